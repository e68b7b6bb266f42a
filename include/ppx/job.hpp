/**
 * @file job.hpp
 * @brief Identifiers, error taxonomy and job records shared by the dispatch
 *        components.
 */

#ifndef PPX_JOB_HPP_
#define PPX_JOB_HPP_

#include "ppx/platform.hpp"
#include "ppx/vocabulary.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace ppx {

// ============================================================================
// Strong identifiers
// ============================================================================

struct WorkerIdTag {};
struct JobIdTag {};
struct AttemptIdTag {};

using WorkerId = NewType<uint32_t, WorkerIdTag>;
using JobId = NewType<uint64_t, JobIdTag>;

/// One Dispatched period of a job. Zero means "no attempt".
using AttemptId = NewType<uint64_t, AttemptIdTag>;

/// Opaque job payload or proof bytes.
using Payload = std::vector<uint8_t>;

/// Worker address text, "host:port".
using WorkerAddress = FixedString<63>;

// ============================================================================
// ProxyError
// ============================================================================

/**
 * @brief Error taxonomy of the dispatch proxy.
 *
 * kNone marks success where an error code travels alongside a result
 * (job outcomes, wire frames).
 */
enum class ProxyError : uint8_t {
  kNone = 0,
  kAdmissionRejected,  ///< Queue full, rate limited or proxy shutting down.
  kUnknownWorker,      ///< Operation on an unregistered worker id.
  kWorkerUnhealthy,    ///< Job evicted because its worker turned Unhealthy.
  kJobTimeout,         ///< Dispatched job exceeded its deadline.
  kRetryExhausted,     ///< Failed max_retries + 1 times.
  kTransportError,     ///< Could not reach or talk to the worker.
  kWorkerError,        ///< Worker reported a proving failure.
  kWorkerBusy,         ///< Worker is not Idle.
  kDuplicateWorker,
  kRegistryFull,
  kInvalidAddress
};

inline const char* ProxyErrorToString(ProxyError e) noexcept {
  switch (e) {
    case ProxyError::kNone:
      return "none";
    case ProxyError::kAdmissionRejected:
      return "admission rejected";
    case ProxyError::kUnknownWorker:
      return "unknown worker";
    case ProxyError::kWorkerUnhealthy:
      return "worker unhealthy";
    case ProxyError::kJobTimeout:
      return "job timeout";
    case ProxyError::kRetryExhausted:
      return "retry exhausted";
    case ProxyError::kTransportError:
      return "transport error";
    case ProxyError::kWorkerError:
      return "worker error";
    case ProxyError::kWorkerBusy:
      return "worker busy";
    case ProxyError::kDuplicateWorker:
      return "duplicate worker";
    case ProxyError::kRegistryFull:
      return "registry full";
    case ProxyError::kInvalidAddress:
      return "invalid address";
  }
  return "unknown";
}

// ============================================================================
// Job
// ============================================================================

enum class JobState : uint8_t { kQueued = 0, kDispatched, kCompleted, kFailed };

inline const char* JobStateToString(JobState s) noexcept {
  switch (s) {
    case JobState::kQueued:
      return "Queued";
    case JobState::kDispatched:
      return "Dispatched";
    case JobState::kCompleted:
      return "Completed";
    case JobState::kFailed:
      return "Failed";
  }
  return "?";
}

/**
 * @brief A client request tracked by the proxy until it reaches a terminal
 *        state. The payload is shared with in-flight attempts.
 */
struct Job {
  JobId id;
  uint64_t correlation_id = 0;
  std::shared_ptr<const Payload> payload;
  uint64_t arrival_us = 0;
  uint64_t deadline_us = 0;  ///< Deadline of the current dispatch.
  uint32_t retry_count = 0;
  optional<WorkerId> worker;
  AttemptId attempt;
  JobState state = JobState::kQueued;
  ProxyError last_cause = ProxyError::kNone;
};

/**
 * @brief Terminal result of a job as delivered to the client.
 *
 * On success `error` is kNone and `proof` holds the worker output. On
 * failure `error` is kAdmissionRejected or kRetryExhausted and
 * `last_cause` names the failure that ended the last attempt.
 */
struct JobOutcome {
  JobId job_id;
  uint64_t correlation_id = 0;
  ProxyError error = ProxyError::kNone;
  ProxyError last_cause = ProxyError::kNone;
  uint32_t retry_count = 0;
  Payload proof;
  std::string detail;

  bool ok() const noexcept { return error == ProxyError::kNone; }
};

}  // namespace ppx

#endif  // PPX_JOB_HPP_
