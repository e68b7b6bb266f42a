/**
 * @file retry_coordinator.hpp
 * @brief Decides whether a failed Dispatched job is rescheduled or fails
 *        terminally.
 */

#ifndef PPX_RETRY_COORDINATOR_HPP_
#define PPX_RETRY_COORDINATOR_HPP_

#include "ppx/job.hpp"
#include "ppx/job_queue.hpp"
#include "ppx/log.hpp"

#include <cstdint>

namespace ppx {

enum class RetryDecision : uint8_t {
  kRequeued = 0,       ///< Back in the queue, ahead of fresh jobs.
  kRetryExhausted,     ///< Terminal: failed max_retries + 1 times.
  kQueueFull           ///< Terminal: retry allowed but no queue space.
};

/**
 * @brief Bounded retry policy applied under the Dispatcher lock.
 *
 * A job may be dispatched at most max_retries + 1 times. The job's
 * retry_count never exceeds max_retries.
 */
class RetryCoordinator final {
 public:
  explicit RetryCoordinator(uint32_t max_retries) noexcept
      : max_retries_(max_retries) {}

  /**
   * @brief Handle a failure of `job`'s current attempt.
   *
   * Clears the worker assignment and records `cause`. On kRequeued the job
   * is Queued with retry_count incremented; otherwise it is Failed and the
   * caller delivers the terminal outcome.
   */
  RetryDecision OnFailure(Job& job, ProxyError cause, JobQueue& queue) {
    job.worker.reset();
    job.attempt = AttemptId();
    job.last_cause = cause;

    if (job.retry_count >= max_retries_) {
      job.state = JobState::kFailed;
      PPX_LOG_WARN("RETRY", "job %llu failed after %u retries (last: %s)",
                   static_cast<unsigned long long>(job.id.value()),
                   job.retry_count, ProxyErrorToString(cause));
      return RetryDecision::kRetryExhausted;
    }

    auto r = queue.EnqueueFront(job.id, job.retry_count + 1U);
    if (!r.has_value()) {
      job.state = JobState::kFailed;
      PPX_LOG_WARN("RETRY", "job %llu dropped on retry: queue full",
                   static_cast<unsigned long long>(job.id.value()));
      return RetryDecision::kQueueFull;
    }
    ++job.retry_count;
    job.state = JobState::kQueued;
    PPX_LOG_INFO("RETRY", "job %llu requeued (retry %u/%u, cause: %s)",
                 static_cast<unsigned long long>(job.id.value()),
                 job.retry_count, max_retries_, ProxyErrorToString(cause));
    return RetryDecision::kRequeued;
  }

  uint32_t MaxRetries() const noexcept { return max_retries_; }

 private:
  uint32_t max_retries_;
};

}  // namespace ppx

#endif  // PPX_RETRY_COORDINATOR_HPP_
