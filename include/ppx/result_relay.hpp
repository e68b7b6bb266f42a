/**
 * @file result_relay.hpp
 * @brief Correlates terminal job outcomes with the waiting client and
 *        delivers each exactly once.
 *
 * Register() and Take() run under the Dispatcher lock. Deliver() runs after
 * the lock is released, so a slow client never stalls scheduling.
 */

#ifndef PPX_RESULT_RELAY_HPP_
#define PPX_RESULT_RELAY_HPP_

#include "ppx/job.hpp"
#include "ppx/log.hpp"
#include "ppx/vocabulary.hpp"

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <utility>

namespace ppx {

// ============================================================================
// ResultSink
// ============================================================================

/**
 * @brief Client-side destination of job outcomes (one per connection).
 */
class ResultSink {
 public:
  virtual ~ResultSink() = default;

  /// False once the client has gone away.
  virtual bool IsConnected() const = 0;

  /// Write the outcome to the client. False if the write failed.
  virtual bool Deliver(const JobOutcome& outcome) = 0;
};

/// Outcome bound to its sink, produced by Take() and consumed by Deliver().
struct PendingDelivery {
  std::shared_ptr<ResultSink> sink;
  JobOutcome outcome;
};

struct RelayStats {
  uint64_t delivered{0U};
  uint64_t discarded{0U};  ///< Client disconnected before delivery.
};

// ============================================================================
// ResultRelay
// ============================================================================

class ResultRelay final {
 public:
  void Register(JobId job, std::shared_ptr<ResultSink> sink) {
    sinks_[job] = std::move(sink);
  }

  /**
   * @brief Remove the job's registration and bind its outcome.
   *
   * Returns empty when the job has no registration, so a second Take for
   * the same job never produces a second delivery.
   */
  optional<PendingDelivery> Take(JobOutcome outcome) {
    auto it = sinks_.find(outcome.job_id);
    if (it == sinks_.end()) return optional<PendingDelivery>();
    PendingDelivery pd{std::move(it->second), std::move(outcome)};
    sinks_.erase(it);
    return optional<PendingDelivery>(std::move(pd));
  }

  /**
   * @brief Write a taken outcome to its client.
   *
   * A disconnected client (or a failed write) discards the outcome without
   * error.
   * @return true if the client received it.
   */
  bool Deliver(const PendingDelivery& pd) {
    if (pd.sink == nullptr || !pd.sink->IsConnected() ||
        !pd.sink->Deliver(pd.outcome)) {
      discarded_.fetch_add(1U, std::memory_order_relaxed);
      PPX_LOG_DEBUG("RELAY", "job %llu result discarded: client gone",
                    static_cast<unsigned long long>(pd.outcome.job_id.value()));
      return false;
    }
    delivered_.fetch_add(1U, std::memory_order_relaxed);
    return true;
  }

  uint32_t Pending() const noexcept {
    return static_cast<uint32_t>(sinks_.size());
  }

  RelayStats GetStats() const noexcept {
    RelayStats s;
    s.delivered = delivered_.load(std::memory_order_relaxed);
    s.discarded = discarded_.load(std::memory_order_relaxed);
    return s;
  }

 private:
  std::map<JobId, std::shared_ptr<ResultSink>> sinks_;
  std::atomic<uint64_t> delivered_{0U};
  std::atomic<uint64_t> discarded_{0U};
};

}  // namespace ppx

#endif  // PPX_RESULT_RELAY_HPP_
