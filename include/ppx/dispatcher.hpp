/**
 * @file dispatcher.hpp
 * @brief Matches idle workers to queued and incoming jobs.
 *
 * The Dispatcher is the single serialization boundary of the proxy: the
 * WorkerRegistry, the JobQueue, the job table, retry decisions and the
 * ResultRelay registrations are only touched under mutex_. Each public
 * operation collects its side effects (job launches, result deliveries,
 * urgent probe requests) inside the critical section and executes them
 * after the lock is released, so no network I/O happens under the lock.
 *
 * Scheduling triggers:
 *   - Submit(): assign to an Idle worker immediately, else enqueue, else
 *     reject with kAdmissionRejected.
 *   - Any transition that can free a worker (attempt finished, probe
 *     recovery, worker added): drain the queue onto Idle workers.
 */

#ifndef PPX_DISPATCHER_HPP_
#define PPX_DISPATCHER_HPP_

#include "ppx/job.hpp"
#include "ppx/job_queue.hpp"
#include "ppx/log.hpp"
#include "ppx/platform.hpp"
#include "ppx/result_relay.hpp"
#include "ppx/retry_coordinator.hpp"
#include "ppx/vocabulary.hpp"
#include "ppx/worker_registry.hpp"

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace ppx {

// ============================================================================
// Launch seam
// ============================================================================

/// One job forwarded to one worker.
struct Assignment {
  JobId job;
  AttemptId attempt;
  WorkerId worker;
  WorkerAddress address;
  std::shared_ptr<const Payload> payload;
  uint32_t retry_count = 0;
  uint64_t deadline_us = 0;
};

/// What came back from the worker for one attempt.
struct AttemptResult {
  AttemptId attempt;
  JobId job;
  WorkerId worker;
  ProxyError error = ProxyError::kNone;  ///< kNone = proof produced.
  Payload proof;
  std::string detail;
};

using CompletionFn = void (*)(const AttemptResult& result, void* ctx);

/**
 * @brief Runs an assignment against its worker and reports back.
 *
 * Launch() must not block on the worker; it reports the result through
 * `done` exactly once, from any thread.
 */
class JobLauncher {
 public:
  virtual ~JobLauncher() = default;
  virtual void Launch(const Assignment& assignment, CompletionFn done,
                      void* ctx) = 0;
};

/// Urgent probe request towards the health monitor.
using ProbeRequestFn = void (*)(WorkerId worker, void* ctx);

// ============================================================================
// Config / Stats
// ============================================================================

struct DispatcherConfig {
  uint32_t queue_capacity = 10;
  uint32_t max_retries = 1;
  uint32_t failure_threshold = 3;
  uint32_t job_deadline_ms = 100000;
  uint32_t remove_after_failures = 0;  ///< 0 = never remove.
  LoadBalancePolicy policy = LoadBalancePolicy::kRoundRobin;
};

struct DispatcherStats {
  uint64_t submitted{0U};
  uint64_t rejected{0U};       ///< Admission rejected at submit.
  uint64_t dispatched{0U};     ///< Attempts started.
  uint64_t completed{0U};
  uint64_t failed{0U};         ///< Terminal failures after admission.
  uint64_t retried{0U};
  uint64_t timeouts{0U};
  uint64_t evictions{0U};      ///< Jobs evicted by unhealthy workers.
  uint64_t stale_results{0U};  ///< Results of reclaimed attempts.
  RelayStats relay{};
};

/// Probe target snapshot handed to the health monitor.
struct ProbeTarget {
  WorkerId id;
  WorkerAddress address;
};

// ============================================================================
// Dispatcher
// ============================================================================

class Dispatcher final {
 public:
  Dispatcher(const DispatcherConfig& cfg, JobLauncher& launcher)
      : cfg_(cfg),
        launcher_(launcher),
        queue_(cfg.queue_capacity),
        retry_(cfg.max_retries) {}

  Dispatcher(const Dispatcher&) = delete;
  Dispatcher& operator=(const Dispatcher&) = delete;

  void SetProbeRequestHandler(ProbeRequestFn fn, void* ctx) {
    std::lock_guard<std::mutex> lock(mutex_);
    probe_fn_ = fn;
    probe_ctx_ = ctx;
  }

  // --------------------------------------------------------------------------
  // Workers
  // --------------------------------------------------------------------------

  expected<WorkerId, ProxyError> AddWorker(const char* address) {
    Effects fx;
    expected<WorkerId, ProxyError> r =
        expected<WorkerId, ProxyError>::error(ProxyError::kInvalidAddress);
    {
      std::lock_guard<std::mutex> lock(mutex_);
      r = registry_.Register(address, SteadyNowUs());
      if (r.has_value()) PumpLocked(fx);
    }
    Flush(fx);
    return r;
  }

  /// @return true if removed now, false if the worker drains first.
  expected<bool, ProxyError> RemoveWorker(WorkerId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return registry_.Deregister(id);
  }

  expected<bool, ProxyError> RemoveWorkerByAddress(const char* address) {
    std::lock_guard<std::mutex> lock(mutex_);
    optional<WorkerId> id = registry_.FindByAddress(address);
    if (!id.has_value()) {
      return expected<bool, ProxyError>::error(ProxyError::kUnknownWorker);
    }
    return registry_.Deregister(id.value());
  }

  // --------------------------------------------------------------------------
  // Jobs
  // --------------------------------------------------------------------------

  /**
   * @brief Admit a client job.
   *
   * Dispatched immediately when a worker is Idle, queued otherwise. The
   * sink receives the terminal outcome exactly once. A rejected job is
   * never registered and the caller answers the client itself.
   * @return The job id, or kAdmissionRejected (queue full or stopped).
   */
  expected<JobId, ProxyError> Submit(uint64_t correlation_id, Payload payload,
                                     std::shared_ptr<ResultSink> sink) {
    Effects fx;
    JobId id;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      ++stats_.submitted;
      if (stopped_) {
        ++stats_.rejected;
        return expected<JobId, ProxyError>::error(
            ProxyError::kAdmissionRejected);
      }
      std::vector<WorkerId> idle = registry_.ListIdle(cfg_.policy);
      id = JobId(next_job_id_);
      if (idle.empty()) {
        if (!queue_.Enqueue(id).has_value()) {
          ++stats_.rejected;
          PPX_LOG_WARN("DISPATCH", "job rejected: queue full (%u/%u)",
                       queue_.Size(), queue_.Capacity());
          return expected<JobId, ProxyError>::error(
              ProxyError::kAdmissionRejected);
        }
      }
      ++next_job_id_;

      Job job;
      job.id = id;
      job.correlation_id = correlation_id;
      job.payload = std::make_shared<const Payload>(std::move(payload));
      job.arrival_us = SteadyNowUs();
      Job& stored = jobs_.emplace(id, std::move(job)).first->second;
      relay_.Register(id, std::move(sink));

      if (!idle.empty()) {
        AssignLocked(stored, idle.front(), fx);
      } else {
        PPX_LOG_DEBUG("DISPATCH", "job %llu queued (%u/%u)",
                      static_cast<unsigned long long>(id.value()),
                      queue_.Size(), queue_.Capacity());
      }
    }
    Flush(fx);
    return expected<JobId, ProxyError>::success(id);
  }

  /**
   * @brief Report the end of an attempt (launcher callback).
   *
   * Frees the worker if this attempt still occupies it, whatever its
   * status. Results of attempts that were reclaimed or evicted never
   * change job state.
   */
  void OnAttemptFinished(const AttemptResult& result) {
    Effects fx;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      const Worker* w = registry_.Find(result.worker);
      if (w != nullptr && w->attempt == result.attempt) {
        (void)registry_.MarkIdle(result.worker);
      }

      auto it = jobs_.find(result.job);
      const bool current = it != jobs_.end() &&
                           it->second.state == JobState::kDispatched &&
                           it->second.attempt == result.attempt;
      if (!current) {
        ++stats_.stale_results;
        PPX_LOG_DEBUG("DISPATCH", "stale result for job %llu attempt %llu",
                      static_cast<unsigned long long>(result.job.value()),
                      static_cast<unsigned long long>(result.attempt.value()));
      } else if (result.error == ProxyError::kNone) {
        Job& job = it->second;
        job.state = JobState::kCompleted;
        ++stats_.completed;
        JobOutcome out = MakeOutcome(job, ProxyError::kNone);
        out.proof = result.proof;
        PPX_LOG_INFO("DISPATCH", "job %llu completed on worker %u (%zu bytes)",
                     static_cast<unsigned long long>(job.id.value()),
                     result.worker.value(), result.proof.size());
        FinishLocked(job.id, std::move(out), fx);
      } else {
        PPX_LOG_WARN("DISPATCH", "job %llu attempt failed on worker %u: %s %s",
                     static_cast<unsigned long long>(result.job.value()),
                     result.worker.value(), ProxyErrorToString(result.error),
                     result.detail.c_str());
        FailAttemptLocked(it->second, result.error, result.detail, fx);
      }
      PumpLocked(fx);
    }
    Flush(fx);
  }

  /**
   * @brief Feed one health probe result.
   *
   * Reaching the failure threshold marks the worker Unhealthy and retries
   * its evicted job. With remove_after_failures set, a worker that keeps
   * failing that many probes past the threshold is deregistered.
   */
  expected<ProbeOutcome, ProxyError> ReportProbe(WorkerId id, bool ok) {
    Effects fx;
    expected<ProbeOutcome, ProxyError> r =
        expected<ProbeOutcome, ProxyError>::error(ProxyError::kUnknownWorker);
    {
      std::lock_guard<std::mutex> lock(mutex_);
      r = registry_.RecordProbe(id, ok, cfg_.failure_threshold, SteadyNowUs());
      if (!r.has_value()) return r;
      const ProbeOutcome& po = r.value();

      if (po.evicted.has_value()) {
        auto it = jobs_.find(po.evicted.value());
        if (it != jobs_.end() && it->second.state == JobState::kDispatched) {
          ++stats_.evictions;
          FailAttemptLocked(it->second, ProxyError::kWorkerUnhealthy,
                            "worker failed health checks", fx);
        }
      }

      const Worker* w = registry_.Find(id);
      if (w != nullptr && cfg_.remove_after_failures > 0U &&
          w->status == WorkerStatus::kUnhealthy &&
          w->consecutive_failures >=
              cfg_.failure_threshold + cfg_.remove_after_failures) {
        PPX_LOG_WARN("DISPATCH", "worker %u removed after %u failed probes",
                     id.value(), w->consecutive_failures);
        (void)registry_.Deregister(id);
        r.value().removed = true;
      }
      PumpLocked(fx);
    }
    Flush(fx);
    return r;
  }

  /**
   * @brief Fail every Dispatched job whose deadline has passed.
   *
   * Each reclaimed job takes the JobTimeout failure path and its worker
   * gets an urgent probe. The worker stays Busy until the outstanding
   * attempt returns.
   * @return Number of jobs reclaimed.
   */
  uint32_t ReclaimExpired(uint64_t now_us) {
    Effects fx;
    uint32_t reclaimed = 0;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      std::vector<JobId> expired;
      for (const auto& kv : jobs_) {
        if (kv.second.state == JobState::kDispatched &&
            kv.second.deadline_us <= now_us) {
          expired.push_back(kv.first);
        }
      }
      for (JobId id : expired) {
        Job& job = jobs_.find(id)->second;
        const WorkerId worker = job.worker.value();
        (void)registry_.DetachJob(worker);
        fx.probes.push_back(worker);
        ++stats_.timeouts;
        PPX_LOG_WARN("DISPATCH", "job %llu exceeded deadline on worker %u",
                     static_cast<unsigned long long>(id.value()),
                     worker.value());
        FailAttemptLocked(job, ProxyError::kJobTimeout, "deadline exceeded",
                          fx);
        ++reclaimed;
      }
      if (reclaimed > 0U) PumpLocked(fx);
    }
    Flush(fx);
    return reclaimed;
  }

  /**
   * @brief Stop admitting and dispatching; fail every queued job.
   *
   * Jobs already Dispatched finish or fail through their launcher.
   */
  void Shutdown() {
    Effects fx;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (stopped_) return;
      stopped_ = true;
      optional<JobId> id;
      while ((id = queue_.Dequeue()).has_value()) {
        auto it = jobs_.find(id.value());
        if (it == jobs_.end()) continue;
        it->second.state = JobState::kFailed;
        ++stats_.failed;
        JobOutcome out = MakeOutcome(it->second, ProxyError::kAdmissionRejected);
        out.detail = "proxy shutting down";
        FinishLocked(id.value(), std::move(out), fx);
      }
    }
    Flush(fx);
  }

  // --------------------------------------------------------------------------
  // Queries
  // --------------------------------------------------------------------------

  std::vector<ProbeTarget> ProbeTargets() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ProbeTarget> out;
    registry_.ForEach([&out](const Worker& w) {
      out.push_back(ProbeTarget{w.id, w.address});
    });
    return out;
  }

  optional<Worker> GetWorker(WorkerId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const Worker* w = registry_.Find(id);
    return (w != nullptr) ? optional<Worker>(*w) : optional<Worker>();
  }

  /// Live (non-terminal) job; terminal jobs leave the table.
  optional<Job> GetJob(JobId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = jobs_.find(id);
    return (it != jobs_.end()) ? optional<Job>(it->second) : optional<Job>();
  }

  uint32_t WorkerCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return registry_.Size();
  }

  uint32_t CountWorkers(WorkerStatus status) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return registry_.CountByStatus(status);
  }

  uint32_t QueueLength() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.Size();
  }

  uint32_t LiveJobs() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<uint32_t>(jobs_.size());
  }

  DispatcherStats GetStats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    DispatcherStats s = stats_;
    s.relay = relay_.GetStats();
    return s;
  }

  /**
   * @brief Check the structural invariants of the dispatch state.
   *
   * Queue within capacity; every Dispatched job held by exactly one Busy
   * or Draining worker running that job's attempt; retry counts within
   * bound.
   */
  bool CheckInvariants() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (queue_.Size() > queue_.Capacity()) return false;
    uint32_t held = 0;
    bool ok = true;
    registry_.ForEach([&](const Worker& w) {
      if (!w.current_job.has_value()) return;
      ++held;
      auto it = jobs_.find(w.current_job.value());
      if (it == jobs_.end() || it->second.state != JobState::kDispatched ||
          !it->second.worker.has_value() || it->second.worker.value() != w.id ||
          it->second.attempt != w.attempt ||
          (w.status != WorkerStatus::kBusy &&
           w.status != WorkerStatus::kDraining)) {
        ok = false;
      }
    });
    uint32_t dispatched = 0;
    for (const auto& kv : jobs_) {
      if (kv.second.retry_count > cfg_.max_retries) ok = false;
      if (kv.second.state == JobState::kDispatched) ++dispatched;
    }
    return ok && held == dispatched;
  }

  const DispatcherConfig& Config() const noexcept { return cfg_; }

 private:
  struct Effects {
    std::vector<Assignment> launches;
    std::vector<PendingDelivery> deliveries;
    std::vector<WorkerId> probes;
  };

  // --- Under mutex_ ---

  void AssignLocked(Job& job, WorkerId worker, Effects& fx) {
    const AttemptId attempt(next_attempt_id_++);
    auto busy = registry_.MarkBusy(worker, job.id, attempt);
    PPX_ASSERT(busy.has_value());
    (void)busy;
    job.state = JobState::kDispatched;
    job.worker = worker;
    job.attempt = attempt;
    job.deadline_us =
        SteadyNowUs() + static_cast<uint64_t>(cfg_.job_deadline_ms) * 1000U;
    ++stats_.dispatched;

    Assignment a;
    a.job = job.id;
    a.attempt = attempt;
    a.worker = worker;
    a.address = registry_.Find(worker)->address;
    a.payload = job.payload;
    a.retry_count = job.retry_count;
    a.deadline_us = job.deadline_us;
    PPX_LOG_DEBUG("DISPATCH", "job %llu -> worker %u (%s) attempt %llu",
                  static_cast<unsigned long long>(job.id.value()),
                  worker.value(), a.address.c_str(),
                  static_cast<unsigned long long>(attempt.value()));
    fx.launches.push_back(std::move(a));
  }

  /// Drain the queue onto Idle workers.
  void PumpLocked(Effects& fx) {
    if (stopped_) return;
    while (!queue_.Empty()) {
      std::vector<WorkerId> idle = registry_.ListIdle(cfg_.policy);
      if (idle.empty()) break;
      optional<JobId> id = queue_.Dequeue();
      auto it = jobs_.find(id.value());
      if (it == jobs_.end()) continue;
      AssignLocked(it->second, idle.front(), fx);
    }
  }

  void FailAttemptLocked(Job& job, ProxyError cause, const std::string& detail,
                         Effects& fx) {
    if (stopped_) {
      // Nothing is dispatched after Shutdown(); a requeued job would strand.
      job.state = JobState::kFailed;
      job.last_cause = cause;
      ++stats_.failed;
      JobOutcome out = MakeOutcome(job, ProxyError::kAdmissionRejected);
      out.detail = "proxy shutting down";
      FinishLocked(job.id, std::move(out), fx);
      return;
    }
    const RetryDecision d = retry_.OnFailure(job, cause, queue_);
    if (d == RetryDecision::kRequeued) {
      ++stats_.retried;
      return;
    }
    ++stats_.failed;
    const ProxyError terminal = (d == RetryDecision::kRetryExhausted)
                                    ? ProxyError::kRetryExhausted
                                    : ProxyError::kAdmissionRejected;
    JobOutcome out = MakeOutcome(job, terminal);
    out.detail = detail;
    FinishLocked(job.id, std::move(out), fx);
  }

  /// Release a terminal job and hand its outcome to the relay.
  void FinishLocked(JobId id, JobOutcome outcome, Effects& fx) {
    optional<PendingDelivery> pd = relay_.Take(std::move(outcome));
    if (pd.has_value()) fx.deliveries.push_back(std::move(pd.value()));
    jobs_.erase(id);
  }

  static JobOutcome MakeOutcome(const Job& job, ProxyError error) {
    JobOutcome out;
    out.job_id = job.id;
    out.correlation_id = job.correlation_id;
    out.error = error;
    out.last_cause = job.last_cause;
    out.retry_count = job.retry_count;
    return out;
  }

  // --- After mutex_ is released ---

  void Flush(Effects& fx) {
    for (const PendingDelivery& pd : fx.deliveries) {
      (void)relay_.Deliver(pd);
    }
    for (const Assignment& a : fx.launches) {
      launcher_.Launch(a, &Dispatcher::OnLaunchDone, this);
    }
    if (!fx.probes.empty()) {
      ProbeRequestFn fn = nullptr;
      void* ctx = nullptr;
      {
        std::lock_guard<std::mutex> lock(mutex_);
        fn = probe_fn_;
        ctx = probe_ctx_;
      }
      if (fn != nullptr) {
        for (WorkerId w : fx.probes) fn(w, ctx);
      }
    }
  }

  static void OnLaunchDone(const AttemptResult& result, void* ctx) {
    static_cast<Dispatcher*>(ctx)->OnAttemptFinished(result);
  }

  DispatcherConfig cfg_;
  JobLauncher& launcher_;

  mutable std::mutex mutex_;
  WorkerRegistry registry_;
  JobQueue queue_;
  RetryCoordinator retry_;
  ResultRelay relay_;
  std::map<JobId, Job> jobs_;
  DispatcherStats stats_;
  uint64_t next_job_id_ = 1;
  uint64_t next_attempt_id_ = 1;
  bool stopped_ = false;

  ProbeRequestFn probe_fn_ = nullptr;
  void* probe_ctx_ = nullptr;
};

}  // namespace ppx

#endif  // PPX_DISPATCHER_HPP_
