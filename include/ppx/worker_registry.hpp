/**
 * @file worker_registry.hpp
 * @brief Known workers and their availability state machine.
 *
 * Status transitions:
 *
 *   Register -> Idle --MarkBusy--> Busy --MarkIdle--> Idle
 *   Idle/Busy --threshold failed probes or MarkUnhealthy--> Unhealthy
 *   Unhealthy --one successful probe--> Idle
 *   Busy --Deregister--> Draining --MarkIdle--> (removed)
 *
 * MarkUnhealthy evicts the job the worker was holding and hands it back to
 * the caller. The registry is not synchronized; the Dispatcher serializes
 * every call under its own mutex.
 */

#ifndef PPX_WORKER_REGISTRY_HPP_
#define PPX_WORKER_REGISTRY_HPP_

#include "ppx/job.hpp"
#include "ppx/log.hpp"
#include "ppx/platform.hpp"
#include "ppx/vocabulary.hpp"

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <map>
#include <vector>

#ifndef PPX_MAX_WORKERS
#define PPX_MAX_WORKERS 256U
#endif

namespace ppx {

// ============================================================================
// WorkerStatus / LoadBalancePolicy
// ============================================================================

enum class WorkerStatus : uint8_t { kIdle = 0, kBusy, kUnhealthy, kDraining };

inline const char* WorkerStatusToString(WorkerStatus s) noexcept {
  switch (s) {
    case WorkerStatus::kIdle:
      return "Idle";
    case WorkerStatus::kBusy:
      return "Busy";
    case WorkerStatus::kUnhealthy:
      return "Unhealthy";
    case WorkerStatus::kDraining:
      return "Draining";
  }
  return "?";
}

enum class LoadBalancePolicy : uint8_t {
  kRoundRobin = 0,
  kLeastRecentlyUsed,
  kLeastLoaded
};

inline const char* LoadBalancePolicyToString(LoadBalancePolicy p) noexcept {
  switch (p) {
    case LoadBalancePolicy::kRoundRobin:
      return "round_robin";
    case LoadBalancePolicy::kLeastRecentlyUsed:
      return "least_recently_used";
    case LoadBalancePolicy::kLeastLoaded:
      return "least_loaded";
  }
  return "?";
}

inline optional<LoadBalancePolicy> ParseLoadBalancePolicy(
    const char* name) noexcept {
  if (name == nullptr) return optional<LoadBalancePolicy>();
  if (std::strcmp(name, "round_robin") == 0) {
    return optional<LoadBalancePolicy>(LoadBalancePolicy::kRoundRobin);
  }
  if (std::strcmp(name, "least_recently_used") == 0 ||
      std::strcmp(name, "lru") == 0) {
    return optional<LoadBalancePolicy>(LoadBalancePolicy::kLeastRecentlyUsed);
  }
  if (std::strcmp(name, "least_loaded") == 0) {
    return optional<LoadBalancePolicy>(LoadBalancePolicy::kLeastLoaded);
  }
  return optional<LoadBalancePolicy>();
}

// ============================================================================
// Worker
// ============================================================================

struct Worker {
  WorkerId id;
  WorkerAddress address;
  WorkerStatus status = WorkerStatus::kIdle;
  uint64_t last_heartbeat_us = 0;
  uint32_t consecutive_failures = 0;
  optional<JobId> current_job;
  /// Attempt occupying the worker. Survives a deadline reclaim and an
  /// eviction; the worker takes no new job until that attempt returns.
  AttemptId attempt;
  uint64_t last_assigned_seq = 0;  ///< 0 = never assigned.
  uint64_t jobs_assigned = 0;

  bool AttemptOutstanding() const noexcept { return attempt != AttemptId(); }
};

/// Result of feeding one probe into the registry.
struct ProbeOutcome {
  bool became_unhealthy = false;
  bool recovered = false;
  bool removed = false;          ///< Draining worker dropped after eviction.
  optional<JobId> evicted;
  uint32_t consecutive_failures = 0;
};

// ============================================================================
// WorkerRegistry
// ============================================================================

class WorkerRegistry final {
 public:
  WorkerRegistry() = default;

  /**
   * @brief Add a worker in Idle state.
   * @return New id, or kInvalidAddress / kDuplicateWorker / kRegistryFull.
   */
  expected<WorkerId, ProxyError> Register(const char* address,
                                          uint64_t now_us) {
    if (address == nullptr || *address == '\0' ||
        std::strlen(address) > WorkerAddress::capacity()) {
      return expected<WorkerId, ProxyError>::error(ProxyError::kInvalidAddress);
    }
    if (FindByAddress(address).has_value()) {
      return expected<WorkerId, ProxyError>::error(ProxyError::kDuplicateWorker);
    }
    if (workers_.size() >= PPX_MAX_WORKERS) {
      return expected<WorkerId, ProxyError>::error(ProxyError::kRegistryFull);
    }
    Worker w;
    w.id = WorkerId(next_id_++);
    w.address.assign(TruncateToCapacity, address);
    w.last_heartbeat_us = now_us;
    workers_.emplace(w.id, w);
    PPX_LOG_INFO("REGISTRY", "worker %u registered at %s", w.id.value(),
                 address);
    return expected<WorkerId, ProxyError>::success(w.id);
  }

  /**
   * @brief Remove a worker.
   *
   * A Busy worker moves to Draining and is removed by the MarkIdle that
   * ends its current job.
   * @return true if removed now, false if draining.
   */
  expected<bool, ProxyError> Deregister(WorkerId id) {
    auto it = workers_.find(id);
    if (it == workers_.end()) {
      return expected<bool, ProxyError>::error(ProxyError::kUnknownWorker);
    }
    Worker& w = it->second;
    if (w.status == WorkerStatus::kBusy || w.status == WorkerStatus::kDraining) {
      w.status = WorkerStatus::kDraining;
      PPX_LOG_INFO("REGISTRY", "worker %u draining", id.value());
      return expected<bool, ProxyError>::success(false);
    }
    PPX_LOG_INFO("REGISTRY", "worker %u (%s) removed", id.value(),
                 w.address.c_str());
    workers_.erase(it);
    return expected<bool, ProxyError>::success(true);
  }

  /**
   * @brief Idle workers in the order the policy would pick them.
   *
   * A recovered worker whose evicted attempt has not returned is skipped.
   * Deterministic for identical registry state.
   */
  std::vector<WorkerId> ListIdle(LoadBalancePolicy policy) const {
    std::vector<const Worker*> idle;
    for (const auto& kv : workers_) {
      if (kv.second.status == WorkerStatus::kIdle &&
          !kv.second.AttemptOutstanding()) {
        idle.push_back(&kv.second);
      }
    }
    switch (policy) {
      case LoadBalancePolicy::kRoundRobin: {
        // Ascending ids, rotated to start after the last assigned worker.
        auto pivot = std::find_if(idle.begin(), idle.end(), [this](const Worker* w) {
          return w->id.value() > rr_last_id_;
        });
        std::rotate(idle.begin(), pivot, idle.end());
        break;
      }
      case LoadBalancePolicy::kLeastRecentlyUsed:
        std::stable_sort(idle.begin(), idle.end(),
                         [](const Worker* a, const Worker* b) {
                           return a->last_assigned_seq < b->last_assigned_seq;
                         });
        break;
      case LoadBalancePolicy::kLeastLoaded:
        std::stable_sort(idle.begin(), idle.end(),
                         [](const Worker* a, const Worker* b) {
                           return a->jobs_assigned < b->jobs_assigned;
                         });
        break;
    }
    std::vector<WorkerId> out;
    out.reserve(idle.size());
    for (const Worker* w : idle) out.push_back(w->id);
    return out;
  }

  /**
   * @brief Idle -> Busy holding `job` under `attempt`.
   * @return kUnknownWorker, or kWorkerBusy / kWorkerUnhealthy when the
   *         worker is not Idle.
   */
  expected<void, ProxyError> MarkBusy(WorkerId id, JobId job,
                                      AttemptId attempt) {
    Worker* w = FindMut(id);
    if (w == nullptr) {
      return expected<void, ProxyError>::error(ProxyError::kUnknownWorker);
    }
    if (w->status == WorkerStatus::kUnhealthy) {
      return expected<void, ProxyError>::error(ProxyError::kWorkerUnhealthy);
    }
    if (w->status != WorkerStatus::kIdle || w->AttemptOutstanding()) {
      return expected<void, ProxyError>::error(ProxyError::kWorkerBusy);
    }
    w->status = WorkerStatus::kBusy;
    w->current_job = job;
    w->attempt = attempt;
    w->last_assigned_seq = ++assign_seq_;
    ++w->jobs_assigned;
    rr_last_id_ = id.value();
    return expected<void, ProxyError>::success();
  }

  /**
   * @brief Release the worker's job slot.
   *
   * Busy -> Idle; Draining -> removed. An Unhealthy worker stays Unhealthy
   * (only a probe brings it back). Also ends the outstanding attempt of an
   * evicted worker.
   * @return true if the worker was removed.
   */
  expected<bool, ProxyError> MarkIdle(WorkerId id) {
    auto it = workers_.find(id);
    if (it == workers_.end()) {
      return expected<bool, ProxyError>::error(ProxyError::kUnknownWorker);
    }
    Worker& w = it->second;
    w.current_job.reset();
    w.attempt = AttemptId();
    if (w.status == WorkerStatus::kDraining) {
      PPX_LOG_INFO("REGISTRY", "drained worker %u (%s) removed", id.value(),
                   w.address.c_str());
      workers_.erase(it);
      return expected<bool, ProxyError>::success(true);
    }
    if (w.status == WorkerStatus::kBusy) {
      w.status = WorkerStatus::kIdle;
    }
    return expected<bool, ProxyError>::success(false);
  }

  /**
   * @brief Drop the job reference but keep the worker occupied by its
   *        attempt (deadline reclaim).
   */
  expected<void, ProxyError> DetachJob(WorkerId id) {
    Worker* w = FindMut(id);
    if (w == nullptr) {
      return expected<void, ProxyError>::error(ProxyError::kUnknownWorker);
    }
    w->current_job.reset();
    return expected<void, ProxyError>::success();
  }

  /**
   * @brief Force the worker Unhealthy, evicting its in-flight job.
   *
   * The attempt stays recorded until MarkIdle reports it returned.
   * A Draining worker is removed instead.
   * @return The evicted job, if the worker held one.
   */
  expected<optional<JobId>, ProxyError> MarkUnhealthy(WorkerId id) {
    auto it = workers_.find(id);
    if (it == workers_.end()) {
      return expected<optional<JobId>, ProxyError>::error(
          ProxyError::kUnknownWorker);
    }
    Worker& w = it->second;
    optional<JobId> evicted = w.current_job;
    w.current_job.reset();
    if (w.status == WorkerStatus::kDraining) {
      PPX_LOG_WARN("REGISTRY", "draining worker %u failed, removed", id.value());
      workers_.erase(it);
    } else if (w.status != WorkerStatus::kUnhealthy) {
      w.status = WorkerStatus::kUnhealthy;
      PPX_LOG_WARN("REGISTRY", "worker %u (%s) unhealthy", id.value(),
                   w.address.c_str());
    }
    return expected<optional<JobId>, ProxyError>::success(evicted);
  }

  /**
   * @brief Apply one health probe result.
   *
   * Failure increments the consecutive-failure counter and marks the worker
   * Unhealthy when it reaches `threshold`. Success resets the counter,
   * refreshes the heartbeat and returns an Unhealthy worker to Idle.
   */
  expected<ProbeOutcome, ProxyError> RecordProbe(WorkerId id, bool ok,
                                                 uint32_t threshold,
                                                 uint64_t now_us) {
    Worker* w = FindMut(id);
    if (w == nullptr) {
      return expected<ProbeOutcome, ProxyError>::error(
          ProxyError::kUnknownWorker);
    }
    ProbeOutcome out;
    if (ok) {
      w->consecutive_failures = 0;
      w->last_heartbeat_us = now_us;
      if (w->status == WorkerStatus::kUnhealthy) {
        w->status = WorkerStatus::kIdle;
        out.recovered = true;
        PPX_LOG_INFO("REGISTRY", "worker %u (%s) recovered", id.value(),
                     w->address.c_str());
      }
      return expected<ProbeOutcome, ProxyError>::success(out);
    }

    ++w->consecutive_failures;
    out.consecutive_failures = w->consecutive_failures;
    if (w->status != WorkerStatus::kUnhealthy &&
        w->consecutive_failures >= threshold) {
      const bool draining = (w->status == WorkerStatus::kDraining);
      auto evicted = MarkUnhealthy(id);  // may erase *w
      out.became_unhealthy = !draining;
      out.removed = draining;
      if (evicted.has_value()) out.evicted = evicted.value();
    }
    return expected<ProbeOutcome, ProxyError>::success(out);
  }

  // --- Query ---

  const Worker* Find(WorkerId id) const {
    auto it = workers_.find(id);
    return (it != workers_.end()) ? &it->second : nullptr;
  }

  optional<WorkerId> FindByAddress(const char* address) const {
    for (const auto& kv : workers_) {
      if (kv.second.address == address) return optional<WorkerId>(kv.first);
    }
    return optional<WorkerId>();
  }

  uint32_t Size() const noexcept {
    return static_cast<uint32_t>(workers_.size());
  }

  uint32_t CountByStatus(WorkerStatus status) const noexcept {
    uint32_t n = 0;
    for (const auto& kv : workers_) {
      if (kv.second.status == status) ++n;
    }
    return n;
  }

  /// @brief Visit every worker in id order.
  template <typename Fn>
  void ForEach(Fn&& fn) const {
    for (const auto& kv : workers_) fn(kv.second);
  }

 private:
  Worker* FindMut(WorkerId id) {
    auto it = workers_.find(id);
    return (it != workers_.end()) ? &it->second : nullptr;
  }

  std::map<WorkerId, Worker> workers_;
  uint32_t next_id_ = 1;
  uint32_t rr_last_id_ = 0;
  uint64_t assign_seq_ = 0;
};

}  // namespace ppx

#endif  // PPX_WORKER_REGISTRY_HPP_
