/**
 * @file health_monitor.hpp
 * @brief Periodic worker probing and stuck-job reclamation.
 *
 * The monitor thread wakes every tick (at most tick_ms apart) and:
 *   1. asks the Dispatcher to reclaim Dispatched jobs past their deadline,
 *   2. runs any urgent probes requested by the Dispatcher (timeouts),
 *   3. once per interval_ms, probes every registered worker that has no
 *      urgent probe pending.
 *
 * Probe results only reach worker state through Dispatcher::ReportProbe(),
 * which applies the consecutive-failure threshold in the WorkerRegistry.
 */

#ifndef PPX_HEALTH_MONITOR_HPP_
#define PPX_HEALTH_MONITOR_HPP_

#include "ppx/dispatcher.hpp"
#include "ppx/log.hpp"
#include "ppx/platform.hpp"
#include "ppx/vocabulary.hpp"
#include "ppx/worker_transport.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <set>
#include <thread>
#include <vector>

namespace ppx {

enum class HealthMonitorError : uint8_t { kAlreadyRunning = 0 };

struct HealthMonitorConfig {
  uint32_t interval_ms = 1000;
  uint32_t probe_timeout_ms = 500;
  uint32_t tick_ms = 50;  ///< Deadline check granularity.
};

struct HealthStats {
  uint64_t rounds{0U};
  uint64_t probes{0U};
  uint64_t probe_failures{0U};
  uint64_t urgent_probes{0U};
  uint64_t reclaimed{0U};
};

class HealthMonitor final {
 public:
  HealthMonitor(Dispatcher& dispatcher, WorkerTransport& transport,
                const HealthMonitorConfig& cfg)
      : dispatcher_(dispatcher), transport_(transport), cfg_(cfg) {
    dispatcher_.SetProbeRequestHandler(&HealthMonitor::OnProbeRequested, this);
  }

  ~HealthMonitor() {
    Stop();
    dispatcher_.SetProbeRequestHandler(nullptr, nullptr);
  }

  HealthMonitor(const HealthMonitor&) = delete;
  HealthMonitor& operator=(const HealthMonitor&) = delete;

  expected<void, HealthMonitorError> Start() {
    bool expected_val = false;
    if (!running_.compare_exchange_strong(expected_val, true)) {
      return expected<void, HealthMonitorError>::error(
          HealthMonitorError::kAlreadyRunning);
    }
    thread_ = std::thread([this]() { Loop(); });
    PPX_LOG_INFO("HEALTH", "monitor started (interval %u ms, probe timeout %u ms)",
                 cfg_.interval_ms, cfg_.probe_timeout_ms);
    return expected<void, HealthMonitorError>::success();
  }

  void Stop() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (!running_.load()) return;
      running_.store(false);
    }
    cv_.notify_all();
    if (thread_.joinable()) thread_.join();
    PPX_LOG_INFO("HEALTH", "monitor stopped");
  }

  bool IsRunning() const noexcept { return running_.load(); }

  /// @brief Schedule an immediate probe of one worker (thread-safe).
  void RequestProbe(WorkerId id) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      urgent_.insert(id);
    }
    cv_.notify_all();
  }

  /**
   * @brief Probe every registered worker without an urgent probe pending.
   * @return Number of workers probed.
   */
  uint32_t ProbeAll() {
    std::vector<ProbeTarget> targets = dispatcher_.ProbeTargets();
    uint32_t probed = 0;
    for (const ProbeTarget& t : targets) {
      {
        std::lock_guard<std::mutex> lock(mutex_);
        if (urgent_.count(t.id) != 0U) continue;
      }
      ProbeOne(t);
      ++probed;
    }
    ++rounds_;
    return probed;
  }

  /// @brief Run all pending urgent probes. Returns how many ran.
  uint32_t ProbeUrgent() {
    std::set<WorkerId> pending;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      pending.swap(urgent_);
    }
    if (pending.empty()) return 0;
    uint32_t probed = 0;
    for (const ProbeTarget& t : dispatcher_.ProbeTargets()) {
      if (pending.count(t.id) == 0U) continue;
      ProbeOne(t);
      ++probed;
      ++urgent_probes_;
    }
    return probed;
  }

  /// @brief Reclaim jobs past their deadline.
  uint32_t ReclaimExpired() {
    uint32_t n = dispatcher_.ReclaimExpired(SteadyNowUs());
    reclaimed_ += n;
    return n;
  }

  uint32_t PendingUrgent() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<uint32_t>(urgent_.size());
  }

  HealthStats GetStats() const noexcept {
    HealthStats s;
    s.rounds = rounds_.load(std::memory_order_relaxed);
    s.probes = probes_.load(std::memory_order_relaxed);
    s.probe_failures = probe_failures_.load(std::memory_order_relaxed);
    s.urgent_probes = urgent_probes_.load(std::memory_order_relaxed);
    s.reclaimed = reclaimed_.load(std::memory_order_relaxed);
    return s;
  }

 private:
  static void OnProbeRequested(WorkerId id, void* ctx) {
    static_cast<HealthMonitor*>(ctx)->RequestProbe(id);
  }

  void ProbeOne(const ProbeTarget& t) {
    const bool ok = transport_.Probe(t.address.c_str(), cfg_.probe_timeout_ms);
    ++probes_;
    if (!ok) {
      ++probe_failures_;
      PPX_LOG_DEBUG("HEALTH", "probe of worker %u (%s) failed", t.id.value(),
                    t.address.c_str());
    }
    // The worker may have been removed meanwhile.
    (void)dispatcher_.ReportProbe(t.id, ok);
  }

  void Loop() {
    uint64_t next_round_ms = SteadyNowMs();
    const uint32_t tick_ms =
        std::max<uint32_t>(1U, std::min(cfg_.tick_ms, cfg_.interval_ms));
    while (running_.load()) {
      (void)ReclaimExpired();
      (void)ProbeUrgent();

      uint64_t now_ms = SteadyNowMs();
      if (now_ms >= next_round_ms) {
        (void)ProbeAll();
        now_ms = SteadyNowMs();
        next_round_ms = now_ms + cfg_.interval_ms;
      }

      const uint64_t until_round = next_round_ms - now_ms;
      const uint64_t wait_ms = std::min<uint64_t>(tick_ms, until_round);
      std::unique_lock<std::mutex> lock(mutex_);
      cv_.wait_for(lock, std::chrono::milliseconds(wait_ms), [this]() {
        return !running_.load() || !urgent_.empty();
      });
    }
  }

  Dispatcher& dispatcher_;
  WorkerTransport& transport_;
  HealthMonitorConfig cfg_;

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::set<WorkerId> urgent_;
  std::atomic<bool> running_{false};
  std::thread thread_;

  std::atomic<uint64_t> rounds_{0U};
  std::atomic<uint64_t> probes_{0U};
  std::atomic<uint64_t> probe_failures_{0U};
  std::atomic<uint64_t> urgent_probes_{0U};
  std::atomic<uint64_t> reclaimed_{0U};
};

}  // namespace ppx

#endif  // PPX_HEALTH_MONITOR_HPP_
