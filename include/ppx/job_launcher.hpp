/**
 * @file job_launcher.hpp
 * @brief ThreadedLauncher: one thread per in-flight job.
 *
 * Each Launch() spawns a thread that forwards the assignment through the
 * WorkerTransport, waits for the worker and reports the AttemptResult to
 * the Dispatcher. The transport call is bounded by the job deadline plus
 * a grace period, so a hung worker releases its thread even after the
 * Dispatcher has reclaimed the job.
 *
 * Finished threads are reaped on the next Launch(); Stop() cancels the
 * transport and joins the rest.
 */

#ifndef PPX_JOB_LAUNCHER_HPP_
#define PPX_JOB_LAUNCHER_HPP_

#include "ppx/dispatcher.hpp"
#include "ppx/log.hpp"
#include "ppx/platform.hpp"
#include "ppx/worker_transport.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>
#include <utility>
#include <vector>

namespace ppx {

class ThreadedLauncher final : public JobLauncher {
 public:
  explicit ThreadedLauncher(WorkerTransport& transport,
                            uint32_t grace_ms = 1000U) noexcept
      : transport_(transport), grace_ms_(grace_ms) {}

  ~ThreadedLauncher() override { Stop(); }

  ThreadedLauncher(const ThreadedLauncher&) = delete;
  ThreadedLauncher& operator=(const ThreadedLauncher&) = delete;

  void Launch(const Assignment& assignment, CompletionFn done,
              void* ctx) override {
    if (stopping_.load(std::memory_order_acquire)) {
      AttemptResult r = MakeResult(assignment);
      r.error = ProxyError::kTransportError;
      r.detail = "launcher stopped";
      done(r, ctx);
      return;
    }
    ReapFinished();

    auto finished = std::make_shared<std::atomic<bool>>(false);
    std::lock_guard<std::mutex> lock(mutex_);
    in_flight_.fetch_add(1U, std::memory_order_relaxed);
    entries_.push_back(Entry{
        std::thread([this, assignment, done, ctx, finished]() {
          Run(assignment, done, ctx);
          in_flight_.fetch_sub(1U, std::memory_order_relaxed);
          finished->store(true, std::memory_order_release);
        }),
        finished});
  }

  /// @brief Cancel in-progress transport calls and join every job thread.
  void Stop() {
    stopping_.store(true, std::memory_order_release);
    transport_.CancelAll();
    // Completions may launch again while we join; loop until drained.
    for (;;) {
      std::vector<Entry> batch;
      {
        std::lock_guard<std::mutex> lock(mutex_);
        if (entries_.empty()) break;
        batch.swap(entries_);
      }
      for (Entry& e : batch) {
        if (e.thread.joinable()) e.thread.join();
      }
    }
  }

  uint32_t InFlight() const noexcept {
    return in_flight_.load(std::memory_order_relaxed);
  }

 private:
  struct Entry {
    std::thread thread;
    std::shared_ptr<std::atomic<bool>> finished;
  };

  static AttemptResult MakeResult(const Assignment& a) {
    AttemptResult r;
    r.attempt = a.attempt;
    r.job = a.job;
    r.worker = a.worker;
    return r;
  }

  void Run(const Assignment& a, CompletionFn done, void* ctx) {
    const uint64_t now = SteadyNowUs();
    const uint64_t remaining_ms =
        (a.deadline_us > now) ? (a.deadline_us - now) / 1000U : 0U;
    const uint32_t timeout_ms = static_cast<uint32_t>(remaining_ms) + grace_ms_;

    AttemptResult r = MakeResult(a);
    auto proof = transport_.Prove(a.address.c_str(), a.job, *a.payload,
                                  timeout_ms);
    if (proof.has_value()) {
      r.proof = std::move(proof.value());
    } else {
      r.error = proof.get_error().code;
      r.detail = proof.get_error().detail;
    }
    done(r, ctx);
  }

  void ReapFinished() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (size_t i = 0; i < entries_.size();) {
      if (entries_[i].finished->load(std::memory_order_acquire)) {
        if (entries_[i].thread.joinable()) entries_[i].thread.join();
        entries_[i] = std::move(entries_.back());
        entries_.pop_back();
      } else {
        ++i;
      }
    }
  }

  WorkerTransport& transport_;
  uint32_t grace_ms_;
  std::mutex mutex_;
  std::vector<Entry> entries_;
  std::atomic<uint32_t> in_flight_{0U};
  std::atomic<bool> stopping_{false};
};

}  // namespace ppx

#endif  // PPX_JOB_LAUNCHER_HPP_
