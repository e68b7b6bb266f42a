/**
 * @file test_dispatcher.cpp
 * @brief Tests for dispatcher.hpp: admission, assignment, retries, health
 *        driven eviction, deadlines and shutdown.
 */

#include "ppx/dispatcher.hpp"
#include "test_support.hpp"

#include <catch2/catch_test_macros.hpp>

#include <memory>
#include <random>
#include <string>
#include <vector>

using ppx::JobId;
using ppx::JobState;
using ppx::ProxyError;
using ppx::WorkerId;
using ppx::WorkerStatus;
using ppx_test::Bytes;
using ppx_test::ManualLauncher;
using ppx_test::RecordingSink;

namespace {

ppx::DispatcherConfig MakeConfig(uint32_t capacity, uint32_t max_retries,
                                 uint32_t threshold = 3U) {
  ppx::DispatcherConfig cfg;
  cfg.queue_capacity = capacity;
  cfg.max_retries = max_retries;
  cfg.failure_threshold = threshold;
  return cfg;
}

WorkerId AddWorker(ppx::Dispatcher& d, const char* addr) {
  auto r = d.AddWorker(addr);
  REQUIRE(r.has_value());
  return r.value();
}

JobId SubmitOk(ppx::Dispatcher& d, const std::shared_ptr<RecordingSink>& sink,
               uint64_t correlation) {
  auto r = d.Submit(correlation, Bytes("payload"), sink);
  REQUIRE(r.has_value());
  return r.value();
}

void ProbeFailures(ppx::Dispatcher& d, WorkerId w, uint32_t n) {
  for (uint32_t i = 0; i < n; ++i) REQUIRE(d.ReportProbe(w, false).has_value());
}

}  // namespace

// ============================================================================
// Admission and assignment
// ============================================================================

TEST_CASE("dispatcher - two idle workers take two jobs", "[dispatcher]") {
  ManualLauncher launcher;
  ppx::Dispatcher d(MakeConfig(10, 1), launcher);
  WorkerId w1 = AddWorker(d, "w1:1");
  WorkerId w2 = AddWorker(d, "w2:1");
  auto sink = std::make_shared<RecordingSink>();

  JobId j1 = SubmitOk(d, sink, 1);
  JobId j2 = SubmitOk(d, sink, 2);

  REQUIRE(d.QueueLength() == 0U);
  REQUIRE(launcher.LaunchCount() == 2U);
  REQUIRE(d.GetJob(j1).value().state == JobState::kDispatched);
  REQUIRE(d.GetJob(j2).value().state == JobState::kDispatched);
  REQUIRE(d.GetWorker(w1).value().status == WorkerStatus::kBusy);
  REQUIRE(d.GetWorker(w2).value().status == WorkerStatus::kBusy);
  REQUIRE(launcher.At(0).worker != launcher.At(1).worker);
  REQUIRE(d.CheckInvariants());
}

TEST_CASE("dispatcher - capacity one: dispatch, queue, then reject", "[dispatcher]") {
  ManualLauncher launcher;
  ppx::Dispatcher d(MakeConfig(1, 1), launcher);
  AddWorker(d, "w1:1");
  auto sink = std::make_shared<RecordingSink>();

  JobId j1 = SubmitOk(d, sink, 1);
  JobId j2 = SubmitOk(d, sink, 2);
  auto r3 = d.Submit(3, Bytes("payload"), sink);

  REQUIRE(d.GetJob(j1).value().state == JobState::kDispatched);
  REQUIRE(d.GetJob(j2).value().state == JobState::kQueued);
  REQUIRE(!r3.has_value());
  REQUIRE(r3.get_error() == ProxyError::kAdmissionRejected);
  REQUIRE(d.QueueLength() == 1U);
  REQUIRE(d.LiveJobs() == 2U);
  REQUIRE(sink->Count() == 0U);
  REQUIRE(d.GetStats().rejected == 1U);
  REQUIRE(d.CheckInvariants());
}

TEST_CASE("dispatcher - dispatches without queueing when a worker is idle", "[dispatcher]") {
  ManualLauncher launcher;
  ppx::Dispatcher d(MakeConfig(1, 0), launcher);
  AddWorker(d, "w1:1");
  auto sink = std::make_shared<RecordingSink>();
  JobId j1 = SubmitOk(d, sink, 1);
  REQUIRE(d.QueueLength() == 0U);
  REQUIRE(launcher.LaunchCount() == 1U);
  REQUIRE(launcher.Last().job == j1);
}

TEST_CASE("dispatcher - queues without workers and drains when one joins", "[dispatcher]") {
  ManualLauncher launcher;
  ppx::Dispatcher d(MakeConfig(4, 0), launcher);
  auto sink = std::make_shared<RecordingSink>();
  JobId j1 = SubmitOk(d, sink, 1);
  JobId j2 = SubmitOk(d, sink, 2);
  REQUIRE(launcher.LaunchCount() == 0U);
  REQUIRE(d.QueueLength() == 2U);

  AddWorker(d, "w1:1");
  REQUIRE(launcher.LaunchCount() == 1U);
  REQUIRE(launcher.Last().job == j1);

  launcher.CompleteOldest();
  REQUIRE(launcher.LaunchCount() == 2U);
  REQUIRE(launcher.Last().job == j2);
  REQUIRE(d.QueueLength() == 0U);
}

TEST_CASE("dispatcher - completes a job and delivers the proof once", "[dispatcher]") {
  ManualLauncher launcher;
  ppx::Dispatcher d(MakeConfig(4, 1), launcher);
  WorkerId w = AddWorker(d, "w1:1");
  auto sink = std::make_shared<RecordingSink>();
  JobId j = SubmitOk(d, sink, 42);

  launcher.CompleteOldest(ProxyError::kNone, "zk-proof");

  auto outs = sink->Outcomes();
  REQUIRE(outs.size() == 1U);
  REQUIRE(outs[0].ok());
  REQUIRE(outs[0].job_id == j);
  REQUIRE(outs[0].correlation_id == 42U);
  REQUIRE(std::string(outs[0].proof.begin(), outs[0].proof.end()) == "zk-proof");
  REQUIRE(!d.GetJob(j).has_value());
  REQUIRE(d.GetWorker(w).value().status == WorkerStatus::kIdle);
  REQUIRE(d.GetStats().completed == 1U);
  REQUIRE(d.GetStats().relay.delivered == 1U);
}

TEST_CASE("dispatcher - shares the load across workers round robin", "[dispatcher]") {
  ManualLauncher launcher;
  ppx::Dispatcher d(MakeConfig(4, 0), launcher);
  WorkerId w1 = AddWorker(d, "w1:1");
  WorkerId w2 = AddWorker(d, "w2:1");
  auto sink = std::make_shared<RecordingSink>();
  SubmitOk(d, sink, 1);
  launcher.CompleteOldest();
  SubmitOk(d, sink, 2);
  launcher.CompleteOldest();
  SubmitOk(d, sink, 3);
  REQUIRE(launcher.At(0).worker == w1);
  REQUIRE(launcher.At(1).worker == w2);
  REQUIRE(launcher.At(2).worker == w1);
}

// ============================================================================
// Retries
// ============================================================================

TEST_CASE("dispatcher - retries exhausted after max_retries + 1 dispatches",
          "[dispatcher]") {
  ManualLauncher launcher;
  ppx::Dispatcher d(MakeConfig(10, 2), launcher);
  AddWorker(d, "w1:1");
  auto sink = std::make_shared<RecordingSink>();
  JobId j = SubmitOk(d, sink, 9);

  for (int i = 0; i < 3; ++i) {
    REQUIRE(launcher.OpenCount() == 1U);
    REQUIRE(launcher.Last().retry_count == static_cast<uint32_t>(i));
    launcher.CompleteOldest(ProxyError::kWorkerError);
    REQUIRE(d.CheckInvariants());
  }

  REQUIRE(launcher.LaunchCount() == 3U);
  REQUIRE(launcher.OpenCount() == 0U);
  auto outs = sink->Outcomes();
  REQUIRE(outs.size() == 1U);
  REQUIRE(outs[0].error == ProxyError::kRetryExhausted);
  REQUIRE(outs[0].last_cause == ProxyError::kWorkerError);
  REQUIRE(outs[0].retry_count == 2U);
  REQUIRE(outs[0].correlation_id == 9U);
  REQUIRE(!d.GetJob(j).has_value());
  REQUIRE(d.GetStats().retried == 2U);
  REQUIRE(d.GetStats().failed == 1U);
}

TEST_CASE("dispatcher - retried job goes ahead of earlier queued jobs", "[dispatcher]") {
  ManualLauncher launcher;
  ppx::Dispatcher d(MakeConfig(4, 1), launcher);
  AddWorker(d, "w1:1");
  auto sink = std::make_shared<RecordingSink>();
  JobId j1 = SubmitOk(d, sink, 1);
  SubmitOk(d, sink, 2);

  launcher.CompleteOldest(ProxyError::kTransportError);
  REQUIRE(launcher.Last().job == j1);
  REQUIRE(launcher.Last().retry_count == 1U);
  REQUIRE(d.GetJob(j1).value().last_cause == ProxyError::kTransportError);
}

TEST_CASE("dispatcher - failed attempt returns the worker to Idle", "[dispatcher]") {
  ManualLauncher launcher;
  ppx::Dispatcher d(MakeConfig(4, 0), launcher);
  WorkerId w = AddWorker(d, "w1:1");
  auto sink = std::make_shared<RecordingSink>();
  SubmitOk(d, sink, 1);
  launcher.CompleteOldest(ProxyError::kWorkerError);
  REQUIRE(d.GetWorker(w).value().status == WorkerStatus::kIdle);
  REQUIRE(sink->Outcomes().at(0).error == ProxyError::kRetryExhausted);
}

// ============================================================================
// Health driven eviction
// ============================================================================

TEST_CASE("dispatcher - missed probes while Busy evict and requeue at front",
          "[dispatcher]") {
  ManualLauncher launcher;
  ppx::Dispatcher d(MakeConfig(4, 1, 3), launcher);
  WorkerId w1 = AddWorker(d, "w1:1");
  auto sink = std::make_shared<RecordingSink>();
  JobId j1 = SubmitOk(d, sink, 1);
  JobId j2 = SubmitOk(d, sink, 2);
  REQUIRE(d.GetJob(j2).value().state == JobState::kQueued);

  ProbeFailures(d, w1, 2);
  REQUIRE(d.GetWorker(w1).value().status == WorkerStatus::kBusy);
  auto third = d.ReportProbe(w1, false);
  REQUIRE(third.value().became_unhealthy);
  REQUIRE(third.value().evicted.value() == j1);

  REQUIRE(d.GetWorker(w1).value().status == WorkerStatus::kUnhealthy);
  ppx::Job evicted = d.GetJob(j1).value();
  REQUIRE(evicted.state == JobState::kQueued);
  REQUIRE(evicted.retry_count == 1U);
  REQUIRE(evicted.last_cause == ProxyError::kWorkerUnhealthy);
  REQUIRE(d.QueueLength() == 2U);
  REQUIRE(d.CheckInvariants());

  // The evicted job is first in line for the next worker.
  AddWorker(d, "w2:1");
  REQUIRE(launcher.Last().job == j1);
  REQUIRE(d.GetStats().evictions == 1U);
}

TEST_CASE("dispatcher - ignores the late result of an evicted attempt", "[dispatcher]") {
  ManualLauncher launcher;
  ppx::Dispatcher d(MakeConfig(4, 1, 1), launcher);
  WorkerId w1 = AddWorker(d, "w1:1");
  auto sink = std::make_shared<RecordingSink>();
  JobId j = SubmitOk(d, sink, 1);
  REQUIRE(d.ReportProbe(w1, false).value().evicted.value() == j);

  WorkerId w2 = AddWorker(d, "w2:1");
  REQUIRE(launcher.OpenCount() == 2U);
  REQUIRE(launcher.Last().worker == w2);

  // The first attempt answers late: no state change, no delivery.
  launcher.Finish(0U, ProxyError::kNone);
  REQUIRE(sink->Count() == 0U);
  REQUIRE(d.GetJob(j).value().state == JobState::kDispatched);
  REQUIRE(d.GetWorker(w1).value().status == WorkerStatus::kUnhealthy);
  REQUIRE(d.GetStats().stale_results == 1U);

  launcher.CompleteOldest();
  REQUIRE(sink->Count() == 1U);
  REQUIRE(sink->Outcomes()[0].ok());
  REQUIRE(sink->Outcomes()[0].retry_count == 1U);
}

TEST_CASE("dispatcher - recovered worker takes no job until its evicted attempt returns",
          "[dispatcher]") {
  ManualLauncher launcher;
  ppx::Dispatcher d(MakeConfig(4, 1, 3), launcher);
  WorkerId w = AddWorker(d, "w1:1");
  auto sink = std::make_shared<RecordingSink>();
  JobId j = SubmitOk(d, sink, 1);
  ProbeFailures(d, w, 3);
  REQUIRE(d.GetJob(j).value().state == JobState::kQueued);

  REQUIRE(d.ReportProbe(w, true).value().recovered);
  REQUIRE(d.GetWorker(w).value().status == WorkerStatus::kIdle);
  REQUIRE(d.GetWorker(w).value().AttemptOutstanding());
  REQUIRE(launcher.LaunchCount() == 1U);
  REQUIRE(launcher.OpenCount() == 1U);
  REQUIRE(d.GetJob(j).value().state == JobState::kQueued);

  // A fresh job waits too.
  JobId j2 = SubmitOk(d, sink, 2);
  REQUIRE(d.GetJob(j2).value().state == JobState::kQueued);
  REQUIRE(d.CheckInvariants());

  // The evicted attempt comes back; the retried job goes out next.
  launcher.Finish(0U, ProxyError::kTransportError);
  REQUIRE(d.GetStats().stale_results == 1U);
  REQUIRE(launcher.LaunchCount() == 2U);
  REQUIRE(launcher.OpenCount() == 1U);
  REQUIRE(launcher.Last().job == j);
  REQUIRE(launcher.Last().worker == w);
  REQUIRE(d.GetWorker(w).value().status == WorkerStatus::kBusy);
  REQUIRE(d.GetJob(j2).value().state == JobState::kQueued);
  REQUIRE(d.CheckInvariants());
}

TEST_CASE("dispatcher - unhealthy worker returns to Idle after one good probe", "[dispatcher]") {
  ManualLauncher launcher;
  ppx::Dispatcher d(MakeConfig(4, 1, 2), launcher);
  WorkerId w = AddWorker(d, "w1:1");
  ProbeFailures(d, w, 2);
  REQUIRE(d.GetWorker(w).value().status == WorkerStatus::kUnhealthy);

  auto sink = std::make_shared<RecordingSink>();
  JobId j = SubmitOk(d, sink, 1);
  REQUIRE(d.GetJob(j).value().state == JobState::kQueued);

  auto ok = d.ReportProbe(w, true);
  REQUIRE(ok.value().recovered);
  REQUIRE(launcher.LaunchCount() == 1U);
  REQUIRE(d.GetJob(j).value().state == JobState::kDispatched);
}

TEST_CASE("dispatcher - removes workers that stay unhealthy when configured", "[dispatcher]") {
  ManualLauncher launcher;
  ppx::DispatcherConfig cfg = MakeConfig(4, 1, 2);
  cfg.remove_after_failures = 2;
  ppx::Dispatcher d(cfg, launcher);
  WorkerId w = AddWorker(d, "w1:1");
  ProbeFailures(d, w, 3);
  REQUIRE(d.WorkerCount() == 1U);
  auto last = d.ReportProbe(w, false);
  REQUIRE(last.value().removed);
  REQUIRE(d.WorkerCount() == 0U);
  REQUIRE(d.ReportProbe(w, true).get_error() == ProxyError::kUnknownWorker);
}

// ============================================================================
// Deadlines
// ============================================================================

namespace {

struct ProbeLog {
  std::vector<WorkerId> requested;
  static void OnRequest(WorkerId w, void* ctx) {
    static_cast<ProbeLog*>(ctx)->requested.push_back(w);
  }
};

}  // namespace

TEST_CASE("dispatcher - reclaims expired jobs and keeps the worker Busy", "[dispatcher][deadline]") {
  ManualLauncher launcher;
  ppx::Dispatcher d(MakeConfig(4, 1), launcher);
  ProbeLog probes;
  d.SetProbeRequestHandler(&ProbeLog::OnRequest, &probes);
  WorkerId w = AddWorker(d, "w1:1");
  auto sink = std::make_shared<RecordingSink>();
  JobId j = SubmitOk(d, sink, 1);

  REQUIRE(d.ReclaimExpired(ppx::SteadyNowUs()) == 0U);
  const uint64_t later = ppx::SteadyNowUs() + 200ULL * 1000ULL * 1000ULL;
  REQUIRE(d.ReclaimExpired(later) == 1U);

  ppx::Job job = d.GetJob(j).value();
  REQUIRE(job.state == JobState::kQueued);
  REQUIRE(job.last_cause == ProxyError::kJobTimeout);
  REQUIRE(probes.requested.size() == 1U);
  REQUIRE(probes.requested[0] == w);
  REQUIRE(d.GetWorker(w).value().status == WorkerStatus::kBusy);
  REQUIRE(d.CheckInvariants());

  // The timed-out attempt finally returns; the worker takes the retry.
  launcher.CompleteOldest(ProxyError::kJobTimeout);
  REQUIRE(d.GetStats().stale_results == 1U);
  REQUIRE(launcher.LaunchCount() == 2U);
  REQUIRE(launcher.Last().job == j);
  REQUIRE(launcher.Last().retry_count == 1U);
  REQUIRE(d.GetStats().timeouts == 1U);
}

TEST_CASE("dispatcher - timeout on the last attempt fails the job", "[dispatcher][deadline]") {
  ManualLauncher launcher;
  ppx::Dispatcher d(MakeConfig(4, 0), launcher);
  AddWorker(d, "w1:1");
  auto sink = std::make_shared<RecordingSink>();
  SubmitOk(d, sink, 5);
  REQUIRE(d.ReclaimExpired(ppx::SteadyNowUs() + 200ULL * 1000ULL * 1000ULL) == 1U);
  auto outs = sink->Outcomes();
  REQUIRE(outs.size() == 1U);
  REQUIRE(outs[0].error == ProxyError::kRetryExhausted);
  REQUIRE(outs[0].last_cause == ProxyError::kJobTimeout);
}

// ============================================================================
// Worker removal
// ============================================================================

TEST_CASE("dispatcher - removing a Busy worker drains it after its job", "[dispatcher]") {
  ManualLauncher launcher;
  ppx::Dispatcher d(MakeConfig(4, 0), launcher);
  WorkerId w = AddWorker(d, "w1:1");
  auto sink = std::make_shared<RecordingSink>();
  SubmitOk(d, sink, 1);
  SubmitOk(d, sink, 2);

  REQUIRE(d.RemoveWorkerByAddress("w1:1").value() == false);
  REQUIRE(d.GetWorker(w).value().status == WorkerStatus::kDraining);
  launcher.CompleteOldest();
  REQUIRE(sink->Count() == 1U);
  REQUIRE(d.WorkerCount() == 0U);
  REQUIRE(launcher.LaunchCount() == 1U);
  REQUIRE(d.QueueLength() == 1U);

  auto unknown = d.RemoveWorkerByAddress("w1:1");
  REQUIRE(unknown.get_error() == ProxyError::kUnknownWorker);
}

TEST_CASE("dispatcher - rejects duplicate workers", "[dispatcher]") {
  ManualLauncher launcher;
  ppx::Dispatcher d(MakeConfig(4, 0), launcher);
  AddWorker(d, "w1:1");
  REQUIRE(d.AddWorker("w1:1").get_error() == ProxyError::kDuplicateWorker);
}

// ============================================================================
// Disconnects and shutdown
// ============================================================================

TEST_CASE("dispatcher - discards results for disconnected clients", "[dispatcher]") {
  ManualLauncher launcher;
  ppx::Dispatcher d(MakeConfig(4, 0), launcher);
  WorkerId w = AddWorker(d, "w1:1");
  auto sink = std::make_shared<RecordingSink>();
  SubmitOk(d, sink, 1);
  sink->connected = false;
  launcher.CompleteOldest();
  REQUIRE(sink->Count() == 0U);
  REQUIRE(d.GetStats().relay.discarded == 1U);
  REQUIRE(d.GetWorker(w).value().status == WorkerStatus::kIdle);
}

TEST_CASE("dispatcher - shutdown fails queued jobs and rejects new ones", "[dispatcher]") {
  ManualLauncher launcher;
  ppx::Dispatcher d(MakeConfig(4, 3), launcher);
  AddWorker(d, "w1:1");
  auto sink = std::make_shared<RecordingSink>();
  SubmitOk(d, sink, 1);
  SubmitOk(d, sink, 2);

  d.Shutdown();
  auto outs = sink->Outcomes();
  REQUIRE(outs.size() == 1U);
  REQUIRE(outs[0].correlation_id == 2U);
  REQUIRE(outs[0].error == ProxyError::kAdmissionRejected);
  REQUIRE(outs[0].detail == "proxy shutting down");
  REQUIRE(d.Submit(3, Bytes("x"), sink).get_error() == ProxyError::kAdmissionRejected);

  // An in-flight failure after shutdown is terminal, never requeued.
  launcher.CompleteOldest(ProxyError::kTransportError);
  REQUIRE(sink->Count() == 2U);
  REQUIRE(d.LiveJobs() == 0U);
  REQUIRE(launcher.LaunchCount() == 1U);
}

// ============================================================================
// Randomized invariants
// ============================================================================

TEST_CASE("dispatcher - invariants hold under random operation sequences", "[dispatcher][property]") {
  const uint32_t kMaxRetries = 2;
  for (uint32_t seed = 1; seed <= 20U; ++seed) {
    ManualLauncher launcher;
    ppx::Dispatcher d(MakeConfig(3, kMaxRetries, 2), launcher);
    std::vector<WorkerId> workers;
    workers.push_back(AddWorker(d, "w1:1"));
    workers.push_back(AddWorker(d, "w2:1"));
    workers.push_back(AddWorker(d, "w3:1"));
    auto sink = std::make_shared<RecordingSink>();
    std::mt19937 rng(seed);
    uint64_t admitted = 0;

    for (int step = 0; step < 300; ++step) {
      const uint32_t op = rng() % 6U;
      if (op == 0U) {
        if (d.Submit(static_cast<uint64_t>(step), Bytes("p"), sink).has_value()) {
          ++admitted;
        }
      } else if (op == 1U && launcher.OpenCount() > 0U) {
        launcher.Finish(rng() % launcher.OpenCount(), ProxyError::kNone);
      } else if (op == 2U && launcher.OpenCount() > 0U) {
        launcher.Finish(rng() % launcher.OpenCount(), ProxyError::kWorkerError);
      } else if (op == 3U) {
        REQUIRE(d.ReportProbe(workers[rng() % workers.size()], (rng() % 3U) != 0U)
                    .has_value());
      } else if (op == 4U) {
        (void)d.ReclaimExpired(ppx::SteadyNowUs() +
                               ((rng() % 4U) == 0U ? 200000000ULL : 0ULL));
      } else {
        REQUIRE(d.ReportProbe(workers[rng() % workers.size()], true).has_value());
      }
      REQUIRE(d.QueueLength() <= 3U);
      REQUIRE(d.CheckInvariants());
    }

    // Heal everything and let every attempt finish.
    for (int round = 0; round < 50 && d.LiveJobs() > 0U; ++round) {
      for (WorkerId w : workers) REQUIRE(d.ReportProbe(w, true).has_value());
      while (launcher.OpenCount() > 0U) launcher.CompleteOldest();
    }
    REQUIRE(d.LiveJobs() == 0U);

    for (const auto& kv : launcher.DispatchesPerJob()) {
      REQUIRE(kv.second <= kMaxRetries + 1U);
    }
    // Every admitted job got exactly one outcome.
    REQUIRE(sink->Count() == admitted);
  }
}
