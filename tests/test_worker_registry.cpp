/**
 * @file test_worker_registry.cpp
 * @brief Tests for worker_registry.hpp
 */

#include "ppx/worker_registry.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

using ppx::AttemptId;
using ppx::JobId;
using ppx::LoadBalancePolicy;
using ppx::WorkerId;
using ppx::WorkerStatus;

static WorkerId Add(ppx::WorkerRegistry& reg, const char* addr) {
  auto r = reg.Register(addr, 1000U);
  REQUIRE(r.has_value());
  return r.value();
}

// ============================================================================
// Registration
// ============================================================================

TEST_CASE("registry - registers workers Idle", "[registry]") {
  ppx::WorkerRegistry reg;
  WorkerId a = Add(reg, "10.0.0.1:9000");
  WorkerId b = Add(reg, "10.0.0.2:9000");
  REQUIRE(a != b);
  REQUIRE(reg.Size() == 2U);
  REQUIRE(reg.Find(a)->status == WorkerStatus::kIdle);
  REQUIRE(reg.Find(a)->last_heartbeat_us == 1000U);
  REQUIRE(reg.FindByAddress("10.0.0.2:9000").value() == b);
  REQUIRE(!reg.FindByAddress("10.0.0.3:9000").has_value());
}

TEST_CASE("registry - rejects duplicate and invalid addresses", "[registry]") {
  ppx::WorkerRegistry reg;
  Add(reg, "host:1");
  auto dup = reg.Register("host:1", 0U);
  REQUIRE(!dup.has_value());
  REQUIRE(dup.get_error() == ppx::ProxyError::kDuplicateWorker);

  auto empty = reg.Register("", 0U);
  REQUIRE(empty.get_error() == ppx::ProxyError::kInvalidAddress);
  auto null = reg.Register(nullptr, 0U);
  REQUIRE(null.get_error() == ppx::ProxyError::kInvalidAddress);
  std::string long_addr(ppx::WorkerAddress::capacity() + 1U, 'a');
  auto too_long = reg.Register(long_addr.c_str(), 0U);
  REQUIRE(too_long.get_error() == ppx::ProxyError::kInvalidAddress);
  REQUIRE(reg.Size() == 1U);
}

TEST_CASE("registry - deregisters Idle immediately, Busy after its job", "[registry]") {
  ppx::WorkerRegistry reg;
  WorkerId a = Add(reg, "a:1");
  WorkerId b = Add(reg, "b:1");
  REQUIRE(reg.Deregister(a).value() == true);
  REQUIRE(reg.Find(a) == nullptr);

  REQUIRE(reg.MarkBusy(b, JobId(1), AttemptId(1)).has_value());
  REQUIRE(reg.Deregister(b).value() == false);
  REQUIRE(reg.Find(b)->status == WorkerStatus::kDraining);
  REQUIRE(reg.ListIdle(LoadBalancePolicy::kRoundRobin).empty());
  REQUIRE(reg.MarkIdle(b).value() == true);
  REQUIRE(reg.Find(b) == nullptr);

  auto unknown = reg.Deregister(WorkerId(99));
  REQUIRE(unknown.get_error() == ppx::ProxyError::kUnknownWorker);
}

// ============================================================================
// Busy / Idle
// ============================================================================

TEST_CASE("registry - holds at most one job per worker", "[registry]") {
  ppx::WorkerRegistry reg;
  WorkerId a = Add(reg, "a:1");
  REQUIRE(reg.MarkBusy(a, JobId(1), AttemptId(1)).has_value());
  auto again = reg.MarkBusy(a, JobId(2), AttemptId(2));
  REQUIRE(again.get_error() == ppx::ProxyError::kWorkerBusy);
  REQUIRE(reg.Find(a)->current_job.value() == JobId(1));

  REQUIRE(reg.MarkIdle(a).value() == false);
  REQUIRE(reg.Find(a)->status == WorkerStatus::kIdle);
  REQUIRE(!reg.Find(a)->current_job.has_value());
  REQUIRE(reg.Find(a)->jobs_assigned == 1U);
}

TEST_CASE("registry - never assigns to an Unhealthy worker", "[registry]") {
  ppx::WorkerRegistry reg;
  WorkerId a = Add(reg, "a:1");
  REQUIRE(reg.MarkUnhealthy(a).has_value());
  auto r = reg.MarkBusy(a, JobId(1), AttemptId(1));
  REQUIRE(r.get_error() == ppx::ProxyError::kWorkerUnhealthy);
  REQUIRE(reg.ListIdle(LoadBalancePolicy::kLeastLoaded).empty());
  REQUIRE(reg.MarkIdle(a).has_value());
  REQUIRE(reg.Find(a)->status == WorkerStatus::kUnhealthy);
}

TEST_CASE("registry - DetachJob keeps the attempt", "[registry]") {
  ppx::WorkerRegistry reg;
  WorkerId a = Add(reg, "a:1");
  REQUIRE(reg.MarkBusy(a, JobId(4), AttemptId(9)).has_value());
  REQUIRE(reg.DetachJob(a).has_value());
  REQUIRE(reg.Find(a)->status == WorkerStatus::kBusy);
  REQUIRE(!reg.Find(a)->current_job.has_value());
  REQUIRE(reg.Find(a)->attempt == AttemptId(9));
}

TEST_CASE("registry - MarkUnhealthy evicts the in-flight job", "[registry]") {
  ppx::WorkerRegistry reg;
  WorkerId a = Add(reg, "a:1");
  REQUIRE(reg.MarkBusy(a, JobId(7), AttemptId(1)).has_value());
  auto r = reg.MarkUnhealthy(a);
  REQUIRE(r.has_value());
  REQUIRE(r.value().value() == JobId(7));
  REQUIRE(reg.Find(a)->status == WorkerStatus::kUnhealthy);
  REQUIRE(!reg.Find(a)->current_job.has_value());
  REQUIRE(reg.Find(a)->attempt == AttemptId(1));
}

TEST_CASE("registry - recovered worker is not idle until its attempt returns", "[registry]") {
  ppx::WorkerRegistry reg;
  WorkerId a = Add(reg, "a:1");
  REQUIRE(reg.MarkBusy(a, JobId(7), AttemptId(1)).has_value());
  REQUIRE(reg.MarkUnhealthy(a).has_value());
  REQUIRE(reg.RecordProbe(a, true, 3U, 0U).value().recovered);
  REQUIRE(reg.Find(a)->status == WorkerStatus::kIdle);
  REQUIRE(reg.ListIdle(LoadBalancePolicy::kRoundRobin).empty());
  REQUIRE(reg.MarkBusy(a, JobId(8), AttemptId(2)).get_error() ==
          ppx::ProxyError::kWorkerBusy);

  REQUIRE(!reg.MarkIdle(a).value());
  REQUIRE(reg.Find(a)->status == WorkerStatus::kIdle);
  REQUIRE(reg.ListIdle(LoadBalancePolicy::kRoundRobin).size() == 1U);
  REQUIRE(reg.MarkBusy(a, JobId(8), AttemptId(2)).has_value());
}

// ============================================================================
// Probes
// ============================================================================

TEST_CASE("registry - turns Unhealthy after exactly threshold failures", "[registry][probe]") {
  ppx::WorkerRegistry reg;
  WorkerId a = Add(reg, "a:1");
  for (uint32_t i = 1; i < 3U; ++i) {
    auto p = reg.RecordProbe(a, false, 3U, 0U);
    REQUIRE(!p.value().became_unhealthy);
    REQUIRE(p.value().consecutive_failures == i);
    REQUIRE(reg.Find(a)->status == WorkerStatus::kIdle);
  }
  auto p = reg.RecordProbe(a, false, 3U, 0U);
  REQUIRE(p.value().became_unhealthy);
  REQUIRE(reg.Find(a)->status == WorkerStatus::kUnhealthy);

  auto more = reg.RecordProbe(a, false, 3U, 0U);
  REQUIRE(!more.value().became_unhealthy);
  REQUIRE(reg.Find(a)->consecutive_failures == 4U);
}

TEST_CASE("registry - success resets the failure counter", "[registry][probe]") {
  ppx::WorkerRegistry reg;
  WorkerId a = Add(reg, "a:1");
  REQUIRE(reg.RecordProbe(a, false, 3U, 0U).has_value());
  REQUIRE(reg.RecordProbe(a, false, 3U, 0U).has_value());
  auto ok = reg.RecordProbe(a, true, 3U, 5000U);
  REQUIRE(!ok.value().recovered);
  REQUIRE(reg.Find(a)->consecutive_failures == 0U);
  REQUIRE(reg.Find(a)->last_heartbeat_us == 5000U);
  REQUIRE(reg.RecordProbe(a, false, 3U, 0U).has_value());
  REQUIRE(reg.Find(a)->status == WorkerStatus::kIdle);
}

TEST_CASE("registry - one successful probe recovers to Idle", "[registry][probe]") {
  ppx::WorkerRegistry reg;
  WorkerId a = Add(reg, "a:1");
  for (int i = 0; i < 2; ++i) REQUIRE(reg.RecordProbe(a, false, 2U, 0U).has_value());
  REQUIRE(reg.Find(a)->status == WorkerStatus::kUnhealthy);
  auto ok = reg.RecordProbe(a, true, 2U, 10U);
  REQUIRE(ok.value().recovered);
  REQUIRE(reg.Find(a)->status == WorkerStatus::kIdle);
}

TEST_CASE("registry - probe failure on a Busy worker evicts its job", "[registry][probe]") {
  ppx::WorkerRegistry reg;
  WorkerId a = Add(reg, "a:1");
  REQUIRE(reg.MarkBusy(a, JobId(3), AttemptId(1)).has_value());
  REQUIRE(reg.RecordProbe(a, false, 1U, 0U).value().evicted.value() == JobId(3));
}

TEST_CASE("registry - Draining worker failing probes is removed", "[registry][probe]") {
  ppx::WorkerRegistry reg;
  WorkerId a = Add(reg, "a:1");
  REQUIRE(reg.MarkBusy(a, JobId(3), AttemptId(1)).has_value());
  REQUIRE(reg.Deregister(a).value() == false);
  auto p = reg.RecordProbe(a, false, 1U, 0U);
  REQUIRE(p.value().removed);
  REQUIRE(p.value().evicted.value() == JobId(3));
  REQUIRE(reg.Find(a) == nullptr);
}

TEST_CASE("registry - probe of unknown worker", "[registry][probe]") {
  ppx::WorkerRegistry reg;
  auto p = reg.RecordProbe(WorkerId(5), true, 3U, 0U);
  REQUIRE(p.get_error() == ppx::ProxyError::kUnknownWorker);
}

// ============================================================================
// Load balancing
// ============================================================================

TEST_CASE("registry - round robin rotates after the last assignment", "[registry][policy]") {
  ppx::WorkerRegistry reg;
  WorkerId a = Add(reg, "a:1");
  WorkerId b = Add(reg, "b:1");
  WorkerId c = Add(reg, "c:1");
  auto idle = reg.ListIdle(LoadBalancePolicy::kRoundRobin);
  REQUIRE(idle == std::vector<WorkerId>{a, b, c});

  REQUIRE(reg.MarkBusy(a, JobId(1), AttemptId(1)).has_value());
  REQUIRE(reg.MarkIdle(a).has_value());
  idle = reg.ListIdle(LoadBalancePolicy::kRoundRobin);
  REQUIRE(idle == std::vector<WorkerId>{b, c, a});

  REQUIRE(reg.MarkBusy(c, JobId(2), AttemptId(2)).has_value());
  REQUIRE(reg.MarkIdle(c).has_value());
  idle = reg.ListIdle(LoadBalancePolicy::kRoundRobin);
  REQUIRE(idle == std::vector<WorkerId>{a, b, c});
}

TEST_CASE("registry - least recently used prefers never-used workers", "[registry][policy]") {
  ppx::WorkerRegistry reg;
  WorkerId a = Add(reg, "a:1");
  WorkerId b = Add(reg, "b:1");
  WorkerId c = Add(reg, "c:1");
  REQUIRE(reg.MarkBusy(b, JobId(1), AttemptId(1)).has_value());
  REQUIRE(reg.MarkIdle(b).has_value());
  REQUIRE(reg.MarkBusy(a, JobId(2), AttemptId(2)).has_value());
  REQUIRE(reg.MarkIdle(a).has_value());
  auto idle = reg.ListIdle(LoadBalancePolicy::kLeastRecentlyUsed);
  REQUIRE(idle == std::vector<WorkerId>{c, b, a});
}

TEST_CASE("registry - least loaded orders by jobs assigned", "[registry][policy]") {
  ppx::WorkerRegistry reg;
  WorkerId a = Add(reg, "a:1");
  WorkerId b = Add(reg, "b:1");
  for (uint64_t j = 1; j <= 2U; ++j) {
    REQUIRE(reg.MarkBusy(a, JobId(j), AttemptId(j)).has_value());
    REQUIRE(reg.MarkIdle(a).has_value());
  }
  auto idle = reg.ListIdle(LoadBalancePolicy::kLeastLoaded);
  REQUIRE(idle.front() == b);
}

TEST_CASE("registry - policy names", "[registry][policy]") {
  REQUIRE(ppx::ParseLoadBalancePolicy("round_robin").value() ==
          LoadBalancePolicy::kRoundRobin);
  REQUIRE(ppx::ParseLoadBalancePolicy("lru").value() ==
          LoadBalancePolicy::kLeastRecentlyUsed);
  REQUIRE(ppx::ParseLoadBalancePolicy("least_loaded").value() ==
          LoadBalancePolicy::kLeastLoaded);
  REQUIRE(!ppx::ParseLoadBalancePolicy("random").has_value());
  REQUIRE(!ppx::ParseLoadBalancePolicy(nullptr).has_value());
}
