/**
 * @file main.cpp
 * @brief mock-prover: stand-in proving worker for local runs.
 *
 *   mock-prover <port> [--fail-rate <percent>] [--delay-ms <ms>]
 *
 * "Proves" by hashing the payload after an optional delay; fails the given
 * percentage of requests.
 */

#include "ppx/log.hpp"
#include "ppx/shutdown.hpp"
#include "ppx/socket.hpp"
#include "ppx/vocabulary.hpp"
#include "ppx/worker_endpoint.hpp"

#include <atomic>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <mutex>
#include <random>
#include <string>
#include <thread>

struct MockProver {
  uint32_t fail_rate = 0;  ///< Percent.
  uint32_t delay_ms = 0;
  std::mutex rng_mutex;
  std::mt19937 rng{std::random_device{}()};
  std::atomic<uint64_t> proved{0};
  std::atomic<uint64_t> failed{0};
};

static uint64_t Fnv1a(const ppx::Payload& data, uint64_t seed) {
  uint64_t h = 14695981039346656037ULL ^ seed;
  for (uint8_t b : data) {
    h ^= b;
    h *= 1099511628211ULL;
  }
  return h;
}

static bool Prove(ppx::JobId job, const ppx::Payload& input, ppx::Payload& proof,
                  std::string& error, void* ctx) {
  MockProver* self = static_cast<MockProver*>(ctx);
  if (self->delay_ms > 0U) {
    std::this_thread::sleep_for(std::chrono::milliseconds(self->delay_ms));
  }
  uint32_t roll = 0;
  {
    std::lock_guard<std::mutex> lock(self->rng_mutex);
    roll = static_cast<uint32_t>(self->rng() % 100U);
  }
  if (roll < self->fail_rate) {
    self->failed.fetch_add(1U, std::memory_order_relaxed);
    error = "mock failure for job " + std::to_string(job.value());
    return false;
  }
  proof.clear();
  for (uint64_t seed = 0; seed < 4U; ++seed) {
    const uint64_t h = Fnv1a(input, seed);
    for (uint32_t i = 0; i < 8U; ++i) {
      proof.push_back(static_cast<uint8_t>(h >> (i * 8U)));
    }
  }
  self->proved.fetch_add(1U, std::memory_order_relaxed);
  return true;
}

static bool ParseUint(const char* text, uint32_t& out) {
  char* end = nullptr;
  unsigned long v = std::strtoul(text, &end, 10);
  if (end == text || *end != '\0' || v > 0xFFFFFFFFUL) return false;
  out = static_cast<uint32_t>(v);
  return true;
}

int main(int argc, char* argv[]) {
  ppx::log::Init();
  PPX_SCOPE_EXIT(ppx::log::Shutdown());

  MockProver prover;
  uint32_t port = 0;
  bool have_port = false;
  for (int i = 1; i < argc; ++i) {
    if (std::strcmp(argv[i], "--fail-rate") == 0 && i + 1 < argc) {
      if (!ParseUint(argv[++i], prover.fail_rate) || prover.fail_rate > 100U) {
        std::fprintf(stderr, "--fail-rate expects 0..100\n");
        return 1;
      }
    } else if (std::strcmp(argv[i], "--delay-ms") == 0 && i + 1 < argc) {
      if (!ParseUint(argv[++i], prover.delay_ms)) {
        std::fprintf(stderr, "--delay-ms expects a number\n");
        return 1;
      }
    } else if (!have_port && ParseUint(argv[i], port) && port <= 65535U) {
      have_port = true;
    } else {
      std::fprintf(stderr,
                   "Usage: %s <port> [--fail-rate <percent>] [--delay-ms <ms>]\n",
                   argv[0]);
      return 1;
    }
  }
  if (!have_port) {
    std::fprintf(stderr,
                 "Usage: %s <port> [--fail-rate <percent>] [--delay-ms <ms>]\n",
                 argv[0]);
    return 1;
  }

  ppx::ShutdownManager shutdown;
  if (!shutdown.InstallSignalHandlers().has_value()) {
    PPX_LOG_ERROR("WORKER", "cannot install signal handlers");
    return 1;
  }

  ppx::WorkerEndpoint endpoint(&Prove, &prover);
  auto r = endpoint.Start(ppx::SocketAddress::Any(static_cast<uint16_t>(port)));
  if (!r.has_value()) {
    PPX_LOG_ERROR("WORKER", "cannot listen on port %u", port);
    return 1;
  }
  PPX_LOG_INFO("WORKER", "mock prover on port %u (fail rate %u%%, delay %u ms)",
               static_cast<unsigned>(endpoint.Port()), prover.fail_rate,
               prover.delay_ms);

  shutdown.WaitForShutdown();
  endpoint.Stop();
  PPX_LOG_INFO("WORKER", "served %llu proof(s), %llu failure(s)",
               static_cast<unsigned long long>(prover.proved.load()),
               static_cast<unsigned long long>(prover.failed.load()));
  return 0;
}
