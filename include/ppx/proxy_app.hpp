/**
 * @file proxy_app.hpp
 * @brief ProxyApp: wires transport, launcher, dispatcher, health monitor
 *        and gateway server into the running `start-proxy` service.
 */

#ifndef PPX_PROXY_APP_HPP_
#define PPX_PROXY_APP_HPP_

#include "ppx/dispatcher.hpp"
#include "ppx/health_monitor.hpp"
#include "ppx/job_launcher.hpp"
#include "ppx/log.hpp"
#include "ppx/proxy_config.hpp"
#include "ppx/proxy_server.hpp"
#include "ppx/socket.hpp"
#include "ppx/vocabulary.hpp"
#include "ppx/worker_transport.hpp"

#if PPX_HAS_NETWORK

#include <cstdint>
#include <string>

namespace ppx {

enum class AppError : uint8_t {
  kInvalidAddress = 0,
  kBindFailed,
  kMonitorFailed,
  kAlreadyStarted,
};

inline const char* AppErrorToString(AppError e) noexcept {
  switch (e) {
    case AppError::kInvalidAddress:
      return "invalid listen address";
    case AppError::kBindFailed:
      return "bind failed";
    case AppError::kMonitorFailed:
      return "health monitor failed to start";
    case AppError::kAlreadyStarted:
      return "already started";
  }
  return "unknown";
}

class ProxyApp final {
 public:
  explicit ProxyApp(const ProxyConfig& cfg)
      : cfg_(cfg),
        transport_(cfg.connect_timeout_ms),
        launcher_(transport_),
        dispatcher_(cfg.ToDispatcherConfig(), launcher_),
        monitor_(dispatcher_, transport_, cfg.ToHealthMonitorConfig()),
        server_(dispatcher_, cfg.ToServerConfig()) {}

  ~ProxyApp() { Stop(); }

  ProxyApp(const ProxyApp&) = delete;
  ProxyApp& operator=(const ProxyApp&) = delete;

  /**
   * @brief Register the configured workers, start health checks and bind
   *        the gateway on @p listen_address ("host:port").
   */
  expected<void, AppError> Start(const char* listen_address) {
    if (started_) return expected<void, AppError>::error(AppError::kAlreadyStarted);
    auto addr = SocketAddress::Parse(listen_address);
    if (!addr.has_value()) {
      PPX_LOG_ERROR("SERVER", "cannot parse listen address '%s'",
                    listen_address != nullptr ? listen_address : "");
      return expected<void, AppError>::error(AppError::kInvalidAddress);
    }

    for (const std::string& w : cfg_.workers) {
      auto r = dispatcher_.AddWorker(w.c_str());
      if (!r.has_value()) {
        PPX_LOG_WARN("SERVER", "worker %s not registered: %s", w.c_str(),
                     ProxyErrorToString(r.get_error()));
      }
    }

    if (!monitor_.Start().has_value()) {
      return expected<void, AppError>::error(AppError::kMonitorFailed);
    }
    if (!server_.Start(addr.value()).has_value()) {
      monitor_.Stop();
      return expected<void, AppError>::error(AppError::kBindFailed);
    }
    started_ = true;
    PPX_LOG_INFO("SERVER",
                 "proof proxy up: %u worker(s), queue %u, retries %u, policy %s",
                 dispatcher_.WorkerCount(), cfg_.queue_capacity,
                 cfg_.max_retries, LoadBalancePolicyToString(cfg_.policy));
    return expected<void, AppError>::success();
  }

  /**
   * @brief Drain and stop.
   *
   * Queued jobs fail first and in-flight calls are cancelled while clients
   * are still connected to receive their outcomes; the gateway goes last.
   */
  void Stop() {
    if (stopped_) return;
    stopped_ = true;
    dispatcher_.Shutdown();
    launcher_.Stop();
    monitor_.Stop();
    server_.Stop();
  }

  void LogStats() const {
    const DispatcherStats d = dispatcher_.GetStats();
    const ServerStats s = server_.GetStats();
    PPX_LOG_INFO("DISPATCH",
                 "workers %u (idle %u busy %u unhealthy %u) queue %u | "
                 "submitted %llu completed %llu failed %llu retried %llu "
                 "rejected %llu rate-limited %llu",
                 dispatcher_.WorkerCount(),
                 dispatcher_.CountWorkers(WorkerStatus::kIdle),
                 dispatcher_.CountWorkers(WorkerStatus::kBusy),
                 dispatcher_.CountWorkers(WorkerStatus::kUnhealthy),
                 dispatcher_.QueueLength(),
                 static_cast<unsigned long long>(d.submitted),
                 static_cast<unsigned long long>(d.completed),
                 static_cast<unsigned long long>(d.failed),
                 static_cast<unsigned long long>(d.retried),
                 static_cast<unsigned long long>(d.rejected),
                 static_cast<unsigned long long>(s.rate_limited));
  }

  uint16_t Port() const noexcept { return server_.Port(); }
  Dispatcher& GetDispatcher() noexcept { return dispatcher_; }
  const ProxyServer& Server() const noexcept { return server_; }
  const HealthMonitor& Monitor() const noexcept { return monitor_; }

 private:
  ProxyConfig cfg_;
  TcpWorkerTransport transport_;
  ThreadedLauncher launcher_;
  Dispatcher dispatcher_;
  HealthMonitor monitor_;
  ProxyServer server_;
  bool started_ = false;
  bool stopped_ = false;
};

}  // namespace ppx

#endif  // PPX_HAS_NETWORK

#endif  // PPX_PROXY_APP_HPP_
