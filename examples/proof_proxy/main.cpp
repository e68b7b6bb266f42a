/**
 * @file main.cpp
 * @brief proof-proxy: dispatch proxy in front of a pool of proving workers.
 *
 *   proof-proxy init [--config proof-proxy.ini]
 *   proof-proxy start-proxy 0.0.0.0:8080 [--config proof-proxy.ini]
 *   proof-proxy update-workers add 127.0.0.1:8080 10.0.0.5:9000
 *
 * start-proxy runs until SIGINT/SIGTERM and logs dispatch statistics every
 * few seconds.
 */

#include "ppx/cli.hpp"
#include "ppx/log.hpp"
#include "ppx/proxy_app.hpp"
#include "ppx/proxy_config.hpp"
#include "ppx/shutdown.hpp"
#include "ppx/vocabulary.hpp"

#include <cstdio>

static constexpr int32_t kStatsIntervalMs = 10000;

static void StopApp(int signo, void* ctx) {
  PPX_LOG_INFO("SERVER", "shutting down (signal %d)", signo);
  static_cast<ppx::ProxyApp*>(ctx)->Stop();
}

static int StartProxy(const ppx::CliCommand& cmd) {
  auto cfg = ppx::LoadProxyConfig(cmd.config_path.c_str(), cmd.config_explicit);
  if (!cfg.has_value()) {
    PPX_LOG_ERROR("CONFIG", "invalid configuration, not starting");
    return 1;
  }
  ppx::log::SetLevel(cfg.value().log_level);

  ppx::ShutdownManager shutdown;
  auto sig = shutdown.InstallSignalHandlers();
  if (!sig.has_value()) {
    PPX_LOG_ERROR("SERVER", "cannot install signal handlers");
    return 1;
  }

  ppx::ProxyApp app(cfg.value());
  auto started = app.Start(cmd.listen_address.c_str());
  if (!started.has_value()) {
    PPX_LOG_ERROR("SERVER", "start-proxy %s: %s", cmd.listen_address.c_str(),
                  ppx::AppErrorToString(started.get_error()));
    return 1;
  }
  if (!shutdown.Register(&StopApp, &app).has_value()) {
    PPX_LOG_ERROR("SERVER", "cannot register shutdown step");
    return 1;
  }

  while (!shutdown.WaitFor(kStatsIntervalMs)) {
    app.LogStats();
  }
  shutdown.RunCallbacks();
  app.LogStats();
  return 0;
}

int main(int argc, char* argv[]) {
  ppx::log::Init();
  PPX_SCOPE_EXIT(ppx::log::Shutdown());

  auto cmd = ppx::ParseCommandLine(argc, argv);
  if (!cmd.has_value()) {
    std::fprintf(stderr, "error: %s\n\n", ppx::CliErrorToString(cmd.get_error()));
    ppx::PrintUsage(stderr, argv[0]);
    return 1;
  }

  switch (cmd.value().kind) {
    case ppx::CommandKind::kHelp:
      ppx::PrintUsage(stdout, argv[0]);
      return 0;
    case ppx::CommandKind::kInit:
      return ppx::RunInit(cmd.value().config_path.c_str()).has_value() ? 0 : 1;
    case ppx::CommandKind::kStartProxy:
      return StartProxy(cmd.value());
    case ppx::CommandKind::kUpdateWorkers: {
      auto count = ppx::RunUpdateWorkers(cmd.value());
      if (!count.has_value()) {
        std::fprintf(stderr, "error: %s\n", ppx::CliErrorToString(count.get_error()));
        return 1;
      }
      std::printf("%u\n", count.value());
      return 0;
    }
  }
  return 1;
}
