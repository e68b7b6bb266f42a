/**
 * @file cli.hpp
 * @brief Command line of the proof-proxy binary.
 *
 *   proof-proxy init [--config <path>]
 *   proof-proxy start-proxy <listen-address> [--config <path>]
 *   proof-proxy update-workers <add|remove> <proxy-address> <worker>...
 */

#ifndef PPX_CLI_HPP_
#define PPX_CLI_HPP_

#include "ppx/config.hpp"
#include "ppx/log.hpp"
#include "ppx/protocol.hpp"
#include "ppx/proxy_client.hpp"
#include "ppx/proxy_config.hpp"
#include "ppx/vocabulary.hpp"

#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <string>
#include <vector>

#include <fcntl.h>
#include <unistd.h>

namespace ppx {

constexpr const char* kDefaultConfigPath = "proof-proxy.ini";

enum class CliError : uint8_t {
  kNoCommand = 0,
  kUnknownCommand,
  kMissingArgument,
  kUnexpectedArgument,
  kBadAction,
  kConnectFailed,
  kRequestFailed,
  kRejected,
};

inline const char* CliErrorToString(CliError e) noexcept {
  switch (e) {
    case CliError::kNoCommand:
      return "no command given";
    case CliError::kUnknownCommand:
      return "unknown command";
    case CliError::kMissingArgument:
      return "missing argument";
    case CliError::kUnexpectedArgument:
      return "unexpected argument";
    case CliError::kBadAction:
      return "action must be 'add' or 'remove'";
    case CliError::kConnectFailed:
      return "cannot connect to proxy";
    case CliError::kRequestFailed:
      return "request failed";
    case CliError::kRejected:
      return "request rejected by proxy";
  }
  return "unknown";
}

enum class CommandKind : uint8_t { kHelp = 0, kInit, kStartProxy, kUpdateWorkers };

struct CliCommand {
  CommandKind kind = CommandKind::kHelp;
  std::string config_path = kDefaultConfigPath;
  bool config_explicit = false;  ///< --config given; the file must exist.
  std::string listen_address;    ///< start-proxy
  std::string proxy_address;     ///< update-workers
  WorkerUpdate update;           ///< update-workers
};

inline void PrintUsage(FILE* out, const char* prog) {
  std::fprintf(out,
               "Usage:\n"
               "  %s init [--config <path>]\n"
               "  %s start-proxy <host:port> [--config <path>]\n"
               "  %s update-workers <add|remove> <proxy host:port> <worker>...\n"
               "  %s --help\n"
               "\n"
               "Configuration defaults to %s; PPX_* environment variables\n"
               "override file values.\n",
               prog, prog, prog, prog, kDefaultConfigPath);
}

inline expected<CliCommand, CliError> ParseCommandLine(int argc,
                                                       const char* const* argv) {
  using Result = expected<CliCommand, CliError>;
  CliCommand cmd;
  std::vector<std::string> positional;
  for (int i = 1; i < argc; ++i) {
    if (std::strcmp(argv[i], "--config") == 0) {
      if (i + 1 >= argc) return Result::error(CliError::kMissingArgument);
      cmd.config_path = argv[++i];
      cmd.config_explicit = true;
    } else if (std::strcmp(argv[i], "--help") == 0 ||
               std::strcmp(argv[i], "-h") == 0) {
      cmd.kind = CommandKind::kHelp;
      return Result::success(std::move(cmd));
    } else {
      positional.emplace_back(argv[i]);
    }
  }
  if (positional.empty()) return Result::error(CliError::kNoCommand);

  const std::string& verb = positional[0];
  if (verb == "init") {
    if (positional.size() > 1U) return Result::error(CliError::kUnexpectedArgument);
    cmd.kind = CommandKind::kInit;
  } else if (verb == "start-proxy") {
    if (positional.size() < 2U) return Result::error(CliError::kMissingArgument);
    if (positional.size() > 2U) return Result::error(CliError::kUnexpectedArgument);
    cmd.kind = CommandKind::kStartProxy;
    cmd.listen_address = positional[1];
  } else if (verb == "update-workers") {
    if (positional.size() < 4U) return Result::error(CliError::kMissingArgument);
    if (positional[1] == "add") {
      cmd.update.action = WorkerUpdateAction::kAdd;
    } else if (positional[1] == "remove") {
      cmd.update.action = WorkerUpdateAction::kRemove;
    } else {
      return Result::error(CliError::kBadAction);
    }
    cmd.kind = CommandKind::kUpdateWorkers;
    cmd.proxy_address = positional[2];
    cmd.update.addresses.assign(positional.begin() + 3, positional.end());
  } else {
    return Result::error(CliError::kUnknownCommand);
  }
  return Result::success(std::move(cmd));
}

/**
 * @brief Write the default configuration to @p path.
 *
 * The format follows the extension (.json, .yaml/.yml, otherwise INI).
 * An existing file is never overwritten.
 */
inline expected<void, ConfigError> RunInit(const char* path) {
  const std::string text = RenderDefaultConfig(FormatFromPath(path));
  const int fd = ::open(path, O_WRONLY | O_CREAT | O_EXCL, 0644);
  if (fd < 0) {
    if (errno == EEXIST) {
      PPX_LOG_ERROR("CLI", "%s already exists, not overwriting", path);
      return expected<void, ConfigError>::error(ConfigError::kAlreadyExists);
    }
    PPX_LOG_ERROR("CLI", "cannot create %s: %s", path, std::strerror(errno));
    return expected<void, ConfigError>::error(ConfigError::kWriteFailed);
  }
  size_t off = 0;
  bool failed = false;
  while (off < text.size()) {
    const ssize_t n = ::write(fd, text.data() + off, text.size() - off);
    if (n < 0) {
      if (errno == EINTR) continue;
      failed = true;
      break;
    }
    off += static_cast<size_t>(n);
  }
  if (::close(fd) != 0) failed = true;
  if (failed) {
    PPX_LOG_ERROR("CLI", "writing %s failed", path);
    (void)::unlink(path);
    return expected<void, ConfigError>::error(ConfigError::kWriteFailed);
  }
  PPX_LOG_INFO("CLI", "wrote default configuration to %s", path);
  return expected<void, ConfigError>::success();
}

#if PPX_HAS_NETWORK

/// @return Worker count reported by the proxy after the update.
inline expected<uint32_t, CliError> RunUpdateWorkers(const CliCommand& cmd,
                                                     uint32_t timeout_ms = 5000U) {
  using Result = expected<uint32_t, CliError>;
  auto client = ProxyClient::Connect(cmd.proxy_address.c_str(), timeout_ms);
  if (!client.has_value()) {
    PPX_LOG_ERROR("CLI", "connect %s: %s", cmd.proxy_address.c_str(),
                  SocketErrorToString(client.get_error()));
    return Result::error(CliError::kConnectFailed);
  }
  if (!client.value().SetReceiveTimeout(timeout_ms).has_value()) {
    PPX_LOG_WARN("CLI", "cannot bound the reply wait, waiting indefinitely");
  }
  auto ack = client.value().UpdateWorkers(cmd.update);
  if (!ack.has_value()) {
    PPX_LOG_ERROR("CLI", "worker update: %s", FrameErrorToString(ack.get_error()));
    return Result::error(CliError::kRequestFailed);
  }
  if (ack.value().error != ProxyError::kNone) {
    PPX_LOG_ERROR("CLI", "worker update rejected: %s (workers now %u)",
                  ProxyErrorToString(ack.value().error), ack.value().worker_count);
    return Result::error(CliError::kRejected);
  }
  return Result::success(ack.value().worker_count);
}

#endif  // PPX_HAS_NETWORK

}  // namespace ppx

#endif  // PPX_CLI_HPP_
