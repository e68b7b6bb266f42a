/**
 * @file shutdown.hpp
 * @brief Signal-driven process shutdown for the proxy and worker binaries.
 *
 * SIGINT/SIGTERM are installed with sigaction(2); the handler writes one
 * byte to a self-pipe. The main thread either blocks in WaitForShutdown()
 * or polls with WaitFor() between periodic chores (stats logging), then
 * RunCallbacks() tears components down in reverse registration order.
 */

#ifndef PPX_SHUTDOWN_HPP_
#define PPX_SHUTDOWN_HPP_

#include "ppx/platform.hpp"
#include "ppx/vocabulary.hpp"

#include <atomic>
#include <csignal>
#include <cstdint>

#include <poll.h>
#include <unistd.h>

namespace ppx {

enum class ShutdownError : uint8_t {
  kCallbacksFull = 0,
  kPipeCreationFailed,
  kSignalInstallFailed,
  kAlreadyInstantiated
};

/// @brief Cleanup step. Receives the signal number (0 for Quit()).
using ShutdownFn = void (*)(int signo, void* ctx);

class ShutdownManager;

namespace detail {

inline ShutdownManager*& GetShutdownInstance() {
  static ShutdownManager* ptr = nullptr;
  return ptr;
}

}  // namespace detail

/**
 * @brief Owns the wakeup pipe and the ordered cleanup list.
 *
 * One instance per process; a second instance is inert (IsValid() false).
 *
 * @code
 *   ppx::ShutdownManager shutdown;
 *   shutdown.Register(&StopApp, &app);
 *   shutdown.InstallSignalHandlers();
 *   while (!shutdown.WaitFor(5000)) LogStats(app);
 *   shutdown.RunCallbacks();
 * @endcode
 */
class ShutdownManager final {
 public:
  static constexpr uint32_t kMaxCallbacks = 16;

  ShutdownManager() noexcept {
    if (detail::GetShutdownInstance() != nullptr) return;
    detail::GetShutdownInstance() = this;
    if (::pipe(pipe_fd_) != 0) {
      pipe_fd_[0] = -1;
      pipe_fd_[1] = -1;
      return;
    }
    valid_ = true;
  }

  ~ShutdownManager() {
    if (pipe_fd_[0] >= 0) ::close(pipe_fd_[0]);
    if (pipe_fd_[1] >= 0) ::close(pipe_fd_[1]);
    if (detail::GetShutdownInstance() == this) {
      detail::GetShutdownInstance() = nullptr;
    }
  }

  ShutdownManager(const ShutdownManager&) = delete;
  ShutdownManager& operator=(const ShutdownManager&) = delete;

  bool IsValid() const noexcept { return valid_; }

  expected<void, ShutdownError> Register(ShutdownFn fn, void* ctx) noexcept {
    if (!valid_) {
      return expected<void, ShutdownError>::error(ShutdownError::kAlreadyInstantiated);
    }
    if (fn == nullptr || count_ >= kMaxCallbacks) {
      return expected<void, ShutdownError>::error(ShutdownError::kCallbacksFull);
    }
    callbacks_[count_] = Callback{fn, ctx};
    ++count_;
    return expected<void, ShutdownError>::success();
  }

  expected<void, ShutdownError> InstallSignalHandlers() noexcept {
    if (!valid_) {
      return expected<void, ShutdownError>::error(ShutdownError::kAlreadyInstantiated);
    }
    struct sigaction sa;
    sa.sa_handler = &ShutdownManager::SignalHandler;
    ::sigemptyset(&sa.sa_mask);
    sa.sa_flags = SA_RESTART;
    if (::sigaction(SIGINT, &sa, nullptr) != 0 ||
        ::sigaction(SIGTERM, &sa, nullptr) != 0) {
      return expected<void, ShutdownError>::error(ShutdownError::kSignalInstallFailed);
    }
    // A client vanishing mid-write must surface as EPIPE, not kill the proxy.
    ::signal(SIGPIPE, SIG_IGN);
    return expected<void, ShutdownError>::success();
  }

  /// @brief Request shutdown from any thread.
  void Quit(int signo = 0) noexcept {
    bool was = false;
    if (flag_.compare_exchange_strong(was, true)) {
      signo_.store(signo, std::memory_order_relaxed);
      Wake();
    }
  }

  /**
   * @brief Wait up to @p timeout_ms for a shutdown request.
   * @return true once shutdown has been requested.
   */
  bool WaitFor(int32_t timeout_ms) noexcept {
    if (flag_.load(std::memory_order_acquire)) return true;
    if (pipe_fd_[0] < 0) return false;
    pollfd pfd{pipe_fd_[0], POLLIN, 0};
    if (::poll(&pfd, 1, timeout_ms) > 0 && (pfd.revents & POLLIN) != 0) {
      uint8_t buf = 0;
      (void)::read(pipe_fd_[0], &buf, 1);
    }
    return flag_.load(std::memory_order_acquire);
  }

  void WaitForShutdown() noexcept {
    while (!WaitFor(-1)) {
      if (pipe_fd_[0] < 0) return;
    }
  }

  /// @brief Run registered cleanup steps once, newest first.
  void RunCallbacks() noexcept {
    const int signo = signo_.load(std::memory_order_relaxed);
    while (count_ > 0U) {
      --count_;
      callbacks_[count_].fn(signo, callbacks_[count_].ctx);
    }
  }

  bool IsShutdownRequested() const noexcept {
    return flag_.load(std::memory_order_acquire);
  }

  int Signal() const noexcept { return signo_.load(std::memory_order_relaxed); }

 private:
  struct Callback {
    ShutdownFn fn = nullptr;
    void* ctx = nullptr;
  };

  void Wake() noexcept {
    if (pipe_fd_[1] >= 0) {
      const uint8_t byte = 1;
      (void)::write(pipe_fd_[1], &byte, 1);
    }
  }

  static void SignalHandler(int signo) {
    ShutdownManager* self = detail::GetShutdownInstance();
    if (self != nullptr) {
      self->signo_.store(signo, std::memory_order_relaxed);
      self->flag_.store(true, std::memory_order_release);
      self->Wake();
    }
  }

  Callback callbacks_[kMaxCallbacks];
  uint32_t count_ = 0;
  std::atomic<bool> flag_{false};
  std::atomic<int> signo_{0};
  int pipe_fd_[2] = {-1, -1};
  bool valid_ = false;
};

}  // namespace ppx

#endif  // PPX_SHUTDOWN_HPP_
