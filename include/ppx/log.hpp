/**
 * @file log.hpp
 * @brief Synchronous, category-tagged, level-filtered logging to stderr.
 *
 * Output format:
 *   [YYYY-MM-DD HH:MM:SS.mmm] [LEVEL] [CATEGORY] message (file:line)
 * Release builds (NDEBUG) omit the file:line suffix.
 *
 * Two filters apply: PPX_LOG_MIN_LEVEL removes calls below it at compile
 * time, log::SetLevel() filters the remainder at runtime.
 */

#ifndef PPX_LOG_HPP_
#define PPX_LOG_HPP_

#include "ppx/platform.hpp"
#include "ppx/vocabulary.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <cstring>
#include <ctime>

#include <time.h>

#ifndef PPX_LOG_MIN_LEVEL
#define PPX_LOG_MIN_LEVEL 0
#endif

namespace ppx {
namespace log {

enum class Level : uint8_t {
  kDebug = 0,
  kInfo = 1,
  kWarn = 2,
  kError = 3,
  kFatal = 4,
  kOff = 5
};

namespace detail {

inline std::atomic<uint8_t>& LevelStorage() noexcept {
#ifdef NDEBUG
  static std::atomic<uint8_t> level{static_cast<uint8_t>(Level::kInfo)};
#else
  static std::atomic<uint8_t> level{static_cast<uint8_t>(Level::kDebug)};
#endif
  return level;
}

inline std::atomic<bool>& InitFlag() noexcept {
  static std::atomic<bool> flag{false};
  return flag;
}

inline const char* LevelTag(Level level) noexcept {
  switch (level) {
    case Level::kDebug:
      return "DEBUG";
    case Level::kInfo:
      return "INFO";
    case Level::kWarn:
      return "WARN";
    case Level::kError:
      return "ERROR";
    case Level::kFatal:
      return "FATAL";
    default:
      return "OFF";
  }
}

inline const char* Basename(const char* path) noexcept {
  if (path == nullptr) return "?";
  const char* slash = std::strrchr(path, '/');
  return (slash != nullptr) ? slash + 1 : path;
}

inline void FormatTimestamp(char* buf, size_t bufsz) noexcept {
  struct timespec ts;
  clock_gettime(CLOCK_REALTIME, &ts);
  time_t t = ts.tv_sec;
  struct tm tm_local;
  localtime_r(&t, &tm_local);
  (void)std::snprintf(buf, bufsz, "%04d-%02d-%02d %02d:%02d:%02d.%03u",
                      tm_local.tm_year + 1900, tm_local.tm_mon + 1,
                      tm_local.tm_mday, tm_local.tm_hour, tm_local.tm_min,
                      tm_local.tm_sec,
                      static_cast<unsigned>(ts.tv_nsec / 1000000L));
}

}  // namespace detail

// ============================================================================
// Runtime control
// ============================================================================

inline Level GetLevel() noexcept {
  return static_cast<Level>(
      detail::LevelStorage().load(std::memory_order_relaxed));
}

inline void SetLevel(Level level) noexcept {
  detail::LevelStorage().store(static_cast<uint8_t>(level),
                               std::memory_order_relaxed);
}

/// @brief Mark the logger initialized. Logging works without it.
inline void Init() noexcept {
  detail::InitFlag().store(true, std::memory_order_release);
}

inline void Shutdown() noexcept {
  (void)std::fflush(stderr);
  detail::InitFlag().store(false, std::memory_order_release);
}

inline bool IsInitialized() noexcept {
  return detail::InitFlag().load(std::memory_order_acquire);
}

/**
 * @brief Parse a level name ("debug", "info", "warn", "error", "fatal",
 *        "off"). Matching is case-sensitive.
 */
inline optional<Level> ParseLevel(const char* name) noexcept {
  if (name == nullptr) return optional<Level>();
  static constexpr const char* kNames[] = {"debug", "info",  "warn",
                                           "error", "fatal", "off"};
  for (uint8_t i = 0; i < 6U; ++i) {
    if (std::strcmp(name, kNames[i]) == 0) {
      return optional<Level>(static_cast<Level>(i));
    }
  }
  if (std::strcmp(name, "warning") == 0) return optional<Level>(Level::kWarn);
  return optional<Level>();
}

// ============================================================================
// Write
// ============================================================================

inline void LogWriteVa(Level level, const char* category, const char* file,
                       int line, const char* fmt, va_list args) noexcept {
  if (static_cast<uint8_t>(level) < static_cast<uint8_t>(GetLevel())) {
    return;
  }
  char msg[1024];
  (void)std::vsnprintf(msg, sizeof(msg), fmt, args);
  char ts_buf[32];
  detail::FormatTimestamp(ts_buf, sizeof(ts_buf));

  // Single fprintf per line keeps concurrent lines from interleaving.
#ifdef NDEBUG
  (void)file;
  (void)line;
  (void)std::fprintf(stderr, "[%s] [%s] [%s] %s\n", ts_buf,
                     detail::LevelTag(level), category, msg);
#else
  (void)std::fprintf(stderr, "[%s] [%s] [%s] %s (%s:%d)\n", ts_buf,
                     detail::LevelTag(level), category, msg,
                     detail::Basename(file), line);
#endif
}

inline void LogWrite(Level level, const char* category, const char* file,
                     int line, const char* fmt, ...) noexcept {
  va_list args;
  va_start(args, fmt);
  LogWriteVa(level, category, file, line, fmt, args);
  va_end(args);
}

}  // namespace log
}  // namespace ppx

// ============================================================================
// Macros
// ============================================================================

#define PPX_LOG_DEBUG(cat, fmt, ...)                                        \
  do {                                                                      \
    if (PPX_LOG_MIN_LEVEL <= 0) {                                           \
      ::ppx::log::LogWrite(::ppx::log::Level::kDebug, cat, __FILE__,        \
                           __LINE__, fmt, ##__VA_ARGS__);                   \
    }                                                                       \
  } while (0)

#define PPX_LOG_INFO(cat, fmt, ...)                                         \
  do {                                                                      \
    if (PPX_LOG_MIN_LEVEL <= 1) {                                           \
      ::ppx::log::LogWrite(::ppx::log::Level::kInfo, cat, __FILE__,         \
                           __LINE__, fmt, ##__VA_ARGS__);                   \
    }                                                                       \
  } while (0)

#define PPX_LOG_WARN(cat, fmt, ...)                                         \
  do {                                                                      \
    if (PPX_LOG_MIN_LEVEL <= 2) {                                           \
      ::ppx::log::LogWrite(::ppx::log::Level::kWarn, cat, __FILE__,         \
                           __LINE__, fmt, ##__VA_ARGS__);                   \
    }                                                                       \
  } while (0)

#define PPX_LOG_ERROR(cat, fmt, ...)                                        \
  do {                                                                      \
    if (PPX_LOG_MIN_LEVEL <= 3) {                                           \
      ::ppx::log::LogWrite(::ppx::log::Level::kError, cat, __FILE__,        \
                           __LINE__, fmt, ##__VA_ARGS__);                   \
    }                                                                       \
  } while (0)

#define PPX_LOG_FATAL(cat, fmt, ...)                                        \
  do {                                                                      \
    ::ppx::log::LogWrite(::ppx::log::Level::kFatal, cat, __FILE__,          \
                         __LINE__, fmt, ##__VA_ARGS__);                     \
    std::abort();                                                           \
  } while (0)

#endif  // PPX_LOG_HPP_
