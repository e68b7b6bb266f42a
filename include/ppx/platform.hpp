/**
 * @file platform.hpp
 * @brief Platform detection, monotonic clock and assertion macros.
 */

#ifndef PPX_PLATFORM_HPP_
#define PPX_PLATFORM_HPP_

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstdlib>

namespace ppx {

// ============================================================================
// Platform Detection
// ============================================================================

#if defined(__linux__)
#define PPX_PLATFORM_LINUX 1
#elif defined(__APPLE__)
#define PPX_PLATFORM_MACOS 1
#endif

#if defined(PPX_PLATFORM_LINUX) || defined(PPX_PLATFORM_MACOS)
#define PPX_HAS_NETWORK 1
#else
#define PPX_HAS_NETWORK 0
#endif

// ============================================================================
// Assert Macro
// ============================================================================

namespace detail {

/**
 * @brief Called when an assertion fails in debug mode.
 *
 * Prints the failed condition, file, and line to stderr, then aborts.
 */
inline void AssertFail(const char* cond, const char* file, int line) {
  (void)std::fprintf(stderr, "PPX_ASSERT failed: %s at %s:%d\n", cond, file,
                     line);
  std::abort();
}

}  // namespace detail

#ifdef NDEBUG
#define PPX_ASSERT(cond) ((void)0)
#else
#define PPX_ASSERT(cond) \
  ((cond) ? ((void)0) : ::ppx::detail::AssertFail(#cond, __FILE__, __LINE__))
#endif

// ============================================================================
// Macro Helpers
// ============================================================================

#define PPX_CONCAT_IMPL(a, b) a##b
#define PPX_CONCAT(a, b) PPX_CONCAT_IMPL(a, b)

// ============================================================================
// Monotonic Clock
// ============================================================================

/// @brief Monotonic timestamp in microseconds.
inline uint64_t SteadyNowUs() noexcept {
  return static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::microseconds>(
          std::chrono::steady_clock::now().time_since_epoch())
          .count());
}

/// @brief Monotonic timestamp in milliseconds.
inline uint64_t SteadyNowMs() noexcept { return SteadyNowUs() / 1000U; }

}  // namespace ppx

#endif  // PPX_PLATFORM_HPP_
