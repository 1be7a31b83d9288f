/**
 * @file platform.hpp
 * @brief Platform detection, compiler hints, assertion macros and clock source.
 */

#ifndef ACP_PLATFORM_HPP_
#define ACP_PLATFORM_HPP_

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstdlib>

namespace acp {

// ============================================================================
// Platform Detection
// ============================================================================

#if defined(__linux__)
#define ACP_PLATFORM_LINUX 1
#elif defined(__APPLE__)
#define ACP_PLATFORM_MACOS 1
#elif defined(_WIN32)
#define ACP_PLATFORM_WINDOWS 1
#endif

// ============================================================================
// Compiler Hints
// ============================================================================

#if defined(__GNUC__) || defined(__clang__)
#define ACP_LIKELY(x) __builtin_expect(!!(x), 1)
#define ACP_UNLIKELY(x) __builtin_expect(!!(x), 0)
#define ACP_UNUSED __attribute__((unused))
#else
#define ACP_LIKELY(x) (x)
#define ACP_UNLIKELY(x) (x)
#define ACP_UNUSED
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
  (void)std::fprintf(stderr, "ACP_ASSERT failed: %s at %s:%d\n", cond, file, line);
  std::abort();
}

}  // namespace detail

#ifdef NDEBUG
#define ACP_ASSERT(cond) ((void)0)
#else
#define ACP_ASSERT(cond)                                                    \
  ((cond) ? ((void)0) : ::acp::detail::AssertFail(#cond, __FILE__, __LINE__))
#endif

// ============================================================================
// Time
// ============================================================================

/// Monotonic timestamp in microseconds.
inline uint64_t SteadyNowUs() noexcept {
  return static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::microseconds>(
          std::chrono::steady_clock::now().time_since_epoch())
          .count());
}

static constexpr uint64_t kUsPerMs = 1000ULL;

constexpr uint64_t MsToUs(uint64_t ms) noexcept { return ms * kUsPerMs; }

/// Clock function pointer: returns "now" in microseconds.
using NowUsFn = uint64_t (*)(void* ctx);

/// Time source injection point.
///
/// Every component reads time through one of these. When `fn` is nullptr
/// (default) the steady clock is used. Tests wire a manual clock so that
/// window and cooldown expiry can be driven without sleeping.
struct ClockSource {
  NowUsFn fn = nullptr;  ///< Clock function (nullptr = SteadyNowUs)
  void* ctx = nullptr;   ///< User context passed to fn

  uint64_t NowUs() const noexcept {
    return (fn != nullptr) ? fn(ctx) : SteadyNowUs();
  }
};

// ============================================================================
// Macro Helpers
// ============================================================================

#define ACP_CONCAT_IMPL(a, b) a##b
#define ACP_CONCAT(a, b) ACP_CONCAT_IMPL(a, b)

}  // namespace acp

#endif  // ACP_PLATFORM_HPP_
