/**
 * @file log.hpp
 * @brief Lightweight printf-style logging with category tags.
 *
 * Output format (stderr by default):
 *   [2026-10-18 12:00:00.123] [WARN] [Budget] message (budget_engine.hpp:210)
 *
 * - Runtime level gate: SetLevel()/GetLevel().
 * - Compile-time floor: ACP_LOG_MIN_LEVEL (0=DEBUG ... 4=FATAL, 5=OFF).
 * - Optional sink: SetSink() redirects formatted lines (used by embedding
 *   applications and by tests that assert on diagnostics).
 *
 * Usage:
 * @code
 *   ACP_LOG_INFO("Arbiter", "task %s accepted", id.c_str());
 * @endcode
 */

#ifndef ACP_LOG_HPP_
#define ACP_LOG_HPP_

#include "acp/platform.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <mutex>

#ifndef ACP_LOG_MIN_LEVEL
#ifdef NDEBUG
#define ACP_LOG_MIN_LEVEL 1
#else
#define ACP_LOG_MIN_LEVEL 0
#endif
#endif

#ifndef ACP_LOG_LINE_MAX
#define ACP_LOG_LINE_MAX 512U
#endif

namespace acp {
namespace log {

enum class Level : uint8_t {
  kDebug = 0,
  kInfo = 1,
  kWarn = 2,
  kError = 3,
  kFatal = 4,
  kOff = 5,
};

inline const char* LevelName(Level level) noexcept {
  switch (level) {
    case Level::kDebug: return "DEBUG";
    case Level::kInfo:  return "INFO";
    case Level::kWarn:  return "WARN";
    case Level::kError: return "ERROR";
    case Level::kFatal: return "FATAL";
    case Level::kOff:   return "OFF";
  }
  return "?";
}

/// Sink receives one fully formatted line (no trailing newline).
using LogSinkFn = void (*)(Level level, const char* category,
                           const char* line, void* ctx);

namespace detail {

inline std::atomic<Level>& LogLevelRef() noexcept {
#ifdef NDEBUG
  static std::atomic<Level> level{Level::kInfo};
#else
  static std::atomic<Level> level{Level::kDebug};
#endif
  return level;
}

struct LogState {
  std::mutex mutex;
  LogSinkFn sink = nullptr;
  void* sink_ctx = nullptr;
  bool initialized = false;

  static LogState& Instance() noexcept {
    static LogState state;
    return state;
  }
};

inline const char* Basename(const char* path) noexcept {
  if (path == nullptr) return "";
  const char* slash = std::strrchr(path, '/');
  return (slash != nullptr) ? slash + 1 : path;
}

}  // namespace detail

inline void SetLevel(Level level) noexcept {
  detail::LogLevelRef().store(level, std::memory_order_relaxed);
}

inline Level GetLevel() noexcept {
  return detail::LogLevelRef().load(std::memory_order_relaxed);
}

inline void Init() noexcept {
  auto& st = detail::LogState::Instance();
  std::lock_guard<std::mutex> lock(st.mutex);
  st.initialized = true;
}

inline void Shutdown() noexcept {
  auto& st = detail::LogState::Instance();
  std::lock_guard<std::mutex> lock(st.mutex);
  (void)std::fflush(stderr);
  st.sink = nullptr;
  st.sink_ctx = nullptr;
  st.initialized = false;
}

inline bool IsInitialized() noexcept {
  auto& st = detail::LogState::Instance();
  std::lock_guard<std::mutex> lock(st.mutex);
  return st.initialized;
}

/// Redirect output. Pass nullptr to restore stderr.
inline void SetSink(LogSinkFn fn, void* ctx = nullptr) noexcept {
  auto& st = detail::LogState::Instance();
  std::lock_guard<std::mutex> lock(st.mutex);
  st.sink = fn;
  st.sink_ctx = ctx;
}

inline void LogWriteVa(Level level, const char* category, const char* file,
                       int line, const char* fmt, va_list args) noexcept {
  if (static_cast<uint8_t>(level) <
      static_cast<uint8_t>(detail::LogLevelRef().load(std::memory_order_relaxed))) {
    return;
  }

  char msg[ACP_LOG_LINE_MAX];
  (void)std::vsnprintf(msg, sizeof(msg), fmt, args);

  std::time_t now = std::time(nullptr);
  std::tm tm_buf{};
#if defined(ACP_PLATFORM_WINDOWS)
  localtime_s(&tm_buf, &now);
#else
  localtime_r(&now, &tm_buf);
#endif
  char ts[32];
  (void)std::strftime(ts, sizeof(ts), "%Y-%m-%d %H:%M:%S", &tm_buf);

  char out[ACP_LOG_LINE_MAX + 128U];
  (void)std::snprintf(out, sizeof(out), "[%s] [%s] [%s] %s (%s:%d)", ts,
                      LevelName(level), category, msg, detail::Basename(file),
                      line);

  auto& st = detail::LogState::Instance();
  std::lock_guard<std::mutex> lock(st.mutex);
  if (st.sink != nullptr) {
    st.sink(level, category, out, st.sink_ctx);
  } else {
    (void)std::fprintf(stderr, "%s\n", out);
    if (level >= Level::kError) {
      (void)std::fflush(stderr);
    }
  }
}

#if defined(__GNUC__) || defined(__clang__)
__attribute__((format(printf, 5, 6)))
#endif
inline void LogWrite(Level level, const char* category, const char* file,
                     int line, const char* fmt, ...) noexcept {
  va_list args;
  va_start(args, fmt);
  LogWriteVa(level, category, file, line, fmt, args);
  va_end(args);
}

}  // namespace log
}  // namespace acp

// ============================================================================
// Macros
// ============================================================================

#define ACP_LOG_DEBUG(cat, fmt, ...)                                        \
  do {                                                                      \
    if (ACP_LOG_MIN_LEVEL <= 0) {                                           \
      ::acp::log::LogWrite(::acp::log::Level::kDebug, cat, __FILE__,        \
                           __LINE__, fmt, ##__VA_ARGS__);                   \
    }                                                                       \
  } while (0)

#define ACP_LOG_INFO(cat, fmt, ...)                                         \
  do {                                                                      \
    if (ACP_LOG_MIN_LEVEL <= 1) {                                           \
      ::acp::log::LogWrite(::acp::log::Level::kInfo, cat, __FILE__,         \
                           __LINE__, fmt, ##__VA_ARGS__);                   \
    }                                                                       \
  } while (0)

#define ACP_LOG_WARN(cat, fmt, ...)                                         \
  do {                                                                      \
    if (ACP_LOG_MIN_LEVEL <= 2) {                                           \
      ::acp::log::LogWrite(::acp::log::Level::kWarn, cat, __FILE__,         \
                           __LINE__, fmt, ##__VA_ARGS__);                   \
    }                                                                       \
  } while (0)

#define ACP_LOG_ERROR(cat, fmt, ...)                                        \
  do {                                                                      \
    if (ACP_LOG_MIN_LEVEL <= 3) {                                           \
      ::acp::log::LogWrite(::acp::log::Level::kError, cat, __FILE__,        \
                           __LINE__, fmt, ##__VA_ARGS__);                   \
    }                                                                       \
  } while (0)

#define ACP_LOG_FATAL(cat, fmt, ...)                                        \
  do {                                                                      \
    ::acp::log::LogWrite(::acp::log::Level::kFatal, cat, __FILE__,          \
                         __LINE__, fmt, ##__VA_ARGS__);                     \
    std::abort();                                                           \
  } while (0)

#endif  // ACP_LOG_HPP_
