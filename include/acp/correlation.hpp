/**
 * @file correlation.hpp
 * @brief Correlation id provider and id generation.
 *
 * The current correlation id is thread-scoped: each thread (one agent
 * request chain) sees its own value. TaskArbitrator and EventBus call
 * GetOrGenerate() to default an empty correlation id.
 *
 * Usage:
 * @code
 *   acp::CorrelationScope scope("corr_upstream_42");
 *   arbiter.Submit(sub);   // sub.correlation_id defaults to corr_upstream_42
 * @endcode
 */

#ifndef ACP_CORRELATION_HPP_
#define ACP_CORRELATION_HPP_

#include "acp/fingerprint.hpp"
#include "acp/log.hpp"

#include <atomic>
#include <cstdint>
#include <mutex>
#include <random>
#include <string>

namespace acp {

namespace detail {

/// Process-wide random 64-bit source for ids (guarded; ids are cold path).
inline uint64_t RandomU64() {
  static std::mutex mtx;
  static std::mt19937_64 rng{std::random_device{}()};
  std::lock_guard<std::mutex> lock(mtx);
  return rng();
}

inline std::string& CurrentCorrelationRef() {
  thread_local std::string current;
  return current;
}

}  // namespace detail

/// Generate `<prefix><16 hex chars>`, e.g. "task_3f9a0c1e5b7d2a48".
inline std::string GenerateId(const char* prefix) {
  static std::atomic<uint64_t> seq{0};
  uint64_t v = detail::RandomU64() ^ seq.fetch_add(1, std::memory_order_relaxed);
  return std::string(prefix) + detail::ToHex64(v);
}

class CorrelationContext final {
 public:
  /// Current id or empty string.
  static std::string Get() { return detail::CurrentCorrelationRef(); }

  static void Set(const std::string& correlation_id) {
    detail::CurrentCorrelationRef() = correlation_id;
    ACP_LOG_DEBUG("Corr", "set correlation id %s", correlation_id.c_str());
  }

  /// Generate a new id and make it current.
  static std::string Generate() {
    std::string id = GenerateId("corr_");
    Set(id);
    return id;
  }

  static std::string GetOrGenerate() {
    const std::string& cur = detail::CurrentCorrelationRef();
    if (!cur.empty()) return cur;
    return Generate();
  }

  static void Clear() { detail::CurrentCorrelationRef().clear(); }
};

/// RAII: set a correlation id for the scope, restore the previous on exit.
class CorrelationScope final {
 public:
  explicit CorrelationScope(const std::string& correlation_id)
      : previous_(CorrelationContext::Get()) {
    CorrelationContext::Set(correlation_id);
  }

  ~CorrelationScope() {
    if (previous_.empty()) {
      CorrelationContext::Clear();
    } else {
      detail::CurrentCorrelationRef() = previous_;
    }
  }

  CorrelationScope(const CorrelationScope&) = delete;
  CorrelationScope& operator=(const CorrelationScope&) = delete;

 private:
  std::string previous_;
};

}  // namespace acp

#endif  // ACP_CORRELATION_HPP_
