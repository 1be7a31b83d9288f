/**
 * @file fingerprint.hpp
 * @brief Content fingerprints for task and event deduplication, and the
 *        priority scale shared by tasks and events.
 *
 * A fingerprint is a 64-bit FNV-1a hash of the logical content rendered as
 * 16 lowercase hex digits:
 *   task : "description|k1=v1|k2=v2..."
 *   event: "type|source|k1=v1|k2=v2..."
 * ContextMap is an ordered map, so pairs are always hashed sorted by key and
 * two submissions built with different insertion orders hash identically.
 */

#ifndef ACP_FINGERPRINT_HPP_
#define ACP_FINGERPRINT_HPP_

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>

namespace acp {

/// Opaque key/value context attached to tasks and events.
using ContextMap = std::map<std::string, std::string>;

// ============================================================================
// Priority
// ============================================================================

enum class Priority : uint8_t {
  kLow = 1,
  kNormal = 5,
  kHigh = 8,
  kCritical = 10,
};

inline const char* ToString(Priority p) noexcept {
  switch (p) {
    case Priority::kLow:      return "low";
    case Priority::kNormal:   return "normal";
    case Priority::kHigh:     return "high";
    case Priority::kCritical: return "critical";
  }
  return "unknown";
}

// ============================================================================
// FNV-1a (64-bit)
// ============================================================================

static constexpr uint64_t kFnv64Offset = 14695981039346656037ULL;
static constexpr uint64_t kFnv64Prime = 1099511628211ULL;

/// Fold `len` bytes into a running FNV-1a state.
inline uint64_t Fnv1a64(const char* data, size_t len,
                        uint64_t hash = kFnv64Offset) noexcept {
  for (size_t i = 0; i < len; ++i) {
    hash ^= static_cast<uint64_t>(static_cast<unsigned char>(data[i]));
    hash *= kFnv64Prime;
  }
  return hash;
}

inline uint64_t Fnv1a64(const std::string& s,
                        uint64_t hash = kFnv64Offset) noexcept {
  return Fnv1a64(s.data(), s.size(), hash);
}

namespace detail {

inline std::string ToHex64(uint64_t v) {
  static constexpr char kDigits[] = "0123456789abcdef";
  std::string out(16, '0');
  for (int i = 15; i >= 0; --i) {
    out[static_cast<size_t>(i)] = kDigits[v & 0xFU];
    v >>= 4U;
  }
  return out;
}

inline uint64_t HashPairs(const ContextMap& pairs, uint64_t hash) noexcept {
  bool first = true;
  for (const auto& kv : pairs) {
    if (!first) hash = Fnv1a64("|", 1, hash);
    first = false;
    hash = Fnv1a64(kv.first, hash);
    hash = Fnv1a64("=", 1, hash);
    hash = Fnv1a64(kv.second, hash);
  }
  return hash;
}

}  // namespace detail

/// Task fingerprint over description and sorted context pairs.
inline std::string Fingerprint(const std::string& description,
                               const ContextMap& context) {
  uint64_t h = Fnv1a64(description);
  h = Fnv1a64("|", 1, h);
  h = detail::HashPairs(context, h);
  return detail::ToHex64(h);
}

/// Event fingerprint over type, source and sorted payload pairs.
inline std::string EventFingerprint(const std::string& event_type,
                                    const std::string& source,
                                    const ContextMap& payload) {
  uint64_t h = Fnv1a64(event_type);
  h = Fnv1a64("|", 1, h);
  h = Fnv1a64(source, h);
  h = Fnv1a64("|", 1, h);
  h = detail::HashPairs(payload, h);
  return detail::ToHex64(h);
}

}  // namespace acp

#endif  // ACP_FINGERPRINT_HPP_
