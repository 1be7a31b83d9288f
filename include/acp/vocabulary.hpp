/**
 * @file vocabulary.hpp
 * @brief Small vocabulary types shared by all acp components.
 *
 * - expected<V, E>: value-or-error return for operations that can fail for
 *   a reason other than a policy decision (unknown id, bad input, ...).
 * - Verdict: admit/reject decision with a human-readable reason.
 * - ConfigError: error codes for the configuration layer.
 */

#ifndef ACP_VOCABULARY_HPP_
#define ACP_VOCABULARY_HPP_

#include "acp/platform.hpp"

#include <cstdint>
#include <new>
#include <string>
#include <type_traits>
#include <utility>

namespace acp {

// ============================================================================
// expected<V, E>
// ============================================================================

/**
 * @brief Holds either a value of type V or an error code of type E.
 *
 * Construct through the static factories:
 * @code
 *   return expected<uint32_t, MyError>::success(42);
 *   return expected<uint32_t, MyError>::error(MyError::kFull);
 * @endcode
 */
template <typename V, typename E>
class expected final {
 public:
  static expected success(const V& v) { return expected(v); }
  static expected success(V&& v) { return expected(std::move(v)); }
  static expected error(E e) noexcept { return expected(ErrorTag{}, e); }

  expected(const expected& other) : has_value_(other.has_value_) {
    if (has_value_) {
      new (&storage_.value) V(other.storage_.value);
    } else {
      storage_.err = other.storage_.err;
    }
  }

  expected(expected&& other) noexcept(std::is_nothrow_move_constructible<V>::value)
      : has_value_(other.has_value_) {
    if (has_value_) {
      new (&storage_.value) V(std::move(other.storage_.value));
    } else {
      storage_.err = other.storage_.err;
    }
  }

  expected& operator=(const expected& other) {
    if (this != &other) {
      Destroy();
      has_value_ = other.has_value_;
      if (has_value_) {
        new (&storage_.value) V(other.storage_.value);
      } else {
        storage_.err = other.storage_.err;
      }
    }
    return *this;
  }

  expected& operator=(expected&& other) noexcept(
      std::is_nothrow_move_constructible<V>::value) {
    if (this != &other) {
      Destroy();
      has_value_ = other.has_value_;
      if (has_value_) {
        new (&storage_.value) V(std::move(other.storage_.value));
      } else {
        storage_.err = other.storage_.err;
      }
    }
    return *this;
  }

  ~expected() { Destroy(); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  V& value() & {
    ACP_ASSERT(has_value_);
    return storage_.value;
  }
  const V& value() const& {
    ACP_ASSERT(has_value_);
    return storage_.value;
  }
  V&& value() && {
    ACP_ASSERT(has_value_);
    return std::move(storage_.value);
  }

  E get_error() const noexcept {
    ACP_ASSERT(!has_value_);
    return storage_.err;
  }

  V value_or(const V& fallback) const {
    return has_value_ ? storage_.value : fallback;
  }

 private:
  struct ErrorTag {};

  explicit expected(const V& v) : has_value_(true) { new (&storage_.value) V(v); }
  explicit expected(V&& v) : has_value_(true) {
    new (&storage_.value) V(std::move(v));
  }
  expected(ErrorTag, E e) noexcept : has_value_(false) { storage_.err = e; }

  void Destroy() noexcept {
    if (has_value_) {
      storage_.value.~V();
    }
  }

  union Storage {
    Storage() noexcept : err() {}
    ~Storage() {}
    V value;
    E err;
  } storage_;
  bool has_value_;
};

/// Specialization for operations that return nothing on success.
template <typename E>
class expected<void, E> final {
 public:
  static expected success() noexcept { return expected(true, E{}); }
  static expected error(E e) noexcept { return expected(false, e); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  E get_error() const noexcept {
    ACP_ASSERT(!has_value_);
    return err_;
  }

 private:
  expected(bool ok, E e) noexcept : err_(e), has_value_(ok) {}

  E err_;
  bool has_value_;
};

// ============================================================================
// Verdict
// ============================================================================

/// Admission decision. `reason` is empty when allowed.
struct Verdict {
  bool allowed = true;
  std::string reason;

  static Verdict Allow() { return Verdict{true, std::string()}; }
  static Verdict Reject(std::string why) { return Verdict{false, std::move(why)}; }

  explicit operator bool() const noexcept { return allowed; }
};

// ============================================================================
// ConfigError
// ============================================================================

enum class ConfigError : uint8_t {
  kFileNotFound = 0,
  kParseError,
  kBufferFull,
  kFormatNotSupported,
  kInvalidValue,
};

inline const char* ToString(ConfigError e) noexcept {
  switch (e) {
    case ConfigError::kFileNotFound:       return "file not found";
    case ConfigError::kParseError:         return "parse error";
    case ConfigError::kBufferFull:         return "buffer full";
    case ConfigError::kFormatNotSupported: return "format not supported";
    case ConfigError::kInvalidValue:       return "invalid value";
  }
  return "unknown";
}

}  // namespace acp

#endif  // ACP_VOCABULARY_HPP_
