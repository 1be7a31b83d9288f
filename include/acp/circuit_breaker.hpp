/**
 * MIT License
 *
 * Copyright (c) 2024 liudegui
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

/**
 * @file circuit_breaker.hpp
 * @brief Per-key circuit breaker (closed / open / half-open).
 *
 * State machine:
 *
 *   closed ──(consecutive or windowed failures >= failure_threshold)──> open
 *   closed ──Trip()──> open
 *   open ──(cooldown elapsed since trip)──> half_open
 *   half_open ──(success_threshold consecutive successes)──> closed
 *   half_open ──(any failure)──> open
 *   any ──Reset()──> closed
 *
 * Time-based transitions are lazy: open->half_open promotion and failure
 * window expiry happen as a side effect of CanProceed(), GetState() and
 * the Record*() calls. No timer thread is involved.
 *
 * Consecutive failure and success counters are mutually exclusive: a
 * success zeroes the failure run and vice versa.
 *
 * State-change notifications are collected under the lock and delivered
 * after it is released, so the hook may call back into the breaker.
 *
 * Thread-safe: every operation runs under the instance mutex.
 */

#ifndef ACP_CIRCUIT_BREAKER_HPP_
#define ACP_CIRCUIT_BREAKER_HPP_

#include "acp/log.hpp"
#include "acp/platform.hpp"
#include "acp/vocabulary.hpp"

#include <algorithm>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace acp {

// ============================================================================
// Enumerations
// ============================================================================

enum class CircuitState : uint8_t {
  kClosed = 0,   ///< Normal operation
  kOpen,         ///< Tripped, calls blocked
  kHalfOpen,     ///< Probing recovery
};

inline const char* ToString(CircuitState s) noexcept {
  switch (s) {
    case CircuitState::kClosed:   return "closed";
    case CircuitState::kOpen:     return "open";
    case CircuitState::kHalfOpen: return "half_open";
  }
  return "unknown";
}

enum class CircuitError : uint8_t {
  kNotFound = 0,
};

inline const char* ToString(CircuitError e) noexcept {
  switch (e) {
    case CircuitError::kNotFound: return "circuit not found";
  }
  return "unknown";
}

// ============================================================================
// Configuration and records
// ============================================================================

/// State-change callback, invoked outside the breaker lock.
using CircuitStateFn = void (*)(const std::string& circuit_id, CircuitState from,
                                CircuitState to, const std::string& reason,
                                void* ctx);

struct CircuitStateHook {
  CircuitStateFn fn = nullptr;
  void* ctx = nullptr;
};

struct CircuitBreakerConfig {
  uint32_t failure_threshold = 5;
  uint32_t success_threshold = 2;   ///< Successes in half_open to close
  uint64_t window_ms = 60000;       ///< Failure counting window
  uint64_t cooldown_ms = 60000;     ///< Open time before probing
  uint64_t max_open_ms = 300000;    ///< Upper bound on the open period
  CircuitStateHook on_state_change;
  ClockSource clock;
};

struct CircuitRecord {
  std::string circuit_id;
  CircuitState state = CircuitState::kClosed;
  std::string trip_reason;
  std::optional<uint64_t> tripped_at_us;
  std::optional<uint64_t> last_failure_us;
  std::optional<uint64_t> last_success_us;
  uint64_t last_activity_us = 0;
  uint64_t total_failures = 0;
  uint64_t total_successes = 0;
  uint32_t window_failures = 0;
  uint32_t consecutive_failures = 0;
  uint32_t consecutive_successes = 0;
};

struct CircuitBreakerStats {
  uint32_t circuits;
  uint32_t open;
  uint32_t half_open;
  uint64_t trips;
  uint64_t recoveries;
  uint64_t blocked;     ///< CanProceed() calls answered false
};

// ============================================================================
// CircuitBreaker
// ============================================================================

class CircuitBreaker final {
 public:
  explicit CircuitBreaker(const CircuitBreakerConfig& config = CircuitBreakerConfig{})
      : config_(config) {
    ACP_ASSERT(config_.failure_threshold > 0U);
    ACP_ASSERT(config_.success_threshold > 0U);
    ACP_LOG_INFO("Circuit", "circuit breaker initialized (failures=%u, successes=%u, "
                 "cooldown=%llums)", config_.failure_threshold,
                 config_.success_threshold,
                 static_cast<unsigned long long>(EffectiveCooldownMs()));
  }

  CircuitBreaker(const CircuitBreaker&) = delete;
  CircuitBreaker& operator=(const CircuitBreaker&) = delete;

  /**
   * @brief May an operation on `circuit_id` proceed?
   *
   * Creates the circuit (closed) on first use and applies pending
   * time-based transitions. Open circuits answer false; closed and
   * half-open circuits answer true.
   */
  bool CanProceed(const std::string& circuit_id) {
    Transitions pending;
    bool allowed;
    {
      const uint64_t now = config_.clock.NowUs();
      std::lock_guard<std::mutex> lock(mutex_);
      CircuitRecord& rec = GetOrCreateLocked(circuit_id, now);
      UpdateLocked(rec, now, pending);
      allowed = (rec.state != CircuitState::kOpen);
      if (!allowed) {
        ++blocked_;
        ACP_LOG_DEBUG("Circuit", "circuit %s open, call blocked", circuit_id.c_str());
      }
    }
    Notify(pending);
    return allowed;
  }

  void RecordSuccess(const std::string& circuit_id) {
    Transitions pending;
    {
      const uint64_t now = config_.clock.NowUs();
      std::lock_guard<std::mutex> lock(mutex_);
      CircuitRecord& rec = GetOrCreateLocked(circuit_id, now);
      UpdateLocked(rec, now, pending);

      ++rec.total_successes;
      ++rec.consecutive_successes;
      rec.consecutive_failures = 0;
      rec.last_success_us = now;
      rec.last_activity_us = now;

      if (rec.state == CircuitState::kHalfOpen &&
          rec.consecutive_successes >= config_.success_threshold) {
        CloseLocked(rec, "recovered", pending);
        ++recoveries_;
      }
    }
    Notify(pending);
  }

  /// Record a failure. An empty `reason` trips with a threshold message.
  void RecordFailure(const std::string& circuit_id, const std::string& reason = "") {
    Transitions pending;
    {
      const uint64_t now = config_.clock.NowUs();
      std::lock_guard<std::mutex> lock(mutex_);
      CircuitRecord& rec = GetOrCreateLocked(circuit_id, now);
      UpdateLocked(rec, now, pending);

      ++rec.total_failures;
      ++rec.window_failures;
      ++rec.consecutive_failures;
      rec.consecutive_successes = 0;
      rec.last_failure_us = now;
      rec.last_activity_us = now;

      if (rec.state == CircuitState::kClosed) {
        if (rec.consecutive_failures >= config_.failure_threshold ||
            rec.window_failures >= config_.failure_threshold) {
          std::string why = reason.empty()
                                ? "failure threshold reached (" +
                                      std::to_string(config_.failure_threshold) + ")"
                                : reason;
          OpenLocked(rec, why, now, pending);
        }
      } else if (rec.state == CircuitState::kHalfOpen) {
        OpenLocked(rec, "Failed during recovery", now, pending);
      }
    }
    Notify(pending);
  }

  /// Manually open a circuit (created if unknown).
  void Trip(const std::string& circuit_id, const std::string& reason) {
    Transitions pending;
    {
      const uint64_t now = config_.clock.NowUs();
      std::lock_guard<std::mutex> lock(mutex_);
      CircuitRecord& rec = GetOrCreateLocked(circuit_id, now);
      rec.last_activity_us = now;
      OpenLocked(rec, reason.empty() ? std::string("manual trip") : reason, now,
                 pending);
    }
    Notify(pending);
  }

  /// Manually close a known circuit and clear its counters.
  expected<void, CircuitError> Reset(const std::string& circuit_id) {
    Transitions pending;
    {
      const uint64_t now = config_.clock.NowUs();
      std::lock_guard<std::mutex> lock(mutex_);
      auto it = circuits_.find(circuit_id);
      if (it == circuits_.end()) {
        ACP_LOG_WARN("Circuit", "reset of unknown circuit %s", circuit_id.c_str());
        return expected<void, CircuitError>::error(CircuitError::kNotFound);
      }
      it->second.last_activity_us = now;
      CloseLocked(it->second, "manual reset", pending);
      it->second.consecutive_successes = 0;
    }
    Notify(pending);
    return expected<void, CircuitError>::success();
  }

  /// Current state. Unknown circuits read as closed and are not created.
  CircuitState GetState(const std::string& circuit_id) {
    Transitions pending;
    CircuitState state = CircuitState::kClosed;
    {
      const uint64_t now = config_.clock.NowUs();
      std::lock_guard<std::mutex> lock(mutex_);
      auto it = circuits_.find(circuit_id);
      if (it != circuits_.end()) {
        UpdateLocked(it->second, now, pending);
        state = it->second.state;
      }
    }
    Notify(pending);
    return state;
  }

  /// Snapshot of a circuit (not updated for elapsed time).
  std::optional<CircuitRecord> GetRecord(const std::string& circuit_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = circuits_.find(circuit_id);
    if (it == circuits_.end()) return std::nullopt;
    return it->second;
  }

  /// Visit a snapshot of every circuit. `fn` runs outside the lock.
  template <typename Fn>
  void ForEachCircuit(Fn&& fn) const {
    std::vector<CircuitRecord> snapshot;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      snapshot.reserve(circuits_.size());
      for (const auto& kv : circuits_) {
        snapshot.push_back(kv.second);
      }
    }
    for (const auto& rec : snapshot) {
      fn(rec);
    }
  }

  /**
   * @brief Drop closed circuits with no activity for `max_idle_ms`.
   * @return Number removed. Open and half-open circuits are kept.
   */
  uint32_t CleanupIdle(uint64_t max_idle_ms) {
    const uint64_t now = config_.clock.NowUs();
    const uint64_t max_idle_us = MsToUs(max_idle_ms);
    uint32_t removed = 0U;
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = circuits_.begin(); it != circuits_.end();) {
      const CircuitRecord& rec = it->second;
      if (rec.state == CircuitState::kClosed && now >= rec.last_activity_us &&
          now - rec.last_activity_us >= max_idle_us) {
        it = circuits_.erase(it);
        ++removed;
      } else {
        ++it;
      }
    }
    if (removed > 0U) {
      ACP_LOG_INFO("Circuit", "removed %u idle circuits", removed);
    }
    return removed;
  }

  CircuitBreakerStats GetStats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    CircuitBreakerStats s{};
    s.circuits = static_cast<uint32_t>(circuits_.size());
    for (const auto& kv : circuits_) {
      if (kv.second.state == CircuitState::kOpen) ++s.open;
      if (kv.second.state == CircuitState::kHalfOpen) ++s.half_open;
    }
    s.trips = trips_;
    s.recoveries = recoveries_;
    s.blocked = blocked_;
    return s;
  }

  /// Open period actually applied: cooldown bounded by max_open_ms.
  uint64_t EffectiveCooldownMs() const noexcept {
    return std::min(config_.cooldown_ms, config_.max_open_ms);
  }

  const CircuitBreakerConfig& config() const noexcept { return config_; }

 private:
  struct Transition {
    std::string circuit_id;
    CircuitState from;
    CircuitState to;
    std::string reason;
  };
  using Transitions = std::vector<Transition>;

  CircuitRecord& GetOrCreateLocked(const std::string& circuit_id, uint64_t now) {
    auto it = circuits_.find(circuit_id);
    if (it != circuits_.end()) return it->second;
    CircuitRecord rec;
    rec.circuit_id = circuit_id;
    rec.last_activity_us = now;
    ACP_LOG_DEBUG("Circuit", "circuit %s created", circuit_id.c_str());
    return circuits_.emplace(circuit_id, std::move(rec)).first->second;
  }

  /// Apply elapsed-time transitions. Caller holds mutex_.
  void UpdateLocked(CircuitRecord& rec, uint64_t now, Transitions& out) {
    if (rec.state == CircuitState::kOpen && rec.tripped_at_us.has_value() &&
        now >= *rec.tripped_at_us &&
        now - *rec.tripped_at_us >= MsToUs(EffectiveCooldownMs())) {
      rec.consecutive_successes = 0;
      SetStateLocked(rec, CircuitState::kHalfOpen, "cooldown elapsed", out);
      ACP_LOG_INFO("Circuit", "circuit %s half-open, probing recovery",
                   rec.circuit_id.c_str());
    }

    if (rec.last_failure_us.has_value() && now >= *rec.last_failure_us &&
        now - *rec.last_failure_us >= MsToUs(config_.window_ms)) {
      rec.window_failures = 0;
      rec.consecutive_failures = 0;
    }
  }

  void OpenLocked(CircuitRecord& rec, const std::string& reason, uint64_t now,
                  Transitions& out) {
    rec.trip_reason = reason;
    rec.tripped_at_us = now;
    rec.consecutive_successes = 0;
    if (rec.state != CircuitState::kOpen) {
      ++trips_;
    }
    SetStateLocked(rec, CircuitState::kOpen, reason, out);
    ACP_LOG_WARN("Circuit", "circuit %s tripped: %s", rec.circuit_id.c_str(),
                 reason.c_str());
  }

  void CloseLocked(CircuitRecord& rec, const char* reason, Transitions& out) {
    rec.trip_reason.clear();
    rec.tripped_at_us.reset();
    rec.window_failures = 0;
    rec.consecutive_failures = 0;
    SetStateLocked(rec, CircuitState::kClosed, reason, out);
    ACP_LOG_INFO("Circuit", "circuit %s closed (%s)", rec.circuit_id.c_str(), reason);
  }

  void SetStateLocked(CircuitRecord& rec, CircuitState to, const std::string& reason,
                      Transitions& out) {
    if (rec.state == to) return;
    const CircuitState from = rec.state;
    rec.state = to;
    if (config_.on_state_change.fn != nullptr) {
      out.push_back(Transition{rec.circuit_id, from, to, reason});
    }
  }

  void Notify(const Transitions& pending) const {
    for (const auto& t : pending) {
      config_.on_state_change.fn(t.circuit_id, t.from, t.to, t.reason,
                                 config_.on_state_change.ctx);
    }
  }

  CircuitBreakerConfig config_;
  mutable std::mutex mutex_;
  std::unordered_map<std::string, CircuitRecord> circuits_;
  uint64_t trips_ = 0;
  uint64_t recoveries_ = 0;
  uint64_t blocked_ = 0;
};

}  // namespace acp

#endif  // ACP_CIRCUIT_BREAKER_HPP_
