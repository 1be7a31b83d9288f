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
 * @file budget_engine.hpp
 * @brief Multi-dimensional per-actor budget accounting with reservations.
 *
 * Dimensions: cost, tokens, wall time, concurrency, API calls. Each actor
 * allocation carries per-dimension limits (ceiling, reset period, optional
 * soft threshold) and usage trackers (used, reserved, last reset).
 *
 * Protocol:
 *   Reserve()  - re-runs the budget check (available = limit - used -
 *                reserved) and, if it fits, increments `reserved`
 *   Commit()   - moves the reservation out of `reserved` and charges the
 *                actual amount (which may differ) to `used`
 *   Release()  - returns the reservation to the pool uncharged
 *   CleanupExpiredReservations() - releases reservations past their expiry
 *
 * Invariant: used + reserved <= limit after every successful Reserve() and
 * Commit(). Requests that would break it are rejected, never truncated.
 *
 * Period reset is lazy: CheckBudget(), Reserve() and GetRemaining() zero
 * `used` for a dimension whose period has elapsed since its last reset.
 * These reads therefore mutate state.
 *
 * Actors without an allocation are denied unless
 * BudgetEngineConfig::allow_implicit_allocation is set, in which case they
 * are unlimited and get an implicit, infinite allocation on first usage.
 *
 * Thread-safe: every operation runs under the instance mutex.
 */

#ifndef ACP_BUDGET_ENGINE_HPP_
#define ACP_BUDGET_ENGINE_HPP_

#include "acp/log.hpp"
#include "acp/platform.hpp"
#include "acp/vocabulary.hpp"

#include <array>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <limits>
#include <map>
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

enum class BudgetDimension : uint8_t {
  kCost = 0,      ///< Monetary cost (USD)
  kTokens,        ///< Model tokens
  kTime,          ///< Execution wall time (seconds)
  kConcurrency,   ///< Concurrent operations
  kApiCalls,      ///< External API calls
};

static constexpr size_t kBudgetDimensionCount = 5U;

inline const char* ToString(BudgetDimension d) noexcept {
  switch (d) {
    case BudgetDimension::kCost:        return "cost";
    case BudgetDimension::kTokens:      return "tokens";
    case BudgetDimension::kTime:        return "time";
    case BudgetDimension::kConcurrency: return "concurrency";
    case BudgetDimension::kApiCalls:    return "api_calls";
  }
  return "unknown";
}

inline std::optional<BudgetDimension> ParseBudgetDimension(const char* name) noexcept {
  if (name == nullptr) return std::nullopt;
  for (size_t i = 0; i < kBudgetDimensionCount; ++i) {
    auto d = static_cast<BudgetDimension>(i);
    if (std::strcmp(name, ToString(d)) == 0) return d;
  }
  return std::nullopt;
}

enum class BudgetError : uint8_t {
  kInvalidArgument = 0,   ///< Negative/NaN amount, empty id
  kInsufficientBudget,    ///< Would break used + reserved <= limit
  kNoAllocation,          ///< Actor unknown and implicit allocation disabled
  kDuplicateReservation,  ///< Reservation id already outstanding
  kReservationNotFound,
};

inline const char* ToString(BudgetError e) noexcept {
  switch (e) {
    case BudgetError::kInvalidArgument:      return "invalid argument";
    case BudgetError::kInsufficientBudget:   return "insufficient budget";
    case BudgetError::kNoAllocation:         return "no allocation";
    case BudgetError::kDuplicateReservation: return "duplicate reservation";
    case BudgetError::kReservationNotFound:  return "reservation not found";
  }
  return "unknown";
}

// ============================================================================
// Data structures
// ============================================================================

struct BudgetLimit {
  BudgetDimension dimension = BudgetDimension::kCost;
  double limit = 0.0;
  uint64_t period_ms = 0;             ///< 0 = never auto-resets
  std::optional<double> soft_limit;   ///< Warning threshold, never blocks
};

struct BudgetUsage {
  BudgetDimension dimension = BudgetDimension::kCost;
  double used = 0.0;
  double reserved = 0.0;
  uint64_t last_reset_at_us = 0;
};

struct BudgetReservation {
  std::string reservation_id;
  std::string actor_id;
  BudgetDimension dimension = BudgetDimension::kCost;
  double amount = 0.0;
  uint64_t created_at_us = 0;
  uint64_t expires_at_us = 0;  ///< 0 = never expires
};

/// Snapshot of an actor's allocation.
struct BudgetAllocation {
  std::string actor_id;
  std::map<BudgetDimension, BudgetLimit> limits;
  std::map<BudgetDimension, BudgetUsage> usage;
  uint64_t created_at_us = 0;
  uint64_t updated_at_us = 0;
  bool implicit = false;
};

/// Result of CheckBudget().
struct BudgetCheck {
  bool allowed = true;
  bool soft_limit_reached = false;
  double available = std::numeric_limits<double>::infinity();
  std::string reason;

  explicit operator bool() const noexcept { return allowed; }
};

struct BudgetEngineConfig {
  /// Admit actors without an allocation (unlimited, allocation created on
  /// first usage). Off: such actors are denied.
  bool allow_implicit_allocation = false;
  uint64_t implicit_period_ms = 30ULL * 24ULL * 3600ULL * 1000ULL;
  ClockSource clock;
};

struct BudgetStats {
  uint32_t allocations;
  uint32_t reservations;
  uint64_t reserves_granted;
  uint64_t reserves_denied;
  uint64_t commits;
  uint64_t releases;
  uint64_t expired_released;
  uint64_t soft_limit_warnings;
  uint64_t auto_resets;
};

// ============================================================================
// Model pricing (USD per 1000 tokens)
// ============================================================================

struct ModelPricing {
  const char* model;
  double prompt_per_1k;
  double completion_per_1k;
};

static constexpr std::array<ModelPricing, 5> kModelPricing{{
    {"gpt-4", 0.03, 0.06},
    {"gpt-4-turbo", 0.01, 0.03},
    {"gpt-3.5-turbo", 0.0005, 0.0015},
    {"claude-3-opus", 0.015, 0.075},
    {"claude-3-sonnet", 0.003, 0.015},
}};

/// Tier applied to unknown models.
static constexpr const char* kDefaultPricingModel = "gpt-4";

// ============================================================================
// BudgetEngine
// ============================================================================

class BudgetEngine final {
 public:
  explicit BudgetEngine(const BudgetEngineConfig& config = BudgetEngineConfig{})
      : config_(config) {
    ACP_LOG_INFO("Budget", "budget engine initialized (implicit allocation %s)",
                 config_.allow_implicit_allocation ? "allowed" : "denied");
  }

  BudgetEngine(const BudgetEngine&) = delete;
  BudgetEngine& operator=(const BudgetEngine&) = delete;

  /**
   * @brief Create or replace an actor's limits.
   *
   * Replacing keeps existing usage and reservations so that outstanding
   * reservations still settle against the right counters.
   */
  expected<void, BudgetError> CreateAllocation(const std::string& actor_id,
                                               const std::vector<BudgetLimit>& limits) {
    if (actor_id.empty()) {
      ACP_LOG_ERROR("Budget", "allocation rejected: empty actor id");
      return expected<void, BudgetError>::error(BudgetError::kInvalidArgument);
    }
    for (const auto& l : limits) {
      if (!ValidLimit(l.limit) ||
          (l.soft_limit.has_value() && !ValidLimit(*l.soft_limit))) {
        ACP_LOG_ERROR("Budget", "allocation rejected for %s: invalid %s limit",
                      actor_id.c_str(), ToString(l.dimension));
        return expected<void, BudgetError>::error(BudgetError::kInvalidArgument);
      }
    }

    const uint64_t now = config_.clock.NowUs();
    std::lock_guard<std::mutex> lock(mutex_);
    auto ins = allocations_.emplace(actor_id, Allocation{});
    Allocation& alloc = ins.first->second;
    if (ins.second) {
      alloc.created_at_us = now;
    }
    alloc.implicit = false;
    alloc.updated_at_us = now;
    for (auto& slot : alloc.slots) {
      slot.limited = false;
    }
    for (const auto& l : limits) {
      Slot& slot = alloc.slots[Index(l.dimension)];
      slot.limited = true;
      slot.limit = l;
      if (!slot.tracked) {
        slot.tracked = true;
        slot.usage = BudgetUsage{l.dimension, 0.0, 0.0, now};
      }
    }

    char buf[256];
    FormatLimits(limits, buf, sizeof(buf));
    ACP_LOG_INFO("Budget", "allocation %s for %s: %s",
                 ins.second ? "created" : "replaced", actor_id.c_str(), buf);
    return expected<void, BudgetError>::success();
  }

  bool HasAllocation(const std::string& actor_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return allocations_.count(actor_id) != 0U;
  }

  /// Would `amount` fit now? Applies the lazy period reset.
  BudgetCheck CheckBudget(const std::string& actor_id, BudgetDimension dim,
                          double amount) {
    const uint64_t now = config_.clock.NowUs();
    std::lock_guard<std::mutex> lock(mutex_);
    return CheckLocked(actor_id, dim, amount, now);
  }

  /**
   * @brief Reserve `amount` ahead of work.
   * @param expires_in_ms  0 = no expiry; otherwise swept by
   *                       CleanupExpiredReservations() once elapsed.
   */
  expected<void, BudgetError> Reserve(const std::string& actor_id,
                                      BudgetDimension dim, double amount,
                                      const std::string& reservation_id,
                                      uint64_t expires_in_ms = 0U) {
    if (reservation_id.empty()) {
      ACP_LOG_ERROR("Budget", "reserve rejected: empty reservation id");
      return expected<void, BudgetError>::error(BudgetError::kInvalidArgument);
    }

    const uint64_t now = config_.clock.NowUs();
    std::lock_guard<std::mutex> lock(mutex_);

    if (reservations_.count(reservation_id) != 0U) {
      ++stats_.reserves_denied;
      ACP_LOG_ERROR("Budget", "reservation %s already outstanding",
                    reservation_id.c_str());
      return expected<void, BudgetError>::error(BudgetError::kDuplicateReservation);
    }

    BudgetCheck check = CheckLocked(actor_id, dim, amount, now);
    if (!check.allowed) {
      ++stats_.reserves_denied;
      ACP_LOG_WARN("Budget", "reservation %s failed for %s: %s",
                   reservation_id.c_str(), actor_id.c_str(), check.reason.c_str());
      if (!ValidAmount(amount)) {
        return expected<void, BudgetError>::error(BudgetError::kInvalidArgument);
      }
      if (allocations_.count(actor_id) == 0U) {
        return expected<void, BudgetError>::error(BudgetError::kNoAllocation);
      }
      return expected<void, BudgetError>::error(BudgetError::kInsufficientBudget);
    }

    Slot& slot = TrackedSlotLocked(actor_id, dim, now);
    slot.usage.reserved += amount;

    BudgetReservation res;
    res.reservation_id = reservation_id;
    res.actor_id = actor_id;
    res.dimension = dim;
    res.amount = amount;
    res.created_at_us = now;
    res.expires_at_us = (expires_in_ms != 0U) ? now + MsToUs(expires_in_ms) : 0U;
    reservations_.emplace(reservation_id, std::move(res));
    ++stats_.reserves_granted;

    ACP_LOG_DEBUG("Budget", "reserved %s: %s %s=%.4f", reservation_id.c_str(),
                  actor_id.c_str(), ToString(dim), amount);
    return expected<void, BudgetError>::success();
  }

  /**
   * @brief Settle a reservation: release its amount from `reserved` and
   *        charge `actual_amount` (default: the reserved amount) to `used`.
   *
   * An actual amount above the reservation is accepted only when the excess
   * fits in the remaining budget; otherwise kInsufficientBudget is returned
   * and the reservation stays outstanding.
   */
  expected<void, BudgetError> Commit(const std::string& reservation_id,
                                     std::optional<double> actual_amount = std::nullopt) {
    const uint64_t now = config_.clock.NowUs();
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = reservations_.find(reservation_id);
    if (it == reservations_.end()) {
      ACP_LOG_ERROR("Budget", "commit: reservation not found: %s",
                    reservation_id.c_str());
      return expected<void, BudgetError>::error(BudgetError::kReservationNotFound);
    }
    const BudgetReservation& res = it->second;
    const double charge = actual_amount.has_value() ? *actual_amount : res.amount;
    if (!ValidAmount(charge)) {
      ACP_LOG_ERROR("Budget", "commit %s: invalid actual amount",
                    reservation_id.c_str());
      return expected<void, BudgetError>::error(BudgetError::kInvalidArgument);
    }

    auto ait = allocations_.find(res.actor_id);
    if (ait == allocations_.end()) {
      ACP_LOG_ERROR("Budget", "commit %s: allocation missing for %s",
                    reservation_id.c_str(), res.actor_id.c_str());
      return expected<void, BudgetError>::error(BudgetError::kNoAllocation);
    }
    Slot& slot = ait->second.slots[Index(res.dimension)];
    if (slot.limited) {
      MaybeResetLocked(slot, now);
    }

    if (charge > res.amount && slot.limited) {
      const double excess = charge - res.amount;
      const double available = slot.limit.limit - slot.usage.used - slot.usage.reserved;
      if (excess > available) {
        ACP_LOG_WARN("Budget", "commit %s: actual %.4f overruns reservation %.4f "
                     "beyond remaining budget", reservation_id.c_str(), charge,
                     res.amount);
        return expected<void, BudgetError>::error(BudgetError::kInsufficientBudget);
      }
    }

    slot.usage.reserved = ClampZero(slot.usage.reserved - res.amount);
    slot.usage.used += charge;
    ait->second.updated_at_us = now;
    ++stats_.commits;

    ACP_LOG_DEBUG("Budget", "committed %s: %s %s=%.4f", reservation_id.c_str(),
                  res.actor_id.c_str(), ToString(res.dimension), charge);
    reservations_.erase(it);
    return expected<void, BudgetError>::success();
  }

  /// Return a reservation to the pool without charging it.
  expected<void, BudgetError> Release(const std::string& reservation_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!ReleaseLocked(reservation_id)) {
      ACP_LOG_ERROR("Budget", "release: reservation not found: %s",
                    reservation_id.c_str());
      return expected<void, BudgetError>::error(BudgetError::kReservationNotFound);
    }
    ++stats_.releases;
    return expected<void, BudgetError>::success();
  }

  /// Charge usage directly (no reservation). Exceeding the limit is
  /// recorded and warned about; the work has already happened.
  expected<void, BudgetError> RecordUsage(const std::string& actor_id,
                                          BudgetDimension dim, double amount) {
    if (!ValidAmount(amount)) {
      ACP_LOG_ERROR("Budget", "record usage for %s: invalid amount", actor_id.c_str());
      return expected<void, BudgetError>::error(BudgetError::kInvalidArgument);
    }

    const uint64_t now = config_.clock.NowUs();
    std::lock_guard<std::mutex> lock(mutex_);
    if (allocations_.count(actor_id) == 0U && !config_.allow_implicit_allocation) {
      ACP_LOG_ERROR("Budget", "record usage: no allocation for %s", actor_id.c_str());
      return expected<void, BudgetError>::error(BudgetError::kNoAllocation);
    }

    Slot& slot = TrackedSlotLocked(actor_id, dim, now);
    if (slot.limited) {
      MaybeResetLocked(slot, now);
    }
    slot.usage.used += amount;
    allocations_[actor_id].updated_at_us = now;

    if (slot.limited && slot.usage.used + slot.usage.reserved > slot.limit.limit) {
      ACP_LOG_WARN("Budget", "%s %s usage %.4f exceeds limit %.4f",
                   actor_id.c_str(), ToString(dim), slot.usage.used, slot.limit.limit);
    }
    ACP_LOG_DEBUG("Budget", "usage recorded: %s %s=%.4f", actor_id.c_str(),
                  ToString(dim), amount);
    return expected<void, BudgetError>::success();
  }

  /// Remaining budget, or nullopt when the dimension has no limit.
  std::optional<double> GetRemaining(const std::string& actor_id, BudgetDimension dim) {
    const uint64_t now = config_.clock.NowUs();
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = allocations_.find(actor_id);
    if (it == allocations_.end()) return std::nullopt;
    Slot& slot = it->second.slots[Index(dim)];
    if (!slot.limited) return std::nullopt;
    MaybeResetLocked(slot, now);
    const double remaining = slot.limit.limit - slot.usage.used - slot.usage.reserved;
    return remaining > 0.0 ? remaining : 0.0;
  }

  std::optional<BudgetUsage> GetUsage(const std::string& actor_id,
                                      BudgetDimension dim) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = allocations_.find(actor_id);
    if (it == allocations_.end()) return std::nullopt;
    const Slot& slot = it->second.slots[Index(dim)];
    if (!slot.tracked) return std::nullopt;
    return slot.usage;
  }

  std::optional<BudgetAllocation> GetAllocation(const std::string& actor_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = allocations_.find(actor_id);
    if (it == allocations_.end()) return std::nullopt;
    const Allocation& a = it->second;
    BudgetAllocation out;
    out.actor_id = actor_id;
    out.created_at_us = a.created_at_us;
    out.updated_at_us = a.updated_at_us;
    out.implicit = a.implicit;
    for (const auto& slot : a.slots) {
      if (slot.limited) out.limits.emplace(slot.limit.dimension, slot.limit);
      if (slot.tracked) out.usage.emplace(slot.usage.dimension, slot.usage);
    }
    return out;
  }

  std::optional<BudgetReservation> GetReservation(const std::string& reservation_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = reservations_.find(reservation_id);
    if (it == reservations_.end()) return std::nullopt;
    return it->second;
  }

  /// Zero `used` for one dimension, or all when `dim` is empty.
  /// Reservations are left untouched.
  expected<void, BudgetError> ResetBudget(const std::string& actor_id,
                                          std::optional<BudgetDimension> dim = std::nullopt) {
    const uint64_t now = config_.clock.NowUs();
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = allocations_.find(actor_id);
    if (it == allocations_.end()) {
      ACP_LOG_ERROR("Budget", "reset: no allocation for %s", actor_id.c_str());
      return expected<void, BudgetError>::error(BudgetError::kNoAllocation);
    }
    for (auto& slot : it->second.slots) {
      if (!slot.tracked) continue;
      if (dim.has_value() && slot.usage.dimension != *dim) continue;
      slot.usage.used = 0.0;
      slot.usage.last_reset_at_us = now;
    }
    if (dim.has_value()) {
      ACP_LOG_INFO("Budget", "budget reset for %s (%s)", actor_id.c_str(), ToString(*dim));
    } else {
      ACP_LOG_INFO("Budget", "all budgets reset for %s", actor_id.c_str());
    }
    return expected<void, BudgetError>::success();
  }

  /**
   * @brief Release reservations whose expiry has passed.
   * @return Number of reservations released.
   */
  uint32_t CleanupExpiredReservations() {
    const uint64_t now = config_.clock.NowUs();
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> expired;
    for (const auto& kv : reservations_) {
      if (kv.second.expires_at_us != 0U && kv.second.expires_at_us <= now) {
        expired.push_back(kv.first);
      }
    }
    for (const auto& id : expired) {
      (void)ReleaseLocked(id);
    }
    stats_.expired_released += expired.size();
    if (!expired.empty()) {
      ACP_LOG_INFO("Budget", "released %zu expired reservations", expired.size());
    }
    return static_cast<uint32_t>(expired.size());
  }

  BudgetStats GetStats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    BudgetStats s = stats_;
    s.allocations = static_cast<uint32_t>(allocations_.size());
    s.reservations = static_cast<uint32_t>(reservations_.size());
    return s;
  }

  /// USD cost of a model call. Unknown models are priced at the default tier.
  static double TokenCost(const std::string& model, uint64_t prompt_tokens,
                          uint64_t completion_tokens) {
    const ModelPricing* pricing = FindPricing(model.c_str());
    if (pricing == nullptr) {
      ACP_LOG_WARN("Budget", "unknown model %s, using %s pricing", model.c_str(),
                   kDefaultPricingModel);
      pricing = FindPricing(kDefaultPricingModel);
    }
    ACP_ASSERT(pricing != nullptr);
    return (static_cast<double>(prompt_tokens) / 1000.0) * pricing->prompt_per_1k +
           (static_cast<double>(completion_tokens) / 1000.0) * pricing->completion_per_1k;
  }

  const BudgetEngineConfig& config() const noexcept { return config_; }

 private:
  struct Slot {
    bool limited = false;
    bool tracked = false;
    BudgetLimit limit;
    BudgetUsage usage;
  };

  struct Allocation {
    std::array<Slot, kBudgetDimensionCount> slots{};
    uint64_t created_at_us = 0;
    uint64_t updated_at_us = 0;
    bool implicit = false;
  };

  static size_t Index(BudgetDimension d) noexcept { return static_cast<size_t>(d); }

  /// Charged or reserved amounts: finite and non-negative.
  static bool ValidAmount(double v) noexcept { return std::isfinite(v) && v >= 0.0; }

  /// Limits may be infinite (unlimited).
  static bool ValidLimit(double v) noexcept { return !std::isnan(v) && v >= 0.0; }

  static double ClampZero(double v) noexcept { return v < 0.0 ? 0.0 : v; }

  static const ModelPricing* FindPricing(const char* model) noexcept {
    for (const auto& p : kModelPricing) {
      if (std::strcmp(p.model, model) == 0) return &p;
    }
    return nullptr;
  }

  static void FormatLimits(const std::vector<BudgetLimit>& limits, char* buf,
                           size_t size) noexcept {
    size_t off = 0;
    buf[0] = '\0';
    for (const auto& l : limits) {
      if (off >= size) break;
      int n = std::snprintf(buf + off, size - off, "%s%s=%g", off == 0 ? "" : ", ",
                            ToString(l.dimension), l.limit);
      if (n < 0) break;
      off += static_cast<size_t>(n);
    }
  }

  void MaybeResetLocked(Slot& slot, uint64_t now) {
    if (slot.limit.period_ms == 0U) return;
    if (now >= slot.usage.last_reset_at_us &&
        now - slot.usage.last_reset_at_us >= MsToUs(slot.limit.period_ms)) {
      slot.usage.used = 0.0;
      slot.usage.last_reset_at_us = now;
      ++stats_.auto_resets;
      ACP_LOG_INFO("Budget", "budget auto-reset (%s) after %llums",
                   ToString(slot.usage.dimension),
                   static_cast<unsigned long long>(slot.limit.period_ms));
    }
  }

  BudgetCheck CheckLocked(const std::string& actor_id, BudgetDimension dim,
                          double amount, uint64_t now) {
    BudgetCheck out;
    if (!ValidAmount(amount)) {
      out.allowed = false;
      out.reason = "invalid amount";
      return out;
    }

    auto it = allocations_.find(actor_id);
    if (it == allocations_.end()) {
      if (config_.allow_implicit_allocation) {
        ACP_LOG_DEBUG("Budget", "no allocation for %s, implicitly unlimited",
                      actor_id.c_str());
        return out;
      }
      ACP_LOG_WARN("Budget", "no budget allocation for actor %s", actor_id.c_str());
      out.allowed = false;
      out.reason = "no budget allocation for actor " + actor_id;
      return out;
    }

    Slot& slot = it->second.slots[Index(dim)];
    if (!slot.limited) {
      return out;
    }
    MaybeResetLocked(slot, now);

    const double committed = slot.usage.used + slot.usage.reserved;
    out.available = slot.limit.limit - committed;
    if (amount > out.available) {
      char buf[160];
      (void)std::snprintf(buf, sizeof(buf),
                          "insufficient %s budget (requested=%g, available=%g)",
                          ToString(dim), amount, out.available);
      ACP_LOG_WARN("Budget", "budget exceeded for %s: %s", actor_id.c_str(), buf);
      out.allowed = false;
      out.reason = buf;
      return out;
    }

    if (slot.limit.soft_limit.has_value() &&
        committed + amount >= *slot.limit.soft_limit) {
      out.soft_limit_reached = true;
      ++stats_.soft_limit_warnings;
      ACP_LOG_WARN("Budget", "soft limit reached for %s (%s): %g/%g",
                   actor_id.c_str(), ToString(dim), committed + amount,
                   slot.limit.limit);
    }
    return out;
  }

  /// Slot with usage tracking for (actor, dim); creates the implicit
  /// allocation and unlimited slot as needed. Caller holds mutex_.
  Slot& TrackedSlotLocked(const std::string& actor_id, BudgetDimension dim,
                          uint64_t now) {
    auto ins = allocations_.emplace(actor_id, Allocation{});
    Allocation& alloc = ins.first->second;
    if (ins.second) {
      alloc.implicit = true;
      alloc.created_at_us = now;
      alloc.updated_at_us = now;
      ACP_LOG_WARN("Budget", "no allocation for %s, created implicit allocation",
                   actor_id.c_str());
    }
    Slot& slot = alloc.slots[Index(dim)];
    if (alloc.implicit && !slot.limited) {
      slot.limited = true;
      slot.limit = BudgetLimit{dim, std::numeric_limits<double>::infinity(),
                               config_.implicit_period_ms, std::nullopt};
    }
    if (!slot.tracked) {
      slot.tracked = true;
      slot.usage = BudgetUsage{dim, 0.0, 0.0, now};
    }
    return slot;
  }

  bool ReleaseLocked(const std::string& reservation_id) {
    auto it = reservations_.find(reservation_id);
    if (it == reservations_.end()) return false;
    const BudgetReservation& res = it->second;
    auto ait = allocations_.find(res.actor_id);
    if (ait != allocations_.end()) {
      Slot& slot = ait->second.slots[Index(res.dimension)];
      slot.usage.reserved = ClampZero(slot.usage.reserved - res.amount);
    }
    ACP_LOG_DEBUG("Budget", "released %s: %s %s=%.4f", reservation_id.c_str(),
                  res.actor_id.c_str(), ToString(res.dimension), res.amount);
    reservations_.erase(it);
    return true;
  }

  BudgetEngineConfig config_;
  mutable std::mutex mutex_;
  std::unordered_map<std::string, Allocation> allocations_;
  std::unordered_map<std::string, BudgetReservation> reservations_;
  BudgetStats stats_{};
};

}  // namespace acp

#endif  // ACP_BUDGET_ENGINE_HPP_
