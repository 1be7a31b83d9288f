/**
 * @file policy.hpp
 * @brief Governance policy: the per-component configs, loaded from a
 *        ConfigStore and validated.
 *
 * Recognized sections and keys (all optional; defaults apply):
 *
 *   [arbitrator]  dedup_window_ms, max_tasks_per_actor,
 *                 loop_detection_enabled, loop_threshold, max_clock_skew_ms
 *   [budget]      allow_implicit_allocation, implicit_period_ms
 *   [budget.<dimension>]  limit (required), period_ms, soft_limit
 *                 dimension: cost | tokens | time | concurrency | api_calls
 *   [circuit]     failure_threshold, success_threshold, window_ms,
 *                 cooldown_ms, max_open_ms
 *   [loop]        max_chain_depth, max_chains, chain_ttl_ms
 *   [events]      dedup_window_ms, cascade_threshold, cascade_fanout_ratio,
 *                 rate_window_ms
 *   [events.rate_limits]  <event_type> = <max events per rate window>
 */

#ifndef ACP_POLICY_HPP_
#define ACP_POLICY_HPP_

#include "acp/budget_engine.hpp"
#include "acp/circuit_breaker.hpp"
#include "acp/config.hpp"
#include "acp/event_bus.hpp"
#include "acp/feedback_loop_detector.hpp"
#include "acp/log.hpp"
#include "acp/task_arbitrator.hpp"
#include "acp/vocabulary.hpp"

#include <cmath>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace acp {

struct GovernancePolicy {
  ArbitratorConfig arbitrator;
  BudgetEngineConfig budget;
  /// Limits applied to actors through ApplyDefaultLimits().
  std::vector<BudgetLimit> default_limits;
  CircuitBreakerConfig circuit;
  LoopDetectorConfig loop;
  DampenerConfig events;

  /// Point every component at the same clock.
  void SetClock(const ClockSource& clock) noexcept {
    arbitrator.clock = clock;
    budget.clock = clock;
    circuit.clock = clock;
    loop.clock = clock;
    events.clock = clock;
  }
};

namespace detail {

inline expected<void, ConfigError> PolicyFail(const char* section, const char* key,
                                              const char* why) {
  ACP_LOG_ERROR("Policy", "[%s] %s: %s", section, key, why);
  return expected<void, ConfigError>::error(ConfigError::kInvalidValue);
}

/// Overwrite `out` when the key is present; fail when it is malformed.
inline expected<void, ConfigError> ReadU64(const ConfigStore& cfg, const char* section,
                                           const char* key, uint64_t& out) {
  if (!cfg.HasKey(section, key)) return expected<void, ConfigError>::success();
  auto v = cfg.FindUint64(section, key);
  if (!v.has_value()) return PolicyFail(section, key, "expected non-negative integer");
  out = *v;
  return expected<void, ConfigError>::success();
}

inline expected<void, ConfigError> ReadU32(const ConfigStore& cfg, const char* section,
                                           const char* key, uint32_t& out) {
  uint64_t wide = out;
  auto r = ReadU64(cfg, section, key, wide);
  if (!r) return r;
  if (wide > UINT32_MAX) return PolicyFail(section, key, "out of range");
  out = static_cast<uint32_t>(wide);
  return expected<void, ConfigError>::success();
}

inline expected<void, ConfigError> ReadBool(const ConfigStore& cfg, const char* section,
                                            const char* key, bool& out) {
  if (!cfg.HasKey(section, key)) return expected<void, ConfigError>::success();
  auto v = cfg.FindBool(section, key);
  if (!v.has_value()) return PolicyFail(section, key, "expected boolean");
  out = *v;
  return expected<void, ConfigError>::success();
}

inline expected<void, ConfigError> ReadDouble(const ConfigStore& cfg, const char* section,
                                              const char* key, double& out) {
  if (!cfg.HasKey(section, key)) return expected<void, ConfigError>::success();
  auto v = cfg.FindDouble(section, key);
  if (!v.has_value() || std::isnan(*v)) return PolicyFail(section, key, "expected number");
  out = *v;
  return expected<void, ConfigError>::success();
}

}  // namespace detail

#define ACP_POLICY_TRY(expr)                                   \
  do {                                                         \
    auto acp_policy_r_ = (expr);                               \
    if (!acp_policy_r_) {                                      \
      return expected<GovernancePolicy, ConfigError>::error(   \
          acp_policy_r_.get_error());                          \
    }                                                          \
  } while (0)

/// Check cross-field constraints of an assembled policy.
inline expected<void, ConfigError> ValidatePolicy(const GovernancePolicy& p) {
  using detail::PolicyFail;
  if (p.arbitrator.max_tasks_per_actor == 0U)
    return PolicyFail("arbitrator", "max_tasks_per_actor", "must be > 0");
  if (p.arbitrator.loop_threshold == 0U)
    return PolicyFail("arbitrator", "loop_threshold", "must be > 0");
  if (p.circuit.failure_threshold == 0U)
    return PolicyFail("circuit", "failure_threshold", "must be > 0");
  if (p.circuit.success_threshold == 0U)
    return PolicyFail("circuit", "success_threshold", "must be > 0");
  if (p.circuit.window_ms == 0U)
    return PolicyFail("circuit", "window_ms", "must be > 0");
  if (p.circuit.max_open_ms < p.circuit.cooldown_ms)
    return PolicyFail("circuit", "max_open_ms", "must be >= cooldown_ms");
  if (p.loop.max_chain_depth == 0U)
    return PolicyFail("loop", "max_chain_depth", "must be > 0");
  if (p.loop.max_chains == 0U)
    return PolicyFail("loop", "max_chains", "must be > 0");
  if (p.events.cascade_threshold == 0U)
    return PolicyFail("events", "cascade_threshold", "must be > 0");
  if (!(p.events.cascade_fanout_ratio > 0.0))
    return PolicyFail("events", "cascade_fanout_ratio", "must be > 0");
  if (p.events.rate_window_ms == 0U)
    return PolicyFail("events", "rate_window_ms", "must be > 0");
  for (const auto& l : p.default_limits) {
    if (std::isnan(l.limit) || l.limit < 0.0)
      return PolicyFail(ToString(l.dimension), "limit", "must be >= 0");
    if (l.soft_limit.has_value() &&
        (std::isnan(*l.soft_limit) || *l.soft_limit < 0.0 || *l.soft_limit > l.limit))
      return PolicyFail(ToString(l.dimension), "soft_limit", "must be within [0, limit]");
  }
  return expected<void, ConfigError>::success();
}

/**
 * @brief Build a policy from `cfg`, starting from defaults.
 * @return kInvalidValue on any malformed or out-of-range value, or on an
 *         unknown [budget.<dimension>] section.
 */
inline expected<GovernancePolicy, ConfigError> LoadPolicy(const ConfigStore& cfg) {
  using detail::ReadBool;
  using detail::ReadDouble;
  using detail::ReadU32;
  using detail::ReadU64;
  GovernancePolicy p;

  ACP_POLICY_TRY(ReadU64(cfg, "arbitrator", "dedup_window_ms", p.arbitrator.dedup_window_ms));
  ACP_POLICY_TRY(ReadU32(cfg, "arbitrator", "max_tasks_per_actor",
                         p.arbitrator.max_tasks_per_actor));
  ACP_POLICY_TRY(ReadBool(cfg, "arbitrator", "loop_detection_enabled",
                          p.arbitrator.loop_detection_enabled));
  ACP_POLICY_TRY(ReadU32(cfg, "arbitrator", "loop_threshold", p.arbitrator.loop_threshold));
  ACP_POLICY_TRY(ReadU64(cfg, "arbitrator", "max_clock_skew_ms",
                         p.arbitrator.max_clock_skew_ms));

  ACP_POLICY_TRY(ReadBool(cfg, "budget", "allow_implicit_allocation",
                          p.budget.allow_implicit_allocation));
  ACP_POLICY_TRY(ReadU64(cfg, "budget", "implicit_period_ms", p.budget.implicit_period_ms));

  // [budget.<dimension>] sections, in the order they first appear.
  std::vector<std::string> dim_sections;
  bool unknown_dim = false;
  cfg.ForEachEntry([&](const std::string& section, const std::string&, const std::string&) {
    static const std::string kPrefix = "budget.";
    if (section.compare(0, kPrefix.size(), kPrefix) != 0) return;
    for (const auto& seen : dim_sections) {
      if (seen == section) return;
    }
    if (!ParseBudgetDimension(section.c_str() + kPrefix.size()).has_value()) {
      ACP_LOG_ERROR("Policy", "unknown budget dimension section [%s]", section.c_str());
      unknown_dim = true;
    }
    dim_sections.push_back(section);
  });
  if (unknown_dim) {
    return expected<GovernancePolicy, ConfigError>::error(ConfigError::kInvalidValue);
  }
  for (const auto& section : dim_sections) {
    const char* sec = section.c_str();
    BudgetLimit limit;
    limit.dimension = *ParseBudgetDimension(sec + sizeof("budget.") - 1U);
    if (!cfg.HasKey(sec, "limit")) {
      (void)detail::PolicyFail(sec, "limit", "missing");
      return expected<GovernancePolicy, ConfigError>::error(ConfigError::kInvalidValue);
    }
    ACP_POLICY_TRY(ReadDouble(cfg, sec, "limit", limit.limit));
    ACP_POLICY_TRY(ReadU64(cfg, sec, "period_ms", limit.period_ms));
    if (cfg.HasKey(sec, "soft_limit")) {
      double soft = 0.0;
      ACP_POLICY_TRY(ReadDouble(cfg, sec, "soft_limit", soft));
      limit.soft_limit = soft;
    }
    p.default_limits.push_back(limit);
  }

  ACP_POLICY_TRY(ReadU32(cfg, "circuit", "failure_threshold", p.circuit.failure_threshold));
  ACP_POLICY_TRY(ReadU32(cfg, "circuit", "success_threshold", p.circuit.success_threshold));
  ACP_POLICY_TRY(ReadU64(cfg, "circuit", "window_ms", p.circuit.window_ms));
  ACP_POLICY_TRY(ReadU64(cfg, "circuit", "cooldown_ms", p.circuit.cooldown_ms));
  ACP_POLICY_TRY(ReadU64(cfg, "circuit", "max_open_ms", p.circuit.max_open_ms));

  ACP_POLICY_TRY(ReadU32(cfg, "loop", "max_chain_depth", p.loop.max_chain_depth));
  ACP_POLICY_TRY(ReadU32(cfg, "loop", "max_chains", p.loop.max_chains));
  ACP_POLICY_TRY(ReadU64(cfg, "loop", "chain_ttl_ms", p.loop.chain_ttl_ms));

  ACP_POLICY_TRY(ReadU64(cfg, "events", "dedup_window_ms", p.events.dedup_window_ms));
  ACP_POLICY_TRY(ReadU32(cfg, "events", "cascade_threshold", p.events.cascade_threshold));
  ACP_POLICY_TRY(ReadDouble(cfg, "events", "cascade_fanout_ratio",
                            p.events.cascade_fanout_ratio));
  ACP_POLICY_TRY(ReadU64(cfg, "events", "rate_window_ms", p.events.rate_window_ms));

  bool bad_rate = false;
  cfg.ForEachKey("events.rate_limits", [&](const std::string& type, const std::string&) {
    auto v = cfg.FindUint64("events.rate_limits", type.c_str());
    if (!v.has_value() || *v > UINT32_MAX) {
      (void)detail::PolicyFail("events.rate_limits", type.c_str(), "expected count");
      bad_rate = true;
      return;
    }
    p.events.rate_limits[type] = static_cast<uint32_t>(*v);
  });
  if (bad_rate) {
    return expected<GovernancePolicy, ConfigError>::error(ConfigError::kInvalidValue);
  }

  auto valid = ValidatePolicy(p);
  if (!valid) return expected<GovernancePolicy, ConfigError>::error(valid.get_error());

  ACP_LOG_INFO("Policy", "policy loaded: %zu budget limits, %zu rate limits",
               p.default_limits.size(), p.events.rate_limits.size());
  return expected<GovernancePolicy, ConfigError>::success(std::move(p));
}

/// Give `actor_id` the policy's default budget limits.
inline expected<void, BudgetError> ApplyDefaultLimits(const GovernancePolicy& policy,
                                                      BudgetEngine& engine,
                                                      const std::string& actor_id) {
  return engine.CreateAllocation(actor_id, policy.default_limits);
}

#undef ACP_POLICY_TRY

}  // namespace acp

#endif  // ACP_POLICY_HPP_
