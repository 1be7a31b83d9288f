/**
 * @file test_budget_engine.cpp
 * @brief Tests for budget_engine.hpp
 */

#include "acp/budget_engine.hpp"

#include "test_clock.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <cmath>
#include <limits>
#include <optional>
#include <string>
#include <thread>
#include <vector>

using acp::BudgetDimension;
using acp::BudgetError;

namespace {

acp::BudgetEngineConfig ConfigWith(acp_test::ManualClock& clock) {
  acp::BudgetEngineConfig cfg;
  cfg.clock = clock.Source();
  return cfg;
}

acp::BudgetLimit Limit(BudgetDimension dim, double limit, uint64_t period_ms = 3600000,
                       std::optional<double> soft = std::nullopt) {
  acp::BudgetLimit l;
  l.dimension = dim;
  l.limit = limit;
  l.period_ms = period_ms;
  l.soft_limit = soft;
  return l;
}

}  // namespace

// ============================================================================
// Reserve / commit / release
// ============================================================================

TEST_CASE("Reserve, commit and re-reserve against a cost limit", "[budget]") {
  acp_test::ManualClock clock;
  acp::BudgetEngine engine(ConfigWith(clock));
  REQUIRE(engine.CreateAllocation("actor", {Limit(BudgetDimension::kCost, 10.0)}).has_value());

  REQUIRE(engine.Reserve("actor", BudgetDimension::kCost, 6.0, "r1").has_value());

  auto r2 = engine.Reserve("actor", BudgetDimension::kCost, 5.0, "r2");
  REQUIRE(!r2.has_value());
  REQUIRE(r2.get_error() == BudgetError::kInsufficientBudget);
  REQUIRE(*engine.GetRemaining("actor", BudgetDimension::kCost) == Catch::Approx(4.0));

  REQUIRE(engine.Commit("r1", 4.0).has_value());
  auto usage = engine.GetUsage("actor", BudgetDimension::kCost);
  REQUIRE(usage->used == Catch::Approx(4.0));
  REQUIRE(usage->reserved == Catch::Approx(0.0));

  REQUIRE(engine.Reserve("actor", BudgetDimension::kCost, 5.0, "r3").has_value());
  REQUIRE(*engine.GetRemaining("actor", BudgetDimension::kCost) == Catch::Approx(1.0));
}

TEST_CASE("Reserve then release restores counters exactly", "[budget]") {
  acp_test::ManualClock clock;
  acp::BudgetEngine engine(ConfigWith(clock));
  REQUIRE(engine.CreateAllocation("actor", {Limit(BudgetDimension::kTokens, 1000.0)})
              .has_value());
  REQUIRE(engine.RecordUsage("actor", BudgetDimension::kTokens, 100.0).has_value());

  auto before = *engine.GetUsage("actor", BudgetDimension::kTokens);
  REQUIRE(engine.Reserve("actor", BudgetDimension::kTokens, 250.0, "r").has_value());
  REQUIRE(engine.GetUsage("actor", BudgetDimension::kTokens)->reserved == 250.0);
  REQUIRE(engine.Release("r").has_value());
  auto after = *engine.GetUsage("actor", BudgetDimension::kTokens);

  REQUIRE(after.used == before.used);
  REQUIRE(after.reserved == before.reserved);
  REQUIRE(!engine.GetReservation("r").has_value());
}

TEST_CASE("Commit without actual amount charges the reservation", "[budget]") {
  acp::BudgetEngine engine;
  REQUIRE(engine.CreateAllocation("a", {Limit(BudgetDimension::kApiCalls, 10.0)}).has_value());
  REQUIRE(engine.Reserve("a", BudgetDimension::kApiCalls, 3.0, "r").has_value());
  REQUIRE(engine.Commit("r").has_value());
  REQUIRE(engine.GetUsage("a", BudgetDimension::kApiCalls)->used == 3.0);
}

TEST_CASE("Commit above the reservation needs remaining budget", "[budget]") {
  acp::BudgetEngine engine;
  REQUIRE(engine.CreateAllocation("a", {Limit(BudgetDimension::kCost, 10.0)}).has_value());
  REQUIRE(engine.Reserve("a", BudgetDimension::kCost, 4.0, "r1").has_value());
  REQUIRE(engine.Reserve("a", BudgetDimension::kCost, 4.0, "r2").has_value());

  // Excess 3.0 > available 2.0: rejected, reservation kept.
  auto over = engine.Commit("r1", 7.0);
  REQUIRE(over.get_error() == BudgetError::kInsufficientBudget);
  REQUIRE(engine.GetReservation("r1").has_value());

  // Excess 2.0 fits exactly.
  REQUIRE(engine.Commit("r1", 6.0).has_value());
  auto usage = engine.GetUsage("a", BudgetDimension::kCost);
  REQUIRE(usage->used + usage->reserved <= 10.0);
  REQUIRE(*engine.GetRemaining("a", BudgetDimension::kCost) == Catch::Approx(0.0));
}

TEST_CASE("Reservation errors", "[budget]") {
  acp::BudgetEngine engine;
  REQUIRE(engine.CreateAllocation("a", {Limit(BudgetDimension::kCost, 10.0)}).has_value());

  REQUIRE(engine.Reserve("a", BudgetDimension::kCost, 1.0, "dup").has_value());
  REQUIRE(engine.Reserve("a", BudgetDimension::kCost, 1.0, "dup").get_error() ==
          BudgetError::kDuplicateReservation);
  REQUIRE(engine.Reserve("a", BudgetDimension::kCost, -1.0, "neg").get_error() ==
          BudgetError::kInvalidArgument);
  REQUIRE(engine.Reserve("a", BudgetDimension::kCost, std::nan(""), "nan").get_error() ==
          BudgetError::kInvalidArgument);
  REQUIRE(engine.Reserve("a", BudgetDimension::kCost, 1.0, "").get_error() ==
          BudgetError::kInvalidArgument);
  REQUIRE(engine.Commit("missing").get_error() == BudgetError::kReservationNotFound);
  REQUIRE(engine.Release("missing").get_error() == BudgetError::kReservationNotFound);
  REQUIRE(engine.Commit("dup", -2.0).get_error() == BudgetError::kInvalidArgument);
}

// ============================================================================
// Allocation policy
// ============================================================================

TEST_CASE("Unknown actor is denied by default", "[budget]") {
  acp::BudgetEngine engine;
  auto check = engine.CheckBudget("ghost", BudgetDimension::kCost, 1.0);
  REQUIRE(!check.allowed);
  REQUIRE(check.reason == "no budget allocation for actor ghost");
  REQUIRE(engine.Reserve("ghost", BudgetDimension::kCost, 1.0, "r").get_error() ==
          BudgetError::kNoAllocation);
  REQUIRE(engine.RecordUsage("ghost", BudgetDimension::kCost, 1.0).get_error() ==
          BudgetError::kNoAllocation);
  REQUIRE(!engine.HasAllocation("ghost"));
}

TEST_CASE("Implicit allocation is created on first usage when allowed", "[budget]") {
  acp::BudgetEngineConfig cfg;
  cfg.allow_implicit_allocation = true;
  acp::BudgetEngine engine(cfg);

  auto check = engine.CheckBudget("ghost", BudgetDimension::kCost, 1e9);
  REQUIRE(check.allowed);
  REQUIRE(!engine.HasAllocation("ghost"));

  REQUIRE(engine.RecordUsage("ghost", BudgetDimension::kCost, 5.0).has_value());
  auto alloc = engine.GetAllocation("ghost");
  REQUIRE(alloc.has_value());
  REQUIRE(alloc->implicit);
  REQUIRE(std::isinf(alloc->limits.at(BudgetDimension::kCost).limit));
  REQUIRE(alloc->usage.at(BudgetDimension::kCost).used == 5.0);
}

TEST_CASE("Dimension without a limit is unlimited", "[budget]") {
  acp::BudgetEngine engine;
  REQUIRE(engine.CreateAllocation("a", {Limit(BudgetDimension::kCost, 1.0)}).has_value());
  REQUIRE(engine.CheckBudget("a", BudgetDimension::kTokens, 1e12).allowed);
  REQUIRE(!engine.GetRemaining("a", BudgetDimension::kTokens).has_value());
  REQUIRE(engine.Reserve("a", BudgetDimension::kTokens, 500.0, "t").has_value());
  REQUIRE(engine.Commit("t").has_value());
  REQUIRE(engine.GetUsage("a", BudgetDimension::kTokens)->used == 500.0);
}

TEST_CASE("Replacing an allocation keeps usage", "[budget]") {
  acp::BudgetEngine engine;
  REQUIRE(engine.CreateAllocation("a", {Limit(BudgetDimension::kCost, 10.0)}).has_value());
  REQUIRE(engine.RecordUsage("a", BudgetDimension::kCost, 3.0).has_value());
  REQUIRE(engine.CreateAllocation("a", {Limit(BudgetDimension::kCost, 20.0)}).has_value());
  REQUIRE(*engine.GetRemaining("a", BudgetDimension::kCost) == Catch::Approx(17.0));
}

TEST_CASE("Infinite amounts are rejected, infinite limits are not", "[budget]") {
  const double inf = std::numeric_limits<double>::infinity();
  acp::BudgetEngine engine;
  REQUIRE(engine.CreateAllocation("a", {Limit(BudgetDimension::kCost, 10.0),
                                        Limit(BudgetDimension::kTokens, inf)})
              .has_value());

  REQUIRE(engine.RecordUsage("a", BudgetDimension::kCost, inf).get_error() ==
          BudgetError::kInvalidArgument);
  REQUIRE(engine.Reserve("a", BudgetDimension::kCost, inf, "r").get_error() ==
          BudgetError::kInvalidArgument);
  REQUIRE(!engine.CheckBudget("a", BudgetDimension::kTokens, inf).allowed);
  REQUIRE(*engine.GetRemaining("a", BudgetDimension::kCost) == 10.0);

  REQUIRE(engine.Reserve("a", BudgetDimension::kCost, 4.0, "r").has_value());
  REQUIRE(engine.Commit("r", inf).get_error() == BudgetError::kInvalidArgument);
  REQUIRE(engine.GetReservation("r").has_value());

  REQUIRE(engine.RecordUsage("a", BudgetDimension::kTokens, 1e9).has_value());
  REQUIRE(engine.CheckBudget("a", BudgetDimension::kTokens, 1e9).allowed);
}

TEST_CASE("Invalid allocations are rejected", "[budget]") {
  acp::BudgetEngine engine;
  REQUIRE(engine.CreateAllocation("", {Limit(BudgetDimension::kCost, 1.0)}).get_error() ==
          BudgetError::kInvalidArgument);
  REQUIRE(engine.CreateAllocation("a", {Limit(BudgetDimension::kCost, -1.0)}).get_error() ==
          BudgetError::kInvalidArgument);
  REQUIRE(!engine.HasAllocation("a"));
}

// ============================================================================
// Soft limits, periods, reset
// ============================================================================

TEST_CASE("Soft limit flags but never blocks", "[budget]") {
  acp::BudgetEngine engine;
  REQUIRE(engine.CreateAllocation("a", {Limit(BudgetDimension::kCost, 10.0, 3600000, 8.0)})
              .has_value());
  auto below = engine.CheckBudget("a", BudgetDimension::kCost, 5.0);
  REQUIRE(below.allowed);
  REQUIRE(!below.soft_limit_reached);

  REQUIRE(engine.RecordUsage("a", BudgetDimension::kCost, 7.0).has_value());
  auto above = engine.CheckBudget("a", BudgetDimension::kCost, 2.0);
  REQUIRE(above.allowed);
  REQUIRE(above.soft_limit_reached);
  REQUIRE(engine.GetStats().soft_limit_warnings == 1U);
}

TEST_CASE("Period elapse resets used lazily", "[budget]") {
  acp_test::ManualClock clock;
  acp::BudgetEngine engine(ConfigWith(clock));
  REQUIRE(engine.CreateAllocation("a", {Limit(BudgetDimension::kCost, 10.0, 60000)})
              .has_value());
  REQUIRE(engine.RecordUsage("a", BudgetDimension::kCost, 10.0).has_value());
  REQUIRE(!engine.CheckBudget("a", BudgetDimension::kCost, 1.0).allowed);

  clock.AdvanceMs(59999);
  REQUIRE(!engine.CheckBudget("a", BudgetDimension::kCost, 1.0).allowed);
  clock.AdvanceMs(1);
  REQUIRE(engine.CheckBudget("a", BudgetDimension::kCost, 1.0).allowed);
  REQUIRE(engine.GetUsage("a", BudgetDimension::kCost)->used == 0.0);
  REQUIRE(engine.GetStats().auto_resets == 1U);
}

TEST_CASE("Period reset keeps outstanding reservations", "[budget]") {
  acp_test::ManualClock clock;
  acp::BudgetEngine engine(ConfigWith(clock));
  REQUIRE(engine.CreateAllocation("a", {Limit(BudgetDimension::kCost, 10.0, 1000)})
              .has_value());
  REQUIRE(engine.RecordUsage("a", BudgetDimension::kCost, 5.0).has_value());
  REQUIRE(engine.Reserve("a", BudgetDimension::kCost, 4.0, "r").has_value());
  clock.AdvanceMs(1000);
  REQUIRE(*engine.GetRemaining("a", BudgetDimension::kCost) == Catch::Approx(6.0));
}

TEST_CASE("Commit after a period rollover charges the new period", "[budget]") {
  acp_test::ManualClock clock;
  acp::BudgetEngine engine(ConfigWith(clock));
  REQUIRE(engine.CreateAllocation("a", {Limit(BudgetDimension::kCost, 10.0, 3600000)})
              .has_value());

  SECTION("charge sticks after the rollover") {
    REQUIRE(engine.Reserve("a", BudgetDimension::kCost, 6.0, "r1").has_value());
    clock.AdvanceMs(3600001);
    REQUIRE(engine.Commit("r1").has_value());
    REQUIRE(engine.GetUsage("a", BudgetDimension::kCost)->used == 6.0);
    REQUIRE(*engine.GetRemaining("a", BudgetDimension::kCost) == Catch::Approx(4.0));
  }

  SECTION("overrun is checked against the new period") {
    REQUIRE(engine.RecordUsage("a", BudgetDimension::kCost, 8.0).has_value());
    REQUIRE(engine.Reserve("a", BudgetDimension::kCost, 2.0, "r1").has_value());
    clock.AdvanceMs(3600001);
    REQUIRE(engine.Commit("r1", 5.0).has_value());
    auto usage = engine.GetUsage("a", BudgetDimension::kCost);
    REQUIRE(usage->used == 5.0);
    REQUIRE(usage->reserved == 0.0);
    REQUIRE(*engine.GetRemaining("a", BudgetDimension::kCost) == Catch::Approx(5.0));
  }
}

TEST_CASE("ResetBudget zeroes one or all dimensions", "[budget]") {
  acp::BudgetEngine engine;
  REQUIRE(engine.CreateAllocation("a", {Limit(BudgetDimension::kCost, 10.0),
                                        Limit(BudgetDimension::kTokens, 100.0)})
              .has_value());
  REQUIRE(engine.RecordUsage("a", BudgetDimension::kCost, 4.0).has_value());
  REQUIRE(engine.RecordUsage("a", BudgetDimension::kTokens, 40.0).has_value());

  REQUIRE(engine.ResetBudget("a", BudgetDimension::kCost).has_value());
  REQUIRE(engine.GetUsage("a", BudgetDimension::kCost)->used == 0.0);
  REQUIRE(engine.GetUsage("a", BudgetDimension::kTokens)->used == 40.0);

  REQUIRE(engine.ResetBudget("a").has_value());
  REQUIRE(engine.GetUsage("a", BudgetDimension::kTokens)->used == 0.0);
  REQUIRE(engine.ResetBudget("ghost").get_error() == BudgetError::kNoAllocation);
}

TEST_CASE("Expired reservations are swept back to the pool", "[budget]") {
  acp_test::ManualClock clock;
  acp::BudgetEngine engine(ConfigWith(clock));
  REQUIRE(engine.CreateAllocation("a", {Limit(BudgetDimension::kCost, 10.0)}).has_value());
  REQUIRE(engine.Reserve("a", BudgetDimension::kCost, 3.0, "short", 1000).has_value());
  REQUIRE(engine.Reserve("a", BudgetDimension::kCost, 3.0, "forever").has_value());

  clock.AdvanceMs(999);
  REQUIRE(engine.CleanupExpiredReservations() == 0U);
  clock.AdvanceMs(1);
  REQUIRE(engine.CleanupExpiredReservations() == 1U);

  REQUIRE(!engine.GetReservation("short").has_value());
  REQUIRE(engine.GetReservation("forever").has_value());
  REQUIRE(engine.GetUsage("a", BudgetDimension::kCost)->reserved == 3.0);
  REQUIRE(engine.GetStats().expired_released == 1U);
}

// ============================================================================
// Pricing
// ============================================================================

TEST_CASE("TokenCost uses the model pricing table", "[budget]") {
  REQUIRE(acp::BudgetEngine::TokenCost("gpt-4", 1000, 1000) == Catch::Approx(0.09));
  REQUIRE(acp::BudgetEngine::TokenCost("gpt-3.5-turbo", 2000, 1000) ==
          Catch::Approx(0.0025));
  REQUIRE(acp::BudgetEngine::TokenCost("claude-3-opus", 1000, 2000) ==
          Catch::Approx(0.165));
  REQUIRE(acp::BudgetEngine::TokenCost("claude-3-sonnet", 0, 0) == 0.0);
}

TEST_CASE("TokenCost falls back to the default tier", "[budget]") {
  REQUIRE(acp::BudgetEngine::TokenCost("mystery-model", 1000, 1000) ==
          acp::BudgetEngine::TokenCost("gpt-4", 1000, 1000));
}

TEST_CASE("Dimension names round trip", "[budget]") {
  for (size_t i = 0; i < acp::kBudgetDimensionCount; ++i) {
    auto d = static_cast<BudgetDimension>(i);
    REQUIRE(acp::ParseBudgetDimension(acp::ToString(d)) == d);
  }
  REQUIRE(!acp::ParseBudgetDimension("bandwidth").has_value());
}

// ============================================================================
// Concurrency
// ============================================================================

TEST_CASE("Concurrent reservations never overcommit", "[budget][thread]") {
  acp::BudgetEngine engine;
  REQUIRE(engine.CreateAllocation("shared", {Limit(BudgetDimension::kConcurrency, 25.0)})
              .has_value());

  std::atomic<uint32_t> granted{0};
  std::vector<std::thread> threads;
  for (int t = 0; t < 8; ++t) {
    threads.emplace_back([&engine, &granted, t]() {
      for (int i = 0; i < 20; ++i) {
        std::string id = "r-" + std::to_string(t) + "-" + std::to_string(i);
        if (engine.Reserve("shared", BudgetDimension::kConcurrency, 1.0, id).has_value()) {
          granted.fetch_add(1);
        }
      }
    });
  }
  for (auto& th : threads) th.join();

  REQUIRE(granted.load() == 25U);
  auto usage = engine.GetUsage("shared", BudgetDimension::kConcurrency);
  REQUIRE(usage->reserved == 25.0);
  REQUIRE(engine.GetStats().reservations == 25U);
}
