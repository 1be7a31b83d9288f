/**
 * @file governance_demo.cpp
 * @brief Walk two agents through the governance plane.
 *
 * Demonstrates:
 *   - Building a GovernancePolicy from a config file (INI builds) or Set()
 *   - Task admission with dedup, capacity and causality-chain checks
 *   - Budget reserve / commit around model calls priced by TokenCost()
 *   - A flaky tool tripping its circuit breaker
 *   - Lifecycle events published on the EventBus
 *
 * Usage: governance_demo [policy.ini]
 */

#include "acp/budget_engine.hpp"
#include "acp/circuit_breaker.hpp"
#include "acp/event_bus.hpp"
#include "acp/feedback_loop_detector.hpp"
#include "acp/log.hpp"
#include "acp/policy.hpp"
#include "acp/task_arbitrator.hpp"

#include <cstdint>
#include <cstdio>
#include <initializer_list>
#include <string>

// -- Policy -----------------------------------------------------------------

static bool BuildPolicy(int argc, char* argv[], acp::GovernancePolicy& out) {
#ifdef ACP_CONFIG_INI_ENABLED
  acp::IniConfig cfg;
  if (argc > 1) {
    auto r = cfg.LoadFile(argv[1]);
    if (!r) {
      ACP_LOG_ERROR("demo", "cannot load %s: %s", argv[1], acp::ToString(r.get_error()));
      return false;
    }
  }
#else
  acp::ConfigStore cfg;
  if (argc > 1) {
    ACP_LOG_WARN("demo", "built without INI support, ignoring %s", argv[1]);
  }
#endif
  if (!cfg.HasSection("budget.cost")) {
    (void)cfg.Set("budget.cost", "limit", "0.50");
    (void)cfg.Set("budget.cost", "soft_limit", "0.40");
    (void)cfg.Set("budget.cost", "period_ms", "86400000");
    (void)cfg.Set("budget.api_calls", "limit", "20");
  }
  if (!cfg.HasSection("circuit")) {
    (void)cfg.Set("circuit", "failure_threshold", "3");
    (void)cfg.Set("circuit", "cooldown_ms", "1000");
    (void)cfg.Set("circuit", "max_open_ms", "5000");
  }

  auto policy = acp::LoadPolicy(cfg);
  if (!policy) {
    ACP_LOG_ERROR("demo", "invalid policy: %s", acp::ToString(policy.get_error()));
    return false;
  }
  out = policy.value();
  return true;
}

// -- Event listener ---------------------------------------------------------

static void PrintEvent(const acp::Event& e) {
  std::string fields;
  for (const auto& kv : e.payload) {
    fields += " " + kv.first + "=" + kv.second;
  }
  std::printf("  [event] %-16s corr=%s%s\n", e.event_type.c_str(),
              e.correlation_id.c_str(), fields.c_str());
}

static void OnCircuit(const std::string& id, acp::CircuitState from, acp::CircuitState to,
                      const std::string& reason, void* ctx) {
  auto* bus = static_cast<acp::EventBus*>(ctx);
  acp::Event e;
  e.event_type = "circuit.changed";
  e.source = "breaker";
  e.correlation_id = "circuit:" + id;
  e.payload["from"] = acp::ToString(from);
  e.payload["to"] = acp::ToString(to);
  e.payload["reason"] = reason;
  (void)bus->Publish(e);
}

// ---------------------------------------------------------------------------

int main(int argc, char* argv[]) {
  acp::log::Init();
  acp::log::SetLevel(acp::log::Level::kWarn);

  acp::GovernancePolicy policy;
  if (!BuildPolicy(argc, argv, policy)) {
    acp::log::Shutdown();
    return 1;
  }

  acp::EventBus bus(policy.events);
  acp::FeedbackLoopDetector detector(policy.loop);
  acp::BudgetEngine budget(policy.budget);
  policy.arbitrator.chain_check = detector.AsHook();
  policy.circuit.on_state_change = acp::CircuitStateHook{&OnCircuit, &bus};
  acp::TaskArbitrator arbitrator(policy.arbitrator);
  acp::CircuitBreaker breaker(policy.circuit);

  if (!bus.Subscribe("*", &PrintEvent)) {
    ACP_LOG_ERROR("demo", "event listener rejected");
    return 1;
  }

  for (const char* agent : {"planner", "coder"}) {
    auto r = acp::ApplyDefaultLimits(policy, budget, agent);
    if (!r) {
      ACP_LOG_ERROR("demo", "allocation failed for %s: %s", agent,
                    acp::ToString(r.get_error()));
      return 1;
    }
  }

  // =====================================================================
  // Part 1: admitted task, funded model call
  // =====================================================================

  std::printf("\n--- Task lifecycle ---\n");
  acp::TaskSubmission sub;
  sub.actor_id = "planner";
  sub.description = "draft release plan";
  sub.context["repo"] = "acp";
  sub.correlation_id = "release-42";

  auto admitted = arbitrator.Submit(sub);
  std::printf("  submit: %s\n", acp::ToString(admitted.outcome));
  auto dup = arbitrator.Submit(sub);
  std::printf("  resubmit: %s (%s)\n", acp::ToString(dup.outcome), dup.reason.c_str());

  const std::string task_id = admitted.record->task_id;
  const double estimate = acp::BudgetEngine::TokenCost("gpt-4", 2000, 1000);
  if (budget.Reserve("planner", acp::BudgetDimension::kCost, estimate, task_id)) {
    (void)arbitrator.Start(task_id);
    const double actual = acp::BudgetEngine::TokenCost("gpt-4", 1800, 700);
    (void)budget.Commit(task_id, actual);
    (void)budget.RecordUsage("planner", acp::BudgetDimension::kApiCalls, 1.0);
    (void)arbitrator.Complete(task_id, "plan ready", "", actual);

    acp::Event done;
    done.event_type = "task.completed";
    done.source = "planner";
    done.correlation_id = sub.correlation_id;
    done.payload["task"] = task_id;
    (void)bus.Publish(done);
  }
  std::printf("  planner cost remaining: %.4f\n",
              budget.GetRemaining("planner", acp::BudgetDimension::kCost).value_or(0.0));

  // =====================================================================
  // Part 2: agents bouncing work around one correlation
  // =====================================================================

  std::printf("\n--- Causality chain ---\n");
  const char* hops[][2] = {{"coder", "implement plan"},
                           {"planner", "review implementation"},
                           {"coder", "draft release plan"}};
  for (const auto& hop : hops) {
    acp::TaskSubmission t;
    t.actor_id = hop[0];
    t.description = hop[1];
    t.context["repo"] = "acp";
    t.correlation_id = "release-42";
    auto r = arbitrator.Submit(t);
    std::printf("  %-8s %-24s -> %s %s\n", hop[0], hop[1], acp::ToString(r.outcome),
                r.reason.c_str());
  }

  // =====================================================================
  // Part 3: a flaky tool
  // =====================================================================

  std::printf("\n--- Circuit breaker ---\n");
  for (int call = 0; call < 5; ++call) {
    if (!breaker.CanProceed("tool:web_search")) {
      std::printf("  call %d blocked (%s)\n", call,
                  acp::ToString(breaker.GetState("tool:web_search")));
      continue;
    }
    breaker.RecordFailure("tool:web_search");
    std::printf("  call %d failed\n", call);
  }

  // =====================================================================
  // Statistics
  // =====================================================================

  auto as = arbitrator.GetStats();
  auto bs = budget.GetStats();
  auto cs = breaker.GetStats();
  auto es = bus.GetStats();
  std::printf("\n--- Statistics ---\n"
              "  tasks     : submitted=%lu accepted=%lu dedup=%lu loops=%lu\n"
              "  budget    : reserves=%lu commits=%lu soft_warnings=%lu\n"
              "  circuits  : %u (open=%u) trips=%lu blocked=%lu\n"
              "  events    : published=%lu delivered=%lu dropped=%lu\n",
              static_cast<unsigned long>(as.submitted),
              static_cast<unsigned long>(as.accepted),
              static_cast<unsigned long>(as.deduplicated),
              static_cast<unsigned long>(as.loop_rejected),
              static_cast<unsigned long>(bs.reserves_granted),
              static_cast<unsigned long>(bs.commits),
              static_cast<unsigned long>(bs.soft_limit_warnings),
              cs.circuits, cs.open,
              static_cast<unsigned long>(cs.trips),
              static_cast<unsigned long>(cs.blocked),
              static_cast<unsigned long>(es.published),
              static_cast<unsigned long>(es.deliveries),
              static_cast<unsigned long>(es.dropped));

  acp::log::Shutdown();
  return 0;
}
