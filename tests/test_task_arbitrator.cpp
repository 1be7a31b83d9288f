/**
 * @file test_task_arbitrator.cpp
 * @brief Tests for task_arbitrator.hpp
 */

#include "acp/feedback_loop_detector.hpp"
#include "acp/task_arbitrator.hpp"

#include "test_clock.hpp"

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <string>
#include <thread>
#include <vector>

namespace {

acp::TaskSubmission MakeTask(const std::string& desc, const std::string& actor,
                             const std::string& corr = "corr_test") {
  acp::TaskSubmission s;
  s.description = desc;
  s.actor_id = actor;
  s.correlation_id = corr;
  return s;
}

acp::ArbitratorConfig ConfigWith(acp_test::ManualClock& clock) {
  acp::ArbitratorConfig cfg;
  cfg.clock = clock.Source();
  return cfg;
}

}  // namespace

// ============================================================================
// Admission and dedup
// ============================================================================

TEST_CASE("Submit admits a new task in pending", "[arbitrator]") {
  acp_test::ManualClock clock;
  acp::TaskArbitrator arb(ConfigWith(clock));

  auto r = arb.Submit(MakeTask("fetch prices", "agent-1"));
  REQUIRE(r.accepted);
  REQUIRE(r.outcome == acp::SubmitOutcome::kAccepted);
  REQUIRE(r.reason.empty());
  REQUIRE(r.record.has_value());
  REQUIRE(r.record->status == acp::TaskStatus::kPending);
  REQUIRE(r.record->task_id.compare(0, 5, "task_") == 0);
  REQUIRE(r.record->fingerprint == acp::Fingerprint("fetch prices", {}));
  REQUIRE(r.record->submitted_at_us == clock.NowUs());
  REQUIRE(arb.ActiveCount("agent-1") == 1U);
}

TEST_CASE("Duplicate submission returns the original record", "[arbitrator]") {
  acp_test::ManualClock clock;
  acp::TaskArbitrator arb(ConfigWith(clock));

  acp::TaskSubmission a = MakeTask("analyze", "agent-1");
  a.context["b"] = "2";
  a.context["a"] = "1";
  acp::TaskSubmission b = MakeTask("analyze", "agent-1");
  b.context["a"] = "1";
  b.context["b"] = "2";

  auto first = arb.Submit(a);
  REQUIRE(first.accepted);
  auto second = arb.Submit(b);
  REQUIRE(!second.accepted);
  REQUIRE(second.outcome == acp::SubmitOutcome::kDuplicate);
  REQUIRE(second.record.has_value());
  REQUIRE(second.record->task_id == first.record->task_id);
  REQUIRE(second.reason == "duplicate of " + first.record->task_id);

  auto stats = arb.GetStats();
  REQUIRE(stats.records == 1U);
  REQUIRE(stats.deduplicated == 1U);
}

TEST_CASE("Same content from another actor is not a duplicate", "[arbitrator]") {
  acp_test::ManualClock clock;
  acp::TaskArbitrator arb(ConfigWith(clock));
  REQUIRE(arb.Submit(MakeTask("analyze", "agent-1")).accepted);
  REQUIRE(arb.Submit(MakeTask("analyze", "agent-2")).accepted);
}

TEST_CASE("Dedup window expiry admits a resubmission", "[arbitrator]") {
  acp_test::ManualClock clock;
  acp::ArbitratorConfig cfg = ConfigWith(clock);
  cfg.dedup_window_ms = 1000;
  acp::TaskArbitrator arb(cfg);

  REQUIRE(arb.Submit(MakeTask("poll", "agent-1")).accepted);
  clock.AdvanceMs(500);
  REQUIRE(!arb.Submit(MakeTask("poll", "agent-1")).accepted);
  clock.AdvanceMs(600);
  REQUIRE(arb.Submit(MakeTask("poll", "agent-1")).accepted);
}

TEST_CASE("Completed task no longer deduplicates", "[arbitrator]") {
  acp_test::ManualClock clock;
  acp::TaskArbitrator arb(ConfigWith(clock));

  auto first = arb.Submit(MakeTask("poll", "agent-1"));
  REQUIRE(arb.Complete(first.record->task_id, "ok").has_value());
  REQUIRE(arb.Submit(MakeTask("poll", "agent-1")).accepted);
}

// ============================================================================
// Capacity
// ============================================================================

TEST_CASE("Per-actor capacity is a hard cap", "[arbitrator]") {
  acp_test::ManualClock clock;
  acp::ArbitratorConfig cfg = ConfigWith(clock);
  cfg.max_tasks_per_actor = 3;
  acp::TaskArbitrator arb(cfg);

  std::vector<std::string> ids;
  for (int i = 0; i < 3; ++i) {
    auto r = arb.Submit(MakeTask("job " + std::to_string(i), "agent-1",
                                 "corr_" + std::to_string(i)));
    REQUIRE(r.accepted);
    ids.push_back(r.record->task_id);
  }

  auto over = arb.Submit(MakeTask("job 3", "agent-1", "corr_3"));
  REQUIRE(!over.accepted);
  REQUIRE(over.outcome == acp::SubmitOutcome::kCapacityExceeded);
  REQUIRE(over.reason == "actor task limit exceeded (3)");
  REQUIRE(!over.record.has_value());

  // Another actor is unaffected.
  REQUIRE(arb.Submit(MakeTask("job 3", "agent-2", "corr_3")).accepted);

  // Freeing a slot admits the next one.
  REQUIRE(arb.Complete(ids[0], "", "boom").has_value());
  REQUIRE(arb.Submit(MakeTask("job 3", "agent-1", "corr_3")).accepted);
  REQUIRE(arb.ActiveCount("agent-1") == 3U);
}

// ============================================================================
// Loop detection
// ============================================================================

TEST_CASE("Correlation count heuristic rejects at threshold", "[arbitrator]") {
  acp_test::ManualClock clock;
  acp::ArbitratorConfig cfg = ConfigWith(clock);
  cfg.loop_threshold = 4;
  acp::TaskArbitrator arb(cfg);

  for (int i = 0; i < 4; ++i) {
    REQUIRE(arb.Submit(MakeTask("step " + std::to_string(i), "agent-1", "corr_loop"))
                .accepted);
  }
  auto r = arb.Submit(MakeTask("step 4", "agent-1", "corr_loop"));
  REQUIRE(!r.accepted);
  REQUIRE(r.outcome == acp::SubmitOutcome::kLoopDetected);
  REQUIRE(r.reason == "feedback loop detected (correlation: corr_loop)");

  // Other correlations are not affected.
  REQUIRE(arb.Submit(MakeTask("step 4", "agent-1", "corr_other")).accepted);
}

TEST_CASE("Loop detection can be disabled", "[arbitrator]") {
  acp_test::ManualClock clock;
  acp::ArbitratorConfig cfg = ConfigWith(clock);
  cfg.loop_threshold = 2;
  cfg.loop_detection_enabled = false;
  acp::TaskArbitrator arb(cfg);

  for (int i = 0; i < 5; ++i) {
    REQUIRE(arb.Submit(MakeTask("step " + std::to_string(i), "agent-1", "corr_x"))
                .accepted);
  }
}

TEST_CASE("Causality chain hook rejects a repeated task", "[arbitrator]") {
  acp_test::ManualClock clock;
  acp::LoopDetectorConfig lcfg;
  lcfg.clock = clock.Source();
  acp::FeedbackLoopDetector detector(lcfg);

  acp::ArbitratorConfig cfg = ConfigWith(clock);
  cfg.chain_check = detector.AsHook();
  acp::TaskArbitrator arb(cfg);

  auto first = arb.Submit(MakeTask("plan", "agent-1", "corr_chain"));
  REQUIRE(first.accepted);
  REQUIRE(arb.Complete(first.record->task_id, "done").has_value());
  REQUIRE(arb.Submit(MakeTask("execute", "agent-1", "corr_chain")).accepted);

  // "plan" again under the same chain closes a cycle.
  auto again = arb.Submit(MakeTask("plan", "agent-1", "corr_chain"));
  REQUIRE(!again.accepted);
  REQUIRE(again.outcome == acp::SubmitOutcome::kLoopDetected);
  REQUIRE(again.reason.find("corr_chain") != std::string::npos);
  REQUIRE(again.reason.find("creates cycle") != std::string::npos);
  REQUIRE(detector.GetChain("corr_chain").size() == 2U);
}

TEST_CASE("Retry after failure is admitted under the same chain", "[arbitrator]") {
  acp_test::ManualClock clock;
  acp::LoopDetectorConfig lcfg;
  lcfg.clock = clock.Source();
  acp::FeedbackLoopDetector detector(lcfg);

  acp::ArbitratorConfig cfg = ConfigWith(clock);
  cfg.chain_check = detector.AsHook();
  acp::TaskArbitrator arb(cfg);

  auto first = arb.Submit(MakeTask("fetch feed", "agent-1", "corr_retry"));
  REQUIRE(first.accepted);
  REQUIRE(arb.Start(first.record->task_id).has_value());
  REQUIRE(arb.Complete(first.record->task_id, "", "timeout").has_value());
  REQUIRE(detector.GetChain("corr_retry").empty());

  auto retry = arb.Submit(MakeTask("fetch feed", "agent-1", "corr_retry"));
  REQUIRE(retry.accepted);
  REQUIRE(retry.record->task_id != first.record->task_id);
  REQUIRE(detector.GetChain("corr_retry").size() == 1U);

  // A successful run stays in the chain.
  REQUIRE(arb.Complete(retry.record->task_id, "ok").has_value());
  auto again = arb.Submit(MakeTask("fetch feed", "agent-1", "corr_retry"));
  REQUIRE(again.outcome == acp::SubmitOutcome::kLoopDetected);
}

// ============================================================================
// Validation
// ============================================================================

TEST_CASE("Malformed submissions are rejected", "[arbitrator]") {
  acp_test::ManualClock clock;
  acp::TaskArbitrator arb(ConfigWith(clock));

  SECTION("empty actor") {
    auto r = arb.Submit(MakeTask("x", ""));
    REQUIRE(r.outcome == acp::SubmitOutcome::kInvalid);
  }
  SECTION("negative budget hint") {
    auto s = MakeTask("x", "agent-1");
    s.budget_reserved = -1.0;
    REQUIRE(arb.Submit(s).outcome == acp::SubmitOutcome::kInvalid);
  }
  SECTION("timestamp beyond clock skew") {
    auto s = MakeTask("x", "agent-1");
    s.submitted_at_us = clock.NowUs() + acp::MsToUs(60000);
    REQUIRE(arb.Submit(s).outcome == acp::SubmitOutcome::kInvalid);
  }
  SECTION("task id reuse") {
    auto s = MakeTask("x", "agent-1");
    s.task_id = "fixed-id";
    REQUIRE(arb.Submit(s).accepted);
    auto t = MakeTask("y", "agent-1");
    t.task_id = "fixed-id";
    auto r = arb.Submit(t);
    REQUIRE(r.outcome == acp::SubmitOutcome::kInvalid);
  }
  REQUIRE(arb.GetStats().accepted <= 1U);
}

TEST_CASE("Empty correlation id defaults from context", "[arbitrator]") {
  acp_test::ManualClock clock;
  acp::TaskArbitrator arb(ConfigWith(clock));
  acp::CorrelationScope scope("corr_from_scope");
  auto r = arb.Submit(MakeTask("x", "agent-1", ""));
  REQUIRE(r.accepted);
  REQUIRE(r.record->correlation_id == "corr_from_scope");
}

// ============================================================================
// Lifecycle
// ============================================================================

TEST_CASE("Start and Complete transitions", "[arbitrator]") {
  acp_test::ManualClock clock;
  acp::TaskArbitrator arb(ConfigWith(clock));
  auto r = arb.Submit(MakeTask("work", "agent-1"));
  const std::string id = r.record->task_id;

  REQUIRE(arb.Start(id).has_value());
  REQUIRE(arb.GetRecord(id)->status == acp::TaskStatus::kRunning);
  REQUIRE(arb.Start(id).get_error() == acp::ArbiterError::kInvalidTransition);

  clock.AdvanceMs(250);
  REQUIRE(arb.Complete(id, "42 rows", "", 0.75).has_value());
  auto rec = arb.GetRecord(id);
  REQUIRE(rec->status == acp::TaskStatus::kCompleted);
  REQUIRE(rec->result == "42 rows");
  REQUIRE(rec->budget_used == 0.75);
  REQUIRE(rec->completed_at_us - rec->started_at_us == acp::MsToUs(250));
  REQUIRE(arb.ActiveCount("agent-1") == 0U);

  REQUIRE(arb.Complete(id).get_error() == acp::ArbiterError::kInvalidTransition);
}

TEST_CASE("Complete with error marks failed", "[arbitrator]") {
  acp_test::ManualClock clock;
  acp::TaskArbitrator arb(ConfigWith(clock));
  auto r = arb.Submit(MakeTask("work", "agent-1"));
  REQUIRE(arb.Start(r.record->task_id).has_value());
  REQUIRE(arb.Complete(r.record->task_id, "", "timeout").has_value());
  auto rec = arb.GetRecord(r.record->task_id);
  REQUIRE(rec->status == acp::TaskStatus::kFailed);
  REQUIRE(rec->error == "timeout");
  REQUIRE(arb.GetStats().failed == 1U);
}

TEST_CASE("Rejected and duplicate submissions create no record", "[arbitrator]") {
  acp_test::ManualClock clock;
  acp::ArbitratorConfig cfg = ConfigWith(clock);
  cfg.max_tasks_per_actor = 1;
  acp::TaskArbitrator arb(cfg);

  auto first = arb.Submit(MakeTask("work", "agent-1"));
  REQUIRE(first.accepted);
  auto dup = arb.Submit(MakeTask("work", "agent-1"));
  REQUIRE(dup.record->task_id == first.record->task_id);
  auto full = arb.Submit(MakeTask("other work", "agent-1"));
  REQUIRE(!full.accepted);
  REQUIRE(!full.record.has_value());

  auto tasks = arb.GetActorTasks("agent-1");
  REQUIRE(tasks.size() == 1U);
  REQUIRE(std::string(acp::ToString(tasks[0].status)) == "pending");
}

TEST_CASE("Unknown task ids report not found", "[arbitrator]") {
  acp::TaskArbitrator arb;
  REQUIRE(arb.Start("nope").get_error() == acp::ArbiterError::kNotFound);
  REQUIRE(arb.Complete("nope").get_error() == acp::ArbiterError::kNotFound);
  REQUIRE(!arb.GetRecord("nope").has_value());
}

TEST_CASE("GetActorTasks lists active records in order", "[arbitrator]") {
  acp_test::ManualClock clock;
  acp::TaskArbitrator arb(ConfigWith(clock));
  auto a = arb.Submit(MakeTask("a", "agent-1", "c1"));
  auto b = arb.Submit(MakeTask("b", "agent-1", "c2"));
  auto c = arb.Submit(MakeTask("c", "agent-1", "c3"));
  REQUIRE(arb.Complete(b.record->task_id).has_value());

  auto tasks = arb.GetActorTasks("agent-1");
  REQUIRE(tasks.size() == 2U);
  REQUIRE(tasks[0].task_id == a.record->task_id);
  REQUIRE(tasks[1].task_id == c.record->task_id);
  REQUIRE(arb.GetActorTasks("nobody").empty());
}

TEST_CASE("CleanupOldRecords removes only old terminal records", "[arbitrator]") {
  acp_test::ManualClock clock;
  acp::TaskArbitrator arb(ConfigWith(clock));
  auto done = arb.Submit(MakeTask("done", "agent-1", "c1"));
  auto live = arb.Submit(MakeTask("live", "agent-1", "c2"));
  REQUIRE(arb.Complete(done.record->task_id).has_value());

  clock.AdvanceMs(1000);
  REQUIRE(arb.CleanupOldRecords(5000) == 0U);
  clock.AdvanceMs(5000);
  REQUIRE(arb.CleanupOldRecords(5000) == 1U);

  REQUIRE(!arb.GetRecord(done.record->task_id).has_value());
  REQUIRE(arb.GetRecord(live.record->task_id).has_value());
  REQUIRE(arb.GetStats().records == 1U);
}

// ============================================================================
// Concurrency
// ============================================================================

TEST_CASE("Concurrent submissions never exceed actor capacity", "[arbitrator][thread]") {
  acp::ArbitratorConfig cfg;
  cfg.max_tasks_per_actor = 10;
  cfg.loop_detection_enabled = false;
  acp::TaskArbitrator arb(cfg);

  std::atomic<uint32_t> accepted{0};
  std::vector<std::thread> threads;
  for (int t = 0; t < 8; ++t) {
    threads.emplace_back([&arb, &accepted, t]() {
      for (int i = 0; i < 50; ++i) {
        auto r = arb.Submit(MakeTask("t" + std::to_string(t) + "-" + std::to_string(i),
                                     "shared-actor", "corr_" + std::to_string(t)));
        if (r.accepted) accepted.fetch_add(1);
      }
    });
  }
  for (auto& th : threads) th.join();

  REQUIRE(accepted.load() == 10U);
  REQUIRE(arb.ActiveCount("shared-actor") == 10U);
}
