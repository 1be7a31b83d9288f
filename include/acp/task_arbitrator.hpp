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
 * @file task_arbitrator.hpp
 * @brief Admission control for agent task submissions.
 *
 * Submit() runs, in order and short-circuiting on the first failure:
 *   1. fingerprint  : description + sorted context
 *   2. dedup        : same fingerprint + actor, still pending/running, within
 *                     dedup_window_ms -> not accepted, existing record returned
 *   3. capacity     : active tasks of the actor >= max_tasks_per_actor
 *   4. loop         : active tasks sharing the correlation id >= loop_threshold,
 *                     then the optional causality-chain hook
 *   5. admit        : TaskRecord created in kPending and indexed by id,
 *                     fingerprint and actor
 *
 * Records move pending -> running -> completed|failed through Start() and
 * Complete(). Terminal records stay until CleanupOldRecords() sweeps them.
 *
 * Thread-safe: every operation runs under the instance mutex. No operation
 * blocks on anything but that mutex; rejected callers retry on their own.
 */

#ifndef ACP_TASK_ARBITRATOR_HPP_
#define ACP_TASK_ARBITRATOR_HPP_

#include "acp/correlation.hpp"
#include "acp/feedback_loop_detector.hpp"
#include "acp/fingerprint.hpp"
#include "acp/log.hpp"
#include "acp/platform.hpp"
#include "acp/vocabulary.hpp"

#include <algorithm>
#include <cmath>
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

enum class TaskStatus : uint8_t {
  kPending = 0,
  kRunning,
  kCompleted,
  kFailed,
};

inline const char* ToString(TaskStatus s) noexcept {
  switch (s) {
    case TaskStatus::kPending:   return "pending";
    case TaskStatus::kRunning:   return "running";
    case TaskStatus::kCompleted: return "completed";
    case TaskStatus::kFailed:    return "failed";
  }
  return "unknown";
}

/// Pending or running: counts against capacity, dedup and loop checks.
inline bool IsActive(TaskStatus s) noexcept {
  return s == TaskStatus::kPending || s == TaskStatus::kRunning;
}

enum class SubmitOutcome : uint8_t {
  kAccepted = 0,
  kDuplicate,
  kCapacityExceeded,
  kLoopDetected,
  kInvalid,
};

inline const char* ToString(SubmitOutcome o) noexcept {
  switch (o) {
    case SubmitOutcome::kAccepted:         return "accepted";
    case SubmitOutcome::kDuplicate:        return "duplicate";
    case SubmitOutcome::kCapacityExceeded: return "capacity_exceeded";
    case SubmitOutcome::kLoopDetected:     return "loop_detected";
    case SubmitOutcome::kInvalid:          return "invalid";
  }
  return "unknown";
}

enum class ArbiterError : uint8_t {
  kNotFound = 0,
  kInvalidTransition,
};

// ============================================================================
// Data structures
// ============================================================================

/// Task submission. Task content is opaque beyond description + context.
struct TaskSubmission {
  std::string task_id;          ///< Caller-chosen id; generated when empty
  std::string description;
  ContextMap context;
  std::string actor_id;
  Priority priority = Priority::kNormal;
  std::string correlation_id;   ///< Defaults to CorrelationContext
  uint64_t submitted_at_us = 0; ///< 0 = arbitrator clock at Submit()
  double budget_reserved = 0.0; ///< Hint only, not enforced here
  uint32_t timeout_ms = 0;      ///< 0 = no timeout
};

struct TaskRecord {
  std::string task_id;
  std::string fingerprint;
  std::string actor_id;
  std::string correlation_id;
  TaskStatus status = TaskStatus::kPending;
  Priority priority = Priority::kNormal;
  uint64_t submitted_at_us = 0;
  uint64_t started_at_us = 0;    ///< 0 = never started
  uint64_t completed_at_us = 0;  ///< 0 = not terminal
  std::string result;
  std::string error;
  double budget_used = 0.0;
  uint32_t timeout_ms = 0;
};

struct SubmitResult {
  bool accepted = false;
  SubmitOutcome outcome = SubmitOutcome::kInvalid;
  std::optional<TaskRecord> record;  ///< New record, or the duplicate's original
  std::string reason;                ///< Empty when accepted
};

struct ArbitratorConfig {
  uint64_t dedup_window_ms = 5ULL * 60ULL * 1000ULL;
  uint32_t max_tasks_per_actor = 100;
  bool loop_detection_enabled = true;
  uint32_t loop_threshold = 10;  ///< Active tasks per correlation id
  uint64_t max_clock_skew_ms = 5000;  ///< Tolerated future submission time
  LoopCheckHook chain_check;     ///< Optional causality-chain detector
  ClockSource clock;
};

struct ArbitratorStats {
  uint64_t submitted;
  uint64_t accepted;
  uint64_t deduplicated;
  uint64_t capacity_rejected;
  uint64_t loop_rejected;
  uint64_t invalid_rejected;
  uint64_t completed;
  uint64_t failed;
  uint32_t active;
  uint32_t records;
};

// ============================================================================
// TaskArbitrator
// ============================================================================

class TaskArbitrator final {
 public:
  explicit TaskArbitrator(const ArbitratorConfig& config = ArbitratorConfig{})
      : config_(config) {
    ACP_ASSERT(config_.max_tasks_per_actor > 0U);
    ACP_ASSERT(config_.loop_threshold > 0U);
    ACP_LOG_INFO("Arbiter",
                 "task arbitrator initialized (dedup_window=%llums, "
                 "max_tasks_per_actor=%u, loop_detection=%s)",
                 static_cast<unsigned long long>(config_.dedup_window_ms),
                 config_.max_tasks_per_actor,
                 config_.loop_detection_enabled ? "on" : "off");
  }

  TaskArbitrator(const TaskArbitrator&) = delete;
  TaskArbitrator& operator=(const TaskArbitrator&) = delete;

  /**
   * @brief Decide whether a submission may run, and register it if so.
   *
   * A duplicate is not an error: accepted=false, outcome kDuplicate, and the
   * record of the original submission.
   */
  SubmitResult Submit(const TaskSubmission& sub) {
    const std::string correlation_id = sub.correlation_id.empty()
                                           ? CorrelationContext::GetOrGenerate()
                                           : sub.correlation_id;
    const std::string fingerprint = Fingerprint(sub.description, sub.context);
    const uint64_t now = config_.clock.NowUs();
    const uint64_t submitted_at = (sub.submitted_at_us != 0U) ? sub.submitted_at_us : now;

    std::lock_guard<std::mutex> lock(mutex_);
    ++stats_.submitted;

    // 0. Preconditions
    const char* invalid = Validate(sub, submitted_at, now);
    if (invalid != nullptr) {
      ++stats_.invalid_rejected;
      ACP_LOG_ERROR("Arbiter", "invalid submission from '%s': %s",
                    sub.actor_id.c_str(), invalid);
      return Reject(SubmitOutcome::kInvalid,
                    std::string("invalid submission: ") + invalid);
    }

    // 1. Dedup
    const TaskRecord* dup = FindDuplicateLocked(fingerprint, sub.actor_id, submitted_at);
    if (dup != nullptr) {
      ++stats_.deduplicated;
      ACP_LOG_INFO("Arbiter", "task deduplicated (duplicate of %s, actor=%s)",
                   dup->task_id.c_str(), sub.actor_id.c_str());
      SubmitResult r;
      r.accepted = false;
      r.outcome = SubmitOutcome::kDuplicate;
      r.record = *dup;
      r.reason = "duplicate of " + dup->task_id;
      return r;
    }

    // 2. Capacity
    if (ActiveCountLocked(sub.actor_id) >= config_.max_tasks_per_actor) {
      ++stats_.capacity_rejected;
      ACP_LOG_WARN("Arbiter", "actor %s exceeded task limit (%u)",
                   sub.actor_id.c_str(), config_.max_tasks_per_actor);
      return Reject(SubmitOutcome::kCapacityExceeded,
                    "actor task limit exceeded (" +
                        std::to_string(config_.max_tasks_per_actor) + ")");
    }

    // 3. Loop
    if (config_.loop_detection_enabled) {
      auto cit = correlation_active_.find(correlation_id);
      const uint32_t same_corr = (cit != correlation_active_.end()) ? cit->second : 0U;
      if (same_corr >= config_.loop_threshold) {
        ++stats_.loop_rejected;
        ACP_LOG_ERROR("Arbiter", "feedback loop detected for correlation %s "
                      "(%u active tasks)", correlation_id.c_str(), same_corr);
        return Reject(SubmitOutcome::kLoopDetected,
                      "feedback loop detected (correlation: " + correlation_id + ")");
      }
      if (config_.chain_check.IsWired()) {
        LoopCheckResult chain =
            config_.chain_check.fn(correlation_id, fingerprint, config_.chain_check.ctx);
        if (chain.loop_detected) {
          ++stats_.loop_rejected;
          ACP_LOG_ERROR("Arbiter", "causality chain rejected correlation %s: %s",
                        correlation_id.c_str(), chain.reason.c_str());
          return Reject(SubmitOutcome::kLoopDetected,
                        "feedback loop detected (correlation: " + correlation_id +
                            "): " + chain.reason);
        }
      }
    }

    // 4. Admit
    TaskRecord rec;
    rec.task_id = sub.task_id.empty() ? GenerateId("task_") : sub.task_id;
    rec.fingerprint = fingerprint;
    rec.actor_id = sub.actor_id;
    rec.correlation_id = correlation_id;
    rec.status = TaskStatus::kPending;
    rec.priority = sub.priority;
    rec.submitted_at_us = submitted_at;
    rec.timeout_ms = sub.timeout_ms;

    by_fingerprint_[fingerprint].push_back(rec.task_id);
    actor_active_[rec.actor_id].push_back(rec.task_id);
    ++correlation_active_[correlation_id];
    auto ins = records_.emplace(rec.task_id, std::move(rec));
    ++stats_.accepted;

    const TaskRecord& stored = ins.first->second;
    ACP_LOG_INFO("Arbiter", "task accepted: %s (actor=%s, priority=%s)",
                 stored.task_id.c_str(), stored.actor_id.c_str(),
                 ToString(stored.priority));

    SubmitResult r;
    r.accepted = true;
    r.outcome = SubmitOutcome::kAccepted;
    r.record = stored;
    return r;
  }

  /// pending -> running.
  expected<void, ArbiterError> Start(const std::string& task_id) {
    const uint64_t now = config_.clock.NowUs();
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = records_.find(task_id);
    if (it == records_.end()) {
      ACP_LOG_ERROR("Arbiter", "start: task not found: %s", task_id.c_str());
      return expected<void, ArbiterError>::error(ArbiterError::kNotFound);
    }
    TaskRecord& rec = it->second;
    if (rec.status != TaskStatus::kPending) {
      ACP_LOG_ERROR("Arbiter", "start: task %s is %s, not pending",
                    task_id.c_str(), ToString(rec.status));
      return expected<void, ArbiterError>::error(ArbiterError::kInvalidTransition);
    }
    rec.status = TaskStatus::kRunning;
    rec.started_at_us = now;
    ACP_LOG_INFO("Arbiter", "task started: %s", task_id.c_str());
    return expected<void, ArbiterError>::success();
  }

  /**
   * @brief running (or pending) -> completed, or -> failed when `error` is
   *        non-empty. Frees the actor's capacity slot.
   */
  expected<void, ArbiterError> Complete(const std::string& task_id,
                                        const std::string& result = std::string(),
                                        const std::string& error = std::string(),
                                        double budget_used = 0.0) {
    const uint64_t now = config_.clock.NowUs();
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = records_.find(task_id);
    if (it == records_.end()) {
      ACP_LOG_ERROR("Arbiter", "complete: task not found: %s", task_id.c_str());
      return expected<void, ArbiterError>::error(ArbiterError::kNotFound);
    }
    TaskRecord& rec = it->second;
    if (!IsActive(rec.status)) {
      ACP_LOG_ERROR("Arbiter", "complete: task %s already %s",
                    task_id.c_str(), ToString(rec.status));
      return expected<void, ArbiterError>::error(ArbiterError::kInvalidTransition);
    }

    const bool failed = !error.empty();
    rec.status = failed ? TaskStatus::kFailed : TaskStatus::kCompleted;
    rec.completed_at_us = now;
    rec.result = result;
    rec.error = error;
    rec.budget_used = budget_used;
    ReleaseActiveLocked(rec);
    // A failed task leaves the causality chain so a retry is not a cycle.
    if (failed && config_.chain_check.release != nullptr) {
      (void)config_.chain_check.release(rec.correlation_id, rec.fingerprint,
                                        config_.chain_check.ctx);
    }

    if (failed) {
      ++stats_.failed;
    } else {
      ++stats_.completed;
    }
    const uint64_t duration_us =
        (rec.started_at_us != 0U && now >= rec.started_at_us) ? now - rec.started_at_us : 0U;
    ACP_LOG_INFO("Arbiter", "task %s: %s (duration=%llums, budget=%.4f)",
                 failed ? "failed" : "completed", task_id.c_str(),
                 static_cast<unsigned long long>(duration_us / kUsPerMs), budget_used);
    return expected<void, ArbiterError>::success();
  }

  std::optional<TaskRecord> GetRecord(const std::string& task_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(task_id);
    if (it == records_.end()) return std::nullopt;
    return it->second;
  }

  /// Active (pending/running) records of an actor, in submission order.
  std::vector<TaskRecord> GetActorTasks(const std::string& actor_id) const {
    std::vector<TaskRecord> out;
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = actor_active_.find(actor_id);
    if (it == actor_active_.end()) return out;
    out.reserve(it->second.size());
    for (const auto& id : it->second) {
      auto rit = records_.find(id);
      if (rit != records_.end()) out.push_back(rit->second);
    }
    return out;
  }

  uint32_t ActiveCount(const std::string& actor_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ActiveCountLocked(actor_id);
  }

  /**
   * @brief Remove completed/failed records whose completion is older than
   *        `max_age_ms` from all indices.
   * @return Number of records removed.
   */
  uint32_t CleanupOldRecords(uint64_t max_age_ms) {
    const uint64_t now = config_.clock.NowUs();
    const uint64_t max_age_us = MsToUs(max_age_ms);
    uint32_t removed = 0U;

    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = records_.begin(); it != records_.end();) {
      const TaskRecord& rec = it->second;
      const bool terminal =
          rec.status == TaskStatus::kCompleted || rec.status == TaskStatus::kFailed;
      if (terminal && rec.completed_at_us != 0U && now >= rec.completed_at_us &&
          now - rec.completed_at_us > max_age_us) {
        EraseFromFingerprintLocked(rec.fingerprint, rec.task_id);
        it = records_.erase(it);
        ++removed;
      } else {
        ++it;
      }
    }
    if (removed > 0U) {
      ACP_LOG_INFO("Arbiter", "cleaned up %u old task records", removed);
    }
    return removed;
  }

  ArbitratorStats GetStats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    ArbitratorStats s = stats_;
    uint32_t active = 0U;
    for (const auto& kv : actor_active_) {
      active += static_cast<uint32_t>(kv.second.size());
    }
    s.active = active;
    s.records = static_cast<uint32_t>(records_.size());
    return s;
  }

  const ArbitratorConfig& config() const noexcept { return config_; }

 private:
  SubmitResult Reject(SubmitOutcome outcome, std::string reason) const {
    SubmitResult r;
    r.accepted = false;
    r.outcome = outcome;
    r.reason = std::move(reason);
    return r;
  }

  /// Returns nullptr when valid, otherwise a static description.
  const char* Validate(const TaskSubmission& sub, uint64_t submitted_at,
                       uint64_t now) const {
    if (sub.actor_id.empty()) return "empty actor id";
    if (std::isnan(sub.budget_reserved) || sub.budget_reserved < 0.0) {
      return "negative budget hint";
    }
    if (submitted_at > now + MsToUs(config_.max_clock_skew_ms)) {
      return "submission timestamp in the future";
    }
    if (!sub.task_id.empty() && records_.count(sub.task_id) != 0U) {
      return "task id already registered";
    }
    return nullptr;
  }

  const TaskRecord* FindDuplicateLocked(const std::string& fingerprint,
                                        const std::string& actor_id,
                                        uint64_t submitted_at) const {
    auto it = by_fingerprint_.find(fingerprint);
    if (it == by_fingerprint_.end()) return nullptr;
    const uint64_t window_us = MsToUs(config_.dedup_window_ms);
    for (const auto& id : it->second) {
      auto rit = records_.find(id);
      if (rit == records_.end()) continue;
      const TaskRecord& rec = rit->second;
      const bool in_window = submitted_at < rec.submitted_at_us ||
                             submitted_at - rec.submitted_at_us <= window_us;
      if (rec.actor_id == actor_id && in_window && IsActive(rec.status)) {
        return &rec;
      }
    }
    return nullptr;
  }

  uint32_t ActiveCountLocked(const std::string& actor_id) const {
    auto it = actor_active_.find(actor_id);
    return (it != actor_active_.end()) ? static_cast<uint32_t>(it->second.size()) : 0U;
  }

  void ReleaseActiveLocked(const TaskRecord& rec) {
    auto ait = actor_active_.find(rec.actor_id);
    if (ait != actor_active_.end()) {
      auto& ids = ait->second;
      ids.erase(std::remove(ids.begin(), ids.end(), rec.task_id), ids.end());
      if (ids.empty()) actor_active_.erase(ait);
    }
    auto cit = correlation_active_.find(rec.correlation_id);
    if (cit != correlation_active_.end()) {
      if (cit->second <= 1U) {
        correlation_active_.erase(cit);
      } else {
        --cit->second;
      }
    }
  }

  void EraseFromFingerprintLocked(const std::string& fingerprint,
                                  const std::string& task_id) {
    auto it = by_fingerprint_.find(fingerprint);
    if (it == by_fingerprint_.end()) return;
    auto& ids = it->second;
    ids.erase(std::remove(ids.begin(), ids.end(), task_id), ids.end());
    if (ids.empty()) by_fingerprint_.erase(it);
  }

  ArbitratorConfig config_;
  mutable std::mutex mutex_;
  std::unordered_map<std::string, TaskRecord> records_;
  std::unordered_map<std::string, std::vector<std::string>> by_fingerprint_;
  std::unordered_map<std::string, std::vector<std::string>> actor_active_;
  std::unordered_map<std::string, uint32_t> correlation_active_;
  ArbitratorStats stats_{};
};

}  // namespace acp

#endif  // ACP_TASK_ARBITRATOR_HPP_
