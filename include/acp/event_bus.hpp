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
 * @file event_bus.hpp
 * @brief Event dampener and the publish/subscribe bus it gates.
 *
 * EventDampener::ShouldEmit() runs the dampening pipeline, stopping at the
 * first failing stage:
 *   0. expiry      - timestamp + ttl already past
 *   1. dedup       - same content hash recorded within dedup_window_ms
 *   2. rate limit  - per-type window reached its configured ceiling
 *   3. cascade     - correlation reached cascade_threshold events, or its
 *                    share of the type window exceeds cascade_fanout_ratio
 * Only admitted events are recorded (dedup index, type window, correlation
 * counter). Correlation counters are never pruned, so no correlation ever
 * gets more than cascade_threshold events through.
 *
 * EventBus::Publish() consults the dampener, then delivers to the event
 * type's subscribers and to wildcard ("*") subscribers. Handlers run outside
 * the bus lock; a handler that throws is logged and counted and the
 * remaining handlers still run.
 */

#ifndef ACP_EVENT_BUS_HPP_
#define ACP_EVENT_BUS_HPP_

#include "acp/correlation.hpp"
#include "acp/fingerprint.hpp"
#include "acp/log.hpp"
#include "acp/platform.hpp"
#include "acp/vocabulary.hpp"

#include <algorithm>
#include <cstdint>
#include <cstdio>
#include <exception>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace acp {

/// Subscribe to this type to receive every event.
static constexpr const char* kWildcardEventType = "*";

// ============================================================================
// Event
// ============================================================================

struct Event {
  std::string event_id;          ///< Generated at publish when empty
  std::string event_type;
  std::string correlation_id;    ///< Defaulted at publish when empty
  ContextMap payload;
  std::string source;
  std::optional<std::string> target;
  Priority priority = Priority::kNormal;
  uint64_t timestamp_us = 0;     ///< 0 = stamped at publish
  std::optional<uint64_t> ttl_ms;

  /// Content hash over type, source and sorted payload.
  std::string Hash() const { return EventFingerprint(event_type, source, payload); }
};

/// Per event-type accounting bucket.
struct EventWindow {
  uint64_t window_start_us = 0;
  uint64_t duration_ms = 0;
  uint32_t count = 0;
  std::unordered_set<std::string> hashes;
};

// ============================================================================
// EventDampener
// ============================================================================

struct DampenerConfig {
  uint64_t dedup_window_ms = 30000;
  uint32_t cascade_threshold = 100;
  double cascade_fanout_ratio = 10.0;
  uint64_t rate_window_ms = 60000;
  /// Event type -> max events per rate window. Types not listed are unlimited.
  std::map<std::string, uint32_t> rate_limits;
  ClockSource clock;
};

struct DampenerStats {
  uint32_t unique_hashes;
  uint32_t windows;
  uint32_t correlations;
  std::map<std::string, uint32_t> window_counts;
  uint64_t allowed;
  uint64_t expired;
  uint64_t deduplicated;
  uint64_t rate_limited;
  uint64_t cascade_rejected;
};

class EventDampener final {
 public:
  explicit EventDampener(const DampenerConfig& config = DampenerConfig{})
      : config_(config) {
    ACP_ASSERT(config_.cascade_threshold > 0U);
    ACP_ASSERT(config_.rate_window_ms > 0U);
    ACP_LOG_INFO("Dampener", "event dampener initialized (dedup=%llums, cascade=%u)",
                 static_cast<unsigned long long>(config_.dedup_window_ms),
                 config_.cascade_threshold);
  }

  EventDampener(const EventDampener&) = delete;
  EventDampener& operator=(const EventDampener&) = delete;

  /// Run the dampening pipeline; record the event when it is admitted.
  /// An empty correlation id is counted under the thread's current one.
  Verdict ShouldEmit(const Event& event) {
    const std::string correlation_id = event.correlation_id.empty()
                                           ? CorrelationContext::GetOrGenerate()
                                           : event.correlation_id;
    const uint64_t now = config_.clock.NowUs();
    const std::string hash = event.Hash();
    std::lock_guard<std::mutex> lock(mutex_);

    if (event.ttl_ms.has_value() &&
        event.timestamp_us + MsToUs(*event.ttl_ms) <= now) {
      ++stats_.expired;
      ACP_LOG_INFO("Dampener", "event %s expired", event.event_type.c_str());
      return Verdict::Reject("event expired");
    }

    auto hit = recent_hashes_.find(hash);
    if (hit != recent_hashes_.end() && now >= hit->second &&
        now - hit->second < MsToUs(config_.dedup_window_ms)) {
      ++stats_.deduplicated;
      ACP_LOG_INFO("Dampener", "duplicate event suppressed: %s (%s)",
                   event.event_type.c_str(), hash.c_str());
      return Verdict::Reject("duplicate event within dedup window");
    }

    EventWindow& window = WindowLocked(event.event_type, now);
    auto limit = config_.rate_limits.find(event.event_type);
    if (limit != config_.rate_limits.end() && window.count >= limit->second) {
      ++stats_.rate_limited;
      ACP_LOG_WARN("Dampener", "rate limit exceeded for %s (%u per window)",
                   event.event_type.c_str(), limit->second);
      return Verdict::Reject("rate limit exceeded for " + event.event_type + " (" +
                             std::to_string(limit->second) + " per window)");
    }

    auto cit = correlation_counts_.find(correlation_id);
    const uint32_t corr_count = (cit != correlation_counts_.end()) ? cit->second : 0U;
    if (corr_count >= config_.cascade_threshold) {
      ++stats_.cascade_rejected;
      ACP_LOG_ERROR("Dampener", "cascade detected: %s reached %u events",
                    correlation_id.c_str(), corr_count);
      return Verdict::Reject("cascade detected: correlation " +
                             correlation_id + " reached " +
                             std::to_string(config_.cascade_threshold) + " events");
    }
    if (window.count > 0U) {
      const double base = std::max(1.0, static_cast<double>(window.count) / 10.0);
      const double ratio = static_cast<double>(corr_count) / base;
      if (ratio > config_.cascade_fanout_ratio) {
        ++stats_.cascade_rejected;
        char buf[128];
        (void)std::snprintf(buf, sizeof(buf),
                            "cascade fan-out ratio %.2f exceeds %.2f", ratio,
                            config_.cascade_fanout_ratio);
        ACP_LOG_ERROR("Dampener", "%s (correlation %s)", buf,
                      correlation_id.c_str());
        return Verdict::Reject(buf);
      }
    }

    recent_hashes_[hash] = now;
    ++window.count;
    window.hashes.insert(hash);
    ++correlation_counts_[correlation_id];
    ++stats_.allowed;
    return Verdict::Allow();
  }

  /**
   * @brief Drop dedup entries older than the dedup window and type windows
   *        that have elapsed.
   * @return Number of dedup entries removed.
   */
  uint32_t CleanupOldEvents() {
    const uint64_t now = config_.clock.NowUs();
    const uint64_t dedup_us = MsToUs(config_.dedup_window_ms);
    uint32_t removed = 0U;
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = recent_hashes_.begin(); it != recent_hashes_.end();) {
      if (now >= it->second && now - it->second >= dedup_us) {
        it = recent_hashes_.erase(it);
        ++removed;
      } else {
        ++it;
      }
    }
    for (auto it = windows_.begin(); it != windows_.end();) {
      if (WindowElapsed(it->second, now)) {
        it = windows_.erase(it);
      } else {
        ++it;
      }
    }
    if (removed > 0U) {
      ACP_LOG_DEBUG("Dampener", "pruned %u dedup entries", removed);
    }
    return removed;
  }

  /// Admitted events so far for a correlation.
  uint32_t CorrelationCount(const std::string& correlation_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = correlation_counts_.find(correlation_id);
    return (it != correlation_counts_.end()) ? it->second : 0U;
  }

  DampenerStats GetStats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    DampenerStats s = stats_;
    s.unique_hashes = static_cast<uint32_t>(recent_hashes_.size());
    s.windows = static_cast<uint32_t>(windows_.size());
    s.correlations = static_cast<uint32_t>(correlation_counts_.size());
    s.window_counts.clear();
    for (const auto& kv : windows_) {
      s.window_counts.emplace(kv.first, kv.second.count);
    }
    return s;
  }

  const DampenerConfig& config() const noexcept { return config_; }

 private:
  bool WindowElapsed(const EventWindow& w, uint64_t now) const noexcept {
    return now >= w.window_start_us &&
           now - w.window_start_us >= MsToUs(w.duration_ms);
  }

  /// Window for `type`, created or reset when elapsed. Caller holds mutex_.
  EventWindow& WindowLocked(const std::string& type, uint64_t now) {
    auto ins = windows_.emplace(type, EventWindow{});
    EventWindow& w = ins.first->second;
    if (ins.second || WindowElapsed(w, now)) {
      w.window_start_us = now;
      w.duration_ms = config_.rate_window_ms;
      w.count = 0U;
      w.hashes.clear();
    }
    return w;
  }

  DampenerConfig config_;
  mutable std::mutex mutex_;
  std::unordered_map<std::string, uint64_t> recent_hashes_;
  std::unordered_map<std::string, EventWindow> windows_;
  std::unordered_map<std::string, uint32_t> correlation_counts_;
  DampenerStats stats_{};
};

// ============================================================================
// EventBus
// ============================================================================

enum class BusError : uint8_t {
  kInvalidHandler = 0,
  kNotSubscribed,
};

inline const char* ToString(BusError e) noexcept {
  switch (e) {
    case BusError::kInvalidHandler: return "invalid handler";
    case BusError::kNotSubscribed:  return "not subscribed";
  }
  return "unknown";
}

using EventHandler = std::function<void(const Event&)>;

struct SubscriptionHandle {
  uint64_t id = 0;  ///< 0 = invalid

  bool IsValid() const noexcept { return id != 0U; }
};

struct PublishResult {
  bool accepted = false;
  std::string reason;       ///< Empty when accepted
  uint32_t delivered = 0;   ///< Handlers that returned normally
  uint32_t failed = 0;      ///< Handlers that threw

  explicit operator bool() const noexcept { return accepted; }
};

struct EventBusStats {
  uint64_t published;
  uint64_t accepted;
  uint64_t dropped;
  uint64_t deliveries;
  uint64_t handler_failures;
  uint32_t subscribers;
};

class EventBus final {
 public:
  explicit EventBus(const DampenerConfig& config = DampenerConfig{})
      : dampener_(config) {}

  EventBus(const EventBus&) = delete;
  EventBus& operator=(const EventBus&) = delete;

  /// Register `handler` for `event_type` ("*" for all types).
  expected<SubscriptionHandle, BusError> Subscribe(const std::string& event_type,
                                                   EventHandler handler) {
    if (!handler || event_type.empty()) {
      ACP_LOG_ERROR("EventBus", "subscribe rejected: invalid handler");
      return expected<SubscriptionHandle, BusError>::error(BusError::kInvalidHandler);
    }
    std::lock_guard<std::mutex> lock(mutex_);
    SubscriptionHandle handle{next_id_++};
    subscribers_[event_type].push_back(Subscriber{handle.id, std::move(handler)});
    ACP_LOG_DEBUG("EventBus", "subscribed #%llu to %s",
                  static_cast<unsigned long long>(handle.id), event_type.c_str());
    return expected<SubscriptionHandle, BusError>::success(handle);
  }

  expected<void, BusError> Unsubscribe(SubscriptionHandle handle) {
    EventHandler old_handler;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      for (auto it = subscribers_.begin(); it != subscribers_.end(); ++it) {
        auto& list = it->second;
        auto sit = std::find_if(list.begin(), list.end(), [&](const Subscriber& s) {
          return s.id == handle.id;
        });
        if (sit != list.end()) {
          old_handler = std::move(sit->handler);
          list.erase(sit);
          if (list.empty()) subscribers_.erase(it);
          break;
        }
      }
    }
    // old handler destroyed outside the lock
    if (!old_handler) {
      ACP_LOG_ERROR("EventBus", "unsubscribe: unknown handle #%llu",
                    static_cast<unsigned long long>(handle.id));
      return expected<void, BusError>::error(BusError::kNotSubscribed);
    }
    return expected<void, BusError>::success();
  }

  /**
   * @brief Dampen, then deliver to subscribers.
   *
   * Empty event id, correlation id and timestamp are filled in before the
   * dampener runs.
   */
  PublishResult Publish(Event event) {
    if (event.event_id.empty()) event.event_id = GenerateId("evt_");
    if (event.correlation_id.empty()) {
      event.correlation_id = CorrelationContext::GetOrGenerate();
    }
    if (event.timestamp_us == 0U) event.timestamp_us = dampener_.config().clock.NowUs();

    PublishResult result;
    std::vector<EventHandler> targets;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      ++published_;
    }

    Verdict verdict = dampener_.ShouldEmit(event);
    if (!verdict) {
      std::lock_guard<std::mutex> lock(mutex_);
      ++dropped_;
      result.reason = verdict.reason;
      ACP_LOG_DEBUG("EventBus", "event %s dropped: %s", event.event_id.c_str(),
                    verdict.reason.c_str());
      return result;
    }

    {
      std::lock_guard<std::mutex> lock(mutex_);
      ++accepted_;
      CollectLocked(event.event_type, targets);
      if (event.event_type != kWildcardEventType) {
        CollectLocked(kWildcardEventType, targets);
      }
    }

    result.accepted = true;
    for (auto& handler : targets) {
      if (Invoke(handler, event)) {
        ++result.delivered;
      } else {
        ++result.failed;
      }
    }

    {
      std::lock_guard<std::mutex> lock(mutex_);
      deliveries_ += result.delivered;
      handler_failures_ += result.failed;
    }
    ACP_LOG_DEBUG("EventBus", "event %s (%s) delivered to %u handlers",
                  event.event_id.c_str(), event.event_type.c_str(), result.delivered);
    return result;
  }

  /// Subscribers of exactly `event_type` (wildcards are not included).
  uint32_t SubscriberCount(const std::string& event_type) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = subscribers_.find(event_type);
    return (it != subscribers_.end()) ? static_cast<uint32_t>(it->second.size()) : 0U;
  }

  EventBusStats GetStats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    EventBusStats s{};
    s.published = published_;
    s.accepted = accepted_;
    s.dropped = dropped_;
    s.deliveries = deliveries_;
    s.handler_failures = handler_failures_;
    for (const auto& kv : subscribers_) {
      s.subscribers += static_cast<uint32_t>(kv.second.size());
    }
    return s;
  }

  EventDampener& dampener() noexcept { return dampener_; }
  const EventDampener& dampener() const noexcept { return dampener_; }

 private:
  struct Subscriber {
    uint64_t id;
    EventHandler handler;
  };

  void CollectLocked(const std::string& type, std::vector<EventHandler>& out) const {
    auto it = subscribers_.find(type);
    if (it == subscribers_.end()) return;
    for (const auto& s : it->second) {
      out.push_back(s.handler);
    }
  }

  static bool Invoke(const EventHandler& handler, const Event& event) {
    try {
      handler(event);
      return true;
    } catch (const std::exception& e) {
      ACP_LOG_ERROR("EventBus", "handler failed for %s: %s", event.event_type.c_str(),
                    e.what());
    } catch (...) {
      ACP_LOG_ERROR("EventBus", "handler failed for %s: unknown exception",
                    event.event_type.c_str());
    }
    return false;
  }

  EventDampener dampener_;
  mutable std::mutex mutex_;
  std::unordered_map<std::string, std::vector<Subscriber>> subscribers_;
  uint64_t next_id_ = 1;
  uint64_t published_ = 0;
  uint64_t accepted_ = 0;
  uint64_t dropped_ = 0;
  uint64_t deliveries_ = 0;
  uint64_t handler_failures_ = 0;
};

}  // namespace acp

#endif  // ACP_EVENT_BUS_HPP_
