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
 * @file feedback_loop_detector.hpp
 * @brief Causality-chain tracker that flags cycles and excessive chain depth.
 *
 * Per correlation id the detector keeps the ordered list of chain elements
 * (task ids, or task fingerprints when wired into TaskArbitrator) seen so far.
 * CheckCausalityChain() rejects when the element already appears in the
 * chain (a cycle) or when the chain has reached max_chain_depth; otherwise
 * the element is appended. ForgetElement() takes an element back out, which
 * the arbitrator does for failed tasks so they can be retried.
 *
 * Chains carry a last-touched timestamp. They are swept by age through
 * CleanupOldChains(), and by count (oldest 10% by last touch) whenever the
 * number of tracked correlations exceeds max_chains.
 *
 * Thread-safe: all operations take the instance mutex.
 */

#ifndef ACP_FEEDBACK_LOOP_DETECTOR_HPP_
#define ACP_FEEDBACK_LOOP_DETECTOR_HPP_

#include "acp/log.hpp"
#include "acp/platform.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace acp {

/// Result of a loop check. `reason` is empty when no loop was found.
struct LoopCheckResult {
  bool loop_detected = false;
  std::string reason;
};

/// Loop check injection point (function pointer + context).
///
/// @param correlation_id  Chain the element belongs to.
/// @param element         Chain element (task id or task fingerprint).
using LoopCheckFn = LoopCheckResult (*)(const std::string& correlation_id,
                                        const std::string& element, void* ctx);

/// Undo a previously admitted element (e.g. the task failed and may be
/// retried). Returns true when the element was present.
using LoopReleaseFn = bool (*)(const std::string& correlation_id,
                               const std::string& element, void* ctx);

struct LoopCheckHook {
  LoopCheckFn fn = nullptr;          ///< nullptr = not wired
  LoopReleaseFn release = nullptr;   ///< Optional
  void* ctx = nullptr;

  bool IsWired() const noexcept { return fn != nullptr; }
};

struct LoopDetectorConfig {
  uint32_t max_chain_depth = 20;
  uint32_t max_chains = 1000;
  uint64_t chain_ttl_ms = 3600ULL * 1000ULL;  ///< Default age for CleanupOldChains()
  ClockSource clock;
};

class FeedbackLoopDetector final {
 public:
  explicit FeedbackLoopDetector(const LoopDetectorConfig& config = LoopDetectorConfig{})
      : config_(config) {
    ACP_ASSERT(config_.max_chain_depth > 0U);
    ACP_ASSERT(config_.max_chains > 0U);
    ACP_LOG_INFO("LoopDet", "loop detector initialized (max_depth=%u, max_chains=%u)",
                 config_.max_chain_depth, config_.max_chains);
  }

  FeedbackLoopDetector(const FeedbackLoopDetector&) = delete;
  FeedbackLoopDetector& operator=(const FeedbackLoopDetector&) = delete;

  /**
   * @brief Check whether `element` closes a cycle or deepens the chain past
   *        the limit; append it when it does neither.
   */
  LoopCheckResult CheckCausalityChain(const std::string& correlation_id,
                                      const std::string& element) {
    if (correlation_id.empty()) {
      ACP_LOG_DEBUG("LoopDet", "empty correlation id, chain check skipped");
      return LoopCheckResult{};
    }

    const uint64_t now = config_.clock.NowUs();
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = chains_.find(correlation_id);
    if (it == chains_.end()) {
      it = chains_.emplace(correlation_id, Chain{}).first;
      if (chains_.size() > config_.max_chains) {
        EvictOldestLocked(correlation_id);
        it = chains_.find(correlation_id);
      }
    }
    Chain& chain = it->second;
    chain.last_touched_us = now;

    if (std::find(chain.elements.begin(), chain.elements.end(), element) !=
        chain.elements.end()) {
      ACP_LOG_ERROR("LoopDet", "feedback loop: %s repeats in chain %s",
                    element.c_str(), correlation_id.c_str());
      return LoopCheckResult{true, "task " + element +
                                       " creates cycle in causality chain " +
                                       correlation_id};
    }

    if (chain.elements.size() >= config_.max_chain_depth) {
      ACP_LOG_WARN("LoopDet", "deep causality chain %s (depth=%zu)",
                   correlation_id.c_str(), chain.elements.size());
      return LoopCheckResult{true, "causality chain exceeds max depth (" +
                                       std::to_string(config_.max_chain_depth) + ")"};
    }

    chain.elements.push_back(element);
    return LoopCheckResult{};
  }

  /// Snapshot of the chain (empty if unknown).
  std::vector<std::string> GetChain(const std::string& correlation_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = chains_.find(correlation_id);
    return (it != chains_.end()) ? it->second.elements : std::vector<std::string>{};
  }

  uint32_t ChainCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<uint32_t>(chains_.size());
  }

  /**
   * @brief Remove one element from a chain so that it may appear again.
   *
   * An emptied chain is dropped.
   */
  bool ForgetElement(const std::string& correlation_id, const std::string& element) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = chains_.find(correlation_id);
    if (it == chains_.end()) return false;
    auto& elems = it->second.elements;
    auto eit = std::find(elems.begin(), elems.end(), element);
    if (eit == elems.end()) return false;
    elems.erase(eit);
    if (elems.empty()) chains_.erase(it);
    ACP_LOG_DEBUG("LoopDet", "released %s from chain %s", element.c_str(),
                  correlation_id.c_str());
    return true;
  }

  /// Drop a finished chain explicitly.
  bool Forget(const std::string& correlation_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return chains_.erase(correlation_id) > 0U;
  }

  /**
   * @brief Remove chains untouched for `max_age_ms`, then enforce the count
   *        ceiling.
   * @return Number of chains removed.
   */
  uint32_t CleanupOldChains(uint64_t max_age_ms) {
    const uint64_t now = config_.clock.NowUs();
    const uint64_t max_age_us = MsToUs(max_age_ms);
    uint32_t removed = 0U;

    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = chains_.begin(); it != chains_.end();) {
      if (now >= it->second.last_touched_us &&
          now - it->second.last_touched_us >= max_age_us) {
        it = chains_.erase(it);
        ++removed;
      } else {
        ++it;
      }
    }
    if (chains_.size() > config_.max_chains) {
      removed += EvictOldestLocked(std::string());
    }
    if (removed > 0U) {
      ACP_LOG_INFO("LoopDet", "cleaned up %u causality chains", removed);
    }
    return removed;
  }

  uint32_t CleanupOldChains() { return CleanupOldChains(config_.chain_ttl_ms); }

  /// Hook bound to this detector, for TaskArbitrator wiring.
  LoopCheckHook AsHook() noexcept {
    return LoopCheckHook{&CheckThunk, &ReleaseThunk, this};
  }

  const LoopDetectorConfig& config() const noexcept { return config_; }

 private:
  struct Chain {
    std::vector<std::string> elements;
    uint64_t last_touched_us = 0;
  };

  static LoopCheckResult CheckThunk(const std::string& correlation_id,
                                    const std::string& element, void* ctx) {
    ACP_ASSERT(ctx != nullptr);
    return static_cast<FeedbackLoopDetector*>(ctx)->CheckCausalityChain(
        correlation_id, element);
  }

  static bool ReleaseThunk(const std::string& correlation_id, const std::string& element,
                           void* ctx) {
    ACP_ASSERT(ctx != nullptr);
    return static_cast<FeedbackLoopDetector*>(ctx)->ForgetElement(correlation_id, element);
  }

  /// Evict down to 90% of max_chains, oldest last touch first. `keep` is
  /// never evicted (the chain being inserted). Caller holds mutex_.
  uint32_t EvictOldestLocked(const std::string& keep) {
    const size_t target = static_cast<size_t>(config_.max_chains) * 9U / 10U;
    if (chains_.size() <= target) return 0U;
    size_t to_remove = chains_.size() - target;

    std::vector<std::pair<uint64_t, std::string>> order;
    order.reserve(chains_.size());
    for (const auto& kv : chains_) {
      if (kv.first != keep) order.emplace_back(kv.second.last_touched_us, kv.first);
    }
    to_remove = std::min(to_remove, order.size());
    std::partial_sort(order.begin(),
                      order.begin() + static_cast<std::ptrdiff_t>(to_remove),
                      order.end());
    for (size_t i = 0; i < to_remove; ++i) {
      chains_.erase(order[i].second);
    }
    ACP_LOG_INFO("LoopDet", "evicted %zu oldest causality chains", to_remove);
    return static_cast<uint32_t>(to_remove);
  }

  LoopDetectorConfig config_;
  mutable std::mutex mutex_;
  std::unordered_map<std::string, Chain> chains_;
};

}  // namespace acp

#endif  // ACP_FEEDBACK_LOOP_DETECTOR_HPP_
