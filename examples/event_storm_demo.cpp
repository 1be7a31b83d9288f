/**
 * @file event_storm_demo.cpp
 * @brief Feedback storm between agents, contained by the event dampener.
 *
 * Four "agents" each react to every alert by publishing a follow-up alert
 * on the same correlation, so one alert fans out without bound. Several
 * producer threads start storms concurrently. The dampener's dedup, rate
 * and cascade checks keep every storm finite.
 *
 * Usage: event_storm_demo [storms_per_thread]
 */

#include "acp/correlation.hpp"
#include "acp/event_bus.hpp"
#include "acp/log.hpp"

#include <atomic>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <thread>
#include <vector>

static constexpr uint32_t kAgents = 4;
static constexpr uint32_t kProducers = 3;

int main(int argc, char* argv[]) {
  acp::log::Init();
  acp::log::SetLevel(acp::log::Level::kWarn);

  uint32_t storms = 5;
  if (argc > 1) {
    long v = std::strtol(argv[1], nullptr, 10);
    if (v > 0 && v < 1000) storms = static_cast<uint32_t>(v);
  }

  acp::DampenerConfig cfg;
  cfg.cascade_threshold = 50;
  cfg.rate_limits["alert.followup"] = 400;
  acp::EventBus bus(cfg);

  std::atomic<uint64_t> reactions{0};
  for (uint32_t a = 0; a < kAgents; ++a) {
    const std::string name = "agent-" + std::to_string(a);
    auto r = bus.Subscribe("alert.followup", [&bus, &reactions, name](const acp::Event& e) {
      ++reactions;
      acp::Event next;
      next.event_type = "alert.followup";
      next.source = name;
      next.correlation_id = e.correlation_id;
      next.payload["parent"] = e.event_id;
      (void)bus.Publish(next);
    });
    if (!r) {
      ACP_LOG_ERROR("storm", "subscribe failed: %s", acp::ToString(r.get_error()));
      return 1;
    }
  }

  std::vector<std::thread> producers;
  for (uint32_t p = 0; p < kProducers; ++p) {
    producers.emplace_back([&bus, p, storms]() {
      for (uint32_t s = 0; s < storms; ++s) {
        acp::CorrelationScope scope(acp::GenerateId("storm_"));
        acp::Event root;
        root.event_type = "alert.followup";
        root.source = "monitor-" + std::to_string(p);
        root.payload["storm"] = std::to_string(s);
        auto res = bus.Publish(root);
        ACP_LOG_INFO("storm", "producer %u storm %u: %s", p, s,
                     res.accepted ? "started" : res.reason.c_str());
      }
    });
  }
  for (auto& t : producers) t.join();

  auto bs = bus.GetStats();
  auto ds = bus.dampener().GetStats();
  std::printf("\n--- Event Storm ---\n"
              "  storms started  : %u\n"
              "  agent reactions : %lu\n"
              "  published       : %lu\n"
              "  accepted        : %lu\n"
              "  dropped         : %lu\n"
              "    deduplicated  : %lu\n"
              "    rate limited  : %lu\n"
              "    cascade       : %lu\n"
              "  correlations    : %u\n",
              kProducers * storms,
              static_cast<unsigned long>(reactions.load()),
              static_cast<unsigned long>(bs.published),
              static_cast<unsigned long>(bs.accepted),
              static_cast<unsigned long>(bs.dropped),
              static_cast<unsigned long>(ds.deduplicated),
              static_cast<unsigned long>(ds.rate_limited),
              static_cast<unsigned long>(ds.cascade_rejected),
              ds.correlations);

  acp::log::Shutdown();
  return 0;
}
