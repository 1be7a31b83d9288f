/**
 * @file test_log.cpp
 * @brief Tests for log.hpp
 */

#include "acp/log.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

namespace {

struct Captured {
  std::vector<std::string> lines;
  std::vector<std::string> categories;
};

void CaptureSink(acp::log::Level, const char* category, const char* line, void* ctx) {
  auto* c = static_cast<Captured*>(ctx);
  c->lines.emplace_back(line);
  c->categories.emplace_back(category);
}

}  // namespace

TEST_CASE("Log level defaults", "[log]") {
#ifdef NDEBUG
  REQUIRE(acp::log::GetLevel() == acp::log::Level::kInfo);
#else
  REQUIRE(acp::log::GetLevel() == acp::log::Level::kDebug);
#endif
}

TEST_CASE("Log SetLevel", "[log]") {
  auto prev = acp::log::GetLevel();
  acp::log::SetLevel(acp::log::Level::kError);
  REQUIRE(acp::log::GetLevel() == acp::log::Level::kError);
  acp::log::SetLevel(prev);
}

TEST_CASE("Log Init and Shutdown", "[log]") {
  REQUIRE(!acp::log::IsInitialized());
  acp::log::Init();
  REQUIRE(acp::log::IsInitialized());
  acp::log::Shutdown();
  REQUIRE(!acp::log::IsInitialized());
}

TEST_CASE("Log sink receives formatted line", "[log]") {
  auto prev = acp::log::GetLevel();
  acp::log::SetLevel(acp::log::Level::kDebug);
  Captured cap;
  acp::log::SetSink(&CaptureSink, &cap);

  ACP_LOG_WARN("Budget", "limit %d reached for %s", 10, "agent-1");

  acp::log::SetSink(nullptr);
  acp::log::SetLevel(prev);

  REQUIRE(cap.lines.size() == 1U);
  REQUIRE(cap.categories[0] == "Budget");
  const std::string& line = cap.lines[0];
  REQUIRE(line.find("[WARN]") != std::string::npos);
  REQUIRE(line.find("[Budget]") != std::string::npos);
  REQUIRE(line.find("limit 10 reached for agent-1") != std::string::npos);
  REQUIRE(line.find("test_log.cpp:") != std::string::npos);
}

TEST_CASE("Log runtime level filtering", "[log]") {
  auto prev = acp::log::GetLevel();
  Captured cap;
  acp::log::SetSink(&CaptureSink, &cap);
  acp::log::SetLevel(acp::log::Level::kWarn);

  ACP_LOG_DEBUG("Test", "dropped");
  ACP_LOG_INFO("Test", "dropped");
  ACP_LOG_WARN("Test", "kept");
  ACP_LOG_ERROR("Test", "kept %d", 2);

  acp::log::SetLevel(acp::log::Level::kOff);
  ACP_LOG_ERROR("Test", "dropped");

  acp::log::SetSink(nullptr);
  acp::log::SetLevel(prev);
  REQUIRE(cap.lines.size() == 2U);
}

TEST_CASE("Log long message is truncated, not overflowed", "[log]") {
  auto prev = acp::log::GetLevel();
  acp::log::SetLevel(acp::log::Level::kDebug);
  Captured cap;
  acp::log::SetSink(&CaptureSink, &cap);

  std::string big(4 * ACP_LOG_LINE_MAX, 'x');
  ACP_LOG_INFO("Test", "%s", big.c_str());

  acp::log::SetSink(nullptr);
  acp::log::SetLevel(prev);
  REQUIRE(cap.lines.size() == 1U);
  REQUIRE(cap.lines[0].size() < ACP_LOG_LINE_MAX + 128U);
}

TEST_CASE("LevelName covers all levels", "[log]") {
  REQUIRE(std::string(acp::log::LevelName(acp::log::Level::kDebug)) == "DEBUG");
  REQUIRE(std::string(acp::log::LevelName(acp::log::Level::kInfo)) == "INFO");
  REQUIRE(std::string(acp::log::LevelName(acp::log::Level::kWarn)) == "WARN");
  REQUIRE(std::string(acp::log::LevelName(acp::log::Level::kError)) == "ERROR");
  REQUIRE(std::string(acp::log::LevelName(acp::log::Level::kFatal)) == "FATAL");
  REQUIRE(std::string(acp::log::LevelName(acp::log::Level::kOff)) == "OFF");
}
