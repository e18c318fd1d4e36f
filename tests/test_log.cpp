/**
 * @file test_log.cpp
 * @brief Tests for log.hpp
 */

#include "pgs/log.hpp"

#include <catch2/catch.hpp>

#include <cstring>
#include <string>

TEST_CASE("Log level defaults", "[log]") {
  // In debug builds default is kDebug, in release kInfo
#ifdef NDEBUG
  REQUIRE(pgs::log::GetLevel() == pgs::log::Level::kInfo);
#else
  REQUIRE(pgs::log::GetLevel() == pgs::log::Level::kDebug);
#endif
}

TEST_CASE("Log SetLevel", "[log]") {
  auto prev = pgs::log::GetLevel();
  pgs::log::SetLevel(pgs::log::Level::kError);
  REQUIRE(pgs::log::GetLevel() == pgs::log::Level::kError);
  pgs::log::SetLevel(prev);
}

TEST_CASE("Log Init and Shutdown", "[log]") {
  REQUIRE(!pgs::log::IsInitialized());
  pgs::log::Init();
  REQUIRE(pgs::log::IsInitialized());
  pgs::log::Shutdown();
  REQUIRE(!pgs::log::IsInitialized());
}

TEST_CASE("Log level tags", "[log]") {
  REQUIRE(std::strcmp(pgs::log::detail::LevelTag(pgs::log::Level::kDebug), "DEBUG") == 0);
  REQUIRE(std::strcmp(pgs::log::detail::LevelTag(pgs::log::Level::kWarn), "WARN") == 0);
  REQUIRE(std::strcmp(pgs::log::detail::LevelTag(pgs::log::Level::kFatal), "FATAL") == 0);
}

TEST_CASE("Log basename strips directories", "[log]") {
  REQUIRE(std::string(pgs::log::detail::Basename("/a/b/registry.hpp")) == "registry.hpp");
  REQUIRE(std::string(pgs::log::detail::Basename("group.hpp")) == "group.hpp");
}

TEST_CASE("Log macros compile and run", "[log]") {
  pgs::log::SetLevel(pgs::log::Level::kDebug);
  PGS_LOG_DEBUG("Test", "debug %d", 1);
  PGS_LOG_INFO("Test", "info %s", "msg");
  PGS_LOG_WARN("Test", "warn");
  PGS_LOG_ERROR("Test", "error %d %d", 1, 2);
  // FATAL aborts
  REQUIRE(true);
}

TEST_CASE("Log runtime level filtering", "[log]") {
  pgs::log::SetLevel(pgs::log::Level::kOff);
  PGS_LOG_DEBUG("Test", "should not appear");
  PGS_LOG_ERROR("Test", "should not appear");
  pgs::log::SetLevel(pgs::log::Level::kDebug);
  REQUIRE(true);
}

TEST_CASE("Log with very long message", "[log]") {
  pgs::log::SetLevel(pgs::log::Level::kDebug);
  // Longer than the line buffer; truncated, not overflowed
  std::string long_msg(1000, 'x');
  PGS_LOG_INFO("Test", "%s", long_msg.c_str());
  PGS_LOG_INFO("Test", "");
  REQUIRE(true);
}
