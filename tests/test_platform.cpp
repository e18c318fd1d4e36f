/**
 * @file test_platform.cpp
 * @brief Tests for platform.hpp
 */

#include "pgs/platform.hpp"

#include <catch2/catch.hpp>

TEST_CASE("PGS_ASSERT passes on true condition", "[platform]") {
  PGS_ASSERT(1 == 1);
  PGS_ASSERT(true);
  REQUIRE(true);
}

TEST_CASE("Linux is detected", "[platform]") {
#if defined(__linux__)
  REQUIRE(PGS_PLATFORM_LINUX == 1);
#else
  SUCCEED("process control unavailable on this target");
#endif
}

TEST_CASE("PGS_CONCAT pastes tokens", "[platform]") {
  int PGS_CONCAT(value_, 42) = 7;
  REQUIRE(value_42 == 7);
}
