/**
 * @file test_command.cpp
 * @brief Tests for command.hpp - command identity derivation.
 */

#include "pgs/command.hpp"

#include <catch2/catch.hpp>

#include <string>

TEST_CASE("DeriveCommandId is deterministic", "[command]") {
  auto a = pgs::DeriveCommandId({"echo", "foo"}, {});
  auto b = pgs::DeriveCommandId({"echo", "foo"}, {});
  REQUIRE(a.has_value());
  REQUIRE(b.has_value());
  REQUIRE(a.value() == b.value());
  REQUIRE(a.value().size() == 64U);
  REQUIRE(a.value().find_first_not_of("0123456789abcdef") == std::string::npos);
}

TEST_CASE("DeriveCommandId known digest", "[command]") {
  // sha256 over u64be(len)||bytes per arg, 0x1E, then the same per env entry
  REQUIRE(pgs::DeriveCommandId({"echo", "foo"}, {}).value() ==
          "b1e40f35d21826a80f87f1e80debb9424f87095f05f89cf6b242a023107dc8cf");
  REQUIRE(pgs::DeriveCommandId({"echo", "foo"}, {"A=1"}).value() ==
          "ffdf72d17c5075068fc5b985eb0869a2296b0c1e08577234f21f003bcdecf945");
}

TEST_CASE("DeriveCommandId is order sensitive", "[command]") {
  SECTION("argument order") {
    REQUIRE(pgs::DeriveCommandId({"a", "b"}, {}).value() !=
            pgs::DeriveCommandId({"b", "a"}, {}).value());
  }
  SECTION("environment order") {
    REQUIRE(pgs::DeriveCommandId({"env"}, {"A=1", "B=2"}).value() !=
            pgs::DeriveCommandId({"env"}, {"B=2", "A=1"}).value());
  }
}

TEST_CASE("DeriveCommandId does not collide on concatenation", "[command]") {
  REQUIRE(pgs::DeriveCommandId({"a b"}, {}).value() !=
          pgs::DeriveCommandId({"a", "b"}, {}).value());
  REQUIRE(pgs::DeriveCommandId({"ab"}, {}).value() !=
          pgs::DeriveCommandId({"a", "b"}, {}).value());
}

TEST_CASE("DeriveCommandId separates args from env", "[command]") {
  REQUIRE(pgs::DeriveCommandId({"x", "A=1"}, {}).value() !=
          pgs::DeriveCommandId({"x"}, {"A=1"}).value());
}

TEST_CASE("DeriveCommandId rejects empty args", "[command]") {
  auto r = pgs::DeriveCommandId({}, {"A=1"});
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.get_error().code == pgs::ErrorCode::kInvalidArgument);
}

TEST_CASE("GetCommandId prefers the assigned id", "[command]") {
  pgs::Command cmd({"sleep", "1"});
  REQUIRE(pgs::GetCommandId(cmd).value() == pgs::DeriveCommandId({"sleep", "1"}, {}).value());

  cmd.id = "worker-1";
  REQUIRE(pgs::GetCommandId(cmd).value() == "worker-1");
}

TEST_CASE("GetCommandId validates", "[command]") {
  SECTION("empty argument list") {
    pgs::Command cmd;
    cmd.id = "named";
    auto r = pgs::GetCommandId(cmd);
    REQUIRE_FALSE(r.has_value());
    REQUIRE(r.get_error().code == pgs::ErrorCode::kInvalidArgument);
  }
  SECTION("id with a path separator") {
    pgs::Command cmd({"true"});
    cmd.id = "../escape";
    REQUIRE(pgs::GetCommandId(cmd).get_error().code == pgs::ErrorCode::kInvalidArgument);
  }
  SECTION("dot ids") {
    pgs::Command cmd({"true"});
    cmd.id = "..";
    REQUIRE_FALSE(pgs::GetCommandId(cmd).has_value());
  }
}

TEST_CASE("Command Program and DescribeCommand", "[command]") {
  pgs::Command cmd({"echo", "hello", "world"});
  REQUIRE(cmd.Program() == "echo");
  REQUIRE(pgs::DescribeCommand(cmd) == "echo hello world");

  cmd.path = "/bin/echo";
  REQUIRE(cmd.Program() == "/bin/echo");
}
