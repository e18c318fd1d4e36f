/**
 * @file test_group.cpp
 * @brief Tests for group.hpp - live process supervision.
 */

#include "pgs/group.hpp"

#include <catch2/catch.hpp>

#include <chrono>
#include <fstream>
#include <string>
#include <vector>

#include <signal.h>
#include <stdlib.h>
#include <unistd.h>

using namespace std::chrono_literals;

namespace {

pgs::Command Cmd(std::vector<std::string> args) { return pgs::Command(std::move(args)); }

std::string MakeTempDir() {
  char tmpl[] = "/tmp/pgs_group_XXXXXX";
  const char* dir = mkdtemp(tmpl);
  REQUIRE(dir != nullptr);
  return dir;
}

pgs::GroupOptions FastOptions() {
  pgs::GroupOptions opts;
  opts.stop_grace = 2000ms;
  opts.drain_timeout = 1000ms;
  return opts;
}

}  // namespace

TEST_CASE("Group Start and Wait for successful processes", "[group]") {
  pgs::Group group("ok");
  REQUIRE(group.Start(Cmd({"true"})).has_value());
  REQUIRE(group.Start(Cmd({"sh", "-c", "exit 0"})).has_value());
  REQUIRE(group.Size() == 2U);

  auto st = group.Wait(5000ms);
  REQUIRE(st.has_value());

  for (const auto& info : group.Commands()) {
    REQUIRE_FALSE(info.running);
    REQUIRE(info.result.Success());
  }
}

TEST_CASE("Group Wait reports the failing command", "[group]") {
  pgs::Group group("fail");
  REQUIRE(group.Start(Cmd({"true"})).has_value());
  pgs::Command bad = Cmd({"sh", "-c", "exit 3"});
  REQUIRE(group.Start(bad).has_value());

  auto st = group.Wait(5000ms);
  REQUIRE_FALSE(st.has_value());
  REQUIRE(st.get_error().code == pgs::ErrorCode::kProcessExit);
  REQUIRE(st.get_error().command_id == pgs::GetCommandId(bad).value());
  REQUIRE(st.get_error().message.find("exit status 3") != std::string::npos);
  REQUIRE(st.get_error().message.find("(sh)") != std::string::npos);
}

TEST_CASE("Group Wait times out without touching live state", "[group]") {
  pgs::Group group("slow", nullptr, FastOptions());
  REQUIRE(group.Start(Cmd({"sleep", "5"})).has_value());

  auto st = group.Wait(50ms);
  REQUIRE_FALSE(st.has_value());
  REQUIRE(st.get_error().code == pgs::ErrorCode::kWaitTimeout);
  REQUIRE(group.Size() == 1U);
  REQUIRE(group.Commands()[0].running);

  REQUIRE(group.Remove().has_value());
}

TEST_CASE("Group Start launch failure registers nothing", "[group]") {
  pgs::Group group("launch");
  auto pid = group.Start(Cmd({"__pgs_no_such_program__"}));
  REQUIRE_FALSE(pid.has_value());
  REQUIRE(pid.get_error().code == pgs::ErrorCode::kLaunch);
  REQUIRE(group.Size() == 0U);
}

TEST_CASE("Group Start rejects empty args and duplicates", "[group]") {
  pgs::Group group("dup", nullptr, FastOptions());

  auto empty = group.Start(pgs::Command());
  REQUIRE_FALSE(empty.has_value());
  REQUIRE(empty.get_error().code == pgs::ErrorCode::kInvalidArgument);

  REQUIRE(group.Start(Cmd({"sleep", "5"})).has_value());
  auto again = group.Start(Cmd({"sleep", "5"}));
  REQUIRE_FALSE(again.has_value());
  REQUIRE(again.get_error().code == pgs::ErrorCode::kAlreadyExists);
  REQUIRE(group.Size() == 1U);

  REQUIRE(group.Remove().has_value());
}

TEST_CASE("Group Remove keeps the others in start order", "[group]") {
  pgs::Group group("rm", nullptr, FastOptions());
  pgs::Command a = Cmd({"sleep", "5"});
  pgs::Command b = Cmd({"sleep", "6"});
  pgs::Command c = Cmd({"sleep", "7"});
  REQUIRE(group.Start(a).has_value());
  REQUIRE(group.Start(b).has_value());
  REQUIRE(group.Start(c).has_value());

  REQUIRE(group.Remove({pgs::GetCommandId(b).value()}).has_value());

  auto cmds = group.Commands();
  REQUIRE(cmds.size() == 2U);
  REQUIRE(cmds[0].command == a);
  REQUIRE(cmds[1].command == c);

  SECTION("remove all") {
    REQUIRE(group.Remove().has_value());
    REQUIRE(group.Commands().empty());
  }
  SECTION("unknown ids are ignored") {
    REQUIRE(group.Remove({"not-a-member"}).has_value());
    REQUIRE(group.Size() == 2U);
    REQUIRE(group.Remove().has_value());
  }
}

TEST_CASE("Group Remove of an exited process succeeds", "[group]") {
  pgs::Group group("exited");
  REQUIRE(group.Start(Cmd({"true"})).has_value());
  REQUIRE(group.Wait(5000ms).has_value());
  REQUIRE(group.Remove().has_value());
  REQUIRE(group.Size() == 0U);
}

TEST_CASE("Group Stop by pid", "[group]") {
  pgs::Group group("stop", nullptr, FastOptions());
  auto pid = group.Start(Cmd({"sleep", "5"}));
  REQUIRE(pid.has_value());
  REQUIRE(group.Start(Cmd({"sleep", "6"})).has_value());

  REQUIRE(group.Stop(pid.value()).has_value());
  REQUIRE(group.Size() == 1U);

  auto missing = group.Stop(pid.value());
  REQUIRE_FALSE(missing.has_value());
  REQUIRE(missing.get_error().code == pgs::ErrorCode::kNotFound);

  REQUIRE(group.Remove().has_value());
}

TEST_CASE("Group Signal reaches every process", "[group]") {
  pgs::Group group("sig", nullptr, FastOptions());
  REQUIRE(group.Start(Cmd({"sleep", "5"})).has_value());
  REQUIRE(group.Start(Cmd({"sleep", "6"})).has_value());

  REQUIRE(group.Signal(SIGKILL).has_value());
  REQUIRE(group.AwaitExit(5000ms).has_value());

  for (const auto& info : group.Commands()) {
    REQUIRE_FALSE(info.running);
    REQUIRE(info.result.signaled);
    REQUIRE(info.result.term_signal == SIGKILL);
  }

  // Exited processes are skipped silently
  REQUIRE(group.Signal(SIGKILL).has_value());
  auto st = group.Wait(1000ms);
  REQUIRE_FALSE(st.has_value());
  REQUIRE(st.get_error().code == pgs::ErrorCode::kProcessExit);
  REQUIRE(st.get_error().message.find("killed by signal 9") != std::string::npos);
}

TEST_CASE("Group Clear forgets processes", "[group]") {
  pgs::Group group("clear");
  REQUIRE(group.Start(Cmd({"true"})).has_value());
  group.Clear();
  REQUIRE(group.Size() == 0U);
  REQUIRE(group.Wait(100ms).has_value());
}

TEST_CASE("Group captures output before Wait returns", "[group]") {
  const std::string root = MakeTempDir();
  pgs::OutputCapture capture(root);
  pgs::Group group("capture", &capture);

  pgs::Command cmd = Cmd({"sh", "-c", "echo foo; echo bar 1>&2"});
  REQUIRE(group.Start(cmd).has_value());
  REQUIRE(group.Wait(5000ms).has_value());

  const std::string id = pgs::GetCommandId(cmd).value();
  std::ifstream out(pgs::CapturePath(root, id, pgs::Stream::kStdout));
  std::string line;
  REQUIRE(std::getline(out, line));
  REQUIRE(line == "foo");

  std::ifstream err(pgs::CapturePath(root, id, pgs::Stream::kStderr));
  REQUIRE(std::getline(err, line));
  REQUIRE(line == "bar");
}

TEST_CASE("Group assigned ids name the capture files", "[group]") {
  const std::string root = MakeTempDir();
  pgs::OutputCapture capture(root);
  pgs::Group group("named", &capture);

  pgs::Command cmd = Cmd({"echo", "named"});
  cmd.id = "greeter";
  REQUIRE(group.Start(cmd).has_value());
  REQUIRE(group.Wait(5000ms).has_value());
  REQUIRE(group.Commands()[0].id == "greeter");

  std::ifstream out(root + "/greeter.stdout");
  std::string line;
  REQUIRE(std::getline(out, line));
  REQUIRE(line == "named");
}

TEST_CASE("Group Start succeeds when the capture file cannot be written", "[group]") {
  const std::string root = MakeTempDir();
  pgs::OutputCapture capture(root);
  pgs::Group group("full", &capture);

  pgs::Command cmd = Cmd({"sh", "-c", "echo lost; echo kept 1>&2"});
  const std::string id = pgs::GetCommandId(cmd).value();
  REQUIRE(symlink("/dev/full", pgs::CapturePath(root, id, pgs::Stream::kStdout).c_str()) == 0);

  REQUIRE(group.Start(cmd).has_value());
  REQUIRE(group.Wait(5000ms).has_value());
  REQUIRE(group.Commands()[0].result.Success());

  std::ifstream err(pgs::CapturePath(root, id, pgs::Stream::kStderr));
  std::string line;
  REQUIRE(std::getline(err, line));
  REQUIRE(line == "kept");
}
