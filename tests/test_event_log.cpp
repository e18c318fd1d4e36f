/**
 * @file test_event_log.cpp
 * @brief Tests for event_log.hpp - command rows, event append and replay.
 */

#include "pgs/event_log.hpp"
#include "pgs/schema.hpp"

#include <catch2/catch.hpp>

#include <cstdlib>
#include <memory>
#include <string>
#include <vector>

namespace {

std::unique_ptr<pgs::Database> OpenTempDb() {
  char tmpl[] = "/tmp/pgs_eventlog_XXXXXX";
  const char* dir = mkdtemp(tmpl);
  REQUIRE(dir != nullptr);
  auto db = pgs::Database::Open(std::string(dir) + "/groups.db", pgs::schema::kCreateTables);
  REQUIRE(db.has_value());
  return std::move(db.value());
}

void AppendAll(pgs::Database& db,
               const std::vector<std::vector<std::string>>& events) {
  auto tx = db.Begin();
  REQUIRE(tx.has_value());
  for (const auto& e : events) {
    REQUIRE(pgs::event_log::Append(tx.value(), e[0].c_str(), e[1], e[2]).has_value());
  }
  REQUIRE(tx.value().Commit().has_value());
}

std::vector<std::string> ReplayAll(pgs::Database& db) {
  auto tx = db.Begin();
  REQUIRE(tx.has_value());
  auto active = pgs::event_log::Replay(tx.value());
  REQUIRE(active.has_value());
  return active.value();
}

}  // namespace

TEST_CASE("Append assigns strictly increasing sequence numbers", "[event_log]") {
  auto db = OpenTempDb();
  auto tx = db->Begin();
  REQUIRE(tx.has_value());

  int64_t prev = 0;
  for (int i = 0; i < 5; ++i) {
    auto seq = pgs::event_log::Append(tx.value(), pgs::action::kCommandStarted,
                                      "c" + std::to_string(i), "g");
    REQUIRE(seq.has_value());
    REQUIRE(seq.value() > prev);
    prev = seq.value();
  }
  REQUIRE(tx.value().Commit().has_value());
}

TEST_CASE("History returns one group in sequence order", "[event_log]") {
  auto db = OpenTempDb();
  AppendAll(*db, {{pgs::action::kGroupCreated, "", "web"},
                  {pgs::action::kGroupCreated, "", "db"},
                  {pgs::action::kCommandStarted, "c1", "web"},
                  {pgs::action::kCommandStopped, "c1", "web"}});

  auto tx = db->Begin();
  REQUIRE(tx.has_value());
  auto hist = pgs::event_log::History(tx.value(), "web");
  REQUIRE(hist.has_value());
  REQUIRE(hist.value().size() == 3U);
  REQUIRE(hist.value()[0].action == "group_created");
  REQUIRE(hist.value()[1].action == "command_started");
  REQUIRE(hist.value()[1].command_id == "c1");
  REQUIRE(hist.value()[2].action == "command_stopped");
  REQUIRE(hist.value()[0].seq < hist.value()[1].seq);
  REQUIRE(hist.value()[1].seq < hist.value()[2].seq);
  for (const auto& e : hist.value()) REQUIRE(e.group == "web");
}

TEST_CASE("Replay folds the log into active groups", "[event_log]") {
  auto db = OpenTempDb();

  SECTION("empty log") { REQUIRE(ReplayAll(*db).empty()); }

  SECTION("running, closed and removed groups") {
    AppendAll(*db, {{pgs::action::kGroupCreated, "", "running"},
                    {pgs::action::kCommandStarted, "r1", "running"},
                    {pgs::action::kCommandStarted, "r2", "running"},
                    {pgs::action::kCommandStopped, "r1", "running"},
                    {pgs::action::kGroupCreated, "", "closed"},
                    {pgs::action::kCommandStarted, "c1", "closed"},
                    {pgs::action::kCommandStopped, "c1", "closed"},
                    {pgs::action::kGroupCreated, "", "removed"},
                    {pgs::action::kCommandStarted, "x1", "removed"},
                    {pgs::action::kGroupRemoved, "", "removed"},
                    {pgs::action::kGroupCreated, "", "idle"}});
    REQUIRE(ReplayAll(*db) == std::vector<std::string>{"running"});
  }

  SECTION("restart after close makes a group active again") {
    AppendAll(*db, {{pgs::action::kGroupCreated, "", "g"},
                    {pgs::action::kCommandStarted, "a", "g"},
                    {pgs::action::kCommandStopped, "a", "g"},
                    {pgs::action::kCommandStarted, "a", "g"}});
    REQUIRE(ReplayAll(*db) == std::vector<std::string>{"g"});
  }

  SECTION("order of first appearance") {
    AppendAll(*db, {{pgs::action::kCommandStarted, "b1", "b"},
                    {pgs::action::kCommandStarted, "a1", "a"}});
    REQUIRE(ReplayAll(*db) == std::vector<std::string>{"b", "a"});
  }
}

TEST_CASE("command_store round trip keeps order and path", "[event_log]") {
  auto db = OpenTempDb();

  pgs::Command first({"sh", "-c", "echo one"}, {"A=1", "B=2"});
  pgs::Command second({"renamed", "x"});
  second.path = "/bin/echo";
  pgs::Command third({"sleep", "1"});

  {
    auto tx = db->Begin();
    REQUIRE(tx.has_value());
    REQUIRE(pgs::command_store::Insert(tx.value(), "g", "id-1", first).has_value());
    REQUIRE(pgs::command_store::Insert(tx.value(), "g", "id-2", second).has_value());
    REQUIRE(pgs::command_store::Insert(tx.value(), "other", "id-3", third).has_value());
    REQUIRE(tx.value().Commit().has_value());
  }

  auto tx = db->Begin();
  REQUIRE(tx.has_value());
  auto cmds = pgs::command_store::ForGroup(tx.value(), "g");
  REQUIRE(cmds.has_value());
  REQUIRE(cmds.value().size() == 2U);

  REQUIRE(cmds.value()[0].id == "id-1");
  REQUIRE(cmds.value()[0].args == first.args);
  REQUIRE(cmds.value()[0].env == first.env);
  REQUIRE(cmds.value()[0].path.empty());

  REQUIRE(cmds.value()[1].id == "id-2");
  REQUIRE(cmds.value()[1].path == "/bin/echo");
  REQUIRE(cmds.value()[1].env.empty());

  REQUIRE(pgs::command_store::GroupOf(tx.value(), "id-3").value() == "other");
  REQUIRE(pgs::command_store::GroupOf(tx.value(), "nope").value().empty());
  REQUIRE(pgs::command_store::ForGroup(tx.value(), "missing").value().empty());
}

TEST_CASE("command_store Insert rejects a duplicate id", "[event_log]") {
  auto db = OpenTempDb();
  auto tx = db->Begin();
  REQUIRE(tx.has_value());
  pgs::Command cmd({"true"});
  REQUIRE(pgs::command_store::Insert(tx.value(), "g", "same", cmd).has_value());
  auto st = pgs::command_store::Insert(tx.value(), "h", "same", cmd);
  REQUIRE_FALSE(st.has_value());
  REQUIRE(st.get_error().code == pgs::ErrorCode::kStore);
  REQUIRE(st.get_error().command_id == "same");
}

TEST_CASE("command_store Delete removes every row", "[event_log]") {
  auto db = OpenTempDb();
  auto tx = db->Begin();
  REQUIRE(tx.has_value());
  pgs::Command cmd({"env"}, {"A=1"});
  REQUIRE(pgs::command_store::Insert(tx.value(), "g", "gone", cmd).has_value());
  REQUIRE(pgs::command_store::Delete(tx.value(), "gone").has_value());

  REQUIRE(pgs::command_store::ForGroup(tx.value(), "g").value().empty());
  auto args = tx.value().Prepare("SELECT COUNT(*) FROM command_args WHERE command_id = 'gone'");
  REQUIRE(args.has_value());
  REQUIRE(args.value().Step().value());
  REQUIRE(args.value().ColumnInt64(0) == 0);
}
