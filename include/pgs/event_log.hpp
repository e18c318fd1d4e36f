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
 * @file event_log.hpp
 * @brief Durable command definitions and the append-only group event log.
 *
 * Every function takes the caller's Transaction, so a Registry operation
 * groups its definition rows, log entries and live-state changes under one
 * commit.
 *
 * Replay folds groups_log in sequence order:
 *   group_created    -> group known, nothing running yet
 *   command_started  -> command live in group
 *   command_stopped  -> command no longer live
 *   group_removed    -> tombstone, every command of the group dropped
 * A group is active when at least one command is still live after the fold.
 */

#ifndef PGS_EVENT_LOG_HPP_
#define PGS_EVENT_LOG_HPP_

#include "pgs/command.hpp"
#include "pgs/error.hpp"
#include "pgs/log.hpp"
#include "pgs/store.hpp"

#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace pgs {

// ============================================================================
// Actions
// ============================================================================

namespace action {

constexpr const char* kGroupCreated = "group_created";
constexpr const char* kCommandStarted = "command_started";
constexpr const char* kCommandStopped = "command_stopped";
constexpr const char* kGroupRemoved = "group_removed";

}  // namespace action

struct LogEntry {
  int64_t seq = 0;
  std::string action;
  std::string command_id;
  std::string group;
};

// ============================================================================
// EventLog
// ============================================================================

namespace event_log {

/**
 * @brief Append one entry to groups_log.
 * @return The assigned sequence number.
 */
inline Result<int64_t> Append(Transaction& tx, const char* action_name,
                              const std::string& command_id,
                              const std::string& group) {
  using R = Result<int64_t>;
  auto stmt = tx.Prepare(
      "INSERT INTO groups_log (action_name, command_id, group_name) "
      "VALUES (?, ?, ?)");
  if (!stmt) return R::error(stmt.get_error().Wrap("appending event"));

  Status st = stmt.value().Bind(1, std::string(action_name));
  if (st) st = stmt.value().Bind(2, command_id);
  if (st) st = stmt.value().Bind(3, group);
  if (st) st = stmt.value().Run();
  if (!st) return R::error(st.get_error().Wrap("appending event"));

  const int64_t seq = tx.LastInsertRowId();
  PGS_LOG_DEBUG("EventLog", "#%lld %s group=%s cmd=%.12s",
                static_cast<long long>(seq), action_name, group.c_str(),
                command_id.c_str());
  return R::success(seq);
}

/// @brief Entries for @p group in sequence order.
inline Result<std::vector<LogEntry>> History(Transaction& tx,
                                             const std::string& group) {
  using R = Result<std::vector<LogEntry>>;
  auto stmt = tx.Prepare(
      "SELECT seq, action_name, command_id, group_name FROM groups_log "
      "WHERE group_name = ? ORDER BY seq");
  if (!stmt) return R::error(stmt.get_error().Wrap("reading history"));
  Status st = stmt.value().Bind(1, group);
  if (!st) return R::error(st.get_error().Wrap("reading history"));

  std::vector<LogEntry> out;
  for (;;) {
    auto row = stmt.value().Step();
    if (!row) return R::error(row.get_error().Wrap("reading history"));
    if (!row.value()) break;
    LogEntry e;
    e.seq = stmt.value().ColumnInt64(0);
    e.action = stmt.value().ColumnText(1);
    e.command_id = stmt.value().ColumnText(2);
    e.group = stmt.value().ColumnText(3);
    out.push_back(std::move(e));
  }
  return R::success(std::move(out));
}

/**
 * @brief Fold the whole log and return the groups that are still active,
 *        in order of their first appearance.
 */
inline Result<std::vector<std::string>> Replay(Transaction& tx) {
  using R = Result<std::vector<std::string>>;
  auto stmt = tx.Prepare(
      "SELECT action_name, command_id, group_name FROM groups_log ORDER BY seq");
  if (!stmt) return R::error(stmt.get_error().Wrap("replaying event log"));

  std::vector<std::string> order;
  std::map<std::string, std::set<std::string>> live;
  for (;;) {
    auto row = stmt.value().Step();
    if (!row) return R::error(row.get_error().Wrap("replaying event log"));
    if (!row.value()) break;

    const std::string act = stmt.value().ColumnText(0);
    const std::string cid = stmt.value().ColumnText(1);
    const std::string group = stmt.value().ColumnText(2);
    if (live.find(group) == live.end()) {
      order.push_back(group);
    }
    std::set<std::string>& cmds = live[group];

    if (act == action::kCommandStarted) {
      cmds.insert(cid);
    } else if (act == action::kCommandStopped) {
      cmds.erase(cid);
    } else if (act == action::kGroupRemoved) {
      cmds.clear();
    } else if (act != action::kGroupCreated) {
      PGS_LOG_WARN("EventLog", "ignoring unknown action '%s'", act.c_str());
    }
  }

  std::vector<std::string> active;
  for (const auto& name : order) {
    if (!live[name].empty()) active.push_back(name);
  }
  return R::success(std::move(active));
}

}  // namespace event_log

// ============================================================================
// Command definitions
// ============================================================================

namespace command_store {

/// @brief Persist @p cmd under @p id: commands row plus ordered args/env.
inline Status Insert(Transaction& tx, const std::string& group,
                     const std::string& id, const Command& cmd) {
  auto stmt = tx.Prepare(
      "INSERT INTO commands (command_id, group_name, path) VALUES (?, ?, ?)");
  if (!stmt) return Fail(stmt.get_error().Wrap("persisting command"));
  Status st = stmt.value().Bind(1, id);
  if (st) st = stmt.value().Bind(2, group);
  if (st) st = stmt.value().Bind(3, cmd.path);
  if (st) st = stmt.value().Run();
  if (!st) {
    Error err = st.get_error().Wrap("persisting command " + id);
    err.command_id = id;
    return Fail(err);
  }

  st = InsertIndexedRows(tx, "command_args", "command_id", "arg", id, cmd.args);
  if (st) st = InsertIndexedRows(tx, "command_env", "command_id", "env_var", id, cmd.env);
  if (!st) {
    Error err = st.get_error().Wrap("persisting command " + id);
    err.command_id = id;
    return Fail(err);
  }
  return Ok();
}

/// @brief Delete the definition of @p id (commands, args, env rows).
inline Status Delete(Transaction& tx, const std::string& id) {
  static const char* const kTables[] = {"command_args", "command_env", "commands"};
  for (const char* table : kTables) {
    auto stmt = tx.Prepare(std::string("DELETE FROM ") + table +
                           " WHERE command_id = ?");
    if (!stmt) return Fail(stmt.get_error().Wrap("deleting command " + id));
    Status st = stmt.value().Bind(1, id);
    if (st) st = stmt.value().Run();
    if (!st) return Fail(st.get_error().Wrap("deleting command " + id));
  }
  return Ok();
}

namespace detail {

inline Result<std::vector<std::string>> ReadIndexed(Transaction& tx,
                                                    const std::string& table,
                                                    const std::string& column,
                                                    const std::string& id) {
  using R = Result<std::vector<std::string>>;
  auto stmt = tx.Prepare("SELECT " + column + " FROM " + table +
                         " WHERE command_id = ? ORDER BY idx");
  if (!stmt) return R::error(stmt.get_error());
  Status st = stmt.value().Bind(1, id);
  if (!st) return R::error(st.get_error());

  std::vector<std::string> out;
  for (;;) {
    auto row = stmt.value().Step();
    if (!row) return R::error(row.get_error());
    if (!row.value()) break;
    out.push_back(stmt.value().ColumnText(0));
  }
  return R::success(std::move(out));
}

}  // namespace detail

/**
 * @brief Rebuild the commands persisted for @p group, in persistence order.
 *
 * Rebuilt commands carry their stored id, so Open() restarts them under the
 * same identity whichever scheme produced it.
 */
inline Result<std::vector<Command>> ForGroup(Transaction& tx,
                                             const std::string& group) {
  using R = Result<std::vector<Command>>;
  auto stmt = tx.Prepare(
      "SELECT command_id, path FROM commands WHERE group_name = ? ORDER BY rowid");
  if (!stmt) return R::error(stmt.get_error().Wrap("reading commands"));
  Status st = stmt.value().Bind(1, group);
  if (!st) return R::error(st.get_error().Wrap("reading commands"));

  std::vector<Command> cmds;
  for (;;) {
    auto row = stmt.value().Step();
    if (!row) return R::error(row.get_error().Wrap("reading commands"));
    if (!row.value()) break;
    Command cmd;
    cmd.id = stmt.value().ColumnText(0);
    cmd.path = stmt.value().ColumnText(1);
    cmds.push_back(std::move(cmd));
  }

  for (auto& cmd : cmds) {
    auto args = detail::ReadIndexed(tx, "command_args", "arg", cmd.id);
    if (!args) return R::error(args.get_error().Wrap("reading arguments of " + cmd.id));
    auto env = detail::ReadIndexed(tx, "command_env", "env_var", cmd.id);
    if (!env) return R::error(env.get_error().Wrap("reading environment of " + cmd.id));
    cmd.args = std::move(args.value());
    cmd.env = std::move(env.value());
  }
  return R::success(std::move(cmds));
}

/// @brief Group owning @p id, or empty when the command is not persisted.
inline Result<std::string> GroupOf(Transaction& tx, const std::string& id) {
  using R = Result<std::string>;
  auto stmt = tx.Prepare("SELECT group_name FROM commands WHERE command_id = ?");
  if (!stmt) return R::error(stmt.get_error().Wrap("looking up command"));
  Status st = stmt.value().Bind(1, id);
  if (!st) return R::error(st.get_error().Wrap("looking up command"));
  auto row = stmt.value().Step();
  if (!row) return R::error(row.get_error().Wrap("looking up command"));
  if (!row.value()) return R::success(std::string());
  return R::success(stmt.value().ColumnText(0));
}

}  // namespace command_store

}  // namespace pgs

#endif  // PGS_EVENT_LOG_HPP_
