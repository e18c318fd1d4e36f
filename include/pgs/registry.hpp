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
 * @file registry.hpp
 * @brief Registry - named, persistent process groups.
 *
 * The Registry pairs every live Group with its durable record:
 *
 *   Create/Open/Close/Remove
 *        |  Database::Begin()            (serializes writers)
 *        |  command_store / event_log    (rows + append-only events)
 *        |  Group::Start / Signal / Remove (live processes)
 *        v  Transaction::Commit()
 *
 * A failure anywhere before the commit rolls the durable side back; processes
 * already spawned by the failed call keep running (OS side effects are not
 * compensated).
 *
 * The name -> Group map is guarded by a std::shared_mutex that is held only
 * for lookup, insert and erase. Map mutations additionally happen inside a
 * transaction, which makes "check absent, then insert" atomic across callers.
 */

#ifndef PGS_REGISTRY_HPP_
#define PGS_REGISTRY_HPP_

#include "pgs/command.hpp"
#include "pgs/config.hpp"
#include "pgs/error.hpp"
#include "pgs/event_log.hpp"
#include "pgs/group.hpp"
#include "pgs/log.hpp"
#include "pgs/output_capture.hpp"
#include "pgs/schema.hpp"
#include "pgs/store.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <shared_mutex>
#include <string>
#include <vector>

#include <signal.h>
#include <sys/stat.h>

namespace pgs {

// ============================================================================
// LogScanner
// ============================================================================

/**
 * @brief Line reader over one capture file. Owns the file handle.
 *
 * @code
 *   auto scanner = registry->Logs(id, 1);
 *   while (scanner.value().Scan()) puts(scanner.value().Text().c_str());
 * @endcode
 */
class LogScanner {
 public:
  explicit LogScanner(FILE* file) : file_(file) {}
  ~LogScanner() {
    if (file_ != nullptr) std::fclose(file_);
  }

  LogScanner(LogScanner&& other) noexcept
      : file_(other.file_), line_(std::move(other.line_)) {
    other.file_ = nullptr;
  }
  LogScanner& operator=(LogScanner&&) = delete;
  LogScanner(const LogScanner&) = delete;
  LogScanner& operator=(const LogScanner&) = delete;

  /**
   * @brief Advance to the next line.
   * @return false at end of file. A final line without '\n' is still returned.
   */
  bool Scan() {
    line_.clear();
    if (file_ == nullptr) return false;
    char buf[512];
    bool got = false;
    while (std::fgets(buf, sizeof(buf), file_) != nullptr) {
      got = true;
      line_ += buf;
      if (!line_.empty() && line_.back() == '\n') {
        line_.pop_back();
        return true;
      }
    }
    return got;
  }

  /// @brief Current line without its trailing newline.
  const std::string& Text() const noexcept { return line_; }

 private:
  FILE* file_;
  std::string line_;
};

// ============================================================================
// Registry
// ============================================================================

class Registry {
 public:
  /**
   * @brief Open (creating if needed) the supervisor state under cfg.root.
   *
   * Runs Recover() when cfg.recover_on_start is set.
   */
  static Result<std::unique_ptr<Registry>> Init(const SupervisorConfig& cfg) {
    using R = Result<std::unique_ptr<Registry>>;
    Status st = EnsureDirectory(cfg.root);
    if (!st) return R::error(st.get_error().Wrap("initializing supervisor"));

    auto db = Database::Open(cfg.DbPath(), schema::kCreateTables);
    if (!db) return R::error(db.get_error().Wrap("initializing supervisor"));

    std::unique_ptr<Registry> reg(new Registry(cfg, std::move(db.value())));
    PGS_LOG_INFO("Registry", "state in %s", cfg.root.c_str());

    if (cfg.recover_on_start) {
      auto names = reg->Recover();
      if (!names) return R::error(names.get_error().Wrap("initializing supervisor"));
    }
    return R::success(std::move(reg));
  }

  Registry(const Registry&) = delete;
  Registry& operator=(const Registry&) = delete;

  /**
   * @brief Persist @p cmds as group @p name and start them.
   * @return kAlreadyExists if @p name is live, a command repeats, or a
   *         command is still persisted (a closed group is restarted by Open),
   *         kInvalidArgument for an empty argument list, or the first
   *         launch / store failure.
   */
  Status Create(const std::string& name, const std::vector<Command>& cmds) {
    std::vector<std::string> ids;
    ids.reserve(cmds.size());
    for (const auto& cmd : cmds) {
      auto id = GetCommandId(cmd);
      if (!id) return Fail(id.get_error().Wrap("creating group " + name));
      for (const auto& seen : ids) {
        if (seen == id.value()) {
          Error err(ErrorCode::kAlreadyExists,
                    "creating group " + name + ": command " + seen + " given twice");
          err.command_id = seen;
          return Fail(err);
        }
      }
      ids.push_back(id.value());
    }

    auto tx = db_->Begin();
    if (!tx) return Fail(tx.get_error().Wrap("creating group " + name));
    if (Find(name)) {
      return Fail(Error(ErrorCode::kAlreadyExists, "group " + name + " already exists"));
    }

    for (size_t i = 0; i < cmds.size(); ++i) {
      auto owner = command_store::GroupOf(tx.value(), ids[i]);
      if (!owner) return Fail(owner.get_error().Wrap("creating group " + name));
      if (!owner.value().empty()) {
        const std::string hint = (owner.value() == name)
                                     ? "; use Open to restart it"
                                     : " by group " + owner.value();
        Error err(ErrorCode::kAlreadyExists, "creating group " + name + ": command " +
                                                 ids[i] + " is already persisted" + hint);
        err.command_id = ids[i];
        return Fail(err);
      }
      Status st = command_store::Insert(tx.value(), name, ids[i], cmds[i]);
      if (!st) return Fail(st.get_error().Wrap("creating group " + name));
    }
    auto seq = event_log::Append(tx.value(), action::kGroupCreated, "", name);
    if (!seq) return Fail(seq.get_error().Wrap("creating group " + name));

    auto group = NewGroup(name);
    Status st = StartAll(tx.value(), *group, cmds);
    if (!st) return Fail(st.get_error().Wrap("creating group " + name));

    st = Publish(tx.value(), name, group);
    if (!st) return Fail(st.get_error().Wrap("creating group " + name));
    return Ok();
  }

  /**
   * @brief Start every command persisted for @p name.
   * @return The commands that were started, in persistence order.
   */
  Result<std::vector<Command>> Open(const std::string& name) {
    using R = Result<std::vector<Command>>;
    auto tx = db_->Begin();
    if (!tx) return R::error(tx.get_error().Wrap("opening group " + name));
    if (Find(name)) {
      return R::error(Error(ErrorCode::kAlreadyExists, "group " + name + " already open"));
    }

    auto cmds = command_store::ForGroup(tx.value(), name);
    if (!cmds) return R::error(cmds.get_error().Wrap("opening group " + name));

    auto group = NewGroup(name);
    Status st = StartAll(tx.value(), *group, cmds.value());
    if (!st) return R::error(st.get_error().Wrap("opening group " + name));

    st = Publish(tx.value(), name, group);
    if (!st) return R::error(st.get_error().Wrap("opening group " + name));
    return R::success(std::move(cmds.value()));
  }

  /**
   * @brief Re-open every group the event log shows as still running.
   *
   * Groups that are already live are skipped. Stops at the first failure;
   * groups opened before it stay open.
   */
  Result<std::vector<std::string>> Recover() {
    using R = Result<std::vector<std::string>>;
    std::vector<std::string> active;
    {
      auto tx = db_->Begin();
      if (!tx) return R::error(tx.get_error().Wrap("recovering"));
      auto replayed = event_log::Replay(tx.value());
      if (!replayed) return R::error(replayed.get_error().Wrap("recovering"));
      active = std::move(replayed.value());
      Status st = tx.value().Commit();
      if (!st) return R::error(st.get_error().Wrap("recovering"));
    }

    std::vector<std::string> opened;
    for (const auto& name : active) {
      if (Find(name)) continue;
      auto cmds = Open(name);
      if (!cmds) return R::error(cmds.get_error().Wrap("recovering"));
      PGS_LOG_INFO("Registry", "recovered group %s (%zu commands)", name.c_str(),
                   cmds.value().size());
      opened.push_back(name);
    }
    return R::success(std::move(opened));
  }

  /**
   * @brief Kill every process of @p name and forget the live group.
   *
   * Closing an unknown group succeeds. Exceeding the close grace period is
   * reported, but the stop events are committed and the group is forgotten.
   */
  Status Close(const std::string& name) {
    auto tx = db_->Begin();
    if (!tx) return Fail(tx.get_error().Wrap("closing group " + name));
    std::shared_ptr<Group> group = Find(name);
    if (!group) {
      PGS_LOG_DEBUG("Registry", "close of unknown group %s", name.c_str());
      return Ok();
    }

    for (const auto& info : group->Commands()) {
      auto seq = event_log::Append(tx.value(), action::kCommandStopped, info.id, name);
      if (!seq) return Fail(seq.get_error().Wrap("closing group " + name));
    }

    Status st = group->Signal(SIGKILL);
    if (!st) return Fail(st.get_error().Wrap("closing group " + name));
    Status drained = group->AwaitExit(cfg_.close_grace);
    group->Clear();
    Erase(name);

    st = tx.value().Commit();
    if (!st) return Fail(st.get_error().Wrap("closing group " + name));
    if (!drained) {
      PGS_LOG_WARN("Registry", "group %s: %s", name.c_str(),
                   drained.get_error().what());
      return Fail(drained.get_error().Wrap("closing group " + name));
    }
    PGS_LOG_INFO("Registry", "closed group %s", name.c_str());
    return Ok();
  }

  /**
   * @brief Delete @p cmds (all commands when empty) from group @p name and
   *        stop their processes.
   *
   * Appends command_stopped per command, and group_removed once no command
   * of the group remains persisted. The durable changes are committed before
   * the processes are stopped; a failed stop is still reported.
   *
   * @return kNotFound if the group is not live or a command is not a member.
   */
  Status Remove(const std::string& name, const std::vector<Command>& cmds = {}) {
    const std::string ctx = "removing from group " + name;
    std::shared_ptr<Group> group = Find(name);
    if (!group) {
      return Fail(Error(ErrorCode::kNotFound, "group " + name + " not found"));
    }

    auto tx = db_->Begin();
    if (!tx) return Fail(tx.get_error().Wrap(ctx));

    std::vector<std::string> ids;
    if (cmds.empty()) {
      auto persisted = command_store::ForGroup(tx.value(), name);
      if (!persisted) return Fail(persisted.get_error().Wrap(ctx));
      for (const auto& c : persisted.value()) ids.push_back(c.id);
      for (const auto& info : group->Commands()) {
        if (std::find(ids.begin(), ids.end(), info.id) == ids.end()) {
          ids.push_back(info.id);
        }
      }
    } else {
      for (const auto& cmd : cmds) {
        auto id = GetCommandId(cmd);
        if (!id) return Fail(id.get_error().Wrap(ctx));
        auto owner = command_store::GroupOf(tx.value(), id.value());
        if (!owner) return Fail(owner.get_error().Wrap(ctx));
        if (owner.value() != name) {
          Error err(ErrorCode::kNotFound,
                    ctx + ": command " + id.value() + " is not a member");
          err.command_id = id.value();
          return Fail(err);
        }
        ids.push_back(id.value());
      }
    }

    for (const auto& id : ids) {
      Status st = command_store::Delete(tx.value(), id);
      if (!st) return Fail(st.get_error().Wrap(ctx));
      auto seq = event_log::Append(tx.value(), action::kCommandStopped, id, name);
      if (!seq) return Fail(seq.get_error().Wrap(ctx));
    }

    auto left = command_store::ForGroup(tx.value(), name);
    if (!left) return Fail(left.get_error().Wrap(ctx));
    if (left.value().empty()) {
      auto seq = event_log::Append(tx.value(), action::kGroupRemoved, "", name);
      if (!seq) return Fail(seq.get_error().Wrap(ctx));
    }

    Status st = tx.value().Commit();
    if (!st) return Fail(st.get_error().Wrap(ctx));

    // Kill-then-wait runs after the commit so other groups can use the store
    // meanwhile. An empty list would mean "everything" to the group.
    if (!ids.empty()) {
      Status stopped = group->Remove(ids);
      if (!stopped) return Fail(stopped.get_error().Wrap(ctx));
    }
    PGS_LOG_INFO("Registry", "removed %zu command(s) from group %s", ids.size(),
                 name.c_str());
    return Ok();
  }

  /// @brief Deliver @p signo to every process of @p name.
  Status Signal(const std::string& name, int signo) {
    std::shared_ptr<Group> group = Find(name);
    if (!group) {
      return Fail(Error(ErrorCode::kNotFound, "group " + name + " not found"));
    }
    Status st = group->Signal(signo);
    if (!st) return Fail(st.get_error().Wrap("signalling group " + name));
    return Ok();
  }

  /**
   * @brief Wait for the processes of @p name (bounded by wait_timeout).
   * @return The first process failure, kWaitTimeout, or kNotFound.
   */
  Status Wait(const std::string& name) {
    std::shared_ptr<Group> group = Find(name);
    if (!group) {
      return Fail(Error(ErrorCode::kNotFound, "group " + name + " not found"));
    }
    Status st = group->Wait(cfg_.wait_timeout);
    if (!st) return Fail(st.get_error().Wrap("waiting for group " + name));
    return Ok();
  }

  /// @brief Live processes of @p name; empty optional if the group is not live.
  optional<std::vector<ProcessInfo>> Commands(const std::string& name) const {
    std::shared_ptr<Group> group = Find(name);
    if (!group) return {};
    return group->Commands();
  }

  /**
   * @brief Open the captured output of @p command_id.
   * @param stream 1 (stdout) or 2 (stderr).
   */
  Result<LogScanner> Logs(const std::string& command_id, int stream) const {
    using R = Result<LogScanner>;
    if (stream != static_cast<int>(Stream::kStdout) &&
        stream != static_cast<int>(Stream::kStderr)) {
      return R::error(Error(ErrorCode::kInvalidArgument,
                            "invalid stream " + std::to_string(stream)));
    }
    if (command_id.empty() || command_id.find('/') != std::string::npos) {
      return R::error(Error(ErrorCode::kInvalidArgument,
                            "invalid command id '" + command_id + "'"));
    }
    const std::string path =
        CapturePath(capture_.Root(), command_id, static_cast<Stream>(stream));
    FILE* f = std::fopen(path.c_str(), "r");
    if (f == nullptr) {
      const ErrorCode code = (errno == ENOENT) ? ErrorCode::kNotFound : ErrorCode::kIo;
      Error err = Error::FromErrno(code, "opening " + path, errno);
      err.command_id = command_id;
      return R::error(err);
    }
    return R::success(LogScanner(f));
  }

  /// @brief Logs() with the stream given by name: "stdout" or "stderr".
  Result<LogScanner> Logs(const std::string& command_id,
                          const std::string& stream) const {
    if (stream == StreamSuffix(Stream::kStdout)) {
      return Logs(command_id, static_cast<int>(Stream::kStdout));
    }
    if (stream == StreamSuffix(Stream::kStderr)) {
      return Logs(command_id, static_cast<int>(Stream::kStderr));
    }
    return Result<LogScanner>::error(
        Error(ErrorCode::kInvalidArgument, "invalid stream '" + stream + "'"));
  }

  /// @brief Event log entries of @p name in sequence order.
  Result<std::vector<LogEntry>> History(const std::string& name) {
    using R = Result<std::vector<LogEntry>>;
    auto tx = db_->Begin();
    if (!tx) return R::error(tx.get_error().Wrap("reading history of " + name));
    auto entries = event_log::History(tx.value(), name);
    if (!entries) return R::error(entries.get_error().Wrap("reading history of " + name));
    Status st = tx.value().Commit();
    if (!st) return R::error(st.get_error().Wrap("reading history of " + name));
    return entries;
  }

  /// @brief Names of the live groups, sorted.
  std::vector<std::string> Groups() const {
    std::shared_lock<std::shared_mutex> lock(mtx_);
    std::vector<std::string> out;
    out.reserve(groups_.size());
    for (const auto& kv : groups_) out.push_back(kv.first);
    return out;
  }

  const SupervisorConfig& Config() const noexcept { return cfg_; }

 private:
  Registry(const SupervisorConfig& cfg, std::unique_ptr<Database> db)
      : cfg_(cfg), capture_(cfg.root), db_(std::move(db)) {}

  static Status EnsureDirectory(const std::string& path) {
    struct stat sb;
    if (stat(path.c_str(), &sb) == 0) {
      if (!S_ISDIR(sb.st_mode)) {
        return Fail(Error(ErrorCode::kIo, path + " exists and is not a directory"));
      }
      return Ok();
    }
    if (errno != ENOENT) return Fail(Error::FromErrno(ErrorCode::kIo, "stat " + path, errno));

    const size_t slash = path.find_last_of('/');
    if (slash != std::string::npos && slash > 0) {
      Status st = EnsureDirectory(path.substr(0, slash));
      if (!st) return st;
    }
    if (mkdir(path.c_str(), 0755) != 0 && errno != EEXIST) {
      return Fail(Error::FromErrno(ErrorCode::kIo, "creating " + path, errno));
    }
    return Ok();
  }

  std::shared_ptr<Group> NewGroup(const std::string& name) const {
    GroupOptions opts;
    opts.stop_grace = cfg_.stop_grace;
    opts.drain_timeout = cfg_.drain_timeout;
    return std::make_shared<Group>(name, &capture_, opts);
  }

  /// @brief Start @p cmds in order, appending command_started for each.
  static Status StartAll(Transaction& tx, Group& group,
                         const std::vector<Command>& cmds) {
    for (const auto& cmd : cmds) {
      auto pid = group.Start(cmd);
      if (!pid) return Fail(pid.get_error().Wrap("starting " + DescribeCommand(cmd)));
      auto id = GetCommandId(cmd);
      if (!id) return Fail(id.get_error());
      auto seq = event_log::Append(tx, action::kCommandStarted, id.value(), group.Name());
      if (!seq) return Fail(seq.get_error());
    }
    return Ok();
  }

  /// @brief Register @p group and commit; on commit failure it is unregistered.
  Status Publish(Transaction& tx, const std::string& name,
                 const std::shared_ptr<Group>& group) {
    {
      std::unique_lock<std::shared_mutex> lock(mtx_);
      groups_[name] = group;
    }
    Status st = tx.Commit();
    if (!st) {
      Erase(name);
      return st;
    }
    PGS_LOG_INFO("Registry", "group %s live with %zu process(es)", name.c_str(),
                 group->Size());
    return Ok();
  }

  std::shared_ptr<Group> Find(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(mtx_);
    auto it = groups_.find(name);
    return (it != groups_.end()) ? it->second : nullptr;
  }

  void Erase(const std::string& name) {
    std::unique_lock<std::shared_mutex> lock(mtx_);
    groups_.erase(name);
  }

  SupervisorConfig cfg_;
  OutputCapture capture_;
  std::unique_ptr<Database> db_;
  mutable std::shared_mutex mtx_;
  std::map<std::string, std::shared_ptr<Group>> groups_;
};

}  // namespace pgs

#endif  // PGS_REGISTRY_HPP_
