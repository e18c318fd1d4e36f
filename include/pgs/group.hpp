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
 * @file group.hpp
 * @brief Group - in-memory supervisor for a set of concurrently running processes.
 *
 * Architecture:
 *   Start(cmd) --> Subprocess::Start --> CaptureSession::Attach (2 copy threads)
 *                        |
 *                 observer thread (one per process)
 *                        | Subprocess::Wait(), drain capture
 *                        v
 *                 CompletionBoard  <-- Wait() / AwaitExit() / Stop()
 *                 (mutex + condvar, exit records stamped with a sequence)
 *
 * Invariants:
 *   - A process is registered only after a successful launch.
 *   - De-registration is idempotent: the observer and Stop()/Remove() may
 *     race on the same process without double-accounting.
 *   - Wait() covers exactly the processes registered when it was called.
 *
 * Observer threads are detached and share ownership of the board and the
 * process entry, so a Group may be destroyed while its children still run.
 */

#ifndef PGS_GROUP_HPP_
#define PGS_GROUP_HPP_

#include "pgs/command.hpp"
#include "pgs/error.hpp"
#include "pgs/log.hpp"
#include "pgs/output_capture.hpp"
#include "pgs/process.hpp"

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <signal.h>

namespace pgs {

struct GroupOptions {
  /// Kill-then-wait budget for Stop()/Remove().
  std::chrono::milliseconds stop_grace{2000};
  /// How long an observer waits for the capture loops after the child exits.
  std::chrono::milliseconds drain_timeout{1000};
};

/// @brief Point-in-time view of a registered process.
struct ProcessInfo {
  std::string id;
  Command command;
  pid_t pid = -1;
  bool running = true;
  WaitResult result;  ///< Valid when running == false
};

class Group {
 public:
  explicit Group(std::string name, const OutputCapture* capture = nullptr,
                 GroupOptions opts = GroupOptions())
      : name_(std::move(name)),
        capture_(capture),
        opts_(opts),
        board_(std::make_shared<CompletionBoard>()) {}

  Group(const Group&) = delete;
  Group& operator=(const Group&) = delete;

  /**
   * @brief Launch @p cmd, register it and start observing its exit.
   *
   * Returns as soon as the process is running. Capture files are created
   * before the launch. On failure nothing is registered.
   *
   * @return The child pid, or kInvalidArgument / kAlreadyExists / kIo / kLaunch.
   */
  Result<pid_t> Start(const Command& cmd) {
    auto id = GetCommandId(cmd);
    if (!id) return Result<pid_t>::error(id.get_error());
    const std::string& cid = id.value();

    if (IsRegistered(cid)) {
      return Result<pid_t>::error(Error(ErrorCode::kAlreadyExists,
                                        "command " + cid + " already in group " + name_));
    }

    std::shared_ptr<CaptureSession> session;
    if (capture_ != nullptr) {
      auto prepared = capture_->Prepare(cid);
      if (!prepared) {
        return Result<pid_t>::error(prepared.get_error().Wrap("capturing output"));
      }
      session = prepared.value();
    }

    auto entry = std::make_shared<Entry>();
    entry->id = cid;
    entry->command = cmd;
    entry->capture = session;

    SubprocessConfig cfg;
    cfg.path = cmd.path;
    cfg.argv = cmd.args;
    cfg.env = cmd.env;
    cfg.capture_stdout = (session != nullptr);
    cfg.capture_stderr = (session != nullptr);

    auto started = entry->proc.Start(cfg);
    if (!started) {
      Error err = started.get_error();
      err.command_id = cid;
      return Result<pid_t>::error(err);
    }
    entry->pid = entry->proc.GetPid();
    if (session) {
      session->Attach(entry->proc.ReleaseStdout(), entry->proc.ReleaseStderr());
    }

    {
      std::lock_guard<std::mutex> lock(board_->mtx);
      for (const auto& e : entries_) {
        if (e->id == cid) {
          // Lost a race with a concurrent Start of the same command; the
          // Subprocess destructor kills and reaps the duplicate.
          return Result<pid_t>::error(Error(
              ErrorCode::kAlreadyExists, "command " + cid + " already in group " + name_));
        }
      }
      entries_.push_back(entry);
    }

    SpawnObserver(entry);
    PGS_LOG_INFO("Group", "[%s] started %.12s pid=%d (%s)", name_.c_str(),
                 cid.c_str(), static_cast<int>(entry->pid),
                 DescribeCommand(cmd).c_str());
    return Result<pid_t>::success(entry->pid);
  }

  /**
   * @brief Deliver @p signo to every registered process.
   *
   * Stops at the first failed delivery; earlier deliveries stand.
   * Processes that already exited are skipped silently.
   */
  Status Signal(int signo) {
    for (const auto& e : Snapshot()) {
      ProcessResult r = e->proc.Signal(signo);
      if (r == ProcessResult::kFailed) {
        Error err = Error::FromErrno(ErrorCode::kSignal,
                                     "signalling pid " + std::to_string(e->pid), errno);
        err.command_id = e->id;
        return Fail(err);
      }
    }
    return Ok();
  }

  /**
   * @brief Kill one process by pid and remove it from the group.
   * @return kNotFound for an unknown pid, kSignal if SIGKILL could not be
   *         delivered, kWaitTimeout if the exit was not observed in time
   *         (the process is de-registered regardless).
   */
  Status Stop(pid_t pid) {
    std::shared_ptr<Entry> target;
    {
      std::lock_guard<std::mutex> lock(board_->mtx);
      for (const auto& e : entries_) {
        if (e->pid == pid) {
          target = e;
          break;
        }
      }
    }
    if (!target) {
      return Fail(Error(ErrorCode::kNotFound,
                        "process " + std::to_string(pid) + " not found"));
    }
    return StopEntry(target);
  }

  /**
   * @brief Kill and remove the processes whose identity is in @p ids.
   *
   * An empty @p ids stops every process. Every target is attempted; the
   * first error is returned. Unknown ids are ignored.
   */
  Status Remove(const std::vector<std::string>& ids = {}) {
    std::vector<std::shared_ptr<Entry>> targets;
    for (const auto& e : Snapshot()) {
      if (ids.empty() || std::find(ids.begin(), ids.end(), e->id) != ids.end()) {
        targets.push_back(e);
      }
    }
    Status first = Ok();
    for (const auto& e : targets) {
      Status st = StopEntry(e);
      if (!st && first) first = st;
    }
    return first;
  }

  /**
   * @brief Block until all processes registered now have exited, one of them
   *        failed, or @p timeout elapsed.
   *
   * @return Ok, the earliest observed process failure (kProcessExit, with
   *         command_id set), or kWaitTimeout. Live state is never modified.
   */
  Status Wait(std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    std::unique_lock<std::mutex> lock(board_->mtx);
    const std::vector<std::shared_ptr<Entry>> batch = entries_;

    for (;;) {
      const Entry* failed = nullptr;
      bool all_done = true;
      for (const auto& e : batch) {
        if (e->removed) continue;
        if (!e->exited) {
          all_done = false;
          continue;
        }
        if (!e->result.Success() &&
            (failed == nullptr || e->exit_seq < failed->exit_seq)) {
          failed = e.get();
        }
      }
      if (failed != nullptr) {
        Error err(ErrorCode::kProcessExit,
                  "command " + failed->id + " (" +
                      detail::Basename(failed->command.Program().c_str()) +
                      "): " + DescribeExit(failed->result));
        err.command_id = failed->id;
        return Fail(err);
      }
      if (all_done) return Ok();
      if (board_->cv.wait_until(lock, deadline) == std::cv_status::timeout &&
          std::chrono::steady_clock::now() >= deadline) {
        return Fail(Error(ErrorCode::kWaitTimeout,
                          "timeout after " + std::to_string(timeout.count()) + "ms"));
      }
    }
  }

  /**
   * @brief Block until every registered process has exited, whatever its
   *        exit status. Used for teardown after a SIGKILL.
   */
  Status AwaitExit(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(board_->mtx);
    const std::vector<std::shared_ptr<Entry>> batch = entries_;
    bool done = board_->cv.wait_for(lock, timeout, [&batch] {
      for (const auto& e : batch) {
        if (!e->exited) return false;
      }
      return true;
    });
    if (!done) {
      return Fail(Error(ErrorCode::kWaitTimeout,
                        "processes still running after " +
                            std::to_string(timeout.count()) + "ms"));
    }
    return Ok();
  }

  /// @brief Forget every process without signalling it.
  void Clear() {
    std::lock_guard<std::mutex> lock(board_->mtx);
    for (const auto& e : entries_) e->removed = true;
    entries_.clear();
  }

  /// @brief Snapshot of registered processes in start order. May be stale.
  std::vector<ProcessInfo> Commands() const {
    std::lock_guard<std::mutex> lock(board_->mtx);
    std::vector<ProcessInfo> out;
    out.reserve(entries_.size());
    for (const auto& e : entries_) {
      ProcessInfo info;
      info.id = e->id;
      info.command = e->command;
      info.pid = e->pid;
      info.running = !e->exited;
      info.result = e->result;
      out.push_back(std::move(info));
    }
    return out;
  }

  size_t Size() const {
    std::lock_guard<std::mutex> lock(board_->mtx);
    return entries_.size();
  }

  const std::string& Name() const noexcept { return name_; }

 private:
  struct Entry {
    std::string id;
    Command command;
    Subprocess proc;
    pid_t pid = -1;
    std::shared_ptr<CaptureSession> capture;
    // Guarded by CompletionBoard::mtx.
    bool exited = false;
    bool removed = false;
    WaitResult result;
    uint64_t exit_seq = 0;
  };

  struct CompletionBoard {
    std::mutex mtx;
    std::condition_variable cv;
    uint64_t next_seq = 1;
  };

  void SpawnObserver(const std::shared_ptr<Entry>& entry) {
    std::shared_ptr<CompletionBoard> board = board_;
    const std::chrono::milliseconds drain = opts_.drain_timeout;
    const std::string group = name_;
    std::thread([board, entry, drain, group]() {
      WaitResult wr = entry->proc.Wait();
      if (entry->capture && !entry->capture->WaitDrained(drain)) {
        PGS_LOG_WARN("Group", "[%s] output of %.12s not drained after exit",
                     group.c_str(), entry->id.c_str());
      }
      {
        std::lock_guard<std::mutex> lock(board->mtx);
        entry->result = wr;
        entry->exited = true;
        entry->exit_seq = board->next_seq++;
      }
      board->cv.notify_all();
      if (wr.Success()) {
        PGS_LOG_DEBUG("Group", "[%s] %.12s pid=%d finished", group.c_str(),
                      entry->id.c_str(), static_cast<int>(entry->pid));
      } else {
        PGS_LOG_INFO("Group", "[%s] %.12s pid=%d %s", group.c_str(),
                     entry->id.c_str(), static_cast<int>(entry->pid),
                     DescribeExit(wr).c_str());
      }
    }).detach();
  }

  Status StopEntry(const std::shared_ptr<Entry>& entry) {
    ProcessResult r = entry->proc.Signal(SIGKILL);
    if (r == ProcessResult::kFailed) {
      Error err = Error::FromErrno(ErrorCode::kSignal,
                                   "sending kill signal to pid " +
                                       std::to_string(entry->pid), errno);
      err.command_id = entry->id;
      return Fail(err);
    }

    std::unique_lock<std::mutex> lock(board_->mtx);
    bool exited = board_->cv.wait_for(lock, opts_.stop_grace,
                                      [&entry] { return entry->exited; });
    Deregister(entry);
    lock.unlock();

    if (!exited) {
      Error err(ErrorCode::kWaitTimeout,
                "waiting for pid " + std::to_string(entry->pid) + " to finish");
      err.command_id = entry->id;
      return Fail(err);
    }
    PGS_LOG_DEBUG("Group", "[%s] stopped %.12s", name_.c_str(), entry->id.c_str());
    return Ok();
  }

  /// @brief Erase @p entry if still registered. Caller holds board_->mtx.
  void Deregister(const std::shared_ptr<Entry>& entry) {
    entry->removed = true;
    auto it = std::find(entries_.begin(), entries_.end(), entry);
    if (it != entries_.end()) entries_.erase(it);
  }

  bool IsRegistered(const std::string& id) const {
    std::lock_guard<std::mutex> lock(board_->mtx);
    for (const auto& e : entries_) {
      if (e->id == id) return true;
    }
    return false;
  }

  std::vector<std::shared_ptr<Entry>> Snapshot() const {
    std::lock_guard<std::mutex> lock(board_->mtx);
    return entries_;
  }

  std::string name_;
  const OutputCapture* capture_;
  GroupOptions opts_;
  std::shared_ptr<CompletionBoard> board_;
  std::vector<std::shared_ptr<Entry>> entries_;  // guarded by board_->mtx
};

}  // namespace pgs

#endif  // PGS_GROUP_HPP_
