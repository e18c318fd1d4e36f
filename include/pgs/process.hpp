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
 * @file process.hpp
 * @brief Child process launch primitive: spawn, signal, wait, pipe capture.
 *
 * Header-only, Linux-only (fork(2), waitid(2), pipe2(2)).
 *
 * Features:
 *   - Subprocess::Start: argv + environment, PATH lookup, stdout/stderr pipes
 *   - Exec failures reported synchronously through a close-on-exec status
 *     pipe, so a missing program is a Start() error and not a late exit 127
 *   - Signal: never targets a reaped pid (no pid-reuse misdelivery)
 *   - Wait: observes exit with WNOWAIT, then reaps under the handle lock, so
 *     one thread may block in Wait() while others call Signal()
 *
 * Inspired by reproc, subprocess.h, and TinyProcessLibrary.
 */

#ifndef PGS_PROCESS_HPP_
#define PGS_PROCESS_HPP_

#include "pgs/error.hpp"
#include "pgs/log.hpp"
#include "pgs/platform.hpp"

#if defined(PGS_PLATFORM_LINUX)

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <mutex>
#include <string>
#include <vector>

#include <fcntl.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <time.h>
#include <unistd.h>

namespace pgs {

// ============================================================================
// ProcessResult
// ============================================================================

enum class ProcessResult : int8_t {
  kSuccess = 0,
  kAlreadyExited = -1,  ///< Target already exited (and possibly reaped)
  kFailed = -2,         ///< Signal delivery failed
};

namespace detail {

/// @brief Sleep for @p ms milliseconds (nanosleep, not deprecated usleep).
inline void SleepMs(uint32_t ms) {
  struct timespec ts;
  ts.tv_sec = static_cast<time_t>(ms / 1000U);
  ts.tv_nsec = static_cast<long>(ms % 1000U) * 1000000L;  // NOLINT
  nanosleep(&ts, nullptr);
}

/// @brief Extract basename from a path (e.g., "/usr/bin/foo" -> "foo").
inline const char* Basename(const char* path) {
  const char* last_slash = nullptr;
  for (const char* p = path; *p != '\0'; ++p) {
    if (*p == '/')
      last_slash = p;
  }
  return last_slash ? (last_slash + 1) : path;
}

// ============================================================================
// PipeGuard - RAII wrapper for close-on-exec pipe file descriptors
// ============================================================================

class PipeGuard {
 public:
  PipeGuard() : fd_{-1, -1} {}
  ~PipeGuard() { CloseAll(); }

  /// @brief Create a pipe with both ends O_CLOEXEC. Returns false on failure.
  bool Create() { return pipe2(fd_, O_CLOEXEC) == 0; }

  int ReadEnd() const { return fd_[0]; }
  int WriteEnd() const { return fd_[1]; }

  void CloseRead() {
    if (fd_[0] >= 0) {
      close(fd_[0]);  // NOLINT
      fd_[0] = -1;
    }
  }
  void CloseWrite() {
    if (fd_[1] >= 0) {
      close(fd_[1]);  // NOLINT
      fd_[1] = -1;
    }
  }
  void CloseAll() {
    CloseRead();
    CloseWrite();
  }

  /// @brief Release read-end ownership (caller takes responsibility).
  int ReleaseRead() {
    int r = fd_[0];
    fd_[0] = -1;
    return r;
  }

  PipeGuard(const PipeGuard&) = delete;
  PipeGuard& operator=(const PipeGuard&) = delete;

 private:
  int fd_[2];
};

/// @brief Build a NULL-terminated char* array viewing @p strs.
inline std::vector<char*> MakeCArray(const std::vector<std::string>& strs) {
  std::vector<char*> out;
  out.reserve(strs.size() + 1);
  for (const auto& s : strs) {
    out.push_back(const_cast<char*>(s.c_str()));
  }
  out.push_back(nullptr);
  return out;
}

}  // namespace detail

/// @brief Check if a process exists and can receive signals.
inline bool IsProcessAlive(pid_t pid) {
  return kill(pid, 0) == 0;
}

// ============================================================================
// Subprocess
// ============================================================================

/// @brief Subprocess configuration.
struct SubprocessConfig {
  /// Executable; empty means argv[0]. Names without '/' are searched in PATH.
  std::string path;
  /// argv[0] is the program name. Must not be empty.
  std::vector<std::string> argv;
  /// KEY=VALUE entries. Empty means inherit the caller's environment.
  std::vector<std::string> env;
  bool capture_stdout = true;
  bool capture_stderr = true;
};

/// @brief Exit status reported by Subprocess::Wait().
struct WaitResult {
  bool exited;      ///< true if child exited normally
  int exit_code;    ///< Exit code (valid if exited==true)
  bool signaled;    ///< true if child was killed by signal
  int term_signal;  ///< Signal number (valid if signaled==true)

  WaitResult() : exited(false), exit_code(-1), signaled(false), term_signal(0) {}

  bool Success() const { return exited && exit_code == 0; }
};

/**
 * @brief Child process handle.
 *
 * RAII: destructor closes unreleased pipes and kills + reaps the child if it
 * was never waited for. Non-copyable and non-movable (owns a mutex); hold it
 * through a smart pointer to share it with an observer thread.
 *
 * Usage:
 * @code
 *   pgs::SubprocessConfig cfg;
 *   cfg.argv = {"echo", "hello"};
 *
 *   pgs::Subprocess proc;
 *   auto st = proc.Start(cfg);
 *   if (st) {
 *     std::string out = proc.ReadAllStdout();
 *     pgs::WaitResult wr = proc.Wait();
 *   }
 * @endcode
 */
class Subprocess {
 public:
  Subprocess() : pid_(-1), stdout_fd_(-1), stderr_fd_(-1) {}

  ~Subprocess() {
    if (stdout_fd_ >= 0)
      close(stdout_fd_);  // NOLINT
    if (stderr_fd_ >= 0)
      close(stderr_fd_);  // NOLINT
    if (pid_ > 0) {
      kill(pid_, SIGKILL);
      int status;
      waitpid(pid_, &status, 0);
    }
  }

  Subprocess(const Subprocess&) = delete;
  Subprocess& operator=(const Subprocess&) = delete;
  Subprocess(Subprocess&&) = delete;
  Subprocess& operator=(Subprocess&&) = delete;

  /**
   * @brief Spawn the child process.
   *
   * The child runs in its own session with default signal dispositions and
   * stdin on /dev/null.
   *
   * @return kInvalidArgument for an empty argv, kLaunch when pipe/fork/exec
   *         fails (exec errno included in the message).
   */
  Status Start(const SubprocessConfig& cfg) {
    if (cfg.argv.empty() || cfg.argv[0].empty()) {
      return Fail(Error(ErrorCode::kInvalidArgument, "empty argument list"));
    }
    if (pid_ > 0) {
      return Fail(Error(ErrorCode::kLaunch, "subprocess already started"));
    }

    const std::string& program = cfg.path.empty() ? cfg.argv[0] : cfg.path;
    std::vector<char*> argv = detail::MakeCArray(cfg.argv);
    std::vector<char*> envp = detail::MakeCArray(cfg.env);
    const bool inherit_env = cfg.env.empty();

    detail::PipeGuard stdout_pipe, stderr_pipe, status_pipe;
    if ((cfg.capture_stdout && !stdout_pipe.Create()) ||
        (cfg.capture_stderr && !stderr_pipe.Create()) || !status_pipe.Create()) {
      return Fail(Error::FromErrno(ErrorCode::kLaunch, "creating pipes", errno));
    }

    pid_t child = fork();
    if (child < 0) {
      return Fail(Error::FromErrno(ErrorCode::kLaunch, "fork", errno));
    }

    if (child == 0) {
      // -- Child process: async-signal-safe calls only --
      setsid();

      struct sigaction sa_dfl;
      std::memset(&sa_dfl, 0, sizeof(sa_dfl));
      sa_dfl.sa_handler = SIG_DFL;
      for (int sig = 1; sig < 32; ++sig) {
        sigaction(sig, &sa_dfl, nullptr);  // ignore errors for uncatchable
      }
      sigset_t empty;
      sigemptyset(&empty);
      sigprocmask(SIG_SETMASK, &empty, nullptr);

      int devnull = open("/dev/null", O_RDONLY);  // NOLINT
      if (devnull >= 0) {
        dup2(devnull, STDIN_FILENO);
        if (devnull != STDIN_FILENO)
          close(devnull);  // NOLINT
      }
      if (cfg.capture_stdout)
        dup2(stdout_pipe.WriteEnd(), STDOUT_FILENO);
      if (cfg.capture_stderr)
        dup2(stderr_pipe.WriteEnd(), STDERR_FILENO);

      if (inherit_env) {
        execvp(program.c_str(), argv.data());
      } else {
        execvpe(program.c_str(), argv.data(), envp.data());
      }
      int err = errno;
      ssize_t w = write(status_pipe.WriteEnd(), &err, sizeof(err));
      (void)w;
      _exit(127);
    }

    // -- Parent process --
    stdout_pipe.CloseWrite();
    stderr_pipe.CloseWrite();
    status_pipe.CloseWrite();

    int exec_errno = 0;
    ssize_t n;
    do {
      n = read(status_pipe.ReadEnd(), &exec_errno, sizeof(exec_errno));
    } while (n < 0 && errno == EINTR);

    if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
      int status;
      waitpid(child, &status, 0);
      return Fail(Error::FromErrno(ErrorCode::kLaunch,
                                   "launching '" + program + "'", exec_errno));
    }

    {
      std::lock_guard<std::mutex> lock(mtx_);
      pid_ = child;
    }
    stdout_fd_ = stdout_pipe.ReleaseRead();
    stderr_fd_ = stderr_pipe.ReleaseRead();
    PGS_LOG_DEBUG("Process", "started %s pid=%d", program.c_str(),
                  static_cast<int>(child));
    return Ok();
  }

  /**
   * @brief Block until the child exits and reap it.
   *
   * Only one thread may wait on a handle. Calls after the child has been
   * reaped return a default WaitResult immediately.
   */
  WaitResult Wait() {
    WaitResult wr;
    pid_t pid;
    {
      std::lock_guard<std::mutex> lock(mtx_);
      pid = pid_;
    }
    if (pid <= 0)
      return wr;

    // Observe the exit without reaping, so Signal() never sees a recycled pid.
    siginfo_t info;
    std::memset(&info, 0, sizeof(info));
    int rc;
    do {
      rc = waitid(P_PID, static_cast<id_t>(pid), &info, WEXITED | WNOWAIT);
    } while (rc != 0 && errno == EINTR);

    std::lock_guard<std::mutex> lock(mtx_);
    int status = 0;
    pid_t w;
    do {
      w = waitpid(pid, &status, 0);
    } while (w < 0 && errno == EINTR);
    if (w == pid) {
      FillWaitResult(status, wr);
    } else {
      PGS_LOG_WARN("Process", "waitpid(%d) failed: %s", static_cast<int>(pid),
                   std::strerror(errno));
    }
    pid_ = -1;
    return wr;
  }

  /**
   * @brief Send a signal to the child process.
   * @return kSuccess if sent, kAlreadyExited if the child is gone,
   *         kFailed otherwise (errno preserved).
   */
  ProcessResult Signal(int signo) {
    std::lock_guard<std::mutex> lock(mtx_);
    if (pid_ <= 0)
      return ProcessResult::kAlreadyExited;
    if (kill(pid_, signo) == 0)
      return ProcessResult::kSuccess;
    return (errno == ESRCH) ? ProcessResult::kAlreadyExited : ProcessResult::kFailed;
  }

  /// @brief Transfer ownership of the stdout read end (-1 if not captured).
  int ReleaseStdout() {
    int fd = stdout_fd_;
    stdout_fd_ = -1;
    return fd;
  }

  /// @brief Transfer ownership of the stderr read end (-1 if not captured).
  int ReleaseStderr() {
    int fd = stderr_fd_;
    stderr_fd_ = -1;
    return fd;
  }

  /// @brief Read all of stdout (blocking until EOF).
  std::string ReadAllStdout() { return ReadAllFd(stdout_fd_); }

  /// @brief Read all of stderr (blocking until EOF).
  std::string ReadAllStderr() { return ReadAllFd(stderr_fd_); }

  /// @brief Child PID, or -1 if not started or already reaped.
  pid_t GetPid() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return pid_;
  }

  bool IsRunning() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return pid_ > 0 && IsProcessAlive(pid_);
  }

 private:
  mutable std::mutex mtx_;
  pid_t pid_;
  int stdout_fd_;
  int stderr_fd_;

  static std::string ReadAllFd(int fd) {
    std::string result;
    if (fd < 0)
      return result;

    char buf[4096];
    for (;;) {
      ssize_t n = read(fd, buf, sizeof(buf));
      if (n < 0 && errno == EINTR)
        continue;
      if (n <= 0)
        break;
      result.append(buf, static_cast<size_t>(n));
    }
    return result;
  }

  static void FillWaitResult(int status, WaitResult& wr) {
    if (WIFEXITED(status)) {
      wr.exited = true;
      wr.exit_code = WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
      wr.signaled = true;
      wr.term_signal = WTERMSIG(status);
    }
  }
};

/// @brief Human-readable exit description: "exit status 1", "signal 9".
inline std::string DescribeExit(const WaitResult& wr) {
  if (wr.exited)
    return "exit status " + std::to_string(wr.exit_code);
  if (wr.signaled)
    return "killed by signal " + std::to_string(wr.term_signal);
  return "unknown exit state";
}

}  // namespace pgs

#endif  // defined(PGS_PLATFORM_LINUX)

#endif  // PGS_PROCESS_HPP_
