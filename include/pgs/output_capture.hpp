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
 * @file output_capture.hpp
 * @brief Copy a child's stdout/stderr pipes into per-command files.
 *
 * Layout under the capture root:
 *   <root>/<command_id>.stdout
 *   <root>/<command_id>.stderr
 *
 * Prepare() creates (truncates) both files before the process starts, so a
 * concurrent Logs() never fails on a missing file. Attach() then starts one
 * detached copy thread per stream; each appends and fsyncs until the pipe
 * reports end-of-stream.
 *
 * Copy errors are logged and counted but never reported to the caller that
 * started the process. A failed write keeps draining the pipe so the child
 * does not block on a full pipe.
 */

#ifndef PGS_OUTPUT_CAPTURE_HPP_
#define PGS_OUTPUT_CAPTURE_HPP_

#include "pgs/error.hpp"
#include "pgs/log.hpp"

#include <atomic>
#include <cerrno>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <cstring>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include <fcntl.h>
#include <unistd.h>

namespace pgs {

/// @brief Stream selector. Numeric values match the file descriptors.
enum class Stream : int {
  kStdout = 1,
  kStderr = 2,
};

inline const char* StreamSuffix(Stream s) noexcept {
  return (s == Stream::kStdout) ? "stdout" : "stderr";
}

/// @brief "<root>/<id>.stdout" or "<root>/<id>.stderr".
inline std::string CapturePath(const std::string& root,
                               const std::string& command_id, Stream s) {
  return root + "/" + command_id + "." + StreamSuffix(s);
}

// ============================================================================
// CaptureSession
// ============================================================================

/**
 * @brief Destination files and copy-loop state for one process.
 *
 * Shared between the supervisor and the two copy threads; the last owner
 * closes whatever descriptors are still open.
 */
class CaptureSession : public std::enable_shared_from_this<CaptureSession> {
 public:
  CaptureSession(std::string command_id, int stdout_dst, int stderr_dst)
      : command_id_(std::move(command_id)), dst_{stdout_dst, stderr_dst} {}

  ~CaptureSession() {
    for (int& fd : dst_) {
      if (fd >= 0)
        close(fd);  // NOLINT
      fd = -1;
    }
  }

  CaptureSession(const CaptureSession&) = delete;
  CaptureSession& operator=(const CaptureSession&) = delete;

  /**
   * @brief Start copying @p stdout_src and @p stderr_src (takes ownership).
   *
   * A source of -1 counts as an already drained stream.
   */
  void Attach(int stdout_src, int stderr_src) {
    StartLoop(0, stdout_src);
    StartLoop(1, stderr_src);
  }

  /**
   * @brief Wait until both copy loops reached end-of-stream.
   * @return false if @p timeout elapsed first.
   */
  bool WaitDrained(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mtx_);
    return cv_.wait_for(lock, timeout, [this] { return drained_ == 2U; });
  }

  /// @brief Number of read/write/sync failures swallowed so far.
  uint32_t Failures() const noexcept {
    return failures_.load(std::memory_order_relaxed);
  }

  const std::string& CommandId() const noexcept { return command_id_; }

 private:
  void StartLoop(int idx, int src) {
    if (src < 0) {
      MarkDrained(idx);
      return;
    }
    auto self = shared_from_this();
    std::thread([self, idx, src]() { self->CopyLoop(idx, src); }).detach();
  }

  void CopyLoop(int idx, int src) {
    const char* name = (idx == 0) ? "stdout" : "stderr";
    const int dst = dst_[idx];
    bool write_failed = false;
    char buf[4096];

    for (;;) {
      ssize_t n = read(src, buf, sizeof(buf));
      if (n < 0) {
        if (errno == EINTR)
          continue;
        RecordFailure(name, "read", errno);
        break;
      }
      if (n == 0)
        break;  // end-of-stream
      if (write_failed)
        continue;  // keep draining so the child never blocks

      size_t off = 0;
      while (off < static_cast<size_t>(n)) {
        ssize_t w = write(dst, buf + off, static_cast<size_t>(n) - off);
        if (w < 0) {
          if (errno == EINTR)
            continue;
          RecordFailure(name, "write", errno);
          write_failed = true;
          break;
        }
        off += static_cast<size_t>(w);
      }
      if (!write_failed && fsync(dst) != 0) {
        RecordFailure(name, "fsync", errno);
        write_failed = true;
      }
    }

    close(src);  // NOLINT
    MarkDrained(idx);
  }

  void RecordFailure(const char* stream, const char* op, int err) {
    failures_.fetch_add(1U, std::memory_order_relaxed);
    PGS_LOG_WARN("Capture", "%s %s for %.12s failed: %s", stream, op,
                 command_id_.c_str(), std::strerror(err));
  }

  void MarkDrained(int idx) {
    std::lock_guard<std::mutex> lock(mtx_);
    if (dst_[idx] >= 0) {
      close(dst_[idx]);  // NOLINT
      dst_[idx] = -1;
    }
    ++drained_;
    cv_.notify_all();
  }

  std::string command_id_;
  int dst_[2];
  std::mutex mtx_;
  std::condition_variable cv_;
  uint32_t drained_ = 0;
  std::atomic<uint32_t> failures_{0};
};

// ============================================================================
// OutputCapture
// ============================================================================

class OutputCapture {
 public:
  explicit OutputCapture(std::string root) : root_(std::move(root)) {}

  /**
   * @brief Create fresh stdout/stderr files for @p command_id.
   * @return The session to Attach() the pipes to, or kIo.
   */
  Result<std::shared_ptr<CaptureSession>> Prepare(const std::string& command_id) const {
    using R = Result<std::shared_ptr<CaptureSession>>;
    const std::string out_path = CapturePath(root_, command_id, Stream::kStdout);
    const std::string err_path = CapturePath(root_, command_id, Stream::kStderr);

    int out_fd = open(out_path.c_str(),
                      O_WRONLY | O_CREAT | O_TRUNC | O_APPEND | O_CLOEXEC, 0644);
    if (out_fd < 0) {
      return R::error(Error::FromErrno(ErrorCode::kIo,
                                       "creating " + out_path, errno));
    }
    int err_fd = open(err_path.c_str(),
                      O_WRONLY | O_CREAT | O_TRUNC | O_APPEND | O_CLOEXEC, 0644);
    if (err_fd < 0) {
      int err = errno;
      close(out_fd);  // NOLINT
      return R::error(Error::FromErrno(ErrorCode::kIo, "creating " + err_path, err));
    }
    return R::success(std::make_shared<CaptureSession>(command_id, out_fd, err_fd));
  }

  const std::string& Root() const noexcept { return root_; }

 private:
  std::string root_;
};

}  // namespace pgs

#endif  // PGS_OUTPUT_CAPTURE_HPP_
