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
 * @file error.hpp
 * @brief Error taxonomy for the supervisor: ErrorCode plus a context message.
 *
 * Context is accumulated the way call chains report it:
 * @code
 *   return Fail(err.Wrap("starting command"));
 *   // -> "starting command: launching 'foo': No such file or directory"
 * @endcode
 */

#ifndef PGS_ERROR_HPP_
#define PGS_ERROR_HPP_

#include "pgs/vocabulary.hpp"

#include <cstdint>
#include <cstring>
#include <string>

namespace pgs {

enum class ErrorCode : uint8_t {
  kInvalidArgument = 0,
  kLaunch,         ///< OS refused to start a process
  kSignal,         ///< Signal delivery failed
  kWaitTimeout,    ///< Deadline elapsed before all processes finished
  kProcessExit,    ///< Supervised process exited non-zero or was killed
  kNotFound,       ///< Unknown group, command, pid or capture file
  kAlreadyExists,  ///< Group already live or command already registered
  kStore,          ///< SQLite failure
  kIo,             ///< Filesystem failure
};

inline const char* ErrorCodeName(ErrorCode code) noexcept {
  switch (code) {
    case ErrorCode::kInvalidArgument: return "InvalidArgument";
    case ErrorCode::kLaunch: return "Launch";
    case ErrorCode::kSignal: return "Signal";
    case ErrorCode::kWaitTimeout: return "WaitTimeout";
    case ErrorCode::kProcessExit: return "ProcessExit";
    case ErrorCode::kNotFound: return "NotFound";
    case ErrorCode::kAlreadyExists: return "AlreadyExists";
    case ErrorCode::kStore: return "Store";
    case ErrorCode::kIo: return "Io";
  }
  return "Unknown";
}

struct Error {
  ErrorCode code;
  std::string message;
  /// Command identity the error is attached to (empty if none).
  std::string command_id;

  Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}

  /// @brief Build an error from errno, e.g. "creating root: Permission denied".
  static Error FromErrno(ErrorCode c, const std::string& context, int err) {
    return Error(c, context + ": " + std::strerror(err));
  }

  /// @brief Prefix the message with @p context, keeping the code.
  Error Wrap(const std::string& context) const {
    Error e(code, context + ": " + message);
    e.command_id = command_id;
    return e;
  }

  const char* what() const noexcept { return message.c_str(); }
};

template <typename V>
using Result = expected<V, Error>;
using Status = expected<void, Error>;

inline Status Ok() { return Status::success(); }

inline Status Fail(Error err) { return Status::error(std::move(err)); }

}  // namespace pgs

#endif  // PGS_ERROR_HPP_
