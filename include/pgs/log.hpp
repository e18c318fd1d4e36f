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
 * @file log.hpp
 * @brief Synchronous printf-style logging to stderr.
 *
 * Two filters apply to every message:
 *   - compile time: PGS_LOG_MIN_LEVEL (0=DEBUG .. 4=FATAL, 5=OFF)
 *   - run time:     pgs::log::SetLevel()
 *
 * Output format:
 *   [2026-10-19 12:00:00.123] [INFO] [Registry] message (registry.hpp:42)
 *
 * Observer and capture threads log concurrently, so each line is written
 * under a process-wide mutex.
 */

#ifndef PGS_LOG_HPP_
#define PGS_LOG_HPP_

#include "pgs/platform.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <mutex>

#include <sys/time.h>
#include <time.h>

#ifndef PGS_LOG_MIN_LEVEL
#define PGS_LOG_MIN_LEVEL 0
#endif

namespace pgs {
namespace log {

enum class Level : uint8_t {
  kDebug = 0,
  kInfo = 1,
  kWarn = 2,
  kError = 3,
  kFatal = 4,
  kOff = 5,
};

namespace detail {

inline std::atomic<Level>& LogLevelRef() noexcept {
#ifdef NDEBUG
  static std::atomic<Level> level{Level::kInfo};
#else
  static std::atomic<Level> level{Level::kDebug};
#endif
  return level;
}

inline std::atomic<bool>& InitializedRef() noexcept {
  static std::atomic<bool> initialized{false};
  return initialized;
}

inline std::mutex& WriteMutex() noexcept {
  static std::mutex mtx;
  return mtx;
}

inline const char* LevelTag(Level level) noexcept {
  switch (level) {
    case Level::kDebug: return "DEBUG";
    case Level::kInfo: return "INFO";
    case Level::kWarn: return "WARN";
    case Level::kError: return "ERROR";
    case Level::kFatal: return "FATAL";
    default: return "?";
  }
}

/// @brief Strip directories from __FILE__.
inline const char* Basename(const char* path) noexcept {
  const char* base = path;
  for (const char* p = path; *p != '\0'; ++p) {
    if (*p == '/') base = p + 1;
  }
  return base;
}

inline void FormatTimestamp(char* buf, size_t size) noexcept {
  struct timeval tv;
  gettimeofday(&tv, nullptr);
  struct tm tm_buf;
  localtime_r(&tv.tv_sec, &tm_buf);
  size_t n = strftime(buf, size, "%Y-%m-%d %H:%M:%S", &tm_buf);
  if (n > 0 && n < size) {
    (void)std::snprintf(buf + n, size - n, ".%03ld",
                        static_cast<long>(tv.tv_usec / 1000));  // NOLINT
  }
}

}  // namespace detail

inline void SetLevel(Level level) noexcept {
  detail::LogLevelRef().store(level, std::memory_order_relaxed);
}

inline Level GetLevel() noexcept {
  return detail::LogLevelRef().load(std::memory_order_relaxed);
}

/// @brief Mark the logger as in use. Safe to call more than once.
inline void Init() noexcept {
  detail::InitializedRef().store(true, std::memory_order_release);
}

/// @brief Flush stderr and mark the logger as shut down.
inline void Shutdown() noexcept {
  std::lock_guard<std::mutex> lock(detail::WriteMutex());
  (void)std::fflush(stderr);
  detail::InitializedRef().store(false, std::memory_order_release);
}

inline bool IsInitialized() noexcept {
  return detail::InitializedRef().load(std::memory_order_acquire);
}

inline void LogWriteVa(Level level, const char* category, const char* file,
                       int line, const char* fmt, va_list args) noexcept {
  if (static_cast<uint8_t>(level) <
      static_cast<uint8_t>(detail::LogLevelRef().load(std::memory_order_relaxed))) {
    return;
  }

  char message[512];
  (void)std::vsnprintf(message, sizeof(message), fmt, args);

  char ts[40];
  detail::FormatTimestamp(ts, sizeof(ts));

  std::lock_guard<std::mutex> lock(detail::WriteMutex());
#ifdef NDEBUG
  (void)file;
  (void)line;
  (void)std::fprintf(stderr, "[%s] [%s] [%s] %s\n", ts,
                     detail::LevelTag(level), category, message);
#else
  (void)std::fprintf(stderr, "[%s] [%s] [%s] %s (%s:%d)\n", ts,
                     detail::LevelTag(level), category, message,
                     detail::Basename(file), line);
#endif
}

#if defined(__GNUC__) || defined(__clang__)
__attribute__((format(printf, 5, 6)))
#endif
inline void LogWrite(Level level, const char* category, const char* file,
                     int line, const char* fmt, ...) noexcept {
  va_list args;
  va_start(args, fmt);
  LogWriteVa(level, category, file, line, fmt, args);
  va_end(args);
}

}  // namespace log
}  // namespace pgs

// ============================================================================
// Macros
// ============================================================================

#define PGS_LOG_DEBUG(cat, fmt, ...)                                       \
  do {                                                                     \
    if (PGS_LOG_MIN_LEVEL <= 0) {                                          \
      ::pgs::log::LogWrite(::pgs::log::Level::kDebug, cat, __FILE__,       \
                           __LINE__, fmt, ##__VA_ARGS__);                  \
    }                                                                      \
  } while (0)

#define PGS_LOG_INFO(cat, fmt, ...)                                        \
  do {                                                                     \
    if (PGS_LOG_MIN_LEVEL <= 1) {                                          \
      ::pgs::log::LogWrite(::pgs::log::Level::kInfo, cat, __FILE__,        \
                           __LINE__, fmt, ##__VA_ARGS__);                  \
    }                                                                      \
  } while (0)

#define PGS_LOG_WARN(cat, fmt, ...)                                        \
  do {                                                                     \
    if (PGS_LOG_MIN_LEVEL <= 2) {                                          \
      ::pgs::log::LogWrite(::pgs::log::Level::kWarn, cat, __FILE__,        \
                           __LINE__, fmt, ##__VA_ARGS__);                  \
    }                                                                      \
  } while (0)

#define PGS_LOG_ERROR(cat, fmt, ...)                                       \
  do {                                                                     \
    if (PGS_LOG_MIN_LEVEL <= 3) {                                          \
      ::pgs::log::LogWrite(::pgs::log::Level::kError, cat, __FILE__,       \
                           __LINE__, fmt, ##__VA_ARGS__);                  \
    }                                                                      \
  } while (0)

#define PGS_LOG_FATAL(cat, fmt, ...)                                       \
  do {                                                                     \
    ::pgs::log::LogWrite(::pgs::log::Level::kFatal, cat, __FILE__,         \
                         __LINE__, fmt, ##__VA_ARGS__);                    \
    std::abort();                                                          \
  } while (0)

#endif  // PGS_LOG_HPP_
