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
 * @file platform.hpp
 * @brief Target check and the debug assertion used across pgs.
 *
 * Process control needs fork(2), waitid(2) and pipe2(2); process.hpp
 * compiles to nothing unless PGS_PLATFORM_LINUX is set.
 */

#ifndef PGS_PLATFORM_HPP_
#define PGS_PLATFORM_HPP_

#include <cstdio>
#include <cstdlib>

#if defined(__linux__)
#define PGS_PLATFORM_LINUX 1
#endif

#define PGS_CONCAT_IMPL(a, b) a##b
#define PGS_CONCAT(a, b) PGS_CONCAT_IMPL(a, b)

namespace pgs {
namespace detail {

/// @brief Report a broken programming invariant and abort.
[[noreturn]] inline void AssertFail(const char* cond, const char* file, int line) {
  (void)std::fprintf(stderr, "[pgs] assertion '%s' failed (%s:%d)\n", cond, file,
                     line);
  std::abort();
}

}  // namespace detail
}  // namespace pgs

/// Programming errors only; runtime failures are returned as pgs::Error.
#ifdef NDEBUG
#define PGS_ASSERT(cond) ((void)0)
#else
#define PGS_ASSERT(cond) \
  ((cond) ? ((void)0) : ::pgs::detail::AssertFail(#cond, __FILE__, __LINE__))
#endif

#endif  // PGS_PLATFORM_HPP_
