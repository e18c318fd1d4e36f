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
 * @file vocabulary.hpp
 * @brief Error-return and scope utilities shared by all pgs headers.
 *
 * - expected<V, E>   : value-or-error return type (void specialization)
 * - and_then/or_else : monadic helpers over expected
 * - optional<T>      : alias of std::optional
 * - ScopeGuard       : run a cleanup on scope exit unless released
 *
 * Errors are returned, never thrown.
 */

#ifndef PGS_VOCABULARY_HPP_
#define PGS_VOCABULARY_HPP_

#include "pgs/platform.hpp"

#include <cstddef>
#include <functional>
#include <optional>
#include <type_traits>
#include <utility>
#include <variant>

namespace pgs {

template <typename T>
using optional = std::optional<T>;

// ============================================================================
// expected<V, E>
// ============================================================================

template <typename V, typename E>
class expected final {
  static_assert(!std::is_same<V, E>::value,
                "expected<V, E> requires distinct value and error types");

 public:
  static expected success(V value) {
    return expected(std::in_place_index<0>, std::move(value));
  }

  static expected error(E err) {
    return expected(std::in_place_index<1>, std::move(err));
  }

  bool has_value() const noexcept { return storage_.index() == 0; }
  explicit operator bool() const noexcept { return has_value(); }

  V& value() & {
    PGS_ASSERT(has_value());
    return std::get<0>(storage_);
  }
  const V& value() const& {
    PGS_ASSERT(has_value());
    return std::get<0>(storage_);
  }
  V&& value() && {
    PGS_ASSERT(has_value());
    return std::get<0>(std::move(storage_));
  }

  const E& get_error() const& {
    PGS_ASSERT(!has_value());
    return std::get<1>(storage_);
  }

  V value_or(V fallback) const {
    return has_value() ? std::get<0>(storage_) : std::move(fallback);
  }

 private:
  template <size_t I, typename Arg>
  expected(std::in_place_index_t<I> tag, Arg&& arg)
      : storage_(tag, std::forward<Arg>(arg)) {}

  std::variant<V, E> storage_;
};

template <typename E>
class expected<void, E> final {
 public:
  static expected success() { return expected(); }

  static expected error(E err) {
    expected r;
    r.error_.emplace(std::move(err));
    return r;
  }

  bool has_value() const noexcept { return !error_.has_value(); }
  explicit operator bool() const noexcept { return has_value(); }

  const E& get_error() const& {
    PGS_ASSERT(!has_value());
    return *error_;
  }

 private:
  expected() = default;

  std::optional<E> error_;
};

// ============================================================================
// and_then / or_else
// ============================================================================

/// @brief Call @p fn with the value on success, propagate the error otherwise.
template <typename V, typename E, typename F>
auto and_then(const expected<V, E>& r, F&& fn) -> decltype(fn(r.value())) {
  using Result = decltype(fn(r.value()));
  if (!r.has_value()) return Result::error(r.get_error());
  return fn(r.value());
}

/// @brief Call @p fn with the error on failure. Returns @p r unchanged.
template <typename V, typename E, typename F>
const expected<V, E>& or_else(const expected<V, E>& r, F&& fn) {
  if (!r.has_value()) fn(r.get_error());
  return r;
}

// ============================================================================
// ScopeGuard
// ============================================================================

class ScopeGuard final {
 public:
  explicit ScopeGuard(std::function<void()> cleanup)
      : cleanup_(std::move(cleanup)), active_(true) {}

  ~ScopeGuard() {
    if (active_ && cleanup_) cleanup_();
  }

  ScopeGuard(ScopeGuard&& other) noexcept
      : cleanup_(std::move(other.cleanup_)), active_(other.active_) {
    other.active_ = false;
  }

  ScopeGuard(const ScopeGuard&) = delete;
  ScopeGuard& operator=(const ScopeGuard&) = delete;
  ScopeGuard& operator=(ScopeGuard&&) = delete;

  /// @brief Disarm: the cleanup will not run.
  void release() noexcept { active_ = false; }

 private:
  std::function<void()> cleanup_;
  bool active_;
};

#define PGS_SCOPE_EXIT(...)                                  \
  ::pgs::ScopeGuard PGS_CONCAT(pgs_scope_exit_, __LINE__)(   \
      [&]() { __VA_ARGS__; })

}  // namespace pgs

#endif  // PGS_VOCABULARY_HPP_
