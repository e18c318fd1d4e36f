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
 * @file command.hpp
 * @brief Command definition and its stable identity.
 *
 * The identity is the lowercase hex SHA-256 of the argument list followed by
 * the environment list. Every element is length-prefixed, and the two lists
 * are separated by a marker byte, so:
 *   - {"a b"} and {"a", "b"} hash differently
 *   - moving an entry from args to env changes the id
 *   - permuting either list changes the id
 *
 * A caller may instead assign an explicit id (Command::id); it is used
 * verbatim and only validated, since it names the capture files.
 */

#ifndef PGS_COMMAND_HPP_
#define PGS_COMMAND_HPP_

#include "pgs/error.hpp"

#include <openssl/evp.h>

#include <cstdint>
#include <cstdio>
#include <string>
#include <vector>

namespace pgs {

// ============================================================================
// Command
// ============================================================================

struct Command {
  /// Caller-assigned identity. Empty means derive it from args + env.
  std::string id;
  /// Executable; empty means args[0] resolved through PATH.
  std::string path;
  std::vector<std::string> args;
  std::vector<std::string> env;

  Command() = default;
  Command(std::vector<std::string> a, std::vector<std::string> e = {})
      : args(std::move(a)), env(std::move(e)) {}

  /// @brief The program that will be executed.
  const std::string& Program() const { return path.empty() ? args[0] : path; }
};

inline bool operator==(const Command& a, const Command& b) {
  return a.id == b.id && a.path == b.path && a.args == b.args && a.env == b.env;
}

namespace detail {

constexpr uint8_t kEnvMarker = 0x1E;  // ASCII record separator

inline bool DigestUpdateString(EVP_MD_CTX* ctx, const std::string& s) {
  uint8_t len[8];
  uint64_t n = s.size();
  for (int i = 7; i >= 0; --i) {
    len[i] = static_cast<uint8_t>(n & 0xFFU);
    n >>= 8;
  }
  return EVP_DigestUpdate(ctx, len, sizeof(len)) == 1 &&
         EVP_DigestUpdate(ctx, s.data(), s.size()) == 1;
}

inline std::string ToHex(const unsigned char* data, unsigned int len) {
  static const char kHex[] = "0123456789abcdef";
  std::string out;
  out.reserve(len * 2U);
  for (unsigned int i = 0; i < len; ++i) {
    out.push_back(kHex[data[i] >> 4]);
    out.push_back(kHex[data[i] & 0x0FU]);
  }
  return out;
}

}  // namespace detail

/**
 * @brief Derive the SHA-256 identity of an argument/environment pair.
 * @return 64 hex chars, or kInvalidArgument when @p args is empty.
 */
inline Result<std::string> DeriveCommandId(const std::vector<std::string>& args,
                                           const std::vector<std::string>& env) {
  if (args.empty()) {
    return Result<std::string>::error(
        Error(ErrorCode::kInvalidArgument, "command has an empty argument list"));
  }

  EVP_MD_CTX* ctx = EVP_MD_CTX_new();
  if (ctx == nullptr) {
    return Result<std::string>::error(
        Error(ErrorCode::kInvalidArgument, "allocating digest context"));
  }
  PGS_SCOPE_EXIT(EVP_MD_CTX_free(ctx));

  bool ok = EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) == 1;
  for (const auto& a : args) {
    ok = ok && detail::DigestUpdateString(ctx, a);
  }
  const uint8_t marker = detail::kEnvMarker;
  ok = ok && EVP_DigestUpdate(ctx, &marker, 1) == 1;
  for (const auto& e : env) {
    ok = ok && detail::DigestUpdateString(ctx, e);
  }

  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int digest_len = 0;
  ok = ok && EVP_DigestFinal_ex(ctx, digest, &digest_len) == 1;
  if (!ok) {
    return Result<std::string>::error(
        Error(ErrorCode::kInvalidArgument, "computing SHA-256 digest"));
  }
  return Result<std::string>::success(detail::ToHex(digest, digest_len));
}

/**
 * @brief Resolve the identity of @p cmd: the assigned id, or the derived one.
 *
 * Rejects empty argument lists and ids that could escape the capture root.
 */
inline Result<std::string> GetCommandId(const Command& cmd) {
  if (cmd.args.empty()) {
    return Result<std::string>::error(
        Error(ErrorCode::kInvalidArgument, "command has an empty argument list"));
  }
  if (!cmd.id.empty()) {
    if (cmd.id.find('/') != std::string::npos || cmd.id == "." || cmd.id == "..") {
      return Result<std::string>::error(Error(
          ErrorCode::kInvalidArgument, "invalid command id '" + cmd.id + "'"));
    }
    return Result<std::string>::success(cmd.id);
  }
  return DeriveCommandId(cmd.args, cmd.env);
}

/// @brief Shell-like rendering for log lines: "echo foo".
inline std::string DescribeCommand(const Command& cmd) {
  std::string out;
  for (size_t i = 0; i < cmd.args.size(); ++i) {
    if (i > 0) out.push_back(' ');
    out += cmd.args[i];
  }
  return out;
}

}  // namespace pgs

#endif  // PGS_COMMAND_HPP_
