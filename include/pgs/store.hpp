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
 * @file store.hpp
 * @brief RAII wrappers over the SQLite C API: Database, Transaction, Statement.
 *
 * - Database    : owns the sqlite3 connection, applies the schema
 * - Transaction : BEGIN IMMEDIATE on construction, ROLLBACK on destruction
 *                 unless Commit() succeeded; serializes users of a connection
 * - Statement   : prepared statement with typed Bind/Column helpers
 * - InsertIndexedRows : one multi-row INSERT per batch of
 *                       (key, idx, value) rows, fully parameterized
 *
 * All failures are reported as ErrorCode::kStore with sqlite3_errmsg().
 *
 * Usage:
 * @code
 *   auto db = pgs::Database::Open("/var/lib/pgs/groups.db");
 *   auto tx = db.value()->Begin();
 *   auto st = tx.value().Exec("DELETE FROM commands");
 *   if (st) st = tx.value().Commit();
 * @endcode
 */

#ifndef PGS_STORE_HPP_
#define PGS_STORE_HPP_

#include "pgs/error.hpp"
#include "pgs/log.hpp"

#include <sqlite3.h>

#include <algorithm>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace pgs {

#ifndef PGS_STORE_BUSY_TIMEOUT_MS
#define PGS_STORE_BUSY_TIMEOUT_MS 5000
#endif

/// Rows per multi-row INSERT; 3 parameters each stays under SQLite's
/// historical limit of 999 host parameters.
#ifndef PGS_STORE_MAX_BATCH_ROWS
#define PGS_STORE_MAX_BATCH_ROWS 300U
#endif

namespace detail {

inline Error StoreError(sqlite3* db, const std::string& context) {
  const char* msg = (db != nullptr) ? sqlite3_errmsg(db) : "out of memory";
  return Error(ErrorCode::kStore, context + ": " + msg);
}

}  // namespace detail

// ============================================================================
// Statement
// ============================================================================

class Statement {
 public:
  Statement(sqlite3* db, sqlite3_stmt* stmt) : db_(db), stmt_(stmt) {}
  ~Statement() {
    if (stmt_ != nullptr) sqlite3_finalize(stmt_);
  }

  Statement(Statement&& other) noexcept : db_(other.db_), stmt_(other.stmt_) {
    other.stmt_ = nullptr;
  }
  Statement& operator=(Statement&& other) noexcept {
    if (this != &other) {
      if (stmt_ != nullptr) sqlite3_finalize(stmt_);
      db_ = other.db_;
      stmt_ = other.stmt_;
      other.stmt_ = nullptr;
    }
    return *this;
  }
  Statement(const Statement&) = delete;
  Statement& operator=(const Statement&) = delete;

  /// @brief Bind a text parameter (1-based index).
  Status Bind(int idx, const std::string& value) {
    int rc = sqlite3_bind_text(stmt_, idx, value.c_str(),
                               static_cast<int>(value.size()), SQLITE_TRANSIENT);
    return Check(rc, "binding parameter " + std::to_string(idx));
  }

  Status Bind(int idx, int64_t value) {
    return Check(sqlite3_bind_int64(stmt_, idx, value),
                 "binding parameter " + std::to_string(idx));
  }

  /**
   * @brief Advance the statement.
   * @return true if a row is available, false when done.
   */
  Result<bool> Step() {
    int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW) return Result<bool>::success(true);
    if (rc == SQLITE_DONE) return Result<bool>::success(false);
    return Result<bool>::error(detail::StoreError(db_, "executing statement"));
  }

  /// @brief Step a statement that returns no rows.
  Status Run() {
    auto r = Step();
    if (!r) return Fail(r.get_error());
    return Ok();
  }

  std::string ColumnText(int col) const {
    const unsigned char* text = sqlite3_column_text(stmt_, col);
    if (text == nullptr) return std::string();
    return std::string(reinterpret_cast<const char*>(text),
                       static_cast<size_t>(sqlite3_column_bytes(stmt_, col)));
  }

  int64_t ColumnInt64(int col) const { return sqlite3_column_int64(stmt_, col); }

  bool ColumnIsNull(int col) const {
    return sqlite3_column_type(stmt_, col) == SQLITE_NULL;
  }

 private:
  Status Check(int rc, const std::string& context) {
    if (rc == SQLITE_OK) return Ok();
    return Fail(detail::StoreError(db_, context));
  }

  sqlite3* db_;
  sqlite3_stmt* stmt_;
};

// ============================================================================
// Transaction
// ============================================================================

class Transaction {
 public:
  Transaction(sqlite3* db, std::unique_lock<std::mutex> lock)
      : db_(db), lock_(std::move(lock)), active_(true) {}

  ~Transaction() { Rollback(); }

  Transaction(Transaction&& other) noexcept
      : db_(other.db_), lock_(std::move(other.lock_)), active_(other.active_) {
    other.active_ = false;
  }
  Transaction& operator=(Transaction&&) = delete;
  Transaction(const Transaction&) = delete;
  Transaction& operator=(const Transaction&) = delete;

  Result<Statement> Prepare(const std::string& sql) {
    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), static_cast<int>(sql.size()),
                                &stmt, nullptr);
    if (rc != SQLITE_OK) {
      if (stmt != nullptr) sqlite3_finalize(stmt);
      return Result<Statement>::error(detail::StoreError(db_, "preparing statement"));
    }
    return Result<Statement>::success(Statement(db_, stmt));
  }

  /// @brief Execute one or more statements without parameters.
  Status Exec(const std::string& sql) {
    char* msg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &msg);
    if (rc != SQLITE_OK) {
      std::string text = (msg != nullptr) ? msg : sqlite3_errstr(rc);
      sqlite3_free(msg);
      return Fail(Error(ErrorCode::kStore, "executing sql: " + text));
    }
    return Ok();
  }

  int64_t LastInsertRowId() const { return sqlite3_last_insert_rowid(db_); }

  Status Commit() {
    if (!active_) {
      return Fail(Error(ErrorCode::kStore, "transaction already finished"));
    }
    char* msg = nullptr;
    int rc = sqlite3_exec(db_, "COMMIT", nullptr, nullptr, &msg);
    if (rc != SQLITE_OK) {
      std::string text = (msg != nullptr) ? msg : sqlite3_errstr(rc);
      sqlite3_free(msg);
      Rollback();
      return Fail(Error(ErrorCode::kStore, "committing transaction: " + text));
    }
    active_ = false;
    Release();
    return Ok();
  }

  /// @brief Roll back if still active. Idempotent.
  void Rollback() noexcept {
    if (!active_) {
      Release();
      return;
    }
    active_ = false;
    if (sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, nullptr) != SQLITE_OK) {
      PGS_LOG_ERROR("Store", "rollback failed: %s", sqlite3_errmsg(db_));
    }
    Release();
  }

  bool IsActive() const noexcept { return active_; }

 private:
  void Release() noexcept {
    if (lock_.owns_lock()) lock_.unlock();
  }

  sqlite3* db_;
  std::unique_lock<std::mutex> lock_;
  bool active_;
};

// ============================================================================
// Database
// ============================================================================

class Database {
 public:
  ~Database() {
    if (db_ != nullptr) sqlite3_close(db_);
  }

  Database(const Database&) = delete;
  Database& operator=(const Database&) = delete;

  /**
   * @brief Open (creating if needed) the database file at @p path.
   * @param schema DDL executed once after opening (may be empty).
   */
  static Result<std::unique_ptr<Database>> Open(const std::string& path,
                                                const char* schema = nullptr) {
    using R = Result<std::unique_ptr<Database>>;
    sqlite3* handle = nullptr;
    int rc = sqlite3_open_v2(path.c_str(), &handle,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE |
                                 SQLITE_OPEN_FULLMUTEX,
                             nullptr);
    if (rc != SQLITE_OK) {
      Error err = detail::StoreError(handle, "opening " + path);
      sqlite3_close(handle);
      return R::error(err);
    }
    sqlite3_busy_timeout(handle, PGS_STORE_BUSY_TIMEOUT_MS);

    std::unique_ptr<Database> db(new Database(handle));
    if (schema != nullptr) {
      char* msg = nullptr;
      rc = sqlite3_exec(handle, schema, nullptr, nullptr, &msg);
      if (rc != SQLITE_OK) {
        std::string text = (msg != nullptr) ? msg : sqlite3_errstr(rc);
        sqlite3_free(msg);
        return R::error(Error(ErrorCode::kStore, "creating tables: " + text));
      }
    }
    PGS_LOG_DEBUG("Store", "opened %s", path.c_str());
    return R::success(std::move(db));
  }

  /**
   * @brief Start a write transaction.
   *
   * Blocks while another transaction on this connection is in flight.
   */
  Result<Transaction> Begin() {
    std::unique_lock<std::mutex> lock(tx_mtx_);
    char* msg = nullptr;
    int rc = sqlite3_exec(db_, "BEGIN IMMEDIATE", nullptr, nullptr, &msg);
    if (rc != SQLITE_OK) {
      std::string text = (msg != nullptr) ? msg : sqlite3_errstr(rc);
      sqlite3_free(msg);
      return Result<Transaction>::error(
          Error(ErrorCode::kStore, "starting transaction: " + text));
    }
    return Result<Transaction>::success(Transaction(db_, std::move(lock)));
  }

 private:
  explicit Database(sqlite3* db) : db_(db) {}

  sqlite3* db_;
  std::mutex tx_mtx_;
};

// ============================================================================
// Batch insert
// ============================================================================

/**
 * @brief "INSERT INTO t (a, b, c) VALUES (?, ?, ?), (?, ?, ?)" for @p rows rows.
 */
inline std::string BuildBatchInsertSql(const std::string& table,
                                       const std::vector<std::string>& columns,
                                       size_t rows) {
  std::string tuple = "(";
  for (size_t i = 0; i < columns.size(); ++i) {
    tuple += (i == 0) ? "?" : ", ?";
  }
  tuple += ")";

  std::string sql = "INSERT INTO " + table + " (";
  for (size_t i = 0; i < columns.size(); ++i) {
    if (i > 0) sql += ", ";
    sql += columns[i];
  }
  sql += ") VALUES ";
  for (size_t r = 0; r < rows; ++r) {
    if (r > 0) sql += ", ";
    sql += tuple;
  }
  return sql;
}

/**
 * @brief Insert ordered @p values as (key_column=key, idx, value_column=value)
 *        rows, one statement per batch of PGS_STORE_MAX_BATCH_ROWS.
 */
inline Status InsertIndexedRows(Transaction& tx, const std::string& table,
                                const std::string& key_column,
                                const std::string& value_column,
                                const std::string& key,
                                const std::vector<std::string>& values) {
  const std::vector<std::string> columns = {key_column, "idx", value_column};
  size_t offset = 0;
  while (offset < values.size()) {
    const size_t rows = std::min<size_t>(PGS_STORE_MAX_BATCH_ROWS,
                                         values.size() - offset);
    auto stmt = tx.Prepare(BuildBatchInsertSql(table, columns, rows));
    if (!stmt) return Fail(stmt.get_error().Wrap("inserting into " + table));

    int param = 1;
    for (size_t i = 0; i < rows; ++i) {
      const size_t idx = offset + i;
      Status st = stmt.value().Bind(param++, key);
      if (st) st = stmt.value().Bind(param++, static_cast<int64_t>(idx));
      if (st) st = stmt.value().Bind(param++, values[idx]);
      if (!st) return Fail(st.get_error().Wrap("inserting into " + table));
    }
    Status run = stmt.value().Run();
    if (!run) return Fail(run.get_error().Wrap("inserting into " + table));
    offset += rows;
  }
  return Ok();
}

}  // namespace pgs

#endif  // PGS_STORE_HPP_
