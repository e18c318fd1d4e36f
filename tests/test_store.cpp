/**
 * @file test_store.cpp
 * @brief Tests for store.hpp - SQLite RAII wrappers and batch inserts.
 */

#include "pgs/store.hpp"

#include <catch2/catch.hpp>

#include <cstdlib>
#include <string>
#include <thread>
#include <vector>

namespace {

constexpr const char* kTestSchema =
    "CREATE TABLE IF NOT EXISTS kv (k TEXT NOT NULL, idx INTEGER NOT NULL, v TEXT NOT NULL);";

std::string TempDbPath() {
  char tmpl[] = "/tmp/pgs_store_XXXXXX";
  const char* dir = mkdtemp(tmpl);
  REQUIRE(dir != nullptr);
  return std::string(dir) + "/test.db";
}

int64_t CountRows(pgs::Database& db) {
  auto tx = db.Begin();
  REQUIRE(tx.has_value());
  auto stmt = tx.value().Prepare("SELECT COUNT(*) FROM kv");
  REQUIRE(stmt.has_value());
  auto row = stmt.value().Step();
  REQUIRE(row.has_value());
  REQUIRE(row.value());
  return stmt.value().ColumnInt64(0);
}

}  // namespace

TEST_CASE("BuildBatchInsertSql", "[store]") {
  REQUIRE(pgs::BuildBatchInsertSql("t", {"a", "b"}, 1) ==
          "INSERT INTO t (a, b) VALUES (?, ?)");
  REQUIRE(pgs::BuildBatchInsertSql("t", {"a", "b", "c"}, 2) ==
          "INSERT INTO t (a, b, c) VALUES (?, ?, ?), (?, ?, ?)");
}

TEST_CASE("Database Open creates the schema", "[store]") {
  auto db = pgs::Database::Open(TempDbPath(), kTestSchema);
  REQUIRE(db.has_value());
  REQUIRE(CountRows(*db.value()) == 0);
}

TEST_CASE("Database Open reports a bad path", "[store]") {
  auto db = pgs::Database::Open("/nonexistent/dir/test.db");
  REQUIRE_FALSE(db.has_value());
  REQUIRE(db.get_error().code == pgs::ErrorCode::kStore);
}

TEST_CASE("Database Open reports bad schema SQL", "[store]") {
  auto db = pgs::Database::Open(TempDbPath(), "CREATE TABLE (");
  REQUIRE_FALSE(db.has_value());
  REQUIRE(db.get_error().code == pgs::ErrorCode::kStore);
}

TEST_CASE("Transaction commit persists and rollback discards", "[store]") {
  const std::string path = TempDbPath();
  auto db = pgs::Database::Open(path, kTestSchema);
  REQUIRE(db.has_value());

  SECTION("commit") {
    {
      auto tx = db.value()->Begin();
      REQUIRE(tx.has_value());
      REQUIRE(tx.value().Exec("INSERT INTO kv VALUES ('a', 0, 'x')").has_value());
      REQUIRE(tx.value().Commit().has_value());
      REQUIRE_FALSE(tx.value().IsActive());
    }
    REQUIRE(CountRows(*db.value()) == 1);

    // Survives reopening
    db.value().reset();
    auto again = pgs::Database::Open(path, kTestSchema);
    REQUIRE(again.has_value());
    REQUIRE(CountRows(*again.value()) == 1);
  }

  SECTION("destructor rolls back") {
    {
      auto tx = db.value()->Begin();
      REQUIRE(tx.has_value());
      REQUIRE(tx.value().Exec("INSERT INTO kv VALUES ('a', 0, 'x')").has_value());
    }
    REQUIRE(CountRows(*db.value()) == 0);
  }

  SECTION("explicit rollback then commit fails") {
    auto tx = db.value()->Begin();
    REQUIRE(tx.has_value());
    REQUIRE(tx.value().Exec("INSERT INTO kv VALUES ('a', 0, 'x')").has_value());
    tx.value().Rollback();
    auto st = tx.value().Commit();
    REQUIRE_FALSE(st.has_value());
    REQUIRE(st.get_error().code == pgs::ErrorCode::kStore);
  }
}

TEST_CASE("Transaction reports SQL errors", "[store]") {
  auto db = pgs::Database::Open(TempDbPath(), kTestSchema);
  REQUIRE(db.has_value());
  auto tx = db.value()->Begin();
  REQUIRE(tx.has_value());

  auto bad = tx.value().Prepare("SELECT * FROM missing_table");
  REQUIRE_FALSE(bad.has_value());
  REQUIRE(bad.get_error().code == pgs::ErrorCode::kStore);
  REQUIRE(bad.get_error().message.find("missing_table") != std::string::npos);

  auto st = tx.value().Exec("INSERT INTO nowhere VALUES (1)");
  REQUIRE_FALSE(st.has_value());
}

TEST_CASE("Statement binds and reads columns", "[store]") {
  auto db = pgs::Database::Open(TempDbPath(), kTestSchema);
  REQUIRE(db.has_value());
  auto tx = db.value()->Begin();
  REQUIRE(tx.has_value());

  auto ins = tx.value().Prepare("INSERT INTO kv (k, idx, v) VALUES (?, ?, ?)");
  REQUIRE(ins.has_value());
  REQUIRE(ins.value().Bind(1, std::string("key")).has_value());
  REQUIRE(ins.value().Bind(2, static_cast<int64_t>(7)).has_value());
  REQUIRE(ins.value().Bind(3, std::string("with\0nul", 8)).has_value());
  REQUIRE(ins.value().Run().has_value());
  REQUIRE(tx.value().LastInsertRowId() == 1);

  auto sel = tx.value().Prepare("SELECT k, idx, v, NULL FROM kv");
  REQUIRE(sel.has_value());
  auto row = sel.value().Step();
  REQUIRE(row.has_value());
  REQUIRE(row.value());
  REQUIRE(sel.value().ColumnText(0) == "key");
  REQUIRE(sel.value().ColumnInt64(1) == 7);
  REQUIRE(sel.value().ColumnText(2) == std::string("with\0nul", 8));
  REQUIRE(sel.value().ColumnIsNull(3));
  REQUIRE_FALSE(sel.value().Step().value());
}

TEST_CASE("InsertIndexedRows spans several batches in order", "[store]") {
  auto db = pgs::Database::Open(TempDbPath(), kTestSchema);
  REQUIRE(db.has_value());

  std::vector<std::string> values;
  for (int i = 0; i < 750; ++i) values.push_back("v" + std::to_string(i));

  auto tx = db.value()->Begin();
  REQUIRE(tx.has_value());
  REQUIRE(pgs::InsertIndexedRows(tx.value(), "kv", "k", "v", "key", values).has_value());
  REQUIRE(pgs::InsertIndexedRows(tx.value(), "kv", "k", "v", "empty", {}).has_value());

  auto sel = tx.value().Prepare("SELECT idx, v FROM kv WHERE k = 'key' ORDER BY idx");
  REQUIRE(sel.has_value());
  size_t n = 0;
  while (sel.value().Step().value()) {
    REQUIRE(sel.value().ColumnInt64(0) == static_cast<int64_t>(n));
    REQUIRE(sel.value().ColumnText(1) == values[n]);
    ++n;
  }
  REQUIRE(n == values.size());
  REQUIRE(tx.value().Commit().has_value());
}

TEST_CASE("Begin serializes transactions across threads", "[store]") {
  auto db = pgs::Database::Open(TempDbPath(), kTestSchema);
  REQUIRE(db.has_value());
  pgs::Database* raw = db.value().get();

  constexpr int kThreads = 4;
  constexpr int kPerThread = 25;
  std::vector<std::thread> threads;
  std::vector<int> failures(kThreads, 0);
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([raw, t, &failures]() {
      for (int i = 0; i < kPerThread; ++i) {
        auto tx = raw->Begin();
        if (!tx ||
            !tx.value().Exec("INSERT INTO kv VALUES ('t', " + std::to_string(i) + ", 'x')") ||
            !tx.value().Commit()) {
          ++failures[t];
        }
      }
    });
  }
  for (auto& th : threads) th.join();

  for (int f : failures) REQUIRE(f == 0);
  REQUIRE(CountRows(*raw) == kThreads * kPerThread);
}
