// Copyright (c) 2024 liudegui. MIT License.
// Tests for slint::Sqlite3Db.

#include <catch2/catch.hpp>
#include <cstdio>
#include <cstring>
#include <vector>

#include "slint/sqlite3_db.hpp"

using namespace slint;

namespace {

// accounts(id, handle UNIQUE, karma) with three rows, karma of "eve" NULL.
Sqlite3Db OpenAccounts() {
  Sqlite3Db db;
  REQUIRE(db.Open(":memory:").ok());
  REQUIRE(db.ExecDml("CREATE TABLE accounts("
                     "id INTEGER PRIMARY KEY, handle TEXT UNIQUE, karma INTEGER);"
                     "INSERT INTO accounts VALUES(1, 'ann', 10);"
                     "INSERT INTO accounts VALUES(2, 'bob', 25);"
                     "INSERT INTO accounts VALUES(3, 'eve', NULL);") >= 0);
  return db;
}

}  // namespace

TEST_CASE("Sqlite3Db: open, reopen and close", "[sqlite3_db]") {
  Sqlite3Db db;
  REQUIRE_FALSE(db.IsOpen());
  REQUIRE(db.Open(":memory:").ok());
  REQUIRE(db.IsOpen());
  // A second Open() replaces the connection.
  REQUIRE(db.Open(":memory:").ok());
  REQUIRE(db.IsOpen());
  db.Close();
  REQUIRE_FALSE(db.IsOpen());
  REQUIRE(db.Handle() == nullptr);
}

TEST_CASE("Sqlite3Db: open rejects null and unreachable paths",
          "[sqlite3_db]") {
  Sqlite3Db db;
  REQUIRE(db.Open(nullptr).code == ErrorCode::kNullParam);
  REQUIRE_FALSE(db.Open("/nonexistent-dir/slint/x.db").ok());
  REQUIRE_FALSE(db.IsOpen());
}

TEST_CASE("Sqlite3Db: sqlite:// url names the same file", "[sqlite3_db]") {
  const char* path = "slint_test_url.db";
  std::remove(path);
  {
    Sqlite3Db db;
    REQUIRE(db.Open("sqlite://slint_test_url.db").ok());
    REQUIRE(db.ExecDml("CREATE TABLE marker(x INTEGER);") == 0);
  }
  Sqlite3Db plain;
  REQUIRE(plain.Open(path).ok());
  REQUIRE(plain.TableExists("marker"));
  plain.Close();
  std::remove(path);
}

TEST_CASE("Sqlite3Db: move transfers the handle", "[sqlite3_db]") {
  Sqlite3Db a;
  a.Open(":memory:");
  Sqlite3Db b(std::move(a));
  REQUIRE(b.IsOpen());
  REQUIRE_FALSE(a.IsOpen());

  Sqlite3Db c;
  c = std::move(b);
  REQUIRE(c.IsOpen());
  REQUIRE_FALSE(b.IsOpen());
}

TEST_CASE("Sqlite3Db: ExecDml runs scripts", "[sqlite3_db]") {
  auto db = OpenAccounts();
  Error err;
  REQUIRE(db.ExecDml("UPDATE accounts SET karma = 0 WHERE karma IS NULL;",
                     &err) == 1);
  REQUIRE(err.ok());

  REQUIRE(db.ExecDml("DELETE FROM ghosts;", &err) == -1);
  REQUIRE(err.code == ErrorCode::kError);
  REQUIRE(std::strstr(err.message, "ghosts") != nullptr);
}

TEST_CASE("Sqlite3Db: closed connection reports kNotOpen", "[sqlite3_db]") {
  Sqlite3Db db;
  Error err;
  REQUIRE(db.ExecDml("SELECT 1;", &err) == -1);
  REQUIRE(err.code == ErrorCode::kNotOpen);

  err.Clear();
  REQUIRE(db.QueryValue("SELECT 1;", {}, &err).IsNull());
  REQUIRE(err.code == ErrorCode::kNotOpen);

  REQUIRE(db.SetBusyTimeout(100).code == ErrorCode::kNotOpen);
  REQUIRE(db.LastInsertId() == 0);
  REQUIRE_FALSE(db.InTransaction());
}

TEST_CASE("Sqlite3Db: Execute binds values", "[sqlite3_db]") {
  auto db = OpenAccounts();
  Error err;
  REQUIRE(db.Execute("INSERT INTO accounts(handle, karma) VALUES(?1, ?2);",
                     {"dan", 7}, &err) == 1);
  REQUIRE(err.ok());
  REQUIRE(db.LastInsertId() == 4);

  REQUIRE(db.Execute("UPDATE accounts SET karma = karma + ?1 "
                     "WHERE karma IS NOT NULL;",
                     {5}, &err) == 3);
  REQUIRE(db.Execute("DELETE FROM accounts WHERE handle = ?1;", {"zed"},
                     &err) == 0);
  REQUIRE(err.ok());
  REQUIRE(db.QueryValue("SELECT karma FROM accounts WHERE handle = ?1;",
                        {"bob"}) == Value(30));
}

TEST_CASE("Sqlite3Db: Execute failures", "[sqlite3_db]") {
  auto db = OpenAccounts();
  Error err;
  REQUIRE(db.Execute("INSERT INTO accounts(handle) VALUES(?1);", {}, &err) ==
          -1);
  REQUIRE(err.code == ErrorCode::kRange);

  err.Clear();
  REQUIRE(db.Execute("INSERT INTO accounts(handle) VALUES(?1);", {"ann"},
                     &err) == -1);
  REQUIRE(err.code == ErrorCode::kConstraint);

  err.Clear();
  REQUIRE(db.Execute("   ", {}, &err) == -1);
  REQUIRE(err.code == ErrorCode::kMisuse);
}

TEST_CASE("Sqlite3Db: Fetch detaches rows", "[sqlite3_db]") {
  auto db = OpenAccounts();
  Error err;
  std::vector<Row> rows = db.Fetch(
      "SELECT handle, karma FROM accounts WHERE id >= ?1 ORDER BY id;", {2},
      &err);
  REQUIRE(err.ok());
  REQUIRE(rows.size() == 2);
  REQUIRE(rows[0].Get("handle") == Value("bob"));
  REQUIRE(rows[0].Get("karma") == Value(25));
  REQUIRE(rows[1].Get("karma").IsNull());

  rows = db.Fetch("SELECT missing FROM accounts;", {}, &err);
  REQUIRE(rows.empty());
  REQUIRE_FALSE(err.ok());
}

TEST_CASE("Sqlite3Db: QueryValue", "[sqlite3_db]") {
  auto db = OpenAccounts();
  REQUIRE(db.QueryValue("SELECT count(*) FROM accounts;") == Value(3));
  REQUIRE(db.QueryValue("SELECT max(karma) FROM accounts;") == Value(25));
  REQUIRE(db.QueryValue("SELECT handle FROM accounts WHERE id = ?1;", {1}) ==
          Value("ann"));
  REQUIRE(db.QueryValue("SELECT handle FROM accounts WHERE id = ?1;", {9})
              .IsNull());
}

TEST_CASE("Sqlite3Db: TableExists binds the name", "[sqlite3_db]") {
  auto db = OpenAccounts();
  REQUIRE(db.TableExists("accounts"));
  REQUIRE_FALSE(db.TableExists("ghosts"));
  REQUIRE_FALSE(db.TableExists("accounts' OR '1'='1"));
  REQUIRE_FALSE(db.TableExists(nullptr));
}

TEST_CASE("Sqlite3Db: commit and rollback", "[sqlite3_db]") {
  auto db = OpenAccounts();

  REQUIRE(db.BeginTransaction().ok());
  REQUIRE(db.InTransaction());
  db.Execute("DELETE FROM accounts WHERE id = ?1;", {1});
  REQUIRE(db.Commit().ok());
  REQUIRE_FALSE(db.InTransaction());
  REQUIRE(db.QueryValue("SELECT count(*) FROM accounts;") == Value(2));

  REQUIRE(db.BeginTransaction().ok());
  db.ExecDml("DELETE FROM accounts;");
  REQUIRE(db.QueryValue("SELECT count(*) FROM accounts;") == Value(0));
  REQUIRE(db.Rollback().ok());
  REQUIRE(db.QueryValue("SELECT count(*) FROM accounts;") == Value(2));

  REQUIRE_FALSE(db.Commit().ok());
}

TEST_CASE("Sqlite3Db: busy timeout", "[sqlite3_db]") {
  auto db = OpenAccounts();
  REQUIRE(db.SetBusyTimeout(1000).ok());
  REQUIRE(db.SetBusyTimeout(0).ok());
}
