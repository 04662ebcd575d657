// Copyright (c) 2024 liudegui. MIT License.
//
// slint::Sqlite3Db -- SQLite3 connection, the default ORM backend.
//
// Design:
//   - Owns the sqlite3* handle; move-only
//   - Failures go to an Error* out-param, never exceptions
//   - Execute()/Fetch()/QueryValue() bind slint::Value lists to numbered
//     placeholders; ExecDml() is kept for DDL and multi-statement scripts
//   - Opens plain paths, ":memory:" and "sqlite://<path>" URLs
//   - No global state; one connection per thread

#pragma once

#include <cstdint>
#include <cstring>
#include <vector>

#include "sqlite3.h"

#include "slint/error.hpp"
#include "slint/row.hpp"
#include "slint/sqlite3_query.hpp"
#include "slint/sqlite3_statement.hpp"
#include "slint/value.hpp"

namespace slint {

// ---------------------------------------------------------------------------
// Sqlite3Db
// ---------------------------------------------------------------------------

class Sqlite3Db {
 public:
  static constexpr const char* kUrlScheme = "sqlite://";

  Sqlite3Db() = default;

  ~Sqlite3Db() { Close(); }

  // Move
  Sqlite3Db(Sqlite3Db&& other) noexcept : db_(other.db_) {
    other.db_ = nullptr;
  }

  Sqlite3Db& operator=(Sqlite3Db&& other) noexcept {
    if (this != &other) {
      Close();
      db_ = other.db_;
      other.db_ = nullptr;
    }
    return *this;
  }

  // No copy
  Sqlite3Db(const Sqlite3Db&) = delete;
  Sqlite3Db& operator=(const Sqlite3Db&) = delete;

  // --- Open / Close ---

  /// Opens a file path, ":memory:", or "sqlite://<path>".
  Error Open(const char* path) {
    if (path == nullptr) {
      return Error::Make(ErrorCode::kNullParam, "path is null");
    }
    Close();
    size_t scheme_len = std::strlen(kUrlScheme);
    if (std::strncmp(path, kUrlScheme, scheme_len) == 0) {
      path += scheme_len;
    }
    int32_t rc = sqlite3_open(path, &db_);
    if (rc != SQLITE_OK) {
      Error err = Error::Make(ErrorCode::kError,
                              db_ ? sqlite3_errmsg(db_) : "sqlite3_open failed");
      if (db_ != nullptr) {
        sqlite3_close(db_);
        db_ = nullptr;
      }
      return err;
    }
    return Error::Ok();
  }

  void Close() {
    if (db_ != nullptr) {
      sqlite3_close(db_);
      db_ = nullptr;
    }
  }

  bool IsOpen() const { return db_ != nullptr; }

  // --- DML ---

  /// Execute raw SQL (may contain several statements).
  /// Returns number of affected rows, or -1 on error.
  int32_t ExecDml(const char* sql, Error* out_error = nullptr) {
    if (db_ == nullptr) {
      Report(out_error, ErrorCode::kNotOpen, "Database not open");
      return -1;
    }
    if (sql == nullptr) {
      Report(out_error, ErrorCode::kNullParam, "sql is null");
      return -1;
    }

    char* errmsg = nullptr;
    int32_t rc = sqlite3_exec(db_, sql, nullptr, nullptr, &errmsg);
    if (rc == SQLITE_OK) {
      return sqlite3_changes(db_);
    }

    Report(out_error, Sqlite3Statement::MapResult(rc),
           errmsg ? errmsg : sqlite3_errmsg(db_));
    if (errmsg != nullptr) { sqlite3_free(errmsg); }
    return -1;
  }

  /// Execute one parameterized DML statement. Returns affected rows or -1.
  int32_t Execute(const char* sql, const std::vector<Value>& params,
                  Error* out_error = nullptr) {
    Sqlite3Statement stmt = CompileStatement(sql, out_error);
    if (!stmt.Valid()) { return -1; }
    Error err = stmt.BindAll(params);
    if (!err.ok()) {
      Report(out_error, err);
      return -1;
    }
    return stmt.ExecDml(out_error);
  }

  // --- Scalar query ---

  /// First column of the first row; null when the query yields no rows.
  Value QueryValue(const char* sql, const std::vector<Value>& params = {},
                   Error* out_error = nullptr) {
    Error err;
    Sqlite3Query q = ExecQuery(sql, params, &err);
    if (!err.ok()) {
      Report(out_error, err);
      return Value();
    }
    if (q.Eof() || q.NumFields() < 1) { return Value(); }
    return q.GetValue(0);
  }

  // --- Query ---

  /// Execute SELECT query. Returns Sqlite3Query for forward iteration.
  Sqlite3Query ExecQuery(const char* sql, Error* out_error = nullptr) {
    return ExecQuery(sql, std::vector<Value>{}, out_error);
  }

  Sqlite3Query ExecQuery(const char* sql, const std::vector<Value>& params,
                         Error* out_error = nullptr) {
    Sqlite3Statement stmt = CompileStatement(sql, out_error);
    if (!stmt.Valid()) { return Sqlite3Query{}; }
    Error err = stmt.BindAll(params);
    if (!err.ok()) {
      Report(out_error, err);
      return Sqlite3Query{};
    }
    return stmt.ExecQuery(out_error);
  }

  /// Execute a parameterized SELECT and collect every row.
  std::vector<Row> Fetch(const char* sql, const std::vector<Value>& params,
                         Error* out_error = nullptr) {
    std::vector<Row> rows;
    Error err;
    Sqlite3Query q = ExecQuery(sql, params, &err);
    while (err.ok() && !q.Eof()) {
      rows.push_back(q.ReadRow());
      q.NextRow(&err);
    }
    if (!err.ok()) {
      Report(out_error, err);
      rows.clear();
    }
    return rows;
  }

  // --- Statement ---

  /// Compile a prepared statement.
  Sqlite3Statement CompileStatement(const char* sql,
                                    Error* out_error = nullptr) {
    if (db_ == nullptr) {
      Report(out_error, ErrorCode::kNotOpen, "Database not open");
      return Sqlite3Statement{};
    }
    if (sql == nullptr) {
      Report(out_error, ErrorCode::kNullParam, "sql is null");
      return Sqlite3Statement{};
    }

    sqlite3_stmt* stmt = Compile(sql, out_error);
    if (stmt == nullptr) { return Sqlite3Statement{}; }
    return Sqlite3Statement(db_, stmt);
  }

  // --- Table exists ---

  bool TableExists(const char* table) {
    if (db_ == nullptr || table == nullptr) { return false; }
    int64_t count = 0;
    return detail::ToInt64(
               QueryValue("SELECT count(*) FROM sqlite_master "
                          "WHERE type='table' AND name=?1",
                          {Value(table)}),
               &count) &&
           count > 0;
  }

  // --- Transaction ---

  Error BeginTransaction() {
    Error err;
    ExecDml("BEGIN TRANSACTION;", &err);
    return err;
  }

  Error Commit() {
    Error err;
    ExecDml("COMMIT TRANSACTION;", &err);
    return err;
  }

  Error Rollback() {
    Error err;
    ExecDml("ROLLBACK;", &err);
    return err;
  }

  bool InTransaction() const {
    if (db_ == nullptr) { return false; }
    return sqlite3_get_autocommit(db_) == 0;
  }

  // --- Misc ---

  Error SetBusyTimeout(int32_t ms) {
    if (db_ == nullptr) {
      return Error::Make(ErrorCode::kNotOpen, "Database not open");
    }
    if (sqlite3_busy_timeout(db_, ms) != SQLITE_OK) {
      return Error::Make(ErrorCode::kError, sqlite3_errmsg(db_));
    }
    return Error::Ok();
  }

  int64_t LastInsertId() const {
    if (db_ == nullptr) { return 0; }
    return static_cast<int64_t>(sqlite3_last_insert_rowid(db_));
  }

  sqlite3* Handle() const { return db_; }

 private:
  sqlite3_stmt* Compile(const char* sql, Error* out_error) {
    const char* tail = nullptr;
    sqlite3_stmt* stmt = nullptr;
    int32_t rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, &tail);
    if (rc != SQLITE_OK) {
      Report(out_error, Sqlite3Statement::MapResult(rc), sqlite3_errmsg(db_));
      return nullptr;
    }
    if (stmt == nullptr) {
      // Empty or comment-only SQL compiles to no statement.
      Report(out_error, ErrorCode::kMisuse, "no SQL statement to compile");
    }
    return stmt;
  }

  sqlite3* db_ = nullptr;
};

}  // namespace slint
