// Copyright (c) 2024 liudegui. MIT License.
//
// slint::MariaDb -- MariaDB/MySQL connection, the optional ORM backend.
//
// Design:
//   - Owns the MYSQL* handle; move-only
//   - Failures go to an Error* out-param, never exceptions
//   - Execute()/Fetch()/QueryValue() run server-side prepared statements
//     with '?' placeholders; ExecDml() uses the text protocol for DDL
//   - Same member set as Sqlite3Db, so Database<MariaBackend> and
//     BasicOrm<MariaBackend> compile unchanged
//   - Connections use utf8mb4
//
// Open() takes the MariaDsn form "host:port:user:password:database",
// e.g. "db.internal:3306:app:secret:shop" or "localhost:3306:root::shop".

#pragma once

#include <cstdint>
#include <cstring>
#include <string>
#include <vector>

#include <fmt/format.h>
#include <mysql.h>

#include "slint/config.hpp"
#include "slint/error.hpp"
#include "slint/maria_query.hpp"
#include "slint/maria_statement.hpp"
#include "slint/row.hpp"
#include "slint/value.hpp"

namespace slint {

// ---------------------------------------------------------------------------
// MariaDb
// ---------------------------------------------------------------------------

class MariaDb {
 public:
  MariaDb() = default;

  ~MariaDb() { Close(); }

  // Move
  MariaDb(MariaDb&& other) noexcept
      : conn_(other.conn_),
        in_transaction_(other.in_transaction_),
        last_insert_id_(other.last_insert_id_) {
    other.conn_ = nullptr;
    other.in_transaction_ = false;
    other.last_insert_id_ = 0;
  }

  MariaDb& operator=(MariaDb&& other) noexcept {
    if (this != &other) {
      Close();
      conn_ = other.conn_;
      in_transaction_ = other.in_transaction_;
      last_insert_id_ = other.last_insert_id_;
      other.conn_ = nullptr;
      other.in_transaction_ = false;
      other.last_insert_id_ = 0;
    }
    return *this;
  }

  // No copy
  MariaDb(const MariaDb&) = delete;
  MariaDb& operator=(const MariaDb&) = delete;

  // --- Open / Close ---

  /// Open connection. Format: "host:port:user:password:database"
  Error Open(const char* dsn) {
    if (dsn == nullptr) {
      return Error::Make(ErrorCode::kNullParam, "dsn is null");
    }
    Close();

    MariaDsn parsed = MariaDsn::Parse(dsn);

    conn_ = mysql_init(nullptr);
    if (conn_ == nullptr) {
      return Error::Make(ErrorCode::kError, "mysql_init failed");
    }

    const char* password =
        parsed.password.empty() ? nullptr : parsed.password.c_str();
    const char* database =
        parsed.database.empty() ? nullptr : parsed.database.c_str();
    bool connected =
        mysql_real_connect(conn_, parsed.host.c_str(), parsed.user.c_str(),
                           password, database, parsed.port, nullptr,
                           0) != nullptr &&
        mysql_set_character_set(conn_, "utf8mb4") == 0;
    if (!connected) {
      Error err = Error::Make(MariaStatement::MapErrno(mysql_errno(conn_)),
                              mysql_error(conn_));
      Close();
      return err;
    }

    return Error::Ok();
  }

  void Close() {
    if (conn_ != nullptr) {
      mysql_close(conn_);
      conn_ = nullptr;
    }
    in_transaction_ = false;
  }

  bool IsOpen() const { return conn_ != nullptr; }

  // --- DML ---

  /// Execute raw SQL through the text protocol.
  /// Returns number of affected rows, or -1 on error.
  int32_t ExecDml(const char* sql, Error* out_error = nullptr) {
    if (conn_ == nullptr) {
      Report(out_error, ErrorCode::kNotOpen, "Database not open");
      return -1;
    }
    if (sql == nullptr) {
      Report(out_error, ErrorCode::kNullParam, "sql is null");
      return -1;
    }

    if (mysql_query(conn_, sql) != 0) {
      Report(out_error, MariaStatement::MapErrno(mysql_errno(conn_)),
             mysql_error(conn_));
      return -1;
    }

    // Discard any result set so the connection stays usable.
    MYSQL_RES* res = mysql_store_result(conn_);
    if (res != nullptr) { mysql_free_result(res); }

    last_insert_id_ = static_cast<int64_t>(mysql_insert_id(conn_));
    int64_t affected = static_cast<int64_t>(mysql_affected_rows(conn_));
    return static_cast<int32_t>(affected);
  }

  /// Execute one parameterized DML statement. Returns affected rows or -1.
  int32_t Execute(const char* sql, const std::vector<Value>& params,
                  Error* out_error = nullptr) {
    MariaStatement stmt = CompileStatement(sql, out_error);
    if (!stmt.Valid()) { return -1; }
    Error err = stmt.BindAll(params);
    if (!err.ok()) {
      Report(out_error, err);
      return -1;
    }
    int32_t affected = stmt.ExecDml(out_error);
    if (affected >= 0) { last_insert_id_ = stmt.InsertId(); }
    return affected;
  }

  // --- Scalar query ---

  /// First column of the first row; null when the query yields no rows.
  Value QueryValue(const char* sql, const std::vector<Value>& params = {},
                   Error* out_error = nullptr) {
    Error err;
    MariaQuery q = ExecQuery(sql, params, &err);
    if (!err.ok()) {
      Report(out_error, err);
      return Value();
    }
    if (q.Eof() || q.NumFields() < 1) { return Value(); }
    return q.GetValue(0);
  }

  // --- Query ---

  MariaQuery ExecQuery(const char* sql, Error* out_error = nullptr) {
    return ExecQuery(sql, std::vector<Value>{}, out_error);
  }

  MariaQuery ExecQuery(const char* sql, const std::vector<Value>& params,
                       Error* out_error = nullptr) {
    MariaStatement stmt = CompileStatement(sql, out_error);
    if (!stmt.Valid()) { return MariaQuery{}; }
    Error err = stmt.BindAll(params);
    if (!err.ok()) {
      Report(out_error, err);
      return MariaQuery{};
    }
    return stmt.ExecQuery(out_error);
  }

  std::vector<Row> Fetch(const char* sql, const std::vector<Value>& params,
                         Error* out_error = nullptr) {
    std::vector<Row> rows;
    Error err;
    MariaQuery q = ExecQuery(sql, params, &err);
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

  MariaStatement CompileStatement(const char* sql,
                                  Error* out_error = nullptr) {
    if (conn_ == nullptr) {
      Report(out_error, ErrorCode::kNotOpen, "Database not open");
      return MariaStatement{};
    }
    if (sql == nullptr) {
      Report(out_error, ErrorCode::kNullParam, "sql is null");
      return MariaStatement{};
    }

    MYSQL_STMT* stmt = mysql_stmt_init(conn_);
    if (stmt == nullptr) {
      Report(out_error, ErrorCode::kError, "mysql_stmt_init failed");
      return MariaStatement{};
    }

    if (mysql_stmt_prepare(stmt, sql,
                           static_cast<unsigned long>(std::strlen(sql))) != 0) {
      Report(out_error, MariaStatement::MapErrno(mysql_stmt_errno(stmt)),
             mysql_stmt_error(stmt));
      mysql_stmt_close(stmt);
      return MariaStatement{};
    }

    return MariaStatement(conn_, stmt);
  }

  // --- Table exists ---

  bool TableExists(const char* table) {
    if (conn_ == nullptr || table == nullptr) { return false; }
    int64_t count = 0;
    return detail::ToInt64(
               QueryValue("SELECT COUNT(*) FROM information_schema.tables "
                          "WHERE table_schema = DATABASE() AND table_name = ?",
                          {Value(table)}),
               &count) &&
           count > 0;
  }

  // --- Transaction ---

  Error BeginTransaction() {
    Error err;
    ExecDml("START TRANSACTION;", &err);
    if (err.ok()) { in_transaction_ = true; }
    return err;
  }

  Error Commit() {
    Error err;
    ExecDml("COMMIT;", &err);
    in_transaction_ = false;
    return err;
  }

  Error Rollback() {
    Error err;
    ExecDml("ROLLBACK;", &err);
    in_transaction_ = false;
    return err;
  }

  bool InTransaction() const { return in_transaction_; }

  // --- Misc ---

  /// MariaDB has no busy handler; maps to innodb_lock_wait_timeout.
  Error SetBusyTimeout(int32_t ms) {
    if (conn_ == nullptr) {
      return Error::Make(ErrorCode::kNotOpen, "Database not open");
    }
    std::string sql = fmt::format("SET SESSION innodb_lock_wait_timeout = {}",
                                  LockWaitSeconds(ms));
    Error err;
    ExecDml(sql.c_str(), &err);
    return err;
  }

  /// Milliseconds rounded up to whole seconds, at least one.
  static int64_t LockWaitSeconds(int32_t ms) {
    if (ms <= 1000) { return 1; }
    return (static_cast<int64_t>(ms) + 999) / 1000;
  }

  int64_t LastInsertId() const { return last_insert_id_; }

  MYSQL* Handle() const { return conn_; }

 private:
  MYSQL* conn_ = nullptr;
  bool in_transaction_ = false;
  int64_t last_insert_id_ = 0;
};

}  // namespace slint
