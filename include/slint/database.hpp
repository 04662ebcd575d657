// Copyright (c) 2024 liudegui. MIT License.
//
// slint::Database<Backend> -- the connection the ORM layer talks to.
//
// Design:
//   - Owns one Backend::Db and forwards to it; no state of its own
//   - Everything above the drivers (QueryBuilder, BasicOrm) is written
//     against this class, so a backend only has to provide the traits
//     struct (Db, Query, Statement, Dialect)
//   - Values travel as slint::Value in both directions
//   - Move-only, RAII, no exceptions
//
// Usage (SQLite3, default):
//   slint::Db db;
//   db.Open("sqlite://app.db");
//   db.Execute("INSERT INTO users(id, name) VALUES(?1, ?2)", {id, "Ann"});
//   std::vector<slint::Row> rows = db.Fetch("SELECT * FROM users", {});
//
// Usage (MariaDB/MySQL, requires SLINT_HAS_MARIADB=1):
//   slint::MDb db;
//   db.Open("localhost:3306:root:pass:app");

#pragma once

#include <cstdint>
#include <utility>
#include <vector>

#include "slint/error.hpp"
#include "slint/row.hpp"
#include "slint/sqlite3_backend.hpp"
#include "slint/value.hpp"

#if defined(SLINT_HAS_MARIADB) && SLINT_HAS_MARIADB
#include "slint/maria_backend.hpp"
#endif

namespace slint {

template <typename Backend = Sqlite3Backend>
class Database {
 public:
  using DbType        = typename Backend::Db;
  using QueryType     = typename Backend::Query;
  using StatementType = typename Backend::Statement;
  using Dialect       = typename Backend::Dialect;

  Database() = default;

  Database(Database&&) noexcept = default;
  Database& operator=(Database&&) noexcept = default;

  Database(const Database&) = delete;
  Database& operator=(const Database&) = delete;

  /// `url` is backend specific, see OrmConfig.
  Error Open(const char* url) { return impl_.Open(url); }
  void Close() { impl_.Close(); }
  bool IsOpen() const { return impl_.IsOpen(); }

  // --- Statements ---

  /// Unparameterized SQL, possibly several statements (DDL, scripts).
  int32_t ExecDml(const char* sql, Error* out_error = nullptr) {
    return impl_.ExecDml(sql, out_error);
  }

  /// One parameterized statement. Affected rows, or -1 on error.
  int32_t Execute(const char* sql, const std::vector<Value>& params,
                  Error* out_error = nullptr) {
    return impl_.Execute(sql, params, out_error);
  }

  /// Every row of a parameterized SELECT, detached from the cursor.
  std::vector<Row> Fetch(const char* sql, const std::vector<Value>& params,
                         Error* out_error = nullptr) {
    return impl_.Fetch(sql, params, out_error);
  }

  Value QueryValue(const char* sql, const std::vector<Value>& params = {},
                   Error* out_error = nullptr) {
    return impl_.QueryValue(sql, params, out_error);
  }

  // --- Cursors and prepared statements ---

  QueryType ExecQuery(const char* sql, const std::vector<Value>& params,
                      Error* out_error = nullptr) {
    return impl_.ExecQuery(sql, params, out_error);
  }

  StatementType CompileStatement(const char* sql,
                                 Error* out_error = nullptr) {
    return impl_.CompileStatement(sql, out_error);
  }

  // --- Catalog / transactions ---

  bool TableExists(const char* table) { return impl_.TableExists(table); }

  Error BeginTransaction() { return impl_.BeginTransaction(); }
  Error Commit() { return impl_.Commit(); }
  Error Rollback() { return impl_.Rollback(); }
  bool InTransaction() const { return impl_.InTransaction(); }

  Error SetBusyTimeout(int32_t ms) { return impl_.SetBusyTimeout(ms); }

  /// Key generated by the last successful INSERT on this connection.
  int64_t LastInsertId() const { return impl_.LastInsertId(); }

  DbType& Impl() { return impl_; }
  const DbType& Impl() const { return impl_; }

 private:
  DbType impl_;
};

using Db        = Database<Sqlite3Backend>;
using Query     = Db::QueryType;
using Statement = Db::StatementType;

#if defined(SLINT_HAS_MARIADB) && SLINT_HAS_MARIADB
using MDb        = Database<MariaBackend>;
using MQuery     = MDb::QueryType;
using MStatement = MDb::StatementType;
#endif

}  // namespace slint
