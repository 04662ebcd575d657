// Copyright (c) 2024 liudegui. MIT License.
//
// slint::Sqlite3Statement -- prepared statement with RAII.
//
// Design:
//   - Wraps sqlite3_stmt* with RAII
//   - Move-only (no copy)
//   - 1-based parameter binding (matches SQLite3 convention)
//   - Parameters are slint::Value; BindAll() binds a whole parameter list
//   - ExecDml() for INSERT/UPDATE/DELETE, ExecQuery() for SELECT

#pragma once

#include <cstdint>
#include <vector>

#include "sqlite3.h"

#include "slint/error.hpp"
#include "slint/sqlite3_query.hpp"
#include "slint/value.hpp"

namespace slint {

class Sqlite3Db;

// ---------------------------------------------------------------------------
// Sqlite3Statement
// ---------------------------------------------------------------------------

class Sqlite3Statement {
 public:
  Sqlite3Statement() = default;

  ~Sqlite3Statement() { Finalize(); }

  // Move
  Sqlite3Statement(Sqlite3Statement&& other) noexcept
      : db_(other.db_), stmt_(other.stmt_) {
    other.db_ = nullptr;
    other.stmt_ = nullptr;
  }

  Sqlite3Statement& operator=(Sqlite3Statement&& other) noexcept {
    if (this != &other) {
      Finalize();
      db_ = other.db_;
      stmt_ = other.stmt_;
      other.db_ = nullptr;
      other.stmt_ = nullptr;
    }
    return *this;
  }

  // No copy
  Sqlite3Statement(const Sqlite3Statement&) = delete;
  Sqlite3Statement& operator=(const Sqlite3Statement&) = delete;

  // --- Execute ---

  /// Execute DML (INSERT/UPDATE/DELETE). Returns affected row count.
  int32_t ExecDml(Error* out_error = nullptr) {
    if (db_ == nullptr || stmt_ == nullptr) {
      Report(out_error, ErrorCode::kMisuse, "Statement not initialized");
      return -1;
    }

    int32_t rc = sqlite3_step(stmt_);
    if (rc == SQLITE_DONE || rc == SQLITE_ROW) {
      int32_t changes = sqlite3_changes(db_);
      int32_t reset_rc = sqlite3_reset(stmt_);
      if (reset_rc != SQLITE_OK) {
        Report(out_error, ErrorCode::kError, sqlite3_errmsg(db_));
      }
      return changes;
    }

    ErrorCode code = MapResult(rc);
    sqlite3_reset(stmt_);
    Report(out_error, code, sqlite3_errmsg(db_));
    return -1;
  }

  /// Execute SELECT query. Returns Sqlite3Query for iteration.
  /// Note: after ExecQuery(), the statement handle is transferred to
  /// the returned Sqlite3Query. This statement becomes empty.
  Sqlite3Query ExecQuery(Error* out_error = nullptr) {
    if (db_ == nullptr || stmt_ == nullptr) {
      Report(out_error, ErrorCode::kMisuse, "Statement not initialized");
      return Sqlite3Query{};
    }

    int32_t rc = sqlite3_step(stmt_);
    if (rc == SQLITE_DONE || rc == SQLITE_ROW) {
      Sqlite3Query q(db_, stmt_, rc == SQLITE_DONE);
      stmt_ = nullptr;  // ownership transferred
      return q;
    }

    ErrorCode code = MapResult(rc);
    sqlite3_reset(stmt_);
    Report(out_error, code, sqlite3_errmsg(db_));
    return Sqlite3Query{};
  }

  // --- Bind (1-based index) ---

  Error Bind(int32_t param, const Value& value) {
    if (stmt_ == nullptr) {
      return Error::Make(ErrorCode::kMisuse, "Statement not initialized");
    }
    int32_t rc = SQLITE_OK;
    switch (value.type()) {
      case ValueType::kNull:
        rc = sqlite3_bind_null(stmt_, param);
        break;
      case ValueType::kInteger:
        rc = sqlite3_bind_int64(stmt_, param,
                                static_cast<sqlite3_int64>(value.AsInt64()));
        break;
      case ValueType::kReal:
        rc = sqlite3_bind_double(stmt_, param, value.AsDouble());
        break;
      case ValueType::kBool:
        rc = sqlite3_bind_int(stmt_, param, value.AsBool() ? 1 : 0);
        break;
      case ValueType::kText:
        rc = sqlite3_bind_text(stmt_, param, value.AsText().data(),
                               static_cast<int>(value.AsText().size()),
                               SQLITE_TRANSIENT);
        break;
    }
    if (rc == SQLITE_RANGE) {
      return Error::Make(ErrorCode::kRange, "param out of range");
    }
    if (rc != SQLITE_OK) {
      return Error::Make(ErrorCode::kError, sqlite3_errmsg(db_));
    }
    return Error::Ok();
  }

  /// Binds params[i] to placeholder i + 1.
  Error BindAll(const std::vector<Value>& params) {
    if (stmt_ == nullptr) {
      return Error::Make(ErrorCode::kMisuse, "Statement not initialized");
    }
    if (static_cast<int32_t>(params.size()) != ParamCount()) {
      Error err;
      err.SetFormat(ErrorCode::kRange, "statement expects %d params, got %d",
                    ParamCount(), static_cast<int32_t>(params.size()));
      return err;
    }
    for (size_t i = 0; i < params.size(); ++i) {
      Error err = Bind(static_cast<int32_t>(i) + 1, params[i]);
      if (!err.ok()) { return err; }
    }
    return Error::Ok();
  }

  int32_t ParamCount() const {
    if (stmt_ == nullptr) { return 0; }
    return sqlite3_bind_parameter_count(stmt_);
  }

  // --- Reset ---

  Error Reset() {
    if (stmt_ == nullptr) {
      return Error::Make(ErrorCode::kMisuse, "Statement not initialized");
    }
    int32_t rc = sqlite3_reset(stmt_);
    if (rc != SQLITE_OK) {
      return Error::Make(ErrorCode::kError,
                         db_ ? sqlite3_errmsg(db_) : "reset failed");
    }
    sqlite3_clear_bindings(stmt_);
    return Error::Ok();
  }

  void Finalize() {
    if (stmt_ != nullptr) {
      sqlite3_finalize(stmt_);
      stmt_ = nullptr;
    }
  }

  bool Valid() const { return stmt_ != nullptr; }
  sqlite3_stmt* Handle() const { return stmt_; }

  /// Maps a primary SQLite result code to an ErrorCode.
  static ErrorCode MapResult(int32_t rc) {
    switch (rc & 0xff) {
      case SQLITE_OK:
      case SQLITE_ROW:
      case SQLITE_DONE:       return ErrorCode::kOk;
      case SQLITE_BUSY:
      case SQLITE_LOCKED:     return ErrorCode::kBusy;
      case SQLITE_NOTFOUND:   return ErrorCode::kNotFound;
      case SQLITE_CONSTRAINT: return ErrorCode::kConstraint;
      case SQLITE_MISMATCH:   return ErrorCode::kMismatch;
      case SQLITE_MISUSE:     return ErrorCode::kMisuse;
      case SQLITE_RANGE:      return ErrorCode::kRange;
      case SQLITE_IOERR:      return ErrorCode::kIoError;
      case SQLITE_FULL:       return ErrorCode::kFull;
      default:                return ErrorCode::kError;
    }
  }

 private:
  friend class Sqlite3Db;

  Sqlite3Statement(sqlite3* db, sqlite3_stmt* stmt)
      : db_(db), stmt_(stmt) {}

  sqlite3* db_ = nullptr;
  sqlite3_stmt* stmt_ = nullptr;
};

}  // namespace slint
