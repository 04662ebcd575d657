// Copyright (c) 2024 liudegui. MIT License.
//
// slint::MariaStatement -- prepared statement for MariaDB/MySQL.
//
// Design:
//   - Wraps MYSQL_STMT* with RAII
//   - Move-only (no copy)
//   - 1-based parameter binding (consistent with Sqlite3Statement)
//   - Bound Values are kept in the statement and turned into MYSQL_BIND
//     entries right before execution, so their storage outlives the call
//   - ExecDml() for INSERT/UPDATE/DELETE, ExecQuery() for SELECT
//   - API-compatible with Sqlite3Statement for Database<Backend> template

#pragma once

#include <cstdint>
#include <cstring>
#include <utility>
#include <vector>

#include <mysql.h>

#include "slint/error.hpp"
#include "slint/maria_query.hpp"
#include "slint/value.hpp"

namespace slint {

class MariaDb;

// ---------------------------------------------------------------------------
// MariaStatement
// ---------------------------------------------------------------------------

class MariaStatement {
 public:
  MariaStatement() = default;

  ~MariaStatement() { Finalize(); }

  // Move
  MariaStatement(MariaStatement&& other) noexcept
      : conn_(other.conn_),
        stmt_(other.stmt_),
        params_(std::move(other.params_)),
        binds_(std::move(other.binds_)),
        int_storage_(std::move(other.int_storage_)),
        double_storage_(std::move(other.double_storage_)),
        tiny_storage_(std::move(other.tiny_storage_)) {
    other.conn_ = nullptr;
    other.stmt_ = nullptr;
  }

  MariaStatement& operator=(MariaStatement&& other) noexcept {
    if (this != &other) {
      Finalize();
      conn_ = other.conn_;
      stmt_ = other.stmt_;
      params_ = std::move(other.params_);
      binds_ = std::move(other.binds_);
      int_storage_ = std::move(other.int_storage_);
      double_storage_ = std::move(other.double_storage_);
      tiny_storage_ = std::move(other.tiny_storage_);
      other.conn_ = nullptr;
      other.stmt_ = nullptr;
    }
    return *this;
  }

  // No copy
  MariaStatement(const MariaStatement&) = delete;
  MariaStatement& operator=(const MariaStatement&) = delete;

  // --- Execute ---

  /// Execute DML. Returns affected row count, or -1 on error.
  int32_t ExecDml(Error* out_error = nullptr) {
    if (stmt_ == nullptr) {
      Report(out_error, ErrorCode::kMisuse, "Statement not initialized");
      return -1;
    }
    if (!BindParams(out_error)) { return -1; }

    if (mysql_stmt_execute(stmt_) != 0) {
      Report(out_error, MapErrno(mysql_stmt_errno(stmt_)),
             mysql_stmt_error(stmt_));
      return -1;
    }

    int64_t affected = static_cast<int64_t>(mysql_stmt_affected_rows(stmt_));
    return static_cast<int32_t>(affected);
  }

  /// Execute SELECT. Returns MariaQuery for iteration.
  /// Note: after ExecQuery(), the statement handle is transferred to
  /// the returned MariaQuery. This statement becomes empty.
  MariaQuery ExecQuery(Error* out_error = nullptr) {
    if (stmt_ == nullptr || conn_ == nullptr) {
      Report(out_error, ErrorCode::kMisuse, "Statement not initialized");
      return MariaQuery{};
    }
    if (!BindParams(out_error)) { return MariaQuery{}; }

    detail::MariaFlag update_max_length = 1;
    if (mysql_stmt_attr_set(stmt_, STMT_ATTR_UPDATE_MAX_LENGTH,
                            &update_max_length) != 0) {
      Report(out_error, ErrorCode::kError, mysql_stmt_error(stmt_));
      return MariaQuery{};
    }

    if (mysql_stmt_execute(stmt_) != 0) {
      Report(out_error, MapErrno(mysql_stmt_errno(stmt_)),
             mysql_stmt_error(stmt_));
      return MariaQuery{};
    }

    MYSQL_RES* meta = mysql_stmt_result_metadata(stmt_);
    if (meta == nullptr) {
      Report(out_error, ErrorCode::kMisuse,
             "statement does not return a result set");
      return MariaQuery{};
    }

    if (mysql_stmt_store_result(stmt_) != 0) {
      Report(out_error, ErrorCode::kError, mysql_stmt_error(stmt_));
      mysql_free_result(meta);
      return MariaQuery{};
    }

    MYSQL_STMT* stmt = stmt_;
    stmt_ = nullptr;  // ownership transferred
    return MariaQuery(stmt, meta, out_error);
  }

  // --- Bind (1-based index) ---

  Error Bind(int32_t param, const Value& value) {
    int32_t idx = param - 1;
    if (stmt_ == nullptr) {
      return Error::Make(ErrorCode::kMisuse, "Statement not initialized");
    }
    if (idx < 0 || idx >= ParamCount()) {
      return Error::Make(ErrorCode::kRange, "param out of range");
    }
    params_[static_cast<size_t>(idx)] = value;
    return Error::Ok();
  }

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
    params_ = params;
    return Error::Ok();
  }

  int32_t ParamCount() const { return static_cast<int32_t>(params_.size()); }

  // --- Reset ---

  Error Reset() {
    if (stmt_ == nullptr) {
      return Error::Make(ErrorCode::kMisuse, "Statement not initialized");
    }
    if (mysql_stmt_reset(stmt_) != 0) {
      return Error::Make(ErrorCode::kError, mysql_stmt_error(stmt_));
    }
    for (Value& v : params_) { v = Value(); }
    return Error::Ok();
  }

  void Finalize() {
    if (stmt_ != nullptr) {
      mysql_stmt_close(stmt_);
      stmt_ = nullptr;
    }
    params_.clear();
    binds_.clear();
    int_storage_.clear();
    double_storage_.clear();
    tiny_storage_.clear();
  }

  bool Valid() const { return stmt_ != nullptr; }

  int64_t InsertId() const {
    if (stmt_ == nullptr) { return 0; }
    return static_cast<int64_t>(mysql_stmt_insert_id(stmt_));
  }

  /// Maps a server/client error number to an ErrorCode.
  static ErrorCode MapErrno(unsigned int err) {
    switch (err) {
      case 1048:  // ER_BAD_NULL_ERROR
      case 1062:  // ER_DUP_ENTRY
      case 1451:  // ER_ROW_IS_REFERENCED_2
      case 1452:  // ER_NO_REFERENCED_ROW_2
        return ErrorCode::kConstraint;
      case 1205:  // ER_LOCK_WAIT_TIMEOUT
      case 1213:  // ER_LOCK_DEADLOCK
        return ErrorCode::kBusy;
      case 2006:  // CR_SERVER_GONE_ERROR
      case 2013:  // CR_SERVER_LOST
        return ErrorCode::kIoError;
      default:
        return ErrorCode::kError;
    }
  }

 private:
  friend class MariaDb;

  MariaStatement(MYSQL* conn, MYSQL_STMT* stmt)
      : conn_(conn), stmt_(stmt) {
    if (stmt_ != nullptr) {
      params_.resize(static_cast<size_t>(mysql_stmt_param_count(stmt_)));
    }
  }

  bool BindParams(Error* out_error) {
    size_t n = params_.size();
    if (n == 0) { return true; }
    binds_.assign(n, MYSQL_BIND{});
    int_storage_.assign(n, 0);
    double_storage_.assign(n, 0.0);
    tiny_storage_.assign(n, 0);
    for (size_t i = 0; i < n; ++i) {
      const Value& v = params_[i];
      MYSQL_BIND& b = binds_[i];
      std::memset(&b, 0, sizeof(MYSQL_BIND));
      switch (v.type()) {
        case ValueType::kNull:
          b.buffer_type = MYSQL_TYPE_NULL;
          break;
        case ValueType::kInteger:
          int_storage_[i] = static_cast<long long>(v.AsInt64());
          b.buffer_type = MYSQL_TYPE_LONGLONG;
          b.buffer = &int_storage_[i];
          break;
        case ValueType::kReal:
          double_storage_[i] = v.AsDouble();
          b.buffer_type = MYSQL_TYPE_DOUBLE;
          b.buffer = &double_storage_[i];
          break;
        case ValueType::kBool:
          tiny_storage_[i] = v.AsBool() ? 1 : 0;
          b.buffer_type = MYSQL_TYPE_TINY;
          b.buffer = &tiny_storage_[i];
          break;
        case ValueType::kText:
          b.buffer_type = MYSQL_TYPE_STRING;
          b.buffer = const_cast<char*>(v.AsText().data());
          b.buffer_length = static_cast<unsigned long>(v.AsText().size());
          break;
      }
    }
    if (mysql_stmt_bind_param(stmt_, binds_.data()) != 0) {
      Report(out_error, ErrorCode::kError, mysql_stmt_error(stmt_));
      return false;
    }
    return true;
  }

  MYSQL* conn_ = nullptr;
  MYSQL_STMT* stmt_ = nullptr;
  std::vector<Value> params_;
  std::vector<MYSQL_BIND> binds_;
  std::vector<long long> int_storage_;
  std::vector<double> double_storage_;
  std::vector<signed char> tiny_storage_;
};

}  // namespace slint
