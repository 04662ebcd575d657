// Copyright (c) 2024 liudegui. MIT License.
//
// slint::MariaQuery -- forward-only cursor over a prepared MariaDB SELECT.
//
// Design:
//   - Owns the executed MYSQL_STMT* and its result metadata (RAII)
//   - Move-only (no copy)
//   - Every column is bound as a string buffer sized from the stored
//     result's max_length; values are converted to slint::Value using the
//     column's field type
//   - API-compatible with Sqlite3Query for Database<Backend> template

#pragma once

#include <cstdint>
#include <cstring>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <mysql.h>

#include "slint/error.hpp"
#include "slint/row.hpp"
#include "slint/value.hpp"

namespace slint {

class MariaDb;
class MariaStatement;

namespace detail {

// my_bool in MariaDB Connector/C, bool in MySQL 8 client headers.
using MariaFlag = decltype(MYSQL_BIND::is_null_value);

inline bool IsMariaIntegerType(enum_field_types type) {
  switch (type) {
    case MYSQL_TYPE_TINY:
    case MYSQL_TYPE_SHORT:
    case MYSQL_TYPE_LONG:
    case MYSQL_TYPE_INT24:
    case MYSQL_TYPE_LONGLONG:
    case MYSQL_TYPE_YEAR:
      return true;
    default:
      return false;
  }
}

inline bool IsMariaRealType(enum_field_types type) {
  switch (type) {
    case MYSQL_TYPE_FLOAT:
    case MYSQL_TYPE_DOUBLE:
    case MYSQL_TYPE_DECIMAL:
    case MYSQL_TYPE_NEWDECIMAL:
      return true;
    default:
      return false;
  }
}

}  // namespace detail

// ---------------------------------------------------------------------------
// MariaQuery
// ---------------------------------------------------------------------------

class MariaQuery {
 public:
  MariaQuery() = default;

  ~MariaQuery() { Finalize(); }

  // Move
  MariaQuery(MariaQuery&& other) noexcept
      : stmt_(other.stmt_),
        meta_(other.meta_),
        fields_(other.fields_),
        eof_(other.eof_),
        num_fields_(other.num_fields_),
        binds_(std::move(other.binds_)),
        buffers_(std::move(other.buffers_)),
        lengths_(std::move(other.lengths_)),
        nulls_(std::move(other.nulls_)),
        errors_(std::move(other.errors_)),
        columns_(std::move(other.columns_)) {
    other.stmt_ = nullptr;
    other.meta_ = nullptr;
    other.fields_ = nullptr;
    other.eof_ = true;
    other.num_fields_ = 0;
  }

  MariaQuery& operator=(MariaQuery&& other) noexcept {
    if (this != &other) {
      Finalize();
      stmt_ = other.stmt_;
      meta_ = other.meta_;
      fields_ = other.fields_;
      eof_ = other.eof_;
      num_fields_ = other.num_fields_;
      binds_ = std::move(other.binds_);
      buffers_ = std::move(other.buffers_);
      lengths_ = std::move(other.lengths_);
      nulls_ = std::move(other.nulls_);
      errors_ = std::move(other.errors_);
      columns_ = std::move(other.columns_);
      other.stmt_ = nullptr;
      other.meta_ = nullptr;
      other.fields_ = nullptr;
      other.eof_ = true;
      other.num_fields_ = 0;
    }
    return *this;
  }

  // No copy
  MariaQuery(const MariaQuery&) = delete;
  MariaQuery& operator=(const MariaQuery&) = delete;

  // --- Field info ---

  int32_t NumFields() const { return num_fields_; }

  int32_t FieldIndex(const char* name) const {
    if (fields_ == nullptr || name == nullptr) { return -1; }
    for (int32_t i = 0; i < num_fields_; ++i) {
      if (fields_[i].name != nullptr &&
          std::strcmp(name, fields_[i].name) == 0) {
        return i;
      }
    }
    return -1;
  }

  const char* FieldName(int32_t col) const {
    if (fields_ == nullptr || col < 0 || col >= num_fields_) {
      return nullptr;
    }
    return fields_[col].name;
  }

  bool FieldIsNull(int32_t col) const {
    if (eof_ || col < 0 || col >= num_fields_) { return true; }
    return nulls_[static_cast<size_t>(col)] != 0;
  }

  // --- Field values ---

  Value GetValue(int32_t col) const {
    if (FieldIsNull(col)) { return Value(); }
    size_t idx = static_cast<size_t>(col);
    std::string text(buffers_[idx].data(), lengths_[idx]);
    enum_field_types type = fields_[col].type;
    if (detail::IsMariaIntegerType(type)) {
      int64_t v = 0;
      if (detail::ParseInt64(text, &v)) { return Value(v); }
    } else if (detail::IsMariaRealType(type)) {
      double v = 0.0;
      if (detail::ParseDouble(text, &v)) { return Value(v); }
    }
    return Value(std::move(text));
  }

  Value GetValue(const char* name) const { return GetValue(FieldIndex(name)); }

  Row ReadRow() {
    if (columns_ == nullptr) {
      auto names = std::make_shared<std::vector<std::string>>();
      names->reserve(static_cast<size_t>(num_fields_));
      for (int32_t i = 0; i < num_fields_; ++i) {
        const char* name = FieldName(i);
        names->emplace_back(name != nullptr ? name : "");
      }
      columns_ = std::move(names);
    }
    std::vector<Value> values;
    values.reserve(static_cast<size_t>(num_fields_));
    for (int32_t i = 0; i < num_fields_; ++i) {
      values.push_back(GetValue(i));
    }
    return Row(columns_, std::move(values));
  }

  // --- Navigation ---

  bool Eof() const { return eof_; }

  void NextRow(Error* out_error = nullptr) {
    if (stmt_ == nullptr || eof_) { return; }
    Fetch(out_error);
  }

  void Finalize() {
    if (meta_ != nullptr) {
      mysql_free_result(meta_);
      meta_ = nullptr;
    }
    if (stmt_ != nullptr) {
      mysql_stmt_free_result(stmt_);
      mysql_stmt_close(stmt_);
      stmt_ = nullptr;
    }
    fields_ = nullptr;
    eof_ = true;
    num_fields_ = 0;
    binds_.clear();
    buffers_.clear();
    lengths_.clear();
    nulls_.clear();
    errors_.clear();
    columns_.reset();
  }

 private:
  friend class MariaDb;
  friend class MariaStatement;

  // Takes ownership of an executed statement whose result was stored
  // with STMT_ATTR_UPDATE_MAX_LENGTH set.
  MariaQuery(MYSQL_STMT* stmt, MYSQL_RES* meta, Error* out_error)
      : stmt_(stmt), meta_(meta) {
    num_fields_ = static_cast<int32_t>(mysql_num_fields(meta_));
    fields_ = mysql_fetch_fields(meta_);

    size_t n = static_cast<size_t>(num_fields_);
    binds_.assign(n, MYSQL_BIND{});
    buffers_.resize(n);
    lengths_.assign(n, 0);
    nulls_.assign(n, 0);
    errors_.assign(n, 0);
    for (size_t i = 0; i < n; ++i) {
      buffers_[i].assign(static_cast<size_t>(fields_[i].max_length) + 1, '\0');
      BindColumn(i);
    }

    if (mysql_stmt_bind_result(stmt_, binds_.data()) != 0) {
      Report(out_error, ErrorCode::kError, mysql_stmt_error(stmt_));
      Finalize();
      return;
    }
    eof_ = false;
    Fetch(out_error);
  }

  void BindColumn(size_t i) {
    std::memset(&binds_[i], 0, sizeof(MYSQL_BIND));
    binds_[i].buffer_type = MYSQL_TYPE_STRING;
    binds_[i].buffer = buffers_[i].data();
    binds_[i].buffer_length = static_cast<unsigned long>(buffers_[i].size());
    binds_[i].length = &lengths_[i];
    binds_[i].is_null = &nulls_[i];
    binds_[i].error = &errors_[i];
  }

  void Fetch(Error* out_error) {
    int32_t rc = mysql_stmt_fetch(stmt_);
    if (rc == MYSQL_NO_DATA) {
      eof_ = true;
      return;
    }
    if (rc == MYSQL_DATA_TRUNCATED) {
      // Grow the truncated columns and re-read them.
      for (size_t i = 0; i < binds_.size(); ++i) {
        if (errors_[i] == 0) { continue; }
        buffers_[i].assign(static_cast<size_t>(lengths_[i]) + 1, '\0');
        BindColumn(i);
        if (mysql_stmt_fetch_column(stmt_, &binds_[i],
                                    static_cast<unsigned int>(i), 0) != 0) {
          Report(out_error, ErrorCode::kError, mysql_stmt_error(stmt_));
          eof_ = true;
          return;
        }
      }
      if (mysql_stmt_bind_result(stmt_, binds_.data()) != 0) {
        Report(out_error, ErrorCode::kError, mysql_stmt_error(stmt_));
        eof_ = true;
      }
      return;
    }
    if (rc != 0) {
      Report(out_error, ErrorCode::kError, mysql_stmt_error(stmt_));
      eof_ = true;
    }
  }

  MYSQL_STMT* stmt_ = nullptr;
  MYSQL_RES* meta_ = nullptr;
  MYSQL_FIELD* fields_ = nullptr;
  bool eof_ = true;
  int32_t num_fields_ = 0;
  std::vector<MYSQL_BIND> binds_;
  std::vector<std::vector<char>> buffers_;
  std::vector<unsigned long> lengths_;
  std::vector<detail::MariaFlag> nulls_;
  std::vector<detail::MariaFlag> errors_;
  ColumnNames columns_;
};

}  // namespace slint
