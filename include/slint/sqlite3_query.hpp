// Copyright (c) 2024 liudegui. MIT License.
//
// slint::Sqlite3Query -- forward-only cursor over a stepped statement.
//
// Design:
//   - Wraps sqlite3_stmt* with RAII
//   - Move-only (no copy)
//   - Forward iteration via Eof()/NextRow()
//   - Columns read as slint::Value according to their storage class;
//     ReadRow() detaches the current row from the statement

#pragma once

#include <cstdint>
#include <cstring>
#include <memory>
#include <string>
#include <vector>

#include "sqlite3.h"

#include "slint/error.hpp"
#include "slint/row.hpp"
#include "slint/value.hpp"

namespace slint {

class Sqlite3Db;
class Sqlite3Statement;

// ---------------------------------------------------------------------------
// Sqlite3Query
// ---------------------------------------------------------------------------

class Sqlite3Query {
 public:
  Sqlite3Query() = default;

  ~Sqlite3Query() { Finalize(); }

  // Move
  Sqlite3Query(Sqlite3Query&& other) noexcept
      : db_(other.db_),
        stmt_(other.stmt_),
        eof_(other.eof_),
        num_fields_(other.num_fields_),
        columns_(std::move(other.columns_)) {
    other.db_ = nullptr;
    other.stmt_ = nullptr;
    other.eof_ = true;
    other.num_fields_ = 0;
  }

  Sqlite3Query& operator=(Sqlite3Query&& other) noexcept {
    if (this != &other) {
      Finalize();
      db_ = other.db_;
      stmt_ = other.stmt_;
      eof_ = other.eof_;
      num_fields_ = other.num_fields_;
      columns_ = std::move(other.columns_);
      other.db_ = nullptr;
      other.stmt_ = nullptr;
      other.eof_ = true;
      other.num_fields_ = 0;
    }
    return *this;
  }

  // No copy
  Sqlite3Query(const Sqlite3Query&) = delete;
  Sqlite3Query& operator=(const Sqlite3Query&) = delete;

  // --- Field info ---

  int32_t NumFields() const { return num_fields_; }

  int32_t FieldIndex(const char* name) const {
    if (stmt_ == nullptr || name == nullptr) { return -1; }
    for (int32_t i = 0; i < num_fields_; ++i) {
      const char* col_name = sqlite3_column_name(stmt_, i);
      if (col_name != nullptr && std::strcmp(name, col_name) == 0) {
        return i;
      }
    }
    return -1;
  }

  const char* FieldName(int32_t col) const {
    if (stmt_ == nullptr || col < 0 || col >= num_fields_) {
      return nullptr;
    }
    return sqlite3_column_name(stmt_, col);
  }

  bool FieldIsNull(int32_t col) const {
    if (stmt_ == nullptr || col < 0 || col >= num_fields_) { return true; }
    return sqlite3_column_type(stmt_, col) == SQLITE_NULL;
  }

  // --- Field values ---

  /// Current row's column as a Value; BLOBs come back as text bytes.
  Value GetValue(int32_t col) const {
    if (stmt_ == nullptr || col < 0 || col >= num_fields_) { return Value(); }
    switch (sqlite3_column_type(stmt_, col)) {
      case SQLITE_INTEGER:
        return Value(static_cast<int64_t>(sqlite3_column_int64(stmt_, col)));
      case SQLITE_FLOAT:
        return Value(sqlite3_column_double(stmt_, col));
      case SQLITE_TEXT: {
        const char* text =
            reinterpret_cast<const char*>(sqlite3_column_text(stmt_, col));
        int32_t len = sqlite3_column_bytes(stmt_, col);
        if (text == nullptr) { return Value(std::string()); }
        return Value(std::string(text, static_cast<size_t>(len)));
      }
      case SQLITE_BLOB: {
        const char* blob =
            static_cast<const char*>(sqlite3_column_blob(stmt_, col));
        int32_t len = sqlite3_column_bytes(stmt_, col);
        if (blob == nullptr) { return Value(std::string()); }
        return Value(std::string(blob, static_cast<size_t>(len)));
      }
      default:
        return Value();
    }
  }

  Value GetValue(const char* name) const { return GetValue(FieldIndex(name)); }

  /// Copies the current row out of the statement.
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

  /// Steps to the next row. A step failure ends iteration and is
  /// reported through out_error.
  void NextRow(Error* out_error = nullptr) {
    if (stmt_ == nullptr || eof_) { return; }
    int32_t rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW) { return; }
    eof_ = true;
    if (rc != SQLITE_DONE && out_error != nullptr) {
      out_error->Set(ErrorCode::kError, sqlite3_errmsg(db_));
    }
  }

  void Finalize() {
    if (stmt_ != nullptr) {
      sqlite3_finalize(stmt_);
      stmt_ = nullptr;
    }
    eof_ = true;
    num_fields_ = 0;
    columns_.reset();
  }

 private:
  friend class Sqlite3Db;
  friend class Sqlite3Statement;

  Sqlite3Query(sqlite3* db, sqlite3_stmt* stmt, bool eof)
      : db_(db), stmt_(stmt), eof_(eof) {
    if (stmt_ != nullptr) {
      num_fields_ = sqlite3_column_count(stmt_);
    }
  }

  sqlite3* db_ = nullptr;
  sqlite3_stmt* stmt_ = nullptr;
  bool eof_ = true;
  int32_t num_fields_ = 0;
  ColumnNames columns_;
};

}  // namespace slint
