// Copyright (c) 2024 liudegui. MIT License.
//
// slint::Table<T, Backend> -- typed handle on one registered table.
//
// Design:
//   - Table, Record and TableQuery borrow the BasicOrm; the ORM must
//     outlive every handle created from it
//   - Record keeps the fetched value and its key column value, so it can
//     update or delete itself
//   - TableQuery is a QueryBuilder restricted to SELECT * with typed
//     results
//
// Usage:
//   slint::Table<User> users(&orm, "users");
//   users.Insert(User{"", "Ann", "ann@example.com"});
//   auto rec = users.Get("email", "ann@example.com", &err);
//   rec->Update({{"name", "Anna"}});
//   auto adults = users.Query().Where("age", ">=", 18).Limit(10).Get(&err);

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "slint/error.hpp"
#include "slint/orm.hpp"
#include "slint/query_builder.hpp"
#include "slint/schema.hpp"
#include "slint/sqlite3_backend.hpp"
#include "slint/value.hpp"

namespace slint {

template <typename T, typename Backend>
class TableQuery;

// ---------------------------------------------------------------------------
// Record
// ---------------------------------------------------------------------------

template <typename T, typename Backend = Sqlite3Backend>
class Record {
 public:
  Record(BasicOrm<Backend>* orm, std::string table, std::string key_column,
         T value)
      : orm_(orm),
        table_(std::move(table)),
        key_column_(std::move(key_column)),
        value_(std::move(value)) {
    key_ = EncodeColumn(value_, key_column_.c_str());
  }

  const T& value() const { return value_; }
  const Value& key() const { return key_; }
  const std::string& table() const { return table_; }

  /// Sets the given columns on this row and reloads the value.
  Error Update(const Assignments& assignments) {
    Error err;
    if (orm_->UpdateColumns(table_.c_str(), assignments, key_column_.c_str(),
                            key_, &err) < 0) {
      return err;
    }
    Value lookup = key_;
    for (const auto& assignment : assignments) {
      if (assignment.first == key_column_) { lookup = assignment.second; }
    }
    std::optional<T> fresh =
        orm_->template First<T>(table_.c_str(), key_column_.c_str(), lookup,
                                &err);
    if (!err.ok()) { return err; }
    if (!fresh.has_value()) {
      return Error::Make(ErrorCode::kNotFound, "record vanished after update");
    }
    value_ = std::move(*fresh);
    key_ = EncodeColumn(value_, key_column_.c_str());
    return Error::Ok();
  }

  /// Deletes this row. kNotFound when it was already gone.
  Error Delete() {
    Error err;
    int32_t deleted =
        orm_->Delete(table_.c_str(), key_column_.c_str(), key_, &err);
    if (deleted < 0) { return err; }
    if (deleted == 0) {
      return Error::Make(ErrorCode::kNotFound, "record not found");
    }
    return Error::Ok();
  }

 private:
  BasicOrm<Backend>* orm_;
  std::string table_;
  std::string key_column_;
  T value_;
  Value key_;
};

// ---------------------------------------------------------------------------
// Table
// ---------------------------------------------------------------------------

template <typename T, typename Backend = Sqlite3Backend>
class Table {
 public:
  using RecordType = Record<T, Backend>;
  using QueryType = TableQuery<T, Backend>;

  /// An empty `key_column` selects the schema's primary key.
  Table(BasicOrm<Backend>* orm, std::string name, std::string key_column = "")
      : orm_(orm), name_(std::move(name)), key_column_(std::move(key_column)) {
    if (key_column_.empty()) {
      const ColumnSchema* key = Schema<T>().PrimaryKey();
      if (key != nullptr) { key_column_ = key->name; }
    }
  }

  const std::string& name() const { return name_; }
  const std::string& key_column() const { return key_column_; }

  Error Insert(const T& item, Value* out_key = nullptr) {
    return orm_->Insert(name_.c_str(), item, out_key);
  }

  /// First record where `column` = `value`.
  std::optional<RecordType> Get(const char* column, const Value& value,
                                Error* out_error = nullptr) {
    std::optional<T> found =
        orm_->template First<T>(name_.c_str(), column, value, out_error);
    if (!found.has_value()) { return std::nullopt; }
    return Wrap(std::move(*found));
  }

  std::vector<RecordType> GetAll(Error* out_error = nullptr) {
    std::vector<T> items = orm_->template GetAll<T>(name_.c_str(), out_error);
    std::vector<RecordType> out;
    out.reserve(items.size());
    for (T& item : items) { out.push_back(Wrap(std::move(item))); }
    return out;
  }

  QueryType Query() { return QueryType(this); }

 private:
  friend class TableQuery<T, Backend>;

  RecordType Wrap(T value) {
    return RecordType(orm_, name_, key_column_, std::move(value));
  }

  BasicOrm<Backend>* orm_;
  std::string name_;
  std::string key_column_;
};

// ---------------------------------------------------------------------------
// TableQuery
// ---------------------------------------------------------------------------

template <typename T, typename Backend = Sqlite3Backend>
class TableQuery {
 public:
  using RecordType = Record<T, Backend>;

  explicit TableQuery(Table<T, Backend>* table)
      : table_(table), builder_(table->orm_->Query(table->name_.c_str())) {}

  TableQuery& Where(const char* column, const char* op, Value value) {
    builder_.Where(column, op, std::move(value));
    return *this;
  }

  TableQuery& Like(const char* column, const std::string& pattern) {
    builder_.Like(column, pattern);
    return *this;
  }

  TableQuery& OrderBy(const char* column, const char* direction = "ASC") {
    builder_.OrderBy(column, direction);
    return *this;
  }

  TableQuery& Limit(int64_t n) {
    builder_.Limit(n);
    return *this;
  }

  TableQuery& Offset(int64_t n) {
    builder_.Offset(n);
    return *this;
  }

  TableQuery& Distinct() {
    builder_.Distinct();
    return *this;
  }

  TableQuery& GroupBy(const std::vector<std::string>& columns) {
    builder_.GroupBy(columns);
    return *this;
  }

  TableQuery& Having(const char* expr, const char* op, Value value) {
    builder_.Having(expr, op, std::move(value));
    return *this;
  }

  std::string ToSql() const { return builder_.ToSql(); }

  std::vector<RecordType> Get(Error* out_error = nullptr) const {
    std::vector<T> items = builder_.template FetchAll<T>(out_error);
    std::vector<RecordType> out;
    out.reserve(items.size());
    for (T& item : items) { out.push_back(table_->Wrap(std::move(item))); }
    return out;
  }

  std::optional<RecordType> First(Error* out_error = nullptr) const {
    std::optional<T> found = builder_.template First<T>(out_error);
    if (!found.has_value()) { return std::nullopt; }
    return table_->Wrap(std::move(*found));
  }

  /// Like First() but an empty result reports kNotFound.
  std::optional<T> FirstValue(Error* out_error = nullptr) const {
    Error err;
    std::optional<T> found = builder_.template First<T>(&err);
    if (!err.ok()) {
      Report(out_error, err);
      return std::nullopt;
    }
    if (!found.has_value()) {
      Report(out_error, ErrorCode::kNotFound, "query returned no rows");
    }
    return found;
  }

 private:
  Table<T, Backend>* table_;
  QueryBuilder<Backend> builder_;
};

}  // namespace slint
