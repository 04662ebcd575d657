// Copyright (c) 2024 liudegui. MIT License.
//
// slint::BasicOrm<Backend> -- schema-driven CRUD over one connection.
//
// Design:
//   - Owns a Database<Backend> and the registered table schemas
//   - Every statement is parameterized; only identifiers checked against
//     the registered schemas (or IsValidIdentifier) reach the SQL text
//   - Records are read and written through RecordTraits<T>, so a record
//     type may cover a subset of the table's columns
//   - Synchronous, single connection, no exceptions
//
// Usage:
//   slint::Orm orm(slint::OrmConfig::FromEnv(),
//                  {slint::Schema<User>(), slint::Schema<Post>()});
//   if (!orm.Connect().ok() || !orm.Migrate().ok()) { ... }
//   slint::Value key;
//   orm.Insert("users", user, &key);
//   auto found = orm.First<User>("users", "email", "a@b.c", &err);

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include "slint/config.hpp"
#include "slint/database.hpp"
#include "slint/error.hpp"
#include "slint/log.hpp"
#include "slint/query_builder.hpp"
#include "slint/row.hpp"
#include "slint/schema.hpp"
#include "slint/uuid.hpp"
#include "slint/value.hpp"

namespace slint {

/// Column/value pairs for a partial UPDATE.
using Assignments = std::vector<std::pair<std::string, Value>>;

// ---------------------------------------------------------------------------
// BasicOrm
// ---------------------------------------------------------------------------

template <typename Backend>
class BasicOrm {
 public:
  using DatabaseType = Database<Backend>;
  using Dialect = typename Backend::Dialect;
  using QueryType = QueryBuilder<Backend>;

  BasicOrm(OrmConfig config, std::vector<TableSchema> schemas)
      : config_(std::move(config)), schemas_(std::move(schemas)) {
    SetLogLevel(config_.log_level);
  }

  BasicOrm(BasicOrm&&) noexcept = default;
  BasicOrm& operator=(BasicOrm&&) noexcept = default;

  BasicOrm(const BasicOrm&) = delete;
  BasicOrm& operator=(const BasicOrm&) = delete;

  // --- Connection ---

  Error Connect() {
    Log()->info("connecting to {} database", Dialect::kName);
    Error err = db_.Open(config_.database_url.c_str());
    if (!err.ok()) {
      Log()->warn("connect failed: {}", err.message);
      return err;
    }
    if (config_.busy_timeout_ms > 0) {
      err = db_.SetBusyTimeout(config_.busy_timeout_ms);
      if (!err.ok()) {
        Log()->warn("busy timeout rejected: {}", err.message);
        db_.Close();
        return err;
      }
    }
    return Error::Ok();
  }

  void Close() { db_.Close(); }
  bool IsConnected() const { return db_.IsOpen(); }

  // --- Schema ---

  /// CREATE TABLE IF NOT EXISTS for every registered schema.
  Error Migrate() {
    if (!db_.IsOpen()) {
      return Error::Make(ErrorCode::kNotOpen, "Database not connected");
    }
    for (const TableSchema& schema : schemas_) {
      std::string sql = CreateTableSql<Dialect>(schema);
      Log()->debug("{}", sql);
      Error err;
      db_.ExecDml(sql.c_str(), &err);
      if (!err.ok()) {
        Log()->warn("migrate {} failed: {}", schema.name, err.message);
        return err;
      }
      Log()->info("migrated table {}", schema.name);
    }
    return Error::Ok();
  }

  const TableSchema* FindSchema(const char* table) const {
    if (table == nullptr) { return nullptr; }
    for (const TableSchema& schema : schemas_) {
      if (schema.name == table) { return &schema; }
    }
    return nullptr;
  }

  const std::vector<TableSchema>& schemas() const { return schemas_; }

  // --- Create ---

  /// Inserts `item` into `table`. Columns the record type lacks are bound
  /// as NULL. Empty uuid keys get a fresh UUID; null or zero auto keys are
  /// left to the database. The resulting key goes to `out_key`.
  template <typename T>
  Error Insert(const char* table, const T& item, Value* out_key = nullptr) {
    Error err;
    const TableSchema* schema = Resolve(table, nullptr, &err);
    if (schema == nullptr) { return err; }

    std::vector<std::string> columns;
    std::vector<Value> values;
    std::string placeholders;
    const ColumnSchema* key = schema->PrimaryKey();
    Value key_value;
    bool key_generated_by_db = false;
    for (const ColumnSchema& c : schema->columns) {
      Value v = EncodeColumn(item, c.name.c_str());
      if (c.uuid && (v.IsNull() || (v.IsText() && v.AsText().empty()))) {
        v = Value(NewUuid());
      }
      if (c.auto_increment &&
          (v.IsNull() || (v.IsInteger() && v.AsInt64() == 0))) {
        if (&c == key) { key_generated_by_db = true; }
        continue;
      }
      if (&c == key) { key_value = v; }
      if (!values.empty()) { placeholders += ","; }
      Dialect::AppendPlaceholder(&placeholders,
                                 static_cast<int32_t>(values.size()) + 1);
      columns.push_back(c.name);
      values.push_back(std::move(v));
    }

    std::string sql;
    if (columns.empty()) {
      sql = fmt::format("INSERT INTO {} {}", schema->name,
                        Dialect::kDefaultValues);
    } else {
      sql = fmt::format("INSERT INTO {} ({}) VALUES ({})", schema->name,
                        fmt::join(columns, ","), placeholders);
    }
    if (Execute(sql, values, &err) < 0) { return err; }

    if (key_generated_by_db) { key_value = Value(db_.LastInsertId()); }
    if (out_key != nullptr) { *out_key = std::move(key_value); }
    return Error::Ok();
  }

  // --- Read ---

  /// First row where `column` = `value`; nullopt when none matches.
  template <typename T>
  std::optional<T> First(const char* table, const char* column,
                         const Value& value, Error* out_error = nullptr) {
    Error err;
    const TableSchema* schema = Resolve(table, column, &err);
    if (schema == nullptr) {
      Report(out_error, err);
      return std::nullopt;
    }
    return Query(table).Where(column, "=", value).template First<T>(out_error);
  }

  template <typename T>
  std::vector<T> Find(const char* table, const char* column,
                      const Value& value, Error* out_error = nullptr) {
    Error err;
    const TableSchema* schema = Resolve(table, column, &err);
    if (schema == nullptr) {
      Report(out_error, err);
      return {};
    }
    return Query(table).Where(column, "=", value).template FetchAll<T>(
        out_error);
  }

  template <typename T>
  std::vector<T> GetAll(const char* table, Error* out_error = nullptr) {
    Error err;
    const TableSchema* schema = Resolve(table, nullptr, &err);
    if (schema == nullptr) {
      Report(out_error, err);
      return {};
    }
    return Query(table).template FetchAll<T>(out_error);
  }

  /// True when a row with `column` = `value` exists.
  bool Exists(const char* table, const char* column, const Value& value,
              Error* out_error = nullptr) {
    Error err;
    const TableSchema* schema = Resolve(table, column, &err);
    if (schema == nullptr) {
      Report(out_error, err);
      return false;
    }
    std::string sql =
        fmt::format("SELECT EXISTS(SELECT 1 FROM {} WHERE {} = {})",
                    schema->name, column, Placeholder(1));
    std::vector<Row> rows = Fetch(sql, {value}, &err);
    int64_t found = 0;
    if (err.ok() &&
        (rows.empty() || !detail::ToInt64(rows.front().Get(0), &found))) {
      err.Set(ErrorCode::kMismatch, "EXISTS returned no integer");
    }
    if (!err.ok()) {
      Report(out_error, err);
      return false;
    }
    return found != 0;
  }

  // --- Update ---

  /// Writes every non-primary-key column of `item` to the rows where
  /// `column` = `value`. Returns affected rows, or -1 on error.
  template <typename T>
  int32_t Update(const char* table, const char* column, const Value& value,
                 const T& item, Error* out_error = nullptr) {
    Error err;
    const TableSchema* schema = Resolve(table, column, &err);
    if (schema == nullptr) {
      Report(out_error, err);
      return -1;
    }
    Assignments sets;
    for (const ColumnSchema& c : schema->columns) {
      if (c.primary) { continue; }
      if (RecordTraits<T>::Def().FindField(c.name.c_str()) == nullptr) {
        continue;
      }
      sets.emplace_back(c.name, EncodeColumn(item, c.name.c_str()));
    }
    return UpdateColumns(table, sets, column, value, out_error);
  }

  /// UPDATE `table` SET <assignments> WHERE `column` = `value`.
  int32_t UpdateColumns(const char* table, const Assignments& assignments,
                        const char* column, const Value& value,
                        Error* out_error = nullptr) {
    Error err;
    const TableSchema* schema = Resolve(table, column, &err);
    if (schema == nullptr) {
      Report(out_error, err);
      return -1;
    }
    if (assignments.empty()) {
      Report(out_error, ErrorCode::kMisuse, "no columns to update");
      return -1;
    }
    std::vector<std::string> sets;
    std::vector<Value> params;
    for (const auto& assignment : assignments) {
      if (schema->FindColumn(assignment.first.c_str()) == nullptr) {
        if (out_error != nullptr) {
          out_error->SetFormat(ErrorCode::kSchema, "unknown column '%s' in %s",
                               assignment.first.c_str(), schema->name.c_str());
        }
        return -1;
      }
      params.push_back(assignment.second);
      int32_t index = static_cast<int32_t>(params.size());
      sets.push_back(fmt::format("{} = {}", assignment.first,
                                 Placeholder(index)));
    }
    params.push_back(value);
    int32_t key_index = static_cast<int32_t>(params.size());
    std::string sql = fmt::format("UPDATE {} SET {} WHERE {} = {}",
                                  schema->name, fmt::join(sets, ", "), column,
                                  Placeholder(key_index));
    return Execute(sql, params, out_error);
  }

  // --- Delete ---

  /// Returns deleted rows, or -1 on error.
  int32_t Delete(const char* table, const char* column, const Value& value,
                 Error* out_error = nullptr) {
    Error err;
    const TableSchema* schema = Resolve(table, column, &err);
    if (schema == nullptr) {
      Report(out_error, err);
      return -1;
    }
    std::string sql = fmt::format("DELETE FROM {} WHERE {} = {}", schema->name,
                                  column, Placeholder(1));
    return Execute(sql, {value}, out_error);
  }

  // --- Raw SQL ---

  /// Runs `sql` unchanged. Returns affected rows, or -1 on error.
  int32_t Raw(const char* sql, Error* out_error = nullptr) {
    if (!db_.IsOpen()) {
      Report(out_error, ErrorCode::kNotOpen, "Database not connected");
      return -1;
    }
    if (sql == nullptr) {
      Report(out_error, ErrorCode::kNullParam, "sql is null");
      return -1;
    }
    Log()->debug("{}", sql);
    Error err;
    int32_t affected = db_.ExecDml(sql, &err);
    if (!err.ok()) {
      Log()->warn("raw statement failed: {}", err.message);
      Report(out_error, err);
      return -1;
    }
    return affected;
  }

  /// Runs a parameterized SELECT written by the caller.
  std::vector<Row> RawQuery(const char* sql, const std::vector<Value>& params,
                            Error* out_error = nullptr) {
    if (sql == nullptr) {
      Report(out_error, ErrorCode::kNullParam, "sql is null");
      return {};
    }
    return Fetch(sql, params, out_error);
  }

  // --- Builder ---

  /// Builder on a registered table; other tables report kSchema on fetch.
  QueryType Query(const char* table) {
    QueryType query(table, &db_);
    if (table != nullptr && FindSchema(table) == nullptr) {
      Error err;
      err.SetFormat(ErrorCode::kSchema, "unknown table '%s'", table);
      query.SetError(err);
    }
    return query;
  }

  DatabaseType& Db() { return db_; }
  const OrmConfig& config() const { return config_; }

 private:
  static std::string Placeholder(int32_t index) {
    std::string ph;
    Dialect::AppendPlaceholder(&ph, index);
    return ph;
  }

  // Looks up `table` and, when given, checks `column` belongs to it.
  const TableSchema* Resolve(const char* table, const char* column,
                             Error* out_error) const {
    if (!db_.IsOpen()) {
      Report(out_error, ErrorCode::kNotOpen, "Database not connected");
      return nullptr;
    }
    const TableSchema* schema = FindSchema(table);
    if (schema == nullptr) {
      if (out_error != nullptr) {
        out_error->SetFormat(ErrorCode::kSchema, "unknown table '%s'",
                             table != nullptr ? table : "(null)");
      }
      return nullptr;
    }
    if (column != nullptr && schema->FindColumn(column) == nullptr) {
      if (out_error != nullptr) {
        out_error->SetFormat(ErrorCode::kSchema, "unknown column '%s' in %s",
                             column, schema->name.c_str());
      }
      return nullptr;
    }
    return schema;
  }

  int32_t Execute(const std::string& sql, const std::vector<Value>& params,
                  Error* out_error) {
    Log()->debug("{} {}", sql, detail::DescribeParams(params));
    Error err;
    int32_t affected = db_.Execute(sql.c_str(), params, &err);
    if (!err.ok()) {
      Log()->warn("statement failed: {} ({})", err.message,
                 ErrorCodeName(err.code));
      Report(out_error, err);
      return -1;
    }
    return affected;
  }

  std::vector<Row> Fetch(const std::string& sql,
                         const std::vector<Value>& params, Error* out_error) {
    if (!db_.IsOpen()) {
      Report(out_error, ErrorCode::kNotOpen, "Database not connected");
      return {};
    }
    Log()->debug("{} {}", sql, detail::DescribeParams(params));
    Error err;
    std::vector<Row> rows = db_.Fetch(sql.c_str(), params, &err);
    if (!err.ok()) {
      Log()->warn("query failed: {} ({})", err.message,
                 ErrorCodeName(err.code));
      Report(out_error, err);
    }
    return rows;
  }

  OrmConfig config_;
  std::vector<TableSchema> schemas_;
  DatabaseType db_;
};

// ---------------------------------------------------------------------------
// Default type aliases
// ---------------------------------------------------------------------------

using Orm = BasicOrm<Sqlite3Backend>;

#if defined(SLINT_HAS_MARIADB) && SLINT_HAS_MARIADB
using MOrm = BasicOrm<MariaBackend>;
#endif

}  // namespace slint
