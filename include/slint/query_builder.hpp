// Copyright (c) 2024 liudegui. MIT License.
//
// slint::QueryBuilder<Backend> -- chained filters to parameterized SELECT.
//
// Design:
//   - Copyable value object; chained calls return *this
//   - Identifiers, operators and directions are validated when added.
//     The first invalid input is recorded and every fetch reports it as
//     kMisuse without touching the database
//   - Placeholders are numbered when the SQL is rendered: WHERE values
//     first, then HAVING values, matching the order of Params()
//   - Only Backend::Dialect is needed to render SQL; the connection is
//     used by the Fetch* calls alone
//
// Usage:
//   auto users = orm.Query("users")
//                    .Where("age", ">", 18)
//                    .Like("name", "li")
//                    .OrderBy("name", "DESC")
//                    .Limit(10)
//                    .FetchAll<User>(&err);

#pragma once

#include <cstdint>
#include <iterator>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include "slint/database.hpp"
#include "slint/dialect.hpp"
#include "slint/error.hpp"
#include "slint/log.hpp"
#include "slint/row.hpp"
#include "slint/schema.hpp"
#include "slint/value.hpp"

namespace slint {

namespace detail {

inline std::string DescribeParams(const std::vector<Value>& params) {
  std::vector<std::string> parts;
  parts.reserve(params.size());
  for (const Value& v : params) { parts.push_back(v.ToString()); }
  return fmt::format("[{}]", fmt::join(parts, ", "));
}

}  // namespace detail

// ---------------------------------------------------------------------------
// QueryBuilder
// ---------------------------------------------------------------------------

template <typename Backend>
class QueryBuilder {
 public:
  using Dialect = typename Backend::Dialect;
  using DatabaseType = Database<Backend>;

  QueryBuilder(const char* table, DatabaseType* db) : db_(db) {
    if (!IsValidIdentifier(table)) {
      Fail("invalid table name", table);
      return;
    }
    table_ = table;
  }

  // --- Projection ---

  QueryBuilder& Select(const std::vector<std::string>& columns) {
    if (columns.empty()) {
      Fail("empty select list", "");
      return *this;
    }
    for (const std::string& c : columns) {
      if (!IsValidExpression(c.c_str())) {
        Fail("invalid select expression", c.c_str());
        return *this;
      }
    }
    selects_ = columns;
    return *this;
  }

  QueryBuilder& Distinct() {
    distinct_ = true;
    return *this;
  }

  // --- Filters ---

  QueryBuilder& Where(const char* column, const char* op, Value value) {
    if (!IsValidIdentifier(column)) {
      Fail("invalid column", column);
    } else if (!IsValidOperator(op)) {
      Fail("invalid operator", op);
    } else {
      wheres_.push_back(
          Condition{column, detail::ToUpper(op), std::move(value), false});
    }
    return *this;
  }

  /// Substring match: the pattern is wrapped in '%'.
  QueryBuilder& Like(const char* column, const std::string& pattern) {
    if (!IsValidIdentifier(column)) {
      Fail("invalid column", column);
    } else {
      wheres_.push_back(
          Condition{column, "LIKE", Value(fmt::format("%{}%", pattern)), false});
    }
    return *this;
  }

  /// Case-insensitive substring match.
  QueryBuilder& ILike(const char* column, const std::string& pattern) {
    if (!IsValidIdentifier(column)) {
      Fail("invalid column", column);
    } else {
      wheres_.push_back(
          Condition{column, "LIKE", Value(fmt::format("%{}%", pattern)), true});
    }
    return *this;
  }

  // --- Joins ---

  QueryBuilder& Join(const char* table, const char* left, const char* right) {
    AddJoin("JOIN", table, left, right);
    return *this;
  }

  QueryBuilder& LeftJoin(const char* table, const char* left,
                         const char* right) {
    AddJoin("LEFT JOIN", table, left, right);
    return *this;
  }

  // --- Grouping ---

  QueryBuilder& GroupBy(const std::vector<std::string>& columns) {
    for (const std::string& c : columns) {
      if (!IsValidIdentifier(c.c_str())) {
        Fail("invalid group column", c.c_str());
        return *this;
      }
    }
    groups_ = columns;
    return *this;
  }

  /// `expr` may be a column or an aggregate such as COUNT(*).
  QueryBuilder& Having(const char* expr, const char* op, Value value) {
    if (!IsValidExpression(expr)) {
      Fail("invalid having expression", expr);
    } else if (!IsValidOperator(op)) {
      Fail("invalid operator", op);
    } else {
      havings_.push_back(
          Condition{expr, detail::ToUpper(op), std::move(value), false});
    }
    return *this;
  }

  // --- Ordering / paging ---

  /// Replaces any earlier ordering.
  QueryBuilder& OrderBy(const char* column, const char* direction = "ASC") {
    const char* dir = NormalizeDirection(direction);
    if (!IsValidExpression(column)) {
      Fail("invalid order column", column);
    } else if (dir == nullptr) {
      Fail("invalid order direction", direction);
    } else {
      order_ = fmt::format("{} {}", column, dir);
    }
    return *this;
  }

  QueryBuilder& Limit(int64_t n) {
    if (n < 0) {
      Fail("negative limit", "");
    } else {
      limit_ = n;
    }
    return *this;
  }

  QueryBuilder& Offset(int64_t n) {
    if (n < 0) {
      Fail("negative offset", "");
    } else {
      offset_ = n;
    }
    return *this;
  }

  // --- Rendering ---

  std::string ToSql() const {
    std::string sql = fmt::format("SELECT {}{} FROM {}",
                                  distinct_ ? "DISTINCT " : "",
                                  fmt::join(selects_, ","), table_);
    if (!joins_.empty()) {
      fmt::format_to(std::back_inserter(sql), " {}", fmt::join(joins_, " "));
    }
    int32_t index = 1;
    if (!wheres_.empty()) {
      sql += " WHERE ";
      AppendConditions(&sql, wheres_, &index);
    }
    if (!groups_.empty()) {
      fmt::format_to(std::back_inserter(sql), " GROUP BY {}",
                     fmt::join(groups_, ", "));
    }
    if (!havings_.empty()) {
      sql += " HAVING ";
      AppendConditions(&sql, havings_, &index);
    }
    if (!order_.empty()) {
      fmt::format_to(std::back_inserter(sql), " ORDER BY {}", order_);
    }
    if (limit_.has_value()) {
      fmt::format_to(std::back_inserter(sql), " LIMIT {}", *limit_);
    } else if (offset_.has_value()) {
      fmt::format_to(std::back_inserter(sql), " LIMIT {}", Dialect::kNoLimit);
    }
    if (offset_.has_value()) {
      fmt::format_to(std::back_inserter(sql), " OFFSET {}", *offset_);
    }
    return sql;
  }

  std::vector<Value> Params() const {
    std::vector<Value> params;
    params.reserve(wheres_.size() + havings_.size());
    for (const Condition& c : wheres_) { params.push_back(c.value); }
    for (const Condition& c : havings_) { params.push_back(c.value); }
    return params;
  }

  /// First recorded misuse, ok when every call was valid.
  const Error& error() const { return error_; }

  /// Records `error` unless an earlier one is already held. Every fetch
  /// then reports it without touching the database.
  void SetError(const Error& error) {
    if (error_.ok()) { error_ = error; }
  }

  // --- Execution ---

  std::vector<Row> FetchRows(Error* out_error = nullptr) const {
    return Run(ToSql(), out_error);
  }

  template <typename T>
  std::vector<T> FetchAll(Error* out_error = nullptr) const {
    std::vector<T> out;
    Error err;
    std::vector<Row> rows = FetchRows(&err);
    if (!err.ok()) {
      Report(out_error, err);
      return out;
    }
    out.reserve(rows.size());
    for (const Row& row : rows) {
      T item{};
      if (!DecodeRow(row, &item, &err)) {
        Report(out_error, err);
        out.clear();
        return out;
      }
      out.push_back(std::move(item));
    }
    return out;
  }

  /// First matching record; an empty result is not an error.
  template <typename T>
  std::optional<T> First(Error* out_error = nullptr) const {
    QueryBuilder one(*this);
    one.Limit(1);
    std::vector<T> items = one.template FetchAll<T>(out_error);
    if (items.empty()) { return std::nullopt; }
    return std::move(items.front());
  }

  /// Exactly one record expected; an empty result reports kNotFound.
  template <typename T>
  std::optional<T> FetchOne(Error* out_error = nullptr) const {
    Error err;
    std::vector<T> items = FetchAll<T>(&err);
    if (!err.ok()) {
      Report(out_error, err);
      return std::nullopt;
    }
    if (items.empty()) {
      Report(out_error, ErrorCode::kNotFound, "query returned no rows");
      return std::nullopt;
    }
    return std::move(items.front());
  }

  /// Number of rows the query would return, or -1 on error.
  int64_t Count(Error* out_error = nullptr) const {
    Error err;
    std::vector<Row> rows =
        Run(fmt::format("SELECT COUNT(*) FROM ({}) AS slint_count", ToSql()),
            &err);
    int64_t count = 0;
    if (err.ok() &&
        (rows.empty() || !detail::ToInt64(rows.front().Get(0), &count))) {
      err.Set(ErrorCode::kMismatch, "COUNT(*) returned no integer");
    }
    if (!err.ok()) {
      Report(out_error, err);
      return -1;
    }
    return count;
  }

 private:
  struct Condition {
    std::string column;
    std::string op;
    Value value;
    bool case_insensitive;
  };

  static void AppendConditions(std::string* sql,
                               const std::vector<Condition>& conditions,
                               int32_t* index) {
    for (size_t i = 0; i < conditions.size(); ++i) {
      const Condition& c = conditions[i];
      if (i > 0) { *sql += " AND "; }
      std::string placeholder;
      Dialect::AppendPlaceholder(&placeholder, (*index)++);
      if (c.case_insensitive) {
        *sql += Dialect::CaseInsensitiveLike(c.column, placeholder);
      } else {
        fmt::format_to(std::back_inserter(*sql), "{} {} {}", c.column, c.op,
                       placeholder);
      }
    }
  }

  void AddJoin(const char* kind, const char* table, const char* left,
               const char* right) {
    if (!IsValidIdentifier(table)) {
      Fail("invalid join table", table);
    } else if (!IsValidIdentifier(left)) {
      Fail("invalid join column", left);
    } else if (!IsValidIdentifier(right)) {
      Fail("invalid join column", right);
    } else {
      joins_.push_back(fmt::format("{} {} ON {} = {}", kind, table, left,
                                   right));
    }
  }

  void Fail(const char* what, const char* input) {
    if (!error_.ok()) { return; }
    error_.SetFormat(ErrorCode::kMisuse, "%s '%s'", what,
                     input != nullptr ? input : "(null)");
  }

  std::vector<Row> Run(const std::string& sql, Error* out_error) const {
    if (!error_.ok()) {
      Report(out_error, error_);
      return {};
    }
    if (db_ == nullptr || !db_->IsOpen()) {
      Report(out_error, ErrorCode::kNotOpen, "Database not open");
      return {};
    }
    std::vector<Value> params = Params();
    Log()->debug("{} {}", sql, detail::DescribeParams(params));
    Error err;
    std::vector<Row> rows = db_->Fetch(sql.c_str(), params, &err);
    if (!err.ok()) {
      Log()->warn("query failed: {} ({})", err.message,
                 ErrorCodeName(err.code));
      Report(out_error, err);
    }
    return rows;
  }

  DatabaseType* db_ = nullptr;
  std::string table_;
  std::vector<std::string> selects_{"*"};
  bool distinct_ = false;
  std::vector<std::string> joins_;
  std::vector<Condition> wheres_;
  std::vector<std::string> groups_;
  std::vector<Condition> havings_;
  std::string order_;
  std::optional<int64_t> limit_;
  std::optional<int64_t> offset_;
  Error error_;
};

}  // namespace slint
