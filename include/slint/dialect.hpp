// Copyright (c) 2024 liudegui. MIT License.
//
// slint dialects -- the SQL differences between supported backends.
//
// Design:
//   - Static-only structs, selected at compile time via Backend::Dialect
//   - No driver headers: the query builder and schema renderer can be
//     exercised without a connection
//   - Identifier/operator checks live here because every statement the
//     ORM builds splices identifiers into the SQL text

#pragma once

#include <cctype>
#include <cstdint>
#include <cstring>
#include <iterator>
#include <string>

#include <fmt/format.h>

#include "slint/value.hpp"

namespace slint {

// ---------------------------------------------------------------------------
// Identifier / operator validation
// ---------------------------------------------------------------------------

namespace detail {

inline bool IsIdentStart(char c) {
  return std::isalpha(static_cast<unsigned char>(c)) != 0 || c == '_';
}

inline bool IsIdentChar(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

// [A-Za-z_][A-Za-z0-9_]* over [begin, end)
inline bool IsSimpleIdent(const char* begin, const char* end) {
  if (begin == end || !IsIdentStart(*begin)) { return false; }
  for (const char* p = begin + 1; p != end; ++p) {
    if (!IsIdentChar(*p)) { return false; }
  }
  return true;
}

inline std::string ToUpper(const char* text) {
  std::string upper(text);
  for (char& c : upper) {
    c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  }
  return upper;
}

}  // namespace detail

/// `name` or `table.name`.
inline bool IsValidIdentifier(const char* name) {
  if (name == nullptr) { return false; }
  const char* end = name + std::strlen(name);
  const char* dot = std::strchr(name, '.');
  if (dot == nullptr) { return detail::IsSimpleIdent(name, end); }
  return detail::IsSimpleIdent(name, dot) &&
         detail::IsSimpleIdent(dot + 1, end);
}

/// Identifier, `*`, or an aggregate call `FUNC(identifier)` / `FUNC(*)`.
inline bool IsValidExpression(const char* expr) {
  if (expr == nullptr) { return false; }
  if (std::strcmp(expr, "*") == 0) { return true; }
  if (IsValidIdentifier(expr)) { return true; }

  const char* open = std::strchr(expr, '(');
  size_t len = std::strlen(expr);
  if (open == nullptr || len < 4 || expr[len - 1] != ')') { return false; }
  if (!detail::IsSimpleIdent(expr, open)) { return false; }

  std::string inner(open + 1, expr + len - 1);
  return inner == "*" || IsValidIdentifier(inner.c_str());
}

/// Comparison operators accepted by the builder, matched case-insensitively.
inline bool IsValidOperator(const char* op) {
  if (op == nullptr) { return false; }
  static const char* const kOperators[] = {
      "=", "!=", "<>", "<", "<=", ">", ">=", "LIKE", "NOT LIKE",
  };
  std::string upper = detail::ToUpper(op);
  for (const char* allowed : kOperators) {
    if (upper == allowed) { return true; }
  }
  return false;
}

/// Returns "ASC"/"DESC" for a case-insensitive match, nullptr otherwise.
inline const char* NormalizeDirection(const char* dir) {
  if (dir == nullptr || dir[0] == '\0') { return "ASC"; }
  std::string upper = detail::ToUpper(dir);
  if (upper == "ASC") { return "ASC"; }
  if (upper == "DESC") { return "DESC"; }
  return nullptr;
}

// ---------------------------------------------------------------------------
// Sqlite3Dialect
// ---------------------------------------------------------------------------

struct Sqlite3Dialect {
  static constexpr const char* kName = "sqlite3";
  static constexpr const char* kAutoIncrement = "AUTOINCREMENT";
  static constexpr const char* kDefaultValues = "DEFAULT VALUES";
  // OFFSET is only accepted after a LIMIT clause.
  static constexpr const char* kNoLimit = "-1";

  /// Numbered placeholders (?1, ?2, ...) so repeated renders stay stable.
  static void AppendPlaceholder(std::string* sql, int32_t index) {
    fmt::format_to(std::back_inserter(*sql), "?{}", index);
  }

  static const char* TypeName(SqlType type, bool /*indexed*/ = false) {
    switch (type) {
      case SqlType::kInteger: return "INTEGER";
      case SqlType::kBigInt:  return "INTEGER";
      case SqlType::kReal:    return "REAL";
      case SqlType::kBoolean: return "BOOLEAN";
      case SqlType::kText:    return "TEXT";
    }
    return "TEXT";
  }

  static std::string CaseInsensitiveLike(const std::string& column,
                                         const std::string& placeholder) {
    return fmt::format("LOWER({}) LIKE LOWER({})", column, placeholder);
  }
};

// ---------------------------------------------------------------------------
// MariaDialect
// ---------------------------------------------------------------------------

struct MariaDialect {
  static constexpr const char* kName = "mariadb";
  static constexpr const char* kAutoIncrement = "AUTO_INCREMENT";
  static constexpr const char* kDefaultValues = "() VALUES ()";
  static constexpr const char* kNoLimit = "18446744073709551615";

  static void AppendPlaceholder(std::string* sql, int32_t /*index*/) {
    sql->push_back('?');
  }

  /// `indexed` is set for key and UNIQUE columns, which need a bounded
  /// length; other text columns are unbounded.
  static const char* TypeName(SqlType type, bool indexed = false) {
    switch (type) {
      case SqlType::kInteger: return "INT";
      case SqlType::kBigInt:  return "BIGINT";
      case SqlType::kReal:    return "DOUBLE";
      case SqlType::kBoolean: return "BOOLEAN";
      case SqlType::kText:    return indexed ? "VARCHAR(255)" : "TEXT";
    }
    return "TEXT";
  }

  static std::string CaseInsensitiveLike(const std::string& column,
                                         const std::string& placeholder) {
    return fmt::format("LOWER({}) LIKE LOWER({})", column, placeholder);
  }
};

}  // namespace slint
