// Copyright (c) 2024 liudegui. MIT License.
//
// slint schema -- record type to table schema mapping without reflection.
//
// Design:
//   - A record is annotated once, at global scope, with SLINT_TABLE or
//     SLINT_RECORD; the macro specializes slint::RecordTraits<T>
//   - Every field becomes a FieldDef holding the column description plus
//     two plain function pointers reading/writing the member as a Value
//   - Column type and nullability come from ValueTraits<member type>;
//     std::optional<T> members are nullable, everything else is NOT NULL
//
// Usage:
//   struct User { std::string id; std::string name; std::string email; };
//   SLINT_TABLE(User, "users",
//               SLINT_UUID(id), SLINT_FIELD(name), SLINT_UNIQUE(email))
//
//   struct Post { int64_t id = 0; std::string title; };
//   SLINT_RECORD(Post, SLINT_AUTO(id), SLINT_FIELD(title))  // table "post"

#pragma once

#include <cctype>
#include <cstdint>
#include <iterator>
#include <string>
#include <utility>
#include <vector>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include "slint/error.hpp"
#include "slint/row.hpp"
#include "slint/value.hpp"

namespace slint {

// ---------------------------------------------------------------------------
// Column flags
// ---------------------------------------------------------------------------

enum ColumnFlag : uint32_t {
  kColumnPlain = 0,
  kColumnPrimary = 1u << 0,
  kColumnUnique = 1u << 1,
  kColumnUuid = 1u << 2,      // primary key, generated on insert when empty
  kColumnAuto = 1u << 3,      // primary key, generated by the database
  kColumnNullable = 1u << 4,
};

// ---------------------------------------------------------------------------
// ColumnSchema / TableSchema
// ---------------------------------------------------------------------------

struct ColumnSchema {
  std::string name;
  SqlType type = SqlType::kText;
  std::string sql_type;  // overrides the dialect type name when set
  bool primary = false;
  bool unique = false;
  bool not_null = true;
  bool uuid = false;
  bool auto_increment = false;
};

struct TableSchema {
  std::string name;
  std::vector<ColumnSchema> columns;

  const ColumnSchema* FindColumn(const char* column) const {
    if (column == nullptr) { return nullptr; }
    for (const ColumnSchema& c : columns) {
      if (c.name == column) { return &c; }
    }
    return nullptr;
  }

  /// First primary key column, nullptr when the table has none.
  const ColumnSchema* PrimaryKey() const {
    for (const ColumnSchema& c : columns) {
      if (c.primary) { return &c; }
    }
    return nullptr;
  }
};

// ---------------------------------------------------------------------------
// FieldDef / TableDef
// ---------------------------------------------------------------------------

template <typename R>
struct FieldDef {
  ColumnSchema column;
  Value (*read)(const R&) = nullptr;
  bool (*write)(R*, const Value&) = nullptr;
};

namespace detail {

template <typename R, typename F, F R::*Member>
Value ReadMember(const R& record) {
  return ValueTraits<F>::ToValue(record.*Member);
}

template <typename R, typename F, F R::*Member>
bool WriteMember(R* record, const Value& value) {
  return ValueTraits<F>::FromValue(value, &(record->*Member));
}

}  // namespace detail

template <typename R, typename F, F R::*Member>
FieldDef<R> MakeField(const char* name, uint32_t flags,
                      const char* sql_type = nullptr) {
  FieldDef<R> field;
  ColumnSchema& c = field.column;
  c.name = name;
  c.type = ValueTraits<F>::kSqlType;
  if (sql_type != nullptr) { c.sql_type = sql_type; }
  c.uuid = (flags & kColumnUuid) != 0;
  c.auto_increment = (flags & kColumnAuto) != 0;
  c.primary = (flags & kColumnPrimary) != 0 || c.uuid || c.auto_increment;
  c.unique = (flags & kColumnUnique) != 0;
  c.not_null = !ValueTraits<F>::kNullable && (flags & kColumnNullable) == 0;
  field.read = &detail::ReadMember<R, F, Member>;
  field.write = &detail::WriteMember<R, F, Member>;
  return field;
}

template <typename R>
class TableDef {
 public:
  TableDef(std::string name, std::vector<FieldDef<R>> fields)
      : fields_(std::move(fields)) {
    schema_.name = std::move(name);
    schema_.columns.reserve(fields_.size());
    for (const FieldDef<R>& f : fields_) { schema_.columns.push_back(f.column); }
  }

  const TableSchema& schema() const { return schema_; }
  const std::vector<FieldDef<R>>& fields() const { return fields_; }

  const FieldDef<R>* FindField(const char* column) const {
    if (column == nullptr) { return nullptr; }
    for (const FieldDef<R>& f : fields_) {
      if (f.column.name == column) { return &f; }
    }
    return nullptr;
  }

 private:
  TableSchema schema_;
  std::vector<FieldDef<R>> fields_;
};

/// Specialized by SLINT_TABLE / SLINT_RECORD.
template <typename T>
struct RecordTraits;

/// "app::UserProfile" -> "userprofile"
inline std::string DefaultTableName(const char* type_name) {
  std::string name;
  if (type_name == nullptr) { return name; }
  for (const char* p = type_name; *p != '\0'; ++p) {
    if (*p == ':') {
      name.clear();
    } else if (std::isspace(static_cast<unsigned char>(*p)) == 0) {
      name.push_back(
          static_cast<char>(std::tolower(static_cast<unsigned char>(*p))));
    }
  }
  return name;
}

// ---------------------------------------------------------------------------
// Record helpers
// ---------------------------------------------------------------------------

template <typename T>
const TableSchema& Schema() {
  return RecordTraits<T>::Def().schema();
}

/// Reads one field of `record` as a Value. Unknown columns read as null.
template <typename T>
Value EncodeColumn(const T& record, const char* column) {
  const FieldDef<T>* field = RecordTraits<T>::Def().FindField(column);
  if (field == nullptr) { return Value(); }
  return field->read(record);
}

/// Fills `out` from a fetched row. Every non-nullable field must be
/// present and convertible; extra row columns are ignored.
template <typename T>
bool DecodeRow(const Row& row, T* out, Error* out_error = nullptr) {
  if (out == nullptr) {
    Report(out_error, ErrorCode::kNullParam, "record is null");
    return false;
  }
  for (const FieldDef<T>& field : RecordTraits<T>::Def().fields()) {
    const char* name = field.column.name.c_str();
    int32_t col = row.FieldIndex(name);
    if (col < 0 && field.column.not_null) {
      if (out_error != nullptr) {
        out_error->SetFormat(ErrorCode::kMismatch,
                             "column '%s' missing from result", name);
      }
      return false;
    }
    const Value& value = row.Get(col);
    // A NULL in a nullable column leaves a non-optional member untouched.
    if (!field.write(out, value) &&
        !(value.IsNull() && !field.column.not_null)) {
      if (out_error != nullptr) {
        out_error->SetFormat(ErrorCode::kMismatch,
                             "column '%s' cannot hold %s", name,
                             value.ToString().c_str());
      }
      return false;
    }
  }
  return true;
}

// ---------------------------------------------------------------------------
// DDL
// ---------------------------------------------------------------------------

template <typename Dialect>
std::string ColumnDefinition(const ColumnSchema& c) {
  std::string def = fmt::format(
      "{} {}", c.name,
      c.sql_type.empty() ? Dialect::TypeName(c.type, c.primary || c.unique)
                         : c.sql_type.c_str());
  if (c.primary) { def += " PRIMARY KEY"; }
  if (c.auto_increment) {
    fmt::format_to(std::back_inserter(def), " {}", Dialect::kAutoIncrement);
  }
  if (c.unique) { def += " UNIQUE"; }
  if (c.not_null) { def += " NOT NULL"; }
  return def;
}

template <typename Dialect>
std::string CreateTableSql(const TableSchema& schema) {
  std::vector<std::string> defs;
  defs.reserve(schema.columns.size());
  for (const ColumnSchema& c : schema.columns) {
    defs.push_back(ColumnDefinition<Dialect>(c));
  }
  return fmt::format("CREATE TABLE IF NOT EXISTS {} ({})", schema.name,
                     fmt::join(defs, ", "));
}

}  // namespace slint

// ---------------------------------------------------------------------------
// Annotation macros (use at global scope)
// ---------------------------------------------------------------------------

#define SLINT_TABLE(Type, table_name, ...)                                 \
  namespace slint {                                                        \
  template <>                                                              \
  struct RecordTraits<Type> {                                              \
    using RecordType = Type;                                               \
    static const TableDef<Type>& Def() {                                   \
      static const TableDef<Type> def(table_name,                          \
                                      std::vector<FieldDef<Type>>{         \
                                          __VA_ARGS__});                   \
      return def;                                                          \
    }                                                                      \
  };                                                                       \
  }

#define SLINT_RECORD(Type, ...) \
  SLINT_TABLE(Type, ::slint::DefaultTableName(#Type), __VA_ARGS__)

#define SLINT_COLUMN(member, flags)                                        \
  ::slint::MakeField<RecordType, decltype(RecordType::member),             \
                     &RecordType::member>(#member, (flags))

#define SLINT_COLUMN_TYPE(member, flags, sql_type)                         \
  ::slint::MakeField<RecordType, decltype(RecordType::member),             \
                     &RecordType::member>(#member, (flags), (sql_type))

#define SLINT_FIELD(member) SLINT_COLUMN(member, ::slint::kColumnPlain)
#define SLINT_UNIQUE(member) SLINT_COLUMN(member, ::slint::kColumnUnique)
#define SLINT_PRIMARY(member) SLINT_COLUMN(member, ::slint::kColumnPrimary)
#define SLINT_UUID(member) SLINT_COLUMN(member, ::slint::kColumnUuid)
#define SLINT_AUTO(member) SLINT_COLUMN(member, ::slint::kColumnAuto)
#define SLINT_NULLABLE(member) SLINT_COLUMN(member, ::slint::kColumnNullable)
