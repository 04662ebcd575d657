// Copyright (c) 2024 liudegui. MIT License.
//
// slint::Value -- dynamically typed SQL value.
//
// Design:
//   - One variant covering what the drivers bind and return:
//     null, 64-bit integer, double, boolean, text
//   - ValueTraits<T> maps a record field type to its column type and
//     converts in both directions
//   - FromValue() is lenient across numeric/text representations since
//     drivers disagree on how they hand back numbers and booleans

#pragma once

#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

#include <fmt/format.h>

namespace slint {

// ---------------------------------------------------------------------------
// SqlType -- column type of a schema field
// ---------------------------------------------------------------------------

enum class SqlType : uint8_t {
  kInteger = 0,
  kBigInt,
  kReal,
  kBoolean,
  kText,
};

enum class ValueType : uint8_t {
  kNull = 0,
  kInteger,
  kReal,
  kBool,
  kText,
};

// ---------------------------------------------------------------------------
// Value
// ---------------------------------------------------------------------------

class Value {
 public:
  Value() = default;
  Value(std::nullptr_t) {}  // NOLINT

  template <typename T,
            typename std::enable_if<std::is_integral<T>::value &&
                                        !std::is_same<T, bool>::value,
                                    int>::type = 0>
  Value(T v) : data_(static_cast<int64_t>(v)) {}  // NOLINT

  template <typename T,
            typename std::enable_if<std::is_floating_point<T>::value,
                                    int>::type = 0>
  Value(T v) : data_(static_cast<double>(v)) {}  // NOLINT

  Value(bool v) : data_(v) {}  // NOLINT
  Value(const char* v) {       // NOLINT
    if (v != nullptr) { data_ = std::string(v); }
  }
  Value(std::string v) : data_(std::move(v)) {}  // NOLINT

  ValueType type() const { return static_cast<ValueType>(data_.index()); }

  bool IsNull() const { return type() == ValueType::kNull; }
  bool IsInteger() const { return type() == ValueType::kInteger; }
  bool IsReal() const { return type() == ValueType::kReal; }
  bool IsBool() const { return type() == ValueType::kBool; }
  bool IsText() const { return type() == ValueType::kText; }

  // Unchecked accessors; callers test the type first.
  int64_t AsInt64() const { return std::get<int64_t>(data_); }
  double AsDouble() const { return std::get<double>(data_); }
  bool AsBool() const { return std::get<bool>(data_); }
  const std::string& AsText() const { return std::get<std::string>(data_); }

  /// Renders the value for logs: NULL, numbers as-is, text quoted.
  std::string ToString() const {
    switch (type()) {
      case ValueType::kNull:    return "NULL";
      case ValueType::kInteger: return fmt::format("{}", AsInt64());
      case ValueType::kReal:    return fmt::format("{}", AsDouble());
      case ValueType::kBool:    return AsBool() ? "true" : "false";
      case ValueType::kText:    return fmt::format("'{}'", AsText());
    }
    return "?";
  }

  bool operator==(const Value& other) const { return data_ == other.data_; }
  bool operator!=(const Value& other) const { return !(*this == other); }

 private:
  std::variant<std::monostate, int64_t, double, bool, std::string> data_;
};

// ---------------------------------------------------------------------------
// Text parsing helpers
// ---------------------------------------------------------------------------

namespace detail {

inline bool ParseInt64(const std::string& text, int64_t* out) {
  if (text.empty()) { return false; }
  errno = 0;
  char* end = nullptr;
  long long v = std::strtoll(text.c_str(), &end, 10);
  if (errno != 0 || end == nullptr || *end != '\0') { return false; }
  *out = static_cast<int64_t>(v);
  return true;
}

inline bool ParseDouble(const std::string& text, double* out) {
  if (text.empty()) { return false; }
  errno = 0;
  char* end = nullptr;
  double v = std::strtod(text.c_str(), &end);
  if (errno != 0 || end == nullptr || *end != '\0') { return false; }
  *out = v;
  return true;
}

inline bool ToInt64(const Value& v, int64_t* out) {
  switch (v.type()) {
    case ValueType::kInteger:
      *out = v.AsInt64();
      return true;
    case ValueType::kBool:
      *out = v.AsBool() ? 1 : 0;
      return true;
    case ValueType::kReal: {
      double d = v.AsDouble();
      // Rejects NaN and anything outside [-2^63, 2^63) before the cast.
      if (!(d >= -9223372036854775808.0 && d < 9223372036854775808.0)) {
        return false;
      }
      if (static_cast<double>(static_cast<int64_t>(d)) != d) { return false; }
      *out = static_cast<int64_t>(d);
      return true;
    }
    case ValueType::kText:
      return ParseInt64(v.AsText(), out);
    case ValueType::kNull:
      return false;
  }
  return false;
}

}  // namespace detail

// ---------------------------------------------------------------------------
// ValueTraits<T>
// ---------------------------------------------------------------------------

template <typename T>
struct ValueTraits;

template <>
struct ValueTraits<int32_t> {
  static constexpr SqlType kSqlType = SqlType::kInteger;
  static constexpr bool kNullable = false;

  static Value ToValue(int32_t v) { return Value(v); }

  static bool FromValue(const Value& v, int32_t* out) {
    int64_t wide = 0;
    if (!detail::ToInt64(v, &wide)) { return false; }
    if (wide < INT32_MIN || wide > INT32_MAX) { return false; }
    *out = static_cast<int32_t>(wide);
    return true;
  }
};

template <>
struct ValueTraits<int64_t> {
  static constexpr SqlType kSqlType = SqlType::kBigInt;
  static constexpr bool kNullable = false;

  static Value ToValue(int64_t v) { return Value(v); }

  static bool FromValue(const Value& v, int64_t* out) {
    return detail::ToInt64(v, out);
  }
};

template <>
struct ValueTraits<double> {
  static constexpr SqlType kSqlType = SqlType::kReal;
  static constexpr bool kNullable = false;

  static Value ToValue(double v) { return Value(v); }

  static bool FromValue(const Value& v, double* out) {
    switch (v.type()) {
      case ValueType::kReal:
        *out = v.AsDouble();
        return true;
      case ValueType::kInteger:
        *out = static_cast<double>(v.AsInt64());
        return true;
      case ValueType::kText:
        return detail::ParseDouble(v.AsText(), out);
      default:
        return false;
    }
  }
};

template <>
struct ValueTraits<bool> {
  static constexpr SqlType kSqlType = SqlType::kBoolean;
  static constexpr bool kNullable = false;

  static Value ToValue(bool v) { return Value(v); }

  static bool FromValue(const Value& v, bool* out) {
    switch (v.type()) {
      case ValueType::kBool:
        *out = v.AsBool();
        return true;
      case ValueType::kInteger:
        *out = v.AsInt64() != 0;
        return true;
      case ValueType::kText: {
        const std::string& t = v.AsText();
        if (t == "1" || t == "true" || t == "TRUE" || t == "t") {
          *out = true;
          return true;
        }
        if (t == "0" || t == "false" || t == "FALSE" || t == "f") {
          *out = false;
          return true;
        }
        return false;
      }
      default:
        return false;
    }
  }
};

template <>
struct ValueTraits<std::string> {
  static constexpr SqlType kSqlType = SqlType::kText;
  static constexpr bool kNullable = false;

  static Value ToValue(const std::string& v) { return Value(v); }

  static bool FromValue(const Value& v, std::string* out) {
    switch (v.type()) {
      case ValueType::kText:
        *out = v.AsText();
        return true;
      case ValueType::kInteger:
        *out = fmt::format("{}", v.AsInt64());
        return true;
      case ValueType::kReal:
        *out = fmt::format("{}", v.AsDouble());
        return true;
      case ValueType::kBool:
        *out = v.AsBool() ? "true" : "false";
        return true;
      case ValueType::kNull:
        return false;
    }
    return false;
  }
};

template <typename T>
struct ValueTraits<std::optional<T>> {
  static constexpr SqlType kSqlType = ValueTraits<T>::kSqlType;
  static constexpr bool kNullable = true;

  static Value ToValue(const std::optional<T>& v) {
    return v.has_value() ? ValueTraits<T>::ToValue(*v) : Value();
  }

  static bool FromValue(const Value& v, std::optional<T>* out) {
    if (v.IsNull()) {
      out->reset();
      return true;
    }
    T inner{};
    if (!ValueTraits<T>::FromValue(v, &inner)) { return false; }
    *out = std::move(inner);
    return true;
  }
};

}  // namespace slint
