// Copyright (c) 2024 liudegui. MIT License.
//
// slint::Row -- one fetched row, detached from the driver.

#pragma once

#include <cstdint>
#include <cstring>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "slint/value.hpp"

namespace slint {

using ColumnNames = std::shared_ptr<const std::vector<std::string>>;

class Row {
 public:
  Row() = default;

  Row(ColumnNames columns, std::vector<Value> values)
      : columns_(std::move(columns)), values_(std::move(values)) {}

  int32_t NumFields() const { return static_cast<int32_t>(values_.size()); }

  int32_t FieldIndex(const char* name) const {
    if (columns_ == nullptr || name == nullptr) { return -1; }
    for (size_t i = 0; i < columns_->size(); ++i) {
      if ((*columns_)[i] == name) { return static_cast<int32_t>(i); }
    }
    return -1;
  }

  const char* FieldName(int32_t col) const {
    if (columns_ == nullptr || col < 0 ||
        col >= static_cast<int32_t>(columns_->size())) {
      return nullptr;
    }
    return (*columns_)[static_cast<size_t>(col)].c_str();
  }

  /// Out-of-range lookups yield a null value.
  const Value& Get(int32_t col) const {
    if (col < 0 || col >= NumFields()) { return Null(); }
    return values_[static_cast<size_t>(col)];
  }

  const Value& Get(const char* name) const { return Get(FieldIndex(name)); }

  bool Has(const char* name) const { return FieldIndex(name) >= 0; }

  const std::vector<Value>& Values() const { return values_; }

 private:
  static const Value& Null() {
    static const Value kNull;
    return kNull;
  }

  ColumnNames columns_;
  std::vector<Value> values_;
};

}  // namespace slint
