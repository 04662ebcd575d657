// Copyright (c) 2024 liudegui. MIT License.
//
// slint::NewUuid -- random (version 4) UUIDs in canonical lowercase text.

#pragma once

#include <string>

#include <uuid/uuid.h>

namespace slint {

inline std::string NewUuid() {
  uuid_t raw;
  uuid_generate_random(raw);
  char text[37];
  uuid_unparse_lower(raw, text);
  return std::string(text);
}

}  // namespace slint
