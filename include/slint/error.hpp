// Copyright (c) 2024 liudegui. MIT License.
//
// slint::Error -- status reporting for the ORM and its drivers.
//
// Design:
//   - ErrorCode enum class with fixed-width underlying type
//   - Error struct: code + fixed-size message buffer
//   - Every fallible call returns an Error or fills an Error* out-param
//   - Compatible with -fno-exceptions

#pragma once

#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <cstring>

namespace slint {

// ---------------------------------------------------------------------------
// ErrorCode
// ---------------------------------------------------------------------------

enum class ErrorCode : int32_t {
  kOk = 0,
  kError = -1,
  kNotOpen = -2,
  kBusy = -3,
  kNotFound = -4,
  kConstraint = -5,
  kMismatch = -6,
  kMisuse = -7,
  kRange = -8,
  kNullParam = -9,
  kIoError = -10,
  kFull = -11,
  kSchema = -12,
};

inline const char* ErrorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::kOk:         return "ok";
    case ErrorCode::kError:      return "error";
    case ErrorCode::kNotOpen:    return "not open";
    case ErrorCode::kBusy:       return "busy";
    case ErrorCode::kNotFound:   return "not found";
    case ErrorCode::kConstraint: return "constraint";
    case ErrorCode::kMismatch:   return "mismatch";
    case ErrorCode::kMisuse:     return "misuse";
    case ErrorCode::kRange:      return "range";
    case ErrorCode::kNullParam:  return "null param";
    case ErrorCode::kIoError:    return "io error";
    case ErrorCode::kFull:       return "full";
    case ErrorCode::kSchema:     return "schema";
  }
  return "unknown";
}

// ---------------------------------------------------------------------------
// Error
// ---------------------------------------------------------------------------

struct Error {
  static constexpr uint32_t kMaxMessageLen = 256;

  ErrorCode code = ErrorCode::kOk;
  char message[kMaxMessageLen] = {};

  bool ok() const { return code == ErrorCode::kOk; }
  explicit operator bool() const { return ok(); }

  void Set(ErrorCode c, const char* msg) {
    code = c;
    if (msg != nullptr) {
      std::strncpy(message, msg, kMaxMessageLen - 1);
      message[kMaxMessageLen - 1] = '\0';
    } else {
      message[0] = '\0';
    }
  }

  void SetFormat(ErrorCode c, const char* fmt, ...) {
    code = c;
    if (fmt != nullptr) {
      va_list ap;
      va_start(ap, fmt);
      std::vsnprintf(message, kMaxMessageLen, fmt, ap);
      va_end(ap);
    } else {
      message[0] = '\0';
    }
  }

  void Clear() {
    code = ErrorCode::kOk;
    message[0] = '\0';
  }

  static Error Ok() { return Error{}; }

  static Error Make(ErrorCode c, const char* msg = nullptr) {
    Error e;
    e.Set(c, msg);
    return e;
  }
};

// Copies `err` into `out` when the caller asked for it.
inline void Report(Error* out, const Error& err) {
  if (out != nullptr) { *out = err; }
}

inline void Report(Error* out, ErrorCode c, const char* msg) {
  if (out != nullptr) { out->Set(c, msg); }
}

}  // namespace slint
