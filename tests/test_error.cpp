// Copyright (c) 2024 liudegui. MIT License.
// Tests for slint::Error.

#include <catch2/catch.hpp>
#include <cstring>

#include "slint/error.hpp"

using namespace slint;

TEST_CASE("Error: default is ok", "[error]") {
  Error err;
  REQUIRE(err.ok());
  REQUIRE(static_cast<bool>(err));
  REQUIRE(err.code == ErrorCode::kOk);
}

TEST_CASE("Error: Make() keeps code and message", "[error]") {
  Error err = Error::Make(ErrorCode::kSchema, "unknown table 'ghosts'");
  REQUIRE_FALSE(err.ok());
  REQUIRE(err.code == ErrorCode::kSchema);
  REQUIRE(std::strstr(err.message, "ghosts") != nullptr);
}

TEST_CASE("Error: Make() without message", "[error]") {
  Error err = Error::Make(ErrorCode::kNotOpen);
  REQUIRE(err.code == ErrorCode::kNotOpen);
  REQUIRE(err.message[0] == '\0');
}

TEST_CASE("Error: SetFormat()", "[error]") {
  Error err;
  err.SetFormat(ErrorCode::kRange, "statement expects %d params, got %d", 2,
                3);
  REQUIRE(err.code == ErrorCode::kRange);
  REQUIRE(std::strcmp(err.message, "statement expects 2 params, got 3") == 0);
}

TEST_CASE("Error: Clear()", "[error]") {
  Error err = Error::Make(ErrorCode::kError, "fail");
  err.Clear();
  REQUIRE(err.ok());
  REQUIRE(err.message[0] == '\0');
}

TEST_CASE("Error: message truncation", "[error]") {
  char long_msg[512];
  std::memset(long_msg, 'x', sizeof(long_msg) - 1);
  long_msg[sizeof(long_msg) - 1] = '\0';

  Error err;
  err.Set(ErrorCode::kError, long_msg);
  REQUIRE(std::strlen(err.message) == Error::kMaxMessageLen - 1);
  REQUIRE(err.message[Error::kMaxMessageLen - 1] == '\0');
}

TEST_CASE("Error: Report() tolerates a null out-param", "[error]") {
  Report(nullptr, ErrorCode::kMisuse, "ignored");
  Report(nullptr, Error::Make(ErrorCode::kBusy));

  Error out;
  Report(&out, ErrorCode::kMisuse, "bad operator");
  REQUIRE(out.code == ErrorCode::kMisuse);
  REQUIRE(std::strcmp(out.message, "bad operator") == 0);

  Report(&out, Error::Make(ErrorCode::kBusy, "locked"));
  REQUIRE(out.code == ErrorCode::kBusy);
  REQUIRE(std::strcmp(out.message, "locked") == 0);
}

TEST_CASE("Error: ErrorCodeName()", "[error]") {
  REQUIRE(std::strcmp(ErrorCodeName(ErrorCode::kOk), "ok") == 0);
  REQUIRE(std::strcmp(ErrorCodeName(ErrorCode::kConstraint), "constraint") ==
          0);
  REQUIRE(std::strcmp(ErrorCodeName(ErrorCode::kSchema), "schema") == 0);
}
