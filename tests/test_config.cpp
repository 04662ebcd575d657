// Copyright (c) 2024 liudegui. MIT License.
// Tests for slint::OrmConfig and slint::MariaDsn.

#include <catch2/catch.hpp>
#include <cstdlib>

#include "slint/config.hpp"

using namespace slint;

TEST_CASE("OrmConfig: FromEnv defaults", "[config]") {
  unsetenv("SLINT_DATABASE_URL");
  unsetenv("SLINT_BUSY_TIMEOUT_MS");
  unsetenv("SLINT_LOG_LEVEL");

  OrmConfig config = OrmConfig::FromEnv();
  REQUIRE(config.database_url == ":memory:");
  REQUIRE(config.busy_timeout_ms == 0);
  REQUIRE(config.log_level.empty());

  REQUIRE(OrmConfig::FromEnv("app.db").database_url == "app.db");
}

TEST_CASE("OrmConfig: FromEnv reads the environment", "[config]") {
  setenv("SLINT_DATABASE_URL", "sqlite:///tmp/slint_config.db", 1);
  setenv("SLINT_BUSY_TIMEOUT_MS", "250", 1);
  setenv("SLINT_LOG_LEVEL", "debug", 1);

  OrmConfig config = OrmConfig::FromEnv();
  REQUIRE(config.database_url == "sqlite:///tmp/slint_config.db");
  REQUIRE(config.busy_timeout_ms == 250);
  REQUIRE(config.log_level == "debug");

  unsetenv("SLINT_DATABASE_URL");
  unsetenv("SLINT_BUSY_TIMEOUT_MS");
  unsetenv("SLINT_LOG_LEVEL");
}

TEST_CASE("OrmConfig: empty url falls back to the default", "[config]") {
  setenv("SLINT_DATABASE_URL", "", 1);
  REQUIRE(OrmConfig::FromEnv("fallback.db").database_url == "fallback.db");
  unsetenv("SLINT_DATABASE_URL");
}

TEST_CASE("MariaDsn: full form", "[config]") {
  MariaDsn dsn = MariaDsn::Parse("db.local:3307:app:secret:shop");
  REQUIRE(dsn.host == "db.local");
  REQUIRE(dsn.port == 3307);
  REQUIRE(dsn.user == "app");
  REQUIRE(dsn.password == "secret");
  REQUIRE(dsn.database == "shop");
}

TEST_CASE("MariaDsn: empty fields keep defaults", "[config]") {
  MariaDsn dsn = MariaDsn::Parse("::::testdb");
  REQUIRE(dsn.host == "localhost");
  REQUIRE(dsn.port == 3306);
  REQUIRE(dsn.user == "root");
  REQUIRE(dsn.password.empty());
  REQUIRE(dsn.database == "testdb");
}

TEST_CASE("MariaDsn: missing trailing fields", "[config]") {
  MariaDsn dsn = MariaDsn::Parse("h:1:u:p");
  REQUIRE(dsn.password == "p");
  REQUIRE(dsn.database.empty());

  MariaDsn null_dsn = MariaDsn::Parse(nullptr);
  REQUIRE(null_dsn.host == "localhost");
}
