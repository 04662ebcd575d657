// Copyright (c) 2024 liudegui. MIT License.
//
// slint::OrmConfig -- connection and runtime settings.
//
// Design:
//   - Plain struct, filled in code or from the environment
//   - database_url is handed to Backend::Db::Open() unchanged:
//       SQLite:  file path, ":memory:" or "sqlite://<path>"
//       MariaDB: "host:port:user:password:database"
//   - MariaDsn splits the MariaDB form; empty fields keep their defaults
//
// Environment (OrmConfig::FromEnv):
//   SLINT_DATABASE_URL     -- database_url
//   SLINT_BUSY_TIMEOUT_MS  -- busy_timeout_ms
//   SLINT_LOG_LEVEL        -- trace|debug|info|warn|error|critical|off

#pragma once

#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <string>

namespace slint {

// ---------------------------------------------------------------------------
// OrmConfig
// ---------------------------------------------------------------------------

struct OrmConfig {
  std::string database_url;
  int32_t busy_timeout_ms = 0;
  std::string log_level;

  static OrmConfig FromEnv(const char* default_url = ":memory:") {
    OrmConfig config;
    const char* url = std::getenv("SLINT_DATABASE_URL");
    config.database_url = (url != nullptr && url[0] != '\0')
                              ? url
                              : (default_url != nullptr ? default_url : "");
    const char* timeout = std::getenv("SLINT_BUSY_TIMEOUT_MS");
    if (timeout != nullptr) {
      config.busy_timeout_ms =
          static_cast<int32_t>(std::strtol(timeout, nullptr, 10));
    }
    const char* level = std::getenv("SLINT_LOG_LEVEL");
    if (level != nullptr) { config.log_level = level; }
    return config;
  }
};

// ---------------------------------------------------------------------------
// MariaDsn -- "host:port:user:password:database"
// ---------------------------------------------------------------------------

struct MariaDsn {
  std::string host = "localhost";
  uint16_t port = 3306;
  std::string user = "root";
  std::string password;
  std::string database;

  /// Fields can be empty. Minimal: "localhost:3306:root::testdb"
  static MariaDsn Parse(const char* dsn) {
    MariaDsn out;
    if (dsn == nullptr) { return out; }

    std::string parts[5];
    int32_t count = 1;
    for (const char* p = dsn; *p != '\0'; ++p) {
      if (*p == ':' && count < 5) {
        ++count;
        continue;
      }
      parts[count - 1].push_back(*p);
    }

    if (!parts[0].empty()) { out.host = parts[0]; }
    if (!parts[1].empty()) {
      out.port = static_cast<uint16_t>(std::strtoul(parts[1].c_str(),
                                                    nullptr, 10));
    }
    if (!parts[2].empty()) { out.user = parts[2]; }
    out.password = parts[3];
    out.database = parts[4];
    return out;
  }
};

}  // namespace slint
