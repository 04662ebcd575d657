// Copyright (c) 2024 liudegui. MIT License.
//
// slint::Sqlite3Backend -- backend traits for SQLite3.
//
// Database<Backend>, QueryBuilder<Backend> and BasicOrm<Backend> only see
// these four names. QueryBuilder needs nothing but Dialect.

#pragma once

#include "slint/dialect.hpp"
#include "slint/sqlite3_db.hpp"

namespace slint {

struct Sqlite3Backend {
  using Db        = Sqlite3Db;
  using Query     = Sqlite3Query;
  using Statement = Sqlite3Statement;
  using Dialect   = Sqlite3Dialect;
};

}  // namespace slint
