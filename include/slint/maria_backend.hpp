// Copyright (c) 2024 liudegui. MIT License.
//
// slint::MariaBackend -- backend traits for MariaDB/MySQL.
//
// Only compiled with SLINT_HAS_MARIADB=1 (links libmariadb).

#pragma once

#include "slint/dialect.hpp"
#include "slint/maria_db.hpp"

namespace slint {

struct MariaBackend {
  using Db        = MariaDb;
  using Query     = MariaQuery;
  using Statement = MariaStatement;
  using Dialect   = MariaDialect;
};

}  // namespace slint
