// Copyright (c) 2024 liudegui. MIT License.
//
// slint -- umbrella header.
//
//   #include "slint/slint.hpp"
//
//   struct User { std::string id; std::string name; std::string email; };
//   SLINT_TABLE(User, "users",
//               SLINT_UUID(id), SLINT_FIELD(name), SLINT_UNIQUE(email))
//
//   slint::Orm orm(slint::OrmConfig::FromEnv(), {slint::Schema<User>()});
//   orm.Connect();
//   orm.Migrate();
//   orm.Insert("users", User{"", "Ann", "ann@example.com"});
//
// Build with SLINT_HAS_MARIADB=1 for slint::MOrm / slint::MDb.

#pragma once

#include "slint/config.hpp"
#include "slint/database.hpp"
#include "slint/dialect.hpp"
#include "slint/error.hpp"
#include "slint/log.hpp"
#include "slint/orm.hpp"
#include "slint/query_builder.hpp"
#include "slint/row.hpp"
#include "slint/schema.hpp"
#include "slint/table.hpp"
#include "slint/uuid.hpp"
#include "slint/value.hpp"
