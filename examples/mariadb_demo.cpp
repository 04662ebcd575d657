// Copyright (c) 2024 liudegui. MIT License.
//
// slint MariaDB demo -- the same record types on Database<MariaBackend>.
//
// Usage:
//   export SLINT_DATABASE_URL="localhost:3306:root:pass:slint_test"
//   ./slint_mariadb_demo
//
// Before running, create the database:
//   mysql -u root -e "CREATE DATABASE IF NOT EXISTS slint_test;"

#include <cstdint>
#include <cstdio>
#include <string>
#include <vector>

#include "slint/slint.hpp"

struct Employee {
  int64_t empno = 0;
  std::string empname;
  double salary = 0.0;
};

SLINT_TABLE(Employee, "emp",
            SLINT_AUTO(empno), SLINT_COLUMN_TYPE(empname, kColumnPlain,
                                                 "VARCHAR(64)"),
            SLINT_FIELD(salary))

int main() {
  slint::MOrm orm(slint::OrmConfig::FromEnv("localhost:3306:root::slint_test"),
                  {slint::Schema<Employee>()});
  slint::Error err = orm.Connect();
  if (!err.ok()) {
    std::fprintf(stderr, "Connect failed: %s\n", err.message);
    return 1;
  }
  std::printf("Connected to MariaDB/MySQL\n");

  orm.Raw("DROP TABLE IF EXISTS emp;");
  err = orm.Migrate();
  if (!err.ok()) {
    std::fprintf(stderr, "Migrate failed: %s\n", err.message);
    return 1;
  }

  // Batch insert in one transaction
  orm.Db().BeginTransaction();
  for (int32_t i = 0; i < 10; ++i) {
    char name[32];
    std::snprintf(name, sizeof(name), "Employee%02d", i);
    orm.Insert("emp", Employee{0, name, 1000.0 + 100.0 * i});
  }
  err = orm.Db().Commit();
  slint::Value rows = orm.Db().QueryValue("SELECT count(*) FROM emp;");
  std::printf("Batch insert: %s, %s rows\n",
              err.ok() ? "committed" : "failed", rows.ToString().c_str());

  // Query
  std::printf("\n--- Top earners ---\n");
  std::vector<Employee> top = orm.Query("emp")
                                  .Where("salary", ">", 1500.0)
                                  .OrderBy("salary", "DESC")
                                  .Limit(3)
                                  .FetchAll<Employee>(&err);
  for (const Employee& e : top) {
    std::printf("  %lld  %s  %.2f\n", static_cast<long long>(e.empno),
                e.empname.c_str(), e.salary);
  }

  // Update / Delete
  int32_t updated = orm.UpdateColumns("emp", {{"empname", "Boss"}}, "empno",
                                      1, &err);
  std::printf("\nUpdated %d row(s)\n", updated);
  int32_t deleted = orm.Delete("emp", "empname", "Employee09", &err);
  std::printf("Deleted %d row(s)\n", deleted);

  std::printf("Final row count: %lld\n",
              static_cast<long long>(orm.Query("emp").Count(&err)));

  orm.Raw("DROP TABLE IF EXISTS emp;");
  orm.Close();
  std::printf("\nDone.\n");
  return 0;
}
