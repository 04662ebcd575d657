// Copyright (c) 2024 liudegui. MIT License.
// Tests for record annotation, row decoding and CREATE TABLE rendering.

#include <catch2/catch.hpp>
#include <cstdint>
#include <cstring>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "slint/dialect.hpp"
#include "slint/schema.hpp"

namespace shop {

struct Customer {
  std::string id;
  std::string name;
  std::string email;
};

struct OrderLine {
  int64_t id = 0;
  int32_t quantity = 0;
  double price = 0.0;
  bool gift = false;
  std::optional<std::string> note;
};

struct Coupon {
  std::string code;
  int32_t discount = 5;
  std::string memo;
};

}  // namespace shop

SLINT_TABLE(shop::Customer, "customers",
            SLINT_UUID(id), SLINT_FIELD(name), SLINT_UNIQUE(email))

SLINT_RECORD(shop::OrderLine,
             SLINT_AUTO(id), SLINT_FIELD(quantity), SLINT_FIELD(price),
             SLINT_FIELD(gift), SLINT_FIELD(note))

SLINT_TABLE(shop::Coupon, "coupons",
            SLINT_PRIMARY(code), SLINT_NULLABLE(discount),
            SLINT_NULLABLE(memo))

using namespace slint;

namespace {

Row MakeRow(std::vector<std::string> names, std::vector<Value> values) {
  return Row(std::make_shared<std::vector<std::string>>(std::move(names)),
             std::move(values));
}

}  // namespace

TEST_CASE("Schema: explicit table name and flags", "[schema]") {
  const TableSchema& schema = Schema<shop::Customer>();
  REQUIRE(schema.name == "customers");
  REQUIRE(schema.columns.size() == 3);

  const ColumnSchema& id = schema.columns[0];
  REQUIRE(id.name == "id");
  REQUIRE(id.uuid);
  REQUIRE(id.primary);
  REQUIRE(id.not_null);
  REQUIRE(id.type == SqlType::kText);

  const ColumnSchema* email = schema.FindColumn("email");
  REQUIRE(email != nullptr);
  REQUIRE(email->unique);
  REQUIRE_FALSE(email->primary);
  REQUIRE(schema.FindColumn("phone") == nullptr);
  REQUIRE(schema.PrimaryKey() == &schema.columns[0]);
}

TEST_CASE("Schema: derived table name and member types", "[schema]") {
  const TableSchema& schema = Schema<shop::OrderLine>();
  REQUIRE(schema.name == "orderline");

  REQUIRE(schema.columns[0].auto_increment);
  REQUIRE(schema.columns[0].primary);
  REQUIRE(schema.columns[0].type == SqlType::kBigInt);
  REQUIRE(schema.columns[1].type == SqlType::kInteger);
  REQUIRE(schema.columns[2].type == SqlType::kReal);
  REQUIRE(schema.columns[3].type == SqlType::kBoolean);
  REQUIRE(schema.columns[4].type == SqlType::kText);
  REQUIRE_FALSE(schema.columns[4].not_null);
}

TEST_CASE("Schema: caller keyed and nullable columns", "[schema]") {
  const TableSchema& schema = Schema<shop::Coupon>();
  const ColumnSchema& code = schema.columns[0];
  REQUIRE(code.primary);
  REQUIRE_FALSE(code.uuid);
  REQUIRE_FALSE(code.auto_increment);
  REQUIRE(code.not_null);
  REQUIRE(schema.PrimaryKey() == &code);

  REQUIRE_FALSE(schema.columns[1].not_null);
  REQUIRE(schema.columns[1].type == SqlType::kInteger);
  REQUIRE_FALSE(schema.columns[2].not_null);

  REQUIRE(CreateTableSql<Sqlite3Dialect>(schema) ==
          "CREATE TABLE IF NOT EXISTS coupons (code TEXT PRIMARY KEY NOT NULL, "
          "discount INTEGER, memo TEXT)");
  REQUIRE(CreateTableSql<MariaDialect>(schema) ==
          "CREATE TABLE IF NOT EXISTS coupons (code VARCHAR(255) PRIMARY KEY "
          "NOT NULL, discount INT, memo TEXT)");
}

TEST_CASE("Schema: DefaultTableName", "[schema]") {
  REQUIRE(DefaultTableName("User") == "user");
  REQUIRE(DefaultTableName("app::v2::BlogPost") == "blogpost");
  REQUIRE(DefaultTableName("app :: Tag") == "tag");
  REQUIRE(DefaultTableName(nullptr).empty());
}

TEST_CASE("Schema: CREATE TABLE for sqlite3", "[schema]") {
  REQUIRE(CreateTableSql<Sqlite3Dialect>(Schema<shop::Customer>()) ==
          "CREATE TABLE IF NOT EXISTS customers (id TEXT PRIMARY KEY NOT NULL, "
          "name TEXT NOT NULL, email TEXT UNIQUE NOT NULL)");
  REQUIRE(CreateTableSql<Sqlite3Dialect>(Schema<shop::OrderLine>()) ==
          "CREATE TABLE IF NOT EXISTS orderline (id INTEGER PRIMARY KEY "
          "AUTOINCREMENT NOT NULL, quantity INTEGER NOT NULL, price REAL NOT "
          "NULL, gift BOOLEAN NOT NULL, note TEXT)");
}

TEST_CASE("Schema: CREATE TABLE for mariadb", "[schema]") {
  REQUIRE(CreateTableSql<MariaDialect>(Schema<shop::OrderLine>()) ==
          "CREATE TABLE IF NOT EXISTS orderline (id BIGINT PRIMARY KEY "
          "AUTO_INCREMENT NOT NULL, quantity INT NOT NULL, price DOUBLE NOT "
          "NULL, gift BOOLEAN NOT NULL, note TEXT)");
  REQUIRE(CreateTableSql<MariaDialect>(Schema<shop::Customer>()) ==
          "CREATE TABLE IF NOT EXISTS customers (id VARCHAR(255) PRIMARY KEY "
          "NOT NULL, name TEXT NOT NULL, email VARCHAR(255) UNIQUE NOT NULL)");
}

TEST_CASE("Schema: sql_type override", "[schema]") {
  ColumnSchema c;
  c.name = "code";
  c.sql_type = "CHAR(8)";
  c.unique = true;
  REQUIRE(ColumnDefinition<MariaDialect>(c) == "code CHAR(8) UNIQUE NOT NULL");
}

TEST_CASE("Schema: EncodeColumn", "[schema]") {
  shop::OrderLine line;
  line.id = 4;
  line.quantity = 2;
  line.gift = true;
  REQUIRE(EncodeColumn(line, "id") == Value(4));
  REQUIRE(EncodeColumn(line, "gift") == Value(true));
  REQUIRE(EncodeColumn(line, "note").IsNull());
  REQUIRE(EncodeColumn(line, "nope").IsNull());

  line.note = "wrap it";
  REQUIRE(EncodeColumn(line, "note") == Value("wrap it"));
}

TEST_CASE("Schema: DecodeRow converts driver values", "[schema]") {
  Row row = MakeRow({"id", "quantity", "price", "gift", "note", "extra"},
                    {Value(9), Value("3"), Value(2), Value(1), Value(),
                     Value("ignored")});
  shop::OrderLine line;
  line.note = "stale";
  Error err;
  REQUIRE(DecodeRow(row, &line, &err));
  REQUIRE(err.ok());
  REQUIRE(line.id == 9);
  REQUIRE(line.quantity == 3);
  REQUIRE(line.price == 2.0);
  REQUIRE(line.gift);
  REQUIRE_FALSE(line.note.has_value());
}

TEST_CASE("Schema: DecodeRow keeps members on NULL", "[schema]") {
  Row row = MakeRow({"code", "discount", "memo"},
                    {Value("SPRING"), Value(), Value()});
  shop::Coupon coupon;
  coupon.memo = "unchanged";
  Error err;
  REQUIRE(DecodeRow(row, &coupon, &err));
  REQUIRE(err.ok());
  REQUIRE(coupon.code == "SPRING");
  REQUIRE(coupon.discount == 5);
  REQUIRE(coupon.memo == "unchanged");

  // Nullable columns may also be absent from the result.
  shop::Coupon partial;
  REQUIRE(DecodeRow(MakeRow({"code"}, {Value("FALL")}), &partial, &err));
  REQUIRE(partial.code == "FALL");
  REQUIRE(partial.discount == 5);
}

TEST_CASE("Schema: DecodeRow rejects NULL in a required column", "[schema]") {
  Row row = MakeRow({"code", "discount", "memo"},
                    {Value(), Value(10), Value("x")});
  shop::Coupon coupon;
  Error err;
  REQUIRE_FALSE(DecodeRow(row, &coupon, &err));
  REQUIRE(err.code == ErrorCode::kMismatch);
  REQUIRE(std::strstr(err.message, "code") != nullptr);
}

TEST_CASE("Schema: DecodeRow rejects reals too large for an integer",
          "[schema]") {
  Row row = MakeRow({"id", "quantity", "price", "gift"},
                    {Value(1e30), Value(1), Value(1.0), Value(0)});
  shop::OrderLine line;
  Error err;
  REQUIRE_FALSE(DecodeRow(row, &line, &err));
  REQUIRE(err.code == ErrorCode::kMismatch);
  REQUIRE(std::strstr(err.message, "id") != nullptr);
}

TEST_CASE("Schema: DecodeRow rejects missing columns", "[schema]") {
  Row row = MakeRow({"id", "name"}, {Value("a"), Value("Ann")});
  shop::Customer customer;
  Error err;
  REQUIRE_FALSE(DecodeRow(row, &customer, &err));
  REQUIRE(err.code == ErrorCode::kMismatch);
  REQUIRE(std::strstr(err.message, "email") != nullptr);
}

TEST_CASE("Schema: DecodeRow rejects unconvertible values", "[schema]") {
  Row row = MakeRow({"id", "quantity", "price", "gift"},
                    {Value(1), Value("many"), Value(1.0), Value(0)});
  shop::OrderLine line;
  Error err;
  REQUIRE_FALSE(DecodeRow(row, &line, &err));
  REQUIRE(err.code == ErrorCode::kMismatch);
  REQUIRE(std::strstr(err.message, "quantity") != nullptr);
}

TEST_CASE("Schema: DecodeRow null record", "[schema]") {
  Error err;
  REQUIRE_FALSE(DecodeRow<shop::Customer>(Row(), nullptr, &err));
  REQUIRE(err.code == ErrorCode::kNullParam);
}
