// Copyright (c) 2024 liudegui. MIT License.
// Tests for slint::MOrm (requires running MySQL/MariaDB server).
//
// Environment variables:
//   SLINT_MARIA_DSN  -- DSN string, default "localhost:3306:root::slint_test"

#include <catch2/catch.hpp>
#include <cstdint>
#include <cstdlib>
#include <optional>
#include <string>
#include <vector>

#include "slint/orm.hpp"

namespace crm {

struct Contact {
  std::string id;
  std::string name;
  std::string email;
  std::optional<int32_t> age;
};

struct Note {
  int64_t id = 0;
  std::string contact;
  std::string text;
};

}  // namespace crm

SLINT_TABLE(crm::Contact, "slint_contacts",
            SLINT_UUID(id), SLINT_FIELD(name), SLINT_UNIQUE(email),
            SLINT_FIELD(age))

SLINT_TABLE(crm::Note, "slint_notes",
            SLINT_AUTO(id), SLINT_FIELD(contact),
            SLINT_COLUMN_TYPE(text, kColumnPlain, "MEDIUMTEXT"))

using namespace slint;
using crm::Contact;
using crm::Note;

static MOrm OpenTestOrm() {
  OrmConfig config;
  const char* dsn = std::getenv("SLINT_MARIA_DSN");
  config.database_url =
      (dsn != nullptr) ? dsn : "localhost:3306:root::slint_test";
  config.busy_timeout_ms = 2000;
  MOrm orm(config, {Schema<Contact>(), Schema<Note>()});
  REQUIRE(orm.Connect().ok());
  orm.Raw("DROP TABLE IF EXISTS slint_contacts;");
  orm.Raw("DROP TABLE IF EXISTS slint_notes;");
  REQUIRE(orm.Migrate().ok());
  return orm;
}

TEST_CASE("MariaOrm: insert and read back", "[mariadb][orm]") {
  auto orm = OpenTestOrm();

  Value key;
  REQUIRE(orm.Insert("slint_contacts",
                     Contact{"", "Ann", "ann@example.com", 31}, &key)
              .ok());
  REQUIRE(key.AsText().size() == 36);
  REQUIRE(orm.Insert("slint_contacts",
                     Contact{"", "Bob", "bob@example.com", std::nullopt})
              .ok());

  Error err;
  std::optional<Contact> ann =
      orm.First<Contact>("slint_contacts", "id", key, &err);
  REQUIRE(err.ok());
  REQUIRE(ann.has_value());
  REQUIRE(ann->age == std::optional<int32_t>(31));

  std::optional<Contact> bob =
      orm.First<Contact>("slint_contacts", "email", "bob@example.com", &err);
  REQUIRE(bob.has_value());
  REQUIRE_FALSE(bob->age.has_value());

  REQUIRE(orm.Exists("slint_contacts", "name", "Bob"));
  REQUIRE(orm.GetAll<Contact>("slint_contacts").size() == 2);
}

TEST_CASE("MariaOrm: auto key and update", "[mariadb][orm]") {
  auto orm = OpenTestOrm();

  Value first;
  Value second;
  REQUIRE(orm.Insert("slint_notes", Note{0, "ann", "call back"}, &first).ok());
  REQUIRE(orm.Insert("slint_notes", Note{0, "ann", "sent offer"}, &second)
              .ok());
  REQUIRE(first == Value(int64_t{1}));
  REQUIRE(second == Value(int64_t{2}));

  Error err;
  REQUIRE(orm.UpdateColumns("slint_notes", {{"text", "offer accepted"}}, "id",
                            second, &err) == 1);
  std::optional<Note> note = orm.First<Note>("slint_notes", "id", second, &err);
  REQUIRE(note.has_value());
  REQUIRE(note->text == "offer accepted");

  REQUIRE(orm.Delete("slint_notes", "contact", "ann", &err) == 2);
}

TEST_CASE("MariaOrm: query builder", "[mariadb][orm]") {
  auto orm = OpenTestOrm();
  orm.Insert("slint_contacts", Contact{"", "Ann", "ann@example.com", 31});
  orm.Insert("slint_contacts", Contact{"", "Bob", "bob@example.com", 45});
  orm.Insert("slint_contacts", Contact{"", "Cleo", "cleo@example.com", 22});

  Error err;
  std::vector<Contact> older = orm.Query("slint_contacts")
                                   .Where("age", ">", 25)
                                   .OrderBy("age", "DESC")
                                   .FetchAll<Contact>(&err);
  REQUIRE(err.ok());
  REQUIRE(older.size() == 2);
  REQUIRE(older[0].name == "Bob");

  REQUIRE(orm.Query("slint_contacts").ILike("email", "EXAMPLE").Count(&err) ==
          3);
}

TEST_CASE("MariaOrm: unique violation", "[mariadb][orm]") {
  auto orm = OpenTestOrm();
  REQUIRE(orm.Insert("slint_contacts",
                     Contact{"", "Ann", "ann@example.com", std::nullopt})
              .ok());
  Error err = orm.Insert("slint_contacts",
                         Contact{"", "Ann", "ann@example.com", std::nullopt});
  REQUIRE(err.code == ErrorCode::kConstraint);
}
