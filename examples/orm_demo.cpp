// Copyright (c) 2024 liudegui. MIT License.
//
// slint ORM demo -- users and posts on SQLite3.
//
// Usage:
//   ./slint_orm_demo                      # in-memory database
//   SLINT_DATABASE_URL=blog.db SLINT_LOG_LEVEL=debug ./slint_orm_demo

#include <cstdint>
#include <cstdio>
#include <optional>
#include <string>
#include <vector>

#include "slint/slint.hpp"

struct User {
  std::string id;
  std::string name;
  std::string email;
  std::optional<int32_t> age;
};

struct Post {
  int64_t id = 0;
  std::string author_id;
  std::string title;
  std::string body;
  bool published = false;
};

SLINT_TABLE(User, "users",
            SLINT_UUID(id), SLINT_FIELD(name), SLINT_UNIQUE(email),
            SLINT_FIELD(age))

SLINT_TABLE(Post, "posts",
            SLINT_AUTO(id), SLINT_FIELD(author_id), SLINT_FIELD(title),
            SLINT_FIELD(body), SLINT_FIELD(published))

int main() {
  slint::Orm orm(slint::OrmConfig::FromEnv(),
                 {slint::Schema<User>(), slint::Schema<Post>()});
  slint::Error err = orm.Connect();
  if (!err.ok()) {
    std::fprintf(stderr, "Connect failed: %s\n", err.message);
    return 1;
  }
  err = orm.Migrate();
  if (!err.ok()) {
    std::fprintf(stderr, "Migrate failed: %s\n", err.message);
    return 1;
  }

  // Insert
  slint::Table<User> users(&orm, "users");
  slint::Value ann_id;
  users.Insert(User{"", "Ann", "ann@example.com", 34}, &ann_id);
  users.Insert(User{"", "Bob", "bob@example.com", std::nullopt});
  users.Insert(User{"", "Cleo", "cleo@example.com", 27});
  std::string ann_key = ann_id.IsText() ? ann_id.AsText() : std::string();
  std::printf("Inserted Ann as %s\n", ann_key.c_str());

  err = users.Insert(User{"", "Ann again", "ann@example.com", 35});
  std::printf("Duplicate email rejected: %s (%s)\n",
              slint::ErrorCodeName(err.code), err.message);

  slint::Value post_id;
  orm.Insert("posts", Post{0, ann_key, "Hello", "First post", true},
             &post_id);
  orm.Insert("posts", Post{0, ann_key, "Draft", "Not yet", false});
  std::printf("Inserted post %s\n", post_id.ToString().c_str());

  // First / GetAll
  std::optional<User> ann = orm.First<User>("users", "email",
                                            "ann@example.com", &err);
  if (ann.has_value()) {
    std::printf("\nFound %s <%s>\n", ann->name.c_str(), ann->email.c_str());
  }

  std::printf("\n--- All users ---\n");
  for (const User& u : orm.GetAll<User>("users", &err)) {
    std::printf("  %s  %-5s %s\n", u.id.c_str(), u.name.c_str(),
                u.age.has_value() ? std::to_string(*u.age).c_str() : "-");
  }

  // Query builder
  std::printf("\n--- Adults ordered by age ---\n");
  auto adults = users.Query()
                    .Where("age", ">=", 18)
                    .OrderBy("age", "DESC")
                    .Get(&err);
  for (const auto& rec : adults) {
    std::printf("  %s (%d)\n", rec.value().name.c_str(), *rec.value().age);
  }

  int64_t published = orm.Query("posts")
                          .Where("published", "=", true)
                          .Count(&err);
  std::printf("Published posts: %lld\n", static_cast<long long>(published));

  // Update / Delete through a record
  auto bob = users.Get("name", "Bob", &err);
  if (bob.has_value()) {
    err = bob->Update({{"age", 41}});
    if (!err.ok()) {
      std::fprintf(stderr, "Update failed: %s\n", err.message);
      return 1;
    }
    std::printf("\nBob is now %d\n", *bob->value().age);
    err = bob->Delete();
    if (!err.ok()) {
      std::fprintf(stderr, "Delete failed: %s\n", err.message);
      return 1;
    }
  }

  // Raw SQL
  orm.Raw("UPDATE posts SET published = 1;", &err);
  std::vector<slint::Row> rows = orm.RawQuery(
      "SELECT u.name, COUNT(p.id) AS posts FROM users u "
      "LEFT JOIN posts p ON p.author_id = u.id GROUP BY u.name "
      "ORDER BY u.name;",
      {}, &err);
  std::printf("\n--- Posts per user ---\n");
  for (const slint::Row& row : rows) {
    std::printf("  %s: %s\n", row.Get("name").ToString().c_str(),
                row.Get("posts").ToString().c_str());
  }

  orm.Close();
  std::printf("\nDone.\n");
  return 0;
}
