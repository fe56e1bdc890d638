#include <catch2/catch_test_macros.hpp>
#include "roster/db/db.hpp"
#include "roster/students/directory.hpp"
#include "roster/students/storage.hpp"

#include <cstdlib>
#include <memory>
#include <string>

using namespace roster;
using namespace roster::students;

namespace {

// Connects to ROSTER_TEST_DATABASE_URL and empties the roster tables.
std::shared_ptr<db::Database> freshDatabase() {
  auto *Url = std::getenv("ROSTER_TEST_DATABASE_URL");
  if (Url == nullptr || *Url == '\0') {
    SKIP("ROSTER_TEST_DATABASE_URL is not set");
  }

  auto Database = db::Database::connect(Url);
  REQUIRE(Database.has_value());
  REQUIRE((*Database)->migrate().has_value());
  REQUIRE((*Database)->transact("reset", [](pqxx::work &Tx) {
    Tx.exec("DELETE FROM students");
    Tx.exec("DELETE FROM counters");
  }).has_value());
  return *Database;
}

models::StudentPayload ann() {
  return {.Name = "Ann", .Email = "a@x.com", .Age = "20", .Hobby = "chess"};
}

} // namespace

TEST_CASE("Directory changes survive a restore", "[storage][integration]") {
  auto Database = freshDatabase();

  Directory Writer(core::nowNanos, makeJournal(Database));
  auto Kept = Writer.addStudent(ann());
  auto Dropped = Writer.addStudent(ann());
  REQUIRE(Kept.has_value());
  REQUIRE(Dropped.has_value());
  REQUIRE(Writer.updateStudent(Kept->Id, {"Ann", "a@x.com", "21", "go"}));
  REQUIRE(Writer.deleteStudent(Dropped->Id));

  Directory Reader;
  REQUIRE(restoreDirectory(*Database, Reader).has_value());
  REQUIRE(Reader.size() == 1);
  REQUIRE(Reader.nextId() == Dropped->Id + 1);

  auto Restored = Reader.getStudent(Kept->Id);
  REQUIRE(Restored.has_value());
  REQUIRE(Restored->Age == "21");
  REQUIRE(Restored->Hobby == "go");
  REQUIRE(Restored->CreatedAt == Kept->CreatedAt);
  REQUIRE(Restored->UpdatedAt.has_value());
}

TEST_CASE("Removing a row storage no longer has succeeds",
          "[storage][integration]") {
  auto Database = freshDatabase();
  auto Journal = makeJournal(Database);

  models::Student Ghost{
      .Id = 77, .Name = "Ghost", .Email = "", .Age = "", .Hobby = ""
  };
  auto Removed = Journal(Change{
      .Kind = ChangeKind::Remove, .Record = Ghost, .NextId = 78
  });
  REQUIRE(Removed.has_value());

  // A directory out of step with storage can still delete the record.
  Directory Students(core::nowNanos, Journal);
  Students.restore({Ghost}, 78);
  REQUIRE(Students.deleteStudent(77).has_value());
  REQUIRE(Students.size() == 0);
}
