#include <catch2/catch_test_macros.hpp>
#include "roster/core/http.hpp"
#include "roster/students/directory.hpp"
#include "roster/students/routes.hpp"
#include "roster/students/schemas.hpp"

#include <expected>
#include <glaze/glaze.hpp>
#include <glaze/net/http_router.hpp>
#include <memory>
#include <string>

using namespace roster;
using namespace roster::students;
using core::HttpStatus;

namespace {

const std::string AnnJson =
    R"({"name":"Ann","email":"a@x.com","age":"20","hobby":"chess"})";

models::Student readStudent(const Reply &Out) {
  models::Student Student;
  REQUIRE_FALSE(glz::read_json(Student, Out.Body));
  return Student;
}

std::string readError(const Reply &Out) {
  ErrorSchema Error;
  REQUIRE_FALSE(glz::read_json(Error, Out.Body));
  return Error.Error;
}

} // namespace

TEST_CASE("POST /students creates and returns the student", "[routes]") {
  Directory Students;

  auto Out = handleCreate(Students, AnnJson);
  REQUIRE(Out.Status == HttpStatus::Created);

  auto Student = readStudent(Out);
  REQUIRE(Student.Id == 0);
  REQUIRE(Student.Name == "Ann");
  REQUIRE(Student.Hobby == "chess");
  REQUIRE_FALSE(Student.UpdatedAt.has_value());
  REQUIRE(Students.size() == 1);
}

TEST_CASE("POST /students rejects bad bodies with 400", "[routes]") {
  Directory Students;

  SECTION("missing field") {
    auto Out = handleCreate(Students, R"({"name":"Ann"})");
    REQUIRE(Out.Status == HttpStatus::BadRequest);
    REQUIRE_FALSE(readError(Out).empty());
  }

  SECTION("not json") {
    auto Out = handleCreate(Students, "{oops");
    REQUIRE(Out.Status == HttpStatus::BadRequest);
  }

  REQUIRE(Students.size() == 0);
}

TEST_CASE("POST /students answers 500 when no student is created",
          "[routes]") {
  Directory Students(
      core::nowNanos, [](const Change &) -> std::expected<void, core::Error> {
        return std::unexpected(
            core::Error{core::ErrorKind::Storage, "storage offline"}
        );
      }
  );

  auto Out = handleCreate(Students, AnnJson);
  REQUIRE(Out.Status == HttpStatus::InternalServerError);
  REQUIRE(readError(Out) == "Could not create student");
}

TEST_CASE("GET /students/:id reads or reports 404", "[routes]") {
  Directory Students;
  handleCreate(Students, AnnJson);

  auto Found = handleGet(Students, "0");
  REQUIRE(Found.Status == HttpStatus::Ok);
  REQUIRE(readStudent(Found).Email == "a@x.com");

  auto Missing = handleGet(Students, "41");
  REQUIRE(Missing.Status == HttpStatus::NotFound);
  REQUIRE(readError(Missing) == "Student with id=41 not found");

  auto Overflow = handleGet(Students, "18446744073709551616");
  REQUIRE(Overflow.Status == HttpStatus::BadRequest);
}

TEST_CASE("PUT /students/:id replaces all fields", "[routes]") {
  Directory Students;
  handleCreate(Students, AnnJson);

  auto Out = handleReplace(
      Students,
      "0",
      R"({"name":"Ann","email":"a@x.com","age":"21","hobby":"chess"})"
  );
  REQUIRE(Out.Status == HttpStatus::Ok);
  auto Student = readStudent(Out);
  REQUIRE(Student.Age == "21");
  REQUIRE(Student.UpdatedAt.has_value());
  REQUIRE(*Student.UpdatedAt >= Student.CreatedAt);

  SECTION("unknown id") {
    REQUIRE(handleReplace(Students, "9", AnnJson).Status ==
            HttpStatus::NotFound);
  }

  SECTION("partial payload") {
    auto Partial = handleReplace(Students, "0", R"({"age":"22"})");
    REQUIRE(Partial.Status == HttpStatus::BadRequest);
    REQUIRE(Students.getStudent(0)->Age == "21");
  }
}

TEST_CASE("DELETE /students/:id returns the removed student once",
          "[routes]") {
  Directory Students;
  handleCreate(Students, AnnJson);

  auto First = handleDelete(Students, "0");
  REQUIRE(First.Status == HttpStatus::Ok);
  REQUIRE(readStudent(First).Name == "Ann");

  auto Second = handleDelete(Students, "0");
  REQUIRE(Second.Status == HttpStatus::NotFound);
  REQUIRE(handleGet(Students, "0").Status == HttpStatus::NotFound);
}

TEST_CASE("registerRoutes needs a directory", "[routes]") {
  glz::http_router Router;

  auto Missing = registerRoutes(Router, nullptr);
  REQUIRE_FALSE(Missing.has_value());
  REQUIRE(Missing.error().Kind == core::ErrorKind::Config);

  REQUIRE(registerRoutes(Router, std::make_shared<Directory>()).has_value());
}
