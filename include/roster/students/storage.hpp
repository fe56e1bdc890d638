#pragma once
#include "roster/core/result.hpp"
#include "roster/core/traits.hpp"
#include "roster/db/db.hpp"
#include "roster/students/directory.hpp"
#include "roster/students/journal.hpp"
#include "roster/students/models.hpp"

#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <pqxx/pqxx>
#include <string>
#include <string_view>
#include <tuple>

namespace roster::core {
template <> struct DbTraits<students::models::Student> {
  static constexpr std::string_view TableName = "students";
  static constexpr std::string_view Columns =
      "id, name, email, age, hobby, created_at, updated_at";

  static constexpr std::string_view UpdateSet =
      "name=$2, email=$3, age=$4, hobby=$5, created_at=$6, updated_at=$7";

  static auto toParams(const students::models::Student &Student) {
    return std::make_tuple(
        Student.Id,
        Student.Name,
        Student.Email,
        Student.Age,
        Student.Hobby,
        Student.CreatedAt,
        Student.UpdatedAt
    );
  }

  static students::models::Student fromRow(const pqxx::row &Row) {
    return {
        .Id = Row["id"].as<std::uint64_t>(),
        .Name = Row["name"].as<std::string>(),
        .Email = Row["email"].as<std::string>(),
        .Age = Row["age"].as<std::string>(),
        .Hobby = Row["hobby"].as<std::string>(),
        .CreatedAt = Row["created_at"].as<std::uint64_t>(),
        .UpdatedAt = Row["updated_at"].is_null()
                         ? std::nullopt
                         : std::optional{Row["updated_at"].as<std::uint64_t>()},
    };
  }
};
} // namespace roster::core

namespace roster::students {

inline constexpr std::string_view CounterName = "students";

// Mirror directory changes into PostgreSQL, one transaction per change.
Journal makeJournal(std::shared_ptr<db::Database> Database);

// Load every stored student and the id counter into Target.
std::expected<void, core::Error>
restoreDirectory(db::Database &Database, Directory &Target);

} // namespace roster::students
