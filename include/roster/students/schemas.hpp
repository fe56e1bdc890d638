#pragma once
#include "roster/core/http.hpp"
#include "roster/core/result.hpp"
#include "roster/students/models.hpp"

#include <charconv>
#include <cstdint>
#include <expected>
#include <format>
#include <glaze/glaze.hpp>
#include <string>
#include <string_view>

template <> struct glz::meta<roster::students::models::StudentPayload> {
  using T = roster::students::models::StudentPayload;
  static constexpr auto value = glz::object(
      "name", &T::Name, "email", &T::Email, "age", &T::Age, "hobby", &T::Hobby
  );
};

template <> struct glz::meta<roster::students::models::Student> {
  using T = roster::students::models::Student;
  static constexpr auto value = glz::object(
      "id", &T::Id,
      "name", &T::Name,
      "email", &T::Email,
      "age", &T::Age,
      "hobby", &T::Hobby,
      "created_at", &T::CreatedAt,
      "updated_at", &T::UpdatedAt
  );
};

namespace roster::students {

struct ErrorSchema {
  std::string Error;
};

} // namespace roster::students

template <> struct glz::meta<roster::students::ErrorSchema> {
  using T = roster::students::ErrorSchema;
  static constexpr auto value = glz::object("error", &T::Error);
};

namespace roster::students {

// All four fields are required; unknown keys are rejected.
inline std::expected<models::StudentPayload, core::Error>
parsePayload(const std::string &Body) {
  models::StudentPayload Payload;
  if (auto JsonError = glz::read<core::JsonOpts>(Payload, Body)) {
    return std::unexpected(core::Error{
        core::ErrorKind::InvalidInput,
        std::format("Invalid JSON: {}", glz::format_error(JsonError, Body))
    });
  }
  return Payload;
}

inline std::expected<std::uint64_t, core::Error> parseId(std::string_view Text) {
  std::uint64_t Id = 0;
  auto [End, Ec] = std::from_chars(Text.data(), Text.data() + Text.size(), Id);
  if (Text.empty() || Ec != std::errc{} || End != Text.data() + Text.size()) {
    return std::unexpected(core::Error{
        core::ErrorKind::InvalidInput, std::format("Invalid student id: '{}'", Text)
    });
  }
  return Id;
}

} // namespace roster::students
