#pragma once
#include <cstdint>
#include <optional>
#include <string>

namespace roster::students::models {

// Caller-editable fields, used for both creation and full replacement.
struct StudentPayload {
  std::string Name;
  std::string Email;
  std::string Age;
  std::string Hobby;
};

struct Student {
  std::uint64_t Id{0};
  std::string Name;
  std::string Email;
  std::string Age;
  std::string Hobby;
  std::uint64_t CreatedAt{0};
  std::optional<std::uint64_t> UpdatedAt;
};

} // namespace roster::students::models
