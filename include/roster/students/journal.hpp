#pragma once
#include "roster/core/result.hpp"
#include "roster/students/models.hpp"

#include <cstdint>
#include <expected>
#include <functional>

namespace roster::students {

enum class ChangeKind : uint8_t { Insert, Update, Remove };

// One directory mutation. Record is the post-state for Insert and Update and
// the last state for Remove; NextId is the counter value after the change.
struct Change {
  ChangeKind Kind;
  models::Student Record;
  std::uint64_t NextId{0};
};

// Called with the directory's exclusive lock held, before the change becomes
// visible. An error aborts the mutation.
using Journal = std::function<std::expected<void, core::Error>(const Change &)>;

} // namespace roster::students
