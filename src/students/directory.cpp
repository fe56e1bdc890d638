#include "roster/students/directory.hpp"

#include <algorithm>
#include <format>
#include <limits>
#include <mutex>
#include <spdlog/spdlog.h>
#include <utility>

namespace roster::students {

namespace {
constexpr auto LastId = std::numeric_limits<std::uint64_t>::max();
} // namespace

Directory::Directory(Clock Now, Journal Sink)
    : Now(std::move(Now)), Sink(std::move(Sink)) {}

core::Error Directory::notFound(std::uint64_t Id) {
  return core::Error{
      core::ErrorKind::NotFound, std::format("Student with id={} not found", Id)
  };
}

std::optional<models::Student>
Directory::addStudent(const models::StudentPayload &Payload) {
  std::lock_guard Writer(WriteMutex);

  // LastId stays reserved so the counter never wraps.
  if (Counter == LastId) {
    spdlog::error("Directory::addStudent - Id space exhausted");
    return std::nullopt;
  }

  models::Student Student{
      .Id = Counter,
      .Name = Payload.Name,
      .Email = Payload.Email,
      .Age = Payload.Age,
      .Hobby = Payload.Hobby,
      .CreatedAt = Now(),
      .UpdatedAt = std::nullopt,
  };

  if (Sink) {
    auto Written = Sink(Change{
        .Kind = ChangeKind::Insert, .Record = Student, .NextId = Counter + 1
    });
    if (!Written) {
      spdlog::error(
          "Directory::addStudent - Journal rejected id {}: {}",
          Student.Id,
          Written.error().Message
      );
      return std::nullopt;
    }
  }

  {
    std::unique_lock Lock(Mutex);
    ++Counter;
    Students.emplace(Student.Id, Student);
  }
  spdlog::debug("Directory::addStudent - Created student {}", Student.Id);
  return Student;
}

std::expected<models::Student, core::Error>
Directory::getStudent(std::uint64_t Id) const {
  std::shared_lock Lock(Mutex);
  auto It = Students.find(Id);
  if (It == Students.end()) {
    spdlog::trace("Directory::getStudent - No student {}", Id);
    return std::unexpected(notFound(Id));
  }
  return It->second;
}

std::expected<models::Student, core::Error> Directory::updateStudent(
    std::uint64_t Id, const models::StudentPayload &Payload
) {
  // Only writers mutate the map, so lookups under WriteMutex need no Mutex.
  std::lock_guard Writer(WriteMutex);
  auto It = Students.find(Id);
  if (It == Students.end()) {
    spdlog::debug("Directory::updateStudent - No student {}", Id);
    return std::unexpected(notFound(Id));
  }

  auto Updated = It->second;
  Updated.Name = Payload.Name;
  Updated.Email = Payload.Email;
  Updated.Age = Payload.Age;
  Updated.Hobby = Payload.Hobby;
  // The wall clock may step backwards; updated_at must not precede creation.
  Updated.UpdatedAt = std::max(Now(), Updated.CreatedAt);

  if (Sink) {
    auto Written = Sink(Change{
        .Kind = ChangeKind::Update, .Record = Updated, .NextId = Counter
    });
    if (!Written) {
      spdlog::error(
          "Directory::updateStudent - Journal rejected id {}: {}",
          Id,
          Written.error().Message
      );
      return std::unexpected(Written.error());
    }
  }

  {
    std::unique_lock Lock(Mutex);
    It->second = Updated;
  }
  spdlog::debug("Directory::updateStudent - Updated student {}", Id);
  return Updated;
}

std::expected<models::Student, core::Error>
Directory::deleteStudent(std::uint64_t Id) {
  std::lock_guard Writer(WriteMutex);
  auto It = Students.find(Id);
  if (It == Students.end()) {
    spdlog::debug("Directory::deleteStudent - No student {}", Id);
    return std::unexpected(notFound(Id));
  }

  if (Sink) {
    auto Written = Sink(Change{
        .Kind = ChangeKind::Remove, .Record = It->second, .NextId = Counter
    });
    if (!Written) {
      spdlog::error(
          "Directory::deleteStudent - Journal rejected id {}: {}",
          Id,
          Written.error().Message
      );
      return std::unexpected(Written.error());
    }
  }

  auto Removed = It->second;
  {
    std::unique_lock Lock(Mutex);
    Students.erase(It);
  }
  spdlog::debug("Directory::deleteStudent - Deleted student {}", Id);
  return Removed;
}

void Directory::restore(
    std::vector<models::Student> Records, std::uint64_t NextId
) {
  std::lock_guard Writer(WriteMutex);
  std::unique_lock Lock(Mutex);
  Students.clear();
  for (auto &Record : Records) {
    auto Id = Record.Id;
    if (Id == LastId) {
      NextId = LastId;
    } else {
      NextId = std::max(NextId, Id + 1);
    }
    Students.insert_or_assign(Id, std::move(Record));
  }
  Counter = NextId;
  spdlog::info(
      "Directory::restore - Loaded {} students, next id {}",
      Students.size(),
      Counter
  );
}

std::size_t Directory::size() const {
  std::shared_lock Lock(Mutex);
  return Students.size();
}

std::uint64_t Directory::nextId() const {
  std::shared_lock Lock(Mutex);
  return Counter;
}

} // namespace roster::students
