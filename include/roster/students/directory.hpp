#pragma once
#include "roster/core/result.hpp"
#include "roster/core/timestamp.hpp"
#include "roster/students/journal.hpp"
#include "roster/students/models.hpp"

#include <cstddef>
#include <cstdint>
#include <expected>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <vector>

namespace roster::students {

// Owns every Student record, keyed by id.
//
// Writers hold WriteMutex from lookup to publish, so mutations reach the
// Journal in the order they become visible. Mutex is taken exclusively only
// for the in-memory swap; readers (getStudent, size, nextId) share it and are
// not held up while a journal write is in flight. Ids come from a counter that
// only moves forward and are never handed out twice, deletions included.
//
// When a Journal is set, every mutation is passed to it before being applied
// in memory. A rejected change leaves the directory untouched.
class Directory {
public:
  using Clock = std::function<std::uint64_t()>;

  explicit Directory(Clock Now = core::nowNanos, Journal Sink = {});

  std::optional<models::Student>
  addStudent(const models::StudentPayload &Payload);

  std::expected<models::Student, core::Error>
  getStudent(std::uint64_t Id) const;

  std::expected<models::Student, core::Error>
  updateStudent(std::uint64_t Id, const models::StudentPayload &Payload);

  std::expected<models::Student, core::Error> deleteStudent(std::uint64_t Id);

  // Replace the content with records loaded from storage. The counter is
  // raised past every restored id if NextId lags behind.
  void restore(std::vector<models::Student> Records, std::uint64_t NextId);

  std::size_t size() const;
  std::uint64_t nextId() const;

private:
  static core::Error notFound(std::uint64_t Id);

  std::mutex WriteMutex;
  mutable std::shared_mutex Mutex;
  std::map<std::uint64_t, models::Student> Students;
  std::uint64_t Counter{0};
  Clock Now;
  Journal Sink;
};

} // namespace roster::students
