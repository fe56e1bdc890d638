#include "roster/students/storage.hpp"

#include <spdlog/spdlog.h>
#include <utility>

namespace roster::students {

Journal makeJournal(std::shared_ptr<db::Database> Database) {
  return [Database](const Change &Entry) -> std::expected<void, core::Error> {
    switch (Entry.Kind) {
    case ChangeKind::Insert:
      return Database->transact("students.insert", [&](pqxx::work &Tx) {
        db::Database::insert(Tx, Entry.Record);
        db::Database::storeCounter(Tx, CounterName, Entry.NextId);
      });
    case ChangeKind::Update:
      return Database->transact("students.update", [&](pqxx::work &Tx) {
        db::Database::update(Tx, Entry.Record);
      });
    case ChangeKind::Remove:
      return Database->transact("students.remove", [&](pqxx::work &Tx) {
        if (db::Database::remove<models::Student>(Tx, Entry.Record.Id) == 0) {
          spdlog::warn(
              "makeJournal - Student {} was already absent from storage",
              Entry.Record.Id
          );
        }
      });
    }
    return std::unexpected(
        core::Error{core::ErrorKind::Storage, "Unknown change kind"}
    );
  };
}

std::expected<void, core::Error>
restoreDirectory(db::Database &Database, Directory &Target) {
  spdlog::debug("restoreDirectory - Loading students");
  auto Records = Database.getAll<models::Student>();
  if (!Records) {
    return std::unexpected(Records.error());
  }

  auto NextId = Database.loadCounter(CounterName);
  if (!NextId) {
    return std::unexpected(NextId.error());
  }

  Target.restore(std::move(*Records), *NextId);
  return {};
}

} // namespace roster::students
