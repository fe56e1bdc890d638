#pragma once
#include "roster/core/result.hpp"
#include "roster/core/traits.hpp"

#include <cstddef>
#include <cstdint>
#include <exception>
#include <expected>
#include <format>
#include <memory>
#include <mutex>
#include <pqxx/pqxx>
#include <pqxx/zview>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <string>
#include <string_view>
#include <tuple>
#include <utility>
#include <vector>

namespace roster::db {

// Unsigned 64-bit values do not fit BIGINT, hence NUMERIC(20,0).
inline constexpr std::string_view Schema = R"sql(
CREATE TABLE IF NOT EXISTS students (
  id NUMERIC(20,0) PRIMARY KEY,
  name TEXT NOT NULL,
  email TEXT NOT NULL,
  age TEXT NOT NULL,
  hobby TEXT NOT NULL,
  created_at NUMERIC(20,0) NOT NULL,
  updated_at NUMERIC(20,0)
);
CREATE TABLE IF NOT EXISTS counters (
  name TEXT PRIMARY KEY,
  value NUMERIC(20,0) NOT NULL
);
)sql";

struct Database {
  pqxx::connection Cx;
  // pqxx connections must not be used from two threads at once.
  std::mutex Mutex;

  explicit Database(const std::string &ConnString) : Cx(ConnString) {}

  static std::expected<std::shared_ptr<Database>, core::Error>
  connect(const std::string &ConnString) {
    try {
      spdlog::debug("Database::connect - Establishing connection");
      auto Db = std::make_shared<Database>(ConnString);
      spdlog::info("Database::connect - Successfully connected to database");
      return Db;
    } catch (const std::exception &Err) {
      spdlog::error("Database::connect - Connection failed: {}", Err.what());
      return std::unexpected(core::Error{core::ErrorKind::Storage, Err.what()});
    }
  }

  // Run Body(Tx) in a single transaction. Exceptions roll back and come out
  // as a Storage error.
  template <typename Fn>
  std::expected<void, core::Error> transact(std::string_view Label, Fn &&Body) {
    std::lock_guard Lock(Mutex);
    try {
      spdlog::trace("Database::transact({}) - Starting transaction", Label);
      pqxx::work Tx(Cx);
      std::forward<Fn>(Body)(Tx);
      Tx.commit();
      spdlog::trace("Database::transact({}) - Committed", Label);
      return {};
    } catch (const std::exception &Err) {
      spdlog::error("Database::transact({}) - Failed: {}", Label, Err.what());
      return std::unexpected(core::Error{core::ErrorKind::Storage, Err.what()});
    }
  }

  std::expected<void, core::Error> migrate() {
    return transact("migrate", [](pqxx::work &Tx) {
      Tx.exec(pqxx::zview{Schema.data(), Schema.size()});
    });
  }

  std::expected<void, core::Error> ping() {
    return transact("ping", [](pqxx::work &Tx) { Tx.exec("SELECT 1"); });
  }

  template <core::DbEntity T>
  static void insert(pqxx::work &Tx, const T &Entity) {
    auto Params = core::DbTraits<T>::toParams(Entity);

    auto PlaceHolders = []<std::size_t... Is>(std::index_sequence<Is...>) {
      return (
          std::string{} + ... +
          (Is == 0 ? "$1" : ", $" + std::to_string(Is + 1))
      );
    }(std::make_index_sequence<std::tuple_size_v<decltype(Params)>>{});

    auto Query = std::format(
        "INSERT INTO {} ({}) VALUES ({})",
        core::DbTraits<T>::TableName,
        core::DbTraits<T>::Columns,
        PlaceHolders
    );

    spdlog::trace(
        "Database::insert<{}> - Query: {}", core::DbTraits<T>::TableName, Query
    );

    std::apply(
        [&](auto &&...Args) {
          Tx.exec(pqxx::zview{Query}, pqxx::params{Args...});
        },
        Params
    );
  }

  template <core::DbEntity T>
  static void update(pqxx::work &Tx, const T &Entity) {
    auto Params = core::DbTraits<T>::toParams(Entity);

    auto Query = std::format(
        "UPDATE {} SET {} WHERE id = $1",
        core::DbTraits<T>::TableName,
        core::DbTraits<T>::UpdateSet
    );

    pqxx::result Res;
    std::apply(
        [&](auto &&...Args) {
          Res = Tx.exec(pqxx::zview{Query}, pqxx::params{Args...});
        },
        Params
    );

    if (Res.affected_rows() == 0) {
      throw std::runtime_error(std::format(
          "{}: no row with id {}", core::DbTraits<T>::TableName, Entity.Id
      ));
    }
  }

  // Returns the number of rows deleted. A missing row is not an error: the
  // caller wanted it gone and it is.
  template <core::DbEntity T>
  static std::size_t remove(pqxx::work &Tx, std::uint64_t Id) {
    auto Query = std::format(
        "DELETE FROM {} WHERE id = $1", core::DbTraits<T>::TableName
    );

    auto Res = Tx.exec(pqxx::zview{Query}, pqxx::params{Id});
    return static_cast<std::size_t>(Res.affected_rows());
  }

  template <core::DbEntity T>
  std::expected<std::vector<T>, core::Error> getAll() {
    std::vector<T> Results;
    auto Loaded = transact(core::DbTraits<T>::TableName, [&](pqxx::work &Tx) {
      auto Query = std::format(
          "SELECT * FROM {} ORDER BY id", core::DbTraits<T>::TableName
      );
      auto Res = Tx.exec(pqxx::zview{Query});
      Results.reserve(Res.size());
      for (const auto &Row : Res) {
        Results.push_back(core::DbTraits<T>::fromRow(Row));
      }
    });
    if (!Loaded) {
      return std::unexpected(Loaded.error());
    }

    spdlog::trace(
        "Database::getAll<{}> - Retrieved {} entities",
        core::DbTraits<T>::TableName,
        Results.size()
    );
    return Results;
  }

  static void
  storeCounter(pqxx::work &Tx, std::string_view Name, std::uint64_t Value) {
    Tx.exec(
        "INSERT INTO counters (name, value) VALUES ($1, $2) "
        "ON CONFLICT (name) DO UPDATE SET value = EXCLUDED.value",
        pqxx::params{Name, Value}
    );
  }

  // A counter that was never stored reads as 0.
  std::expected<std::uint64_t, core::Error> loadCounter(std::string_view Name) {
    std::uint64_t Value = 0;
    auto Loaded = transact("counters", [&](pqxx::work &Tx) {
      auto Res = Tx.exec(
          "SELECT value FROM counters WHERE name = $1", pqxx::params{Name}
      );
      if (!Res.empty()) {
        Value = Res[0]["value"].as<std::uint64_t>();
      }
    });
    if (!Loaded) {
      return std::unexpected(Loaded.error());
    }
    return Value;
  }
};
} // namespace roster::db
