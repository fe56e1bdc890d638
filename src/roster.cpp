#include <asio/io_context.hpp>
#include <asio/signal_set.hpp>
#include <csignal>
#include <glaze/net/http_router.hpp>
#include <glaze/net/http_server.hpp>
#include <memory>
#include <ranges>
#include <system_error>
#include <thread>
#include <vector>

#include "roster/core/config.hpp"
#include "roster/core/logging.hpp"
#include "roster/core/routes.hpp"
#include "roster/db/db.hpp"
#include "roster/server/middleware/logging.hpp"
#include "roster/students/directory.hpp"
#include "roster/students/routes.hpp"
#include "roster/students/storage.hpp"
#include "spdlog/spdlog.h"

int main() {
  auto Config = roster::core::Config::load();
  if (!Config) {
    spdlog::error(Config.error().Message);
    return 1;
  }

  if (auto Logging = roster::core::setupLogging(*Config); !Logging) {
    spdlog::error(Logging.error().Message);
    return 1;
  }

  spdlog::debug(
      "Loaded config - Host: {}, Port: {}, Workers: {}",
      Config->Host,
      Config->Port,
      Config->Workers
  );

  // Storage: PostgreSQL when DATABASE_URL is set, memory otherwise.
  std::shared_ptr<roster::db::Database> Database;
  std::shared_ptr<roster::students::Directory> Students;

  if (Config->DatabaseUrl) {
    spdlog::info("Connecting to database.");
    auto Connected = roster::db::Database::connect(*Config->DatabaseUrl);
    if (!Connected) {
      spdlog::error(Connected.error().Message);
      return 1;
    }
    Database = *Connected;

    if (auto Migrated = Database->migrate(); !Migrated) {
      spdlog::error("Schema setup failed: {}", Migrated.error().Message);
      return 1;
    }

    Students = std::make_shared<roster::students::Directory>(
        roster::core::nowNanos, roster::students::makeJournal(Database)
    );
    if (auto Restored = roster::students::restoreDirectory(*Database, *Students);
        !Restored) {
      spdlog::error("Loading students failed: {}", Restored.error().Message);
      return 1;
    }
  } else {
    spdlog::warn("DATABASE_URL not set, students are kept in memory only.");
    Students = std::make_shared<roster::students::Directory>();
  }

  // Initialize Roster HTTP Server
  auto IOContext = std::make_shared<asio::io_context>();
  auto Server{glz::http_server<false>(IOContext)};

  spdlog::info("Roster Student Directory");
  Server.bind(Config->Host, Config->Port);
  spdlog::info("Binding to Address: {}, Port: {}.", Config->Host, Config->Port);

  // Register Middleware
  Server.wrap(roster::server::middleware::createLoggingMiddleware());

  // Register Routes
  glz::http_router Router;
  spdlog::info("Registering routes:");
  roster::core::registerCoreRoutes(Router, Students, Database);

  spdlog::info("StudentRoutes");
  glz::http_router StudentRouter;
  if (auto Registered = roster::students::registerRoutes(StudentRouter, Students);
      !Registered) {
    spdlog::error(
        "Failed registering student routes: {}", Registered.error().Message
    );
    return 1;
  }

  // Mount the routers
  Server.mount("/", Router);
  Server.mount("/api", StudentRouter);

  // Start The Server (0 Worker Threads so we can run with ASIO shared IO
  // Context)
  Server.start(0);

  asio::signal_set Signals(*IOContext, SIGINT, SIGTERM);
  Signals.async_wait([&](const std::error_code &, int) {
    spdlog::info("Shutdown signal received.");
    Server.stop();
    IOContext->stop();
  });

  // Start the Thread pool.
  std::vector<std::thread> Threads;
  Threads.reserve(Config->Workers);

  spdlog::info(
      "Server ready and listening on http://{}:{}", Config->Host, Config->Port
  );
  spdlog::info("Sharing {} threads.", Config->Workers);

  for (auto _ : std::views::iota(0U, Config->Workers)) {
    Threads.emplace_back([IOContext]() { IOContext->run(); });
  }

  for (auto &Thread : Threads) {
    if (Thread.joinable()) {
      Thread.join();
    }
  }

  spdlog::info("Roster stopped.");
  return 0;
}
