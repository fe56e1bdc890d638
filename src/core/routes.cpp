#include "roster/core/routes.hpp"

#include "roster/core/http.hpp"

#include <spdlog/spdlog.h>

namespace roster::core {

void registerCoreRoutes(
    glz::http_router &Router,
    std::shared_ptr<students::Directory> Students,
    std::shared_ptr<db::Database> Database
) {
  // Healthcheck endpoint
  Router.get(
      "/health",
      [Students, Database](const glz::request &, glz::response &Response) {
        spdlog::debug("GET /health - Running healthcheck");
        auto Count = static_cast<double>(Students->size());

        if (!Database) {
          Response.status(static_cast<int>(HttpStatus::Ok))
              .json(
                  {{"status", "healthy"},
                   {"storage", "memory"},
                   {"students", Count}}
              );
          return;
        }

        // Test database connectivity
        auto Ping = Database->ping();
        if (!Ping) {
          spdlog::error(
              "GET /health - Database connection failed: {}",
              Ping.error().Message
          );
          Response.status(static_cast<int>(HttpStatus::ServiceUnavailable))
              .json(
                  {{"status", "unhealthy"},
                   {"storage", "disconnected"},
                   {"error", Ping.error().Message}}
              );
          return;
        }

        spdlog::debug("GET /health - Database connection healthy");
        Response.status(static_cast<int>(HttpStatus::Ok))
            .json(
                {{"status", "healthy"},
                 {"storage", "postgres"},
                 {"students", Count}}
            );
      }
  );

  // Routes documentation endpoint
  Router.get("/routes", [](const glz::request &, glz::response &Response) {
    spdlog::debug("GET /routes - Listing all endpoints");
    Response.status(static_cast<int>(HttpStatus::Ok))
        .json(
            {{"service", "Roster Student Directory API"},
             {"version", "1.0.0"},
             {"endpoints",
              {{{"path", "/health"},
                {"method", "GET"},
                {"description",
                 "Health check endpoint - reports storage status"}},
               {{"path", "/routes"},
                {"method", "GET"},
                {"description", "Lists all available API endpoints"}},
               {{"path", "/api/students"},
                {"method", "POST"},
                {"description", "Create a new student"}},
               {{"path", "/api/students/:id"},
                {"method", "GET"},
                {"description", "Get a specific student by ID"}},
               {{"path", "/api/students/:id"},
                {"method", "PUT"},
                {"description", "Replace a student's fields by ID"}},
               {{"path", "/api/students/:id"},
                {"method", "DELETE"},
                {"description", "Delete a student by ID, returning it"}}}}}
        );
  });
}

} // namespace roster::core
