#include "roster/students/routes.hpp"

#include "glaze/net/http_router.hpp"
#include "roster/core/http.hpp"
#include "roster/core/result.hpp"
#include "roster/server/dependencies.hpp"
#include "roster/students/models.hpp"
#include "roster/students/schemas.hpp"

#include <glaze/glaze.hpp>
#include <memory>
#include <spdlog/spdlog.h>
#include <string>
#include <utility>

namespace roster::students {

namespace {
using enum core::HttpStatus;

template <typename T> Reply reply(core::HttpStatus Status, const T &Value) {
  std::string Body;
  if (auto WriteError = glz::write_json(Value, Body)) {
    spdlog::error("Failed to encode {} response", static_cast<int>(Status));
    return {InternalServerError, R"({"error":"Failed to encode response"})"};
  }
  return {Status, std::move(Body)};
}

Reply replyError(const core::Error &Err) {
  return reply(core::toStatus(Err.Kind), ErrorSchema{.Error = Err.Message});
}

void send(glz::response &Response, const Reply &Out) {
  Response.status(static_cast<int>(Out.Status))
      .header("Content-Type", "application/json")
      .body(Out.Body);
}
} // namespace

Reply handleCreate(Directory &Students, const std::string &Body) {
  auto Payload = parsePayload(Body);
  if (!Payload) {
    spdlog::warn("POST /students - {}", Payload.error().Message);
    return replyError(Payload.error());
  }

  spdlog::debug("POST /students - Creating student '{}'", Payload->Name);
  auto NewStudent = Students.addStudent(*Payload);
  if (!NewStudent) {
    spdlog::error("POST /students - Could not create student");
    return reply(InternalServerError, ErrorSchema{"Could not create student"});
  }

  spdlog::info(
      "POST /students - Created student '{}' with ID: {}",
      NewStudent->Name,
      NewStudent->Id
  );
  return reply(Created, *NewStudent);
}

// Query: never mutates the directory.
Reply handleGet(const Directory &Students, std::string_view Id) {
  auto Parsed = parseId(Id);
  if (!Parsed) {
    return replyError(Parsed.error());
  }

  spdlog::debug("GET /students/{} - Fetching student", *Parsed);
  auto Found = Students.getStudent(*Parsed);
  if (!Found) {
    spdlog::debug("GET /students/{} - {}", *Parsed, Found.error().Message);
    return replyError(Found.error());
  }
  return reply(Ok, *Found);
}

Reply handleReplace(
    Directory &Students, std::string_view Id, const std::string &Body
) {
  auto Parsed = parseId(Id);
  if (!Parsed) {
    return replyError(Parsed.error());
  }

  auto Payload = parsePayload(Body);
  if (!Payload) {
    spdlog::warn("PUT /students/{} - {}", *Parsed, Payload.error().Message);
    return replyError(Payload.error());
  }

  spdlog::debug("PUT /students/{} - Updating student", *Parsed);
  auto Updated = Students.updateStudent(*Parsed, *Payload);
  if (!Updated) {
    spdlog::debug("PUT /students/{} - {}", *Parsed, Updated.error().Message);
    return replyError(Updated.error());
  }

  spdlog::info(
      "PUT /students/{} - Updated student '{}'", *Parsed, Updated->Name
  );
  return reply(Ok, *Updated);
}

// Responds with the removed student's last state.
Reply handleDelete(Directory &Students, std::string_view Id) {
  auto Parsed = parseId(Id);
  if (!Parsed) {
    return replyError(Parsed.error());
  }

  spdlog::debug("DELETE /students/{} - Deleting student", *Parsed);
  auto Removed = Students.deleteStudent(*Parsed);
  if (!Removed) {
    spdlog::debug("DELETE /students/{} - {}", *Parsed, Removed.error().Message);
    return replyError(Removed.error());
  }

  spdlog::info(
      "DELETE /students/{} - Deleted student '{}'", *Parsed, Removed->Name
  );
  return reply(Ok, *Removed);
}

auto registerRoutes(
    glz::http_router &Router, std::shared_ptr<Directory> Students
) -> std::expected<void, core::Error> {
  if (!Students) {
    return std::unexpected(
        core::Error{core::ErrorKind::Config, "Student directory is not set"}
    );
  }

  spdlog::debug("Registering students routes");

  Router.post(
      "/students",
      [Students](const glz::request &Request, glz::response &Response) {
        send(Response, handleCreate(*Students, Request.body));
      }
  );

  Router.get(
      "/students/:id",
      [Students](const glz::request &Request, glz::response &Response) {
        send(Response, handleGet(*Students, Request.params.at("id")));
      },
      {.constraints = {{"id", server::dependencies::idConstraint()}}}
  );

  Router.put(
      "/students/:id",
      [Students](const glz::request &Request, glz::response &Response) {
        send(
            Response,
            handleReplace(*Students, Request.params.at("id"), Request.body)
        );
      },
      {.constraints = {{"id", server::dependencies::idConstraint()}}}
  );

  Router.del(
      "/students/:id",
      [Students](const glz::request &Request, glz::response &Response) {
        send(Response, handleDelete(*Students, Request.params.at("id")));
      },
      {.constraints = {{"id", server::dependencies::idConstraint()}}}
  );

  return {};
}

} // namespace roster::students
