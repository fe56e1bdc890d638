#pragma once
#include "roster/core/http.hpp"
#include "roster/core/result.hpp"
#include "roster/students/directory.hpp"

#include <expected>
#include <glaze/net/http_router.hpp>
#include <memory>
#include <string>
#include <string_view>

namespace roster::students {

// Status and JSON body produced by a student handler.
struct Reply {
  core::HttpStatus Status;
  std::string Body;
};

Reply handleCreate(Directory &Students, const std::string &Body);
Reply handleGet(const Directory &Students, std::string_view Id);
Reply handleReplace(
    Directory &Students, std::string_view Id, const std::string &Body
);
Reply handleDelete(Directory &Students, std::string_view Id);

// POST /students, GET|PUT|DELETE /students/:id
auto registerRoutes(
    glz::http_router &Router, std::shared_ptr<Directory> Students
) -> std::expected<void, core::Error>;

} // namespace roster::students
