#pragma once
#include "roster/db/db.hpp"
#include "roster/students/directory.hpp"

#include <glaze/net/http_router.hpp>
#include <memory>

namespace roster::core {

// Database is null when the service runs without durable storage.
void registerCoreRoutes(
    glz::http_router &Router,
    std::shared_ptr<students::Directory> Students,
    std::shared_ptr<db::Database> Database
);

} // namespace roster::core
