#pragma once
#include "glaze/net/http.hpp"
#include "glaze/net/http_server.hpp"

#include "spdlog/spdlog.h"

#include <chrono>

namespace roster::server::middleware {

// Logs "[METHOD] path status Nms" once the handler has run. Server errors go
// out at warn so they are flushed straight away.
inline auto createLoggingMiddleware() {
  return [](const glz::request &Request,
            glz::response &Response,
            const auto &Next) {
    auto Start = std::chrono::steady_clock::now();
    Next();
    auto Elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - Start
    );

    auto Level = Response.status_code >= 500 ? spdlog::level::warn
                                             : spdlog::level::info;
    spdlog::log(
        Level,
        "[{}] {} {} {}ms",
        glz::to_string(Request.method),
        Request.path,
        Response.status_code,
        Elapsed.count()
    );
  };
}

} // namespace roster::server::middleware
