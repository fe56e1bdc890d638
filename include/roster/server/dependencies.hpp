#pragma once

#include "glaze/net/http_router.hpp"
#include <regex>
#include <string>
#include <string_view>

namespace roster::server::dependencies {
inline glz::param_constraint idConstraint() {
  glz::param_constraint Id{
      .description = "Must be an unsigned decimal id",
      .validation = [](std::string_view Value) {
        static const std::regex IdRegex(R"([0-9]{1,20})");
        return std::regex_match(std::string(Value), IdRegex);
      }};
  return Id;
}
} // namespace roster::server::dependencies
