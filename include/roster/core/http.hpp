#pragma once

#include "glaze/core/opts.hpp"
#include "roster/core/result.hpp"

#include <cstdint>

namespace roster::core {

inline constexpr auto JsonOpts = glz::opts{.error_on_missing_keys = true};

enum class HttpStatus : uint16_t {
  // 2xx Success
  Ok = 200,
  Created = 201,

  // 4xx Client Errors
  BadRequest = 400,
  NotFound = 404,

  // 5xx Server Errors
  InternalServerError = 500,
  ServiceUnavailable = 503,
};

inline HttpStatus toStatus(ErrorKind Kind) {
  switch (Kind) {
  case ErrorKind::NotFound:
    return HttpStatus::NotFound;
  case ErrorKind::InvalidInput:
    return HttpStatus::BadRequest;
  case ErrorKind::Storage:
  case ErrorKind::Config:
    return HttpStatus::InternalServerError;
  }
  return HttpStatus::InternalServerError;
}

} // namespace roster::core
