#pragma once
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

namespace roster::core {

enum class ErrorKind : uint8_t {
  NotFound,
  InvalidInput,
  Storage,
  Config,
};

struct Error {
  ErrorKind Kind{ErrorKind::Storage};
  std::string Message;
};

inline std::string_view toString(ErrorKind Kind) {
  switch (Kind) {
  case ErrorKind::NotFound:
    return "NotFound";
  case ErrorKind::InvalidInput:
    return "InvalidInput";
  case ErrorKind::Storage:
    return "Storage";
  case ErrorKind::Config:
    return "Config";
  }
  return "Unknown";
}

// Use std::expected<T, core::Error> directly

} // namespace roster::core
