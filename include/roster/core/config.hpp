#pragma once
#include "roster/core/result.hpp"

#include <algorithm>
#include <charconv>
#include <cstdlib>
#include <expected>
#include <format>
#include <optional>
#include <spdlog/common.h>
#include <string>
#include <string_view>
#include <thread>

namespace roster::core {

struct Config {
  int Port = 3000;
  std::string Host{"127.0.0.1"};
  std::optional<std::string> DatabaseUrl;
  std::string LogLevel{"info"};
  std::optional<std::string> LogDir;
  unsigned Workers = 1;

  static std::expected<Config, Error> load() {
    auto *HostEnv = std::getenv("HOST");
    auto *PortEnv = std::getenv("PORT");
    auto *DatabaseUrlEnv = std::getenv("DATABASE_URL");
    auto *LogLevelEnv = std::getenv("LOG_LEVEL");
    auto *LogDirEnv = std::getenv("LOG_DIR");
    auto *WorkersEnv = std::getenv("WORKERS");

    std::string Host = "127.0.0.1";
    if (HostEnv != nullptr && *HostEnv != '\0') {
      Host = HostEnv;
    }

    int Port = 3000;
    if (PortEnv != nullptr) {
      auto Parsed = parseNumber<int>("PORT", PortEnv);
      if (!Parsed) {
        return std::unexpected(Parsed.error());
      }
      if (*Parsed < 1 || *Parsed > 65535) {
        return std::unexpected(Error{
            ErrorKind::Config, std::format("PORT out of range: {}", *Parsed)
        });
      }
      Port = *Parsed;
    }

    std::optional<std::string> DatabaseUrl;
    if (DatabaseUrlEnv != nullptr && *DatabaseUrlEnv != '\0') {
      DatabaseUrl = DatabaseUrlEnv;
    }

    std::string LogLevel = "info";
    if (LogLevelEnv != nullptr) {
      LogLevel = LogLevelEnv;
      // from_str maps unknown names to off, so only accept "off" verbatim.
      if (LogLevel != "off" &&
          spdlog::level::from_str(LogLevel) == spdlog::level::off) {
        return std::unexpected(Error{
            ErrorKind::Config, std::format("Unknown LOG_LEVEL: {}", LogLevel)
        });
      }
    }

    std::optional<std::string> LogDir;
    if (LogDirEnv != nullptr && *LogDirEnv != '\0') {
      LogDir = LogDirEnv;
    }

    unsigned Workers = std::max(1U, std::thread::hardware_concurrency());
    if (WorkersEnv != nullptr) {
      auto Parsed = parseNumber<unsigned>("WORKERS", WorkersEnv);
      if (!Parsed) {
        return std::unexpected(Parsed.error());
      }
      if (*Parsed == 0) {
        return std::unexpected(
            Error{ErrorKind::Config, "WORKERS must be at least 1"}
        );
      }
      Workers = *Parsed;
    }

    return Config{
        .Port = Port,
        .Host = Host,
        .DatabaseUrl = DatabaseUrl,
        .LogLevel = LogLevel,
        .LogDir = LogDir,
        .Workers = Workers,
    };
  }

private:
  template <typename T>
  static std::expected<T, Error>
  parseNumber(std::string_view Name, std::string_view Text) {
    T Value{};
    auto [End, Ec] =
        std::from_chars(Text.data(), Text.data() + Text.size(), Value);
    if (Ec != std::errc{} || End != Text.data() + Text.size()) {
      return std::unexpected(Error{
          ErrorKind::Config, std::format("Invalid {}: '{}'", Name, Text)
      });
    }
    return Value;
  }
};

} // namespace roster::core
