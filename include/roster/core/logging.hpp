#pragma once
#include "roster/core/config.hpp"
#include "roster/core/result.hpp"

#include "spdlog/sinks/rotating_file_sink.h"
#include "spdlog/sinks/stdout_color_sinks.h"
#include "spdlog/spdlog.h"

#include <chrono>
#include <exception>
#include <expected>
#include <filesystem>
#include <format>
#include <memory>
#include <spdlog/common.h>
#include <string>
#include <string_view>
#include <vector>

namespace roster::core {

// Shared console sink — all loggers write to the same stdout stream
inline std::shared_ptr<spdlog::sinks::stdout_color_sink_mt>
consoleSink() {
  static auto Sink =
      std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  return Sink;
}

// Build a logger with console output and an optional rotating file.
// The file is placed at {LogDir}/{name}.log when LogDir is set.
// The logger is registered in spdlog's global registry so any translation
// unit can retrieve it with spdlog::get(name).
inline std::expected<void, Error>
createLogger(std::string_view Name, const Config &Cfg) {
  std::vector<spdlog::sink_ptr> Sinks{consoleSink()};

  if (Cfg.LogDir) {
    try {
      std::filesystem::path Dir{*Cfg.LogDir};
      std::filesystem::create_directories(Dir);
      Sinks.push_back(
          std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
              (Dir / (std::string(Name) + ".log")).string(),
              1024 * 1024 * 10,
              3
          )
      );
    } catch (const std::exception &Err) {
      return std::unexpected(Error{
          ErrorKind::Config,
          std::format("Cannot open log directory {}: {}", *Cfg.LogDir,
                      Err.what())
      });
    }
  }

  auto Logger = std::make_shared<spdlog::logger>(
      std::string(Name), Sinks.begin(), Sinks.end()
  );
  Logger->set_level(spdlog::level::from_str(Cfg.LogLevel));
  spdlog::register_logger(Logger);
  return {};
}

inline std::expected<void, Error> setupLogging(const Config &Cfg) {
  // Server logger becomes the default — all bare spdlog::info() calls use it
  if (auto Created = createLogger("server", Cfg); !Created) {
    return Created;
  }
  spdlog::set_default_logger(spdlog::get("server"));

  // Flush errors immediately; flush info-level logs every second
  spdlog::flush_on(spdlog::level::warn);
  spdlog::flush_every(std::chrono::seconds(1));
  return {};
}

} // namespace roster::core
