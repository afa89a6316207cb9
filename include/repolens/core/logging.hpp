#pragma once
#include "repolens/core/config.hpp"

#include "spdlog/sinks/rotating_file_sink.h"
#include "spdlog/sinks/stdout_color_sinks.h"
#include "spdlog/spdlog.h"

#include <array>
#include <chrono>
#include <filesystem>
#include <memory>
#include <spdlog/common.h>
#include <string>
#include <string_view>
#include <vector>

namespace repolens::core {

inline constexpr std::array<std::string_view, 5> ComponentLoggers{
    "cache", "quality", "github", "pipeline", "db"};

// Shared console sink: all loggers write to the same stdout stream
inline std::shared_ptr<spdlog::sinks::stdout_color_sink_mt> consoleSink() {
  static auto Sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  return Sink;
}

// Build a logger with console output and an optional rotating file.
// The file is placed at {LogDir}/{name}.log when LogDir is set.
// The logger is registered in spdlog's global registry so any translation
// unit can retrieve it with logger(name).
inline void createLogger(std::string_view Name, const Config &Cfg) {
  std::vector<spdlog::sink_ptr> Sinks{consoleSink()};

  if (Cfg.LogDir) {
    std::filesystem::path Dir{*Cfg.LogDir};
    std::filesystem::create_directories(Dir);
    Sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        (Dir / (std::string(Name) + ".log")).string(), 1024 * 1024 * 10, 3));
  }

  auto Logger = std::make_shared<spdlog::logger>(std::string(Name),
                                                 Sinks.begin(), Sinks.end());
  Logger->set_level(spdlog::level::from_str(Cfg.LogLevel));
  spdlog::drop(std::string(Name));
  spdlog::register_logger(Logger);
}

// Component loggers are only registered by setupLogging(). Library code and
// tests that run without it fall back to the default logger.
inline std::shared_ptr<spdlog::logger> logger(std::string_view Name) {
  if (auto Logger = spdlog::get(std::string(Name))) {
    return Logger;
  }
  return spdlog::default_logger();
}

inline void setupLogging(const Config &Cfg) {
  // The application logger becomes the default; bare spdlog::info() uses it
  createLogger("repolens", Cfg);
  spdlog::set_default_logger(spdlog::get("repolens"));

  for (auto Name : ComponentLoggers) {
    createLogger(Name, Cfg);
  }

  // Flush errors immediately; flush info-level logs every second
  spdlog::flush_on(spdlog::level::warn);
  spdlog::flush_every(std::chrono::seconds(1));
}

} // namespace repolens::core
