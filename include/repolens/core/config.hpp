#pragma once
#include "repolens/core/result.hpp"

#include <charconv>
#include <cstdlib>
#include <expected>
#include <format>
#include <optional>
#include <string>
#include <string_view>

namespace repolens::core {

namespace detail {

inline std::optional<std::string> env(const char *Name) {
  auto *Value = std::getenv(Name);
  if (Value == nullptr || *Value == '\0') {
    return std::nullopt;
  }
  return std::string{Value};
}

inline std::expected<int, Error> envInt(const char *Name, int Default) {
  auto Value = env(Name);
  if (!Value) {
    return Default;
  }
  int Parsed = 0;
  auto [Ptr, Ec] =
      std::from_chars(Value->data(), Value->data() + Value->size(), Parsed);
  if (Ec != std::errc{} || Ptr != Value->data() + Value->size() ||
      Parsed < 0) {
    return std::unexpected(Error{
        .Message = std::format("{} must be a non-negative integer, got '{}'",
                               Name, *Value),
        .Kind = ErrorKind::Configuration,
    });
  }
  return Parsed;
}

} // namespace detail

struct Config {
  std::string LogLevel{"info"};
  std::optional<std::string> LogDir;

  std::string CacheDir{"cache"};

  std::optional<std::string> GitHubToken;
  int GitHubCacheMinutes = 30;

  // The key is optional here. The quality assessor reports its absence as a
  // configuration error when it is first used.
  std::optional<std::string> GroqApiKey;
  std::string GroqModel{"llama-3.1-8b-instant"};
  int QualityCacheMinutes = 24 * 60;
  std::string QualityCacheVersion{"groq_v1"};

  std::optional<std::string> DatabaseUrl;
  int Workers = 1;

  static std::expected<Config, Error> load() {
    Config Cfg;

    if (auto LogLevel = detail::env("LOG_LEVEL")) {
      Cfg.LogLevel = *LogLevel;
    }
    Cfg.LogDir = detail::env("LOG_DIR");

    if (auto CacheDir = detail::env("CACHE_DIR")) {
      Cfg.CacheDir = *CacheDir;
    }

    Cfg.GitHubToken = detail::env("GITHUB_TOKEN");
    auto GitHubMinutes = detail::envInt("GITHUB_CACHE_MINUTES", 30);
    if (!GitHubMinutes) {
      return std::unexpected(GitHubMinutes.error());
    }
    Cfg.GitHubCacheMinutes = *GitHubMinutes;

    Cfg.GroqApiKey = detail::env("GROQ_API_KEY");
    if (auto Model = detail::env("GROQ_MODEL")) {
      Cfg.GroqModel = *Model;
    }
    auto QualityMinutes = detail::envInt("QUALITY_CACHE_MINUTES", 24 * 60);
    if (!QualityMinutes) {
      return std::unexpected(QualityMinutes.error());
    }
    Cfg.QualityCacheMinutes = *QualityMinutes;
    if (auto Version = detail::env("QUALITY_CACHE_VERSION")) {
      Cfg.QualityCacheVersion = *Version;
    }

    Cfg.DatabaseUrl = detail::env("DATABASE_URL");

    auto Workers = detail::envInt("WORKERS", 1);
    if (!Workers) {
      return std::unexpected(Workers.error());
    }
    if (*Workers == 0) {
      return std::unexpected(Error{
          .Message = "WORKERS must be at least 1",
          .Kind = ErrorKind::Configuration,
      });
    }
    Cfg.Workers = *Workers;

    return Cfg;
  }
};

} // namespace repolens::core
