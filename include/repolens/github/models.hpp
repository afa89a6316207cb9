#pragma once
#include "repolens/core/timestamp.hpp"

#include <glaze/core/meta.hpp>

#include <optional>
#include <string>
#include <vector>

namespace repolens::github::models {

using Timestamp = core::Timestamp;

// One repository as listed by GET /users/{user}/repos. Timestamps stay in
// their raw text form; enrichment parses them.
struct RepositoryRecord {
  std::string Name;
  std::string FullName;
  std::string HtmlUrl;
  std::optional<std::string> Language;
  int Stars{0};
  int Forks{0};
  int OpenIssues{0};
  int SizeKb{0};
  bool Archived{false};
  std::optional<std::string> LicenseName;
  std::optional<std::string> CreatedAt;
  std::optional<std::string> UpdatedAt;
  std::optional<std::string> PushedAt;
};

// A record plus the features derived from its push timestamp.
struct EnrichedRepository {
  RepositoryRecord Record;
  std::optional<Timestamp> PushedInstant;
  // std::nullopt when pushed_at was missing or unparsable.
  std::optional<long long> DaysSincePush;
  bool IsActive30{false};
  bool IsActive90{false};
  bool IsActive365{false};
};

struct FileSample {
  std::string Path;
  std::string Content;
};

// README and a few source files, the input of a quality assessment.
struct RepositorySample {
  std::string FullName;
  std::string Readme;
  std::vector<FileSample> Files;
};

} // namespace repolens::github::models

template <> struct glz::meta<repolens::github::models::FileSample> {
  using T = repolens::github::models::FileSample;
  static constexpr auto value =
      glz::object("path", &T::Path, "content", &T::Content);
};
