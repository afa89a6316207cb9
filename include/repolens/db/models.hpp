#pragma once
#include "repolens/core/timestamp.hpp"
#include "repolens/core/traits.hpp"

#include <optional>
#include <pqxx/pqxx>
#include <string>
#include <string_view>
#include <tuple>

namespace repolens::db::models {

using Timestamp = core::Timestamp;

// One scoring run for a user.
struct Run {
  std::string Id;
  std::string Username;
  int RepoCount{0};
  Timestamp CreatedAt;
};

// One scored repository of a run. The list fields hold newline-joined text.
struct RepoScore {
  std::string Id;
  std::string RunId;
  std::string RepoName;
  std::string RepoUrl;
  std::optional<std::string> Language;
  double TotalScore{0.0};
  std::optional<double> QualityScore;
  double HardScore{0.0};
  double ActivityScore{0.0};
  double PopularityScore{0.0};
  double HealthScore{0.0};
  std::string Strengths;
  std::string Weaknesses;
  std::string Improvements;
  std::string Notes;
  Timestamp CreatedAt;
};

} // namespace repolens::db::models

namespace repolens::core {

namespace detail {
inline Timestamp rowTimestamp(const pqxx::row &Row, const char *Column) {
  if (Row[Column].is_null()) {
    return Timestamp{};
  }
  return parseTimestamp(Row[Column].as<std::string>()).value_or(Timestamp{});
}
} // namespace detail

template <> struct DbTraits<db::models::Run> {
  static constexpr std::string_view TableName = "runs";
  static constexpr std::string_view Columns = "username, repo_count";

  static auto toParams(const db::models::Run &Run) {
    return std::make_tuple(Run.Username, Run.RepoCount);
  }

  static db::models::Run fromRow(const pqxx::row &Row) {
    return {
        .Id = Row["id"].as<std::string>(),
        .Username = Row["username"].as<std::string>(),
        .RepoCount = Row["repo_count"].as<int>(),
        .CreatedAt = detail::rowTimestamp(Row, "created_at"),
    };
  }
};

template <> struct DbTraits<db::models::RepoScore> {
  static constexpr std::string_view TableName = "repo_scores";
  static constexpr std::string_view Columns =
      "run_id, repo_name, repo_url, language, total_score, quality_score, "
      "hard_score, activity_score, popularity_score, health_score, "
      "strengths, weaknesses, improvements, notes";

  static auto toParams(const db::models::RepoScore &Score) {
    return std::make_tuple(
        Score.RunId,
        Score.RepoName,
        Score.RepoUrl,
        Score.Language,
        Score.TotalScore,
        Score.QualityScore,
        Score.HardScore,
        Score.ActivityScore,
        Score.PopularityScore,
        Score.HealthScore,
        Score.Strengths,
        Score.Weaknesses,
        Score.Improvements,
        Score.Notes
    );
  }

  static db::models::RepoScore fromRow(const pqxx::row &Row) {
    return {
        .Id = Row["id"].as<std::string>(),
        .RunId = Row["run_id"].as<std::string>(),
        .RepoName = Row["repo_name"].as<std::string>(),
        .RepoUrl = Row["repo_url"].as<std::string>(),
        .Language = Row["language"].as<std::optional<std::string>>(),
        .TotalScore = Row["total_score"].as<double>(),
        .QualityScore = Row["quality_score"].as<std::optional<double>>(),
        .HardScore = Row["hard_score"].as<double>(),
        .ActivityScore = Row["activity_score"].as<double>(),
        .PopularityScore = Row["popularity_score"].as<double>(),
        .HealthScore = Row["health_score"].as<double>(),
        .Strengths = Row["strengths"].as<std::string>(),
        .Weaknesses = Row["weaknesses"].as<std::string>(),
        .Improvements = Row["improvements"].as<std::string>(),
        .Notes = Row["notes"].as<std::string>(),
        .CreatedAt = detail::rowTimestamp(Row, "created_at"),
    };
  }
};

} // namespace repolens::core
