#include "repolens/pipeline/persist.hpp"

#include "repolens/core/logging.hpp"
#include "repolens/core/text.hpp"

#include <algorithm>
#include <expected>
#include <format>
#include <functional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace repolens::pipeline {

static auto Log() { return core::logger("pipeline"); }

db::models::RepoScore toRepoScore(std::string_view RunId,
                                  const ScoredRepository &Entry) {
  db::models::RepoScore Row{
      .RunId = std::string{RunId},
      .RepoName = Entry.Name,
      .RepoUrl = Entry.Url,
      .Language = Entry.Language,
      .TotalScore = Entry.Scores.Total,
      .QualityScore = Entry.Scores.Quality,
      .HardScore = Entry.Scores.Hard,
      .ActivityScore = Entry.Scores.Activity,
      .PopularityScore = Entry.Scores.Popularity,
      .HealthScore = Entry.Scores.Health,
  };
  if (Entry.Assessment) {
    Row.Strengths = core::joinLines(Entry.Assessment->Strengths);
    Row.Weaknesses = core::joinLines(Entry.Assessment->Weaknesses);
    Row.Improvements = core::joinLines(Entry.Assessment->SuggestedImprovements);
    Row.Notes = Entry.Assessment->Notes;
  } else if (Entry.AssessmentError) {
    Row.Notes = Entry.AssessmentError->Message;
  }
  return Row;
}

auto persistRun(db::Database &Database, std::string_view Username,
                int RepoCount, const BatchResult &Batch)
    -> std::expected<db::models::Run, core::Error> {
  auto Stored = Database.transaction([&](pqxx::work &Tx) {
    auto Run = db::Database::insert(Tx, db::models::Run{
                                            .Username = std::string{Username},
                                            .RepoCount = RepoCount,
                                        });
    for (const auto &Entry : Batch.Entries) {
      db::Database::insert(Tx, toRepoScore(Run.Id, Entry));
    }
    return Run;
  });
  if (!Stored) {
    Log()->error("Run for {} was not stored: {}", Username,
                 Stored.error().Message);
    return std::unexpected(Stored.error());
  }

  Log()->info("Stored run {} with {} scores", Stored->Id,
              Batch.Entries.size());
  return Stored;
}

void sortByTotal(std::vector<db::models::RepoScore> &Scores) {
  std::ranges::stable_sort(Scores, std::ranges::greater{},
                           &db::models::RepoScore::TotalScore);
}

auto recentRuns(db::Database &Database, int Limit)
    -> std::expected<std::vector<db::models::Run>, core::Error> {
  return Database.getRecent<db::models::Run>(Limit);
}

auto loadRun(db::Database &Database, std::string_view RunId)
    -> std::expected<RunHistory, core::Error> {
  auto Run = Database.get<db::models::Run>(RunId);
  if (!Run) {
    if (Run.error().Kind == core::ErrorKind::NotFound) {
      return std::unexpected(
          core::Error{.Message = std::format("No run with id {}", RunId),
                      .Kind = core::ErrorKind::NotFound});
    }
    return std::unexpected(Run.error());
  }

  auto Scores = Database.getWhere<db::models::RepoScore>("run_id", RunId);
  if (!Scores) {
    return std::unexpected(Scores.error());
  }
  sortByTotal(*Scores);
  return RunHistory{.Run = std::move(*Run), .Scores = std::move(*Scores)};
}

} // namespace repolens::pipeline
