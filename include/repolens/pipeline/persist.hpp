#pragma once
#include "repolens/core/result.hpp"
#include "repolens/db/db.hpp"
#include "repolens/db/models.hpp"
#include "repolens/pipeline/pipeline.hpp"

#include <expected>
#include <string>
#include <string_view>
#include <vector>

namespace repolens::pipeline {

inline constexpr int HistoryLimit = 10;

// A stored run and its scores, best total first.
struct RunHistory {
  db::models::Run Run;
  std::vector<db::models::RepoScore> Scores;
};

// Flattens one scored repository into a repo_scores row of run RunId.
db::models::RepoScore toRepoScore(std::string_view RunId,
                                  const ScoredRepository &Entry);

// Writes one runs row and one repo_scores row per entry in a single
// transaction. On failure nothing is stored.
auto persistRun(db::Database &Database, std::string_view Username,
                int RepoCount, const BatchResult &Batch)
    -> std::expected<db::models::Run, core::Error>;

// Highest total first; equal totals keep their order.
void sortByTotal(std::vector<db::models::RepoScore> &Scores);

auto recentRuns(db::Database &Database, int Limit = HistoryLimit)
    -> std::expected<std::vector<db::models::Run>, core::Error>;

auto loadRun(db::Database &Database, std::string_view RunId)
    -> std::expected<RunHistory, core::Error>;

} // namespace repolens::pipeline
