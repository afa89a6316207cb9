#include <gtest/gtest.h>

#include "repolens/core/text.hpp"
#include "repolens/pipeline/persist.hpp"

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdlib>
#include <format>
#include <fstream>
#include <memory>
#include <sstream>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>

namespace repolens::pipeline {
namespace {

ScoredRepository scored() {
  ScoredRepository Entry{
      .Name = "tool",
      .FullName = "octo/tool",
      .Url = "https://github.com/octo/tool",
      .Language = "Go",
  };
  Entry.Scores = {.Activity = 80.0,
                  .Popularity = 41.2,
                  .Health = 85.0,
                  .Hard = 67.4,
                  .Quality = 72.0,
                  .Total = 70.4};
  return Entry;
}

TEST(ToRepoScore, FlattensAssessment) {
  auto Entry = scored();
  Entry.Assessment = quality::models::QualityAssessment{
      .Strengths = {"a", "b", "c"},
      .Weaknesses = {"d", "e", "f"},
      .SuggestedImprovements = {"g", "h", "i"},
      .SkillScore = 72,
      .Notes = "sampled 3 files",
  };

  auto Row = toRepoScore("run-1", Entry);
  EXPECT_EQ(Row.RunId, "run-1");
  EXPECT_EQ(Row.RepoName, "tool");
  EXPECT_EQ(Row.RepoUrl, "https://github.com/octo/tool");
  EXPECT_EQ(Row.Language.value_or(""), "Go");
  EXPECT_EQ(Row.TotalScore, 70.4);
  EXPECT_EQ(Row.QualityScore.value_or(-1.0), 72.0);
  EXPECT_EQ(Row.HardScore, 67.4);
  EXPECT_EQ(Row.ActivityScore, 80.0);
  EXPECT_EQ(Row.PopularityScore, 41.2);
  EXPECT_EQ(Row.HealthScore, 85.0);
  EXPECT_EQ(Row.Strengths, "a\nb\nc");
  EXPECT_EQ(Row.Weaknesses, "d\ne\nf");
  EXPECT_EQ(Row.Improvements, "g\nh\ni");
  EXPECT_EQ(Row.Notes, "sampled 3 files");
  EXPECT_TRUE(Row.Id.empty());
}

TEST(ToRepoScore, FailedAssessmentLeavesNote) {
  auto Entry = scored();
  Entry.Scores.Quality.reset();
  Entry.Scores.Total = Entry.Scores.Hard;
  Entry.AssessmentError = core::Error{.Message = "Forbidden",
                                      .Kind = core::ErrorKind::Configuration};

  auto Row = toRepoScore("run-2", Entry);
  EXPECT_FALSE(Row.QualityScore.has_value());
  EXPECT_EQ(Row.TotalScore, 67.4);
  EXPECT_TRUE(Row.Strengths.empty());
  EXPECT_EQ(Row.Notes, "Forbidden");
}

TEST(ToRepoScore, UnassessedRowIsBare) {
  auto Entry = scored();
  Entry.Language.reset();
  auto Row = toRepoScore("run-3", Entry);
  EXPECT_FALSE(Row.Language.has_value());
  EXPECT_TRUE(Row.Notes.empty());
  EXPECT_TRUE(Row.Improvements.empty());
}

TEST(Placeholders, NumbersEveryParameter) {
  EXPECT_EQ(db::placeholders(0), "");
  EXPECT_EQ(db::placeholders(1), "$1");
  EXPECT_EQ(db::placeholders(3), "$1, $2, $3");
}

std::vector<std::string> columnNames(std::string_view Columns) {
  std::vector<std::string> Names;
  std::size_t Start = 0;
  while (Start <= Columns.size()) {
    auto Comma = Columns.find(',', Start);
    if (Comma == std::string_view::npos) {
      Comma = Columns.size();
    }
    Names.push_back(core::trim(Columns.substr(Start, Comma - Start)));
    Start = Comma + 1;
  }
  return Names;
}

TEST(DbTraits, RunColumnsMatchParams) {
  using Traits = core::DbTraits<db::models::Run>;
  auto Params =
      Traits::toParams(db::models::Run{.Username = "octo", .RepoCount = 4});
  auto Names = columnNames(Traits::Columns);
  ASSERT_EQ(Names.size(), std::tuple_size_v<decltype(Params)>);
  EXPECT_EQ(Names[0], "username");
  EXPECT_EQ(std::get<0>(Params), "octo");
  EXPECT_EQ(Names[1], "repo_count");
  EXPECT_EQ(std::get<1>(Params), 4);
}

TEST(DbTraits, RepoScoreColumnsMatchParams) {
  using Traits = core::DbTraits<db::models::RepoScore>;
  auto Row = toRepoScore("run-9", scored());
  Row.Notes = "note";
  auto Params = Traits::toParams(Row);
  auto Names = columnNames(Traits::Columns);
  ASSERT_EQ(Names.size(), std::tuple_size_v<decltype(Params)>);

  EXPECT_EQ(Names[0], "run_id");
  EXPECT_EQ(std::get<0>(Params), "run-9");
  EXPECT_EQ(Names[3], "language");
  EXPECT_EQ(std::get<3>(Params).value_or(""), "Go");
  EXPECT_EQ(Names[4], "total_score");
  EXPECT_EQ(std::get<4>(Params), 70.4);
  EXPECT_EQ(Names[5], "quality_score");
  EXPECT_EQ(std::get<5>(Params).value_or(-1.0), 72.0);
  EXPECT_EQ(Names[6], "hard_score");
  EXPECT_EQ(std::get<6>(Params), 67.4);
  EXPECT_EQ(Names[9], "health_score");
  EXPECT_EQ(std::get<9>(Params), 85.0);
  EXPECT_EQ(Names[13], "notes");
  EXPECT_EQ(std::get<13>(Params), "note");
}

TEST(SortByTotal, HighestFirstAndStable) {
  std::vector<db::models::RepoScore> Scores{
      {.RepoName = "low", .TotalScore = 10.0},
      {.RepoName = "tie-a", .TotalScore = 50.0},
      {.RepoName = "high", .TotalScore = 90.0},
      {.RepoName = "tie-b", .TotalScore = 50.0},
  };
  sortByTotal(Scores);
  ASSERT_EQ(Scores.size(), 4u);
  EXPECT_EQ(Scores[0].RepoName, "high");
  EXPECT_EQ(Scores[1].RepoName, "tie-a");
  EXPECT_EQ(Scores[2].RepoName, "tie-b");
  EXPECT_EQ(Scores[3].RepoName, "low");
}

// Runs against a live PostgreSQL named by REPOLENS_TEST_DATABASE_URL and is
// skipped without one.
class DatabaseTest : public ::testing::Test {
protected:
  void SetUp() override {
    const auto *Url = std::getenv("REPOLENS_TEST_DATABASE_URL");
    if (Url == nullptr || *Url == '\0') {
      GTEST_SKIP() << "REPOLENS_TEST_DATABASE_URL is not set";
    }
    auto Connected = db::Database::connect(Url);
    ASSERT_TRUE(Connected.has_value()) << Connected.error().Message;
    Db = *Connected;

    std::ifstream File(REPOLENS_SCHEMA_FILE);
    ASSERT_TRUE(File.good());
    std::stringstream Schema;
    Schema << File.rdbuf();
    auto Applied = Db->transaction([&](pqxx::work &Tx) {
      Tx.exec(pqxx::zview{Schema.str()});
      return true;
    });
    ASSERT_TRUE(Applied.has_value()) << Applied.error().Message;

    Username = std::format(
        "repolens-test-{}",
        std::chrono::system_clock::now().time_since_epoch().count());
  }

  std::shared_ptr<db::Database> Db;
  std::string Username;
};

TEST_F(DatabaseTest, StoredRunLoadsBackBestFirst) {
  BatchResult Batch;
  Batch.Entries.push_back(scored());
  auto Better = scored();
  Better.Name = "better";
  Better.Scores.Total = 88.0;
  Better.Assessment = quality::models::QualityAssessment{
      .Strengths = {"a", "b", "c"}, .Notes = "good"};
  Batch.Entries.push_back(Better);

  auto Run = persistRun(*Db, Username, 2, Batch);
  ASSERT_TRUE(Run.has_value()) << Run.error().Message;
  EXPECT_EQ(Run->Username, Username);
  EXPECT_FALSE(Run->Id.empty());

  auto History = loadRun(*Db, Run->Id);
  ASSERT_TRUE(History.has_value()) << History.error().Message;
  EXPECT_EQ(History->Run.RepoCount, 2);
  ASSERT_EQ(History->Scores.size(), 2u);
  EXPECT_EQ(History->Scores[0].RepoName, "better");
  EXPECT_EQ(History->Scores[0].Strengths, "a\nb\nc");
  EXPECT_EQ(History->Scores[0].Notes, "good");
  EXPECT_EQ(History->Scores[1].RepoName, "tool");
  EXPECT_EQ(History->Scores[1].Language.value_or(""), "Go");
  EXPECT_EQ(History->Scores[1].QualityScore.value_or(-1.0), 72.0);
  EXPECT_EQ(History->Scores[1].RunId, Run->Id);

  auto Recent = recentRuns(*Db, 50);
  ASSERT_TRUE(Recent.has_value()) << Recent.error().Message;
  EXPECT_TRUE(std::ranges::any_of(
      *Recent, [&](const db::models::Run &R) { return R.Id == Run->Id; }));
}

TEST_F(DatabaseTest, FailedScoreRowStoresNothing) {
  BatchResult Batch;
  Batch.Entries.push_back(scored());
  auto OutOfRange = scored();
  OutOfRange.Scores.Total = 150.0;
  Batch.Entries.push_back(OutOfRange);

  auto Run = persistRun(*Db, Username, 2, Batch);
  ASSERT_FALSE(Run.has_value());

  auto Runs = Db->getWhere<db::models::Run>("username", Username);
  ASSERT_TRUE(Runs.has_value()) << Runs.error().Message;
  EXPECT_TRUE(Runs->empty());
}

TEST_F(DatabaseTest, UnknownRunIsNotFound) {
  for (std::string_view Id :
       {"00000000-0000-0000-0000-000000000000", "not-a-run"}) {
    auto History = loadRun(*Db, Id);
    ASSERT_FALSE(History.has_value());
    EXPECT_EQ(History.error().Kind, core::ErrorKind::NotFound);
  }
}

} // namespace
} // namespace repolens::pipeline
