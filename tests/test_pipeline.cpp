#include <gtest/gtest.h>

#include "repolens/pipeline/pipeline.hpp"

#include <atomic>
#include <expected>
#include <filesystem>
#include <format>
#include <memory>
#include <stop_token>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace repolens::pipeline {
namespace {

namespace fs = std::filesystem;
using github::models::EnrichedRepository;

constexpr std::string_view ScoredReply = R"({
  "repo_summary": "Small tool.",
  "strengths": ["s1", "s2", "s3"],
  "weaknesses": ["w1", "w2", "w3"],
  "suggested_improvements": ["i1", "i2", "i3"],
  "skill_score": 80,
  "notes": "ok"
})";

constexpr std::string_view UnscoredReply = R"({
  "repo_summary": "Small tool.",
  "strengths": ["s1"],
  "weaknesses": [],
  "suggested_improvements": []
})";

class FakeSource : public github::Source {
public:
  auto listRepositories(std::string_view)
      -> std::expected<std::vector<github::models::RepositoryRecord>,
                       core::Error> override {
    return std::vector<github::models::RepositoryRecord>{};
  }

  auto fetchSample(std::string_view Owner, std::string_view Repo)
      -> github::models::RepositorySample override {
    ++Fetches;
    return {.FullName = std::format("{}/{}", Owner, Repo),
            .Readme = std::format("# {}", Repo),
            .Files = {{.Path = "main.py", .Content = "print('hi')"}}};
  }

  std::atomic<int> Fetches{0};
};

class FakeProvider : public quality::Provider {
public:
  explicit FakeProvider(std::expected<std::string, core::Error> Reply)
      : Reply(std::move(Reply)) {}

  auto complete(const quality::ChatRequest &)
      -> std::expected<std::string, core::Error> override {
    ++Calls;
    return Reply;
  }

  std::atomic<int> Calls{0};

private:
  std::expected<std::string, core::Error> Reply;
};

std::vector<EnrichedRepository> repositories(int Count) {
  std::vector<EnrichedRepository> Repos;
  for (int I = 0; I < Count; ++I) {
    EnrichedRepository Repo;
    Repo.Record.Name = std::format("r{}", I);
    Repo.Record.FullName = std::format("octo/r{}", I);
    Repo.Record.HtmlUrl = std::format("https://github.com/octo/r{}", I);
    Repo.Record.Stars = I * 3;
    Repo.Record.Forks = I;
    Repo.DaysSincePush = 10 * I;
    Repos.push_back(std::move(Repo));
  }
  return Repos;
}

class PipelineTest : public ::testing::Test {
protected:
  void SetUp() override {
    Root = fs::temp_directory_path() /
           ("repolens_pipeline_" +
            std::string(::testing::UnitTest::GetInstance()
                            ->current_test_info()
                            ->name()));
    fs::remove_all(Root);
    Store = std::make_shared<cache::Cache>(Root);
    Source = std::make_shared<FakeSource>();
  }

  void TearDown() override { fs::remove_all(Root); }

  Pipeline make(std::shared_ptr<FakeProvider> Provider,
                PipelineOptions Options = {}) {
    quality::RetryPolicy Policy{
        .MaxAttempts = 1,
        .Sleep = [](quality::Duration, std::stop_token) { return true; },
    };
    auto Assessor = std::make_shared<quality::QualityAssessor>(
        quality::AssessorConfig{.ApiKey = "key", .Model = "test-model"},
        std::move(Provider), Policy);
    return Pipeline(Source, Store, std::move(Assessor), std::move(Options));
  }

  fs::path Root;
  std::shared_ptr<cache::Cache> Store;
  std::shared_ptr<FakeSource> Source;
};

TEST_F(PipelineTest, ScoresInInputOrderWithWorkers) {
  auto Provider = std::make_shared<FakeProvider>(std::string{ScoredReply});
  auto Repos = repositories(6);
  auto Runner = make(Provider, {.Count = 5, .Workers = 3});

  auto Batch = Runner.scoreBatch(Repos);
  ASSERT_TRUE(Batch.has_value()) << Batch.error().Message;
  ASSERT_EQ(Batch->Entries.size(), 5u);
  for (std::size_t I = 0; I < Batch->Entries.size(); ++I) {
    EXPECT_EQ(Batch->Entries[I].Name, std::format("r{}", I));
    EXPECT_EQ(Batch->Entries[I].Scores.Quality.value_or(-1.0), 80.0);
    EXPECT_TRUE(Batch->Entries[I].Assessment.has_value());
  }
  EXPECT_EQ(Provider->Calls.load(), 5);
  EXPECT_EQ(Source->Fetches.load(), 5);
  EXPECT_EQ(Batch->Confidence, 70);
}

TEST_F(PipelineTest, SecondRunIsServedFromCache) {
  auto Provider = std::make_shared<FakeProvider>(std::string{ScoredReply});
  auto Repos = repositories(3);
  auto Runner = make(Provider);

  auto First = Runner.scoreBatch(Repos);
  auto Second = Runner.scoreBatch(Repos);
  ASSERT_TRUE(First.has_value());
  ASSERT_TRUE(Second.has_value());
  EXPECT_EQ(Provider->Calls.load(), 3);
  ASSERT_EQ(First->Entries.size(), Second->Entries.size());
  for (std::size_t I = 0; I < First->Entries.size(); ++I) {
    EXPECT_EQ(First->Entries[I].Scores, Second->Entries[I].Scores);
  }
  EXPECT_EQ(First->Averages.Total, Second->Averages.Total);
}

TEST_F(PipelineTest, NewCacheVersionBypassesOldEntries) {
  auto Provider = std::make_shared<FakeProvider>(std::string{ScoredReply});
  auto Repos = repositories(2);
  ASSERT_TRUE(make(Provider).scoreBatch(Repos).has_value());
  ASSERT_TRUE(
      make(Provider, {.CacheVersion = "groq_v2"}).scoreBatch(Repos).has_value());
  EXPECT_EQ(Provider->Calls.load(), 4);
}

TEST_F(PipelineTest, MissingSkillScoreLeavesHardTotal) {
  auto Provider = std::make_shared<FakeProvider>(std::string{UnscoredReply});
  auto Repos = repositories(2);
  auto Batch = make(Provider).scoreBatch(Repos);
  ASSERT_TRUE(Batch.has_value());
  for (const auto &Entry : Batch->Entries) {
    ASSERT_TRUE(Entry.Assessment.has_value());
    EXPECT_FALSE(Entry.Scores.Quality.has_value());
    EXPECT_EQ(Entry.Scores.Total, Entry.Scores.Hard);
  }
  EXPECT_FALSE(Batch->Averages.Quality.has_value());
}

TEST_F(PipelineTest, FailedAssessmentIsRecordedAndNotCached) {
  auto Provider = std::make_shared<FakeProvider>(std::unexpected(
      core::Error{.Message = "upstream down",
                  .Kind = core::ErrorKind::Transient}));
  auto Repos = repositories(2);
  auto Runner = make(Provider);

  auto Batch = Runner.scoreBatch(Repos);
  ASSERT_TRUE(Batch.has_value());
  for (const auto &Entry : Batch->Entries) {
    EXPECT_FALSE(Entry.Assessment.has_value());
    ASSERT_TRUE(Entry.AssessmentError.has_value());
    EXPECT_EQ(Entry.AssessmentError->Kind, core::ErrorKind::Transient);
    EXPECT_EQ(Entry.Scores.Total, Entry.Scores.Hard);
  }

  ASSERT_TRUE(Runner.scoreBatch(Repos).has_value());
  EXPECT_EQ(Provider->Calls.load(), 4);
}

TEST_F(PipelineTest, AssessmentCanBeDisabled) {
  auto Provider = std::make_shared<FakeProvider>(std::string{ScoredReply});
  auto Repos = repositories(2);
  auto Batch = make(Provider, {.AssessQuality = false}).scoreBatch(Repos);
  ASSERT_TRUE(Batch.has_value());
  EXPECT_EQ(Provider->Calls.load(), 0);
  EXPECT_EQ(Source->Fetches.load(), 0);
  EXPECT_FALSE(Batch->Entries[0].AssessmentError.has_value());
}

TEST_F(PipelineTest, StoppedRunIsCancelled) {
  auto Provider = std::make_shared<FakeProvider>(std::string{ScoredReply});
  auto Repos = repositories(3);
  std::stop_source Stop;
  Stop.request_stop();

  for (int Workers : {1, 3}) {
    auto Batch =
        make(Provider, {.Workers = Workers}).scoreBatch(Repos, Stop.get_token());
    ASSERT_FALSE(Batch.has_value());
    EXPECT_EQ(Batch.error().Kind, core::ErrorKind::Cancelled);
  }
  EXPECT_EQ(Provider->Calls.load(), 0);
}

TEST_F(PipelineTest, EmptyInputGivesEmptyBatch) {
  auto Provider = std::make_shared<FakeProvider>(std::string{ScoredReply});
  std::vector<EnrichedRepository> None;
  auto Batch = make(Provider).scoreBatch(None);
  ASSERT_TRUE(Batch.has_value());
  EXPECT_TRUE(Batch->Entries.empty());
  EXPECT_EQ(Batch->Confidence, 0);
}

TEST(PortfolioEntries, CarriesAssessmentBullets) {
  BatchResult Batch;
  Batch.Entries.push_back({.Name = "a", .Language = "C++"});
  Batch.Entries[0].Scores.Total = 55.5;
  Batch.Entries[0].Assessment = quality::models::QualityAssessment{
      .Strengths = {"s"}, .Weaknesses = {"w"}};
  Batch.Entries.push_back({.Name = "b"});

  auto Entries = portfolioEntries(Batch);
  ASSERT_EQ(Entries.size(), 2u);
  EXPECT_EQ(Entries[0].Repo, "a");
  EXPECT_EQ(Entries[0].Language.value_or(""), "C++");
  EXPECT_EQ(Entries[0].TotalScore, 55.5);
  EXPECT_EQ(Entries[0].Strengths, (std::vector<std::string>{"s"}));
  EXPECT_TRUE(Entries[1].Strengths.empty());
  EXPECT_FALSE(Entries[1].Language.has_value());
}

TEST(SplitFullName, OwnerAndName) {
  EXPECT_EQ(splitFullName("octo/tool"),
            (std::pair<std::string, std::string>{"octo", "tool"}));
  EXPECT_EQ(splitFullName("tool"),
            (std::pair<std::string, std::string>{"", "tool"}));
}

} // namespace
} // namespace repolens::pipeline
