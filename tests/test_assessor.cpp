#include <gtest/gtest.h>

#include "repolens/core/text.hpp"
#include "repolens/quality/assessor.hpp"

#include <chrono>
#include <deque>
#include <expected>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace repolens::quality {
namespace {

using namespace std::chrono_literals;
using Reply = std::expected<std::string, core::Error>;

constexpr std::string_view GoodReply = R"({
  "repo_summary": "Scraper with a clean CLI.",
  "strengths": ["small modules", "type hints", "README"],
  "weaknesses": ["no tests", "hard-coded URLs", "no retries"],
  "suggested_improvements": ["add tests", "config file", "retry logic"],
  "skill_score": 64,
  "notes": "Four files sampled."
})";

// Replays scripted replies and records every request.
class ScriptedProvider : public Provider {
public:
  explicit ScriptedProvider(std::vector<Reply> Script)
      : Script(Script.begin(), Script.end()) {}

  auto complete(const ChatRequest &Request) -> Reply override {
    std::lock_guard Lock(Mutex);
    Requests.push_back(Request);
    if (Script.empty()) {
      return std::unexpected(core::Error{.Message = "script exhausted",
                                         .Kind = core::ErrorKind::Transient});
    }
    auto Next = Script.front();
    Script.pop_front();
    return Next;
  }

  std::size_t calls() const {
    std::lock_guard Lock(Mutex);
    return Requests.size();
  }

  std::vector<ChatRequest> Requests;

private:
  mutable std::mutex Mutex;
  std::deque<Reply> Script;
};

Reply transient(std::string Message) {
  return std::unexpected(core::Error{.Message = std::move(Message),
                                     .Kind = core::ErrorKind::Transient});
}

github::models::RepositorySample sample() {
  return {.FullName = "octo/scraper",
          .Readme = "# Scraper\nFetches pages.",
          .Files = {{.Path = "main.py", .Content = "print('hi')"}}};
}

class AssessorTest : public ::testing::Test {
protected:
  QualityAssessor make(std::shared_ptr<ScriptedProvider> Provider,
                       int MaxAttempts = 3,
                       std::optional<std::string> Key = "test-key") {
    RetryPolicy Policy{
        .MaxAttempts = MaxAttempts,
        .Delay = exponentialBackoff,
        .Sleep =
            [this](Duration Delay, std::stop_token) {
              Sleeps.push_back(Delay);
              return SleepResult;
            },
    };
    return QualityAssessor(AssessorConfig{.ApiKey = Key, .Model = "test-model"},
                           std::move(Provider), Policy);
  }

  std::vector<Duration> Sleeps;
  bool SleepResult{true};
};

TEST_F(AssessorTest, FirstAttemptSucceeds) {
  auto Provider =
      std::make_shared<ScriptedProvider>(std::vector<Reply>{std::string{GoodReply}});
  auto Assessor = make(Provider);

  auto Result = Assessor.assess(sample());
  ASSERT_TRUE(Result.has_value()) << Result.error().Message;
  EXPECT_EQ(Result->SkillScore, std::optional<int>{64});
  EXPECT_EQ(Result->Strengths.size(), 3u);
  EXPECT_EQ(Provider->calls(), 1u);
  EXPECT_TRUE(Sleeps.empty());

  const auto &Request = Provider->Requests.front();
  EXPECT_EQ(Request.Model, "test-model");
  EXPECT_EQ(Request.MaxTokens, 900);
  EXPECT_NE(Request.Prompt.find("octo/scraper"), std::string::npos);
  EXPECT_NE(Request.Prompt.find("main.py"), std::string::npos);
}

TEST_F(AssessorTest, RecoversFromFencedReply) {
  auto Provider = std::make_shared<ScriptedProvider>(std::vector<Reply>{
      "```json\n" + std::string{GoodReply} + "\n```"});
  auto Result = make(Provider).assess(sample());
  ASSERT_TRUE(Result.has_value());
  EXPECT_EQ(Result->RepoSummary, "Scraper with a clean CLI.");
}

TEST_F(AssessorTest, RetriesWithBackoffThenSucceeds) {
  auto Provider = std::make_shared<ScriptedProvider>(std::vector<Reply>{
      transient("timeout"), std::string{"no json here"},
      std::string{GoodReply}});
  auto Result = make(Provider).assess(sample());
  ASSERT_TRUE(Result.has_value()) << Result.error().Message;
  EXPECT_EQ(Provider->calls(), 3u);
  EXPECT_EQ(Sleeps, (std::vector<Duration>{1s, 2s}));
}

TEST_F(AssessorTest, ExhaustedRetriesCarryPreview) {
  std::string Garbage(400, 'x');
  auto Provider = std::make_shared<ScriptedProvider>(
      std::vector<Reply>{Garbage, Garbage, Garbage});
  auto Result = make(Provider).assess(sample());
  ASSERT_FALSE(Result.has_value());
  EXPECT_EQ(Provider->calls(), 3u);
  EXPECT_EQ(Sleeps.size(), 2u);
  EXPECT_EQ(Result.error().Kind, core::ErrorKind::ContractViolation);
  EXPECT_NE(Result.error().Message.find("failed after 3 attempts"),
            std::string::npos);
  EXPECT_EQ(Result.error().Preview, std::string(PreviewChars, 'x') + "...");
}

TEST_F(AssessorTest, TransientFailuresSurfaceAsTransient) {
  auto Provider = std::make_shared<ScriptedProvider>(std::vector<Reply>{
      transient("503"), transient("503"), transient("timeout")});
  auto Result = make(Provider).assess(sample());
  ASSERT_FALSE(Result.has_value());
  EXPECT_EQ(Result.error().Kind, core::ErrorKind::Transient);
  EXPECT_NE(Result.error().Message.find("timeout"), std::string::npos);
}

TEST_F(AssessorTest, MissingKeyFailsWithoutCallingProvider) {
  auto Provider = std::make_shared<ScriptedProvider>(
      std::vector<Reply>{std::string{GoodReply}});
  for (std::optional<std::string> Key :
       {std::optional<std::string>{}, std::optional<std::string>{"   "}}) {
    auto Result = make(Provider, 3, Key).assess(sample());
    ASSERT_FALSE(Result.has_value());
    EXPECT_EQ(Result.error().Kind, core::ErrorKind::Configuration);
    EXPECT_NE(Result.error().Message.find("GROQ_API_KEY"), std::string::npos);
  }
  EXPECT_EQ(Provider->calls(), 0u);
}

TEST_F(AssessorTest, RejectedKeyIsNotRetried) {
  auto Provider = std::make_shared<ScriptedProvider>(std::vector<Reply>{
      std::unexpected(core::Error{.Message = "401",
                                  .Kind = core::ErrorKind::Configuration}),
      std::string{GoodReply}});
  auto Result = make(Provider).assess(sample());
  ASSERT_FALSE(Result.has_value());
  EXPECT_EQ(Result.error().Kind, core::ErrorKind::Configuration);
  EXPECT_EQ(Provider->calls(), 1u);
  EXPECT_TRUE(Sleeps.empty());
}

TEST_F(AssessorTest, StopBeforeFirstAttempt) {
  auto Provider = std::make_shared<ScriptedProvider>(
      std::vector<Reply>{std::string{GoodReply}});
  std::stop_source Source;
  Source.request_stop();
  auto Result = make(Provider).assess(sample(), Source.get_token());
  ASSERT_FALSE(Result.has_value());
  EXPECT_EQ(Result.error().Kind, core::ErrorKind::Cancelled);
  EXPECT_EQ(Provider->calls(), 0u);
}

TEST_F(AssessorTest, StopDuringBackoff) {
  auto Provider = std::make_shared<ScriptedProvider>(std::vector<Reply>{
      transient("timeout"), std::string{GoodReply}});
  SleepResult = false;
  auto Result = make(Provider).assess(sample());
  ASSERT_FALSE(Result.has_value());
  EXPECT_EQ(Result.error().Kind, core::ErrorKind::Cancelled);
  EXPECT_EQ(Provider->calls(), 1u);
}

TEST_F(AssessorTest, PortfolioUsesItsOwnBudget) {
  auto Provider = std::make_shared<ScriptedProvider>(std::vector<Reply>{
      std::string{R"({"headline": "Pragmatic builder",
                      "recruiter_summary": "Ships small tools.",
                      "top_strengths": ["range"], "top_risks": []})"}});
  std::vector<models::PortfolioEntry> Entries{
      {.Repo = "scraper", .Language = "Python", .TotalScore = 61.5}};
  auto Result = make(Provider).assessPortfolio("octo", Entries);
  ASSERT_TRUE(Result.has_value()) << Result.error().Message;
  EXPECT_EQ(Result->Headline, "Pragmatic builder");
  EXPECT_EQ(Result->TopRisks.size(), 3u);
  EXPECT_EQ(Provider->Requests.front().MaxTokens, 600);
  EXPECT_NE(Provider->Requests.front().Prompt.find("octo"), std::string::npos);
}

TEST(CleanSample, BoundsPromptInput) {
  std::string LongFile;
  for (int I = 0; I < 30; ++I) {
    LongFile += std::string(99, 'a') + "\n";
  }
  github::models::RepositorySample Sample{
      .FullName = "octo/big",
      .Readme = std::string(5000, 'r'),
      .Files = {
          {.Path = "bundle.min.js", .Content = std::string(800, 'm')},
          {.Path = "image.png", .Content = "binary"},
          {.Path = "a.py", .Content = LongFile},
          {.Path = "b.py", .Content = "b"},
          {.Path = "requirements.txt", .Content = "requests"},
          {.Path = "c.md", .Content = "c"},
          {.Path = "d.py", .Content = "d"},
      }};
  auto Cleaned = cleanSample(Sample);
  EXPECT_EQ(Cleaned.Readme.size(), ReadmeChars);
  ASSERT_EQ(Cleaned.Files.size(), MaxSampleFiles);
  EXPECT_EQ(Cleaned.Files[0].Path, "a.py");
  EXPECT_EQ(Cleaned.Files[0].Content.size(), FileChars);
  EXPECT_EQ(Cleaned.Files[1].Path, "b.py");
  EXPECT_EQ(Cleaned.Files[2].Path, "requirements.txt");
  EXPECT_EQ(Cleaned.Files[3].Path, "c.md");
}

TEST(LooksMinified, LongLinesOnly) {
  EXPECT_FALSE(looksMinified("short\nlines\n"));
  EXPECT_FALSE(looksMinified(std::string(MinifiedLineChars, 'x')));
  EXPECT_TRUE(looksMinified("ok\n" + std::string(MinifiedLineChars + 1, 'x')));
}

TEST(CompactPortfolio, KeepsTopEntriesAndTwoBullets) {
  std::vector<models::PortfolioEntry> Entries(20);
  Entries[0].Strengths = {"a", "b", "c"};
  auto Compact = compactPortfolio(Entries);
  ASSERT_EQ(Compact.size(), MaxPortfolioEntries);
  EXPECT_EQ(Compact[0].Strengths, (std::vector<std::string>{"a", "b"}));
}

TEST(ExponentialBackoff, Doubles) {
  EXPECT_EQ(exponentialBackoff(1), Duration{1s});
  EXPECT_EQ(exponentialBackoff(2), Duration{2s});
  EXPECT_EQ(exponentialBackoff(3), Duration{4s});
}

TEST(InterruptibleSleep, ReturnsEarlyOnStop) {
  std::stop_source Source;
  Source.request_stop();
  auto Start = std::chrono::steady_clock::now();
  EXPECT_FALSE(interruptibleSleep(Duration{10s}, Source.get_token()));
  EXPECT_LT(std::chrono::steady_clock::now() - Start, 5s);
  EXPECT_TRUE(interruptibleSleep(Duration{1ms}, std::stop_token{}));
}

} // namespace
} // namespace repolens::quality
