#include <gtest/gtest.h>

#include "repolens/github/enrichment.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace repolens::github {
namespace {

using namespace std::chrono;

const core::Timestamp Now =
    sys_days{2024y / June / 15} + hours{12};

models::RepositoryRecord pushedAt(std::optional<std::string> PushedAt) {
  return models::RepositoryRecord{.Name = "demo", .PushedAt = PushedAt};
}

TEST(DaysBetween, FloorsPartialDays) {
  EXPECT_EQ(daysBetween(Now - hours{23}, Now), 0);
  EXPECT_EQ(daysBetween(Now - hours{25}, Now), 1);
  EXPECT_EQ(daysBetween(Now + hours{1}, Now), -1);
}

TEST(Enrich, DerivesAgeAndWindows) {
  auto Enriched = enrich(pushedAt("2024-05-16T12:00:00Z"), Now);
  ASSERT_TRUE(Enriched.DaysSincePush.has_value());
  EXPECT_EQ(*Enriched.DaysSincePush, 30);
  EXPECT_TRUE(Enriched.IsActive30);
  EXPECT_TRUE(Enriched.IsActive90);
  EXPECT_TRUE(Enriched.IsActive365);

  auto Older = enrich(pushedAt("2024-01-01T00:00:00Z"), Now);
  ASSERT_TRUE(Older.DaysSincePush.has_value());
  EXPECT_FALSE(Older.IsActive30);
  EXPECT_FALSE(Older.IsActive90);
  EXPECT_TRUE(Older.IsActive365);
}

TEST(Enrich, MissingOrBadTimestampLeavesAgeUnknown) {
  for (auto Raw : {std::optional<std::string>{},
                   std::optional<std::string>{"not a date"}}) {
    auto Enriched = enrich(pushedAt(Raw), Now);
    EXPECT_FALSE(Enriched.PushedInstant.has_value());
    EXPECT_FALSE(Enriched.DaysSincePush.has_value());
    EXPECT_FALSE(Enriched.IsActive30);
    EXPECT_FALSE(Enriched.IsActive90);
    EXPECT_FALSE(Enriched.IsActive365);
  }
}

TEST(Enrich, SourceRecordIsCopiedUnchanged) {
  auto Record = pushedAt("2024-06-10T00:00:00Z");
  Record.Stars = 9;
  auto Enriched = enrich(Record, Now);
  EXPECT_EQ(Enriched.Record.Stars, 9);
  EXPECT_EQ(Enriched.Record.PushedAt, Record.PushedAt);
  EXPECT_EQ(Record.PushedAt.value_or(""), "2024-06-10T00:00:00Z");
}

TEST(EnrichAll, KeepsOrder) {
  std::vector<models::RepositoryRecord> Records{
      pushedAt("2024-06-14T12:00:00Z"), pushedAt(std::nullopt),
      pushedAt("2023-06-14T12:00:00Z")};
  auto Enriched = enrichAll(Records, Now);
  ASSERT_EQ(Enriched.size(), 3u);
  EXPECT_EQ(Enriched[0].DaysSincePush, std::optional<long long>{1});
  EXPECT_FALSE(Enriched[1].DaysSincePush.has_value());
  EXPECT_EQ(Enriched[2].DaysSincePush, std::optional<long long>{367});
}

} // namespace
} // namespace repolens::github
