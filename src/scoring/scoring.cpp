#include "repolens/scoring/scoring.hpp"

#include <algorithm>
#include <cmath>
#include <optional>

namespace repolens::scoring {

double clamp(double Value, double Lo, double Hi) {
  if (std::isnan(Value)) {
    return Lo;
  }
  return std::clamp(Value, Lo, Hi);
}

double roundTenth(double Value) { return std::round(Value * 10.0) / 10.0; }

double activityScore(std::optional<long long> DaysSincePush) {
  if (!DaysSincePush) {
    return 0.0;
  }
  auto Days = *DaysSincePush;
  if (Days <= 7) {
    return 100.0;
  }
  if (Days <= 30) {
    return 85.0;
  }
  if (Days <= 90) {
    return 70.0;
  }
  if (Days <= 365) {
    return 45.0;
  }
  return 20.0;
}

double popularityScore(long long Stars, long long Forks) {
  auto S = static_cast<double>(std::max(0LL, Stars));
  auto F = static_cast<double>(std::max(0LL, Forks));
  return clamp(18.0 * std::log1p(S) + 14.0 * std::log1p(F));
}

double healthScore(long long OpenIssues, bool Archived) {
  auto Issues = static_cast<double>(std::max(0LL, OpenIssues));
  auto Score = HealthBaseline;
  if (Archived) {
    Score -= ArchivedPenalty;
  }
  Score -= std::min(MaxIssuePenalty, Issues * IssuePenaltyPerIssue);
  return clamp(Score);
}

double hardScore(double Activity, double Popularity, double Health) {
  return ActivityWeight * Activity + PopularityWeight * Popularity +
         HealthWeight * Health;
}

ScoreBreakdown score(const github::models::EnrichedRepository &Repository,
                     std::optional<double> Quality) {
  const auto &Record = Repository.Record;
  auto Activity = activityScore(Repository.DaysSincePush);
  auto Popularity = popularityScore(Record.Stars, Record.Forks);
  auto Health = healthScore(Record.OpenIssues, Record.Archived);
  auto Hard = hardScore(Activity, Popularity, Health);

  auto Total = Hard;
  std::optional<double> Clamped;
  if (Quality) {
    Clamped = clamp(*Quality);
    Total = HardBlendWeight * Hard + QualityBlendWeight * *Clamped;
  }

  ScoreBreakdown Breakdown{
      .Activity = roundTenth(Activity),
      .Popularity = roundTenth(Popularity),
      .Health = roundTenth(Health),
      .Hard = roundTenth(Hard),
      .Total = roundTenth(Total),
  };
  if (Clamped) {
    Breakdown.Quality = roundTenth(*Clamped);
  }
  return Breakdown;
}

} // namespace repolens::scoring
