#pragma once
#include "repolens/github/models.hpp"

#include <optional>

namespace repolens::scoring {

inline constexpr double HealthBaseline = 85.0;
inline constexpr double ArchivedPenalty = 25.0;
inline constexpr double IssuePenaltyPerIssue = 1.5;
inline constexpr double MaxIssuePenalty = 25.0;

inline constexpr double ActivityWeight = 0.45;
inline constexpr double PopularityWeight = 0.35;
inline constexpr double HealthWeight = 0.20;

inline constexpr double HardBlendWeight = 0.35;
inline constexpr double QualityBlendWeight = 0.65;

// Every figure lies in [0, 100] and is rounded to one decimal place.
// Quality is absent when no external assessment produced a score; it is not
// the same as a score of zero.
struct ScoreBreakdown {
  double Activity{0.0};
  double Popularity{0.0};
  double Health{0.0};
  double Hard{0.0};
  std::optional<double> Quality;
  double Total{0.0};

  bool operator==(const ScoreBreakdown &) const = default;
};

double clamp(double Value, double Lo = 0.0, double Hi = 100.0);

// Rounds half away from zero to one decimal place.
double roundTenth(double Value);

// Step function of push age. Unknown age scores as fully stale.
double activityScore(std::optional<long long> DaysSincePush);

// 18·ln(1+stars) + 14·ln(1+forks), clamped. Negative counts count as zero.
double popularityScore(long long Stars, long long Forks);

double healthScore(long long OpenIssues, bool Archived);

double hardScore(double Activity, double Popularity, double Health);

// Scores one repository. Quality, when given, is clamped to [0, 100] and
// dominates the total.
ScoreBreakdown score(const github::models::EnrichedRepository &Repository,
                     std::optional<double> Quality = std::nullopt);

} // namespace repolens::scoring
