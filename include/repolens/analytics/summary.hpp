#pragma once
#include "repolens/github/models.hpp"

#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace repolens::analytics {

struct PortfolioSummary {
  std::size_t RepoCount{0};
  long long TotalStars{0};
  double AvgStars{0.0};
  int MinStars{0};
  int MaxStars{0};
  std::size_t Active30d{0};
  std::size_t Active90d{0};
  std::size_t Active365d{0};
  // Never pushed, unparsable push time, or pushed more than a year ago.
  std::size_t Stale365dPlus{0};
  std::size_t ArchivedCount{0};
  std::size_t LicensedCount{0};
  std::size_t ReposWithIssues{0};
  long long TotalOpenIssues{0};
};

struct LanguageCount {
  std::string Language;
  std::size_t RepoCount{0};
};

// All zeros for an empty batch.
PortfolioSummary
computeSummary(std::span<const github::models::EnrichedRepository> Repos);

std::vector<github::models::EnrichedRepository>
topByStars(std::span<const github::models::EnrichedRepository> Repos,
           std::size_t N = 10);

std::vector<github::models::EnrichedRepository>
topByForks(std::span<const github::models::EnrichedRepository> Repos,
           std::size_t N = 10);

// Most recently pushed first. Repositories with an unknown push age sort
// after every known one.
std::vector<github::models::EnrichedRepository>
topByRecentPush(std::span<const github::models::EnrichedRepository> Repos,
                std::size_t N = 10);

// Repositories without a language are ignored. Equal counts keep the order
// in which the languages first appeared.
std::vector<LanguageCount>
topLanguages(std::span<const github::models::EnrichedRepository> Repos,
             std::size_t N = 10);

// Case-insensitive substring match on the repository name.
std::vector<github::models::EnrichedRepository>
searchByName(std::span<const github::models::EnrichedRepository> Repos,
             std::string_view Keyword);

// Printable top-N tables: stars, forks, most recent push and languages, each
// a heading line followed by one indented line per entry.
std::vector<std::string>
rankingLines(std::span<const github::models::EnrichedRepository> Repos,
             std::size_t N = 5);

} // namespace repolens::analytics
