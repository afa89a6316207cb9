#include "repolens/analytics/summary.hpp"

#include "repolens/core/text.hpp"

#include <algorithm>
#include <cstddef>
#include <format>
#include <limits>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace repolens::analytics {

using github::models::EnrichedRepository;

namespace {

// Unknown push ages sort as very old.
constexpr long long UnknownAge = std::numeric_limits<long long>::max();

template <class Key>
std::vector<EnrichedRepository>
topBy(std::span<const EnrichedRepository> Repos, std::size_t N, Key KeyOf) {
  std::vector<EnrichedRepository> Sorted(Repos.begin(), Repos.end());
  std::ranges::stable_sort(Sorted, [&](const auto &A, const auto &B) {
    return KeyOf(A) < KeyOf(B);
  });
  if (Sorted.size() > N) {
    Sorted.resize(N);
  }
  return Sorted;
}

} // namespace

PortfolioSummary
computeSummary(std::span<const EnrichedRepository> Repos) {
  PortfolioSummary Summary;
  if (Repos.empty()) {
    return Summary;
  }

  Summary.RepoCount = Repos.size();
  Summary.MinStars = std::numeric_limits<int>::max();
  for (const auto &Repo : Repos) {
    const auto &Record = Repo.Record;

    Summary.TotalStars += Record.Stars;
    Summary.MinStars = std::min(Summary.MinStars, Record.Stars);
    Summary.MaxStars = std::max(Summary.MaxStars, Record.Stars);

    Summary.Active30d += Repo.IsActive30 ? 1 : 0;
    Summary.Active90d += Repo.IsActive90 ? 1 : 0;
    Summary.Active365d += Repo.IsActive365 ? 1 : 0;
    if (!Repo.DaysSincePush || *Repo.DaysSincePush > 365) {
      ++Summary.Stale365dPlus;
    }

    Summary.ArchivedCount += Record.Archived ? 1 : 0;
    Summary.LicensedCount += Record.LicenseName ? 1 : 0;

    Summary.TotalOpenIssues += Record.OpenIssues;
    Summary.ReposWithIssues += Record.OpenIssues > 0 ? 1 : 0;
  }
  Summary.AvgStars = static_cast<double>(Summary.TotalStars) /
                     static_cast<double>(Summary.RepoCount);
  return Summary;
}

std::vector<EnrichedRepository>
topByStars(std::span<const EnrichedRepository> Repos, std::size_t N) {
  return topBy(Repos, N,
               [](const EnrichedRepository &R) { return -R.Record.Stars; });
}

std::vector<EnrichedRepository>
topByForks(std::span<const EnrichedRepository> Repos, std::size_t N) {
  return topBy(Repos, N,
               [](const EnrichedRepository &R) { return -R.Record.Forks; });
}

std::vector<EnrichedRepository>
topByRecentPush(std::span<const EnrichedRepository> Repos, std::size_t N) {
  return topBy(Repos, N, [](const EnrichedRepository &R) {
    return R.DaysSincePush.value_or(UnknownAge);
  });
}

std::vector<LanguageCount>
topLanguages(std::span<const EnrichedRepository> Repos, std::size_t N) {
  std::vector<LanguageCount> Counts;
  for (const auto &Repo : Repos) {
    if (!Repo.Record.Language) {
      continue;
    }
    auto It = std::ranges::find(Counts, *Repo.Record.Language,
                                &LanguageCount::Language);
    if (It == Counts.end()) {
      Counts.push_back({.Language = *Repo.Record.Language, .RepoCount = 1});
    } else {
      ++It->RepoCount;
    }
  }

  std::ranges::stable_sort(Counts, [](const auto &A, const auto &B) {
    return A.RepoCount > B.RepoCount;
  });
  if (Counts.size() > N) {
    Counts.resize(N);
  }
  return Counts;
}

std::vector<EnrichedRepository>
searchByName(std::span<const EnrichedRepository> Repos,
             std::string_view Keyword) {
  auto Needle = core::toLower(core::trim(Keyword));
  std::vector<EnrichedRepository> Matches;
  for (const auto &Repo : Repos) {
    if (core::toLower(Repo.Record.Name).find(Needle) != std::string::npos) {
      Matches.push_back(Repo);
    }
  }
  return Matches;
}

std::vector<std::string>
rankingLines(std::span<const EnrichedRepository> Repos, std::size_t N) {
  std::vector<std::string> Lines;
  auto Table = [&](std::string_view Title,
                   const std::vector<EnrichedRepository> &Ranked, auto Value) {
    Lines.push_back(std::format("{}:", Title));
    for (const auto &Repo : Ranked) {
      Lines.push_back(std::format("  {:<40} {}", Repo.Record.Name, Value(Repo)));
    }
  };
  Table("Top by stars", topByStars(Repos, N),
        [](const auto &Repo) { return std::to_string(Repo.Record.Stars); });
  Table("Top by forks", topByForks(Repos, N),
        [](const auto &Repo) { return std::to_string(Repo.Record.Forks); });
  Table("Most recently pushed", topByRecentPush(Repos, N),
        [](const auto &Repo) {
          return Repo.DaysSincePush
                     ? std::format("{} days ago", *Repo.DaysSincePush)
                     : std::string{"unknown"};
        });

  Lines.push_back("Languages:");
  for (const auto &Language : topLanguages(Repos, N)) {
    Lines.push_back(
        std::format("  {:<40} {}", Language.Language, Language.RepoCount));
  }
  return Lines;
}

} // namespace repolens::analytics
