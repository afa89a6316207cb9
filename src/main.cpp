#include <array>
#include <asio/io_context.hpp>
#include <asio/signal_set.hpp>
#include <charconv>
#include <chrono>
#include <csignal>
#include <cstddef>
#include <format>
#include <memory>
#include <optional>
#include <span>
#include <stop_token>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <vector>

#include "repolens/analytics/summary.hpp"
#include "repolens/cache/cache.hpp"
#include "repolens/core/config.hpp"
#include "repolens/core/logging.hpp"
#include "repolens/core/timestamp.hpp"
#include "repolens/db/db.hpp"
#include "repolens/github/enrichment.hpp"
#include "repolens/github/source.hpp"
#include "repolens/pipeline/persist.hpp"
#include "repolens/pipeline/pipeline.hpp"
#include "repolens/quality/assessor.hpp"
#include "repolens/quality/provider.hpp"
#include "spdlog/spdlog.h"

namespace {

constexpr std::array<std::string_view, 2> CacheNamespaces{
    "github", repolens::pipeline::QualityNamespace};

struct Options {
  std::string Username;
  std::size_t Count{10};
  bool Portfolio{false};
  bool ClearCache{false};
  std::optional<std::string> Namespace;
  bool History{false};
  std::optional<std::string> RunId;
  std::optional<std::string> Search;
};

constexpr std::size_t RankingSize = 5;

void printUsage() {
  spdlog::info(
      "Usage: repolens <username> [count] [--portfolio] [--search <term>]");
  spdlog::info("       repolens --history [run_id]");
  spdlog::info("       repolens --clear-cache [namespace]");
}

std::optional<Options> parseArgs(int Argc, char **Argv) {
  std::vector<std::string_view> Args(Argv + 1, Argv + Argc);
  if (Args.empty()) {
    return std::nullopt;
  }

  Options Opts;
  if (Args[0] == "--clear-cache") {
    Opts.ClearCache = true;
    if (Args.size() > 1) {
      Opts.Namespace = std::string{Args[1]};
    }
    return Opts;
  }

  if (Args[0] == "--history") {
    Opts.History = true;
    if (Args.size() > 1) {
      Opts.RunId = std::string{Args[1]};
    }
    return Opts;
  }

  for (std::size_t I = 0; I < Args.size(); ++I) {
    auto Arg = Args[I];
    if (Arg == "--portfolio") {
      Opts.Portfolio = true;
    } else if (Arg == "--search") {
      if (I + 1 == Args.size()) {
        spdlog::error("--search needs a term");
        return std::nullopt;
      }
      Opts.Search = std::string{Args[++I]};
    } else if (Opts.Username.empty()) {
      Opts.Username = std::string{Arg};
    } else {
      std::size_t Count = 0;
      auto [Ptr, Ec] =
          std::from_chars(Arg.data(), Arg.data() + Arg.size(), Count);
      if (Ec != std::errc{} || Ptr != Arg.data() + Arg.size() || Count == 0) {
        spdlog::error("Invalid repository count '{}'", Arg);
        return std::nullopt;
      }
      Opts.Count = Count;
    }
  }
  if (Opts.Username.empty()) {
    return std::nullopt;
  }
  return Opts;
}

int clearCache(const repolens::cache::Cache &Cache,
               const std::optional<std::string> &Namespace) {
  std::vector<std::string_view> Targets;
  if (Namespace) {
    Targets.push_back(*Namespace);
  } else {
    Targets.assign(CacheNamespaces.begin(), CacheNamespaces.end());
  }

  for (auto Target : Targets) {
    auto Removed = Cache.clear(Target);
    if (!Removed) {
      spdlog::error(Removed.error().Message);
      return 1;
    }
    spdlog::info("Cleared {} entries from cache namespace '{}'", *Removed,
                 Target);
  }
  return 0;
}

void report(const repolens::analytics::PortfolioSummary &Summary) {
  spdlog::info("Repositories: {} | Stars: {} (avg {:.1f}, min {}, max {})",
               Summary.RepoCount, Summary.TotalStars, Summary.AvgStars,
               Summary.MinStars, Summary.MaxStars);
  spdlog::info("Active: {} (30d) / {} (90d) / {} (365d) | Stale: {}",
               Summary.Active30d, Summary.Active90d, Summary.Active365d,
               Summary.Stale365dPlus);
  spdlog::info("Archived: {} | Licensed: {} | With issues: {} ({} open)",
               Summary.ArchivedCount, Summary.LicensedCount,
               Summary.ReposWithIssues, Summary.TotalOpenIssues);
}

void reportSearch(
    std::span<const repolens::github::models::EnrichedRepository> Repos,
    std::string_view Term) {
  auto Matches = repolens::analytics::searchByName(Repos, Term);
  spdlog::info("{} repositories match '{}'", Matches.size(), Term);
  for (const auto &Repo : Matches) {
    spdlog::info("  {:<40} {}", Repo.Record.Name, Repo.Record.HtmlUrl);
  }
}

int showHistory(repolens::db::Database &Database,
                const std::optional<std::string> &RunId) {
  if (!RunId) {
    auto Runs = repolens::pipeline::recentRuns(Database);
    if (!Runs) {
      spdlog::error(Runs.error().Message);
      return 1;
    }
    if (Runs->empty()) {
      spdlog::info("No saved runs yet.");
    }
    for (const auto &Run : *Runs) {
      spdlog::info("{}  {:<24} {:>3} repos  {}",
                   repolens::core::formatTimestamp(Run.CreatedAt),
                   Run.Username, Run.RepoCount, Run.Id);
    }
    return 0;
  }

  auto History = repolens::pipeline::loadRun(Database, *RunId);
  if (!History) {
    spdlog::error(History.error().Message);
    return 1;
  }
  spdlog::info("Run {} for {} ({} repos, {})", History->Run.Id,
               History->Run.Username, History->Run.RepoCount,
               repolens::core::formatTimestamp(History->Run.CreatedAt));
  for (const auto &Score : History->Scores) {
    spdlog::info("{:<40} total {:>5.1f} | hard {:>5.1f} | quality {:>5} | "
                 "activity {:>5.1f} popularity {:>5.1f} health {:>5.1f}",
                 Score.RepoName, Score.TotalScore, Score.HardScore,
                 Score.QualityScore
                     ? std::format("{:.1f}", *Score.QualityScore)
                     : std::string{"-"},
                 Score.ActivityScore, Score.PopularityScore,
                 Score.HealthScore);
    spdlog::info("    {}", Score.RepoUrl);
    if (!Score.Notes.empty()) {
      spdlog::info("    {}", Score.Notes);
    }
  }
  return 0;
}

void report(const repolens::pipeline::BatchResult &Batch) {
  for (const auto &Entry : Batch.Entries) {
    const auto &S = Entry.Scores;
    spdlog::info("{:<40} total {:>5.1f} | hard {:>5.1f} | quality {:>5} | "
                 "activity {:>5.1f} popularity {:>5.1f} health {:>5.1f}",
                 Entry.FullName, S.Total, S.Hard,
                 S.Quality ? std::format("{:.1f}", *S.Quality) : "-",
                 S.Activity, S.Popularity, S.Health);
    if (Entry.Assessment && !Entry.Assessment->RepoSummary.empty()) {
      spdlog::info("    {}", Entry.Assessment->RepoSummary);
    }
    if (Entry.AssessmentError) {
      spdlog::warn("    assessment unavailable: {}",
                   Entry.AssessmentError->Message);
    }
  }

  auto Show = [](const std::optional<double> &Value) {
    return Value ? std::format("{:.1f}", *Value) : std::string{"-"};
  };
  const auto &A = Batch.Averages;
  spdlog::info("Averages: total {} | hard {} | quality {} | activity {} | "
               "popularity {} | health {}",
               Show(A.Total), Show(A.Hard), Show(A.Quality), Show(A.Activity),
               Show(A.Popularity), Show(A.Health));
  spdlog::info("Confidence: {}/100", Batch.Confidence);
}

} // namespace

int main(int Argc, char **Argv) {
  auto Config = repolens::core::Config::load();
  if (!Config) {
    spdlog::error(Config.error().Message);
    return 1;
  }
  repolens::core::setupLogging(*Config);

  auto Opts = parseArgs(Argc, Argv);
  if (!Opts) {
    printUsage();
    return 2;
  }

  auto Cache = std::make_shared<repolens::cache::Cache>(Config->CacheDir);
  if (Opts->ClearCache) {
    return clearCache(*Cache, Opts->Namespace);
  }

  if (Opts->History) {
    if (!Config->DatabaseUrl) {
      spdlog::error("DATABASE_URL is not set; no run history available.");
      return 1;
    }
    auto Database = repolens::db::Database::connect(*Config->DatabaseUrl);
    if (!Database) {
      spdlog::error(Database.error().Message);
      return 1;
    }
    return showHistory(**Database, Opts->RunId);
  }

  auto Source = repolens::github::HttpSource::create(
      {.Token = Config->GitHubToken,
       .CacheTtl = std::chrono::minutes(Config->GitHubCacheMinutes)},
      Cache);
  if (!Source) {
    spdlog::error(Source.error().Message);
    return 1;
  }

  std::shared_ptr<repolens::quality::Provider> Provider;
  if (Config->GroqApiKey) {
    auto Groq = repolens::quality::GroqProvider::create(*Config->GroqApiKey);
    if (!Groq) {
      spdlog::error(Groq.error().Message);
      return 1;
    }
    Provider = *Groq;
  } else {
    spdlog::warn("GROQ_API_KEY is not set. Scoring without quality signal.");
  }

  auto Assessor = std::make_shared<repolens::quality::QualityAssessor>(
      repolens::quality::AssessorConfig{.ApiKey = Config->GroqApiKey,
                                        .Model = Config->GroqModel},
      Provider);

  repolens::pipeline::Pipeline Pipeline(
      *Source, Cache, Assessor,
      {.Count = Opts->Count,
       .AssessQuality = Provider != nullptr,
       .QualityTtl = std::chrono::minutes(Config->QualityCacheMinutes),
       .CacheVersion = Config->QualityCacheVersion,
       .Workers = Config->Workers});

  // SIGINT / SIGTERM stop the run between attempts and during backoff waits.
  std::stop_source StopSource;
  asio::io_context IOContext;
  asio::signal_set Signals(IOContext, SIGINT, SIGTERM);
  Signals.async_wait([&StopSource](const std::error_code &ErrorCode, int) {
    if (ErrorCode) {
      return;
    }
    spdlog::info("Shutdown signal received.");
    StopSource.request_stop();
  });
  std::thread SignalThread([&IOContext]() { IOContext.run(); });
  auto StopSignals = [&]() {
    Signals.cancel();
    IOContext.stop();
    if (SignalThread.joinable()) {
      SignalThread.join();
    }
  };

  auto Records = (*Source)->listRepositories(Opts->Username);
  if (!Records) {
    spdlog::error(Records.error().Message);
    StopSignals();
    return 1;
  }

  auto Repos = repolens::github::enrichAll(*Records,
                                           repolens::core::systemClock()());
  report(repolens::analytics::computeSummary(Repos));
  for (const auto &Line :
       repolens::analytics::rankingLines(Repos, RankingSize)) {
    spdlog::info(Line);
  }
  if (Opts->Search) {
    reportSearch(Repos, *Opts->Search);
  }

  auto Batch = Pipeline.scoreBatch(Repos, StopSource.get_token());
  if (!Batch) {
    spdlog::error(Batch.error().Message);
    StopSignals();
    return 1;
  }
  report(*Batch);

  if (Opts->Portfolio) {
    auto Portfolio = Pipeline.summarizePortfolio(Opts->Username, *Batch,
                                                 StopSource.get_token());
    if (Portfolio) {
      spdlog::info("{}", Portfolio->Headline);
      spdlog::info("{}", Portfolio->RecruiterSummary);
      for (const auto &Strength : Portfolio->TopStrengths) {
        spdlog::info("  + {}", Strength);
      }
      for (const auto &Risk : Portfolio->TopRisks) {
        spdlog::info("  - {}", Risk);
      }
    } else {
      spdlog::error(Portfolio.error().Message);
    }
  }
  StopSignals();

  if (Config->DatabaseUrl) {
    spdlog::info("Connecting to database.");
    auto Database = repolens::db::Database::connect(*Config->DatabaseUrl);
    if (!Database) {
      spdlog::error(Database.error().Message);
      return 1;
    }
    auto Run = repolens::pipeline::persistRun(
        **Database, Opts->Username, static_cast<int>(Batch->Entries.size()),
        *Batch);
    if (!Run) {
      spdlog::error(Run.error().Message);
      return 1;
    }
    spdlog::info("Saved run {}", Run->Id);
  }

  return 0;
}
