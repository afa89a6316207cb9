#include "repolens/pipeline/pipeline.hpp"

#include "repolens/cache/key.hpp"
#include "repolens/core/logging.hpp"

#include <algorithm>
#include <asio/post.hpp>
#include <asio/thread_pool.hpp>
#include <cstddef>
#include <expected>
#include <format>
#include <memory>
#include <optional>
#include <span>
#include <stop_token>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace repolens::pipeline {

static auto Log() { return core::logger("pipeline"); }

namespace {

core::Error cancelled() {
  return core::Error{.Message = "Scoring run cancelled",
                     .Kind = core::ErrorKind::Cancelled};
}

} // namespace

std::pair<std::string, std::string> splitFullName(std::string_view FullName) {
  auto Slash = FullName.find('/');
  if (Slash == std::string_view::npos) {
    return {std::string{}, std::string{FullName}};
  }
  return {std::string{FullName.substr(0, Slash)},
          std::string{FullName.substr(Slash + 1)}};
}

std::vector<quality::models::PortfolioEntry>
portfolioEntries(const BatchResult &Batch) {
  std::vector<quality::models::PortfolioEntry> Entries;
  Entries.reserve(Batch.Entries.size());
  for (const auto &Entry : Batch.Entries) {
    quality::models::PortfolioEntry Portfolio{
        .Repo = Entry.Name,
        .Language = Entry.Language,
        .TotalScore = Entry.Scores.Total,
    };
    if (Entry.Assessment) {
      Portfolio.Strengths = Entry.Assessment->Strengths;
      Portfolio.Weaknesses = Entry.Assessment->Weaknesses;
    }
    Entries.push_back(std::move(Portfolio));
  }
  return Entries;
}

Pipeline::Pipeline(std::shared_ptr<github::Source> Source,
                   std::shared_ptr<cache::Cache> Cache,
                   std::shared_ptr<quality::QualityAssessor> Assessor,
                   PipelineOptions Options)
    : Source(std::move(Source)), Cache(std::move(Cache)),
      Assessor(std::move(Assessor)), Options(std::move(Options)) {
  this->Options.Workers = std::max(this->Options.Workers, 1);
}

std::string Pipeline::modelTag() const {
  return std::format("{}:{}", Options.CacheVersion,
                     Assessor ? Assessor->config().Model : std::string{});
}

auto Pipeline::assess(const github::models::RepositorySample &Sample,
                      std::stop_token Stop) const
    -> std::expected<quality::models::QualityAssessment, core::Error> {
  if (!Assessor) {
    return std::unexpected(
        core::Error{.Message = "No quality assessor configured",
                    .Kind = core::ErrorKind::Configuration});
  }

  bool Cached = Cache && Options.UseQualityCache;
  std::string Key;
  if (Cached) {
    Key = cache::makeQualityKey(Sample.FullName, Sample.Readme, Sample.Files,
                                modelTag());
    if (auto Hit = Cache->get<quality::models::QualityAssessment>(
            QualityNamespace, Key, Options.QualityTtl)) {
      Log()->debug("Cached assessment for {}", Sample.FullName);
      return std::move(*Hit);
    }
  }

  auto Result = Assessor->assess(Sample, Stop);
  if (Result && Cached) {
    Cache->set(QualityNamespace, Key, *Result);
  }
  return Result;
}

ScoredRepository
Pipeline::scoreRepository(const github::models::EnrichedRepository &Repository,
                          std::stop_token Stop) const {
  const auto &Record = Repository.Record;
  ScoredRepository Entry{
      .Name = Record.Name,
      .FullName = Record.FullName,
      .Url = Record.HtmlUrl,
      .Language = Record.Language,
  };

  std::optional<double> Quality;
  if (Options.AssessQuality && Source) {
    auto [Owner, Repo] = splitFullName(Record.FullName);
    auto Sample = Source->fetchSample(Owner, Repo);
    auto Assessment = assess(Sample, Stop);
    if (Assessment) {
      if (Assessment->SkillScore) {
        Quality = static_cast<double>(*Assessment->SkillScore);
      }
      Entry.Assessment = std::move(*Assessment);
    } else {
      Log()->warn("Assessment of {} failed ({}): {}", Record.FullName,
                  core::toString(Assessment.error().Kind),
                  Assessment.error().Message);
      Entry.AssessmentError = std::move(Assessment.error());
    }
  }

  Entry.Scores = scoring::score(Repository, Quality);
  return Entry;
}

auto Pipeline::scoreBatch(
    std::span<const github::models::EnrichedRepository> Repos,
    std::stop_token Stop) const -> std::expected<BatchResult, core::Error> {
  auto Count = std::min(Options.Count, Repos.size());
  auto Selected = Repos.first(Count);
  Log()->info("Scoring {} repositories with {} worker(s)", Count,
              Options.Workers);

  std::vector<ScoredRepository> Entries(Count);
  if (Options.Workers == 1 || Count <= 1) {
    for (std::size_t I = 0; I < Count; ++I) {
      if (Stop.stop_requested()) {
        return std::unexpected(cancelled());
      }
      Entries[I] = scoreRepository(Selected[I], Stop);
    }
  } else {
    asio::thread_pool Pool(
        std::min(static_cast<std::size_t>(Options.Workers), Count));
    for (std::size_t I = 0; I < Count; ++I) {
      asio::post(Pool, [this, &Entries, Selected, Stop, I]() {
        if (Stop.stop_requested()) {
          return;
        }
        Entries[I] = scoreRepository(Selected[I], Stop);
      });
    }
    Pool.join();
  }

  if (Stop.stop_requested()) {
    return std::unexpected(cancelled());
  }

  std::vector<scoring::ScoreBreakdown> Scores;
  Scores.reserve(Entries.size());
  for (const auto &Entry : Entries) {
    Scores.push_back(Entry.Scores);
  }

  BatchResult Batch{
      .Entries = std::move(Entries),
      .Averages = scoring::average(Scores),
      .Confidence = scoring::confidence(Scores),
  };
  Log()->info("Scored {} repositories, confidence {}", Batch.Entries.size(),
              Batch.Confidence);
  return Batch;
}

auto Pipeline::summarizePortfolio(std::string_view Username,
                                  const BatchResult &Batch,
                                  std::stop_token Stop) const
    -> std::expected<quality::models::PortfolioAssessment, core::Error> {
  if (!Assessor) {
    return std::unexpected(
        core::Error{.Message = "No quality assessor configured",
                    .Kind = core::ErrorKind::Configuration});
  }
  auto Entries = portfolioEntries(Batch);
  return Assessor->assessPortfolio(Username, Entries, Stop);
}

} // namespace repolens::pipeline
