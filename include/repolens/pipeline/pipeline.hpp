#pragma once
#include "repolens/cache/cache.hpp"
#include "repolens/core/result.hpp"
#include "repolens/github/models.hpp"
#include "repolens/github/source.hpp"
#include "repolens/quality/assessor.hpp"
#include "repolens/quality/models.hpp"
#include "repolens/scoring/aggregate.hpp"
#include "repolens/scoring/scoring.hpp"

#include <chrono>
#include <cstddef>
#include <expected>
#include <memory>
#include <optional>
#include <span>
#include <stop_token>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace repolens::pipeline {

inline constexpr std::string_view QualityNamespace = "quality";

struct PipelineOptions {
  // How many of the given repositories to score, in input order.
  std::size_t Count{10};
  bool AssessQuality{true};
  bool UseQualityCache{true};
  std::chrono::seconds QualityTtl{std::chrono::hours(24)};
  // Bumping the version invalidates every cached assessment.
  std::string CacheVersion{"groq_v1"};
  int Workers{1};
};

struct ScoredRepository {
  std::string Name;
  std::string FullName;
  std::string Url;
  std::optional<std::string> Language;
  scoring::ScoreBreakdown Scores;
  std::optional<quality::models::QualityAssessment> Assessment;
  // Set when an assessment was requested and failed. The entry is still
  // scored, without a quality signal.
  std::optional<core::Error> AssessmentError;
};

struct BatchResult {
  std::vector<ScoredRepository> Entries;
  scoring::ScoreAverages Averages;
  int Confidence{0};
};

// Drives a scoring run: sample, assess through the cache, score, aggregate.
class Pipeline {
public:
  Pipeline(std::shared_ptr<github::Source> Source,
           std::shared_ptr<cache::Cache> Cache,
           std::shared_ptr<quality::QualityAssessor> Assessor,
           PipelineOptions Options);

  // Cached assessment of one sample. Only successful assessments are stored.
  auto assess(const github::models::RepositorySample &Sample,
              std::stop_token Stop = {}) const
      -> std::expected<quality::models::QualityAssessment, core::Error>;

  ScoredRepository
  scoreRepository(const github::models::EnrichedRepository &Repository,
                  std::stop_token Stop = {}) const;

  // Scores the first Options.Count repositories with up to Options.Workers
  // in flight. Entries keep input order. Fails only when stopped.
  auto scoreBatch(std::span<const github::models::EnrichedRepository> Repos,
                  std::stop_token Stop = {}) const
      -> std::expected<BatchResult, core::Error>;

  auto summarizePortfolio(std::string_view Username, const BatchResult &Batch,
                          std::stop_token Stop = {}) const
      -> std::expected<quality::models::PortfolioAssessment, core::Error>;

  const PipelineOptions &options() const { return Options; }

private:
  std::string modelTag() const;

  std::shared_ptr<github::Source> Source;
  std::shared_ptr<cache::Cache> Cache;
  std::shared_ptr<quality::QualityAssessor> Assessor;
  PipelineOptions Options;
};

// Entries of a batch as the portfolio assessment sees them.
std::vector<quality::models::PortfolioEntry>
portfolioEntries(const BatchResult &Batch);

// Splits "owner/name". The owner is empty when there is no slash.
std::pair<std::string, std::string> splitFullName(std::string_view FullName);

} // namespace repolens::pipeline
