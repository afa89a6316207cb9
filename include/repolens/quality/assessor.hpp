#pragma once
#include "repolens/core/result.hpp"
#include "repolens/github/models.hpp"
#include "repolens/quality/models.hpp"
#include "repolens/quality/provider.hpp"
#include "repolens/quality/retry.hpp"

#include <cstddef>
#include <expected>
#include <memory>
#include <optional>
#include <span>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace repolens::quality {

inline constexpr std::size_t ReadmeChars = 2000;
inline constexpr std::size_t FileChars = 2000;
inline constexpr std::size_t MinifiedLineChars = 500;
inline constexpr std::size_t MaxSampleFiles = 4;
inline constexpr std::size_t PreviewChars = 300;
inline constexpr std::size_t MaxPortfolioEntries = 12;
inline constexpr std::size_t PortfolioBullets = 2;

struct AssessorConfig {
  std::optional<std::string> ApiKey;
  std::string Model{"llama-3.1-8b-instant"};
  double Temperature{0.2};
  int MaxTokens{900};
  int PortfolioMaxTokens{600};
};

// True when any line is longer than MinifiedLineChars.
bool looksMinified(std::string_view Content);

// Source and text files worth showing to the evaluator.
bool isAssessableFile(std::string_view Path);

// Bounds the prompt: README truncated, minified and unrecognised files
// dropped, contents truncated, at most MaxSampleFiles files.
github::models::RepositorySample
cleanSample(const github::models::RepositorySample &Sample);

// At most MaxPortfolioEntries entries with PortfolioBullets strengths and
// weaknesses each.
std::vector<models::PortfolioEntry>
compactPortfolio(std::span<const models::PortfolioEntry> Entries);

std::string buildAssessmentPrompt(const github::models::RepositorySample &Cleaned);

std::string buildPortfolioPrompt(std::string_view Username,
                                 std::span<const models::PortfolioEntry> Compact);

// Wraps the external evaluator and enforces its output contract.
//
// Every call makes up to Policy.MaxAttempts attempts with Policy.Delay between
// them. An attempt fails on a transport error or when no JSON object can be
// recovered from the reply; a recovered object is validated into the fixed
// shape and returned. When every attempt fails the error carries the last
// failure and a preview of the last reply. A missing API key, or one the
// provider rejects, is reported at once as a configuration error. A stop
// request ends the loop before the next attempt or during a backoff wait.
class QualityAssessor {
public:
  QualityAssessor(AssessorConfig Config, std::shared_ptr<Provider> Evaluator,
                  RetryPolicy Policy = {});

  auto assess(const github::models::RepositorySample &Sample,
              std::stop_token Stop = {}) const
      -> std::expected<models::QualityAssessment, core::Error>;

  auto assessPortfolio(std::string_view Username,
                       std::span<const models::PortfolioEntry> Entries,
                       std::stop_token Stop = {}) const
      -> std::expected<models::PortfolioAssessment, core::Error>;

  const AssessorConfig &config() const { return Config; }

private:
  template <class T, class Validator>
  auto invoke(const ChatRequest &Request, std::string_view Label,
              std::stop_token Stop, Validator Validate) const
      -> std::expected<T, core::Error>;

  std::optional<core::Error> checkCredentials() const;

  AssessorConfig Config;
  std::shared_ptr<Provider> Evaluator;
  RetryPolicy Policy;
};

} // namespace repolens::quality
