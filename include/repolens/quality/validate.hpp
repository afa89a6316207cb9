#pragma once
#include "repolens/quality/models.hpp"

#include <glaze/json/generic.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace repolens::quality {

inline constexpr std::size_t SummaryChars = 220;
inline constexpr std::size_t NotesChars = 220;
inline constexpr std::size_t HeadlineChars = 90;
inline constexpr std::size_t RecruiterSummaryChars = 600;
inline constexpr std::size_t BulletCount = 3;

inline constexpr std::string_view StrengthFallback =
    "Not enough evidence in sample to make a confident strength.";
inline constexpr std::string_view WeaknessFallback =
    "Not enough evidence in sample to make a confident weakness.";
inline constexpr std::string_view ImprovementFallback =
    "Add a README with setup, usage, and project goals.";
inline constexpr std::string_view PortfolioStrengthFallback =
    "Not enough evidence to identify a clear strength.";
inline constexpr std::string_view PortfolioRiskFallback =
    "Not enough evidence to identify a clear risk.";

// Integer in [0, 100], or std::nullopt when Value cannot be read as a number.
std::optional<int> clampSkillScore(const glz::generic *Value);

// Exactly BulletCount strings: the first entries of Value when it is an
// array, padded with Fallback. A non-array Value counts as empty.
std::vector<std::string> normalizeBullets(const glz::generic *Value,
                                          std::string_view Fallback);

models::QualityAssessment validateAssessment(const glz::generic &Value,
                                             std::string_view Raw);

models::PortfolioAssessment validatePortfolio(const glz::generic &Value,
                                              std::string_view Raw);

} // namespace repolens::quality
