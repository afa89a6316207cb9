#include "repolens/quality/validate.hpp"

#include "repolens/core/coerce.hpp"
#include "repolens/core/text.hpp"

#include <algorithm>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace repolens::quality {

std::optional<int> clampSkillScore(const glz::generic *Value) {
  auto Score = core::toOptionalInteger(Value);
  if (!Score) {
    return std::nullopt;
  }
  return static_cast<int>(std::clamp<long long>(*Score, 0, 100));
}

std::vector<std::string> normalizeBullets(const glz::generic *Value,
                                          std::string_view Fallback) {
  std::vector<std::string> Bullets;
  Bullets.reserve(BulletCount);

  if (Value != nullptr) {
    if (const auto *Items = std::get_if<glz::generic::array_t>(&Value->data)) {
      for (const auto &Item : *Items) {
        if (Bullets.size() == BulletCount) {
          break;
        }
        // null entries carry nothing worth showing.
        if (auto Text = core::toOptionalString(&Item)) {
          Bullets.push_back(std::move(*Text));
        }
      }
    }
  }

  while (Bullets.size() < BulletCount) {
    Bullets.emplace_back(Fallback);
  }
  return Bullets;
}

models::QualityAssessment validateAssessment(const glz::generic &Value,
                                             std::string_view Raw) {
  return models::QualityAssessment{
      .RepoSummary = core::truncate(
          core::toString(core::field(Value, "repo_summary")), SummaryChars),
      .Strengths =
          normalizeBullets(core::field(Value, "strengths"), StrengthFallback),
      .Weaknesses =
          normalizeBullets(core::field(Value, "weaknesses"), WeaknessFallback),
      .SuggestedImprovements = normalizeBullets(
          core::field(Value, "suggested_improvements"), ImprovementFallback),
      .SkillScore = clampSkillScore(core::field(Value, "skill_score")),
      .Notes = core::truncate(core::toString(core::field(Value, "notes")),
                              NotesChars),
      .RawOutput = std::string{Raw},
  };
}

models::PortfolioAssessment validatePortfolio(const glz::generic &Value,
                                              std::string_view Raw) {
  return models::PortfolioAssessment{
      .Headline = core::truncate(
          core::toString(core::field(Value, "headline")), HeadlineChars),
      .RecruiterSummary =
          core::truncate(core::toString(core::field(Value, "recruiter_summary")),
                         RecruiterSummaryChars),
      .TopStrengths = normalizeBullets(core::field(Value, "top_strengths"),
                                       PortfolioStrengthFallback),
      .TopRisks = normalizeBullets(core::field(Value, "top_risks"),
                                   PortfolioRiskFallback),
      .RawOutput = std::string{Raw},
  };
}

} // namespace repolens::quality
