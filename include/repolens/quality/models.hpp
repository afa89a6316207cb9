#pragma once
#include <glaze/core/meta.hpp>

#include <optional>
#include <string>
#include <vector>

namespace repolens::quality::models {

// Validated result of a single repository assessment. The three lists always
// hold exactly three entries.
struct QualityAssessment {
  std::string RepoSummary;
  std::vector<std::string> Strengths;
  std::vector<std::string> Weaknesses;
  std::vector<std::string> SuggestedImprovements;
  std::optional<int> SkillScore;
  std::string Notes;
  // Unparsed provider reply, kept for diagnostics only.
  std::string RawOutput;
};

struct PortfolioAssessment {
  std::string Headline;
  std::string RecruiterSummary;
  std::vector<std::string> TopStrengths;
  std::vector<std::string> TopRisks;
  std::string RawOutput;
};

// Compact view of one scored repository, the input of a portfolio assessment.
struct PortfolioEntry {
  std::string Repo;
  std::optional<std::string> Language;
  double TotalScore{0.0};
  std::vector<std::string> Strengths;
  std::vector<std::string> Weaknesses;
};

} // namespace repolens::quality::models

template <> struct glz::meta<repolens::quality::models::QualityAssessment> {
  using T = repolens::quality::models::QualityAssessment;
  static constexpr auto value = glz::object(
      "repo_summary", &T::RepoSummary,
      "strengths", &T::Strengths,
      "weaknesses", &T::Weaknesses,
      "suggested_improvements", &T::SuggestedImprovements,
      "skill_score", &T::SkillScore,
      "notes", &T::Notes,
      "raw_output", &T::RawOutput);
};

template <> struct glz::meta<repolens::quality::models::PortfolioAssessment> {
  using T = repolens::quality::models::PortfolioAssessment;
  static constexpr auto value = glz::object(
      "headline", &T::Headline,
      "recruiter_summary", &T::RecruiterSummary,
      "top_strengths", &T::TopStrengths,
      "top_risks", &T::TopRisks,
      "raw_output", &T::RawOutput);
};

template <> struct glz::meta<repolens::quality::models::PortfolioEntry> {
  using T = repolens::quality::models::PortfolioEntry;
  static constexpr auto value = glz::object(
      "repo", &T::Repo,
      "language", &T::Language,
      "total_score", &T::TotalScore,
      "strengths", &T::Strengths,
      "weaknesses", &T::Weaknesses);
};
