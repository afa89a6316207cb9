#pragma once
#include "repolens/scoring/scoring.hpp"

#include <optional>
#include <span>

namespace repolens::scoring {

// Per-field means over a batch, rounded to one decimal place. A field is
// averaged over the entries where it is present, independently of the
// others; std::nullopt means no entry carried it.
struct ScoreAverages {
  std::optional<double> Activity;
  std::optional<double> Popularity;
  std::optional<double> Health;
  std::optional<double> Hard;
  std::optional<double> Quality;
  std::optional<double> Total;
};

ScoreAverages average(std::span<const ScoreBreakdown> Scores);

// How far the batch averages can be trusted, 0-100. Batch size caps the
// value (1 → 20, ≤3 → 50, ≤5 → 70, more → 90) and the share of entries
// with a quality score scales it down.
int confidence(std::span<const ScoreBreakdown> Scores);

} // namespace repolens::scoring
