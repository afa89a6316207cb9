#include "repolens/scoring/aggregate.hpp"

#include <cstddef>
#include <optional>
#include <span>

namespace repolens::scoring {

namespace {

struct Mean {
  double Sum{0.0};
  std::size_t Count{0};

  void add(double Value) {
    Sum += Value;
    ++Count;
  }

  void add(const std::optional<double> &Value) {
    if (Value) {
      add(*Value);
    }
  }

  std::optional<double> value() const {
    if (Count == 0) {
      return std::nullopt;
    }
    return roundTenth(Sum / static_cast<double>(Count));
  }
};

} // namespace

ScoreAverages average(std::span<const ScoreBreakdown> Scores) {
  Mean Activity, Popularity, Health, Hard, Quality, Total;
  for (const auto &Score : Scores) {
    Activity.add(Score.Activity);
    Popularity.add(Score.Popularity);
    Health.add(Score.Health);
    Hard.add(Score.Hard);
    Quality.add(Score.Quality);
    Total.add(Score.Total);
  }
  return ScoreAverages{
      .Activity = Activity.value(),
      .Popularity = Popularity.value(),
      .Health = Health.value(),
      .Hard = Hard.value(),
      .Quality = Quality.value(),
      .Total = Total.value(),
  };
}

int confidence(std::span<const ScoreBreakdown> Scores) {
  if (Scores.empty()) {
    return 0;
  }

  std::size_t Valid = 0;
  for (const auto &Score : Scores) {
    if (Score.Quality) {
      ++Valid;
    }
  }

  int Base = 90;
  if (Scores.size() <= 1) {
    Base = 20;
  } else if (Scores.size() <= 3) {
    Base = 50;
  } else if (Scores.size() <= 5) {
    Base = 70;
  }

  // Integer arithmetic keeps floor(Base * Valid / Size) exact.
  return static_cast<int>(static_cast<std::size_t>(Base) * Valid /
                          Scores.size());
}

} // namespace repolens::scoring
