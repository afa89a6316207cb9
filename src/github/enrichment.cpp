#include "repolens/github/enrichment.hpp"

#include <chrono>
#include <span>
#include <vector>

namespace repolens::github {

long long daysBetween(core::Timestamp Then, core::Timestamp Now) {
  return std::chrono::floor<std::chrono::days>(Now - Then).count();
}

models::EnrichedRepository enrich(const models::RepositoryRecord &Record,
                                  core::Timestamp Now) {
  models::EnrichedRepository Enriched{.Record = Record};

  if (Record.PushedAt) {
    Enriched.PushedInstant = core::parseTimestamp(*Record.PushedAt);
  }
  if (Enriched.PushedInstant) {
    auto Days = daysBetween(*Enriched.PushedInstant, Now);
    Enriched.DaysSincePush = Days;
    Enriched.IsActive30 = Days <= 30;
    Enriched.IsActive90 = Days <= 90;
    Enriched.IsActive365 = Days <= 365;
  }
  return Enriched;
}

std::vector<models::EnrichedRepository>
enrichAll(std::span<const models::RepositoryRecord> Records,
          core::Timestamp Now) {
  std::vector<models::EnrichedRepository> Enriched;
  Enriched.reserve(Records.size());
  for (const auto &Record : Records) {
    Enriched.push_back(enrich(Record, Now));
  }
  return Enriched;
}

} // namespace repolens::github
