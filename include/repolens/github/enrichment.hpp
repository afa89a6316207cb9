#pragma once
#include "repolens/core/timestamp.hpp"
#include "repolens/github/models.hpp"

#include <optional>
#include <span>
#include <vector>

namespace repolens::github {

// Whole days from Then to Now, floored. Negative when Then lies in the future.
long long daysBetween(core::Timestamp Then, core::Timestamp Now);

// Derives push age and activity windows. The record is copied, never
// modified, and a bad timestamp only leaves the derived fields unknown.
models::EnrichedRepository enrich(const models::RepositoryRecord &Record,
                                  core::Timestamp Now);

std::vector<models::EnrichedRepository>
enrichAll(std::span<const models::RepositoryRecord> Records,
          core::Timestamp Now);

} // namespace repolens::github
