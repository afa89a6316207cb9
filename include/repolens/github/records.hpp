#pragma once
#include "repolens/core/result.hpp"
#include "repolens/github/models.hpp"

#include <glaze/json/generic.hpp>

#include <expected>
#include <string_view>
#include <vector>

namespace repolens::github {

// Reads one repository object. Wrong or missing fields degrade to zero, false
// or std::nullopt; this never fails.
models::RepositoryRecord parseRepository(const glz::generic &Value);

// Reads a JSON array of repository objects. Non-object elements are skipped.
// Fails only when Body is not JSON or not an array.
auto parseRepositories(std::string_view Body)
    -> std::expected<std::vector<models::RepositoryRecord>, core::Error>;

auto parseRepositories(const glz::generic &Value)
    -> std::expected<std::vector<models::RepositoryRecord>, core::Error>;

} // namespace repolens::github
