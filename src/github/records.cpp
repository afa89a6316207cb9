#include "repolens/github/records.hpp"

#include "repolens/core/coerce.hpp"
#include "repolens/core/logging.hpp"

#include <expected>
#include <format>
#include <glaze/json/read.hpp>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace repolens::github {

static auto Log() { return core::logger("github"); }

models::RepositoryRecord parseRepository(const glz::generic &Value) {
  models::RepositoryRecord Record{
      .Name = core::toString(core::field(Value, "name")),
      .FullName = core::toString(core::field(Value, "full_name")),
      .HtmlUrl = core::toString(core::field(Value, "html_url")),
      .Language = core::toOptionalString(core::field(Value, "language")),
      .Stars = core::toCount(core::field(Value, "stargazers_count")),
      .Forks = core::toCount(core::field(Value, "forks_count")),
      .OpenIssues = core::toCount(core::field(Value, "open_issues_count")),
      .SizeKb = core::toCount(core::field(Value, "size")),
      .Archived = core::toBool(core::field(Value, "archived")),
      .CreatedAt = core::toOptionalString(core::field(Value, "created_at")),
      .UpdatedAt = core::toOptionalString(core::field(Value, "updated_at")),
      .PushedAt = core::toOptionalString(core::field(Value, "pushed_at")),
  };

  // license is either null or an object carrying a name.
  if (const auto *License = core::field(Value, "license")) {
    Record.LicenseName = core::toOptionalString(core::field(*License, "name"));
  }
  return Record;
}

auto parseRepositories(const glz::generic &Value)
    -> std::expected<std::vector<models::RepositoryRecord>, core::Error> {
  const auto *Items = std::get_if<glz::generic::array_t>(&Value.data);
  if (Items == nullptr) {
    return std::unexpected(core::Error{
        .Message = "Expected a JSON array of repositories",
        .Kind = core::ErrorKind::ContractViolation,
    });
  }

  std::vector<models::RepositoryRecord> Records;
  Records.reserve(Items->size());
  for (const auto &Item : *Items) {
    if (!std::holds_alternative<glz::generic::object_t>(Item.data)) {
      Log()->debug("Skipping non-object repository entry");
      continue;
    }
    Records.push_back(parseRepository(Item));
  }
  return Records;
}

auto parseRepositories(std::string_view Body)
    -> std::expected<std::vector<models::RepositoryRecord>, core::Error> {
  glz::generic Value{};
  std::string Buffer{Body};
  if (auto Ec = glz::read_json(Value, Buffer)) {
    return std::unexpected(core::Error{
        .Message = std::format("Parse failed: {}", glz::format_error(Ec, Buffer)),
        .Kind = core::ErrorKind::ContractViolation,
    });
  }
  return parseRepositories(Value);
}

} // namespace repolens::github
