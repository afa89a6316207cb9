#include "repolens/quality/extract.hpp"

#include "repolens/core/text.hpp"

#include <format>
#include <glaze/json/read.hpp>
#include <string>
#include <string_view>
#include <variant>

namespace repolens::quality {

namespace {

// Parses Text and insists on an object at the top level.
ParseOutcome parseObject(std::string_view Text, ParseStrategy Strategy) {
  ParseOutcome Outcome{.Status = ParseStatus::Malformed, .Strategy = Strategy};
  std::string Buffer{Text};
  if (auto Ec = glz::read_json(Outcome.Value, Buffer)) {
    Outcome.Error = glz::format_error(Ec, Buffer);
    return Outcome;
  }
  if (!std::holds_alternative<glz::generic::object_t>(Outcome.Value.data)) {
    Outcome.Error = "Top level JSON value is not an object";
    return Outcome;
  }
  Outcome.Status = ParseStatus::Success;
  return Outcome;
}

void replaceAll(std::string &Text, std::string_view From) {
  for (auto Pos = Text.find(From); Pos != std::string::npos;
       Pos = Text.find(From, Pos)) {
    Text.erase(Pos, From.size());
  }
}

} // namespace

std::string stripCodeFences(std::string_view Text) {
  std::string Cleaned = core::trim(Text);
  replaceAll(Cleaned, "```json");
  replaceAll(Cleaned, "```");
  return core::trim(Cleaned);
}

ParseOutcome extractJson(std::string_view Text) {
  auto Trimmed = core::trim(Text);
  if (Trimmed.empty()) {
    return ParseOutcome{.Status = ParseStatus::Empty,
                        .Error = "Empty response"};
  }

  auto Direct = parseObject(Trimmed, ParseStrategy::Direct);
  if (Direct.ok()) {
    return Direct;
  }

  auto Cleaned = stripCodeFences(Trimmed);
  auto Stripped = parseObject(Cleaned, ParseStrategy::FenceStripped);
  if (Stripped.ok()) {
    return Stripped;
  }

  auto Open = Cleaned.find('{');
  auto Close = Cleaned.rfind('}');
  if (Open == std::string::npos || Close == std::string::npos ||
      Close < Open) {
    return ParseOutcome{
        .Status = ParseStatus::Malformed,
        .Strategy = ParseStrategy::BraceSearch,
        .Error = std::format("No JSON object found in model output ({})",
                             Stripped.Error),
    };
  }
  return parseObject(std::string_view{Cleaned}.substr(Open, Close - Open + 1),
                     ParseStrategy::BraceSearch);
}

} // namespace repolens::quality
