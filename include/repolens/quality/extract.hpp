#pragma once
#include <glaze/json/generic.hpp>

#include <string>
#include <string_view>

namespace repolens::quality {

enum class ParseStatus { Success, Malformed, Empty };

// Which strategy produced the value, in the order they are tried.
enum class ParseStrategy { None, Direct, FenceStripped, BraceSearch };

struct ParseOutcome {
  ParseStatus Status{ParseStatus::Empty};
  ParseStrategy Strategy{ParseStrategy::None};
  glz::generic Value{};
  // Why the last strategy failed. Empty on success.
  std::string Error;

  bool ok() const { return Status == ParseStatus::Success; }
};

// Removes ```json and ``` markers and surrounding whitespace.
std::string stripCodeFences(std::string_view Text);

// Recovers a JSON object from model output. Strategies run in order and the
// first that yields an object wins:
//   1. the whole text as JSON
//   2. the text with markdown code fences removed
//   3. the span from the first '{' to the last '}'
// Blank input is Empty; anything else that fails is Malformed.
ParseOutcome extractJson(std::string_view Text);

} // namespace repolens::quality
