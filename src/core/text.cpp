#include "repolens/core/text.hpp"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <span>
#include <string>
#include <string_view>

namespace repolens::core {

namespace {

// Continuation bytes look like 10xxxxxx.
bool isContinuation(char Ch) {
  return (static_cast<unsigned char>(Ch) & 0xC0) == 0x80;
}

} // namespace

std::size_t characterCount(std::string_view Text) {
  return static_cast<std::size_t>(std::ranges::count_if(
      Text, [](char Ch) { return !isContinuation(Ch); }));
}

std::string truncate(std::string_view Text, std::size_t MaxChars) {
  std::size_t Seen = 0;
  for (std::size_t I = 0; I < Text.size(); ++I) {
    if (isContinuation(Text[I])) {
      continue;
    }
    if (Seen == MaxChars) {
      return std::string{Text.substr(0, I)};
    }
    ++Seen;
  }
  return std::string{Text};
}

std::size_t longestLineLength(std::string_view Text) {
  std::size_t Longest = 0;
  while (!Text.empty()) {
    auto End = Text.find('\n');
    auto Line = Text.substr(0, End);
    if (!Line.empty() && Line.back() == '\r') {
      Line.remove_suffix(1);
    }
    Longest = std::max(Longest, characterCount(Line));
    if (End == std::string_view::npos) {
      break;
    }
    Text.remove_prefix(End + 1);
  }
  return Longest;
}

std::string toLower(std::string_view Text) {
  std::string Lower{Text};
  std::ranges::transform(Lower, Lower.begin(), [](unsigned char Ch) {
    return static_cast<char>(std::tolower(Ch));
  });
  return Lower;
}

std::string trim(std::string_view Text) {
  auto IsSpace = [](unsigned char Ch) { return std::isspace(Ch) != 0; };
  while (!Text.empty() && IsSpace(Text.front())) {
    Text.remove_prefix(1);
  }
  while (!Text.empty() && IsSpace(Text.back())) {
    Text.remove_suffix(1);
  }
  return std::string{Text};
}

std::string joinLines(std::span<const std::string> Lines) {
  std::string Joined;
  for (std::size_t I = 0; I < Lines.size(); ++I) {
    if (I != 0) {
      Joined += '\n';
    }
    Joined += Lines[I];
  }
  return Joined;
}

} // namespace repolens::core
