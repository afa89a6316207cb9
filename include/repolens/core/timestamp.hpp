#pragma once
#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace repolens::core {

using Timestamp = std::chrono::system_clock::time_point;

// Source of "now". Injected wherever elapsed time matters so tests can pin it.
using Clock = std::function<Timestamp()>;

inline Clock systemClock() {
  return [] { return std::chrono::system_clock::now(); };
}

// Parses GitHub style timestamps ("2024-01-01T12:34:56Z"). Fractional seconds
// and a numeric "+HH:MM" offset are accepted as well. Anything else yields
// std::nullopt.
std::optional<Timestamp> parseTimestamp(std::string_view Str);

// "YYYY-MM-DDTHH:MM:SSZ", whole seconds, UTC.
std::string formatTimestamp(Timestamp Time);

} // namespace repolens::core
