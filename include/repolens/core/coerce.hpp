#pragma once
#include <glaze/json/generic.hpp>

#include <optional>
#include <string>
#include <string_view>

// Best-effort readers over loosely typed JSON. None of these fail: a missing
// key or a value of the wrong type yields the supplied default.
namespace repolens::core {

// Member Key of Value, or nullptr when Value is not an object or lacks Key.
const glz::generic *field(const glz::generic &Value, std::string_view Key);

// Numbers are truncated toward zero, numeric strings are parsed, booleans
// count as 0/1. Anything else is std::nullopt.
std::optional<long long> toOptionalInteger(const glz::generic *Value);

long long toInteger(const glz::generic *Value, long long Default = 0);

// Non-negative int, saturating at INT_MAX.
int toCount(const glz::generic *Value);

// Booleans as-is, numbers by != 0, "true"/"false"/"1"/"0" strings.
bool toBool(const glz::generic *Value, bool Default = false);

// Strings as-is, numbers and booleans rendered as text, null/missing to
// std::nullopt.
std::optional<std::string> toOptionalString(const glz::generic *Value);

std::string toString(const glz::generic *Value, std::string_view Default = "");

} // namespace repolens::core
