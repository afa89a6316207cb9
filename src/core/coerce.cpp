#include "repolens/core/coerce.hpp"

#include "repolens/core/text.hpp"

#include <charconv>
#include <climits>
#include <cmath>
#include <format>
#include <glaze/json/write.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <variant>

namespace repolens::core {

namespace {

std::optional<long long> fromDouble(double Number) {
  if (!std::isfinite(Number)) {
    return std::nullopt;
  }
  auto Truncated = std::trunc(Number);
  if (Truncated >= static_cast<double>(LLONG_MAX)) {
    return LLONG_MAX;
  }
  if (Truncated <= static_cast<double>(LLONG_MIN)) {
    return LLONG_MIN;
  }
  return static_cast<long long>(Truncated);
}

std::optional<long long> fromText(std::string_view Raw) {
  auto Text = trim(Raw);
  if (Text.empty()) {
    return std::nullopt;
  }
  const char *Begin = Text.data();
  const char *End = Text.data() + Text.size();
  if (*Begin == '+') {
    ++Begin;
  }

  long long Integer = 0;
  auto [IntPtr, IntEc] = std::from_chars(Begin, End, Integer);
  if (IntEc == std::errc{} && IntPtr == End) {
    return Integer;
  }

  double Number = 0.0;
  auto [DblPtr, DblEc] = std::from_chars(Begin, End, Number);
  if (DblEc == std::errc{} && DblPtr == End) {
    return fromDouble(Number);
  }
  return std::nullopt;
}

std::string renderNumber(double Number) {
  if (std::isfinite(Number) && Number == std::trunc(Number) &&
      std::fabs(Number) < 1e15) {
    return std::format("{}", static_cast<long long>(Number));
  }
  return std::format("{}", Number);
}

} // namespace

const glz::generic *field(const glz::generic &Value, std::string_view Key) {
  const auto *Object = std::get_if<glz::generic::object_t>(&Value.data);
  if (Object == nullptr) {
    return nullptr;
  }
  auto It = Object->find(Key);
  if (It == Object->end()) {
    return nullptr;
  }
  return &It->second;
}

std::optional<long long> toOptionalInteger(const glz::generic *Value) {
  if (Value == nullptr) {
    return std::nullopt;
  }
  if (const auto *Number = std::get_if<double>(&Value->data)) {
    return fromDouble(*Number);
  }
  if (const auto *Text = std::get_if<std::string>(&Value->data)) {
    return fromText(*Text);
  }
  if (const auto *Flag = std::get_if<bool>(&Value->data)) {
    return *Flag ? 1 : 0;
  }
  return std::nullopt;
}

long long toInteger(const glz::generic *Value, long long Default) {
  return toOptionalInteger(Value).value_or(Default);
}

int toCount(const glz::generic *Value) {
  auto Integer = toInteger(Value, 0);
  if (Integer < 0) {
    return 0;
  }
  if (Integer > INT_MAX) {
    return INT_MAX;
  }
  return static_cast<int>(Integer);
}

bool toBool(const glz::generic *Value, bool Default) {
  if (Value == nullptr) {
    return Default;
  }
  if (const auto *Flag = std::get_if<bool>(&Value->data)) {
    return *Flag;
  }
  if (const auto *Number = std::get_if<double>(&Value->data)) {
    return *Number != 0.0;
  }
  if (const auto *Text = std::get_if<std::string>(&Value->data)) {
    auto Lower = toLower(trim(*Text));
    if (Lower == "true" || Lower == "1") {
      return true;
    }
    if (Lower == "false" || Lower == "0") {
      return false;
    }
  }
  return Default;
}

std::optional<std::string> toOptionalString(const glz::generic *Value) {
  if (Value == nullptr) {
    return std::nullopt;
  }
  if (const auto *Text = std::get_if<std::string>(&Value->data)) {
    return *Text;
  }
  if (const auto *Number = std::get_if<double>(&Value->data)) {
    return renderNumber(*Number);
  }
  if (const auto *Flag = std::get_if<bool>(&Value->data)) {
    return std::string{*Flag ? "true" : "false"};
  }
  if (std::holds_alternative<glz::generic::array_t>(Value->data) ||
      std::holds_alternative<glz::generic::object_t>(Value->data)) {
    std::string Buffer;
    if (!glz::write_json(*Value, Buffer)) {
      return Buffer;
    }
  }
  return std::nullopt;
}

std::string toString(const glz::generic *Value, std::string_view Default) {
  return toOptionalString(Value).value_or(std::string{Default});
}

} // namespace repolens::core
