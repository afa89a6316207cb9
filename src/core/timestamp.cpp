#include "repolens/core/timestamp.hpp"

#include <cctype>
#include <chrono>
#include <cstddef>
#include <format>
#include <optional>
#include <string>
#include <string_view>

namespace repolens::core {

namespace {

// Reads exactly Width digits starting at Pos.
std::optional<int> readDigits(std::string_view Str, std::size_t &Pos,
                              std::size_t Width) {
  if (Pos + Width > Str.size()) {
    return std::nullopt;
  }
  int Value = 0;
  for (std::size_t I = 0; I < Width; ++I) {
    auto Ch = static_cast<unsigned char>(Str[Pos + I]);
    if (!std::isdigit(Ch)) {
      return std::nullopt;
    }
    Value = Value * 10 + (Ch - '0');
  }
  Pos += Width;
  return Value;
}

bool expect(std::string_view Str, std::size_t &Pos, char Ch) {
  if (Pos >= Str.size() || Str[Pos] != Ch) {
    return false;
  }
  ++Pos;
  return true;
}

} // namespace

std::optional<Timestamp> parseTimestamp(std::string_view Str) {
  using namespace std::chrono;

  std::size_t Pos = 0;
  auto Year = readDigits(Str, Pos, 4);
  if (!Year || !expect(Str, Pos, '-')) {
    return std::nullopt;
  }
  auto Month = readDigits(Str, Pos, 2);
  if (!Month || !expect(Str, Pos, '-')) {
    return std::nullopt;
  }
  auto Day = readDigits(Str, Pos, 2);
  if (!Day) {
    return std::nullopt;
  }

  year_month_day Date{year{*Year}, month{static_cast<unsigned>(*Month)},
                      day{static_cast<unsigned>(*Day)}};
  if (!Date.ok()) {
    return std::nullopt;
  }

  // Date only: midnight UTC.
  if (Pos == Str.size()) {
    return sys_days{Date};
  }

  if (Str[Pos] != 'T' && Str[Pos] != 't' && Str[Pos] != ' ') {
    return std::nullopt;
  }
  ++Pos;

  auto Hour = readDigits(Str, Pos, 2);
  if (!Hour || !expect(Str, Pos, ':')) {
    return std::nullopt;
  }
  auto Minute = readDigits(Str, Pos, 2);
  if (!Minute || !expect(Str, Pos, ':')) {
    return std::nullopt;
  }
  auto Second = readDigits(Str, Pos, 2);
  if (!Second || *Hour > 23 || *Minute > 59 || *Second > 59) {
    return std::nullopt;
  }

  Timestamp::duration Fraction{};
  if (Pos < Str.size() && (Str[Pos] == '.' || Str[Pos] == ',')) {
    ++Pos;
    std::size_t Start = Pos;
    long long Micros = 0;
    int Digits = 0;
    while (Pos < Str.size() &&
           std::isdigit(static_cast<unsigned char>(Str[Pos]))) {
      if (Digits < 6) {
        Micros = Micros * 10 + (Str[Pos] - '0');
        ++Digits;
      }
      ++Pos;
    }
    if (Pos == Start) {
      return std::nullopt;
    }
    for (; Digits < 6; ++Digits) {
      Micros *= 10;
    }
    Fraction = duration_cast<Timestamp::duration>(microseconds{Micros});
  }

  minutes Offset{0};
  if (Pos < Str.size()) {
    char Sign = Str[Pos];
    if ((Sign == 'Z' || Sign == 'z') && Pos + 1 == Str.size()) {
      ++Pos;
    } else if (Sign == '+' || Sign == '-') {
      ++Pos;
      auto OffsetHours = readDigits(Str, Pos, 2);
      if (!OffsetHours) {
        return std::nullopt;
      }
      // PostgreSQL renders whole-hour offsets as "+00".
      bool Colon = expect(Str, Pos, ':');
      auto OffsetMinutes =
          !Colon && Pos == Str.size() ? std::optional{0}
                                      : readDigits(Str, Pos, 2);
      if (!OffsetMinutes || *OffsetHours > 23 || *OffsetMinutes > 59) {
        return std::nullopt;
      }
      Offset = hours{*OffsetHours} + minutes{*OffsetMinutes};
      if (Sign == '-') {
        Offset = -Offset;
      }
    } else {
      return std::nullopt;
    }
  }
  if (Pos != Str.size()) {
    return std::nullopt;
  }

  Timestamp Local = sys_days{Date} + hours{*Hour} + minutes{*Minute} +
                    seconds{*Second} + Fraction;
  return Local - Offset;
}

std::string formatTimestamp(Timestamp Time) {
  return std::format("{:%Y-%m-%dT%H:%M:%SZ}",
                     std::chrono::floor<std::chrono::seconds>(Time));
}

} // namespace repolens::core
