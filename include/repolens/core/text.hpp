#pragma once
#include <cstddef>
#include <span>
#include <string>
#include <string_view>

namespace repolens::core {

// Length in code points. Bytes that do not start a UTF-8 sequence are counted
// as one character each.
std::size_t characterCount(std::string_view Text);

// First MaxChars code points of Text, never splitting a multi-byte sequence.
std::string truncate(std::string_view Text, std::size_t MaxChars);

// Longest line measured in code points. "\r\n" and "\n" both end a line.
std::size_t longestLineLength(std::string_view Text);

std::string toLower(std::string_view Text);

std::string trim(std::string_view Text);

std::string joinLines(std::span<const std::string> Lines);

} // namespace repolens::core
