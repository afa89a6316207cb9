#pragma once
#include "repolens/github/models.hpp"

#include <glaze/json/generic.hpp>

#include <cstddef>
#include <span>
#include <string>
#include <string_view>

namespace repolens::cache {

// Characters of README and file content that take part in a quality key.
// Content differing only past this point maps to the same entry.
inline constexpr std::size_t KeyContentChars = 1500;

// Lowercase hex SHA-256 of Text. Always 64 characters, safe as a file name.
std::string sha256Hex(std::string_view Text);

// JSON text of Value with object members in sorted order, so equal values
// always serialize identically whatever order their members were added in.
std::string canonicalJson(const glz::generic &Value);

// Key of a quality assessment: repository identity, model tag, README and
// file samples, each content truncated to KeyContentChars.
std::string makeQualityKey(std::string_view RepoFullName,
                           std::string_view Readme,
                           std::span<const github::models::FileSample> Files,
                           std::string_view ModelTag);

// Key of a raw API payload: "Prefix|Url|canonical(Params)". Params is
// usually an object of query parameters; null stands for none.
std::string makeRequestKey(std::string_view Prefix, std::string_view Url,
                           const glz::generic &Params);

} // namespace repolens::cache
