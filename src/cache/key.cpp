#include "repolens/cache/key.hpp"

#include "repolens/core/text.hpp"

#include <array>
#include <format>
#include <glaze/json/write.hpp>
#include <openssl/evp.h>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace repolens::cache {

std::string sha256Hex(std::string_view Text) {
  std::array<unsigned char, EVP_MAX_MD_SIZE> Digest{};
  unsigned int Length = 0;
  if (EVP_Digest(Text.data(), Text.size(), Digest.data(), &Length,
                 EVP_sha256(), nullptr) != 1) {
    // Only fails when OpenSSL itself is unusable.
    throw std::runtime_error("EVP_Digest(sha256) failed");
  }

  std::string Hex;
  Hex.reserve(Length * 2);
  for (unsigned int I = 0; I < Length; ++I) {
    Hex += std::format("{:02x}", Digest[I]);
  }
  return Hex;
}

std::string canonicalJson(const glz::generic &Value) {
  // generic objects are std::map backed, so members come out sorted.
  std::string Buffer;
  if (auto Ec = glz::write_json(Value, Buffer)) {
    throw std::runtime_error("Failed to serialize cache key input");
  }
  return Buffer;
}

std::string makeQualityKey(std::string_view RepoFullName,
                           std::string_view Readme,
                           std::span<const github::models::FileSample> Files,
                           std::string_view ModelTag) {
  glz::generic::array_t FileParts;
  FileParts.reserve(Files.size());
  for (const auto &File : Files) {
    glz::generic::object_t Part;
    Part["path"].data = File.Path;
    Part["content"].data = core::truncate(File.Content, KeyContentChars);
    glz::generic Entry{};
    Entry.data = std::move(Part);
    FileParts.push_back(std::move(Entry));
  }

  glz::generic::object_t Input;
  Input["repo"].data = std::string{RepoFullName};
  Input["model"].data = std::string{ModelTag};
  Input["readme"].data = core::truncate(Readme, KeyContentChars);
  Input["files"].data = std::move(FileParts);

  glz::generic Value{};
  Value.data = std::move(Input);
  return sha256Hex(canonicalJson(Value));
}

std::string makeRequestKey(std::string_view Prefix, std::string_view Url,
                           const glz::generic &Params) {
  return sha256Hex(
      std::format("{}|{}|{}", Prefix, Url, canonicalJson(Params)));
}

} // namespace repolens::cache
