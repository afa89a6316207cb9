#pragma once
#include "repolens/core/http.hpp"
#include "repolens/core/logging.hpp"
#include "repolens/core/result.hpp"
#include "repolens/core/timestamp.hpp"

#include <glaze/json/read.hpp>
#include <glaze/json/write.hpp>

#include <chrono>
#include <cstddef>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace repolens::cache {

// File backed key/value store. Each entry lives at {Root}/{Namespace}/{Key}.json
// and its age is taken from the file's modification time, which a write sets
// from the injected clock.
//
// A read is a hit only when the entry exists and is no older than the TTL.
// Missing, expired and unreadable entries are all plain misses. Writes are
// best effort: failures are logged and otherwise ignored. Keys are content
// hashes (see key.hpp) so concurrent writers of one key write the same bytes;
// each write lands through a rename and readers never see a partial file.
class Cache {
public:
  explicit Cache(std::filesystem::path Root,
                 core::Clock Clock = core::systemClock());

  template <class T>
  std::optional<T> get(std::string_view Namespace, std::string_view Key,
                       std::chrono::seconds Ttl) const {
    auto Payload = read(Namespace, Key, Ttl);
    if (!Payload) {
      return std::nullopt;
    }
    T Value{};
    if (auto Ec = glz::read<core::JsonOpts>(Value, *Payload)) {
      core::logger("cache")->debug("Cache::get - Corrupt entry {}/{}: {}",
                                   Namespace, Key,
                                   glz::format_error(Ec, *Payload));
      return std::nullopt;
    }
    return Value;
  }

  template <class T>
  void set(std::string_view Namespace, std::string_view Key,
           const T &Value) const {
    std::string Buffer;
    if (auto Ec = glz::write<glz::opts{.prettify = true}>(Value, Buffer)) {
      core::logger("cache")->warn("Cache::set - Failed to serialize {}/{}",
                                  Namespace, Key);
      return;
    }
    write(Namespace, Key, Buffer);
  }

  // Removes every entry of Namespace. Returns how many were removed.
  std::expected<std::size_t, core::Error>
  clear(std::string_view Namespace) const;

  std::filesystem::path pathFor(std::string_view Namespace,
                                std::string_view Key) const;

  const std::filesystem::path &root() const { return Root; }

private:
  std::optional<std::string> read(std::string_view Namespace,
                                  std::string_view Key,
                                  std::chrono::seconds Ttl) const;
  void write(std::string_view Namespace, std::string_view Key,
             std::string_view Payload) const;

  std::filesystem::path Root;
  core::Clock Clock;
};

} // namespace repolens::cache
