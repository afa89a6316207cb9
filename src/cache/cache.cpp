#include "repolens/cache/cache.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <expected>
#include <filesystem>
#include <format>
#include <fstream>
#include <functional>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <utility>

namespace repolens::cache {

namespace fs = std::filesystem;

static auto Log() { return core::logger("cache"); }

namespace {

std::string temporaryName(std::string_view Key) {
  static std::atomic<unsigned long long> Counter{0};
  return std::format("{}.{}.{}.tmp", Key,
                     std::hash<std::thread::id>{}(std::this_thread::get_id()),
                     Counter.fetch_add(1, std::memory_order_relaxed));
}

} // namespace

Cache::Cache(fs::path Root, core::Clock Clock)
    : Root(std::move(Root)), Clock(std::move(Clock)) {}

fs::path Cache::pathFor(std::string_view Namespace,
                        std::string_view Key) const {
  return Root / fs::path{std::string(Namespace)} /
         fs::path{std::format("{}.json", Key)};
}

std::optional<std::string> Cache::read(std::string_view Namespace,
                                       std::string_view Key,
                                       std::chrono::seconds Ttl) const {
  auto Path = pathFor(Namespace, Key);

  std::error_code Ec;
  auto Modified = fs::last_write_time(Path, Ec);
  if (Ec) {
    Log()->trace("Cache::get - Miss {}/{}", Namespace, Key);
    return std::nullopt;
  }

  auto Written = std::chrono::time_point_cast<core::Timestamp::duration>(
      std::chrono::file_clock::to_sys(Modified));
  auto Age = Clock() - Written;
  if (Age > Ttl) {
    Log()->trace("Cache::get - Expired {}/{} (age {}s)", Namespace, Key,
                 std::chrono::duration_cast<std::chrono::seconds>(Age).count());
    return std::nullopt;
  }

  std::ifstream File(Path, std::ios::binary);
  if (!File) {
    Log()->debug("Cache::get - Could not open {}", Path.string());
    return std::nullopt;
  }
  std::string Payload((std::istreambuf_iterator<char>(File)),
                      std::istreambuf_iterator<char>());
  if (File.bad()) {
    Log()->debug("Cache::get - Read error on {}", Path.string());
    return std::nullopt;
  }

  Log()->trace("Cache::get - Hit {}/{}", Namespace, Key);
  return Payload;
}

void Cache::write(std::string_view Namespace, std::string_view Key,
                  std::string_view Payload) const {
  auto Path = pathFor(Namespace, Key);

  std::error_code Ec;
  fs::create_directories(Path.parent_path(), Ec);
  if (Ec) {
    Log()->warn("Cache::set - Cannot create {}: {}",
                Path.parent_path().string(), Ec.message());
    return;
  }

  auto Temporary = Path.parent_path() / temporaryName(Key);
  {
    std::ofstream File(Temporary, std::ios::binary | std::ios::trunc);
    File.write(Payload.data(), static_cast<std::streamsize>(Payload.size()));
    File.close();
    if (!File) {
      Log()->warn("Cache::set - Failed writing {}", Temporary.string());
      fs::remove(Temporary, Ec);
      return;
    }
  }

  fs::last_write_time(Temporary, std::chrono::file_clock::from_sys(Clock()),
                      Ec);
  if (Ec) {
    Log()->debug("Cache::set - Could not stamp {}: {}", Temporary.string(),
                 Ec.message());
  }

  fs::rename(Temporary, Path, Ec);
  if (Ec) {
    Log()->warn("Cache::set - Failed to move entry into place {}: {}",
                Path.string(), Ec.message());
    fs::remove(Temporary, Ec);
    return;
  }
  Log()->trace("Cache::set - Wrote {}/{}", Namespace, Key);
}

std::expected<std::size_t, core::Error>
Cache::clear(std::string_view Namespace) const {
  auto Dir = Root / fs::path{std::string(Namespace)};
  std::error_code Ec;
  auto Removed = fs::remove_all(Dir, Ec);
  if (Ec) {
    Log()->error("Cache::clear - Failed to clear {}: {}", Dir.string(),
                 Ec.message());
    return std::unexpected(core::Error{
        .Message = std::format("Failed to clear {}: {}", Dir.string(),
                               Ec.message()),
    });
  }
  // remove_all counts the directory itself.
  auto Entries = Removed > 0 ? static_cast<std::size_t>(Removed) - 1 : 0;
  Log()->info("Cache::clear - Removed {} entries from {}", Entries,
              Dir.string());
  return Entries;
}

} // namespace repolens::cache
