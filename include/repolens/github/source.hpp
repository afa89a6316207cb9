#pragma once
#include "glaze/net/http_client.hpp"
#include "repolens/cache/cache.hpp"
#include "repolens/core/http.hpp"
#include "repolens/core/result.hpp"
#include "repolens/github/models.hpp"

#include <glaze/json/generic.hpp>

#include <chrono>
#include <cstddef>
#include <expected>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace repolens::github {

inline constexpr std::size_t MaxSampleBytes = 200'000;
inline constexpr std::size_t MaxSamplePaths = 8;

struct TreeEntry {
  std::string Path;
  std::string Type;
  long long Size{0};
};

// Blobs under MaxSampleBytes with a recognised extension; READMEs and entry
// points first, then the rest in tree order. At most Max paths.
std::vector<std::string> selectSamplePaths(std::span<const TreeEntry> Entries,
                                           std::size_t Max = MaxSamplePaths);

// Percent-encodes every byte of a repository path except unreserved
// characters and the '/' separators.
std::string encodePath(std::string_view Path);

// Decodes GitHub's line-wrapped base64 content. std::nullopt on bad input.
std::optional<std::string> decodeBase64(std::string_view Encoded);

// Where repository metadata and samples come from.
class Source {
public:
  virtual ~Source() = default;

  virtual auto listRepositories(std::string_view Username)
      -> std::expected<std::vector<models::RepositoryRecord>, core::Error> = 0;

  // Best effort: whatever could not be fetched is left empty.
  virtual auto fetchSample(std::string_view Owner, std::string_view Repo)
      -> models::RepositorySample = 0;
};

struct SourceOptions {
  std::string BaseUrl{"https://api.github.com"};
  std::optional<std::string> Token;
  int PerPage = 100;
  int MaxPages = 10;
  bool UseCache = true;
  std::chrono::seconds CacheTtl{std::chrono::minutes(30)};
};

// GitHub REST API over glz::http_client. Successful GET payloads are kept in
// the "github" cache namespace.
class HttpSource : public Source {
public:
  static auto create(SourceOptions Options,
                     std::shared_ptr<cache::Cache> Cache)
      -> std::expected<std::shared_ptr<HttpSource>, core::Error>;

  HttpSource(std::shared_ptr<glz::http_client> Client, SourceOptions Options,
             std::shared_ptr<cache::Cache> Cache);

  auto listRepositories(std::string_view Username)
      -> std::expected<std::vector<models::RepositoryRecord>,
                       core::Error> override;

  auto fetchSample(std::string_view Owner, std::string_view Repo)
      -> models::RepositorySample override;

private:
  auto getJson(const std::string &Url, const glz::generic &Params)
      -> std::expected<glz::generic, core::Error>;

  std::shared_ptr<glz::http_client> Client;
  SourceOptions Options;
  std::shared_ptr<cache::Cache> Cache;
  core::Headers Headers;
};

} // namespace repolens::github
