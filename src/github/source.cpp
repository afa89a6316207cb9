#include "repolens/github/source.hpp"

#include "repolens/cache/key.hpp"
#include "repolens/core/coerce.hpp"
#include "repolens/core/logging.hpp"
#include "repolens/core/text.hpp"
#include "repolens/github/records.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <expected>
#include <format>
#include <glaze/json/read.hpp>
#include <memory>
#include <openssl/evp.h>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace repolens::github {

static auto Log() { return core::logger("github"); }

namespace {

constexpr std::string_view CacheNamespace = "github";

constexpr std::array<std::string_view, 20> SampleExtensions{
    ".py",  ".md",   ".txt", ".json", ".yml", ".yaml", ".toml",
    ".ini", ".cfg",  ".js",  ".ts",   ".html", ".css", ".c",
    ".cc",  ".cpp",  ".h",   ".hpp",  ".rs",  ".go"};

constexpr std::array<std::string_view, 2> SampleNames{"requirements.txt",
                                                      "package.json"};

constexpr std::array<std::string_view, 4> EntryPoints{"main.py", "app.py",
                                                      "index.js", "main.cpp"};

glz::generic makeParams(
    std::initializer_list<std::pair<std::string_view, std::string>> Pairs) {
  glz::generic::object_t Object;
  for (const auto &[Key, Value] : Pairs) {
    Object[std::string(Key)].data = Value;
  }
  glz::generic Params{};
  Params.data = std::move(Object);
  return Params;
}

std::string queryString(const glz::generic &Params) {
  const auto *Object = std::get_if<glz::generic::object_t>(&Params.data);
  if (Object == nullptr || Object->empty()) {
    return {};
  }
  std::string Query;
  for (const auto &[Key, Value] : *Object) {
    Query += Query.empty() ? '?' : '&';
    Query += std::format("{}={}", Key, core::toString(&Value));
  }
  return Query;
}

glz::generic noParams() { return glz::generic{}; }

} // namespace

std::vector<std::string> selectSamplePaths(std::span<const TreeEntry> Entries,
                                           std::size_t Max) {
  std::vector<std::string> Prioritized;
  std::vector<std::string> Others;

  for (const auto &Entry : Entries) {
    if (Entry.Type != "blob" || Entry.Size > static_cast<long long>(MaxSampleBytes)) {
      continue;
    }
    auto Lower = core::toLower(Entry.Path);
    std::string_view View{Lower};
    bool Known =
        std::ranges::find(SampleNames, View) != SampleNames.end() ||
        std::ranges::any_of(SampleExtensions,
                            [&](std::string_view Ext) { return View.ends_with(Ext); });
    if (!Known) {
      continue;
    }
    bool EntryPoint =
        View.find("readme") != std::string_view::npos ||
        std::ranges::any_of(EntryPoints,
                            [&](std::string_view Name) { return View.ends_with(Name); });
    (EntryPoint ? Prioritized : Others).push_back(Entry.Path);
  }

  Prioritized.insert(Prioritized.end(), Others.begin(), Others.end());
  if (Prioritized.size() > Max) {
    Prioritized.resize(Max);
  }
  return Prioritized;
}

std::string encodePath(std::string_view Path) {
  std::string Encoded;
  Encoded.reserve(Path.size());
  for (char Ch : Path) {
    auto Byte = static_cast<unsigned char>(Ch);
    if (std::isalnum(Byte) || Ch == '-' || Ch == '.' || Ch == '_' ||
        Ch == '~' || Ch == '/') {
      Encoded += Ch;
    } else {
      Encoded += std::format("%{:02X}", Byte);
    }
  }
  return Encoded;
}

std::optional<std::string> decodeBase64(std::string_view Encoded) {
  std::string Compact;
  Compact.reserve(Encoded.size());
  for (char Ch : Encoded) {
    if (!std::isspace(static_cast<unsigned char>(Ch))) {
      Compact += Ch;
    }
  }
  if (Compact.empty()) {
    return std::string{};
  }
  if (Compact.size() % 4 != 0) {
    return std::nullopt;
  }

  std::string Decoded(Compact.size() / 4 * 3, '\0');
  auto Written = EVP_DecodeBlock(
      reinterpret_cast<unsigned char *>(Decoded.data()),
      reinterpret_cast<const unsigned char *>(Compact.data()),
      static_cast<int>(Compact.size()));
  if (Written < 0) {
    return std::nullopt;
  }

  // EVP_DecodeBlock writes padding as zero bytes.
  auto Padding = static_cast<std::size_t>(
      std::ranges::count(Compact.end() - 2, Compact.end(), '='));
  Decoded.resize(static_cast<std::size_t>(Written) - Padding);
  return Decoded;
}

auto HttpSource::create(SourceOptions Options,
                        std::shared_ptr<cache::Cache> Cache)
    -> std::expected<std::shared_ptr<HttpSource>, core::Error> {
  auto Client = std::make_shared<glz::http_client>();

  auto Ok = Client->configure_system_ca_certificates();
  if (!Ok) {
    Log()->error("Error: Could not find CA certificates.");
    return std::unexpected(
        core::Error{"Error: Could not find CA certificates."});
  }
  return std::make_shared<HttpSource>(std::move(Client), std::move(Options),
                                      std::move(Cache));
}

HttpSource::HttpSource(std::shared_ptr<glz::http_client> Client,
                       SourceOptions Options,
                       std::shared_ptr<cache::Cache> Cache)
    : Client(std::move(Client)), Options(std::move(Options)),
      Cache(std::move(Cache)) {
  Headers = {
      {"Accept", "application/vnd.github+json"},
      {"User-Agent", "repolens"},
      {"X-GitHub-Api-Version", "2022-11-28"},
  };
  if (this->Options.Token) {
    Headers["Authorization"] = std::format("Bearer {}", *this->Options.Token);
  }
}

auto HttpSource::getJson(const std::string &Url, const glz::generic &Params)
    -> std::expected<glz::generic, core::Error> {
  using enum core::HttpStatus;

  std::string Key;
  if (Cache && Options.UseCache) {
    Key = cache::makeRequestKey("GET", Url, Params);
    if (auto Hit = Cache->get<glz::generic>(CacheNamespace, Key,
                                            Options.CacheTtl)) {
      Log()->trace("Cache hit for GET {}", Url);
      return std::move(*Hit);
    }
  }

  if (!Client) {
    Log()->error("HTTP Client is null");
    return std::unexpected(core::Error{"Client initialization failed"});
  }

  auto FullUrl = Url + queryString(Params);
  Log()->debug("Making HTTP GET request to: {}", FullUrl);
  auto Response = Client->get(FullUrl, Headers);
  if (!Response) {
    Log()->error("GET {} failed: {}", FullUrl, Response.error().message());
    return std::unexpected(core::Error{
        .Message = std::format("Network error calling GitHub API: {}",
                               Response.error().message()),
        .Kind = core::ErrorKind::Transient,
    });
  }

  auto Status = static_cast<int>(Response->status_code);
  if (Status == static_cast<int>(NotFound)) {
    return std::unexpected(core::Error{.Message = "Not found (404).",
                                       .Kind = core::ErrorKind::NotFound});
  }
  if (Status == static_cast<int>(Unauthorized)) {
    return std::unexpected(
        core::Error{.Message = "Unauthorized (401). Check your GITHUB_TOKEN.",
                    .Kind = core::ErrorKind::Configuration});
  }
  if (!core::isSuccess(Status)) {
    glz::generic Body{};
    std::string Detail;
    if (!glz::read_json(Body, Response->response_body)) {
      Detail = core::toString(core::field(Body, "message"));
    }
    auto Message =
        Status == static_cast<int>(Forbidden)
            ? std::format("Forbidden / rate limited (403). {}", Detail)
            : std::format("GitHub API error: status {}", Status);
    Log()->error("GET {} - {}", FullUrl, Message);
    return std::unexpected(
        core::Error{.Message = Message, .Kind = core::ErrorKind::Transient});
  }

  glz::generic Data{};
  if (auto ParseError = glz::read_json(Data, Response->response_body)) {
    Log()->error("Parse failed: {}",
                 glz::format_error(ParseError, Response->response_body));
    return std::unexpected(
        core::Error{.Message = "GitHub response was not valid JSON.",
                    .Kind = core::ErrorKind::ContractViolation});
  }

  if (Cache && Options.UseCache) {
    Cache->set(CacheNamespace, Key, Data);
  }
  return Data;
}

auto HttpSource::listRepositories(std::string_view Username)
    -> std::expected<std::vector<models::RepositoryRecord>, core::Error> {
  auto User = core::trim(Username);
  if (User.empty()) {
    return std::unexpected(core::Error{"username cannot be empty"});
  }

  std::vector<models::RepositoryRecord> All;
  auto Url = std::format("{}/users/{}/repos", Options.BaseUrl, User);
  for (int Page = 1; Page <= Options.MaxPages; ++Page) {
    auto Params = makeParams({{"per_page", std::to_string(Options.PerPage)},
                              {"page", std::to_string(Page)},
                              {"sort", "pushed"},
                              {"direction", "desc"}});
    auto Data = getJson(Url, Params);
    if (!Data) {
      Log()->error("Error fetching repos for {}: {}", User,
                   Data.error().Message);
      return std::unexpected(Data.error());
    }

    auto Records = parseRepositories(*Data);
    if (!Records) {
      return std::unexpected(Records.error());
    }
    if (Records->empty()) {
      break;
    }
    auto Received = Records->size();
    All.insert(All.end(), std::make_move_iterator(Records->begin()),
               std::make_move_iterator(Records->end()));
    if (Received < static_cast<std::size_t>(Options.PerPage)) {
      break;
    }
  }

  Log()->info("Fetched {} repositories for {}", All.size(), User);
  return All;
}

auto HttpSource::fetchSample(std::string_view Owner, std::string_view Repo)
    -> models::RepositorySample {
  models::RepositorySample Sample{
      .FullName = std::format("{}/{}", core::trim(Owner), core::trim(Repo))};
  if (core::trim(Owner).empty() || core::trim(Repo).empty()) {
    return Sample;
  }

  auto RepoUrl = std::format("{}/repos/{}", Options.BaseUrl, Sample.FullName);
  auto RepoData = getJson(RepoUrl, noParams());
  if (!RepoData) {
    Log()->warn("Sample of {} unavailable: {}", Sample.FullName,
                RepoData.error().Message);
    return Sample;
  }
  auto Branch =
      core::toString(core::field(*RepoData, "default_branch"), "main");

  if (auto Readme = getJson(RepoUrl + "/readme", noParams())) {
    auto Content = core::toString(core::field(*Readme, "content"));
    Sample.Readme = decodeBase64(Content).value_or("");
  } else {
    Log()->debug("No README for {}: {}", Sample.FullName,
                 Readme.error().Message);
  }

  auto Tree = getJson(std::format("{}/git/trees/{}", RepoUrl, Branch),
                      makeParams({{"recursive", "1"}}));
  if (!Tree) {
    Log()->warn("Tree of {} unavailable: {}", Sample.FullName,
                Tree.error().Message);
    return Sample;
  }

  std::vector<TreeEntry> Entries;
  if (const auto *Items = core::field(*Tree, "tree")) {
    if (const auto *Array = std::get_if<glz::generic::array_t>(&Items->data)) {
      for (const auto &Item : *Array) {
        Entries.push_back({
            .Path = core::toString(core::field(Item, "path")),
            .Type = core::toString(core::field(Item, "type")),
            .Size = core::toInteger(core::field(Item, "size")),
        });
      }
    }
  }

  for (const auto &Path : selectSamplePaths(Entries)) {
    auto File = getJson(
        std::format("{}/contents/{}", RepoUrl, encodePath(Path)), noParams());
    if (!File) {
      continue;
    }
    auto Decoded =
        decodeBase64(core::toString(core::field(*File, "content")));
    if (!Decoded || Decoded->empty()) {
      continue;
    }
    Sample.Files.push_back({.Path = Path, .Content = std::move(*Decoded)});
  }

  Log()->debug("Sampled {}: readme {} chars, {} files", Sample.FullName,
               Sample.Readme.size(), Sample.Files.size());
  return Sample;
}

} // namespace repolens::github
