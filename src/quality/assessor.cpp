#include "repolens/quality/assessor.hpp"

#include "repolens/core/logging.hpp"
#include "repolens/core/text.hpp"
#include "repolens/quality/extract.hpp"
#include "repolens/quality/validate.hpp"

#include <algorithm>
#include <array>
#include <expected>
#include <format>
#include <glaze/json/write.hpp>
#include <memory>
#include <optional>
#include <span>
#include <stop_token>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace repolens::quality {

static auto Log() { return core::logger("quality"); }

namespace {

constexpr std::array<std::string_view, 15> AssessableExtensions{
    ".py", ".js",  ".ts",  ".md",  ".txt", ".json", ".yml", ".yaml",
    ".c",  ".cc",  ".cpp", ".h",   ".hpp", ".rs",   ".go"};

constexpr std::array<std::string_view, 2> AssessableNames{"requirements.txt",
                                                          "package.json"};

constexpr std::string_view AssessmentSystem =
    "You return only valid JSON. No markdown. No commentary.";

constexpr std::string_view PortfolioSystem =
    "Return only JSON. Do not include markdown.";

template <class T> std::string toJson(const T &Value) {
  std::string Buffer;
  if (auto Ec = glz::write_json(Value, Buffer)) {
    return "[]";
  }
  return Buffer;
}

core::Error cancelled(std::string_view Label) {
  return core::Error{
      .Message = std::format("{} cancelled", Label),
      .Kind = core::ErrorKind::Cancelled,
  };
}

} // namespace

bool looksMinified(std::string_view Content) {
  return core::longestLineLength(Content) > MinifiedLineChars;
}

bool isAssessableFile(std::string_view Path) {
  auto Lower = core::toLower(Path);
  if (std::ranges::find(AssessableNames, Lower) != AssessableNames.end()) {
    return true;
  }
  return std::ranges::any_of(AssessableExtensions, [&](std::string_view Ext) {
    return std::string_view{Lower}.ends_with(Ext);
  });
}

github::models::RepositorySample
cleanSample(const github::models::RepositorySample &Sample) {
  github::models::RepositorySample Cleaned{
      .FullName = Sample.FullName,
      .Readme = core::truncate(Sample.Readme, ReadmeChars),
  };

  for (const auto &File : Sample.Files) {
    if (Cleaned.Files.size() >= MaxSampleFiles) {
      break;
    }
    if (looksMinified(File.Content) || !isAssessableFile(File.Path)) {
      continue;
    }
    Cleaned.Files.push_back({.Path = File.Path,
                             .Content = core::truncate(File.Content, FileChars)});
  }
  return Cleaned;
}

std::vector<models::PortfolioEntry>
compactPortfolio(std::span<const models::PortfolioEntry> Entries) {
  std::vector<models::PortfolioEntry> Compact;
  auto Count = std::min(Entries.size(), MaxPortfolioEntries);
  Compact.reserve(Count);
  for (const auto &Entry : Entries.first(Count)) {
    auto Bullets = [](const std::vector<std::string> &Items) {
      auto Keep = std::min(Items.size(), PortfolioBullets);
      return std::vector<std::string>(Items.begin(), Items.begin() + Keep);
    };
    Compact.push_back({
        .Repo = Entry.Repo,
        .Language = Entry.Language,
        .TotalScore = Entry.TotalScore,
        .Strengths = Bullets(Entry.Strengths),
        .Weaknesses = Bullets(Entry.Weaknesses),
    });
  }
  return Compact;
}

std::string
buildAssessmentPrompt(const github::models::RepositorySample &Cleaned) {
  return std::format(
      "You are a senior software engineer reviewing a GitHub repository for a "
      "recruiter.\n"
      "Base every statement on the README and file samples below only.\n\n"
      "Reply with ONLY a JSON object, no markdown and no extra text, with "
      "exactly these keys:\n"
      "- repo_summary (string, <= {} chars)\n"
      "- strengths (array of 3 strings)\n"
      "- weaknesses (array of 3 strings)\n"
      "- suggested_improvements (array of 3 strings)\n"
      "- skill_score (integer 0-100)\n"
      "- notes (string, <= {} chars)\n\n"
      "Repo: {}\n\n"
      "README:\n{}\n\n"
      "FILES (sample):\n{}",
      SummaryChars, NotesChars, Cleaned.FullName, Cleaned.Readme,
      toJson(Cleaned.Files));
}

std::string buildPortfolioPrompt(std::string_view Username,
                                 std::span<const models::PortfolioEntry> Compact) {
  std::vector<models::PortfolioEntry> Entries(Compact.begin(), Compact.end());
  return std::format(
      "You are writing a recruiter-facing summary of a GitHub portfolio from "
      "per-repository evaluation results.\n\n"
      "Reply with ONLY a JSON object with exactly these keys:\n"
      "- recruiter_summary (string, 3-5 sentences, <= {} chars)\n"
      "- headline (string, <= {} chars)\n"
      "- top_strengths (array of 3 strings)\n"
      "- top_risks (array of 3 strings)\n\n"
      "GitHub username: {}\n\n"
      "Scored repo signals:\n{}",
      RecruiterSummaryChars, HeadlineChars, Username, toJson(Entries));
}

QualityAssessor::QualityAssessor(AssessorConfig Config,
                                 std::shared_ptr<Provider> Evaluator,
                                 RetryPolicy Policy)
    : Config(std::move(Config)), Evaluator(std::move(Evaluator)),
      Policy(std::move(Policy)) {
  this->Policy.MaxAttempts = std::max(this->Policy.MaxAttempts, 1);
}

std::optional<core::Error> QualityAssessor::checkCredentials() const {
  if (!Config.ApiKey || core::trim(*Config.ApiKey).empty()) {
    return core::Error{
        .Message = "Missing GROQ_API_KEY. Set it in the environment before "
                   "requesting quality assessments.",
        .Kind = core::ErrorKind::Configuration,
    };
  }
  if (!Evaluator) {
    return core::Error{
        .Message = "No quality provider configured",
        .Kind = core::ErrorKind::Configuration,
    };
  }
  return std::nullopt;
}

template <class T, class Validator>
auto QualityAssessor::invoke(const ChatRequest &Request, std::string_view Label,
                             std::stop_token Stop, Validator Validate) const
    -> std::expected<T, core::Error> {
  std::string LastRaw;
  core::Error LastError{.Message = "no attempt completed",
                        .Kind = core::ErrorKind::Transient};

  for (int Attempt = 1; Attempt <= Policy.MaxAttempts; ++Attempt) {
    if (Stop.stop_requested()) {
      return std::unexpected(cancelled(Label));
    }

    auto Reply = Evaluator->complete(Request);
    if (!Reply) {
      if (Reply.error().Kind == core::ErrorKind::Configuration) {
        Log()->error("[{}] {}", Label, Reply.error().Message);
        return std::unexpected(Reply.error());
      }
      LastError = Reply.error();
      Log()->warn("[{}] Attempt {}/{} failed: {}", Label, Attempt,
                  Policy.MaxAttempts, LastError.Message);
    } else {
      LastRaw = core::trim(*Reply);
      auto Outcome = extractJson(LastRaw);
      if (Outcome.ok()) {
        Log()->debug("[{}] Attempt {}/{} parsed (strategy {})", Label, Attempt,
                     Policy.MaxAttempts, static_cast<int>(Outcome.Strategy));
        return Validate(Outcome.Value, LastRaw);
      }
      LastError = core::Error{
          .Message = Outcome.Error,
          .Kind = core::ErrorKind::ContractViolation,
      };
      Log()->warn("[{}] Attempt {}/{} returned unusable output: {}", Label,
                  Attempt, Policy.MaxAttempts, Outcome.Error);
    }

    if (Attempt < Policy.MaxAttempts) {
      auto Delay = Policy.Delay(Attempt);
      Log()->debug("[{}] Retrying in {}ms", Label, Delay.count());
      if (!Policy.Sleep(Delay, Stop)) {
        return std::unexpected(cancelled(Label));
      }
    }
  }

  std::string Preview;
  if (!LastRaw.empty()) {
    Preview = core::truncate(LastRaw, PreviewChars) + "...";
  } else {
    Preview = LastError.Preview;
  }
  auto Message =
      std::format("{} failed after {} attempts. Last error: {}. Preview: {}",
                  Label, Policy.MaxAttempts, LastError.Message, Preview);
  Log()->error("{}", Message);
  return std::unexpected(core::Error{
      .Message = std::move(Message),
      .Kind = LastError.Kind,
      .Preview = std::move(Preview),
  });
}

auto QualityAssessor::assess(const github::models::RepositorySample &Sample,
                             std::stop_token Stop) const
    -> std::expected<models::QualityAssessment, core::Error> {
  if (auto Missing = checkCredentials()) {
    return std::unexpected(*Missing);
  }

  auto Cleaned = cleanSample(Sample);
  Log()->debug("Assessing {} (readme {} chars, {} files)", Cleaned.FullName,
               core::characterCount(Cleaned.Readme), Cleaned.Files.size());

  ChatRequest Request{
      .Model = Config.Model,
      .System = std::string{AssessmentSystem},
      .Prompt = buildAssessmentPrompt(Cleaned),
      .Temperature = Config.Temperature,
      .MaxTokens = Config.MaxTokens,
  };
  return invoke<models::QualityAssessment>(
      Request, std::format("Quality assessment of {}", Cleaned.FullName), Stop,
      validateAssessment);
}

auto QualityAssessor::assessPortfolio(
    std::string_view Username, std::span<const models::PortfolioEntry> Entries,
    std::stop_token Stop) const
    -> std::expected<models::PortfolioAssessment, core::Error> {
  if (auto Missing = checkCredentials()) {
    return std::unexpected(*Missing);
  }

  auto Compact = compactPortfolio(Entries);
  ChatRequest Request{
      .Model = Config.Model,
      .System = std::string{PortfolioSystem},
      .Prompt = buildPortfolioPrompt(Username, Compact),
      .Temperature = Config.Temperature,
      .MaxTokens = Config.PortfolioMaxTokens,
  };
  return invoke<models::PortfolioAssessment>(
      Request, std::format("Portfolio summary for {}", Username), Stop,
      validatePortfolio);
}

} // namespace repolens::quality
