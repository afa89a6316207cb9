#include "repolens/quality/provider.hpp"

#include "repolens/core/http.hpp"
#include "repolens/core/logging.hpp"
#include "repolens/core/text.hpp"
#include "repolens/quality/responses.hpp"

#include <asio/ssl.hpp>
#include <expected>
#include <format>
#include <glaze/json/read.hpp>
#include <glaze/json/write.hpp>
#include <memory>
#include <string>
#include <utility>

namespace repolens::quality {

static auto Log() { return core::logger("quality"); }

auto GroqProvider::create(std::string ApiKey, std::string Endpoint)
    -> std::expected<std::shared_ptr<GroqProvider>, core::Error> {
  auto Client = std::make_shared<glz::http_client>();

  auto Ok = Client->configure_system_ca_certificates();
  if (!Ok) {
    Log()->error("Error: Could not find CA certificates.");
    return std::unexpected(
        core::Error{"Error: Could not find CA certificates."});
  }
  return std::make_shared<GroqProvider>(std::move(Client), std::move(ApiKey),
                                        std::move(Endpoint));
}

GroqProvider::GroqProvider(std::shared_ptr<glz::http_client> Client,
                           std::string ApiKey, std::string Endpoint)
    : Client(std::move(Client)), ApiKey(std::move(ApiKey)),
      Endpoint(std::move(Endpoint)) {}

auto GroqProvider::complete(const ChatRequest &Request)
    -> std::expected<std::string, core::Error> {
  using enum core::HttpStatus;

  if (!Client) {
    Log()->error("HTTP Client is null");
    return std::unexpected(core::Error{"Client initialization failed"});
  }

  core::Headers Headers = {
      {"Authorization", std::format("Bearer {}", ApiKey)},
      {"Content-Type", "application/json"},
      {"User-Agent", "repolens"},
  };

  responses::ChatCompletionRequest Payload{
      .model = Request.Model,
      .messages = {{.role = "system", .content = Request.System},
                   {.role = "user", .content = Request.Prompt}},
      .temperature = Request.Temperature,
      .max_tokens = Request.MaxTokens,
  };
  std::string Body;
  if (auto Ec = glz::write_json(Payload, Body)) {
    return std::unexpected(core::Error{"Failed to serialize chat request"});
  }

  Log()->debug("Making HTTP POST request to: {} (model {})", Endpoint,
               Request.Model);
  auto Response = Client->post(Endpoint, Body, Headers);
  if (!Response) {
    Log()->warn("POST {} failed: {}", Endpoint, Response.error().message());
    return std::unexpected(core::Error{
        .Message = std::format("POST {} failed: {}", Endpoint,
                               Response.error().message()),
        .Kind = core::ErrorKind::Transient,
    });
  }

  auto Status = static_cast<int>(Response->status_code);
  if (!core::isSuccess(Status)) {
    // A rejected key will not get better by asking again.
    auto Kind = (Status == static_cast<int>(Unauthorized) ||
                 Status == static_cast<int>(Forbidden))
                    ? core::ErrorKind::Configuration
                    : core::ErrorKind::Transient;
    Log()->warn("POST {} returned status {}", Endpoint, Status);
    return std::unexpected(core::Error{
        .Message = std::format("Provider returned status {}", Status),
        .Kind = Kind,
        .Preview = core::truncate(Response->response_body, 300),
    });
  }

  responses::ChatCompletionResponse Completion{};
  if (auto ParseError =
          glz::read<core::JsonOpts>(Completion, Response->response_body)) {
    return std::unexpected(core::Error{
        .Message = std::format(
            "Parse failed: {}",
            glz::format_error(ParseError, Response->response_body)),
        .Kind = core::ErrorKind::ContractViolation,
        .Preview = core::truncate(Response->response_body, 300),
    });
  }
  if (Completion.choices.empty()) {
    return std::unexpected(core::Error{
        .Message = "Provider reply carried no choices",
        .Kind = core::ErrorKind::ContractViolation,
    });
  }

  return Completion.choices.front().message.content.value_or("");
}

} // namespace repolens::quality
