#pragma once
#include "glaze/net/http_client.hpp"
#include "repolens/core/result.hpp"

#include <expected>
#include <memory>
#include <string>
#include <string_view>

namespace repolens::quality {

struct ChatRequest {
  std::string Model;
  std::string System;
  std::string Prompt;
  double Temperature{0.2};
  int MaxTokens{900};
};

// The external evaluator. Implementations return the text of the reply or an
// error whose kind says whether retrying can help.
class Provider {
public:
  virtual ~Provider() = default;

  virtual auto complete(const ChatRequest &Request)
      -> std::expected<std::string, core::Error> = 0;
};

inline constexpr std::string_view GroqEndpoint =
    "https://api.groq.com/openai/v1/chat/completions";

class GroqProvider : public Provider {
public:
  static auto create(std::string ApiKey,
                     std::string Endpoint = std::string{GroqEndpoint})
      -> std::expected<std::shared_ptr<GroqProvider>, core::Error>;

  GroqProvider(std::shared_ptr<glz::http_client> Client, std::string ApiKey,
               std::string Endpoint);

  auto complete(const ChatRequest &Request)
      -> std::expected<std::string, core::Error> override;

private:
  std::shared_ptr<glz::http_client> Client;
  std::string ApiKey;
  std::string Endpoint;
};

} // namespace repolens::quality
