#pragma once
#include <optional>
#include <string>
#include <vector>

// Wire format of the OpenAI-compatible chat completions endpoint.
namespace repolens::quality::responses {

struct ChatMessage {
  std::string role;
  std::string content;
};

struct ChatCompletionRequest {
  std::string model;
  std::vector<ChatMessage> messages;
  double temperature;
  int max_tokens;
};

struct ChatReplyMessage {
  std::optional<std::string> content;
};

struct ChatChoice {
  ChatReplyMessage message;
};

struct ChatCompletionResponse {
  std::vector<ChatChoice> choices;
};

} // namespace repolens::quality::responses
