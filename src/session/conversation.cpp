#include "claire/session/conversation.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>

namespace claire {

const char* const kOfflineNotice =
    "Claire is currently offline. Please check that your local AI server (LM Studio) is running, or configure a cloud AI provider in "
    "settings.";

std::string strip_reasoning(const std::string& text) {
  const std::string open = "<think>";
  const std::string close = "</think>";

  // Matched spans first (non-greedy, may cross lines)
  std::string result;
  result.reserve(text.size());
  size_t pos = 0;
  while (pos < text.size()) {
    size_t start = text.find(open, pos);
    if (start == std::string::npos) {
      result.append(text, pos, std::string::npos);
      break;
    }
    size_t end = text.find(close, start + open.size());
    if (end == std::string::npos) {
      result.append(text, pos, std::string::npos);
      break;
    }
    result.append(text, pos, start - pos);
    pos = end + close.size();
  }

  // Then any leftover marker
  for (const auto& marker : {close, open}) {
    size_t at = 0;
    while ((at = result.find(marker, at)) != std::string::npos) {
      result.erase(at, marker.size());
    }
  }

  return trim(result);
}

ConversationDriver::ConversationDriver(const ToolRegistry& registry, llm::Backend& backend, BackendConfig config)
    : detector_(registry), invoker_(registry), backend_(backend), config_(std::move(config)) {}

MessageList ConversationDriver::augment(const MessageList& history) const {
  if (history.empty()) {
    throw std::invalid_argument("Conversation history is empty");
  }

  MessageList messages = history;

  auto calls = detector_.detect(history.back().content());
  if (calls.empty()) {
    return messages;
  }

  spdlog::info("[ConversationDriver] Running {} tool call(s)", calls.size());
  auto results = invoker_.process_chain(calls);

  std::string content;
  for (const auto& block : results) {
    if (!content.empty()) content += "\n";
    content += block;
  }

  Message tool_message = Message::system(content);
  tool_message.set_synthetic(true);
  messages.push_back(std::move(tool_message));
  return messages;
}

std::string ConversationDriver::complete(const MessageList& history, const CompletionOptions& options) {
  llm::CompletionRequest request;
  request.messages = augment(history);
  request.model = options.model.value_or(config_.default_model);
  request.temperature = options.temperature.value_or(config_.temperature);
  request.max_tokens = options.max_tokens.value_or(config_.max_tokens);

  spdlog::debug("[ConversationDriver] Calling {} with model={}, messages={}", backend_.name(), request.model, request.messages.size());

  auto response = backend_.complete(request).get();
  if (!response.ok()) {
    spdlog::error("[ConversationDriver] Backend {} failed: {}", backend_.name(), *response.error);
    throw llm::BackendError(*response.error);
  }

  return strip_reasoning(response.content);
}

bool ConversationDriver::test_connection() {
  return backend_.ping().get();
}

std::string ConversationDriver::complete_with_fallback(const MessageList& history, const CompletionOptions& options) {
  if (!test_connection()) {
    spdlog::warn("[ConversationDriver] Backend {} unreachable, returning offline notice", backend_.name());
    return kOfflineNotice;
  }
  return complete(history, options);
}

}  // namespace claire
