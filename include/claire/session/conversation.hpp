#pragma once

#include <optional>
#include <string>

#include "claire/core/config.hpp"
#include "claire/core/message.hpp"
#include "claire/llm/backend.hpp"
#include "claire/tool/detector.hpp"
#include "claire/tool/invoker.hpp"

namespace claire {

// Shown instead of a reply when the backend cannot be reached
extern const char* const kOfflineNotice;

// Per-call overrides of the configured generation parameters
struct CompletionOptions {
  std::optional<std::string> model;
  std::optional<double> temperature;
  std::optional<int> max_tokens;
};

// Remove <think>...</think> spans and stray markers, then trim
std::string strip_reasoning(const std::string& text);

// One conversational turn: run tools requested by the last message, splice their
// results into the history, call the backend and clean up its reply.
class ConversationDriver {
 public:
  ConversationDriver(const ToolRegistry& registry, llm::Backend& backend, BackendConfig config = {});

  // Throws BackendError when the backend call fails, std::invalid_argument on empty history
  std::string complete(const MessageList& history, const CompletionOptions& options = {});

  // Probe first and answer with kOfflineNotice when the backend is unreachable
  std::string complete_with_fallback(const MessageList& history, const CompletionOptions& options = {});

  // History as it would be sent: the input plus the tool-results message, if any
  MessageList augment(const MessageList& history) const;

  bool test_connection();

  const BackendConfig& config() const {
    return config_;
  }

 private:
  RequestDetector detector_;
  ToolInvoker invoker_;
  llm::Backend& backend_;
  BackendConfig config_;
};

}  // namespace claire
