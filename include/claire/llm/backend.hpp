#pragma once

#include <asio.hpp>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

#include "claire/core/config.hpp"
#include "claire/core/message.hpp"
#include "claire/core/types.hpp"

namespace claire::llm {

// Chat completion request
struct CompletionRequest {
  std::string model;
  MessageList messages;

  std::optional<double> temperature;
  std::optional<int> max_tokens;

  // OpenAI chat/completions body (non-streaming)
  json to_openai_format() const;
};

// Chat completion response (non-streaming)
struct CompletionResponse {
  std::string content;  // first choice's message content
  std::string finish_reason;
  std::optional<std::string> error;

  bool ok() const {
    return !error.has_value();
  }
};

// Connectivity or protocol failure of the completion backend
class BackendError : public std::runtime_error {
 public:
  explicit BackendError(const std::string& message) : std::runtime_error(message) {}
};

// Abstract completion backend
class Backend {
 public:
  virtual ~Backend() = default;

  virtual std::string name() const = 0;

  // Non-streaming completion; failures are reported in CompletionResponse::error
  virtual std::future<CompletionResponse> complete(const CompletionRequest& request) = 0;

  // Lightweight reachability probe
  virtual std::future<bool> ping() = 0;
};

// Backend factory
class BackendFactory {
 public:
  static BackendFactory& instance();

  // Create backend by provider name; nullptr when unknown
  std::shared_ptr<Backend> create(const std::string& name, const BackendConfig& config, asio::io_context& io_ctx);

  // Register custom backend factory
  using FactoryFunc = std::function<std::shared_ptr<Backend>(const BackendConfig&, asio::io_context&)>;
  void register_backend(const std::string& name, FactoryFunc factory);

 private:
  BackendFactory();

  std::map<std::string, FactoryFunc> factories_;
};

}  // namespace claire::llm
