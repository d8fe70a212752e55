#pragma once

#include "claire/llm/backend.hpp"
#include "claire/net/http_client.hpp"

namespace claire::llm {

// Map a /v1/chat/completions reply to a CompletionResponse. Transport, HTTP and
// body failures end up in `error`, never thrown.
CompletionResponse parse_chat_response(const net::HttpResponse& response);

// OpenAI-compatible chat backend (LM Studio and friends)
class OpenAICompatibleBackend : public Backend {
 public:
  OpenAICompatibleBackend(const BackendConfig& config, asio::io_context& io_ctx);

  std::string name() const override {
    return "lmstudio";
  }

  std::future<CompletionResponse> complete(const CompletionRequest& request) override;

  // GET /v1/models
  std::future<bool> ping() override;

  const std::string& base_url() const {
    return base_url_;
  }

  void set_base_url(const std::string& url) {
    base_url_ = normalize_base_url(url);
  }

 protected:
  // Probe an endpoint: true when it answers 200 within the probe timeout
  std::future<bool> probe(const std::string& path);

  const BackendConfig& config() const {
    return config_;
  }

 private:
  BackendConfig config_;
  net::HttpClient http_client_;
  std::string base_url_;
};

}  // namespace claire::llm
