#include "claire/llm/openai_compatible.hpp"

#include <spdlog/spdlog.h>

namespace claire::llm {

CompletionResponse parse_chat_response(const net::HttpResponse& response) {
  CompletionResponse result;

  if (!response.error.empty()) {
    result.error = "Network error: " + response.error;
    return result;
  }

  if (!response.ok()) {
    result.error = "HTTP error: " + std::to_string(response.status_code);
    auto err = json::parse(response.body, nullptr, false);
    if (!err.is_discarded() && err.is_object() && err.contains("error")) {
      const auto& e = err["error"];
      if (e.is_object() && e.contains("message") && e["message"].is_string()) {
        result.error = *result.error + " - " + e["message"].get<std::string>();
      } else if (e.is_string()) {
        result.error = *result.error + " - " + e.get<std::string>();
      }
    } else if (!response.body.empty()) {
      result.error = *result.error + " - " + response.body;
    }
    return result;
  }

  auto j = json::parse(response.body, nullptr, false);
  if (j.is_discarded()) {
    result.error = "Parse error: response is not valid JSON";
    return result;
  }

  if (!j.is_object() || !j.contains("choices") || !j["choices"].is_array() || j["choices"].empty()) {
    result.error = "Parse error: response has no choices";
    return result;
  }

  const auto& choice = j["choices"][0];
  if (choice.is_object() && choice.contains("message") && choice["message"].is_object() && choice["message"].contains("content") &&
      choice["message"]["content"].is_string()) {
    result.content = choice["message"]["content"].get<std::string>();
  }
  if (choice.is_object() && choice.contains("finish_reason") && choice["finish_reason"].is_string()) {
    result.finish_reason = choice["finish_reason"].get<std::string>();
  }
  return result;
}

OpenAICompatibleBackend::OpenAICompatibleBackend(const BackendConfig& config, asio::io_context& io_ctx)
    : config_(config), http_client_(io_ctx), base_url_(normalize_base_url(config.base_url)) {
  if (base_url_.empty()) {
    base_url_ = default_base_url("lmstudio");
  }
}

std::future<CompletionResponse> OpenAICompatibleBackend::complete(const CompletionRequest& request) {
  auto promise = std::make_shared<std::promise<CompletionResponse>>();
  auto future = promise->get_future();

  CompletionRequest effective = request;
  if (effective.model.empty()) {
    effective.model = config_.default_model;
  }

  net::HttpOptions options;
  options.method = "POST";
  options.body = effective.to_openai_format().dump(-1, ' ', false, json::error_handler_t::replace);
  options.headers = {{"Content-Type", "application/json"}};
  options.timeout = config_.request_timeout;

  spdlog::info("[{}] chat completion: base_url={}, model={}, messages={}", name(), base_url_, effective.model, effective.messages.size());

  http_client_.request(base_url_ + "/v1/chat/completions", options, [promise](net::HttpResponse response) {
    promise->set_value(parse_chat_response(response));
  });

  return future;
}

std::future<bool> OpenAICompatibleBackend::ping() {
  return probe("/v1/models");
}

std::future<bool> OpenAICompatibleBackend::probe(const std::string& path) {
  auto promise = std::make_shared<std::promise<bool>>();
  auto future = promise->get_future();

  net::HttpOptions options;
  options.method = "GET";
  options.timeout = config_.probe_timeout;

  std::string url = base_url_ + path;
  http_client_.request(url, options, [promise, url](net::HttpResponse response) {
    if (!response.error.empty() || response.status_code != 200) {
      spdlog::warn("[Backend] Local AI server not available at {} (status={}, error={})", url, response.status_code, response.error);
      promise->set_value(false);
      return;
    }
    promise->set_value(true);
  });

  return future;
}

}  // namespace claire::llm
