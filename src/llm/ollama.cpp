#include "claire/llm/ollama.hpp"

namespace claire::llm {

namespace {

BackendConfig with_ollama_defaults(BackendConfig config) {
  if (config.base_url.empty()) {
    config.base_url = default_base_url("ollama");
  }
  return config;
}

}  // namespace

OllamaBackend::OllamaBackend(const BackendConfig& config, asio::io_context& io_ctx) : OpenAICompatibleBackend(with_ollama_defaults(config), io_ctx) {}

std::future<bool> OllamaBackend::ping() {
  return probe("/api/version");
}

}  // namespace claire::llm
