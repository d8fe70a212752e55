#pragma once

#include "claire/llm/openai_compatible.hpp"

namespace claire::llm {

// Ollama backend for local LLM serving
// Uses Ollama's OpenAI-compatible chat endpoint; only the reachability probe differs
class OllamaBackend : public OpenAICompatibleBackend {
 public:
  OllamaBackend(const BackendConfig& config, asio::io_context& io_ctx);

  std::string name() const override {
    return "ollama";
  }

  // GET /api/version
  std::future<bool> ping() override;
};

}  // namespace claire::llm
