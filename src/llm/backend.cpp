#include "claire/llm/backend.hpp"

#include "claire/llm/ollama.hpp"
#include "claire/llm/openai_compatible.hpp"

namespace claire::llm {

json CompletionRequest::to_openai_format() const {
  json request;
  request["model"] = model;

  json msgs = json::array();
  for (const auto& msg : messages) {
    msgs.push_back(msg.to_api_format());
  }
  request["messages"] = msgs;

  if (temperature) {
    request["temperature"] = *temperature;
  }
  if (max_tokens) {
    request["max_tokens"] = *max_tokens;
  }
  request["stream"] = false;

  return request;
}

BackendFactory::BackendFactory() {
  register_backend("lmstudio", [](const BackendConfig& cfg, asio::io_context& ctx) {
    return std::make_shared<OpenAICompatibleBackend>(cfg, ctx);
  });
  register_backend("ollama", [](const BackendConfig& cfg, asio::io_context& ctx) {
    return std::make_shared<OllamaBackend>(cfg, ctx);
  });
}

BackendFactory& BackendFactory::instance() {
  static BackendFactory instance;
  return instance;
}

std::shared_ptr<Backend> BackendFactory::create(const std::string& name, const BackendConfig& config, asio::io_context& io_ctx) {
  auto it = factories_.find(name);
  if (it != factories_.end()) {
    return it->second(config, io_ctx);
  }
  return nullptr;
}

void BackendFactory::register_backend(const std::string& name, FactoryFunc factory) {
  factories_[name] = std::move(factory);
}

}  // namespace claire::llm
