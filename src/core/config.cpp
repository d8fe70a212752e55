#include "claire/core/config.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <fstream>

namespace claire {

namespace fs = std::filesystem;

Result<Config> Config::parse(const json& j) {
  if (!j.is_object()) {
    return Result<Config>::failure("Config root must be a JSON object");
  }

  Config config;

  try {
    // Backend
    if (j.contains("backend")) {
      const auto& b = j["backend"];
      config.backend.provider = b.value("provider", config.backend.provider);
      if (b.contains("base_url")) {
        config.backend.base_url = normalize_base_url(b["base_url"].get<std::string>());
      } else {
        config.backend.base_url = default_base_url(config.backend.provider);
      }
      config.backend.default_model = b.value("default_model", config.backend.default_model);
      config.backend.temperature = b.value("temperature", config.backend.temperature);
      config.backend.max_tokens = b.value("max_tokens", config.backend.max_tokens);
      config.backend.request_timeout = std::chrono::seconds(b.value("request_timeout", 120));
      config.backend.probe_timeout = std::chrono::seconds(b.value("probe_timeout", 5));
    }

    // Agentic loop
    if (j.contains("agent")) {
      int max_turns = j["agent"].value("max_turns", config.agent.max_turns);
      if (max_turns <= 0) {
        return Result<Config>::failure("agent.max_turns must be positive");
      }
      config.agent.max_turns = max_turns;
    }

    config.default_mode = j.value("default_mode", config.default_mode);

    config.log_level = j.value("log_level", "info");
    if (j.contains("log_file")) {
      config.log_file = j["log_file"].get<std::string>();
    }
  } catch (const json::exception& e) {
    return Result<Config>::failure(std::string("Invalid config: ") + e.what());
  }

  return Result<Config>::success(config);
}

Config Config::load(const fs::path& path) {
  if (!fs::exists(path)) {
    return Config{};
  }

  std::ifstream file(path);
  if (!file.is_open()) {
    spdlog::warn("[Config] Cannot open {}", path.string());
    return Config{};
  }

  json j = json::parse(file, nullptr, false);
  if (j.is_discarded()) {
    spdlog::warn("[Config] {} is not valid JSON, using defaults", path.string());
    return Config{};
  }

  auto parsed = parse(j);
  if (!parsed.ok()) {
    spdlog::warn("[Config] {}: {}, using defaults", path.string(), *parsed.error);
    return Config{};
  }
  return *parsed.value;
}

Config Config::load_default() {
  // Try to load from project config first, then global
  auto project_config = config_paths::project_config_file();
  if (fs::exists(project_config)) {
    return load(project_config);
  }

  auto global_config = config_paths::default_config_file();
  if (fs::exists(global_config)) {
    return load(global_config);
  }

  return Config{};
}

Config Config::from_env() {
  Config config = load_default();

  const char* provider = std::getenv("CLAIRE_PROVIDER");
  if (provider) {
    config.backend.provider = provider;
    config.backend.base_url = default_base_url(config.backend.provider);
  }

  const char* base_url = std::getenv("CLAIRE_BASE_URL");
  if (base_url) {
    config.backend.base_url = normalize_base_url(base_url);
  }

  const char* model = std::getenv("CLAIRE_MODEL");
  if (model) {
    config.backend.default_model = model;
  }

  const char* level = std::getenv("CLAIRE_LOG_LEVEL");
  if (level) {
    config.log_level = level;
  }

  return config;
}

json Config::to_json() const {
  json j;
  j["backend"] = {{"provider", backend.provider},
                  {"base_url", backend.base_url},
                  {"default_model", backend.default_model},
                  {"temperature", backend.temperature},
                  {"max_tokens", backend.max_tokens},
                  {"request_timeout", backend.request_timeout.count()},
                  {"probe_timeout", backend.probe_timeout.count()}};
  j["agent"] = {{"max_turns", agent.max_turns}};
  j["default_mode"] = default_mode;
  j["log_level"] = log_level;
  if (log_file) {
    j["log_file"] = log_file->string();
  }
  return j;
}

void Config::save(const fs::path& path) const {
  std::error_code ec;
  if (path.has_parent_path()) {
    fs::create_directories(path.parent_path(), ec);
  }

  std::ofstream file(path);
  if (!file.is_open()) {
    spdlog::error("[Config] Cannot write {}", path.string());
    return;
  }
  file << to_json().dump(2);
}

std::string normalize_base_url(const std::string& url) {
  std::string result = url;
  if (!result.empty() && result.back() == '/') {
    result.pop_back();
  }
  const std::string suffix = "/v1";
  if (result.size() >= suffix.size() && result.compare(result.size() - suffix.size(), suffix.size(), suffix) == 0) {
    result.erase(result.size() - suffix.size());
  }
  return result;
}

std::string default_base_url(const std::string& provider) {
  if (provider == "ollama") return "http://localhost:11434";
  return "http://localhost:6223";
}

namespace config_paths {

fs::path home_dir() {
  const char* home = std::getenv("HOME");
  if (home) {
    return fs::path(home);
  }
#ifdef _WIN32
  const char* userprofile = std::getenv("USERPROFILE");
  if (userprofile) {
    return fs::path(userprofile);
  }
#endif
  return fs::current_path();
}

fs::path config_dir() {
  return home_dir() / ".config" / "claire";
}

fs::path default_config_file() {
  return config_dir() / "config.json";
}

fs::path project_config_file() {
  return fs::current_path() / ".claire" / "config.json";
}

}  // namespace config_paths

}  // namespace claire
