#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

#include "claire/core/types.hpp"

namespace claire {

// Backend connection settings
struct BackendConfig {
  std::string provider = "lmstudio";  // "lmstudio" or "ollama"
  std::string base_url = "http://localhost:6223";
  std::string default_model = "google/gemma-3-4b";

  // Generation parameters
  double temperature = 0.7;
  int max_tokens = 100000;

  std::chrono::seconds request_timeout{120};
  // Connectivity probe used before falling back to the offline notice
  std::chrono::seconds probe_timeout{5};
};

// Agentic loop settings
struct AgentSettings {
  int max_turns = 5;
};

// Application configuration
struct Config {
  BackendConfig backend;
  AgentSettings agent;

  std::string default_mode = "general";

  // Logging
  std::string log_level = "info";
  std::optional<std::filesystem::path> log_file;

  // Build from a JSON document; missing keys keep their defaults
  static Result<Config> parse(const json& j);

  // Load from file (defaults when the file is missing or malformed)
  static Config load(const std::filesystem::path& path);

  // Load default config from project/global config files
  static Config load_default();

  // Load config from environment variables, with file config as base
  // Reads: CLAIRE_PROVIDER, CLAIRE_BASE_URL, CLAIRE_MODEL, CLAIRE_LOG_LEVEL
  static Config from_env();

  json to_json() const;

  // Save to file
  void save(const std::filesystem::path& path) const;
};

// Strip one trailing '/' and a trailing "/v1"; the backend appends "/v1/..." itself
std::string normalize_base_url(const std::string& url);

// Default base URL for a provider name
std::string default_base_url(const std::string& provider);

// Configuration paths
namespace config_paths {
std::filesystem::path home_dir();

std::filesystem::path config_dir();

std::filesystem::path default_config_file();

std::filesystem::path project_config_file();
}  // namespace config_paths

}  // namespace claire
