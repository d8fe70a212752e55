#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>

#include "claire/core/config.hpp"

using namespace claire;

namespace fs = std::filesystem;

// --- ConfigTest ---

TEST(ConfigTest, Defaults) {
  Config config;

  EXPECT_EQ(config.backend.provider, "lmstudio");
  EXPECT_EQ(config.backend.base_url, "http://localhost:6223");
  EXPECT_EQ(config.backend.default_model, "google/gemma-3-4b");
  EXPECT_DOUBLE_EQ(config.backend.temperature, 0.7);
  EXPECT_EQ(config.backend.max_tokens, 100000);
  EXPECT_EQ(config.backend.probe_timeout.count(), 5);
  EXPECT_EQ(config.agent.max_turns, 5);
  EXPECT_EQ(config.default_mode, "general");
  EXPECT_EQ(config.log_level, "info");
}

TEST(ConfigTest, ParseOverrides) {
  auto parsed = Config::parse(json{{"backend", {{"provider", "ollama"}, {"default_model", "llama3"}, {"temperature", 0.2}}},
                                   {"agent", {{"max_turns", 8}}},
                                   {"default_mode", "coding"},
                                   {"log_level", "debug"}});

  ASSERT_TRUE(parsed.ok());
  const auto& config = *parsed.value;
  EXPECT_EQ(config.backend.provider, "ollama");
  // Provider default applies when no base_url is given
  EXPECT_EQ(config.backend.base_url, "http://localhost:11434");
  EXPECT_EQ(config.backend.default_model, "llama3");
  EXPECT_DOUBLE_EQ(config.backend.temperature, 0.2);
  EXPECT_EQ(config.agent.max_turns, 8);
  EXPECT_EQ(config.default_mode, "coding");
  EXPECT_EQ(config.log_level, "debug");
}

TEST(ConfigTest, ParseNormalizesBaseUrl) {
  auto parsed = Config::parse(json{{"backend", {{"base_url", "http://box:1234/v1/"}}}});
  ASSERT_TRUE(parsed.ok());
  EXPECT_EQ(parsed.value->backend.base_url, "http://box:1234");
}

TEST(ConfigTest, ParseRejectsBadInput) {
  EXPECT_TRUE(Config::parse(json::array()).failed());
  EXPECT_TRUE(Config::parse(json{{"agent", {{"max_turns", 0}}}}).failed());
  EXPECT_TRUE(Config::parse(json{{"backend", {{"max_tokens", "lots"}}}}).failed());
}

TEST(ConfigTest, SaveAndLoad) {
  auto path = fs::temp_directory_path() / "claire_test_config" / "config.json";
  fs::remove_all(path.parent_path());

  Config config;
  config.backend.default_model = "saved-model";
  config.agent.max_turns = 3;
  config.save(path);

  auto loaded = Config::load(path);
  EXPECT_EQ(loaded.backend.default_model, "saved-model");
  EXPECT_EQ(loaded.agent.max_turns, 3);

  fs::remove_all(path.parent_path());
}

TEST(ConfigTest, LoadMalformedFallsBackToDefaults) {
  auto path = fs::temp_directory_path() / "claire_bad_config.json";
  {
    std::ofstream out(path);
    out << "{ not json";
  }

  auto config = Config::load(path);
  EXPECT_EQ(config.backend.default_model, "google/gemma-3-4b");

  fs::remove(path);
}

TEST(ConfigTest, LoadMissingFile) {
  auto config = Config::load("/nonexistent/claire/config.json");
  EXPECT_EQ(config.backend.provider, "lmstudio");
}

TEST(ConfigTest, FromEnv) {
  setenv("CLAIRE_PROVIDER", "ollama", 1);
  setenv("CLAIRE_MODEL", "phi3", 1);
  unsetenv("CLAIRE_BASE_URL");

  auto config = Config::from_env();
  EXPECT_EQ(config.backend.provider, "ollama");
  EXPECT_EQ(config.backend.base_url, "http://localhost:11434");
  EXPECT_EQ(config.backend.default_model, "phi3");

  setenv("CLAIRE_BASE_URL", "http://gpu:9000/v1", 1);
  EXPECT_EQ(Config::from_env().backend.base_url, "http://gpu:9000");

  unsetenv("CLAIRE_PROVIDER");
  unsetenv("CLAIRE_MODEL");
  unsetenv("CLAIRE_BASE_URL");
}

// --- BaseUrlTest ---

TEST(BaseUrlTest, Normalize) {
  EXPECT_EQ(normalize_base_url("http://localhost:6223"), "http://localhost:6223");
  EXPECT_EQ(normalize_base_url("http://localhost:6223/"), "http://localhost:6223");
  EXPECT_EQ(normalize_base_url("http://localhost:6223/v1"), "http://localhost:6223");
  EXPECT_EQ(normalize_base_url("http://localhost:6223/v1/"), "http://localhost:6223");
}

TEST(BaseUrlTest, ProviderDefaults) {
  EXPECT_EQ(default_base_url("lmstudio"), "http://localhost:6223");
  EXPECT_EQ(default_base_url("ollama"), "http://localhost:11434");
}

// --- ConfigPathsTest ---

TEST(ConfigPathsTest, Layout) {
  EXPECT_EQ(config_paths::config_dir(), config_paths::home_dir() / ".config" / "claire");
  EXPECT_EQ(config_paths::default_config_file().filename(), "config.json");
  EXPECT_EQ(config_paths::project_config_file().parent_path().filename(), ".claire");
}
