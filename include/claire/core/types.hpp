#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace claire {

using json = nlohmann::json;
using ordered_json = nlohmann::ordered_json;

using ToolId = std::string;

// Result type for operations that can fail
template <typename T>
struct Result {
  std::optional<T> value;
  std::optional<std::string> error;

  bool ok() const {
    return value.has_value();
  }

  bool failed() const {
    return error.has_value();
  }

  static Result success(T val) {
    return Result{std::move(val), std::nullopt};
  }

  static Result failure(std::string err) {
    return Result{std::nullopt, std::move(err)};
  }
};

// Assistant modes, each with its own protocol
enum class AssistantMode { General, Writing, Research, Coding, Pdf, Web };

std::string to_string(AssistantMode mode);

// Unknown names fall back to General
AssistantMode assistant_mode_from_string(const std::string &str);

// Replace invalid UTF-8 sequences with U+FFFD
std::string sanitize_utf8(const std::string &input);

// ASCII lower-casing and whitespace trimming
std::string to_lower(std::string str);

std::string trim(const std::string &str);

// Whole-string decimal in [1, INT_MAX]; nullopt for anything else
std::optional<int> parse_positive_int(const std::string &str);

}  // namespace claire
