#include "claire/tool/detector.hpp"

#include <spdlog/spdlog.h>

#include <cctype>

namespace claire {

namespace {

constexpr const char* kTagOpen = "[TOOL]";
constexpr const char* kTagClose = "[/TOOL]";

bool is_word_char(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

bool is_blank(char c) {
  return c == ' ' || c == '\t';
}

bool is_terminator(char c) {
  return c == '.' || c == '!' || c == '?' || c == '\n';
}

// Skip one or more blanks; npos when there is none at pos (or pos is npos)
size_t skip_blanks(const std::string& s, size_t pos) {
  if (pos >= s.size() || !is_blank(s[pos])) {
    return std::string::npos;
  }
  while (pos < s.size() && is_blank(s[pos])) {
    ++pos;
  }
  return pos;
}

// Position after `literal` if it occurs at pos, otherwise npos
size_t expect(const std::string& s, size_t pos, const std::string& literal) {
  if (pos == std::string::npos || s.compare(pos, literal.size(), literal) != 0) {
    return std::string::npos;
  }
  return pos + literal.size();
}

// Capture up to the next sentence terminator; returns the end position
size_t capture_query(const std::string& text, size_t pos, std::string& query) {
  size_t end = pos;
  while (end < text.size() && !is_terminator(text[end])) {
    ++end;
  }
  query = trim(text.substr(pos, end - pos));
  return end;
}

ToolCall query_call(const std::string& name, const std::string& query) {
  return ToolCall{name, json{{"query", query}}};
}

}  // namespace

std::vector<ToolCall> RequestDetector::detect(const std::string& text) const {
  std::vector<ToolCall> calls = detect_tagged(text);

  auto natural = detect_natural_language(text);
  calls.insert(calls.end(), natural.begin(), natural.end());

  auto slash = detect_slash_commands(text);
  calls.insert(calls.end(), slash.begin(), slash.end());

  if (!calls.empty()) {
    spdlog::debug("[RequestDetector] {} tool call(s) detected", calls.size());
  }
  return calls;
}

std::vector<ToolCall> RequestDetector::detect_tagged(const std::string& text) {
  std::vector<ToolCall> calls;
  const std::string open = kTagOpen;
  const std::string close = kTagClose;

  size_t pos = 0;
  while (true) {
    size_t start = text.find(open, pos);
    if (start == std::string::npos) break;

    size_t body_start = start + open.size();
    size_t end = text.find(close, body_start);
    if (end == std::string::npos) break;
    pos = end + close.size();

    std::string body = trim(text.substr(body_start, end - body_start));
    json j = json::parse(body, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
      spdlog::warn("[RequestDetector] Dropping malformed tool call: {}", body);
      continue;
    }
    if (!j.contains("name") || !j["name"].is_string() || !j.contains("parameters")) {
      spdlog::warn("[RequestDetector] Tool call needs \"name\" and \"parameters\": {}", body);
      continue;
    }

    json params = j["parameters"];
    if (params.is_null()) {
      params = json::object();
    }
    if (!params.is_object()) {
      spdlog::warn("[RequestDetector] Tool call parameters must be an object: {}", body);
      continue;
    }

    calls.push_back(ToolCall{j["name"].get<std::string>(), std::move(params)});
  }

  return calls;
}

std::vector<ToolCall> RequestDetector::detect_natural_language(const std::string& text) const {
  std::vector<ToolCall> calls;
  const std::string lower = to_lower(text);

  for (const auto& name : registry_.names()) {
    const std::string lname = to_lower(name);

    size_t pos = 0;
    while ((pos = lower.find("use", pos)) != std::string::npos) {
      size_t match_start = pos;
      pos += 3;
      if (match_start > 0 && is_word_char(lower[match_start - 1])) {
        continue;
      }

      // use <name> tool with <query>
      size_t p = skip_blanks(lower, pos);
      p = expect(lower, p, lname);
      p = skip_blanks(lower, p);
      p = expect(lower, p, "tool");
      p = skip_blanks(lower, p);
      p = expect(lower, p, "with");
      p = skip_blanks(lower, p);
      if (p == std::string::npos) {
        continue;
      }

      std::string query;
      pos = capture_query(text, p, query);
      if (!query.empty()) {
        calls.push_back(query_call(name, query));
      }
    }
  }

  return calls;
}

std::vector<ToolCall> RequestDetector::detect_slash_commands(const std::string& text) const {
  std::vector<ToolCall> calls;
  const std::string lower = to_lower(text);

  for (const auto& name : registry_.names()) {
    const std::string needle = "/" + to_lower(name);

    size_t pos = 0;
    while ((pos = lower.find(needle, pos)) != std::string::npos) {
      size_t match_start = pos;
      pos += needle.size();

      // Only at the start of the text or after whitespace / an opening bracket (not inside URLs or paths)
      if (match_start > 0) {
        char prev = lower[match_start - 1];
        if (!std::isspace(static_cast<unsigned char>(prev)) && prev != '(' && prev != '[' && prev != '{' && prev != '"' && prev != '\'') {
          continue;
        }
      }

      size_t p = skip_blanks(lower, pos);
      if (p == std::string::npos) {
        continue;
      }

      std::string query;
      pos = capture_query(text, p, query);
      if (!query.empty()) {
        calls.push_back(query_call(name, query));
      }
    }
  }

  return calls;
}

}  // namespace claire
