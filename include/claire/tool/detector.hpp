#pragma once

#include <string>
#include <vector>

#include "claire/tool/tool.hpp"

namespace claire {

// Finds tool-invocation requests in free text.
//
// Three syntaxes are recognized, each scanned over the whole text:
//   1. [TOOL]{"name": "...", "parameters": {...}}[/TOOL]
//   2. use <tool> tool with <query>.
//   3. /<tool> <query>.
// Results are ordered: every tag match in order of appearance, then the
// natural-language matches tool by tool (registration order), then the slash
// matches tool by tool. Forms 2 and 3 only fire for registered tools; form 1
// accepts any name.
class RequestDetector {
 public:
  explicit RequestDetector(const ToolRegistry& registry) : registry_(registry) {}

  std::vector<ToolCall> detect(const std::string& text) const;

  // Individual passes
  static std::vector<ToolCall> detect_tagged(const std::string& text);

  std::vector<ToolCall> detect_natural_language(const std::string& text) const;

  std::vector<ToolCall> detect_slash_commands(const std::string& text) const;

 private:
  const ToolRegistry& registry_;
};

}  // namespace claire
