#pragma once

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "claire/tool/tool.hpp"

namespace claire {

// Keyword-based tool suggestions for raw user input
class ToolSuggester {
 public:
  // Starts with keyword lists for the builtin tools
  explicit ToolSuggester(const ToolRegistry& registry);

  // Append keywords for a tool (matched case-insensitively as substrings)
  void add_keywords(const std::string& tool, const std::vector<std::string>& keywords);

  // Registered tools with a keyword hit, in keyword-table order, without duplicates
  std::vector<std::shared_ptr<Tool>> suggest(const std::string& input) const;

 private:
  const ToolRegistry& registry_;
  std::vector<std::pair<std::string, std::vector<std::string>>> keywords_;
};

}  // namespace claire
