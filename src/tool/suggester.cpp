#include "claire/tool/suggester.hpp"

#include <algorithm>
#include <iterator>

namespace claire {

ToolSuggester::ToolSuggester(const ToolRegistry& registry)
    : registry_(registry),
      keywords_{
          {"search_wikipedia", {"search", "find", "look up", "research", "wikipedia", "information about"}},
          {"analyze_text", {"analyze", "sentiment", "keywords", "readability", "analysis"}},
          {"summarize_content", {"summarize", "summary", "key points", "tldr", "brief"}},
          {"plan_task", {"plan", "steps", "break down", "organize", "schedule", "task"}},
      } {}

void ToolSuggester::add_keywords(const std::string& tool, const std::vector<std::string>& keywords) {
  auto it = std::find_if(keywords_.begin(), keywords_.end(), [&tool](const auto& entry) {
    return entry.first == tool;
  });
  if (it == keywords_.end()) {
    keywords_.emplace_back(tool, std::vector<std::string>{});
    it = std::prev(keywords_.end());
  }
  for (const auto& keyword : keywords) {
    it->second.push_back(to_lower(keyword));
  }
}

std::vector<std::shared_ptr<Tool>> ToolSuggester::suggest(const std::string& input) const {
  std::vector<std::shared_ptr<Tool>> suggestions;
  const auto lower = to_lower(input);

  for (const auto& [name, keywords] : keywords_) {
    bool hit = std::any_of(keywords.begin(), keywords.end(), [&lower](const std::string& keyword) {
      return lower.find(keyword) != std::string::npos;
    });
    if (!hit) continue;

    auto tool = registry_.get(name);
    if (tool && std::find(suggestions.begin(), suggestions.end(), tool) == suggestions.end()) {
      suggestions.push_back(tool);
    }
  }

  return suggestions;
}

}  // namespace claire
