#include <spdlog/spdlog.h>

#include "claire/tool/builtin/builtins.hpp"

namespace claire::tools {

namespace {

// Split a task description into its parts at ";", "," and the connectives "and then", "then", "and"
std::vector<std::string> split_subtasks(const std::string& task) {
  std::vector<std::string> parts;
  std::string lower = to_lower(task);

  static const std::vector<std::string> separators = {";", ",", " and then ", " then ", " and "};

  size_t start = 0;
  size_t pos = 0;
  while (pos < lower.size()) {
    size_t matched = 0;
    for (const auto& sep : separators) {
      if (lower.compare(pos, sep.size(), sep) == 0) {
        matched = sep.size();
        break;
      }
    }
    if (matched == 0) {
      pos++;
      continue;
    }
    auto part = trim(task.substr(start, pos - start));
    if (!part.empty()) parts.push_back(part);
    pos += matched;
    start = pos;
  }

  auto tail = trim(task.substr(start));
  while (!tail.empty() && (tail.back() == '.' || tail.back() == '!' || tail.back() == '?')) {
    tail.pop_back();
  }
  if (!tail.empty()) parts.push_back(tail);
  return parts;
}

std::string capitalize(std::string s) {
  if (!s.empty() && s[0] >= 'a' && s[0] <= 'z') {
    s[0] = static_cast<char>(s[0] - 'a' + 'A');
  }
  return s;
}

}  // namespace

json plan_task(const std::string& task, const std::string& context) {
  auto goal = trim(task);
  if (goal.empty()) {
    throw ToolError("Parameter 'task' is required");
  }

  std::vector<std::string> steps;
  steps.push_back("Clarify the goal and success criteria: " + goal);
  if (!trim(context).empty()) {
    steps.push_back("Review the constraints: " + trim(context));
  }
  for (const auto& part : split_subtasks(goal)) {
    steps.push_back(capitalize(part));
  }
  steps.push_back("Review the results against the goal");

  json list = json::array();
  for (size_t i = 0; i < steps.size(); ++i) {
    list.push_back({{"step", i + 1}, {"description", steps[i]}});
  }

  json result{{"task", goal}, {"steps", list}, {"total_steps", steps.size()}};
  if (!trim(context).empty()) {
    result["context"] = trim(context);
  }
  return result;
}

// ============================================================================
// PlanTaskTool
// ============================================================================

PlanTaskTool::PlanTaskTool() : SimpleTool("plan_task", "Break down complex tasks into manageable steps", "planning") {}

std::vector<ParameterSchema> PlanTaskTool::parameters() const {
  return {{"task", "string", "The complex task to plan", true}, {"context", "string", "Additional context or constraints", false}};
}

std::future<json> PlanTaskTool::execute(const json& args) {
  return std::async(std::launch::async, [args]() -> json {
    return plan_task(string_arg(args, "task"), string_arg(args, "context"));
  });
}

// ============================================================================
// Registration
// ============================================================================

void register_builtins(ToolRegistry& registry, std::shared_ptr<net::HttpClient> http) {
  if (http) {
    registry.register_tool(std::make_shared<WikipediaSearchTool>(std::move(http)));
  } else {
    spdlog::warn("[Builtins] No HTTP client, search_wikipedia not registered");
  }
  registry.register_tool(std::make_shared<AnalyzeTextTool>());
  registry.register_tool(std::make_shared<SummarizeContentTool>());
  registry.register_tool(std::make_shared<PlanTaskTool>());

  spdlog::debug("[Builtins] Registered {} tool(s)", registry.size());
}

}  // namespace claire::tools
