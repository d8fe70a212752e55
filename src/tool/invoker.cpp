#include "claire/tool/invoker.hpp"

#include <spdlog/spdlog.h>

namespace claire {

namespace {

std::string join(const std::vector<ToolId>& names, const std::string& sep) {
  std::string result;
  for (const auto& name : names) {
    if (!result.empty()) result += sep;
    result += name;
  }
  return result;
}

}  // namespace

std::string ToolInvoker::invoke(const ToolCall& call) const {
  return invoke_result(call).to_block();
}

ToolResult ToolInvoker::invoke_result(const ToolCall& call) const {
  auto tool = registry_.get(call.name);
  if (!tool) {
    spdlog::warn("[ToolInvoker] Unknown tool: {}", call.name);
    return ToolResult::unknown(call.name, "Unknown tool: " + call.name + ". Available tools: " + join(registry_.names(), ", "));
  }

  spdlog::debug("[ToolInvoker] Invoking {} with {}", call.name, call.parameters.dump());

  // Both a synchronous throw from execute() and a stored exception in the future count as failure
  try {
    auto future = tool->execute(call.parameters);
    return ToolResult::success(call.name, future.get());
  } catch (const std::exception& e) {
    spdlog::warn("[ToolInvoker] Tool {} failed: {}", call.name, e.what());
    return ToolResult::failure(call.name, std::string("Error: ") + e.what());
  } catch (...) {
    spdlog::warn("[ToolInvoker] Tool {} failed with a non-standard exception", call.name);
    return ToolResult::failure(call.name, "Error: unknown failure");
  }
}

std::vector<std::string> ToolInvoker::process_chain(const std::vector<ToolCall>& calls) const {
  std::vector<std::string> results;
  results.reserve(calls.size());
  for (const auto& call : calls) {
    results.push_back(invoke(call));
  }
  return results;
}

}  // namespace claire
