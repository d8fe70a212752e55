#include "claire/tool/tool.hpp"

namespace claire {

std::string ParameterSchema::signature() const {
  return name + " (" + type + (required ? ", required" : "") + ")";
}

json ParameterSchema::to_json() const {
  return json{{"name", name}, {"type", type}, {"description", description}, {"required", required}};
}

std::string ToolResult::to_block() const {
  if (unknown_tool) {
    return "[TOOL_ERROR]" + error + "[/TOOL_ERROR]";
  }
  if (is_error) {
    return "[TOOL_ERROR:" + tool_name + "]" + error + "[/TOOL_ERROR]";
  }
  // Replace invalid UTF-8 rather than throwing from dump()
  return "[TOOL_RESULT:" + tool_name + "]" + payload.dump(-1, ' ', false, json::error_handler_t::replace) + "[/TOOL_RESULT]";
}

json Tool::to_manifest() const {
  json params = json::array();
  for (const auto &param : parameters()) {
    params.push_back(param.to_json());
  }
  return json{{"name", id()}, {"description", description()}, {"parameters", params}};
}

std::string Tool::signature() const {
  std::string result;
  for (const auto &param : parameters()) {
    if (!result.empty()) result += ", ";
    result += param.signature();
  }
  return result;
}

SimpleTool::SimpleTool(ToolId id, std::string description, std::optional<std::string> category)
    : id_(std::move(id)), description_(std::move(description)), category_(std::move(category)) {}

FunctionTool::FunctionTool(ToolId id, std::string description, std::vector<ParameterSchema> parameters, Handler handler,
                           std::optional<std::string> category)
    : SimpleTool(std::move(id), std::move(description), std::move(category)), parameters_(std::move(parameters)), handler_(std::move(handler)) {}

std::future<json> FunctionTool::execute(const json &args) {
  std::promise<json> promise;
  try {
    promise.set_value(handler_(args));
  } catch (...) {
    promise.set_exception(std::current_exception());
  }
  return promise.get_future();
}

}  // namespace claire
