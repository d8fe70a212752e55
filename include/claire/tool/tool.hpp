#pragma once

#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "claire/core/types.hpp"

namespace claire {

// Thrown by a tool's capability when it cannot produce a result
class ToolError : public std::runtime_error {
 public:
  explicit ToolError(const std::string& message) : std::runtime_error(message) {}
};

// Parameter declaration
struct ParameterSchema {
  std::string name;
  std::string type;  // "string", "number", "boolean", "object", "array"
  std::string description;
  bool required = true;

  // "name (type, required)" or "name (type)"
  std::string signature() const;

  json to_json() const;
};

// A request to invoke a tool, extracted from text
struct ToolCall {
  std::string name;
  json parameters = json::object();

  bool operator==(const ToolCall& other) const {
    return name == other.name && parameters == other.parameters;
  }
};

// Outcome of one invocation. Always attributable to the tool that produced it.
struct ToolResult {
  std::string tool_name;
  json payload;
  std::string error;
  bool is_error = false;
  bool unknown_tool = false;  // the name did not resolve to a registered tool

  static ToolResult success(const std::string& tool_name, json payload) {
    return ToolResult{tool_name, std::move(payload), "", false, false};
  }

  static ToolResult failure(const std::string& tool_name, const std::string& message) {
    return ToolResult{tool_name, nullptr, message, true, false};
  }

  static ToolResult unknown(const std::string& tool_name, const std::string& message) {
    return ToolResult{tool_name, nullptr, message, true, true};
  }

  // [TOOL_RESULT:<name>]<json>[/TOOL_RESULT], [TOOL_ERROR:<name>]<message>[/TOOL_ERROR],
  // or [TOOL_ERROR]<message>[/TOOL_ERROR] for unknown tools
  std::string to_block() const;
};

// Tool definition
class Tool {
 public:
  virtual ~Tool() = default;

  virtual ToolId id() const = 0;

  virtual std::string description() const = 0;

  virtual std::vector<ParameterSchema> parameters() const = 0;

  virtual std::optional<std::string> category() const {
    return std::nullopt;
  }

  // Run the capability. Failures surface as an exception from future::get().
  virtual std::future<json> execute(const json& args) = 0;

  // {"name", "description", "parameters": [...]}
  json to_manifest() const;

  // "a (string, required), b (number)"
  std::string signature() const;
};

// Base class for simpler tool implementation
class SimpleTool : public Tool {
 public:
  SimpleTool(ToolId id, std::string description, std::optional<std::string> category = std::nullopt);

  ToolId id() const override {
    return id_;
  }

  std::string description() const override {
    return description_;
  }

  std::optional<std::string> category() const override {
    return category_;
  }

 protected:
  ToolId id_;
  std::string description_;
  std::optional<std::string> category_;
};

// Tool backed by a callable, for ad-hoc registration
class FunctionTool : public SimpleTool {
 public:
  using Handler = std::function<json(const json& args)>;

  FunctionTool(ToolId id, std::string description, std::vector<ParameterSchema> parameters, Handler handler,
               std::optional<std::string> category = std::nullopt);

  std::vector<ParameterSchema> parameters() const override {
    return parameters_;
  }

  // Runs the handler inline; the returned future is already satisfied
  std::future<json> execute(const json& args) override;

 private:
  std::vector<ParameterSchema> parameters_;
  Handler handler_;
};

// Name-keyed tool registry, enumerated in registration order.
// Mutate during setup only; the mutex makes single mutations atomic, it does not
// make a running detection/invocation see a consistent snapshot.
class ToolRegistry {
 public:
  ToolRegistry() = default;

  ToolRegistry(const ToolRegistry&) = delete;
  ToolRegistry& operator=(const ToolRegistry&) = delete;

  // Process-wide registry
  static ToolRegistry& instance();

  // Register a tool. An existing tool with the same id is replaced in place.
  void register_tool(std::shared_ptr<Tool> tool);

  // Returns whether a tool was removed
  bool unregister_tool(const std::string& id);

  std::shared_ptr<Tool> get(const std::string& id) const;

  bool contains(const std::string& id) const;

  // All tools, optionally only those with an exactly matching category
  std::vector<std::shared_ptr<Tool>> list(const std::optional<std::string>& category = std::nullopt) const;

  std::vector<ToolId> names() const;

  size_t size() const;

  bool empty() const;

  void clear();

 private:
  mutable std::mutex mutex_;
  std::map<ToolId, std::shared_ptr<Tool>> tools_;
  std::vector<ToolId> order_;
};

}  // namespace claire
