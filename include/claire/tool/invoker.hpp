#pragma once

#include <string>
#include <vector>

#include "claire/tool/tool.hpp"

namespace claire {

// Executes tool calls against a registry. Failures never escape: they come back
// as error blocks the model can read and react to.
class ToolInvoker {
 public:
  explicit ToolInvoker(const ToolRegistry& registry) : registry_(registry) {}

  // Serialized result block for one call
  std::string invoke(const ToolCall& call) const;

  // Tagged result for one call
  ToolResult invoke_result(const ToolCall& call) const;

  // Sequential, one block per call, in call order
  std::vector<std::string> process_chain(const std::vector<ToolCall>& calls) const;

 private:
  const ToolRegistry& registry_;
};

}  // namespace claire
