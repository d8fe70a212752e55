#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "claire/core/types.hpp"
#include "claire/tool/tool.hpp"

namespace claire {

// Static per-mode instruction template
struct Protocol {
  std::string directive;
  std::string context;
  std::string rationale;
  std::vector<std::string> examples;
  std::vector<std::string> constraints;
  std::optional<json> tools;  // manifest snapshot, only for modes that embed it

  // Field order is kept so the echo reads like the prose
  ordered_json to_json() const;
};

// Builds system instructions for the assistant modes and the agentic loop
class PromptComposer {
 public:
  explicit PromptComposer(const ToolRegistry& registry) : registry_(registry) {}

  Protocol protocol(AssistantMode mode) const;

  // Unrecognized mode names get the general protocol
  Protocol protocol(const std::string& mode) const {
    return protocol(assistant_mode_from_string(mode));
  }

  // Directive/context/rationale, tool usage block, then the protocol echo
  std::string system_prompt(AssistantMode mode) const;

  std::string system_prompt(const std::string& mode) const {
    return system_prompt(assistant_mode_from_string(mode));
  }

  // Empty when no tools are registered
  std::string tool_instructions() const;

  std::string agentic_system_prompt() const;

 private:
  static std::string describe_tools(const std::vector<std::shared_ptr<Tool>>& tools);

  const ToolRegistry& registry_;
};

}  // namespace claire
