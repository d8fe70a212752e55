#include "claire/prompt/composer.hpp"

#include <sstream>

namespace claire {

ordered_json Protocol::to_json() const {
  ordered_json j;
  j["directive"] = directive;
  j["context"] = context;
  j["rationale"] = rationale;
  j["examples"] = examples;
  j["constraints"] = constraints;
  if (tools) {
    // Keep name/description/parameters order inside each entry as well
    ordered_json manifest = ordered_json::array();
    for (const auto& tool : *tools) {
      ordered_json entry;
      entry["name"] = tool.value("name", "");
      entry["description"] = tool.value("description", "");
      ordered_json params = ordered_json::array();
      if (tool.contains("parameters")) {
        for (const auto& p : tool["parameters"]) {
          ordered_json param;
          param["name"] = p.value("name", "");
          param["type"] = p.value("type", "");
          param["description"] = p.value("description", "");
          param["required"] = p.value("required", false);
          params.push_back(param);
        }
      }
      entry["parameters"] = params;
      manifest.push_back(entry);
    }
    j["tools"] = manifest;
  }
  return j;
}

Protocol PromptComposer::protocol(AssistantMode mode) const {
  switch (mode) {
    case AssistantMode::Writing:
      return Protocol{"You are Claire, a writing assistant.",
                      "You help users improve their writing by offering suggestions, edits, and feedback.",
                      "Focus on clarity, conciseness, and impact.",
                      {"Write a short story about a dog named Charlie.",
                       "Rewrite this paragraph to make it more engaging: \"The quick brown fox jumps over the lazy dog.\"",
                       "Rewrite this sentence to make it more engaging: \"The quick brown fox jumps over the lazy dog.\""},
                      {"Be concise and clear.", "Avoid jargon and unnecessary language. Complex and creative language is welcome.",
                       "Focus on the main idea."},
                      std::nullopt};
    case AssistantMode::Research:
      return Protocol{"You are Claire, a research assistant.",
                      "You help users analyze information, find connections, and summarize complex topics.",
                      "Provide well-structured, factual responses.",
                      {"Summarize the main points of this article.", "What are the key findings of this research paper?",
                       "Can you help me find sources for my thesis?"},
                      {"Be factual and objective.", "Avoid personal opinions or biases.", "Cite sources when possible."},
                      std::nullopt};
    case AssistantMode::Coding:
      return Protocol{"You are Claire, a coding assistant.",
                      "You help users write, debug, and understand code.",
                      "Provide clear explanations and practical examples.",
                      {"Write a Python function to calculate the factorial of a number.", "Explain how a for loop works in Python.",
                       "Can you help me debug this code?"},
                      {"Be clear and concise.", "Avoid complex jargon unless necessary.", "Provide examples when possible."},
                      std::nullopt};
    case AssistantMode::Pdf:
      return Protocol{"You are Claire, a PDF analysis assistant.",
                      "You help users understand and extract information from PDF documents.",
                      "Provide clear summaries and highlight key points.",
                      {"Summarize this PDF document.", "What are the key findings in this research paper?",
                       "Can you help me extract data from this PDF?"},
                      {"Be clear and concise.", "Avoid complex jargon unless necessary.", "Provide examples when possible."},
                      std::nullopt};
    case AssistantMode::Web: {
      json manifest = json::array();
      for (const auto& tool : registry_.list()) {
        manifest.push_back(tool->to_manifest());
      }
      return Protocol{"You are Claire, a web page analysis assistant.",
                      "You help users understand and extract information from web pages.",
                      "Provide clear summaries and highlight key points.",
                      {"Summarize this web page.", "What are the key findings in this research paper?",
                       "Can you help me extract data from this web page?"},
                      {"Be clear and concise.", "Avoid complex jargon unless necessary.", "Provide examples when possible."},
                      manifest};
    }
    case AssistantMode::General:
      break;
  }

  return Protocol{"You are Claire, an AI assistant that helps with a variety of tasks.",
                  "You are helpful, friendly, witty, and engaging.",
                  "Your responses should be short, to the point, and concise.",
                  {"What is the weather like today?", "Can you help me with my homework?", "Tell me a joke."},
                  {"Be polite and respectful.", "Avoid sensitive topics.", "Do not provide medical or legal advice."},
                  std::nullopt};
}

std::string PromptComposer::describe_tools(const std::vector<std::shared_ptr<Tool>>& tools) {
  std::ostringstream out;
  for (const auto& tool : tools) {
    const auto name = tool->id();
    out << "- " << name << ": " << tool->description() << "\n";
    out << "  Parameters: " << tool->signature() << "\n";
    out << "  Usage formats:\n";
    out << "    * [TOOL]{\"name\": \"" << name << "\", \"parameters\": {...}}[/TOOL]\n";
    out << "    * Use " << name << " tool with [query/parameters]\n";
    out << "    * /" << name << " [query]\n";
  }
  return out.str();
}

std::string PromptComposer::tool_instructions() const {
  auto tools = registry_.list();
  if (tools.empty()) {
    return "";
  }

  std::ostringstream out;
  out << "Available tools:\n";
  out << describe_tools(tools);
  out << "\nYou can use these tools naturally in conversation. Just mention what you want to do and I'll use the appropriate tool.";
  return out.str();
}

std::string PromptComposer::system_prompt(AssistantMode mode) const {
  auto proto = protocol(mode);

  std::string prompt = proto.directive + " " + proto.context + " " + proto.rationale;

  auto tools = tool_instructions();
  if (!tools.empty()) {
    prompt += "\n\n" + tools + "\n\n";
  } else {
    prompt += " ";
  }

  prompt += "Here are your protocols: " + proto.to_json().dump(-1, ' ', false, json::error_handler_t::replace);
  return prompt;
}

std::string PromptComposer::agentic_system_prompt() const {
  std::ostringstream out;
  out << "You are Claire, an agentic AI assistant. You can break down complex tasks and use available tools to complete them step by step.\n\n";
  out << "Available tools:\n";
  out << describe_tools(registry_.list());
  out << "\nInstructions:\n";
  out << "1. Analyze the task and break it down if complex\n";
  out << "2. Use available tools when needed\n";
  out << "3. Build upon previous results\n";
  out << "4. When you have completed the task, say \"TASK COMPLETE:\" followed by your final answer\n";
  out << "5. Be proactive - suggest additional tools or information that might be helpful";
  return out.str();
}

}  // namespace claire
