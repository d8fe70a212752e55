#include <gtest/gtest.h>

#include "claire/prompt/composer.hpp"
#include "fake_backend.hpp"

using namespace claire;
using namespace claire::fakes;

namespace {

const char* kGeneralPrefix =
    "You are Claire, an AI assistant that helps with a variety of tasks. You are helpful, friendly, witty, and engaging. "
    "Your responses should be short, to the point, and concise.";

}  // namespace

TEST(PromptTest, GeneralWithoutTools) {
  ToolRegistry registry;
  PromptComposer composer(registry);

  auto prompt = composer.system_prompt(AssistantMode::General);

  std::string expected_head = std::string(kGeneralPrefix) + " Here are your protocols: {\"directive\":";
  EXPECT_EQ(prompt.rfind(expected_head, 0), 0u);
  EXPECT_EQ(prompt.find("Available tools"), std::string::npos);
}

TEST(PromptTest, ProtocolEchoKeepsFieldOrder) {
  ToolRegistry registry;
  PromptComposer composer(registry);

  auto echo = composer.protocol(AssistantMode::Coding).to_json().dump();
  auto directive = echo.find("\"directive\"");
  auto context = echo.find("\"context\"");
  auto rationale = echo.find("\"rationale\"");
  auto examples = echo.find("\"examples\"");
  auto constraints = echo.find("\"constraints\"");

  EXPECT_LT(directive, context);
  EXPECT_LT(context, rationale);
  EXPECT_LT(rationale, examples);
  EXPECT_LT(examples, constraints);
  EXPECT_EQ(echo.find("\"tools\""), std::string::npos);
}

TEST(PromptTest, UnknownModeIsGeneral) {
  ToolRegistry registry;
  registry.register_tool(echo_tool("alpha"));
  PromptComposer composer(registry);

  EXPECT_EQ(composer.system_prompt("interpretive-dance"), composer.system_prompt(AssistantMode::General));
  EXPECT_EQ(composer.system_prompt(""), composer.system_prompt("general"));
}

TEST(PromptTest, ModesHaveDistinctDirectives) {
  ToolRegistry registry;
  PromptComposer composer(registry);

  EXPECT_EQ(composer.protocol("writing").directive, "You are Claire, a writing assistant.");
  EXPECT_EQ(composer.protocol("research").directive, "You are Claire, a research assistant.");
  EXPECT_EQ(composer.protocol("coding").directive, "You are Claire, a coding assistant.");
  EXPECT_EQ(composer.protocol("pdf").directive, "You are Claire, a PDF analysis assistant.");
  EXPECT_EQ(composer.protocol("web").directive, "You are Claire, a web page analysis assistant.");
  EXPECT_EQ(composer.protocol("research").constraints.size(), 3u);
}

TEST(PromptTest, ToolInstructionsListEveryTool) {
  ToolRegistry registry;
  registry.register_tool(echo_tool("alpha"));
  registry.register_tool(echo_tool("beta"));
  PromptComposer composer(registry);

  auto text = composer.tool_instructions();
  EXPECT_EQ(text.rfind("Available tools:\n", 0), 0u);
  EXPECT_NE(text.find("- alpha: Echo alpha\n  Parameters: query (string, required)\n"), std::string::npos);
  EXPECT_NE(text.find("[TOOL]{\"name\": \"beta\", \"parameters\": {...}}[/TOOL]"), std::string::npos);
  EXPECT_NE(text.find("Use beta tool with [query/parameters]"), std::string::npos);
  EXPECT_NE(text.find("/beta [query]"), std::string::npos);
  EXPECT_LT(text.find("alpha"), text.find("beta"));
}

TEST(PromptTest, ToolBlockSitsBetweenProseAndProtocols) {
  ToolRegistry registry;
  registry.register_tool(echo_tool("alpha"));
  PromptComposer composer(registry);

  auto prompt = composer.system_prompt(AssistantMode::General);
  auto expected = std::string(kGeneralPrefix) + "\n\n" + composer.tool_instructions() + "\n\nHere are your protocols: ";
  EXPECT_EQ(prompt.rfind(expected, 0), 0u);
}

TEST(PromptTest, OnlyWebEmbedsManifest) {
  ToolRegistry registry;
  registry.register_tool(echo_tool("alpha"));
  PromptComposer composer(registry);

  auto web = composer.protocol(AssistantMode::Web);
  ASSERT_TRUE(web.tools.has_value());
  ASSERT_EQ(web.tools->size(), 1u);
  EXPECT_EQ((*web.tools)[0]["name"], "alpha");

  auto echo = web.to_json().dump();
  EXPECT_NE(echo.find("{\"name\":\"alpha\",\"description\":\"Echo alpha\",\"parameters\":[{\"name\":\"query\""), std::string::npos);

  for (auto mode : {AssistantMode::General, AssistantMode::Writing, AssistantMode::Research, AssistantMode::Coding, AssistantMode::Pdf}) {
    EXPECT_FALSE(composer.protocol(mode).tools.has_value()) << to_string(mode);
  }
}

TEST(PromptTest, AgenticPrompt) {
  ToolRegistry registry;
  registry.register_tool(echo_tool("alpha"));
  PromptComposer composer(registry);

  auto prompt = composer.agentic_system_prompt();
  EXPECT_EQ(prompt.rfind("You are Claire, an agentic AI assistant.", 0), 0u);
  EXPECT_NE(prompt.find("- alpha: Echo alpha"), std::string::npos);
  EXPECT_NE(prompt.find("say \"TASK COMPLETE:\" followed by your final answer"), std::string::npos);
  EXPECT_NE(prompt.find("5. Be proactive"), std::string::npos);
}
