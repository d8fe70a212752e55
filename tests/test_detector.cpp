#include <gtest/gtest.h>

#include "claire/tool/detector.hpp"
#include "fake_backend.hpp"

using namespace claire;
using namespace claire::fakes;

class DetectorTest : public ::testing::Test {
 protected:
  void SetUp() override {
    registry.register_tool(echo_tool("search_wikipedia"));
    registry.register_tool(echo_tool("plan_task"));
  }

  ToolRegistry registry;
};

TEST_F(DetectorTest, TaggedCall) {
  RequestDetector detector(registry);
  auto calls = detector.detect(R"(Please [TOOL]{"name": "search_wikipedia", "parameters": {"query": "Ada Lovelace"}}[/TOOL] thanks)");

  ASSERT_EQ(calls.size(), 1u);
  EXPECT_EQ(calls[0].name, "search_wikipedia");
  EXPECT_EQ(calls[0].parameters, (json{{"query", "Ada Lovelace"}}));
}

TEST_F(DetectorTest, TaggedCallAcceptsUnregisteredName) {
  auto calls = RequestDetector::detect_tagged(R"([TOOL]{"name": "ghost", "parameters": {}}[/TOOL])");

  ASSERT_EQ(calls.size(), 1u);
  EXPECT_EQ(calls[0].name, "ghost");
  EXPECT_TRUE(calls[0].parameters.empty());
}

TEST_F(DetectorTest, MalformedTagIsSkipped) {
  auto calls = RequestDetector::detect_tagged(
      R"([TOOL]{"name": "broken", "parameters": }[/TOOL] and [TOOL]{"name": "plan_task", "parameters": {"task": "x"}}[/TOOL])");

  ASSERT_EQ(calls.size(), 1u);
  EXPECT_EQ(calls[0].name, "plan_task");
}

TEST_F(DetectorTest, TagNeedsNameAndParameters) {
  EXPECT_TRUE(RequestDetector::detect_tagged(R"([TOOL]{"parameters": {}}[/TOOL])").empty());
  EXPECT_TRUE(RequestDetector::detect_tagged(R"([TOOL]{"name": "a"}[/TOOL])").empty());
  EXPECT_TRUE(RequestDetector::detect_tagged(R"([TOOL]{"name": "a", "parameters": [1]}[/TOOL])").empty());
}

TEST_F(DetectorTest, NullParametersBecomeEmptyObject) {
  auto calls = RequestDetector::detect_tagged(R"([TOOL]{"name": "a", "parameters": null}[/TOOL])");
  ASSERT_EQ(calls.size(), 1u);
  EXPECT_EQ(calls[0].parameters, json::object());
}

TEST_F(DetectorTest, UnterminatedTagIsIgnored) {
  EXPECT_TRUE(RequestDetector::detect_tagged(R"([TOOL]{"name": "a", "parameters": {}})").empty());
}

TEST_F(DetectorTest, NaturalLanguage) {
  RequestDetector detector(registry);
  auto calls = detector.detect("Could you use search_wikipedia tool with quantum computing. Thanks!");

  ASSERT_EQ(calls.size(), 1u);
  EXPECT_EQ(calls[0].name, "search_wikipedia");
  EXPECT_EQ(calls[0].parameters, (json{{"query", "quantum computing"}}));
}

TEST_F(DetectorTest, NaturalLanguageIsCaseInsensitiveAndKeepsQueryCase) {
  RequestDetector detector(registry);
  auto calls = detector.detect("USE Search_Wikipedia TOOL WITH Alan Turing");

  ASSERT_EQ(calls.size(), 1u);
  EXPECT_EQ(calls[0].name, "search_wikipedia");
  EXPECT_EQ(calls[0].parameters["query"], "Alan Turing");
}

TEST_F(DetectorTest, NaturalLanguageNeedsWordBoundary) {
  RequestDetector detector(registry);
  EXPECT_TRUE(detector.detect_natural_language("reuse search_wikipedia tool with cats").empty());
  EXPECT_TRUE(detector.detect_natural_language("use unknown tool with cats").empty());
}

TEST_F(DetectorTest, SlashCommand) {
  RequestDetector detector(registry);
  auto calls = detector.detect("/plan_task launch a website");

  ASSERT_EQ(calls.size(), 1u);
  EXPECT_EQ(calls[0].name, "plan_task");
  EXPECT_EQ(calls[0].parameters, (json{{"query", "launch a website"}}));
}

TEST_F(DetectorTest, SlashCommandNotInsidePaths) {
  RequestDetector detector(registry);
  EXPECT_TRUE(detector.detect_slash_commands("see https://example.com/plan_task now").empty());
  EXPECT_TRUE(detector.detect_slash_commands("/plan_task").empty());
}

TEST_F(DetectorTest, QueryStopsAtTerminator) {
  RequestDetector detector(registry);
  auto calls = detector.detect_slash_commands("/search_wikipedia Rust language? Then more words");

  ASSERT_EQ(calls.size(), 1u);
  EXPECT_EQ(calls[0].parameters["query"], "Rust language");
}

TEST_F(DetectorTest, OrderingTagsThenNaturalLanguageThenSlash) {
  RequestDetector detector(registry);
  std::string text =
      "/plan_task ship it.\n"
      "use search_wikipedia tool with Mars.\n"
      R"([TOOL]{"name": "plan_task", "parameters": {"task": "tagged"}}[/TOOL])"
      "\n/search_wikipedia Venus.";

  auto calls = detector.detect(text);
  ASSERT_EQ(calls.size(), 4u);

  EXPECT_EQ(calls[0].name, "plan_task");
  EXPECT_EQ(calls[0].parameters["task"], "tagged");

  EXPECT_EQ(calls[1].name, "search_wikipedia");
  EXPECT_EQ(calls[1].parameters["query"], "Mars");

  // Slash matches follow registration order, not text order
  EXPECT_EQ(calls[2].name, "search_wikipedia");
  EXPECT_EQ(calls[2].parameters["query"], "Venus");
  EXPECT_EQ(calls[3].name, "plan_task");
  EXPECT_EQ(calls[3].parameters["query"], "ship it");
}

TEST_F(DetectorTest, MultipleMatchesForOneTool) {
  RequestDetector detector(registry);
  auto calls = detector.detect_natural_language("use plan_task tool with first. use plan_task tool with second.");

  ASSERT_EQ(calls.size(), 2u);
  EXPECT_EQ(calls[0].parameters["query"], "first");
  EXPECT_EQ(calls[1].parameters["query"], "second");
}

TEST_F(DetectorTest, NothingToDetect) {
  RequestDetector detector(registry);
  EXPECT_TRUE(detector.detect("Just chatting about the weather.").empty());
}

TEST_F(DetectorTest, CanonicalForms) {
  RequestDetector detector(registry);

  auto natural = detector.detect("use search_wikipedia tool with cats.");
  ASSERT_EQ(natural.size(), 1u);
  EXPECT_EQ(natural[0], (ToolCall{"search_wikipedia", json{{"query", "cats"}}}));

  auto slash = detector.detect("/plan_task build a shed.");
  ASSERT_EQ(slash.size(), 1u);
  EXPECT_EQ(slash[0], (ToolCall{"plan_task", json{{"query", "build a shed"}}}));
}
