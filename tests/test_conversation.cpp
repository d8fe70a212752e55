#include <gtest/gtest.h>

#include "claire/session/conversation.hpp"
#include "fake_backend.hpp"

using namespace claire;
using namespace claire::fakes;

class ConversationTest : public ::testing::Test {
 protected:
  void SetUp() override {
    registry.register_tool(echo_tool("search_wikipedia"));
    registry.register_tool(failing_tool("broken", "offline"));
  }

  ToolRegistry registry;
  FakeBackend backend;
};

TEST_F(ConversationTest, PlainCompletion) {
  backend.reply("Hello!");
  ConversationDriver driver(registry, backend);

  MessageList history = {Message::system("rules"), Message::user("hi")};
  EXPECT_EQ(driver.complete(history), "Hello!");

  ASSERT_EQ(backend.requests.size(), 1u);
  const auto& request = backend.requests[0];
  EXPECT_EQ(request.messages.size(), 2u);
  EXPECT_EQ(request.model, "google/gemma-3-4b");
  EXPECT_DOUBLE_EQ(*request.temperature, 0.7);
  EXPECT_EQ(*request.max_tokens, 100000);
}

TEST_F(ConversationTest, OptionsOverrideConfig) {
  ConversationDriver driver(registry, backend);

  CompletionOptions options;
  options.model = "other";
  options.temperature = 0.1;
  driver.complete({Message::user("hi")}, options);

  ASSERT_EQ(backend.requests.size(), 1u);
  EXPECT_EQ(backend.requests[0].model, "other");
  EXPECT_DOUBLE_EQ(*backend.requests[0].temperature, 0.1);
}

TEST_F(ConversationTest, ToolResultsAreSplicedAsOneSyntheticMessage) {
  ConversationDriver driver(registry, backend);

  MessageList history = {Message::system("rules"), Message::user("/search_wikipedia Mars. Also /broken now.")};
  auto augmented = driver.augment(history);

  ASSERT_EQ(augmented.size(), 3u);
  const auto& spliced = augmented.back();
  EXPECT_EQ(spliced.role(), Role::System);
  EXPECT_TRUE(spliced.is_synthetic());
  EXPECT_EQ(spliced.content(),
            "[TOOL_RESULT:search_wikipedia]{\"args\":{\"query\":\"Mars\"},\"tool\":\"search_wikipedia\"}[/TOOL_RESULT]\n"
            "[TOOL_ERROR:broken]Error: offline[/TOOL_ERROR]");

  // The caller's history is untouched
  EXPECT_EQ(history.size(), 2u);
}

TEST_F(ConversationTest, OnlyLastMessageIsScanned) {
  ConversationDriver driver(registry, backend);

  MessageList history = {Message::user("/search_wikipedia Mars"), Message::assistant("Sure"), Message::user("thanks")};
  EXPECT_EQ(driver.augment(history).size(), 3u);
}

TEST_F(ConversationTest, SplicedMessageReachesBackend) {
  backend.reply("Mars is red.");
  ConversationDriver driver(registry, backend);

  driver.complete({Message::user("use search_wikipedia tool with Mars")});

  ASSERT_EQ(backend.requests.size(), 1u);
  const auto& messages = backend.requests[0].messages;
  ASSERT_EQ(messages.size(), 2u);
  EXPECT_EQ(messages[1].content().rfind("[TOOL_RESULT:search_wikipedia]", 0), 0u);
}

TEST_F(ConversationTest, EmptyHistoryIsRejected) {
  ConversationDriver driver(registry, backend);
  EXPECT_THROW(driver.complete({}), std::invalid_argument);
}

TEST_F(ConversationTest, BackendFailureThrows) {
  backend.fail("Network error: Connection refused");
  ConversationDriver driver(registry, backend);

  try {
    driver.complete({Message::user("hi")});
    FAIL() << "expected BackendError";
  } catch (const llm::BackendError& e) {
    EXPECT_STREQ(e.what(), "Network error: Connection refused");
  }
}

TEST_F(ConversationTest, ReasoningIsStripped) {
  backend.reply("<think>let me consider\nthe options</think>\n  The answer is 4.  ");
  ConversationDriver driver(registry, backend);

  EXPECT_EQ(driver.complete({Message::user("2+2?")}), "The answer is 4.");
}

TEST_F(ConversationTest, FallbackWhenOffline) {
  backend.reachable = false;
  ConversationDriver driver(registry, backend);

  EXPECT_EQ(driver.complete_with_fallback({Message::user("hi")}), kOfflineNotice);
  EXPECT_EQ(backend.pings, 1);
  EXPECT_TRUE(backend.requests.empty());
}

TEST_F(ConversationTest, FallbackWhenOnline) {
  backend.reply("Hi there");
  ConversationDriver driver(registry, backend);

  EXPECT_EQ(driver.complete_with_fallback({Message::user("hi")}), "Hi there");
  EXPECT_EQ(backend.requests.size(), 1u);
}

// --- StripReasoningTest ---

TEST(StripReasoningTest, MultipleSpans) {
  EXPECT_EQ(strip_reasoning("<think>a</think>One <think>b</think>Two"), "One Two");
}

TEST(StripReasoningTest, StrayMarkers) {
  EXPECT_EQ(strip_reasoning("partial</think> answer"), "partial answer");
  EXPECT_EQ(strip_reasoning("answer <think>unfinished"), "answer unfinished");
}

TEST(StripReasoningTest, NothingToStrip) {
  EXPECT_EQ(strip_reasoning("  plain  "), "plain");
}
