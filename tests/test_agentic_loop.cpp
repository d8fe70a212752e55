#include <gtest/gtest.h>

#include "claire/agent/agentic_loop.hpp"
#include "fake_backend.hpp"

using namespace claire;
using namespace claire::fakes;

class AgenticLoopTest : public ::testing::Test {
 protected:
  ToolRegistry registry;
  FakeBackend backend;
  PromptComposer composer{registry};
  ConversationDriver driver{registry, backend};
};

TEST_F(AgenticLoopTest, StopsAtBudget) {
  backend.reply("t1");
  backend.reply("t2");
  backend.reply("t3");
  backend.reply("t4");
  AgenticLoop loop(composer, driver);

  auto outcome = loop.run("Research solar panels", 3);

  EXPECT_EQ(outcome.phase, LoopPhase::BudgetExhausted);
  EXPECT_EQ(outcome.turns, 3);
  EXPECT_EQ(outcome.text, "t3");
  EXPECT_EQ(backend.requests.size(), 3u);
}

TEST_F(AgenticLoopTest, StopsOnCompletionPhrase) {
  backend.reply("Step one done");
  backend.reply("Task Complete: done");
  backend.reply("never sent");
  AgenticLoop loop(composer, driver);

  auto outcome = loop.run("Do the thing", 5);

  EXPECT_EQ(outcome.phase, LoopPhase::Completed);
  EXPECT_EQ(outcome.turns, 2);
  EXPECT_EQ(outcome.text, "Task Complete: done");
  EXPECT_EQ(backend.requests.size(), 2u);
}

TEST_F(AgenticLoopTest, PromptAccumulatesPreviousResponses) {
  backend.reply("first");
  backend.reply("second");
  AgenticLoop loop(composer, driver);

  loop.run("Task", 2);

  ASSERT_EQ(backend.requests.size(), 2u);
  const auto& first = backend.requests[0].messages;
  ASSERT_EQ(first.size(), 2u);
  EXPECT_EQ(first[0].role(), Role::System);
  EXPECT_EQ(first[0].content(), composer.agentic_system_prompt());
  EXPECT_EQ(first[1].content(), "Task");

  EXPECT_EQ(backend.requests[1].messages[1].content(), "Task\n\nPrevious response: first");
}

TEST_F(AgenticLoopTest, InvalidBudget) {
  AgenticLoop loop(composer, driver);
  EXPECT_THROW(loop.run("Task", 0), std::invalid_argument);
  EXPECT_THROW(loop.run("Task", -2), std::invalid_argument);
  EXPECT_TRUE(backend.requests.empty());
}

TEST_F(AgenticLoopTest, BackendErrorPropagates) {
  backend.reply("partial");
  backend.fail("HTTP error: 500");
  AgenticLoop loop(composer, driver);

  EXPECT_THROW(loop.run("Task", 5), llm::BackendError);
}

TEST_F(AgenticLoopTest, OnTurnCallback) {
  backend.reply("a");
  backend.reply("analysis complete");
  AgenticLoop loop(composer, driver);

  std::vector<std::pair<int, std::string>> turns;
  loop.on_turn([&turns](int turn, const std::string& text) {
    turns.emplace_back(turn, text);
  });
  loop.run("Task", 5);

  ASSERT_EQ(turns.size(), 2u);
  EXPECT_EQ(turns[0], (std::pair<int, std::string>{1, "a"}));
  EXPECT_EQ(turns[1].first, 2);
}

// --- AgenticStateTest ---

TEST(AgenticStateTest, AdvanceIsPure) {
  auto state = begin_task("Task", 2);
  auto next = advance(state, "thinking");

  EXPECT_EQ(state.current_turn, 0);
  EXPECT_EQ(state.prompt, "Task");
  EXPECT_EQ(next.current_turn, 1);
  EXPECT_EQ(next.phase, LoopPhase::Running);
  EXPECT_EQ(next.prompt, "Task\n\nPrevious response: thinking");

  auto last = advance(next, "more thinking");
  EXPECT_EQ(last.phase, LoopPhase::BudgetExhausted);
  EXPECT_EQ(last.turns_taken, 2);
}

TEST(AgenticStateTest, CompletionDoesNotExtendPrompt) {
  auto state = advance(begin_task("Task", 3), "TASK FINISHED");
  EXPECT_EQ(state.phase, LoopPhase::Completed);
  EXPECT_EQ(state.prompt, "Task");
  EXPECT_EQ(state.current_turn, 0);
  EXPECT_EQ(state.turns_taken, 1);
}

TEST(AgenticStateTest, FinishedStateIsStable) {
  auto done = advance(begin_task("Task", 1), "nope");
  ASSERT_EQ(done.phase, LoopPhase::BudgetExhausted);

  auto again = advance(done, "TASK COMPLETE: late");
  EXPECT_EQ(again.phase, LoopPhase::BudgetExhausted);
  EXPECT_EQ(again.turns_taken, 1);
}

TEST(AgenticStateTest, BudgetExhaustionKeepsLastOutput) {
  auto state = begin_task("Task", 3);
  state = advance(state, "t1");
  state = advance(state, "t2");
  EXPECT_EQ(state.phase, LoopPhase::Running);
  state = advance(state, "t3");

  EXPECT_EQ(state.phase, LoopPhase::BudgetExhausted);
  EXPECT_EQ(state.current_turn, state.max_turns);
  EXPECT_EQ(state.turns_taken, 3);
  EXPECT_EQ(state.last_output, "t3");
}

TEST(CompletionPhraseTest, Detection) {
  EXPECT_TRUE(is_task_complete("TASK COMPLETE: here you go"));
  EXPECT_TRUE(is_task_complete("The analysis complete, see above"));
  EXPECT_TRUE(is_task_complete("Here is your final answer: 42"));
  EXPECT_TRUE(is_task_complete("It completed successfully."));
  EXPECT_FALSE(is_task_complete("Task complete without colon"));
  EXPECT_FALSE(is_task_complete("Working on it"));
}

TEST(LoopPhaseTest, Strings) {
  EXPECT_EQ(to_string(LoopPhase::Running), "running");
  EXPECT_EQ(to_string(LoopPhase::Completed), "completed");
  EXPECT_EQ(to_string(LoopPhase::BudgetExhausted), "budget_exhausted");
}
