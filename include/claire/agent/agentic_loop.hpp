#pragma once

#include <functional>
#include <string>
#include <vector>

#include "claire/core/types.hpp"
#include "claire/prompt/composer.hpp"
#include "claire/session/conversation.hpp"

namespace claire {

enum class LoopPhase { Running, Completed, BudgetExhausted };

std::string to_string(LoopPhase phase);

// State of one agentic run. Lives only for that run.
struct AgenticState {
  std::string current_task;
  std::vector<std::string> task_steps;
  std::vector<std::string> completed_steps;
  json context = json::object();
  int max_turns = 5;
  int current_turn = 0;

  LoopPhase phase = LoopPhase::Running;
  std::string prompt;       // accumulated user turn: task plus previous responses
  std::string last_output;  // most recent completion text
  int turns_taken = 0;      // completions issued so far, including a completing one

  bool finished() const {
    return phase != LoopPhase::Running;
  }
};

struct AgenticOutcome {
  LoopPhase phase = LoopPhase::Running;
  std::string text;
  int turns = 0;
};

// Case-insensitive check for any completion phrase
bool is_task_complete(const std::string& response);

const std::vector<std::string>& completion_phrases();

// Initial state for a task; max_turns must be positive
AgenticState begin_task(const std::string& task, int max_turns);

// Pure transition: fold one turn's output into the state
AgenticState advance(AgenticState state, const std::string& turn_output);

// Repeats completions against an evolving task context until a completion
// phrase shows up or the turn budget runs out.
class AgenticLoop {
 public:
  AgenticLoop(const PromptComposer& composer, ConversationDriver& driver) : composer_(composer), driver_(driver) {}

  // Throws std::invalid_argument when max_turns <= 0; backend failures propagate as BackendError
  AgenticOutcome run(const std::string& input, int max_turns = 5);

  using OnTurnCallback = std::function<void(int turn, const std::string& text)>;

  void on_turn(OnTurnCallback cb) {
    on_turn_ = std::move(cb);
  }

 private:
  const PromptComposer& composer_;
  ConversationDriver& driver_;
  OnTurnCallback on_turn_;
};

}  // namespace claire
