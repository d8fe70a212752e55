#include "claire/agent/agentic_loop.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <stdexcept>

namespace claire {

std::string to_string(LoopPhase phase) {
  switch (phase) {
    case LoopPhase::Running:
      return "running";
    case LoopPhase::Completed:
      return "completed";
    case LoopPhase::BudgetExhausted:
      return "budget_exhausted";
  }
  return "running";
}

const std::vector<std::string>& completion_phrases() {
  static const std::vector<std::string> phrases = {
      "task complete:", "analysis complete", "here is your final answer", "task finished", "completed successfully",
  };
  return phrases;
}

bool is_task_complete(const std::string& response) {
  const auto lower = to_lower(response);
  const auto& phrases = completion_phrases();
  return std::any_of(phrases.begin(), phrases.end(), [&lower](const std::string& phrase) {
    return lower.find(phrase) != std::string::npos;
  });
}

AgenticState begin_task(const std::string& task, int max_turns) {
  if (max_turns <= 0) {
    throw std::invalid_argument("max_turns must be positive, got " + std::to_string(max_turns));
  }

  AgenticState state;
  state.current_task = task;
  state.max_turns = max_turns;
  state.prompt = task;
  return state;
}

AgenticState advance(AgenticState state, const std::string& turn_output) {
  if (state.finished()) {
    return state;
  }

  state.last_output = turn_output;
  state.turns_taken++;

  if (is_task_complete(turn_output)) {
    state.phase = LoopPhase::Completed;
    return state;
  }

  state.prompt += "\n\nPrevious response: " + turn_output;
  state.current_turn++;

  if (state.current_turn >= state.max_turns) {
    state.phase = LoopPhase::BudgetExhausted;
  }
  return state;
}

AgenticOutcome AgenticLoop::run(const std::string& input, int max_turns) {
  AgenticState state = begin_task(input, max_turns);
  const std::string system_prompt = composer_.agentic_system_prompt();

  spdlog::info("[AgenticLoop] Starting task (max_turns={})", max_turns);

  while (!state.finished()) {
    MessageList messages = {Message::system(system_prompt), Message::user(state.prompt)};
    std::string response = driver_.complete(messages);

    state = advance(std::move(state), response);
    spdlog::debug("[AgenticLoop] Turn {} -> {}", state.turns_taken, to_string(state.phase));

    if (on_turn_) {
      on_turn_(state.turns_taken, response);
    }
  }

  spdlog::info("[AgenticLoop] Finished after {} turn(s): {}", state.turns_taken, to_string(state.phase));
  return AgenticOutcome{state.phase, state.last_output, state.turns_taken};
}

}  // namespace claire
