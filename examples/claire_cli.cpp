#include <spdlog/spdlog.h>

#include <asio.hpp>
#include <iostream>
#include <string>
#include <thread>

#include "claire/claire.hpp"
#include "claire/core/version.hpp"

using namespace claire;

struct CliOptions {
  bool agent = false;
  int max_turns = 0;  // 0 = from config
  std::string mode;
  std::string model;
  std::string base_url;
  std::string provider;
  std::string task;  // remaining words, run once instead of the chat loop
};

static void print_usage(const char* argv0) {
  std::cout << "Usage: " << argv0 << " [options] [message]\n"
            << "  --agent            Run the message as an agentic task\n"
            << "  --max-turns <N>    Turn budget for --agent\n"
            << "  --mode <mode>      general, writing, research, coding, pdf, web\n"
            << "  --model <name>     Model identifier\n"
            << "  --base-url <url>   Backend base URL\n"
            << "  --provider <name>  lmstudio or ollama\n"
            << "  -h, --help         Show this help message\n";
}

// Returns false when the program should exit with the given code
static bool parse_args(int argc, char* argv[], CliOptions& opts, int& exit_code) {
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    auto value = [&](const std::string& flag) -> const char* {
      if (i + 1 >= argc) {
        std::cerr << "Error: " << flag << " requires a value\n";
        return nullptr;
      }
      return argv[++i];
    };

    if (arg == "-h" || arg == "--help") {
      print_usage(argv[0]);
      exit_code = 0;
      return false;
    } else if (arg == "--agent") {
      opts.agent = true;
    } else if (arg == "--max-turns" || arg == "--mode" || arg == "--model" || arg == "--base-url" || arg == "--provider") {
      const char* v = value(arg);
      if (!v) {
        exit_code = 2;
        return false;
      }
      if (arg == "--max-turns") {
        auto n = parse_positive_int(v);
        if (!n) {
          std::cerr << "Error: --max-turns must be a positive integer\n";
          exit_code = 2;
          return false;
        }
        opts.max_turns = *n;
      } else if (arg == "--mode") {
        opts.mode = v;
      } else if (arg == "--model") {
        opts.model = v;
      } else if (arg == "--base-url") {
        opts.base_url = v;
      } else {
        opts.provider = v;
      }
    } else if (arg.rfind("--", 0) == 0) {
      std::cerr << "Error: unknown option " << arg << "\n";
      print_usage(argv[0]);
      exit_code = 2;
      return false;
    } else {
      if (!opts.task.empty()) opts.task += " ";
      opts.task += arg;
    }
  }
  return true;
}

static void print_help() {
  std::cout << "\n--- Available Commands ---\n";
  std::cout << "  /tools [category]      List registered tools\n";
  std::cout << "  /suggest <text>        Suggest tools for a request\n";
  std::cout << "  /mode [name]           Show or switch the assistant mode\n";
  std::cout << "  /agent <task>          Run a task through the agentic loop\n";
  std::cout << "  /h, /help              Show this help message\n";
  std::cout << "  /q, /quit              Exit the program\n";
  std::cout << "--------------------------\n\n";
}

static void print_tools(const ToolRegistry& registry, const std::string& category) {
  auto tools = registry.list(category.empty() ? std::nullopt : std::optional<std::string>(category));
  if (tools.empty()) {
    std::cout << "\n[No tools registered]\n\n";
    return;
  }
  std::cout << "\n--- Tools ---\n";
  for (const auto& tool : tools) {
    std::cout << "  " << tool->id() << " [" << tool->category().value_or("-") << "]: " << tool->description() << "\n";
    std::cout << "     " << tool->signature() << "\n";
  }
  std::cout << "-------------\n\n";
}

static int run_agent(AgenticLoop& loop, const std::string& task, int max_turns) {
  loop.on_turn([](int turn, const std::string& text) {
    std::cout << "\n[Turn " << turn << "]\n" << text << "\n";
  });

  try {
    auto outcome = loop.run(task, max_turns);
    std::cout << "\n[Agent " << to_string(outcome.phase) << " after " << outcome.turns << " turn(s)]\n";
    return 0;
  } catch (const llm::BackendError& e) {
    std::cerr << "\n[Error: " << e.what() << "]\n";
    return 1;
  } catch (const std::invalid_argument& e) {
    std::cerr << "\n[Error: " << e.what() << "]\n";
    return 2;
  }
}

int main(int argc, char* argv[]) {
  CliOptions opts;
  int exit_code = 0;
  if (!parse_args(argc, argv, opts, exit_code)) {
    return exit_code;
  }

  // Load configuration, command line wins
  Config config = Config::from_env();
  if (!opts.provider.empty()) {
    config.backend.provider = opts.provider;
    if (opts.base_url.empty()) config.backend.base_url = default_base_url(opts.provider);
  }
  if (!opts.base_url.empty()) config.backend.base_url = normalize_base_url(opts.base_url);
  if (!opts.model.empty()) config.backend.default_model = opts.model;
  if (opts.max_turns > 0) config.agent.max_turns = opts.max_turns;
  std::string mode = opts.mode.empty() ? config.default_mode : opts.mode;

  // Initialize ASIO
  asio::io_context io_ctx;
  auto http = std::make_shared<net::HttpClient>(io_ctx);

  claire::init(config, http);

  auto backend = llm::BackendFactory::instance().create(config.backend.provider, config.backend, io_ctx);
  if (!backend) {
    std::cerr << "Error: unknown provider '" << config.backend.provider << "'. Use lmstudio or ollama\n";
    return 2;
  }

  auto& registry = ToolRegistry::instance();
  PromptComposer composer(registry);
  ConversationDriver driver(registry, *backend, config.backend);
  ToolSuggester suggester(registry);
  AgenticLoop loop(composer, driver);

  // Run IO context in background thread
  std::thread io_thread([&io_ctx]() {
    auto work = asio::make_work_guard(io_ctx);
    io_ctx.run();
  });

  auto finish = [&](int code) {
    io_ctx.stop();
    io_thread.join();
    return code;
  };

  // One-shot
  if (!opts.task.empty()) {
    if (opts.agent) {
      return finish(run_agent(loop, opts.task, config.agent.max_turns));
    }
    MessageList history = {Message::system(composer.system_prompt(mode)), Message::user(opts.task)};
    try {
      std::cout << driver.complete_with_fallback(history) << "\n";
      return finish(0);
    } catch (const llm::BackendError& e) {
      std::cerr << "Error: " << e.what() << "\n";
      return finish(1);
    }
  }

  std::cout << "claire " << CLAIRE_VERSION_STRING << "\n";
  std::cout << "================================\n";
  std::cout << "Backend: " << backend->name() << " (" << config.backend.base_url << ")\n";
  std::cout << "Model: " << config.backend.default_model << "\n";
  std::cout << "Mode: " << to_string(assistant_mode_from_string(mode)) << "\n\n";

  if (!driver.test_connection()) {
    std::cout << "[" << kOfflineNotice << "]\n\n";
  }

  MessageList history = {Message::system(composer.system_prompt(mode))};

  std::string input;
  std::cout << "Enter your message (or '/q' to exit):\n";
  std::cout << "Commands: /h for help, /q to quit\n\n";

  while (true) {
    std::cout << "> ";
    std::getline(std::cin, input);

    // Handle EOF (e.g. Ctrl+D)
    if (std::cin.eof()) {
      break;
    }

    input = trim(input);
    if (input == "/quit" || input == "/q") {
      break;
    }
    if (input.empty()) {
      continue;
    }

    if (input == "/help" || input == "/h") {
      print_help();
      continue;
    }

    if (input == "/tools" || input.rfind("/tools ", 0) == 0) {
      print_tools(registry, input.size() > 7 ? trim(input.substr(7)) : "");
      continue;
    }

    if (input.rfind("/suggest ", 0) == 0) {
      auto suggestions = suggester.suggest(input.substr(9));
      std::cout << "\n";
      if (suggestions.empty()) {
        std::cout << "[No suggestions]\n";
      }
      for (const auto& tool : suggestions) {
        std::cout << "  " << tool->id() << ": " << tool->description() << "\n";
      }
      std::cout << "\n";
      continue;
    }

    if (input == "/mode" || input.rfind("/mode ", 0) == 0) {
      if (input.size() > 6) {
        mode = trim(input.substr(6));
        // The system prompt is always the first message
        history.front() = Message::system(composer.system_prompt(mode));
      }
      std::cout << "\n[Mode: " << to_string(assistant_mode_from_string(mode)) << "]\n\n";
      continue;
    }

    if (input.rfind("/agent ", 0) == 0) {
      run_agent(loop, trim(input.substr(7)), config.agent.max_turns);
      std::cout << "\n";
      continue;
    }

    history.push_back(Message::user(input));
    try {
      auto reply = driver.complete_with_fallback(history);
      std::cout << "\nAssistant: " << reply << "\n\n";
      if (reply != kOfflineNotice) {
        history.push_back(Message::assistant(reply));
      } else {
        history.pop_back();
      }
    } catch (const llm::BackendError& e) {
      std::cerr << "\n[Error: " << e.what() << "]\n\n";
      history.pop_back();
    }
  }

  std::cout << "Goodbye!\n";
  return finish(0);
}
