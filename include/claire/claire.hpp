#pragma once

// Core types
#include "claire/core/config.hpp"
#include "claire/core/message.hpp"
#include "claire/core/types.hpp"

// Network
#include "claire/net/http_client.hpp"

// LLM backends
#include "claire/llm/backend.hpp"

// Tool system
#include "claire/tool/builtin/builtins.hpp"
#include "claire/tool/detector.hpp"
#include "claire/tool/invoker.hpp"
#include "claire/tool/suggester.hpp"
#include "claire/tool/tool.hpp"

// Prompts, conversation and the agentic loop
#include "claire/agent/agentic_loop.hpp"
#include "claire/prompt/composer.hpp"
#include "claire/session/conversation.hpp"

namespace claire {

// Initialize logging from the config and register the builtin tools in the
// process-wide registry. A null http client leaves search_wikipedia out.
void init(const Config& config, std::shared_ptr<net::HttpClient> http);

// Get version string
std::string version();

}  // namespace claire
