#pragma once

#include <memory>
#include <string>

#include "claire/net/http_client.hpp"
#include "claire/tool/tool.hpp"

namespace claire::tools {

// search_wikipedia - look a topic up on Wikipedia (category "research")
class WikipediaSearchTool : public SimpleTool {
 public:
  explicit WikipediaSearchTool(std::shared_ptr<net::HttpClient> http, std::string base_url = "https://en.wikipedia.org");

  std::vector<ParameterSchema> parameters() const override;
  std::future<json> execute(const json& args) override;

 private:
  std::shared_ptr<net::HttpClient> http_;
  std::string base_url_;

  static constexpr int kTimeoutSeconds = 15;
};

// analyze_text - sentiment, keywords, readability or structure (category "analysis")
class AnalyzeTextTool : public SimpleTool {
 public:
  AnalyzeTextTool();

  std::vector<ParameterSchema> parameters() const override;
  std::future<json> execute(const json& args) override;
};

// summarize_content - extractive summary (category "content")
class SummarizeContentTool : public SimpleTool {
 public:
  SummarizeContentTool();

  std::vector<ParameterSchema> parameters() const override;
  std::future<json> execute(const json& args) override;
};

// plan_task - break a task into steps (category "planning")
class PlanTaskTool : public SimpleTool {
 public:
  PlanTaskTool();

  std::vector<ParameterSchema> parameters() const override;
  std::future<json> execute(const json& args) override;
};

// String argument `key`, or `fallback` when it is missing, null or empty.
// Any other non-string value throws ToolError.
std::string string_arg(const json& args, const std::string& key, const std::string& fallback = "");

// The capabilities behind the text tools; throw ToolError on bad input
json analyze_text(const std::string& text, const std::string& type);

json summarize_content(const std::string& content, const std::string& focus = "key_points", const std::string& length = "medium");

json plan_task(const std::string& task, const std::string& context = "");

// Title of the first hit in a list=search reply; ToolError when there is none
std::string wikipedia_top_title(const json& search, const std::string& query);

// {title, summary, url} from a page summary reply
json wikipedia_article(const json& summary, const std::string& title, const std::string& base_url);

// Register all builtin tools
void register_builtins(ToolRegistry& registry, std::shared_ptr<net::HttpClient> http);

}  // namespace claire::tools
