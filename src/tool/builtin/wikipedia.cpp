#include <spdlog/spdlog.h>

#include "claire/core/version.hpp"
#include "claire/tool/builtin/builtins.hpp"

namespace claire::tools {

namespace {

net::HttpResponse fetch(net::HttpClient& http, const std::string& url, int timeout_seconds) {
  net::HttpOptions options;
  options.method = "GET";
  options.headers["Accept"] = "application/json";
  options.headers["User-Agent"] = std::string("claire/") + CLAIRE_VERSION_STRING;
  options.timeout = std::chrono::seconds(timeout_seconds);

  auto response = http.request(url, options).get();
  if (!response.error.empty()) {
    throw ToolError("Wikipedia request failed: " + response.error);
  }
  if (!response.ok()) {
    throw ToolError("Wikipedia returned HTTP " + std::to_string(response.status_code));
  }
  return response;
}

json parse_body(const net::HttpResponse& response) {
  try {
    return json::parse(response.body);
  } catch (const json::parse_error& e) {
    throw ToolError(std::string("Invalid response from Wikipedia: ") + e.what());
  }
}

// Article titles use underscores in page paths
std::string page_name(std::string title) {
  for (auto& c : title) {
    if (c == ' ') c = '_';
  }
  return title;
}

}  // namespace

std::string wikipedia_top_title(const json& search, const std::string& query) {
  json hits = json::array();
  if (search.is_object() && search.contains("query") && search["query"].is_object()) {
    hits = search["query"].value("search", json::array());
  }
  if (!hits.is_array() || hits.empty() || !hits[0].is_object()) {
    throw ToolError("No Wikipedia results found for: " + query);
  }
  const auto& hit = hits[0];
  std::string title = hit.contains("title") && hit["title"].is_string() ? hit["title"].get<std::string>() : "";
  if (title.empty()) {
    throw ToolError("No Wikipedia results found for: " + query);
  }
  return title;
}

json wikipedia_article(const json& summary, const std::string& title, const std::string& base_url) {
  std::string page = page_name(title);

  auto text_field = [&summary](const char* key, const std::string& fallback) {
    if (summary.is_object() && summary.contains(key) && summary[key].is_string()) {
      return summary[key].get<std::string>();
    }
    return fallback;
  };

  std::string url = base_url + "/wiki/" + page;
  if (summary.is_object() && summary.contains("content_urls") && summary["content_urls"].is_object()) {
    const auto& urls = summary["content_urls"];
    if (urls.contains("desktop") && urls["desktop"].is_object() && urls["desktop"].contains("page") && urls["desktop"]["page"].is_string()) {
      url = urls["desktop"]["page"].get<std::string>();
    }
  }

  return json{{"title", text_field("title", title)}, {"summary", text_field("extract", "")}, {"url", url}};
}

// ============================================================================
// WikipediaSearchTool
// ============================================================================

WikipediaSearchTool::WikipediaSearchTool(std::shared_ptr<net::HttpClient> http, std::string base_url)
    : SimpleTool("search_wikipedia", "Search Wikipedia for information on a topic", "research"), http_(std::move(http)), base_url_(std::move(base_url)) {
  while (!base_url_.empty() && base_url_.back() == '/') {
    base_url_.pop_back();
  }
}

std::vector<ParameterSchema> WikipediaSearchTool::parameters() const {
  return {{"query", "string", "Search query", true}};
}

std::future<json> WikipediaSearchTool::execute(const json& args) {
  auto http = http_;
  auto base_url = base_url_;

  return std::async(std::launch::async, [http, base_url, args]() -> json {
    std::string query = string_arg(args, "query");
    if (trim(query).empty()) {
      throw ToolError("Parameter 'query' is required");
    }

    spdlog::debug("[WikipediaSearchTool] Searching: \"{}\"", query);

    // Resolve the best-matching article title
    std::string search_url = base_url + "/w/api.php?action=query&list=search&srsearch=" + net::url_encode(query) + "&format=json&srlimit=1";
    auto search = parse_body(fetch(*http, search_url, kTimeoutSeconds));

    std::string title = wikipedia_top_title(search, query);
    std::string page = page_name(title);

    auto summary = parse_body(fetch(*http, base_url + "/api/rest_v1/page/summary/" + net::url_encode(page), kTimeoutSeconds));

    spdlog::debug("[WikipediaSearchTool] Found article \"{}\"", title);

    return wikipedia_article(summary, title, base_url);
  });
}

}  // namespace claire::tools
