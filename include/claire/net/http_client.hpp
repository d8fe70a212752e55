#pragma once

#include <asio.hpp>
#include <chrono>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace claire::net {

// HTTP response
struct HttpResponse {
  int status_code = 0;
  std::map<std::string, std::string> headers;
  std::string body;
  std::string error;

  bool ok() const {
    return error.empty() && status_code >= 200 && status_code < 300;
  }

  // Case-insensitive header lookup
  std::optional<std::string> header(const std::string &name) const;
};

// HTTP request options
struct HttpOptions {
  std::string method = "GET";
  std::map<std::string, std::string> headers;
  std::string body;
  std::chrono::seconds timeout{30};
};

// Async HTTP/1.1 client using ASIO (plain and TLS)
class HttpClient {
 public:
  explicit HttpClient(asio::io_context &io_ctx);

  ~HttpClient();

  HttpClient(const HttpClient &) = delete;
  HttpClient &operator=(const HttpClient &) = delete;

  // Async request with callback; the callback runs on the io_context thread
  void request(const std::string &url, const HttpOptions &options, std::function<void(HttpResponse)> callback);

  // Async request returning future
  std::future<HttpResponse> request(const std::string &url, const HttpOptions &options);

 private:
  class Impl;

  std::unique_ptr<Impl> impl_;
};

// URL parsing helper
struct ParsedUrl {
  std::string scheme;
  std::string host;
  std::string port;
  std::string path;
  std::string query;

  bool is_https() const {
    return scheme == "https";
  }

  std::string port_or_default() const;

  static std::optional<ParsedUrl> parse(const std::string &url);
};

// Parse a complete raw HTTP/1.x response (status line, headers, body).
// Chunked bodies are decoded. Returns nullopt when the status line is malformed.
std::optional<HttpResponse> parse_response(const std::string &raw);

// Decode a "Transfer-Encoding: chunked" body; nullopt on malformed framing
std::optional<std::string> decode_chunked(const std::string &body);

// Percent-encode a string for use in a query component
std::string url_encode(const std::string &value);

}  // namespace claire::net
