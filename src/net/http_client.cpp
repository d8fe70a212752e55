#include "claire/net/http_client.hpp"

#include <openssl/ssl.h>
#include <spdlog/spdlog.h>

#include <array>
#include <asio/ssl.hpp>
#include <cctype>
#include <regex>
#include <sstream>

namespace claire::net {

namespace {

using Callback = std::function<void(HttpResponse)>;
using ReadBuffer = std::array<char, 8192>;

HttpResponse error_response(const std::string& message) {
  HttpResponse response;
  response.error = message;
  return response;
}

bool iequals(const std::string& a, const std::string& b) {
  if (a.size() != b.size()) return false;
  for (size_t i = 0; i < a.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) {
      return false;
    }
  }
  return true;
}

// True once the raw buffer holds a full response, so we need not wait for the peer to close
bool response_complete(const std::string& raw) {
  auto header_end = raw.find("\r\n\r\n");
  if (header_end == std::string::npos) {
    return false;
  }

  auto head = parse_response(raw.substr(0, header_end + 4));
  if (!head) {
    return false;
  }

  size_t body_size = raw.size() - (header_end + 4);
  if (auto length = head->header("Content-Length")) {
    try {
      return body_size >= std::stoull(*length);
    } catch (const std::exception&) {
      return false;
    }
  }
  if (auto encoding = head->header("Transfer-Encoding"); encoding && iequals(*encoding, "chunked")) {
    return raw.size() >= 5 && raw.compare(raw.size() - 5, 5, "0\r\n\r\n") == 0;
  }
  return false;
}

std::string build_request(const ParsedUrl& url, const HttpOptions& options) {
  std::ostringstream req;
  req << options.method << " " << url.path << url.query << " HTTP/1.1\r\n";
  req << "Host: " << url.host << "\r\n";
  req << "Connection: close\r\n";

  for (const auto& [key, value] : options.headers) {
    req << key << ": " << value << "\r\n";
  }

  if (!options.body.empty() || options.method == "POST") {
    req << "Content-Length: " << options.body.size() << "\r\n";
  }

  req << "\r\n";
  req << options.body;
  return req.str();
}

}  // namespace

std::optional<std::string> HttpResponse::header(const std::string& name) const {
  for (const auto& [key, value] : headers) {
    if (iequals(key, name)) {
      return value;
    }
  }
  return std::nullopt;
}

// URL parsing
std::optional<ParsedUrl> ParsedUrl::parse(const std::string& url) {
  std::regex url_regex(R"(^(https?):\/\/([^:\/\s]+)(?::(\d+))?(\/[^\?\s]*)?(\?[^\s]*)?)");
  std::smatch match;

  if (!std::regex_match(url, match, url_regex)) {
    return std::nullopt;
  }

  ParsedUrl result;
  result.scheme = match[1].str();
  result.host = match[2].str();
  result.port = match[3].str();
  result.path = match[4].str().empty() ? "/" : match[4].str();
  result.query = match[5].str();

  return result;
}

std::string ParsedUrl::port_or_default() const {
  if (!port.empty()) return port;
  return is_https() ? "443" : "80";
}

std::optional<HttpResponse> parse_response(const std::string& raw) {
  auto header_end = raw.find("\r\n\r\n");
  std::string head = header_end == std::string::npos ? raw : raw.substr(0, header_end);

  std::istringstream stream(head);
  std::string status_line;
  std::getline(stream, status_line);

  std::regex status_regex(R"(^HTTP/[\d.]+ (\d{3}))");
  std::smatch match;
  if (!std::regex_search(status_line, match, status_regex)) {
    return std::nullopt;
  }

  HttpResponse response;
  response.status_code = std::stoi(match[1].str());

  std::string header_line;
  while (std::getline(stream, header_line)) {
    auto colon = header_line.find(':');
    if (colon == std::string::npos) continue;
    std::string key = header_line.substr(0, colon);
    std::string value = header_line.substr(colon + 1);
    value.erase(0, value.find_first_not_of(" \t"));
    value.erase(value.find_last_not_of(" \t\r\n") + 1);
    response.headers[key] = value;
  }

  if (header_end == std::string::npos) {
    return response;
  }

  response.body = raw.substr(header_end + 4);

  if (auto encoding = response.header("Transfer-Encoding"); encoding && iequals(*encoding, "chunked")) {
    auto decoded = decode_chunked(response.body);
    if (!decoded) {
      response.error = "Malformed chunked body";
      return response;
    }
    response.body = std::move(*decoded);
  } else if (auto length = response.header("Content-Length")) {
    try {
      size_t content_length = std::stoull(*length);
      if (response.body.size() > content_length) {
        response.body.resize(content_length);
      }
    } catch (const std::exception&) {
      spdlog::debug("[HttpClient] Ignoring invalid Content-Length: {}", *length);
    }
  }

  return response;
}

std::optional<std::string> decode_chunked(const std::string& body) {
  std::string out;
  size_t pos = 0;

  while (true) {
    auto line_end = body.find("\r\n", pos);
    if (line_end == std::string::npos) {
      return std::nullopt;
    }

    // Chunk extensions after ';' are ignored
    std::string size_str = body.substr(pos, line_end - pos);
    auto semicolon = size_str.find(';');
    if (semicolon != std::string::npos) {
      size_str.resize(semicolon);
    }

    size_t chunk_size = 0;
    try {
      chunk_size = std::stoul(size_str, nullptr, 16);
    } catch (const std::exception&) {
      return std::nullopt;
    }

    pos = line_end + 2;
    if (chunk_size == 0) {
      return out;
    }

    if (chunk_size > body.size() - pos) {
      return std::nullopt;
    }
    out.append(body, pos, chunk_size);
    pos += chunk_size;

    if (body.compare(pos, 2, "\r\n") != 0) {
      return std::nullopt;
    }
    pos += 2;
  }
}

std::string url_encode(const std::string& value) {
  static const char* hex = "0123456789ABCDEF";
  std::string out;
  out.reserve(value.size() * 3);
  for (unsigned char c : value) {
    if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
      out.push_back(static_cast<char>(c));
    } else {
      out.push_back('%');
      out.push_back(hex[c >> 4]);
      out.push_back(hex[c & 0x0F]);
    }
  }
  return out;
}

// HTTP Client implementation
class HttpClient::Impl {
 public:
  explicit Impl(asio::io_context& io_ctx) : io_ctx_(io_ctx), ssl_ctx_(asio::ssl::context::tlsv12_client) {
    ssl_ctx_.set_default_verify_paths();
    ssl_ctx_.set_verify_mode(asio::ssl::verify_peer);
  }

  void request(const std::string& url, const HttpOptions& options, Callback callback) {
    auto parsed = ParsedUrl::parse(url);
    if (!parsed) {
      callback(error_response("Invalid URL"));
      return;
    }

    spdlog::debug("[HttpClient] {} {}", options.method, url);

    if (parsed->is_https()) {
      auto socket = std::make_shared<asio::ssl::stream<asio::ip::tcp::socket>>(io_ctx_, ssl_ctx_);
      SSL_set_tlsext_host_name(socket->native_handle(), parsed->host.c_str());
      start(socket, *parsed, options, std::move(callback));
    } else {
      auto socket = std::make_shared<asio::ip::tcp::socket>(io_ctx_);
      start(socket, *parsed, options, std::move(callback));
    }
  }

 private:
  template <typename Socket>
  static void close_socket(const std::shared_ptr<Socket>& socket) {
    asio::error_code ignored;
    socket->lowest_layer().close(ignored);
  }

  // Start a timeout timer. When it fires, set the timed_out flag and close the socket.
  template <typename Socket>
  std::shared_ptr<asio::steady_timer> start_timeout(std::chrono::seconds timeout, std::shared_ptr<Socket> socket, std::shared_ptr<bool> timed_out) {
    auto timer = std::make_shared<asio::steady_timer>(io_ctx_);
    timer->expires_after(timeout);
    timer->async_wait([socket, timed_out](const asio::error_code& ec) {
      if (!ec) {
        *timed_out = true;
        close_socket(socket);
      }
    });
    return timer;
  }

  template <typename Socket>
  void start(std::shared_ptr<Socket> socket, const ParsedUrl& url, const HttpOptions& options, Callback callback) {
    auto request_str = std::make_shared<std::string>(build_request(url, options));
    auto resolver = std::make_shared<asio::ip::tcp::resolver>(io_ctx_);
    auto timed_out = std::make_shared<bool>(false);
    auto timer = start_timeout(options.timeout, socket, timed_out);

    // Cancel the timer and report timeouts uniformly
    Callback guarded_callback = [timer, timed_out, socket, callback](HttpResponse resp) {
      timer->cancel();
      close_socket(socket);
      if (*timed_out) {
        resp = error_response("Request timed out");
      }
      callback(std::move(resp));
    };

    resolver->async_resolve(url.host, url.port_or_default(),
                            [socket, resolver, request_str, guarded_callback](const asio::error_code& ec, asio::ip::tcp::resolver::results_type results) {
                              if (ec) {
                                guarded_callback(error_response("DNS resolution failed: " + ec.message()));
                                return;
                              }

                              asio::async_connect(socket->lowest_layer(), results,
                                                  [socket, request_str, guarded_callback](const asio::error_code& ec, const asio::ip::tcp::endpoint&) {
                                                    if (ec) {
                                                      guarded_callback(error_response("Connection failed: " + ec.message()));
                                                      return;
                                                    }
                                                    handshake(socket, request_str, guarded_callback);
                                                  });
                            });
  }

  static void handshake(std::shared_ptr<asio::ip::tcp::socket> socket, std::shared_ptr<std::string> request_str, Callback callback) {
    send(socket, request_str, std::move(callback));
  }

  static void handshake(std::shared_ptr<asio::ssl::stream<asio::ip::tcp::socket>> socket, std::shared_ptr<std::string> request_str, Callback callback) {
    socket->async_handshake(asio::ssl::stream_base::client, [socket, request_str, callback](const asio::error_code& ec) {
      if (ec) {
        callback(error_response("SSL handshake failed: " + ec.message()));
        return;
      }
      send(socket, request_str, callback);
    });
  }

  template <typename Socket>
  static void send(std::shared_ptr<Socket> socket, std::shared_ptr<std::string> request_str, Callback callback) {
    asio::async_write(*socket, asio::buffer(*request_str), [socket, request_str, callback](const asio::error_code& ec, size_t) {
      if (ec) {
        callback(error_response("Write failed: " + ec.message()));
        return;
      }
      read_all(socket, std::make_shared<std::string>(), std::make_shared<ReadBuffer>(), callback);
    });
  }

  template <typename Socket>
  static void read_all(std::shared_ptr<Socket> socket, std::shared_ptr<std::string> raw, std::shared_ptr<ReadBuffer> buffer, Callback callback) {
    socket->async_read_some(asio::buffer(*buffer), [socket, raw, buffer, callback](const asio::error_code& ec, size_t bytes_transferred) {
      raw->append(buffer->data(), bytes_transferred);

      // TLS peers often close without close_notify; treat that as EOF
      bool is_eof = ec == asio::error::eof || ec == asio::ssl::error::stream_truncated;
      if (ec && !is_eof) {
        callback(error_response("Read failed: " + ec.message()));
        return;
      }

      if (!is_eof && !response_complete(*raw)) {
        read_all(socket, raw, buffer, callback);
        return;
      }

      auto response = parse_response(*raw);
      if (!response) {
        callback(error_response("Invalid HTTP response"));
        return;
      }
      callback(std::move(*response));
    });
  }

  asio::io_context& io_ctx_;
  asio::ssl::context ssl_ctx_;
};

HttpClient::HttpClient(asio::io_context& io_ctx) : impl_(std::make_unique<Impl>(io_ctx)) {}

HttpClient::~HttpClient() = default;

void HttpClient::request(const std::string& url, const HttpOptions& options, std::function<void(HttpResponse)> callback) {
  impl_->request(url, options, std::move(callback));
}

std::future<HttpResponse> HttpClient::request(const std::string& url, const HttpOptions& options) {
  auto promise = std::make_shared<std::promise<HttpResponse>>();
  auto future = promise->get_future();

  impl_->request(url, options, [promise](HttpResponse response) {
    promise->set_value(std::move(response));
  });

  return future;
}

}  // namespace claire::net
