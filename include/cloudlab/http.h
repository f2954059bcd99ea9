#pragma once

#include "cloudlab/result.h"

#include <atomic>
#include <condition_variable>
#include <csignal>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace cloudlab {

class Logger;

struct HttpRequest {
  std::string method;
  std::string target;  // as sent: path plus optional "?query"
  std::string path;    // target without the query, still percent-encoded
  std::string body;
  std::map<std::string, std::string> headers;
  std::map<std::string, std::string> query;  // decoded; first occurrence wins
};

struct HttpResponse {
  uint16_t status_code = 200;
  std::string_view status_text = "OK";
  std::string body;
  std::map<std::string, std::string> headers;
};

using RequestHandler = std::function<HttpResponse(const HttpRequest&)>;

// Decodes %XX escapes; with plus_as_space also maps '+' to ' ' (query strings).
std::string url_decode(std::string_view in, bool plus_as_space = false);
std::map<std::string, std::string> parse_query(std::string_view query);
std::string_view status_text_for(uint16_t status_code);

HttpResponse json_response(uint16_t status_code, const std::string& body);

class HttpServer {
public:
  static constexpr size_t kMaxRequestSize = 1024 * 1024;

  explicit HttpServer(std::string_view address, uint16_t port, Logger* logger = nullptr);
  ~HttpServer();

  HttpServer(const HttpServer&) = delete;
  HttpServer& operator=(const HttpServer&) = delete;

  // Exact path match.
  void register_handler(std::string_view path, RequestHandler handler);
  // Matches any path starting with `prefix`; exact handlers win.
  void register_prefix_handler(std::string_view prefix, RequestHandler handler);

  // Binds and listens. Port 0 picks an ephemeral port, see port().
  Result<void> listen();
  [[nodiscard]] uint16_t port() const noexcept { return port_; }

  // Accepts until *shutdown_flag becomes 0, serving each connection on its own thread.
  // Waits for in-flight connections before returning.
  Result<void> serve_forever(volatile std::sig_atomic_t* shutdown_flag = nullptr);

  // Routing, CORS and error mapping without a socket.
  HttpResponse dispatch(const HttpRequest& req) const;

  static HttpRequest parse_request(const std::string& data);
  static std::string format_response(const HttpResponse& resp);

private:
  void handle_client(int client_fd);

  std::string address_;
  uint16_t port_;
  int server_fd_ = -1;
  Logger* logger_;
  std::vector<std::pair<std::string, RequestHandler>> handlers_;
  std::vector<std::pair<std::string, RequestHandler>> prefix_handlers_;

  std::mutex clients_mutex_;
  std::condition_variable clients_cv_;
  size_t active_clients_ = 0;
};

} // namespace cloudlab
