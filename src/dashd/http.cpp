#include "cloudlab/http.h"
#include "cloudlab/logger.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <arpa/inet.h>
#include <cerrno>
#include <charconv>
#include <cstring>
#include <exception>
#include <netinet/in.h>
#include <poll.h>
#include <string>
#include <strings.h>
#include <system_error>
#include <sys/socket.h>
#include <sys/time.h>
#include <thread>
#include <unistd.h>

namespace {

std::string_view trim(std::string_view sv) {
  while (!sv.empty() && (sv[0] == ' ' || sv[0] == '\t')) {
    sv.remove_prefix(1);
  }
  while (!sv.empty() &&
         (sv.back() == ' ' || sv.back() == '\t' || sv.back() == '\n' || sv.back() == '\r')) {
    sv.remove_suffix(1);
  }
  return sv;
}

int hex_value(char c) {
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  if (c >= 'a' && c <= 'f') {
    return c - 'a' + 10;
  }
  if (c >= 'A' && c <= 'F') {
    return c - 'A' + 10;
  }
  return -1;
}

// Content-Length from a raw header block, 0 when absent or unparsable.
size_t find_content_length(std::string_view headers) {
  size_t pos = 0;
  while (pos < headers.size()) {
    size_t line_end = headers.find("\r\n", pos);
    if (line_end == std::string_view::npos) {
      line_end = headers.size();
    }
    std::string_view line = headers.substr(pos, line_end - pos);
    if (line.size() >= 15 && strncasecmp(line.data(), "Content-Length:", 15) == 0) {
      std::string_view value = trim(line.substr(15));
      size_t length = 0;
      auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), length);
      if (ec != std::errc() || ptr != value.data() + value.size()) {
        return 0;
      }
      return length;
    }
    pos = line_end + 2;
  }
  return 0;
}

void write_all(int fd, const std::string& data) {
  size_t sent = 0;
  while (sent < data.size()) {
    ssize_t n = ::send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
    if (n < 0 && errno == EINTR) {
      continue;
    }
    if (n <= 0) {
      return;
    }
    sent += static_cast<size_t>(n);
  }
}

void add_cors_headers(cloudlab::HttpResponse& resp) {
  resp.headers["Access-Control-Allow-Origin"] = "*";
  resp.headers["Access-Control-Allow-Methods"] = "GET, POST, OPTIONS";
  resp.headers["Access-Control-Allow-Headers"] = "Content-Type";
}

} // namespace

namespace cloudlab {

std::string url_decode(std::string_view in, bool plus_as_space) {
  std::string out;
  out.reserve(in.size());
  for (size_t i = 0; i < in.size(); ++i) {
    char c = in[i];
    if (c == '%' && i + 2 < in.size()) {
      int hi = hex_value(in[i + 1]);
      int lo = hex_value(in[i + 2]);
      if (hi >= 0 && lo >= 0) {
        out.push_back(static_cast<char>(hi * 16 + lo));
        i += 2;
        continue;
      }
    }
    if (c == '+' && plus_as_space) {
      out.push_back(' ');
      continue;
    }
    out.push_back(c);
  }
  return out;
}

std::map<std::string, std::string> parse_query(std::string_view query) {
  std::map<std::string, std::string> params;
  while (!query.empty()) {
    size_t amp = query.find('&');
    std::string_view pair = query.substr(0, amp);
    query = amp == std::string_view::npos ? std::string_view() : query.substr(amp + 1);
    if (pair.empty()) {
      continue;
    }
    size_t eq = pair.find('=');
    std::string key = url_decode(pair.substr(0, eq), true);
    std::string value =
        eq == std::string_view::npos ? std::string() : url_decode(pair.substr(eq + 1), true);
    params.emplace(std::move(key), std::move(value));
  }
  return params;
}

std::string_view status_text_for(uint16_t status_code) {
  switch (status_code) {
  case 200:
    return "OK";
  case 400:
    return "Bad Request";
  case 404:
    return "Not Found";
  case 405:
    return "Method Not Allowed";
  case 413:
    return "Payload Too Large";
  case 500:
    return "Internal Server Error";
  case 503:
    return "Service Unavailable";
  default:
    return "Unknown";
  }
}

HttpResponse json_response(uint16_t status_code, const std::string& body) {
  HttpResponse resp;
  resp.status_code = status_code;
  resp.status_text = status_text_for(status_code);
  resp.body = body;
  resp.headers["Content-Type"] = "application/json";
  return resp;
}

HttpServer::HttpServer(std::string_view address, uint16_t port, Logger* logger)
    : address_(address), port_(port), logger_(logger) {}

HttpServer::~HttpServer() {
  if (server_fd_ >= 0) {
    close(server_fd_);
  }
}

void HttpServer::register_handler(std::string_view path, RequestHandler handler) {
  handlers_.emplace_back(std::string(path), std::move(handler));
}

void HttpServer::register_prefix_handler(std::string_view prefix, RequestHandler handler) {
  prefix_handlers_.emplace_back(std::string(prefix), std::move(handler));
}

Result<void> HttpServer::listen() {
  struct sockaddr_in addr;
  memset(&addr, 0, sizeof(addr));
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port_);
  if (inet_pton(AF_INET, address_.c_str(), &addr.sin_addr) != 1) {
    return Result<void>::failure(ErrorCode::InvalidArgument, "Invalid address: " + address_);
  }

  server_fd_ = socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
  if (server_fd_ < 0) {
    return Result<void>::failure(ErrorCode::SocketError,
                                 std::string("socket: ") + std::strerror(errno));
  }

  int opt = 1;
  setsockopt(server_fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

  if (bind(server_fd_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
    int err = errno;
    close(server_fd_);
    server_fd_ = -1;
    if (err == EADDRINUSE) {
      return Result<void>::failure(ErrorCode::AddressInUse,
                                   "Port " + std::to_string(port_) + " is already in use");
    }
    return Result<void>::failure(ErrorCode::SocketError,
                                 std::string("bind: ") + std::strerror(err));
  }

  if (::listen(server_fd_, SOMAXCONN) < 0) {
    int err = errno;
    close(server_fd_);
    server_fd_ = -1;
    return Result<void>::failure(ErrorCode::SocketError,
                                 std::string("listen: ") + std::strerror(err));
  }

  socklen_t len = sizeof(addr);
  if (getsockname(server_fd_, reinterpret_cast<struct sockaddr*>(&addr), &len) == 0) {
    port_ = ntohs(addr.sin_port);
  }
  return Result<void>::success();
}

Result<void> HttpServer::serve_forever(volatile std::sig_atomic_t* shutdown_flag) {
  if (server_fd_ < 0) {
    auto listening = listen();
    if (!listening) {
      return listening;
    }
  }

  while (!shutdown_flag || *shutdown_flag) {
    struct pollfd pfd = {server_fd_, POLLIN, 0};
    int ready = poll(&pfd, 1, 200);
    if (ready < 0) {
      if (errno == EINTR) {
        continue;
      }
      if (logger_) {
        logger_->error(std::string("poll failed: ") + std::strerror(errno));
      }
      break;
    }
    if (ready == 0) {
      continue;
    }

    int client_fd = accept4(server_fd_, nullptr, nullptr, SOCK_CLOEXEC);
    if (client_fd < 0) {
      if (errno == EINTR || errno == EAGAIN || errno == ECONNABORTED) {
        continue;
      }
      if (logger_) {
        logger_->error(std::string("accept failed: ") + std::strerror(errno));
      }
      break;
    }

    struct timeval tv = {5, 0};
    setsockopt(client_fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    setsockopt(client_fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));

    {
      std::lock_guard<std::mutex> lock(clients_mutex_);
      ++active_clients_;
    }
    try {
      std::thread([this, client_fd]() {
        handle_client(client_fd);
        close(client_fd);
        std::lock_guard<std::mutex> lock(clients_mutex_);
        --active_clients_;
        clients_cv_.notify_all();
      }).detach();
    } catch (const std::system_error& e) {
      if (logger_) {
        logger_->warn(std::string("serving connection inline: ") + e.what());
      }
      handle_client(client_fd);
      close(client_fd);
      std::lock_guard<std::mutex> lock(clients_mutex_);
      --active_clients_;
    }
  }

  std::unique_lock<std::mutex> lock(clients_mutex_);
  clients_cv_.wait(lock, [this]() { return active_clients_ == 0; });
  return Result<void>::success();
}

void HttpServer::handle_client(int client_fd) {
  std::string request_buffer;
  char temp_buf[4096];
  size_t body_start = std::string::npos;
  size_t content_length = 0;
  bool headers_parsed = false;

  while (true) {
    if (request_buffer.size() > kMaxRequestSize ||
        (headers_parsed && content_length > kMaxRequestSize - body_start)) {
      HttpResponse resp = json_response(413, R"({"error":"Request too large"})");
      add_cors_headers(resp);
      resp.headers["Connection"] = "close";
      write_all(client_fd, format_response(resp));
      return;
    }
    if (headers_parsed && request_buffer.size() >= body_start + content_length) {
      break;
    }

    ssize_t n = recv(client_fd, temp_buf, sizeof(temp_buf), 0);
    if (n < 0 && errno == EINTR) {
      continue;
    }
    if (n <= 0) {
      break;
    }
    request_buffer.append(temp_buf, static_cast<size_t>(n));

    if (!headers_parsed) {
      size_t end = request_buffer.find("\r\n\r\n");
      if (end != std::string::npos) {
        body_start = end + 4;
        headers_parsed = true;
        content_length = find_content_length(std::string_view(request_buffer).substr(0, end));
      }
    }
  }

  if (request_buffer.empty()) {
    return;
  }

  HttpRequest req = parse_request(request_buffer);
  HttpResponse resp;
  if (req.method.empty()) {
    resp = json_response(400, R"({"error":"Bad request"})");
    add_cors_headers(resp);
  } else {
    resp = dispatch(req);
  }
  resp.headers["Connection"] = "close";

  if (logger_ && logger_->enabled(LogLevel::Debug)) {
    logger_->debug(req.method + " " + req.target + " -> " + std::to_string(resp.status_code));
  }
  write_all(client_fd, format_response(resp));
}

HttpResponse HttpServer::dispatch(const HttpRequest& req) const {
  HttpResponse resp;
  if (req.method == "OPTIONS") {
    resp.status_code = 200;
    resp.status_text = "OK";
  } else if (req.method != "GET") {
    resp = json_response(405, R"({"error":"Method not allowed"})");
  } else {
    const RequestHandler* handler = nullptr;
    for (const auto& [path, h] : handlers_) {
      if (req.path == path) {
        handler = &h;
        break;
      }
    }
    if (!handler) {
      for (const auto& [prefix, h] : prefix_handlers_) {
        if (req.path.rfind(prefix, 0) == 0) {
          handler = &h;
          break;
        }
      }
    }

    if (!handler) {
      nlohmann::json body = {{"error", "Not found"}, {"path", req.path}};
      resp = json_response(404, body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
    } else {
      try {
        resp = (*handler)(req);
      } catch (const std::exception& e) {
        if (logger_) {
          logger_->error("handler for " + req.path + " failed: " + e.what());
        }
        resp = json_response(500, R"({"error":"Internal server error"})");
      }
    }
  }

  add_cors_headers(resp);
  return resp;
}

HttpRequest HttpServer::parse_request(const std::string& data) {
  HttpRequest req;

  size_t header_end = data.find("\r\n\r\n");
  if (header_end == std::string::npos) {
    return req;
  }

  size_t line_end = data.find("\r\n");
  std::string_view request_line(data.c_str(), line_end);
  size_t sp1 = request_line.find(' ');
  if (sp1 == std::string_view::npos) {
    return req;
  }
  size_t sp2 = request_line.find(' ', sp1 + 1);
  if (sp2 == std::string_view::npos) {
    return req;
  }

  std::string_view method = trim(request_line.substr(0, sp1));
  std::string_view target = trim(request_line.substr(sp1 + 1, sp2 - sp1 - 1));
  if (method.empty() || target.empty()) {
    return req;
  }
  req.method = std::string(method);
  req.target = std::string(target);
  size_t qmark = target.find('?');
  req.path = std::string(target.substr(0, qmark));
  if (qmark != std::string_view::npos) {
    req.query = parse_query(target.substr(qmark + 1));
  }

  size_t pos = line_end + 2;
  while (pos < header_end) {
    size_t next = data.find("\r\n", pos);
    if (next == std::string::npos || next > header_end) {
      next = header_end;
    }
    std::string_view line(data.c_str() + pos, next - pos);
    size_t colon = line.find(':');
    if (colon != std::string_view::npos && colon > 0) {
      req.headers.emplace(std::string(trim(line.substr(0, colon))),
                          std::string(trim(line.substr(colon + 1))));
    }
    pos = next + 2;
  }

  size_t body_start = header_end + 4;
  size_t content_length =
      find_content_length(std::string_view(data).substr(0, header_end));
  size_t available = data.size() - body_start;
  req.body = data.substr(body_start, std::min(content_length, available));
  return req;
}

std::string HttpServer::format_response(const HttpResponse& resp) {
  std::string resp_str = "HTTP/1.1 ";
  resp_str += std::to_string(resp.status_code) + " " + std::string(resp.status_text) + "\r\n";

  for (const auto& [key, value] : resp.headers) {
    resp_str += key + ": " + value + "\r\n";
  }

  resp_str += "Content-Length: " + std::to_string(resp.body.size()) + "\r\n";
  resp_str += "\r\n";
  resp_str += resp.body;

  return resp_str;
}

} // namespace cloudlab
