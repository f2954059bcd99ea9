#include "cloudlab/dashboard_api.h"
#include "cloudlab/config.h"
#include "cloudlab/logger.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <charconv>
#include <fstream>
#include <sstream>

namespace cloudlab {

namespace {

// Log files and command output are not guaranteed to be UTF-8.
HttpResponse json_reply(uint16_t status_code, const nlohmann::json& j) {
  return json_response(status_code,
                       j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
}

// Blank values count as absent.
std::string query_value(const HttpRequest& req, const std::string& key,
                        std::string_view fallback) {
  auto it = req.query.find(key);
  if (it == req.query.end() || it->second.empty()) {
    return std::string(fallback);
  }
  return it->second;
}

} // namespace

DashboardApi::DashboardApi(StatusAggregator& status, const LogTailReader& logs,
                           const EnvironmentCatalog& environments, const CommandBridge& commands,
                           std::filesystem::path dashboard_html, Logger* logger)
    : status_(status), logs_(logs), environments_(environments), commands_(commands),
      dashboard_html_(std::move(dashboard_html)), logger_(logger) {}

void DashboardApi::register_routes(HttpServer& server) {
  auto page = [this](const HttpRequest&) { return dashboard_page(); };
  server.register_handler("/", page);
  server.register_handler("/index.html", page);
  server.register_handler("/dashboard.html", page);

  server.register_handler("/api/health", [this](const HttpRequest&) { return health(); });
  server.register_handler("/api/status", [this](const HttpRequest&) { return status(); });
  server.register_handler("/api/logs", [this](const HttpRequest& req) { return logs(req); });
  server.register_handler("/api/kernels", [this](const HttpRequest&) { return kernels(); });
  server.register_handler("/api/environments",
                          [this](const HttpRequest&) { return environments(); });
  server.register_prefix_handler(kCommandPrefix,
                                 [this](const HttpRequest& req) { return command(req); });
}

HttpResponse DashboardApi::dashboard_page() const {
  std::ifstream file(dashboard_html_, std::ios::binary);
  if (!file) {
    return json_reply(404, {{"error", "Dashboard HTML not found"}});
  }
  std::ostringstream content;
  content << file.rdbuf();

  HttpResponse resp;
  resp.body = content.str();
  resp.headers["Content-Type"] = "text/html; charset=utf-8";
  return resp;
}

HttpResponse DashboardApi::health() const {
  return json_reply(200, {{"status", "ok"}, {"version", std::string(OptionsParser::version())}});
}

HttpResponse DashboardApi::status() {
  return json_reply(200, status_.snapshot().to_json());
}

int DashboardApi::parse_line_count(const std::string& text) {
  long long value = 0;
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (text.empty() || ptr != text.data() + text.size()) {
    return kDefaultLogLines;
  }
  if (ec == std::errc::result_out_of_range) {
    return text[0] == '-' ? 1 : kMaxLogLines;
  }
  if (ec != std::errc()) {
    return kDefaultLogLines;
  }
  return static_cast<int>(std::clamp<long long>(value, 1, kMaxLogLines));
}

HttpResponse DashboardApi::logs(const HttpRequest& req) const {
  std::string service = query_value(req, "service", kDefaultLogService);
  int lines = parse_line_count(query_value(req, "lines", ""));
  return json_reply(200, {{"service", service},
                          {"log", logs_.tail(service, static_cast<size_t>(lines))}});
}

HttpResponse DashboardApi::kernels() const {
  return json_reply(200, {{"kernels", status_.kernels()}});
}

HttpResponse DashboardApi::environments() const {
  return json_reply(200, {{"environments", to_json(environments_.list())}});
}

std::vector<std::string> DashboardApi::command_arguments(std::string_view path) {
  std::vector<std::string> args;
  if (path.rfind(kCommandPrefix, 0) != 0) {
    return args;
  }
  path.remove_prefix(kCommandPrefix.size());

  while (!path.empty()) {
    size_t slash = path.find('/');
    std::string_view segment = path.substr(0, slash);
    if (!segment.empty()) {
      args.push_back(url_decode(segment));
    }
    if (slash == std::string_view::npos) {
      break;
    }
    path.remove_prefix(slash + 1);
  }
  return args;
}

HttpResponse DashboardApi::command(const HttpRequest& req) const {
  std::vector<std::string> args = command_arguments(req.path);
  if (args.empty()) {
    return json_reply(400, {{"error", "No command specified"}});
  }

  if (logger_) {
    logger_->info("command: " + commands_.display_command(args));
  }
  auto result = commands_.run(args, command_timeout_);
  if (!result) {
    return json_reply(200, {{"success", false},
                            {"error", result.error().message},
                            {"reason", std::string(error_code_name(result.error().code))}});
  }

  const CommandOutput& out = result.value();
  return json_reply(200, {{"success", out.exited_zero()},
                          {"stdout", out.stdout_data},
                          {"stderr", out.stderr_data},
                          {"command", commands_.display_command(args)}});
}

} // namespace cloudlab
