#pragma once

#include "cloudlab/command_bridge.h"
#include "cloudlab/environments.h"
#include "cloudlab/http.h"
#include "cloudlab/log_tail.h"
#include "cloudlab/status.h"

#include <chrono>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace cloudlab {

class Logger;

// JSON endpoints of the dashboard. Holds references only; the components must outlive it.
class DashboardApi {
public:
  static constexpr int kDefaultLogLines = 100;
  static constexpr int kMaxLogLines = 10000;
  static constexpr std::string_view kDefaultLogService = "jupyter";
  static constexpr std::string_view kCommandPrefix = "/api/command/";

  DashboardApi(StatusAggregator& status, const LogTailReader& logs,
               const EnvironmentCatalog& environments, const CommandBridge& commands,
               std::filesystem::path dashboard_html, Logger* logger = nullptr);

  void register_routes(HttpServer& server);

  // Limit for /api/command runs; CommandBridge::kDefaultTimeout unless changed.
  void set_command_timeout(std::chrono::milliseconds timeout) { command_timeout_ = timeout; }

  HttpResponse dashboard_page() const;
  HttpResponse health() const;
  HttpResponse status();
  HttpResponse logs(const HttpRequest& req) const;
  HttpResponse kernels() const;
  HttpResponse environments() const;
  HttpResponse command(const HttpRequest& req) const;

  // Missing or non-numeric -> 100; otherwise clamped to [1, 10000].
  static int parse_line_count(const std::string& text);
  // "/api/command/a/b%20c/" -> {"a", "b c"}; empty segments are dropped.
  static std::vector<std::string> command_arguments(std::string_view path);

private:
  StatusAggregator& status_;
  const LogTailReader& logs_;
  const EnvironmentCatalog& environments_;
  const CommandBridge& commands_;
  std::filesystem::path dashboard_html_;
  Logger* logger_;
  std::chrono::milliseconds command_timeout_ = CommandBridge::kDefaultTimeout;
};

} // namespace cloudlab
