#include "cloudlab/command_bridge.h"
#include "cloudlab/config.h"
#include "cloudlab/config_store.h"
#include "cloudlab/dashboard_api.h"
#include "cloudlab/environments.h"
#include "cloudlab/http.h"
#include "cloudlab/log_tail.h"
#include "cloudlab/logger.h"
#include "cloudlab/metrics.h"
#include "cloudlab/paths.h"
#include "cloudlab/port_probe.h"
#include "cloudlab/process_probe.h"
#include "cloudlab/result.h"
#include "cloudlab/service_status.h"
#include "cloudlab/status.h"

#include <csignal>
#include <filesystem>
#include <iostream>
#include <system_error>

namespace {

volatile std::sig_atomic_t g_running = 1;

void signal_handler(int) {
  g_running = 0;
}

bool ensure_directory(const std::filesystem::path& dir, cloudlab::Logger& logger) {
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  if (ec) {
    logger.error("cannot create " + dir.string() + ": " + ec.message());
    return false;
  }
  return true;
}

} // namespace

int main(int argc, char* argv[]) {
  auto options_result = cloudlab::OptionsParser::parse(argc, argv);
  if (!options_result) {
    std::cerr << "Error: " << options_result.error().message << "\n";
    std::cerr << cloudlab::OptionsParser::usage();
    return 2;
  }
  auto& options = options_result.value();

  if (options.show_version) {
    std::cout << "cloudlab-dashd " << cloudlab::OptionsParser::version() << "\n";
    return 0;
  }
  if (options.show_help) {
    std::cout << cloudlab::OptionsParser::usage();
    return 0;
  }

  cloudlab::Logger logger;
  auto level = cloudlab::Logger::parse_level(options.log_level);
  if (!level) {
    std::cerr << "Error: Invalid log level: " << options.log_level << "\n";
    return 2;
  }
  logger.set_level(*level);

  cloudlab::Paths paths(options.root_dir);
  if (!ensure_directory(paths.root(), logger) || !ensure_directory(paths.log_dir(), logger) ||
      !ensure_directory(paths.pid_dir(), logger)) {
    return 1;
  }

  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);
  std::signal(SIGPIPE, SIG_IGN);

  cloudlab::ConfigStore config_store(paths.config_file().string(), &logger);
  cloudlab::KillSignalChecker existence_checker;
  cloudlab::ProcessLivenessProbe process_probe(paths, existence_checker);
  cloudlab::PortLivenessProbe port_probe;
  cloudlab::ServiceStatusResolver resolver(process_probe, port_probe);
  auto metrics = cloudlab::make_metrics_collector("/proc", &logger);
  cloudlab::CommandBridge commands(options.command, &logger);
  cloudlab::EnvironmentCatalog environments(paths);
  cloudlab::LogTailReader log_reader(paths);
  cloudlab::StatusAggregator status(config_store, resolver, *metrics, commands, environments,
                                    &logger);

  std::filesystem::path html =
      options.static_file.empty() ? paths.dashboard_html() : std::filesystem::path(options.static_file);
  cloudlab::DashboardApi api(status, log_reader, environments, commands, html, &logger);

  cloudlab::HttpServer server(options.address, options.port, &logger);
  api.register_routes(server);

  auto listening = server.listen();
  if (!listening) {
    if (listening.error().code == cloudlab::ErrorCode::AddressInUse) {
      std::cerr << "Error: Port " << options.port << " is already in use\n";
      std::cerr << "Try: cloudlab stop dashboard && cloudlab start dashboard\n";
    } else {
      std::cerr << "Error: " << listening.error().message << "\n";
    }
    return 1;
  }

  std::cout << "\nCloudLab Dashboard Server " << cloudlab::OptionsParser::version() << "\n"
            << "URL: http://localhost:" << server.port() << "\n"
            << "Press Ctrl+C to stop\n\n";
  std::cout.flush();

  logger.info("root: " + paths.root().string());
  logger.info("listening on " + options.address + ":" + std::to_string(server.port()));

  auto served = server.serve_forever(&g_running);
  if (!served) {
    logger.error(served.error().message);
    return 1;
  }

  logger.info("Shutting down dashboard server...");
  return 0;
}
