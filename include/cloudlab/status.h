#pragma once

#include "cloudlab/command_bridge.h"
#include "cloudlab/config_store.h"
#include "cloudlab/environments.h"
#include "cloudlab/metrics.h"
#include "cloudlab/service_status.h"

#include <nlohmann/json.hpp>

#include <chrono>
#include <map>
#include <string>
#include <vector>

namespace cloudlab {

class Logger;

struct StatusSnapshot {
  // Keyed by service name ("jupyter", "vscode", "ssh", "dashboard").
  std::map<std::string, bool> services;
  // Keyed by tunnel helper name ("tunnel_jupyter", ...).
  std::map<std::string, bool> tunnels;
  nlohmann::json config = nlohmann::json::object();
  nlohmann::json tunnel_urls = nlohmann::json::object();
  SystemMetrics system;
  std::string kernels;
  std::vector<EnvironmentDescriptor> environments;

  [[nodiscard]] nlohmann::json to_json() const;
};

class StatusAggregator {
public:
  static constexpr std::chrono::seconds kKernelListTimeout{30};
  static constexpr const char* kKernelListUnavailable = "Unable to list kernels";

  StatusAggregator(const ConfigStore& config_store, ServiceStatusResolver& resolver,
                   ISystemMetricsCollector& metrics, const CommandBridge& commands,
                   const EnvironmentCatalog& environments, Logger* logger = nullptr);

  // Never throws: each sub-step falls back to its default on failure.
  StatusSnapshot snapshot();

  // Output of `cloudlab kernel list`, or kKernelListUnavailable.
  std::string kernels() const;

  void set_kernel_list_timeout(std::chrono::milliseconds timeout) { kernel_timeout_ = timeout; }

private:
  void warn(const std::string& step, const std::exception& e) const;

  const ConfigStore& config_store_;
  ServiceStatusResolver& resolver_;
  ISystemMetricsCollector& metrics_;
  const CommandBridge& commands_;
  const EnvironmentCatalog& environments_;
  Logger* logger_;
  std::chrono::milliseconds kernel_timeout_ = kKernelListTimeout;
};

} // namespace cloudlab
