#include "cloudlab/status.h"
#include "cloudlab/logger.h"

#include <future>
#include <system_error>

namespace cloudlab {

namespace {

// Runs `fn` on its own thread when one can be created, inline otherwise.
template <typename Fn>
auto start_async(Fn fn) -> std::future<decltype(fn())> {
  try {
    return std::async(std::launch::async, fn);
  } catch (const std::system_error&) {
    return std::async(std::launch::deferred, fn);
  }
}

} // namespace

nlohmann::json StatusSnapshot::to_json() const {
  nlohmann::json j = nlohmann::json::object();
  for (const auto& [name, up] : services) {
    j[name] = up;
  }
  for (const auto& [name, up] : tunnels) {
    j[name] = up;
  }
  j["config"] = config;
  j["tunnel_urls"] = tunnel_urls;
  j["system"] = system.to_json();
  j["kernels"] = kernels;
  j["environments"] = cloudlab::to_json(environments);
  return j;
}

StatusAggregator::StatusAggregator(const ConfigStore& config_store,
                                   ServiceStatusResolver& resolver,
                                   ISystemMetricsCollector& metrics, const CommandBridge& commands,
                                   const EnvironmentCatalog& environments, Logger* logger)
    : config_store_(config_store), resolver_(resolver), metrics_(metrics), commands_(commands),
      environments_(environments), logger_(logger) {}

void StatusAggregator::warn(const std::string& step, const std::exception& e) const {
  if (logger_) {
    logger_->warn("status: " + step + " failed: " + e.what());
  }
}

std::string StatusAggregator::kernels() const {
  auto result = commands_.run({"kernel", "list"}, kernel_timeout_);
  if (!result) {
    return kKernelListUnavailable;
  }
  return result.value().stdout_data;
}

StatusSnapshot StatusAggregator::snapshot() {
  StatusSnapshot snap;

  Configuration config;
  try {
    config = config_store_.load();
  } catch (const std::exception& e) {
    warn("config", e);
  }
  snap.config = config.raw();
  snap.tunnel_urls = config.tunnel_urls();

  // The slow sub-steps (CPU sampling window, external kernel listing) overlap the probes.
  auto metrics_future = start_async([this]() { return metrics_.collect(); });
  auto kernels_future = start_async([this]() { return kernels(); });

  for (const auto& service : kPrimaryServices) {
    std::string name(service.name);
    try {
      int port = config.port(service.port_key, service.default_port);
      snap.services[name] = resolver_.is_service_up(service.name, port);
    } catch (const std::exception& e) {
      warn(name, e);
      snap.services[name] = false;
    }
  }
  // Reported by the running daemon itself.
  snap.services[std::string(kDashboardService.name)] = true;

  for (auto tunnel : kTunnelServices) {
    std::string name(tunnel);
    try {
      snap.tunnels[name] = resolver_.is_tunnel_up(tunnel);
    } catch (const std::exception& e) {
      warn(name, e);
      snap.tunnels[name] = false;
    }
  }

  try {
    snap.environments = environments_.list();
  } catch (const std::exception& e) {
    warn("environments", e);
  }

  try {
    snap.system = metrics_future.get();
  } catch (const std::exception& e) {
    warn("system metrics", e);
    snap.system = StubMetricsCollector().collect();
  }

  try {
    snap.kernels = kernels_future.get();
  } catch (const std::exception& e) {
    warn("kernel list", e);
    snap.kernels = kKernelListUnavailable;
  }

  return snap;
}

} // namespace cloudlab
