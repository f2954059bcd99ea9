#pragma once

#include "cloudlab/port_probe.h"
#include "cloudlab/process_probe.h"

#include <array>
#include <string_view>

namespace cloudlab {

struct ServiceSpec {
  std::string_view name;
  std::string_view port_key;
  int default_port;
};

inline constexpr std::array<ServiceSpec, 3> kPrimaryServices = {{
    {"jupyter", "jupyter_port", 8888},
    {"vscode", "vscode_port", 8080},
    {"ssh", "ssh_port", 7681},
}};

inline constexpr ServiceSpec kDashboardService = {"dashboard", "dashboard_port", 3000};

// Tunnel helpers have no port of their own.
inline constexpr std::array<std::string_view, 4> kTunnelServices = {
    "tunnel_jupyter", "tunnel_vscode", "tunnel_ssh", "tunnel_dashboard"};

class ServiceStatusResolver {
public:
  ServiceStatusResolver(ProcessLivenessProbe& process_probe, const PortLivenessProbe& port_probe);

  // Either signal is enough: a stale pid with a listening port, or a live pid still starting up.
  bool is_service_up(std::string_view name, int port);
  bool is_tunnel_up(std::string_view name);

private:
  ProcessLivenessProbe& process_probe_;
  const PortLivenessProbe& port_probe_;
};

} // namespace cloudlab
