#include "cloudlab/service_status.h"

namespace cloudlab {

ServiceStatusResolver::ServiceStatusResolver(ProcessLivenessProbe& process_probe,
                                             const PortLivenessProbe& port_probe)
    : process_probe_(process_probe), port_probe_(port_probe) {}

bool ServiceStatusResolver::is_service_up(std::string_view name, int port) {
  if (process_probe_.is_process_alive(name)) {
    return true;
  }
  return port_probe_.is_port_open(port);
}

bool ServiceStatusResolver::is_tunnel_up(std::string_view name) {
  return process_probe_.is_process_alive(name);
}

} // namespace cloudlab
