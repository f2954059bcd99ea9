#pragma once

#include <chrono>

namespace cloudlab {

// Connect-and-close check against 127.0.0.1. No data is exchanged.
class PortLivenessProbe {
public:
  explicit PortLivenessProbe(std::chrono::milliseconds timeout = std::chrono::milliseconds{1000});

  [[nodiscard]] bool is_port_open(int port) const;

  [[nodiscard]] std::chrono::milliseconds timeout() const noexcept { return timeout_; }

private:
  std::chrono::milliseconds timeout_;
};

} // namespace cloudlab
