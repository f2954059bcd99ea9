#pragma once

#include "cloudlab/result.h"

#include <cstdint>
#include <string>
#include <string_view>

namespace cloudlab {

constexpr uint16_t kDefaultDashboardPort = 3000;
constexpr std::string_view kDefaultCommand = "cloudlab";

struct Options {
  std::string address = "0.0.0.0";
  uint16_t port = kDefaultDashboardPort;
  std::string root_dir;
  std::string command = std::string(kDefaultCommand);
  std::string static_file;
  std::string log_level = "info";
  bool show_version = false;
  bool show_help = false;
};

struct OptionsParser {
  // Environment defaults (CLOUDLAB_PORT, CLOUDLAB_DIR, CLOUDLAB_BIN, HOME) are applied first,
  // command line flags override them.
  static Result<Options> parse(int argc, char* argv[]);
  static std::string_view version();
  static std::string_view usage();
};

// Strict decimal port parse; rejects 0, trailing garbage and values above 65535.
[[nodiscard]] bool parse_port(std::string_view text, uint16_t& port);

} // namespace cloudlab
