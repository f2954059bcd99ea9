#include "cloudlab/config.h"

#include <charconv>
#include <cstdlib>
#include <string_view>

namespace cloudlab {

namespace {

constexpr std::string_view kVersion = "1.2.0";

constexpr std::string_view kUsage =
    "Usage: cloudlab-dashd [OPTIONS]\n"
    "Options:\n"
    "  --port <n>          Listen port (default 3000, env CLOUDLAB_PORT)\n"
    "  --address <ip>      Listen address (default 0.0.0.0)\n"
    "  --root <dir>        CloudLab state directory (default ~/.cloudlab, env CLOUDLAB_DIR)\n"
    "  --command <exe>     Management executable (default cloudlab, env CLOUDLAB_BIN)\n"
    "  --static <file>     Dashboard HTML file (default <root>/dashboard.html)\n"
    "  --log-level <level> Log level (debug, info, warn, error)\n"
    "  --version, -v       Show version\n"
    "  --help, -h          Show this help\n";

std::string default_root() {
  const char* home = std::getenv("HOME");
  if (home && home[0]) {
    return std::string(home) + "/.cloudlab";
  }
  return ".cloudlab";
}

} // namespace

bool parse_port(std::string_view text, uint16_t& port) {
  unsigned value = 0;
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc() || ptr != text.data() + text.size() || text.empty()) {
    return false;
  }
  if (value == 0 || value > 65535) {
    return false;
  }
  port = static_cast<uint16_t>(value);
  return true;
}

Result<Options> OptionsParser::parse(int argc, char* argv[]) {
  Options options;
  options.root_dir = default_root();

  if (const char* env_port = std::getenv("CLOUDLAB_PORT")) {
    if (!parse_port(env_port, options.port)) {
      return Result<Options>::error(ErrorCode::InvalidArgument,
                                    "Invalid CLOUDLAB_PORT: " + std::string(env_port));
    }
  }
  if (const char* env_dir = std::getenv("CLOUDLAB_DIR"); env_dir && env_dir[0]) {
    options.root_dir = env_dir;
  }
  if (const char* env_bin = std::getenv("CLOUDLAB_BIN"); env_bin && env_bin[0]) {
    options.command = env_bin;
  }

  for (int i = 1; i < argc; ++i) {
    std::string_view arg = argv[i];

    if (arg == "--help" || arg == "-h") {
      options.show_help = true;
    } else if (arg == "--version" || arg == "-v") {
      options.show_version = true;
    } else if (arg == "--log-level" && i + 1 < argc) {
      options.log_level = argv[++i];
    } else if (arg == "--port" && i + 1 < argc) {
      std::string_view value = argv[++i];
      if (!parse_port(value, options.port)) {
        return Result<Options>::error(ErrorCode::InvalidArgument,
                                      "Invalid port: " + std::string(value));
      }
    } else if (arg == "--address" && i + 1 < argc) {
      options.address = argv[++i];
    } else if (arg == "--root" && i + 1 < argc) {
      options.root_dir = argv[++i];
    } else if (arg == "--command" && i + 1 < argc) {
      options.command = argv[++i];
    } else if (arg == "--static" && i + 1 < argc) {
      options.static_file = argv[++i];
    } else {
      return Result<Options>::error(ErrorCode::InvalidArgument,
                                    "Unknown argument: " + std::string(arg));
    }
  }

  return Result<Options>::ok(options);
}

std::string_view OptionsParser::version() {
  return kVersion;
}

std::string_view OptionsParser::usage() {
  return kUsage;
}

} // namespace cloudlab
