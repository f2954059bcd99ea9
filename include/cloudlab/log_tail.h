#pragma once

#include "cloudlab/paths.h"

#include <cstddef>
#include <string>
#include <string_view>

namespace cloudlab {

class LogTailReader {
public:
  explicit LogTailReader(const Paths& paths);

  // Last `max_lines` lines of <root>/logs/<service>.log with their line endings preserved.
  // Missing or unreadable files yield placeholder(service). The caller bounds max_lines.
  std::string tail(std::string_view service, size_t max_lines) const;

  static std::string placeholder(std::string_view service);

private:
  const Paths& paths_;
};

// Returns the suffix of the file holding its last `max_lines` lines, reading backwards in
// `block_size` chunks. Returns false when the file cannot be opened or read.
bool read_last_lines(const std::string& path, size_t max_lines, std::string& out,
                     size_t block_size = 64 * 1024);

} // namespace cloudlab
