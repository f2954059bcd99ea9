#include "cloudlab/log_tail.h"

#include <algorithm>
#include <fstream>
#include <vector>

namespace cloudlab {

bool read_last_lines(const std::string& path, size_t max_lines, std::string& out,
                     size_t block_size) {
  out.clear();

  std::ifstream file(path, std::ios::binary);
  if (!file) {
    return false;
  }
  file.seekg(0, std::ios::end);
  std::streamoff size = file.tellg();
  if (size < 0) {
    return false;
  }
  if (size == 0 || max_lines == 0) {
    return true;
  }
  if (block_size == 0) {
    block_size = 1;
  }

  // A trailing newline terminates the last line; it does not start a new one.
  std::streamoff search_end = size;
  char last = '\0';
  file.seekg(size - 1);
  if (!file.get(last)) {
    return false;
  }
  if (last == '\n') {
    --search_end;
  }

  std::streamoff start = 0;
  size_t newlines = 0;
  bool found = false;
  std::vector<char> block(block_size);
  std::streamoff pos = search_end;
  while (pos > 0 && !found) {
    std::streamoff chunk_start = std::max<std::streamoff>(0, pos - static_cast<std::streamoff>(block_size));
    auto chunk_len = static_cast<size_t>(pos - chunk_start);
    file.seekg(chunk_start);
    if (!file.read(block.data(), static_cast<std::streamsize>(chunk_len))) {
      return false;
    }
    for (size_t i = chunk_len; i > 0; --i) {
      if (block[i - 1] == '\n' && ++newlines == max_lines) {
        start = chunk_start + static_cast<std::streamoff>(i);
        found = true;
        break;
      }
    }
    pos = chunk_start;
  }

  out.resize(static_cast<size_t>(size - start));
  file.seekg(start);
  if (!file.read(out.data(), static_cast<std::streamsize>(out.size()))) {
    out.clear();
    return false;
  }
  return true;
}

LogTailReader::LogTailReader(const Paths& paths) : paths_(paths) {}

std::string LogTailReader::placeholder(std::string_view service) {
  return "No logs available for " + std::string(service);
}

std::string LogTailReader::tail(std::string_view service, size_t max_lines) const {
  if (!Paths::is_plain_name(service)) {
    return placeholder(service);
  }

  std::string content;
  if (!read_last_lines(paths_.log_file(service).string(), max_lines, content)) {
    return placeholder(service);
  }
  return content;
}

} // namespace cloudlab
