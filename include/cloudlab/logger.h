#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace cloudlab {

enum class LogLevel : uint8_t {
  Debug = 0,
  Info = 1,
  Warn = 2,
  Error = 3,
};

// Line-oriented logger shared by every component. Each line is written and flushed
// under one lock, so concurrent request threads never interleave output.
class Logger {
public:
  explicit Logger(std::ostream& out = std::cout, LogLevel min_level = LogLevel::Info);

  void set_level(LogLevel level) noexcept { min_level_.store(level, std::memory_order_relaxed); }
  [[nodiscard]] LogLevel level() const noexcept {
    return min_level_.load(std::memory_order_relaxed);
  }
  [[nodiscard]] bool enabled(LogLevel level) const noexcept { return level >= this->level(); }

  void log(LogLevel level, std::string_view msg);
  void debug(std::string_view msg) { log(LogLevel::Debug, msg); }
  void info(std::string_view msg) { log(LogLevel::Info, msg); }
  void warn(std::string_view msg) { log(LogLevel::Warn, msg); }
  void error(std::string_view msg) { log(LogLevel::Error, msg); }

  static std::string_view level_to_string(LogLevel level);
  // Accepts "debug", "info", "warn"/"warning", "error" in any case.
  static std::optional<LogLevel> parse_level(std::string_view name);

  // "YYYY-MM-DD HH:MM:SS.mmm [LEVEL] msg\n" in local time.
  static std::string format_line(LogLevel level, std::string_view msg,
                                 std::chrono::system_clock::time_point when);

private:
  std::ostream& out_;
  std::atomic<LogLevel> min_level_;
  std::mutex write_mutex_;
};

} // namespace cloudlab
