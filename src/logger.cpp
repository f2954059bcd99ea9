#include "cloudlab/logger.h"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace cloudlab {

Logger::Logger(std::ostream& out, LogLevel min_level) : out_(out), min_level_(min_level) {}

std::string_view Logger::level_to_string(LogLevel level) {
  switch (level) {
  case LogLevel::Debug:
    return "DEBUG";
  case LogLevel::Info:
    return "INFO";
  case LogLevel::Warn:
    return "WARN";
  case LogLevel::Error:
    return "ERROR";
  }
  return "UNKNOWN";
}

std::optional<LogLevel> Logger::parse_level(std::string_view name) {
  std::string lower(name);
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  if (lower == "debug") {
    return LogLevel::Debug;
  }
  if (lower == "info") {
    return LogLevel::Info;
  }
  if (lower == "warn" || lower == "warning") {
    return LogLevel::Warn;
  }
  if (lower == "error") {
    return LogLevel::Error;
  }
  return std::nullopt;
}

std::string Logger::format_line(LogLevel level, std::string_view msg,
                                std::chrono::system_clock::time_point when) {
  std::time_t seconds = std::chrono::system_clock::to_time_t(when);
  auto millis =
      std::chrono::duration_cast<std::chrono::milliseconds>(when.time_since_epoch()).count() %
      1000;
  if (millis < 0) {
    millis += 1000;
  }

  std::tm local{};
  localtime_r(&seconds, &local);

  std::ostringstream line;
  line << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << '.' << std::setfill('0')
       << std::setw(3) << millis << " [" << level_to_string(level) << "] " << msg << '\n';
  return line.str();
}

void Logger::log(LogLevel level, std::string_view msg) {
  if (!enabled(level)) {
    return;
  }
  // Format outside the lock; only the write is serialized.
  std::string line = format_line(level, msg, std::chrono::system_clock::now());
  std::lock_guard<std::mutex> lock(write_mutex_);
  out_ << line;
  out_.flush();
}

} // namespace cloudlab
