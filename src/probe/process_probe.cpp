#include "cloudlab/process_probe.h"

#include <cerrno>
#include <climits>
#include <cstdlib>
#include <fstream>
#include <signal.h>
#include <string>

namespace cloudlab {

ProcessExistence KillSignalChecker::exists(pid_t pid) {
  // pid <= 0 addresses process groups, never a single process.
  if (pid <= 0) {
    return ProcessExistence::NotFound;
  }
  if (kill(pid, 0) == 0) {
    return ProcessExistence::Alive;
  }
  if (errno == EPERM) {
    return ProcessExistence::NoPermission;
  }
  return ProcessExistence::NotFound;
}

ProcessLivenessProbe::ProcessLivenessProbe(const Paths& paths, IProcessExistenceChecker& checker)
    : paths_(paths), checker_(checker) {}

std::optional<pid_t> ProcessLivenessProbe::read_pid(std::string_view service) const {
  if (!Paths::is_plain_name(service)) {
    return std::nullopt;
  }

  std::ifstream file(paths_.pid_file(service));
  if (!file) {
    return std::nullopt;
  }

  // Marker files are a handful of bytes; anything longer is not a pid.
  char buf[64] = {};
  file.read(buf, sizeof(buf) - 1);
  std::string content(buf, static_cast<size_t>(file.gcount()));

  size_t start = content.find_first_not_of(" \t\r\n");
  if (start == std::string::npos) {
    return std::nullopt;
  }
  size_t end = content.find_last_not_of(" \t\r\n");
  std::string digits = content.substr(start, end - start + 1);

  errno = 0;
  char* endptr = nullptr;
  long value = std::strtol(digits.c_str(), &endptr, 10);
  if (errno != 0 || *endptr != '\0' || value <= 0 || value > INT_MAX) {
    return std::nullopt;
  }
  return static_cast<pid_t>(value);
}

bool ProcessLivenessProbe::is_process_alive(std::string_view service) {
  auto pid = read_pid(service);
  if (!pid) {
    return false;
  }

  switch (checker_.exists(*pid)) {
  case ProcessExistence::Alive:
    return true;
  case ProcessExistence::NoPermission:
    // Deliberate false-positive bias: EPERM means the pid exists under another owner, and a
    // monitor should not report a running service as dead.
    return true;
  case ProcessExistence::NotFound:
    break;
  }
  return false;
}

} // namespace cloudlab
