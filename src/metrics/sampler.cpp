#include "cloudlab/metrics.h"
#include "cloudlab/logger.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstring>
#include <fstream>
#include <sstream>
#include <sys/statvfs.h>
#include <sys/utsname.h>
#include <thread>

namespace cloudlab {

namespace {

constexpr double kGiB = 1024.0 * 1024.0 * 1024.0;

double round1(double value) {
  return std::round(value * 10.0) / 10.0;
}

bool readable(const std::string& path) {
  std::ifstream file(path);
  return static_cast<bool>(file);
}

} // namespace

nlohmann::json SystemMetrics::to_json() const {
  return nlohmann::json{
      {"cpu_percent", cpu_percent},
      {"memory_percent", memory_percent},
      {"disk_percent", disk_percent},
      {"cpu_count", cpu_count},
      {"memory_total", memory_total_gb},
      {"disk_total", disk_total_gb},
      {"platform", platform},
      {"runtime_version", runtime_version},
  };
}

std::string platform_name() {
  struct utsname uts;
  if (uname(&uts) != 0) {
    return "unknown";
  }
  std::string name = uts.sysname;
  std::transform(name.begin(), name.end(), name.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return name;
}

std::string runtime_version() {
#if defined(__clang__)
  return "clang " __clang_version__;
#elif defined(__GNUC__)
  return "gcc " __VERSION__;
#else
  return "c++ " + std::to_string(__cplusplus);
#endif
}

ProcfsMetricsCollector::ProcfsMetricsCollector(std::string proc_root, std::string disk_path,
                                               std::chrono::milliseconds cpu_interval,
                                               Logger* logger)
    : proc_root_(std::move(proc_root)), disk_path_(std::move(disk_path)),
      cpu_interval_(cpu_interval), logger_(logger) {}

CpuStats ProcfsMetricsCollector::read_cpu_stats() const {
  CpuStats stats;
  std::ifstream file(proc_root_ + "/stat");
  std::string line;
  while (std::getline(file, line)) {
    // Aggregate line is "cpu  ..."; per-core lines are "cpuN ...".
    if (line.rfind("cpu ", 0) == 0) {
      std::istringstream iss(line);
      std::string cpu;
      iss >> cpu >> stats.user >> stats.nice >> stats.system >> stats.idle >> stats.iowait >>
          stats.irq >> stats.softirq >> stats.steal;
      break;
    }
  }
  return stats;
}

int ProcfsMetricsCollector::read_cpu_count() const {
  std::ifstream file(proc_root_ + "/stat");
  std::string line;
  int count = 0;
  while (std::getline(file, line)) {
    if (line.size() > 3 && line.rfind("cpu", 0) == 0 &&
        std::isdigit(static_cast<unsigned char>(line[3]))) {
      ++count;
    }
  }
  return count > 0 ? count : 1;
}

MemStats ProcfsMetricsCollector::read_mem_stats() const {
  MemStats stats;
  std::ifstream file(proc_root_ + "/meminfo");
  std::string line;
  bool have_available = false;
  while (std::getline(file, line)) {
    std::istringstream iss(line);
    std::string key;
    uint64_t value = 0;
    if (!(iss >> key >> value)) {
      continue;
    }
    if (key == "MemTotal:") {
      stats.total = value;
    } else if (key == "MemFree:") {
      stats.free = value;
    } else if (key == "MemAvailable:") {
      stats.available = value;
      have_available = true;
    }
  }
  // Kernels before 3.14 have no MemAvailable.
  if (!have_available) {
    stats.available = stats.free;
  }
  return stats;
}

SystemMetrics ProcfsMetricsCollector::collect() {
  SystemMetrics metrics;
  metrics.platform = platform_name();
  metrics.runtime_version = runtime_version();

  CpuStats before = read_cpu_stats();
  if (cpu_interval_.count() > 0) {
    std::this_thread::sleep_for(cpu_interval_);
  }
  CpuStats after = read_cpu_stats();

  if (after.total() > before.total()) {
    uint64_t delta_total = after.total() - before.total();
    uint64_t delta_idle =
        after.idle_total() > before.idle_total() ? after.idle_total() - before.idle_total() : 0;
    delta_idle = std::min(delta_idle, delta_total);
    metrics.cpu_percent = round1(100.0 * static_cast<double>(delta_total - delta_idle) /
                                 static_cast<double>(delta_total));
  }
  metrics.cpu_count = read_cpu_count();

  MemStats mem = read_mem_stats();
  if (mem.total > 0) {
    uint64_t used = mem.total > mem.available ? mem.total - mem.available : 0;
    metrics.memory_percent =
        round1(100.0 * static_cast<double>(used) / static_cast<double>(mem.total));
    metrics.memory_total_gb = round1(static_cast<double>(mem.total) * 1024.0 / kGiB);
  } else if (logger_) {
    logger_->warn("no MemTotal in " + proc_root_ + "/meminfo");
  }

  struct statvfs vfs;
  if (statvfs(disk_path_.c_str(), &vfs) == 0) {
    double frsize = static_cast<double>(vfs.f_frsize);
    double total = static_cast<double>(vfs.f_blocks) * frsize;
    double used = static_cast<double>(vfs.f_blocks - vfs.f_bfree) * frsize;
    double avail = static_cast<double>(vfs.f_bavail) * frsize;
    if (used + avail > 0) {
      metrics.disk_percent = round1(100.0 * used / (used + avail));
    }
    metrics.disk_total_gb = round1(total / kGiB);
  } else if (logger_) {
    int err = errno;
    logger_->warn("statvfs(" + disk_path_ + ") failed: " + std::strerror(err));
  }

  return metrics;
}

SystemMetrics StubMetricsCollector::collect() {
  SystemMetrics metrics;
  metrics.platform = platform_name();
  metrics.runtime_version = runtime_version();
  return metrics;
}

std::unique_ptr<ISystemMetricsCollector> make_metrics_collector(const std::string& proc_root,
                                                                Logger* logger) {
  if (readable(proc_root + "/stat") && readable(proc_root + "/meminfo")) {
    return std::make_unique<ProcfsMetricsCollector>(proc_root, "/", std::chrono::milliseconds{100},
                                                    logger);
  }
  if (logger) {
    logger->info("system metrics backend unavailable, reporting placeholders");
  }
  return std::make_unique<StubMetricsCollector>();
}

} // namespace cloudlab
