#pragma once

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace cloudlab {

class Logger;

struct CpuStats {
  uint64_t user = 0;
  uint64_t nice = 0;
  uint64_t system = 0;
  uint64_t idle = 0;
  uint64_t iowait = 0;
  uint64_t irq = 0;
  uint64_t softirq = 0;
  uint64_t steal = 0;

  [[nodiscard]] uint64_t total() const {
    return user + nice + system + idle + iowait + irq + softirq + steal;
  }
  [[nodiscard]] uint64_t idle_total() const { return idle + iowait; }
};

// kB values as reported by /proc/meminfo
struct MemStats {
  uint64_t total = 0;
  uint64_t free = 0;
  uint64_t available = 0;
};

struct SystemMetrics {
  double cpu_percent = 0.0;
  double memory_percent = 0.0;
  double disk_percent = 0.0;
  int cpu_count = 1;
  double memory_total_gb = 0.0;
  double disk_total_gb = 0.0;
  std::string platform;
  std::string runtime_version;

  [[nodiscard]] nlohmann::json to_json() const;
};

class ISystemMetricsCollector {
public:
  virtual ~ISystemMetricsCollector() = default;

  // Best effort; never throws for a missing or partial backend.
  virtual SystemMetrics collect() = 0;
};

// Linux collector over procfs and statvfs.
class ProcfsMetricsCollector : public ISystemMetricsCollector {
public:
  explicit ProcfsMetricsCollector(std::string proc_root = "/proc", std::string disk_path = "/",
                                  std::chrono::milliseconds cpu_interval =
                                      std::chrono::milliseconds{100},
                                  Logger* logger = nullptr);

  SystemMetrics collect() override;

  CpuStats read_cpu_stats() const;
  int read_cpu_count() const;
  MemStats read_mem_stats() const;

private:
  std::string proc_root_;
  std::string disk_path_;
  std::chrono::milliseconds cpu_interval_;
  Logger* logger_;
};

// Placeholder values when no metrics backend is available.
class StubMetricsCollector : public ISystemMetricsCollector {
public:
  SystemMetrics collect() override;
};

// Capability check done once at startup: procfs collector when <proc_root>/stat and
// <proc_root>/meminfo are readable, stub collector otherwise.
std::unique_ptr<ISystemMetricsCollector>
make_metrics_collector(const std::string& proc_root = "/proc", Logger* logger = nullptr);

// Lower-case kernel name, e.g. "linux".
std::string platform_name();
std::string runtime_version();

} // namespace cloudlab
