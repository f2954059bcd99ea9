#include "cloudlab/metrics.h"
#include "temp_dir.h"

#include <gtest/gtest.h>

namespace cloudlab {
namespace {

constexpr const char* kStat =
    "cpu  100 0 100 800 0 0 0 0 0 0\n"
    "cpu0 50 0 50 400 0 0 0 0 0 0\n"
    "cpu1 50 0 50 400 0 0 0 0 0 0\n"
    "intr 12345\n";

constexpr const char* kMeminfo =
    "MemTotal:        8388608 kB\n"
    "MemFree:         1048576 kB\n"
    "MemAvailable:    2097152 kB\n"
    "Buffers:          100000 kB\n";

class ProcfsMetricsTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_.write("stat", kStat);
        dir_.write("meminfo", kMeminfo);
    }

    ProcfsMetricsCollector collector(std::chrono::milliseconds interval = std::chrono::milliseconds{0}) {
        return ProcfsMetricsCollector(dir_.path().string(), "/", interval);
    }

    testing::TempDir dir_;
};

TEST_F(ProcfsMetricsTest, ReadCpuStats) {
    CpuStats stats = collector().read_cpu_stats();
    EXPECT_EQ(stats.user, 100u);
    EXPECT_EQ(stats.system, 100u);
    EXPECT_EQ(stats.idle, 800u);
    EXPECT_EQ(stats.total(), 1000u);
}

TEST_F(ProcfsMetricsTest, ReadCpuCount) {
    EXPECT_EQ(collector().read_cpu_count(), 2);
}

TEST_F(ProcfsMetricsTest, ReadMemStats) {
    MemStats mem = collector().read_mem_stats();
    EXPECT_EQ(mem.total, 8388608u);
    EXPECT_EQ(mem.free, 1048576u);
    EXPECT_EQ(mem.available, 2097152u);
}

TEST_F(ProcfsMetricsTest, MemAvailableFallsBackToFree) {
    dir_.write("meminfo", "MemTotal: 1000 kB\nMemFree: 250 kB\n");
    MemStats mem = collector().read_mem_stats();
    EXPECT_EQ(mem.available, 250u);
}

TEST_F(ProcfsMetricsTest, CollectFromFakeProc) {
    SystemMetrics m = collector().collect();
    EXPECT_DOUBLE_EQ(m.memory_percent, 75.0);
    EXPECT_DOUBLE_EQ(m.memory_total_gb, 8.0);
    EXPECT_EQ(m.cpu_count, 2);
    // Unchanged counters between samples: no CPU time elapsed.
    EXPECT_DOUBLE_EQ(m.cpu_percent, 0.0);
    EXPECT_GE(m.disk_percent, 0.0);
    EXPECT_LE(m.disk_percent, 100.0);
    EXPECT_GT(m.disk_total_gb, 0.0);
    EXPECT_FALSE(m.platform.empty());
    EXPECT_FALSE(m.runtime_version.empty());
}

TEST_F(ProcfsMetricsTest, JsonKeys) {
    nlohmann::json j = collector().collect().to_json();
    for (const char* key : {"cpu_percent", "memory_percent", "disk_percent", "cpu_count",
                            "memory_total", "disk_total", "platform", "runtime_version"}) {
        EXPECT_TRUE(j.contains(key)) << key;
    }
}

TEST(MetricsFactoryTest, StubWhenProcUnavailable) {
    testing::TempDir empty;
    auto collector = make_metrics_collector(empty.path().string());
    ASSERT_NE(collector, nullptr);
    EXPECT_NE(dynamic_cast<StubMetricsCollector*>(collector.get()), nullptr);

    SystemMetrics m = collector->collect();
    EXPECT_DOUBLE_EQ(m.cpu_percent, 0.0);
    EXPECT_DOUBLE_EQ(m.memory_percent, 0.0);
    EXPECT_EQ(m.cpu_count, 1);
}

TEST(MetricsFactoryTest, ProcfsWhenAvailable) {
    testing::TempDir proc;
    proc.write("stat", kStat);
    proc.write("meminfo", kMeminfo);
    auto collector = make_metrics_collector(proc.path().string());
    EXPECT_NE(dynamic_cast<ProcfsMetricsCollector*>(collector.get()), nullptr);
}

TEST(MetricsSamplerTest, LiveProcCpuInRange) {
    auto collector = make_metrics_collector();
    SystemMetrics m = collector->collect();
    EXPECT_GE(m.cpu_percent, 0.0);
    EXPECT_LE(m.cpu_percent, 100.0);
    EXPECT_GE(m.cpu_count, 1);
}

} // namespace
} // namespace cloudlab
