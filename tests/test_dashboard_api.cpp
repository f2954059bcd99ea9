#include "cloudlab/dashboard_api.h"
#include "cloudlab/http.h"
#include "http_client.h"
#include "temp_dir.h"

#include <csignal>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <thread>

#ifndef FAKE_CLOUDLAB_PATH
#error "FAKE_CLOUDLAB_PATH must point at the fake_cloudlab helper"
#endif

namespace cloudlab {
namespace {

class QuietMetrics : public ISystemMetricsCollector {
public:
    SystemMetrics collect() override {
        SystemMetrics m;
        m.platform = "linux";
        return m;
    }
};

class DashboardApiTest : public ::testing::Test {
protected:
    DashboardApiTest()
        : paths_(dir_.path()), config_store_(paths_.config_file().string()),
          process_probe_(paths_, checker_), port_probe_(std::chrono::milliseconds{200}),
          resolver_(process_probe_, port_probe_), commands_(FAKE_CLOUDLAB_PATH),
          environments_(paths_), log_reader_(paths_),
          status_(config_store_, resolver_, metrics_, commands_, environments_),
          api_(status_, log_reader_, environments_, commands_, paths_.dashboard_html()) {}

    void SetUp() override {
        api_.register_routes(server_);
        auto listening = server_.listen();
        ASSERT_TRUE(listening.ok()) << listening.error().message;
        server_thread_ = std::thread([this]() { (void)server_.serve_forever(&running_); });
    }

    void TearDown() override {
        running_ = 0;
        if (server_thread_.joinable()) {
            server_thread_.join();
        }
    }

    std::string get(const std::string& target) { return testing::http_get(server_.port(), target); }

    nlohmann::json get_json(const std::string& target) {
        return nlohmann::json::parse(testing::response_body(get(target)));
    }

    testing::TempDir dir_;
    Paths paths_;
    ConfigStore config_store_;
    KillSignalChecker checker_;
    ProcessLivenessProbe process_probe_;
    PortLivenessProbe port_probe_;
    ServiceStatusResolver resolver_;
    QuietMetrics metrics_;
    CommandBridge commands_;
    EnvironmentCatalog environments_;
    LogTailReader log_reader_;
    StatusAggregator status_;
    DashboardApi api_;
    HttpServer server_{"127.0.0.1", 0};
    volatile std::sig_atomic_t running_ = 1;
    std::thread server_thread_;
};

TEST_F(DashboardApiTest, Health) {
    std::string resp = get("/api/health");
    EXPECT_NE(resp.find("HTTP/1.1 200 OK"), std::string::npos);
    EXPECT_NE(resp.find("Access-Control-Allow-Origin: *"), std::string::npos);
    auto body = nlohmann::json::parse(testing::response_body(resp));
    EXPECT_EQ(body, (nlohmann::json{{"status", "ok"}, {"version", "1.2.0"}}));
}

TEST_F(DashboardApiTest, StatusReportsDashboardUp) {
    std::string resp = get("/api/status");
    EXPECT_NE(resp.find("HTTP/1.1 200 OK"), std::string::npos);
    auto body = nlohmann::json::parse(testing::response_body(resp));
    EXPECT_EQ(body["dashboard"], true);
    EXPECT_EQ(body["tunnel_jupyter"], false);
    EXPECT_EQ(body["config"], nlohmann::json::object());
    EXPECT_EQ(body["system"]["platform"], "linux");
    EXPECT_NE(body["kernels"].get<std::string>().find("python3"), std::string::npos);
}

TEST_F(DashboardApiTest, DashboardPage) {
    std::string resp = get("/");
    EXPECT_NE(resp.find("HTTP/1.1 404"), std::string::npos);
    EXPECT_EQ(nlohmann::json::parse(testing::response_body(resp))["error"],
              "Dashboard HTML not found");

    dir_.write("dashboard.html", "<html>cloudlab</html>");
    for (const char* target : {"/", "/index.html", "/dashboard.html"}) {
        resp = get(target);
        EXPECT_NE(resp.find("HTTP/1.1 200 OK"), std::string::npos) << target;
        EXPECT_NE(resp.find("Content-Type: text/html; charset=utf-8"), std::string::npos);
        EXPECT_EQ(testing::response_body(resp), "<html>cloudlab</html>");
    }
}

TEST_F(DashboardApiTest, LogsDefaultsAndClamp) {
    std::string lines;
    for (int i = 1; i <= 150; ++i) {
        lines += std::to_string(i) + "\n";
    }
    dir_.write("logs/jupyter.log", lines);

    auto body = get_json("/api/logs");
    EXPECT_EQ(body["service"], "jupyter");
    EXPECT_EQ(body["log"].get<std::string>().rfind("51\n", 0), 0u);

    body = get_json("/api/logs?service=jupyter&lines=2");
    EXPECT_EQ(body["log"], "149\n150\n");

    body = get_json("/api/logs?service=jupyter&lines=abc");
    EXPECT_EQ(body["log"].get<std::string>().rfind("51\n", 0), 0u);

    body = get_json("/api/logs?service=jupyter&lines=-5");
    EXPECT_EQ(body["log"], "150\n");

    body = get_json("/api/logs?service=&lines=");
    EXPECT_EQ(body["service"], "jupyter");
    EXPECT_EQ(body["log"].get<std::string>().rfind("51\n", 0), 0u);

    body = get_json("/api/logs?service=ssh");
    EXPECT_EQ(body["log"], "No logs available for ssh");
}

TEST_F(DashboardApiTest, KernelsAndEnvironments) {
    dir_.mkdir("venv");
    EXPECT_NE(get_json("/api/kernels")["kernels"].get<std::string>().find("python3"),
              std::string::npos);

    auto envs = get_json("/api/environments")["environments"];
    ASSERT_EQ(envs.size(), 1u);
    EXPECT_EQ(envs[0]["name"], "cloudlab");
    EXPECT_EQ(envs[0]["default"], true);
}

TEST_F(DashboardApiTest, CommandWithoutSegmentsIs400) {
    std::string resp = get("/api/command/");
    EXPECT_NE(resp.find("HTTP/1.1 400"), std::string::npos);
    EXPECT_EQ(nlohmann::json::parse(testing::response_body(resp))["error"],
              "No command specified");

    resp = get("/api/command//");
    EXPECT_NE(resp.find("HTTP/1.1 400"), std::string::npos);
}

TEST_F(DashboardApiTest, CommandRunsWithDecodedSegments) {
    auto body = get_json("/api/command/echo/hello%20world/");
    EXPECT_EQ(body["success"], true);
    EXPECT_EQ(body["stdout"], "hello world\n");
    EXPECT_EQ(body["stderr"], "");
    EXPECT_EQ(body["command"], std::string(FAKE_CLOUDLAB_PATH) + " echo hello world");
}

TEST_F(DashboardApiTest, CommandNonZeroExit) {
    auto body = get_json("/api/command/fail/2");
    EXPECT_EQ(body["success"], false);
    EXPECT_EQ(body["stderr"], "failing with 2\n");
}

// Serves `api` on its own ephemeral port for the lifetime of the object.
class ApiServer {
public:
    explicit ApiServer(DashboardApi& api) {
        api.register_routes(server_);
        auto listening = server_.listen();
        if (listening.ok()) {
            thread_ = std::thread([this]() { (void)server_.serve_forever(&running_); });
        }
    }
    ~ApiServer() {
        running_ = 0;
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    int port() const { return server_.port(); }

private:
    HttpServer server_{"127.0.0.1", 0};
    volatile std::sig_atomic_t running_ = 1;
    std::thread thread_;
};

TEST_F(DashboardApiTest, CommandNotInstalledReportsNotFound) {
    CommandBridge missing("cloudlab-definitely-not-installed");
    DashboardApi api(status_, log_reader_, environments_, missing, paths_.dashboard_html());
    ApiServer served(api);

    std::string resp = testing::http_get(served.port(), "/api/command/start/jupyter");
    EXPECT_NE(resp.find("HTTP/1.1 200 OK"), std::string::npos);
    auto body = nlohmann::json::parse(testing::response_body(resp));
    EXPECT_EQ(body["success"], false);
    EXPECT_EQ(body["reason"], "not_found");
    EXPECT_EQ(body["error"], "cloudlab-definitely-not-installed command not found in PATH");
    EXPECT_FALSE(body.contains("stdout"));
}

TEST_F(DashboardApiTest, CommandTimeoutReportsTimeout) {
    DashboardApi api(status_, log_reader_, environments_, commands_, paths_.dashboard_html());
    api.set_command_timeout(std::chrono::seconds{1});
    ApiServer served(api);

    std::string resp = testing::http_get(served.port(), "/api/command/sleep/30");
    EXPECT_NE(resp.find("HTTP/1.1 200 OK"), std::string::npos);
    auto body = nlohmann::json::parse(testing::response_body(resp));
    EXPECT_EQ(body["success"], false);
    EXPECT_EQ(body["reason"], "timeout");
    EXPECT_EQ(body["error"], "Command timed out after 1 seconds");
}

TEST_F(DashboardApiTest, UnknownPathAndMethod) {
    std::string resp = get("/api/unknown");
    EXPECT_NE(resp.find("HTTP/1.1 404"), std::string::npos);
    EXPECT_EQ(nlohmann::json::parse(testing::response_body(resp))["path"], "/api/unknown");

    resp = testing::send_raw(server_.port(), "DELETE /api/status HTTP/1.1\r\n\r\n");
    EXPECT_NE(resp.find("HTTP/1.1 405"), std::string::npos);

    resp = testing::send_raw(server_.port(), "OPTIONS /api/status HTTP/1.1\r\n\r\n");
    EXPECT_NE(resp.find("HTTP/1.1 200 OK"), std::string::npos);
    EXPECT_NE(resp.find("Content-Length: 0"), std::string::npos);
}

TEST(DashboardApiHelpersTest, ParseLineCount) {
    EXPECT_EQ(DashboardApi::parse_line_count(""), 100);
    EXPECT_EQ(DashboardApi::parse_line_count("abc"), 100);
    EXPECT_EQ(DashboardApi::parse_line_count("12abc"), 100);
    EXPECT_EQ(DashboardApi::parse_line_count("25"), 25);
    EXPECT_EQ(DashboardApi::parse_line_count("0"), 1);
    EXPECT_EQ(DashboardApi::parse_line_count("-3"), 1);
    EXPECT_EQ(DashboardApi::parse_line_count("50000"), 10000);
    EXPECT_EQ(DashboardApi::parse_line_count("99999999999999999999999"), 10000);
}

TEST(DashboardApiHelpersTest, CommandArguments) {
    using Args = std::vector<std::string>;
    EXPECT_EQ(DashboardApi::command_arguments("/api/command/"), Args{});
    EXPECT_EQ(DashboardApi::command_arguments("/api/command/start/jupyter"),
              (Args{"start", "jupyter"}));
    EXPECT_EQ(DashboardApi::command_arguments("/api/command//kernel//list/"),
              (Args{"kernel", "list"}));
    EXPECT_EQ(DashboardApi::command_arguments("/api/command/env/create/my%2Fenv"),
              (Args{"env", "create", "my/env"}));
    EXPECT_EQ(DashboardApi::command_arguments("/api/other"), Args{});
}

} // namespace
} // namespace cloudlab
