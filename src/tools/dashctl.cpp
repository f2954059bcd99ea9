#include "cloudlab/config.h"

#include <nlohmann/json.hpp>

#include <arpa/inet.h>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <netdb.h>
#include <string>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>
#include <vector>

namespace {

// Long enough for a management command that runs into its own 120 s limit.
constexpr int kTimeoutSeconds = 130;

std::string percent_encode(const std::string& in) {
    static const char* hex = "0123456789ABCDEF";
    std::string out;
    for (unsigned char c : in) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(hex[c >> 4]);
            out.push_back(hex[c & 0x0F]);
        }
    }
    return out;
}

class DashClient {
private:
    std::string host_;
    std::string port_;

public:
    DashClient(std::string host, std::string port) : host_(std::move(host)), port_(std::move(port)) {}

    // Returns the HTTP status code, or -1 when no response could be obtained.
    int get(const std::string& target, std::string& body) {
        struct addrinfo hints;
        memset(&hints, 0, sizeof(hints));
        hints.ai_family = AF_INET;
        hints.ai_socktype = SOCK_STREAM;
        struct addrinfo* res = nullptr;
        int gai = getaddrinfo(host_.c_str(), port_.c_str(), &hints, &res);
        if (gai != 0) {
            std::cerr << "Cannot resolve " << host_ << ": " << gai_strerror(gai) << "\n";
            return -1;
        }

        int fd = socket(res->ai_family, res->ai_socktype, res->ai_protocol);
        if (fd < 0) {
            std::cerr << "Failed to create socket: " << strerror(errno) << "\n";
            freeaddrinfo(res);
            return -1;
        }

        struct timeval tv;
        tv.tv_sec = kTimeoutSeconds;
        tv.tv_usec = 0;
        setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
        setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));

        if (connect(fd, res->ai_addr, res->ai_addrlen) < 0) {
            std::cerr << "Failed to connect to dashboard at " << host_ << ":" << port_ << "\n";
            close(fd);
            freeaddrinfo(res);
            return -1;
        }
        freeaddrinfo(res);

        std::string request = "GET " + target + " HTTP/1.1\r\nHost: " + host_ +
                              "\r\nConnection: close\r\n\r\n";
        if (send(fd, request.c_str(), request.size(), MSG_NOSIGNAL) < 0) {
            std::cerr << "Failed to send request\n";
            close(fd);
            return -1;
        }

        std::string response;
        char buffer[4096];
        ssize_t n;
        while ((n = recv(fd, buffer, sizeof(buffer), 0)) > 0) {
            response.append(buffer, static_cast<size_t>(n));
        }
        close(fd);

        size_t header_end = response.find("\r\n\r\n");
        size_t sp = response.find(' ');
        if (header_end == std::string::npos || sp == std::string::npos || sp > header_end) {
            std::cerr << "Malformed response from dashboard\n";
            return -1;
        }
        body = response.substr(header_end + 4);
        return std::atoi(response.c_str() + sp + 1);
    }
};

void usage(const char* argv0) {
    std::cout << "Usage: " << argv0 << " [--host <h>] [--port <p>] <command>\n";
    std::cout << "Commands:\n";
    std::cout << "  health               Dashboard health\n";
    std::cout << "  status               Full service status\n";
    std::cout << "  kernels              Registered kernels\n";
    std::cout << "  envs                 Python environments\n";
    std::cout << "  logs <svc> [n]       Last n lines of a service log\n";
    std::cout << "  run <args...>        Run a cloudlab management command\n";
}

} // namespace

int main(int argc, char* argv[]) {
    std::string host = "127.0.0.1";
    std::string port = "3000";

    const char* env_port = getenv("CLOUDLAB_PORT");
    if (env_port && env_port[0]) {
        port = env_port;
    }

    std::vector<std::string> words;
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (words.empty() && arg == "--host" && i + 1 < argc) {
            host = argv[++i];
        } else if (words.empty() && arg == "--port" && i + 1 < argc) {
            port = argv[++i];
        } else if (words.empty() && (arg == "--help" || arg == "-h")) {
            usage(argv[0]);
            return 0;
        } else {
            words.push_back(arg);
        }
    }

    uint16_t port_number = 0;
    if (!cloudlab::parse_port(port, port_number)) {
        std::cerr << "Invalid port: " << port << "\n";
        return 2;
    }
    if (words.empty()) {
        usage(argv[0]);
        return 2;
    }

    const std::string& command = words[0];
    std::string target;
    if (command == "health") {
        target = "/api/health";
    } else if (command == "status") {
        target = "/api/status";
    } else if (command == "kernels") {
        target = "/api/kernels";
    } else if (command == "envs") {
        target = "/api/environments";
    } else if (command == "logs" && words.size() >= 2) {
        target = "/api/logs?service=" + percent_encode(words[1]);
        if (words.size() >= 3) {
            target += "&lines=" + percent_encode(words[2]);
        }
    } else if (command == "run" && words.size() >= 2) {
        target = "/api/command";
        for (size_t i = 1; i < words.size(); ++i) {
            target += "/" + percent_encode(words[i]);
        }
    } else {
        usage(argv[0]);
        return 2;
    }

    DashClient client(host, std::to_string(port_number));
    std::string body;
    int status = client.get(target, body);
    if (status < 0) {
        return 1;
    }

    auto json = nlohmann::json::parse(body, nullptr, false);
    if (json.is_discarded()) {
        std::cout << body << "\n";
    } else {
        std::cout << json.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << "\n";
    }
    return status == 200 ? 0 : 1;
}
