#include "cloudlab/port_probe.h"

#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace cloudlab {

namespace {

class SocketGuard {
public:
  explicit SocketGuard(int fd) : fd_(fd) {}
  ~SocketGuard() {
    if (fd_ >= 0) {
      ::close(fd_);
    }
  }
  SocketGuard(const SocketGuard&) = delete;
  SocketGuard& operator=(const SocketGuard&) = delete;

  int get() const { return fd_; }

private:
  int fd_;
};

} // namespace

PortLivenessProbe::PortLivenessProbe(std::chrono::milliseconds timeout) : timeout_(timeout) {}

bool PortLivenessProbe::is_port_open(int port) const {
  if (port <= 0 || port > 65535) {
    return false;
  }

  SocketGuard sock(::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC | SOCK_NONBLOCK, 0));
  if (sock.get() < 0) {
    return false;
  }

  struct sockaddr_in addr;
  memset(&addr, 0, sizeof(addr));
  addr.sin_family = AF_INET;
  addr.sin_port = htons(static_cast<uint16_t>(port));
  addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);

  if (::connect(sock.get(), reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) == 0) {
    return true;
  }
  if (errno != EINPROGRESS) {
    return false;
  }

  auto deadline = std::chrono::steady_clock::now() + timeout_;
  struct pollfd pfd = {sock.get(), POLLOUT, 0};
  while (true) {
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    if (remaining.count() <= 0) {
      return false;
    }
    int r = ::poll(&pfd, 1, static_cast<int>(remaining.count()));
    if (r < 0 && errno == EINTR) {
      continue;
    }
    if (r <= 0) {
      return false;
    }
    break;
  }

  int so_error = 0;
  socklen_t len = sizeof(so_error);
  if (::getsockopt(sock.get(), SOL_SOCKET, SO_ERROR, &so_error, &len) < 0) {
    return false;
  }
  return so_error == 0;
}

} // namespace cloudlab
