#include "cloudlab/command_bridge.h"
#include "cloudlab/logger.h"

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <spawn.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

extern char** environ;

namespace cloudlab {

namespace {

class UniqueFd {
public:
  UniqueFd() = default;
  explicit UniqueFd(int fd) : fd_(fd) {}
  ~UniqueFd() { reset(); }

  UniqueFd(const UniqueFd&) = delete;
  UniqueFd& operator=(const UniqueFd&) = delete;

  int get() const { return fd_; }
  bool valid() const { return fd_ >= 0; }

  void reset(int fd = -1) {
    if (fd_ >= 0) {
      ::close(fd_);
    }
    fd_ = fd;
  }

private:
  int fd_ = -1;
};

// Owns a spawned child. Whatever path leaves run(), the child is killed and reaped. Only the
// direct child is signalled: services it started in the background keep running.
class ChildProcess {
public:
  explicit ChildProcess(pid_t pid) : pid_(pid) {}
  ~ChildProcess() {
    if (!reaped_) {
      terminate();
      int status = 0;
      wait_blocking(status);
    }
  }

  ChildProcess(const ChildProcess&) = delete;
  ChildProcess& operator=(const ChildProcess&) = delete;

  void terminate() {
    if (!reaped_) {
      ::kill(pid_, SIGKILL);
    }
  }

  // Returns true once the child has been reaped.
  bool try_wait(int& status) {
    if (reaped_) {
      status = status_;
      return true;
    }
    pid_t r = ::waitpid(pid_, &status_, WNOHANG);
    if (r == pid_ || (r < 0 && errno == ECHILD)) {
      reaped_ = true;
      status = status_;
      return true;
    }
    return false;
  }

  void wait_blocking(int& status) {
    while (!reaped_) {
      pid_t r = ::waitpid(pid_, &status_, 0);
      if (r == pid_ || (r < 0 && errno != EINTR)) {
        reaped_ = true;
      }
    }
    status = status_;
  }

private:
  pid_t pid_;
  bool reaped_ = false;
  int status_ = 0;
};

class SpawnAttributes {
public:
  SpawnAttributes() {
    posix_spawnattr_init(&attr_);
    posix_spawn_file_actions_init(&actions_);
  }
  ~SpawnAttributes() {
    posix_spawn_file_actions_destroy(&actions_);
    posix_spawnattr_destroy(&attr_);
  }
  SpawnAttributes(const SpawnAttributes&) = delete;
  SpawnAttributes& operator=(const SpawnAttributes&) = delete;

  posix_spawnattr_t* attr() { return &attr_; }
  posix_spawn_file_actions_t* actions() { return &actions_; }

private:
  posix_spawnattr_t attr_;
  posix_spawn_file_actions_t actions_;
};

int decode_exit_status(int status) {
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  if (WIFSIGNALED(status)) {
    return 128 + WTERMSIG(status);
  }
  return -1;
}

std::string describe_timeout(std::chrono::milliseconds timeout) {
  if (timeout.count() % 1000 == 0) {
    return "Command timed out after " + std::to_string(timeout.count() / 1000) + " seconds";
  }
  return "Command timed out after " + std::to_string(timeout.count()) + " ms";
}

// Appends whatever is readable. Returns false once the pipe reached EOF or failed.
bool drain(int fd, std::string& sink) {
  char buf[4096];
  while (true) {
    ssize_t n = ::read(fd, buf, sizeof(buf));
    if (n > 0) {
      size_t room = CommandBridge::kMaxCaptureBytes > sink.size()
                        ? CommandBridge::kMaxCaptureBytes - sink.size()
                        : 0;
      sink.append(buf, std::min(room, static_cast<size_t>(n)));
      continue;
    }
    if (n == 0) {
      return false;
    }
    if (errno == EINTR) {
      continue;
    }
    return errno == EAGAIN || errno == EWOULDBLOCK;
  }
}

} // namespace

CommandBridge::CommandBridge(std::string executable, Logger* logger)
    : executable_(std::move(executable)), logger_(logger) {}

std::string CommandBridge::display_command(const std::vector<std::string>& args) const {
  std::string cmd = executable_;
  for (const auto& arg : args) {
    cmd += " ";
    cmd += arg;
  }
  return cmd;
}

Result<CommandOutput> CommandBridge::run(const std::vector<std::string>& args,
                                         std::chrono::milliseconds timeout) const {
  if (logger_ && logger_->enabled(LogLevel::Debug)) {
    logger_->debug("running: " + display_command(args));
  }

  int out_pipe[2];
  int err_pipe[2];
  if (::pipe2(out_pipe, O_CLOEXEC) != 0) {
    return Result<CommandOutput>::error(ErrorCode::CommandFailed,
                                        std::string("pipe: ") + std::strerror(errno));
  }
  UniqueFd out_read(out_pipe[0]);
  UniqueFd out_write(out_pipe[1]);
  if (::pipe2(err_pipe, O_CLOEXEC) != 0) {
    return Result<CommandOutput>::error(ErrorCode::CommandFailed,
                                        std::string("pipe: ") + std::strerror(errno));
  }
  UniqueFd err_read(err_pipe[0]);
  UniqueFd err_write(err_pipe[1]);

  std::vector<char*> argv;
  argv.reserve(args.size() + 2);
  argv.push_back(const_cast<char*>(executable_.c_str()));
  for (const auto& arg : args) {
    argv.push_back(const_cast<char*>(arg.c_str()));
  }
  argv.push_back(nullptr);

  pid_t pid = -1;
  int spawn_ret = 0;
  {
    SpawnAttributes spawn;
    posix_spawn_file_actions_addopen(spawn.actions(), STDIN_FILENO, "/dev/null", O_RDONLY, 0);
    posix_spawn_file_actions_adddup2(spawn.actions(), out_write.get(), STDOUT_FILENO);
    posix_spawn_file_actions_adddup2(spawn.actions(), err_write.get(), STDERR_FILENO);

    sigset_t empty_mask;
    sigemptyset(&empty_mask);
    sigset_t default_signals;
    sigfillset(&default_signals);
    posix_spawnattr_setsigmask(spawn.attr(), &empty_mask);
    posix_spawnattr_setsigdefault(spawn.attr(), &default_signals);
    // Own process group: a terminal SIGINT to the daemon does not reach started services.
    posix_spawnattr_setpgroup(spawn.attr(), 0);
    posix_spawnattr_setflags(spawn.attr(),
                             POSIX_SPAWN_SETPGROUP | POSIX_SPAWN_SETSIGMASK | POSIX_SPAWN_SETSIGDEF);

    spawn_ret = ::posix_spawnp(&pid, executable_.c_str(), spawn.actions(), spawn.attr(),
                               argv.data(), environ);
  }

  if (spawn_ret != 0) {
    if (spawn_ret == ENOENT) {
      if (logger_) {
        logger_->warn(executable_ + " not found in PATH");
      }
      return Result<CommandOutput>::error(ErrorCode::CommandNotFound,
                                          executable_ + " command not found in PATH");
    }
    if (logger_) {
      logger_->warn("failed to start " + executable_ + ": " + std::strerror(spawn_ret));
    }
    return Result<CommandOutput>::error(ErrorCode::CommandFailed, std::strerror(spawn_ret));
  }

  ChildProcess child(pid);
  out_write.reset();
  err_write.reset();
  ::fcntl(out_read.get(), F_SETFL, ::fcntl(out_read.get(), F_GETFL, 0) | O_NONBLOCK);
  ::fcntl(err_read.get(), F_SETFL, ::fcntl(err_read.get(), F_GETFL, 0) | O_NONBLOCK);

  CommandOutput output;
  auto deadline = std::chrono::steady_clock::now() + timeout;
  auto remaining_ms = [&deadline]() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(deadline -
                                                                 std::chrono::steady_clock::now())
        .count();
  };
  auto timed_out = [&]() {
    child.terminate();
    if (logger_) {
      logger_->warn(display_command(args) + ": " + describe_timeout(timeout));
    }
    return Result<CommandOutput>::error(ErrorCode::CommandTimeout, describe_timeout(timeout));
  };

  while (out_read.valid() || err_read.valid()) {
    long long wait_ms = remaining_ms();
    if (wait_ms <= 0) {
      return timed_out();
    }

    struct pollfd fds[2];
    int nfds = 0;
    if (out_read.valid()) {
      fds[nfds++] = {out_read.get(), POLLIN, 0};
    }
    if (err_read.valid()) {
      fds[nfds++] = {err_read.get(), POLLIN, 0};
    }

    int ready = ::poll(fds, static_cast<nfds_t>(nfds), static_cast<int>(wait_ms));
    if (ready < 0) {
      if (errno == EINTR) {
        continue;
      }
      return Result<CommandOutput>::error(ErrorCode::CommandFailed,
                                          std::string("poll: ") + std::strerror(errno));
    }
    for (int i = 0; i < nfds; ++i) {
      if (fds[i].revents == 0) {
        continue;
      }
      if (fds[i].fd == out_read.get()) {
        if (!drain(out_read.get(), output.stdout_data)) {
          out_read.reset();
        }
      } else if (fds[i].fd == err_read.get()) {
        if (!drain(err_read.get(), output.stderr_data)) {
          err_read.reset();
        }
      }
    }
  }

  // Both streams closed; the child may still be running briefly.
  int status = 0;
  while (!child.try_wait(status)) {
    if (remaining_ms() <= 0) {
      return timed_out();
    }
    std::this_thread::sleep_for(std::chrono::milliseconds{5});
  }

  output.exit_code = decode_exit_status(status);
  if (logger_ && logger_->enabled(LogLevel::Debug)) {
    logger_->debug(display_command(args) + " exited with " + std::to_string(output.exit_code));
  }
  return Result<CommandOutput>::ok(std::move(output));
}

} // namespace cloudlab
