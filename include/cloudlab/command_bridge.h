#pragma once

#include "cloudlab/result.h"

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

namespace cloudlab {

class Logger;

struct CommandOutput {
    int exit_code = -1;  // 128 + signal when the child was killed by a signal
    std::string stdout_data;
    std::string stderr_data;

    [[nodiscard]] bool exited_zero() const noexcept { return exit_code == 0; }
};

// Runs the management executable with caller-supplied arguments.
// Each call spawns and owns one child; calls may run concurrently.
class CommandBridge {
public:
    static constexpr std::chrono::seconds kDefaultTimeout{120};
    static constexpr size_t kMaxCaptureBytes = 8 * 1024 * 1024;

    explicit CommandBridge(std::string executable = "cloudlab", Logger* logger = nullptr);

    // Errors: CommandTimeout, CommandNotFound, CommandFailed.
    Result<CommandOutput> run(const std::vector<std::string>& args,
                              std::chrono::milliseconds timeout = kDefaultTimeout) const;

    [[nodiscard]] const std::string& executable() const noexcept { return executable_; }

    // "<executable> arg1 arg2", as shown to dashboard users.
    [[nodiscard]] std::string display_command(const std::vector<std::string>& args) const;

private:
    std::string executable_;
    Logger* logger_;
};

} // namespace cloudlab
