#pragma once

#include "cloudlab/paths.h"

#include <optional>
#include <string_view>
#include <sys/types.h>

namespace cloudlab {

enum class ProcessExistence {
    Alive,
    NoPermission,  // exists, owned by another user
    NotFound
};

// Interface for probing whether a pid refers to a live process (injected for testability)
class IProcessExistenceChecker {
public:
    virtual ~IProcessExistenceChecker() = default;

    // Must never deliver a real signal to the target.
    virtual ProcessExistence exists(pid_t pid) = 0;
};

// POSIX implementation: kill(pid, 0)
class KillSignalChecker : public IProcessExistenceChecker {
public:
    ProcessExistence exists(pid_t pid) override;
};

// Reads <root>/pids/<service>.pid and checks the recorded process.
class ProcessLivenessProbe {
public:
    ProcessLivenessProbe(const Paths& paths, IProcessExistenceChecker& checker);

    bool is_process_alive(std::string_view service);

    // Parsed marker content, or nullopt when missing, unreadable or not a positive integer.
    std::optional<pid_t> read_pid(std::string_view service) const;

private:
    const Paths& paths_;
    IProcessExistenceChecker& checker_;
};

} // namespace cloudlab
