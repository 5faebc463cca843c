#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "sandbox/process_env.hpp"

namespace evalbox::supervisor {

using CommandLine = std::vector<std::string>;

struct TaskStatus {
    int pid = -1;
    bool running = false;
    std::optional<int> return_code;
    bool has_stdout = false;
    bool has_stderr = false;
};

using TaskStatusMap = std::map<std::string, TaskStatus>;

// Named long-running child processes. A task is either running or exited(code), and its
// state is observed by polling.
class TaskSupervisor {
public:
    virtual ~TaskSupervisor() = default;

    // Starts the task now. Re-adding a name abandons the previous process without waiting.
    virtual void Add(const std::string& name,
                     const CommandLine& command,
                     const sandbox::EnvMap& env = {}) = 0;
    virtual TaskStatusMap Status() = 0;
    virtual bool IsRunning(const std::string& name) = 0;
    // SIGTERM (SIGKILL when forced), then SIGKILL after the grace window.
    virtual bool Stop(const std::string& name, bool force = false) = 0;
    // Attempts every task even when an earlier stop fails.
    virtual void StopAll(bool force = true) = 0;
    // Logs every output line of every task as "[name] line".
    virtual void Monitor() = 0;
    // Returns once no task is running or an interrupt arrives.
    virtual void RunUntilComplete() = 0;
    // Ends the current, or the next, RunUntilComplete. Each interrupt ends one run.
    virtual void Interrupt() = 0;
    virtual std::size_t Size() const = 0;
};

}  // namespace evalbox::supervisor
