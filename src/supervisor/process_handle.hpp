#pragma once

#include <chrono>
#include <functional>
#include <istream>
#include <memory>
#include <mutex>
#include <optional>

#include "sandbox/process_env.hpp"
#include "supervisor/task_supervisor.hpp"

namespace evalbox::supervisor {

class ProcessHandle {
public:
    virtual ~ProcessHandle() = default;

    virtual int Pid() const = 0;
    // Exit code once the process has exited.
    virtual std::optional<int> Poll() = 0;
    virtual std::optional<int> WaitFor(std::chrono::milliseconds timeout) = 0;
    virtual void Terminate() = 0;
    virtual void Kill() = 0;
    // Null when the stream is not piped.
    virtual std::shared_ptr<std::istream> Stdout() = 0;
    virtual std::shared_ptr<std::istream> Stderr() = 0;
};

using ProcessLauncher = std::function<std::unique_ptr<ProcessHandle>(const CommandLine&,
                                                                     const sandbox::EnvMap&)>;

// Child with piped stdout/stderr. Destroying the handle leaves the process running.
class BoostProcessHandle : public ProcessHandle {
public:
    BoostProcessHandle(const CommandLine& command, const sandbox::EnvMap& env);
    ~BoostProcessHandle() override;

    int Pid() const override { return pid_; }
    std::optional<int> Poll() override;
    std::optional<int> WaitFor(std::chrono::milliseconds timeout) override;
    void Terminate() override;
    void Kill() override;
    std::shared_ptr<std::istream> Stdout() override { return stdout_; }
    std::shared_ptr<std::istream> Stderr() override { return stderr_; }

private:
    void Signal(int signal);

    std::mutex mutex_;
    std::shared_ptr<bp::ipstream> stdout_;
    std::shared_ptr<bp::ipstream> stderr_;
    bp::child child_;
    int pid_ = -1;
    std::optional<int> exit_code_;
};

// Default launcher. Throws std::runtime_error when the executable cannot be found.
std::unique_ptr<ProcessHandle> LaunchBoostProcess(const CommandLine& command, const sandbox::EnvMap& env);

}  // namespace evalbox::supervisor
