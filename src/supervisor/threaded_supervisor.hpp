#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>

#include "supervisor/process_handle.hpp"
#include "supervisor/task_supervisor.hpp"
#include "utils/logging.hpp"

namespace evalbox::supervisor {

// One mutex guards the task map; output readers are detached threads.
class ThreadedTaskSupervisor : public TaskSupervisor {
public:
    explicit ThreadedTaskSupervisor(std::shared_ptr<utils::Logger> logger = nullptr,
                                    ProcessLauncher launcher = LaunchBoostProcess,
                                    std::chrono::milliseconds grace = std::chrono::seconds(5),
                                    std::chrono::milliseconds poll_interval = std::chrono::seconds(1));

    void Add(const std::string& name,
             const CommandLine& command,
             const sandbox::EnvMap& env = {}) override;
    TaskStatusMap Status() override;
    bool IsRunning(const std::string& name) override;
    bool Stop(const std::string& name, bool force = false) override;
    void StopAll(bool force = true) override;
    void Monitor() override;
    void RunUntilComplete() override;
    void Interrupt() override;
    std::size_t Size() const override;

private:
    struct Task {
        std::shared_ptr<ProcessHandle> handle;
        bool monitored = false;
    };

    bool AnyRunning();
    bool Interrupted() const;
    void StartReader(const std::string& name, std::shared_ptr<std::istream> stream);

    std::shared_ptr<utils::Logger> logger_;
    ProcessLauncher launcher_;
    std::chrono::milliseconds grace_;
    std::chrono::milliseconds poll_interval_;

    mutable std::mutex mutex_;
    std::condition_variable wake_;
    std::map<std::string, Task> tasks_;
    std::atomic<bool> interrupted_{false};
};

}  // namespace evalbox::supervisor
