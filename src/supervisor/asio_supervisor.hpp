#pragma once

#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <optional>

#include <boost/asio.hpp>

#include "supervisor/task_supervisor.hpp"
#include "utils/logging.hpp"

namespace evalbox::supervisor {

// Single-threaded variant: every child, pipe reader and timer runs on one io_context that
// is only driven from the calling thread. Interrupt() may be called from any thread.
class AsioTaskSupervisor : public TaskSupervisor {
public:
    explicit AsioTaskSupervisor(std::shared_ptr<utils::Logger> logger = nullptr,
                                std::chrono::milliseconds grace = std::chrono::seconds(5),
                                std::chrono::milliseconds tick = std::chrono::seconds(1));
    ~AsioTaskSupervisor() override;

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
    std::size_t Size() const override { return tasks_.size(); }

private:
    struct Task {
        std::string name;
        int pid = -1;
        std::optional<int> exit_code;
        bool monitored = false;
        std::unique_ptr<bp::async_pipe> out;
        std::unique_ptr<bp::async_pipe> err;
        boost::asio::streambuf out_buffer;
        boost::asio::streambuf err_buffer;
        std::unique_ptr<bp::child> child;
    };

    void Pump();
    bool AnyRunning() const;
    bool Interrupted() const;
    // Drives the loop until the task exits or the grace window passes.
    bool WaitForExit(const std::shared_ptr<Task>& task);
    void ReadLines(std::shared_ptr<Task> task, bp::async_pipe& pipe, boost::asio::streambuf& buffer);
    static void Abandon(Task& task);

    std::shared_ptr<utils::Logger> logger_;
    std::chrono::milliseconds grace_;
    std::chrono::milliseconds tick_;
    std::atomic<bool> interrupted_{false};
    boost::asio::io_context io_;
    std::map<std::string, std::shared_ptr<Task>> tasks_;
};

}  // namespace evalbox::supervisor
