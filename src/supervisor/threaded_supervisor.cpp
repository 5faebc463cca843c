#include "supervisor/threaded_supervisor.hpp"

#include <thread>
#include <vector>

#include "utils/common.hpp"
#include "utils/signals.hpp"

namespace evalbox::supervisor {

ThreadedTaskSupervisor::ThreadedTaskSupervisor(std::shared_ptr<utils::Logger> logger,
                                               ProcessLauncher launcher,
                                               std::chrono::milliseconds grace,
                                               std::chrono::milliseconds poll_interval)
    : logger_(logger ? std::move(logger) : utils::MakeStderrLogger())
    , launcher_(std::move(launcher))
    , grace_(grace)
    , poll_interval_(poll_interval) {}

void ThreadedTaskSupervisor::Add(const std::string& name,
                                 const CommandLine& command,
                                 const sandbox::EnvMap& env) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (tasks_.count(name)) {
        logger_->Warn("[supervisor] Task " + name + " already exists, will replace");
    }
    logger_->Info("[supervisor] Starting task: " + name + " - " + utils::Join(command, " "));
    Task task;
    task.handle = std::shared_ptr<ProcessHandle>(launcher_(command, env));
    tasks_[name] = std::move(task);
}

TaskStatusMap ThreadedTaskSupervisor::Status() {
    std::lock_guard<std::mutex> lock(mutex_);
    TaskStatusMap status;
    for (const auto& [name, task] : tasks_) {
        TaskStatus entry;
        entry.pid = task.handle->Pid();
        entry.return_code = task.handle->Poll();
        entry.running = !entry.return_code.has_value();
        entry.has_stdout = task.handle->Stdout() != nullptr;
        entry.has_stderr = task.handle->Stderr() != nullptr;
        status[name] = entry;
    }
    return status;
}

bool ThreadedTaskSupervisor::IsRunning(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = tasks_.find(name);
    if (it == tasks_.end()) {
        return false;
    }
    return !it->second.handle->Poll().has_value();
}

bool ThreadedTaskSupervisor::Stop(const std::string& name, bool force) {
    std::shared_ptr<ProcessHandle> handle;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = tasks_.find(name);
        if (it == tasks_.end()) {
            logger_->Warn("[supervisor] Task " + name + " does not exist");
            return false;
        }
        handle = it->second.handle;
    }

    try {
        if (handle->Poll()) {
            logger_->Info("[supervisor] Task " + name + " already stopped");
            return true;
        }
        if (force) {
            handle->Kill();
        } else {
            handle->Terminate();
        }
        if (!handle->WaitFor(grace_)) {
            logger_->Warn("[supervisor] Task " + name + " ignored the stop request, killing");
            handle->Kill();
            if (!handle->WaitFor(grace_)) {
                logger_->Error("[supervisor] Task " + name + " is still running after kill");
                return false;
            }
        }
        logger_->Info("[supervisor] Task " + name + " stopped");
        return true;
    } catch (const std::exception& ex) {
        logger_->Error("[supervisor] Failed to stop task " + name + ": " + ex.what());
        return false;
    }
}

void ThreadedTaskSupervisor::StopAll(bool force) {
    logger_->Info("[supervisor] Stopping all tasks...");
    std::vector<std::string> names;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& entry : tasks_) {
            names.push_back(entry.first);
        }
    }
    for (const auto& name : names) {
        Stop(name, force);
    }
}

void ThreadedTaskSupervisor::StartReader(const std::string& name, std::shared_ptr<std::istream> stream) {
    if (!stream) {
        return;
    }
    auto logger = logger_;
    std::thread([logger, name, stream]() {
        try {
            std::string line;
            while (std::getline(*stream, line)) {
                if (!line.empty()) {
                    logger->Info("[" + name + "] " + utils::Trim(line));
                }
            }
        } catch (const std::exception& ex) {
            logger->Warn("[supervisor] Reader for " + name + " stopped: " + ex.what());
        }
    }).detach();
}

void ThreadedTaskSupervisor::Monitor() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [name, task] : tasks_) {
        if (task.monitored) {
            continue;
        }
        task.monitored = true;
        StartReader(name, task.handle->Stdout());
        StartReader(name, task.handle->Stderr());
    }
}

bool ThreadedTaskSupervisor::AnyRunning() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& entry : tasks_) {
        if (!entry.second.handle->Poll().has_value()) {
            return true;
        }
    }
    return false;
}

bool ThreadedTaskSupervisor::Interrupted() const {
    return interrupted_ || utils::ShutdownRequested();
}

void ThreadedTaskSupervisor::RunUntilComplete() {
    if (Size() == 0) {
        logger_->Warn("[supervisor] No tasks to start");
        return;
    }
    logger_->Info("[supervisor] Starting task supervisor...");
    Monitor();

    while (!Interrupted() && AnyRunning()) {
        std::unique_lock<std::mutex> lock(mutex_);
        wake_.wait_for(lock, poll_interval_, [this]() { return interrupted_.load(); });
    }
    if (Interrupted()) {
        logger_->Info("[supervisor] Received interrupt signal");
    }
    // An interrupt ends one run only.
    interrupted_ = false;
}

void ThreadedTaskSupervisor::Interrupt() {
    interrupted_ = true;
    wake_.notify_all();
}

std::size_t ThreadedTaskSupervisor::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size();
}

}  // namespace evalbox::supervisor
