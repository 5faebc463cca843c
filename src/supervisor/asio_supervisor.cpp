#include "supervisor/asio_supervisor.hpp"

#include <csignal>
#include <functional>
#include <istream>
#include <stdexcept>
#include <vector>
#include <signal.h>

#include "utils/common.hpp"
#include "utils/signals.hpp"

namespace evalbox::supervisor {

AsioTaskSupervisor::AsioTaskSupervisor(std::shared_ptr<utils::Logger> logger,
                                       std::chrono::milliseconds grace,
                                       std::chrono::milliseconds tick)
    : logger_(logger ? std::move(logger) : utils::MakeStderrLogger())
    , grace_(grace)
    , tick_(tick) {}

AsioTaskSupervisor::~AsioTaskSupervisor() {
    for (auto& entry : tasks_) {
        Abandon(*entry.second);
    }
    // Aborted reads still hold their task; let them finish before the pipes go away.
    io_.restart();
    io_.poll();
    tasks_.clear();
}

void AsioTaskSupervisor::Abandon(Task& task) {
    boost::system::error_code ec;
    if (task.out) {
        task.out->close(ec);
    }
    if (task.err) {
        task.err->close(ec);
    }
    if (task.child && task.child->valid()) {
        task.child->detach();
    }
}

void AsioTaskSupervisor::Pump() {
    io_.restart();
    io_.poll();
}

void AsioTaskSupervisor::Add(const std::string& name,
                             const CommandLine& command,
                             const sandbox::EnvMap& env) {
    if (command.empty()) {
        throw std::runtime_error("empty command for task " + name);
    }
    const auto merged = sandbox::BuildEnvironment({&env}, false);
    const auto path = merged.find("PATH");
    const auto exe = sandbox::FindExecutable(
        command.front(), path == merged.end() ? sandbox::kSecurePath : path->second);
    if (exe.empty()) {
        throw std::runtime_error("executable not found: " + command.front());
    }

    const auto existing = tasks_.find(name);
    if (existing != tasks_.end()) {
        logger_->Warn("[supervisor] Task " + name + " already exists, will replace");
        Abandon(*existing->second);
        tasks_.erase(existing);
    }
    logger_->Info("[supervisor] Starting asynchronous task: " + name + " - " + utils::Join(command, " "));

    auto task = std::make_shared<Task>();
    task->name = name;
    task->out = std::make_unique<bp::async_pipe>(io_);
    task->err = std::make_unique<bp::async_pipe>(io_);
    std::weak_ptr<Task> weak = task;
    auto logger = logger_;
    const std::vector<std::string> args(command.begin() + 1, command.end());
    task->child = std::make_unique<bp::child>(
        bp::exe = exe,
        bp::args = args,
        sandbox::ToBoostEnvironment(merged),
        bp::std_out > *task->out,
        bp::std_err > *task->err,
        bp::std_in < bp::null,
        bp::extend::on_exec_setup = sandbox::NewProcessGroup{},
        io_,
        bp::on_exit = [weak, logger](int exit_code, const std::error_code& ec) {
            const auto owner = weak.lock();
            if (!owner) {
                return;
            }
            owner->exit_code = exit_code;
            if (ec) {
                logger->Warn("[supervisor] Exit notification for " + owner->name + ": " + ec.message());
            }
        });
    task->pid = task->child->id();
    tasks_[name] = std::move(task);
}

TaskStatusMap AsioTaskSupervisor::Status() {
    Pump();
    TaskStatusMap status;
    for (const auto& [name, task] : tasks_) {
        TaskStatus entry;
        entry.pid = task->pid;
        entry.return_code = task->exit_code;
        entry.running = !task->exit_code.has_value();
        entry.has_stdout = task->out != nullptr;
        entry.has_stderr = task->err != nullptr;
        status[name] = entry;
    }
    return status;
}

bool AsioTaskSupervisor::IsRunning(const std::string& name) {
    Pump();
    const auto it = tasks_.find(name);
    return it != tasks_.end() && !it->second->exit_code.has_value();
}

bool AsioTaskSupervisor::WaitForExit(const std::shared_ptr<Task>& task) {
    auto expired = std::make_shared<bool>(false);
    boost::asio::steady_timer timer(io_, grace_);
    timer.async_wait([expired](const boost::system::error_code& ec) {
        if (!ec) {
            *expired = true;
        }
    });
    io_.restart();
    while (!task->exit_code && !*expired) {
        if (io_.run_one() == 0) {
            break;
        }
    }
    timer.cancel();
    io_.poll();
    return task->exit_code.has_value();
}

bool AsioTaskSupervisor::Stop(const std::string& name, bool force) {
    Pump();
    const auto it = tasks_.find(name);
    if (it == tasks_.end()) {
        logger_->Warn("[supervisor] Task " + name + " does not exist");
        return false;
    }
    const auto task = it->second;
    if (task->exit_code) {
        logger_->Info("[supervisor] Task " + name + " already stopped");
        return true;
    }
    try {
        logger_->Info("[supervisor] Stopping asynchronous task: " + name);
        sandbox::SignalProcessTree(task->pid, force ? SIGKILL : SIGTERM);
        if (!WaitForExit(task)) {
            logger_->Warn("[supervisor] Task " + name + " ignored the stop request, killing");
            sandbox::SignalProcessTree(task->pid, SIGKILL);
            if (!WaitForExit(task)) {
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

void AsioTaskSupervisor::StopAll(bool force) {
    logger_->Info("[supervisor] Stopping all asynchronous tasks...");
    std::vector<std::string> names;
    for (const auto& entry : tasks_) {
        names.push_back(entry.first);
    }
    for (const auto& name : names) {
        Stop(name, force);
    }
}

void AsioTaskSupervisor::ReadLines(std::shared_ptr<Task> task,
                                   bp::async_pipe& pipe,
                                   boost::asio::streambuf& buffer) {
    auto logger = logger_;
    boost::asio::async_read_until(pipe, buffer, '\n',
        [this, task, &pipe, &buffer, logger](const boost::system::error_code& ec, std::size_t) {
            std::istream stream(&buffer);
            std::string line;
            if (ec) {
                // Flush a trailing line without a newline.
                if (std::getline(stream, line) && !utils::Trim(line).empty()) {
                    logger->Info("[" + task->name + "] " + utils::Trim(line));
                }
                return;
            }
            std::getline(stream, line);
            if (!utils::Trim(line).empty()) {
                logger->Info("[" + task->name + "] " + utils::Trim(line));
            }
            ReadLines(task, pipe, buffer);
        });
}

void AsioTaskSupervisor::Monitor() {
    for (auto& entry : tasks_) {
        auto& task = entry.second;
        if (task->monitored) {
            continue;
        }
        task->monitored = true;
        ReadLines(task, *task->out, task->out_buffer);
        ReadLines(task, *task->err, task->err_buffer);
    }
}

bool AsioTaskSupervisor::AnyRunning() const {
    for (const auto& entry : tasks_) {
        if (!entry.second->exit_code) {
            return true;
        }
    }
    return false;
}

bool AsioTaskSupervisor::Interrupted() const {
    return interrupted_ || utils::ShutdownRequested();
}

void AsioTaskSupervisor::RunUntilComplete() {
    if (tasks_.empty()) {
        logger_->Warn("[supervisor] No asynchronous tasks to start");
        return;
    }
    logger_->Info("[supervisor] Starting asynchronous task supervisor...");
    Monitor();

    // A destroyed signal_set leaves SIG_DFL behind; the caller's handlers are restored after.
    struct sigaction previous_int {};
    struct sigaction previous_term {};
    ::sigaction(SIGINT, nullptr, &previous_int);
    ::sigaction(SIGTERM, nullptr, &previous_term);
    {
        boost::asio::signal_set signals(io_, SIGINT, SIGTERM);
        signals.async_wait([this](const boost::system::error_code& ec, int signal_number) {
            if (!ec) {
                logger_->Info("[supervisor] Received signal " + std::to_string(signal_number) +
                              ", gracefully shutting down...");
                interrupted_ = true;
            }
        });

        auto done = std::make_shared<bool>(false);
        boost::asio::steady_timer ticker(io_);
        std::function<void(const boost::system::error_code&)> on_tick;
        on_tick = [this, done, &ticker, &signals, &on_tick](const boost::system::error_code& ec) {
            if (ec) {
                return;
            }
            if (Interrupted() || !AnyRunning()) {
                *done = true;
                boost::system::error_code ignored;
                signals.cancel(ignored);
                return;
            }
            ticker.expires_after(tick_);
            ticker.async_wait(on_tick);
        };
        ticker.expires_after(std::chrono::milliseconds(0));
        ticker.async_wait(on_tick);

        io_.restart();
        while (!*done) {
            if (io_.run_one() == 0) {
                break;
            }
        }
        boost::system::error_code ignored;
        ticker.cancel();
        signals.cancel(ignored);
        io_.poll();
    }
    ::sigaction(SIGINT, &previous_int, nullptr);
    ::sigaction(SIGTERM, &previous_term, nullptr);

    if (Interrupted()) {
        logger_->Info("[supervisor] Received interrupt signal");
        StopAll(true);
    }
    // An interrupt ends one run only.
    interrupted_ = false;
}

void AsioTaskSupervisor::Interrupt() {
    interrupted_ = true;
    boost::asio::post(io_, []() {});
}

}  // namespace evalbox::supervisor
