#include "supervisor/devtools_manager.hpp"

#include <filesystem>

#include "supervisor/asio_supervisor.hpp"
#include "supervisor/threaded_supervisor.hpp"
#include "utils/signals.hpp"

namespace evalbox::supervisor {
namespace {

constexpr const char* kServerTask = "mcp_server";
constexpr const char* kInspectorTask = "inspector";

}  // namespace

const char* ToString(SupervisorBackend backend) {
    switch (backend) {
        case SupervisorBackend::kThreads: return "threads";
        case SupervisorBackend::kCooperative: return "cooperative";
    }
    return "unknown";
}

std::unique_ptr<TaskSupervisor> MakeSupervisor(SupervisorBackend backend,
                                               std::shared_ptr<utils::Logger> logger,
                                               std::chrono::milliseconds grace) {
    if (backend == SupervisorBackend::kCooperative) {
        return std::make_unique<AsioTaskSupervisor>(std::move(logger), grace);
    }
    return std::make_unique<ThreadedTaskSupervisor>(std::move(logger), LaunchBoostProcess, grace);
}

DevToolsManager::DevToolsManager(config::DevToolsConfig config,
                                 std::shared_ptr<utils::Logger> logger,
                                 SupervisorBackend backend)
    : config_(std::move(config))
    , logger_(logger ? std::move(logger) : utils::MakeStderrLogger())
    , supervisor_(MakeSupervisor(backend, logger_, std::chrono::seconds(config_.stop_grace_s))) {}

DevToolsManager::DevToolsManager(config::DevToolsConfig config,
                                 std::shared_ptr<utils::Logger> logger,
                                 std::unique_ptr<TaskSupervisor> supervisor)
    : config_(std::move(config))
    , logger_(logger ? std::move(logger) : utils::MakeStderrLogger())
    , supervisor_(std::move(supervisor)) {}

CommandLine DevToolsManager::ServerCommand(const std::string& work_dir) const {
    std::error_code ec;
    auto dir = work_dir;
    if (dir.empty() || !std::filesystem::exists(dir, ec)) {
        dir = std::filesystem::current_path(ec).string();
    }
    CommandLine command = config_.server_command;
    command.push_back(dir);
#if defined(__APPLE__)
    command.push_back("--log-dir");
    command.push_back("~/.evalbox/devtools.log");
#endif
    return command;
}

CommandLine DevToolsManager::InspectorCommand(int port) const {
    CommandLine command = config_.inspector_command;
    command.push_back(std::to_string(port));
    return command;
}

void DevToolsManager::Start(const std::string& work_dir, int port, bool quiet) {
    logger_->Debug("[supervisor] Starting tool server and inspector tasks...");
    utils::InstallShutdownHandlers();
    try {
        supervisor_->Add(kServerTask, ServerCommand(work_dir));
        if (!quiet) {
            supervisor_->Add(kInspectorTask, InspectorCommand(port));
        }
        supervisor_->RunUntilComplete();
    } catch (const std::exception& ex) {
        logger_->Error(std::string("[supervisor] ") + ex.what());
        supervisor_->StopAll(true);
        throw;
    }
    if (utils::ShutdownRequested()) {
        logger_->Info("[supervisor] Received signal " + std::to_string(utils::ShutdownSignal()) +
                      ", gracefully shutting down...");
    }
    supervisor_->StopAll(true);
}

}  // namespace evalbox::supervisor
