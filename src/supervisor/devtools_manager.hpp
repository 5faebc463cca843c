#pragma once

#include <chrono>
#include <memory>
#include <string>

#include "config/config_schema.hpp"
#include "supervisor/task_supervisor.hpp"
#include "utils/logging.hpp"

namespace evalbox::supervisor {

enum class SupervisorBackend {
    kThreads,
    kCooperative
};

const char* ToString(SupervisorBackend backend);

std::unique_ptr<TaskSupervisor> MakeSupervisor(SupervisorBackend backend,
                                               std::shared_ptr<utils::Logger> logger,
                                               std::chrono::milliseconds grace);

// Runs the local tool server and, unless quiet, the inspector next to it.
class DevToolsManager {
public:
    DevToolsManager(config::DevToolsConfig config,
                    std::shared_ptr<utils::Logger> logger,
                    SupervisorBackend backend = SupervisorBackend::kThreads);
    DevToolsManager(config::DevToolsConfig config,
                    std::shared_ptr<utils::Logger> logger,
                    std::unique_ptr<TaskSupervisor> supervisor);

    // Blocks until every task exits or SIGINT/SIGTERM arrives, then force-stops everything.
    void Start(const std::string& work_dir, int port, bool quiet);

    CommandLine ServerCommand(const std::string& work_dir) const;
    CommandLine InspectorCommand(int port) const;

    TaskSupervisor& Supervisor() { return *supervisor_; }

private:
    config::DevToolsConfig config_;
    std::shared_ptr<utils::Logger> logger_;
    std::unique_ptr<TaskSupervisor> supervisor_;
};

}  // namespace evalbox::supervisor
