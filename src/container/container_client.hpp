#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "config/config_schema.hpp"
#include "nlohmann/json.hpp"
#include "utils/logging.hpp"

namespace evalbox::container {

class ContainerError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct ContainerConfig {
    std::string image;
    // Working directory for launch and the default for Execute.
    std::string cwd = "/";
    // Applied after forward_env, so these win on conflict.
    std::map<std::string, std::string> env;
    // Forwarded only when set in the host environment.
    std::vector<std::string> forward_env;
    std::chrono::seconds timeout{30};
    std::string executable = "nerdctl";
    std::vector<std::string> run_args = {"--rm"};
    // Argument to `sleep` inside the container; bounds an orphaned container's life.
    std::string container_timeout = "2h";
    std::chrono::seconds pull_timeout{120};
    std::chrono::seconds stop_timeout{60};
    int discovery_attempts = 5;
    std::chrono::milliseconds discovery_backoff{1000};
    std::string namespace_name;
    std::string container_id;
};

ContainerConfig FromSettings(const config::ContainerSettings& settings);

struct ContainerExecResult {
    std::string stdout_text;
    std::string stderr_text;
    int returncode = 1;

    bool Ok() const { return returncode == 0; }
    nlohmann::json ToJson() const;
};

enum class ContainerState {
    kUnbound,
    kStarted,
    kBound,
    kReleased
};

const char* ToString(ContainerState state);

// Drives a container runtime CLI (nerdctl, docker) for one container.
// The destructor does not release the container; see ScopedContainer.
class ContainerClient {
public:
    explicit ContainerClient(ContainerConfig config,
                             std::shared_ptr<utils::Logger> logger = nullptr);

    ContainerClient(const ContainerClient&) = delete;
    ContainerClient& operator=(const ContainerClient&) = delete;

    // Throws ContainerError when the runtime fails or exceeds the pull timeout.
    void StartContainer();

    // Runs `bash -lc command` in the container. Dispatch failures come back as
    // returncode 1 with the reason in stderr. Throws std::logic_error when no
    // container is bound.
    ContainerExecResult Execute(const std::string& command,
                                const std::string& cwd = {},
                                std::optional<std::chrono::seconds> timeout = std::nullopt);

    // Fire-and-forget stop, falling back to rm -f. Safe to call repeatedly.
    void Cleanup() noexcept;

    std::vector<std::string> BuildRunArgs(const std::string& container_name) const;
    std::vector<std::string> BuildExecArgs(const std::string& command, const std::string& cwd) const;
    std::string BuildCleanupCommand() const;

    // Searches the namespaces in order for a running container named exactly full_name.
    // Throws ContainerError when none matches.
    std::pair<std::string, std::string> FindContainerId(const std::vector<std::string>& namespaces,
                                                        const std::string& full_name) const;

    // Binds to the pod-local container k8s://$POD_NAMESPACE/$POD_NAME/<container_name>,
    // retrying discovery_attempts times with discovery_backoff in between.
    static std::unique_ptr<ContainerClient> LoadContainer(
        ContainerConfig config,
        const std::vector<std::string>& namespaces,
        const std::string& container_name,
        std::shared_ptr<utils::Logger> logger = nullptr);

    static std::string ResolveDiscoveryName(const std::string& container_name);

    ContainerState State() const { return state_; }
    const std::string& ContainerId() const { return config_.container_id; }
    const std::string& Namespace() const { return config_.namespace_name; }
    const ContainerConfig& Config() const { return config_; }
    nlohmann::json TemplateVars() const;

private:
    std::vector<std::string> RuntimePrefix(const std::string& namespace_name) const;

    ContainerConfig config_;
    std::shared_ptr<utils::Logger> logger_;
    ContainerState state_ = ContainerState::kUnbound;
};

}  // namespace evalbox::container
