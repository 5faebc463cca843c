#include "container/container_client.hpp"

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <thread>
#include <signal.h>
#include <sys/wait.h>

#include "sandbox/process_env.hpp"
#include "sandbox/shell_executor.hpp"
#include "utils/common.hpp"

namespace evalbox::container {
namespace {

struct CliResult {
    int code = -1;
    bool timed_out = false;
    std::string out;
    std::string err;
};

std::string QuoteCommand(const std::vector<std::string>& argv) {
    std::vector<std::string> quoted;
    quoted.reserve(argv.size());
    for (const auto& arg : argv) {
        quoted.push_back(sandbox::QuoteShellWord(arg));
    }
    return utils::Join(quoted, " ");
}

// Every container operation is one host-side invocation of the runtime CLI.
CliResult RunCli(const std::vector<std::string>& argv,
                 std::chrono::seconds timeout,
                 bool merge_stderr) {
    namespace fs = std::filesystem;
    if (argv.empty()) {
        throw ContainerError("empty runtime invocation");
    }
    auto search_path = utils::GetEnv("PATH");
    if (search_path.empty()) {
        search_path = sandbox::kSecurePath;
    }
    const auto exe = sandbox::FindExecutable(argv.front(), search_path);
    if (exe.empty()) {
        throw ContainerError("No such file or directory: '" + argv.front() + "'");
    }
    const std::vector<std::string> args(argv.begin() + 1, argv.end());

    const auto stamp = utils::RandomHex(8);
    const auto out_path = fs::temp_directory_path() / ("evalbox_cli_out_" + stamp + ".log");
    const auto err_path = fs::temp_directory_path() / ("evalbox_cli_err_" + stamp + ".log");

    const auto start = std::chrono::steady_clock::now();
    bp::child child_process = merge_stderr
        ? bp::child(bp::exe = exe, bp::args = args,
                    (bp::std_out & bp::std_err) > out_path.string(),
                    bp::std_in < bp::null,
                    bp::extend::on_exec_setup = sandbox::NewProcessGroup{})
        : bp::child(bp::exe = exe, bp::args = args,
                    bp::std_out > out_path.string(),
                    bp::std_err > err_path.string(),
                    bp::std_in < bp::null,
                    bp::extend::on_exec_setup = sandbox::NewProcessGroup{});

    CliResult result{};
    const pid_t pid = child_process.id();
    int status = 0;
    if (sandbox::WaitForExit(pid, start + timeout, status)) {
        result.code = sandbox::DecodeWaitStatus(status);
    } else {
        result.timed_out = std::chrono::steady_clock::now() >= start + timeout;
        sandbox::SignalProcessTree(pid, SIGKILL);
        ::waitpid(pid, &status, 0);
    }
    child_process.detach();

    result.out = utils::ReadFile(out_path);
    result.err = utils::ReadFile(err_path);
    std::error_code ec;
    fs::remove(out_path, ec);
    fs::remove(err_path, ec);
    return result;
}

}  // namespace

ContainerConfig FromSettings(const config::ContainerSettings& settings) {
    ContainerConfig config{};
    config.image = settings.image;
    config.cwd = settings.cwd;
    config.env = settings.env;
    config.forward_env = settings.forward_env;
    config.timeout = std::chrono::seconds(settings.timeout_s);
    config.executable = settings.executable;
    config.run_args = settings.run_args;
    config.container_timeout = settings.container_timeout;
    config.pull_timeout = std::chrono::seconds(settings.pull_timeout_s);
    config.stop_timeout = std::chrono::seconds(settings.stop_timeout_s);
    config.discovery_attempts = settings.discovery_attempts;
    config.discovery_backoff = std::chrono::milliseconds(settings.discovery_backoff_ms);
    return config;
}

nlohmann::json ContainerExecResult::ToJson() const {
    return {
        {"stdout", stdout_text},
        {"stderr", stderr_text},
        {"returncode", returncode}
    };
}

const char* ToString(ContainerState state) {
    switch (state) {
        case ContainerState::kUnbound: return "unbound";
        case ContainerState::kStarted: return "started";
        case ContainerState::kBound: return "bound";
        case ContainerState::kReleased: return "released";
    }
    return "unknown";
}

ContainerClient::ContainerClient(ContainerConfig config, std::shared_ptr<utils::Logger> logger)
    : config_(std::move(config))
    , logger_(logger ? std::move(logger) : utils::MakeStderrLogger()) {
    if (!config_.container_id.empty()) {
        state_ = ContainerState::kBound;
    }
}

std::vector<std::string> ContainerClient::RuntimePrefix(const std::string& namespace_name) const {
    std::vector<std::string> argv = {config_.executable};
    if (!namespace_name.empty()) {
        argv.push_back("-n");
        argv.push_back(namespace_name);
    }
    return argv;
}

std::vector<std::string> ContainerClient::BuildRunArgs(const std::string& container_name) const {
    auto argv = RuntimePrefix(config_.namespace_name);
    argv.insert(argv.end(), {"run", "-d", "--name", container_name, "-w", config_.cwd});
    argv.insert(argv.end(), config_.run_args.begin(), config_.run_args.end());
    argv.insert(argv.end(), {config_.image, "sleep", config_.container_timeout});
    return argv;
}

std::vector<std::string> ContainerClient::BuildExecArgs(const std::string& command,
                                                        const std::string& cwd) const {
    auto argv = RuntimePrefix(config_.namespace_name);
    argv.insert(argv.end(), {"exec", "-w", cwd});
    for (const auto& key : config_.forward_env) {
        if (const char* value = std::getenv(key.c_str())) {
            argv.push_back("-e");
            argv.push_back(key + "=" + value);
        }
    }
    for (const auto& [key, value] : config_.env) {
        argv.push_back("-e");
        argv.push_back(key + "=" + value);
    }
    argv.insert(argv.end(), {config_.container_id, "bash", "-lc", command});
    return argv;
}

std::string ContainerClient::BuildCleanupCommand() const {
    const auto prefix = QuoteCommand(RuntimePrefix(config_.namespace_name));
    const auto id = sandbox::QuoteShellWord(config_.container_id);
    return "(timeout " + std::to_string(config_.stop_timeout.count()) + " " + prefix + " stop " + id +
           " || " + prefix + " rm -f " + id + ") >/dev/null 2>&1 &";
}

void ContainerClient::StartContainer() {
    const auto container_name = "evalbox-" + utils::RandomHex(8);
    const auto argv = BuildRunArgs(container_name);
    logger_->Debug("[container] Starting container with command: " + QuoteCommand(argv));

    CliResult result{};
    try {
        result = RunCli(argv, config_.pull_timeout, false);
    } catch (const std::exception& ex) {
        throw ContainerError("failed to start container " + container_name + ": " + ex.what());
    }
    if (result.timed_out) {
        throw ContainerError("starting container " + container_name + " timed out after " +
                             std::to_string(config_.pull_timeout.count()) + " seconds");
    }
    if (result.code != 0) {
        const auto detail = utils::Trim(result.err.empty() ? result.out : result.err);
        throw ContainerError("failed to start container " + container_name + " (exit " +
                             std::to_string(result.code) + "): " + detail);
    }
    config_.container_id = utils::Trim(result.out);
    state_ = ContainerState::kStarted;
    logger_->Info("[container] Started container " + container_name + " with ID " + config_.container_id);
}

ContainerExecResult ContainerClient::Execute(const std::string& command,
                                             const std::string& cwd,
                                             std::optional<std::chrono::seconds> timeout) {
    if (state_ != ContainerState::kStarted && state_ != ContainerState::kBound) {
        throw std::logic_error("Container not started");
    }
    const auto argv = BuildExecArgs(command, cwd.empty() ? config_.cwd : cwd);
    const auto limit = timeout.value_or(config_.timeout);
    logger_->Info("[container] Executing command: " + QuoteCommand(argv));

    ContainerExecResult result{};
    try {
        const auto cli = RunCli(argv, limit, true);
        if (cli.timed_out) {
            result.stderr_text = "run err:Command '" + command + "' timed out after " +
                                 std::to_string(limit.count()) + " seconds";
            return result;
        }
        result.stdout_text = cli.out;
        result.returncode = cli.code;
    } catch (const std::exception& ex) {
        result = ContainerExecResult{};
        result.stderr_text = std::string("run err:") + ex.what();
    }
    return result;
}

void ContainerClient::Cleanup() noexcept {
    if (state_ == ContainerState::kReleased || config_.container_id.empty()) {
        return;
    }
    state_ = ContainerState::kReleased;
    try {
        const auto command = BuildCleanupCommand();
        // The shell backgrounds the stop/rm and exits at once.
        bp::child launcher(
            bp::exe = "/bin/sh",
            bp::args = std::vector<std::string>{"-c", command},
            bp::std_out > bp::null,
            bp::std_err > bp::null,
            bp::std_in < bp::null);
        launcher.wait();
        logger_->Info("[container] Released container " + config_.container_id);
    } catch (const std::exception& ex) {
        logger_->Warn("[container] Release of " + config_.container_id + " failed: " + ex.what());
    }
}

std::pair<std::string, std::string> ContainerClient::FindContainerId(
    const std::vector<std::string>& namespaces,
    const std::string& full_name) const {
    for (const auto& ns : namespaces) {
        const std::vector<std::string> argv = {config_.executable, "-n", ns, "ps", "--format", "json"};
        CliResult cli{};
        try {
            cli = RunCli(argv, config_.timeout, false);
        } catch (const std::exception& ex) {
            logger_->Warn("[container] listing namespace " + ns + " failed: " + ex.what());
            continue;
        }
        if (cli.timed_out || cli.code != 0) {
            continue;
        }
        for (const auto& line : utils::SplitLines(cli.out)) {
            const auto info = nlohmann::json::parse(line, nullptr, false);
            if (info.is_discarded() || !info.is_object()) {
                continue;
            }
            if (!info.contains("Names") || !info["Names"].is_string()
                || !info.contains("ID") || !info["ID"].is_string()) {
                continue;
            }
            if (info["Names"].get<std::string>() == full_name) {
                return {info["ID"].get<std::string>(), ns};
            }
        }
    }
    throw ContainerError("no container matched '" + full_name + "' in namespaces [" +
                         utils::Join(namespaces, ", ") + "]");
}

std::string ContainerClient::ResolveDiscoveryName(const std::string& container_name) {
    const auto pod_name = utils::GetEnv("POD_NAME");
    const auto pod_namespace = utils::GetEnv("POD_NAMESPACE");
    if (pod_name.empty() || pod_namespace.empty()) {
        throw ContainerError("env POD_NAME or env POD_NAMESPACE not set");
    }
    return "k8s://" + pod_namespace + "/" + pod_name + "/" + container_name;
}

std::unique_ptr<ContainerClient> ContainerClient::LoadContainer(
    ContainerConfig config,
    const std::vector<std::string>& namespaces,
    const std::string& container_name,
    std::shared_ptr<utils::Logger> logger) {
    const auto full_name = ResolveDiscoveryName(container_name);
    if (namespaces.empty()) {
        throw ContainerError("container namespace not set");
    }

    config.container_id.clear();
    auto client = std::make_unique<ContainerClient>(std::move(config), std::move(logger));
    const int attempts = std::max(1, client->config_.discovery_attempts);
    for (int attempt = 1; attempt <= attempts; ++attempt) {
        try {
            auto [id, ns] = client->FindContainerId(namespaces, full_name);
            client->config_.container_id = std::move(id);
            client->config_.namespace_name = std::move(ns);
            client->state_ = ContainerState::kBound;
            client->logger_->Info("[container] Found container " + client->config_.container_id +
                                  " in namespace " + client->config_.namespace_name);
            return client;
        } catch (const ContainerError& ex) {
            client->logger_->Warn("[container] Failed to find container try again (" +
                                  std::to_string(attempt) + "/" + std::to_string(attempts) +
                                  "): " + ex.what());
        }
        if (attempt < attempts) {
            std::this_thread::sleep_for(client->config_.discovery_backoff);
        }
    }
    throw ContainerError("Failed to find target container");
}

nlohmann::json ContainerClient::TemplateVars() const {
    return {
        {"image", config_.image},
        {"cwd", config_.cwd},
        {"env", config_.env},
        {"forward_env", config_.forward_env},
        {"timeout", config_.timeout.count()},
        {"executable", config_.executable},
        {"run_args", config_.run_args},
        {"container_timeout", config_.container_timeout},
        {"pull_timeout", config_.pull_timeout.count()},
        {"namespace", config_.namespace_name},
        {"container_id", config_.container_id},
        {"state", ToString(state_)}
    };
}

}  // namespace evalbox::container
