#include "config/config_loader.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>

#include "utils/common.hpp"

namespace evalbox::config {
namespace {

using evalbox::utils::GetEnv;

std::string GetEnvFallback(const char* primary, const char* secondary) {
    auto value = GetEnv(primary);
    if (!value.empty()) {
        return value;
    }
    return GetEnv(secondary);
}

bool ParseBool(const std::string& value) {
    std::string lowered = value;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on";
}

int ParseInt(const std::string& value, int fallback) {
    try {
        return std::stoi(value);
    } catch (const std::exception&) {
        return fallback;
    }
}

std::vector<std::string> SplitCsv(const std::string& value) {
    std::vector<std::string> items;
    std::stringstream stream(value);
    std::string item;
    while (std::getline(stream, item, ',')) {
        if (!item.empty()) {
            items.push_back(item);
        }
    }
    return items;
}

std::vector<std::string> SplitWords(const std::string& value) {
    std::vector<std::string> items;
    std::istringstream stream(value);
    std::string item;
    while (stream >> item) {
        items.push_back(item);
    }
    return items;
}

void ReadString(const nlohmann::json& source, const char* key, std::string& target) {
    if (source.contains(key) && source[key].is_string()) {
        target = source[key].get<std::string>();
    }
}

void ReadInt(const nlohmann::json& source, const char* key, int& target) {
    if (source.contains(key) && source[key].is_number_integer()) {
        target = source[key].get<int>();
    }
}

void ReadBool(const nlohmann::json& source, const char* key, bool& target) {
    if (source.contains(key) && source[key].is_boolean()) {
        target = source[key].get<bool>();
    }
}

void ReadStringList(const nlohmann::json& source, const char* key, std::vector<std::string>& target) {
    if (!source.contains(key) || !source[key].is_array()) {
        return;
    }
    target.clear();
    for (const auto& item : source[key]) {
        if (item.is_string()) {
            target.push_back(item.get<std::string>());
        }
    }
}

void ReadStringMap(const nlohmann::json& source, const char* key, std::map<std::string, std::string>& target) {
    if (!source.contains(key) || !source[key].is_object()) {
        return;
    }
    target.clear();
    for (const auto& item : source[key].items()) {
        if (item.value().is_string()) {
            target[item.key()] = item.value().get<std::string>();
        }
    }
}

}  // namespace

std::string DefaultWorkDir() {
#if defined(__linux__)
    return "/dev/shm/swe-sandbox";
#else
    return "/tmp/swe-sandbox";
#endif
}

std::filesystem::path GetConfigPath() {
    return evalbox::utils::GetHomePath() / ".evalbox" / "config.json";
}

void ApplyConfigFromJson(Config& config, const nlohmann::json& data) {
    if (!data.is_object()) {
        return;
    }

    if (data.contains("executor") && data["executor"].is_object()) {
        const auto& executor = data["executor"];
        ReadInt(executor, "timeoutS", config.executor.timeout_s);
        ReadString(executor, "workingDir", config.executor.working_dir);
        ReadStringMap(executor, "env", config.executor.env);
    }

    if (data.contains("container") && data["container"].is_object()) {
        const auto& container = data["container"];
        ReadString(container, "executable", config.container.executable);
        ReadString(container, "image", config.container.image);
        ReadString(container, "cwd", config.container.cwd);
        ReadStringList(container, "namespaces", config.container.namespaces);
        ReadString(container, "containerName", config.container.container_name);
        ReadStringList(container, "forwardEnv", config.container.forward_env);
        ReadStringMap(container, "env", config.container.env);
        ReadStringList(container, "runArgs", config.container.run_args);
        ReadString(container, "containerTimeout", config.container.container_timeout);
        ReadInt(container, "timeoutS", config.container.timeout_s);
        ReadInt(container, "pullTimeoutS", config.container.pull_timeout_s);
        ReadInt(container, "stopTimeoutS", config.container.stop_timeout_s);
        ReadInt(container, "discoveryAttempts", config.container.discovery_attempts);
        ReadInt(container, "discoveryBackoffMs", config.container.discovery_backoff_ms);
    }

    if (data.contains("evaluation") && data["evaluation"].is_object()) {
        const auto& evaluation = data["evaluation"];
        ReadString(evaluation, "workDir", config.evaluation.work_dir);
        ReadString(evaluation, "detailsPath", config.evaluation.details_path);
        ReadString(evaluation, "codeSpace", config.evaluation.code_space);
        ReadInt(evaluation, "timeoutS", config.evaluation.timeout_s);
        ReadBool(evaluation, "includeTestsStatus", config.evaluation.include_tests_status);
    }

    if (data.contains("reward") && data["reward"].is_object()) {
        const auto& reward = data["reward"];
        ReadString(reward, "datasetPath", config.reward.dataset_path);
        ReadString(reward, "sharePath", config.reward.share_path);
        ReadString(reward, "evaluatorSource", config.reward.evaluator_source);
        ReadString(reward, "evaluatorCommand", config.reward.evaluator_command);
        ReadInt(reward, "timeoutS", config.reward.timeout_s);
    }

    if (data.contains("devtools") && data["devtools"].is_object()) {
        const auto& devtools = data["devtools"];
        ReadStringList(devtools, "serverCommand", config.devtools.server_command);
        ReadStringList(devtools, "inspectorCommand", config.devtools.inspector_command);
        ReadInt(devtools, "inspectorPort", config.devtools.inspector_port);
        ReadInt(devtools, "stopGraceS", config.devtools.stop_grace_s);
    }

    if (data.contains("logging") && data["logging"].is_object()) {
        const auto& logging = data["logging"];
        ReadString(logging, "level", config.logging.level);
        ReadBool(logging, "stdout", config.logging.stdout_echo);
    }
}

void ApplyConfigFromEnv(Config& config) {
    const auto executor_timeout = GetEnvFallback(
        "EVALBOX_EXECUTOR__TIMEOUT_S",
        "EVALBOX_EXECUTOR_TIMEOUT_S");
    if (!executor_timeout.empty()) {
        config.executor.timeout_s = ParseInt(executor_timeout, config.executor.timeout_s);
    }

    // Legacy name used by existing deployments.
    const auto legacy_executable = GetEnv("MSWEA_DOCKER_EXECUTABLE");
    if (!legacy_executable.empty()) {
        config.container.executable = legacy_executable;
    }
    const auto executable = GetEnvFallback(
        "EVALBOX_CONTAINER__EXECUTABLE",
        "EVALBOX_CONTAINER_EXECUTABLE");
    if (!executable.empty()) {
        config.container.executable = executable;
    }

    const auto image = GetEnvFallback(
        "EVALBOX_CONTAINER__IMAGE",
        "EVALBOX_CONTAINER_IMAGE");
    if (!image.empty()) {
        config.container.image = image;
    }

    const auto namespaces = GetEnvFallback(
        "EVALBOX_CONTAINER__NAMESPACES",
        "EVALBOX_CONTAINER_NAMESPACES");
    if (!namespaces.empty()) {
        config.container.namespaces = SplitCsv(namespaces);
    }

    const auto container_name = GetEnvFallback(
        "EVALBOX_CONTAINER__NAME",
        "EVALBOX_CONTAINER_NAME");
    if (!container_name.empty()) {
        config.container.container_name = container_name;
    }

    const auto forward_env = GetEnvFallback(
        "EVALBOX_CONTAINER__FORWARD_ENV",
        "EVALBOX_CONTAINER_FORWARD_ENV");
    if (!forward_env.empty()) {
        config.container.forward_env = SplitCsv(forward_env);
    }

    const auto container_timeout = GetEnvFallback(
        "EVALBOX_CONTAINER__TIMEOUT_S",
        "EVALBOX_CONTAINER_TIMEOUT_S");
    if (!container_timeout.empty()) {
        config.container.timeout_s = ParseInt(container_timeout, config.container.timeout_s);
    }

    const auto discovery_attempts = GetEnvFallback(
        "EVALBOX_CONTAINER__DISCOVERY_ATTEMPTS",
        "EVALBOX_CONTAINER_DISCOVERY_ATTEMPTS");
    if (!discovery_attempts.empty()) {
        config.container.discovery_attempts = ParseInt(
            discovery_attempts,
            config.container.discovery_attempts);
    }

    const auto discovery_backoff = GetEnvFallback(
        "EVALBOX_CONTAINER__DISCOVERY_BACKOFF_MS",
        "EVALBOX_CONTAINER_DISCOVERY_BACKOFF_MS");
    if (!discovery_backoff.empty()) {
        config.container.discovery_backoff_ms = ParseInt(
            discovery_backoff,
            config.container.discovery_backoff_ms);
    }

    const auto work_dir = GetEnvFallback(
        "EVALBOX_EVALUATION__WORK_DIR",
        "EVALBOX_EVALUATION_WORK_DIR");
    if (!work_dir.empty()) {
        config.evaluation.work_dir = work_dir;
    }

    const auto details_path = GetEnvFallback(
        "EVALBOX_EVALUATION__DETAILS_PATH",
        "EVALBOX_EVALUATION_DETAILS_PATH");
    if (!details_path.empty()) {
        config.evaluation.details_path = details_path;
    }

    const auto eval_timeout = GetEnvFallback(
        "EVALBOX_EVALUATION__TIMEOUT_S",
        "EVALBOX_EVALUATION_TIMEOUT_S");
    if (!eval_timeout.empty()) {
        config.evaluation.timeout_s = ParseInt(eval_timeout, config.evaluation.timeout_s);
    }

    const auto share_path = GetEnv("WORK_SHARE");
    if (!share_path.empty()) {
        config.reward.share_path = share_path;
    }

    const auto dataset_path = GetEnvFallback(
        "EVALBOX_REWARD__DATASET_PATH",
        "EVALBOX_REWARD_DATASET_PATH");
    if (!dataset_path.empty()) {
        config.reward.dataset_path = dataset_path;
    }

    const auto evaluator_command = GetEnvFallback(
        "EVALBOX_REWARD__EVALUATOR_COMMAND",
        "EVALBOX_REWARD_EVALUATOR_COMMAND");
    if (!evaluator_command.empty()) {
        config.reward.evaluator_command = evaluator_command;
    }

    const auto server_command = GetEnvFallback(
        "EVALBOX_DEVTOOLS__SERVER_COMMAND",
        "EVALBOX_DEVTOOLS_SERVER_COMMAND");
    if (!server_command.empty()) {
        config.devtools.server_command = SplitWords(server_command);
    }

    const auto inspector_port = GetEnvFallback(
        "EVALBOX_DEVTOOLS__INSPECTOR_PORT",
        "EVALBOX_DEVTOOLS_INSPECTOR_PORT");
    if (!inspector_port.empty()) {
        config.devtools.inspector_port = ParseInt(inspector_port, config.devtools.inspector_port);
    }

    const auto log_level = GetEnvFallback(
        "EVALBOX_LOGGING__LEVEL",
        "EVALBOX_LOG_LEVEL");
    if (!log_level.empty()) {
        config.logging.level = log_level;
    }

    const auto log_stdout = GetEnvFallback(
        "EVALBOX_LOGGING__STDOUT",
        "EVALBOX_LOG_STDOUT");
    if (!log_stdout.empty()) {
        config.logging.stdout_echo = ParseBool(log_stdout);
    }
}

Config LoadConfig(const std::filesystem::path& config_path) {
    Config config{};
    config.evaluation.work_dir = DefaultWorkDir();

    if (std::filesystem::exists(config_path)) {
        try {
            std::ifstream input(config_path);
            nlohmann::json data;
            input >> data;
            ApplyConfigFromJson(config, data);
        } catch (const nlohmann::json::exception&) {
            // Keep defaults on parse errors
        }
    }

    ApplyConfigFromEnv(config);
    if (config.evaluation.work_dir.empty()) {
        config.evaluation.work_dir = DefaultWorkDir();
    }
    return config;
}

Config LoadConfig() {
    return LoadConfig(GetConfigPath());
}

}  // namespace evalbox::config
