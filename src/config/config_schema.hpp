#pragma once

#include <map>
#include <string>
#include <vector>

namespace evalbox::config {

struct ExecutorConfig {
    int timeout_s = 3600;
    std::string working_dir;
    std::map<std::string, std::string> env = {{"CUSTOM_VAR", "value"}};
};

struct ContainerSettings {
    std::string executable = "nerdctl";
    std::string image;
    std::string cwd = "/";
    std::vector<std::string> namespaces = {"k8s.io", "default"};
    std::string container_name = "second";
    std::vector<std::string> forward_env;
    std::map<std::string, std::string> env;
    std::vector<std::string> run_args = {"--rm"};
    std::string container_timeout = "2h";
    int timeout_s = 30;
    int pull_timeout_s = 120;
    int stop_timeout_s = 60;
    int discovery_attempts = 5;
    int discovery_backoff_ms = 1000;
};

struct EvaluationConfig {
    std::string work_dir;
    std::string details_path = "/shared/details.json";
    std::string code_space = "/testbed";
    int timeout_s = 3600;
    bool include_tests_status = true;
};

struct RewardConfig {
    std::string dataset_path = "/app/data/swe-verify-details.json";
    std::string share_path = "/shared";
    std::string evaluator_source = "/app/src/eval";
    std::string evaluator_command = "/shared/eval/evalbox evaluate --details /shared/details.json";
    int timeout_s = 30;
};

struct DevToolsConfig {
    std::vector<std::string> server_command = {"python", "-m", "aenv.main"};
    std::vector<std::string> inspector_command = {"npx", "@modelcontextprotocol/inspector", "--port"};
    int inspector_port = 6274;
    int stop_grace_s = 5;
};

struct LoggingConfig {
    std::string level = "INFO";
    bool stdout_echo = false;
};

struct Config {
    ExecutorConfig executor;
    ContainerSettings container;
    EvaluationConfig evaluation;
    RewardConfig reward;
    DevToolsConfig devtools;
    LoggingConfig logging;
};

// Scratch directory used when evaluation.work_dir is unset.
std::string DefaultWorkDir();

}  // namespace evalbox::config
