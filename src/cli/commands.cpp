#include <chrono>
#include <filesystem>
#include <iostream>
#include <iterator>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "config/config_loader.hpp"
#include "container/container_client.hpp"
#include "container/scoped_container.hpp"
#include "eval/command_runner.hpp"
#include "eval/evaluation_pipeline.hpp"
#include "eval/job_descriptor.hpp"
#include "eval/reward_service.hpp"
#include "nlohmann/json.hpp"
#include "sandbox/shell_executor.hpp"
#include "supervisor/devtools_manager.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace {

using evalbox::config::Config;
using evalbox::utils::Logger;

constexpr const char* kUsage =
    "Usage: evalbox evaluate [--details PATH] [--container | --image IMAGE]\n"
    "       evalbox reward <instance_id> <patch_file|-> [timeout]\n"
    "       evalbox serve [work_dir] [port] [--quiet] [--async]";

std::shared_ptr<Logger> MakeLogger(const Config& config, const std::filesystem::path& log_file, bool console) {
    evalbox::utils::LogConfig log_config{};
    log_config.min_level = evalbox::utils::ParseLogLevel(config.logging.level);
    auto logger = std::make_shared<Logger>(log_config);
    if (!log_file.empty() && !logger->AddFileSink(log_file)) {
        std::cerr << "[cli] cannot open log file " << log_file.string() << std::endl;
        console = true;
    }
    if (console || config.logging.stdout_echo) {
        logger->AddStreamSink(std::cerr);
    }
    return logger;
}

int ParsePositiveInt(const std::string& value, const char* what) {
    std::size_t consumed = 0;
    int parsed = 0;
    try {
        parsed = std::stoi(value, &consumed);
    } catch (const std::logic_error&) {
        throw std::invalid_argument(std::string("invalid ") + what + ": " + value);
    }
    if (consumed != value.size() || parsed <= 0) {
        throw std::invalid_argument(std::string("invalid ") + what + ": " + value);
    }
    return parsed;
}

int RunEvaluate(const std::vector<std::string>& args) {
    auto config = evalbox::config::LoadConfig();
    std::string details_path = config.evaluation.details_path;
    bool use_container = false;
    std::string image;
    for (std::size_t i = 0; i < args.size(); ++i) {
        if (args[i] == "--details" && i + 1 < args.size()) {
            details_path = args[++i];
        } else if (args[i] == "--container") {
            use_container = true;
        } else if (args[i] == "--image" && i + 1 < args.size()) {
            image = args[++i];
        } else {
            std::cerr << kUsage << std::endl;
            return 2;
        }
    }

    const std::filesystem::path work_dir = config.evaluation.work_dir;
    std::error_code ec;
    std::filesystem::create_directories(work_dir, ec);
    auto logger = MakeLogger(config, work_dir / "run_instance.log", false);

    try {
        const auto run = evalbox::eval::LoadEvaluationRun(details_path);
        evalbox::eval::RunContext context{
            *logger,
            work_dir,
            std::chrono::seconds(config.evaluation.timeout_s),
            config.evaluation.include_tests_status};
        auto prepared = run;
        prepared.local_code_space = config.evaluation.code_space;

        evalbox::eval::EvalReport report;
        if (!image.empty()) {
            auto settings = evalbox::container::FromSettings(config.container);
            settings.image = image;
            // The scratch files are written on the host and read inside the container.
            settings.run_args.push_back("-v");
            settings.run_args.push_back(work_dir.string() + ":" + work_dir.string());
            auto container = evalbox::container::StartScopedContainer(settings, logger);
            evalbox::eval::ContainerCommandRunner runner(*container);
            evalbox::eval::EvaluationPipeline pipeline(context, runner);
            report = pipeline.Run(prepared);
        } else if (use_container) {
            // The discovered container belongs to the pod; it is not released here.
            auto client = evalbox::container::ContainerClient::LoadContainer(
                evalbox::container::FromSettings(config.container),
                config.container.namespaces,
                config.container.container_name,
                logger);
            evalbox::eval::ContainerCommandRunner runner(*client);
            evalbox::eval::EvaluationPipeline pipeline(context, runner);
            report = pipeline.Run(prepared);
        } else {
            evalbox::sandbox::ShellExecutor executor(
                std::chrono::seconds(config.executor.timeout_s),
                config.executor.working_dir,
                config.executor.env,
                logger);
            evalbox::eval::LocalCommandRunner runner(executor);
            evalbox::eval::EvaluationPipeline pipeline(context, runner);
            report = pipeline.Run(prepared);
        }

        std::cout << evalbox::eval::ReportToJson(report).dump(2) << std::endl;
        return report.resolved ? 0 : 1;
    } catch (const std::exception& ex) {
        logger->Error(std::string("[eval] ") + ex.what());
        std::cerr << "[eval] " << ex.what() << std::endl;
        return 1;
    }
}

int RunReward(const std::vector<std::string>& args) {
    if (args.size() < 2 || args.size() > 3) {
        std::cerr << kUsage << std::endl;
        return 2;
    }
    auto config = evalbox::config::LoadConfig();
    auto logger = MakeLogger(config, {}, true);

    try {
        const auto timeout = args.size() == 3
            ? ParsePositiveInt(args[2], "timeout")
            : config.reward.timeout_s;
        std::string patch;
        if (args[1] == "-") {
            patch.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
        } else {
            std::error_code ec;
            if (!std::filesystem::is_regular_file(args[1], ec)) {
                throw std::runtime_error("patch file not found: " + args[1]);
            }
            patch = evalbox::utils::ReadFile(args[1]);
        }

        auto client = evalbox::container::ContainerClient::LoadContainer(
            evalbox::container::FromSettings(config.container),
            config.container.namespaces,
            config.container.container_name,
            logger);
        evalbox::eval::RewardService service(config.reward, *client, logger);
        service.StageEvaluator();
        service.LoadDataset(config.reward.dataset_path);

        const auto result = service.Evaluate(args[0], patch, std::chrono::seconds(timeout));
        std::cout << result.ToJson().dump(2) << std::endl;
        return result.Ok() ? 0 : 1;
    } catch (const std::exception& ex) {
        logger->Error(std::string("[reward] ") + ex.what());
        return 1;
    }
}

int RunServe(const std::vector<std::string>& args) {
    auto config = evalbox::config::LoadConfig();
    auto logger = MakeLogger(config, {}, true);

    std::string work_dir = ".";
    int port = config.devtools.inspector_port;
    bool quiet = false;
    auto backend = evalbox::supervisor::SupervisorBackend::kThreads;
    std::vector<std::string> positional;
    for (const auto& arg : args) {
        if (arg == "--quiet") {
            quiet = true;
        } else if (arg == "--async") {
            backend = evalbox::supervisor::SupervisorBackend::kCooperative;
        } else {
            positional.push_back(arg);
        }
    }

    try {
        if (positional.size() > 2) {
            throw std::invalid_argument("too many arguments");
        }
        if (!positional.empty()) {
            work_dir = positional[0];
        }
        if (positional.size() == 2) {
            port = ParsePositiveInt(positional[1], "port");
        }
        logger->Info(std::string("[supervisor] Using ") + evalbox::supervisor::ToString(backend) + " backend");
        evalbox::supervisor::DevToolsManager manager(config.devtools, logger, backend);
        manager.Start(work_dir, port, quiet);
        return 0;
    } catch (const std::invalid_argument& ex) {
        std::cerr << ex.what() << "\n" << kUsage << std::endl;
        return 2;
    } catch (const std::exception& ex) {
        logger->Error(std::string("[supervisor] ") + ex.what());
        return 1;
    }
}

}  // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cout << kUsage << std::endl;
        return 1;
    }
    const std::string command = argv[1];
    const std::vector<std::string> args(argv + 2, argv + argc);

    if (command == "evaluate") {
        return RunEvaluate(args);
    }
    if (command == "reward") {
        return RunReward(args);
    }
    if (command == "serve") {
        return RunServe(args);
    }

    std::cout << kUsage << std::endl;
    return 1;
}
