#include "eval/command_runner.hpp"

namespace evalbox::eval {

LocalCommandRunner::LocalCommandRunner(const sandbox::ShellExecutor& executor)
    : executor_(executor) {}

CommandOutcome LocalCommandRunner::Run(const std::string& command, std::chrono::seconds timeout) {
    const auto result = executor_.Execute(command, timeout);
    return {result.code, result.stdout_text, result.stderr_text};
}

ContainerCommandRunner::ContainerCommandRunner(container::ContainerClient& client, std::string cwd)
    : client_(client)
    , cwd_(std::move(cwd)) {}

CommandOutcome ContainerCommandRunner::Run(const std::string& command, std::chrono::seconds timeout) {
    const auto result = client_.Execute(command, cwd_, timeout);
    return {result.returncode, result.stdout_text, result.stderr_text};
}

}  // namespace evalbox::eval
