#pragma once

#include <chrono>
#include <string>

#include "container/container_client.hpp"
#include "sandbox/shell_executor.hpp"

namespace evalbox::eval {

struct CommandOutcome {
    int code = 1;
    std::string stdout_text;
    std::string stderr_text;

    bool Ok() const { return code == 0; }
};

// Where the pipeline's shell commands run.
class CommandRunner {
public:
    virtual ~CommandRunner() = default;
    virtual CommandOutcome Run(const std::string& command, std::chrono::seconds timeout) = 0;
    virtual std::string Name() const = 0;
};

// Runs commands in the current sandbox through a ShellExecutor.
class LocalCommandRunner : public CommandRunner {
public:
    explicit LocalCommandRunner(const sandbox::ShellExecutor& executor);

    CommandOutcome Run(const std::string& command, std::chrono::seconds timeout) override;
    std::string Name() const override { return "local"; }

private:
    const sandbox::ShellExecutor& executor_;
};

// Runs commands in a bound container. The pipeline's work dir has to be visible in the
// container at the same path.
class ContainerCommandRunner : public CommandRunner {
public:
    explicit ContainerCommandRunner(container::ContainerClient& client, std::string cwd = {});

    CommandOutcome Run(const std::string& command, std::chrono::seconds timeout) override;
    std::string Name() const override { return "container"; }

private:
    container::ContainerClient& client_;
    std::string cwd_;
};

}  // namespace evalbox::eval
