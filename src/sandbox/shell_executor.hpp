#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "utils/logging.hpp"

namespace evalbox::sandbox {

// Reserved codes; a child process never produces them.
constexpr int kExitInternalError = -1;
constexpr int kExitTimeout = -2;

enum class DispatchMode {
    kDirectExec,
    kShellExec
};

inline const char* ToString(DispatchMode mode) {
    switch (mode) {
        case DispatchMode::kDirectExec: return "direct";
        case DispatchMode::kShellExec: return "shell";
    }
    return "unknown";
}

// kShellExec when the command uses pipes, redirection, separators, expansion,
// backticks or the cd builtin.
DispatchMode ClassifyCommand(const std::string& command);

// POSIX shell word splitting. Throws std::invalid_argument on unbalanced quotes.
std::vector<std::string> SplitShellWords(const std::string& command);

// Single-quotes a word so /bin/sh reads it back unchanged.
std::string QuoteShellWord(const std::string& word);

// Receives "[STDOUT] line" / "[STDERR] line" from the reader threads.
using LineCallback = std::function<void(const std::string&)>;

struct ExecRequest {
    std::string command;
    std::vector<std::string> argv;
    std::string working_dir;
    std::map<std::string, std::string> env;
    std::optional<std::chrono::seconds> timeout;
    std::optional<std::string> input;
    std::string out_record;
    LineCallback on_line;
};

struct ExecResult {
    int code = kExitInternalError;
    std::string stdout_text;
    std::string stderr_text;
    double duration = 0.0;
    DispatchMode mode = DispatchMode::kDirectExec;

    bool Ok() const { return code == 0; }
    std::string Output() const;
    std::string Summary() const;
};

class ShellExecutor {
public:
    explicit ShellExecutor(std::chrono::seconds timeout = std::chrono::seconds(60),
                           std::string working_dir = {},
                           std::map<std::string, std::string> env = {},
                           std::shared_ptr<utils::Logger> logger = nullptr);

    ExecResult Execute(const ExecRequest& request) const;
    ExecResult Execute(const std::string& command,
                       std::optional<std::chrono::seconds> timeout = std::nullopt,
                       LineCallback on_line = {},
                       std::optional<std::string> input = std::nullopt) const;
    ExecResult Execute(const std::vector<std::string>& argv,
                       std::optional<std::chrono::seconds> timeout = std::nullopt,
                       LineCallback on_line = {},
                       std::optional<std::string> input = std::nullopt) const;

    // Throws std::runtime_error when the script does not exist.
    ExecResult ExecuteScript(const std::string& script_path,
                             const std::vector<std::string>& args = {},
                             const std::string& interpreter = {},
                             std::optional<std::chrono::seconds> timeout = std::nullopt) const;

    void SetLogger(std::shared_ptr<utils::Logger> logger);
    const std::string& WorkingDir() const { return working_dir_; }
    std::chrono::seconds Timeout() const { return timeout_; }

private:
    struct Invocation {
        std::string exe;
        std::vector<std::string> args;
        DispatchMode mode = DispatchMode::kDirectExec;
    };

    Invocation Prepare(const ExecRequest& request, const std::string& search_path) const;
    ExecResult ExecuteWithCapture(const Invocation& invocation,
                                  const ExecRequest& request,
                                  const std::map<std::string, std::string>& env,
                                  const std::string& working_dir,
                                  std::chrono::seconds timeout) const;
    ExecResult ExecuteWithStreaming(const Invocation& invocation,
                                    const ExecRequest& request,
                                    const std::map<std::string, std::string>& env,
                                    const std::string& working_dir,
                                    std::chrono::seconds timeout) const;

    std::chrono::seconds timeout_;
    std::string working_dir_;
    std::map<std::string, std::string> env_;
    std::shared_ptr<utils::Logger> logger_;
};

}  // namespace evalbox::sandbox
