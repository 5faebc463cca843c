#include "sandbox/shell_executor.hpp"

#include <algorithm>
#include <cctype>
#include <condition_variable>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <thread>
#include <signal.h>
#include <sys/wait.h>

#include "sandbox/process_env.hpp"
#include "utils/common.hpp"

namespace evalbox::sandbox {
namespace {

constexpr auto kReaderGrace = std::chrono::seconds(1);

template <typename... Props>
bp::child Spawn(const std::string& exe,
                const std::vector<std::string>& args,
                bp::environment& env,
                const std::string& working_dir,
                Props&&... props) {
    return bp::child(
        bp::exe = exe,
        bp::args = args,
        env,
        bp::start_dir = working_dir,
        bp::extend::on_exec_setup = NewProcessGroup{},
        std::forward<Props>(props)...);
}

std::string DescribeCommand(const ExecRequest& request) {
    if (!request.argv.empty()) {
        return utils::Join(request.argv, " ");
    }
    return request.command;
}

std::string RightTrim(std::string value) {
    value.erase(std::find_if(value.rbegin(), value.rend(), [](unsigned char c) {
        return !std::isspace(c);
    }).base(), value.end());
    return value;
}

std::string FormatSeconds(double seconds) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << seconds;
    return oss.str();
}

double SecondsSince(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
}

std::string TimeoutMessage(std::chrono::seconds timeout) {
    return "Timeout after " + std::to_string(timeout.count()) + " seconds";
}

bool IsWordBoundary(const std::string& value, std::size_t pos) {
    return pos >= value.size() || std::isspace(static_cast<unsigned char>(value[pos]));
}

}  // namespace

DispatchMode ClassifyCommand(const std::string& command) {
    static const std::vector<std::string> kShellTokens = {
        "&&", "||", ";", "|", "$", ">", "<", "`"
    };
    for (const auto& token : kShellTokens) {
        if (command.find(token) != std::string::npos) {
            return DispatchMode::kShellExec;
        }
    }
    std::size_t pos = 0;
    while ((pos = command.find("cd", pos)) != std::string::npos) {
        const bool starts_word = pos == 0
            || std::isspace(static_cast<unsigned char>(command[pos - 1]));
        if (starts_word && IsWordBoundary(command, pos + 2)) {
            return DispatchMode::kShellExec;
        }
        pos += 2;
    }
    return DispatchMode::kDirectExec;
}

std::vector<std::string> SplitShellWords(const std::string& command) {
    enum class Quote { kNone, kSingle, kDouble };
    std::vector<std::string> words;
    std::string current;
    bool in_word = false;
    Quote quote = Quote::kNone;

    for (std::size_t i = 0; i < command.size(); ++i) {
        const char c = command[i];
        if (quote == Quote::kSingle) {
            if (c == '\'') {
                quote = Quote::kNone;
            } else {
                current.push_back(c);
            }
            continue;
        }
        if (quote == Quote::kDouble) {
            if (c == '"') {
                quote = Quote::kNone;
            } else if (c == '\\' && i + 1 < command.size()
                       && std::strchr("\\\"$`\n", command[i + 1]) != nullptr) {
                current.push_back(command[++i]);
            } else {
                current.push_back(c);
            }
            continue;
        }
        if (std::isspace(static_cast<unsigned char>(c))) {
            if (in_word) {
                words.push_back(current);
                current.clear();
                in_word = false;
            }
            continue;
        }
        in_word = true;
        if (c == '\'') {
            quote = Quote::kSingle;
        } else if (c == '"') {
            quote = Quote::kDouble;
        } else if (c == '\\') {
            if (i + 1 >= command.size()) {
                throw std::invalid_argument("No escaped character");
            }
            current.push_back(command[++i]);
        } else {
            current.push_back(c);
        }
    }
    if (quote != Quote::kNone) {
        throw std::invalid_argument("No closing quotation");
    }
    if (in_word) {
        words.push_back(current);
    }
    return words;
}

std::string QuoteShellWord(const std::string& word) {
    if (word.empty()) {
        return "''";
    }
    const bool safe = std::all_of(word.begin(), word.end(), [](unsigned char c) {
        return std::isalnum(c) || std::strchr("@%+=:,./-_", c) != nullptr;
    });
    if (safe) {
        return word;
    }
    return "'" + utils::ReplaceAll(word, "'", "'\\''") + "'";
}

std::string ExecResult::Output() const {
    return "++++++++START_STDOUT++++++++\n" + stdout_text +
           "\n++++++++END_STDOUT++++++++\n"
           "++++++++START_STDERR++++++++\n" + stderr_text +
           "\n++++++++END_STDERR++++++++";
}

std::string ExecResult::Summary() const {
    return "ExecResult:{code: " + std::to_string(code) +
           ", duration: " + FormatSeconds(duration) + "s}";
}

ShellExecutor::ShellExecutor(std::chrono::seconds timeout,
                             std::string working_dir,
                             std::map<std::string, std::string> env,
                             std::shared_ptr<utils::Logger> logger)
    : timeout_(timeout)
    , working_dir_(std::move(working_dir))
    , env_(std::move(env))
    , logger_(logger ? std::move(logger) : utils::MakeStderrLogger()) {
    if (working_dir_.empty()) {
        working_dir_ = std::filesystem::current_path().string();
    }
}

void ShellExecutor::SetLogger(std::shared_ptr<utils::Logger> logger) {
    if (logger) {
        logger_ = std::move(logger);
    }
}

ExecResult ShellExecutor::Execute(const std::string& command,
                                  std::optional<std::chrono::seconds> timeout,
                                  LineCallback on_line,
                                  std::optional<std::string> input) const {
    ExecRequest request{};
    request.command = command;
    request.timeout = timeout;
    request.on_line = std::move(on_line);
    request.input = std::move(input);
    return Execute(request);
}

ExecResult ShellExecutor::Execute(const std::vector<std::string>& argv,
                                  std::optional<std::chrono::seconds> timeout,
                                  LineCallback on_line,
                                  std::optional<std::string> input) const {
    ExecRequest request{};
    request.argv = argv;
    request.timeout = timeout;
    request.on_line = std::move(on_line);
    request.input = std::move(input);
    return Execute(request);
}

ExecResult ShellExecutor::Execute(const ExecRequest& request) const {
    const auto timeout = request.timeout.value_or(timeout_);
    const auto working_dir = request.working_dir.empty() ? working_dir_ : request.working_dir;

    logger_->Info("[exec] ++++++++Begin executing command++++++++");
    logger_->Info("[exec] Command:" + DescribeCommand(request) + " Workdir: " + working_dir +
                  ", Timeout: " + std::to_string(timeout.count()) + "s");

    const auto start = std::chrono::steady_clock::now();
    ExecResult result{};
    try {
        const auto env = BuildEnvironment({&env_, &request.env});
        const auto path_it = env.find("PATH");
        const auto invocation = Prepare(request, path_it == env.end() ? kSecurePath : path_it->second);
        if (request.on_line) {
            result = ExecuteWithStreaming(invocation, request, env, working_dir, timeout);
        } else {
            result = ExecuteWithCapture(invocation, request, env, working_dir, timeout);
        }
    } catch (const std::exception& ex) {
        const auto duration = SecondsSince(start);
        logger_->Error("[exec] Execution failed after " + FormatSeconds(duration) + "s: " + ex.what());
        result = ExecResult{};
        result.code = kExitInternalError;
        result.stderr_text = std::string("Execution error: ") + ex.what();
        result.duration = duration;
        result.mode = request.argv.empty() ? ClassifyCommand(request.command) : DispatchMode::kDirectExec;
    }
    logger_->Info("[exec] ++++++++End executing command++++++++");
    return result;
}

ShellExecutor::Invocation ShellExecutor::Prepare(const ExecRequest& request,
                                                 const std::string& search_path) const {
    Invocation invocation{};
    std::vector<std::string> words;
    if (!request.argv.empty()) {
        words = request.argv;
    } else {
        invocation.mode = ClassifyCommand(request.command);
        if (invocation.mode == DispatchMode::kShellExec) {
            invocation.exe = "/bin/sh";
            invocation.args = {"-c", request.command};
            return invocation;
        }
        words = SplitShellWords(request.command);
    }
    if (words.empty()) {
        throw std::invalid_argument("empty command");
    }
    invocation.exe = FindExecutable(words.front(), search_path);
    if (invocation.exe.empty()) {
        throw std::runtime_error("No such file or directory: '" + words.front() + "'");
    }
    invocation.args.assign(words.begin() + 1, words.end());
    return invocation;
}

ExecResult ShellExecutor::ExecuteWithCapture(const Invocation& invocation,
                                             const ExecRequest& request,
                                             const std::map<std::string, std::string>& env,
                                             const std::string& working_dir,
                                             std::chrono::seconds timeout) const {
    namespace fs = std::filesystem;
    const auto stamp = utils::RandomHex(8);
    const bool record = !request.out_record.empty();
    const auto output_path = record
        ? fs::path(request.out_record)
        : fs::temp_directory_path() / ("evalbox_capture_" + stamp + ".log");
    const auto input_path = fs::temp_directory_path() / ("evalbox_stdin_" + stamp);
    if (request.input && !utils::WriteFile(input_path, *request.input)) {
        throw std::runtime_error("cannot stage stdin at " + input_path.string());
    }

    auto cleanup = [&]() {
        std::error_code ec;
        if (!record) {
            fs::remove(output_path, ec);
        }
        fs::remove(input_path, ec);
    };

    auto boost_env = ToBoostEnvironment(env);
    const auto start = std::chrono::steady_clock::now();
    auto spawn = [&]() -> bp::child {
        if (request.input) {
            return Spawn(invocation.exe, invocation.args, boost_env, working_dir,
                         (bp::std_out & bp::std_err) > output_path.string(),
                         bp::std_in < input_path.string());
        }
        return Spawn(invocation.exe, invocation.args, boost_env, working_dir,
                     (bp::std_out & bp::std_err) > output_path.string(),
                     bp::std_in < bp::null);
    };

    bp::child child_process;
    try {
        child_process = spawn();
    } catch (const bp::process_error&) {
        cleanup();
        throw;
    }

    const pid_t pid = child_process.id();
    int status = 0;
    const bool finished = WaitForExit(pid, start + timeout, status);
    if (!finished) {
        const bool timed_out = std::chrono::steady_clock::now() >= start + timeout;
        SignalProcessTree(pid, SIGKILL);
        ::waitpid(pid, &status, 0);
        child_process.detach();
        cleanup();
        if (!timed_out) {
            throw std::runtime_error("waitpid failed for pid " + std::to_string(pid));
        }
        ExecResult result{};
        result.code = kExitTimeout;
        result.stderr_text = TimeoutMessage(timeout);
        result.duration = static_cast<double>(timeout.count());
        result.mode = invocation.mode;
        return result;
    }
    child_process.detach();

    ExecResult result{};
    result.code = DecodeWaitStatus(status);
    result.duration = SecondsSince(start);
    result.mode = invocation.mode;
    if (!record) {
        result.stdout_text = utils::ReadFile(output_path);
    }
    cleanup();
    return result;
}

ExecResult ShellExecutor::ExecuteWithStreaming(const Invocation& invocation,
                                               const ExecRequest& request,
                                               const std::map<std::string, std::string>& env,
                                               const std::string& working_dir,
                                               std::chrono::seconds timeout) const {
    // Shared with the reader threads, which may outlive this call after the grace period.
    struct StreamState {
        std::mutex mutex;
        std::condition_variable cv;
        int finished = 0;
        std::string out;
        std::string err;
        std::string callback_error;
    };
    auto state = std::make_shared<StreamState>();
    auto out_stream = std::make_shared<bp::ipstream>();
    auto err_stream = std::make_shared<bp::ipstream>();

    // Input is staged in a file so a child that never reads stdin cannot block the
    // deadline or raise SIGPIPE in this process.
    const auto input_path = std::filesystem::temp_directory_path() / ("evalbox_stdin_" + utils::RandomHex(8));
    if (request.input && !utils::WriteFile(input_path, *request.input)) {
        throw std::runtime_error("cannot stage stdin at " + input_path.string());
    }
    auto remove_input = [&input_path]() {
        std::error_code ec;
        std::filesystem::remove(input_path, ec);
    };

    auto boost_env = ToBoostEnvironment(env);
    const auto start = std::chrono::steady_clock::now();
    auto spawn = [&]() -> bp::child {
        if (request.input) {
            return Spawn(invocation.exe, invocation.args, boost_env, working_dir,
                         bp::std_out > *out_stream,
                         bp::std_err > *err_stream,
                         bp::std_in < input_path.string());
        }
        return Spawn(invocation.exe, invocation.args, boost_env, working_dir,
                     bp::std_out > *out_stream,
                     bp::std_err > *err_stream,
                     bp::std_in < bp::null);
    };
    bp::child child_process;
    try {
        child_process = spawn();
    } catch (const bp::process_error&) {
        remove_input();
        throw;
    }
    // The child holds its own descriptor from here on.
    remove_input();
    const pid_t pid = child_process.id();

    const auto callback = request.on_line;
    auto reader = [state, callback](std::shared_ptr<bp::ipstream> stream, bool is_stdout) {
        const std::string tag = is_stdout ? "[STDOUT] " : "[STDERR] ";
        std::string line;
        while (std::getline(*stream, line)) {
            {
                std::lock_guard<std::mutex> lock(state->mutex);
                (is_stdout ? state->out : state->err) += line + "\n";
            }
            if (!callback) {
                continue;
            }
            try {
                callback(tag + RightTrim(line));
            } catch (const std::exception& ex) {
                std::lock_guard<std::mutex> lock(state->mutex);
                if (state->callback_error.empty()) {
                    state->callback_error = ex.what();
                }
            }
        }
        {
            std::lock_guard<std::mutex> lock(state->mutex);
            ++state->finished;
        }
        state->cv.notify_all();
    };
    std::thread stdout_thread(reader, out_stream, true);
    std::thread stderr_thread(reader, err_stream, false);

    int status = 0;
    bool timed_out = false;
    if (!WaitForExit(pid, start + timeout, status)) {
        timed_out = std::chrono::steady_clock::now() >= start + timeout;
        SignalProcessTree(pid, SIGKILL);
        ::waitpid(pid, &status, 0);
    }
    child_process.detach();

    bool readers_done = false;
    {
        std::unique_lock<std::mutex> lock(state->mutex);
        readers_done = state->cv.wait_for(lock, kReaderGrace, [&state] {
            return state->finished == 2;
        });
    }
    if (readers_done) {
        stdout_thread.join();
        stderr_thread.join();
    } else {
        logger_->Warn("[exec] output readers still blocked after grace period; abandoning them");
        stdout_thread.detach();
        stderr_thread.detach();
    }

    ExecResult result{};
    result.mode = invocation.mode;
    result.duration = SecondsSince(start);
    {
        std::lock_guard<std::mutex> lock(state->mutex);
        result.stdout_text = state->out;
        result.stderr_text = state->err;
        if (!state->callback_error.empty()) {
            logger_->Warn("[exec] line callback failed: " + state->callback_error);
        }
    }
    if (timed_out) {
        result.code = kExitTimeout;
        result.stderr_text += "\n" + TimeoutMessage(timeout);
    } else {
        result.code = DecodeWaitStatus(status);
    }
    return result;
}

ExecResult ShellExecutor::ExecuteScript(const std::string& script_path,
                                        const std::vector<std::string>& args,
                                        const std::string& interpreter,
                                        std::optional<std::chrono::seconds> timeout) const {
    namespace fs = std::filesystem;
    if (!fs::exists(script_path)) {
        throw std::runtime_error("Script not found: " + script_path);
    }

    std::error_code ec;
    const auto perms = fs::status(script_path, ec).permissions();
    if (!ec && (perms & fs::perms::owner_exec) == fs::perms::none) {
        logger_->Warn("[exec] Script " + script_path + " is not executable. Adding permission.");
        fs::permissions(script_path, fs::perms::owner_exec, fs::perm_options::add, ec);
        if (ec) {
            logger_->Warn("[exec] chmod failed for " + script_path + ": " + ec.message());
        }
    }

    std::string chosen = interpreter;
    if (chosen.empty()) {
        std::ifstream input(script_path);
        std::string first_line;
        std::getline(input, first_line);
        first_line = utils::Trim(first_line);
        if (utils::StartsWith(first_line, "#!")) {
            chosen = utils::Trim(first_line.substr(2));
            logger_->Info("[exec] Detected interpreter: " + chosen);
        }
    }

    ExecRequest request{};
    if (!chosen.empty()) {
        request.argv = SplitShellWords(chosen);
    }
    request.argv.push_back(script_path);
    request.argv.insert(request.argv.end(), args.begin(), args.end());
    request.timeout = timeout;
    return Execute(request);
}

}  // namespace evalbox::sandbox
