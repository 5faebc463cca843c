#include "supervisor/process_handle.hpp"

#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <signal.h>
#include <sys/wait.h>

namespace evalbox::supervisor {
namespace {

std::string ResolveExecutable(const CommandLine& command, const sandbox::EnvMap& env) {
    if (command.empty()) {
        throw std::runtime_error("empty command");
    }
    const auto path = env.find("PATH");
    const auto exe = sandbox::FindExecutable(
        command.front(), path == env.end() ? sandbox::kSecurePath : path->second);
    if (exe.empty()) {
        throw std::runtime_error("executable not found: " + command.front());
    }
    return exe;
}

}  // namespace

BoostProcessHandle::BoostProcessHandle(const CommandLine& command, const sandbox::EnvMap& env)
    : stdout_(std::make_shared<bp::ipstream>())
    , stderr_(std::make_shared<bp::ipstream>()) {
    const auto exe = ResolveExecutable(command, env);
    const std::vector<std::string> args(command.begin() + 1, command.end());
    child_ = bp::child(
        bp::exe = exe,
        bp::args = args,
        sandbox::ToBoostEnvironment(env),
        bp::std_out > *stdout_,
        bp::std_err > *stderr_,
        bp::std_in < bp::null);
    pid_ = child_.id();
}

BoostProcessHandle::~BoostProcessHandle() {
    if (child_.valid()) {
        child_.detach();
    }
}

std::optional<int> BoostProcessHandle::Poll() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (exit_code_) {
        return exit_code_;
    }
    int status = 0;
    const auto waited = ::waitpid(pid_, &status, WNOHANG);
    if (waited == pid_) {
        exit_code_ = sandbox::DecodeWaitStatus(status);
    }
    return exit_code_;
}

std::optional<int> BoostProcessHandle::WaitFor(std::chrono::milliseconds timeout) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (exit_code_) {
        return exit_code_;
    }
    int status = 0;
    if (sandbox::WaitForExit(pid_, std::chrono::steady_clock::now() + timeout, status)) {
        exit_code_ = sandbox::DecodeWaitStatus(status);
    }
    return exit_code_;
}

void BoostProcessHandle::Signal(int signal) {
    if (Poll()) {
        return;
    }
    if (::kill(pid_, signal) != 0 && errno != ESRCH) {
        throw std::runtime_error("kill(" + std::to_string(pid_) + ") failed: " + std::strerror(errno));
    }
}

void BoostProcessHandle::Terminate() {
    Signal(SIGTERM);
}

void BoostProcessHandle::Kill() {
    Signal(SIGKILL);
}

std::unique_ptr<ProcessHandle> LaunchBoostProcess(const CommandLine& command, const sandbox::EnvMap& env) {
    return std::make_unique<BoostProcessHandle>(command, sandbox::BuildEnvironment({&env}, false));
}

}  // namespace evalbox::supervisor
