#include "sandbox/process_env.hpp"

#include <cerrno>
#include <filesystem>
#include <sstream>
#include <thread>
#include <signal.h>
#include <sys/wait.h>

extern char** environ;

namespace evalbox::sandbox {

EnvMap CurrentEnvironment() {
    EnvMap env;
    for (char** entry = environ; entry && *entry; ++entry) {
        const std::string item(*entry);
        const auto pos = item.find('=');
        if (pos == std::string::npos || pos == 0) {
            continue;
        }
        env[item.substr(0, pos)] = item.substr(pos + 1);
    }
    return env;
}

EnvMap BuildEnvironment(const std::vector<const EnvMap*>& overlays, bool pin_path) {
    auto env = CurrentEnvironment();
    for (const auto* overlay : overlays) {
        if (!overlay) {
            continue;
        }
        for (const auto& [key, value] : *overlay) {
            env[key] = value;
        }
    }
#if defined(__linux__)
    if (pin_path) {
        env["PATH"] = kSecurePath;
    }
#else
    (void)pin_path;
#endif
    return env;
}

bp::environment ToBoostEnvironment(const EnvMap& env) {
    bp::environment result;
    for (const auto& [key, value] : env) {
        result[key] = value;
    }
    return result;
}

std::string FindExecutable(const std::string& name, const std::string& search_path) {
    if (name.empty()) {
        return {};
    }
    if (name.find('/') != std::string::npos) {
        return name;
    }
    std::stringstream stream(search_path);
    std::string dir;
    while (std::getline(stream, dir, ':')) {
        if (dir.empty()) {
            continue;
        }
        const auto candidate = std::filesystem::path(dir) / name;
        std::error_code ec;
        if (std::filesystem::is_regular_file(candidate, ec)
            && ::access(candidate.c_str(), X_OK) == 0) {
            return candidate.string();
        }
    }
    return {};
}

int DecodeWaitStatus(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return status;
}

bool WaitForExit(pid_t pid, std::chrono::steady_clock::time_point deadline, int& status) {
    while (true) {
        const auto waited = ::waitpid(pid, &status, WNOHANG);
        if (waited == pid) {
            return true;
        }
        if (waited < 0 && errno != EINTR) {
            return false;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
}

void SignalProcessTree(pid_t pid, int signal) {
    if (pid <= 0) {
        return;
    }
    ::kill(-pid, signal);
    ::kill(pid, signal);
}

}  // namespace evalbox::sandbox
