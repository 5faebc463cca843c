#pragma once

#include <chrono>
#include <map>
#include <string>
#include <vector>
#include <sys/types.h>
#include <unistd.h>

#include "sandbox/boost_process.hpp"

namespace evalbox::sandbox {

using EnvMap = std::map<std::string, std::string>;

// Search path pinned for children on Linux hosts.
constexpr const char* kSecurePath = "/bin:/usr/bin:/usr/local/bin";

EnvMap CurrentEnvironment();

// Host environment, then each overlay in order, then PATH pinned to kSecurePath on Linux.
EnvMap BuildEnvironment(const std::vector<const EnvMap*>& overlays, bool pin_path = true);

bp::environment ToBoostEnvironment(const EnvMap& env);

// Names containing '/' are returned unchanged; otherwise the first executable match in
// search_path, or an empty string.
std::string FindExecutable(const std::string& name, const std::string& search_path);

// Exit status for WIFEXITED, 128 + signal for WIFSIGNALED.
int DecodeWaitStatus(int status);

// Polls waitpid until the child is reaped or the deadline passes.
bool WaitForExit(pid_t pid, std::chrono::steady_clock::time_point deadline, int& status);

// Sends the signal to the child's process group and to the child itself.
void SignalProcessTree(pid_t pid, int signal);

// Exec-setup hook that moves the child into its own process group.
struct NewProcessGroup {
    template <typename Executor>
    void operator()(Executor&) const {
        ::setpgid(0, 0);
    }
};

}  // namespace evalbox::sandbox
