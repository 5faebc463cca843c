#include "utils/signals.hpp"

#include <csignal>
#include <signal.h>

namespace evalbox::utils {
namespace {

volatile std::sig_atomic_t g_signal = 0;

void HandleSignal(int signal) {
    g_signal = signal;
}

}  // namespace

void InstallShutdownHandlers() {
    struct sigaction action {};
    action.sa_handler = HandleSignal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);
}

bool ShutdownRequested() {
    return g_signal != 0;
}

int ShutdownSignal() {
    return g_signal;
}

void RequestShutdown(int signal) {
    g_signal = signal;
}

void ResetShutdown() {
    g_signal = 0;
}

}  // namespace evalbox::utils
