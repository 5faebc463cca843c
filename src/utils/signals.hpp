#pragma once

namespace evalbox::utils {

// Installs SIGINT/SIGTERM handlers that only record the signal number.
void InstallShutdownHandlers();

bool ShutdownRequested();
int ShutdownSignal();
void RequestShutdown(int signal);
void ResetShutdown();

}  // namespace evalbox::utils
