// =============================================================================
// Tether - Process Utilities
// =============================================================================
// POSIX spawning helpers shared by AdbClient and ChildProcessHandle.
//   spawnProcess()  fork/exec with exec errors reported back to the parent
//   runCommand()    run to completion, capture output, kill on timeout
//   findExecutable() application-local candidates first, then PATH
// =============================================================================
#pragma once
#include <chrono>
#include <optional>
#include <string>
#include <vector>
#include <signal.h>
#include <sys/types.h>
#include "result.hpp"

namespace tether {

struct SpawnOptions {
    bool new_process_group = true;  // child leads its own group (kill(-pid))
    bool stdin_devnull = true;
    int stdout_fd = -1;             // -1: inherit
    int stderr_fd = -1;             // -1: inherit
};

// Starts argv[0] (resolved through PATH when it has no slash).
// Exec failure is reported as LaunchError with errno in Error::code.
Result<pid_t> spawnProcess(const std::vector<std::string>& argv,
                           const SpawnOptions& opts = {});

struct CommandOutput {
    int exit_code = 0;   // -signal when killed by a signal
    std::string output;  // stdout and stderr interleaved
};

// Errors: ToolUnavailable (missing / not executable), LaunchError, Timeout.
// A non-zero exit is not an error; inspect exit_code.
Result<CommandOutput> runCommand(const std::vector<std::string>& argv,
                                 std::chrono::milliseconds timeout);

// Decodes a waitpid() status: exit status, or -signal.
int decodeWaitStatus(int status);

bool isExecutableFile(const std::string& path);

// Returns the first executable among candidates, else the PATH match of
// name, else nullopt.
std::optional<std::string> findExecutable(const std::string& name,
                                          const std::vector<std::string>& candidates = {});

// Application-local locations checked before PATH.
std::vector<std::string> adbCandidates(const std::string& app_dir);
std::vector<std::string> scrcpyCandidates(const std::string& app_dir);

// Blocks SIGINT and SIGTERM in the calling thread. Must run before any
// thread is created: threads inherit the mask, and one left unblocked would
// take the default action and end the process.
sigset_t blockStopSignals();

// Collects one of the blocked signals. Returns it, or 0 on timeout.
int waitForStopSignal(const sigset_t& signals, std::chrono::milliseconds timeout);

// Joins argv for log output.
std::string joinArgs(const std::vector<std::string>& argv);

} // namespace tether
