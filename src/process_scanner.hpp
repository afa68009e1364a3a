#pragma once
#include <chrono>
#include <string>
#include <vector>
#include <sys/types.h>

namespace tether {

// =============================================================================
// ProcessScanner - advisory system-wide check for other mirroring instances
// =============================================================================
// Reads /proc/<pid>/comm. The result is racy by nature: a process may start
// or exit right after the scan.
class ProcessScanner {
public:
    explicit ProcessScanner(std::string process_name = "scrcpy",
                            std::string proc_root = "/proc");

    // Pids whose comm equals the process name, excluding this process
    std::vector<pid_t> find() const;
    bool anyRunning() const { return !find().empty(); }

    // SIGTERM each match, wait up to grace, then SIGKILL stragglers.
    // Returns how many were signalled.
    int killAll(std::chrono::milliseconds grace = std::chrono::milliseconds(3000)) const;

    const std::string& processName() const { return process_name_; }

private:
    bool alive(pid_t pid) const;

    std::string process_name_;
    std::string proc_root_;
};

} // namespace tether
