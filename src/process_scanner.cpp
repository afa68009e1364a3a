#include "process_scanner.hpp"
#include "tether_log.hpp"
#include <cctype>
#include <cerrno>
#include <csignal>
#include <fstream>
#include <thread>
#include <dirent.h>
#include <unistd.h>

namespace tether {

namespace {

bool isNumeric(const char* s) {
    if (!*s) return false;
    for (; *s; ++s) {
        if (!std::isdigit(static_cast<unsigned char>(*s))) return false;
    }
    return true;
}

} // namespace

// A zombie counts as gone: it holds no resources and only its parent can reap it
bool ProcessScanner::alive(pid_t pid) const {
    if (::kill(pid, 0) != 0 && errno != EPERM) return false;

    std::ifstream stat(proc_root_ + "/" + std::to_string(pid) + "/stat");
    std::string line;
    if (!std::getline(stat, line)) return false;
    size_t paren = line.rfind(')');
    if (paren == std::string::npos || paren + 2 >= line.size()) return true;
    return line[paren + 2] != 'Z';
}

ProcessScanner::ProcessScanner(std::string process_name, std::string proc_root)
    : process_name_(std::move(process_name)), proc_root_(std::move(proc_root)) {}

std::vector<pid_t> ProcessScanner::find() const {
    std::vector<pid_t> pids;

    DIR* dir = ::opendir(proc_root_.c_str());
    if (!dir) {
        TLOG_WARN("scan", "Cannot open %s, skipping process check", proc_root_.c_str());
        return pids;
    }

    const pid_t self = ::getpid();
    while (dirent* entry = ::readdir(dir)) {
        if (!isNumeric(entry->d_name)) continue;

        std::ifstream comm(proc_root_ + "/" + entry->d_name + "/comm");
        if (!comm.is_open()) continue;  // exited between readdir and open

        std::string name;
        std::getline(comm, name);
        if (name != process_name_) continue;

        pid_t pid = static_cast<pid_t>(std::stol(entry->d_name));
        if (pid != self) pids.push_back(pid);
    }
    ::closedir(dir);

    if (!pids.empty()) {
        TLOG_DEBUG("scan", "Found %zu running '%s' process(es)", pids.size(), process_name_.c_str());
    }
    return pids;
}

int ProcessScanner::killAll(std::chrono::milliseconds grace) const {
    auto pids = find();
    int signalled = 0;

    for (pid_t pid : pids) {
        if (::kill(pid, SIGTERM) == 0) {
            ++signalled;
            TLOG_INFO("scan", "Sent SIGTERM to existing %s pid %d", process_name_.c_str(), (int)pid);
        } else {
            TLOG_WARN("scan", "Cannot signal pid %d (errno %d)", (int)pid, errno);
        }
    }
    if (signalled == 0) return 0;

    auto deadline = std::chrono::steady_clock::now() + grace;
    while (std::chrono::steady_clock::now() < deadline) {
        bool any = false;
        for (pid_t pid : pids) {
            if (alive(pid)) { any = true; break; }
        }
        if (!any) return signalled;
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }

    for (pid_t pid : pids) {
        if (alive(pid)) {
            TLOG_WARN("scan", "pid %d ignored SIGTERM, killing", (int)pid);
            ::kill(pid, SIGKILL);
        }
    }
    return signalled;
}

} // namespace tether
