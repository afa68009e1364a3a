#include "process_util.hpp"
#include "tether_log.hpp"
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <csignal>
#include <sstream>
#include <fcntl.h>
#include <poll.h>
#include <pthread.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

namespace tether {

namespace {

// Prevent excessive output from a misbehaving tool
constexpr size_t MAX_OUTPUT_BYTES = 1024 * 1024;
constexpr int POLL_INTERVAL_MS = 25;

void closeFd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

pid_t waitNoIntr(pid_t pid, int* status, int flags) {
    pid_t r;
    do {
        r = ::waitpid(pid, status, flags);
    } while (r < 0 && errno == EINTR);
    return r;
}

} // namespace

// =============================================================================
// Spawning
// =============================================================================

Result<pid_t> spawnProcess(const std::vector<std::string>& argv,
                           const SpawnOptions& opts) {
    if (argv.empty() || argv[0].empty()) {
        return Err<pid_t>(ErrorKind::LaunchError, "empty command line");
    }

    // Everything the child touches is prepared before fork()
    std::vector<char*> cargv;
    cargv.reserve(argv.size() + 1);
    for (const auto& a : argv) cargv.push_back(const_cast<char*>(a.c_str()));
    cargv.push_back(nullptr);

    int errpipe[2];
    if (::pipe2(errpipe, O_CLOEXEC) != 0) {
        int err = errno;
        return Err<pid_t>(ErrorKind::LaunchError,
                          std::string("pipe2 failed: ") + std::strerror(err), err);
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        int err = errno;
        ::close(errpipe[0]);
        ::close(errpipe[1]);
        return Err<pid_t>(ErrorKind::LaunchError,
                          std::string("fork failed: ") + std::strerror(err), err);
    }

    if (pid == 0) {
        // Child: async-signal-safe calls only
        ::close(errpipe[0]);
        if (opts.new_process_group) ::setpgid(0, 0);
        if (opts.stdin_devnull) {
            int devnull = ::open("/dev/null", O_RDONLY);
            if (devnull >= 0) {
                ::dup2(devnull, STDIN_FILENO);
                ::close(devnull);
            }
        }
        if (opts.stdout_fd >= 0) ::dup2(opts.stdout_fd, STDOUT_FILENO);
        if (opts.stderr_fd >= 0) ::dup2(opts.stderr_fd, STDERR_FILENO);

        sigset_t empty;
        sigemptyset(&empty);
        ::sigprocmask(SIG_SETMASK, &empty, nullptr);
        ::signal(SIGPIPE, SIG_DFL);

        ::execvp(cargv[0], cargv.data());
        int err = errno;
        ssize_t ignored = ::write(errpipe[1], &err, sizeof(err));
        (void)ignored;
        ::_exit(127);
    }

    // Parent
    ::close(errpipe[1]);
    if (opts.new_process_group) ::setpgid(pid, pid);  // EACCES after exec is fine

    int child_errno = 0;
    ssize_t n;
    do {
        n = ::read(errpipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    ::close(errpipe[0]);

    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        waitNoIntr(pid, nullptr, 0);
        return Err<pid_t>(ErrorKind::LaunchError,
                          "cannot execute '" + argv[0] + "': " + std::strerror(child_errno),
                          child_errno);
    }

    TLOG_DEBUG("process", "Spawned pid %d: %s", (int)pid, joinArgs(argv).c_str());
    return Ok(pid);
}

int decodeWaitStatus(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return -WTERMSIG(status);
    return -1;
}

// =============================================================================
// Run to completion
// =============================================================================

Result<CommandOutput> runCommand(const std::vector<std::string>& argv,
                                 std::chrono::milliseconds timeout) {
    int out[2];
    if (::pipe2(out, O_CLOEXEC) != 0) {
        int err = errno;
        return Err<CommandOutput>(ErrorKind::IoError,
                                  std::string("pipe2 failed: ") + std::strerror(err), err);
    }

    SpawnOptions opts;
    opts.stdout_fd = out[1];
    opts.stderr_fd = out[1];
    auto spawned = spawnProcess(argv, opts);
    closeFd(out[1]);

    if (spawned.is_err()) {
        closeFd(out[0]);
        Error e = spawned.error();
        if (e.code == ENOENT || e.code == EACCES || e.code == ENOTDIR) {
            e.kind = ErrorKind::ToolUnavailable;
        }
        return e;
    }
    pid_t pid = spawned.value();

    ::fcntl(out[0], F_SETFL, ::fcntl(out[0], F_GETFL) | O_NONBLOCK);

    CommandOutput result;
    auto deadline = std::chrono::steady_clock::now() + timeout;
    bool eof = false;
    bool exited = false;
    int status = 0;
    char buffer[4096];

    auto drain = [&]() {
        while (true) {
            ssize_t r = ::read(out[0], buffer, sizeof(buffer));
            if (r > 0) {
                if (result.output.size() < MAX_OUTPUT_BYTES) {
                    result.output.append(buffer, static_cast<size_t>(r));
                }
                continue;
            }
            if (r == 0) eof = true;
            if (r < 0 && errno == EINTR) continue;
            break;
        }
    };

    while (true) {
        if (!eof) {
            pollfd pfd{out[0], POLLIN, 0};
            int pr = ::poll(&pfd, 1, POLL_INTERVAL_MS);
            if (pr > 0) drain();
        } else {
            ::usleep(POLL_INTERVAL_MS * 1000);
        }

        if (!exited && waitNoIntr(pid, &status, WNOHANG) == pid) {
            exited = true;
        }
        if (exited) {
            // A daemonized grandchild may keep the pipe open; take what is there
            drain();
            break;
        }

        if (std::chrono::steady_clock::now() >= deadline) {
            TLOG_WARN("process", "Timed out after %lld ms: %s",
                      (long long)timeout.count(), joinArgs(argv).c_str());
            ::kill(-pid, SIGKILL);
            ::kill(pid, SIGKILL);
            waitNoIntr(pid, nullptr, 0);
            closeFd(out[0]);
            return Err<CommandOutput>(ErrorKind::Timeout,
                                      "'" + argv[0] + "' timed out");
        }
    }

    closeFd(out[0]);
    if (result.output.size() >= MAX_OUTPUT_BYTES) {
        TLOG_WARN("process", "Output truncated (exceeded 1MB)");
        result.output.resize(MAX_OUTPUT_BYTES);
    }
    result.exit_code = decodeWaitStatus(status);
    return Ok(std::move(result));
}

// =============================================================================
// Executable lookup
// =============================================================================

bool isExecutableFile(const std::string& path) {
    struct stat st;
    if (::stat(path.c_str(), &st) != 0) return false;
    return S_ISREG(st.st_mode) && ::access(path.c_str(), X_OK) == 0;
}

std::optional<std::string> findExecutable(const std::string& name,
                                          const std::vector<std::string>& candidates) {
    for (const auto& c : candidates) {
        if (isExecutableFile(c)) {
            TLOG_DEBUG("process", "Found local %s at: %s", name.c_str(), c.c_str());
            return c;
        }
    }

    if (name.empty()) return std::nullopt;
    if (name.find('/') != std::string::npos) {
        if (isExecutableFile(name)) return name;
        return std::nullopt;
    }

    const char* path_env = std::getenv("PATH");
    if (!path_env) return std::nullopt;

    std::istringstream iss(path_env);
    std::string dir;
    while (std::getline(iss, dir, ':')) {
        if (dir.empty()) dir = ".";
        std::string full = dir + "/" + name;
        if (isExecutableFile(full)) return full;
    }
    return std::nullopt;
}

std::vector<std::string> adbCandidates(const std::string& app_dir) {
    if (app_dir.empty()) return {};
    return {
        app_dir + "/platform-tools/adb",
        app_dir + "/adb",
        app_dir + "/bin/adb",
        app_dir + "/scrcpy/adb",
    };
}

std::vector<std::string> scrcpyCandidates(const std::string& app_dir) {
    if (app_dir.empty()) return {};
    return {
        app_dir + "/scrcpy/scrcpy",
        app_dir + "/scrcpy",
        app_dir + "/bin/scrcpy",
    };
}

// =============================================================================
// Stop signals
// =============================================================================

sigset_t blockStopSignals() {
    sigset_t set;
    sigemptyset(&set);
    sigaddset(&set, SIGINT);
    sigaddset(&set, SIGTERM);
    int rc = ::pthread_sigmask(SIG_BLOCK, &set, nullptr);
    if (rc != 0) {
        TLOG_ERROR("process", "pthread_sigmask failed: %s", strerror(rc));
    }
    return set;
}

int waitForStopSignal(const sigset_t& signals, std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        auto left = std::chrono::duration_cast<std::chrono::nanoseconds>(
            deadline - std::chrono::steady_clock::now());
        if (left.count() < 0) left = std::chrono::nanoseconds(0);
        timespec ts{static_cast<time_t>(left.count() / 1000000000),
                    static_cast<long>(left.count() % 1000000000)};
        int sig = ::sigtimedwait(&signals, nullptr, &ts);
        if (sig > 0) return sig;
        if (errno == EAGAIN) return 0;
        if (errno != EINTR) {
            TLOG_ERROR("process", "sigtimedwait failed: %s", strerror(errno));
            return 0;
        }
    }
}

std::string joinArgs(const std::vector<std::string>& argv) {
    std::string s;
    for (size_t i = 0; i < argv.size(); ++i) {
        if (i) s += ' ';
        s += argv[i];
    }
    return s;
}

} // namespace tether
