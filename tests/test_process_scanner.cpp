// =============================================================================
// Tether - ProcessScanner Tests
// =============================================================================

#include <gtest/gtest.h>
#include <algorithm>
#include <csignal>
#include <sys/wait.h>
#include "process_scanner.hpp"
#include "process_util.hpp"
#include "test_helpers.hpp"

using namespace tether;
using namespace std::chrono_literals;
using tether::test::TempDir;

namespace {

void fakeProcess(const TempDir& root, const std::string& pid, const std::string& comm) {
    std::filesystem::create_directories(root.file(pid));
    tether::test::writeFile(root.file(pid) + "/comm", comm + "\n");
}

} // namespace

// =============================================================================
// find() over a synthetic /proc
// =============================================================================

TEST(ProcessScannerTest, MatchesCommExactly) {
    TempDir proc;
    fakeProcess(proc, "100", "scrcpy");
    fakeProcess(proc, "200", "adb");
    fakeProcess(proc, "300", "scrcpy-server");
    fakeProcess(proc, "400", "scrcpy");
    std::filesystem::create_directories(proc.file("self"));
    std::filesystem::create_directories(proc.file("500"));  // exited: no comm

    ProcessScanner scanner("scrcpy", proc.path());
    auto pids = scanner.find();
    std::sort(pids.begin(), pids.end());

    EXPECT_EQ(pids, (std::vector<pid_t>{100, 400}));
    EXPECT_TRUE(scanner.anyRunning());
}

TEST(ProcessScannerTest, ExcludesOwnProcess) {
    TempDir proc;
    fakeProcess(proc, std::to_string(::getpid()), "scrcpy");

    ProcessScanner scanner("scrcpy", proc.path());
    EXPECT_TRUE(scanner.find().empty());
    EXPECT_FALSE(scanner.anyRunning());
}

TEST(ProcessScannerTest, MissingProcRootFindsNothing) {
    ProcessScanner scanner("scrcpy", "/nonexistent/tether-test/proc");
    EXPECT_TRUE(scanner.find().empty());
    EXPECT_EQ(scanner.killAll(100ms), 0);
}

// =============================================================================
// Real processes
// =============================================================================

TEST(ProcessScannerTest, FindsAndKillsRealProcess) {
    TempDir dir;
    // comm of a script is its file name (max 15 chars)
    std::string name = "tthr" + std::to_string(::getpid() % 100000);
    std::string path = dir.file(name);
    tether::test::writeScript(path, "while true; do sleep 0.05; done");

    auto spawned = spawnProcess({path});
    ASSERT_TRUE(spawned.is_ok());
    pid_t pid = spawned.value();

    ProcessScanner scanner(name);
    ASSERT_TRUE(tether::test::waitFor([&] {
        auto pids = scanner.find();
        return std::find(pids.begin(), pids.end(), pid) != pids.end();
    }));

    EXPECT_EQ(scanner.killAll(2000ms), 1);

    int status = 0;
    ASSERT_EQ(::waitpid(pid, &status, 0), pid);
    EXPECT_EQ(decodeWaitStatus(status), -SIGTERM);
    EXPECT_TRUE(scanner.find().empty());

    ::kill(-pid, SIGKILL);  // leftover sleep from the loop, if any
}

int main(int argc, char** argv) {
    testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
