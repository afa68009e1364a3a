// =============================================================================
// Tether - Command-line front end
// =============================================================================
//   tether [--config PATH] [--log-level LEVEL] <command>
//     devices               list attached devices
//     check                 report adb / scrcpy availability
//     run [DEVICE] [--force] mirror until SIGINT/SIGTERM
//     set KEY VALUE         validated settings edit
//     config                print persisted settings
//     reset                 restore default settings
// =============================================================================

#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <string>
#include <vector>
#include <signal.h>
#include <nlohmann/json.hpp>

#include "tether_log.hpp"
#include "tether_config.hpp"
#include "adb_client.hpp"
#include "config_store.hpp"
#include "device_registry.hpp"
#include "process_orchestrator.hpp"
#include "process_util.hpp"

using namespace tether;

namespace {

constexpr int EXIT_OK = 0;
constexpr int EXIT_FAIL = 1;
constexpr int EXIT_USAGE = 2;

void printUsage() {
    fprintf(stderr,
        "usage: tether [--config PATH] [--log-level LEVEL] <command>\n"
        "\n"
        "commands:\n"
        "  devices                 list attached devices\n"
        "  check                   report adb / scrcpy availability\n"
        "  run [DEVICE] [--force]  mirror a device until interrupted\n"
        "  set KEY VALUE           change a persisted setting\n"
        "  config                  print persisted settings\n"
        "  reset                   restore default settings\n");
}

std::string resolveAdb(const config::SystemConfig& sys) {
    if (!sys.adb_path.empty()) return sys.adb_path;
    auto found = findExecutable("adb", adbCandidates(sys.app_directory));
    return found ? *found : "adb";
}

// =============================================================================
// devices
// =============================================================================

int cmdDevices(DeviceRegistry& registry) {
    auto result = registry.refreshChecked();
    if (result.is_err()) {
        fprintf(stderr, "adb failed: %s\n", result.error().describe().c_str());
        return EXIT_FAIL;
    }

    const auto& list = result.value();
    if (list.empty()) {
        printf("No devices attached\n");
        return EXIT_OK;
    }
    for (const auto& d : list) {
        printf("%-24s %-14s %s\n", d.id.c_str(), d.status.c_str(), d.display_name.c_str());
    }
    return EXIT_OK;
}

// =============================================================================
// check
// =============================================================================

int cmdCheck(const config::SystemConfig& sys, const AdbClient& adb) {
    bool adb_ok = adb.isAvailable();
    printf("adb:    %s (%s)\n", adb_ok ? "ok" : "unavailable", adb.adbPath().c_str());

    std::optional<std::string> scrcpy;
    if (!sys.scrcpy_path.empty()) {
        if (isExecutableFile(sys.scrcpy_path)) scrcpy = sys.scrcpy_path;
    } else {
        scrcpy = findExecutable("scrcpy", scrcpyCandidates(sys.app_directory));
    }
    printf("scrcpy: %s", scrcpy ? "ok" : "unavailable");
    if (scrcpy) printf(" (%s)", scrcpy->c_str());
    printf("\n");

    return (adb_ok && scrcpy) ? EXIT_OK : EXIT_FAIL;
}

// =============================================================================
// run
// =============================================================================

std::string pickDevice(const std::string& requested, const config::ConfigStore& store,
                       const DeviceRegistry& registry) {
    if (!requested.empty()) return requested;

    auto last = store.config().last_selected_device;
    if (!last.empty() && registry.isConnected(last)) return last;

    auto ids = registry.deviceIds();
    if (ids.size() == 1) return ids.front();
    return last;
}

// stop_signals must already be blocked (see main)
int cmdRun(const config::SystemConfig& sys, config::ConfigStore& store,
           DeviceRegistry& registry, const std::string& requested, bool force,
           const sigset_t& stop_signals) {
    auto listed = registry.refreshChecked();
    if (listed.is_err()) {
        fprintf(stderr, "adb failed: %s\n", listed.error().describe().c_str());
        return EXIT_FAIL;
    }

    std::string device = pickDevice(requested, store, registry);
    if (auto sel = registry.selectDevice(device); sel.is_err()) {
        fprintf(stderr, "%s\n", sel.error().message.c_str());
        return EXIT_FAIL;
    }

    auto settings = store.config();

    ProcessOrchestrator::Options opts;
    opts.scrcpy_path = sys.scrcpy_path;
    opts.app_directory = sys.app_directory;
    opts.skip_process_check = settings.skip_process_check;
    opts.force_start = force;

    ProcessOrchestrator orchestrator(registry, opts);
    orchestrator.configureAutoReconnect(
        settings.auto_reconnect_enabled, settings.reconnect_max_attempts,
        std::chrono::milliseconds(static_cast<long long>(settings.reconnect_delay * 1000.0)));

    auto& bus = orchestrator.events();
    std::vector<SubscriptionHandle> subs;
    subs.push_back(bus.subscribe<ProcessStartedEvent>([](const ProcessStartedEvent& e) {
        printf("[started] %s pid=%d\n", e.config.device_id.c_str(), e.pid);
        fflush(stdout);
    }));
    subs.push_back(bus.subscribe<ProcessStoppedEvent>([](const ProcessStoppedEvent& e) {
        if (e.exit_code) printf("[stopped] exit=%d\n", *e.exit_code);
        else printf("[stopped]\n");
        fflush(stdout);
    }));
    subs.push_back(bus.subscribe<ProcessErrorEvent>([](const ProcessErrorEvent& e) {
        printf("[error] %s\n", e.message.c_str());
        fflush(stdout);
    }));
    subs.push_back(bus.subscribe<ReconnectAttemptEvent>([](const ReconnectAttemptEvent& e) {
        printf("[reconnect] %s attempt %d\n", e.device_id.c_str(), e.attempt);
        fflush(stdout);
    }));
    subs.push_back(bus.subscribe<ReconnectSuccessEvent>([](const ReconnectSuccessEvent& e) {
        printf("[reconnected] %s after %d attempt(s)\n", e.device_id.c_str(), e.attempts);
        fflush(stdout);
    }));
    subs.push_back(registry.events().subscribe<DeviceConnectedEvent>(
        [](const DeviceConnectedEvent& e) {
            printf("[device+] %s (%s)\n", e.device_id.c_str(), e.display_name.c_str());
            fflush(stdout);
        }));
    subs.push_back(registry.events().subscribe<DeviceDisconnectedEvent>(
        [](const DeviceDisconnectedEvent& e) {
            printf("[device-] %s\n", e.device_id.c_str());
            fflush(stdout);
        }));

    registry.startMonitoring(std::chrono::milliseconds(
        static_cast<long long>(settings.device_refresh_interval * 1000.0)));

    auto started = orchestrator.startSession(store.sessionConfig(device));
    if (started.is_err()) {
        fprintf(stderr, "Failed to start: %s\n", started.error().describe().c_str());
        registry.stopMonitoring();
        return EXIT_FAIL;
    }
    store.set("last_selected_device", device);

    while (orchestrator.state() != ProcessOrchestrator::State::Stopped) {
        int sig = waitForStopSignal(stop_signals, std::chrono::milliseconds(200));
        if (sig > 0) {
            TLOG_INFO("main", "Received %s, stopping", strsignal(sig));
            break;
        }
    }

    auto stopped = orchestrator.stopSession();
    registry.stopMonitoring();
    if (stopped.is_err()) {
        fprintf(stderr, "%s\n", stopped.error().describe().c_str());
        return EXIT_FAIL;
    }
    return EXIT_OK;
}

// =============================================================================
// set / config / reset
// =============================================================================

int cmdSet(config::ConfigStore& store, const std::string& key, const std::string& text) {
    if (!config::ConfigStore::isKnownKey(key)) {
        fprintf(stderr, "Unknown setting: %s\n", key.c_str());
        return EXIT_FAIL;
    }

    // JSON literal when it parses ("true", "30", "[\"--turn-screen-off\"]"), else a string
    nlohmann::json value = nlohmann::json::parse(text, nullptr, false);
    if (value.is_discarded()) value = text;

    auto result = store.set(key, value);
    if (result.is_err()) {
        fprintf(stderr, "%s: %s\n", key.c_str(), result.error().message.c_str());
        return EXIT_FAIL;
    }
    store.flush();
    return EXIT_OK;
}

int cmdConfig(const config::ConfigStore& store) {
    printf("%s\n", store.document().dump(4).c_str());
    return EXIT_OK;
}

int cmdReset(config::ConfigStore& store) {
    store.resetToDefaults();
    auto saved = store.save();
    if (saved.is_err()) {
        fprintf(stderr, "%s\n", saved.error().describe().c_str());
        return EXIT_FAIL;
    }
    return EXIT_OK;
}

} // namespace

int main(int argc, char* argv[]) {
    config::SystemConfig sys;
    config::applyEnvironmentOverrides(sys);

    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--config" && i + 1 < argc) {
            sys.config_path = argv[++i];
        } else if (a == "--log-level" && i + 1 < argc) {
            sys.log_level = argv[++i];
            sys.console_log_level = sys.log_level;
        } else if (a == "-h" || a == "--help") {
            printUsage();
            return EXIT_OK;
        } else {
            args.push_back(a);
        }
    }
    if (args.empty()) {
        printUsage();
        return EXIT_USAGE;
    }

    log::setFileLevel(log::parseLogLevel(sys.log_level));
    log::setConsoleLevel(log::parseLogLevel(sys.console_log_level, log::Level::Warn));
    if (sys.log_to_file) {
        std::error_code ec;
        std::filesystem::create_directories(sys.log_directory, ec);
        if (ec || !log::openLogFile(sys.logFilePath().c_str())) {
            fprintf(stderr, "warning: cannot open log file %s\n", sys.logFilePath().c_str());
        }
    }
    TLOG_INFO("main", "Tether starting (config %s)", sys.config_path.c_str());

    // run collects SIGINT/SIGTERM itself. Block them before ConfigStore starts
    // its writer thread so no thread is left with the default action.
    sigset_t stop_signals;
    sigemptyset(&stop_signals);
    if (args[0] == "run") stop_signals = blockStopSignals();

    int rc = EXIT_USAGE;
    {
        config::ConfigStore store(sys.config_path);
        store.load();

        AdbClient adb(resolveAdb(sys));
        DeviceRegistry registry(adb);

        const std::string& cmd = args[0];
        if (cmd == "devices" && args.size() == 1) {
            rc = cmdDevices(registry);
        } else if (cmd == "check" && args.size() == 1) {
            rc = cmdCheck(sys, adb);
        } else if (cmd == "run" && args.size() <= 3) {
            std::string device;
            bool force = false;
            bool ok = true;
            for (size_t i = 1; i < args.size(); ++i) {
                if (args[i] == "--force") force = true;
                else if (device.empty()) device = args[i];
                else ok = false;
            }
            if (ok) rc = cmdRun(sys, store, registry, device, force, stop_signals);
            else printUsage();
        } else if (cmd == "set" && args.size() == 3) {
            rc = cmdSet(store, args[1], args[2]);
        } else if (cmd == "config" && args.size() == 1) {
            rc = cmdConfig(store);
        } else if (cmd == "reset" && args.size() == 1) {
            rc = cmdReset(store);
        } else {
            printUsage();
        }
    }

    TLOG_INFO("main", "Tether exiting (%d)", rc);
    log::closeLogFile();
    return rc;
}
