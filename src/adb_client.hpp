#pragma once
#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include "process_util.hpp"
#include "result.hpp"

namespace tether {

/**
 * Thin adb front end: device listing, model lookup and availability check.
 * All invocations go through a CommandRunner so tests can script adb output.
 */
class AdbClient {
public:
    using CommandRunner = std::function<Result<CommandOutput>(
        const std::vector<std::string>& argv, std::chrono::milliseconds timeout)>;

    struct DeviceLine {
        std::string id;
        std::string status;  // "device", "offline", "unauthorized", ...
    };

    static constexpr std::chrono::milliseconds LIST_TIMEOUT{10000};
    static constexpr std::chrono::milliseconds NAME_TIMEOUT{5000};
    static constexpr std::chrono::milliseconds VERSION_TIMEOUT{5000};

    // runner == nullptr uses runCommand()
    explicit AdbClient(std::string adb_path = "adb", CommandRunner runner = nullptr);

    // Parses `adb devices` output. Lines without a tab (header, daemon
    // notices) and mDNS service records are ignored.
    static std::vector<DeviceLine> parseDevices(const std::string& output);

    // Errors: ToolUnavailable, Timeout, LaunchError, Other (non-zero exit)
    Result<std::vector<DeviceLine>> listDevices() const;

    // ro.product.model, or nullopt when empty / failed
    std::optional<std::string> deviceName(const std::string& device_id) const;

    // `adb version` exits 0 within VERSION_TIMEOUT
    bool isAvailable() const;

    const std::string& adbPath() const { return adb_path_; }

private:
    Result<CommandOutput> run(const std::vector<std::string>& args,
                              std::chrono::milliseconds timeout) const;

    std::string adb_path_;
    CommandRunner runner_;
};

/**
 * Validate ADB device ID format (serial or host:port).
 * Rejects shell metacharacters; ids end up on command lines.
 */
bool isValidAdbId(const std::string& adb_id);

} // namespace tether
