#include "adb_client.hpp"
#include "tether_log.hpp"
#include <cctype>
#include <cstring>
#include <sstream>

namespace tether {

namespace {

// Dangerous shell metacharacters that could enable command injection
constexpr const char* SHELL_METACHARACTERS = "|;&$`\\\"'<>(){}[]!#*?~\n\r";

std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

} // namespace

bool isValidAdbId(const std::string& adb_id) {
    if (adb_id.empty() || adb_id.length() > 64) {
        return false;
    }

    for (char c : adb_id) {
        if (std::strchr(SHELL_METACHARACTERS, c) != nullptr) {
            TLOG_ERROR("adb", "Invalid character in device ID: '%c'", c);
            return false;
        }
    }

    // Must be alphanumeric, colons, dots, hyphens or underscores
    for (char c : adb_id) {
        if (!std::isalnum(static_cast<unsigned char>(c)) &&
            c != ':' && c != '.' && c != '-' && c != '_') {
            TLOG_WARN("adb", "Unexpected character in device ID: '%c'", c);
            return false;
        }
    }

    return true;
}

AdbClient::AdbClient(std::string adb_path, CommandRunner runner)
    : adb_path_(adb_path.empty() ? "adb" : std::move(adb_path)),
      runner_(std::move(runner)) {
    if (!runner_) runner_ = &runCommand;
}

Result<CommandOutput> AdbClient::run(const std::vector<std::string>& args,
                                     std::chrono::milliseconds timeout) const {
    std::vector<std::string> argv;
    argv.reserve(args.size() + 1);
    argv.push_back(adb_path_);
    argv.insert(argv.end(), args.begin(), args.end());
    return runner_(argv, timeout);
}

std::vector<AdbClient::DeviceLine> AdbClient::parseDevices(const std::string& output) {
    std::vector<DeviceLine> devices;

    std::istringstream iss(output);
    std::string line;
    while (std::getline(iss, line)) {
        if (line.find("List of devices") != std::string::npos) continue;

        // "device_id\tdevice" or "device_id\toffline"
        size_t tab_pos = line.find('\t');
        if (tab_pos == std::string::npos) continue;

        std::string id = trim(line.substr(0, tab_pos));
        std::string status = trim(line.substr(tab_pos + 1));
        if (id.empty()) continue;

        // Ignore mDNS ADB records (e.g. adb-XXXX._adb-tls-connect._tcp)
        if (id.rfind("adb-", 0) == 0 && id.find("._adb") != std::string::npos) {
            continue;
        }

        devices.push_back({id, status});
    }

    return devices;
}

Result<std::vector<AdbClient::DeviceLine>> AdbClient::listDevices() const {
    auto result = run({"devices"}, LIST_TIMEOUT);
    if (result.is_err()) {
        TLOG_DEBUG("adb", "'adb devices' failed: %s", result.error().describe().c_str());
        return result.error();
    }

    const auto& out = result.value();
    if (out.exit_code != 0) {
        return Err<std::vector<DeviceLine>>(
            ErrorKind::Other,
            "'adb devices' exited with " + std::to_string(out.exit_code) + ": " +
                trim(out.output).substr(0, 200),
            out.exit_code);
    }

    TLOG_TRACE("adb", "Raw adb output (%zu bytes)", out.output.size());
    return Ok(parseDevices(out.output));
}

std::optional<std::string> AdbClient::deviceName(const std::string& device_id) const {
    if (!isValidAdbId(device_id)) {
        TLOG_ERROR("adb", "Invalid device ID rejected: %s", device_id.c_str());
        return std::nullopt;
    }

    auto result = run({"-s", device_id, "shell", "getprop", "ro.product.model"}, NAME_TIMEOUT);
    if (result.is_err() || result.value().exit_code != 0) {
        return std::nullopt;
    }

    std::string name = trim(result.value().output);
    if (name.empty()) return std::nullopt;
    return name;
}

bool AdbClient::isAvailable() const {
    auto result = run({"version"}, VERSION_TIMEOUT);
    if (result.is_err()) {
        TLOG_WARN("adb", "adb not available: %s", result.error().describe().c_str());
        return false;
    }
    return result.value().exit_code == 0;
}

} // namespace tether
