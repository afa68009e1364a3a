#include "session_config.hpp"
#include <cmath>
#include <cstdio>
#include <cstdlib>

namespace tether {

namespace {

constexpr double MAX_BITRATE_MBPS = 1000.0;
constexpr int MIN_FPS = 1;
constexpr int MAX_FPS = 240;
constexpr int MAX_MAX_SIZE = 16384;

struct ResolutionEntry {
    const char* name;
    int max_size;
};

constexpr ResolutionEntry kResolutions[] = {
    {"Original Device Resolution", 0},
    {"720p", 1280},
    {"1080p", 1920},
    {"4K", 3840},
};

} // namespace

Result<void> validateSessionConfig(const SessionConfig& cfg) {
    if (cfg.device_id.empty()) {
        return Err<void>(ErrorKind::ValidationError, "No device selected");
    }
    if (!std::isfinite(cfg.bitrate_mbps) || cfg.bitrate_mbps <= 0.0 ||
        cfg.bitrate_mbps > MAX_BITRATE_MBPS) {
        char buf[96];
        snprintf(buf, sizeof(buf), "bitrate_mbps must be in (0, 1000], got %g", cfg.bitrate_mbps);
        return Err<void>(ErrorKind::ValidationError, buf);
    }
    if (cfg.max_fps < MIN_FPS || cfg.max_fps > MAX_FPS) {
        return Err<void>(ErrorKind::ValidationError,
                         "max_fps must be in [1, 240], got " + std::to_string(cfg.max_fps));
    }
    if (cfg.max_size < 0 || cfg.max_size > MAX_MAX_SIZE) {
        return Err<void>(ErrorKind::ValidationError,
                         "max_size out of range: " + std::to_string(cfg.max_size));
    }
    return Ok();
}

std::vector<std::string> buildScrcpyArgs(const SessionConfig& cfg) {
    std::vector<std::string> args = {
        "-s", cfg.device_id,
        "-b", formatBitrate(cfg.bitrate_mbps) + "M",
        "--max-fps", std::to_string(cfg.max_fps),
    };

    if (cfg.max_size > 0) {
        args.push_back("--max-size");
        args.push_back(std::to_string(cfg.max_size));
    }

    if (cfg.fullscreen) args.push_back("-f");

    switch (cfg.audio_mode) {
        case AudioMode::Playback:   args.push_back("--audio-source=playback"); break;
        case AudioMode::Microphone: args.push_back("--audio-source=mic-voice-communication"); break;
        case AudioMode::None:       args.push_back("--no-audio"); break;
    }

    if (cfg.no_control) args.push_back("--no-control");

    args.insert(args.end(), cfg.extra_args.begin(), cfg.extra_args.end());
    return args;
}

const char* audioModeDisplayName(AudioMode mode) {
    switch (mode) {
        case AudioMode::Playback:   return "Audio Playback";
        case AudioMode::Microphone: return "Microphone";
        case AudioMode::None:       return "No audio";
    }
    return "Audio Playback";
}

bool audioModeFromDisplayName(const std::string& name, AudioMode& out) {
    if (name == "Audio Playback") { out = AudioMode::Playback; return true; }
    if (name == "Microphone")     { out = AudioMode::Microphone; return true; }
    if (name == "No audio")       { out = AudioMode::None; return true; }
    return false;
}

int maxSizeFromResolution(const std::string& resolution) {
    for (const auto& r : kResolutions) {
        if (resolution == r.name) return r.max_size;
    }
    return 0;
}

bool resolutionFromMaxSize(int max_size, std::string& out) {
    for (const auto& r : kResolutions) {
        if (max_size == r.max_size) { out = r.name; return true; }
    }
    return false;
}

bool parseBitrate(const std::string& text, double& out_mbps) {
    size_t begin = text.find_first_not_of(" \t");
    size_t end = text.find_last_not_of(" \t");
    if (begin == std::string::npos) return false;
    std::string s = text.substr(begin, end - begin + 1);
    if (!s.empty() && (s.back() == 'M' || s.back() == 'm')) s.pop_back();
    if (s.empty()) return false;

    char* parse_end = nullptr;
    double v = std::strtod(s.c_str(), &parse_end);
    if (parse_end != s.c_str() + s.size() || !std::isfinite(v)) return false;
    out_mbps = v;
    return true;
}

std::string formatBitrate(double mbps) {
    // Shortest of %.15g / %.17g that parses back to the same double
    char buf[40];
    snprintf(buf, sizeof(buf), "%.15g", mbps);
    if (std::strtod(buf, nullptr) != mbps) {
        snprintf(buf, sizeof(buf), "%.17g", mbps);
    }
    return buf;
}

} // namespace tether
