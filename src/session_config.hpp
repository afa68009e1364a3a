// =============================================================================
// Tether - Session Configuration
// =============================================================================
// Immutable parameters of one mirroring session. A reconnect restarts the
// executable with the exact same SessionConfig.
// =============================================================================
#pragma once
#include <string>
#include <vector>
#include "result.hpp"

namespace tether {

enum class AudioMode { Playback, Microphone, None };

struct SessionConfig {
    std::string device_id;
    double bitrate_mbps = 20.0;      // (0, 1000]
    int max_fps = 60;                // [1, 240]
    bool fullscreen = false;
    AudioMode audio_mode = AudioMode::Playback;
    std::vector<std::string> extra_args;
    bool no_control = false;
    int max_size = 0;                // longest edge in px; 0 = device resolution

    bool operator==(const SessionConfig& o) const {
        return device_id == o.device_id && bitrate_mbps == o.bitrate_mbps &&
               max_fps == o.max_fps && fullscreen == o.fullscreen &&
               audio_mode == o.audio_mode && extra_args == o.extra_args &&
               no_control == o.no_control && max_size == o.max_size;
    }
    bool operator!=(const SessionConfig& o) const { return !(*this == o); }
};

// ValidationError naming the first offending field
Result<void> validateSessionConfig(const SessionConfig& cfg);

// Arguments after the executable name:
//   -s ID -b <N>M --max-fps N [--max-size N] [-f] <audio> [--no-control] extra...
std::vector<std::string> buildScrcpyArgs(const SessionConfig& cfg);

// Persisted display names ("Audio Playback", "Microphone", "No audio")
const char* audioModeDisplayName(AudioMode mode);
bool audioModeFromDisplayName(const std::string& name, AudioMode& out);

// "Original Device Resolution" -> 0, "720p" -> 1280, "1080p" -> 1920, "4K" -> 3840
// resolutionFromMaxSize fails for sizes outside the table.
int maxSizeFromResolution(const std::string& resolution);
bool resolutionFromMaxSize(int max_size, std::string& out);

// "20", "20M", "8.5m" -> megabits; false when not a number
bool parseBitrate(const std::string& text, double& out_mbps);
std::string formatBitrate(double mbps);  // round-trips through parseBitrate

} // namespace tether
