// =============================================================================
// Tether - SessionConfig Unit Tests
// =============================================================================

#include <gtest/gtest.h>
#include <algorithm>
#include "session_config.hpp"

using namespace tether;

namespace {

SessionConfig validConfig() {
    SessionConfig cfg;
    cfg.device_id = "ABC123";
    return cfg;
}

bool contains(const std::vector<std::string>& args, const std::string& s) {
    return std::find(args.begin(), args.end(), s) != args.end();
}

} // namespace

// =============================================================================
// Validation
// =============================================================================

TEST(SessionConfigTest, DefaultsAreValidOnceDeviceIsSet) {
    EXPECT_TRUE(validateSessionConfig(validConfig()).is_ok());
}

TEST(SessionConfigTest, EmptyDeviceRejected) {
    SessionConfig cfg;
    auto r = validateSessionConfig(cfg);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().kind, ErrorKind::ValidationError);
    EXPECT_EQ(r.error().message, "No device selected");
}

TEST(SessionConfigTest, BitrateBounds) {
    auto cfg = validConfig();

    cfg.bitrate_mbps = 0.0;
    EXPECT_TRUE(validateSessionConfig(cfg).is_err());
    cfg.bitrate_mbps = -5.0;
    EXPECT_TRUE(validateSessionConfig(cfg).is_err());
    cfg.bitrate_mbps = 1000.5;
    EXPECT_TRUE(validateSessionConfig(cfg).is_err());

    cfg.bitrate_mbps = 0.5;
    EXPECT_TRUE(validateSessionConfig(cfg).is_ok());
    cfg.bitrate_mbps = 1000.0;
    EXPECT_TRUE(validateSessionConfig(cfg).is_ok());
}

TEST(SessionConfigTest, FramerateBounds) {
    auto cfg = validConfig();

    cfg.max_fps = 0;
    EXPECT_TRUE(validateSessionConfig(cfg).is_err());
    cfg.max_fps = 241;
    EXPECT_TRUE(validateSessionConfig(cfg).is_err());

    cfg.max_fps = 1;
    EXPECT_TRUE(validateSessionConfig(cfg).is_ok());
    cfg.max_fps = 240;
    EXPECT_TRUE(validateSessionConfig(cfg).is_ok());
}

TEST(SessionConfigTest, NegativeMaxSizeRejected) {
    auto cfg = validConfig();
    cfg.max_size = -1;
    EXPECT_TRUE(validateSessionConfig(cfg).is_err());
}

// =============================================================================
// Argument building
// =============================================================================

TEST(SessionConfigTest, DefaultArguments) {
    auto args = buildScrcpyArgs(validConfig());

    EXPECT_EQ(args, (std::vector<std::string>{
        "-s", "ABC123", "-b", "20M", "--max-fps", "60", "--audio-source=playback"}));
}

TEST(SessionConfigTest, AllOptions) {
    auto cfg = validConfig();
    cfg.bitrate_mbps = 8.5;
    cfg.max_fps = 30;
    cfg.max_size = 1920;
    cfg.fullscreen = true;
    cfg.audio_mode = AudioMode::Microphone;
    cfg.no_control = true;
    cfg.extra_args = {"--turn-screen-off", "--stay-awake"};

    auto args = buildScrcpyArgs(cfg);

    EXPECT_EQ(args, (std::vector<std::string>{
        "-s", "ABC123", "-b", "8.5M", "--max-fps", "30", "--max-size", "1920", "-f",
        "--audio-source=mic-voice-communication", "--no-control",
        "--turn-screen-off", "--stay-awake"}));
}

TEST(SessionConfigTest, NoAudio) {
    auto cfg = validConfig();
    cfg.audio_mode = AudioMode::None;

    auto args = buildScrcpyArgs(cfg);
    EXPECT_TRUE(contains(args, "--no-audio"));
    EXPECT_FALSE(contains(args, "--audio-source=playback"));
}

TEST(SessionConfigTest, ExtraArgsComeLast) {
    auto cfg = validConfig();
    cfg.extra_args = {"--window-title=phone"};

    auto args = buildScrcpyArgs(cfg);
    EXPECT_EQ(args.back(), "--window-title=phone");
}

TEST(SessionConfigTest, Equality) {
    auto a = validConfig();
    auto b = validConfig();
    EXPECT_EQ(a, b);

    b.extra_args.push_back("--stay-awake");
    EXPECT_NE(a, b);
}

// =============================================================================
// Persisted representations
// =============================================================================

TEST(SessionConfigTest, AudioDisplayNames) {
    for (AudioMode m : {AudioMode::Playback, AudioMode::Microphone, AudioMode::None}) {
        AudioMode back;
        ASSERT_TRUE(audioModeFromDisplayName(audioModeDisplayName(m), back));
        EXPECT_EQ(back, m);
    }
    AudioMode unused;
    EXPECT_FALSE(audioModeFromDisplayName("Speaker", unused));
}

TEST(SessionConfigTest, ResolutionMapping) {
    EXPECT_EQ(maxSizeFromResolution("Original Device Resolution"), 0);
    EXPECT_EQ(maxSizeFromResolution("720p"), 1280);
    EXPECT_EQ(maxSizeFromResolution("1080p"), 1920);
    EXPECT_EQ(maxSizeFromResolution("4K"), 3840);
    EXPECT_EQ(maxSizeFromResolution("8K"), 0);

    std::string name;
    ASSERT_TRUE(resolutionFromMaxSize(1920, name));
    EXPECT_EQ(name, "1080p");
    ASSERT_TRUE(resolutionFromMaxSize(0, name));
    EXPECT_EQ(name, "Original Device Resolution");
    EXPECT_FALSE(resolutionFromMaxSize(1000, name));
}

TEST(SessionConfigTest, ParseBitrate) {
    double mbps = 0.0;
    EXPECT_TRUE(parseBitrate("20", mbps));
    EXPECT_DOUBLE_EQ(mbps, 20.0);
    EXPECT_TRUE(parseBitrate(" 8M ", mbps));
    EXPECT_DOUBLE_EQ(mbps, 8.0);
    EXPECT_TRUE(parseBitrate("2.5m", mbps));
    EXPECT_DOUBLE_EQ(mbps, 2.5);

    EXPECT_FALSE(parseBitrate("", mbps));
    EXPECT_FALSE(parseBitrate("M", mbps));
    EXPECT_FALSE(parseBitrate("fast", mbps));
    EXPECT_FALSE(parseBitrate("20 Mbps", mbps));
}

TEST(SessionConfigTest, FormatBitrate) {
    EXPECT_EQ(formatBitrate(20.0), "20");
    EXPECT_EQ(formatBitrate(8.5), "8.5");
    EXPECT_EQ(formatBitrate(0.1), "0.1");

    for (double v : {12.3456789, 0.1 + 0.2, 999.99999999999, 1.0 / 3.0}) {
        double back = 0.0;
        ASSERT_TRUE(parseBitrate(formatBitrate(v), back));
        EXPECT_EQ(back, v) << formatBitrate(v);
    }
}

int main(int argc, char** argv) {
    testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
