#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <stdexcept>
#include <string>

#include "gestify/gesture_config.hpp"

using namespace gestify;

namespace {

std::string writeTempFile(const std::string& name, const std::string& contents) {
    std::string path = ::testing::TempDir() + name;
    std::ofstream out(path);
    out << contents;
    return path;
}

}  // namespace

TEST(GestureConfigTest, DefaultsAreValid) {
    GestureConfig config;
    EXPECT_NO_THROW(config.validate());
    EXPECT_FLOAT_EQ(config.pinchEngageThreshold(), 40.0f);
    EXPECT_FLOAT_EQ(config.pinchReleaseThreshold(), 60.0f);
}

TEST(GestureConfigTest, PresetsAreValid) {
    GestureConfig fast = GestureConfig::fastMode();
    EXPECT_NO_THROW(fast.validate());
    EXPECT_EQ(fast.max_hands, 1);
    EXPECT_FALSE(fast.enable_attention_gate);

    GestureConfig accurate = GestureConfig::accurateMode();
    EXPECT_NO_THROW(accurate.validate());
    EXPECT_GT(accurate.attention_vote_threshold, GestureConfig().attention_vote_threshold);

    GestureConfig two_hand = GestureConfig::twoHandMode();
    EXPECT_NO_THROW(two_hand.validate());
    EXPECT_EQ(two_hand.max_hands, 2);
    EXPECT_TRUE(two_hand.enable_two_hand);
}

TEST(GestureConfigTest, ValidateNamesOffendingOption) {
    GestureConfig config;
    config.attention_vote_threshold = 11;
    try {
        config.validate();
        FAIL() << "expected std::invalid_argument";
    } catch (const std::invalid_argument& e) {
        EXPECT_NE(std::string(e.what()).find("attention_vote_threshold"), std::string::npos);
    }
}

TEST(GestureConfigTest, ValidateRejectsBadValues) {
    GestureConfig config;
    config.drag_release_hysteresis = 0.9f;
    EXPECT_THROW(config.validate(), std::invalid_argument);

    config = GestureConfig();
    config.max_hands = 3;
    EXPECT_THROW(config.validate(), std::invalid_argument);

    config = GestureConfig();
    config.gaze_vertical_min = 0.05f;
    EXPECT_THROW(config.validate(), std::invalid_argument);
}

TEST(GestureConfigTest, FileOverridesOnlyListedKeys) {
    std::string path = writeTempFile("gestify_partial.yaml",
        "%YAML:1.0\n"
        "---\n"
        "pinch_threshold: 25.5\n"
        "gesture_cooldown: 0.4\n"
        "cursor_smoothing: 3\n"
        "enable_attention_gate: 0\n"
        "dominant_hand: \"Left\"\n"
        "hand_model_path: \"/opt/models/hand.task\"\n");

    GestureConfig config = GestureConfig::fromFile(path);
    std::remove(path.c_str());

    EXPECT_FLOAT_EQ(config.pinch_threshold, 25.5f);
    EXPECT_DOUBLE_EQ(config.gesture_cooldown, 0.4);
    EXPECT_EQ(config.cursor_smoothing, 3);
    EXPECT_FALSE(config.enable_attention_gate);
    EXPECT_EQ(config.dominant_hand, Handedness::LEFT);
    EXPECT_EQ(config.hand_model_path, "/opt/models/hand.task");

    // Untouched keys keep their defaults
    EXPECT_EQ(config.target_width, 1920);
    EXPECT_TRUE(config.enable_two_hand);
}

TEST(GestureConfigTest, JsonFileIsAccepted) {
    std::string path = writeTempFile("gestify_config.json",
        "{\n"
        "  \"two_hand_distance_threshold\": 80.0,\n"
        "  \"mirror_cursor\": 0\n"
        "}\n");

    GestureConfig config = GestureConfig::fromFile(path);
    std::remove(path.c_str());

    EXPECT_FLOAT_EQ(config.two_hand_distance_threshold, 80.0f);
    EXPECT_FALSE(config.mirror_cursor);
}

TEST(GestureConfigTest, InvalidValueInFileThrows) {
    std::string path = writeTempFile("gestify_invalid.yaml",
        "%YAML:1.0\n"
        "---\n"
        "cursor_smoothing: 0\n");

    EXPECT_THROW(GestureConfig::fromFile(path), std::invalid_argument);
    std::remove(path.c_str());
}

TEST(GestureConfigTest, UnknownHandednessThrows) {
    std::string path = writeTempFile("gestify_hand.yaml",
        "%YAML:1.0\n"
        "---\n"
        "dominant_hand: \"Both\"\n");

    EXPECT_THROW(GestureConfig::fromFile(path), std::invalid_argument);
    std::remove(path.c_str());
}

TEST(GestureConfigTest, MissingFileThrows) {
    EXPECT_THROW(GestureConfig::fromFile(::testing::TempDir() + "gestify_does_not_exist.yaml"),
                 std::runtime_error);
}

TEST(GestureConfigTest, ShippedConfigMatchesDefaults) {
    GestureConfig shipped = GestureConfig::fromFile(std::string(GESTIFY_CONFIG_DIR) + "/gestify.yaml");
    GestureConfig defaults;

    EXPECT_EQ(shipped.camera_width, defaults.camera_width);
    EXPECT_FLOAT_EQ(shipped.pinch_threshold, defaults.pinch_threshold);
    EXPECT_DOUBLE_EQ(shipped.gesture_cooldown, defaults.gesture_cooldown);
    EXPECT_EQ(shipped.attention_buffer_size, defaults.attention_buffer_size);
    EXPECT_FLOAT_EQ(shipped.gaze_vertical_min, defaults.gaze_vertical_min);
    EXPECT_EQ(shipped.dominant_hand, defaults.dominant_hand);
    EXPECT_EQ(shipped.mirror_cursor, defaults.mirror_cursor);
    EXPECT_DOUBLE_EQ(shipped.dwell_time, defaults.dwell_time);
}

TEST(GestureConfigTest, PresetByName) {
    EXPECT_EQ(GestureConfig::preset("").cursor_smoothing, GestureConfig().cursor_smoothing);
    EXPECT_EQ(GestureConfig::preset("default").max_hands, GestureConfig().max_hands);
    EXPECT_EQ(GestureConfig::preset("fast").cursor_smoothing, 3);
    EXPECT_EQ(GestureConfig::preset("accurate").cursor_smoothing, 7);
    EXPECT_TRUE(GestureConfig::preset("two_hand").enable_two_hand);
    EXPECT_THROW(GestureConfig::preset("turbo"), std::invalid_argument);
}

TEST(GestureConfigTest, FileModeSelectsBasePreset) {
    std::string path = writeTempFile("gestify_mode.yaml",
        "%YAML:1.0\n"
        "---\n"
        "mode: \"fast\"\n"
        "cursor_smoothing: 4\n");

    GestureConfig config = GestureConfig::fromFile(path);
    std::remove(path.c_str());

    // Preset values apply, listed keys still override them
    EXPECT_EQ(config.max_hands, 1);
    EXPECT_FALSE(config.enable_attention_gate);
    EXPECT_EQ(config.cursor_smoothing, 4);
}

TEST(GestureConfigTest, ModeArgumentOverridesFileMode) {
    std::string path = writeTempFile("gestify_mode_arg.yaml",
        "%YAML:1.0\n"
        "---\n"
        "mode: \"fast\"\n"
        "target_width: 2560\n");

    GestureConfig config = GestureConfig::fromFile(path, "accurate");
    std::remove(path.c_str());

    EXPECT_EQ(config.cursor_smoothing, 7);
    EXPECT_EQ(config.attention_vote_threshold, 5);
    EXPECT_EQ(config.max_hands, GestureConfig().max_hands);
    EXPECT_EQ(config.target_width, 2560);
}

TEST(GestureConfigTest, UnknownModeInFileThrows) {
    std::string path = writeTempFile("gestify_bad_mode.yaml",
        "%YAML:1.0\n"
        "---\n"
        "mode: \"turbo\"\n");

    EXPECT_THROW(GestureConfig::fromFile(path), std::invalid_argument);
    std::remove(path.c_str());
}
