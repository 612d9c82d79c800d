#include "gestify/gesture_config.hpp"

#include <sstream>
#include <stdexcept>

#include <opencv2/core/persistence.hpp>

#include "absl/log/log.h"

namespace gestify {

namespace {

template <typename T>
void readIfPresent(const cv::FileStorage& fs, const char* key, T& value) {
    cv::FileNode node = fs[key];
    if (!node.empty()) {
        node >> value;
    }
}

// cv::FileStorage has no bool type; flags are stored as 0/1
void readFlag(const cv::FileStorage& fs, const char* key, bool& value) {
    cv::FileNode node = fs[key];
    if (!node.empty()) {
        int raw = 0;
        node >> raw;
        value = raw != 0;
    }
}

void readHandedness(const cv::FileStorage& fs, const char* key, Handedness& value) {
    cv::FileNode node = fs[key];
    if (node.empty()) return;

    std::string name;
    node >> name;
    if (name == "Left" || name == "left" || name == "LEFT") {
        value = Handedness::LEFT;
    } else if (name == "Right" || name == "right" || name == "RIGHT") {
        value = Handedness::RIGHT;
    } else {
        LOG(ERROR) << "Unknown handedness '" << name << "' for " << key;
        throw std::invalid_argument(std::string(key) + " must be Left or Right");
    }
}

void require(bool condition, const char* option, const char* rule) {
    if (!condition) {
        std::ostringstream msg;
        msg << option << " " << rule;
        LOG(ERROR) << "Invalid configuration: " << msg.str();
        throw std::invalid_argument(msg.str());
    }
}

}  // namespace

void GestureConfig::validate() const {
    require(camera_width > 0 && camera_height > 0, "camera_width/camera_height", "must be positive");
    require(max_hands == 1 || max_hands == 2, "max_hands", "must be 1 or 2");
    require(hand_confidence >= 0.0f && hand_confidence <= 1.0f, "hand_confidence", "must be between 0 and 1");
    require(hand_tracking_confidence >= 0.0f && hand_tracking_confidence <= 1.0f,
            "hand_tracking_confidence", "must be between 0 and 1");
    require(face_confidence >= 0.0f && face_confidence <= 1.0f, "face_confidence", "must be between 0 and 1");

    require(finger_extension_ratio > 0.0f, "finger_extension_ratio", "must be positive");
    require(thumb_extension_ratio > 0.0f, "thumb_extension_ratio", "must be positive");
    require(velocity_history >= 2, "velocity_history", "must be >= 2");

    require(pinch_threshold > 0.0f, "pinch_threshold", "must be positive");
    require(gesture_cooldown >= 0.0, "gesture_cooldown", "must be >= 0");
    require(double_click_window > 0.0, "double_click_window", "must be positive");
    require(click_history >= 2, "click_history", "must be >= 2");
    require(scroll_velocity_min >= 0.0f, "scroll_velocity_min", "must be >= 0");

    require(pinch_hold_engage_ratio > 0.0f, "pinch_hold_engage_ratio", "must be positive");
    require(drag_release_hysteresis >= 1.0f, "drag_release_hysteresis", "must be >= 1");

    require(two_hand_distance_threshold > 0.0f, "two_hand_distance_threshold", "must be positive");
    require(two_hand_rotation_threshold > 0.0f, "two_hand_rotation_threshold", "must be positive");

    require(attention_buffer_size >= 1, "attention_buffer_size", "must be >= 1");
    require(attention_vote_threshold >= 1 && attention_vote_threshold <= attention_buffer_size,
            "attention_vote_threshold", "must be in [1, attention_buffer_size]");
    require(attention_min_samples >= 1 && attention_min_samples <= attention_buffer_size,
            "attention_min_samples", "must be in [1, attention_buffer_size]");
    require(gaze_vertical_min < gaze_vertical_max, "gaze_vertical_min", "must be below gaze_vertical_max");
    require(nose_center_min < nose_center_max, "nose_center_min", "must be below nose_center_max");

    require(target_width > 0 && target_height > 0, "target_width/target_height", "must be positive");
    require(cursor_smoothing >= 1, "cursor_smoothing", "must be >= 1");
    require(dwell_time > 0.0, "dwell_time", "must be positive");
    require(dwell_radius >= 0.0f, "dwell_radius", "must be >= 0");
}

GestureConfig GestureConfig::fromFile(const std::string& path, const std::string& mode) {
    cv::FileStorage fs;
    try {
        fs.open(path, cv::FileStorage::READ);
    } catch (const cv::Exception& e) {
        LOG(ERROR) << "Failed to parse config file " << path << ": " << e.what();
        throw std::runtime_error("Cannot parse config file: " + path);
    }
    if (!fs.isOpened()) {
        LOG(ERROR) << "Failed to open config file: " << path;
        throw std::runtime_error("Cannot open config file: " + path);
    }

    std::string file_mode;
    readIfPresent(fs, "mode", file_mode);
    GestureConfig config = preset(mode.empty() ? file_mode : mode);

    readIfPresent(fs, "camera_index", config.camera_index);
    readIfPresent(fs, "camera_width", config.camera_width);
    readIfPresent(fs, "camera_height", config.camera_height);
    readIfPresent(fs, "camera_fps", config.camera_fps);

    readIfPresent(fs, "hand_model_path", config.hand_model_path);
    readIfPresent(fs, "face_model_path", config.face_model_path);
    readIfPresent(fs, "max_hands", config.max_hands);
    readIfPresent(fs, "hand_confidence", config.hand_confidence);
    readIfPresent(fs, "hand_tracking_confidence", config.hand_tracking_confidence);
    readIfPresent(fs, "face_confidence", config.face_confidence);

    readIfPresent(fs, "finger_extension_ratio", config.finger_extension_ratio);
    readIfPresent(fs, "thumb_extension_ratio", config.thumb_extension_ratio);
    readIfPresent(fs, "velocity_history", config.velocity_history);

    readIfPresent(fs, "pinch_threshold", config.pinch_threshold);
    readIfPresent(fs, "gesture_cooldown", config.gesture_cooldown);
    readIfPresent(fs, "double_click_window", config.double_click_window);
    readIfPresent(fs, "click_history", config.click_history);
    readIfPresent(fs, "scroll_velocity_min", config.scroll_velocity_min);

    readIfPresent(fs, "pinch_hold_engage_ratio", config.pinch_hold_engage_ratio);
    readIfPresent(fs, "drag_release_hysteresis", config.drag_release_hysteresis);

    readFlag(fs, "enable_two_hand", config.enable_two_hand);
    readIfPresent(fs, "two_hand_distance_threshold", config.two_hand_distance_threshold);
    readIfPresent(fs, "two_hand_rotation_threshold", config.two_hand_rotation_threshold);
    readHandedness(fs, "dominant_hand", config.dominant_hand);

    readFlag(fs, "enable_attention_gate", config.enable_attention_gate);
    readIfPresent(fs, "attention_buffer_size", config.attention_buffer_size);
    readIfPresent(fs, "attention_vote_threshold", config.attention_vote_threshold);
    readIfPresent(fs, "attention_min_samples", config.attention_min_samples);
    readIfPresent(fs, "gaze_horizontal_limit", config.gaze_horizontal_limit);
    readIfPresent(fs, "gaze_vertical_min", config.gaze_vertical_min);
    readIfPresent(fs, "gaze_vertical_max", config.gaze_vertical_max);
    readIfPresent(fs, "nose_center_min", config.nose_center_min);
    readIfPresent(fs, "nose_center_max", config.nose_center_max);
    readIfPresent(fs, "min_face_width", config.min_face_width);

    readIfPresent(fs, "target_width", config.target_width);
    readIfPresent(fs, "target_height", config.target_height);
    readIfPresent(fs, "cursor_smoothing", config.cursor_smoothing);
    readFlag(fs, "mirror_cursor", config.mirror_cursor);
    readIfPresent(fs, "dwell_time", config.dwell_time);
    readIfPresent(fs, "dwell_radius", config.dwell_radius);

    fs.release();

    config.validate();
    LOG(INFO) << "Loaded gesture config from " << path;
    return config;
}

GestureConfig GestureConfig::preset(const std::string& mode) {
    if (mode.empty() || mode == "default") return GestureConfig();
    if (mode == "fast") return fastMode();
    if (mode == "accurate") return accurateMode();
    if (mode == "two_hand") return twoHandMode();

    LOG(ERROR) << "Unknown config mode '" << mode << "'";
    throw std::invalid_argument("mode must be default, fast, accurate or two_hand");
}

GestureConfig GestureConfig::fastMode() {
    GestureConfig config;
    config.max_hands = 1;
    config.enable_attention_gate = false;
    config.cursor_smoothing = 3;
    return config;
}

GestureConfig GestureConfig::accurateMode() {
    GestureConfig config;
    config.hand_confidence = 0.8f;
    config.face_confidence = 0.7f;
    config.cursor_smoothing = 7;
    config.attention_vote_threshold = 5;
    config.attention_min_samples = 5;
    return config;
}

GestureConfig GestureConfig::twoHandMode() {
    GestureConfig config;
    config.max_hands = 2;
    config.enable_two_hand = true;
    config.enable_attention_gate = true;
    return config;
}

}  // namespace gestify
