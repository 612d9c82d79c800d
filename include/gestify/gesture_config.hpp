#ifndef GESTIFY_GESTURE_CONFIG_HPP_
#define GESTIFY_GESTURE_CONFIG_HPP_

#include <string>

#include "gestify/gesture_types.hpp"

namespace gestify {

/**
 * @brief Every tunable of the recognition pipeline and the camera application.
 *
 * Keys in a config file carry the field names below. Pixel thresholds are in
 * camera-frame pixels, times in seconds, velocities in pixels per frame.
 */
struct GestureConfig {
    // Camera
    int camera_index = 0;
    int camera_width = 640;
    int camera_height = 480;
    int camera_fps = 30;

    // Landmark models
    std::string hand_model_path = "models/hand_landmarker.task";
    std::string face_model_path = "models/face_landmarker.task";
    int max_hands = 2;
    float hand_confidence = 0.7f;
    float hand_tracking_confidence = 0.5f;
    float face_confidence = 0.5f;

    // Pose classification
    float finger_extension_ratio = 1.15f;
    float thumb_extension_ratio = 1.2f;
    int velocity_history = 5;

    // Single-hand gestures
    float pinch_threshold = 20.0f;
    double gesture_cooldown = 0.25;
    double double_click_window = 0.5;
    int click_history = 3;
    float scroll_velocity_min = 5.0f;

    // Pinch hold hysteresis
    float pinch_hold_engage_ratio = 2.0f;
    float drag_release_hysteresis = 1.5f;

    // Two-hand gestures
    bool enable_two_hand = true;
    float two_hand_distance_threshold = 50.0f;
    float two_hand_rotation_threshold = 0.3f;  // radians
    Handedness dominant_hand = Handedness::RIGHT;

    // Attention gate
    bool enable_attention_gate = true;
    int attention_buffer_size = 10;
    int attention_vote_threshold = 3;
    int attention_min_samples = 3;
    float gaze_horizontal_limit = 0.015f;
    float gaze_vertical_min = -0.005f;
    float gaze_vertical_max = 0.020f;
    float nose_center_min = 0.3f;
    float nose_center_max = 0.7f;
    float min_face_width = 0.15f;

    // Cursor output
    int target_width = 1920;
    int target_height = 1080;
    int cursor_smoothing = 5;
    bool mirror_cursor = true;
    double dwell_time = 1.0;
    float dwell_radius = 30.0f;

    // Throws std::invalid_argument naming the first bad option
    void validate() const;

    float pinchEngageThreshold() const { return pinch_threshold * pinch_hold_engage_ratio; }
    float pinchReleaseThreshold() const { return pinchEngageThreshold() * drag_release_hysteresis; }

    // Reads any cv::FileStorage format (YAML, JSON, XML). Missing keys keep
    // the values of the preset named by the file's `mode` key, or by `mode`
    // when it is non-empty. Throws std::runtime_error if the file cannot be opened.
    static GestureConfig fromFile(const std::string& path, const std::string& mode = "");

    // "default", "fast", "accurate" or "two_hand"; anything else throws std::invalid_argument
    static GestureConfig preset(const std::string& mode);

    static GestureConfig fastMode();
    static GestureConfig accurateMode();
    static GestureConfig twoHandMode();
};

}  // namespace gestify

#endif  // GESTIFY_GESTURE_CONFIG_HPP_
