#pragma once

#include <opencv2/opencv.hpp>
#include <cstdint>
#include <memory>
#include <string>

#include "gestify/gesture_config.hpp"
#include "gestify/gesture_pipeline.hpp"
#include "gestify/utils/mp_utils.hpp"

namespace gestify {

// Enum for system states
enum class SystemState {
    IDLE,           // Initial state - create landmarkers and verify the camera
    TRACKING,       // Active gesture recognition
    ERROR,          // Error state
    SHUTDOWN        // Clean shutdown state
};

// Struct to hold shared state data between states
struct StateCommand {
    // Current system state
    SystemState current_state = SystemState::IDLE;

    GestureConfig config;

    // Last frame from camera
    cv::Mat rgb_frame;

    // Component initialization flags
    bool hand_landmarker_initialized = false;
    bool face_landmarker_initialized = false;

    // Shared components (created once in IDLE, reused across re-entries)
    std::unique_ptr<utils::HandLandmarkerMP> hand_landmarker;
    std::unique_ptr<utils::FaceLandmarkerMP> face_landmarker;
    std::unique_ptr<GesturePipeline> pipeline;

    // Last timestamp handed to the VIDEO-mode landmarkers; must keep increasing
    int64_t detection_timestamp_ms = 0;

    bool debug_overlay = false;

    // Error message
    std::string error_message;

    StateCommand() = default;
};

}  // namespace gestify
