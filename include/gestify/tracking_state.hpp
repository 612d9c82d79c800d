#ifndef GESTIFY_TRACKING_STATE_HPP_
#define GESTIFY_TRACKING_STATE_HPP_

#include <opencv2/opencv.hpp>
#include <chrono>
#include <cstdint>
#include <string>

#include "gestify/gesture_pipeline.hpp"
#include "gestify/state_command.hpp"

namespace gestify {

/**
 * @brief TrackingState - Live gesture recognition from the camera
 *
 * Responsibilities:
 * - Run the hand and face landmarkers on every frame
 * - Feed observations through the gesture pipeline in frame order
 * - Write one JSON line per gesture event to stdout
 * - Draw hand skeletons, cursor, attention and hold/dwell progress
 * - Handle keyboard commands (quit, idle, reset, attention toggle, debug overlay)
 */
class TrackingState {
public:
    TrackingState(StateCommand& state_command, cv::VideoCapture& cap);

    // Run tracking state - returns next state to transition to
    SystemState run();

private:
    StateCommand& state_command_;
    cv::VideoCapture& cap_;

    // References to shared components (from StateCommand)
    utils::HandLandmarkerMP* hand_landmarker_;
    utils::FaceLandmarkerMP* face_landmarker_;
    GesturePipeline* pipeline_;

    // Frame data
    cv::Mat current_frame_;
    FrameObservation observation_;
    FrameResult result_;

    std::chrono::steady_clock::time_point start_time_;
    Gesture last_discrete_gesture_ = Gesture::NONE;
    float fps_ = 0.0f;

    // Helper methods
    int64_t nextTimestampMs();
    void processFrame();
    void publishEvents();
    void visualizeTracking();
    void drawHandSkeleton(const HandObservation& hand);
    void drawProgressBar(const std::string& label, float progress, int y, const cv::Scalar& color);
    bool handleKey(int key, SystemState& next_state);
};

}  // namespace gestify

#endif  // GESTIFY_TRACKING_STATE_HPP_
