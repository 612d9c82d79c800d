#include "gestify/tracking_state.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <utility>
#include <vector>

#include "gestify/utils/event_json.hpp"

namespace gestify {

TrackingState::TrackingState(StateCommand& state_command, cv::VideoCapture& cap)
    : state_command_(state_command),
      cap_(cap) {

    std::cout << "TrackingState: Constructor called\n";

    // Get references to shared components from StateCommand
    hand_landmarker_ = state_command_.hand_landmarker.get();
    face_landmarker_ = state_command_.face_landmarker.get();
    pipeline_ = state_command_.pipeline.get();

    // Verify components are initialized
    if (!hand_landmarker_ || !pipeline_) {
        throw std::runtime_error("TrackingState: Required components not initialized!");
    }

    std::cout << "TrackingState: All components verified\n";
}

SystemState TrackingState::run() {
    std::cout << "TrackingState: Starting tracking loop...\n";
    std::cout << "Point with your index finger to move the cursor\n";
    std::cout << "Keys: 'i' IDLE | 'r' reset | 'f' attention gate | 'd' debug | 'q'/ESC quit\n\n";

    int frame_count = 0;
    start_time_ = std::chrono::steady_clock::now();
    auto fps_window_start = start_time_;

    while (true) {
        // Capture frame
        if (!cap_.read(current_frame_) || current_frame_.empty()) {
            std::cerr << "Error: Failed to capture frame\n";
            state_command_.error_message = "Camera capture failed";
            return SystemState::ERROR;
        }

        frame_count++;

        processFrame();
        publishEvents();
        visualizeTracking();

        cv::imshow("Gestify", current_frame_);

        // Calculate and display FPS every 30 frames
        if (frame_count % 30 == 0) {
            auto current_time = std::chrono::steady_clock::now();
            auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                current_time - fps_window_start).count();
            fps_ = elapsed > 0 ? (30.0f * 1000.0f) / elapsed : 0.0f;

            std::cout << "Frame " << frame_count
                      << " - FPS: " << fps_
                      << " - Hands: " << result_.hands.size()
                      << " - Attention: " << (result_.attending ? "YES" : "NO")
                      << " - Last gesture: " << gestureName(last_discrete_gesture_)
                      << "\n";

            fps_window_start = current_time;
        }

        SystemState next_state = SystemState::TRACKING;
        if (handleKey(cv::waitKey(1), next_state)) {
            return next_state;
        }
    }
}

int64_t TrackingState::nextTimestampMs() {
    int64_t now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now().time_since_epoch()).count();
    state_command_.detection_timestamp_ms = std::max(now_ms, state_command_.detection_timestamp_ms + 1);
    return state_command_.detection_timestamp_ms;
}

void TrackingState::processFrame() {
    int64_t timestamp_ms = nextTimestampMs();

    observation_ = FrameObservation();
    observation_.timestamp = static_cast<double>(timestamp_ms) / 1000.0;
    observation_.frame_size = current_frame_.size();
    observation_.hands = hand_landmarker_->Detect(current_frame_, timestamp_ms);

    if (face_landmarker_ && pipeline_->attentionGateEnabled()) {
        observation_.face = face_landmarker_->Detect(current_frame_, timestamp_ms);
    }

    result_ = pipeline_->processFrame(observation_);
}

void TrackingState::publishEvents() {
    for (const auto& event : result_.events) {
        utils::json line = utils::ToJson(event);
        if (result_.cursor) {
            line["cursor"] = {result_.cursor->x, result_.cursor->y};
        }
        std::cout << line.dump() << "\n";

        if (!isContinuous(event.gesture)) {
            last_discrete_gesture_ = event.gesture;
        }
    }

    if (result_.pinch_transition != PinchHoldTransition::NONE || result_.dwell_triggered ||
        result_.drag_force_released) {
        std::cout << utils::ToJson(result_).dump() << "\n";
    }
    std::cout.flush();
}

bool TrackingState::handleKey(int key, SystemState& next_state) {
    char c = static_cast<char>(key);
    if (c == 'i' || c == 'I') {
        std::cout << "Returning to IDLE state...\n";
        next_state = SystemState::IDLE;
        return true;
    } else if (c == 'q' || c == 'Q' || key == 27) {
        std::cout << "Shutdown requested\n";
        next_state = SystemState::SHUTDOWN;
        return true;
    } else if (c == 'r' || c == 'R') {
        pipeline_->reset();
        last_discrete_gesture_ = Gesture::NONE;
        std::cout << "Gesture pipeline reset\n";
    } else if (c == 'f' || c == 'F') {
        bool enable = !pipeline_->attentionGateEnabled();
        if (enable && !face_landmarker_) {
            std::cout << "Attention gate unavailable: face landmarker not loaded\n";
        } else {
            pipeline_->setAttentionGateEnabled(enable);
        }
    } else if (c == 'd' || c == 'D') {
        state_command_.debug_overlay = !state_command_.debug_overlay;
    }
    return false;
}

void TrackingState::drawHandSkeleton(const HandObservation& hand) {
    int frame_width = current_frame_.cols;
    int frame_height = current_frame_.rows;
    const auto& landmarks = hand.landmarks;

    // MediaPipe hand connections (21 landmarks, 0-20)
    const std::vector<std::pair<int, int>> connections = {
        // Thumb
        {0, 1}, {1, 2}, {2, 3}, {3, 4},
        // Index finger
        {0, 5}, {5, 6}, {6, 7}, {7, 8},
        // Middle finger
        {0, 9}, {9, 10}, {10, 11}, {11, 12},
        // Ring finger
        {0, 13}, {13, 14}, {14, 15}, {15, 16},
        // Pinky
        {0, 17}, {17, 18}, {18, 19}, {19, 20},
        // Palm
        {5, 9}, {9, 13}, {13, 17}
    };

    auto toPixel = [&](const Eigen::Vector3f& lm) {
        return cv::Point(static_cast<int>(lm.x() * frame_width),
                         static_cast<int>(lm.y() * frame_height));
    };

    // Draw connections (skeleton)
    for (const auto& connection : connections) {
        size_t idx1 = static_cast<size_t>(connection.first);
        size_t idx2 = static_cast<size_t>(connection.second);
        if (idx1 < landmarks.size() && idx2 < landmarks.size()) {
            cv::line(current_frame_, toPixel(landmarks[idx1]), toPixel(landmarks[idx2]),
                     cv::Scalar(0, 255, 0), 2);
        }
    }

    // Draw landmarks (joints)
    for (size_t i = 0; i < landmarks.size(); ++i) {
        // Different colors for different fingers
        cv::Scalar color;
        if (i == 0) {
            color = cv::Scalar(255, 0, 0);  // Wrist - Blue
        } else if (i <= 4) {
            color = cv::Scalar(255, 255, 0);  // Thumb - Cyan
        } else if (i <= 8) {
            color = cv::Scalar(0, 255, 255);  // Index - Yellow
        } else if (i <= 12) {
            color = cv::Scalar(255, 0, 255);  // Middle - Magenta
        } else if (i <= 16) {
            color = cv::Scalar(128, 0, 255);  // Ring - Purple
        } else {
            color = cv::Scalar(0, 128, 255);  // Pinky - Orange
        }

        cv::circle(current_frame_, toPixel(landmarks[i]), 5, color, -1);
        cv::circle(current_frame_, toPixel(landmarks[i]), 6, cv::Scalar(255, 255, 255), 1);
    }

    if (!landmarks.empty()) {
        cv::putText(current_frame_, handednessName(hand.handedness),
                    toPixel(landmarks[hand_landmark::WRIST]) + cv::Point(10, 20),
                    cv::FONT_HERSHEY_SIMPLEX, 0.6, cv::Scalar(255, 255, 255), 2);
    }
}

void TrackingState::drawProgressBar(const std::string& label, float progress, int y,
                                    const cv::Scalar& color) {
    int bar_width = 200;
    int bar_height = 16;
    cv::Point bar_start(10, y);
    cv::rectangle(current_frame_, bar_start,
                  cv::Point(bar_start.x + bar_width, bar_start.y + bar_height),
                  cv::Scalar(255, 255, 255), 2);
    cv::rectangle(current_frame_, bar_start,
                  cv::Point(bar_start.x + static_cast<int>(bar_width * progress),
                            bar_start.y + bar_height),
                  color, -1);
    cv::putText(current_frame_, label, cv::Point(bar_start.x + bar_width + 10, y + 13),
                cv::FONT_HERSHEY_SIMPLEX, 0.5, color, 1);
}

void TrackingState::visualizeTracking() {
    // Draw hand skeletons
    for (const auto& hand : observation_.hands) {
        drawHandSkeleton(hand);
    }

    // Dominant fingertip in camera space
    if (const HandSlotResult* dominant = result_.dominantHand()) {
        if (dominant->pose.valid) {
            cv::Point tip(static_cast<int>(dominant->pose.position.x),
                          static_cast<int>(dominant->pose.position.y));
            cv::Scalar tip_color = result_.pinch_holding ? cv::Scalar(0, 255, 255) : cv::Scalar(0, 0, 255);
            cv::circle(current_frame_, tip, 12, tip_color, -1);
            cv::circle(current_frame_, tip, 14, cv::Scalar(255, 255, 255), 2);
        }
    }

    // Current gesture header
    std::string gesture = "Gesture: " + std::string(gestureName(last_discrete_gesture_));
    cv::putText(current_frame_, gesture, cv::Point(10, 30),
                cv::FONT_HERSHEY_SIMPLEX, 1.0, cv::Scalar(0, 255, 0), 2);

    int y_offset = 60;
    if (result_.cursor) {
        std::string cursor = cv::format("Cursor: (%d, %d)", result_.cursor->x, result_.cursor->y);
        cv::putText(current_frame_, cursor, cv::Point(10, y_offset),
                    cv::FONT_HERSHEY_SIMPLEX, 0.6, cv::Scalar(255, 200, 0), 2);
        y_offset += 25;
    }

    if (result_.pinch_holding) {
        drawProgressBar("HOLD", 1.0f, y_offset, cv::Scalar(0, 255, 255));
        y_offset += 25;
    }
    if (result_.dwell_progress > 0.0f) {
        drawProgressBar("DWELL", result_.dwell_progress, y_offset, cv::Scalar(0, 165, 255));
        y_offset += 25;
    }

    if (state_command_.debug_overlay) {
        for (const auto& slot : result_.hands) {
            const auto& f = slot.pose.fingers;
            std::string info = cv::format("%s%s [%d%d%d%d%d] pinch %.0fpx v(%.1f, %.1f)",
                                          handednessName(slot.hand), slot.dominant ? "*" : "",
                                          f[0], f[1], f[2], f[3], f[4],
                                          slot.pose.valid ? slot.pose.pinch_distance : -1.0f,
                                          slot.pose.velocity.x, slot.pose.velocity.y);
            cv::putText(current_frame_, info, cv::Point(10, y_offset),
                        cv::FONT_HERSHEY_SIMPLEX, 0.5, cv::Scalar(255, 255, 255), 1);
            y_offset += 22;
        }
        if (const auto& baseline = pipeline_->twoHandBaseline()) {
            std::string info = cv::format("Two-hand baseline: %.0fpx %.2frad",
                                          baseline->distance, baseline->angle);
            cv::putText(current_frame_, info, cv::Point(10, y_offset),
                        cv::FONT_HERSHEY_SIMPLEX, 0.5, cv::Scalar(255, 255, 255), 1);
        }
    }

    // Attention indicator
    cv::Scalar attention_color;
    std::string attention_label;
    if (!pipeline_->attentionGateEnabled()) {
        attention_color = cv::Scalar(128, 128, 128);
        attention_label = "GATE OFF";
    } else if (result_.attending) {
        attention_color = cv::Scalar(0, 255, 0);
        attention_label = "LOOKING";
    } else {
        attention_color = cv::Scalar(0, 0, 255);
        attention_label = "AWAY";
    }
    cv::circle(current_frame_, cv::Point(current_frame_.cols - 30, 30),
               15, attention_color, -1);
    cv::putText(current_frame_, attention_label,
                cv::Point(current_frame_.cols - 140, 35),
                cv::FONT_HERSHEY_SIMPLEX, 0.5, attention_color, 2);

    // Instructions footer
    std::string footer = cv::format("FPS: %.1f | 'i' IDLE | 'r' reset | 'f' gate | 'd' debug | 'q' QUIT", fps_);
    cv::putText(current_frame_, footer,
                cv::Point(10, current_frame_.rows - 20),
                cv::FONT_HERSHEY_SIMPLEX, 0.5, cv::Scalar(255, 255, 255), 1);
}

}  // namespace gestify
