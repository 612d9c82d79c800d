#include "gestify/idle_state.hpp"

#include <iostream>

namespace gestify {

IdleState::IdleState(StateCommand& state_command, cv::VideoCapture& cap)
    : state_command_(state_command),
      cap_(cap) {
    std::cout << "IdleState: Initializing...\n";
}

SystemState IdleState::run() {
    if (!initializeComponents()) {
        return SystemState::ERROR;
    }
    if (!verifyComponents()) {
        return SystemState::ERROR;
    }

    std::cout << "IdleState: Initialization complete\n\n";

    // Show the status screen briefly; 'q' or ESC quits before tracking starts
    displayStatus(state_command_.rgb_frame);
    cv::imshow("Gestify", state_command_.rgb_frame);
    char key = cv::waitKey(800);
    if (key == 'q' || key == 'Q' || key == 27) {
        std::cout << "Quit requested\n";
        return SystemState::SHUTDOWN;
    }

    return SystemState::TRACKING;
}

bool IdleState::initializeComponents() {
    const GestureConfig& config = state_command_.config;
    status_lines_.clear();

    try {
        if (!state_command_.hand_landmarker_initialized) {
            state_command_.hand_landmarker = utils::HandLandmarkerMP::FromConfig(config);
            state_command_.hand_landmarker_initialized = true;
            std::cout << "  - MediaPipe HandLandmarker initialized\n";
        }
        status_lines_.push_back("HandLandmarker: OK");

        if (config.enable_attention_gate) {
            if (!state_command_.face_landmarker_initialized) {
                state_command_.face_landmarker = utils::FaceLandmarkerMP::FromConfig(config);
                state_command_.face_landmarker_initialized = true;
                std::cout << "  - MediaPipe FaceLandmarker initialized\n";
            }
            status_lines_.push_back("FaceLandmarker: OK");
        } else {
            status_lines_.push_back("FaceLandmarker: disabled");
        }

        if (!state_command_.pipeline) {
            state_command_.pipeline = std::make_unique<GesturePipeline>(config);
            std::cout << "  - Gesture pipeline initialized\n";
        } else {
            state_command_.pipeline->reset();
        }
        status_lines_.push_back("Gesture pipeline: OK");
    } catch (const std::exception& e) {
        std::cerr << "Error: Component initialization failed: " << e.what() << "\n";
        state_command_.error_message = e.what();
        return false;
    }

    return true;
}

bool IdleState::verifyComponents() {
    if (!cap_.read(state_command_.rgb_frame) || state_command_.rgb_frame.empty()) {
        std::cerr << "Error: Failed to capture frame\n";
        state_command_.error_message = "Camera capture failed";
        return false;
    }

    std::cout << "  - Camera delivers " << state_command_.rgb_frame.cols << "x"
              << state_command_.rgb_frame.rows << " frames\n";
    status_lines_.push_back(cv::format("Camera: %dx%d", state_command_.rgb_frame.cols,
                                       state_command_.rgb_frame.rows));

    // One detection pass on the captured frame
    int64_t timestamp_ms = ++state_command_.detection_timestamp_ms;
    auto hands = state_command_.hand_landmarker->Detect(state_command_.rgb_frame, timestamp_ms);
    std::cout << "  - HandLandmarker test pass: " << hands.size() << " hand(s)\n";

    if (state_command_.face_landmarker) {
        auto face = state_command_.face_landmarker->Detect(state_command_.rgb_frame, timestamp_ms);
        std::cout << "  - FaceLandmarker test pass: " << (face ? "face found" : "no face") << "\n";
    }

    return true;
}

void IdleState::displayStatus(cv::Mat& frame) {
    cv::putText(frame, "Gestify - initializing", cv::Point(10, 30),
                cv::FONT_HERSHEY_SIMPLEX, 0.9, cv::Scalar(255, 255, 0), 2);

    int y = 65;
    for (const auto& line : status_lines_) {
        cv::putText(frame, line, cv::Point(10, y),
                    cv::FONT_HERSHEY_SIMPLEX, 0.6, cv::Scalar(0, 255, 0), 2);
        y += 28;
    }

    cv::putText(frame, "Press 'q' to QUIT",
                cv::Point(10, frame.rows - 20),
                cv::FONT_HERSHEY_SIMPLEX, 0.5, cv::Scalar(255, 255, 255), 1);
}

}  // namespace gestify
