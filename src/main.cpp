#include <opencv2/opencv.hpp>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include "gestify/gesture_config.hpp"
#include "gestify/idle_state.hpp"
#include "gestify/state_command.hpp"
#include "gestify/tracking_state.hpp"

using namespace gestify;

int main(int argc, char** argv) {
    std::cout << "========================================\n";
    std::cout << "  Gestify - Hand Gesture Control\n";
    std::cout << "========================================\n\n";

    // Configuration paths
    std::string config_path = "config/gestify.yaml";
    bool explicit_config = false;
    int camera_override = -1;
    std::string mode;
    bool no_face = false;

    // Parse command line arguments:
    //   gestify [--fast|--accurate|--two-hand] [--no-face] [config-file] [camera-index]
    int positional = 0;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--fast") {
            mode = "fast";
        } else if (arg == "--accurate") {
            mode = "accurate";
        } else if (arg == "--two-hand") {
            mode = "two_hand";
        } else if (arg == "--no-face") {
            no_face = true;
        } else if (arg.rfind("--", 0) == 0) {
            std::cerr << "Error: unknown option " << arg << "\n";
            return -1;
        } else if (positional == 0) {
            config_path = arg;
            explicit_config = true;
            ++positional;
        } else {
            camera_override = std::atoi(arg.c_str());
            ++positional;
        }
    }

    StateCommand state_command;
    try {
        state_command.config = GestureConfig::fromFile(config_path, mode);
    } catch (const std::runtime_error& e) {
        if (explicit_config) {
            std::cerr << "Error: " << e.what() << "\n";
            return -1;
        }
        std::cout << e.what() << ", using defaults\n";
        state_command.config = GestureConfig::preset(mode);
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return -1;
    }
    GestureConfig& config = state_command.config;
    if (camera_override >= 0) config.camera_index = camera_override;
    if (no_face) config.enable_attention_gate = false;

    std::cout << "Configuration:\n";
    std::cout << "  Config file: " << config_path << "\n";
    std::cout << "  Mode: " << (mode.empty() ? "from config" : mode) << "\n";
    std::cout << "  Camera ID: " << config.camera_index << "\n";
    std::cout << "  Hand model: " << config.hand_model_path << " (max " << config.max_hands << " hands)\n";
    std::cout << "  Face model: " << config.face_model_path << "\n";
    std::cout << "  Attention gate: " << (config.enable_attention_gate ? "on" : "off")
              << " | Two-hand gestures: " << (config.enable_two_hand ? "on" : "off") << "\n";
    std::cout << "  Target: " << config.target_width << "x" << config.target_height
              << " | Smoothing: " << config.cursor_smoothing << "\n\n";

    // Open camera
    cv::VideoCapture cap(config.camera_index);
    if (!cap.isOpened()) {
        std::cerr << "Error: Cannot open camera " << config.camera_index << "\n";
        return -1;
    }
    cap.set(cv::CAP_PROP_FRAME_WIDTH, config.camera_width);
    cap.set(cv::CAP_PROP_FRAME_HEIGHT, config.camera_height);
    cap.set(cv::CAP_PROP_FPS, config.camera_fps);

    std::cout << "Camera opened successfully\n";
    std::cout << "Resolution: " << cap.get(cv::CAP_PROP_FRAME_WIDTH)
              << "x" << cap.get(cv::CAP_PROP_FRAME_HEIGHT) << "\n\n";

    try {
        state_command.current_state = SystemState::IDLE;

        // State machine loop
        while (state_command.current_state != SystemState::SHUTDOWN) {

            switch (state_command.current_state) {
                case SystemState::IDLE: {
                    std::cout << "\n========================================\n";
                    std::cout << "  ENTERING IDLE STATE\n";
                    std::cout << "========================================\n\n";

                    IdleState idle_state(state_command, cap);
                    state_command.current_state = idle_state.run();
                    break;
                }

                case SystemState::TRACKING: {
                    std::cout << "\n========================================\n";
                    std::cout << "  ENTERING TRACKING STATE\n";
                    std::cout << "========================================\n\n";

                    TrackingState tracking_state(state_command, cap);
                    state_command.current_state = tracking_state.run();
                    break;
                }

                case SystemState::ERROR: {
                    std::cerr << "\n========================================\n";
                    std::cerr << "  ERROR STATE\n";
                    std::cerr << "========================================\n";
                    std::cerr << "Error: " << state_command.error_message << "\n\n";
                    std::cerr << "Press any key to retry or ESC to quit\n";

                    char key = cv::waitKey(0);
                    if (key == 27) { // ESC
                        state_command.current_state = SystemState::SHUTDOWN;
                    } else {
                        state_command.current_state = SystemState::IDLE;
                        state_command.error_message.clear();
                    }
                    break;
                }

                case SystemState::SHUTDOWN:
                    // Will exit loop
                    break;
            }
        }

        std::cout << "\nShutting down...\n";

    } catch (const std::exception& e) {
        std::cerr << "Fatal Error: " << e.what() << "\n";
        cap.release();
        return -1;
    }

    cap.release();
    cv::destroyAllWindows();

    std::cout << "Shutdown complete.\n";
    return 0;
}
