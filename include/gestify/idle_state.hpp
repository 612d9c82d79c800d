#ifndef GESTIFY_IDLE_STATE_HPP_
#define GESTIFY_IDLE_STATE_HPP_

#include <opencv2/opencv.hpp>
#include <string>
#include <vector>

#include "gestify/state_command.hpp"

namespace gestify {

/**
 * @brief IdleState - Initialization and component verification state
 *
 * Responsibilities:
 * - Create the MediaPipe hand and face landmarkers from the configuration
 * - Create the gesture pipeline
 * - Verify the camera delivers frames and the landmarkers run on them
 * - Display initialization status to user
 * - Transition to TrackingState when all components are ready
 */
class IdleState {
public:
    IdleState(StateCommand& state_command, cv::VideoCapture& cap);

    // Run idle state - returns next state to transition to
    SystemState run();

private:
    StateCommand& state_command_;
    cv::VideoCapture& cap_;

    std::vector<std::string> status_lines_;

    // Helper methods
    bool initializeComponents();
    bool verifyComponents();
    void displayStatus(cv::Mat& frame);
};

}  // namespace gestify

#endif  // GESTIFY_IDLE_STATE_HPP_
