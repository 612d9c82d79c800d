#ifndef GESTIFY_GESTURE_TYPES_HPP_
#define GESTIFY_GESTURE_TYPES_HPP_

#include <array>
#include <limits>
#include <optional>
#include <vector>

#include <Eigen/Core>
#include <opencv2/core.hpp>

namespace gestify {

// MediaPipe hand landmark indices
namespace hand_landmark {
constexpr int WRIST = 0;
constexpr int THUMB_CMC = 1;
constexpr int THUMB_MCP = 2;
constexpr int THUMB_IP = 3;
constexpr int THUMB_TIP = 4;
constexpr int INDEX_MCP = 5;
constexpr int INDEX_PIP = 6;
constexpr int INDEX_DIP = 7;
constexpr int INDEX_TIP = 8;
constexpr int MIDDLE_MCP = 9;
constexpr int MIDDLE_PIP = 10;
constexpr int MIDDLE_DIP = 11;
constexpr int MIDDLE_TIP = 12;
constexpr int RING_MCP = 13;
constexpr int RING_PIP = 14;
constexpr int RING_DIP = 15;
constexpr int RING_TIP = 16;
constexpr int PINKY_MCP = 17;
constexpr int PINKY_PIP = 18;
constexpr int PINKY_DIP = 19;
constexpr int PINKY_TIP = 20;

constexpr int NUM_LANDMARKS = 21;
}  // namespace hand_landmark

// MediaPipe face mesh indices (refined mesh, 478 points)
namespace face_landmark {
constexpr int NOSE_TIP = 1;
constexpr int LEFT_EYE_CENTER = 33;
constexpr int LEFT_FACE = 234;
constexpr int RIGHT_EYE_CENTER = 263;
constexpr int RIGHT_FACE = 454;
constexpr int LEFT_IRIS = 468;
constexpr int RIGHT_IRIS = 473;

constexpr int NUM_LANDMARKS = 478;
}  // namespace face_landmark

enum class Handedness {
    LEFT,
    RIGHT
};

const char* handednessName(Handedness hand);
Handedness opposite(Handedness hand);

// One detected hand, as delivered by the landmark model
struct HandObservation {
    std::vector<Eigen::Vector3f> landmarks;  // normalized x, y; z is relative depth
    Handedness handedness = Handedness::RIGHT;
    float confidence = 0.0f;
};

struct FaceObservation {
    std::vector<Eigen::Vector3f> landmarks;
};

// Everything the landmark collaborator produced for one camera frame
struct FrameObservation {
    double timestamp = 0.0;  // seconds
    cv::Size frame_size;
    std::vector<HandObservation> hands;
    std::optional<FaceObservation> face;
};

enum class Finger {
    THUMB = 0,
    INDEX,
    MIDDLE,
    RING,
    PINKY
};

// [thumb, index, middle, ring, pinky]
using FingerPattern = std::array<bool, 5>;

/**
 * @brief Instantaneous pose descriptor for one hand in one frame.
 *
 * Pixel quantities are in camera-frame pixels. A state with valid == false is
 * the neutral pose substituted for a malformed observation.
 */
struct HandPoseState {
    bool valid = false;
    Handedness handedness = Handedness::RIGHT;

    cv::Point2f position;   // index fingertip
    cv::Point2f thumb_tip;
    cv::Point2f wrist;

    FingerPattern fingers{};
    bool is_fist = false;
    bool is_palm = false;

    float pinch_distance = std::numeric_limits<float>::max();
    cv::Point2f velocity;    // pixels per frame

    bool isExtended(Finger finger) const {
        return fingers[static_cast<size_t>(finger)];
    }
};

enum class Gesture {
    NONE,
    CURSOR_MOVE,
    CLICK,
    DOUBLE_CLICK,
    SCROLL,
    DRAG_START,
    DRAG_END,
    PAUSE,
    CONFIRM,
    CANCEL,
    ZOOM_IN,
    ZOOM_OUT,
    ROTATE_CW,
    ROTATE_CCW
};

const char* gestureName(Gesture gesture);

// Level-triggered gestures that may repeat every frame and bypass the cooldown
bool isContinuous(Gesture gesture);

struct GestureEvent {
    Gesture gesture = Gesture::NONE;
    double timestamp = 0.0;
    Handedness hand = Handedness::RIGHT;
    cv::Point2f velocity;
};

}  // namespace gestify

#endif  // GESTIFY_GESTURE_TYPES_HPP_
