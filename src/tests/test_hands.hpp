#ifndef GESTIFY_TESTS_TEST_HANDS_HPP_
#define GESTIFY_TESTS_TEST_HANDS_HPP_

#include <algorithm>
#include <cmath>
#include <optional>
#include <utility>
#include <vector>

#include "gestify/gesture_types.hpp"

namespace gestify {
namespace test_support {

constexpr int kFrameWidth = 640;
constexpr int kFrameHeight = 480;

inline cv::Size frameSize() { return cv::Size(kFrameWidth, kFrameHeight); }

constexpr FingerPattern kPointing   = {false, true, false, false, false};
constexpr FingerPattern kPeace      = {false, true, true, false, false};
constexpr FingerPattern kPalm       = {true, true, true, true, true};
constexpr FingerPattern kFist       = {false, false, false, false, false};
constexpr FingerPattern kThumbOnly  = {true, false, false, false, false};
constexpr FingerPattern kThreeUp    = {true, true, true, true, false};

/**
 * Synthetic 21-point hand in normalized coordinates. Each finger is laid out
 * along a ray from the wrist; extended fingers put the tip well beyond the
 * proximal joint, curled fingers fold the tip back inside it.
 *
 * With the default wrist (0.5, 0.8) on a 640x480 frame the thumb-index
 * distance is about 62px (thumb and index extended), 75px (index only) and
 * 28px (fist), all above the default 20px pinch threshold.
 */
class HandBuilder {
public:
    explicit HandBuilder(const FingerPattern& fingers = kPointing) : fingers_(fingers) {}

    HandBuilder& handedness(Handedness hand) { hand_ = hand; return *this; }
    HandBuilder& confidence(float c) { confidence_ = c; return *this; }
    HandBuilder& thumbDown() { thumb_down_ = true; return *this; }
    HandBuilder& wrist(float x, float y) { wrist_ = Eigen::Vector3f(x, y, 0.0f); return *this; }

    // Thumb tip placed `px` pixels to the right of the index tip
    HandBuilder& pinch(float px) { pinch_px_ = px; return *this; }

    // Translate every landmark by a pixel offset
    HandBuilder& shift(float dx_px, float dy_px) {
        shift_ = Eigen::Vector3f(dx_px / kFrameWidth, dy_px / kFrameHeight, 0.0f);
        return *this;
    }

    HandObservation build() const {
        namespace hl = hand_landmark;
        HandObservation obs;
        obs.handedness = hand_;
        obs.confidence = confidence_;
        obs.landmarks.assign(hl::NUM_LANDMARKS, wrist_);

        // Thumb: CMC, MCP, IP, TIP
        Eigen::Vector3f thumb_dir = direction(-0.8f, thumb_down_ ? 0.6f : -0.6f);
        bool thumb_out = fingers_[0];
        obs.landmarks[hl::THUMB_CMC] = wrist_ + thumb_dir * 0.04f;
        obs.landmarks[hl::THUMB_MCP] = wrist_ + thumb_dir * 0.07f;
        obs.landmarks[hl::THUMB_IP] = wrist_ + thumb_dir * 0.10f;
        obs.landmarks[hl::THUMB_TIP] = wrist_ + thumb_dir * (thumb_out ? 0.14f : 0.06f);

        // Index through pinky: MCP, PIP, DIP, TIP
        const float dirs[4][2] = {{-0.3f, -1.0f}, {0.0f, -1.0f}, {0.25f, -1.0f}, {0.5f, -1.0f}};
        for (int f = 0; f < 4; ++f) {
            Eigen::Vector3f dir = direction(dirs[f][0], dirs[f][1]);
            bool out = fingers_[f + 1];
            int mcp = hl::INDEX_MCP + 4 * f;
            obs.landmarks[mcp] = wrist_ + dir * 0.08f;
            obs.landmarks[mcp + 1] = wrist_ + dir * 0.13f;
            obs.landmarks[mcp + 2] = wrist_ + dir * (out ? 0.16f : 0.11f);
            obs.landmarks[mcp + 3] = wrist_ + dir * (out ? 0.20f : 0.09f);
        }

        if (pinch_px_) {
            obs.landmarks[hl::THUMB_TIP] =
                obs.landmarks[hl::INDEX_TIP] + Eigen::Vector3f(*pinch_px_ / kFrameWidth, 0.0f, 0.0f);
        }

        for (auto& lm : obs.landmarks) {
            lm += shift_;
        }
        return obs;
    }

private:
    static Eigen::Vector3f direction(float x, float y) {
        return Eigen::Vector3f(x, y, 0.0f).normalized();
    }

    FingerPattern fingers_;
    Handedness hand_ = Handedness::RIGHT;
    float confidence_ = 0.9f;
    bool thumb_down_ = false;
    Eigen::Vector3f wrist_ = Eigen::Vector3f(0.5f, 0.8f, 0.0f);
    Eigen::Vector3f shift_ = Eigen::Vector3f::Zero();
    std::optional<float> pinch_px_;
};

// Pose fed straight into the gesture machine, bypassing the classifier
inline HandPoseState makePose(const FingerPattern& fingers,
                              float pinch_distance = 100.0f,
                              cv::Point2f velocity = cv::Point2f(0.0f, 0.0f)) {
    HandPoseState pose;
    pose.valid = true;
    pose.handedness = Handedness::RIGHT;
    pose.fingers = fingers;
    pose.is_fist = std::none_of(fingers.begin(), fingers.end(), [](bool f) { return f; });
    pose.is_palm = std::all_of(fingers.begin(), fingers.end(), [](bool f) { return f; });
    pose.position = cv::Point2f(300.0f, 250.0f);
    pose.wrist = cv::Point2f(320.0f, 380.0f);
    pose.thumb_tip = cv::Point2f(260.0f, 340.0f);  // above the wrist
    pose.pinch_distance = pinch_distance;
    pose.velocity = velocity;
    return pose;
}

inline HandPoseState thumbsDown() {
    HandPoseState pose = makePose(kThumbOnly);
    pose.thumb_tip = cv::Point2f(260.0f, 420.0f);
    return pose;
}

/**
 * Refined face mesh with the gaze landmarks placed so the default arguments
 * read as looking at the screen.
 */
inline FaceObservation makeFace(float gaze_x = 0.0f, float gaze_y = 0.005f,
                                float nose_x = 0.5f, float face_width = 0.4f) {
    namespace fl = face_landmark;
    FaceObservation face;
    face.landmarks.assign(fl::NUM_LANDMARKS, Eigen::Vector3f(0.5f, 0.5f, 0.0f));

    Eigen::Vector3f gaze(gaze_x, gaze_y, 0.0f);
    face.landmarks[fl::LEFT_EYE_CENTER] = Eigen::Vector3f(0.4f, 0.4f, 0.0f);
    face.landmarks[fl::RIGHT_EYE_CENTER] = Eigen::Vector3f(0.6f, 0.4f, 0.0f);
    face.landmarks[fl::LEFT_IRIS] = face.landmarks[fl::LEFT_EYE_CENTER] + gaze;
    face.landmarks[fl::RIGHT_IRIS] = face.landmarks[fl::RIGHT_EYE_CENTER] + gaze;
    face.landmarks[fl::NOSE_TIP] = Eigen::Vector3f(nose_x, 0.5f, 0.0f);
    face.landmarks[fl::LEFT_FACE] = Eigen::Vector3f(0.5f - face_width / 2.0f, 0.5f, 0.0f);
    face.landmarks[fl::RIGHT_FACE] = Eigen::Vector3f(0.5f + face_width / 2.0f, 0.5f, 0.0f);
    return face;
}

inline FrameObservation makeFrame(double timestamp, std::vector<HandObservation> hands = {},
                                  std::optional<FaceObservation> face = std::nullopt) {
    FrameObservation frame;
    frame.timestamp = timestamp;
    frame.frame_size = frameSize();
    frame.hands = std::move(hands);
    frame.face = std::move(face);
    return frame;
}

}  // namespace test_support
}  // namespace gestify

#endif  // GESTIFY_TESTS_TEST_HANDS_HPP_
