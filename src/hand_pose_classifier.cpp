#include "gestify/hand_pose_classifier.hpp"

#include <algorithm>
#include <cmath>

#include "absl/log/log.h"

namespace gestify {

namespace hl = hand_landmark;

namespace {

// Tip and proximal joint for each finger, in FingerPattern order
constexpr int FINGER_JOINTS[5][2] = {
    {hl::THUMB_TIP, hl::THUMB_IP},
    {hl::INDEX_TIP, hl::INDEX_PIP},
    {hl::MIDDLE_TIP, hl::MIDDLE_PIP},
    {hl::RING_TIP, hl::RING_PIP},
    {hl::PINKY_TIP, hl::PINKY_PIP},
};

float planarDistance(const Eigen::Vector3f& a, const Eigen::Vector3f& b) {
    return (a.head<2>() - b.head<2>()).norm();
}

float pixelDistance(const cv::Point2f& a, const cv::Point2f& b) {
    return static_cast<float>(cv::norm(a - b));
}

}  // namespace

HandPoseClassifier::HandPoseClassifier(const GestureConfig& config)
    : finger_ratio_(config.finger_extension_ratio),
      thumb_ratio_(config.thumb_extension_ratio),
      history_length_(static_cast<size_t>(std::max(2, config.velocity_history))) {}

HandPoseState HandPoseClassifier::neutralState(Handedness hand) {
    HandPoseState state;
    state.valid = false;
    state.handedness = hand;
    state.fingers = {false, false, false, false, false};
    state.is_fist = false;
    state.is_palm = false;
    state.pinch_distance = std::numeric_limits<float>::max();
    state.velocity = cv::Point2f(0.0f, 0.0f);
    return state;
}

bool HandPoseClassifier::isWellFormed(const HandObservation& hand) {
    if (hand.landmarks.size() < static_cast<size_t>(hl::NUM_LANDMARKS)) {
        return false;
    }
    return std::all_of(hand.landmarks.begin(), hand.landmarks.end(),
                       [](const Eigen::Vector3f& lm) { return lm.allFinite(); });
}

cv::Point2f HandPoseClassifier::toPixel(const Eigen::Vector3f& landmark, const cv::Size& frame_size) {
    return cv::Point2f(landmark.x() * frame_size.width, landmark.y() * frame_size.height);
}

bool HandPoseClassifier::isFingerExtended(const HandObservation& hand,
                                          int tip_idx, int pip_idx, float ratio) const {
    const auto& wrist = hand.landmarks[hl::WRIST];
    float tip_dist = planarDistance(hand.landmarks[tip_idx], wrist);
    float pip_dist = planarDistance(hand.landmarks[pip_idx], wrist);
    return tip_dist > pip_dist * ratio;
}

cv::Point2f HandPoseClassifier::velocityFrom(const std::deque<cv::Point2f>& history) {
    if (history.size() < 2) {
        return cv::Point2f(0.0f, 0.0f);
    }
    float frames = static_cast<float>(history.size() - 1);
    cv::Point2f delta = history.back() - history.front();
    return cv::Point2f(delta.x / frames, delta.y / frames);
}

HandPoseState HandPoseClassifier::classify(const HandObservation& hand,
                                           const cv::Size& frame_size,
                                           std::deque<cv::Point2f>& history) const {
    if (!isWellFormed(hand) || frame_size.width <= 0 || frame_size.height <= 0) {
        LOG(WARNING) << "Malformed " << handednessName(hand.handedness)
                     << " hand observation (" << hand.landmarks.size()
                     << " landmarks), substituting neutral pose";
        return neutralState(hand.handedness);
    }

    HandPoseState state;
    state.valid = true;
    state.handedness = hand.handedness;

    for (size_t i = 0; i < state.fingers.size(); ++i) {
        float ratio = (i == static_cast<size_t>(Finger::THUMB)) ? thumb_ratio_ : finger_ratio_;
        state.fingers[i] = isFingerExtended(hand, FINGER_JOINTS[i][0], FINGER_JOINTS[i][1], ratio);
    }

    state.is_fist = std::none_of(state.fingers.begin(), state.fingers.end(), [](bool f) { return f; });
    state.is_palm = std::all_of(state.fingers.begin(), state.fingers.end(), [](bool f) { return f; });

    state.position = toPixel(hand.landmarks[hl::INDEX_TIP], frame_size);
    state.thumb_tip = toPixel(hand.landmarks[hl::THUMB_TIP], frame_size);
    state.wrist = toPixel(hand.landmarks[hl::WRIST], frame_size);

    // Absolute pixels: downstream thresholds are calibrated in pixels
    state.pinch_distance = pixelDistance(state.thumb_tip, state.position);

    history.push_back(state.position);
    while (history.size() > history_length_) {
        history.pop_front();
    }
    state.velocity = velocityFrom(history);

    return state;
}

}  // namespace gestify
