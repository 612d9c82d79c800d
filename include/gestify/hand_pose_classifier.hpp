#ifndef GESTIFY_HAND_POSE_CLASSIFIER_HPP_
#define GESTIFY_HAND_POSE_CLASSIFIER_HPP_

#include <deque>

#include <opencv2/core.hpp>

#include "gestify/gesture_config.hpp"
#include "gestify/gesture_types.hpp"

namespace gestify {

/**
 * @brief Derives a HandPoseState from one hand observation.
 *
 * A finger is extended when its tip lies farther from the wrist than its
 * proximal joint by the configured ratio. Both distances share the wrist as
 * origin, which keeps the test independent of hand scale and in-plane
 * rotation. The thumb is measured against its IP joint.
 *
 * Malformed observations never throw; they produce the neutral pose.
 */
class HandPoseClassifier {
public:
    explicit HandPoseClassifier(const GestureConfig& config);

    // Appends the index fingertip to `history` (bounded to the configured
    // length) and derives velocity from it.
    HandPoseState classify(const HandObservation& hand,
                           const cv::Size& frame_size,
                           std::deque<cv::Point2f>& history) const;

    // All fingers retracted, zero velocity, maximal pinch distance, valid == false
    static HandPoseState neutralState(Handedness hand);

    static bool isWellFormed(const HandObservation& hand);

    bool isFingerExtended(const HandObservation& hand, int tip_idx, int pip_idx, float ratio) const;

    static cv::Point2f velocityFrom(const std::deque<cv::Point2f>& history);

private:
    float finger_ratio_;
    float thumb_ratio_;
    size_t history_length_;

    static cv::Point2f toPixel(const Eigen::Vector3f& landmark, const cv::Size& frame_size);
};

}  // namespace gestify

#endif  // GESTIFY_HAND_POSE_CLASSIFIER_HPP_
