#include "gestify/two_hand_tracker.hpp"

#include <cmath>

#include "absl/log/log.h"

namespace gestify {

namespace {

constexpr float PI = 3.14159265358979323846f;
constexpr float TWO_PI = 2.0f * PI;

}  // namespace

TwoHandCompositeTracker::TwoHandCompositeTracker(const GestureConfig& config)
    : distance_threshold_(config.two_hand_distance_threshold),
      rotation_threshold_(config.two_hand_rotation_threshold),
      cooldown_(config.gesture_cooldown) {}

bool TwoHandCompositeTracker::preconditionHolds(const HandPoseState& left, const HandPoseState& right) {
    return left.valid && right.valid &&
           left.isExtended(Finger::INDEX) && right.isExtended(Finger::INDEX);
}

float TwoHandCompositeTracker::normalizeAngle(float angle) {
    while (angle > PI) {
        angle -= TWO_PI;
    }
    while (angle <= -PI) {
        angle += TWO_PI;
    }
    return angle;
}

Gesture TwoHandCompositeTracker::update(const HandPoseState& left, const HandPoseState& right,
                                        GestureMachineState& cooldown_owner, double now) {
    if (!preconditionHolds(left, right)) {
        baseline_.reset();
        return Gesture::NONE;
    }

    cv::Point2f span = right.position - left.position;
    float distance = static_cast<float>(cv::norm(span));
    float angle = std::atan2(span.y, span.x);

    if (!baseline_) {
        baseline_ = TwoHandBaseline{distance, angle};
        return Gesture::NONE;
    }

    Gesture candidate = Gesture::NONE;
    float distance_delta = distance - baseline_->distance;
    float angle_delta = normalizeAngle(angle - baseline_->angle);
    bool zooming = std::abs(distance_delta) > distance_threshold_;

    if (zooming) {
        candidate = distance_delta > 0.0f ? Gesture::ZOOM_IN : Gesture::ZOOM_OUT;
    } else if (std::abs(angle_delta) > rotation_threshold_) {
        candidate = angle_delta > 0.0f ? Gesture::ROTATE_CCW : Gesture::ROTATE_CW;
    }

    if (candidate == Gesture::NONE || !cooldownElapsed(cooldown_owner, now, cooldown_)) {
        return Gesture::NONE;
    }

    if (zooming) {
        baseline_->distance = distance;
    } else {
        baseline_->angle = angle;
    }
    recordEmission(cooldown_owner, candidate, now);
    LOG(INFO) << gestureName(candidate) << " at t=" << now << " (distance " << distance
              << "px, angle " << angle << "rad)";
    return candidate;
}

}  // namespace gestify
