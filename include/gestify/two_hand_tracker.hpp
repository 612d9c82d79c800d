#ifndef GESTIFY_TWO_HAND_TRACKER_HPP_
#define GESTIFY_TWO_HAND_TRACKER_HPP_

#include <optional>

#include "gestify/gesture_config.hpp"
#include "gestify/gesture_machine.hpp"
#include "gestify/gesture_types.hpp"

namespace gestify {

struct TwoHandBaseline {
    float distance = 0.0f;  // pixels between index fingertips
    float angle = 0.0f;     // radians, left to right fingertip
};

/**
 * @brief Zoom and rotate from two index fingertips measured against a baseline.
 *
 * The first frame with both index fingers extended captures the baseline and
 * never fires. Each emission moves only the quantity that fired to its current
 * value, so a sustained spread produces repeated ticks. Zoom is evaluated
 * before rotation and a frame never reports both.
 */
class TwoHandCompositeTracker {
public:
    explicit TwoHandCompositeTracker(const GestureConfig& config);

    // `cooldown_owner` is the slot whose cooldown the composite gesture shares
    Gesture update(const HandPoseState& left, const HandPoseState& right,
                   GestureMachineState& cooldown_owner, double now);

    void reset() { baseline_.reset(); }

    const std::optional<TwoHandBaseline>& baseline() const { return baseline_; }

    static bool preconditionHolds(const HandPoseState& left, const HandPoseState& right);

    // Wraps into (-pi, pi]
    static float normalizeAngle(float angle);

private:
    float distance_threshold_;
    float rotation_threshold_;
    double cooldown_;
    std::optional<TwoHandBaseline> baseline_;
};

}  // namespace gestify

#endif  // GESTIFY_TWO_HAND_TRACKER_HPP_
