#ifndef GESTIFY_PINCH_HOLD_HPP_
#define GESTIFY_PINCH_HOLD_HPP_

#include "gestify/gesture_config.hpp"

namespace gestify {

enum class PinchHoldTransition {
    NONE,
    ENGAGED,
    RELEASED
};

const char* pinchTransitionName(PinchHoldTransition transition);

/**
 * @brief Stable pick/hold state from a noisy pinch distance.
 *
 * While idle only the stricter engage threshold is tested, while holding only
 * the looser release threshold, so jitter near either boundary cannot toggle
 * the hold.
 */
class PinchHoldTracker {
public:
    // Throws std::invalid_argument unless 0 < engage <= release
    PinchHoldTracker(float engage_threshold, float release_threshold);

    static PinchHoldTracker fromConfig(const GestureConfig& config);

    PinchHoldTransition update(float pinch_distance);

    // Forced release, e.g. the hand was lost
    PinchHoldTransition release();

    void reset() { holding_ = false; }

    bool isHolding() const { return holding_; }
    float engageThreshold() const { return engage_threshold_; }
    float releaseThreshold() const { return release_threshold_; }

private:
    float engage_threshold_;
    float release_threshold_;
    bool holding_ = false;
};

}  // namespace gestify

#endif  // GESTIFY_PINCH_HOLD_HPP_
