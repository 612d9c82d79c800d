#include "gestify/pinch_hold.hpp"

#include <sstream>
#include <stdexcept>

namespace gestify {

const char* pinchTransitionName(PinchHoldTransition transition) {
    switch (transition) {
        case PinchHoldTransition::NONE:     return "NONE";
        case PinchHoldTransition::ENGAGED:  return "ENGAGED";
        case PinchHoldTransition::RELEASED: return "RELEASED";
    }
    return "NONE";
}

PinchHoldTracker::PinchHoldTracker(float engage_threshold, float release_threshold)
    : engage_threshold_(engage_threshold), release_threshold_(release_threshold) {
    if (engage_threshold_ <= 0.0f || release_threshold_ < engage_threshold_) {
        std::ostringstream msg;
        msg << "Pinch hold thresholds must satisfy 0 < engage <= release (engage="
            << engage_threshold_ << ", release=" << release_threshold_ << ")";
        throw std::invalid_argument(msg.str());
    }
}

PinchHoldTracker PinchHoldTracker::fromConfig(const GestureConfig& config) {
    return PinchHoldTracker(config.pinchEngageThreshold(), config.pinchReleaseThreshold());
}

PinchHoldTransition PinchHoldTracker::update(float pinch_distance) {
    if (!holding_) {
        if (pinch_distance < engage_threshold_) {
            holding_ = true;
            return PinchHoldTransition::ENGAGED;
        }
        return PinchHoldTransition::NONE;
    }

    if (pinch_distance < release_threshold_) {
        return PinchHoldTransition::NONE;
    }
    holding_ = false;
    return PinchHoldTransition::RELEASED;
}

PinchHoldTransition PinchHoldTracker::release() {
    if (!holding_) {
        return PinchHoldTransition::NONE;
    }
    holding_ = false;
    return PinchHoldTransition::RELEASED;
}

}  // namespace gestify
