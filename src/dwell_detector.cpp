#include "gestify/dwell_detector.hpp"

#include <algorithm>
#include <stdexcept>

namespace gestify {

DwellDetector::DwellDetector(double dwell_time, float radius)
    : dwell_time_(dwell_time), radius_(radius) {
    if (dwell_time_ <= 0.0) {
        throw std::invalid_argument("Dwell time must be positive");
    }
    if (radius_ < 0.0f) {
        throw std::invalid_argument("Dwell radius must not be negative");
    }
}

DwellDetector DwellDetector::fromConfig(const GestureConfig& config) {
    return DwellDetector(config.dwell_time, config.dwell_radius);
}

bool DwellDetector::update(const cv::Point& cursor, double now) {
    if (!anchor_ || cv::norm(cursor - *anchor_) > radius_) {
        anchor_ = cursor;
        anchor_time_ = now;
        fired_ = false;
        return false;
    }

    if (!fired_ && now - anchor_time_ >= dwell_time_) {
        fired_ = true;
        return true;
    }
    return false;
}

float DwellDetector::progress(double now) const {
    if (!anchor_ || fired_) {
        return 0.0f;
    }
    double fraction = (now - anchor_time_) / dwell_time_;
    return static_cast<float>(std::min(1.0, std::max(0.0, fraction)));
}

void DwellDetector::reset() {
    anchor_.reset();
    anchor_time_ = 0.0;
    fired_ = false;
}

}  // namespace gestify
