#ifndef GESTIFY_DWELL_DETECTOR_HPP_
#define GESTIFY_DWELL_DETECTOR_HPP_

#include <optional>

#include <opencv2/core.hpp>

#include "gestify/gesture_config.hpp"

namespace gestify {

// Fires once when the cursor rests within `radius` of an anchor for `dwell_time`
class DwellDetector {
public:
    // Throws std::invalid_argument for a non-positive time or negative radius
    DwellDetector(double dwell_time, float radius);

    static DwellDetector fromConfig(const GestureConfig& config);

    // True only on the frame the dwell completes
    bool update(const cv::Point& cursor, double now);

    // Fraction of the dwell time elapsed, 0 without an anchor or after firing
    float progress(double now) const;

    void reset();

    const std::optional<cv::Point>& anchor() const { return anchor_; }

private:
    double dwell_time_;
    float radius_;
    std::optional<cv::Point> anchor_;
    double anchor_time_ = 0.0;
    bool fired_ = false;
};

}  // namespace gestify

#endif  // GESTIFY_DWELL_DETECTOR_HPP_
