#ifndef GESTIFY_CURSOR_MAPPER_HPP_
#define GESTIFY_CURSOR_MAPPER_HPP_

#include <deque>

#include <opencv2/core.hpp>

#include "gestify/gesture_config.hpp"

namespace gestify {

/**
 * @brief Camera-frame fingertip to target-space cursor.
 *
 * mapRaw() is a pure transform: optional horizontal mirror, scale, clamp to
 * [0, w-1] x [0, h-1]. map() also averages the last `smoothing_window`
 * mapped positions.
 */
class CursorMapper {
public:
    // Throws std::invalid_argument on an empty target or a window below 1
    CursorMapper(const cv::Size& target_size, int smoothing_window, bool mirror);

    static CursorMapper fromConfig(const GestureConfig& config);

    // Frame sizes must be positive; the caller guarantees it
    cv::Point mapRaw(const cv::Point2f& position, const cv::Size& frame_size) const;

    cv::Point map(const cv::Point2f& position, const cv::Size& frame_size);

    void reset() { history_.clear(); }

    void setTargetSize(const cv::Size& target_size);

    const cv::Size& targetSize() const { return target_size_; }
    size_t historySize() const { return history_.size(); }

private:
    cv::Size target_size_;
    size_t smoothing_window_;
    bool mirror_;
    std::deque<cv::Point> history_;
};

}  // namespace gestify

#endif  // GESTIFY_CURSOR_MAPPER_HPP_
