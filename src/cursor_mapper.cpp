#include "gestify/cursor_mapper.hpp"

#include <algorithm>
#include <stdexcept>

namespace gestify {

namespace {

void checkTarget(const cv::Size& target_size) {
    if (target_size.width <= 0 || target_size.height <= 0) {
        throw std::invalid_argument("Cursor target size must be positive");
    }
}

}  // namespace

CursorMapper::CursorMapper(const cv::Size& target_size, int smoothing_window, bool mirror)
    : target_size_(target_size), mirror_(mirror) {
    checkTarget(target_size);
    if (smoothing_window < 1) {
        throw std::invalid_argument("Cursor smoothing window must be at least 1");
    }
    smoothing_window_ = static_cast<size_t>(smoothing_window);
}

CursorMapper CursorMapper::fromConfig(const GestureConfig& config) {
    return CursorMapper(cv::Size(config.target_width, config.target_height),
                        config.cursor_smoothing, config.mirror_cursor);
}

void CursorMapper::setTargetSize(const cv::Size& target_size) {
    checkTarget(target_size);
    target_size_ = target_size;
    history_.clear();
}

cv::Point CursorMapper::mapRaw(const cv::Point2f& position, const cv::Size& frame_size) const {
    float nx = position.x / static_cast<float>(frame_size.width);
    float ny = position.y / static_cast<float>(frame_size.height);
    if (mirror_) {
        nx = 1.0f - nx;  // front camera shows a mirror image
    }

    int x = static_cast<int>(nx * target_size_.width);
    int y = static_cast<int>(ny * target_size_.height);
    x = std::max(0, std::min(x, target_size_.width - 1));
    y = std::max(0, std::min(y, target_size_.height - 1));
    return cv::Point(x, y);
}

cv::Point CursorMapper::map(const cv::Point2f& position, const cv::Size& frame_size) {
    history_.push_back(mapRaw(position, frame_size));
    while (history_.size() > smoothing_window_) {
        history_.pop_front();
    }

    long sum_x = 0;
    long sum_y = 0;
    for (const auto& p : history_) {
        sum_x += p.x;
        sum_y += p.y;
    }
    long n = static_cast<long>(history_.size());
    return cv::Point(static_cast<int>(sum_x / n), static_cast<int>(sum_y / n));
}

}  // namespace gestify
