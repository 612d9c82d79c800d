#include "gestify/attention_gate.hpp"

#include <algorithm>
#include <cmath>

namespace gestify {

namespace fl = face_landmark;

AttentionGate::AttentionGate(const GestureConfig& config)
    : buffer_size_(static_cast<size_t>(std::max(1, config.attention_buffer_size))),
      vote_threshold_(config.attention_vote_threshold),
      min_samples_(static_cast<size_t>(std::max(1, config.attention_min_samples))),
      gaze_horizontal_limit_(config.gaze_horizontal_limit),
      gaze_vertical_min_(config.gaze_vertical_min),
      gaze_vertical_max_(config.gaze_vertical_max),
      nose_center_min_(config.nose_center_min),
      nose_center_max_(config.nose_center_max),
      min_face_width_(config.min_face_width) {}

bool AttentionGate::checkLooking(const std::optional<FaceObservation>& face) const {
    if (!face) {
        return false;
    }

    const auto& lm = face->landmarks;
    const int required[] = {fl::LEFT_EYE_CENTER, fl::LEFT_IRIS, fl::RIGHT_EYE_CENTER,
                            fl::RIGHT_IRIS, fl::NOSE_TIP, fl::LEFT_FACE, fl::RIGHT_FACE};
    for (int idx : required) {
        if (static_cast<size_t>(idx) >= lm.size() || !lm[idx].allFinite()) {
            return false;
        }
    }

    // Iris offset from eye centre, averaged over both eyes
    Eigen::Vector2f left_gaze = lm[fl::LEFT_IRIS].head<2>() - lm[fl::LEFT_EYE_CENTER].head<2>();
    Eigen::Vector2f right_gaze = lm[fl::RIGHT_IRIS].head<2>() - lm[fl::RIGHT_EYE_CENTER].head<2>();
    Eigen::Vector2f gaze = (left_gaze + right_gaze) / 2.0f;

    bool looking_forward = std::abs(gaze.x()) < gaze_horizontal_limit_;
    bool looking_at_screen = gaze.y() > gaze_vertical_min_ && gaze.y() < gaze_vertical_max_;

    float nose_x = lm[fl::NOSE_TIP].x();
    bool face_centered = nose_x > nose_center_min_ && nose_x < nose_center_max_;

    // Narrow apparent width means the head is turned too far for reliable iris points
    float face_width = std::abs(lm[fl::RIGHT_FACE].x() - lm[fl::LEFT_FACE].x());
    bool facing_camera = face_width > min_face_width_;

    return looking_forward && looking_at_screen && face_centered && facing_camera;
}

bool AttentionGate::update(bool looking) {
    history_.push_back(looking);
    while (history_.size() > buffer_size_) {
        history_.pop_front();
    }

    if (history_.size() < min_samples_) {
        attending_ = false;
    } else {
        attending_ = lookingCount() >= vote_threshold_;
    }
    return attending_;
}

bool AttentionGate::process(const std::optional<FaceObservation>& face) {
    return update(checkLooking(face));
}

int AttentionGate::lookingCount() const {
    return static_cast<int>(std::count(history_.begin(), history_.end(), true));
}

void AttentionGate::reset() {
    history_.clear();
    attending_ = false;
}

}  // namespace gestify
