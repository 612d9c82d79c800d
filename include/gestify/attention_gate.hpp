#ifndef GESTIFY_ATTENTION_GATE_HPP_
#define GESTIFY_ATTENTION_GATE_HPP_

#include <deque>
#include <optional>

#include "gestify/gesture_config.hpp"
#include "gestify/gesture_types.hpp"

namespace gestify {

/**
 * @brief Smoothed "user is looking at the screen" signal.
 *
 * Responsibilities:
 * - Per-frame gaze and head-pose heuristic on the face mesh
 * - Majority vote over a fixed-size sliding window
 * - Fail closed: no face, too few samples or broken landmarks read as not attending
 */
class AttentionGate {
public:
    explicit AttentionGate(const GestureConfig& config);

    // Single-frame heuristic, no state change
    bool checkLooking(const std::optional<FaceObservation>& face) const;

    // Pushes one sample and returns the smoothed signal
    bool update(bool looking);

    // checkLooking() followed by update()
    bool process(const std::optional<FaceObservation>& face);

    bool isAttending() const { return attending_; }
    size_t sampleCount() const { return history_.size(); }
    int lookingCount() const;

    void reset();

private:
    size_t buffer_size_;
    int vote_threshold_;
    size_t min_samples_;

    float gaze_horizontal_limit_;
    float gaze_vertical_min_;
    float gaze_vertical_max_;
    float nose_center_min_;
    float nose_center_max_;
    float min_face_width_;

    std::deque<bool> history_;
    bool attending_ = false;
};

}  // namespace gestify

#endif  // GESTIFY_ATTENTION_GATE_HPP_
