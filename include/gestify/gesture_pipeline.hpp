#ifndef GESTIFY_GESTURE_PIPELINE_HPP_
#define GESTIFY_GESTURE_PIPELINE_HPP_

#include <array>
#include <optional>
#include <vector>

#include <opencv2/core.hpp>

#include "gestify/attention_gate.hpp"
#include "gestify/cursor_mapper.hpp"
#include "gestify/dwell_detector.hpp"
#include "gestify/gesture_config.hpp"
#include "gestify/gesture_machine.hpp"
#include "gestify/gesture_types.hpp"
#include "gestify/hand_pose_classifier.hpp"
#include "gestify/pinch_hold.hpp"
#include "gestify/two_hand_tracker.hpp"

namespace gestify {

struct HandSlotResult {
    Handedness hand = Handedness::RIGHT;
    HandPoseState pose;
    GestureEvent event;
    bool dominant = false;
};

// Everything one frame produced for downstream consumers
struct FrameResult {
    double timestamp = 0.0;
    bool dropped = false;  // out-of-order frame, nothing processed
    bool attending = false;

    std::vector<HandSlotResult> hands;  // present slots, LEFT before RIGHT
    std::vector<GestureEvent> events;   // non-NONE only

    std::optional<cv::Point> cursor;
    PinchHoldTransition pinch_transition = PinchHoldTransition::NONE;
    bool pinch_holding = false;
    bool dwell_triggered = false;
    float dwell_progress = 0.0f;
    bool drag_force_released = false;

    const HandSlotResult* dominantHand() const;
};

/**
 * @brief Frame-at-a-time recognition: observations in, gesture events out.
 *
 * Responsibilities:
 * - Assign hands to LEFT/RIGHT slots and own one GestureMachineState per slot
 * - Gate everything on the smoothed attention signal
 * - Run the two-hand composite check before the dominant hand's single-hand table
 * - Map the dominant fingertip to the cursor and feed pinch-hold and dwell
 *
 * Frames must arrive in timestamp order; earlier frames are dropped.
 */
class GesturePipeline {
public:
    // Validates the configuration; throws std::invalid_argument
    explicit GesturePipeline(const GestureConfig& config);

    FrameResult processFrame(const FrameObservation& frame);

    void reset();

    const GestureMachineState& slotState(Handedness hand) const;
    const std::optional<TwoHandBaseline>& twoHandBaseline() const { return two_hand_.baseline(); }
    bool isAttending() const { return attending_; }
    bool isPinchHolding() const { return pinch_hold_.isHolding(); }

    // Runtime toggle; disabling makes attention always true
    void setAttentionGateEnabled(bool enabled);
    bool attentionGateEnabled() const { return config_.enable_attention_gate; }

    const GestureConfig& config() const { return config_; }

private:
    using SlotHands = std::array<std::optional<HandObservation>, 2>;

    GestureConfig config_;
    HandPoseClassifier classifier_;
    SingleHandGestureMachine machine_;
    TwoHandCompositeTracker two_hand_;
    AttentionGate attention_;
    CursorMapper cursor_;
    PinchHoldTracker pinch_hold_;
    DwellDetector dwell_;

    std::array<GestureMachineState, 2> slots_;
    std::optional<double> last_timestamp_;
    bool attending_ = false;

    static size_t slotIndex(Handedness hand) { return hand == Handedness::LEFT ? 0 : 1; }
    static Handedness slotHand(size_t index) { return index == 0 ? Handedness::LEFT : Handedness::RIGHT; }

    SlotHands assignSlots(const std::vector<HandObservation>& hands) const;
    bool releaseDrag(GestureMachineState& state) const;
};

}  // namespace gestify

#endif  // GESTIFY_GESTURE_PIPELINE_HPP_
