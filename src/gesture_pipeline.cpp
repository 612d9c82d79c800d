#include "gestify/gesture_pipeline.hpp"

#include <algorithm>
#include <numeric>

#include "absl/log/log.h"

namespace gestify {

namespace {

const GestureConfig& validated(const GestureConfig& config) {
    config.validate();
    return config;
}

}  // namespace

const HandSlotResult* FrameResult::dominantHand() const {
    for (const auto& slot : hands) {
        if (slot.dominant) return &slot;
    }
    return nullptr;
}

GesturePipeline::GesturePipeline(const GestureConfig& config)
    : config_(validated(config)),
      classifier_(config_),
      machine_(config_),
      two_hand_(config_),
      attention_(config_),
      cursor_(CursorMapper::fromConfig(config_)),
      pinch_hold_(PinchHoldTracker::fromConfig(config_)),
      dwell_(DwellDetector::fromConfig(config_)) {}

void GesturePipeline::reset() {
    for (auto& slot : slots_) {
        slot.reset();
    }
    two_hand_.reset();
    attention_.reset();
    cursor_.reset();
    pinch_hold_.reset();
    dwell_.reset();
    last_timestamp_.reset();
    attending_ = false;
}

const GestureMachineState& GesturePipeline::slotState(Handedness hand) const {
    return slots_[slotIndex(hand)];
}

void GesturePipeline::setAttentionGateEnabled(bool enabled) {
    config_.enable_attention_gate = enabled;
    attention_.reset();
    LOG(INFO) << "Attention gate " << (enabled ? "enabled" : "disabled");
}

GesturePipeline::SlotHands GesturePipeline::assignSlots(const std::vector<HandObservation>& hands) const {
    std::vector<size_t> order(hands.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(), [&hands](size_t a, size_t b) {
        return hands[a].confidence > hands[b].confidence;
    });
    if (order.size() > 2) {
        order.resize(2);
    }

    // The more confident hand keeps a contested label
    SlotHands slots;
    for (size_t idx : order) {
        HandObservation hand = hands[idx];
        if (slots[slotIndex(hand.handedness)]) {
            hand.handedness = opposite(hand.handedness);
        }
        slots[slotIndex(hand.handedness)] = std::move(hand);
    }
    return slots;
}

bool GesturePipeline::releaseDrag(GestureMachineState& state) const {
    bool was_dragging = state.dragging;
    state.dragging = false;
    return was_dragging;
}

FrameResult GesturePipeline::processFrame(const FrameObservation& frame) {
    FrameResult result;
    result.timestamp = frame.timestamp;

    if (last_timestamp_ && frame.timestamp < *last_timestamp_) {
        LOG(WARNING) << "Dropping out-of-order frame at t=" << frame.timestamp
                     << " (previous t=" << *last_timestamp_ << ")";
        result.dropped = true;
        result.attending = attending_;
        result.pinch_holding = pinch_hold_.isHolding();
        return result;
    }
    last_timestamp_ = frame.timestamp;
    const double now = frame.timestamp;

    attending_ = config_.enable_attention_gate ? attention_.process(frame.face) : true;
    result.attending = attending_;

    SlotHands hands = assignSlots(frame.hands);

    std::array<std::optional<HandPoseState>, 2> poses;
    for (size_t i = 0; i < slots_.size(); ++i) {
        if (!hands[i]) {
            // Absent hand: drop transient state, keep cooldown and click history
            if (releaseDrag(slots_[i])) {
                result.drag_force_released = true;
            }
            slots_[i].clearTransient();
            continue;
        }
        poses[i] = classifier_.classify(*hands[i], frame.frame_size, slots_[i].position_history);
    }

    std::optional<size_t> dominant;
    if (poses[0] && poses[1]) {
        dominant = slotIndex(config_.dominant_hand);
    } else if (poses[0]) {
        dominant = 0;
    } else if (poses[1]) {
        dominant = 1;
    }

    std::array<Gesture, 2> gestures = {Gesture::NONE, Gesture::NONE};

    if (!attending_) {
        two_hand_.reset();
        for (size_t i = 0; i < slots_.size(); ++i) {
            if (!poses[i]) continue;
            bool was_dragging = slots_[i].dragging;
            gestures[i] = machine_.update(slots_[i], *poses[i], false, now);
            if (was_dragging && !slots_[i].dragging) {
                result.drag_force_released = true;
            }
        }
    } else {
        Gesture composite = Gesture::NONE;
        if (config_.enable_two_hand && poses[0] && poses[1]) {
            composite = two_hand_.update(*poses[0], *poses[1], slots_[*dominant], now);
        } else {
            two_hand_.reset();
        }

        for (size_t i = 0; i < slots_.size(); ++i) {
            if (!poses[i] || (dominant && i == *dominant)) continue;
            // Non-dominant hands never run the single-hand table
            if (releaseDrag(slots_[i])) {
                result.drag_force_released = true;
            }
            if (poses[i]->valid) {
                slots_[i].pinch_engaged = poses[i]->pinch_distance < config_.pinch_threshold;
            }
        }

        if (dominant) {
            if (composite != Gesture::NONE) {
                gestures[*dominant] = composite;
                // Keep the pinch edge frame-to-frame even when the table is skipped
                if (poses[*dominant]->valid) {
                    slots_[*dominant].pinch_engaged =
                        poses[*dominant]->pinch_distance < config_.pinch_threshold;
                }
            } else {
                gestures[*dominant] = machine_.update(slots_[*dominant], *poses[*dominant], true, now);
            }
        }
    }

    for (size_t i = 0; i < slots_.size(); ++i) {
        if (!poses[i]) continue;

        HandSlotResult slot;
        slot.hand = slotHand(i);
        slot.pose = *poses[i];
        slot.dominant = dominant && *dominant == i;
        slot.event.gesture = gestures[i];
        slot.event.timestamp = now;
        slot.event.hand = slot.hand;
        slot.event.velocity = poses[i]->velocity;

        if (gestures[i] != Gesture::NONE) {
            result.events.push_back(slot.event);
        }
        result.hands.push_back(slot);
    }

    // Cursor, pinch hold and dwell follow the dominant hand
    if (!dominant) {
        cursor_.reset();
        dwell_.reset();
        result.pinch_transition = pinch_hold_.release();
    } else {
        const HandPoseState& pose = *poses[*dominant];
        if (pose.valid) {
            cv::Point cursor = cursor_.map(pose.position, frame.frame_size);
            result.cursor = cursor;
            result.dwell_triggered = dwell_.update(cursor, now);
            result.dwell_progress = dwell_.progress(now);
        }

        if (!attending_) {
            result.pinch_transition = pinch_hold_.release();
        } else if (pose.valid) {
            result.pinch_transition = pinch_hold_.update(pose.pinch_distance);
        }
    }
    result.pinch_holding = pinch_hold_.isHolding();

    if (result.dwell_triggered) {
        LOG(INFO) << "Dwell at (" << result.cursor->x << ", " << result.cursor->y << ") t=" << now;
    }
    if (result.drag_force_released) {
        LOG(INFO) << "Active drag force-released at t=" << now;
    }

    return result;
}

}  // namespace gestify
