#ifndef GESTIFY_GESTURE_MACHINE_HPP_
#define GESTIFY_GESTURE_MACHINE_HPP_

#include <deque>
#include <optional>
#include <vector>

#include <opencv2/core.hpp>

#include "gestify/gesture_config.hpp"
#include "gestify/gesture_types.hpp"

namespace gestify {

/**
 * @brief Mutable per-hand-slot state, owned by the pipeline and passed into
 * the transition function each frame.
 */
struct GestureMachineState {
    Gesture last_gesture = Gesture::NONE;
    std::optional<double> last_emission_time;
    bool dragging = false;
    bool pinch_engaged = false;
    std::deque<double> click_edges;
    std::deque<cv::Point2f> position_history;

    // Hand left the frame. Cooldown and click history survive.
    void clearTransient();
    void reset();
};

bool cooldownElapsed(const GestureMachineState& state, double now, double cooldown);

// Stamps a discrete emission; continuous gestures must not be recorded
void recordEmission(GestureMachineState& state, Gesture gesture, double now);

struct RuleContext {
    GestureMachineState& state;
    const HandPoseState& pose;
    const GestureConfig& config;
    bool attending;
    double now;
    bool pinch_edge;  // pinch crossed below threshold this frame
};

struct GestureRule {
    const char* name;
    bool (*when)(const RuleContext& ctx);
    Gesture (*then)(RuleContext& ctx);
};

/**
 * @brief Ordered decision table mapping one hand's pose stream to gestures.
 *
 * Rules are evaluated in priority order and the first whose predicate holds
 * decides the frame, even when its action yields NONE because the cooldown
 * has not elapsed.
 */
class SingleHandGestureMachine {
public:
    explicit SingleHandGestureMachine(const GestureConfig& config);

    Gesture update(GestureMachineState& state, const HandPoseState& pose,
                   bool attending, double now);

    // Name of the rule that decided the most recent update()
    const char* lastRule() const { return last_rule_; }

    const std::vector<GestureRule>& rules() const { return rules_; }

    static bool matches(const HandPoseState& pose, const FingerPattern& pattern);

    // Emits `candidate` if the cooldown allows it, otherwise NONE
    static Gesture tryEmit(RuleContext& ctx, Gesture candidate);

private:
    GestureConfig config_;
    std::vector<GestureRule> rules_;
    const char* last_rule_ = "";
};

}  // namespace gestify

#endif  // GESTIFY_GESTURE_MACHINE_HPP_
