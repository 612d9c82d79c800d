#include "gestify/gesture_machine.hpp"

#include <cmath>

#include "absl/log/log.h"

namespace gestify {

namespace {

constexpr FingerPattern POINTING   = {false, true, false, false, false};
constexpr FingerPattern PEACE      = {false, true, true, false, false};
constexpr FingerPattern THUMB_ONLY = {true, false, false, false, false};

std::vector<GestureRule> buildRules() {
    return {
        {"attention_lost",
         [](const RuleContext& ctx) { return !ctx.attending; },
         [](RuleContext& ctx) {
             // A stuck drag is worse than a dropped one
             ctx.state.dragging = false;
             return Gesture::NONE;
         }},
        {"neutral_pose",
         [](const RuleContext& ctx) { return !ctx.pose.valid; },
         [](RuleContext&) { return Gesture::NONE; }},
        {"cursor",
         [](const RuleContext& ctx) { return SingleHandGestureMachine::matches(ctx.pose, POINTING); },
         [](RuleContext&) { return Gesture::CURSOR_MOVE; }},
        {"drag",
         [](const RuleContext& ctx) { return SingleHandGestureMachine::matches(ctx.pose, PEACE); },
         [](RuleContext& ctx) {
             if (ctx.state.dragging) {
                 return Gesture::CURSOR_MOVE;
             }
             Gesture g = SingleHandGestureMachine::tryEmit(ctx, Gesture::DRAG_START);
             if (g == Gesture::DRAG_START) {
                 ctx.state.dragging = true;
             }
             return g;
         }},
        {"drag_end",
         [](const RuleContext& ctx) { return ctx.state.dragging; },
         [](RuleContext& ctx) {
             Gesture g = SingleHandGestureMachine::tryEmit(ctx, Gesture::DRAG_END);
             if (g == Gesture::DRAG_END) {
                 ctx.state.dragging = false;
             }
             return g;
         }},
        {"pause",
         [](const RuleContext& ctx) { return ctx.pose.is_palm; },
         [](RuleContext& ctx) { return SingleHandGestureMachine::tryEmit(ctx, Gesture::PAUSE); }},
        // Thumb tip against wrist height; sensitive to forearm roll
        {"confirm",
         [](const RuleContext& ctx) {
             return SingleHandGestureMachine::matches(ctx.pose, THUMB_ONLY) &&
                    ctx.pose.thumb_tip.y < ctx.pose.wrist.y;
         },
         [](RuleContext& ctx) { return SingleHandGestureMachine::tryEmit(ctx, Gesture::CONFIRM); }},
        {"cancel",
         [](const RuleContext& ctx) {
             return SingleHandGestureMachine::matches(ctx.pose, THUMB_ONLY) &&
                    ctx.pose.thumb_tip.y > ctx.pose.wrist.y;
         },
         [](RuleContext& ctx) { return SingleHandGestureMachine::tryEmit(ctx, Gesture::CANCEL); }},
        {"pinch_click",
         [](const RuleContext& ctx) { return ctx.pinch_edge; },
         [](RuleContext& ctx) {
             auto& edges = ctx.state.click_edges;
             edges.push_back(ctx.now);
             while (edges.size() > static_cast<size_t>(ctx.config.click_history)) {
                 edges.pop_front();
             }

             bool is_double = edges.size() >= 2 &&
                              edges[edges.size() - 1] - edges[edges.size() - 2] < ctx.config.double_click_window;
             Gesture g = SingleHandGestureMachine::tryEmit(ctx, is_double ? Gesture::DOUBLE_CLICK : Gesture::CLICK);
             if (g == Gesture::DOUBLE_CLICK) {
                 edges.clear();
             }
             return g;
         }},
        {"scroll",
         [](const RuleContext& ctx) {
             return ctx.pose.is_fist && std::abs(ctx.pose.velocity.y) > ctx.config.scroll_velocity_min;
         },
         [](RuleContext&) { return Gesture::SCROLL; }},
    };
}

}  // namespace

void GestureMachineState::clearTransient() {
    dragging = false;
    pinch_engaged = false;
    position_history.clear();
}

void GestureMachineState::reset() {
    *this = GestureMachineState();
}

bool cooldownElapsed(const GestureMachineState& state, double now, double cooldown) {
    return !state.last_emission_time || (now - *state.last_emission_time) >= cooldown;
}

void recordEmission(GestureMachineState& state, Gesture gesture, double now) {
    state.last_gesture = gesture;
    state.last_emission_time = now;
}

SingleHandGestureMachine::SingleHandGestureMachine(const GestureConfig& config)
    : config_(config), rules_(buildRules()) {}

bool SingleHandGestureMachine::matches(const HandPoseState& pose, const FingerPattern& pattern) {
    return pose.fingers == pattern;
}

Gesture SingleHandGestureMachine::tryEmit(RuleContext& ctx, Gesture candidate) {
    if (!cooldownElapsed(ctx.state, ctx.now, ctx.config.gesture_cooldown)) {
        return Gesture::NONE;
    }
    recordEmission(ctx.state, candidate, ctx.now);
    LOG(INFO) << gestureName(candidate) << " (" << handednessName(ctx.pose.handedness)
              << " hand) at t=" << ctx.now;
    return candidate;
}

Gesture SingleHandGestureMachine::update(GestureMachineState& state, const HandPoseState& pose,
                                         bool attending, double now) {
    // Engagement tracks every valid frame so edges are true frame-to-frame transitions
    bool pinch_edge = false;
    if (pose.valid) {
        bool pinched = pose.pinch_distance < config_.pinch_threshold;
        pinch_edge = pinched && !state.pinch_engaged;
        state.pinch_engaged = pinched;
    }

    RuleContext ctx{state, pose, config_, attending, now, pinch_edge};
    for (const auto& rule : rules_) {
        if (rule.when(ctx)) {
            last_rule_ = rule.name;
            return rule.then(ctx);
        }
    }

    last_rule_ = "none";
    return Gesture::NONE;
}

}  // namespace gestify
