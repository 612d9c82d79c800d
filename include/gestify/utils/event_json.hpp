#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "gestify/gesture_pipeline.hpp"
#include "gestify/gesture_types.hpp"

namespace gestify {
namespace utils {

using json = nlohmann::json;

// {"gesture": "CLICK", "timestamp": 1.25, "hand": "Right", "velocity": [vx, vy]}
json ToJson(const GestureEvent& event);

// Frame summary for the action dispatcher: attention, cursor (or null),
// pinch-hold state, dwell flag and the non-NONE events.
json ToJson(const FrameResult& result);

}  // namespace utils
}  // namespace gestify
