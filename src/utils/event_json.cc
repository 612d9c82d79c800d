#include "gestify/utils/event_json.hpp"

namespace gestify {
namespace utils {

json ToJson(const GestureEvent& event) {
  json j;
  j["gesture"] = gestureName(event.gesture);
  j["timestamp"] = event.timestamp;
  j["hand"] = handednessName(event.hand);
  j["velocity"] = {event.velocity.x, event.velocity.y};
  return j;
}

json ToJson(const FrameResult& result) {
  json j;
  j["timestamp"] = result.timestamp;
  j["attending"] = result.attending;

  if (result.cursor) {
    j["cursor"] = {result.cursor->x, result.cursor->y};
  } else {
    j["cursor"] = nullptr;
  }

  j["pinch"] = {
      {"transition", pinchTransitionName(result.pinch_transition)},
      {"holding", result.pinch_holding},
  };
  j["dwell"] = result.dwell_triggered;
  j["drag_force_released"] = result.drag_force_released;

  j["events"] = json::array();
  for (const auto& event : result.events) {
    j["events"].push_back(ToJson(event));
  }
  return j;
}

}  // namespace utils
}  // namespace gestify
