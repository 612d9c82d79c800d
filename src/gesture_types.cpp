#include "gestify/gesture_types.hpp"

namespace gestify {

const char* handednessName(Handedness hand) {
    switch (hand) {
        case Handedness::LEFT:  return "Left";
        case Handedness::RIGHT: return "Right";
    }
    return "Right";
}

Handedness opposite(Handedness hand) {
    return hand == Handedness::LEFT ? Handedness::RIGHT : Handedness::LEFT;
}

const char* gestureName(Gesture gesture) {
    switch (gesture) {
        case Gesture::NONE:         return "NONE";
        case Gesture::CURSOR_MOVE:  return "CURSOR_MOVE";
        case Gesture::CLICK:        return "CLICK";
        case Gesture::DOUBLE_CLICK: return "DOUBLE_CLICK";
        case Gesture::SCROLL:       return "SCROLL";
        case Gesture::DRAG_START:   return "DRAG_START";
        case Gesture::DRAG_END:     return "DRAG_END";
        case Gesture::PAUSE:        return "PAUSE";
        case Gesture::CONFIRM:      return "CONFIRM";
        case Gesture::CANCEL:       return "CANCEL";
        case Gesture::ZOOM_IN:      return "ZOOM_IN";
        case Gesture::ZOOM_OUT:     return "ZOOM_OUT";
        case Gesture::ROTATE_CW:    return "ROTATE_CW";
        case Gesture::ROTATE_CCW:   return "ROTATE_CCW";
    }
    return "NONE";
}

bool isContinuous(Gesture gesture) {
    switch (gesture) {
        case Gesture::CURSOR_MOVE:
        case Gesture::SCROLL:
            return true;
        case Gesture::NONE:
        case Gesture::CLICK:
        case Gesture::DOUBLE_CLICK:
        case Gesture::DRAG_START:
        case Gesture::DRAG_END:
        case Gesture::PAUSE:
        case Gesture::CONFIRM:
        case Gesture::CANCEL:
        case Gesture::ZOOM_IN:
        case Gesture::ZOOM_OUT:
        case Gesture::ROTATE_CW:
        case Gesture::ROTATE_CCW:
            return false;
    }
    return false;
}

}  // namespace gestify
