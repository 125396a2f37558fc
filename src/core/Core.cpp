#include "core/Core.hpp"

const char *button_name(button_t button) {
    switch (button) {
        case BUTTON_A:      return "A";
        case BUTTON_B:      return "B";
        case BUTTON_START:  return "Start";
        case BUTTON_SELECT: return "Select";
        case BUTTON_UP:     return "Up";
        case BUTTON_DOWN:   return "Down";
        case BUTTON_LEFT:   return "Left";
        case BUTTON_RIGHT:  return "Right";
        default:            return "???";
    }
}
