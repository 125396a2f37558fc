#pragma once

#include "core/Core.hpp"

/* Host-side source of logical button state and of the "please quit" signal. */
class InputSource {
public:
    virtual ~InputSource() = default;

    // pump host events; call once per frame before reading anything.
    virtual void poll() = 0;
    virtual bool button_down(button_t button) = 0;
    virtual bool close_requested() = 0;
};
