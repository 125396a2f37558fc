#pragma once

#include <cstdint>

#include "core/Core.hpp"
#include "input/InputSource.hpp"

/*
 * Level-samples every logical button once per frame and hands the whole set
 * to the core. No edge detection or debouncing; that's the core's business.
 */
class InputSampler {
    private:
        InputSource *source;
        bool pressed[NUM_BUTTONS] = { false };
        uint64_t samples_taken = 0;

    public:
        InputSampler(InputSource *source) : source(source) {}

        /* returns true if the host asked us to shut down. */
        bool sample(EmulationCore *core);

        bool is_pressed(button_t button) const { return pressed[button]; }
        uint64_t get_samples_taken() const { return samples_taken; }
};
