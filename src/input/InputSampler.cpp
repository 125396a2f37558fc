#include "input/InputSampler.hpp"

bool InputSampler::sample(EmulationCore *core) {
    source->poll();

    for (int i = 0; i < NUM_BUTTONS; i++) {
        button_t button = (button_t)i;
        pressed[i] = source->button_down(button);
        core->set_button(button, pressed[i]);
    }
    samples_taken++;

    return source->close_requested();
}
