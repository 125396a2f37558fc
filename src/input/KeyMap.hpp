#pragma once

#include <SDL3/SDL.h>

#include "core/Core.hpp"

struct key_binding_t {
    button_t button;
    SDL_Scancode scancode;
};

// host keyboard -> handheld buttons
const key_binding_t default_key_map[NUM_BUTTONS] = {
    { BUTTON_A,      SDL_SCANCODE_A },
    { BUTTON_B,      SDL_SCANCODE_S },
    { BUTTON_START,  SDL_SCANCODE_RETURN },
    { BUTTON_SELECT, SDL_SCANCODE_TAB },
    { BUTTON_UP,     SDL_SCANCODE_UP },
    { BUTTON_DOWN,   SDL_SCANCODE_DOWN },
    { BUTTON_LEFT,   SDL_SCANCODE_LEFT },
    { BUTTON_RIGHT,  SDL_SCANCODE_RIGHT },
};

const SDL_Scancode quit_scancode = SDL_SCANCODE_ESCAPE;
