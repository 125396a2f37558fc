/*
 *   Copyright (c) 2025 Jawaid Bazyar

 *   This program is free software: you can redistribute it and/or modify
 *   it under the terms of the GNU General Public License as published by
 *   the Free Software Foundation, either version 3 of the License, or
 *   (at your option) any later version.

 *   This program is distributed in the hope that it will be useful,
 *   but WITHOUT ANY WARRANTY; without even the implied warranty of
 *   MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *   GNU General Public License for more details.

 *   You should have received a copy of the GNU General Public License
 *   along with this program.  If not, see <https://www.gnu.org/licenses/>.
 */

#include <cstdio>

#include "display/VideoSystem.hpp"
#include "input/KeyMap.hpp"

video_system_t::video_system_t(int scale) : scale(scale) {
    if (this->scale < 1) this->scale = 1;
}

video_system_t::~video_system_t() {
    if (screenTexture) SDL_DestroyTexture(screenTexture);
    if (renderer) SDL_DestroyRenderer(renderer);
    if (window) {
        SDL_DestroyWindow(window);
        SDL_QuitSubSystem(SDL_INIT_VIDEO);
    }
}

bool video_system_t::init(const char *title) {
    if (!SDL_InitSubSystem(SDL_INIT_VIDEO)) {
        fprintf(stderr, "Error initializing SDL video: %s\n", SDL_GetError());
        return false;
    }

    if (!SDL_CreateWindowAndRenderer(title, FRAME_WIDTH * scale, FRAME_HEIGHT * scale, 0, &window, &renderer)) {
        fprintf(stderr, "Error creating window and renderer: %s\n", SDL_GetError());
        SDL_QuitSubSystem(SDL_INIT_VIDEO);
        return false;
    }

    // emulation always draws 160x144; SDL scales the result up to the window.
    if (!SDL_SetRenderLogicalPresentation(renderer, FRAME_WIDTH, FRAME_HEIGHT, SDL_LOGICAL_PRESENTATION_INTEGER_SCALE)) {
        fprintf(stderr, "Error setting logical presentation: %s\n", SDL_GetError());
    }

    screenTexture = SDL_CreateTexture(renderer, PIXEL_FORMAT, SDL_TEXTUREACCESS_STREAMING, FRAME_WIDTH, FRAME_HEIGHT);
    if (!screenTexture) {
        fprintf(stderr, "Error creating screen texture: %s\n", SDL_GetError());
        return false;
    }
    SDL_SetTextureBlendMode(screenTexture, SDL_BLENDMODE_NONE);
    // NEAREST gets us sharp pixels.
    SDL_SetTextureScaleMode(screenTexture, SDL_SCALEMODE_NEAREST);

    key_state = SDL_GetKeyboardState(NULL);
    return true;
}

void video_system_t::present_frame(const LcdFrame &frame) {
    if (!SDL_UpdateTexture(screenTexture, NULL, frame.data(), LcdFrame::pitch())) {
        if (present_errors++ == 0) {
            fprintf(stderr, "Failed to update texture: %s\n", SDL_GetError());
        }
        return;
    }
    SDL_RenderClear(renderer);
    SDL_RenderTexture(renderer, screenTexture, NULL, NULL);
    SDL_RenderPresent(renderer);
}

// Loops until there are no events in queue waiting to be read.
void video_system_t::poll() {
    SDL_Event event;
    while (SDL_PollEvent(&event)) {
        switch (event.type) {
            case SDL_EVENT_QUIT:
            case SDL_EVENT_WINDOW_CLOSE_REQUESTED:
                quit_requested = true;
                break;
            default:
                break;
        }
    }
    if (key_state && key_state[quit_scancode]) {
        quit_requested = true;
    }
}

bool video_system_t::button_down(button_t button) {
    if (!key_state || button >= NUM_BUTTONS) return false;
    return key_state[default_key_map[button].scancode];
}
