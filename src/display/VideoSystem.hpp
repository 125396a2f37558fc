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

#pragma once

#include <cstdint>

#include <SDL3/SDL.h>

#include "display/PresentationTarget.hpp"
#include "input/InputSource.hpp"

#define PIXEL_FORMAT SDL_PIXELFORMAT_XRGB8888
#define DEFAULT_SCALE 4

/**
 * The one SDL window. It is both where frames go and where keys come from;
 * the frame pacer only ever sees it through PresentationTarget and
 * InputSource.
 */
struct video_system_t : public PresentationTarget, public InputSource {
    SDL_Window *window = nullptr;
    SDL_Renderer *renderer = nullptr;
    SDL_Texture *screenTexture = nullptr;

    int scale = DEFAULT_SCALE;
    bool quit_requested = false;
    const bool *key_state = nullptr;
    uint64_t present_errors = 0;

    video_system_t(int scale = DEFAULT_SCALE);
    ~video_system_t();

    bool init(const char *title);

    void present_frame(const LcdFrame &frame) override;

    void poll() override;
    bool button_down(button_t button) override;
    bool close_requested() override { return quit_requested; }
};
