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

#include "display/VideoSink.hpp"

VideoSink::VideoSink(PresentationTarget *target) : target(target) {
    frame.clear(0xFFFFFFFF); // LCD starts out white
}

void VideoSink::write_pixel(uint32_t color, uint32_t x, uint32_t y) {
    if (x >= FRAME_WIDTH || y >= FRAME_HEIGHT) {
        if (out_of_bounds_writes == 0) {
            printf("VideoSink: pixel write out of bounds: [%u,%u]\n", x, y);
        }
        out_of_bounds_writes++;
        return;
    }
    frame.set(x, y, color);
}

void VideoSink::present() {
    if (target) {
        target->present_frame(frame);
    }
    frames_presented++;
}
