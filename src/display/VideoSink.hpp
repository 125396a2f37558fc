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

#include "core/Core.hpp"
#include "display/FrameBuffer.hpp"
#include "display/PresentationTarget.hpp"

/**
 * VideoSink
 *
 * The core's pixel sink. Single buffered: the core writes into frame, and
 * present() hands it to the target on the same thread before the next
 * frame's writes can start, so there is nothing to tear.
 *
 * Writes outside the LCD are dropped and counted rather than trusted.
 */
class VideoSink : public PixelSink {
private:
    LcdFrame frame;
    PresentationTarget *target;

    uint64_t frames_presented = 0;
    uint64_t out_of_bounds_writes = 0;

public:
    VideoSink(PresentationTarget *target);

    void write_pixel(uint32_t color, uint32_t x, uint32_t y) override;
    void present() override;

    const LcdFrame &get_frame() const { return frame; }
    uint64_t get_frames_presented() const { return frames_presented; }
    uint64_t get_out_of_bounds_writes() const { return out_of_bounds_writes; }
};
