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
#include <stdexcept>
#include <string>

/**
 * Emulation core boundary.
 *
 * The core (CPU / PPU / APU simulation) lives outside this program. It is
 * handed the sink capabilities below at construction and calls them
 * synchronously from inside step(). The frontend drives it through
 * EmulationCore and never looks inside.
 */

constexpr uint32_t FRAME_WIDTH = 160;
constexpr uint32_t FRAME_HEIGHT = 144;

typedef enum {
    BUTTON_A = 0,
    BUTTON_B,
    BUTTON_START,
    BUTTON_SELECT,
    BUTTON_UP,
    BUTTON_DOWN,
    BUTTON_LEFT,
    BUTTON_RIGHT,
    NUM_BUTTONS
} button_t;

const char *button_name(button_t button);

/* A fault inside the emulated machine (illegal opcode, corrupted state).
   The frontend can't continue stepping after one of these. */
class CoreFault : public std::runtime_error {
public:
    explicit CoreFault(const std::string &what) : std::runtime_error(what) {}
};

class PixelSink {
public:
    virtual ~PixelSink() = default;

    // color is packed 0x00RRGGBB. x < FRAME_WIDTH, y < FRAME_HEIGHT from a conformant core.
    virtual void write_pixel(uint32_t color, uint32_t x, uint32_t y) = 0;
    // end of frame.
    virtual void present() = 0;
};

class ByteSink {
public:
    virtual ~ByteSink() = default;
    virtual void put_byte(uint8_t b) = 0;
};

class SampleSink {
public:
    virtual ~SampleSink() = default;
    virtual void push_samples(float left, float right) = 0;
};

class EmulationCore {
public:
    virtual ~EmulationCore() = default;

    /* Run exactly one video frame worth of emulated time. Pixel, byte and
       sample sinks are called from in here. Throws CoreFault. */
    virtual void step() = 0;

    virtual void set_button(button_t button, bool pressed) = 0;

    virtual void set_frame_rate(uint32_t fps) = 0;
    virtual uint64_t minimum_frame_interval() const = 0; // nanoseconds
};
