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
#include <vector>

#include "core/Core.hpp"
#include "clock.hpp"

/**
 * PatternCore
 *
 * Stand-in emulation core. It doesn't run the ROM; it exercises every sink
 * the way a real core would, so the frontend can be run and timed without one:
 *   - a full 160x144 scan-out per step, a scrolling 4-shade pattern seeded
 *     from the ROM contents, shifted by the D-pad,
 *   - a stereo square wave while A or B is held (silence otherwise), at the
 *     sink's sample rate with fractional samples carried between frames,
 *   - a banner and one line per button press on the serial port.
 */
class PatternCore : public EmulationCore {
    private:
        std::vector<uint8_t> rom;
        PixelSink *lcd;
        ByteSink *serial;
        SampleSink *speaker;       // may be null: no audio

        uint32_t frame_rate = DEFAULT_FRAME_RATE;
        uint64_t frame_interval_ns = NS_PER_SECOND / DEFAULT_FRAME_RATE;

        int sample_rate;
        double samples_per_frame = 0.0;
        double samples_accumulated = 0.0;
        uint64_t sample_index = 0;

        bool buttons[NUM_BUTTONS] = { false };
        bool last_buttons[NUM_BUTTONS] = { false };

        uint64_t frame_count = 0;
        int32_t scroll_x = 0;
        int32_t scroll_y = 0;
        uint16_t rom_checksum = 0;

        void render_frame();
        void generate_audio();
        void report_serial();
        void serial_puts(const char *s);
        void recalc_samples_per_frame();

    public:
        PatternCore(std::vector<uint8_t> rom, PixelSink *lcd, ByteSink *serial, SampleSink *speaker = nullptr, int sample_rate = 48000);

        void step() override;
        void set_button(button_t button, bool pressed) override;
        void set_frame_rate(uint32_t fps) override;
        uint64_t minimum_frame_interval() const override { return frame_interval_ns; }

        uint64_t get_frame_count() const { return frame_count; }
        uint64_t get_samples_generated() const { return sample_index; }
};
