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

#include "clock.hpp"
#include "core/Core.hpp"
#include "input/InputSampler.hpp"
#include "util/Metrics.hpp"

class AudioSink;

/**
 * FramePacer
 *
 * The main loop. Each iteration is one frame:
 *   - one core step (which writes pixels, serial bytes and samples),
 *   - one input sample, forwarded to the core,
 *   - sleep out whatever is left of the core's minimum frame interval.
 *
 * Exactly one step per iteration. If a frame runs long there is no sleep and
 * no catch-up either; the slip is counted and the next frame starts right
 * away. Ends when the input source asks to close (or the frame limit hits),
 * after the current frame has finished.
 */
class FramePacer {
    private:
        EmulationCore *core;
        InputSampler *input;
        PacingClock *clock;
        AudioSink *audio = nullptr;    // only for the status line

        uint64_t frame_limit = 0;      // 0 = run until closed
        uint64_t frame_count = 0;
        uint64_t clock_slip = 0;
        uint64_t last_sleep_ns = 0;
        bool terminated = false;

        // status line
        uint64_t status_interval_ns = 5 * NS_PER_SECOND;
        uint64_t last_status_time = 0;
        uint64_t last_status_frames = 0;

        void frame_status_update();

    public:
        Metrics step_times, input_times, frame_times;

        FramePacer(EmulationCore *core, InputSampler *input, PacingClock *clock);

        void set_frame_limit(uint64_t frames) { frame_limit = frames; }
        void set_audio_sink(AudioSink *sink) { audio = sink; }
        void set_status_interval(uint64_t ns) { status_interval_ns = ns; } // 0 disables

        /* Run one frame. false once the loop should stop. CoreFault from the
           core's step() is not caught. */
        bool run_frame();

        /* Run frames until terminated. Returns the number of frames run. */
        uint64_t run();

        bool is_terminated() const { return terminated; }
        uint64_t get_frame_count() const { return frame_count; }
        uint64_t get_clock_slip() const { return clock_slip; }
        uint64_t get_last_sleep_ns() const { return last_sleep_ns; }
};
