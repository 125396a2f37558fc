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

#include "FramePacer.hpp"
#include "audio/AudioSink.hpp"
#include "util/printf_helper.hpp"

FramePacer::FramePacer(EmulationCore *core, InputSampler *input, PacingClock *clock)
    : core(core), input(input), clock(clock) {
}

bool FramePacer::run_frame() {
    if (terminated) return false;

    uint64_t frame_start = clock->now_ns();

    /* Emulate one frame */
    MEASURE(*clock, step_times, core->step());

    /* Sample Input */
    bool close = false;
    MEASURE(*clock, input_times, close = input->sample(core));

    frame_count++;
    if (frame_limit && frame_count >= frame_limit) {
        close = true;
    }

    uint64_t elapsed = clock->now_ns() - frame_start;
    frame_times.record(elapsed);

    if (close) {
        // frame is complete; no point sleeping on the way out.
        terminated = true;
        return false;
    }

    // sleep out the rest of this frame.
    uint64_t min_frame_time = core->minimum_frame_interval();
    if (elapsed < min_frame_time) {
        last_sleep_ns = min_frame_time - elapsed;
        clock->sleep_ns(last_sleep_ns);
    } else {
        last_sleep_ns = 0;
        if (elapsed > min_frame_time) {
            clock_slip++;
        }
    }

    frame_status_update();
    return true;
}

uint64_t FramePacer::run() {
    while (run_frame()) {
    }
    return frame_count;
}

void FramePacer::frame_status_update() {
    if (status_interval_ns == 0) return;

    uint64_t now = clock->now_ns();
    if (last_status_time == 0) {
        last_status_time = now;
        last_status_frames = frame_count;
        return;
    }
    uint64_t delta = now - last_status_time;
    if (delta < status_interval_ns) return;

    double fps = ((double)(frame_count - last_status_frames) * NS_PER_SECOND) / delta;
    fprintf(stdout, "frames: %llu fps: %8.3f [ slips: %llu ]\n",
        u64_t(frame_count), fps, u64_t(clock_slip));
    fprintf(stdout, "step_time: avg %10llu max %10llu, input_time: avg %10llu, frame_time: avg %10llu\n",
        u64_t(step_times.getAverage()), u64_t(step_times.getMax()), u64_t(input_times.getAverage()), u64_t(frame_times.getAverage()));
    if (audio) {
        fprintf(stdout, "audio: queued %zu / %zu pairs, dropped %llu\n",
            audio->queued_pairs(), audio->max_queue_pairs(), u64_t(audio->dropped_pairs()));
    }

    last_status_time = now;
    last_status_frames = frame_count;
}
