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

#include <SDL3/SDL.h>

#include "core/Core.hpp"
#include "audio/SampleQueue.hpp"

constexpr int AUDIO_SAMPLE_RATE = 48000;
constexpr int AUDIO_CHANNELS = 2;
constexpr uint32_t AUDIO_QUEUE_MS = 300;

/**
 * AudioSink
 *
 * Producer side: the core calls push_samples() for every APU output tick,
 * on the emulation thread. If the queue is at its bound the pair is dropped;
 * emulation timing matters more than a short audible gap.
 *
 * Consumer side: fill() runs on SDL's audio thread via stream_callback().
 */
class AudioSink : public SampleSink {
private:
    SampleQueue queue;
    int sample_rate;
    std::vector<float> scratch; // only touched from the audio thread

public:
    AudioSink(int sample_rate = AUDIO_SAMPLE_RATE, uint32_t queue_ms = AUDIO_QUEUE_MS);

    void push_samples(float left, float right) override;

    /* Copy up to num_floats queued samples into out, zero the rest. */
    size_t fill(float *out, size_t num_floats);

    void clear() { queue.clear(); }

    int get_sample_rate() const { return sample_rate; }
    size_t queued_pairs() const { return queue.size(); }
    size_t max_queue_pairs() const { return queue.capacity(); }
    uint64_t dropped_pairs() const { return queue.get_dropped(); }

    static void SDLCALL stream_callback(void *userdata, SDL_AudioStream *stream, int additional_amount, int total_amount);
};
