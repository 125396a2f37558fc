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

#include "audio/AudioSink.hpp"

AudioSink::AudioSink(int sample_rate, uint32_t queue_ms)
    : queue(SampleQueue::pairs_for_duration(sample_rate, queue_ms)), sample_rate(sample_rate) {
}

void AudioSink::push_samples(float left, float right) {
    queue.push(left, right);
}

size_t AudioSink::fill(float *out, size_t num_floats) {
    return queue.drain(out, num_floats);
}

/*
 * Called by SDL from its audio thread whenever the device wants more data.
 * additional_amount is in bytes of the stream's input format (F32 stereo).
 * The queue lock is only held inside fill(); the stream put happens after.
 */
void SDLCALL AudioSink::stream_callback(void *userdata, SDL_AudioStream *stream, int additional_amount, int total_amount) {
    AudioSink *sink = (AudioSink *)userdata;

    if (additional_amount <= 0) return;

    size_t num_floats = (size_t)additional_amount / sizeof(float);
    num_floats &= ~(size_t)1; // whole frames only
    if (num_floats == 0) return;

    if (sink->scratch.size() < num_floats) {
        sink->scratch.resize(num_floats);
    }
    sink->fill(sink->scratch.data(), num_floats);

    if (!SDL_PutAudioStreamData(stream, sink->scratch.data(), (int)(num_floats * sizeof(float)))) {
        SDL_Log("AudioSink: couldn't put stream data: %s", SDL_GetError());
    }
}
