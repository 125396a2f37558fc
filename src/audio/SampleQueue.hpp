#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include <SDL3/SDL.h>

/**
 * SampleQueue
 *
 * Bounded FIFO of interleaved stereo float samples, shared between exactly one
 * producer (the emulation thread) and one consumer (the audio device thread).
 *
 * push() and drain() are the only ways in or out. Both take the one mutex for
 * the copy and nothing else. When the queue is full the incoming pair is
 * thrown away; what's already queued is never touched, so ordering holds and
 * the producer never waits on the consumer.
 */
class SampleQueue {
private:
    std::vector<float> ring;     // capacity_pairs * 2 floats, L,R,L,R...
    size_t capacity_pairs;
    size_t head = 0;             // next pair to drain
    size_t count = 0;            // pairs queued
    uint64_t dropped_pairs = 0;
    SDL_Mutex *lock;

public:
    SampleQueue(size_t max_pairs);
    ~SampleQueue();

    SampleQueue(const SampleQueue &) = delete;
    SampleQueue &operator=(const SampleQueue &) = delete;

    /* producer side. false if the pair was dropped. */
    bool push(float left, float right);

    /* consumer side. Fills all of out[0..num_floats): queued pairs first, in
       order, then silence (0.0f). Returns how many floats came from the queue. */
    size_t drain(float *out, size_t num_floats);

    void clear();

    size_t size() const;         // pairs currently queued
    size_t capacity() const { return capacity_pairs; }
    uint64_t get_dropped() const;

    static size_t pairs_for_duration(int sample_rate, uint32_t ms) {
        return ((size_t)sample_rate * ms) / 1000;
    }
};
