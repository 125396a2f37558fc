#include <algorithm>
#include <cstring>
#include <stdexcept>
#include <string>

#include "audio/SampleQueue.hpp"

SampleQueue::SampleQueue(size_t max_pairs) : ring(max_pairs * 2, 0.0f), capacity_pairs(max_pairs) {
    lock = SDL_CreateMutex();
    if (!lock) {
        throw std::runtime_error(std::string("SampleQueue: couldn't create mutex: ") + SDL_GetError());
    }
}

SampleQueue::~SampleQueue() {
    SDL_DestroyMutex(lock);
}

bool SampleQueue::push(float left, float right) {
    SDL_LockMutex(lock);
    if (count >= capacity_pairs) {
        dropped_pairs++;
        SDL_UnlockMutex(lock);
        return false;
    }
    size_t tail = (head + count) % capacity_pairs;
    ring[tail * 2] = left;
    ring[tail * 2 + 1] = right;
    count++;
    SDL_UnlockMutex(lock);
    return true;
}

size_t SampleQueue::drain(float *out, size_t num_floats) {
    size_t pairs_wanted = num_floats / 2;
    size_t pairs_copied = 0;

    SDL_LockMutex(lock);
    size_t n = std::min(pairs_wanted, count);
    if (n > 0) {
        // at most two runs: head to end of ring, then wrap to the start.
        size_t first = std::min(n, capacity_pairs - head);
        memcpy(out, &ring[head * 2], first * 2 * sizeof(float));
        if (n > first) {
            memcpy(out + first * 2, &ring[0], (n - first) * 2 * sizeof(float));
        }
        head = (head + n) % capacity_pairs;
        count -= n;
        pairs_copied = n;
    }
    SDL_UnlockMutex(lock);

    size_t copied = pairs_copied * 2;
    if (copied < num_floats) {
        std::fill(out + copied, out + num_floats, 0.0f);
    }
    return copied;
}

void SampleQueue::clear() {
    SDL_LockMutex(lock);
    head = 0;
    count = 0;
    SDL_UnlockMutex(lock);
}

size_t SampleQueue::size() const {
    SDL_LockMutex(lock);
    size_t n = count;
    SDL_UnlockMutex(lock);
    return n;
}

uint64_t SampleQueue::get_dropped() const {
    SDL_LockMutex(lock);
    uint64_t n = dropped_pairs;
    SDL_UnlockMutex(lock);
    return n;
}
