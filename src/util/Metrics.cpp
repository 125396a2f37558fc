#include "Metrics.hpp"

// all three only look at the slots that have actually been recorded.

uint64_t Metrics::getMin() {
    if (filled == 0) return 0;
    uint64_t min = samples[0];
    for (int i = 1; i < filled; i++) {
        if (samples[i] < min) {
            min = samples[i];
        }
    }
    return min;
}

uint64_t Metrics::getMax() {
    uint64_t max = 0;
    for (int i = 0; i < filled; i++) {
        if (samples[i] > max) {
            max = samples[i];
        }
    }
    return max;
}

uint64_t Metrics::getAverage() {
    if (filled == 0) return 0;
    uint64_t sum = 0;
    for (int i = 0; i < filled; i++) {
        sum += samples[i];
    }
    return sum / filled;
}
