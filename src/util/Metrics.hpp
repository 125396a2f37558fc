#pragma once

#include <cstdint>
#include <cstring>

/* Rolling window over the last 60 recorded values (one second of frames). */
class Metrics {
    public:
        static constexpr int WINDOW = 60;

        Metrics() { clear(); };
        ~Metrics() {};

        void record(uint64_t value) {
            samples[write_pos] = value;
            write_pos = (write_pos + 1) % WINDOW;
            if (filled < WINDOW) filled++;
        };
        void clear() { memset(samples, 0, sizeof(samples)); write_pos = 0; filled = 0; };

        uint64_t getMin();
        uint64_t getMax();
        uint64_t getAverage();
        int getCount() { return filled; }

    private:
        uint64_t samples[WINDOW];
        int write_pos = 0;
        int filled = 0;
};

#define MEASURE(clock, metric, measurablecode) { uint64_t start_time = (clock).now_ns(); measurablecode; uint64_t end_time = (clock).now_ns(); (metric).record(end_time - start_time); }
