#include <gtest/gtest.h>

#include <vector>

#include "audio/AudioSink.hpp"

TEST(AudioSink, DefaultBoundIs300msAt48k) {
    AudioSink sink;
    EXPECT_EQ(sink.get_sample_rate(), 48000);
    EXPECT_EQ(sink.max_queue_pairs(), 14400u);
}

TEST(AudioSink, BurstWithoutDrainStopsAtBound) {
    AudioSink sink(48000, 300);
    for (int i = 0; i < 20000; i++) {
        sink.push_samples(0.1f, -0.1f);
    }
    EXPECT_EQ(sink.queued_pairs(), 14400u);
    EXPECT_EQ(sink.dropped_pairs(), 5600u);

    // still full; more pushes are no-ops
    sink.push_samples(1.0f, 1.0f);
    EXPECT_EQ(sink.queued_pairs(), 14400u);
}

TEST(AudioSink, FillDrainsInOrderThenSilence) {
    AudioSink sink(48000, 300);
    for (int i = 0; i < 3; i++) {
        sink.push_samples((float)i, (float)(i + 10));
    }
    std::vector<float> out(8, 7.0f);
    EXPECT_EQ(sink.fill(out.data(), out.size()), 6u);
    EXPECT_EQ(out, (std::vector<float>{ 0, 10, 1, 11, 2, 12, 0, 0 }));
    EXPECT_EQ(sink.queued_pairs(), 0u);
}

TEST(AudioSink, FillLeavesRemainderQueued) {
    AudioSink sink(48000, 300);
    for (int i = 0; i < 100; i++) {
        sink.push_samples((float)i, (float)i);
    }
    std::vector<float> out(40);
    EXPECT_EQ(sink.fill(out.data(), out.size()), 40u);
    EXPECT_EQ(sink.queued_pairs(), 80u);
    EXPECT_EQ(out.front(), 0.0f);
    EXPECT_EQ(out.back(), 19.0f);
}

TEST(AudioSink, DrainMakesRoomForMore) {
    AudioSink sink(1000, 10);  // 10 pairs
    for (int i = 0; i < 15; i++) sink.push_samples(1, 1);
    EXPECT_EQ(sink.queued_pairs(), 10u);

    std::vector<float> out(8);
    sink.fill(out.data(), out.size());
    EXPECT_EQ(sink.queued_pairs(), 6u);

    for (int i = 0; i < 15; i++) sink.push_samples(2, 2);
    EXPECT_EQ(sink.queued_pairs(), 10u);
}

TEST(AudioSink, ClearEmptiesQueue) {
    AudioSink sink;
    sink.push_samples(1, 1);
    sink.clear();
    EXPECT_EQ(sink.queued_pairs(), 0u);
}
