#include <gtest/gtest.h>

#include "input/InputSampler.hpp"
#include "fakes.hpp"

TEST(InputSampler, ForwardsAllEightButtonsEveryFrame) {
    FakeClock clock;
    FakeCore core(&clock);
    FakeInputSource source;
    InputSampler sampler(&source);

    source.down[BUTTON_A] = true;
    source.down[BUTTON_LEFT] = true;
    EXPECT_FALSE(sampler.sample(&core));

    EXPECT_EQ(source.polls, 1u);
    EXPECT_EQ(core.set_button_calls, (uint64_t)NUM_BUTTONS);
    EXPECT_TRUE(core.buttons[BUTTON_A]);
    EXPECT_TRUE(core.buttons[BUTTON_LEFT]);
    EXPECT_FALSE(core.buttons[BUTTON_B]);
    EXPECT_FALSE(core.buttons[BUTTON_START]);
    EXPECT_TRUE(sampler.is_pressed(BUTTON_A));
}

TEST(InputSampler, LevelSampledNoHistory) {
    FakeClock clock;
    FakeCore core(&clock);
    FakeInputSource source;
    InputSampler sampler(&source);

    source.down[BUTTON_START] = true;
    sampler.sample(&core);
    EXPECT_TRUE(core.buttons[BUTTON_START]);

    source.down[BUTTON_START] = false;
    sampler.sample(&core);
    EXPECT_FALSE(core.buttons[BUTTON_START]);

    // held across frames: forwarded every time, not just on the edge
    source.down[BUTTON_UP] = true;
    sampler.sample(&core);
    sampler.sample(&core);
    EXPECT_EQ(core.set_button_calls, 4u * NUM_BUTTONS);
    EXPECT_TRUE(core.buttons[BUTTON_UP]);
    EXPECT_EQ(sampler.get_samples_taken(), 4u);
}

TEST(InputSampler, ReportsCloseRequest) {
    FakeClock clock;
    FakeCore core(&clock);
    FakeInputSource source;
    source.close_after_polls = 2;
    InputSampler sampler(&source);

    EXPECT_FALSE(sampler.sample(&core));
    EXPECT_TRUE(sampler.sample(&core));
    // buttons still forwarded on the closing frame
    EXPECT_EQ(core.set_button_calls, 2u * NUM_BUTTONS);
}

TEST(InputSampler, ButtonNames) {
    EXPECT_STREQ(button_name(BUTTON_A), "A");
    EXPECT_STREQ(button_name(BUTTON_SELECT), "Select");
    EXPECT_STREQ(button_name(BUTTON_RIGHT), "Right");
}
