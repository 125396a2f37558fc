#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "gbsync.hpp"

namespace {

bool parse(std::vector<std::string> args, gbsync_app_t &app) {
    std::vector<char *> argv;
    args.insert(args.begin(), "gbsync");
    for (auto &a : args) argv.push_back(&a[0]);
    argv.push_back(nullptr);
    return parse_command_line((int)args.size(), argv.data(), app);
}

} // namespace

TEST(Options, RomOnlyUsesDefaults) {
    gbsync_app_t app;
    ASSERT_TRUE(parse({ "tetris.gb" }, app));
    EXPECT_EQ(app.rom_path, "tetris.gb");
    EXPECT_EQ(app.serial_log_path, DEFAULT_SERIAL_LOG);
    EXPECT_EQ(app.frame_rate, 60u);
    EXPECT_EQ(app.scale, 4);
    EXPECT_EQ(app.audio_queue_ms, 300u);
    EXPECT_FALSE(app.mute);
    EXPECT_EQ(app.frame_limit, 0u);
}

TEST(Options, AllFlags) {
    gbsync_app_t app;
    ASSERT_TRUE(parse({ "-l", "/tmp/s.log", "-r", "50", "-z", "2", "-q", "150", "-v", "8", "-m", "-f", "600", "cpu_instrs.gb" }, app));
    EXPECT_EQ(app.serial_log_path, "/tmp/s.log");
    EXPECT_EQ(app.frame_rate, 50u);
    EXPECT_EQ(app.scale, 2);
    EXPECT_EQ(app.audio_queue_ms, 150u);
    EXPECT_EQ(app.volume, 8);
    EXPECT_TRUE(app.mute);
    EXPECT_EQ(app.frame_limit, 600u);
    EXPECT_EQ(app.rom_path, "cpu_instrs.gb");
}

TEST(Options, MissingRomFails) {
    gbsync_app_t app;
    EXPECT_FALSE(parse({}, app));
    EXPECT_FALSE(parse({ "-m" }, app));
}

TEST(Options, ExtraPositionalFails) {
    gbsync_app_t app;
    EXPECT_FALSE(parse({ "a.gb", "b.gb" }, app));
}

TEST(Options, BadNumbersFail) {
    gbsync_app_t app;
    EXPECT_FALSE(parse({ "-r", "fast", "a.gb" }, app));
    EXPECT_FALSE(parse({ "-z", "0", "a.gb" }, app));
    EXPECT_FALSE(parse({ "-q", "0", "a.gb" }, app));
    EXPECT_FALSE(parse({ "-v", "16", "a.gb" }, app));
}
