#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <string>
#include <vector>

#include "core/Rom.hpp"

TEST(Rom, LoadsWholeFile) {
    std::string path = testing::TempDir() + "gbsync_test.gb";
    {
        std::ofstream out(path, std::ios::binary);
        for (int i = 0; i < 1024; i++) out.put((char)(i & 0xFF));
    }
    std::vector<uint8_t> data;
    std::string error;
    ASSERT_TRUE(load_rom_file(path, data, error)) << error;
    ASSERT_EQ(data.size(), 1024u);
    EXPECT_EQ(data[0], 0x00);
    EXPECT_EQ(data[0x1FF], 0xFF);
    std::remove(path.c_str());
}

TEST(Rom, MissingFileIsAnError) {
    std::vector<uint8_t> data;
    std::string error;
    EXPECT_FALSE(load_rom_file("/nonexistent-dir/missing.gb", data, error));
    EXPECT_NE(error.find("missing.gb"), std::string::npos);
}

TEST(Rom, EmptyFileIsAnError) {
    std::string path = testing::TempDir() + "gbsync_empty.gb";
    { std::ofstream out(path, std::ios::binary); }
    std::vector<uint8_t> data;
    std::string error;
    EXPECT_FALSE(load_rom_file(path, data, error));
    EXPECT_NE(error.find("empty"), std::string::npos);
    std::remove(path.c_str());
}

TEST(Rom, DisplayName) {
    EXPECT_EQ(rom_display_name("roms/tetris.gb"), "tetris");
    EXPECT_EQ(rom_display_name("tetris"), "tetris");
    EXPECT_EQ(rom_display_name("/a/b.c/rom"), "rom");
    EXPECT_EQ(rom_display_name(".hidden"), ".hidden");
}
