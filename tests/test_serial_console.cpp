#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <iterator>
#include <string>
#include <csignal>
#include <sys/resource.h>
#include <unistd.h>

#include "serial_devices/SerialConsole.hpp"

namespace {

std::string temp_log(const char *name) {
    std::string path = testing::TempDir() + name;
    std::remove(path.c_str());
    return path;
}

std::string read_all(const std::string &path) {
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

} // namespace

TEST(SerialConsole, WritesRawBytesInOrder) {
    std::string path = temp_log("gbsync_serial_raw.log");
    {
        SerialConsole serial(path);
        ASSERT_TRUE(serial.open());
        const uint8_t bytes[] = { 'P', 'a', 's', 's', 'e', 'd', '\n', 0x00, 0xFF };
        for (uint8_t b : bytes) serial.put_byte(b);
        EXPECT_EQ(serial.get_bytes_written(), sizeof(bytes));
    }
    EXPECT_EQ(read_all(path), std::string("Passed\n\0\xFF", 9));
}

TEST(SerialConsole, AppendsAcrossOpens) {
    std::string path = temp_log("gbsync_serial_append.log");
    {
        SerialConsole serial(path);
        ASSERT_TRUE(serial.open());
        serial.put_byte('a');
    }
    {
        SerialConsole serial(path);
        ASSERT_TRUE(serial.open());
        serial.put_byte('b');
    }
    EXPECT_EQ(read_all(path), "ab");
}

TEST(SerialConsole, CloseFlushesToDisk) {
    std::string path = temp_log("gbsync_serial_close.log");
    SerialConsole serial(path);
    ASSERT_TRUE(serial.open());
    serial.put_byte('x');
    serial.close();
    EXPECT_FALSE(serial.is_open());
    EXPECT_EQ(read_all(path), "x");

    // second close is harmless
    serial.close();
}

TEST(SerialConsole, FlushMakesBytesVisibleWhileOpen) {
    std::string path = temp_log("gbsync_serial_flush.log");
    SerialConsole serial(path);
    ASSERT_TRUE(serial.open());
    serial.put_byte('1');
    serial.put_byte('2');
    serial.flush();
    EXPECT_EQ(read_all(path), "12");
}

TEST(SerialConsole, OpenFailsForBadPath) {
    SerialConsole serial("/nonexistent-dir/gbsync/serial.log");
    EXPECT_FALSE(serial.open());
    EXPECT_FALSE(serial.is_open());
}

TEST(SerialConsole, WritesWithoutFileAreCountedNotFatal) {
    SerialConsole serial("/nonexistent-dir/gbsync/serial.log");
    serial.put_byte('a');
    serial.put_byte('b');
    EXPECT_EQ(serial.get_bytes_written(), 0u);
    EXPECT_EQ(serial.get_write_errors(), 2u);
}

TEST(SerialConsole, DiskFullIsReportedNotPropagated) {
    if (access("/dev/full", W_OK) != 0) {
        GTEST_SKIP() << "/dev/full not available";
    }
    SerialConsole serial("/dev/full");
    ASSERT_TRUE(serial.open());
    for (int i = 0; i < 10000; i++) {
        serial.put_byte('z');
    }
    serial.close();
    EXPECT_GT(serial.get_write_errors(), 0u);
}

TEST(SerialConsole, FileSizeLimitIsReportedNotPropagated) {
    std::string path = temp_log("gbsync_serial_fsize.log");

    // with SIGXFSZ ignored, writes past RLIMIT_FSIZE fail with EFBIG.
    struct rlimit saved;
    ASSERT_EQ(getrlimit(RLIMIT_FSIZE, &saved), 0);
    void (*saved_handler)(int) = signal(SIGXFSZ, SIG_IGN);
    struct rlimit limited = saved;
    limited.rlim_cur = 16;
    ASSERT_EQ(setrlimit(RLIMIT_FSIZE, &limited), 0);

    SerialConsole serial(path);
    bool opened = serial.open();
    for (int i = 0; opened && i < 10000; i++) {
        serial.put_byte('z');
    }
    serial.close();

    setrlimit(RLIMIT_FSIZE, &saved);
    signal(SIGXFSZ, saved_handler);

    ASSERT_TRUE(opened);
    EXPECT_GT(serial.get_write_errors(), 0u);
    EXPECT_LT(serial.get_bytes_written(), 10000u);
    EXPECT_FALSE(serial.is_open());
}
