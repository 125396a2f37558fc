#pragma once

#include <cstdint>
#include <cstdio>
#include <string>

#include "core/Core.hpp"

/*
 * SerialConsole
 *
 * Whatever the emulated machine shifts out of its serial port lands here and
 * gets appended to a log file, unframed. Test ROMs report their results this
 * way. Output is diagnostic only, so a failed write is logged and otherwise
 * ignored.
 */
class SerialConsole : public ByteSink {
    private:
        std::string path;
        FILE *file = nullptr;
        uint64_t bytes_written = 0;
        uint64_t write_errors = 0;

    public:
        SerialConsole(const std::string &path) : path(path) {}
        ~SerialConsole() { close(); }

        SerialConsole(const SerialConsole &) = delete;
        SerialConsole &operator=(const SerialConsole &) = delete;

        bool open();
        void flush();
        void close();

        void put_byte(uint8_t b) override;

        bool is_open() const { return file != nullptr; }
        uint64_t get_bytes_written() const { return bytes_written; }
        uint64_t get_write_errors() const { return write_errors; }
};
