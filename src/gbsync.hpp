/*
 *   Copyright (c) 2025 Jawaid Bazyar

 *   This program is free software: you can redistribute it and/or modify
 *   it under the terms of the GNU General Public License as published by
 *   the Free Software Foundation, either version 3 of the License, or
 *   (at your option) any later version.

 *   This program is distributed in the hope that it will be useful,
 *   but WITHOUT ANY WARRANTY; without even the implied warranty of
 *   MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *   GNU General Public License for more details.

 *   You should have received a copy of the GNU General Public License
 *   along with this program.  If not, see <https://www.gnu.org/licenses/>.
 */

#pragma once

#include <cstdint>
#include <string>

#include "audio/AudioSink.hpp"
#include "clock.hpp"
#include "display/VideoSystem.hpp"

#define DEFAULT_SERIAL_LOG "/tmp/gbsync_serial.log"

struct gbsync_app_t {
    std::string rom_path;
    std::string serial_log_path = DEFAULT_SERIAL_LOG;
    uint32_t frame_rate = DEFAULT_FRAME_RATE;
    int scale = DEFAULT_SCALE;
    uint32_t audio_queue_ms = AUDIO_QUEUE_MS;
    uint16_t volume = 15;
    bool mute = false;
    uint64_t frame_limit = 0;
};

extern gbsync_app_t gbsync_app_values;

/* Parses argv into app. Prints usage and returns false on a bad command line. */
bool parse_command_line(int argc, char *argv[], gbsync_app_t &app);
