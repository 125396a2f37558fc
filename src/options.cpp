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

#include <cstdlib>
#include <iostream>
#include <getopt.h>

#include "gbsync.hpp"

static void usage(const char *exe) {
    std::cerr << "Usage: " << exe << " [-l serial_log] [-r fps] [-z scale] [-q queue_ms] [-v volume] [-m] [-f frames] <rom file>\n";
    std::cerr << "  -l: serial port log file (default " DEFAULT_SERIAL_LOG ")\n";
    std::cerr << "  -r: target frame rate, 0 = free run (default 60)\n";
    std::cerr << "  -z: window scale (default 4)\n";
    std::cerr << "  -q: audio queue limit in milliseconds (default 300)\n";
    std::cerr << "  -v: volume 0-15 (default 15)\n";
    std::cerr << "  -m: mute, don't open an audio device\n";
    std::cerr << "  -f: quit after this many frames\n";
}

static bool parse_number(const char *arg, unsigned long max, unsigned long &out) {
    char *end = nullptr;
    unsigned long v = strtoul(arg, &end, 10);
    if (end == arg || *end != '\0' || v > max) {
        return false;
    }
    out = v;
    return true;
}

bool parse_command_line(int argc, char *argv[], gbsync_app_t &app) {
    int opt;
    unsigned long v;

    optind = 1; // may be called more than once (tests)
    while ((opt = getopt(argc, argv, "l:r:z:q:v:mf:h")) != -1) {
        switch (opt) {
            case 'l':
                app.serial_log_path = optarg;
                break;
            case 'r':
                if (!parse_number(optarg, 1000, v)) {
                    std::cerr << "Invalid frame rate: " << optarg << "\n";
                    usage(argv[0]);
                    return false;
                }
                app.frame_rate = (uint32_t)v;
                break;
            case 'z':
                if (!parse_number(optarg, 16, v) || v == 0) {
                    std::cerr << "Invalid scale: " << optarg << "\n";
                    usage(argv[0]);
                    return false;
                }
                app.scale = (int)v;
                break;
            case 'q':
                if (!parse_number(optarg, 10'000, v) || v == 0) {
                    std::cerr << "Invalid audio queue length: " << optarg << "\n";
                    usage(argv[0]);
                    return false;
                }
                app.audio_queue_ms = (uint32_t)v;
                break;
            case 'v':
                if (!parse_number(optarg, 15, v)) {
                    std::cerr << "Invalid volume: " << optarg << "\n";
                    usage(argv[0]);
                    return false;
                }
                app.volume = (uint16_t)v;
                break;
            case 'm':
                app.mute = true;
                break;
            case 'f':
                if (!parse_number(optarg, ~0UL, v)) {
                    std::cerr << "Invalid frame count: " << optarg << "\n";
                    usage(argv[0]);
                    return false;
                }
                app.frame_limit = v;
                break;
            case 'h':
            default:
                usage(argv[0]);
                return false;
        }
    }

    if (optind != argc - 1) {
        std::cerr << (optind >= argc ? "Missing ROM file\n" : "Too many arguments\n");
        usage(argv[0]);
        return false;
    }
    app.rom_path = argv[optind];
    return true;
}
