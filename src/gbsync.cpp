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

#include <iostream>
#include <cstdio>
#include <cstdlib>
#include <memory>
#include <stdexcept>
#include <utility>
#include <string>
#include <vector>
#include <SDL3/SDL_main.h>

#include "gbsync.hpp"
#include "clock.hpp"
#include "FramePacer.hpp"
#include "audio/AudioSink.hpp"
#include "core/PatternCore.hpp"
#include "core/Rom.hpp"
#include "display/VideoSink.hpp"
#include "display/VideoSystem.hpp"
#include "input/InputSampler.hpp"
#include "serial_devices/SerialConsole.hpp"
#include "session.hpp"
#include "util/AudioSystem.hpp"
#include "util/dialog.hpp"
#include "util/printf_helper.hpp"
#include "version.h"

/**
 * gbsync
 *
 * Real-time frontend for a handheld (160x144) emulation core.
 *
 * Main thread: step the core once per frame, present its frame, sample the
 * keyboard, sleep out the rest of the frame.
 * Audio thread (SDL's): drain the sample queue into the device.
 *
 * Setup failures are fatal and reported before anything runs. Once the loop is
 * going, only a fault inside the core stops it early.
 */

gbsync_app_t gbsync_app_values;

static void fatal(const std::string &message) {
    system_failure(message.c_str());
    SDL_Quit();
    exit(1);
}

int main(int argc, char *argv[]) {
    std::cout << "Booting GBSync!" << std::endl;

    SDL_SetAppMetadata("GBSync", VERSION_STRING, "org.gbsync.frontend");

    if (!parse_command_line(argc, argv, gbsync_app_values)) {
        exit(1);
    }
    gbsync_app_t &app = gbsync_app_values;

    std::vector<uint8_t> rom;
    std::string error;
    if (!load_rom_file(app.rom_path, rom, error)) {
        fatal(error);
    }
    printf("ROM: %s (%zu bytes)\n", app.rom_path.c_str(), rom.size());

    SerialConsole serial(app.serial_log_path);
    if (!serial.open()) {
        fatal("Couldn't open serial log " + app.serial_log_path);
    }

    std::unique_ptr<video_system_t> vs(new video_system_t(app.scale));
    std::string title = "GBSync - " + rom_display_name(app.rom_path);
    if (!vs->init(title.c_str())) {
        fatal(std::string("Couldn't open a window: ") + SDL_GetError());
    }

    std::unique_ptr<AudioSink> audio_sink;
    try {
        audio_sink.reset(new AudioSink(AUDIO_SAMPLE_RATE, app.audio_queue_ms));
    } catch (const std::runtime_error &e) {
        fatal(e.what());
    }
    std::unique_ptr<AudioSystem> audio_system(new AudioSystem());
    if (!app.mute) {
        if (!audio_system->open(audio_sink.get())) {
            fatal(std::string("Couldn't open a 2 channel float audio device: ") + SDL_GetError());
        }
        audio_system->set_volume(app.volume);
        printf("Audio: %d Hz, queue limit %zu pairs (%u ms)\n", audio_sink->get_sample_rate(), audio_sink->max_queue_pairs(), app.audio_queue_ms);
    }

    VideoSink video_sink(vs.get());

    std::unique_ptr<EmulationCore> core;
    try {
        core.reset(new PatternCore(std::move(rom), &video_sink, &serial, app.mute ? nullptr : audio_sink.get(), AUDIO_SAMPLE_RATE));
    } catch (const CoreFault &e) {
        fatal(e.what());
    }
    core->set_frame_rate(app.frame_rate);

    InputSampler input(vs.get());
    SDLPacingClock clock;
    FramePacer pacer(core.get(), &input, &clock);
    pacer.set_frame_limit(app.frame_limit);
    if (!app.mute) pacer.set_audio_sink(audio_sink.get());

    // stops the audio thread and closes the log on the way out.
    session_result_t result = run_session(pacer, audio_system.get(), audio_sink.get(), serial);

    printf("Ran %llu frames, %llu clock slips, %llu audio pairs dropped, %llu serial bytes\n",
        u64_t(result.frames), u64_t(pacer.get_clock_slip()),
        u64_t(audio_sink->dropped_pairs()), u64_t(serial.get_bytes_written()));

    core.reset();
    audio_system.reset();
    audio_sink.reset();

    if (!result.core_fault.empty()) {
        fatal("Emulation core fault: " + result.core_fault);
    }

    vs.reset();
    SDL_Quit();
    return 0;
}
