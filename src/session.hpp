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

class FramePacer;
class AudioSystem;
class AudioSink;
class SerialConsole;

struct session_result_t {
    uint64_t frames = 0;
    std::string core_fault;     // empty unless the core faulted
};

/*
 * Runs the pacer until it terminates (close signal, frame limit or core
 * fault), then shuts down in order: the audio stream first, since its
 * thread reads the sink, then the sample queue, then the serial log.
 * audio_system and audio_sink may be null when running muted.
 * A CoreFault is caught here and handed back in the result, after the
 * shutdown has happened.
 */
session_result_t run_session(FramePacer &pacer, AudioSystem *audio_system, AudioSink *audio_sink, SerialConsole &serial);
