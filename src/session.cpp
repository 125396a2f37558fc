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

#include "session.hpp"
#include "FramePacer.hpp"
#include "audio/AudioSink.hpp"
#include "core/Core.hpp"
#include "serial_devices/SerialConsole.hpp"
#include "util/AudioSystem.hpp"

session_result_t run_session(FramePacer &pacer, AudioSystem *audio_system, AudioSink *audio_sink, SerialConsole &serial) {
    session_result_t result;
    try {
        pacer.run();
    } catch (const CoreFault &e) {
        result.core_fault = e.what();
    }
    result.frames = pacer.get_frame_count();

    if (audio_system) audio_system->close();
    if (audio_sink) audio_sink->clear();
    serial.close();

    return result;
}
