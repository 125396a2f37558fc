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

#include <SDL3/SDL.h>

constexpr uint64_t NS_PER_SECOND = 1'000'000'000;
constexpr uint32_t DEFAULT_FRAME_RATE = 60;

/* Wall clock as seen by the frame pacer. */
class PacingClock {
public:
    virtual ~PacingClock() = default;
    virtual uint64_t now_ns() = 0;
    virtual void sleep_ns(uint64_t ns) = 0;
};

/* SDL_DelayNS blocks the thread. Don't swap in SDL_DelayPrecise here: it
   spins for the tail of the wait and starves the audio thread on small hosts. */
class SDLPacingClock : public PacingClock {
public:
    uint64_t now_ns() override { return SDL_GetTicksNS(); }
    void sleep_ns(uint64_t ns) override { SDL_DelayNS(ns); }
};
