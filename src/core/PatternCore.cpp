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

#include <cstdio>
#include <utility>

#include "core/PatternCore.hpp"
#include "util/printf_helper.hpp"

// DMG-ish green, lightest to darkest.
static const uint32_t lcd_palette[4] = { 0x9BBC0F, 0x8BAC0F, 0x306230, 0x0F380F };

PatternCore::PatternCore(std::vector<uint8_t> rom_data, PixelSink *lcd, ByteSink *serial, SampleSink *speaker, int sample_rate)
    : rom(std::move(rom_data)), lcd(lcd), serial(serial), speaker(speaker), sample_rate(sample_rate) {
    if (rom.empty()) {
        throw CoreFault("PatternCore: empty ROM image");
    }
    for (uint8_t b : rom) {
        rom_checksum = (uint16_t)(rom_checksum + b);
    }
    recalc_samples_per_frame();
}

void PatternCore::set_frame_rate(uint32_t fps) {
    frame_rate = fps;
    // 0 means free run: no minimum frame time at all.
    frame_interval_ns = fps ? NS_PER_SECOND / fps : 0;
    recalc_samples_per_frame();
}

void PatternCore::recalc_samples_per_frame() {
    // a free-running core still ticks its APU as if it were at 60.
    uint32_t fps = frame_rate ? frame_rate : DEFAULT_FRAME_RATE;
    samples_per_frame = (double)sample_rate / (double)fps;
}

void PatternCore::set_button(button_t button, bool pressed) {
    if (button >= NUM_BUTTONS) {
        throw CoreFault("PatternCore: invalid button");
    }
    buttons[button] = pressed;
}

void PatternCore::step() {
    if (frame_count == 0) {
        char banner[96];
        snprintf(banner, sizeof(banner), "PatternCore: %zu byte ROM, checksum %04X\n", rom.size(), rom_checksum);
        serial_puts(banner);
    }

    if (buttons[BUTTON_LEFT]) scroll_x--;
    if (buttons[BUTTON_RIGHT]) scroll_x++;
    if (buttons[BUTTON_UP]) scroll_y--;
    if (buttons[BUTTON_DOWN]) scroll_y++;

    render_frame();
    generate_audio();
    report_serial();

    frame_count++;
}

void PatternCore::render_frame() {
    uint32_t t = (uint32_t)frame_count;
    for (uint32_t y = 0; y < FRAME_HEIGHT; y++) {
        uint32_t sy = (uint32_t)(y + scroll_y + t / 2);
        for (uint32_t x = 0; x < FRAME_WIDTH; x++) {
            uint32_t sx = (uint32_t)(x + scroll_x);
            // 8x8 tiles, each tile's shade taken from a ROM byte.
            uint32_t tile = ((sy >> 3) * 32 + (sx >> 3)) % rom.size();
            uint8_t shade = (rom[tile] >> ((sx ^ sy) & 6)) & 3;
            lcd->write_pixel(lcd_palette[shade], x, y);
        }
    }
    lcd->present();
}

void PatternCore::generate_audio() {
    if (!speaker) return;

    // carry the fractional part so that e.g. 59.73 fps still averages out right.
    samples_accumulated += samples_per_frame;
    uint32_t samples_this_frame = (uint32_t)samples_accumulated;
    samples_accumulated -= samples_this_frame;

    bool tone = buttons[BUTTON_A] || buttons[BUTTON_B];
    uint64_t half_period = buttons[BUTTON_A] ? (uint64_t)sample_rate / 880 : (uint64_t)sample_rate / 440;
    if (half_period == 0) half_period = 1;

    for (uint32_t i = 0; i < samples_this_frame; i++) {
        float v = 0.0f;
        if (tone) {
            v = ((sample_index / half_period) & 1) ? 0.125f : -0.125f;
        }
        // A pans left, B pans right.
        float left = buttons[BUTTON_B] && !buttons[BUTTON_A] ? v * 0.5f : v;
        float right = buttons[BUTTON_A] && !buttons[BUTTON_B] ? v * 0.5f : v;
        speaker->push_samples(left, right);
        sample_index++;
    }
}

void PatternCore::report_serial() {
    for (int i = 0; i < NUM_BUTTONS; i++) {
        if (buttons[i] && !last_buttons[i]) {
            char line[48];
            snprintf(line, sizeof(line), "frame %llu: press %s\n", u64_t(frame_count), button_name((button_t)i));
            serial_puts(line);
        }
        last_buttons[i] = buttons[i];
    }
}

void PatternCore::serial_puts(const char *s) {
    if (!serial) return;
    while (*s) {
        serial->put_byte((uint8_t)*s++);
    }
}
