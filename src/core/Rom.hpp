#pragma once

#include <cstdint>
#include <string>
#include <vector>

/* Read a ROM image fully into memory. Nothing is parsed; the core gets the
   raw bytes. false (with the reason in error) if missing, unreadable or empty. */
bool load_rom_file(const std::string &path, std::vector<uint8_t> &data, std::string &error);

/* "roms/tetris.gb" -> "tetris" */
std::string rom_display_name(const std::string &path);
