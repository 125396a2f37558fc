#include <SDL3/SDL.h>

#include "core/Rom.hpp"

bool load_rom_file(const std::string &path, std::vector<uint8_t> &data, std::string &error) {
    size_t size = 0;
    void *buf = SDL_LoadFile(path.c_str(), &size);
    if (!buf) {
        error = "Couldn't read ROM " + path + ": " + SDL_GetError();
        return false;
    }
    if (size == 0) {
        SDL_free(buf);
        error = "ROM " + path + " is empty";
        return false;
    }
    const uint8_t *bytes = (const uint8_t *)buf;
    data.assign(bytes, bytes + size);
    SDL_free(buf);
    return true;
}

std::string rom_display_name(const std::string &path) {
    size_t slash = path.find_last_of("/\\");
    std::string name = (slash == std::string::npos) ? path : path.substr(slash + 1);
    size_t dot = name.find_last_of('.');
    if (dot != std::string::npos && dot > 0) {
        name = name.substr(0, dot);
    }
    return name;
}
