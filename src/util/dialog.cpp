#include <cstdio>
#include <SDL3/SDL.h>

#include "util/dialog.hpp"

void system_failure(const char *message) {
    fprintf(stderr, "GBSync: %s\n", message);
    if (SDL_WasInit(SDL_INIT_VIDEO)) {
        if (!SDL_ShowSimpleMessageBox(SDL_MESSAGEBOX_ERROR, "GBSync", message, NULL)) {
            SDL_Log("Couldn't show message box: %s", SDL_GetError());
        }
    }
}
