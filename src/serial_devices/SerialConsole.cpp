#include <cerrno>
#include <cstring>

#include <SDL3/SDL.h>

#include "serial_devices/SerialConsole.hpp"
#include "util/printf_helper.hpp"

bool SerialConsole::open() {
    if (file) return true;

    // never truncate; the log spans runs.
    file = fopen(path.c_str(), "ab");
    if (file == NULL) {
        SDL_Log("SerialConsole: failed to open %s: %s", path.c_str(), strerror(errno));
        return false;
    }
    setvbuf(file, NULL, _IOFBF, 4096);
    printf("SerialConsole: logging to %s\n", path.c_str());
    return true;
}

void SerialConsole::put_byte(uint8_t b) {
    if (!file) {
        write_errors++;
        return;
    }
    if (fputc(b, file) == EOF) {
        if (write_errors == 0) {
            SDL_Log("SerialConsole: write to %s failed: %s", path.c_str(), strerror(errno));
        }
        write_errors++;
        clearerr(file);
        return;
    }
    bytes_written++;
}

void SerialConsole::flush() {
    if (file && fflush(file) != 0) {
        SDL_Log("SerialConsole: flush of %s failed: %s", path.c_str(), strerror(errno));
        write_errors++;
        clearerr(file);
    }
}

void SerialConsole::close() {
    if (file != NULL) {
        flush();
        if (fclose(file) != 0) {
            SDL_Log("SerialConsole: close of %s failed: %s", path.c_str(), strerror(errno));
        }
        file = NULL;
        if (write_errors) {
            SDL_Log("SerialConsole: %llu bytes written, %llu write errors", u64_t(bytes_written), u64_t(write_errors));
        }
    }
}
