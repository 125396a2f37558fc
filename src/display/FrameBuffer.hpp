#pragma once

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <new>

#include "core/Core.hpp"

/**
 * Fixed-size off-screen frame, row-major. Storage is 64-byte aligned so the
 * whole thing can be handed straight to SDL_UpdateTexture.
 */
template<typename px_t, uint32_t WIDTH, uint32_t HEIGHT>
class FrameBuffer {
private:
    px_t (* __restrict stream)[WIDTH];

public:
    FrameBuffer() {
        size_t total_size = sizeof(px_t) * WIDTH * HEIGHT;
        size_t aligned_size = (total_size + 63) & ~63;
        stream = static_cast<px_t(*)[WIDTH]>(aligned_alloc(64, aligned_size));
        if (stream == nullptr) {
            fprintf(stderr, "FrameBuffer allocation failed: requested %zu bytes\n", aligned_size);
            throw std::bad_alloc();
        }
    }

    ~FrameBuffer() { free(stream); }

    FrameBuffer(const FrameBuffer &) = delete;
    FrameBuffer &operator=(const FrameBuffer &) = delete;

    inline void set(uint32_t x, uint32_t y, px_t px) noexcept { stream[y][x] = px; }
    inline px_t get(uint32_t x, uint32_t y) const noexcept { return stream[y][x]; }

    inline px_t *data() { return stream[0]; }
    inline const px_t *data() const { return stream[0]; }

    void clear(px_t clr) {
        for (size_t i = 0; i < HEIGHT; ++i) {
            for (size_t j = 0; j < WIDTH; ++j) {
                stream[i][j] = clr;
            }
        }
    }

    static constexpr uint32_t width() { return WIDTH; }
    static constexpr uint32_t height() { return HEIGHT; }
    static constexpr int pitch() { return WIDTH * sizeof(px_t); } // bytes per row
};

// packed 0x00RRGGBB, the LCD as the core sees it.
using LcdFrame = FrameBuffer<uint32_t, FRAME_WIDTH, FRAME_HEIGHT>;
