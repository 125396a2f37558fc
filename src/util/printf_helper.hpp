#pragma once

/* uint64_t is unsigned long on some platforms and unsigned long long on
   others; route every %llu argument through this so both compile clean. */

template<typename T>
inline unsigned long long u64_t(T value) {
    static_assert(sizeof(T) == 8, "u64_t wants a 64-bit value");
    return static_cast<unsigned long long>(value);
}
