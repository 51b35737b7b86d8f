#include "mem.hpp"

// Byte loops only: -ffreestanding keeps the compiler from turning these back
// into calls to themselves.

extern "C" void *memcpy(void *dest, const void *src, size_t n) noexcept {
    auto *out = static_cast<uint8_t *>(dest);
    const auto *in = static_cast<const uint8_t *>(src);
    while (n-- != 0) {
        *out++ = *in++;
    }
    return dest;
}

extern "C" void *memmove(void *dest, const void *src, size_t n) noexcept {
    auto *out = static_cast<uint8_t *>(dest);
    const auto *in = static_cast<const uint8_t *>(src);
    if (out == in || n == 0) {
        return dest;
    }
    if (out < in || out >= in + n) {
        return memcpy(dest, src, n);
    }
    // Overlap with the destination above the source: copy from the end.
    while (n != 0) {
        --n;
        out[n] = in[n];
    }
    return dest;
}

extern "C" void *memset(void *s, int c, size_t n) noexcept {
    auto *out = static_cast<uint8_t *>(s);
    const auto value = static_cast<uint8_t>(c);
    while (n-- != 0) {
        *out++ = value;
    }
    return s;
}

extern "C" int memcmp(const void *s1, const void *s2, size_t n) noexcept {
    const auto *a = static_cast<const uint8_t *>(s1);
    const auto *b = static_cast<const uint8_t *>(s2);
    for (; n != 0; --n, ++a, ++b) {
        if (*a != *b) {
            return *a < *b ? -1 : 1;
        }
    }
    return 0;
}
