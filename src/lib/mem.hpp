#pragma once
#include <stddef.h>
#include <stdint.h>

// Freestanding images link mem.cpp; hosted builds resolve these to libc.
extern "C" void *memcpy(void *dest, const void *src, size_t n) noexcept;
extern "C" void *memmove(void *dest, const void *src, size_t n) noexcept;
extern "C" void *memset(void *s, int c, size_t n) noexcept;
extern "C" int memcmp(const void *s1, const void *s2, size_t n) noexcept;
