#pragma once

#include <stddef.h>

namespace string_util {

size_t length(const char* str);

// Truncates to fit; `dest` is always terminated when `dest_size` > 0.
void copy(char* dest, size_t dest_size, const char* src);

// Copies exactly `count` bytes plus a terminator. False, leaving `dest`
// untouched, when that does not fit.
bool copy_exact(char* dest, size_t dest_size, const char* src, size_t count);

bool equals(const char* a, const char* b);

// True when `str` is exactly the `count` bytes at `bytes`.
bool equals_n(const char* str, const char* bytes, size_t count);

}  // namespace string_util
