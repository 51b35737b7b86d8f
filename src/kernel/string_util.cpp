#include "string_util.hpp"

namespace string_util {

size_t length(const char* str) {
    size_t len = 0;
    if (str != nullptr) {
        while (str[len] != '\0') {
            ++len;
        }
    }
    return len;
}

void copy(char* dest, size_t dest_size, const char* src) {
    if (dest == nullptr || dest_size == 0) {
        return;
    }
    size_t len = length(src);
    if (len >= dest_size) {
        len = dest_size - 1;
    }
    for (size_t i = 0; i < len; ++i) {
        dest[i] = src[i];
    }
    dest[len] = '\0';
}

bool copy_exact(char* dest, size_t dest_size, const char* src, size_t count) {
    if (dest == nullptr || count >= dest_size) {
        return false;
    }
    for (size_t i = 0; i < count; ++i) {
        dest[i] = src[i];
    }
    dest[count] = '\0';
    return true;
}

bool equals(const char* a, const char* b) {
    if (a == nullptr || b == nullptr) {
        return false;
    }
    size_t len = length(b);
    return equals_n(a, b, len);
}

bool equals_n(const char* str, const char* bytes, size_t count) {
    if (str == nullptr || bytes == nullptr) {
        return false;
    }
    for (size_t i = 0; i < count; ++i) {
        if (str[i] != bytes[i] || str[i] == '\0') {
            return false;
        }
    }
    return str[count] == '\0';
}

}  // namespace string_util
