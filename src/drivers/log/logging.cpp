#include "logging.hpp"

#include <stdarg.h>
#include <stddef.h>
#include <stdint.h>

#include "kernel/sync/spinlock.hpp"

namespace {

constexpr size_t LOG_BUFFER_CAPACITY = 16 * 1024;
constexpr size_t LOG_LINE_MAX = 512;

char g_buffer[LOG_BUFFER_CAPACITY];
ksync::Spinlock g_output_lock;
size_t g_write_pos = 0;
size_t g_start_pos = 0;
size_t g_size = 0;
bool g_initialized = false;

LogOutputFn g_output = nullptr;
void* g_output_context = nullptr;
LogLevel g_minimum = LogLevel::Debug;

const char* level_tag(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:
            return "DEBUG";
        case LogLevel::Info:
            return "INFO";
        case LogLevel::Warn:
            return "WARN";
        case LogLevel::Error:
        default:
            return "ERROR";
    }
}

// ANSI color escape for the tag; the diagnostic sinks all understand these.
const char* level_color(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:
            return "\x1b[94m";
        case LogLevel::Info:
            return "\x1b[97m";
        case LogLevel::Warn:
            return "\x1b[93m";
        case LogLevel::Error:
        default:
            return "\x1b[91m";
    }
}

constexpr const char* kColorReset = "\x1b[0m";

void push_char(char c) {
    g_buffer[g_write_pos] = c;
    g_write_pos = (g_write_pos + 1) % LOG_BUFFER_CAPACITY;
    if (g_size < LOG_BUFFER_CAPACITY) {
        ++g_size;
    } else {
        g_start_pos = (g_start_pos + 1) % LOG_BUFFER_CAPACITY;
    }
}

void append_line_to_buffer(const char* line) {
    if (!line) return;

    size_t len = 0;
    while (line[len] != '\0' && len < LOG_LINE_MAX - 1) {
        ++len;
    }

    for (size_t i = 0; i < len; ++i) {
        push_char(line[i]);
    }
    push_char('\n');
}

void append_char(char*& out, char* end, char c) {
    if (out < end) {
        *out = c;
    }
    ++out;
}

void append_string(char*& out, char* end, const char* str) {
    if (!str) {
        str = "(null)";
    }
    while (*str) {
        append_char(out, end, *str++);
    }
}

void append_unsigned(char*& out, char* end, uint64_t value, int width,
                     char pad_char) {
    char buffer[21];
    int pos = 0;
    if (value == 0) {
        buffer[pos++] = '0';
    } else {
        while (value > 0 && pos < 21) {
            buffer[pos++] = static_cast<char>('0' + (value % 10));
            value /= 10;
        }
    }

    int pad_len = width > pos ? width - pos : 0;
    while (pad_len-- > 0) {
        append_char(out, end, pad_char);
    }
    while (pos--) {
        append_char(out, end, buffer[pos]);
    }
}

void append_signed(char*& out, char* end, int64_t value, int width,
                   char pad_char) {
    bool negative = value < 0;
    uint64_t mag = negative ? 0 - static_cast<uint64_t>(value)
                            : static_cast<uint64_t>(value);

    char buffer[21];
    int pos = 0;
    if (mag == 0) {
        buffer[pos++] = '0';
    } else {
        while (mag > 0 && pos < 21) {
            buffer[pos++] = static_cast<char>('0' + (mag % 10));
            mag /= 10;
        }
    }

    int total_len = pos + (negative ? 1 : 0);
    int pad_len = width > total_len ? width - total_len : 0;

    if (negative && pad_char == '0') {
        append_char(out, end, '-');
        while (pad_len-- > 0) {
            append_char(out, end, '0');
        }
    } else {
        while (pad_len-- > 0) {
            append_char(out, end, pad_char);
        }
        if (negative) {
            append_char(out, end, '-');
        }
    }

    while (pos--) {
        append_char(out, end, buffer[pos]);
    }
}

void append_hex(char*& out, char* end, uint64_t value, int width) {
    char buffer[16];
    int pos = 0;
    if (value == 0) {
        buffer[pos++] = '0';
    }
    while (value > 0 && pos < 16) {
        uint8_t digit = static_cast<uint8_t>(value & 0xF);
        buffer[pos++] = (digit < 10) ? static_cast<char>('0' + digit)
                                     : static_cast<char>('a' + (digit - 10));
        value >>= 4;
    }
    append_string(out, end, "0x");
    for (int i = pos; i < width; ++i) {
        append_char(out, end, '0');
    }
    while (pos--) {
        append_char(out, end, buffer[pos]);
    }
}

size_t format_message(char* out, size_t capacity, const char* fmt,
                      va_list args_origin) {
    if (capacity == 0) return 0;
    char* cursor = out;
    char* end = out + capacity - 1;

    va_list args;
    va_copy(args, args_origin);

    while (*fmt) {
        if (*fmt != '%') {
            append_char(cursor, end, *fmt++);
            continue;
        }
        ++fmt;

        bool zero_pad = false;
        int width = 0;
        if (*fmt == '0') {
            zero_pad = true;
            ++fmt;
        }
        while (*fmt >= '0' && *fmt <= '9') {
            width = width * 10 + (*fmt - '0');
            ++fmt;
        }

        char length = '\0';
        if (*fmt == 'z' || *fmt == 'l') {
            length = *fmt++;
            if (length == 'l' && *fmt == 'l') {
                length = 'L';
                ++fmt;
            }
        }

        char spec = *fmt;
        if (spec == '\0') {
            break;
        }
        ++fmt;
        switch (spec) {
            case 's':
                append_string(cursor, end, va_arg(args, const char*));
                break;
            case 'd':
            case 'i': {
                long long value = 0;
                switch (length) {
                    case 'z':
                    case 'l':
                        value = va_arg(args, long);
                        break;
                    case 'L':
                        value = va_arg(args, long long);
                        break;
                    default:
                        value = va_arg(args, int);
                        break;
                }
                append_signed(cursor, end, value, width,
                              zero_pad ? '0' : ' ');
                break;
            }
            case 'u':
            case 'x': {
                uint64_t value = 0;
                switch (length) {
                    case 'z':
                        value = static_cast<uint64_t>(va_arg(args, size_t));
                        break;
                    case 'l':
                        value = static_cast<uint64_t>(
                            va_arg(args, unsigned long));
                        break;
                    case 'L':
                        value = va_arg(args, unsigned long long);
                        break;
                    default:
                        value =
                            static_cast<uint64_t>(va_arg(args, unsigned int));
                        break;
                }
                if (spec == 'u') {
                    append_unsigned(cursor, end, value, width,
                                    zero_pad ? '0' : ' ');
                } else {
                    append_hex(cursor, end, value, zero_pad ? width : 0);
                }
                break;
            }
            case 'p':
                append_hex(cursor, end,
                           reinterpret_cast<uintptr_t>(va_arg(args, void*)),
                           16);
                break;
            case 'c':
                append_char(cursor, end, static_cast<char>(va_arg(args, int)));
                break;
            case '%':
                append_char(cursor, end, '%');
                break;
            default:
                append_char(cursor, end, '%');
                append_char(cursor, end, spec);
                break;
        }
    }

    va_end(args);

    if (cursor <= end) {
        *cursor = '\0';
    } else {
        out[capacity - 1] = '\0';
    }

    return static_cast<size_t>(cursor - out);
}

void store_log_line(const char* tag, const char* message) {
    char line[LOG_LINE_MAX];
    char* cursor = line;
    char* end = line + sizeof(line) - 1;

    append_char(cursor, end, '[');
    append_string(cursor, end, tag);
    append_string(cursor, end, "] ");
    append_string(cursor, end, message);

    if (cursor <= end) {
        *cursor = '\0';
    } else {
        line[sizeof(line) - 1] = '\0';
    }

    append_line_to_buffer(line);
}

void emit_to_output(LogLevel level, const char* tag, const char* message) {
    if (g_output == nullptr) {
        return;
    }

    char line[LOG_LINE_MAX];
    char* cursor = line;
    char* end = line + sizeof(line) - 1;

    append_string(cursor, end, level_color(level));
    append_char(cursor, end, '[');
    append_string(cursor, end, tag);
    append_char(cursor, end, ']');
    append_string(cursor, end, kColorReset);
    append_char(cursor, end, ' ');
    append_string(cursor, end, message);
    append_char(cursor, end, '\n');

    if (cursor <= end) {
        *cursor = '\0';
    } else {
        line[sizeof(line) - 2] = '\n';
        line[sizeof(line) - 1] = '\0';
    }

    g_output(g_output_context, line);
}

}  // namespace

void log_init() {
    for (size_t i = 0; i < LOG_BUFFER_CAPACITY; ++i) {
        g_buffer[i] = '\0';
    }
    g_write_pos = 0;
    g_start_pos = 0;
    g_size = 0;
    g_initialized = true;
}

void log_set_output(LogOutputFn output, void* context) {
    ksync::SpinlockGuard guard(g_output_lock);
    g_output = output;
    g_output_context = context;
}

void log_set_level(LogLevel minimum) {
    g_minimum = minimum;
}

void log_message_v(LogLevel level, const char* fmt, va_list args) {
    if (!g_initialized) {
        log_init();
    }
    if (static_cast<uint8_t>(level) < static_cast<uint8_t>(g_minimum)) {
        return;
    }

    char buffer[256];
    format_message(buffer, sizeof(buffer), fmt, args);

    const char* tag = level_tag(level);

    ksync::SpinlockGuard guard(g_output_lock);
    emit_to_output(level, tag, buffer);
    store_log_line(tag, buffer);
}

void log_message(LogLevel level, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log_message_v(level, fmt, args);
    va_end(args);
}

size_t log_format(char* out, size_t capacity, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    size_t written = format_message(out, capacity, fmt, args);
    va_end(args);
    return written;
}

size_t log_format_v(char* out, size_t capacity, const char* fmt,
                    va_list args) {
    return format_message(out, capacity, fmt, args);
}

size_t log_copy_recent(char* out, size_t max_len) {
    if (out == nullptr || max_len == 0) {
        return 0;
    }

    ksync::SpinlockGuard guard(g_output_lock);
    size_t available = g_size;
    if (available == 0 || max_len == 1) {
        out[0] = '\0';
        return 0;
    }

    size_t to_copy = (available < max_len - 1) ? available : (max_len - 1);
    // Keep the newest bytes when the caller's buffer is short.
    size_t src = (g_start_pos + (available - to_copy)) % LOG_BUFFER_CAPACITY;

    for (size_t i = 0; i < to_copy; ++i) {
        out[i] = g_buffer[src];
        src = (src + 1) % LOG_BUFFER_CAPACITY;
    }
    out[to_copy] = '\0';
    return to_copy;
}
