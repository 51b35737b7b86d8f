#pragma once
#include <stdarg.h>
#include <stddef.h>
#include <stdint.h>

enum class LogLevel : uint8_t {
    Debug,
    Info,
    Warn,
    Error,
};

using LogOutputFn = void (*)(void* context, const char* text);

void log_init();
void log_set_output(LogOutputFn output, void* context);
void log_set_level(LogLevel minimum);
void log_message(LogLevel level, const char* fmt, ...);
void log_message_v(LogLevel level, const char* fmt, va_list args);
size_t log_format(char* out, size_t capacity, const char* fmt, ...);
size_t log_format_v(char* out, size_t capacity, const char* fmt, va_list args);
size_t log_copy_recent(char* out, size_t max_len);
