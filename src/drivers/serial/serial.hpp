#pragma once
#include <stddef.h>
#include <stdint.h>

namespace serial {

void init();
void write_char(char c);
void write(const char* data, size_t len);
void write_string(const char* str);

// LogOutputFn-compatible sink for the kernel log.
void log_sink(void* context, const char* text);

}  // namespace serial
