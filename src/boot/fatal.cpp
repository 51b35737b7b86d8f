#include <stdarg.h>

#include "drivers/log/logging.hpp"
#include "kernel/panic.hpp"

[[noreturn]] void panic(const char* fmt, ...) {
    char message[256];
    va_list args;
    va_start(args, fmt);
    log_format_v(message, sizeof(message), fmt, args);
    va_end(args);

    log_message(LogLevel::Error, "PANIC: %s", message);

    while (true) {
        asm volatile("pause");
    }
}
