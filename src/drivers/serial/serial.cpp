#include "serial.hpp"

#include <stddef.h>
#include <stdint.h>

namespace {

constexpr uint16_t kCom1Port = 0x3F8;

enum Register : uint16_t {
    kData = 0,
    kInterruptEnable = 1,
    kFifoControl = 2,
    kLineControl = 3,
    kModemControl = 4,
    kLineStatus = 5,
};

constexpr uint8_t kTransmitEmpty = 0x20;

inline void outb(uint16_t port, uint8_t value) {
    asm volatile("outb %0, %1" : : "a"(value), "Nd"(port));
}

inline uint8_t inb(uint16_t port) {
    uint8_t value;
    asm volatile("inb %1, %0" : "=a"(value) : "Nd"(port));
    return value;
}

bool g_initialized = false;

}  // namespace

namespace serial {

void init() {
    if (g_initialized) {
        return;
    }

    // 115200 8N1, FIFO on, polled.
    outb(kCom1Port + kInterruptEnable, 0x00);
    outb(kCom1Port + kLineControl, 0x80);
    outb(kCom1Port + kData, 0x01);
    outb(kCom1Port + kInterruptEnable, 0x00);
    outb(kCom1Port + kLineControl, 0x03);
    outb(kCom1Port + kFifoControl, 0xC7);
    outb(kCom1Port + kModemControl, 0x03);

    g_initialized = true;
}

void write_char(char c) {
    if (!g_initialized) {
        init();
    }
    if (c == '\n') {
        write_char('\r');
    }
    while ((inb(kCom1Port + kLineStatus) & kTransmitEmpty) == 0) {
        asm volatile("pause");
    }
    outb(kCom1Port + kData, static_cast<uint8_t>(c));
}

void write(const char* data, size_t len) {
    for (size_t i = 0; i < len; ++i) {
        write_char(data[i]);
    }
}

void write_string(const char* str) {
    if (str == nullptr) {
        return;
    }
    while (*str) {
        write_char(*str++);
    }
}

void log_sink(void*, const char* text) {
    write_string(text);
}

}  // namespace serial
