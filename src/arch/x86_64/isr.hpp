#pragma once

#include <stdint.h>

// Saved by isr_stubs.S, lowest address first.
struct InterruptFrame {
    uint64_t r15;
    uint64_t r14;
    uint64_t r13;
    uint64_t r12;
    uint64_t r11;
    uint64_t r10;
    uint64_t r9;
    uint64_t r8;
    uint64_t rbp;
    uint64_t rdi;
    uint64_t rsi;
    uint64_t rdx;
    uint64_t rcx;
    uint64_t rbx;
    uint64_t rax;
    uint64_t int_no;
    uint64_t err_code;
    uint64_t rip;
    uint64_t cs;
    uint64_t rflags;
    uint64_t rsp;
    uint64_t ss;
};

using InterruptHandler = void (*)(InterruptFrame& frame);

namespace interrupts {

constexpr uint32_t kVectorCount = 256;
constexpr uint32_t kExceptionCount = 32;

// nullptr restores the default handler.
void set_handler(uint8_t vector, InterruptHandler handler);

}  // namespace interrupts
