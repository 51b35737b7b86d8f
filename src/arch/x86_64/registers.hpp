#pragma once

#include <stdint.h>

namespace cpu {

// Faulting linear address of the last page fault.
inline uint64_t read_cr2() {
    uint64_t value;
    asm volatile("mov %%cr2, %0" : "=r"(value));
    return value;
}

inline uint64_t read_cr3() {
    uint64_t value;
    asm volatile("mov %%cr3, %0" : "=r"(value));
    return value;
}

// Also flushes every non-global TLB entry.
inline void write_cr3(uint64_t value) {
    asm volatile("mov %0, %%cr3" : : "r"(value) : "memory");
}

[[noreturn]] inline void halt() {
    while (true) {
        asm volatile("cli; hlt");
    }
}

}  // namespace cpu
