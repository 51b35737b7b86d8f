#pragma once
#include <stdint.h>
#include <stddef.h>

#include "kernel/memory/memory.hpp"

struct TSS {
    uint32_t reserved0;
    uint64_t rsp0;
    uint64_t rsp1;
    uint64_t rsp2;
    uint64_t reserved1;
    uint64_t ist1;
    uint64_t ist2;
    uint64_t ist3;
    uint64_t ist4;
    uint64_t ist5;
    uint64_t ist6;
    uint64_t ist7;
    uint64_t reserved2;
    uint16_t reserved3;
    uint16_t iomap_base;
} __attribute__((packed));

constexpr uint64_t kInterruptStackPages = 4;

extern TSS tss;

// Gives IST1 a fresh interrupt stack; every IDT gate switches to it.
void init_tss(memory::Context& memory, TSS& tss_obj);
