#pragma once
#include <stdint.h>
#include <stddef.h>

#include "kernel/memory/memory.hpp"

struct TSS;

static constexpr uint16_t KERNEL_CS = 0x08;
static constexpr uint16_t KERNEL_DS = 0x10;
static constexpr uint16_t USER_CS   = 0x1B;
static constexpr uint16_t USER_DS   = 0x23;
static constexpr uint16_t TSS_SEL   = 0x28;

// Builds the GDT in a page from the physical allocator, loads it, reloads
// the segment registers and the task register.
void gdt_install(memory::Context& memory, TSS& tss);
