#include "idt.hpp"
#include <stdint.h>
#include "gdt.hpp"
#include "isr.hpp"
#include "drivers/log/logging.hpp"
#include "lib/mem.hpp"

namespace {

struct __attribute__((packed)) IdtEntry {
    uint16_t offset_low;
    uint16_t selector;
    uint8_t  ist;
    uint8_t  type_attr;
    uint16_t offset_mid;
    uint32_t offset_high;
    uint32_t zero;
};

struct __attribute__((packed)) IdtPtr {
    uint16_t limit;
    uint64_t base;
};

constexpr uint8_t kInterruptGate = 0x8E;
constexpr uint8_t kInterruptStack = 1;

void set_idt_entry(IdtEntry& entry, void* handler, uint8_t ist, uint8_t flags) {
    uintptr_t addr = (uintptr_t)handler;
    entry.offset_low  = (uint16_t)(addr & 0xFFFF);
    entry.selector    = KERNEL_CS;
    entry.ist         = ist & 0x7;
    entry.type_attr   = flags;
    entry.offset_mid  = (uint16_t)((addr >> 16) & 0xFFFF);
    entry.offset_high = (uint32_t)((addr >> 32) & 0xFFFFFFFF);
    entry.zero        = 0;
}

}  // namespace

extern "C" void* isr_stub_table[interrupts::kVectorCount];  // isr_stubs.S

void idt_install(memory::Context& memory) {
    uint64_t page = memory.allocator().alloc_page();
    auto* idt = memory.phys_to_virt<IdtEntry>(page);
    memset(idt, 0, memory::kPageSize);

    for (uint32_t i = 0; i < interrupts::kVectorCount; i++) {
        set_idt_entry(idt[i], isr_stub_table[i], kInterruptStack,
                      kInterruptGate);
    }

    IdtPtr idt_ptr{
        .limit = sizeof(IdtEntry) * interrupts::kVectorCount - 1,
        .base = reinterpret_cast<uint64_t>(idt),
    };
    asm volatile("lidt %0" :: "m"(idt_ptr));

    log_message(LogLevel::Debug, "IDT at %p", idt);
}
