#include "gdt.hpp"
#include "tss.hpp"
#include "drivers/log/logging.hpp"
#include "lib/mem.hpp"
#include <stdint.h>

namespace {

constexpr size_t kGdtSlots = 7;  // TSS descriptor takes two
constexpr size_t kGdtBytes = kGdtSlots * 8;

void set_gdt_entry_bytes(uint8_t* dst, uint32_t base, uint32_t limit,
                         uint8_t access, uint8_t gran) {
    dst[0] = limit & 0xFF;
    dst[1] = (limit >> 8) & 0xFF;
    dst[2] = base & 0xFF;
    dst[3] = (base >> 8) & 0xFF;
    dst[4] = (base >> 16) & 0xFF;
    dst[5] = access;
    dst[6] = ((limit >> 16) & 0x0F) | (gran & 0xF0);
    dst[7] = (base >> 24) & 0xFF;
}

void set_tss_descriptor_bytes(uint8_t* dst, uint64_t base, uint32_t limit) {
    uint64_t low = 0;
    low  = (limit & 0xFFFF);
    low |= (base & 0xFFFFFF) << 16;
    low |= 0x89ull << 40;  // present, 64-bit available TSS
    low |= static_cast<uint64_t>((limit >> 16) & 0xF) << 48;
    low |= ((base >> 24) & 0xFF) << 56;

    uint64_t high = (base >> 32) & 0xFFFFFFFF;

    memcpy(dst + 0, &low, sizeof(low));
    memcpy(dst + 8, &high, sizeof(high));
}

struct __attribute__((packed)) GdtPointer {
    uint16_t limit;
    uint64_t base;
};

}  // namespace

extern "C" void load_gdt_ptr(const void* ptr, uint16_t code_selector,
                             uint16_t data_selector,
                             uint16_t tss_selector);  // gdt_load.S

void gdt_install(memory::Context& memory, TSS& tss) {
    uint64_t page = memory.allocator().alloc_page();
    auto* area = memory.phys_to_virt<uint8_t>(page);
    memset(area, 0, memory::kPageSize);

    set_gdt_entry_bytes(area + 0 * 8, 0, 0, 0, 0);                  // null
    set_gdt_entry_bytes(area + 1 * 8, 0, 0x000FFFFF, 0x9A, 0x20);   // kernel code (L=1)
    set_gdt_entry_bytes(area + 2 * 8, 0, 0x000FFFFF, 0x92, 0x00);   // kernel data
    set_gdt_entry_bytes(area + 3 * 8, 0, 0x000FFFFF, 0xFA, 0x20);   // user code DPL=3 L=1
    set_gdt_entry_bytes(area + 4 * 8, 0, 0x000FFFFF, 0xF2, 0x00);   // user data DPL=3
    set_tss_descriptor_bytes(area + 5 * 8, reinterpret_cast<uint64_t>(&tss),
                             sizeof(TSS) - 1);

    GdtPointer gdtr{
        .limit = static_cast<uint16_t>(kGdtBytes - 1),
        .base = reinterpret_cast<uint64_t>(area),
    };
    load_gdt_ptr(&gdtr, KERNEL_CS, KERNEL_DS, TSS_SEL);

    log_message(LogLevel::Debug, "GDT at %p", area);
}
