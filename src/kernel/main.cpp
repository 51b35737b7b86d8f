#include <stddef.h>
#include <stdint.h>

#include "arch/x86_64/gdt.hpp"
#include "arch/x86_64/idt.hpp"
#include "arch/x86_64/isr.hpp"
#include "arch/x86_64/memory/paging.hpp"
#include "arch/x86_64/registers.hpp"
#include "arch/x86_64/tss.hpp"
#include "boot_protocol.hpp"
#include "drivers/log/logging.hpp"
#include "drivers/serial/serial.hpp"
#include "kernel/error.hpp"
#include "kernel/memory/memory.hpp"
#include "panic.hpp"

namespace {

void log_memory_map(const boot::HandoffHeader& header) {
    for (uint64_t i = 0; i < header.memory_map_entries; ++i) {
        const boot::MemorySegment& segment = header.memory_map[i];
        log_message(LogLevel::Debug, "  %016llx +%llu pages %s",
                    static_cast<unsigned long long>(segment.start),
                    static_cast<unsigned long long>(segment.page_count),
                    segment.state == boot::MemorySegmentState::Free
                        ? "free"
                        : "occupied");
    }
}

constexpr uint8_t kPageFaultVector = 14;

// Nothing is demand-paged, so every page fault is a kernel bug.
void page_fault(InterruptFrame& frame) {
    uint64_t address = cpu::read_cr2();
    log_message(LogLevel::Error, "Page fault at %016llx (%s, %s%s)",
                static_cast<unsigned long long>(address),
                (frame.err_code & 0x1) != 0 ? "protection" : "not present",
                (frame.err_code & 0x2) != 0 ? "write" : "read",
                (frame.err_code & 0x10) != 0 ? ", fetch" : "");
    error_screen::display("PAGE_FAULT", nullptr, &frame);
}

}  // namespace

extern "C" [[noreturn]] void kernel_main(const boot::HandoffHeader* header) {
    serial::init();
    log_init();
    log_set_output(&serial::log_sink, nullptr);

    if (header == nullptr) {
        panic("No handoff header");
    }

    log_message(LogLevel::Info, "Kernel started, header at %p", header);
    log_message(LogLevel::Info, "Screen %ux%u (scanline %u) at %p",
                header->screen_width, header->screen_height,
                header->screen_scanline_width, header->screen_buffer);
    log_memory_map(*header);

    memory::Context& memory = memory::init(*header);
    paging_release_identity_map(memory);

    init_tss(memory, tss);
    gdt_install(memory, tss);
    idt_install(memory);
    interrupts::set_handler(kPageFaultVector, &page_fault);

    log_message(LogLevel::Info, "Boot complete, %llu KB free",
                static_cast<unsigned long long>(
                    memory.allocator().free_page_count() * memory::kPageSize /
                    1024));

    cpu::halt();
}
