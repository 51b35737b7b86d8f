#include <stddef.h>
#include <stdint.h>

#include "drivers/log/logging.hpp"
#include "kernel/error.hpp"
#include "isr.hpp"

namespace {

// Interrupt number to name mapping
constexpr const char* exception_names[interrupts::kExceptionCount] = {
    "DIVIDE_BY_ZERO",
    "DEBUG",
    "NMI",
    "BREAKPOINT",
    "OVERFLOW",
    "BOUND_RANGE_EXCEEDED",
    "INVALID_OPCODE",
    "DEVICE_NOT_AVAILABLE",
    "DOUBLE_FAULT",
    "COPROCESSOR_SEGMENT_OVERRUN",
    "INVALID_TSS",
    "SEGMENT_NOT_PRESENT",
    "STACK_SEGMENT_FAULT",
    "GENERAL_PROTECTION_FAULT",
    "PAGE_FAULT",
    "RESERVED",
    "x87_FLOATING_POINT_EXCEPTION",
    "ALIGNMENT_CHECK",
    "MACHINE_CHECK",
    "SIMD_FLOATING_POINT_EXCEPTION",
    "VIRTUALIZATION_EXCEPTION",
    "CONTROL_PROTECTION_EXCEPTION",
    "RESERVED",
    "RESERVED",
    "RESERVED",
    "RESERVED",
    "RESERVED",
    "RESERVED",
    "RESERVED",
    "RESERVED",
    "RESERVED",
    "RESERVED"
};

InterruptHandler g_handlers[interrupts::kVectorCount];

void unhandled_exception(InterruptFrame& regs) {
    log_message(LogLevel::Error, "Exception %x %s",
                static_cast<unsigned int>(regs.int_no),
                exception_names[regs.int_no]);

    uint16_t selector = static_cast<uint16_t>(regs.err_code & 0xFFF8);
    log_message(LogLevel::Error, "Error code: %x (sel=%04x ext=%d idt=%d ldt=%d)",
                static_cast<unsigned int>(regs.err_code),
                static_cast<unsigned int>(selector),
                (regs.err_code & 0x1) != 0 ? 1 : 0,
                (regs.err_code & 0x2) != 0 ? 1 : 0,
                (regs.err_code & 0x4) != 0 ? 1 : 0);

    error_screen::display("UNHANDLED_CPU_EXCEPTION_",
                          exception_names[regs.int_no], &regs);
}

void default_handler(InterruptFrame& regs) {
    log_message(LogLevel::Warn, "Interrupt %02x occurred",
                static_cast<unsigned int>(regs.int_no));
}

}  // namespace

namespace interrupts {

void set_handler(uint8_t vector, InterruptHandler handler) {
    g_handlers[vector] = handler;
}

}  // namespace interrupts

extern "C" void isr_handler(InterruptFrame* regs) {
    if (regs == nullptr || regs->int_no >= interrupts::kVectorCount) {
        return;
    }

    InterruptHandler handler = g_handlers[regs->int_no];
    if (handler != nullptr) {
        handler(*regs);
    } else if (regs->int_no < interrupts::kExceptionCount) {
        unhandled_exception(*regs);
    } else {
        default_handler(*regs);
    }
}
