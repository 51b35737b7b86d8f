#include "error.hpp"

#include <stdarg.h>

#include "arch/x86_64/registers.hpp"
#include "drivers/log/logging.hpp"
#include "panic.hpp"

namespace {

struct ControlRegisters {
    uint64_t cr0;
    uint64_t cr2;
    uint64_t cr3;
    uint64_t cr4;
};

ControlRegisters read_control_registers() {
    ControlRegisters regs{};
    asm volatile("mov %%cr0, %0" : "=r"(regs.cr0));
    asm volatile("mov %%cr2, %0" : "=r"(regs.cr2));
    asm volatile("mov %%cr3, %0" : "=r"(regs.cr3));
    asm volatile("mov %%cr4, %0" : "=r"(regs.cr4));
    return regs;
}

void print_registers(const InterruptFrame* regs) {
    if (regs == nullptr) {
        log_message(LogLevel::Error, "Register dump unavailable.");
        return;
    }

    auto cr = read_control_registers();

    log_message(LogLevel::Error, "INT=%016llx     ERR=%016llx     CR2=%016llx",
                static_cast<unsigned long long>(regs->int_no),
                static_cast<unsigned long long>(regs->err_code),
                static_cast<unsigned long long>(cr.cr2));
    log_message(LogLevel::Error, "RAX=%016llx     RBX=%016llx     RCX=%016llx",
                static_cast<unsigned long long>(regs->rax),
                static_cast<unsigned long long>(regs->rbx),
                static_cast<unsigned long long>(regs->rcx));
    log_message(LogLevel::Error, "RDX=%016llx     RSI=%016llx     RDI=%016llx",
                static_cast<unsigned long long>(regs->rdx),
                static_cast<unsigned long long>(regs->rsi),
                static_cast<unsigned long long>(regs->rdi));
    log_message(LogLevel::Error, "R8 =%016llx     R9 =%016llx     R10=%016llx",
                static_cast<unsigned long long>(regs->r8),
                static_cast<unsigned long long>(regs->r9),
                static_cast<unsigned long long>(regs->r10));
    log_message(LogLevel::Error, "R11=%016llx     R12=%016llx     R13=%016llx",
                static_cast<unsigned long long>(regs->r11),
                static_cast<unsigned long long>(regs->r12),
                static_cast<unsigned long long>(regs->r13));
    log_message(LogLevel::Error, "R14=%016llx     R15=%016llx     RBP=%016llx",
                static_cast<unsigned long long>(regs->r14),
                static_cast<unsigned long long>(regs->r15),
                static_cast<unsigned long long>(regs->rbp));
    log_message(LogLevel::Error, "RIP=%016llx     RSP=%016llx  RFLAGS=%016llx",
                static_cast<unsigned long long>(regs->rip),
                static_cast<unsigned long long>(regs->rsp),
                static_cast<unsigned long long>(regs->rflags));
    log_message(LogLevel::Error, "CS=%04llx      SS=%04llx",
                static_cast<unsigned long long>(regs->cs),
                static_cast<unsigned long long>(regs->ss));
    log_message(LogLevel::Error, "CR0=%016llx     CR3=%016llx     CR4=%016llx",
                static_cast<unsigned long long>(cr.cr0),
                static_cast<unsigned long long>(cr.cr3),
                static_cast<unsigned long long>(cr.cr4));
}

}  // namespace

namespace error_screen {

[[noreturn]] void display(const char* primary,
                         const char* secondary,
                         const InterruptFrame* regs) {
    const char* main_message = primary ? primary : "";
    const char* info_message = secondary ? secondary : "";

    log_message(LogLevel::Error, "An error has occurred: %s%s", main_message,
                info_message);
    print_registers(regs);
    log_message(LogLevel::Error, "System halted.");

    cpu::halt();
}

}  // namespace error_screen

[[noreturn]] void panic(const char* fmt, ...) {
    char message[256];
    va_list args;
    va_start(args, fmt);
    log_format_v(message, sizeof(message), fmt, args);
    va_end(args);

    error_screen::display("KERNEL_PANIC: ", message, nullptr);
}
