#pragma once

#include <stddef.h>
#include <stdint.h>

#include "boot/firmware.hpp"
#include "drivers/log/logging.hpp"
#include "kernel/config.hpp"

namespace boot {

constexpr const char* kConfigPath = "EFI\\BOOT\\boot.cfg";
constexpr const char* kDefaultKernelPath = "EFI\\BOOT\\kernel.sys";
constexpr uint32_t kDefaultMaxWidth = 1920;
constexpr uint64_t kDefaultKernelStackPages = 8;

struct LoaderConfig {
    char kernel_path[config::kMaxValueLength];
    uint32_t max_width;
    uint64_t kernel_stack_pages;
    LogLevel log_level;
};

void default_config(LoaderConfig& out);

// Overrides defaults with whatever `table` sets. Bad values are logged and
// ignored.
void apply_config(const config::Table& table, LoaderConfig& out);

// Builds the boot page tables, loads the kernel and jumps to it.
[[noreturn]] void run(Firmware& firmware);

}  // namespace boot
