#pragma once

#include <stddef.h>
#include <stdint.h>

namespace boot {

enum class PixelFormat : uint32_t {
    Rgb,
    Bgr,
    Bitmask,
    BltOnly,
};

struct DisplayMode {
    uint32_t width;
    uint32_t height;
    uint32_t scanline_width;
    PixelFormat format;
};

struct Framebuffer {
    uint64_t base;
    uint64_t size;
    uint32_t width;
    uint32_t height;
    uint32_t scanline_width;
};

// One firmware memory descriptor, already classified. `usable` means the
// range is free for the kernel once boot services have exited.
struct FirmwareRange {
    uint64_t start;
    uint64_t page_count;
    bool usable;
};

// Boot services the loader depends on. The UEFI glue fills this table in;
// physical addresses are identity mapped while boot services run.
struct Firmware {
    void (*write)(void* context, const char* text);

    // Returns the number of descriptors; copies at most `capacity`.
    size_t (*memory_map)(void* context, FirmwareRange* out, size_t capacity);

    // Returns the physical address of `count` pages, or 0 on failure.
    uint64_t (*allocate_pages)(void* context, uint64_t count);
    void (*free_pages)(void* context, uint64_t phys, uint64_t count);
    void* (*physical_pointer)(void* context, uint64_t phys);

    // Loads a whole file into freshly allocated pages.
    bool (*read_file)(void* context,
                      const char* path,
                      uint64_t& phys_out,
                      uint64_t& size_out);

    size_t (*display_modes)(void* context, DisplayMode* out, size_t capacity);
    bool (*set_display_mode)(void* context, size_t index, Framebuffer& out);
    void (*current_framebuffer)(void* context, Framebuffer& out);

    void (*set_page_table_base)(void* context, uint64_t pml4_phys);

    // Fetches the final memory map and leaves boot services.
    bool (*exit_boot_services)(void* context,
                               FirmwareRange* out,
                               size_t capacity,
                               size_t& count_out);

    // Switches to `stack_top` and calls `entry(header)`. Does not return on
    // real hardware.
    void (*enter_kernel)(void* context,
                         uint64_t entry,
                         uint64_t header,
                         uint64_t stack_top);

    void* context;
};

}  // namespace boot
