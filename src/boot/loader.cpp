#include "boot/loader.hpp"

#include "boot/elf.hpp"
#include "boot/memory_map.hpp"
#include "boot/paging.hpp"
#include "boot_protocol.hpp"
#include "kernel/panic.hpp"
#include "kernel/string_util.hpp"
#include "lib/mem.hpp"

namespace boot {

namespace {

constexpr size_t kMaxDisplayModes = 64;
// Allocations made after the first map query add descriptors.
constexpr size_t kMemoryMapSlack = 32;

uint64_t pages_for_bytes(uint64_t bytes) {
    return (bytes + kPageSize - 1) / kPageSize;
}

void firmware_output(void* context, const char* text) {
    auto* firmware = static_cast<Firmware*>(context);
    firmware->write(firmware->context, text);
}

uint64_t allocate_or_die(Firmware& firmware, uint64_t pages,
                         const char* what) {
    uint64_t phys = firmware.allocate_pages(firmware.context, pages);
    if (phys == 0) {
        panic("Failed to allocate %llu pages for %s",
              static_cast<unsigned long long>(pages), what);
    }
    return phys;
}

template <typename T>
T* physical(Firmware& firmware, uint64_t phys) {
    return static_cast<T*>(firmware.physical_pointer(firmware.context, phys));
}

bool parse_log_level(const char* text, LogLevel& out) {
    if (string_util::equals(text, "debug")) {
        out = LogLevel::Debug;
    } else if (string_util::equals(text, "info")) {
        out = LogLevel::Info;
    } else if (string_util::equals(text, "warn")) {
        out = LogLevel::Warn;
    } else if (string_util::equals(text, "error")) {
        out = LogLevel::Error;
    } else {
        return false;
    }
    return true;
}

void load_config(Firmware& firmware, LoaderConfig& out) {
    default_config(out);

    uint64_t phys = 0;
    uint64_t size = 0;
    if (!firmware.read_file(firmware.context, kConfigPath, phys, size)) {
        log_message(LogLevel::Info, "No %s, using defaults", kConfigPath);
        return;
    }

    static config::Table table;
    if (!config::parse(physical<const char>(firmware, phys),
                       static_cast<size_t>(size), table)) {
        log_message(LogLevel::Warn, "Config: some lines were ignored");
    }
    apply_config(table, out);
    firmware.free_pages(firmware.context, phys, pages_for_bytes(size));
}

Framebuffer select_display(Firmware& firmware, uint32_t max_width) {
    DisplayMode modes[kMaxDisplayModes];
    size_t count =
        firmware.display_modes(firmware.context, modes, kMaxDisplayModes);
    if (count > kMaxDisplayModes) {
        count = kMaxDisplayModes;
    }

    Framebuffer framebuffer{};
    size_t index = 0;
    if (select_display_mode(modes, count, max_width, index)) {
        if (firmware.set_display_mode(firmware.context, index, framebuffer)) {
            log_message(LogLevel::Info, "Display: mode %u (%ux%u)",
                        static_cast<unsigned int>(index),
                        framebuffer.width, framebuffer.height);
            return framebuffer;
        }
        log_message(LogLevel::Warn, "Display: failed to set mode %u",
                    static_cast<unsigned int>(index));
    } else {
        log_message(LogLevel::Warn,
                    "Display: no RGB mode up to %u wide, keeping current",
                    max_width);
    }

    firmware.current_framebuffer(firmware.context, framebuffer);
    return framebuffer;
}

}  // namespace

void default_config(LoaderConfig& out) {
    string_util::copy(out.kernel_path, sizeof(out.kernel_path),
                      kDefaultKernelPath);
    out.max_width = kDefaultMaxWidth;
    out.kernel_stack_pages = kDefaultKernelStackPages;
    out.log_level = LogLevel::Info;
}

void apply_config(const config::Table& table, LoaderConfig& out) {
    const char* value = nullptr;
    if (config::get(table, "kernel", value) && value[0] != '\0') {
        string_util::copy(out.kernel_path, sizeof(out.kernel_path), value);
    }

    uint64_t number = 0;
    if (config::get(table, "max_width", value)) {
        if (config::get_u64(table, "max_width", number) && number > 0 &&
            number <= UINT32_MAX) {
            out.max_width = static_cast<uint32_t>(number);
        } else {
            log_message(LogLevel::Warn, "Config: bad max_width '%s'", value);
        }
    }

    if (config::get(table, "kernel_stack_pages", value)) {
        if (config::get_u64(table, "kernel_stack_pages", number) &&
            number > 0) {
            out.kernel_stack_pages = number;
        } else {
            log_message(LogLevel::Warn,
                        "Config: bad kernel_stack_pages '%s'", value);
        }
    }

    if (config::get(table, "log_level", value) &&
        !parse_log_level(value, out.log_level)) {
        log_message(LogLevel::Warn, "Config: bad log_level '%s'", value);
    }
}

[[noreturn]] void run(Firmware& firmware) {
    log_set_output(&firmware_output, &firmware);

    LoaderConfig loader_config{};
    load_config(firmware, loader_config);
    log_set_level(loader_config.log_level);

    uint64_t header_phys = allocate_or_die(firmware, 1, "handoff header");
    auto* header = physical<HandoffHeader>(firmware, header_phys);
    memset(header, 0, sizeof(HandoffHeader));

    Framebuffer framebuffer = select_display(firmware, loader_config.max_width);

    size_t range_count = firmware.memory_map(firmware.context, nullptr, 0);
    size_t range_capacity = range_count + kMemoryMapSlack;
    uint64_t ranges_pages =
        pages_for_bytes(range_capacity * sizeof(FirmwareRange));
    uint64_t ranges_phys =
        allocate_or_die(firmware, ranges_pages, "memory map");
    auto* ranges = physical<FirmwareRange>(firmware, ranges_phys);
    range_count = firmware.memory_map(firmware.context, ranges, range_capacity);
    if (range_count > range_capacity) {
        range_count = range_capacity;
    }

    uint64_t physical_size = memory_map_end(ranges, range_count);
    uint64_t framebuffer_end = framebuffer.base + framebuffer.size;
    if (framebuffer_end > physical_size) {
        physical_size = framebuffer_end;
    }
    log_message(LogLevel::Info, "Memory ranges from 0 to %016llx",
                static_cast<unsigned long long>(physical_size));

    PageTableLayout layout = compute_page_table_layout(physical_size);
    uint64_t tables_phys =
        allocate_or_die(firmware, layout.total_pages(), "page tables");
    PagingInfo paging_info = build_page_tables(
        layout, physical<uint64_t>(firmware, tables_phys), tables_phys);
    firmware.set_page_table_base(firmware.context, tables_phys);

    uint64_t high_base = high_memory_base(layout.pml4_entries);

    uint64_t file_phys = 0;
    uint64_t file_size = 0;
    if (!firmware.read_file(firmware.context, loader_config.kernel_path,
                            file_phys, file_size)) {
        panic("Kernel %s not found", loader_config.kernel_path);
    }
    const auto* image = physical<const uint8_t>(firmware, file_phys);

    uint64_t kernel_span = 0;
    if (!elf::image_size(image, static_cast<size_t>(file_size),
                         kernel_span)) {
        panic("Kernel %s is not a loadable image", loader_config.kernel_path);
    }
    uint64_t kernel_pages = pages_for_bytes(kernel_span);
    uint64_t kernel_phys = allocate_or_die(firmware, kernel_pages, "kernel");

    uint64_t entry = 0;
    if (!elf::prepare(image, static_cast<size_t>(file_size),
                      physical<uint8_t>(firmware, kernel_phys),
                      kernel_phys | high_base, entry)) {
        panic("Kernel %s could not be prepared", loader_config.kernel_path);
    }
    firmware.free_pages(firmware.context, file_phys,
                        pages_for_bytes(file_size));
    log_message(LogLevel::Info, "Kernel: %llu pages at %016llx, entry %016llx",
                static_cast<unsigned long long>(kernel_pages),
                static_cast<unsigned long long>(kernel_phys),
                static_cast<unsigned long long>(entry));

    uint64_t stack_pages = loader_config.kernel_stack_pages;
    uint64_t stack_phys = allocate_or_die(firmware, stack_pages, "kernel stack");
    uint64_t stack_top = (stack_phys + stack_pages * kPageSize) | high_base;

    size_t segment_capacity = range_capacity * 2 + 1;
    uint64_t segment_pages =
        pages_for_bytes(segment_capacity * sizeof(MemorySegment));
    uint64_t segments_phys =
        allocate_or_die(firmware, segment_pages, "memory segments");
    auto* segments = physical<MemorySegment>(firmware, segments_phys);

    log_message(LogLevel::Info, "Exiting boot services");
    size_t final_count = 0;
    if (!firmware.exit_boot_services(firmware.context, ranges, range_capacity,
                                     final_count)) {
        panic("Failed to exit boot services");
    }
    // Boot-services text output is gone from here on.
    log_set_output(nullptr, nullptr);
    if (final_count > range_capacity) {
        panic("Final memory map has %llu descriptors, room for %llu",
              static_cast<unsigned long long>(final_count),
              static_cast<unsigned long long>(range_capacity));
    }

    size_t segment_count =
        normalize_memory_map(ranges, final_count, segments, segment_capacity);

    header->screen_buffer =
        reinterpret_cast<uint8_t*>(framebuffer.base | high_base);
    header->screen_width = framebuffer.width;
    header->screen_height = framebuffer.height;
    header->screen_scanline_width = framebuffer.scanline_width;
    header->paging_info = paging_info;
    header->paging_info.page_buffer =
        reinterpret_cast<uint64_t*>(tables_phys | high_base);
    header->memory_map =
        reinterpret_cast<MemorySegment*>(segments_phys | high_base);
    header->memory_map_entries = segment_count;
    header->high_memory_base = high_base;

    firmware.enter_kernel(firmware.context, entry, header_phys | high_base,
                          stack_top);
    panic("Kernel returned to the loader");
}

}  // namespace boot
