#pragma once

#include <stddef.h>
#include <stdint.h>

// Binary contract between the loader and the kernel. Both sides are built
// from this header, so field order and widths must not change.

namespace boot {

constexpr uint64_t kPageSize = 0x1000;
constexpr uint64_t kPageShift = 12;

enum class MemorySegmentState : uint32_t {
    Free = 0,
    Occupied = 1,
};

struct MemorySegment {
    uint64_t start;       // physical address
    uint64_t page_count;  // number of 4 KiB pages
    MemorySegmentState state;
};

// Bootstrap page table built by the loader. The buffer holds the PML4 page,
// then `pdp_pages` PDPT pages, then `pd_pages` page directories.
struct PagingInfo {
    uint64_t* page_buffer;
    uint64_t pdp_pages;
    uint64_t pd_pages;
    uint64_t pml4_entries;
};

struct HandoffHeader {
    uint8_t* screen_buffer;
    uint32_t screen_width;
    uint32_t screen_height;
    uint32_t screen_scanline_width;

    PagingInfo paging_info;

    MemorySegment* memory_map;
    uint64_t memory_map_entries;

    // OR-mask turning a physical address into its high-half alias.
    uint64_t high_memory_base;
};

static_assert(sizeof(MemorySegment) == 24, "MemorySegment layout changed");
static_assert(offsetof(HandoffHeader, screen_width) == 8,
              "HandoffHeader layout changed");
static_assert(offsetof(HandoffHeader, paging_info) == 24,
              "HandoffHeader layout changed");
static_assert(offsetof(HandoffHeader, memory_map) == 56,
              "HandoffHeader layout changed");
static_assert(offsetof(HandoffHeader, high_memory_base) == 72,
              "HandoffHeader layout changed");
static_assert(sizeof(HandoffHeader) == 80, "HandoffHeader layout changed");

}  // namespace boot
