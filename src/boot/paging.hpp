#pragma once

#include <stdint.h>

#include "boot_protocol.hpp"

namespace boot {

constexpr uint64_t kPageEntryPresent = 1ull << 0;
constexpr uint64_t kPageEntryWritable = 1ull << 1;
constexpr uint64_t kPageEntryLarge = 1ull << 7;

constexpr uint64_t kPml4AddressMask = 0x000FFFFFFFFFF000ull;
constexpr uint64_t kPdpeAddressMask = 0x000FFFFFFFFFF000ull;
constexpr uint64_t kPdeAddressMask = 0x000FFFFFFFE00000ull;

constexpr uint64_t kPhysicalSizeMask = 0x00007FFFFFFFFFFFull;
constexpr uint64_t kEntriesPerTable = 512;

struct PageTableLayout {
    uint64_t pml4_entries;
    uint64_t pdp_entries;
    uint64_t pd_entries;
    uint64_t pml4_pages;
    uint64_t pdp_pages;
    uint64_t pd_pages;

    uint64_t total_pages() const { return pml4_pages + pdp_pages + pd_pages; }
};

// Sizes an identity map of [0, physical_size) built from 2 MiB pages. Bits
// above the 47-bit canonical low half are dropped first.
PageTableLayout compute_page_table_layout(uint64_t physical_size);

constexpr uint64_t high_memory_base(uint64_t pml4_entries) {
    return 0xFFFF000000000000ull |
           ((kEntriesPerTable - pml4_entries) << 39);
}

// Fills `tables` (total_pages() pages, physically at `tables_phys`) with the
// identity map, mirrored into the top `pml4_entries` PML4 slots. The returned
// info points at `tables` as given.
PagingInfo build_page_tables(const PageTableLayout& layout,
                             uint64_t* tables,
                             uint64_t tables_phys);

}  // namespace boot
