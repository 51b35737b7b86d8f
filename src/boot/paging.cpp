#include "boot/paging.hpp"

#include "drivers/log/logging.hpp"
#include "kernel/panic.hpp"

namespace boot {

namespace {

constexpr uint64_t kTableBytes = kPageSize;

uint64_t pages_for_entries(uint64_t entries) {
    return (entries * sizeof(uint64_t) + kTableBytes - 1) / kTableBytes;
}

uint64_t checked_entry(uint64_t address, uint64_t mask, uint64_t flags,
                       const char* level) {
    if ((address & mask) != address) {
        panic("%s address field misaligned: %016llx", level,
              static_cast<unsigned long long>(address));
    }
    return address | flags;
}

}  // namespace

PageTableLayout compute_page_table_layout(uint64_t physical_size) {
    physical_size &= kPhysicalSizeMask;

    PageTableLayout layout{};
    layout.pml4_entries = (physical_size >> 39) + 1;
    layout.pdp_entries = (physical_size >> 30) + 1;
    layout.pd_entries = (physical_size >> 21) + 1;
    layout.pml4_pages = pages_for_entries(layout.pml4_entries);
    layout.pdp_pages = pages_for_entries(layout.pdp_entries);
    layout.pd_pages = pages_for_entries(layout.pd_entries);

    if (layout.pml4_pages != 1) {
        panic("PML4 larger than one page (%llu pages)",
              static_cast<unsigned long long>(layout.pml4_pages));
    }
    return layout;
}

PagingInfo build_page_tables(const PageTableLayout& layout,
                             uint64_t* tables,
                             uint64_t tables_phys) {
    uint64_t words = layout.total_pages() * kEntriesPerTable;
    for (uint64_t i = 0; i < words; ++i) {
        tables[i] = 0;
    }

    uint64_t pdpt_base = layout.pml4_pages;
    uint64_t pd_base = layout.pml4_pages + layout.pdp_pages;
    uint64_t n = layout.pml4_entries;

    for (uint64_t i = 0; i < n; ++i) {
        uint64_t address = tables_phys + kPageSize * (pdpt_base + i);
        uint64_t entry = checked_entry(address, kPml4AddressMask,
                                       kPageEntryPresent | kPageEntryWritable,
                                       "PML4");
        tables[i] = entry;
        tables[kEntriesPerTable - n + i] = entry;
    }

    uint64_t* pdpt = tables + pdpt_base * kEntriesPerTable;
    for (uint64_t j = 0; j < layout.pdp_entries; ++j) {
        uint64_t address = tables_phys + kPageSize * (pd_base + j);
        pdpt[j] = checked_entry(address, kPdpeAddressMask,
                                kPageEntryPresent | kPageEntryWritable,
                                "PDP");
    }

    uint64_t* pd = tables + pd_base * kEntriesPerTable;
    for (uint64_t k = 0; k < layout.pd_entries; ++k) {
        pd[k] = checked_entry(k << 21, kPdeAddressMask,
                              kPageEntryPresent | kPageEntryWritable |
                                  kPageEntryLarge,
                              "PD");
    }

    log_message(LogLevel::Info,
                "Page tables: pml4=%llu pdp=%llu pd=%llu pages, high base %016llx",
                static_cast<unsigned long long>(layout.pml4_pages),
                static_cast<unsigned long long>(layout.pdp_pages),
                static_cast<unsigned long long>(layout.pd_pages),
                static_cast<unsigned long long>(high_memory_base(n)));

    return PagingInfo{
        .page_buffer = tables,
        .pdp_pages = layout.pdp_pages,
        .pd_pages = layout.pd_pages,
        .pml4_entries = n,
    };
}

}  // namespace boot
