#pragma once

#include <stddef.h>
#include <stdint.h>

#include "boot_protocol.hpp"
#include "kernel/memory/address.hpp"
#include "kernel/memory/buddy.hpp"

namespace memory {

// Keeps the buddy bookkeeping inside the memory it manages: the bitmap is
// carved from the front of the first free segment large enough to hold it,
// and the free entry of page `i` is the first bytes of that page.
class SelfHostedStorage {
public:
    SelfHostedStorage() = default;
    explicit SelfHostedStorage(AddressTranslator translator)
        : translator_(translator) {}

    BuddyStorage storage();
    uint64_t bitmap_phys() const { return bitmap_phys_; }
    uint64_t bitmap_page_count() const { return bitmap_page_count_; }

private:
    AddressTranslator translator_{};
    uint64_t bitmap_phys_ = 0;
    uint64_t bitmap_page_count_ = 0;

    static bool prepare(void* context,
                        boot::MemorySegment* segments,
                        size_t segment_count,
                        uint64_t page_count);
    static uint64_t* bitmap(void* context);
    static FreeEntry* entry_at(void* context, uint64_t index);
    static uint64_t index_of(void* context, const FreeEntry* entry);
};

}  // namespace memory
