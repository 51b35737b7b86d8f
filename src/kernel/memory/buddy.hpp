#pragma once

#include <stddef.h>
#include <stdint.h>

#include "boot_protocol.hpp"
#include "kernel/sync/spinlock.hpp"

namespace memory {

constexpr uint64_t kPageSize = boot::kPageSize;
constexpr uint64_t kPageShift = boot::kPageShift;
constexpr uint8_t kMaxOrder = 8;

// Metadata node of one free block. It lives in storage chosen by the backend;
// for the self-hosted backend that is the first bytes of the free block, so a
// page is either a free-list node or caller-owned payload, never both.
struct FreeEntry {
    uint64_t order;
    FreeEntry* next;
    FreeEntry* prev;
};

// Where the allocator keeps its own bookkeeping. `prepare` may shrink one
// free segment in place to make room for the bitmap; `entry_at` and
// `index_of` must be inverses over [0, page_count).
struct BuddyStorage {
    bool (*prepare)(void* context,
                    boot::MemorySegment* segments,
                    size_t segment_count,
                    uint64_t page_count);
    uint64_t* (*bitmap)(void* context);
    FreeEntry* (*entry_at)(void* context, uint64_t index);
    uint64_t (*index_of)(void* context, const FreeEntry* entry);
    void* context;
};

constexpr uint64_t bitmap_words(uint64_t page_count) {
    return (page_count + 63) / 64;
}

constexpr uint64_t bitmap_pages(uint64_t page_count) {
    return (bitmap_words(page_count) * sizeof(uint64_t) + kPageSize - 1) /
           kPageSize;
}

// Smallest order whose block holds `count` pages.
uint8_t size_order(uint64_t count);

class BuddyAllocator {
public:
    void init(const BuddyStorage& storage,
              boot::MemorySegment* segments,
              size_t segment_count);

    uint64_t alloc_page();
    uint64_t alloc_linear_pages(uint64_t count);
    void alloc_pages(uint64_t* out, size_t count);

    // Addresses must come from the matching alloc call; nothing is checked.
    void free_page(uint64_t addr);
    void free_linear_pages(uint64_t addr, uint64_t count);
    void free_pages(const uint64_t* addrs, size_t count);

    uint64_t free_page_count() const;
    uint64_t max_address() const { return max_address_; }
    uint64_t page_count() const { return page_count_; }
    bool is_block_head(uint64_t index) const;
    const FreeEntry* free_list_head(uint8_t order) const;

private:
    BuddyStorage storage_{};
    uint64_t* bitmap_{nullptr};
    FreeEntry* free_lists_[kMaxOrder + 1]{};
    uint64_t page_count_{0};
    uint64_t max_address_{0};
    uint64_t free_pages_{0};
    mutable ksync::Spinlock lock_;

    void add_region(uint64_t index, uint64_t page_count);
    void free_block(uint64_t index, uint8_t order);
    uint64_t alloc_block(uint8_t order);

    void push_free(uint64_t index, uint8_t order);
    void unlink(FreeEntry* entry, uint8_t order);
    FreeEntry* entry_at(uint64_t index) const;

    bool test_bit(uint64_t index) const;
    void set_bit(uint64_t index);
    void clear_bit(uint64_t index);
};

}  // namespace memory
