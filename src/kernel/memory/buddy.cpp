#include "kernel/memory/buddy.hpp"

#include "drivers/log/logging.hpp"
#include "kernel/panic.hpp"

namespace memory {

namespace {

uint8_t trailing_zeros(uint64_t value) {
    if (value == 0) {
        return 64;
    }
    return static_cast<uint8_t>(__builtin_ctzll(value));
}

uint8_t floor_log2(uint64_t value) {
    return static_cast<uint8_t>(63 - __builtin_clzll(value));
}

uint8_t min_order(uint8_t a, uint8_t b) {
    return a < b ? a : b;
}

}  // namespace

uint8_t size_order(uint64_t count) {
    uint8_t order = 0;
    while (order < 63 && (1ull << order) < count) {
        ++order;
    }
    return order;
}

void BuddyAllocator::init(const BuddyStorage& storage,
                          boot::MemorySegment* segments,
                          size_t segment_count) {
    ksync::SpinlockGuard guard(lock_);

    if (segments == nullptr || segment_count == 0) {
        panic("Buddy init: empty memory map");
    }

    uint64_t max_address = 0;
    for (size_t i = 0; i < segment_count; ++i) {
        uint64_t end = segments[i].start + segments[i].page_count * kPageSize;
        if (end > max_address) {
            max_address = end;
        }
    }

    storage_ = storage;
    max_address_ = max_address;
    page_count_ = max_address / kPageSize;
    free_pages_ = 0;
    for (auto& head : free_lists_) {
        head = nullptr;
    }

    if (!storage_.prepare(storage_.context, segments, segment_count,
                          page_count_)) {
        panic("Buddy init: no free segment can hold the %llu page bitmap",
              static_cast<unsigned long long>(bitmap_pages(page_count_)));
    }

    bitmap_ = storage_.bitmap(storage_.context);
    uint64_t words = bitmap_words(page_count_);
    for (uint64_t i = 0; i < words; ++i) {
        bitmap_[i] = 0;
    }

    for (size_t i = 0; i < segment_count; ++i) {
        const boot::MemorySegment& segment = segments[i];
        if (segment.state != boot::MemorySegmentState::Free ||
            segment.page_count == 0) {
            continue;
        }
        add_region(segment.start / kPageSize, segment.page_count);
    }

    log_message(LogLevel::Debug,
                "Buddy: max_address=%016llx pages=%llu free=%llu",
                static_cast<unsigned long long>(max_address_),
                static_cast<unsigned long long>(page_count_),
                static_cast<unsigned long long>(free_pages_));
}

uint64_t BuddyAllocator::alloc_page() {
    ksync::SpinlockGuard guard(lock_);
    uint64_t index = alloc_block(0);
    --free_pages_;
    return index * kPageSize;
}

uint64_t BuddyAllocator::alloc_linear_pages(uint64_t count) {
    uint8_t order = size_order(count);
    if (order > kMaxOrder) {
        panic("Buddy: %llu linear pages exceed the largest block",
              static_cast<unsigned long long>(count));
    }

    ksync::SpinlockGuard guard(lock_);
    uint64_t index = alloc_block(order);
    free_pages_ -= 1ull << order;
    return index * kPageSize;
}

void BuddyAllocator::alloc_pages(uint64_t* out, size_t count) {
    ksync::SpinlockGuard guard(lock_);
    for (size_t i = 0; i < count; ++i) {
        out[i] = alloc_block(0) * kPageSize;
        --free_pages_;
    }
}

void BuddyAllocator::free_page(uint64_t addr) {
    ksync::SpinlockGuard guard(lock_);
    free_block(addr / kPageSize, 0);
    ++free_pages_;
}

void BuddyAllocator::free_linear_pages(uint64_t addr, uint64_t count) {
    uint8_t order = size_order(count);
    if (order > kMaxOrder) {
        panic("Buddy: %llu linear pages exceed the largest block",
              static_cast<unsigned long long>(count));
    }
    ksync::SpinlockGuard guard(lock_);
    free_block(addr / kPageSize, order);
    free_pages_ += 1ull << order;
}

void BuddyAllocator::free_pages(const uint64_t* addrs, size_t count) {
    ksync::SpinlockGuard guard(lock_);
    for (size_t i = 0; i < count; ++i) {
        free_block(addrs[i] / kPageSize, 0);
        ++free_pages_;
    }
}

uint64_t BuddyAllocator::free_page_count() const {
    ksync::SpinlockGuard guard(lock_);
    return free_pages_;
}

bool BuddyAllocator::is_block_head(uint64_t index) const {
    ksync::SpinlockGuard guard(lock_);
    return test_bit(index);
}

const FreeEntry* BuddyAllocator::free_list_head(uint8_t order) const {
    if (order > kMaxOrder) {
        return nullptr;
    }
    ksync::SpinlockGuard guard(lock_);
    return free_lists_[order];
}

// Split an arbitrary run into the largest aligned blocks it contains.
void BuddyAllocator::add_region(uint64_t index, uint64_t page_count) {
    free_pages_ += page_count;
    while (page_count > 0) {
        uint8_t order = min_order(trailing_zeros(index), floor_log2(page_count));
        order = min_order(order, kMaxOrder);
        free_block(index, order);
        index += 1ull << order;
        page_count -= 1ull << order;
    }
}

void BuddyAllocator::free_block(uint64_t index, uint8_t order) {
    uint64_t buddy = index ^ (1ull << order);

    // A set bit only says some block starts at `buddy`; it must also be
    // exactly this order to be our buddy.
    if (order < kMaxOrder && test_bit(buddy)) {
        FreeEntry* buddy_entry = entry_at(buddy);
        if (buddy_entry->order == order) {
            clear_bit(buddy);
            unlink(buddy_entry, order);
            free_block(index & ~(1ull << order), order + 1);
            return;
        }
    }

    push_free(index, order);
}

uint64_t BuddyAllocator::alloc_block(uint8_t order) {
    FreeEntry* entry = free_lists_[order];
    if (entry == nullptr) {
        if (order == kMaxOrder) {
            panic("Buddy: out of physical memory");
        }
        uint64_t index = alloc_block(order + 1);
        push_free(index ^ (1ull << order), order);
        return index;
    }

    unlink(entry, order);
    uint64_t index = storage_.index_of(storage_.context, entry);
    clear_bit(index);
    return index;
}

void BuddyAllocator::push_free(uint64_t index, uint8_t order) {
    FreeEntry* entry = entry_at(index);
    FreeEntry* head = free_lists_[order];
    entry->order = order;
    entry->prev = nullptr;
    entry->next = head;
    if (head != nullptr) {
        head->prev = entry;
    }
    free_lists_[order] = entry;
    set_bit(index);
}

void BuddyAllocator::unlink(FreeEntry* entry, uint8_t order) {
    if (entry->prev != nullptr) {
        entry->prev->next = entry->next;
    } else {
        free_lists_[order] = entry->next;
    }
    if (entry->next != nullptr) {
        entry->next->prev = entry->prev;
    }
    entry->next = nullptr;
    entry->prev = nullptr;
}

FreeEntry* BuddyAllocator::entry_at(uint64_t index) const {
    return storage_.entry_at(storage_.context, index);
}

bool BuddyAllocator::test_bit(uint64_t index) const {
    if (index >= page_count_) {
        return false;
    }
    return (bitmap_[index / 64] >> (index % 64)) & 1;
}

void BuddyAllocator::set_bit(uint64_t index) {
    bitmap_[index / 64] |= 1ull << (index % 64);
}

void BuddyAllocator::clear_bit(uint64_t index) {
    bitmap_[index / 64] &= ~(1ull << (index % 64));
}

}  // namespace memory
