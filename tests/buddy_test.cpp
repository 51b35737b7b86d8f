#include <assert.h>
#include <stdio.h>

#include <algorithm>
#include <vector>

#include "kernel/memory/buddy.hpp"
#include "support/buffer_storage.hpp"
#include "support/fatal.hpp"

using boot::MemorySegment;
using boot::MemorySegmentState;
using memory::BuddyAllocator;
using memory::FreeEntry;
using memory::kMaxOrder;
using memory::kPageSize;

namespace {

constexpr MemorySegmentState kFree = MemorySegmentState::Free;
constexpr MemorySegmentState kOccupied = MemorySegmentState::Occupied;

MemorySegment pages(uint64_t first, uint64_t count, MemorySegmentState state) {
    return MemorySegment{first * kPageSize, count, state};
}

struct Fixture {
    test_support::BufferStorage storage;
    BuddyAllocator allocator;

    void init(std::vector<MemorySegment> segments) {
        allocator.init(storage.storage(), segments.data(), segments.size());
    }

    uint64_t index_of(const FreeEntry* entry) const {
        return static_cast<uint64_t>(entry - storage.entries().data());
    }

    size_t list_length(uint8_t order) const {
        size_t length = 0;
        for (const FreeEntry* e = allocator.free_list_head(order); e != nullptr;
             e = e->next) {
            ++length;
        }
        return length;
    }

    bool all_lists_empty() const {
        for (uint8_t order = 0; order <= kMaxOrder; ++order) {
            if (allocator.free_list_head(order) != nullptr) {
                return false;
            }
        }
        return true;
    }
};

void test_size_order() {
    assert(memory::size_order(1) == 0);
    assert(memory::size_order(2) == 1);
    assert(memory::size_order(3) == 2);
    assert(memory::size_order(4) == 2);
    assert(memory::size_order(13) == 4);
    assert(memory::size_order(256) == 8);
    assert(memory::size_order(257) == 9);

    for (uint64_t count = 1; count <= 4096; ++count) {
        uint8_t order = memory::size_order(count);
        assert((1ull << order) >= count);
        assert(order == 0 || (1ull << (order - 1)) < count);
    }
}

void test_init_clears_bitmap_and_tracks_max_address() {
    Fixture f;
    f.init({pages(0, 8, kOccupied), pages(8, 8, kFree)});
    assert(f.allocator.max_address() == 16 * kPageSize);
    assert(f.allocator.page_count() == 16);
    assert(f.allocator.free_page_count() == 8);
    for (uint64_t i = 0; i < 16; ++i) {
        assert(f.allocator.is_block_head(i) == (i == 8));
    }
    assert(f.list_length(3) == 1);
    assert(f.index_of(f.allocator.free_list_head(3)) == 8);
}

void test_empty_map_is_fatal() {
    Fixture f;
    assert(test_support::raises_fatal([&] { f.init({}); }));
}

void test_free_sets_single_head() {
    Fixture f;
    f.init({pages(0, 4, kOccupied)});
    assert(f.all_lists_empty());

    f.allocator.free_page(2 * kPageSize);

    assert(f.allocator.is_block_head(2));
    assert(!f.allocator.is_block_head(3));
    const FreeEntry* head = f.allocator.free_list_head(0);
    assert(head != nullptr);
    assert(f.index_of(head) == 2);
    assert(head->order == 0);
    assert(head->next == nullptr);
    assert(head->prev == nullptr);
    assert(f.list_length(0) == 1);
    for (uint8_t order = 1; order <= kMaxOrder; ++order) {
        assert(f.allocator.free_list_head(order) == nullptr);
    }
}

void check_merged_pair_at_six(Fixture& f) {
    assert(!f.allocator.is_block_head(7));
    assert(f.allocator.is_block_head(6));
    assert(f.allocator.free_list_head(0) == nullptr);
    assert(f.list_length(1) == 1);
    const FreeEntry* head = f.allocator.free_list_head(1);
    assert(f.index_of(head) == 6);
    assert(head->order == 1);
}

void test_forward_merge() {
    Fixture f;
    f.init({pages(0, 8, kOccupied)});
    f.allocator.free_page(6 * kPageSize);
    f.allocator.free_page(7 * kPageSize);
    check_merged_pair_at_six(f);
}

void test_backward_merge() {
    Fixture f;
    f.init({pages(0, 8, kOccupied)});
    f.allocator.free_page(7 * kPageSize);
    f.allocator.free_page(6 * kPageSize);
    check_merged_pair_at_six(f);
}

void test_merge_cascades_up() {
    Fixture f;
    f.init({pages(0, 8, kOccupied)});
    for (uint64_t i = 4; i < 8; ++i) {
        f.allocator.free_page(i * kPageSize);
    }
    assert(f.list_length(2) == 1);
    assert(f.index_of(f.allocator.free_list_head(2)) == 4);
    assert(f.list_length(0) == 0);
    assert(f.list_length(1) == 0);
}

void test_no_cross_order_merge() {
    Fixture f;
    f.init({pages(0, 1, kFree), pages(1, 3, kOccupied)});
    assert(f.allocator.is_block_head(0));

    f.allocator.free_linear_pages(2 * kPageSize, 2);

    assert(f.allocator.is_block_head(0));
    assert(f.allocator.is_block_head(2));
    assert(f.list_length(0) == 1);
    assert(f.index_of(f.allocator.free_list_head(0)) == 0);
    assert(f.list_length(1) == 1);
    assert(f.index_of(f.allocator.free_list_head(1)) == 2);
    assert(f.allocator.free_list_head(2) == nullptr);
}

void test_max_order_cap() {
    constexpr uint64_t kMaxBlock = 1ull << kMaxOrder;
    Fixture f;
    f.init({pages(0, 2 * kMaxBlock, kFree)});

    assert(f.list_length(kMaxOrder) == 2);
    const FreeEntry* first = f.allocator.free_list_head(kMaxOrder);
    assert(first->prev == nullptr);
    assert(first->next != nullptr);
    assert(first->next->prev == first);
    assert(first->next->next == nullptr);

    uint64_t a = f.index_of(first);
    uint64_t b = f.index_of(first->next);
    assert(std::min(a, b) == 0 && std::max(a, b) == kMaxBlock);
    for (uint8_t order = 0; order < kMaxOrder; ++order) {
        assert(f.allocator.free_list_head(order) == nullptr);
    }
}

void test_alloc_splits_two_page_region() {
    Fixture f;
    f.init({pages(0, 2, kFree)});
    assert(f.list_length(1) == 1);

    assert(f.allocator.alloc_page() == 0);
    assert(f.list_length(0) == 1);
    assert(f.index_of(f.allocator.free_list_head(0)) == 1);
    assert(f.allocator.free_list_head(1) == nullptr);
    assert(!f.allocator.is_block_head(0));
    assert(f.allocator.is_block_head(1));
}

void test_alloc_from_single_page_region() {
    Fixture f;
    f.init({pages(0, 1, kFree)});
    assert(f.allocator.alloc_page() == 0);
    assert(f.all_lists_empty());
    assert(f.allocator.free_page_count() == 0);
}

void test_out_of_memory_is_fatal() {
    Fixture f;
    f.init({pages(0, 1, kFree), pages(1, 7, kOccupied)});
    assert(f.allocator.alloc_page() == 0);
    std::string message;
    assert(test_support::raises_fatal([&] { f.allocator.alloc_page(); },
                                      &message));
    assert(message.find("out of physical memory") != std::string::npos);
}

void test_region_ingestion_combines_aligned_neighbours() {
    Fixture f;
    f.init({pages(0, 68, kOccupied), pages(68, 2, kFree), pages(70, 2, kFree)});
    assert(f.list_length(2) == 1);
    assert(f.index_of(f.allocator.free_list_head(2)) == 68);
    assert(f.list_length(1) == 0);
    assert(f.list_length(0) == 0);
}

void test_region_ingestion_keeps_odd_neighbour_apart() {
    Fixture f;
    f.init({pages(0, 68, kOccupied), pages(68, 2, kFree), pages(70, 1, kFree)});
    assert(f.list_length(1) == 1);
    assert(f.index_of(f.allocator.free_list_head(1)) == 68);
    assert(f.list_length(0) == 1);
    assert(f.index_of(f.allocator.free_list_head(0)) == 70);
    assert(f.allocator.free_list_head(2) == nullptr);
}

void test_unaligned_region_decomposition() {
    // [3, 20): 3 | 4-7 | 8-15 | 16-19
    Fixture f;
    f.init({pages(0, 3, kOccupied), pages(3, 17, kFree)});
    assert(f.list_length(0) == 1);
    assert(f.index_of(f.allocator.free_list_head(0)) == 3);
    assert(f.list_length(2) == 2);
    assert(f.list_length(3) == 1);
    assert(f.index_of(f.allocator.free_list_head(3)) == 8);
    assert(f.allocator.free_page_count() == 17);
}

void test_linear_allocation_is_aligned_and_rounded() {
    Fixture f;
    f.init({pages(0, 64, kFree)});

    uint64_t block = f.allocator.alloc_linear_pages(3);
    assert(block % (4 * kPageSize) == 0);
    assert(f.allocator.free_page_count() == 60);

    uint64_t big = f.allocator.alloc_linear_pages(16);
    assert(big % (16 * kPageSize) == 0);
    assert(big / kPageSize + 16 <= 64);
    assert(block / kPageSize + 4 <= big / kPageSize ||
           big / kPageSize + 16 <= block / kPageSize);

    f.allocator.free_linear_pages(block, 3);
    f.allocator.free_linear_pages(big, 16);
    assert(f.allocator.free_page_count() == 64);
    assert(f.list_length(6) == 1);
    assert(f.index_of(f.allocator.free_list_head(6)) == 0);
}

void test_linear_allocation_above_max_order_is_fatal() {
    Fixture f;
    f.init({pages(0, 1024, kFree)});
    assert(test_support::raises_fatal(
        [&] { f.allocator.alloc_linear_pages((1ull << kMaxOrder) + 1); }));
    assert(f.allocator.free_page_count() == 1024);
}

void test_linear_free_above_max_order_is_fatal() {
    Fixture f;
    f.init({pages(0, 1024, kOccupied)});
    std::string message;
    assert(test_support::raises_fatal(
        [&] { f.allocator.free_linear_pages(0, (1ull << kMaxOrder) + 1); },
        &message));
    assert(message.find("exceed the largest block") != std::string::npos);
    assert(f.allocator.free_page_count() == 0);
    assert(f.all_lists_empty());
}

void test_alloc_pages_batch() {
    Fixture f;
    f.init({pages(0, 16, kFree)});

    uint64_t addrs[5] = {};
    f.allocator.alloc_pages(addrs, 5);
    for (size_t i = 0; i < 5; ++i) {
        assert(addrs[i] % kPageSize == 0);
        assert(addrs[i] < 16 * kPageSize);
        for (size_t j = 0; j < i; ++j) {
            assert(addrs[i] != addrs[j]);
        }
    }
    assert(f.allocator.free_page_count() == 11);

    f.allocator.free_pages(addrs, 5);
    assert(f.allocator.free_page_count() == 16);
    assert(f.list_length(4) == 1);
    assert(f.list_length(0) == 0);
}

void test_lifo_reuse() {
    Fixture f;
    f.init({pages(0, 8, kOccupied)});
    f.allocator.free_page(1 * kPageSize);
    f.allocator.free_page(3 * kPageSize);
    f.allocator.free_page(5 * kPageSize);
    assert(f.allocator.alloc_page() == 5 * kPageSize);
    assert(f.allocator.alloc_page() == 3 * kPageSize);
    assert(f.allocator.alloc_page() == 1 * kPageSize);
}

void test_full_cycle_restores_state() {
    Fixture f;
    f.init({pages(0, 1, kOccupied), pages(1, 299, kFree)});
    uint64_t initial = f.allocator.free_page_count();

    std::vector<uint64_t> taken;
    for (int i = 0; i < 40; ++i) {
        taken.push_back(f.allocator.alloc_page());
    }
    uint64_t linear = f.allocator.alloc_linear_pages(32);
    f.allocator.free_linear_pages(linear, 32);
    std::reverse(taken.begin(), taken.end());
    for (size_t i = 0; i < taken.size(); i += 2) {
        f.allocator.free_page(taken[i]);
    }
    for (size_t i = 1; i < taken.size(); i += 2) {
        f.allocator.free_page(taken[i]);
    }

    assert(f.allocator.free_page_count() == initial);
    Fixture fresh;
    fresh.init({pages(0, 1, kOccupied), pages(1, 299, kFree)});
    for (uint8_t order = 0; order <= kMaxOrder; ++order) {
        assert(f.list_length(order) == fresh.list_length(order));
    }
    for (uint64_t i = 0; i < 300; ++i) {
        assert(f.allocator.is_block_head(i) == fresh.allocator.is_block_head(i));
    }
}

}  // namespace

int main() {
    test_size_order();
    test_init_clears_bitmap_and_tracks_max_address();
    test_empty_map_is_fatal();
    test_free_sets_single_head();
    test_forward_merge();
    test_backward_merge();
    test_merge_cascades_up();
    test_no_cross_order_merge();
    test_max_order_cap();
    test_alloc_splits_two_page_region();
    test_alloc_from_single_page_region();
    test_out_of_memory_is_fatal();
    test_region_ingestion_combines_aligned_neighbours();
    test_region_ingestion_keeps_odd_neighbour_apart();
    test_unaligned_region_decomposition();
    test_linear_allocation_is_aligned_and_rounded();
    test_linear_allocation_above_max_order_is_fatal();
    test_linear_free_above_max_order_is_fatal();
    test_alloc_pages_batch();
    test_lifo_reuse();
    test_full_cycle_restores_state();
    puts("buddy_test: ok");
    return 0;
}
