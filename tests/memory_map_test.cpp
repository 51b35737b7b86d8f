#include <assert.h>
#include <stdio.h>

#include <vector>

#include "boot/memory_map.hpp"
#include "support/fatal.hpp"

using boot::DisplayMode;
using boot::FirmwareRange;
using boot::MemorySegment;
using boot::MemorySegmentState;
using boot::PixelFormat;

namespace {

constexpr uint64_t kPage = boot::kPageSize;
constexpr MemorySegmentState kFree = MemorySegmentState::Free;
constexpr MemorySegmentState kOccupied = MemorySegmentState::Occupied;

FirmwareRange range(uint64_t first_page, uint64_t pages, bool usable) {
    return FirmwareRange{first_page * kPage, pages, usable};
}

std::vector<MemorySegment> normalize(const std::vector<FirmwareRange>& ranges,
                                     size_t capacity = 64) {
    std::vector<MemorySegment> out(capacity);
    size_t count = boot::normalize_memory_map(ranges.data(), ranges.size(),
                                              out.data(), out.size());
    out.resize(count);
    return out;
}

void expect(const MemorySegment& segment, uint64_t first_page, uint64_t pages,
            MemorySegmentState state) {
    assert(segment.start == first_page * kPage);
    assert(segment.page_count == pages);
    assert(segment.state == state);
}

void test_sorted_and_coalesced() {
    auto out = normalize({
        range(16, 16, true),
        range(0, 8, true),
        range(8, 8, true),
        range(32, 4, false),
        range(36, 4, false),
    });
    assert(out.size() == 2);
    expect(out[0], 0, 32, kFree);
    expect(out[1], 32, 8, kOccupied);
}

void test_holes_become_occupied() {
    auto out = normalize({range(4, 4, true), range(12, 4, true)});
    assert(out.size() == 4);
    expect(out[0], 0, 4, kOccupied);
    expect(out[1], 4, 4, kFree);
    expect(out[2], 8, 4, kOccupied);
    expect(out[3], 12, 4, kFree);
}

void test_hole_merges_with_occupied_neighbour() {
    auto out = normalize({range(0, 4, false), range(8, 4, true)});
    assert(out.size() == 2);
    expect(out[0], 0, 8, kOccupied);
    expect(out[1], 8, 4, kFree);
}

void test_overlap_prefers_occupied() {
    auto out = normalize({range(0, 16, true), range(4, 2, false)});
    assert(out.size() == 3);
    expect(out[0], 0, 4, kFree);
    expect(out[1], 4, 2, kOccupied);
    expect(out[2], 6, 10, kFree);

    auto reversed = normalize({range(4, 2, false), range(0, 16, true)});
    assert(reversed.size() == 3);
    expect(reversed[1], 4, 2, kOccupied);
}

void test_segments_tile_address_space() {
    auto out = normalize({
        range(100, 3, true),
        range(7, 20, false),
        range(40, 1, true),
        range(41, 9, true),
        range(0, 2, true),
    });
    uint64_t cursor = 0;
    for (size_t i = 0; i < out.size(); ++i) {
        assert(out[i].start == cursor);
        assert(out[i].page_count > 0);
        if (i > 0) {
            assert(out[i].state != out[i - 1].state);
        }
        cursor += out[i].page_count * kPage;
    }
    assert(cursor == 103 * kPage);
}

void test_empty_ranges_are_ignored() {
    auto out = normalize({range(0, 4, true), range(2, 0, false)});
    assert(out.size() == 1);
    expect(out[0], 0, 4, kFree);
    assert(normalize({}).empty());
}

void test_capacity_overflow_is_fatal() {
    std::vector<FirmwareRange> ranges = {range(0, 1, true), range(1, 1, false),
                                         range(2, 1, true)};
    assert(test_support::raises_fatal([&] { normalize(ranges, 2); }));
    assert(normalize(ranges, 3).size() == 3);
}

void test_memory_map_end() {
    std::vector<FirmwareRange> ranges = {range(10, 2, true), range(3, 1, false)};
    assert(boot::memory_map_end(ranges.data(), ranges.size()) == 12 * kPage);
}

DisplayMode mode(uint32_t width, PixelFormat format) {
    return DisplayMode{width, width * 3 / 4, width, format};
}

void test_display_picks_widest_allowed() {
    std::vector<DisplayMode> modes = {
        mode(800, PixelFormat::Rgb),   mode(2560, PixelFormat::Bgr),
        mode(1280, PixelFormat::Bgr),  mode(1920, PixelFormat::Bitmask),
        mode(1600, PixelFormat::Rgb),  mode(1024, PixelFormat::BltOnly),
    };
    size_t index = 99;
    assert(boot::select_display_mode(modes.data(), modes.size(), 1920, index));
    assert(index == 4);

    assert(boot::select_display_mode(modes.data(), modes.size(), 4096, index));
    assert(index == 1);
}

void test_display_tie_keeps_first() {
    std::vector<DisplayMode> modes = {
        mode(1024, PixelFormat::Rgb),
        DisplayMode{1280, 720, 1280, PixelFormat::Bgr},
        DisplayMode{1280, 1024, 1280, PixelFormat::Rgb},
    };
    size_t index = 0;
    assert(boot::select_display_mode(modes.data(), modes.size(), 1920, index));
    assert(index == 1);
}

void test_display_without_candidate() {
    std::vector<DisplayMode> modes = {mode(2560, PixelFormat::Rgb),
                                      mode(800, PixelFormat::BltOnly)};
    size_t index = 7;
    assert(!boot::select_display_mode(modes.data(), modes.size(), 1920, index));
    assert(index == 7);
    assert(!boot::select_display_mode(nullptr, 0, 1920, index));
}

}  // namespace

int main() {
    test_sorted_and_coalesced();
    test_holes_become_occupied();
    test_hole_merges_with_occupied_neighbour();
    test_overlap_prefers_occupied();
    test_segments_tile_address_space();
    test_empty_ranges_are_ignored();
    test_capacity_overflow_is_fatal();
    test_memory_map_end();
    test_display_picks_widest_allowed();
    test_display_tie_keeps_first();
    test_display_without_candidate();
    puts("memory_map_test: ok");
    return 0;
}
