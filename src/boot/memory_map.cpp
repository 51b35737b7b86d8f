#include "boot/memory_map.hpp"

#include "kernel/panic.hpp"

namespace boot {

namespace {

uint64_t range_end(const FirmwareRange& range) {
    return range.start + range.page_count * kPageSize;
}

// First descriptor boundary strictly above `cursor`, or `limit`.
uint64_t next_boundary(const FirmwareRange* ranges, size_t range_count,
                       uint64_t cursor, uint64_t limit) {
    uint64_t next = limit;
    for (size_t i = 0; i < range_count; ++i) {
        if (ranges[i].page_count == 0) {
            continue;
        }
        uint64_t start = ranges[i].start;
        uint64_t end = range_end(ranges[i]);
        if (start > cursor && start < next) {
            next = start;
        }
        if (end > cursor && end < next) {
            next = end;
        }
    }
    return next;
}

MemorySegmentState state_at(const FirmwareRange* ranges, size_t range_count,
                            uint64_t address) {
    bool covered = false;
    for (size_t i = 0; i < range_count; ++i) {
        if (ranges[i].page_count == 0 || address < ranges[i].start ||
            address >= range_end(ranges[i])) {
            continue;
        }
        if (!ranges[i].usable) {
            return MemorySegmentState::Occupied;
        }
        covered = true;
    }
    return covered ? MemorySegmentState::Free : MemorySegmentState::Occupied;
}

}  // namespace

uint64_t memory_map_end(const FirmwareRange* ranges, size_t range_count) {
    uint64_t end = 0;
    for (size_t i = 0; i < range_count; ++i) {
        uint64_t range_last = range_end(ranges[i]);
        if (range_last > end) {
            end = range_last;
        }
    }
    return end;
}

size_t normalize_memory_map(const FirmwareRange* ranges,
                            size_t range_count,
                            MemorySegment* out,
                            size_t capacity) {
    uint64_t limit = memory_map_end(ranges, range_count);
    size_t count = 0;
    uint64_t cursor = 0;

    while (cursor < limit) {
        uint64_t next = next_boundary(ranges, range_count, cursor, limit);
        MemorySegmentState state = state_at(ranges, range_count, cursor);
        uint64_t pages = (next - cursor) / kPageSize;

        if (count > 0 && out[count - 1].state == state) {
            out[count - 1].page_count += pages;
        } else {
            if (count >= capacity) {
                panic("Memory map needs more than %llu segments",
                      static_cast<unsigned long long>(capacity));
            }
            out[count++] = MemorySegment{
                .start = cursor,
                .page_count = pages,
                .state = state,
            };
        }
        cursor = next;
    }

    return count;
}

bool select_display_mode(const DisplayMode* modes,
                         size_t mode_count,
                         uint32_t max_width,
                         size_t& index_out) {
    bool found = false;
    uint32_t best_width = 0;
    for (size_t i = 0; i < mode_count; ++i) {
        const DisplayMode& mode = modes[i];
        if (mode.format != PixelFormat::Rgb &&
            mode.format != PixelFormat::Bgr) {
            continue;
        }
        if (mode.width > max_width) {
            continue;
        }
        if (!found || mode.width > best_width) {
            found = true;
            best_width = mode.width;
            index_out = i;
        }
    }
    return found;
}

}  // namespace boot
