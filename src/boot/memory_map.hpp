#pragma once

#include <stddef.h>
#include <stdint.h>

#include "boot/firmware.hpp"
#include "boot_protocol.hpp"

namespace boot {

// Turns firmware descriptors (any order, possibly overlapping, possibly with
// gaps) into segments that tile [0, highest end) in address order. Gaps and
// anything claimed as not usable by any descriptor become Occupied; equal
// neighbours are merged. Returns the number of segments written.
size_t normalize_memory_map(const FirmwareRange* ranges,
                            size_t range_count,
                            MemorySegment* out,
                            size_t capacity);

uint64_t memory_map_end(const FirmwareRange* ranges, size_t range_count);

// Widest RGB/BGR mode no wider than `max_width`; the first one wins a tie.
// Returns false when no mode qualifies.
bool select_display_mode(const DisplayMode* modes,
                         size_t mode_count,
                         uint32_t max_width,
                         size_t& index_out);

}  // namespace boot
