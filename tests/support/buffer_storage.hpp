#pragma once

#include <stddef.h>
#include <stdint.h>

#include <vector>

#include "kernel/memory/buddy.hpp"

namespace test_support {

// Buddy bookkeeping in ordinary heap buffers, indexed by page number. Never
// touches the segments it is given.
class BufferStorage {
public:
    memory::BuddyStorage storage();

    const std::vector<memory::FreeEntry>& entries() const { return entries_; }
    size_t prepare_calls() const { return prepare_calls_; }

private:
    std::vector<uint64_t> bitmap_;
    std::vector<memory::FreeEntry> entries_;
    size_t prepare_calls_ = 0;

    static bool prepare(void* context,
                        boot::MemorySegment* segments,
                        size_t segment_count,
                        uint64_t page_count);
    static uint64_t* bitmap(void* context);
    static memory::FreeEntry* entry_at(void* context, uint64_t index);
    static uint64_t index_of(void* context, const memory::FreeEntry* entry);
};

}  // namespace test_support
