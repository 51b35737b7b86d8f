#include "kernel/memory/self_hosted_storage.hpp"

#include "drivers/log/logging.hpp"

namespace memory {

BuddyStorage SelfHostedStorage::storage() {
    return BuddyStorage{
        .prepare = &SelfHostedStorage::prepare,
        .bitmap = &SelfHostedStorage::bitmap,
        .entry_at = &SelfHostedStorage::entry_at,
        .index_of = &SelfHostedStorage::index_of,
        .context = this,
    };
}

bool SelfHostedStorage::prepare(void* context,
                                boot::MemorySegment* segments,
                                size_t segment_count,
                                uint64_t page_count) {
    auto* self = static_cast<SelfHostedStorage*>(context);
    uint64_t needed = bitmap_pages(page_count);

    for (size_t i = 0; i < segment_count; ++i) {
        boot::MemorySegment& segment = segments[i];
        if (segment.state != boot::MemorySegmentState::Free ||
            segment.page_count < needed) {
            continue;
        }

        self->bitmap_phys_ = segment.start;
        self->bitmap_page_count_ = needed;
        segment.start += needed * kPageSize;
        segment.page_count -= needed;

        log_message(LogLevel::Debug,
                    "Buddy bitmap: phys=%016llx pages=%llu",
                    static_cast<unsigned long long>(self->bitmap_phys_),
                    static_cast<unsigned long long>(needed));
        return true;
    }
    return false;
}

uint64_t* SelfHostedStorage::bitmap(void* context) {
    auto* self = static_cast<SelfHostedStorage*>(context);
    return self->translator_.pointer<uint64_t>(self->bitmap_phys_);
}

FreeEntry* SelfHostedStorage::entry_at(void* context, uint64_t index) {
    auto* self = static_cast<SelfHostedStorage*>(context);
    return self->translator_.pointer<FreeEntry>(index * kPageSize);
}

uint64_t SelfHostedStorage::index_of(void* context, const FreeEntry* entry) {
    auto* self = static_cast<SelfHostedStorage*>(context);
    return self->translator_.physical(entry) / kPageSize;
}

}  // namespace memory
