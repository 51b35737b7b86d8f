#pragma once

#include <stddef.h>
#include <stdint.h>

#include "boot_protocol.hpp"
#include "kernel/memory/address.hpp"
#include "kernel/memory/buddy.hpp"
#include "kernel/memory/self_hosted_storage.hpp"

namespace memory {

// Process-wide physical memory state. Only `init` hands one out, so code that
// holds a Context& runs after the allocator is ready.
class Context {
public:
    const AddressTranslator& translator() const { return translator_; }
    BuddyAllocator& allocator() { return allocator_; }
    const boot::PagingInfo& paging_info() const { return paging_info_; }

    template <typename T>
    T* phys_to_virt(uint64_t phys) const {
        return translator_.pointer<T>(phys);
    }

    uint64_t virt_to_phys(const void* ptr) const {
        return translator_.physical(ptr);
    }

    // Clears the low-half PML4 slots of the boot tables and returns the
    // physical address of the PML4 for the caller to reload into CR3.
    uint64_t release_identity_map();

private:
    friend Context& init(const boot::HandoffHeader& header);

    AddressTranslator translator_{};
    SelfHostedStorage storage_{};
    BuddyAllocator allocator_{};
    boot::PagingInfo paging_info_{};
};

// Must be called exactly once, before anything allocates.
Context& init(const boot::HandoffHeader& header);

}  // namespace memory
