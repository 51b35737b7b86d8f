#include "kernel/memory/memory.hpp"

#include "drivers/log/logging.hpp"
#include "kernel/panic.hpp"
#include "kernel/sync/spinlock.hpp"

namespace memory {

namespace {

Context g_context;
ksync::Spinlock g_init_lock;
bool g_initialized = false;

}  // namespace

Context& init(const boot::HandoffHeader& header) {
    {
        ksync::SpinlockGuard guard(g_init_lock);
        if (g_initialized) {
            panic("Memory init called twice");
        }
        g_initialized = true;
    }

    g_context.translator_ = AddressTranslator(header.high_memory_base);
    g_context.paging_info_ = header.paging_info;
    g_context.storage_ = SelfHostedStorage(g_context.translator_);
    g_context.allocator_.init(g_context.storage_.storage(),
                              header.memory_map,
                              static_cast<size_t>(header.memory_map_entries));

    log_message(LogLevel::Info,
                "Memory: base=%016llx max=%016llx free=%llu KB",
                static_cast<unsigned long long>(header.high_memory_base),
                static_cast<unsigned long long>(
                    g_context.allocator_.max_address()),
                static_cast<unsigned long long>(
                    g_context.allocator_.free_page_count() * kPageSize /
                    1024));
    return g_context;
}

uint64_t Context::release_identity_map() {
    uint64_t* pml4 = paging_info_.page_buffer;
    for (uint64_t i = 0; i < paging_info_.pml4_entries; ++i) {
        pml4[i] = 0;
    }
    log_message(LogLevel::Debug, "Released %llu identity PML4 entries",
                static_cast<unsigned long long>(paging_info_.pml4_entries));
    return translator_.physical(pml4);
}

}  // namespace memory
