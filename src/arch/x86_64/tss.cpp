#include "tss.hpp"
#include "drivers/log/logging.hpp"
#include "lib/mem.hpp"

TSS tss __attribute__((aligned(16)));

void init_tss(memory::Context& memory, TSS& tss_obj) {
    memset(&tss_obj, 0, sizeof(TSS));

    uint64_t stack = memory.allocator().alloc_linear_pages(kInterruptStackPages);
    uint64_t stack_top = memory.translator().phys_to_virt(
        stack + kInterruptStackPages * memory::kPageSize);
    tss_obj.ist1 = stack_top & ~0xFULL;
    tss_obj.iomap_base = sizeof(TSS);

    log_message(LogLevel::Debug, "TSS: IST1 top %016llx",
                static_cast<unsigned long long>(tss_obj.ist1));
}
