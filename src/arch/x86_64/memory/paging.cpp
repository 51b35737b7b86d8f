#include "arch/x86_64/memory/paging.hpp"

#include "arch/x86_64/registers.hpp"
#include "drivers/log/logging.hpp"

void paging_release_identity_map(memory::Context& memory) {
    uint64_t pml4_phys = memory.release_identity_map();
    cpu::write_cr3(pml4_phys);
    log_message(LogLevel::Info, "Identity map released, CR3=%016llx",
                static_cast<unsigned long long>(cpu::read_cr3()));
}
