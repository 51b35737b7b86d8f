#pragma once
#include <stdint.h>

#include "kernel/memory/memory.hpp"

// Drops the loader's low-half identity map and flushes the TLB. Only the
// high-half mirror stays usable afterwards.
void paging_release_identity_map(memory::Context& memory);
