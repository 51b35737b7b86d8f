#pragma once

#include "kernel/memory/memory.hpp"

// Points all 256 vectors at the assembly stubs, on IST1.
void idt_install(memory::Context& memory);
