#pragma once

// Unrecoverable condition. Each image links its own implementation: the
// kernel halts the CPU, the loader spins after reporting through firmware
// text output.
[[noreturn]] void panic(const char* fmt, ...);
