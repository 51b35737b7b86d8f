#pragma once

#include <stddef.h>
#include <stdint.h>

namespace elf {

enum : uint8_t {
    ELFCLASS64 = 2,
    ELFDATA2LSB = 1,
};

enum : uint16_t {
    ET_EXEC = 2,
    ET_DYN = 3,
    EM_X86_64 = 62,
};

enum : uint32_t {
    PT_LOAD = 1,
    PT_DYNAMIC = 2,
};

enum : int64_t {
    DT_NULL = 0,
    DT_RELA = 7,
    DT_RELASZ = 8,
    DT_RELAENT = 9,
};

enum : uint32_t {
    R_X86_64_64 = 1,
    R_X86_64_RELATIVE = 8,
};

struct Elf64Ehdr {
    uint8_t ident[16];
    uint16_t type;
    uint16_t machine;
    uint32_t version;
    uint64_t entry;
    uint64_t phoff;
    uint64_t shoff;
    uint32_t flags;
    uint16_t ehsize;
    uint16_t phentsize;
    uint16_t phnum;
    uint16_t shentsize;
    uint16_t shnum;
    uint16_t shstrndx;
};

struct Elf64Phdr {
    uint32_t type;
    uint32_t flags;
    uint64_t offset;
    uint64_t vaddr;
    uint64_t paddr;
    uint64_t filesz;
    uint64_t memsz;
    uint64_t align;
};

struct Elf64Dyn {
    int64_t tag;
    uint64_t val;
};

struct Elf64Rela {
    uint64_t offset;
    uint64_t info;
    int64_t addend;
};

// Bytes needed to hold every PT_LOAD segment of a kernel linked at 0.
bool image_size(const uint8_t* data, size_t size, uint64_t& span_out);

// Copies the loadable segments to `dest`, zeroes their bss tails and applies
// RELATIVE relocations as if the image ran at `load_base`. `dest` is where
// the loader can write; `load_base` is where the kernel will execute.
bool prepare(const uint8_t* data,
             size_t size,
             uint8_t* dest,
             uint64_t load_base,
             uint64_t& entry_out);

}  // namespace elf
