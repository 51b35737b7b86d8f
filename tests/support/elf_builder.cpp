#include "support/elf_builder.hpp"

#include <string.h>

#include "boot/elf.hpp"

namespace test_support {

namespace {

template <typename T>
void put(std::vector<uint8_t>& image, uint64_t offset, const T& value) {
    memcpy(image.data() + offset, &value, sizeof(T));
}

}  // namespace

std::vector<uint8_t> build_kernel_image(
    const std::vector<TestRelocation>& relocations,
    uint64_t bss_size,
    uint64_t entry) {
    std::vector<uint8_t> image(kImageFileSize, kImageFillByte);

    elf::Elf64Ehdr header{};
    header.ident[0] = 0x7F;
    header.ident[1] = 'E';
    header.ident[2] = 'L';
    header.ident[3] = 'F';
    header.ident[4] = elf::ELFCLASS64;
    header.ident[5] = elf::ELFDATA2LSB;
    header.ident[6] = 1;
    header.type = elf::ET_DYN;
    header.machine = elf::EM_X86_64;
    header.version = 1;
    header.entry = entry;
    header.phoff = sizeof(elf::Elf64Ehdr);
    header.ehsize = sizeof(elf::Elf64Ehdr);
    header.phentsize = sizeof(elf::Elf64Phdr);
    header.phnum = 2;
    put(image, 0, header);

    elf::Elf64Phdr load{};
    load.type = elf::PT_LOAD;
    load.flags = 7;
    load.offset = 0;
    load.vaddr = 0;
    load.filesz = kImageFileSize;
    load.memsz = kImageFileSize + bss_size;
    load.align = 0x1000;
    put(image, header.phoff, load);

    const elf::Elf64Dyn dynamic[] = {
        {elf::DT_RELA, kImageRelaOffset},
        {elf::DT_RELASZ, relocations.size() * sizeof(elf::Elf64Rela)},
        {elf::DT_RELAENT, sizeof(elf::Elf64Rela)},
        {elf::DT_NULL, 0},
    };

    elf::Elf64Phdr dyn{};
    dyn.type = elf::PT_DYNAMIC;
    dyn.flags = 6;
    dyn.offset = kImageDynamicOffset;
    dyn.vaddr = kImageDynamicOffset;
    dyn.filesz = sizeof(dynamic);
    dyn.memsz = sizeof(dynamic);
    dyn.align = 8;
    put(image, header.phoff + sizeof(elf::Elf64Phdr), dyn);

    memset(image.data() + kImageCodeOffset, kImageCodeByte,
           kImageDataOffset - kImageCodeOffset);
    put(image, kImageDynamicOffset, dynamic);

    for (size_t i = 0; i < relocations.size(); ++i) {
        elf::Elf64Rela rela{};
        rela.offset = relocations[i].offset;
        rela.info = relocations[i].type;
        rela.addend = relocations[i].addend;
        put(image, kImageRelaOffset + i * sizeof(elf::Elf64Rela), rela);
    }

    return image;
}

}  // namespace test_support
