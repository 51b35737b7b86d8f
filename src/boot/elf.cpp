#include "boot/elf.hpp"

#include "drivers/log/logging.hpp"
#include "lib/mem.hpp"

namespace elf {

namespace {

constexpr uint8_t kElfMagic[4] = {0x7F, 'E', 'L', 'F'};

enum class ElfIdent : size_t {
    Class = 4,
    Data = 5,
    Version = 6,
};

const Elf64Phdr* program_header(const uint8_t* data,
                                const Elf64Ehdr& header,
                                uint16_t index) {
    uint64_t offset =
        header.phoff + static_cast<uint64_t>(index) * header.phentsize;
    return reinterpret_cast<const Elf64Phdr*>(data + offset);
}

bool validate_elf_header(const uint8_t* data, size_t size) {
    if (data == nullptr || size < sizeof(Elf64Ehdr)) {
        log_message(LogLevel::Error, "ELF: image too small for header");
        return false;
    }
    const auto* header = reinterpret_cast<const Elf64Ehdr*>(data);

    if (header->ident[0] != kElfMagic[0] || header->ident[1] != kElfMagic[1] ||
        header->ident[2] != kElfMagic[2] || header->ident[3] != kElfMagic[3]) {
        log_message(LogLevel::Error, "ELF: bad magic");
        return false;
    }

    if (header->ident[static_cast<size_t>(ElfIdent::Class)] != ELFCLASS64 ||
        header->ident[static_cast<size_t>(ElfIdent::Data)] != ELFDATA2LSB ||
        header->ident[static_cast<size_t>(ElfIdent::Version)] != 1) {
        log_message(LogLevel::Error, "ELF: unsupported identification");
        return false;
    }

    if (header->type != ET_EXEC && header->type != ET_DYN) {
        log_message(LogLevel::Error, "ELF: unsupported type %u",
                    static_cast<unsigned int>(header->type));
        return false;
    }

    if (header->machine != EM_X86_64 || header->version != 1) {
        log_message(LogLevel::Error, "ELF: unsupported target");
        return false;
    }

    if (header->phoff == 0 || header->phnum == 0 ||
        header->phentsize != sizeof(Elf64Phdr)) {
        log_message(LogLevel::Error, "ELF: missing program headers");
        return false;
    }

    uint64_t ph_table_end =
        header->phoff +
        static_cast<uint64_t>(header->phnum) * header->phentsize;
    if (ph_table_end > size || ph_table_end < header->phoff) {
        log_message(LogLevel::Error, "ELF: program headers exceed image");
        return false;
    }

    return true;
}

// Everything read or written here must stay inside [dest, dest + span).
bool within_image(uint64_t offset, uint64_t length, uint64_t span) {
    return offset <= span && length <= span - offset;
}

bool apply_relocations(uint8_t* dest,
                       uint64_t span,
                       uint64_t load_base,
                       const Elf64Phdr& dynamic) {
    if (!within_image(dynamic.vaddr, dynamic.memsz, span)) {
        log_message(LogLevel::Error, "ELF: dynamic table outside image");
        return false;
    }

    auto* dyn_table = reinterpret_cast<const Elf64Dyn*>(dest + dynamic.vaddr);
    size_t dyn_count = static_cast<size_t>(dynamic.memsz / sizeof(Elf64Dyn));

    uint64_t rela_addr = 0;
    uint64_t rela_size = 0;
    uint64_t rela_ent = 0;

    for (size_t i = 0; i < dyn_count; ++i) {
        int64_t tag = dyn_table[i].tag;
        if (tag == DT_NULL) {
            break;
        }
        switch (tag) {
            case DT_RELA:
                rela_addr = dyn_table[i].val;
                break;
            case DT_RELASZ:
                rela_size = dyn_table[i].val;
                break;
            case DT_RELAENT:
                rela_ent = dyn_table[i].val;
                break;
            default:
                break;
        }
    }

    if (rela_addr == 0 || rela_size == 0) {
        return true;
    }
    if (rela_ent == 0) {
        rela_ent = sizeof(Elf64Rela);
    }
    if (rela_ent < sizeof(Elf64Rela) ||
        !within_image(rela_addr, rela_size, span)) {
        log_message(LogLevel::Error, "ELF: relocation table outside image");
        return false;
    }

    size_t rela_count = static_cast<size_t>(rela_size / rela_ent);
    for (size_t i = 0; i < rela_count; ++i) {
        const auto& rela = *reinterpret_cast<const Elf64Rela*>(
            dest + rela_addr + i * rela_ent);
        uint32_t type = static_cast<uint32_t>(rela.info & 0xFFFFFFFFu);
        if (type != R_X86_64_RELATIVE) {
            log_message(LogLevel::Error, "ELF: unsupported relocation type %u",
                        type);
            return false;
        }
        if (!within_image(rela.offset, sizeof(uint64_t), span)) {
            log_message(LogLevel::Error,
                        "ELF: relocation target %p outside image",
                        reinterpret_cast<void*>(rela.offset));
            return false;
        }
        uint64_t value = load_base + static_cast<uint64_t>(rela.addend);
        memcpy(dest + rela.offset, &value, sizeof(value));
    }

    log_message(LogLevel::Debug, "ELF: applied %llu relocations",
                static_cast<unsigned long long>(rela_count));
    return true;
}

}  // namespace

bool image_size(const uint8_t* data, size_t size, uint64_t& span_out) {
    if (!validate_elf_header(data, size)) {
        return false;
    }
    const auto& header = *reinterpret_cast<const Elf64Ehdr*>(data);

    uint64_t max_vaddr = 0;
    for (uint16_t i = 0; i < header.phnum; ++i) {
        const Elf64Phdr* ph = program_header(data, header, i);
        if (ph->type != PT_LOAD || ph->memsz == 0) {
            continue;
        }
        uint64_t seg_end = ph->vaddr + ph->memsz;
        if (seg_end < ph->vaddr) {
            log_message(LogLevel::Error, "ELF: segment address overflow");
            return false;
        }
        if (seg_end > max_vaddr) {
            max_vaddr = seg_end;
        }
    }

    if (max_vaddr == 0) {
        log_message(LogLevel::Error, "ELF: no loadable segments");
        return false;
    }
    span_out = max_vaddr;
    return true;
}

bool prepare(const uint8_t* data,
             size_t size,
             uint8_t* dest,
             uint64_t load_base,
             uint64_t& entry_out) {
    uint64_t span = 0;
    if (!image_size(data, size, span)) {
        return false;
    }
    const auto& header = *reinterpret_cast<const Elf64Ehdr*>(data);

    if (header.entry >= span) {
        log_message(LogLevel::Error, "ELF: entry point %p outside image",
                    reinterpret_cast<void*>(header.entry));
        return false;
    }

    const Elf64Phdr* dynamic_phdr = nullptr;
    for (uint16_t i = 0; i < header.phnum; ++i) {
        const Elf64Phdr* ph = program_header(data, header, i);
        if (ph->type == PT_DYNAMIC) {
            dynamic_phdr = ph;
        }
        if (ph->type != PT_LOAD || ph->memsz == 0) {
            continue;
        }

        if (ph->filesz > ph->memsz) {
            log_message(LogLevel::Error, "ELF: segment filesz exceeds memsz");
            return false;
        }
        if (ph->offset + ph->filesz > size ||
            ph->offset + ph->filesz < ph->offset) {
            log_message(LogLevel::Error, "ELF: segment exceeds image size");
            return false;
        }

        uint8_t* segment = dest + ph->vaddr;
        if (ph->filesz != 0) {
            memcpy(segment, data + ph->offset, static_cast<size_t>(ph->filesz));
        }
        if (ph->memsz > ph->filesz) {
            memset(segment + ph->filesz, 0,
                   static_cast<size_t>(ph->memsz - ph->filesz));
        }
    }

    if (dynamic_phdr != nullptr &&
        !apply_relocations(dest, span, load_base, *dynamic_phdr)) {
        return false;
    }

    entry_out = load_base + header.entry;
    return true;
}

}  // namespace elf
