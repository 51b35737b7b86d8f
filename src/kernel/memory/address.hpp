#pragma once

#include <stdint.h>

namespace memory {

// Physical/virtual translation for the mirrored high half. The base only has
// bits above the highest physical address, so OR and AND-NOT are exact.
class AddressTranslator {
public:
    constexpr AddressTranslator() = default;
    explicit constexpr AddressTranslator(uint64_t base) : base_(base) {}

    constexpr uint64_t base() const { return base_; }

    constexpr uint64_t phys_to_virt(uint64_t phys) const {
        return phys | base_;
    }

    constexpr uint64_t virt_to_phys(uint64_t virt) const {
        return virt & ~base_;
    }

    template <typename T>
    T* pointer(uint64_t phys) const {
        return reinterpret_cast<T*>(phys_to_virt(phys));
    }

    uint64_t physical(const void* ptr) const {
        return virt_to_phys(reinterpret_cast<uint64_t>(ptr));
    }

private:
    uint64_t base_ = 0;
};

}  // namespace memory
