//
// Address rounding shared by every heap strategy
//

#ifndef HERON_POINTERARITHMETIC_H
#define HERON_POINTERARITHMETIC_H

#include <stddef.h>
#include <stdint.h>

namespace LibHeap{
    template <bool Power2Alignment>
    constexpr uintptr_t alignDown(uintptr_t addr, const size_t alignment) {
        if (Power2Alignment) {
            addr &= ~(alignment - 1);
        }
        else {
            addr -= addr % alignment;
        }
        return addr;
    }

    //Wraps around if addr is within alignment - 1 bytes of the top of the address space; callers that care use
    //checkedAlignUp
    template <bool Power2Alignment>
    constexpr uintptr_t alignUp(const uintptr_t addr, const size_t alignment) {
        return alignDown<Power2Alignment>(addr + alignment - 1, alignment);
    }

    template <bool Power2Alignment>
    constexpr bool checkedAlignUp(const uintptr_t addr, const size_t alignment, uintptr_t& out) {
        uintptr_t bumped;
        if (__builtin_add_overflow(addr, alignment - 1, &bumped)) {
            return false;
        }
        out = alignDown<Power2Alignment>(bumped, alignment);
        return true;
    }

    constexpr bool isAligned(const uintptr_t addr, const size_t alignment) {
        return (addr & (alignment - 1)) == 0;
    }

    template <typename T>
    inline bool isAligned(const T* ptr, const size_t alignment) {
        return isAligned(reinterpret_cast<uintptr_t>(ptr), alignment);
    }
}

#endif //HERON_POINTERARITHMETIC_H
