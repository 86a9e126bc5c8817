//
// Strongly typed physical and virtual addresses
//

#ifndef HERON_MEMTYPES_H
#define HERON_MEMTYPES_H

#include <stdint.h>
#include <stddef.h>
#include <core/PrintStream.h>

namespace kernel::mm{
    struct phys_addr {
        uint64_t value;
        constexpr explicit phys_addr(uint64_t v) : value(v) {}
        constexpr explicit phys_addr() : value(0) {}
        bool operator==(const phys_addr & other) const {return value == other.value;}
    };

    struct virt_addr {
        uint64_t value;
        constexpr explicit virt_addr(uint64_t v) : value(v) {}
        constexpr explicit virt_addr() : value(0) {}
        bool operator==(const virt_addr & other) const {return value == other.value;}
    };
}

inline Core::PrintStream& operator<<(Core::PrintStream& ps, kernel::mm::phys_addr paddr){
    return ps << "phys_addr(" << reinterpret_cast<void*>(paddr.value) << ")";
}

inline Core::PrintStream& operator<<(Core::PrintStream& ps, kernel::mm::virt_addr vaddr){
    return ps << "virt_addr(" << reinterpret_cast<void*>(vaddr.value) << ")";
}

#endif //HERON_MEMTYPES_H
