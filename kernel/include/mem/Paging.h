//
// Interfaces the heap bootstrap needs from the paging code and the physical frame allocator
//

#ifndef HERON_PAGING_H
#define HERON_PAGING_H

#include <stdint.h>
#include <core/PrintStream.h>
#include <core/utility.h>
#include <mem/MemTypes.h>

namespace kernel::mm{
    using PageFlags = uint8_t;

    constexpr PageFlags PF_PRESENT = 1;
    constexpr PageFlags PF_WRITABLE = 2;

    enum class MapResult : uint8_t{
        SUCCESS,
        //The mapper needed a frame for an intermediate page table and none was left
        FRAME_ALLOCATION_FAILED,
        PAGE_ALREADY_MAPPED,
        PARENT_ENTRY_HUGE_PAGE
    };

    template <typename T>
    concept PhysicalFrameAllocator = requires(T frames, phys_addr& out)
    {
        {frames.allocateFrame(out)} -> convertible_to<bool>;
    };

    //map() installs a single small-page translation, taking any page table frames it needs from frames.
    //flush() makes a new translation visible to the current core.
    template <typename T, typename Frames>
    concept PageMapper = PhysicalFrameAllocator<Frames> &&
        requires(T mapper, virt_addr page, phys_addr frame, PageFlags flags, Frames& frames)
    {
        {mapper.map(page, frame, flags, frames)} -> IsSame<MapResult>;
        mapper.flush(page);
    };
}

Core::PrintStream& operator<<(Core::PrintStream& ps, kernel::mm::MapResult result);

#endif //HERON_PAGING_H
