//
// One-time mapping of the heap range and hand-off to a heap strategy
//

#ifndef HERON_HEAPBOOTSTRAP_H
#define HERON_HEAPBOOTSTRAP_H

#include <stddef.h>
#include <stdint.h>
#include <arch.h>
#include <assert.h>
#include <core/PrintStream.h>
#include <libheap/HeapStrategy.h>
#include <libheap/Locked.h>
#include <libheap/PointerArithmetic.h>
#include <mem/MemTypes.h>
#include <mem/Paging.h>

namespace kernel::mm{
    enum class HeapInitResult : uint8_t{
        SUCCESS,
        FRAME_ALLOCATION_FAILED,
        MAPPING_FAILED
    };

    //Backs every small page overlapping [start, start + length) with a fresh frame, mapped present and writable.
    //Stops at the first failure; pages mapped before it stay mapped.
    template <typename Mapper, typename Frames>
    requires PageMapper<Mapper, Frames>
    HeapInitResult mapHeapRegion(Mapper& mapper, Frames& frames, virt_addr start, size_t length){
        assert(length > 0, "Empty heap region");
        const uint64_t firstPage = LibHeap::alignDown<true>(start.value, arch::smallPageSize);
        const uint64_t lastPage = LibHeap::alignDown<true>(start.value + length - 1, arch::smallPageSize);

        for(uint64_t page = firstPage; page <= lastPage; page += arch::smallPageSize){
            phys_addr frame;
            if(!frames.allocateFrame(frame)){
                return HeapInitResult::FRAME_ALLOCATION_FAILED;
            }
            switch(mapper.map(virt_addr(page), frame, PF_PRESENT | PF_WRITABLE, frames)){
                case MapResult::SUCCESS:
                    break;
                case MapResult::FRAME_ALLOCATION_FAILED:
                    return HeapInitResult::FRAME_ALLOCATION_FAILED;
                default:
                    return HeapInitResult::MAPPING_FAILED;
            }
            mapper.flush(virt_addr(page));
        }
        return HeapInitResult::SUCCESS;
    }

    //Maps the region and, only if every page was mapped, initialises heap over it. Undefined if heap is already
    //serving allocations.
    template <LibHeap::HeapStrategy Strategy, typename Mapper, typename Frames>
    requires PageMapper<Mapper, Frames>
    HeapInitResult bootstrapHeap(LibHeap::Locked<Strategy>& heap, Mapper& mapper, Frames& frames,
                                 virt_addr start, size_t length){
        const auto result = mapHeapRegion(mapper, frames, start, length);
        if(result != HeapInitResult::SUCCESS){
            return result;
        }
        heap.acquire() -> init(start.value, length);
        return HeapInitResult::SUCCESS;
    }
}

Core::PrintStream& operator<<(Core::PrintStream& ps, kernel::mm::HeapInitResult result);

#endif //HERON_HEAPBOOTSTRAP_H
