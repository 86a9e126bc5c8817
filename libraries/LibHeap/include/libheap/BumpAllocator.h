//
// Bump allocator: a single cursor that only moves forward, reclaimed in bulk
//

#ifndef HERON_BUMPALLOCATOR_H
#define HERON_BUMPALLOCATOR_H

#include <stddef.h>
#include <stdint.h>
#include <libheap/AllocationRequest.h>

namespace LibHeap{
    //Liveness is tracked only as a count. Space is reused once every allocation has been freed, at which point the
    //cursor returns to the start of the region. While any allocation is live, freed blocks stay unusable and
    //allocation fails once the cursor reaches the end.
    class BumpAllocator{
        uintptr_t heapStart;
        uintptr_t heapEnd;
        uintptr_t next;
        size_t allocations;

    public:
        constexpr BumpAllocator() : heapStart(0), heapEnd(0), next(0), allocations(0) {}

        void init(uintptr_t start, size_t length);

        [[nodiscard]] void* allocate(AllocationRequest request);
        void deallocate(void* ptr, AllocationRequest request);

        [[nodiscard]] size_t freeBytes() const;
        [[nodiscard]] size_t liveAllocations() const;
        [[nodiscard]] uintptr_t cursor() const;
    };
}

#endif //HERON_BUMPALLOCATOR_H
