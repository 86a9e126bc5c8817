//
// Fixed-size-block allocator: one free list per power-of-two size class, backed by a FreeListAllocator
//

#ifndef HERON_FIXEDSIZEBLOCKALLOCATOR_H
#define HERON_FIXEDSIZEBLOCKALLOCATOR_H

#include <stddef.h>
#include <stdint.h>
#include <core/utility.h>
#include <core/SizeClass.h>
#include <libheap/AllocationRequest.h>
#include <libheap/FreeListAllocator.h>

namespace LibHeap{
    //Each class size doubles as the block alignment, so every class must be a power of two and large enough to hold
    //a BlockNode
    constexpr ConstexprArray<size_t, 9> blockSizes{{8, 16, 32, 64, 128, 256, 512, 1024, 2048}};

    struct BlockNode{
        BlockNode* next;
    };

    static_assert(isArraySorted(blockSizes));
    static_assert(blockSizes[0] >= sizeof(BlockNode));

    //Blocks are carved from the fallback on demand and, once freed, stay on their class list for good. Requests
    //larger than the biggest class go straight to the fallback.
    class FixedSizeBlockAllocator{
        BlockNode* listHeads[blockSizes.size()];
        FreeListAllocator fallbackAllocator;

        void* refillFromFallback(size_t index);

    public:
        constexpr FixedSizeBlockAllocator() : listHeads{}, fallbackAllocator() {}

        FixedSizeBlockAllocator(const FixedSizeBlockAllocator&) = delete;
        FixedSizeBlockAllocator& operator=(const FixedSizeBlockAllocator&) = delete;

        void init(uintptr_t start, size_t length);

        [[nodiscard]] void* allocate(AllocationRequest request);
        void deallocate(void* ptr, AllocationRequest request);

        //Index into blockSizes of the class serving this request, or sizeClassNpos if the fallback serves it
        [[nodiscard]] static size_t sizeClassFor(AllocationRequest request);

        [[nodiscard]] size_t freeBytes() const;
        [[nodiscard]] size_t cachedBlockCount(size_t classIndex) const;
        [[nodiscard]] const FreeListAllocator& fallback() const;
    };
}

#endif //HERON_FIXEDSIZEBLOCKALLOCATOR_H
