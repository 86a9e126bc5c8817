//
// The contract every heap strategy satisfies so the kernel can select one at build time
//

#ifndef HERON_HEAPSTRATEGY_H
#define HERON_HEAPSTRATEGY_H

#include <stddef.h>
#include <stdint.h>
#include <core/utility.h>
#include <libheap/AllocationRequest.h>

namespace LibHeap{
    //init() hands the strategy a region it owns from then on. allocate() returns nullptr on exhaustion.
    //deallocate() must be given the same request the block was allocated with.
    template <typename T>
    concept HeapStrategy = requires(T t, const T ct, uintptr_t start, size_t length, void* ptr, AllocationRequest request)
    {
        t.init(start, length);
        {t.allocate(request)} -> convertible_to<void*>;
        t.deallocate(ptr, request);
        {ct.freeBytes()} -> convertible_to<size_t>;
    };
}

#endif //HERON_HEAPSTRATEGY_H
