//
// Free-list allocator: first fit over an intrusive list of free regions stored inside the free memory
//

#ifndef HERON_FREELISTALLOCATOR_H
#define HERON_FREELISTALLOCATOR_H

#include <stddef.h>
#include <stdint.h>
#include <libheap/AllocationRequest.h>

namespace LibHeap{
    //Header written into the first bytes of every free region. size spans the whole region, header included.
    struct FreeListNode{
        size_t size;
        FreeListNode* next;

        constexpr explicit FreeListNode(size_t s) : size(s), next(nullptr) {}

        [[nodiscard]] uintptr_t startAddr() const {
            return reinterpret_cast<uintptr_t>(this);
        }

        [[nodiscard]] uintptr_t endAddr() const {
            return startAddr() + size;
        }
    };

    //Regions are kept most-recently-inserted first and are never merged with their neighbours, so a heap with
    //enough total free bytes can still fail a request if no single region is large enough.
    class FreeListAllocator{
        //Sentinel; only head.next is meaningful
        FreeListNode head;

        void addFreeRegion(uintptr_t addr, size_t size);
        static bool allocFromRegion(const FreeListNode& region, size_t size, size_t align, uintptr_t& allocStart);

    public:
        constexpr FreeListAllocator() : head(0) {}

        FreeListAllocator(const FreeListAllocator&) = delete;
        FreeListAllocator& operator=(const FreeListAllocator&) = delete;

        void init(uintptr_t start, size_t length);

        [[nodiscard]] void* allocate(AllocationRequest request);
        void deallocate(void* ptr, AllocationRequest request);

        //Grows a request so the block can hold a FreeListNode once it is freed
        static AllocationRequest adjustRequest(AllocationRequest request);

        [[nodiscard]] size_t freeBytes() const;
        [[nodiscard]] size_t freeRegionCount() const;

        template <typename F>
        void forEachFreeRegion(F&& fn) const {
            for(const FreeListNode* node = head.next; node != nullptr; node = node -> next){
                fn(node -> startAddr(), node -> size);
            }
        }
    };
}

#endif //HERON_FREELISTALLOCATOR_H
