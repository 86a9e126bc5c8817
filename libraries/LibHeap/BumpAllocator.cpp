//
// Bump allocator
//

#include <libheap/BumpAllocator.h>
#include <libheap/PointerArithmetic.h>
#include <assert.h>

namespace LibHeap{
    void BumpAllocator::init(uintptr_t start, size_t length){
        uintptr_t end;
        const bool overflow = __builtin_add_overflow(start, length, &end);
        assert(!overflow, "Heap region wraps around the address space");
        this -> heapStart = start;
        this -> heapEnd = end;
        this -> next = start;
        this -> allocations = 0;
    }

    void* BumpAllocator::allocate(AllocationRequest request){
        assert(request.hasValidAlignment(), "Alignment must be a power of two");
        uintptr_t allocStart;
        if(!checkedAlignUp<true>(next, request.align, allocStart)){
            return nullptr;
        }
        uintptr_t allocEnd;
        if(__builtin_add_overflow(allocStart, request.size, &allocEnd) || allocEnd > heapEnd){
            return nullptr;
        }
        next = allocEnd;
        allocations++;
        return reinterpret_cast<void*>(allocStart);
    }

    void BumpAllocator::deallocate(void* ptr, AllocationRequest request){
        (void)request;
        assert(ptr != nullptr, "Freeing a null pointer");
        assert(allocations > 0, "More frees than allocations");
        allocations--;
        if(allocations == 0){
            next = heapStart;
        }
    }

    size_t BumpAllocator::freeBytes() const {
        return heapEnd - next;
    }

    size_t BumpAllocator::liveAllocations() const {
        return allocations;
    }

    uintptr_t BumpAllocator::cursor() const {
        return next;
    }
}
