//
// Free-list allocator
//

#include <libheap/FreeListAllocator.h>
#include <libheap/PointerArithmetic.h>
#include <core/utility.h>
#include <assert.h>
#include <new>

namespace LibHeap{
    constexpr size_t minimumRegionSize = sizeof(FreeListNode);
    constexpr size_t nodeAlignment = alignof(FreeListNode);

    void FreeListAllocator::init(uintptr_t start, size_t length){
        head.next = nullptr;
        const uintptr_t alignedStart = alignUp<true>(start, nodeAlignment);
        const size_t skipped = alignedStart - start;
        if(length < skipped + minimumRegionSize){
            return;
        }
        addFreeRegion(alignedStart, length - skipped);
    }

    void FreeListAllocator::addFreeRegion(uintptr_t addr, size_t size){
        assert(isAligned(addr, nodeAlignment), "Free region is not aligned for a FreeListNode");
        assert(size >= minimumRegionSize, "Free region too small to hold a FreeListNode");
        auto* node = new (reinterpret_cast<void*>(addr)) FreeListNode(size);
        node -> next = head.next;
        head.next = node;
    }

    bool FreeListAllocator::allocFromRegion(const FreeListNode& region, size_t size, size_t align,
                                            uintptr_t& allocStart){
        uintptr_t start;
        if(!checkedAlignUp<true>(region.startAddr(), align, start)){
            return false;
        }
        uintptr_t end;
        if(__builtin_add_overflow(start, size, &end) || end > region.endAddr()){
            return false;
        }
        //The remainder would have to become a node of its own
        const size_t excess = region.endAddr() - end;
        if(excess > 0 && excess < minimumRegionSize){
            return false;
        }
        allocStart = start;
        return true;
    }

    AllocationRequest FreeListAllocator::adjustRequest(AllocationRequest request){
        const size_t align = max(request.align, nodeAlignment);
        uintptr_t size;
        if(!checkedAlignUp<true>(request.size, align, size)){
            //Cannot be satisfied by any region
            size = alignDown<true>(static_cast<uintptr_t>(-1), align);
        }
        return {max(static_cast<size_t>(size), minimumRegionSize), align};
    }

    void* FreeListAllocator::allocate(AllocationRequest request){
        assert(request.hasValidAlignment(), "Alignment must be a power of two");
        const auto adjusted = adjustRequest(request);

        FreeListNode* prev = &head;
        while(prev -> next != nullptr){
            FreeListNode* region = prev -> next;
            uintptr_t allocStart;
            if(allocFromRegion(*region, adjusted.size, adjusted.align, allocStart)){
                //region's header may be overwritten below, so read everything out first
                const uintptr_t regionStart = region -> startAddr();
                const uintptr_t regionEnd = region -> endAddr();
                prev -> next = region -> next;

                const uintptr_t allocEnd = allocStart + adjusted.size;
                if(regionEnd > allocEnd){
                    addFreeRegion(allocEnd, regionEnd - allocEnd);
                }
                //A leading alignment gap too small for a node is lost until the heap is reinitialised
                if(allocStart - regionStart >= minimumRegionSize){
                    addFreeRegion(regionStart, allocStart - regionStart);
                }
                return reinterpret_cast<void*>(allocStart);
            }
            prev = region;
        }
        return nullptr;
    }

    void FreeListAllocator::deallocate(void* ptr, AllocationRequest request){
        assert(ptr != nullptr, "Freeing a null pointer");
        const auto adjusted = adjustRequest(request);
        addFreeRegion(reinterpret_cast<uintptr_t>(ptr), adjusted.size);
    }

    size_t FreeListAllocator::freeBytes() const {
        size_t total = 0;
        forEachFreeRegion([&total](uintptr_t, size_t size){
            total += size;
        });
        return total;
    }

    size_t FreeListAllocator::freeRegionCount() const {
        size_t count = 0;
        forEachFreeRegion([&count](uintptr_t, size_t){
            count++;
        });
        return count;
    }
}
