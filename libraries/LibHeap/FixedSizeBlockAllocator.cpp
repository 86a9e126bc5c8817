//
// Fixed-size-block allocator
//

#include <libheap/FixedSizeBlockAllocator.h>
#include <libheap/PointerArithmetic.h>
#include <assert.h>
#include <new>

namespace LibHeap{
    void FixedSizeBlockAllocator::init(uintptr_t start, size_t length){
        for(auto& listHead : listHeads){
            listHead = nullptr;
        }
        fallbackAllocator.init(start, length);
    }

    size_t FixedSizeBlockAllocator::sizeClassFor(AllocationRequest request){
        return sizeClassIndex<blockSizes>(max(request.size, request.align));
    }

    void* FixedSizeBlockAllocator::allocate(AllocationRequest request){
        assert(request.hasValidAlignment(), "Alignment must be a power of two");
        const size_t index = sizeClassFor(request);
        if(index == sizeClassNpos){
            return fallbackAllocator.allocate(request);
        }
        if(BlockNode* node = listHeads[index]; node != nullptr){
            listHeads[index] = node -> next;
            return node;
        }
        return refillFromFallback(index);
    }

    void* FixedSizeBlockAllocator::refillFromFallback(size_t index){
        const size_t blockSize = blockSizes[index];
        const auto chunkRequest = FreeListAllocator::adjustRequest({blockSize, blockSize});
        auto* chunk = static_cast<uint8_t*>(fallbackAllocator.allocate(chunkRequest));
        if(chunk == nullptr){
            return nullptr;
        }
        //Classes smaller than a FreeListNode get a whole node's worth of bytes; the rest of the chunk is split into
        //blocks of the same class
        for(size_t offset = blockSize; offset + blockSize <= chunkRequest.size; offset += blockSize){
            listHeads[index] = new (chunk + offset) BlockNode{listHeads[index]};
        }
        return chunk;
    }

    void FixedSizeBlockAllocator::deallocate(void* ptr, AllocationRequest request){
        assert(ptr != nullptr, "Freeing a null pointer");
        const size_t index = sizeClassFor(request);
        if(index == sizeClassNpos){
            fallbackAllocator.deallocate(ptr, request);
            return;
        }
        assert(isAligned(ptr, blockSizes[index]), "Block does not belong to its size class");
        auto* node = new (ptr) BlockNode{listHeads[index]};
        listHeads[index] = node;
    }

    size_t FixedSizeBlockAllocator::cachedBlockCount(size_t classIndex) const {
        assert(classIndex < blockSizes.size(), "Size class index out of range");
        size_t count = 0;
        for(const BlockNode* node = listHeads[classIndex]; node != nullptr; node = node -> next){
            count++;
        }
        return count;
    }

    size_t FixedSizeBlockAllocator::freeBytes() const {
        size_t total = fallbackAllocator.freeBytes();
        for(size_t i = 0; i < blockSizes.size(); i++){
            total += cachedBlockCount(i) * blockSizes[i];
        }
        return total;
    }

    const FreeListAllocator& FixedSizeBlockAllocator::fallback() const {
        return fallbackAllocator;
    }
}
