//
// The global kernel heap and the kmalloc/kfree entry points
//
#include <kernel.h>
#include <mem/KernelHeap.h>
#include <libheap/Locked.h>
#include <core/atomic.h>
#include <assert.h>
#include <panic.h>

namespace kernel::mm{
    //Constant-initialised, so it is usable before global constructors run. Empty until installKernelHeap.
    constinit LibHeap::Locked<KernelHeapStrategy> kernelHeap;
    //heapClaimed guards against a second install; heapInstalled is only published once init has finished
    constinit Atomic<bool> heapClaimed(false);
    constinit Atomic<bool> heapInstalled(false);

    bool kernelHeapInstalled(){
        return heapInstalled.load(ACQUIRE);
    }

    void installKernelHeap(virt_addr start, size_t length){
        bool expected = false;
        const bool firstInstall = heapClaimed.compare_exchange(expected, true);
        assert(firstInstall, "Kernel heap installed twice");
        {
            auto heap = kernelHeap.acquire();
            heap -> init(start.value, length);
        }
        heapInstalled.store(true, RELEASE);
    }

    size_t kernelHeapFreeBytes(){
        return kernelHeap.acquire() -> freeBytes();
    }

    const char* kernelHeapStrategyName(){
#if KERNEL_HEAP_STRATEGY == KERNEL_HEAP_BUMP
        return "bump";
#elif KERNEL_HEAP_STRATEGY == KERNEL_HEAP_FIXED_SIZE_BLOCK
        return "fixed-size-block";
#else
        return "free-list";
#endif
    }
}

namespace kernel{
    void* kmalloc(size_t size, std::align_val_t align){
        assert(mm::kernelHeapInstalled(), "kmalloc before the kernel heap was installed");
        return mm::kernelHeap.acquire() -> allocate({size, static_cast<size_t>(align)});
    }

    void* kmallocOrPanic(size_t size, std::align_val_t align){
        void* ptr = kmalloc(size, align);
        if(ptr == nullptr){
            PANIC("Kernel heap exhausted allocating ", size, " bytes aligned to ", static_cast<size_t>(align));
        }
        return ptr;
    }

    void kfree(void* ptr, size_t size, std::align_val_t align){
        if(ptr == nullptr){
            return;
        }
        mm::kernelHeap.acquire() -> deallocate(ptr, {size, static_cast<size_t>(align)});
    }
}
