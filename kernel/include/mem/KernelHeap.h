//
// The process-wide kernel heap
//

#ifndef HERON_KERNELHEAP_H
#define HERON_KERNELHEAP_H

#include <stddef.h>
#include <kconfig.h>
#include <kernel.h>
#include <assert.h>
#include <mem/HeapBootstrap.h>
#include <libheap/BumpAllocator.h>
#include <libheap/FreeListAllocator.h>
#include <libheap/FixedSizeBlockAllocator.h>

namespace kernel::mm{
#if KERNEL_HEAP_STRATEGY == KERNEL_HEAP_BUMP
    using KernelHeapStrategy = LibHeap::BumpAllocator;
#elif KERNEL_HEAP_STRATEGY == KERNEL_HEAP_FIXED_SIZE_BLOCK
    using KernelHeapStrategy = LibHeap::FixedSizeBlockAllocator;
#else
    using KernelHeapStrategy = LibHeap::FreeListAllocator;
#endif

    static_assert(LibHeap::HeapStrategy<KernelHeapStrategy>);

    [[nodiscard]] bool kernelHeapInstalled();
    //Hands an already mapped range to the global heap. Called once, by initKernelHeap.
    void installKernelHeap(virt_addr start, size_t length);
    [[nodiscard]] size_t kernelHeapFreeBytes();
    [[nodiscard]] const char* kernelHeapStrategyName();

    //Must run exactly once, before the first kmalloc. A failure leaves the heap uninstalled and is fatal to the
    //caller's init sequence.
    template <typename Mapper, typename Frames>
    requires PageMapper<Mapper, Frames>
    HeapInitResult initKernelHeap(Mapper& mapper, Frames& frames,
                                  virt_addr start = virt_addr(KERNEL_HEAP_START), size_t length = KERNEL_HEAP_SIZE){
        assert(!kernelHeapInstalled(), "Kernel heap initialized twice");
        klog << "Mapping " << kernelHeapStrategyName() << " kernel heap at " << start << ", " << length << " bytes\n";
        const auto result = mapHeapRegion(mapper, frames, start, length);
        if(result != HeapInitResult::SUCCESS){
            klog << "Kernel heap initialization failed: " << result << "\n";
            return result;
        }
        installKernelHeap(start, length);
        klog << "Kernel heap ready, " << kernelHeapFreeBytes() << " bytes free\n";
        return HeapInitResult::SUCCESS;
    }
}

#endif //HERON_KERNELHEAP_H
