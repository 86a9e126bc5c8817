//
// Kernel-wide logging and allocation entry points
//

#ifndef HERON_KERNEL_H
#define HERON_KERNEL_H

#include <core/PrintStream.h>
#include <core/utility.h>
#include <stddef.h>
#include <new>

namespace kernel{
    extern Core::PrintStream& klog;

    //Returns nullptr when the heap cannot satisfy the request. Must not be called before the heap is installed.
    void* kmalloc(size_t size, std::align_val_t align = std::align_val_t{1});
    //For callers that cannot continue without the memory: panics instead of returning nullptr
    void* kmallocOrPanic(size_t size, std::align_val_t align = std::align_val_t{1});
    //size and align must match the kmalloc call that returned ptr
    void kfree(void* ptr, size_t size, std::align_val_t align = std::align_val_t{1});
}

#endif //HERON_KERNEL_H
