//
// Build-time kernel configuration
//

#ifndef HERON_KCONFIG_H
#define HERON_KCONFIG_H

#define KERNEL_PAGE_SIZE 4096

//Virtual range backing the kernel heap. Changing either value changes the set of pages mapped at bootstrap.
#define KERNEL_HEAP_START 0x0000444444440000
#define KERNEL_HEAP_SIZE (100 * 1024)

#define KERNEL_HEAP_BUMP 1
#define KERNEL_HEAP_FREE_LIST 2
#define KERNEL_HEAP_FIXED_SIZE_BLOCK 3

#ifndef KERNEL_HEAP_STRATEGY
#define KERNEL_HEAP_STRATEGY KERNEL_HEAP_FREE_LIST
#endif

#if KERNEL_HEAP_STRATEGY != KERNEL_HEAP_BUMP && KERNEL_HEAP_STRATEGY != KERNEL_HEAP_FREE_LIST && \
    KERNEL_HEAP_STRATEGY != KERNEL_HEAP_FIXED_SIZE_BLOCK
#error "KERNEL_HEAP_STRATEGY must be one of KERNEL_HEAP_BUMP, KERNEL_HEAP_FREE_LIST, KERNEL_HEAP_FIXED_SIZE_BLOCK"
#endif

#endif //HERON_KCONFIG_H
