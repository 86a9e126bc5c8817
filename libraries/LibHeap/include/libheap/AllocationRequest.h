//
// Size and alignment of a single heap request
//

#ifndef HERON_ALLOCATIONREQUEST_H
#define HERON_ALLOCATIONREQUEST_H

#include <stddef.h>
#include <core/math.h>

namespace LibHeap{
    //align must be a power of two. Every strategy checks this with a debug assertion; it is never reported as a
    //runtime failure.
    struct AllocationRequest{
        size_t size;
        size_t align;

        [[nodiscard]] constexpr bool hasValidAlignment() const {
            return isPowerOfTwo(align);
        }
    };
}

#endif //HERON_ALLOCATIONREQUEST_H
