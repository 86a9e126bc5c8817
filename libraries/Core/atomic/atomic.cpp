//
// Spinlock implementation over the compiler atomic intrinsics
//
#include <core/atomic.h>

void Spinlock::acquire() {
    while (!locked.compare_exchange_v(false, true, ACQUIRE)) {
        //Spin on a plain load so waiting cores do not keep the cache line in exclusive state
        while (locked.load(RELAXED)) {
            tight_spin();
        }
    }
}

void Spinlock::release() {
    locked.store(false, RELEASE);
}

bool Spinlock::try_acquire() {
    return locked.compare_exchange_v(false, true, ACQUIRE);
}

bool Spinlock::lock_taken() const {
    return locked.load(RELAXED);
}
