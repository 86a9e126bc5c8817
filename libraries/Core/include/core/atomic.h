//
// Atomic primitives and the busy-waiting Spinlock
//

#ifndef HERON_ATOMIC_H
#define HERON_ATOMIC_H
#include <stddef.h>
#include <core/TypeTraits.h>
#include <core/utility.h>

#ifdef __GNUC__
enum MemoryOrder : int{
    SEQ_CST = __ATOMIC_SEQ_CST,
    ACQUIRE = __ATOMIC_ACQUIRE,
    RELEASE = __ATOMIC_RELEASE,
    RELAXED = __ATOMIC_RELAXED
};
#else
#error "Compiler atomic intrinsics not supported"
#endif

template <typename T>
constexpr bool _use_intrinsic_atomic_ops = (is_trivially_copyable_v<T>) && ((sizeof(T) == 1) || (sizeof(T) == 2) || (sizeof(T) == 4) || (sizeof(T) == 8));

template<typename T>
inline void atomic_store(T& dest, T val, MemoryOrder mem_order = SEQ_CST){
    static_assert(_use_intrinsic_atomic_ops<T>, "Unimplemented");
    __atomic_store_n(&dest, val, mem_order);
}

template<typename T>
inline T atomic_load(const T& src, MemoryOrder mem_order = SEQ_CST){
    static_assert(_use_intrinsic_atomic_ops<T>, "Unimplemented");
    return __atomic_load_n(&src, mem_order);
}

inline void tight_spin(){
#if defined(__x86_64__) || defined(__i386__)
    asm volatile("pause");
#elif defined(__aarch64__)
    asm volatile("yield");
#endif
}

template<typename T>
inline bool atomic_cmpxchg(T& src, T& expected, T value, bool weak = false,
                          MemoryOrder success_order = SEQ_CST, MemoryOrder failure_order = SEQ_CST){
    static_assert(_use_intrinsic_atomic_ops<T>, "Unimplemented");
    return __atomic_compare_exchange_n(&src, &expected, value, weak, success_order, failure_order);
}

template<typename T>
class Atomic {
    alignas(alignof(T)) T value;
public:
    //constexpr so that globals holding an Atomic are constant-initialized and usable before constructors run
    constexpr Atomic(T t) : value(t) {}

    Atomic() = default;

    void store(T val, MemoryOrder order = SEQ_CST) {
        atomic_store(value, val, order);
    }

    T load(MemoryOrder order = SEQ_CST) const {
        return atomic_load(value, order);
    }

    bool compare_exchange(T& expected, T desired,
                          MemoryOrder success_order = SEQ_CST,
                          MemoryOrder failure_order = SEQ_CST) {
        if(failure_order > success_order) failure_order = success_order;
        return atomic_cmpxchg(value, expected, desired,
                              false, success_order, failure_order);
    }

    bool compare_exchange_v(T expected, T desired,
                          MemoryOrder success_order = SEQ_CST,
                          MemoryOrder failure_order = SEQ_CST) {
        if(failure_order > success_order) failure_order = success_order;
        return atomic_cmpxchg(value, expected, desired,
                              false, success_order, failure_order);
    }
};

//Test-and-set lock. Not recursive: acquiring a lock already held by the current context spins forever.
class Spinlock {
private:
    Atomic<bool> locked{false};

public:
    constexpr Spinlock() = default;

    void acquire();
    bool try_acquire();
    void release();
    [[nodiscard]] bool lock_taken() const;
};

#endif //HERON_ATOMIC_H
