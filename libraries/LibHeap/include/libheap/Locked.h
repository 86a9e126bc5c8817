//
// Spinlock-protected wrapper giving exclusive access to a value
//

#ifndef HERON_LOCKED_H
#define HERON_LOCKED_H

#include <core/atomic.h>
#include <core/utility.h>

namespace LibHeap{
    //Every access to the wrapped value goes through a Guard, which holds the lock for its lifetime.
    //
    //The lock is not recursive and does not mask interrupts. Acquiring it from an interrupt handler that
    //interrupted the holder on the same core spins forever; callers that may be interrupted while holding it must
    //disable interrupts around the critical section themselves. A holder that panics never releases it.
    template <typename T>
    class Locked{
        Spinlock lock;
        T inner;

    public:
        class Guard{
            Locked* owner;

            explicit Guard(Locked* l) : owner(l) {}
            friend class Locked;

        public:
            Guard(const Guard&) = delete;
            Guard& operator=(const Guard&) = delete;

            Guard(Guard&& other) noexcept : owner(other.owner) {
                other.owner = nullptr;
            }

            Guard& operator=(Guard&& other) noexcept {
                if(this != &other){
                    release();
                    owner = other.owner;
                    other.owner = nullptr;
                }
                return *this;
            }

            ~Guard(){
                release();
            }

            //Drops access early; the guard is empty afterwards
            void release(){
                if(owner != nullptr){
                    owner -> lock.release();
                    owner = nullptr;
                }
            }

            explicit operator bool() const {
                return owner != nullptr;
            }

            T& operator*() const {
                return owner -> inner;
            }

            T* operator->() const {
                return &owner -> inner;
            }
        };

        constexpr Locked() : inner() {}

        template <typename... Args>
        requires (sizeof...(Args) > 0)
        constexpr explicit Locked(Args&&... args) : inner(::forward<Args>(args)...) {}

        Locked(const Locked&) = delete;
        Locked& operator=(const Locked&) = delete;

        //Busy-waits until the lock is free
        [[nodiscard]] Guard acquire(){
            lock.acquire();
            return Guard(this);
        }

        //Returns an empty guard instead of spinning if the lock is taken
        [[nodiscard]] Guard tryAcquire(){
            if(lock.try_acquire()){
                return Guard(this);
            }
            return Guard(nullptr);
        }

        [[nodiscard]] bool isHeld() const {
            return lock.lock_taken();
        }
    };
}

#endif //HERON_LOCKED_H
