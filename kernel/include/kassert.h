//
// Kernel assertions: PANIC in debug builds, compiled out otherwise
//

#ifndef HERON_KASSERT_H
#define HERON_KASSERT_H

#include <panic.h>

#ifdef DEBUG_BUILD
#define assert_base(condition, ...) if(!(condition)) PANIC(__VA_ARGS__)
#define assert(condition, ...) assert_base((condition), "Assert failed: ", __VA_ARGS__)
#define assertNotReached(...) assert_base(false, "Assert not reached ", __VA_ARGS__)
#else
#define assert(condition, message, ...) (void)(condition)
#define assertNotReached(message)
#endif

#endif //HERON_KASSERT_H
