//
// Assertion macros shared by the kernel, LibHeap and the unit tests
//

#ifndef HERON_CORE_ASSERT_H
#define HERON_CORE_ASSERT_H

#ifdef KERNEL

#include <kassert.h>

#elif defined(CORE_LIBRARY_TESTING)

#include <assert_support.h>

// Assert macros that integrate with test framework
#define assert(condition, ...) \
    do { \
        if (!(condition)) { \
            throw HeronTest::AssertionFailure(HeronTest::formatAssertMessage("Assert failed: " __VA_OPT__(,) __VA_ARGS__)); \
        } \
    } while(0)

#define assertNotReached(...) \
    do { \
        throw HeronTest::AssertionFailure(HeronTest::formatAssertMessage("Assert not reached: " __VA_OPT__(,) __VA_ARGS__)); \
    } while(0)

#else

// When not in kernel or testing mode, provide empty macros
#define assert(condition, ...) (void)sizeof(condition)
#define assertNotReached(...)

#endif

#endif //HERON_CORE_ASSERT_H
