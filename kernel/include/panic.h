//
// Fatal error reporting
//

#ifndef HERON_PANIC_H
#define HERON_PANIC_H

#include "kernel.h"

#ifdef HERON_TESTING
#include <assert_support.h>
#endif

#define PANIC(...) kernel::panic(__FILE__, __LINE__, __VA_ARGS__)

namespace kernel{
    void print_stacktrace();
    template <typename... Args>
    [[noreturn]]
    void panic(const char* filename, const uint32_t line, Args&&... args){
        kernel::klog << "Panic: ";
        (kernel::klog << ... << ::forward<Args>(args));
        kernel::klog << "\nIn file " << filename << " line " << line << "\n";
#ifdef HERON_TESTING
        //Host tests observe a panic the same way they observe a failed assert
        throw HeronTest::AssertionFailure(HeronTest::formatAssertMessage("Panic in ", filename, " line ", line));
#else
        print_stacktrace();
        for(;;){
#ifdef __x86_64__
            asm volatile("cli; hlt");
#endif
        }
#endif
    }
}

#endif //HERON_PANIC_H
