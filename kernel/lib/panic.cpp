//
// Stack trace printed on panic
//

#include <kernel.h>
#include <panic.h>

namespace kernel{

    void print_stacktrace(){
#ifdef __x86_64__
        uintptr_t* rbp;
        asm volatile("movq %%rbp, %0" : "=r"(rbp));
        kernel::klog << "Stack trace:\n";

        for (int i = 0; (i < 20) && rbp; i++) {
            uintptr_t rip = rbp[1];
            kernel::klog << "[" << i << "] " << reinterpret_cast<void*>(rip) << "\n";
            rbp = reinterpret_cast<uintptr_t*>(rbp[0]);
        }
#endif
    }
}
