//
// C++ runtime hooks the freestanding kernel provides itself
//
#include <kernel.h>
#include <assert.h>

extern "C" void *__dso_handle;
void *__dso_handle = nullptr;

//Kernel globals are never destroyed, so registered destructors are dropped
extern "C" int __cxa_atexit(void (*destructor) (void *), void *arg, void *dso_handle){
    (void)destructor;
    (void)arg;
    (void)dso_handle;
    return 0;
}

extern "C" void __cxa_pure_virtual(){
    kernel::klog << "Pure virtual function called\n";
    assertNotReached("Pure virtual function called");
    for(;;){}
}
