//
// Global operator new/delete for the freestanding kernel, routed to the kernel heap
//
#include <kernel.h>
#include <assert.h>

//Exceptions are disabled in the kernel, so the ordinary forms panic on exhaustion instead of throwing. Callers
//that can cope with failure use the nothrow forms.

namespace {
    constexpr auto defaultNewAlignment = std::align_val_t{__STDCPP_DEFAULT_NEW_ALIGNMENT__};
}

void *operator new(size_t size)
{
    return kernel::kmallocOrPanic(size, defaultNewAlignment);
}

void *operator new[](size_t size)
{
    return kernel::kmallocOrPanic(size, defaultNewAlignment);
}

void *operator new(size_t size, std::align_val_t align)
{
    return kernel::kmallocOrPanic(size, align);
}

void *operator new[](size_t size, std::align_val_t align)
{
    return kernel::kmallocOrPanic(size, align);
}

void *operator new(size_t size, const std::nothrow_t&) noexcept
{
    return kernel::kmalloc(size, defaultNewAlignment);
}

void *operator new[](size_t size, const std::nothrow_t&) noexcept
{
    return kernel::kmalloc(size, defaultNewAlignment);
}

void *operator new(size_t size, std::align_val_t align, const std::nothrow_t&) noexcept
{
    return kernel::kmalloc(size, align);
}

void *operator new[](size_t size, std::align_val_t align, const std::nothrow_t&) noexcept
{
    return kernel::kmalloc(size, align);
}

void operator delete(void *p, size_t size)
{
    kernel::kfree(p, size, defaultNewAlignment);
}

void operator delete[](void *p, size_t size)
{
    kernel::kfree(p, size, defaultNewAlignment);
}

void operator delete(void *p, size_t size, std::align_val_t align)
{
    kernel::kfree(p, size, align);
}

void operator delete[](void *p, size_t size, std::align_val_t align)
{
    kernel::kfree(p, size, align);
}

//Every heap strategy needs the original size to free a block. These are only reached for incomplete types or
//through code compiled without -fsized-deallocation.
void operator delete(void *p)
{
    if(p != nullptr){
        assertNotReached("Unsized delete cannot be routed to the kernel heap");
    }
}

void operator delete[](void *p)
{
    if(p != nullptr){
        assertNotReached("Unsized delete cannot be routed to the kernel heap");
    }
}

void operator delete(void *p, std::align_val_t)
{
    if(p != nullptr){
        assertNotReached("Unsized delete cannot be routed to the kernel heap");
    }
}

void operator delete[](void *p, std::align_val_t)
{
    if(p != nullptr){
        assertNotReached("Unsized delete cannot be routed to the kernel heap");
    }
}
