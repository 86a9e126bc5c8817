//
// The narrow slice of the architecture layer the heap subsystem depends on
//

#ifndef HERON_ARCH_H
#define HERON_ARCH_H

#include <stdint.h>
#include <stddef.h>
#include <kconfig.h>
#include <core/PrintStream.h>

namespace arch{
    //Provided by the platform's serial driver
    void serialOutputString(const char* str);

    constexpr size_t smallPageSize = KERNEL_PAGE_SIZE;

    class SerialPrintStream : public Core::PrintStream{
    protected:
        void putString(const char*) override;
    };
}

#endif //HERON_ARCH_H
