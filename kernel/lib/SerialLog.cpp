//
// klog over the platform serial port
//
#include <kernel.h>
#include <arch.h>

namespace arch{
    void SerialPrintStream::putString(const char * str){
        serialOutputString(str);
    }
}

namespace kernel{
    arch::SerialPrintStream serialStream;
    Core::PrintStream& klog = serialStream;
}
