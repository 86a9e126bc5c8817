//
// Minimal formatted output stream used for kernel logging
//

#ifndef HERON_PRINTSTREAM_H
#define HERON_PRINTSTREAM_H

#include <stdint.h>
#include "utility.h"

namespace Core{
    class PrintStream{
    protected:
        virtual void putString(const char*) = 0;

    public:
        virtual ~PrintStream() = default;

        PrintStream& operator<<(const char);
        PrintStream& operator<<(const char*);
        PrintStream& operator<<(const void*);
        PrintStream& operator<<(const uint8_t);
        PrintStream& operator<<(const uint16_t);
        PrintStream& operator<<(const uint32_t);
        PrintStream& operator<<(const uint64_t);
        PrintStream& operator<<(const int16_t);
        PrintStream& operator<<(const int32_t);
        PrintStream& operator<<(const int64_t);
        PrintStream& operator<<(const bool);
    };

#ifdef HERON_TESTING
    PrintStream& cout();
#endif
}

#endif //HERON_PRINTSTREAM_H
