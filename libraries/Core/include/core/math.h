//
// Integer helpers used for alignment checks and size class arithmetic
//

#ifndef HERON_MATH_H
#define HERON_MATH_H

#include <stdint.h>
#include <stddef.h>

template <typename T>
constexpr T log2floor(T value){
    T log = 0;
    while(value >>= 1) log++;
    return log;
}

template <typename T>
constexpr bool isPowerOfTwo(T value){
    return value != 0 && (value & (value - 1)) == 0;
}

#endif //HERON_MATH_H
