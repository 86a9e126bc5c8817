//
// Compile-time size class lookup: maps a request size to the smallest class that can hold it
//

#ifndef HERON_SIZECLASS_H
#define HERON_SIZECLASS_H

#include <core/math.h>
#include <core/utility.h>

constexpr size_t sizeClassNpos = static_cast<size_t>(-1);

//jumpTable[i] is the first class index whose size is at least 2^i; any size with log2floor(size) == i
//can only fit in that class or a later one
template <typename T, size_t N, ConstexprArray<T, N> array>
requires (isArraySorted(array) && N > 0)
constexpr ConstexprArray<size_t, log2floor(array[N-1]) + 1> _makeSizeClassJumpTableImpl(){
    constexpr size_t M = log2floor(array[N-1]) + 1;
    ConstexprArray<size_t, M> jumpTable{};
    size_t index = 0;
    for(size_t i = 0; i < M; i++){
        while(array[index] < (static_cast<T>(1) << i)) index++;
        jumpTable[i] = index;
    }

    return jumpTable;
}

template <auto array>
requires IsConstexprArray<decltype(array)>
constexpr auto makeSizeClassJumpTable() {
    using T = decltype(array);
    return _makeSizeClassJumpTableImpl<typename T::Type, T::size(), array>();
}

template <auto array>
requires IsConstexprArray<decltype(array)>
constexpr size_t sizeClassIndex(typename decltype(array)::Type size) {
    constexpr auto jumpTable = makeSizeClassJumpTable<array>();
    if (size == 0) return 0;
    const size_t log2Size = log2floor(size);
    if (log2Size >= jumpTable.size()) return sizeClassNpos;
    for (size_t index = jumpTable[log2Size]; index < array.size(); ++index) {
        if (size <= array[index]) return index;
    }
    return sizeClassNpos;
}

#endif //HERON_SIZECLASS_H
