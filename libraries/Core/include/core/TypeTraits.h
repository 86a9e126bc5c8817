//
// Compiler-backed type traits for freestanding code
//

#ifndef HERON_TYPETRAITS_H
#define HERON_TYPETRAITS_H
#include "stdint.h"
#include "stddef.h"

template <typename T, T v>
struct integral_constant {
    static constexpr T value = v;
    using value_type = T;
    using type = integral_constant;
    constexpr operator T() const noexcept { return value; }
};

using true_type = integral_constant<bool, true>;
using false_type = integral_constant<bool, false>;

template <typename T>
struct is_trivially_copyable {
    static constexpr bool value = __is_trivially_copyable(T);
};

template <typename T>
inline constexpr bool is_trivially_copyable_v = is_trivially_copyable<T>::value;

#endif //HERON_TYPETRAITS_H
