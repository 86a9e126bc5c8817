//
// Freestanding utility templates shared by the kernel and LibHeap
//

#ifndef HERON_UTILITY_H
#define HERON_UTILITY_H

#include "TypeTraits.h"
#include <stddef.h>

template <typename T>
struct remove_reference {
    using type = T;
};

template <typename T>
struct remove_reference<T&> {
    using type = T;
};

template <typename T>
struct remove_reference<T&&> {
    using type = T;
};

template <typename T>
using remove_reference_t = typename remove_reference<T>::type;

template <typename T>
struct is_lvalue_reference : false_type {};

template <typename T>
struct is_lvalue_reference<T&> : true_type {};

template <typename T>
constexpr remove_reference_t<T>&& move(T&& t) noexcept {
    return static_cast<remove_reference_t<T>&&>(t);
}

template <typename T>
constexpr T&& forward(remove_reference_t<T>& arg) noexcept {
    return static_cast<T&&>(arg);
}

template <typename T>
constexpr T&& forward(remove_reference_t<T>&& arg) noexcept {
    static_assert(!is_lvalue_reference<T>::value, "bad forward");
    return static_cast<T&&>(arg);
}

template<typename T, typename S>
struct is_same {
    static constexpr bool value = false;
};

template<typename T>
struct is_same<T, T> {
    static constexpr bool value = true;
};

template<typename T, typename S>
constexpr bool is_same_v = is_same<T, S>::value;

template<typename T, typename S>
concept IsSame = is_same_v<T, S>;

template<typename From, typename To>
concept convertible_to = (IsSame<From, void> && IsSame<To, void>) || requires(From f) {
    static_cast<To>(f);
};

template <typename T>
constexpr T max(T t1, T t2){
    return t1 > t2 ? t1 : t2;
}

template <typename T, typename... Rest>
constexpr T max(T a, T b, Rest... rest) {
    return max(max(a, b), rest...);
}

template <typename T, size_t N>
struct ConstexprArray {
    T elems[N];

    constexpr T const& operator[](size_t i) const { return elems[i]; }
    constexpr T& operator[](size_t i) { return elems[i]; }
    constexpr static size_t size() { return N; }

    constexpr T* begin(){return &elems[0];}
    constexpr T* end(){return &elems[N];}
    constexpr const T* begin() const {return &elems[0];}
    constexpr const T* end() const {return &elems[N];}
    using Type = T;
};

template <typename T, size_t N>
ConstexprArray(const T (&)[N]) -> ConstexprArray<T, N>;

template <typename T, typename... U>
ConstexprArray(T, U...) -> ConstexprArray<T, 1 + sizeof...(U)>;

template <typename T>
struct is_constexpr_array {
    static constexpr bool value = false;
};

template <typename T, size_t N>
struct is_constexpr_array<ConstexprArray<T, N>> {
    static constexpr bool value = true;
};

template <typename T, size_t N>
struct is_constexpr_array<const ConstexprArray<T, N>> {
    static constexpr bool value = true;
};

template <typename T>
concept IsConstexprArray = is_constexpr_array<T>::value;

template<typename T, size_t N>
constexpr bool isArraySorted(ConstexprArray<T, N> array){
    for(size_t i = 1; i < N; i++){
        if(array[i] < array[i-1]){
            return false;
        }
    }
    return true;
}

#endif //HERON_UTILITY_H
