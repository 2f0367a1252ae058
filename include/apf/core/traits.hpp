// include/apf/core/traits.hpp — Compile-time traits for bigints and float formats.

#pragma once

#include <cstddef>
#include <type_traits>

#include <apf/core/bigint.hpp>
#include <apf/float.hpp>

namespace apf::core {

    template <typename T> struct is_bigint : std::false_type {};

    template <std::size_t Words> struct is_bigint<bigint<Words>> : std::true_type {};

    template <typename T> inline constexpr bool is_bigint_v = is_bigint<T>::value;

    template <typename T> struct is_float_format : std::false_type {};

    template <int E, int M> struct is_float_format<apf::Float<E, M>> : std::true_type {};

    template <typename T> inline constexpr bool is_float_format_v = is_float_format<T>::value;

    // True when T packs into a native 64-bit word.
    template <typename T>
    inline constexpr bool fits_native_word_v =
        is_float_format_v<T> && (T::EXPONENT_BITS + T::MANTISSA_BITS + 1 <= 64);

} // namespace apf::core
