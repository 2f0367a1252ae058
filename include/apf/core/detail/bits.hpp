// include/apf/core/detail/bits.hpp — Bit-field helpers shared by the integer and float layers.

#pragma once

#include <cstdint>

namespace apf::core::detail {

#if !defined(__SIZEOF_INT128__)
#error "apf::core requires __int128 support"
#endif

using uint128 = unsigned __int128;

inline constexpr int WORD_BITS = 64;

// Low `bits` bits set; saturates at a full word.
inline constexpr std::uint64_t low_mask(int bits) noexcept {
    if (bits <= 0) {
        return 0;
    }
    if (bits >= WORD_BITS) {
        return ~std::uint64_t{0};
    }
    return (std::uint64_t{1} << bits) - 1;
}

inline constexpr std::int64_t ieee_bias(int exponent_bits) noexcept {
    return (std::int64_t{1} << (exponent_bits - 1)) - 1;
}

// Places the hidden bit of a packed fraction explicitly above it.
inline constexpr std::uint64_t expand_mantissa_to_explicit(std::uint64_t fraction,
                                                           int fraction_bits,
                                                           bool leading_one) noexcept {
    const std::uint64_t body = fraction & low_mask(fraction_bits);
    return leading_one ? (body | (std::uint64_t{1} << fraction_bits)) : body;
}

} // namespace apf::core::detail
