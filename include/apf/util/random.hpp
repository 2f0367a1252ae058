#pragma once

#include <array>
#include <bit>
#include <cstddef>
#include <cstdint>
#include <random>

#include <apf/core/bigint.hpp>
#include <apf/core/detail/bits.hpp>

namespace apf::util {

template <std::size_t Words>
inline apf::core::bigint<Words> random_bigint(std::mt19937_64& generator) {
    std::array<std::uint64_t, Words> words{};
    for (auto& word : words) {
        word = generator();
    }
    return apf::core::bigint<Words>::from_words(words);
}

// Random value with only the low `bits` bits populated.
template <std::size_t Words>
inline apf::core::bigint<Words> random_bigint(std::mt19937_64& generator, std::size_t bits) {
    auto value = random_bigint<Words>(generator);
    value.mask(bits);
    return value;
}

// Uniform over bit patterns whose exponent field is not all ones.
template <int E, int M>
inline std::uint64_t random_finite_bits(std::mt19937_64& generator) {
    static_assert(E + M + 1 <= 64, "packed format must fit in 64 bits");
    const std::uint64_t field_mask = apf::core::detail::low_mask(E);
    const std::uint64_t pattern_mask = apf::core::detail::low_mask(E + M + 1);
    for (;;) {
        const std::uint64_t bits = generator() & pattern_mask;
        if (((bits >> M) & field_mask) != field_mask) {
            return bits;
        }
    }
}

inline float random_finite_f32(std::mt19937_64& generator) {
    return std::bit_cast<float>(static_cast<std::uint32_t>(random_finite_bits<8, 23>(generator)));
}

inline double random_finite_f64(std::mt19937_64& generator) {
    return std::bit_cast<double>(random_finite_bits<11, 52>(generator));
}

} // namespace apf::util
