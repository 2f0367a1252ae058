// include/apf/util/special_values.hpp — Doubles that stress rounding and range edges.

#pragma once

#include <bit>
#include <cstdint>
#include <limits>
#include <vector>

namespace apf::util {

namespace detail {

inline double from_f64_bits(std::uint64_t bits) { return std::bit_cast<double>(bits); }

inline double from_f32_bits(std::uint32_t bits) {
    return static_cast<double>(std::bit_cast<float>(bits));
}

} // namespace detail

/// Values around the binary32 range and precision limits, both signs, plus
/// the special encodings.
inline std::vector<double> special_test_values() {
    using limits = std::numeric_limits<double>;
    using flimits = std::numeric_limits<float>;
    std::vector<double> magnitudes = {
        0.0,
        1.0,
        0.5,
        0.1,
        0.3,
        1.0 / 3.0,
        355.0 / 113.0,
        65504.0,
        65520.0,
        16777216.0,
        16777217.0,
        16777218.0,
        16777219.0,
        1e10,
        1e-10,
        1e38,
        1e39,
        1e-38,
        1e-40,
        1e-45,
        1e-46,
        1e300,
        1e-300,
        static_cast<double>(flimits::max()),
        static_cast<double>(flimits::min()),
        static_cast<double>(flimits::denorm_min()),
        static_cast<double>(flimits::epsilon()),
        limits::max(),
        limits::min(),
        limits::denorm_min(),
        limits::epsilon(),
        // Halfway between FLT_MAX and the next binade: rounds to infinity.
        detail::from_f64_bits(0x47efffffF0000000ULL),
        // Just below that halfway point: rounds to FLT_MAX.
        detail::from_f64_bits(0x47efffffEfffffffULL),
        // Halfway between 1.0f and its successor, and one ulp either side.
        detail::from_f64_bits(0x3ff0000010000000ULL),
        detail::from_f64_bits(0x3ff000000fffffffULL),
        detail::from_f64_bits(0x3ff0000010000001ULL),
        // 1.0f + 1 ulp plus an exact f32 half-ulp: odd tie rounds up.
        detail::from_f64_bits(0x3ff0000030000000ULL),
        // Half of the smallest f32 subnormal, and a hair above and below it.
        detail::from_f64_bits(0x3690000000000000ULL),
        detail::from_f64_bits(0x3690000000000001ULL),
        detail::from_f64_bits(0x368fffffffffffffULL),
        // 1.5 f32 subnormal units: tie between odd 1 and even 2.
        detail::from_f64_bits(0x36a8000000000000ULL),
        // Largest f32 subnormal plus a half unit: carries into the smallest normal.
        detail::from_f64_bits(0x380fffffE0000000ULL),
        detail::from_f32_bits(0x007fffffU),
        detail::from_f32_bits(0x00800001U),
        detail::from_f32_bits(0x3f8fffffU),
        detail::from_f32_bits(0x7f7ffffeU),
        limits::infinity(),
        limits::quiet_NaN(),
        limits::signaling_NaN(),
    };
    std::vector<double> values;
    values.reserve(magnitudes.size() * 2);
    for (const double value : magnitudes) {
        values.push_back(value);
        values.push_back(-value);
    }
    return values;
}

} // namespace apf::util
