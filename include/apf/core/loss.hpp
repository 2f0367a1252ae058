// include/apf/core/loss.hpp — Classification of bits discarded by a truncating shift.

#pragma once

#include <cstdint>

namespace apf::core {

// Bits below the cut, as a fraction of one unit in the last kept place.
enum class LossFraction : std::uint8_t {
    ExactlyZero,  // 0000000
    LessThanHalf, // 0xxxxxx
    ExactlyHalf,  // 1000000
    MoreThanHalf, // 1xxxxxx
};

inline constexpr bool is_lte_half(LossFraction loss) noexcept {
    return loss == LossFraction::LessThanHalf || loss == LossFraction::ExactlyHalf;
}

inline constexpr bool is_gte_half(LossFraction loss) noexcept {
    return loss == LossFraction::ExactlyHalf || loss == LossFraction::MoreThanHalf;
}

// Loss of the complement, as seen by a subtraction that borrows the lost bits.
inline constexpr LossFraction invert(LossFraction loss) noexcept {
    switch (loss) {
    case LossFraction::LessThanHalf:
        return LossFraction::MoreThanHalf;
    case LossFraction::MoreThanHalf:
        return LossFraction::LessThanHalf;
    case LossFraction::ExactlyZero:
    case LossFraction::ExactlyHalf:
        break;
    }
    return loss;
}

/// Combines two successive truncations: `msb` is the loss of the bits just
/// below the kept ones, `lsb` the loss of an earlier, less significant cut.
/// Any non-zero tail nudges an exact result off its boundary.
inline constexpr LossFraction combine_loss(LossFraction msb, LossFraction lsb) noexcept {
    if (lsb != LossFraction::ExactlyZero) {
        if (msb == LossFraction::ExactlyZero) {
            return LossFraction::LessThanHalf;
        }
        if (msb == LossFraction::ExactlyHalf) {
            return LossFraction::MoreThanHalf;
        }
    }
    return msb;
}

inline constexpr const char *to_string(LossFraction loss) noexcept {
    switch (loss) {
    case LossFraction::ExactlyZero:
        return "exactly-zero";
    case LossFraction::LessThanHalf:
        return "less-than-half";
    case LossFraction::ExactlyHalf:
        return "exactly-half";
    case LossFraction::MoreThanHalf:
        return "more-than-half";
    }
    return "?";
}

} // namespace apf::core
