// include/apf/core/bigint.hpp — Fixed-width multi-word unsigned integer.

#pragma once

#include <array>
#include <bit>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <utility>

#include <apf/core/detail/bits.hpp>
#include <apf/core/loss.hpp>

namespace apf::core {

template <std::size_t Words> class bigint {
public:
    static_assert(Words > 0, "bigint requires at least one word");

    using word_type = std::uint64_t;
    static constexpr std::size_t WORDS = Words;
    static constexpr std::size_t WORD_BITS = detail::WORD_BITS;
    static constexpr std::size_t BITS = Words * WORD_BITS;

    constexpr bigint() noexcept = default;
    constexpr bigint(const bigint&) noexcept = default;
    constexpr bigint& operator=(const bigint&) noexcept = default;

    explicit constexpr bigint(const std::array<word_type, Words>& words) noexcept
        : words_(words) {}

    static constexpr bigint zero() noexcept { return {}; }
    static constexpr bigint one() noexcept { return from_u64(1); }

    static constexpr bigint from_u64(std::uint64_t value) noexcept {
        bigint result;
        result.words_[0] = value;
        return result;
    }

    static constexpr bigint from_u128(detail::uint128 value) {
        bigint result;
        result.words_[0] = static_cast<word_type>(value);
        const auto high = static_cast<word_type>(value >> WORD_BITS);
        if constexpr (Words > 1) {
            result.words_[1] = high;
        } else {
            if (high != 0) {
                throw std::overflow_error("bigint value does not fit in one word");
            }
        }
        return result;
    }

    static constexpr bigint from_words(const std::array<word_type, Words>& words) noexcept {
        return bigint(words);
    }

    // The low `bits` bits set.
    static constexpr bigint all_ones(std::size_t bits) noexcept {
        bigint result;
        for (auto& word : result.words_) {
            word = ~word_type{0};
        }
        result.mask(bits);
        return result;
    }

    constexpr std::uint64_t to_u64() const {
        for (std::size_t index = 1; index < Words; ++index) {
            if (words_[index] != 0) {
                throw std::overflow_error("bigint does not fit in 64 bits");
            }
        }
        return words_[0];
    }

    constexpr detail::uint128 to_u128() const {
        for (std::size_t index = 2; index < Words; ++index) {
            if (words_[index] != 0) {
                throw std::overflow_error("bigint does not fit in 128 bits");
            }
        }
        detail::uint128 value = words_[0];
        if constexpr (Words > 1) {
            value |= static_cast<detail::uint128>(words_[1]) << WORD_BITS;
        }
        return value;
    }

    // Keeps the low Target words.
    template <std::size_t Target> constexpr bigint<Target> truncate() const noexcept {
        static_assert(Target <= Words, "cannot truncate bigint to a larger width");
        std::array<word_type, Target> words{};
        for (std::size_t index = 0; index < Target; ++index) {
            words[index] = words_[index];
        }
        return bigint<Target>(words);
    }

    // Zero-extends into a wider integer.
    template <std::size_t Target> constexpr bigint<Target> extend() const noexcept {
        static_assert(Target >= Words, "cannot extend bigint to a smaller width");
        std::array<word_type, Target> words{};
        for (std::size_t index = 0; index < Words; ++index) {
            words[index] = words_[index];
        }
        return bigint<Target>(words);
    }

    constexpr bool is_zero() const noexcept {
        for (const auto word : words_) {
            if (word != 0) {
                return false;
            }
        }
        return true;
    }

    constexpr bool is_even() const noexcept { return (words_[0] & 1U) == 0; }
    constexpr bool is_odd() const noexcept { return !is_even(); }

    constexpr word_type word(std::size_t index) const {
        if (index >= Words) {
            throw std::out_of_range("bigint word index out of range");
        }
        return words_[index];
    }

    constexpr const std::array<word_type, Words>& words() const noexcept { return words_; }

    // Zero out every bit at or above position `bits`.
    constexpr void mask(std::size_t bits) noexcept {
        for (std::size_t index = 0; index < Words; ++index) {
            const std::size_t start = index * WORD_BITS;
            if (bits >= start + WORD_BITS) {
                continue;
            }
            if (bits <= start) {
                words_[index] = 0;
                continue;
            }
            words_[index] &= detail::low_mask(static_cast<int>(bits - start));
        }
    }

    /// 1-based index of the highest set bit; zero when no bit is set.
    constexpr std::size_t msb_index() const noexcept {
        for (std::size_t index = Words; index-- > 0;) {
            const word_type word = words_[index];
            if (word != 0) {
                return index * WORD_BITS + (WORD_BITS - static_cast<std::size_t>(std::countl_zero(word)));
            }
        }
        return 0;
    }

    /// Classifies the bits below position `bit`, i.e. what a right shift by
    /// `bit` would throw away, relative to half of the kept unit.
    constexpr LossFraction loss_for_truncation_at(std::size_t bit) const noexcept {
        if (is_zero()) {
            return LossFraction::ExactlyZero;
        }
        if (bit > BITS) {
            return LossFraction::LessThanHalf;
        }
        bigint remainder = *this;
        remainder.mask(bit);
        if (remainder.is_zero()) {
            return LossFraction::ExactlyZero;
        }
        bigint half = one();
        half.shift_left(bit - 1);
        const auto ordering = remainder <=> half;
        if (ordering < 0) {
            return LossFraction::LessThanHalf;
        }
        if (ordering == 0) {
            return LossFraction::ExactlyHalf;
        }
        return LossFraction::MoreThanHalf;
    }

    // Returns true when the sum carried out of the top word.
    constexpr bool add_in_place(const bigint& other) noexcept {
        bool carry = false;
        for (std::size_t index = 0; index < Words; ++index) {
            const word_type partial = words_[index] + other.words_[index];
            const bool first = partial < words_[index];
            const word_type total = partial + static_cast<word_type>(carry);
            const bool second = total < partial;
            words_[index] = total;
            carry = first || second;
        }
        return carry;
    }

    // Returns true when the difference borrowed past the top word.
    constexpr bool sub_in_place(const bigint& other) noexcept {
        bool borrow = false;
        for (std::size_t index = 0; index < Words; ++index) {
            const word_type partial = words_[index] - other.words_[index];
            const bool first = partial > words_[index];
            const word_type total = partial - static_cast<word_type>(borrow);
            const bool second = total > partial;
            words_[index] = total;
            borrow = first || second;
        }
        return borrow;
    }

    /// Schoolbook product of two W-word values into a 2W-word result.
    constexpr bigint<2 * Words> multiply_wide(const bigint& other) const noexcept {
        std::array<word_type, 2 * Words> scratch{};
        for (std::size_t lhs = 0; lhs < Words; ++lhs) {
            detail::uint128 carry = 0;
            for (std::size_t rhs = 0; rhs < Words; ++rhs) {
                const detail::uint128 current =
                    static_cast<detail::uint128>(words_[lhs]) * other.words_[rhs] +
                    scratch[lhs + rhs] + carry;
                scratch[lhs + rhs] = static_cast<word_type>(current);
                carry = current >> WORD_BITS;
            }
            scratch[lhs + Words] = static_cast<word_type>(carry);
        }
        return bigint<2 * Words>(scratch);
    }

    // Keeps the low W words of the product; true if anything landed above them.
    constexpr bool multiply_in_place(const bigint& other) noexcept {
        const auto product = multiply_wide(other);
        bool overflow = false;
        for (std::size_t index = 0; index < Words; ++index) {
            words_[index] = product.words()[index];
            overflow = overflow || product.words()[index + Words] != 0;
        }
        return overflow;
    }

    constexpr void shift_left(std::size_t bits) noexcept {
        if (bits >= BITS) {
            words_.fill(0);
            return;
        }
        const std::size_t word_shift = bits / WORD_BITS;
        const std::size_t bit_shift = bits % WORD_BITS;
        for (std::size_t index = Words; index-- > 0;) {
            const word_type upper = index >= word_shift ? words_[index - word_shift] : 0;
            if (bit_shift == 0) {
                words_[index] = upper;
                continue;
            }
            const word_type lower = index > word_shift ? words_[index - word_shift - 1] : 0;
            words_[index] = (upper << bit_shift) | (lower >> (WORD_BITS - bit_shift));
        }
    }

    constexpr void shift_right(std::size_t bits) noexcept {
        if (bits >= BITS) {
            words_.fill(0);
            return;
        }
        const std::size_t word_shift = bits / WORD_BITS;
        const std::size_t bit_shift = bits % WORD_BITS;
        for (std::size_t index = 0; index < Words; ++index) {
            const word_type lower = index + word_shift < Words ? words_[index + word_shift] : 0;
            if (bit_shift == 0) {
                words_[index] = lower;
                continue;
            }
            const word_type upper =
                index + word_shift + 1 < Words ? words_[index + word_shift + 1] : 0;
            words_[index] = (lower >> bit_shift) | (upper << (WORD_BITS - bit_shift));
        }
    }

    constexpr bigint& operator+=(const bigint& other) noexcept {
        (void)add_in_place(other);
        return *this;
    }

    constexpr bigint& operator-=(const bigint& other) noexcept {
        (void)sub_in_place(other);
        return *this;
    }

    constexpr bigint& operator*=(const bigint& other) noexcept {
        (void)multiply_in_place(other);
        return *this;
    }

    constexpr bigint& operator<<=(std::size_t bits) noexcept {
        shift_left(bits);
        return *this;
    }

    constexpr bigint& operator>>=(std::size_t bits) noexcept {
        shift_right(bits);
        return *this;
    }

    friend constexpr bigint operator+(bigint lhs, const bigint& rhs) noexcept {
        lhs += rhs;
        return lhs;
    }

    friend constexpr bigint operator-(bigint lhs, const bigint& rhs) noexcept {
        lhs -= rhs;
        return lhs;
    }

    friend constexpr bigint operator*(bigint lhs, const bigint& rhs) noexcept {
        lhs *= rhs;
        return lhs;
    }

    friend constexpr bigint operator<<(bigint lhs, std::size_t bits) noexcept {
        lhs <<= bits;
        return lhs;
    }

    friend constexpr bigint operator>>(bigint lhs, std::size_t bits) noexcept {
        lhs >>= bits;
        return lhs;
    }

    friend constexpr bool operator==(const bigint& lhs, const bigint& rhs) noexcept {
        return lhs.words_ == rhs.words_;
    }

    friend constexpr std::strong_ordering operator<=>(const bigint& lhs,
                                                      const bigint& rhs) noexcept {
        for (std::size_t index = Words; index-- > 0;) {
            if (lhs.words_[index] != rhs.words_[index]) {
                return lhs.words_[index] <=> rhs.words_[index];
            }
        }
        return std::strong_ordering::equal;
    }

private:
    std::array<word_type, Words> words_{};
};

/// Shifts `value` right by `bits` and reports what fell off the end.
template <std::size_t Words>
constexpr std::pair<bigint<Words>, LossFraction> shift_right_with_loss(bigint<Words> value,
                                                                       std::size_t bits) noexcept {
    const LossFraction loss = value.loss_for_truncation_at(bits);
    value.shift_right(bits);
    return {value, loss};
}

} // namespace apf::core
