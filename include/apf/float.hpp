// include/apf/float.hpp — Binary floating point with compile-time exponent and mantissa widths.

#pragma once

#include <bit>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <utility>

#include <apf/core/bigint.hpp>
#include <apf/core/detail/bits.hpp>
#include <apf/core/loss.hpp>

namespace apf {

    namespace detail {
        // 384 bits: room for the widest alias plus the rounding carry.
        inline constexpr std::size_t MANTISSA_WORDS = 6;
    } // namespace detail

    using core::LossFraction;

    enum class RoundingMode : std::uint8_t {
        NearestTiesToEven,
        NearestTiesToAway,
        Zero,
        Positive,
        Negative,
    };

    enum class Category : std::uint8_t {
        Infinity,
        NaN,
        Normal,
        Zero,
    };

    /// IEEE-754 style binary float with an E-bit exponent field and an M-bit
    /// fraction field.
    ///
    /// A Normal value denotes (-1)^sign * mantissa * 2^(exp - (precision - 1)).
    /// The mantissa keeps its leading one explicitly, so once normalized its
    /// msb_index() equals precision(). Values clamped at the minimum exponent
    /// may carry a shorter mantissa; they are the hardware subnormals.
    template <int E, int M> class Float {
      public:
        static_assert(E >= 2 && E <= 30, "Float exponent width must be in [2, 30]");
        static_assert(M >= 1, "Float needs at least one fraction bit");

        using mantissa_type = core::bigint<detail::MANTISSA_WORDS>;
        static_assert(M + 2 <= static_cast<int>(mantissa_type::BITS),
                      "Float fraction does not fit the mantissa storage");

        static constexpr int EXPONENT_BITS = E;
        static constexpr int MANTISSA_BITS = M;

        constexpr Float() noexcept = default;

        /// A Normal value (Zero when the mantissa is zero). Not normalized.
        static constexpr Float make(bool sign, std::int64_t exp,
                                    const mantissa_type &mantissa) noexcept {
            if (mantissa.is_zero()) {
                return zero(sign);
            }
            return Float(sign, exp, mantissa, Category::Normal);
        }

        static constexpr Float raw(bool sign, std::int64_t exp, const mantissa_type &mantissa,
                                   Category category) noexcept {
            return Float(sign, exp, mantissa, category);
        }

        static constexpr Float zero(bool sign = false) noexcept {
            return Float(sign, 0, mantissa_type::zero(), Category::Zero);
        }

        static constexpr Float inf(bool sign = false) noexcept {
            return Float(sign, 0, mantissa_type::zero(), Category::Infinity);
        }

        static constexpr Float nan(bool sign = false) noexcept {
            return Float(sign, 0, mantissa_type::zero(), Category::NaN);
        }

        // The finite value of greatest magnitude.
        static constexpr Float largest(bool sign = false) noexcept {
            return make(sign, exp_bounds().second,
                        mantissa_type::all_ones(static_cast<std::size_t>(precision())));
        }

        static constexpr std::int64_t bias() noexcept {
            return core::detail::ieee_bias(E);
        }

        /// {exp_min, exp_max}. The top exponent code is reserved for Inf/NaN
        /// and the bottom one for subnormals.
        static constexpr std::pair<std::int64_t, std::int64_t> exp_bounds() noexcept {
            const std::int64_t exp_min = -bias() + 1;
            const std::int64_t exp_max = (std::int64_t{1} << E) - bias() - 2;
            return {exp_min, exp_max};
        }

        // Significand bits including the integer bit.
        static constexpr std::int64_t precision() noexcept {
            return M + 1;
        }

        constexpr bool is_negative() const noexcept { return sign_; }
        constexpr bool is_inf() const noexcept { return category_ == Category::Infinity; }
        constexpr bool is_nan() const noexcept { return category_ == Category::NaN; }
        constexpr bool is_zero() const noexcept { return category_ == Category::Zero; }
        constexpr bool is_normal() const noexcept { return category_ == Category::Normal; }

        constexpr bool sign() const noexcept { return sign_; }
        constexpr std::int64_t exponent() const noexcept { return exp_; }
        constexpr const mantissa_type &mantissa() const noexcept { return mantissa_; }
        constexpr Category category() const noexcept { return category_; }

        constexpr void set_sign(bool sign) noexcept { sign_ = sign; }

        constexpr Float neg() const noexcept {
            return raw(!sign_, exp_, mantissa_, category_);
        }

        constexpr Float operator-() const noexcept { return neg(); }

        /// True if |*this| < |other|. Both operands must be finite and normalized.
        constexpr bool absolute_less_than(const Float &other) const noexcept {
            if (other.is_zero()) {
                return false;
            }
            if (is_zero()) {
                return true;
            }
            if (exp_ != other.exp_) {
                return exp_ < other.exp_;
            }
            return mantissa_ < other.mantissa_;
        }

        constexpr void shift_significand_left(std::size_t bits) noexcept {
            exp_ -= static_cast<std::int64_t>(bits);
            mantissa_.shift_left(bits);
        }

        constexpr LossFraction shift_significand_right(std::size_t bits) noexcept {
            exp_ += static_cast<std::int64_t>(bits);
            const auto [shifted, loss] = core::shift_right_with_loss(mantissa_, bits);
            mantissa_ = shifted;
            return loss;
        }

        // Throws std::logic_error if a Normal value breaks the normalized form.
        constexpr void check_bounds() const {
            if (category_ != Category::Normal) {
                return;
            }
            const auto [exp_min, exp_max] = exp_bounds();
            if (exp_ < exp_min || exp_ > exp_max) {
                throw std::logic_error("float exponent outside the format range");
            }
            const auto msb = static_cast<std::int64_t>(mantissa_.msb_index());
            if (msb > precision()) {
                throw std::logic_error("float mantissa wider than the format precision");
            }
            if (msb < precision() && exp_ != exp_min) {
                throw std::logic_error("float mantissa is not normalized");
            }
        }

        /// Aligns the mantissa to precision(), applies the exponent bounds and
        /// rounds according to `mode`. `loss` describes bits the caller already
        /// discarded below the current mantissa.
        constexpr void normalize(RoundingMode mode, LossFraction loss) {
            if (category_ != Category::Normal) {
                return;
            }
            const auto [exp_min, exp_max] = exp_bounds();
            const auto nmsb = static_cast<std::int64_t>(mantissa_.msb_index());

            if (nmsb > 0) {
                std::int64_t exp_change = nmsb - precision();

                if (exp_ + exp_change > exp_max) {
                    overflow(mode);
                    return;
                }

                // No exponent below exp_min; the mantissa gives up bits instead.
                if (exp_ + exp_change < exp_min) {
                    exp_change = exp_min - exp_;
                }

                if (exp_change < 0) {
                    if (loss != LossFraction::ExactlyZero) {
                        throw std::logic_error("normalize cannot widen a mantissa with pending loss");
                    }
                    shift_significand_left(static_cast<std::size_t>(-exp_change));
                    return;
                }

                if (exp_change > 0) {
                    const LossFraction shifted = shift_significand_right(shift_amount(exp_change));
                    loss = core::combine_loss(shifted, loss);
                }
            }

            if (loss == LossFraction::ExactlyZero) {
                if (mantissa_.is_zero()) {
                    *this = zero(sign_);
                }
                return;
            }

            if (need_round_away_from_zero(mode, loss)) {
                if (mantissa_.is_zero()) {
                    exp_ = exp_min;
                }
                mantissa_ += mantissa_type::one();
                if (static_cast<std::int64_t>(mantissa_.msb_index()) > precision()) {
                    if (exp_ < exp_max) {
                        (void)shift_significand_right(1);
                    } else {
                        *this = inf(sign_);
                        return;
                    }
                }
            }

            if (mantissa_.is_zero()) {
                *this = zero(sign_);
            }
        }

        static constexpr Float from_u64(std::uint64_t value) {
            if (value == 0) {
                return zero(false);
            }
            const std::int64_t size = 63 - std::countl_zero(value);
            if (size > exp_bounds().second) {
                return inf(false);
            }
            // mantissa * 2^(precision - 1 - (precision - 1)) == value
            Float result = make(false, precision() - 1, mantissa_type::from_u64(value));
            result.normalize(RoundingMode::NearestTiesToEven, LossFraction::ExactlyZero);
            return result;
        }

        static constexpr Float from_i64(std::int64_t value) {
            if (value < 0) {
                Float result = from_u64(std::uint64_t{0} - static_cast<std::uint64_t>(value));
                result.set_sign(true);
                return result;
            }
            return from_u64(static_cast<std::uint64_t>(value));
        }

        /// Decodes an IEEE-754 bit pattern with an E2-bit exponent field and
        /// an M2-bit fraction field, rounding into this format.
        template <int E2, int M2> static constexpr Float from_bits(std::uint64_t bits) {
            static_assert(E2 >= 2 && M2 >= 1 && E2 + M2 + 1 <= 64,
                          "packed format must fit in 64 bits");
            const std::uint64_t field_mask = core::detail::low_mask(E2);
            const std::uint64_t field = (bits >> M2) & field_mask;
            const bool sign = ((bits >> (E2 + M2)) & 1U) != 0;
            const std::uint64_t fraction = bits & core::detail::low_mask(M2);

            if (field == field_mask) {
                return fraction == 0 ? inf(sign) : nan(sign);
            }
            if (field == 0 && fraction == 0) {
                return zero(sign);
            }

            const std::int64_t source_bias = core::detail::ieee_bias(E2);
            const std::int64_t exp =
                field == 0 ? 1 - source_bias : static_cast<std::int64_t>(field) - source_bias;
            const auto [exp_min, exp_max] = exp_bounds();
            if (exp < exp_min) {
                return zero(sign);
            }
            if (exp > exp_max) {
                return inf(sign);
            }

            const auto mantissa = mantissa_type::from_u64(
                core::detail::expand_mantissa_to_explicit(fraction, M2, field != 0));
            Float result = make(sign, exp + M - M2, mantissa);
            result.normalize(RoundingMode::NearestTiesToEven, LossFraction::ExactlyZero);
            return result;
        }

        static constexpr Float from_f32(float value) {
            return from_bits<8, 23>(std::bit_cast<std::uint32_t>(value));
        }

        static constexpr Float from_f64(double value) {
            return from_bits<11, 52>(std::bit_cast<std::uint64_t>(value));
        }

        /// The same value in another format, rounded with `mode`.
        template <int E2, int M2>
        constexpr Float<E2, M2> cast(RoundingMode mode = RoundingMode::NearestTiesToEven) const {
            using target = Float<E2, M2>;
            std::int64_t exp = exp_;
            if (category_ == Category::Normal) {
                exp += target::precision() - precision();
            }
            target result = target::raw(sign_, exp, mantissa_, category_);
            result.normalize(mode, LossFraction::ExactlyZero);
            return result;
        }

        /// Packs this (normalized) value into its IEEE-754 interchange layout.
        /// NaN always encodes as the canonical quiet NaN.
        constexpr std::uint64_t to_bits() const {
            static_assert(E + M + 1 <= 64, "format does not fit in a native word");
            std::uint64_t field = 0;
            std::uint64_t fraction = 0;
            switch (category_) {
            case Category::Infinity:
                field = core::detail::low_mask(E);
                break;
            case Category::NaN:
                field = core::detail::low_mask(E);
                fraction = std::uint64_t{1} << (M - 1);
                break;
            case Category::Zero:
                break;
            case Category::Normal: {
                check_bounds();
                mantissa_type significand = mantissa_;
                if (static_cast<std::int64_t>(significand.msb_index()) == precision()) {
                    field = static_cast<std::uint64_t>(exp_ + bias());
                    significand.mask(M);
                }
                fraction = significand.to_u64();
                break;
            }
            }
            const std::uint64_t sign = sign_ ? 1U : 0U;
            return (sign << (E + M)) | (field << M) | fraction;
        }

        template <int E2, int M2> constexpr std::uint64_t as_native_float() const {
            return cast<E2, M2>().to_bits();
        }

        constexpr float as_f32() const {
            return std::bit_cast<float>(static_cast<std::uint32_t>(as_native_float<8, 23>()));
        }

        constexpr double as_f64() const {
            return std::bit_cast<double>(as_native_float<11, 52>());
        }

        friend constexpr bool operator==(const Float &, const Float &) noexcept = default;

      private:
        constexpr Float(bool sign, std::int64_t exp, const mantissa_type &mantissa,
                        Category category) noexcept
            : sign_(sign), exp_(exp), mantissa_(mantissa), category_(category) {}

        // Shifts past the storage width all behave alike.
        static constexpr std::size_t shift_amount(std::int64_t bits) noexcept {
            constexpr auto limit = static_cast<std::int64_t>(mantissa_type::BITS + 1);
            return static_cast<std::size_t>(bits < limit ? bits : limit);
        }

        constexpr void overflow(RoundingMode mode) noexcept {
            switch (mode) {
            case RoundingMode::NearestTiesToEven:
            case RoundingMode::NearestTiesToAway:
                *this = inf(sign_);
                return;
            case RoundingMode::Zero:
                *this = largest(sign_);
                return;
            case RoundingMode::Positive:
                *this = sign_ ? largest(true) : inf(false);
                return;
            case RoundingMode::Negative:
                *this = sign_ ? inf(true) : largest(false);
                return;
            }
        }

        constexpr bool need_round_away_from_zero(RoundingMode mode,
                                                 LossFraction loss) const noexcept {
            switch (mode) {
            case RoundingMode::Positive:
                return !sign_;
            case RoundingMode::Negative:
                return sign_;
            case RoundingMode::Zero:
                return false;
            case RoundingMode::NearestTiesToAway:
                return core::is_gte_half(loss);
            case RoundingMode::NearestTiesToEven:
                if (loss == LossFraction::MoreThanHalf) {
                    return true;
                }
                return loss == LossFraction::ExactlyHalf && mantissa_.is_odd();
            }
            return false;
        }

        bool sign_ = false;
        std::int64_t exp_ = 0;
        mantissa_type mantissa_{};
        Category category_ = Category::Zero;
    };

    using FP16 = Float<5, 10>;
    using BF16 = Float<8, 7>;
    using FP32 = Float<8, 23>;
    using FP64 = Float<11, 52>;
    using FP128 = Float<15, 112>;
    using FP256 = Float<19, 236>;

    inline constexpr const char *to_string(RoundingMode mode) noexcept {
        switch (mode) {
        case RoundingMode::NearestTiesToEven:
            return "nearest-ties-to-even";
        case RoundingMode::NearestTiesToAway:
            return "nearest-ties-to-away";
        case RoundingMode::Zero:
            return "toward-zero";
        case RoundingMode::Positive:
            return "toward-positive";
        case RoundingMode::Negative:
            return "toward-negative";
        }
        return "?";
    }

    inline constexpr const char *to_string(Category category) noexcept {
        switch (category) {
        case Category::Infinity:
            return "infinity";
        case Category::NaN:
            return "nan";
        case Category::Normal:
            return "normal";
        case Category::Zero:
            return "zero";
        }
        return "?";
    }

} // namespace apf
