// tests/unit/test_loss_fraction.cpp — Truncation loss classification and its combination rule.

#include <array>
#include <iostream>

#include <apf/apf.hpp>

namespace {

using apf::core::bigint;
using apf::core::LossFraction;

bool check_loss(LossFraction actual, LossFraction expected, const char* label) {
    if (actual == expected) {
        return true;
    }
    std::cerr << label << ": got " << apf::core::to_string(actual) << ", expected "
              << apf::core::to_string(expected) << '\n';
    return false;
}

bool test_shift_right_with_loss() {
    using mantissa = bigint<6>;
    bool good = true;
    {
        const auto [value, loss] = apf::core::shift_right_with_loss(mantissa::from_u64(0b10000000), 3);
        good = check_loss(loss, LossFraction::ExactlyZero, "0b10000000 >> 3") && good;
        good = good && value.to_u64() == 0b10000;
    }
    {
        const auto [value, loss] = apf::core::shift_right_with_loss(mantissa::from_u64(0b10000111), 3);
        good = check_loss(loss, LossFraction::MoreThanHalf, "0b10000111 >> 3") && good;
        good = good && value.to_u64() == 0b10000;
    }
    {
        const auto [value, loss] = apf::core::shift_right_with_loss(mantissa::from_u64(0b10000100), 3);
        good = check_loss(loss, LossFraction::ExactlyHalf, "0b10000100 >> 3") && good;
    }
    {
        const auto [value, loss] = apf::core::shift_right_with_loss(mantissa::from_u64(0b10000001), 3);
        good = check_loss(loss, LossFraction::LessThanHalf, "0b10000001 >> 3") && good;
    }
    return good;
}

bool test_truncation_edges() {
    bool good = true;
    const auto top_bit = bigint<2>::from_u64(0x8000000000000000ULL);
    good = check_loss(top_bit.loss_for_truncation_at(64), LossFraction::ExactlyHalf,
                      "top bit of the low word at a word boundary") && good;
    good = check_loss(top_bit.loss_for_truncation_at(65), LossFraction::LessThanHalf,
                      "top bit below a cut past the word") && good;
    good = check_loss(top_bit.loss_for_truncation_at(63), LossFraction::ExactlyZero,
                      "nothing below bit 63") && good;
    good = check_loss(top_bit.loss_for_truncation_at(0), LossFraction::ExactlyZero,
                      "cut at zero loses nothing") && good;
    good = check_loss(bigint<2>::all_ones(128).loss_for_truncation_at(129),
                      LossFraction::LessThanHalf, "cut above the width") && good;
    good = check_loss(bigint<2>::zero().loss_for_truncation_at(500), LossFraction::ExactlyZero,
                      "zero never loses anything") && good;
    good = check_loss(bigint<2>::all_ones(128).loss_for_truncation_at(128),
                      LossFraction::MoreThanHalf, "cut exactly at the width") && good;

    const auto cross_word = bigint<2>::from_words({0x0, 0x1});
    good = check_loss(cross_word.loss_for_truncation_at(65), LossFraction::ExactlyHalf,
                      "half in the second word") && good;
    const auto cross_word_tail = bigint<2>::from_words({0x1, 0x1});
    good = check_loss(cross_word_tail.loss_for_truncation_at(65), LossFraction::MoreThanHalf,
                      "half in the second word plus a tail") && good;
    return good;
}

bool test_combination() {
    constexpr std::array<LossFraction, 4> all = {
        LossFraction::ExactlyZero,
        LossFraction::LessThanHalf,
        LossFraction::ExactlyHalf,
        LossFraction::MoreThanHalf,
    };
    bool good = true;
    for (const auto msb : all) {
        good = check_loss(apf::core::combine_loss(msb, LossFraction::ExactlyZero), msb,
                          "exact tail keeps the first loss") && good;
    }
    for (const auto lsb : {LossFraction::LessThanHalf, LossFraction::ExactlyHalf,
                           LossFraction::MoreThanHalf}) {
        good = check_loss(apf::core::combine_loss(LossFraction::ExactlyZero, lsb),
                          LossFraction::LessThanHalf, "zero plus tail") && good;
        good = check_loss(apf::core::combine_loss(LossFraction::LessThanHalf, lsb),
                          LossFraction::LessThanHalf, "below half plus tail") && good;
        good = check_loss(apf::core::combine_loss(LossFraction::ExactlyHalf, lsb),
                          LossFraction::MoreThanHalf, "half plus tail") && good;
        good = check_loss(apf::core::combine_loss(LossFraction::MoreThanHalf, lsb),
                          LossFraction::MoreThanHalf, "above half plus tail") && good;
    }

    // Two shifts report what one equivalent shift would.
    const auto value = bigint<2>::from_u64(0b1011000001);
    const auto [once, single_loss] = apf::core::shift_right_with_loss(value, 7);
    const auto [first, first_loss] = apf::core::shift_right_with_loss(value, 3);
    const auto [twice, second_loss] = apf::core::shift_right_with_loss(first, 4);
    good = good && once == twice;
    good = check_loss(apf::core::combine_loss(second_loss, first_loss), single_loss,
                      "two-step shift matches the single shift") && good;
    return good;
}

bool test_helpers() {
    bool good = true;
    good = good && apf::core::is_gte_half(LossFraction::ExactlyHalf);
    good = good && apf::core::is_gte_half(LossFraction::MoreThanHalf);
    good = good && !apf::core::is_gte_half(LossFraction::LessThanHalf);
    good = good && apf::core::is_lte_half(LossFraction::LessThanHalf);
    good = good && !apf::core::is_lte_half(LossFraction::ExactlyZero);
    good = good && apf::core::invert(LossFraction::LessThanHalf) == LossFraction::MoreThanHalf;
    good = good && apf::core::invert(LossFraction::MoreThanHalf) == LossFraction::LessThanHalf;
    good = good && apf::core::invert(LossFraction::ExactlyHalf) == LossFraction::ExactlyHalf;
    good = good && apf::core::invert(LossFraction::ExactlyZero) == LossFraction::ExactlyZero;
    if (!good) {
        std::cerr << "loss fraction helper mismatch\n";
    }
    return good;
}

} // namespace

int main() {
    bool all_good = true;
    all_good = test_shift_right_with_loss() && all_good;
    all_good = test_truncation_edges() && all_good;
    all_good = test_combination() && all_good;
    all_good = test_helpers() && all_good;

    if (!all_good) {
        std::cerr << "loss fraction tests failed\n";
        return 1;
    }
    std::cout << "loss fraction tests passed\n";
    return 0;
}
