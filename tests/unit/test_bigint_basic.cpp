// tests/unit/test_bigint_basic.cpp — Construction, conversion, masking and msb queries.

#include <array>
#include <cstdint>
#include <iostream>
#include <random>
#include <stdexcept>

#include <apf/apf.hpp>
#include <apf/util/random.hpp>

namespace {

using apf::core::bigint;
using apf::core::detail::uint128;

} // namespace

int main() {
    bool all_good = true;
    const auto expect = [&](bool condition, const char* message) {
        if (!condition) {
            all_good = false;
            std::cerr << "bigint basic test failed: " << message << '\n';
        }
    };

    std::mt19937_64 rng(0x5eed0001);
    for (int iteration = 0; iteration < 1000; ++iteration) {
        const std::uint64_t value = rng();
        expect(bigint<4>::from_u64(value).to_u64() == value, "from_u64/to_u64 round trip");
        const uint128 wide = (static_cast<uint128>(rng()) << 64) | rng();
        expect(bigint<3>::from_u128(wide).to_u128() == wide, "from_u128/to_u128 round trip");
    }

    {
        const auto value = bigint<2>::from_words({0x1, 0x1});
        bool threw = false;
        try {
            (void)value.to_u64();
        } catch (const std::overflow_error&) {
            threw = true;
        }
        expect(threw, "to_u64 must reject a value with high bits set");
    }
    {
        const auto value = bigint<3>::from_words({0x0, 0x0, 0x1});
        bool threw = false;
        try {
            (void)value.to_u128();
        } catch (const std::overflow_error&) {
            threw = true;
        }
        expect(threw, "to_u128 must reject a value above 128 bits");
    }
    {
        bool threw = false;
        try {
            (void)bigint<1>::from_u128(static_cast<uint128>(1) << 64);
        } catch (const std::overflow_error&) {
            threw = true;
        }
        expect(threw, "from_u128 into one word must reject a high half");
        expect(bigint<1>::from_u128(42).to_u64() == 42, "from_u128 into one word keeps small values");
    }

    {
        const auto value = bigint<4>::from_words({1, 2, 3, 4});
        const auto low = value.truncate<2>();
        expect(low.word(0) == 1 && low.word(1) == 2, "truncate keeps the low words");
        const auto wide = low.extend<4>();
        expect(wide.word(2) == 0 && wide.word(3) == 0, "extend zero-fills the high words");
        expect(wide.truncate<2>() == low, "extend then truncate is the identity");
    }

    {
        auto value = bigint<3>::from_words({0b11111, 0b10101010101010, 0b111});
        value.mask(69);
        expect(value.word(0) == 0b11111, "mask leaves lower words alone");
        expect(value.word(1) == 0b01010, "mask keeps the bottom five bits of word one");
        expect(value.word(2) == 0, "mask clears words above the cut");

        auto all = bigint<3>::all_ones(192);
        all.mask(0);
        expect(all.is_zero(), "mask(0) clears everything");
    }

    {
        const auto ones = bigint<3>::all_ones(70);
        expect(ones.msb_index() == 70, "all_ones(70) has msb 70");
        expect(ones.word(0) == ~std::uint64_t{0}, "all_ones fills the low word");
        expect(ones.word(1) == 0x3f, "all_ones fills six bits of the second word");
        expect(ones.word(2) == 0, "all_ones leaves the top word empty");
    }

    expect(bigint<2>::zero().is_zero(), "zero is zero");
    expect(!bigint<2>::one().is_zero(), "one is not zero");
    expect(bigint<2>::from_u64(6).is_even(), "six is even");
    expect(bigint<2>::from_u64(7).is_odd(), "seven is odd");
    expect(bigint<2>::from_words({0, 1}).is_even(), "2^64 is even");

    expect(bigint<5>::from_u64(0xffffffff00000000ULL).msb_index() == 64, "msb of top-heavy word");
    expect(bigint<5>::from_u64(0).msb_index() == 0, "msb of zero");
    expect(bigint<5>::from_u64(1).msb_index() == 1, "msb of one");
    {
        auto value = bigint<5>::from_u64(1);
        value.shift_left(189);
        expect(value.msb_index() == 190, "msb after shifting by 189");
    }
    for (std::size_t bit = 0; bit < bigint<5>::BITS; ++bit) {
        auto value = bigint<5>::one();
        value.shift_left(bit);
        if (value.msb_index() != bit + 1) {
            all_good = false;
            std::cerr << "msb_index(1 << " << bit << ") = " << value.msb_index() << '\n';
        }
    }

    {
        bool threw = false;
        try {
            (void)bigint<2>::zero().word(2);
        } catch (const std::out_of_range&) {
            threw = true;
        }
        expect(threw, "word() past the end must throw");
    }

    {
        const auto value = apf::util::random_bigint<4>(rng, 100);
        expect(value.msb_index() <= 100, "random_bigint honours the bit limit");
    }

    if (!all_good) {
        std::cerr << "bigint basic tests failed\n";
        return 1;
    }
    std::cout << "bigint basic tests passed\n";
    return 0;
}
