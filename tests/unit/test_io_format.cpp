// tests/unit/test_io_format.cpp — Text rendering, debug dumps and compile-time traits.

#include <cstdint>
#include <format>
#include <iostream>
#include <sstream>
#include <string>

#include <apf/apf.hpp>

int main() {
    using apf::core::bigint;

    bool all_good = true;
    const auto expect_text = [&](const std::string& actual, const std::string& expected) {
        if (actual != expected) {
            all_good = false;
            std::cerr << "format mismatch: got '" << actual << "', expected '" << expected << "'\n";
        }
    };

    expect_text(apf::io::to_string(bigint<2>::from_words({0x0, 0x1})), "0x1_0000000000000000");
    expect_text(apf::io::to_string(bigint<4>::zero()), "0x0");
    expect_text(apf::io::to_string(bigint<3>::from_u64(0xabc)), "0xabc");
    expect_text(apf::io::to_string(bigint<3>::from_words({0x5, 0x0, 0x2})),
                "0x2_0000000000000000_0000000000000005");

    expect_text(apf::io::to_string(apf::FP16::from_i64(15)), "FP[+ E=   3 M=0x780]");
    expect_text(apf::io::to_string(apf::FP16::from_i64(-1)), "FP[- E=   0 M=0x400]");
    expect_text(apf::io::to_string(apf::FP16::inf(true)), "[-Inf]");
    expect_text(apf::io::to_string(apf::FP32::nan()), "[+NaN]");
    expect_text(apf::io::to_string(apf::FP64::zero(true)), "[-0.0]");

    expect_text(std::format("{}", apf::FP16::from_u64(1)), "FP[+ E=   0 M=0x400]");
    expect_text(std::format("{:>8}", bigint<1>::from_u64(0xff)), "    0xff");

    {
        std::ostringstream stream;
        stream << apf::FP16::zero() << ' ' << apf::RoundingMode::Zero << ' '
               << apf::Category::Normal << ' ' << apf::LossFraction::ExactlyHalf;
        expect_text(stream.str(), "[+0.0] toward-zero normal exactly-half");
    }
    {
        std::ostringstream stream;
        apf::util::dump(stream, bigint<2>::from_u64(16));
        stream << ' ';
        apf::util::dump(stream, apf::FP16::inf());
        stream << ' ';
        apf::util::dump(stream, apf::LossFraction::LessThanHalf);
        expect_text(stream.str(), "bigint<2>(0x10) Float<5,10>[+Inf] loss(less-than-half)");
    }

    static_assert(apf::core::is_bigint_v<bigint<3>>);
    static_assert(!apf::core::is_bigint_v<std::uint64_t>);
    static_assert(apf::core::is_float_format_v<apf::BF16>);
    static_assert(!apf::core::is_float_format_v<double>);
    static_assert(apf::core::fits_native_word_v<apf::FP64>);
    static_assert(!apf::core::fits_native_word_v<apf::FP128>);
    static_assert(apf::APF_VERSION_MAJOR == 0);

    if (!all_good) {
        std::cerr << "io format tests failed\n";
        return 1;
    }
    std::cout << "io format tests passed\n";
    return 0;
}
