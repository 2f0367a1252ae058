// examples/example_precision.cpp — Walks one value through formats of growing precision.

#include <cstdint>
#include <iomanip>
#include <iostream>

#include <apf/apf.hpp>

int
main() {
    const double third = 1.0 / 3.0;
    const auto wide = apf::FP256::from_f64(third);

    std::cout << "1/3 as binary64 = " << std::setprecision(17) << third << "\n";
    std::cout << "FP256 holds it exactly: " << wide << "\n";
    std::cout << "FP16 " << wide.cast<5, 10>() << " -> " << wide.cast<5, 10>().as_f64() << "\n";
    std::cout << "BF16 " << wide.cast<8, 7>() << " -> " << wide.cast<8, 7>().as_f64() << "\n";
    std::cout << "FP32 " << wide.cast<8, 23>() << " -> " << wide.as_f32() << "\n";
    std::cout << "FP64 " << wide.cast<11, 52>() << " -> " << wide.as_f64() << "\n";

    // Integers beyond 2^11 start to lose their low bits in binary16.
    for (const std::uint64_t value : {2047U, 2048U, 2049U, 2051U, 65504U, 65535U}) {
        const auto half = apf::FP16::from_u64(value);
        std::cout << value << " -> " << half.as_f64() << " (bits 0x" << std::hex
                  << half.to_bits() << std::dec << ")\n";
    }

    const auto [exp_min, exp_max] = apf::FP16::exp_bounds();
    std::cout << "binary16 exponent range [" << exp_min << ", " << exp_max << "], bias "
              << apf::FP16::bias() << ", largest " << apf::FP16::largest().as_f64() << "\n";
    return 0;
}
