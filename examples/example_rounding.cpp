// examples/example_rounding.cpp — Shows how each rounding mode narrows the same values.

#include <cstdint>
#include <iostream>

#include <apf/apf.hpp>

int
main() {
    constexpr apf::RoundingMode modes[] = {
        apf::RoundingMode::NearestTiesToEven, apf::RoundingMode::NearestTiesToAway,
        apf::RoundingMode::Zero, apf::RoundingMode::Positive, apf::RoundingMode::Negative,
    };

    // 2651 sits exactly between two binary16 neighbours; 1e5 is out of range.
    for (const std::int64_t value : {2651, -2651, 100000}) {
        const auto single = apf::FP32::from_i64(value);
        std::cout << value << ":\n";
        for (const auto mode : modes) {
            std::cout << "  " << mode << " -> " << single.cast<5, 10>(mode).as_f64() << "\n";
        }
    }

    // Below the smallest binary16 subnormal.
    const auto tiny = apf::FP32::from_f64(3e-8);
    std::cout << "3e-8:\n";
    for (const auto mode : modes) {
        const auto half = tiny.cast<5, 10>(mode);
        std::cout << "  " << mode << " -> " << half << " bits 0x" << std::hex << half.to_bits()
                  << std::dec << "\n";
    }
    return 0;
}
