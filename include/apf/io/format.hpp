// include/apf/io/format.hpp — Text rendering for bigints and floats.

#pragma once

#include <cstddef>
#include <format>
#include <ostream>
#include <string>
#include <string_view>

#include <apf/core/bigint.hpp>
#include <apf/float.hpp>

namespace apf::io {

    // Hex with the leading zero words dropped, e.g. "0x1_0000000000000000".
    template <std::size_t Words> std::string to_string(const core::bigint<Words> &value) {
        std::size_t top = Words;
        while (top > 1 && value.words()[top - 1] == 0) {
            --top;
        }
        std::string result = std::format("0x{:x}", value.words()[top - 1]);
        for (std::size_t index = top - 1; index-- > 0;) {
            result += std::format("_{:016x}", value.words()[index]);
        }
        return result;
    }

    template <int E, int M> std::string to_string(const Float<E, M> &value) {
        const char sign = value.is_negative() ? '-' : '+';
        switch (value.category()) {
        case Category::NaN:
            return std::format("[{}NaN]", sign);
        case Category::Infinity:
            return std::format("[{}Inf]", sign);
        case Category::Zero:
            return std::format("[{}0.0]", sign);
        case Category::Normal:
            break;
        }
        return std::format("FP[{} E={:4} M={}]", sign, value.exponent(),
                           to_string(value.mantissa()));
    }

} // namespace apf::io

namespace apf::core {

    template <std::size_t Words>
    std::ostream &operator<<(std::ostream &os, const bigint<Words> &value) {
        return os << apf::io::to_string(value);
    }

    inline std::ostream &operator<<(std::ostream &os, LossFraction loss) {
        return os << to_string(loss);
    }

} // namespace apf::core

namespace apf {

    template <int E, int M> std::ostream &operator<<(std::ostream &os, const Float<E, M> &value) {
        return os << io::to_string(value);
    }

    inline std::ostream &operator<<(std::ostream &os, RoundingMode mode) {
        return os << to_string(mode);
    }

    inline std::ostream &operator<<(std::ostream &os, Category category) {
        return os << to_string(category);
    }

} // namespace apf

namespace std {

    template <std::size_t Words>
    struct formatter<apf::core::bigint<Words>, char> : std::formatter<std::string_view, char> {
        template <typename FormatContext>
        auto format(const apf::core::bigint<Words> &value, FormatContext &ctx) const {
            const std::string text = apf::io::to_string(value);
            return std::formatter<std::string_view, char>::format(text, ctx);
        }
    };

    template <int E, int M>
    struct formatter<apf::Float<E, M>, char> : std::formatter<std::string_view, char> {
        template <typename FormatContext>
        auto format(const apf::Float<E, M> &value, FormatContext &ctx) const {
            const std::string text = apf::io::to_string(value);
            return std::formatter<std::string_view, char>::format(text, ctx);
        }
    };

} // namespace std
