#pragma once

#include <cstddef>
#include <ostream>

#include <apf/core/bigint.hpp>
#include <apf/float.hpp>
#include <apf/io/format.hpp>

namespace apf::util {

template <std::size_t Words>
inline std::ostream& dump(std::ostream& os, const apf::core::bigint<Words>& value) {
    return os << "bigint<" << Words << ">(" << apf::io::to_string(value) << ')';
}

template <int E, int M>
inline std::ostream& dump(std::ostream& os, const apf::Float<E, M>& value) {
    return os << "Float<" << E << ',' << M << ">" << apf::io::to_string(value);
}

inline std::ostream& dump(std::ostream& os, apf::core::LossFraction loss) {
    return os << "loss(" << apf::core::to_string(loss) << ')';
}

} // namespace apf::util
