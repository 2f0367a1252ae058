// python/bindings.cpp — Pybind11 bindings for the apf module.

#include <cstdint>
#include <string>

#include <pybind11/pybind11.h>

#include <apf/apf.hpp>

namespace py = pybind11;

namespace {

template <std::size_t Words> py::int_ to_python_int(const apf::core::bigint<Words>& value) {
    const auto builtins = py::module_::import("builtins");
    // Python accepts the "0x1_0000000000000000" digit grouping with base 0.
    return builtins.attr("int")(apf::io::to_string(value), 0);
}

template <int E, int M>
void bind_float_format(py::module_& module, const char* name, const char* doc) {
    using Format = apf::Float<E, M>;
    py::class_<Format> cls(module, name, doc);
    cls.def(py::init<>())
        .def_readonly_static("EXPONENT_BITS", &Format::EXPONENT_BITS)
        .def_readonly_static("MANTISSA_BITS", &Format::MANTISSA_BITS)
        .def_static("zero", &Format::zero, py::arg("negative") = false)
        .def_static("inf", &Format::inf, py::arg("negative") = false)
        .def_static("nan", &Format::nan, py::arg("negative") = false)
        .def_static("largest", &Format::largest, py::arg("negative") = false)
        .def_static("bias", &Format::bias)
        .def_static("exp_bounds", &Format::exp_bounds)
        .def_static("precision", &Format::precision)
        .def_static("from_u64", &Format::from_u64, py::arg("value"))
        .def_static("from_i64", &Format::from_i64, py::arg("value"))
        .def_static("from_f32", &Format::from_f32, py::arg("value"))
        .def_static("from_f64", &Format::from_f64, py::arg("value"))
        .def_static("from_f16_bits", &Format::template from_bits<5, 10>, py::arg("bits"),
                    "Decode an IEEE binary16 bit pattern")
        .def_static("from_bf16_bits", &Format::template from_bits<8, 7>, py::arg("bits"),
                    "Decode a bfloat16 bit pattern")
        .def_static("from_f32_bits", &Format::template from_bits<8, 23>, py::arg("bits"),
                    "Decode an IEEE binary32 bit pattern")
        .def_static("from_f64_bits", &Format::template from_bits<11, 52>, py::arg("bits"),
                    "Decode an IEEE binary64 bit pattern")
        .def("is_negative", &Format::is_negative)
        .def("is_inf", &Format::is_inf)
        .def("is_nan", &Format::is_nan)
        .def("is_zero", &Format::is_zero)
        .def("is_normal", &Format::is_normal)
        .def_property_readonly("category", &Format::category)
        .def_property_readonly("exponent", &Format::exponent)
        .def_property_readonly("mantissa",
                               [](const Format& self) { return to_python_int(self.mantissa()); })
        .def("to_f16_bits",
             [](const Format& self, apf::RoundingMode mode) {
                 return self.template cast<5, 10>(mode).to_bits();
             },
             py::arg("mode") = apf::RoundingMode::NearestTiesToEven)
        .def("to_bf16_bits",
             [](const Format& self, apf::RoundingMode mode) {
                 return self.template cast<8, 7>(mode).to_bits();
             },
             py::arg("mode") = apf::RoundingMode::NearestTiesToEven)
        .def("to_f32",
             [](const Format& self, apf::RoundingMode mode) {
                 return self.template cast<8, 23>(mode).as_f32();
             },
             py::arg("mode") = apf::RoundingMode::NearestTiesToEven)
        .def("to_f64",
             [](const Format& self, apf::RoundingMode mode) {
                 return self.template cast<11, 52>(mode).as_f64();
             },
             py::arg("mode") = apf::RoundingMode::NearestTiesToEven)
        .def("__float__", &Format::as_f64)
        .def("__neg__", [](const Format& self) { return -self; })
        .def("__abs__", [](const Format& self) {
            Format result = self;
            result.set_sign(false);
            return result;
        })
        .def("__eq__", [](const Format& a, const Format& b) { return a == b; })
        .def("__ne__", [](const Format& a, const Format& b) { return a != b; })
        .def("__repr__", [name](const Format& self) {
            return "<apf." + std::string(name) + " " + apf::io::to_string(self) + ">";
        })
        .def("__str__", [](const Format& self) { return apf::io::to_string(self); });
}

} // namespace

PYBIND11_MODULE(apf, module) {
    module.doc() = "Pybind11 bindings for the apf binary floating point formats";
    module.attr("VERSION") = py::make_tuple(apf::APF_VERSION_MAJOR, apf::APF_VERSION_MINOR,
                                            apf::APF_VERSION_PATCH);

    py::enum_<apf::RoundingMode>(module, "RoundingMode", "IEEE-754 rounding direction")
        .value("NEAREST_TIES_TO_EVEN", apf::RoundingMode::NearestTiesToEven)
        .value("NEAREST_TIES_TO_AWAY", apf::RoundingMode::NearestTiesToAway)
        .value("ZERO", apf::RoundingMode::Zero)
        .value("POSITIVE", apf::RoundingMode::Positive)
        .value("NEGATIVE", apf::RoundingMode::Negative);

    py::enum_<apf::Category>(module, "Category", "Classification of a float value")
        .value("INFINITY", apf::Category::Infinity)
        .value("NAN", apf::Category::NaN)
        .value("NORMAL", apf::Category::Normal)
        .value("ZERO", apf::Category::Zero);

    bind_float_format<5, 10>(module, "FP16", "IEEE binary16");
    bind_float_format<8, 7>(module, "BF16", "bfloat16");
    bind_float_format<8, 23>(module, "FP32", "IEEE binary32");
    bind_float_format<11, 52>(module, "FP64", "IEEE binary64");
    bind_float_format<15, 112>(module, "FP128", "IEEE binary128 (no native packing)");
    bind_float_format<19, 236>(module, "FP256", "IEEE binary256 (no native packing)");
}
