// include/apf/apf.hpp — Umbrella header that exposes the apf components.

#pragma once

// Users should generally include only this file.

#include <apf/core/bigint.hpp>
#include <apf/core/loss.hpp>
#include <apf/core/traits.hpp>
#include <apf/float.hpp>
#include <apf/io/format.hpp>
#include <apf/util/debug.hpp>

namespace apf {

    inline constexpr int APF_VERSION_MAJOR = 0;
    inline constexpr int APF_VERSION_MINOR = 1;
    inline constexpr int APF_VERSION_PATCH = 0;

} // namespace apf
