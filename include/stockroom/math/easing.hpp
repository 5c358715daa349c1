#pragma once

/// @file easing.hpp
/// @brief Easing curves used by layout containers

#include "types.hpp"

namespace stock_math {

/// Bounce-out curve; f(0) = 0, f(1) = 1
[[nodiscard]] inline float ease_out_bounce(float x) noexcept {
    constexpr float n1 = 7.5625f;
    constexpr float d1 = 2.75f;

    if (x < 1.0f / d1) {
        return n1 * x * x;
    }
    if (x < 2.0f / d1) {
        x -= 1.5f / d1;
        return n1 * x * x + 0.75f;
    }
    if (x < 2.5f / d1) {
        x -= 2.25f / d1;
        return n1 * x * x + 0.9375f;
    }
    x -= 2.625f / d1;
    return n1 * x * x + 0.984375f;
}

} // namespace stock_math
