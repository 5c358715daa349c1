#pragma once

/// @file types.hpp
/// @brief Core type definitions for stock_math

#define GLM_FORCE_RADIANS

#include <glm/glm.hpp>

#include <cmath>
#include <limits>

namespace stock_math {

// =============================================================================
// Vector Types (GLM aliases)
// =============================================================================
using Vec2 = glm::vec2;

// =============================================================================
// Constants
// =============================================================================

namespace consts {
inline constexpr float EPSILON = 1e-6f;
inline constexpr float PI = 3.14159265358979323846f;
inline constexpr float MAX_FLOAT = std::numeric_limits<float>::max();
} // namespace consts

namespace vec2 {
    inline constexpr Vec2 ZERO  = Vec2(0.0f, 0.0f);
    inline constexpr Vec2 ONE   = Vec2(1.0f, 1.0f);
    inline constexpr Vec2 X     = Vec2(1.0f, 0.0f);
    inline constexpr Vec2 Y     = Vec2(0.0f, 1.0f);
}

// =============================================================================
// Scalar Helpers
// =============================================================================

/// Linear interpolation between two values
[[nodiscard]] constexpr float lerp(float a, float b, float t) noexcept {
    return a + (b - a) * t;
}

/// Clamp value into [lo, hi]
[[nodiscard]] constexpr float clamp(float value, float lo, float hi) noexcept {
    return value < lo ? lo : (value > hi ? hi : value);
}

/// Remap a value from one range to another (no clamping)
[[nodiscard]] inline float remap(float value, float in_min, float in_max,
                                 float out_min, float out_max) noexcept {
    float range = in_max - in_min;
    if (range > -consts::EPSILON && range < consts::EPSILON) {
        return out_min;
    }
    return out_min + (value - in_min) / range * (out_max - out_min);
}

/// Euclidean modulo: result is always in [0, m) for m > 0
[[nodiscard]] inline float wrap(float value, float m) noexcept {
    if (m <= 0.0f) {
        return 0.0f;
    }
    float r = value - m * std::floor(value / m);
    return r >= m ? 0.0f : r;
}

// =============================================================================
// Vector Helpers
// =============================================================================

/// Componentwise lerp
[[nodiscard]] inline Vec2 lerp(const Vec2& a, const Vec2& b, float t) noexcept {
    return Vec2(lerp(a.x, b.x, t), lerp(a.y, b.y, t));
}

/// Distance between two points
[[nodiscard]] inline float distance(const Vec2& a, const Vec2& b) noexcept {
    return glm::length(b - a);
}

/// Check two vectors are equal within a tolerance on each component
[[nodiscard]] inline bool almost_equal(const Vec2& a, const Vec2& b,
                                       float tolerance = 1e-3f) noexcept {
    return std::abs(a.x - b.x) <= tolerance && std::abs(a.y - b.y) <= tolerance;
}

} // namespace stock_math
