#pragma once

/// @file rect.hpp
/// @brief 2D axis-aligned rectangle for stock_math
///
/// Rect is position (top-left corner) plus size, matching how shelves and
/// products lay out slots left-to-right from their origin.

#include "types.hpp"

namespace stock_math {

// =============================================================================
// Rect (2D Axis-Aligned Bounding Box)
// =============================================================================

struct Rect {
    Vec2 position = vec2::ZERO;  ///< Top-left corner
    Vec2 size = vec2::ZERO;      ///< Width/height (non-negative)

    constexpr Rect() noexcept = default;

    constexpr Rect(const Vec2& pos, const Vec2& sz) noexcept
        : position(pos), size(sz) {}

    /// Create from min and max corners
    static Rect from_min_max(const Vec2& min_point, const Vec2& max_point) noexcept {
        return Rect(min_point, max_point - min_point);
    }

    [[nodiscard]] Vec2 min() const noexcept { return position; }
    [[nodiscard]] Vec2 max() const noexcept { return position + size; }

    [[nodiscard]] Vec2 center() const noexcept {
        return position + size * 0.5f;
    }

    [[nodiscard]] bool contains_point(const Vec2& point) const noexcept {
        return point.x >= position.x && point.x <= position.x + size.x &&
               point.y >= position.y && point.y <= position.y + size.y;
    }

    /// Overlap test; rectangles that only touch along an edge do not overlap
    [[nodiscard]] bool overlaps(const Rect& other) const noexcept {
        return position.x < other.position.x + other.size.x &&
               position.x + size.x > other.position.x &&
               position.y < other.position.y + other.size.y &&
               position.y + size.y > other.position.y;
    }

    /// Distance between the two rectangle centres
    [[nodiscard]] float center_distance(const Rect& other) const noexcept {
        return distance(center(), other.center());
    }

    [[nodiscard]] Rect translated(const Vec2& offset) const noexcept {
        return Rect(position + offset, size);
    }

    [[nodiscard]] bool operator==(const Rect& other) const noexcept {
        return position == other.position && size == other.size;
    }
};

} // namespace stock_math
