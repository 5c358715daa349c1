/// @file types.hpp
/// @brief Core types and enumerations for stock_puzzle module

#pragma once

#include "fwd.hpp"

#include <stockroom/math/math.hpp>

#include <cstdint>
#include <optional>
#include <string_view>

namespace stock_puzzle {

using stock_math::Vec2;
using stock_math::Rect;

// =============================================================================
// Shelf Kinds
// =============================================================================

/// @brief Concrete shelf type, named as in content files
enum class ShelfKind : std::uint8_t {
    Basic,         ///< "shelf"
    Closing,       ///< "closing-shelf"
    Display,       ///< "display-shelf"
    Deep,          ///< "deep-shelf"
    Disappearing,  ///< "disappearing-shelf"
    Supply,        ///< "supply-shelf"
    Locking        ///< "locking-shelf"
};

/// @brief Content name of a shelf kind
[[nodiscard]] const char* shelf_kind_name(ShelfKind kind);

/// @brief Parse a content shelf type name
[[nodiscard]] std::optional<ShelfKind> shelf_kind_from_string(std::string_view name);

/// @brief True for kinds that wrap another shelf
[[nodiscard]] constexpr bool is_wrapper_kind(ShelfKind kind) {
    return kind == ShelfKind::Disappearing || kind == ShelfKind::Supply || kind == ShelfKind::Locking;
}

/// @brief Whether a wrapper of kind @p outer may wrap a shelf of kind @p inner
[[nodiscard]] bool can_wrap(ShelfKind outer, ShelfKind inner);

// =============================================================================
// Layout Enumerations
// =============================================================================

/// @brief Axis along which a container arranges its children
enum class Orientation : std::uint8_t {
    Horizontal,
    Vertical
};

/// @brief Anchor of a collapse group within its grid footprint
enum class CollapseDirection : std::uint8_t {
    Positive,  ///< Packed against the far end of the axis
    Negative,  ///< Packed against the start of the axis
    Center     ///< Centred on the axis
};

[[nodiscard]] const char* orientation_name(Orientation orientation);
[[nodiscard]] std::optional<Orientation> orientation_from_string(std::string_view name);

[[nodiscard]] const char* collapse_direction_name(CollapseDirection direction);
[[nodiscard]] std::optional<CollapseDirection> collapse_direction_from_string(std::string_view name);

// =============================================================================
// Input / View
// =============================================================================

/// @brief Pointer state for one tick, in world coordinates
struct PointerState {
    Vec2 position{0.0f, 0.0f};
    bool pressed{false};  ///< Button went down this tick
    bool down{false};     ///< Button is held
};

/// @brief Visible world-space extent, supplied by the camera owner
struct ViewBounds {
    float left{0.0f};
    float right{0.0f};
    float top{0.0f};
    float bottom{0.0f};

    [[nodiscard]] float width() const { return right - left; }
    [[nodiscard]] float height() const { return bottom - top; }
};

// =============================================================================
// Placement
// =============================================================================

/// @brief Nearest eligible slot of one shelf for a dragged product
struct SlotCandidate {
    std::size_t slot{0};
    float distance{0.0f};
};

} // namespace stock_puzzle
