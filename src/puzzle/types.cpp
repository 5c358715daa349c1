/// @file types.cpp
/// @brief Enumeration names for stock_puzzle

#include <stockroom/puzzle/types.hpp>

namespace stock_puzzle {

const char* shelf_kind_name(ShelfKind kind) {
    switch (kind) {
        case ShelfKind::Basic: return "shelf";
        case ShelfKind::Closing: return "closing-shelf";
        case ShelfKind::Display: return "display-shelf";
        case ShelfKind::Deep: return "deep-shelf";
        case ShelfKind::Disappearing: return "disappearing-shelf";
        case ShelfKind::Supply: return "supply-shelf";
        case ShelfKind::Locking: return "locking-shelf";
    }
    return "unknown";
}

std::optional<ShelfKind> shelf_kind_from_string(std::string_view name) {
    if (name == "shelf") return ShelfKind::Basic;
    if (name == "closing-shelf") return ShelfKind::Closing;
    if (name == "display-shelf") return ShelfKind::Display;
    if (name == "deep-shelf") return ShelfKind::Deep;
    if (name == "disappearing-shelf") return ShelfKind::Disappearing;
    if (name == "supply-shelf") return ShelfKind::Supply;
    if (name == "locking-shelf") return ShelfKind::Locking;
    return std::nullopt;
}

bool can_wrap(ShelfKind outer, ShelfKind inner) {
    switch (outer) {
        case ShelfKind::Disappearing:
            return inner == ShelfKind::Basic || inner == ShelfKind::Deep ||
                   inner == ShelfKind::Display || inner == ShelfKind::Locking ||
                   inner == ShelfKind::Supply;
        case ShelfKind::Supply:
            return inner == ShelfKind::Basic || inner == ShelfKind::Deep ||
                   inner == ShelfKind::Disappearing || inner == ShelfKind::Locking;
        case ShelfKind::Locking:
            return inner != ShelfKind::Locking;
        default:
            return false;
    }
}

const char* orientation_name(Orientation orientation) {
    return orientation == Orientation::Horizontal ? "horizontal" : "vertical";
}

std::optional<Orientation> orientation_from_string(std::string_view name) {
    if (name == "horizontal") return Orientation::Horizontal;
    if (name == "vertical") return Orientation::Vertical;
    return std::nullopt;
}

const char* collapse_direction_name(CollapseDirection direction) {
    switch (direction) {
        case CollapseDirection::Positive: return "positive";
        case CollapseDirection::Negative: return "negative";
        case CollapseDirection::Center: return "center";
    }
    return "unknown";
}

std::optional<CollapseDirection> collapse_direction_from_string(std::string_view name) {
    if (name == "positive") return CollapseDirection::Positive;
    if (name == "negative") return CollapseDirection::Negative;
    if (name == "center") return CollapseDirection::Center;
    return std::nullopt;
}

} // namespace stock_puzzle
