/// @file fwd.hpp
/// @brief Forward declarations for stock_puzzle module

#pragma once

#include <cstdint>
#include <string>

namespace stock_puzzle {

// =============================================================================
// Identifiers
// =============================================================================

/// @brief Product identifier as authored in content (e.g. "apple")
using ProductId = std::string;

/// @brief Stable handle naming a shelf for stats and lock conditions
using ShelfReference = std::string;

/// @brief Runtime identity of an actor within one level
struct ActorId {
    std::uint64_t value{0};
    bool operator==(const ActorId&) const = default;
    bool operator!=(const ActorId&) const = default;
    explicit operator bool() const { return value != 0; }
};

// =============================================================================
// Forward Declarations - Definitions
// =============================================================================

struct ProductDef;
struct ShelfDef;
struct CollapseDef;
struct CarouselDef;
struct ActorDef;
struct LevelDef;
struct PuzzleConfig;
struct RuntimeConfig;

// =============================================================================
// Forward Declarations - Runtime
// =============================================================================

struct PointerState;
struct ViewBounds;
struct TickContext;
class DragController;

class Product;
class Actor;
class ShelfGate;
class IShelf;
class Shelf;
class ClosingShelf;
class DisplayShelf;
class DeepShelf;
class ShelfWrapper;
class SupplyShelf;
class DisappearingShelf;
class LockingShelf;
class Collapse;
class Carousel;

struct LevelStats;
class ProductFactory;
struct BuildContext;
class ShelfFactory;
class ActorFactory;
class Level;

} // namespace stock_puzzle
