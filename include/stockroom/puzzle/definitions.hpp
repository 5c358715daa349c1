/// @file definitions.hpp
/// @brief Content definitions for products, shelves, containers and levels
///
/// Definitions are plain data parsed from JSON content. They are validated for
/// shape here; product ids and shelf references are resolved against the
/// product catalogue when a level is built.

#pragma once

#include "types.hpp"

#include <stockroom/core/error.hpp>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace stock_puzzle {

/// @brief One slot of authored content: a product id or empty
using SlotContents = std::vector<std::optional<ProductId>>;

// =============================================================================
// ProductDef
// =============================================================================

/// @brief Immutable product identity and matching data
struct ProductDef {
    ProductId id;
    std::string name;
    std::string image;               ///< Opaque asset handle
    std::vector<ProductId> matches;  ///< Ids this product matches
    int points{1};

    /// @brief True when @p other's id is in this product's match list
    [[nodiscard]] bool matches_product(const ProductDef& other) const;

    [[nodiscard]] static stock_core::Result<ProductDef> from_json(
        const nlohmann::json& j, const std::string& path = "product");

    [[nodiscard]] nlohmann::json to_json() const;
};

/// @brief Parse a product catalogue (JSON array); ids must be unique
[[nodiscard]] stock_core::Result<std::vector<ProductDef>> parse_product_defs(const nlohmann::json& j);

// =============================================================================
// Lock Condition Definitions
// =============================================================================

/// Alternates locked/unlocked every @c period seconds
struct ToggleTimerDef {
    float period{1.0f};
    bool initially_locked{true};
    std::optional<float> final_countdown_unlock;  ///< Seconds before the time limit
};

/// Locked until elapsed time exceeds @c time
struct CountdownTimerDef {
    float time{0.0f};
};

/// Locked until @c count matches (optionally of products matching @c product)
struct MatchProductsDef {
    std::optional<ProductId> product;
    int count{1};
};

/// Locked until @c count referenced shelves are complete
struct CompleteShelvesDef {
    int count{1};
};

/// Locked until the referenced shelf is complete
struct CompleteShelfDef {
    ShelfReference shelf_reference;
};

/// Locked until a qualifying product sits (or has sat) in a referenced slot
struct PlaceProductDef {
    ShelfReference shelf_reference;
    std::size_t slot{0};
    bool latch{false};
    bool inverted{false};
    std::optional<ProductId> product;
};

using LockConditionDef = std::variant<
    ToggleTimerDef,
    CountdownTimerDef,
    MatchProductsDef,
    CompleteShelvesDef,
    CompleteShelfDef,
    PlaceProductDef
>;

/// @brief Content mode name ("toggle-timer", "place-product", ...)
[[nodiscard]] const char* lock_mode_name(const LockConditionDef& def);

[[nodiscard]] stock_core::Result<LockConditionDef> lock_condition_from_json(
    const nlohmann::json& j, const std::string& path = "locking");

// =============================================================================
// ShelfDef
// =============================================================================

/// @brief Definition of any of the seven shelf kinds
///
/// Field use depends on @c kind: slot kinds use @c products (Deep uses
/// @c layers, Display also @c allowed); wrapper kinds use @c inner and,
/// for Locking, @c locking.
struct ShelfDef {
    ShelfKind kind{ShelfKind::Basic};
    SlotContents products;
    SlotContents allowed;
    std::vector<SlotContents> layers;  ///< Deep shelf layers, last is on top
    Vec2 offset{0.0f, 0.0f};           ///< In product-size units
    std::optional<std::size_t> slot_count;
    std::optional<std::size_t> match_count;
    bool ignore{false};
    std::optional<ShelfReference> reference;
    std::shared_ptr<const ShelfDef> inner;
    std::optional<LockConditionDef> locking;

    [[nodiscard]] static stock_core::Result<ShelfDef> from_json(
        const nlohmann::json& j, const std::string& path = "shelf");
};

/// @brief Check that a wrapper of kind @p outer may wrap @p inner
[[nodiscard]] stock_core::Result<void> validate_nesting(
    ShelfKind outer, ShelfKind inner, const std::string& path);

// =============================================================================
// Container Definitions
// =============================================================================

/// @brief Child of a collapse: a shelf or a nested collapse
struct CollapseEntry {
    std::optional<ShelfDef> shelf;
    std::shared_ptr<const CollapseDef> collapse;
};

struct CollapseDef {
    int grid_width{1};
    int grid_height{1};
    Orientation orientation{Orientation::Horizontal};
    CollapseDirection direction{CollapseDirection::Negative};
    std::vector<CollapseEntry> entries;

    [[nodiscard]] static stock_core::Result<CollapseDef> from_json(
        const nlohmann::json& j, const std::string& path = "collapse");
};

struct CarouselDef {
    Orientation orientation{Orientation::Horizontal};
    float speed{0.0f};  ///< Product widths per second
    std::vector<ShelfDef> shelves;

    [[nodiscard]] static stock_core::Result<CarouselDef> from_json(
        const nlohmann::json& j, const std::string& path = "carousel");
};

// =============================================================================
// Level Definitions
// =============================================================================

enum class ActorKind : std::uint8_t {
    Shelf,
    Carousel,
    Collapse
};

/// @brief Top-level actor placed on the level grid
struct ActorDef {
    ActorKind kind{ActorKind::Shelf};
    Vec2 grid_position{0.0f, 0.0f};
    std::optional<ShelfDef> shelf;
    std::optional<CarouselDef> carousel;
    std::optional<CollapseDef> collapse;

    [[nodiscard]] static stock_core::Result<ActorDef> from_json(
        const nlohmann::json& j, const std::string& path = "actor");
};

/// @brief A product pinned in place at level start
struct LockedProductDef {
    ShelfReference shelf_reference;
    std::size_t slot{0};
};

struct LevelDef {
    std::string id;
    std::string name;
    std::optional<std::string> description;
    int grid_width{1};
    int grid_height{1};
    std::vector<ActorDef> actors;
    std::vector<LockedProductDef> locked_products;
    std::optional<float> time_limit;

    [[nodiscard]] static stock_core::Result<LevelDef> from_json(
        const nlohmann::json& j, const std::string& path = "level");
};

// =============================================================================
// File Loading
// =============================================================================

[[nodiscard]] stock_core::Result<std::vector<ProductDef>> load_product_file(const std::filesystem::path& path);
[[nodiscard]] stock_core::Result<LevelDef> load_level_file(const std::filesystem::path& path);

} // namespace stock_puzzle
