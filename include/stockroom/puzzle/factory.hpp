/// @file factory.hpp
/// @brief Construction of products, shelves and actors from definitions

#pragma once

#include "config.hpp"
#include "definitions.hpp"
#include "layout.hpp"
#include "locking.hpp"
#include "shelf_variants.hpp"

#include <stockroom/core/error.hpp>

#include <map>
#include <memory>
#include <vector>

namespace stock_puzzle {

// =============================================================================
// ProductFactory
// =============================================================================

/// @brief Product catalogue; creates product instances by id
class ProductFactory {
public:
    ProductFactory() = default;

    /// @brief Build a catalogue, rejecting duplicate ids
    [[nodiscard]] static stock_core::Result<ProductFactory> from_defs(std::vector<ProductDef> defs);

    /// @brief Add one definition
    [[nodiscard]] stock_core::Result<void> register_product(ProductDef def);

    [[nodiscard]] bool contains(const ProductId& id) const { return m_defs.count(id) > 0; }

    /// @brief Shared definition, or nullptr
    [[nodiscard]] ProductDefPtr find(const ProductId& id) const;

    /// @brief New product instance sized to @p size
    [[nodiscard]] stock_core::Result<std::unique_ptr<Product>> create(const ProductId& id, Vec2 size) const;

    [[nodiscard]] std::vector<ProductId> product_ids() const;
    [[nodiscard]] std::size_t size() const { return m_defs.size(); }

private:
    std::map<ProductId, ProductDefPtr> m_defs;
};

// =============================================================================
// BuildContext
// =============================================================================

/// @brief Shared state while building one level
///
/// Every slot shelf and locking shelf created is registered here, in
/// construction order, so the level can address nested shelves directly.
struct BuildContext {
    const ProductFactory& products;
    const PuzzleConfig& config;
    std::vector<Shelf*> shelves;
    std::vector<LockingShelf*> locking_shelves;
};

// =============================================================================
// ShelfFactory
// =============================================================================

class ShelfFactory {
public:
    /// @brief Create any shelf kind, recursing into wrapped shelves
    [[nodiscard]] static stock_core::Result<std::unique_ptr<IShelf>> create(
        const ShelfDef& def, BuildContext& ctx, const std::string& path = "shelf");

    /// @brief Resolve a lock definition against the product catalogue
    [[nodiscard]] static stock_core::Result<LockCondition> resolve_lock(
        const LockConditionDef& def, const ProductFactory& products, const std::string& path);

private:
    static stock_core::Result<Shelf::Slots> create_slots(
        const SlotContents& contents, std::size_t slot_count, BuildContext& ctx, const std::string& path);

    static stock_core::Result<std::unique_ptr<Shelf>> create_slot_shelf(
        const ShelfDef& def, BuildContext& ctx, const std::string& path);
};

// =============================================================================
// ActorFactory
// =============================================================================

class ActorFactory {
public:
    [[nodiscard]] static stock_core::Result<std::unique_ptr<Actor>> create(
        const ActorDef& def, BuildContext& ctx, const std::string& path = "actor");

    [[nodiscard]] static stock_core::Result<std::unique_ptr<Collapse>> create_collapse(
        const CollapseDef& def, BuildContext& ctx, const std::string& path = "collapse");

    [[nodiscard]] static stock_core::Result<std::unique_ptr<Carousel>> create_carousel(
        const CarouselDef& def, BuildContext& ctx, const std::string& path = "carousel");
};

} // namespace stock_puzzle
