/// @file stats.hpp
/// @brief Level-wide statistics observed by lock conditions

#pragma once

#include "definitions.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <vector>

namespace stock_puzzle {

using ProductDefPtr = std::shared_ptr<const ProductDef>;

/// @brief Running match total for one product id
struct ProductMatchTotal {
    ProductDefPtr product;
    std::uint32_t total{0};
};

/// @brief One accepted drop into a referenced shelf
struct PlacementRecord {
    ShelfReference shelf_reference;
    std::size_t slot{0};
    ProductDefPtr product;
    float time{0.0f};
};

/// @brief Statistics for one level, live for the level's lifetime
///
/// Match counters and the placement log grow by events. Completion flags and
/// the current placement snapshot are rebuilt by the level each tick.
struct LevelStats {
    float time{0.0f};

    std::map<ProductId, ProductMatchTotal> product_matches;
    std::uint32_t total_matches{0};
    std::int64_t score{0};

    /// Completion of each referenced shelf; disposed shelves keep their last value
    std::map<ShelfReference, bool> completed_shelves;
    std::uint32_t total_completed_shelves{0};

    /// Append-only
    std::vector<PlacementRecord> product_placements;

    /// Slot contents of each referenced shelf (null = empty slot)
    std::map<ShelfReference, std::vector<ProductDefPtr>> current_product_placement;

    /// @brief Count one matched product
    void record_match(const ProductDefPtr& product);

    /// @brief Append to the placement log
    void record_placement(const ShelfReference& reference, std::size_t slot, const ProductDefPtr& product);

    /// @brief Number of referenced shelves currently flagged complete
    [[nodiscard]] std::uint32_t completed_reference_count() const;

    /// @brief Sum of match totals over products that @p reference matches
    [[nodiscard]] std::uint32_t matches_for(const ProductDef& reference) const;

    /// @brief A product (matching @p required, if given) was ever logged at this slot
    [[nodiscard]] bool was_ever_placed(const ShelfReference& reference, std::size_t slot,
                                       const ProductDef* required) const;

    /// @brief A product (matching @p required, if given) currently occupies this slot
    [[nodiscard]] bool is_currently_placed(const ShelfReference& reference, std::size_t slot,
                                           const ProductDef* required) const;
};

} // namespace stock_puzzle
