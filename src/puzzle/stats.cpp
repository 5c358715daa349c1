/// @file stats.cpp
/// @brief LevelStats queries

#include <stockroom/puzzle/stats.hpp>

namespace stock_puzzle {

namespace {

bool qualifies(const ProductDefPtr& placed, const ProductDef* required) {
    if (!placed) {
        return false;
    }
    return required == nullptr || placed->matches_product(*required);
}

} // anonymous namespace

void LevelStats::record_match(const ProductDefPtr& product) {
    if (!product) {
        return;
    }
    auto& entry = product_matches[product->id];
    if (!entry.product) {
        entry.product = product;
    }
    entry.total += 1;
    total_matches += 1;
    score += product->points;
}

void LevelStats::record_placement(const ShelfReference& reference, std::size_t slot, const ProductDefPtr& product) {
    product_placements.push_back(PlacementRecord{reference, slot, product, time});
}

std::uint32_t LevelStats::completed_reference_count() const {
    std::uint32_t count = 0;
    for (const auto& [reference, completed] : completed_shelves) {
        if (completed) {
            ++count;
        }
    }
    return count;
}

std::uint32_t LevelStats::matches_for(const ProductDef& reference) const {
    std::uint32_t total = 0;
    for (const auto& [id, entry] : product_matches) {
        if (entry.product && reference.matches_product(*entry.product)) {
            total += entry.total;
        }
    }
    return total;
}

bool LevelStats::was_ever_placed(const ShelfReference& reference, std::size_t slot,
                                 const ProductDef* required) const {
    for (const auto& record : product_placements) {
        if (record.shelf_reference == reference && record.slot == slot && qualifies(record.product, required)) {
            return true;
        }
    }
    return false;
}

bool LevelStats::is_currently_placed(const ShelfReference& reference, std::size_t slot,
                                     const ProductDef* required) const {
    auto it = current_product_placement.find(reference);
    if (it == current_product_placement.end() || slot >= it->second.size()) {
        return false;
    }
    return qualifies(it->second[slot], required);
}

} // namespace stock_puzzle
