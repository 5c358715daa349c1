/// @file shelf.hpp
/// @brief Shelf interface, capability gates and the base slot shelf

#pragma once

#include "actor.hpp"
#include "product.hpp"

#include <memory>
#include <optional>
#include <vector>

namespace stock_puzzle {

// =============================================================================
// ShelfGate
// =============================================================================

/// @brief Extra pick-up/drop veto installed on a shelf by a wrapper
///
/// Gates are non-owning; the wrapper that installs a gate owns the shelf it
/// gates, so the gate always outlives its registration.
class ShelfGate {
public:
    virtual ~ShelfGate() = default;

    [[nodiscard]] virtual bool allows_pick_up() const = 0;
    [[nodiscard]] virtual bool allows_drop() const = 0;
};

// =============================================================================
// IShelf
// =============================================================================

/// @brief Capability set shared by slot shelves and wrapping shelves
class IShelf : public Actor {
public:
    [[nodiscard]] virtual ShelfKind kind() const = 0;

    [[nodiscard]] virtual bool can_pick_up_at(const Product& product, std::size_t index) const = 0;
    [[nodiscard]] virtual bool can_drop_at(const Product& product, std::size_t index) const = 0;

    /// @brief Nearest drop-eligible slot overlapping @p product
    [[nodiscard]] virtual std::optional<SlotCandidate> find_slot(const Product& product) const = 0;

    [[nodiscard]] virtual bool is_empty() const = 0;
    [[nodiscard]] virtual bool is_complete() const = 0;

    /// @brief Excluded from level completion
    [[nodiscard]] virtual bool ignored() const = 0;

    /// @brief Install a gate on the slot shelf at the bottom of this chain
    virtual void add_gate(const ShelfGate* gate) = 0;
};

// =============================================================================
// MatchResult
// =============================================================================

/// @brief Outcome of a match check; products are in group order
struct MatchResult {
    bool found{false};
    std::vector<Product*> products;
};

/// @brief Greedy seeded match search
///
/// For each seed in order, repeatedly append the first remaining candidate
/// that matches every group member, up to @p match_count. The first seed
/// whose group reaches @p match_count wins.
[[nodiscard]] MatchResult find_match_group(const std::vector<Product*>& candidates, std::size_t match_count);

// =============================================================================
// Shelf
// =============================================================================

/// @brief Fixed-capacity row of product slots
///
/// Slots run left to right from position(); each is one product cell wide.
/// Matched products disappear and their slots empty; an empty shelf is
/// complete.
class Shelf : public IShelf {
public:
    using Slots = std::vector<std::unique_ptr<Product>>;

    /// @param products Initial contents; resized to @p slot_count
    Shelf(Slots products, std::size_t slot_count, std::size_t match_count, Vec2 cell_size);

    [[nodiscard]] ShelfKind kind() const override { return ShelfKind::Basic; }

    // =========================================================================
    // Properties
    // =========================================================================

    [[nodiscard]] std::size_t slot_count() const { return m_slot_count; }
    [[nodiscard]] std::size_t match_count() const { return m_match_count; }
    [[nodiscard]] Vec2 cell_size() const { return m_cell_size; }

    [[nodiscard]] const std::optional<ShelfReference>& reference() const { return m_reference; }
    void set_reference(std::optional<ShelfReference> reference) { m_reference = std::move(reference); }

    [[nodiscard]] bool ignored() const override { return m_ignore; }
    void set_ignored(bool ignore) { m_ignore = ignore; }

    // =========================================================================
    // Geometry
    // =========================================================================

    [[nodiscard]] Vec2 size() const override;
    [[nodiscard]] Rect slot_rect(std::size_t index) const;

    // =========================================================================
    // Slots
    // =========================================================================

    /// @brief Product in a live slot, or nullptr
    [[nodiscard]] Product* product_at(std::size_t index) const;

    /// @brief Live slot contents
    [[nodiscard]] const Slots& products() const { return m_products; }

    /// @brief Product definitions of the live slots (null = empty)
    [[nodiscard]] std::vector<ProductDefPtr> slot_contents() const;

    /// @brief Place a product; fails on a bad index or an occupied slot
    ///
    /// @p product is only moved from on success.
    virtual bool add_product_at(std::size_t index, std::unique_ptr<Product>&& product);

    /// @brief Take a product out; nullptr on a bad index or an empty slot
    virtual std::unique_ptr<Product> remove_product_at(std::size_t index);

    /// @brief Set the locked flag of the product at @p index
    /// @return the new flag, or nullopt on a bad index or an empty slot
    virtual std::optional<bool> lock_product_at(std::size_t index, bool locked = true);

    // =========================================================================
    // Capabilities
    // =========================================================================

    [[nodiscard]] bool can_pick_up_at(const Product& product, std::size_t index) const final;
    [[nodiscard]] bool can_drop_at(const Product& product, std::size_t index) const final;
    [[nodiscard]] std::optional<SlotCandidate> find_slot(const Product& product) const override;

    [[nodiscard]] bool is_empty() const override;
    [[nodiscard]] bool is_complete() const override;

    void add_gate(const ShelfGate* gate) override;
    [[nodiscard]] std::size_t gate_count() const { return m_gates.size(); }

    // =========================================================================
    // Update
    // =========================================================================

    void update(TickContext& ctx) override;

    /// @brief Look for a match among live, non-disappearing products
    [[nodiscard]] virtual MatchResult check_for_matches() const;

protected:
    /// Variant policy for pick-up, before gates
    [[nodiscard]] virtual bool slot_allows_pick_up(const Product& product, std::size_t index) const;

    /// Variant policy for drop, before gates
    [[nodiscard]] virtual bool slot_allows_drop(const Product& product, std::size_t index) const;

    /// Update every live product, then clear slots whose product has gone
    void update_products(TickContext& ctx);

    /// Add one match per product to the level stats
    static void record_match(const MatchResult& match, TickContext& ctx);

    [[nodiscard]] static bool slots_empty(const Slots& slots);

    Slots m_products;

private:
    std::size_t m_slot_count;
    std::size_t m_match_count;
    Vec2 m_cell_size;
    bool m_ignore{false};
    std::optional<ShelfReference> m_reference;
    std::vector<const ShelfGate*> m_gates;
};

} // namespace stock_puzzle
