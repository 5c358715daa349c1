/// @file shelf_variants.hpp
/// @brief Slot shelves with their own completion rules

#pragma once

#include "shelf.hpp"

namespace stock_puzzle {

// =============================================================================
// ClosingShelf
// =============================================================================

/// @brief Closes on its first match; a closed shelf is complete and frozen
///
/// Matched products stay on the shelf.
class ClosingShelf : public Shelf {
public:
    using Shelf::Shelf;

    [[nodiscard]] ShelfKind kind() const override { return ShelfKind::Closing; }

    [[nodiscard]] bool closed() const { return m_closed; }

    /// @brief Closing animation progress in [0, 1]
    [[nodiscard]] float closing_progress() const { return m_closing_progress; }

    [[nodiscard]] bool is_complete() const override { return m_closed; }

    void update(TickContext& ctx) override;

protected:
    [[nodiscard]] bool slot_allows_pick_up(const Product& product, std::size_t index) const override;
    [[nodiscard]] bool slot_allows_drop(const Product& product, std::size_t index) const override;

private:
    bool m_closed{false};
    float m_closing_progress{0.0f};
};

// =============================================================================
// DisplayShelf
// =============================================================================

/// @brief Each slot requires a specific product
///
/// Complete once every slot holds a product matching its allowed product,
/// or both are empty. Completion freezes the shelf.
class DisplayShelf : public Shelf {
public:
    /// @param allowed Required product per slot (null = must stay empty); resized to @p slot_count
    DisplayShelf(Slots products, std::vector<ProductDefPtr> allowed,
                 std::size_t slot_count, std::size_t match_count, Vec2 cell_size);

    [[nodiscard]] ShelfKind kind() const override { return ShelfKind::Display; }

    [[nodiscard]] const std::vector<ProductDefPtr>& allowed() const { return m_allowed; }

    [[nodiscard]] bool completed() const { return m_completed; }
    [[nodiscard]] float completing_progress() const { return m_completing_progress; }

    [[nodiscard]] bool is_complete() const override { return m_completed; }

    [[nodiscard]] MatchResult check_for_matches() const override;

    void update(TickContext& ctx) override;

protected:
    [[nodiscard]] bool slot_allows_pick_up(const Product& product, std::size_t index) const override;
    [[nodiscard]] bool slot_allows_drop(const Product& product, std::size_t index) const override;

private:
    std::vector<ProductDefPtr> m_allowed;
    bool m_completed{false};
    float m_completing_progress{0.0f};
};

// =============================================================================
// DeepShelf
// =============================================================================

/// @brief Stack of product layers; only the top layer is live
///
/// Layers are kept in authored order, last on top. When the top layer
/// empties, the next layer is exposed after a short delay. The last layer is
/// never removed.
class DeepShelf : public Shelf {
public:
    /// @param layers Authored layers, last on top; each resized to @p slot_count
    DeepShelf(std::vector<Slots> layers, std::size_t slot_count, std::size_t match_count, Vec2 cell_size);

    [[nodiscard]] ShelfKind kind() const override { return ShelfKind::Deep; }

    /// @brief Layers still present, including the live one
    [[nodiscard]] std::size_t layer_count() const;

    /// @brief Layers below the live one, bottom first
    [[nodiscard]] const std::vector<Slots>& hidden_layers() const { return m_hidden; }

    [[nodiscard]] bool changing_layers() const { return m_changing; }

    bool add_product_at(std::size_t index, std::unique_ptr<Product>&& product) override;
    std::unique_ptr<Product> remove_product_at(std::size_t index) override;

    /// @brief Lock across all layers; index = layer * slot_count + slot, bottom layer first
    std::optional<bool> lock_product_at(std::size_t index, bool locked = true) override;

    [[nodiscard]] bool is_empty() const override;
    [[nodiscard]] bool is_complete() const override { return is_empty(); }

    void update(TickContext& ctx) override;

protected:
    [[nodiscard]] bool slot_allows_drop(const Product& product, std::size_t index) const override;

private:
    std::vector<Slots> m_hidden;
    bool m_has_layers{true};
    bool m_changing{false};
    float m_changing_time{0.0f};
};

} // namespace stock_puzzle
