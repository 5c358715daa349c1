/// @file shelf_wrappers.hpp
/// @brief Shelves that wrap another shelf and change its behaviour

#pragma once

#include "shelf.hpp"

#include <memory>

namespace stock_puzzle {

// =============================================================================
// ShelfWrapper
// =============================================================================

/// @brief Owns an inner shelf and forwards geometry and updates to it
///
/// A wrapper offers no slots of its own; placement always goes to the slot
/// shelf at the bottom of the chain, which the level tracks directly.
/// Wrappers change that shelf's behaviour through gates.
class ShelfWrapper : public IShelf {
public:
    explicit ShelfWrapper(std::unique_ptr<IShelf> inner);

    [[nodiscard]] IShelf& inner() { return *m_inner; }
    [[nodiscard]] const IShelf& inner() const { return *m_inner; }

    void set_position(Vec2 position) override;
    [[nodiscard]] Vec2 size() const override { return m_inner->size(); }

    [[nodiscard]] bool can_pick_up_at(const Product&, std::size_t) const override { return false; }
    [[nodiscard]] bool can_drop_at(const Product&, std::size_t) const override { return false; }
    [[nodiscard]] std::optional<SlotCandidate> find_slot(const Product&) const override { return std::nullopt; }

    [[nodiscard]] bool is_empty() const override { return true; }
    [[nodiscard]] bool is_complete() const override { return m_inner->is_complete(); }
    [[nodiscard]] bool ignored() const override { return true; }

    void add_gate(const ShelfGate* gate) override { m_inner->add_gate(gate); }

    void update(TickContext& ctx) override;

    /// @brief Disposes the whole chain
    void dispose() override;

private:
    std::unique_ptr<IShelf> m_inner;
};

// =============================================================================
// SupplyShelf
// =============================================================================

/// @brief Dispense-only: products can be taken out but never dropped in
class SupplyShelf : public ShelfWrapper, public ShelfGate {
public:
    explicit SupplyShelf(std::unique_ptr<IShelf> inner);

    [[nodiscard]] ShelfKind kind() const override { return ShelfKind::Supply; }

    [[nodiscard]] bool allows_pick_up() const override { return true; }
    [[nodiscard]] bool allows_drop() const override { return false; }
};

// =============================================================================
// DisappearingShelf
// =============================================================================

/// @brief Removes itself and its inner shelf once the inner shelf completes
///
/// The inner shelf is closed to pick-up and drop for the whole exit animation.
class DisappearingShelf : public ShelfWrapper, public ShelfGate {
public:
    explicit DisappearingShelf(std::unique_ptr<IShelf> inner);

    [[nodiscard]] ShelfKind kind() const override { return ShelfKind::Disappearing; }

    [[nodiscard]] bool allows_pick_up() const override { return !m_disappearing; }
    [[nodiscard]] bool allows_drop() const override { return !m_disappearing; }

    [[nodiscard]] bool disappearing() const { return m_disappearing; }

    /// @brief Remaining exit animation time
    [[nodiscard]] float exit_time() const { return m_exit_time; }

    void update(TickContext& ctx) override;

private:
    bool m_disappearing{false};
    float m_exit_time{0.0f};
};

} // namespace stock_puzzle
