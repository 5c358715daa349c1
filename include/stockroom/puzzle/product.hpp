/// @file product.hpp
/// @brief Product: immutable identity plus placement and animation state

#pragma once

#include "actor.hpp"
#include "stats.hpp"

#include <memory>
#include <optional>

namespace stock_puzzle {

/// @brief A draggable product sitting in one shelf slot
///
/// Identity and matching come from a shared ProductDef. Everything else is
/// per-instance state driven by update(): hover, drag following, easing back
/// to the slot, the landing bump and the disappear timeline.
class Product {
public:
    Product(ProductDefPtr def, Vec2 size);

    Product(const Product&) = delete;
    Product& operator=(const Product&) = delete;

    // =========================================================================
    // Identity
    // =========================================================================

    [[nodiscard]] const ProductDef& def() const { return *m_def; }
    [[nodiscard]] const ProductDefPtr& shared_def() const { return m_def; }
    [[nodiscard]] const ProductId& id() const { return m_def->id; }
    [[nodiscard]] const std::string& name() const { return m_def->name; }
    [[nodiscard]] int points() const { return m_def->points; }

    /// @brief True when @p other's id is in this product's match list
    [[nodiscard]] bool matches(const Product& other) const { return m_def->matches_product(other.def()); }
    [[nodiscard]] bool matches(const ProductDef& other) const { return m_def->matches_product(other); }

    // =========================================================================
    // Locking
    // =========================================================================

    [[nodiscard]] bool locked() const { return m_locked; }
    void set_locked(bool locked) { m_locked = locked; }

    // =========================================================================
    // Geometry
    // =========================================================================

    [[nodiscard]] Vec2 position() const { return m_position; }
    [[nodiscard]] Vec2 size() const { return m_size; }
    [[nodiscard]] Rect rect() const { return Rect(m_position, m_size); }
    [[nodiscard]] Vec2 target() const { return m_target; }
    [[nodiscard]] float rotation() const { return m_rotation; }

    /// @brief Place without easing (hidden layers, tests)
    void set_position_immediate(Vec2 position);

    // =========================================================================
    // Update
    // =========================================================================

    /// @brief Advance one tick while sitting in @p shelf slot @p slot
    void update(TickContext& ctx, Shelf& shelf, std::size_t slot);

    [[nodiscard]] bool hovered() const { return m_hovered; }
    [[nodiscard]] bool dragging() const { return m_dragging; }
    [[nodiscard]] bool finished_moving() const { return m_finished_moving; }

    /// @brief Stop following the pointer; the product eases to its slot
    void end_drag();

    /// @brief Remaining landing animation time (0 when settled)
    [[nodiscard]] float landing_time() const { return m_landing_time; }

    // =========================================================================
    // Disappearing
    // =========================================================================

    /// @brief Start the disappear timeline after @p delay seconds
    void disappear(float delay, float duration);

    [[nodiscard]] bool disappearing() const { return m_disappearing; }
    [[nodiscard]] bool started_disappearing() const { return m_started_disappearing; }
    [[nodiscard]] bool finished_disappearing() const { return m_finished_disappearing; }

    /// @brief 0 before the timeline starts, 1 once fully gone
    [[nodiscard]] float disappear_progress() const;

private:
    struct SlotRef {
        ActorId shelf;
        std::size_t slot{0};
        bool operator==(const SlotRef&) const = default;
    };

    void update_disappearing(float dt);
    void update_rotation(const TickContext& ctx, Vec2 previous);

    ProductDefPtr m_def;
    Vec2 m_size;
    Vec2 m_position{0.0f, 0.0f};
    Vec2 m_target{0.0f, 0.0f};
    Vec2 m_drag_offset{0.0f, 0.0f};
    float m_rotation{0.0f};

    bool m_locked{false};
    bool m_hovered{false};
    bool m_dragging{false};
    bool m_finished_moving{true};
    float m_move_time{0.0f};

    std::optional<SlotRef> m_previous_slot;
    float m_landing_time{0.0f};

    bool m_disappearing{false};
    bool m_started_disappearing{false};
    bool m_finished_disappearing{false};
    float m_disappear_delay{0.0f};
    float m_disappear_duration{0.0f};
    float m_disappear_time{0.0f};
};

} // namespace stock_puzzle
