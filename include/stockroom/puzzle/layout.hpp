/// @file layout.hpp
/// @brief Layout containers: Collapse and Carousel
///
/// Containers position their children every tick; they carry no rules of
/// their own. Children disposed during a tick are released at the start of
/// the container's next update, after the level has dropped its references.

#pragma once

#include "shelf.hpp"

#include <memory>
#include <vector>

namespace stock_puzzle {

// =============================================================================
// Collapse
// =============================================================================

/// @brief Packs shelves and nested collapses along one axis of a grid footprint
///
/// When a child's target changes (because a sibling vanished) it eases from
/// its previous resting place with a bounce curve. An empty collapse disposes
/// itself.
class Collapse : public Actor {
public:
    Collapse(int grid_width, int grid_height, Orientation orientation, CollapseDirection direction,
             std::vector<std::unique_ptr<Actor>> children, Vec2 cell_size);

    [[nodiscard]] Orientation orientation() const { return m_orientation; }
    [[nodiscard]] CollapseDirection direction() const { return m_direction; }

    [[nodiscard]] std::size_t child_count() const { return m_children.size(); }
    [[nodiscard]] Actor& child(std::size_t index) { return *m_children[index].child; }
    [[nodiscard]] const Actor& child(std::size_t index) const { return *m_children[index].child; }

    /// @brief Resting place of a child, relative to position()
    [[nodiscard]] Vec2 target_of(std::size_t index) const { return m_children[index].target; }

    /// @brief Grid footprint in world units
    [[nodiscard]] Vec2 grid_size() const;

    /// @brief Extent of the packed children
    [[nodiscard]] Vec2 size() const override;

    void set_position(Vec2 position) override;

    void update(TickContext& ctx) override;

    void dispose() override;

private:
    struct Entry {
        std::unique_ptr<Actor> child;
        Vec2 target{0.0f, 0.0f};
        Vec2 settled{0.0f, 0.0f};
        float ease_progress{0.0f};
    };

    [[nodiscard]] Vec2 start_position() const;
    void compute_targets();
    void release_disposed();

    int m_grid_width;
    int m_grid_height;
    Orientation m_orientation;
    CollapseDirection m_direction;
    Vec2 m_cell_size;
    std::vector<Entry> m_children;
};

// =============================================================================
// Carousel
// =============================================================================

/// @brief Scrolls a row (or column) of shelves at constant speed, wrapping around
///
/// The loop starts one shelf-length before the visible edge and is at least
/// as long as the visible extent plus the largest shelf.
class Carousel : public Actor {
public:
    /// @param speed Product widths per second; negative runs backwards
    Carousel(Orientation orientation, float speed, std::vector<std::unique_ptr<IShelf>> shelves, Vec2 cell_size);

    [[nodiscard]] Orientation orientation() const { return m_orientation; }
    [[nodiscard]] float speed() const { return m_speed; }
    [[nodiscard]] float time() const { return m_time; }

    [[nodiscard]] std::size_t shelf_count() const { return m_shelves.size(); }
    [[nodiscard]] IShelf& shelf(std::size_t index) { return *m_shelves[index]; }
    [[nodiscard]] const IShelf& shelf(std::size_t index) const { return *m_shelves[index]; }

    /// @brief Summed extent of the shelves
    [[nodiscard]] Vec2 size() const override;

    /// @brief Loop length along the axis for the given view
    [[nodiscard]] float loop_length(const ViewBounds& view) const;

    /// @brief Axis coordinate where the loop starts for the given view
    [[nodiscard]] float loop_start(const ViewBounds& view) const;

    void update(TickContext& ctx) override;

    void dispose() override;

private:
    [[nodiscard]] float axis_extent(const Vec2& v) const;
    [[nodiscard]] float largest_shelf() const;

    Orientation m_orientation;
    float m_speed;
    Vec2 m_cell_size;
    float m_time{0.0f};
    std::vector<std::unique_ptr<IShelf>> m_shelves;
};

} // namespace stock_puzzle
