/// @file layout.cpp
/// @brief Collapse and Carousel layout

#include <stockroom/puzzle/layout.hpp>
#include <stockroom/puzzle/config.hpp>

#include <stockroom/core/log.hpp>

#include <algorithm>

namespace stock_puzzle {

using stock_math::clamp;

// =============================================================================
// Collapse
// =============================================================================

Collapse::Collapse(int grid_width, int grid_height, Orientation orientation, CollapseDirection direction,
                   std::vector<std::unique_ptr<Actor>> children, Vec2 cell_size)
    : m_grid_width(grid_width)
    , m_grid_height(grid_height)
    , m_orientation(orientation)
    , m_direction(direction)
    , m_cell_size(cell_size) {
    m_children.reserve(children.size());
    for (auto& child : children) {
        if (child) {
            m_children.push_back(Entry{std::move(child)});
        }
    }

    compute_targets();
    for (auto& entry : m_children) {
        entry.settled = entry.target;
        entry.child->set_position(position() + entry.target);
    }
}

Vec2 Collapse::grid_size() const {
    return Vec2(m_cell_size.x * static_cast<float>(m_grid_width),
                m_cell_size.y * static_cast<float>(m_grid_height));
}

Vec2 Collapse::size() const {
    Vec2 total(0.0f, 0.0f);
    for (const auto& entry : m_children) {
        const Vec2 s = entry.child->size();
        if (m_orientation == Orientation::Horizontal) {
            total.x += s.x;
            total.y = std::max(total.y, s.y);
        } else {
            total.x = std::max(total.x, s.x);
            total.y += s.y;
        }
    }
    return total;
}

void Collapse::set_position(Vec2 position) {
    const Vec2 delta = position - this->position();
    Actor::set_position(position);
    for (auto& entry : m_children) {
        entry.child->set_position(entry.child->position() + delta);
    }
}

Vec2 Collapse::start_position() const {
    const Vec2 free_space = grid_size() - size();
    Vec2 start(0.0f, 0.0f);
    float& axis = m_orientation == Orientation::Horizontal ? start.x : start.y;
    const float space = m_orientation == Orientation::Horizontal ? free_space.x : free_space.y;

    switch (m_direction) {
        case CollapseDirection::Positive: axis = space; break;
        case CollapseDirection::Negative: axis = 0.0f; break;
        case CollapseDirection::Center: axis = space * 0.5f; break;
    }
    return start;
}

void Collapse::compute_targets() {
    Vec2 cursor = start_position();
    for (auto& entry : m_children) {
        entry.target = cursor;
        const Vec2 s = entry.child->size();
        if (m_orientation == Orientation::Horizontal) {
            cursor.x += s.x;
        } else {
            cursor.y += s.y;
        }
    }
}

void Collapse::release_disposed() {
    m_children.erase(std::remove_if(m_children.begin(), m_children.end(),
                                    [](const Entry& e) { return e.child->disposed(); }),
                     m_children.end());
}

void Collapse::update(TickContext& ctx) {
    release_disposed();
    if (m_children.empty()) {
        if (!disposed()) {
            stock_core::puzzle_logger()->debug("[Collapse] Empty, disposing");
        }
        dispose();
        return;
    }

    compute_targets();

    for (auto& entry : m_children) {
        const Vec2 world_target = position() + entry.target;
        if (entry.ease_progress >= 1.0f ||
            stock_math::almost_equal(entry.child->position(), world_target, ctx.config.settle_tolerance)) {
            entry.child->set_position(world_target);
            entry.ease_progress = 0.0f;
            entry.settled = entry.target;
        } else {
            entry.ease_progress = clamp(entry.ease_progress + ctx.dt / ctx.config.collapse_ease_time, 0.0f, 1.0f);
            const float t = stock_math::ease_out_bounce(entry.ease_progress);
            entry.child->set_position(position() + stock_math::lerp(entry.settled, entry.target, t));
        }
        entry.child->update(ctx);
    }
}

void Collapse::dispose() {
    Actor::dispose();
    for (auto& entry : m_children) {
        entry.child->dispose();
    }
}

// =============================================================================
// Carousel
// =============================================================================

Carousel::Carousel(Orientation orientation, float speed, std::vector<std::unique_ptr<IShelf>> shelves,
                   Vec2 cell_size)
    : m_orientation(orientation)
    , m_speed(speed)
    , m_cell_size(cell_size)
    , m_shelves(std::move(shelves)) {
    m_shelves.erase(std::remove(m_shelves.begin(), m_shelves.end(), nullptr), m_shelves.end());
}

float Carousel::axis_extent(const Vec2& v) const {
    return m_orientation == Orientation::Horizontal ? v.x : v.y;
}

float Carousel::largest_shelf() const {
    float largest = 0.0f;
    for (const auto& shelf : m_shelves) {
        largest = std::max(largest, axis_extent(shelf->size()));
    }
    return largest;
}

Vec2 Carousel::size() const {
    Vec2 total(0.0f, 0.0f);
    for (const auto& shelf : m_shelves) {
        const Vec2 s = shelf->size();
        if (m_orientation == Orientation::Horizontal) {
            total.x += s.x;
            total.y = std::max(total.y, s.y);
        } else {
            total.x = std::max(total.x, s.x);
            total.y += s.y;
        }
    }
    return total;
}

float Carousel::loop_length(const ViewBounds& view) const {
    const float visible = m_orientation == Orientation::Horizontal ? view.width() : view.height();
    return std::max(largest_shelf() + visible, axis_extent(size()));
}

float Carousel::loop_start(const ViewBounds& view) const {
    const float edge = m_orientation == Orientation::Horizontal ? view.left : view.top;
    return edge - largest_shelf();
}

void Carousel::update(TickContext& ctx) {
    m_shelves.erase(std::remove_if(m_shelves.begin(), m_shelves.end(),
                                   [](const auto& shelf) { return shelf->disposed(); }),
                    m_shelves.end());

    m_time += ctx.dt;

    Vec2 origin = position();
    if (m_orientation == Orientation::Horizontal) {
        origin.x = loop_start(ctx.view);
    } else {
        origin.y = loop_start(ctx.view);
    }
    Actor::set_position(origin);

    const float length = loop_length(ctx.view);
    const float travelled = m_time * m_speed * m_cell_size.x;

    float cursor = 0.0f;
    for (auto& shelf : m_shelves) {
        const Vec2 offset = shelf->offset() * m_cell_size;
        const float along = stock_math::wrap(travelled + cursor, length);

        Vec2 p = origin + offset;
        if (m_orientation == Orientation::Horizontal) {
            p.x += along;
        } else {
            p.y += along;
        }
        shelf->set_position(p);
        shelf->update(ctx);

        cursor += axis_extent(shelf->size());
    }
}

void Carousel::dispose() {
    Actor::dispose();
    for (auto& shelf : m_shelves) {
        shelf->dispose();
    }
}

} // namespace stock_puzzle
