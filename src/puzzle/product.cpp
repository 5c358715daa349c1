/// @file product.cpp
/// @brief Product per-tick behaviour

#include <stockroom/puzzle/product.hpp>
#include <stockroom/puzzle/config.hpp>
#include <stockroom/puzzle/shelf.hpp>

#include <algorithm>

namespace stock_puzzle {

using stock_math::clamp;

Product::Product(ProductDefPtr def, Vec2 size)
    : m_def(std::move(def))
    , m_size(size) {}

void Product::set_position_immediate(Vec2 position) {
    m_position = position;
    m_target = position;
    m_dragging = false;
    m_finished_moving = true;
    m_landing_time = 0.0f;
    m_previous_slot.reset();
}

void Product::end_drag() {
    m_dragging = false;
}

void Product::disappear(float delay, float duration) {
    if (m_disappearing) {
        return;
    }
    m_disappearing = true;
    m_started_disappearing = false;
    m_finished_disappearing = false;
    m_disappear_delay = delay;
    m_disappear_duration = duration;
    m_disappear_time = duration;
}

float Product::disappear_progress() const {
    if (!m_started_disappearing || m_disappear_duration <= 0.0f) {
        return m_finished_disappearing ? 1.0f : 0.0f;
    }
    return 1.0f - m_disappear_time / m_disappear_duration;
}

void Product::update(TickContext& ctx, Shelf& shelf, std::size_t slot) {
    const PuzzleConfig& config = ctx.config;
    m_size = config.product_size();

    const Vec2 previous = m_position;
    const SlotRef here{shelf.id(), slot};
    if (!m_previous_slot) {
        m_previous_slot = here;
    }

    const bool over = rect().contains_point(ctx.pointer.position);
    m_hovered = over || m_dragging;

    // Drag starts on the press edge, and only if the level grants it
    if (ctx.pointer.pressed && over && !m_dragging && !m_locked &&
        shelf.can_pick_up_at(*this, slot) &&
        ctx.drags != nullptr && ctx.drags->begin_drag(shelf, slot, *this)) {
        m_dragging = true;
        m_finished_moving = false;
        m_drag_offset = ctx.pointer.position - m_position;
    }

    if (m_dragging && ctx.pointer.down) {
        m_target = ctx.pointer.position - m_drag_offset;
        m_move_time = config.move_cooldown;
    }

    m_move_time = clamp(m_move_time - ctx.dt, 0.0f, config.move_cooldown);

    if (!m_dragging) {
        m_target = shelf.slot_rect(slot).position;

        if (m_move_time <= 0.0f) {
            m_finished_moving = true;
            m_position = m_target;
        }

        // Landing bump once we are nearly settled in a different slot
        if (m_previous_slot && !(*m_previous_slot == here) &&
            stock_math::distance(m_position, m_target) < config.landing_range * m_size.x) {
            m_landing_time = config.landing_time;
            m_previous_slot = here;
        }
    }

    m_landing_time = clamp(m_landing_time - ctx.dt, 0.0f, config.landing_time);

    update_disappearing(ctx.dt);

    if (stock_math::almost_equal(m_position, m_target, config.settle_tolerance)) {
        m_position = m_target;
        if (!m_dragging) {
            m_finished_moving = true;
        }
    } else {
        m_position += (m_target - m_position) * config.move_ease;
    }

    update_rotation(ctx, previous);
}

void Product::update_disappearing(float dt) {
    if (!m_disappearing) {
        return;
    }
    m_disappear_delay = std::max(m_disappear_delay - dt, 0.0f);
    if (!m_started_disappearing && m_disappear_delay <= 0.0f) {
        m_started_disappearing = true;
    }
    if (m_started_disappearing) {
        m_disappear_time = clamp(m_disappear_time - dt, 0.0f, m_disappear_duration);
        if (m_disappear_time <= 0.0f) {
            m_finished_disappearing = true;
        }
    }
}

void Product::update_rotation(const TickContext& ctx, Vec2 previous) {
    const PuzzleConfig& config = ctx.config;
    const Vec2 velocity = m_position - previous;

    float target = 0.0f;
    if (m_dragging || !m_finished_moving) {
        target = velocity.x * config.tilt_per_velocity;
    }
    m_rotation = clamp(m_rotation + (target - m_rotation) * config.tilt_ease,
                       -config.max_tilt, config.max_tilt);
}

} // namespace stock_puzzle
