/// @file shelf_wrappers.cpp
/// @brief ShelfWrapper, SupplyShelf and DisappearingShelf

#include <stockroom/puzzle/shelf_wrappers.hpp>
#include <stockroom/puzzle/config.hpp>

#include <stockroom/core/log.hpp>

namespace stock_puzzle {

// =============================================================================
// ShelfWrapper
// =============================================================================

ShelfWrapper::ShelfWrapper(std::unique_ptr<IShelf> inner)
    : m_inner(std::move(inner)) {}

void ShelfWrapper::set_position(Vec2 position) {
    Actor::set_position(position);
    m_inner->set_position(position);
}

void ShelfWrapper::update(TickContext& ctx) {
    m_inner->set_position(position());
    m_inner->update(ctx);
}

void ShelfWrapper::dispose() {
    Actor::dispose();
    m_inner->dispose();
}

// =============================================================================
// SupplyShelf
// =============================================================================

SupplyShelf::SupplyShelf(std::unique_ptr<IShelf> inner)
    : ShelfWrapper(std::move(inner)) {
    add_gate(this);
}

// =============================================================================
// DisappearingShelf
// =============================================================================

DisappearingShelf::DisappearingShelf(std::unique_ptr<IShelf> inner)
    : ShelfWrapper(std::move(inner)) {
    add_gate(this);
}

void DisappearingShelf::update(TickContext& ctx) {
    ShelfWrapper::update(ctx);

    if (!m_disappearing && inner().is_complete()) {
        m_disappearing = true;
        m_exit_time = ctx.config.shelf_exit_time;
        stock_core::puzzle_logger()->debug("[DisappearingShelf] Inner {} complete, exiting",
                                           shelf_kind_name(inner().kind()));
    }

    if (m_disappearing) {
        m_exit_time -= ctx.dt;
        if (m_exit_time <= 0.0f) {
            m_exit_time = 0.0f;
            dispose();
        }
    }
}

} // namespace stock_puzzle
