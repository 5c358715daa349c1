/// @file actor.hpp
/// @brief Actor base class and per-tick context

#pragma once

#include "types.hpp"

namespace stock_puzzle {

// =============================================================================
// DragController
// =============================================================================

/// @brief Owner of the single in-flight drag
///
/// Products ask the controller before they start following the pointer.
class DragController {
public:
    virtual ~DragController() = default;

    /// @brief Claim the drag for @p product in @p shelf slot @p slot
    /// @return false if another drag is already in flight
    virtual bool begin_drag(Shelf& shelf, std::size_t slot, Product& product) = 0;
};

// =============================================================================
// TickContext
// =============================================================================

/// @brief Everything an actor sees during one update
struct TickContext {
    float dt{0.0f};
    PointerState pointer;
    ViewBounds view;
    const PuzzleConfig& config;
    LevelStats& stats;
    DragController* drags{nullptr};
};

// =============================================================================
// Actor
// =============================================================================

/// @brief Anything placed in a level: shelves and layout containers
class Actor {
public:
    Actor();
    virtual ~Actor() = default;

    Actor(const Actor&) = delete;
    Actor& operator=(const Actor&) = delete;

    [[nodiscard]] ActorId id() const { return m_id; }

    [[nodiscard]] Vec2 position() const { return m_position; }
    virtual void set_position(Vec2 position) { m_position = position; }

    /// @brief Authored offset, in product-size units
    [[nodiscard]] Vec2 offset() const { return m_offset; }
    void set_offset(Vec2 offset) { m_offset = offset; }

    /// @brief World-space extent
    [[nodiscard]] virtual Vec2 size() const = 0;

    [[nodiscard]] Rect bounds() const { return Rect(m_position, size()); }

    virtual void update(TickContext& ctx) = 0;

    [[nodiscard]] bool disposed() const { return m_disposed; }
    virtual void dispose() { m_disposed = true; }

private:
    ActorId m_id;
    Vec2 m_position{0.0f, 0.0f};
    Vec2 m_offset{0.0f, 0.0f};
    bool m_disposed{false};
};

} // namespace stock_puzzle
