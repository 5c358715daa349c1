/// @file locking.hpp
/// @brief Lock conditions and the LockingShelf wrapper

#pragma once

#include "shelf_wrappers.hpp"

#include <optional>
#include <variant>

namespace stock_puzzle {

// =============================================================================
// Lock Conditions
// =============================================================================

struct ToggleTimerLock {
    float period{1.0f};
    bool initially_locked{true};
    std::optional<float> final_countdown_unlock;
};

struct CountdownTimerLock {
    float time{0.0f};
};

struct MatchProductsLock {
    ProductDefPtr product;  ///< null = any product
    std::uint32_t count{1};
};

struct CompleteShelvesLock {
    std::uint32_t count{1};
};

struct CompleteShelfLock {
    ShelfReference shelf_reference;
};

struct PlaceProductLock {
    ShelfReference shelf_reference;
    std::size_t slot{0};
    bool latch{false};
    bool inverted{false};
    ProductDefPtr product;  ///< null = any product
};

/// @brief Resolved lock condition; product ids replaced by definitions
using LockCondition = std::variant<
    ToggleTimerLock,
    CountdownTimerLock,
    MatchProductsLock,
    CompleteShelvesLock,
    CompleteShelfLock,
    PlaceProductLock
>;

/// @brief Evaluate whether @p condition currently holds its shelf locked
[[nodiscard]] bool evaluate_locked(const LockCondition& condition, const LevelStats& stats,
                                   std::optional<float> time_limit);

// =============================================================================
// LockingShelf
// =============================================================================

/// @brief Blocks pick-up and drop on its inner shelf while locked
///
/// The level re-evaluates the condition once per tick, after all actors have
/// updated and stats have been aggregated.
class LockingShelf : public ShelfWrapper, public ShelfGate {
public:
    LockingShelf(std::unique_ptr<IShelf> inner, LockCondition condition);

    [[nodiscard]] ShelfKind kind() const override { return ShelfKind::Locking; }

    [[nodiscard]] const LockCondition& condition() const { return m_condition; }

    [[nodiscard]] bool locked() const { return m_locked; }

    /// @brief 1 when fully locked, 0 when fully unlocked
    [[nodiscard]] float lock_progress() const { return m_lock_progress; }

    [[nodiscard]] bool allows_pick_up() const override { return !m_locked; }
    [[nodiscard]] bool allows_drop() const override { return !m_locked; }

    /// @brief Recompute the lock flag
    /// @return true if the flag changed
    bool refresh(const LevelStats& stats, std::optional<float> time_limit);

    void update(TickContext& ctx) override;

private:
    LockCondition m_condition;
    bool m_locked{true};
    bool m_evaluated{false};
    float m_lock_progress{1.0f};
};

} // namespace stock_puzzle
