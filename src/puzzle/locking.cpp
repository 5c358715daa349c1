/// @file locking.cpp
/// @brief Lock condition evaluation and LockingShelf

#include <stockroom/puzzle/locking.hpp>
#include <stockroom/puzzle/config.hpp>

#include <stockroom/core/log.hpp>

#include <cmath>

namespace stock_puzzle {

// =============================================================================
// Evaluation
// =============================================================================

namespace {

bool locked_by(const ToggleTimerLock& lock, const LevelStats& stats, std::optional<float> time_limit) {
    if (lock.final_countdown_unlock && time_limit &&
        *time_limit - stats.time <= *lock.final_countdown_unlock) {
        return false;
    }
    if (lock.period <= 0.0f) {
        return lock.initially_locked;
    }
    // Starting unlocked shifts the cycle by half a period, so the first flip comes at period / 2.
    const float offset = lock.initially_locked ? 0.0f : 0.5f;
    const auto phase = static_cast<std::int64_t>(std::floor(stats.time / lock.period + offset));
    return (phase % 2) == 0;
}

bool locked_by(const CountdownTimerLock& lock, const LevelStats& stats, std::optional<float>) {
    return stats.time <= lock.time;
}

bool locked_by(const MatchProductsLock& lock, const LevelStats& stats, std::optional<float>) {
    const std::uint32_t matches = lock.product ? stats.matches_for(*lock.product) : stats.total_matches;
    return matches < lock.count;
}

bool locked_by(const CompleteShelvesLock& lock, const LevelStats& stats, std::optional<float>) {
    return stats.completed_reference_count() < lock.count;
}

bool locked_by(const CompleteShelfLock& lock, const LevelStats& stats, std::optional<float>) {
    auto it = stats.completed_shelves.find(lock.shelf_reference);
    return it == stats.completed_shelves.end() || !it->second;
}

bool locked_by(const PlaceProductLock& lock, const LevelStats& stats, std::optional<float>) {
    const ProductDef* required = lock.product.get();
    const bool placed = lock.latch
        ? stats.was_ever_placed(lock.shelf_reference, lock.slot, required)
        : stats.is_currently_placed(lock.shelf_reference, lock.slot, required);
    const bool locked = !placed;
    return lock.inverted ? !locked : locked;
}

const char* mode_name(const LockCondition& condition) {
    static constexpr const char* names[] = {
        "toggle-timer", "countdown-timer", "match-products",
        "complete-shelves", "complete-shelf", "place-product"};
    return names[condition.index()];
}

} // anonymous namespace

bool evaluate_locked(const LockCondition& condition, const LevelStats& stats, std::optional<float> time_limit) {
    return std::visit([&](const auto& lock) { return locked_by(lock, stats, time_limit); }, condition);
}

// =============================================================================
// LockingShelf
// =============================================================================

LockingShelf::LockingShelf(std::unique_ptr<IShelf> inner, LockCondition condition)
    : ShelfWrapper(std::move(inner))
    , m_condition(std::move(condition)) {
    add_gate(this);
}

bool LockingShelf::refresh(const LevelStats& stats, std::optional<float> time_limit) {
    const bool locked = evaluate_locked(m_condition, stats, time_limit);
    if (!m_evaluated) {
        m_evaluated = true;
        m_locked = locked;
        m_lock_progress = locked ? 1.0f : 0.0f;
        return false;
    }
    if (locked == m_locked) {
        return false;
    }
    m_locked = locked;
    stock_core::puzzle_logger()->debug("[LockingShelf] {} at t={:.2f} ({})",
                                       locked ? "Locked" : "Unlocked", stats.time, mode_name(m_condition));
    return true;
}

void LockingShelf::update(TickContext& ctx) {
    ShelfWrapper::update(ctx);

    const float duration = ctx.config.lock_transition_time;
    if (duration <= 0.0f) {
        m_lock_progress = m_locked ? 1.0f : 0.0f;
        return;
    }
    const float step = ctx.dt / duration;
    m_lock_progress = stock_math::clamp(m_lock_progress + (m_locked ? step : -step), 0.0f, 1.0f);
}

} // namespace stock_puzzle
