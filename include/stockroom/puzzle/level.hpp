/// @file level.hpp
/// @brief Level: owns actors, resolves drag and drop, aggregates stats

#pragma once

#include "factory.hpp"
#include "stats.hpp"

#include <stockroom/core/error.hpp>

#include <memory>
#include <optional>
#include <vector>

namespace stock_puzzle {

/// @brief The in-flight drag: where the product came from
struct DragState {
    Shelf* shelf{nullptr};
    std::size_t slot{0};
    Product* product{nullptr};
};

/// @brief Winning destination for a drop
struct PlacementTarget {
    Shelf* shelf{nullptr};
    std::size_t slot{0};
    float distance{0.0f};
};

/// @brief Outcome of releasing a drag
enum class DropResult : std::uint8_t {
    Placed,     ///< Moved to a new slot
    Invalid,    ///< No eligible slot; product stays in its origin
    Cancelled   ///< Origin changed under the drag; product stays put
};

// =============================================================================
// Level
// =============================================================================

/// @brief One playable level
///
/// Each update() runs, in order: actor updates (products may start a drag),
/// drop resolution if the pointer was released, completion check, release of
/// disposed shelves, stat aggregation, and lock re-evaluation.
///
/// @code
/// auto level = Level::create(level_def, products, config);
/// if (!level) { /* report level.error() */ }
/// (*level)->update(dt, pointer, view);
/// @endcode
class Level : public DragController {
public:
    [[nodiscard]] static stock_core::Result<std::unique_ptr<Level>> create(
        const LevelDef& def, const ProductFactory& products, const PuzzleConfig& config = {});

    ~Level() override;

    Level(const Level&) = delete;
    Level& operator=(const Level&) = delete;

    // =========================================================================
    // Tick
    // =========================================================================

    void update(float dt, const PointerState& pointer, const ViewBounds& view = {});

    // =========================================================================
    // Drag and Drop
    // =========================================================================

    bool begin_drag(Shelf& shelf, std::size_t slot, Product& product) override;

    [[nodiscard]] const std::optional<DragState>& dragging() const { return m_drag; }

    /// @brief Abandon the drag; the product returns to its slot
    /// @return false if no drag was in flight
    bool cancel_drag();

    /// @brief Nearest eligible slot across all shelves for @p product
    [[nodiscard]] std::optional<PlacementTarget> resolve_drop(const Product& product) const;

    /// @brief Result of the most recent release, if any
    [[nodiscard]] std::optional<DropResult> last_drop() const { return m_last_drop; }

    // =========================================================================
    // Queries
    // =========================================================================

    [[nodiscard]] const LevelDef& def() const { return m_def; }
    [[nodiscard]] const PuzzleConfig& config() const { return m_config; }
    [[nodiscard]] const LevelStats& stats() const { return m_stats; }

    /// @brief Every live slot shelf, including nested ones, in construction order
    [[nodiscard]] const std::vector<Shelf*>& shelves() const { return m_shelves; }

    [[nodiscard]] const std::vector<LockingShelf*>& locking_shelves() const { return m_locking; }

    [[nodiscard]] Shelf* find_shelf(const ShelfReference& reference) const;

    [[nodiscard]] std::size_t actor_count() const { return m_actors.size(); }
    [[nodiscard]] const Actor& actor(std::size_t index) const { return *m_actors[index].actor; }

    /// @brief World-space top-left of the level grid (grid is centred on the origin)
    [[nodiscard]] Vec2 grid_origin() const;

    /// @brief Latched once every non-ignored shelf is complete
    [[nodiscard]] bool completed() const { return m_completed; }

    [[nodiscard]] std::optional<float> time_remaining() const;
    [[nodiscard]] bool time_expired() const;

private:
    struct PlacedActor {
        Vec2 grid_position;
        std::unique_ptr<Actor> actor;
    };

    Level(LevelDef def, const PuzzleConfig& config);

    stock_core::Result<void> build(const ProductFactory& products);
    stock_core::Result<void> apply_locked_products();
    stock_core::Result<void> validate_references() const;

    void position_actors();
    void finish_drag();
    void check_completion();
    void release_disposed();
    void aggregate_stats(float dt);
    void refresh_locks();

    LevelDef m_def;
    PuzzleConfig m_config;
    LevelStats m_stats;

    std::vector<PlacedActor> m_actors;
    std::vector<Shelf*> m_shelves;
    std::vector<LockingShelf*> m_locking;

    std::optional<DragState> m_drag;
    std::optional<DropResult> m_last_drop;
    bool m_completed{false};

    /// Shelves disposed while complete
    std::uint32_t m_retired_complete{0};
};

} // namespace stock_puzzle
