/// @file level.cpp
/// @brief Level construction, tick and drag resolution

#include <stockroom/puzzle/level.hpp>

#include <stockroom/core/log.hpp>

#include <algorithm>
#include <set>

namespace stock_puzzle {

using stock_core::DefinitionError;
using stock_core::Error;
using stock_core::Result;

namespace {

std::string describe(const Shelf& shelf) {
    return shelf.reference() ? "'" + *shelf.reference() + "'" : std::string("(unreferenced)");
}

/// Shelf reference a lock condition observes, if any
const ShelfReference* observed_reference(const LockCondition& condition) {
    if (const auto* complete = std::get_if<CompleteShelfLock>(&condition)) {
        return &complete->shelf_reference;
    }
    if (const auto* place = std::get_if<PlaceProductLock>(&condition)) {
        return &place->shelf_reference;
    }
    return nullptr;
}

} // anonymous namespace

// =============================================================================
// Construction
// =============================================================================

Level::Level(LevelDef def, const PuzzleConfig& config)
    : m_def(std::move(def))
    , m_config(config) {}

Level::~Level() = default;

Result<std::unique_ptr<Level>> Level::create(const LevelDef& def, const ProductFactory& products,
                                             const PuzzleConfig& config) {
    auto valid = config.validate();
    if (!valid) {
        return stock_core::Err<std::unique_ptr<Level>>(valid.error());
    }

    std::unique_ptr<Level> level(new Level(def, config));
    auto built = level->build(products);
    if (!built) {
        Error error = built.error();
        error.with_context("level", def.id);
        stock_core::debug::record_error(error);
        stock_core::puzzle_logger()->error("[Level] Failed to build '{}': {}", def.id,
                                           stock_core::build_error_chain(error));
        return stock_core::Err<std::unique_ptr<Level>>(std::move(error));
    }

    stock_core::puzzle_logger()->info("[Level] Built '{}' with {} actors, {} shelves ({} locking)",
                                      def.id, level->m_actors.size(), level->m_shelves.size(),
                                      level->m_locking.size());
    return stock_core::Ok(std::move(level));
}

Result<void> Level::build(const ProductFactory& products) {
    BuildContext ctx{products, m_config, {}, {}};

    m_actors.reserve(m_def.actors.size());
    for (std::size_t i = 0; i < m_def.actors.size(); ++i) {
        const ActorDef& actor_def = m_def.actors[i];
        auto actor = ActorFactory::create(actor_def, ctx, "level.actors[" + std::to_string(i) + "]");
        if (!actor) {
            return stock_core::Err(actor.error());
        }
        m_actors.push_back(PlacedActor{actor_def.grid_position, std::move(*actor)});
    }

    m_shelves = std::move(ctx.shelves);
    m_locking = std::move(ctx.locking_shelves);

    std::set<ShelfReference> seen;
    for (const Shelf* shelf : m_shelves) {
        if (shelf->reference() && !seen.insert(*shelf->reference()).second) {
            return stock_core::Err(Error(DefinitionError::duplicate_id("level.actors", *shelf->reference())));
        }
    }

    auto references = validate_references();
    if (!references) {
        return references;
    }

    auto locked = apply_locked_products();
    if (!locked) {
        return locked;
    }

    for (const ProductId& id : products.product_ids()) {
        m_stats.product_matches.emplace(id, ProductMatchTotal{products.find(id), 0});
    }

    position_actors();
    aggregate_stats(0.0f);
    refresh_locks();
    return stock_core::Ok();
}

Result<void> Level::validate_references() const {
    for (std::size_t i = 0; i < m_locking.size(); ++i) {
        const ShelfReference* reference = observed_reference(m_locking[i]->condition());
        if (reference != nullptr && find_shelf(*reference) == nullptr) {
            return stock_core::Err(Error(DefinitionError::unknown_reference(
                "locking[" + std::to_string(i) + "].shelfReference", *reference)));
        }
    }
    return stock_core::Ok();
}

Result<void> Level::apply_locked_products() {
    for (std::size_t i = 0; i < m_def.locked_products.size(); ++i) {
        const LockedProductDef& entry = m_def.locked_products[i];
        const std::string path = "level.lockedProducts[" + std::to_string(i) + "]";

        Shelf* shelf = find_shelf(entry.shelf_reference);
        if (shelf == nullptr) {
            return stock_core::Err(Error(DefinitionError::unknown_reference(path, entry.shelf_reference)));
        }
        if (!shelf->lock_product_at(entry.slot)) {
            stock_core::puzzle_logger()->warn("[Level] {}: no product at '{}' slot {}, nothing locked",
                                              path, entry.shelf_reference, entry.slot);
        }
    }
    return stock_core::Ok();
}

// =============================================================================
// Tick
// =============================================================================

void Level::update(float dt, const PointerState& pointer, const ViewBounds& view) {
    TickContext ctx{dt, pointer, view, m_config, m_stats, this};

    position_actors();
    for (auto& placed : m_actors) {
        placed.actor->update(ctx);
    }

    if (m_drag && !pointer.down) {
        finish_drag();
    }

    check_completion();
    release_disposed();
    aggregate_stats(dt);
    refresh_locks();
}

Vec2 Level::grid_origin() const {
    const Vec2 cell = m_config.product_size();
    return Vec2(-static_cast<float>(m_def.grid_width) * cell.x,
                -static_cast<float>(m_def.grid_height) * cell.y) * 0.5f;
}

void Level::position_actors() {
    const Vec2 origin = grid_origin();
    const Vec2 cell = m_config.product_size();
    for (auto& placed : m_actors) {
        placed.actor->set_position(origin + (placed.grid_position + placed.actor->offset()) * cell);
    }
}

// =============================================================================
// Drag and Drop
// =============================================================================

bool Level::begin_drag(Shelf& shelf, std::size_t slot, Product& product) {
    if (m_drag) {
        return false;
    }
    m_drag = DragState{&shelf, slot, &product};
    stock_core::puzzle_logger()->trace("[Level] Drag '{}' from {} slot {}", product.id(), describe(shelf), slot);
    return true;
}

bool Level::cancel_drag() {
    if (!m_drag) {
        return false;
    }
    m_drag->product->end_drag();
    m_drag.reset();
    m_last_drop = DropResult::Cancelled;
    return true;
}

std::optional<PlacementTarget> Level::resolve_drop(const Product& product) const {
    std::optional<PlacementTarget> best;
    for (Shelf* shelf : m_shelves) {
        if (shelf->disposed()) {
            continue;
        }
        auto candidate = shelf->find_slot(product);
        if (candidate && (!best || candidate->distance < best->distance)) {
            best = PlacementTarget{shelf, candidate->slot, candidate->distance};
        }
    }
    return best;
}

void Level::finish_drag() {
    const DragState drag = *m_drag;
    m_drag.reset();

    if (drag.shelf->product_at(drag.slot) != drag.product) {
        m_last_drop = DropResult::Cancelled;
        stock_core::puzzle_logger()->debug("[Level] Drag cancelled, {} slot {} changed",
                                           describe(*drag.shelf), drag.slot);
        return;
    }

    drag.product->end_drag();
    if (!drag.shelf->can_pick_up_at(*drag.product, drag.slot)) {
        m_last_drop = DropResult::Cancelled;
        stock_core::puzzle_logger()->debug("[Level] Drag of '{}' cancelled, origin {} changed",
                                           drag.product->id(), describe(*drag.shelf));
        return;
    }

    auto target = resolve_drop(*drag.product);
    if (!target) {
        m_last_drop = DropResult::Invalid;
        stock_core::puzzle_logger()->trace("[Level] No slot for '{}', returning to {} slot {}",
                                           drag.product->id(), describe(*drag.shelf), drag.slot);
        return;
    }

    std::unique_ptr<Product> product = drag.shelf->remove_product_at(drag.slot);
    if (!target->shelf->add_product_at(target->slot, std::move(product))) {
        if (!drag.shelf->add_product_at(drag.slot, std::move(product))) {
            stock_core::puzzle_logger()->error("[Level] Could not return '{}' to {} slot {}",
                                               drag.product->id(), describe(*drag.shelf), drag.slot);
        }
        m_last_drop = DropResult::Invalid;
        return;
    }

    const Shelf& destination = *target->shelf;
    if (destination.reference()) {
        m_stats.record_placement(*destination.reference(), target->slot, drag.product->shared_def());
    }
    m_last_drop = DropResult::Placed;
    stock_core::puzzle_logger()->debug("[Level] Placed '{}' from {} slot {} to {} slot {}",
                                       drag.product->id(), describe(*drag.shelf), drag.slot,
                                       describe(destination), target->slot);
}

// =============================================================================
// Bookkeeping
// =============================================================================

void Level::check_completion() {
    if (m_completed) {
        return;
    }
    const bool all_complete = std::all_of(m_shelves.begin(), m_shelves.end(),
        [](const Shelf* shelf) { return shelf->ignored() || shelf->is_complete(); });
    if (all_complete) {
        m_completed = true;
        stock_core::puzzle_logger()->info("[Level] '{}' completed at {:.2f}s, score {}",
                                          m_def.id, m_stats.time, m_stats.score);
    }
}

void Level::release_disposed() {
    if (m_drag) {
        // The dragged product may already be gone; only compare pointers
        const bool origin_gone = m_drag->shelf->disposed();
        const bool product_gone = m_drag->shelf->product_at(m_drag->slot) != m_drag->product;
        if (origin_gone && !product_gone) {
            m_drag->product->end_drag();
        }
        if (origin_gone || product_gone) {
            m_drag.reset();
            m_last_drop = DropResult::Cancelled;
        }
    }

    for (const Shelf* shelf : m_shelves) {
        if (!shelf->disposed()) {
            continue;
        }
        const bool complete = shelf->is_complete();
        if (complete) {
            ++m_retired_complete;
        }
        if (shelf->reference()) {
            m_stats.completed_shelves[*shelf->reference()] = complete;
        }
        stock_core::puzzle_logger()->debug("[Level] Released shelf {}", describe(*shelf));
    }

    m_shelves.erase(std::remove_if(m_shelves.begin(), m_shelves.end(),
                                   [](const Shelf* shelf) { return shelf->disposed(); }),
                    m_shelves.end());
    m_locking.erase(std::remove_if(m_locking.begin(), m_locking.end(),
                                   [](const LockingShelf* shelf) { return shelf->disposed(); }),
                    m_locking.end());
    m_actors.erase(std::remove_if(m_actors.begin(), m_actors.end(),
                                  [](const PlacedActor& placed) { return placed.actor->disposed(); }),
                   m_actors.end());
}

void Level::aggregate_stats(float dt) {
    m_stats.time += dt;

    std::uint32_t live_complete = 0;
    for (const Shelf* shelf : m_shelves) {
        const bool complete = shelf->is_complete();
        if (complete) {
            ++live_complete;
        }
        if (shelf->reference()) {
            m_stats.completed_shelves[*shelf->reference()] = complete;
            m_stats.current_product_placement[*shelf->reference()] = shelf->slot_contents();
        }
    }
    m_stats.total_completed_shelves = live_complete + m_retired_complete;
}

void Level::refresh_locks() {
    for (LockingShelf* lock : m_locking) {
        lock->refresh(m_stats, m_def.time_limit);
    }
}

// =============================================================================
// Queries
// =============================================================================

Shelf* Level::find_shelf(const ShelfReference& reference) const {
    auto it = std::find_if(m_shelves.begin(), m_shelves.end(), [&](const Shelf* shelf) {
        return shelf->reference() && *shelf->reference() == reference;
    });
    return it != m_shelves.end() ? *it : nullptr;
}

std::optional<float> Level::time_remaining() const {
    if (!m_def.time_limit) {
        return std::nullopt;
    }
    return std::max(*m_def.time_limit - m_stats.time, 0.0f);
}

bool Level::time_expired() const {
    auto remaining = time_remaining();
    return remaining && *remaining <= 0.0f;
}

} // namespace stock_puzzle
