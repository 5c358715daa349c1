#pragma once

/// @file fixtures.hpp
/// @brief Shared builders for stock_puzzle tests

#include <stockroom/puzzle/puzzle.hpp>

#include <initializer_list>
#include <memory>
#include <string>
#include <vector>

namespace stock_test {

using namespace stock_puzzle;

inline constexpr float k_dt = 1.0f / 60.0f;

/// Product that matches itself plus @p also
inline ProductDefPtr make_def(const std::string& id, std::vector<ProductId> also = {}, int points = 1) {
    auto def = std::make_shared<ProductDef>();
    def->id = id;
    def->name = id;
    def->image = id + ".png";
    def->matches.push_back(id);
    for (auto& other : also) {
        def->matches.push_back(std::move(other));
    }
    def->points = points;
    return def;
}

inline std::unique_ptr<Product> make_product(const ProductDefPtr& def) {
    return std::make_unique<Product>(def, PuzzleConfig{}.product_size());
}

/// Slot contents from definitions; nullptr leaves the slot empty
inline Shelf::Slots make_slots(std::initializer_list<ProductDefPtr> defs) {
    Shelf::Slots slots;
    for (const auto& def : defs) {
        slots.push_back(def ? make_product(def) : nullptr);
    }
    return slots;
}

inline Vec2 cell() {
    return PuzzleConfig{}.product_size();
}

/// Config, stats and a tick context for driving actors without a level
struct Harness {
    PuzzleConfig config;
    LevelStats stats;

    [[nodiscard]] TickContext tick(float dt = k_dt) {
        return TickContext{dt, PointerState{}, ViewBounds{}, config, stats, nullptr};
    }

    /// Run @p actor for @p seconds of simulated time
    void run(Actor& actor, float seconds) {
        for (float t = 0.0f; t < seconds; t += k_dt) {
            TickContext ctx = tick();
            actor.update(ctx);
        }
    }
};

// =============================================================================
// Catalogue
// =============================================================================

/// apple, banana, cherry and berry; cherry and berry match each other
inline ProductFactory fruit_catalogue() {
    std::vector<ProductDef> defs;
    for (const auto& def : {make_def("apple", {}, 10), make_def("banana", {}, 10),
                            make_def("cherry", {"berry"}, 15), make_def("berry", {"cherry"}, 15)}) {
        defs.push_back(*def);
    }
    return ProductFactory::from_defs(std::move(defs)).unwrap();
}

// =============================================================================
// Definition Builders
// =============================================================================

inline ShelfDef shelf_def(SlotContents products, std::optional<ShelfReference> reference = std::nullopt) {
    ShelfDef def;
    def.kind = ShelfKind::Basic;
    def.products = std::move(products);
    def.reference = std::move(reference);
    return def;
}

inline ShelfDef wrap_def(ShelfKind kind, ShelfDef inner) {
    ShelfDef def;
    def.kind = kind;
    def.inner = std::make_shared<const ShelfDef>(std::move(inner));
    return def;
}

inline ShelfDef locking_def(ShelfDef inner, LockConditionDef condition) {
    ShelfDef def = wrap_def(ShelfKind::Locking, std::move(inner));
    def.locking = std::move(condition);
    return def;
}

inline ActorDef shelf_actor(ShelfDef shelf, Vec2 grid_position) {
    ActorDef def;
    def.kind = ActorKind::Shelf;
    def.grid_position = grid_position;
    def.shelf = std::move(shelf);
    return def;
}

inline LevelDef level_def(std::vector<ActorDef> actors) {
    LevelDef def;
    def.id = "test_level";
    def.name = "Test Level";
    def.grid_width = 8;
    def.grid_height = 6;
    def.actors = std::move(actors);
    return def;
}

// =============================================================================
// Pointer Scripts
// =============================================================================

inline Vec2 slot_center(const Shelf& shelf, std::size_t slot) {
    return shelf.slot_rect(slot).center();
}

inline void idle(Level& level, float seconds) {
    for (float t = 0.0f; t < seconds; t += k_dt) {
        level.update(k_dt, PointerState{});
    }
}

/// Press at @p from, hold over @p to until the product settles, release
inline void drag(Level& level, Vec2 from, Vec2 to) {
    level.update(k_dt, PointerState{from, true, true});
    for (int i = 0; i < 30; ++i) {
        level.update(k_dt, PointerState{to, false, true});
    }
    level.update(k_dt, PointerState{to, false, false});
}

inline void drag(Level& level, const Shelf& from, std::size_t from_slot, const Shelf& to, std::size_t to_slot) {
    drag(level, slot_center(from, from_slot), slot_center(to, to_slot));
}

} // namespace stock_test
