// stock_puzzle Level tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "fixtures.hpp"

using namespace stock_test;
using Catch::Matchers::WithinAbs;
using stock_core::DefinitionError;

namespace {

const ProductFactory& catalogue() {
    static const ProductFactory products = fruit_catalogue();
    return products;
}

std::unique_ptr<Level> build(LevelDef def) {
    auto level = Level::create(def, catalogue());
    REQUIRE(level.is_ok());
    return std::move(*level);
}

stock_core::Error build_error(LevelDef def) {
    auto level = Level::create(def, catalogue());
    REQUIRE_FALSE(level.is_ok());
    return level.error();
}

/// left [apple, apple, -], right [banana, apple, -]
LevelDef two_shelves() {
    return level_def({
        shelf_actor(shelf_def({"apple", "apple", std::nullopt}, "left"), Vec2(0.0f, 0.0f)),
        shelf_actor(shelf_def({"banana", "apple", std::nullopt}, "right"), Vec2(4.0f, 0.0f)),
    });
}

} // anonymous namespace

// =============================================================================
// Construction
// =============================================================================

TEST_CASE("Level construction", "[puzzle][level]") {
    auto level = build(two_shelves());

    REQUIRE(level->actor_count() == 2);
    REQUIRE(level->shelves().size() == 2);
    REQUIRE(level->locking_shelves().empty());
    REQUIRE(level->find_shelf("left") != nullptr);
    REQUIRE(level->find_shelf("missing") == nullptr);
    REQUIRE_FALSE(level->completed());
    REQUIRE_FALSE(level->dragging().has_value());
    REQUIRE_FALSE(level->last_drop().has_value());

    SECTION("grid is centred on the origin") {
        REQUIRE(level->grid_origin() == Vec2(-4.0f, -4.5f));
        const Shelf& left = *level->find_shelf("left");
        const Shelf& right = *level->find_shelf("right");
        REQUIRE(left.slot_rect(0).position == Vec2(-4.0f, -4.5f));
        REQUIRE(right.slot_rect(0).position == Vec2(0.0f, -4.5f));
    }

    SECTION("stats start from the catalogue") {
        const LevelStats& stats = level->stats();
        REQUIRE(stats.product_matches.size() == 4);
        REQUIRE(stats.product_matches.at("cherry").total == 0);
        REQUIRE(stats.total_matches == 0);
        REQUIRE(stats.completed_shelves.at("left") == false);
        REQUIRE(stats.current_product_placement.at("right").size() == 3);
        REQUIRE(stats.current_product_placement.at("right")[0]->id == "banana");
    }

    SECTION("products settle into their slots") {
        idle(*level, 0.2f);
        const Shelf& left = *level->find_shelf("left");
        REQUIRE(left.product_at(1)->position() == left.slot_rect(1).position);
    }
}

TEST_CASE("Level construction errors", "[puzzle][level]") {
    SECTION("unknown product") {
        auto error = build_error(level_def({
            shelf_actor(shelf_def({"kiwi"}), Vec2(0.0f, 0.0f)),
        }));
        REQUIRE(error.as<DefinitionError>()->kind == DefinitionError::Kind::UnknownProduct);
        REQUIRE(error.as<DefinitionError>()->value == "kiwi");
        REQUIRE(*error.get_context("level") == "test_level");
    }

    SECTION("duplicate shelf reference") {
        auto error = build_error(level_def({
            shelf_actor(shelf_def({}, "left"), Vec2(0.0f, 0.0f)),
            shelf_actor(shelf_def({}, "left"), Vec2(4.0f, 0.0f)),
        }));
        REQUIRE(error.as<DefinitionError>()->kind == DefinitionError::Kind::DuplicateId);
        REQUIRE(error.as<DefinitionError>()->value == "left");
    }

    SECTION("lock on an unknown shelf") {
        auto error = build_error(level_def({
            shelf_actor(locking_def(shelf_def({}, "vault"), CompleteShelfDef{"nowhere"}), Vec2(0.0f, 0.0f)),
        }));
        REQUIRE(error.as<DefinitionError>()->kind == DefinitionError::Kind::UnknownReference);
        REQUIRE(error.as<DefinitionError>()->value == "nowhere");
    }

    SECTION("locked product on an unknown shelf") {
        LevelDef def = two_shelves();
        def.locked_products.push_back(LockedProductDef{"nowhere", 0});
        auto error = build_error(def);
        REQUIRE(error.as<DefinitionError>()->kind == DefinitionError::Kind::UnknownReference);
    }

    SECTION("too many products for the shelf") {
        auto error = build_error(level_def({
            shelf_actor(shelf_def({"apple", "apple", "apple", "apple"}), Vec2(0.0f, 0.0f)),
        }));
        REQUIRE(error.as<DefinitionError>()->kind == DefinitionError::Kind::InvalidValue);
    }
}

// =============================================================================
// Drag and Drop
// =============================================================================

TEST_CASE("Level drag and drop", "[puzzle][level][drag]") {
    auto level = build(two_shelves());
    Shelf& left = *level->find_shelf("left");
    Shelf& right = *level->find_shelf("right");
    idle(*level, 0.2f);

    SECTION("drop into an empty slot") {
        drag(*level, left, 0, right, 2);

        REQUIRE(level->last_drop() == DropResult::Placed);
        REQUIRE_FALSE(level->dragging().has_value());
        REQUIRE(left.product_at(0) == nullptr);
        REQUIRE(right.product_at(2)->id() == "apple");

        const auto& placements = level->stats().product_placements;
        REQUIRE(placements.size() == 1);
        REQUIRE(placements[0].shelf_reference == "right");
        REQUIRE(placements[0].slot == 2);
        REQUIRE(placements[0].product->id == "apple");
    }

    SECTION("press starts a drag") {
        level->update(k_dt, PointerState{slot_center(right, 0), true, true});
        REQUIRE(level->dragging().has_value());
        REQUIRE(level->dragging()->shelf == &right);
        REQUIRE(level->dragging()->slot == 0);
        REQUIRE(right.product_at(0)->dragging());
    }

    SECTION("drop on an occupied slot is rejected") {
        drag(*level, right, 0, left, 1);

        REQUIRE(level->last_drop() == DropResult::Invalid);
        REQUIRE(right.product_at(0)->id() == "banana");
        REQUIRE(left.product_at(1)->id() == "apple");
        REQUIRE(level->stats().product_placements.empty());
    }

    SECTION("drop away from any shelf returns the product") {
        drag(*level, slot_center(right, 0), Vec2(100.0f, 100.0f));

        REQUIRE(level->last_drop() == DropResult::Invalid);
        REQUIRE(right.product_at(0)->id() == "banana");
        REQUIRE_FALSE(right.product_at(0)->dragging());

        idle(*level, 1.0f);
        REQUIRE(right.product_at(0)->position() == right.slot_rect(0).position);
    }

    SECTION("cancel") {
        level->update(k_dt, PointerState{slot_center(right, 0), true, true});
        REQUIRE(level->cancel_drag());
        REQUIRE_FALSE(level->cancel_drag());
        REQUIRE(level->last_drop() == DropResult::Cancelled);
        REQUIRE_FALSE(right.product_at(0)->dragging());

        level->update(k_dt, PointerState{slot_center(left, 2), false, false});
        REQUIRE(right.product_at(0)->id() == "banana");
        REQUIRE(left.product_at(2) == nullptr);
    }

    SECTION("nothing to pick up on an empty slot") {
        level->update(k_dt, PointerState{slot_center(right, 2), true, true});
        REQUIRE_FALSE(level->dragging().has_value());
    }
}

TEST_CASE("Level drop picks the nearest slot across shelves", "[puzzle][level][drag]") {
    // near_left slot 2 and near_right slot 0 touch at x = -1 on the top row
    auto level = build(level_def({
        shelf_actor(shelf_def({"apple", "cherry", std::nullopt}, "near_left"), Vec2(0.0f, 0.0f)),
        shelf_actor(shelf_def({std::nullopt, "cherry", "apple"}, "near_right"), Vec2(3.0f, 0.0f)),
        shelf_actor(shelf_def({"banana", "apple", "cherry"}, "source"), Vec2(4.0f, 2.0f)),
        shelf_actor(shelf_def({"apple", "banana", std::nullopt}, "bystander"), Vec2(0.0f, 4.0f)),
    }));
    Shelf& near_left = *level->find_shelf("near_left");
    Shelf& near_right = *level->find_shelf("near_right");
    Shelf& source = *level->find_shelf("source");
    Shelf& bystander = *level->find_shelf("bystander");
    idle(*level, 0.2f);

    const auto left_before = near_left.slot_contents();
    const auto right_before = near_right.slot_contents();
    const auto bystander_before = bystander.slot_contents();
    const float row_y = slot_center(near_left, 2).y;

    SECTION("later shelf wins when strictly nearer") {
        drag(*level, slot_center(source, 0), Vec2(-0.8f, row_y));

        REQUIRE(level->last_drop() == DropResult::Placed);
        REQUIRE(near_right.product_at(0)->id() == "banana");
        REQUIRE(near_left.slot_contents() == left_before);
        REQUIRE(level->stats().product_placements.back().shelf_reference == "near_right");
    }

    SECTION("earlier shelf wins when nearer") {
        drag(*level, slot_center(source, 0), Vec2(-1.2f, row_y));

        REQUIRE(level->last_drop() == DropResult::Placed);
        REQUIRE(near_left.product_at(2)->id() == "banana");
        REQUIRE(near_right.slot_contents() == right_before);
    }

    SECTION("equal distance goes to the earlier shelf") {
        drag(*level, slot_center(source, 0), Vec2(-1.0f, row_y));

        REQUIRE(level->last_drop() == DropResult::Placed);
        REQUIRE(near_left.product_at(2)->id() == "banana");
        REQUIRE(near_right.slot_contents() == right_before);
        REQUIRE(level->stats().product_placements.back().shelf_reference == "near_left");
    }

    REQUIRE(source.product_at(0) == nullptr);
    REQUIRE(source.product_at(1)->id() == "apple");
    REQUIRE(bystander.slot_contents() == bystander_before);
    REQUIRE(level->stats().product_placements.size() == 1);
}

TEST_CASE("Level matching and completion", "[puzzle][level]") {
    auto level = build(two_shelves());
    Shelf& left = *level->find_shelf("left");
    Shelf& right = *level->find_shelf("right");
    idle(*level, 0.2f);

    drag(*level, right, 1, left, 2);
    REQUIRE(level->last_drop() == DropResult::Placed);
    idle(*level, 2.0f);

    const LevelStats& stats = level->stats();
    REQUIRE(stats.total_matches == 3);
    REQUIRE(stats.score == 30);
    REQUIRE(stats.product_matches.at("apple").total == 3);
    REQUIRE(left.is_empty());
    REQUIRE(stats.completed_shelves.at("left"));
    REQUIRE_FALSE(stats.completed_shelves.at("right"));
    REQUIRE(stats.total_completed_shelves == 1);
    REQUIRE_FALSE(level->completed());

    SECTION("level completes once every shelf is complete") {
        LevelDef def = level_def({
            shelf_actor(shelf_def({"apple", "apple", std::nullopt}), Vec2(0.0f, 0.0f)),
            shelf_actor(shelf_def({"apple"}), Vec2(4.0f, 0.0f)),
        });
        auto small = build(def);
        idle(*small, 0.2f);
        drag(*small, *small->shelves()[1], 0, *small->shelves()[0], 2);
        idle(*small, 2.0f);

        REQUIRE(small->completed());
        REQUIRE(small->stats().total_completed_shelves == 2);
    }
}

TEST_CASE("Ignored shelves do not hold back completion", "[puzzle][level]") {
    ShelfDef decoration = shelf_def({"banana"});
    decoration.ignore = true;
    auto level = build(level_def({
        shelf_actor(shelf_def({}), Vec2(0.0f, 0.0f)),
        shelf_actor(decoration, Vec2(4.0f, 0.0f)),
    }));

    level->update(k_dt, PointerState{});
    REQUIRE(level->completed());
}

TEST_CASE("Locked products stay put", "[puzzle][level]") {
    LevelDef def = two_shelves();
    def.locked_products.push_back(LockedProductDef{"right", 0});
    def.locked_products.push_back(LockedProductDef{"right", 2});
    auto level = build(def);
    Shelf& right = *level->find_shelf("right");
    idle(*level, 0.2f);

    REQUIRE(right.product_at(0)->locked());
    REQUIRE(right.product_at(2) == nullptr);

    level->update(k_dt, PointerState{slot_center(right, 0), true, true});
    REQUIRE_FALSE(level->dragging().has_value());
}

// =============================================================================
// Locks
// =============================================================================

TEST_CASE("Level locks follow stats", "[puzzle][level][locking]") {
    SECTION("complete-shelf lock opens after the shelf clears") {
        auto level = build(level_def({
            shelf_actor(shelf_def({"apple", "apple", std::nullopt}, "left"), Vec2(0.0f, 0.0f)),
            shelf_actor(shelf_def({"banana", "apple", std::nullopt}, "right"), Vec2(4.0f, 0.0f)),
            shelf_actor(locking_def(shelf_def({"banana"}, "vault"), CompleteShelfDef{"left"}), Vec2(0.0f, 2.0f)),
        }));
        Shelf& left = *level->find_shelf("left");
        Shelf& right = *level->find_shelf("right");
        Shelf& vault = *level->find_shelf("vault");
        REQUIRE(level->locking_shelves().size() == 1);
        REQUIRE(level->locking_shelves()[0]->locked());
        idle(*level, 0.2f);

        level->update(k_dt, PointerState{slot_center(vault, 0), true, true});
        REQUIRE_FALSE(level->dragging().has_value());
        level->update(k_dt, PointerState{});

        drag(*level, right, 1, left, 2);
        idle(*level, 2.0f);
        REQUIRE_FALSE(level->locking_shelves()[0]->locked());

        drag(*level, vault, 0, right, 2);
        REQUIRE(level->last_drop() == DropResult::Placed);
    }

    auto place_level = [](bool latch) {
        PlaceProductDef place;
        place.shelf_reference = "counter";
        place.slot = 2;
        place.latch = latch;
        return build(level_def({
            shelf_actor(shelf_def({"apple", "banana", std::nullopt}, "stock"), Vec2(0.0f, 0.0f)),
            shelf_actor(shelf_def({"banana"}, "counter"), Vec2(4.0f, 0.0f)),
            shelf_actor(locking_def(shelf_def({}, "vault"), place), Vec2(0.0f, 2.0f)),
        }));
    };

    SECTION("place-product without latch re-locks") {
        auto level = place_level(false);
        Shelf& stock = *level->find_shelf("stock");
        Shelf& counter = *level->find_shelf("counter");
        idle(*level, 0.2f);
        REQUIRE(level->locking_shelves()[0]->locked());

        drag(*level, stock, 0, counter, 2);
        REQUIRE(level->last_drop() == DropResult::Placed);
        REQUIRE_FALSE(level->locking_shelves()[0]->locked());

        drag(*level, counter, 2, stock, 0);
        REQUIRE(level->last_drop() == DropResult::Placed);
        REQUIRE(level->locking_shelves()[0]->locked());
    }

    SECTION("place-product with latch stays open") {
        auto level = place_level(true);
        Shelf& stock = *level->find_shelf("stock");
        Shelf& counter = *level->find_shelf("counter");
        idle(*level, 0.2f);

        drag(*level, stock, 0, counter, 2);
        drag(*level, counter, 2, stock, 0);
        REQUIRE(level->last_drop() == DropResult::Placed);
        REQUIRE_FALSE(level->locking_shelves()[0]->locked());
    }
}

// =============================================================================
// Time Limit
// =============================================================================

TEST_CASE("Level time limit", "[puzzle][level]") {
    SECTION("no limit") {
        auto level = build(two_shelves());
        idle(*level, 0.5f);
        REQUIRE_FALSE(level->time_remaining().has_value());
        REQUIRE_FALSE(level->time_expired());
    }

    SECTION("counts down and clamps at zero") {
        LevelDef def = two_shelves();
        def.time_limit = 3.0f;
        auto level = build(def);

        idle(*level, 1.0f);
        REQUIRE_THAT(*level->time_remaining(), WithinAbs(2.0f, 0.05f));
        REQUIRE_FALSE(level->time_expired());

        idle(*level, 3.0f);
        REQUIRE(*level->time_remaining() == 0.0f);
        REQUIRE(level->time_expired());
    }
}
