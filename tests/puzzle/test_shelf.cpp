// stock_puzzle base shelf tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "fixtures.hpp"

using namespace stock_test;
using Catch::Matchers::WithinAbs;

// =============================================================================
// Slots
// =============================================================================

TEST_CASE("Shelf slot storage", "[puzzle][shelf]") {
    auto apple = make_def("apple");

    SECTION("contents are resized to the slot count") {
        Shelf shelf(make_slots({apple}), 3, 3, cell());
        REQUIRE(shelf.products().size() == 3);
        REQUIRE(shelf.product_at(0) != nullptr);
        REQUIRE(shelf.product_at(1) == nullptr);
        REQUIRE(shelf.product_at(7) == nullptr);
    }

    SECTION("add to an empty slot") {
        Shelf shelf({}, 3, 3, cell());
        auto product = make_product(apple);
        REQUIRE(shelf.add_product_at(1, std::move(product)));
        REQUIRE(product == nullptr);
        REQUIRE(shelf.product_at(1)->id() == "apple");
        REQUIRE(shelf.products().size() == 3);
    }

    SECTION("add to an occupied slot keeps the product with the caller") {
        Shelf shelf(make_slots({apple}), 3, 3, cell());
        auto product = make_product(apple);
        REQUIRE_FALSE(shelf.add_product_at(0, std::move(product)));
        REQUIRE(product != nullptr);
    }

    SECTION("add out of range") {
        Shelf shelf({}, 3, 3, cell());
        auto product = make_product(apple);
        REQUIRE_FALSE(shelf.add_product_at(3, std::move(product)));
        REQUIRE(product != nullptr);
        REQUIRE(shelf.products().size() == 3);
    }

    SECTION("remove") {
        Shelf shelf(make_slots({apple}), 3, 3, cell());
        auto removed = shelf.remove_product_at(0);
        REQUIRE(removed != nullptr);
        REQUIRE(shelf.product_at(0) == nullptr);
        REQUIRE(shelf.remove_product_at(0) == nullptr);
        REQUIRE(shelf.remove_product_at(9) == nullptr);
        REQUIRE(shelf.products().size() == 3);
    }

    SECTION("slot contents") {
        Shelf shelf(make_slots({apple, nullptr, apple}), 3, 3, cell());
        auto contents = shelf.slot_contents();
        REQUIRE(contents.size() == 3);
        REQUIRE(contents[0] == apple);
        REQUIRE(contents[1] == nullptr);
    }
}

TEST_CASE("Shelf product locking", "[puzzle][shelf]") {
    auto apple = make_def("apple");
    Shelf shelf(make_slots({apple}), 3, 3, cell());

    auto locked = shelf.lock_product_at(0);
    REQUIRE(locked.has_value());
    REQUIRE(*locked);
    REQUIRE(shelf.product_at(0)->locked());

    auto unlocked = shelf.lock_product_at(0, false);
    REQUIRE(unlocked.has_value());
    REQUIRE_FALSE(*unlocked);

    REQUIRE_FALSE(shelf.lock_product_at(1).has_value());
    REQUIRE_FALSE(shelf.lock_product_at(5).has_value());
}

// =============================================================================
// Geometry
// =============================================================================

TEST_CASE("Shelf geometry", "[puzzle][shelf]") {
    Shelf shelf({}, 3, 3, Vec2(1.0f, 1.5f));
    shelf.set_position(Vec2(2.0f, 3.0f));

    REQUIRE(shelf.size() == Vec2(3.0f, 1.5f));
    REQUIRE(shelf.slot_rect(0).position == Vec2(2.0f, 3.0f));
    REQUIRE(shelf.slot_rect(2).position == Vec2(4.0f, 3.0f));
    REQUIRE(shelf.slot_rect(1).size == Vec2(1.0f, 1.5f));
}

TEST_CASE("Shelf slot search", "[puzzle][shelf]") {
    auto apple = make_def("apple");
    auto probe = make_product(apple);

    SECTION("nearest overlapping slot") {
        Shelf shelf({}, 3, 3, cell());
        probe->set_position_immediate(Vec2(1.2f, 0.1f));
        auto found = shelf.find_slot(*probe);
        REQUIRE(found.has_value());
        REQUIRE(found->slot == 1);
    }

    SECTION("occupied slots are skipped") {
        Shelf shelf(make_slots({nullptr, apple}), 3, 3, cell());
        probe->set_position_immediate(Vec2(1.2f, 0.1f));
        auto found = shelf.find_slot(*probe);
        REQUIRE(found.has_value());
        REQUIRE(found->slot == 2);
    }

    SECTION("ties go to the lower slot") {
        Shelf shelf({}, 3, 3, cell());
        probe->set_position_immediate(Vec2(0.5f, 0.0f));
        auto found = shelf.find_slot(*probe);
        REQUIRE(found.has_value());
        REQUIRE(found->slot == 0);
    }

    SECTION("no overlap") {
        Shelf shelf({}, 3, 3, cell());
        probe->set_position_immediate(Vec2(0.0f, 5.0f));
        REQUIRE_FALSE(shelf.find_slot(*probe).has_value());
    }
}

// =============================================================================
// Matching
// =============================================================================

TEST_CASE("Shelf clears a full match", "[puzzle][shelf]") {
    auto apple = make_def("apple", {}, 10);
    Harness h;
    Shelf shelf(make_slots({apple, apple, apple}), 3, 3, cell());
    shelf.set_reference(std::string("left"));

    TickContext ctx = h.tick();
    shelf.update(ctx);

    SECTION("next tick reports the match") {
        REQUIRE(h.stats.total_matches == 3);
        REQUIRE(h.stats.product_matches["apple"].total == 3);
        REQUIRE(h.stats.score == 30);
        for (std::size_t i = 0; i < 3; ++i) {
            REQUIRE(shelf.product_at(i)->disappearing());
        }
        REQUIRE_FALSE(shelf.is_complete());
    }

    SECTION("disappearing is staggered") {
        h.run(shelf, 0.1f);
        REQUIRE(shelf.product_at(0)->started_disappearing());
        REQUIRE_FALSE(shelf.product_at(2)->started_disappearing());
    }

    SECTION("matched products cannot be picked up") {
        REQUIRE_FALSE(shelf.can_pick_up_at(*shelf.product_at(0), 0));
    }

    SECTION("shelf empties and completes") {
        h.run(shelf, 1.5f);
        REQUIRE(shelf.is_empty());
        REQUIRE(shelf.is_complete());
        REQUIRE(shelf.products().size() == 3);
        REQUIRE(h.stats.total_matches == 3);
    }
}

TEST_CASE("Shelf leaves a partial group alone", "[puzzle][shelf]") {
    auto apple = make_def("apple");
    auto banana = make_def("banana");
    Harness h;
    Shelf shelf(make_slots({apple, banana, apple}), 3, 3, cell());

    h.run(shelf, 1.0f);
    REQUIRE(h.stats.total_matches == 0);
    REQUIRE_FALSE(shelf.product_at(0)->disappearing());
    REQUIRE_FALSE(shelf.is_complete());
}

TEST_CASE("Shelf settles products into their slots", "[puzzle][shelf]") {
    auto apple = make_def("apple");
    Harness h;
    Shelf shelf(make_slots({nullptr, apple}), 3, 3, cell());
    shelf.set_position(Vec2(-2.0f, 1.0f));

    h.run(shelf, k_dt);
    Vec2 expected = shelf.slot_rect(1).position;
    REQUIRE_THAT(shelf.product_at(1)->position().x, WithinAbs(expected.x, 1e-5f));
    REQUIRE_THAT(shelf.product_at(1)->position().y, WithinAbs(expected.y, 1e-5f));
}

TEST_CASE("Shelf gates", "[puzzle][shelf]") {
    struct FixedGate : ShelfGate {
        bool pick_up = true;
        bool drop = true;
        bool allows_pick_up() const override { return pick_up; }
        bool allows_drop() const override { return drop; }
    };

    auto apple = make_def("apple");
    Shelf shelf(make_slots({apple}), 3, 3, cell());
    FixedGate gate;
    shelf.add_gate(&gate);
    shelf.add_gate(&gate);
    REQUIRE(shelf.gate_count() == 1);

    REQUIRE(shelf.can_pick_up_at(*shelf.product_at(0), 0));
    REQUIRE(shelf.can_drop_at(*shelf.product_at(0), 1));

    gate.pick_up = false;
    gate.drop = false;
    REQUIRE_FALSE(shelf.can_pick_up_at(*shelf.product_at(0), 0));
    REQUIRE_FALSE(shelf.can_drop_at(*shelf.product_at(0), 1));
}
