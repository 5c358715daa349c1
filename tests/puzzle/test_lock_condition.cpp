// stock_puzzle lock condition and LockingShelf tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "fixtures.hpp"

using namespace stock_test;
using Catch::Matchers::WithinAbs;

// =============================================================================
// Timers
// =============================================================================

TEST_CASE("Toggle timer lock", "[puzzle][locking]") {
    LevelStats stats;

    SECTION("starts locked and alternates each period") {
        ToggleTimerLock lock{2.0f, true, std::nullopt};
        stats.time = 0.5f;
        REQUIRE(evaluate_locked(lock, stats, std::nullopt));
        stats.time = 2.5f;
        REQUIRE_FALSE(evaluate_locked(lock, stats, std::nullopt));
        stats.time = 4.5f;
        REQUIRE(evaluate_locked(lock, stats, std::nullopt));
    }

    SECTION("starting unlocked shifts the cycle by half a period") {
        ToggleTimerLock lock{2.0f, false, std::nullopt};
        stats.time = 0.5f;
        REQUIRE(evaluate_locked(lock, stats, std::nullopt));
        stats.time = 1.5f;
        REQUIRE_FALSE(evaluate_locked(lock, stats, std::nullopt));
        stats.time = 2.5f;
        REQUIRE_FALSE(evaluate_locked(lock, stats, std::nullopt));
        stats.time = 3.5f;
        REQUIRE(evaluate_locked(lock, stats, std::nullopt));
    }

    SECTION("final countdown forces unlock") {
        ToggleTimerLock lock{2.0f, true, 10.0f};
        stats.time = 48.5f;
        REQUIRE(evaluate_locked(lock, stats, 60.0f));
        stats.time = 50.5f;
        REQUIRE_FALSE(evaluate_locked(lock, stats, 60.0f));
        stats.time = 52.5f;
        REQUIRE_FALSE(evaluate_locked(lock, stats, 60.0f));
    }

    SECTION("final countdown needs a time limit") {
        ToggleTimerLock lock{2.0f, true, 10.0f};
        stats.time = 52.5f;
        REQUIRE(evaluate_locked(lock, stats, std::nullopt));
    }
}

TEST_CASE("Countdown timer lock", "[puzzle][locking]") {
    LevelStats stats;
    CountdownTimerLock lock{5.0f};

    stats.time = 4.9f;
    REQUIRE(evaluate_locked(lock, stats, std::nullopt));
    stats.time = 5.1f;
    REQUIRE_FALSE(evaluate_locked(lock, stats, std::nullopt));
    stats.time = 500.0f;
    REQUIRE_FALSE(evaluate_locked(lock, stats, std::nullopt));
}

// =============================================================================
// Progress Conditions
// =============================================================================

TEST_CASE("Match products lock", "[puzzle][locking]") {
    auto apple = make_def("apple");
    auto cherry = make_def("cherry", {"berry"});
    auto berry = make_def("berry", {"cherry"});
    LevelStats stats;

    SECTION("any product") {
        MatchProductsLock lock{nullptr, 3};
        stats.record_match(apple);
        stats.record_match(apple);
        REQUIRE(evaluate_locked(lock, stats, std::nullopt));
        stats.record_match(cherry);
        REQUIRE_FALSE(evaluate_locked(lock, stats, std::nullopt));
    }

    SECTION("products matching a reference product") {
        MatchProductsLock lock{cherry, 3};
        for (int i = 0; i < 5; ++i) {
            stats.record_match(apple);
        }
        stats.record_match(cherry);
        stats.record_match(berry);
        REQUIRE(evaluate_locked(lock, stats, std::nullopt));
        stats.record_match(berry);
        REQUIRE_FALSE(evaluate_locked(lock, stats, std::nullopt));
    }
}

TEST_CASE("Complete shelves lock", "[puzzle][locking]") {
    LevelStats stats;
    CompleteShelvesLock lock{2};
    stats.completed_shelves = {{"a", true}, {"b", false}, {"c", false}};

    SECTION("one of three complete") {
        REQUIRE(evaluate_locked(lock, stats, std::nullopt));
    }

    SECTION("two of three complete") {
        stats.completed_shelves["b"] = true;
        REQUIRE_FALSE(evaluate_locked(lock, stats, std::nullopt));
    }
}

TEST_CASE("Complete shelf lock", "[puzzle][locking]") {
    LevelStats stats;
    CompleteShelfLock lock{"pantry"};

    REQUIRE(evaluate_locked(lock, stats, std::nullopt));
    stats.completed_shelves["pantry"] = false;
    REQUIRE(evaluate_locked(lock, stats, std::nullopt));
    stats.completed_shelves["pantry"] = true;
    REQUIRE_FALSE(evaluate_locked(lock, stats, std::nullopt));
}

// =============================================================================
// Placement Conditions
// =============================================================================

TEST_CASE("Place product lock", "[puzzle][locking]") {
    auto apple = make_def("apple");
    auto banana = make_def("banana");
    LevelStats stats;

    SECTION("latch stays unlocked after the product leaves") {
        PlaceProductLock lock{"counter", 1, true, false, nullptr};
        REQUIRE(evaluate_locked(lock, stats, std::nullopt));

        stats.record_placement("counter", 1, apple);
        stats.current_product_placement["counter"] = {nullptr, apple, nullptr};
        REQUIRE_FALSE(evaluate_locked(lock, stats, std::nullopt));

        stats.current_product_placement["counter"] = {nullptr, nullptr, nullptr};
        REQUIRE_FALSE(evaluate_locked(lock, stats, std::nullopt));
    }

    SECTION("non-latch re-locks when the product leaves") {
        PlaceProductLock lock{"counter", 1, false, false, nullptr};
        stats.record_placement("counter", 1, apple);
        stats.current_product_placement["counter"] = {nullptr, apple, nullptr};
        REQUIRE_FALSE(evaluate_locked(lock, stats, std::nullopt));

        stats.current_product_placement["counter"] = {nullptr, nullptr, nullptr};
        REQUIRE(evaluate_locked(lock, stats, std::nullopt));
    }

    SECTION("required product must qualify") {
        PlaceProductLock lock{"counter", 1, false, false, banana};
        stats.current_product_placement["counter"] = {nullptr, apple, nullptr};
        REQUIRE(evaluate_locked(lock, stats, std::nullopt));
        stats.current_product_placement["counter"] = {nullptr, banana, nullptr};
        REQUIRE_FALSE(evaluate_locked(lock, stats, std::nullopt));
    }

    SECTION("other slots do not count") {
        PlaceProductLock lock{"counter", 1, true, false, nullptr};
        stats.record_placement("counter", 0, apple);
        stats.record_placement("shelf", 1, apple);
        REQUIRE(evaluate_locked(lock, stats, std::nullopt));
    }

    SECTION("inverted") {
        PlaceProductLock lock{"counter", 1, false, true, nullptr};
        REQUIRE_FALSE(evaluate_locked(lock, stats, std::nullopt));
        stats.current_product_placement["counter"] = {nullptr, apple, nullptr};
        REQUIRE(evaluate_locked(lock, stats, std::nullopt));
    }
}

// =============================================================================
// LockingShelf
// =============================================================================

TEST_CASE("LockingShelf gates its inner shelf", "[puzzle][locking][shelf]") {
    auto apple = make_def("apple");
    Harness h;
    auto inner = std::make_unique<Shelf>(make_slots({apple, nullptr, nullptr}), 3, 3, cell());
    Shelf* slots = inner.get();
    LockingShelf locking(std::move(inner), CompleteShelfLock{"pantry"});

    REQUIRE(locking.kind() == ShelfKind::Locking);
    REQUIRE_FALSE(locking.refresh(h.stats, std::nullopt));
    REQUIRE(locking.locked());

    const Product& product = *slots->product_at(0);
    REQUIRE_FALSE(slots->can_pick_up_at(product, 0));
    REQUIRE_FALSE(slots->can_drop_at(product, 1));
    REQUIRE_FALSE(slots->find_slot(product).has_value());

    SECTION("unlock edge") {
        h.stats.completed_shelves["pantry"] = true;
        REQUIRE(locking.refresh(h.stats, std::nullopt));
        REQUIRE_FALSE(locking.locked());
        REQUIRE(slots->can_pick_up_at(product, 0));
        REQUIRE(slots->can_drop_at(product, 1));

        REQUIRE_FALSE(locking.refresh(h.stats, std::nullopt));
    }

    SECTION("lock transition animates") {
        REQUIRE_THAT(locking.lock_progress(), WithinAbs(1.0f, 1e-6f));
        h.stats.completed_shelves["pantry"] = true;
        REQUIRE(locking.refresh(h.stats, std::nullopt));
        h.run(locking, h.config.lock_transition_time * 0.5f);
        REQUIRE(locking.lock_progress() > 0.0f);
        REQUIRE(locking.lock_progress() < 1.0f);
        h.run(locking, h.config.lock_transition_time);
        REQUIRE_THAT(locking.lock_progress(), WithinAbs(0.0f, 1e-6f));
    }
}

TEST_CASE("LockingShelf first evaluation is not an edge", "[puzzle][locking][shelf]") {
    LevelStats stats;
    stats.time = 10.0f;
    LockingShelf locking(std::make_unique<Shelf>(Shelf::Slots{}, 3, 3, cell()), CountdownTimerLock{5.0f});

    REQUIRE_FALSE(locking.refresh(stats, std::nullopt));
    REQUIRE_FALSE(locking.locked());
    REQUIRE_THAT(locking.lock_progress(), WithinAbs(0.0f, 1e-6f));
}
