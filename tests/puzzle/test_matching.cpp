// stock_puzzle match search tests

#include <catch2/catch_test_macros.hpp>
#include "fixtures.hpp"

using namespace stock_test;

namespace {

std::vector<Product*> raw(const Shelf::Slots& slots) {
    std::vector<Product*> out;
    for (const auto& p : slots) {
        out.push_back(p.get());
    }
    return out;
}

} // namespace

TEST_CASE("Match group of identical products", "[puzzle][matching]") {
    auto apple = make_def("apple");
    auto slots = make_slots({apple, apple, apple});

    MatchResult match = find_match_group(raw(slots), 3);
    REQUIRE(match.found);
    REQUIRE(match.products.size() == 3);
    REQUIRE(match.products[0] == slots[0].get());
    REQUIRE(match.products[1] == slots[1].get());
    REQUIRE(match.products[2] == slots[2].get());
}

TEST_CASE("Match group below threshold", "[puzzle][matching]") {
    auto apple = make_def("apple");
    auto banana = make_def("banana");
    auto slots = make_slots({apple, banana, apple});

    MatchResult match = find_match_group(raw(slots), 3);
    REQUIRE_FALSE(match.found);
    REQUIRE(match.products.empty());
}

TEST_CASE("Match group across matching ids", "[puzzle][matching]") {
    auto cherry = make_def("cherry", {"berry"});
    auto berry = make_def("berry", {"cherry"});
    auto slots = make_slots({cherry, berry, cherry});

    MatchResult match = find_match_group(raw(slots), 3);
    REQUIRE(match.found);
    REQUIRE(match.products.size() == 3);
}

TEST_CASE("Match group must match every member", "[puzzle][matching]") {
    // x accepts everyone, but y and z do not accept each other
    auto x = make_def("x", {"y", "z"});
    auto y = make_def("y", {"x"});
    auto z = make_def("z", {"x"});
    auto slots = make_slots({x, y, z});

    MatchResult match = find_match_group(raw(slots), 3);
    REQUIRE_FALSE(match.found);
}

TEST_CASE("Match group picks the first qualifying seed", "[puzzle][matching]") {
    auto apple = make_def("apple");
    auto banana = make_def("banana");
    auto slots = make_slots({banana, apple, apple, banana});

    MatchResult match = find_match_group(raw(slots), 2);
    REQUIRE(match.found);
    REQUIRE(match.products.size() == 2);
    REQUIRE(match.products[0] == slots[0].get());
    REQUIRE(match.products[1] == slots[3].get());
}

TEST_CASE("Match group size is exactly the match count", "[puzzle][matching]") {
    auto apple = make_def("apple");
    auto slots = make_slots({apple, apple, apple, apple});

    MatchResult match = find_match_group(raw(slots), 3);
    REQUIRE(match.found);
    REQUIRE(match.products.size() == 3);
    for (const Product* a : match.products) {
        for (const Product* b : match.products) {
            REQUIRE(a->matches(*b));
        }
    }
}

TEST_CASE("Match group edge cases", "[puzzle][matching]") {
    auto apple = make_def("apple");
    auto slots = make_slots({apple});

    SECTION("zero match count never matches") {
        REQUIRE_FALSE(find_match_group(raw(slots), 0).found);
    }

    SECTION("single product with match count one") {
        MatchResult match = find_match_group(raw(slots), 1);
        REQUIRE(match.found);
        REQUIRE(match.products.size() == 1);
    }

    SECTION("no candidates") {
        REQUIRE_FALSE(find_match_group({}, 3).found);
    }
}
