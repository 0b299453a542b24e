#include <catch2/catch_test_macros.hpp>
#include "core/number.hpp"

TEST_CASE("Fuzzy equality uses ten digits of precision", "[number]") {
    using namespace ce;
    REQUIRE(fuzzy::equals(0.1 + 0.2, 0.3));
    REQUIRE(fuzzy::equals(1.0, 1.0 + 1e-12));
    REQUIRE_FALSE(fuzzy::equals(1.0, 1.0 + 1e-9));
}

TEST_CASE("Fuzzy comparisons treat near values as equal", "[number]") {
    using namespace ce;
    REQUIRE_FALSE(fuzzy::less_than(1.0 - 1e-12, 1.0));
    REQUIRE(fuzzy::less_than_or_equals(1.0 + 1e-12, 1.0));
    REQUIRE(fuzzy::greater_than(2.0, 1.0));
    REQUIRE(fuzzy::greater_than_or_equals(1.0 - 1e-12, 1.0));
}

TEST_CASE("Fuzzy clamp snaps to bounds", "[number]") {
    using namespace ce;
    REQUIRE(fuzzy::clamp(1.0 + 1e-12, 0.0, 1.0) == 1.0);
    REQUIRE(fuzzy::clamp(-5.0, 0.0, 1.0) == 0.0);
    REQUIRE(fuzzy::clamp(0.25, 0.0, 1.0) == 0.25);
    REQUIRE(fuzzy::in_range(1.0 + 1e-12, 0.0, 1.0));
    REQUIRE_FALSE(fuzzy::in_range(1.001, 0.0, 1.0));
}

TEST_CASE("Degree normalization", "[number]") {
    using namespace ce;
    REQUIRE(core::normalize_degrees(370.0) == 10.0);
    REQUIRE(core::normalize_degrees(-30.0) == 330.0);
    REQUIRE(core::normalize_degrees(360.0) == 0.0);
    REQUIRE(core::lerp(10.0, 20.0, 0.25) == 12.5);
}
