#include <catch2/catch_test_macros.hpp>
#include "core/expected.hpp"
#include <stdexcept>
#include <string>

namespace {
// Counts live instances; copies throw while `fail_copy` is set.
struct Tracked {
    static inline int live = 0;
    static inline bool fail_copy = false;
    int v;
    explicit Tracked(int value) : v(value) { ++live; }
    Tracked(const Tracked& other) : v(other.v) {
        if(fail_copy) throw std::runtime_error("copy failed");
        ++live;
    }
    Tracked(Tracked&& other) noexcept : v(other.v) { ++live; }
    ~Tracked() { --live; }
};

ce::expected<int, std::string> parse_digit(char c) {
    if(c < '0' || c > '9') return ce::make_unexpected(std::string("not a digit"));
    return c - '0';
}
}

TEST_CASE("Expected holds a value", "[expected]") {
    auto r = parse_digit('7');
    REQUIRE(r.has_value());
    REQUIRE(r.value() == 7);
    REQUIRE(*r == 7);
    REQUIRE(r.value_or(0) == 7);
}

TEST_CASE("Expected holds an error", "[expected]") {
    auto r = parse_digit('x');
    REQUIRE_FALSE(r);
    REQUIRE(r.error() == "not a digit");
    REQUIRE(r.value_or(-1) == -1);
}

TEST_CASE("Expected copies and reassigns across states", "[expected]") {
    auto ok = parse_digit('3');
    auto bad = parse_digit('?');
    auto copy = ok;
    REQUIRE(copy.value() == 3);
    copy = bad;
    REQUIRE_FALSE(copy.has_value());
    REQUIRE(copy.error() == "not a digit");
    copy = parse_digit('9');
    REQUIRE(copy.value() == 9);
}

TEST_CASE("Expected keeps its state when a copy assignment throws", "[expected]") {
    {
        ce::expected<int, Tracked> target(7);
        ce::expected<int, Tracked> source(ce::unexpect, Tracked(3));
        REQUIRE(Tracked::live == 1);

        Tracked::fail_copy = true;
        REQUIRE_THROWS_AS(target = source, std::runtime_error);
        Tracked::fail_copy = false;

        REQUIRE(target.has_value());
        REQUIRE(*target == 7);
        REQUIRE(Tracked::live == 1);

        target = source;
        REQUIRE_FALSE(target.has_value());
        REQUIRE(target.error().v == 3);
        REQUIRE(Tracked::live == 2);
    }
    REQUIRE(Tracked::live == 0);
}
