#include <catch2/catch_test_macros.hpp>
#include "core/log.hpp"
#include "color/space.hpp"
#include <string>
#include <vector>

namespace {
struct CapturedLine { ce::log::Level level; std::string msg; };
}

TEST_CASE("Log sink captures messages", "[log]") {
    std::vector<CapturedLine> lines;
    ce::log::set_sink([&](ce::log::Level lvl, const std::string& msg){ lines.push_back({lvl, msg}); });

    ce::log::info("hello");
    ce::log::error("broken");

    ce::log::set_sink({});
    REQUIRE(lines.size() == 2);
    REQUIRE(lines[0].level == ce::log::Level::Info);
    REQUIRE(lines[0].msg == "hello");
    REQUIRE(lines[1].level == ce::log::Level::Error);
}

TEST_CASE("Unknown color space name logs a warning", "[log][space]") {
    std::vector<CapturedLine> lines;
    ce::log::set_sink([&](ce::log::Level lvl, const std::string& msg){ lines.push_back({lvl, msg}); });

    auto space = ce::color::color_space_from_name("not-a-space");

    ce::log::set_sink({});
    REQUIRE_FALSE(space.has_value());
    REQUIRE(lines.size() == 1);
    REQUIRE(lines[0].level == ce::log::Level::Warn);
    REQUIRE(lines[0].msg.find("not-a-space") != std::string::npos);
}

TEST_CASE("Log level names", "[log]") {
    REQUIRE(std::string(ce::log::level_name(ce::log::Level::Trace)) == "trace");
    REQUIRE(std::string(ce::log::level_name(ce::log::Level::Critical)) == "critical");
}

TEST_CASE("JSON mode toggles", "[log]") {
    REQUIRE_FALSE(ce::log::json_mode());
    ce::log::set_json_mode(true);
    REQUIRE(ce::log::json_mode());
    ce::log::set_json_mode(false);
    REQUIRE_FALSE(ce::log::json_mode());
}

TEST_CASE("Messages below the level threshold are dropped", "[log]") {
    std::vector<CapturedLine> lines;
    ce::log::set_sink([&](ce::log::Level lvl, const std::string& msg){ lines.push_back({lvl, msg}); });
    const auto previous = ce::log::level();

    ce::log::set_level(ce::log::Level::Warn);
    ce::log::info("quiet");
    ce::log::warn("loud");
    ce::log::set_level(ce::log::Level::Trace);
    ce::log::trace("everything");

    ce::log::set_level(previous);
    ce::log::set_sink({});
    REQUIRE(lines.size() == 2);
    REQUIRE(lines[0].msg == "loud");
    REQUIRE(lines[1].level == ce::log::Level::Trace);
}

TEST_CASE("Level names parse", "[log]") {
    using ce::log::Level;
    REQUIRE(ce::log::parse_level("debug") == Level::Debug);
    REQUIRE(ce::log::parse_level("warning") == Level::Warn);
    REQUIRE(ce::log::parse_level("err") == Level::Error);
    REQUIRE_FALSE(ce::log::parse_level("loud").has_value());
}
