#include <catch2/catch_test_macros.hpp>
#include "color/color.hpp"
#include "color/gamut_map.hpp"
#include <cmath>

namespace {
bool approx(double a, double b, double eps = 1e-9) { return std::fabs(a - b) < eps; }
}

TEST_CASE("Gamut map method names", "[gamut]") {
    using namespace ce::color;
    REQUIRE(gamut_map_method_from_name("clip").value() == GamutMapMethod::Clip);
    REQUIRE(gamut_map_method_from_name("local-minde").value() == GamutMapMethod::LocalMinde);
    REQUIRE(name(GamutMapMethod::LocalMinde) == "local-minde");

    auto bad = gamut_map_method_from_name("nearest");
    REQUIRE_FALSE(bad.has_value());
    REQUIRE(bad.error().kind == ColorErrorKind::UnknownGamutMapMethod);
}

TEST_CASE("Gamut membership", "[gamut]") {
    using namespace ce::color;
    REQUIRE(Color::rgb(255, 0, 128).is_in_gamut());
    REQUIRE_FALSE(Color::rgb(300, -10, 128).is_in_gamut());
    REQUIRE(Color::srgb(1 + 1e-12, 0, 0).is_in_gamut());
    REQUIRE(Color::srgb(std::nullopt, 0.5, 0.5).is_in_gamut());
    // Unbounded spaces are always in gamut.
    REQUIRE(Color::oklch(0.7, 5, 30).is_in_gamut());
    REQUIRE(Color(ColorSpace::XyzD65, 3, -1, 2).is_in_gamut());

    REQUIRE_FALSE(Color(ColorSpace::DisplayP3, 1, 0, 0).to_space(ColorSpace::Srgb).is_in_gamut());
}

TEST_CASE("Clip clamps each linear channel", "[gamut]") {
    using namespace ce::color;
    auto clipped = Color::rgb(300, -10, 128, 0.5).to_gamut(GamutMapMethod::Clip);
    REQUIRE(clipped == Color::rgb(255, 0, 128, 0.5));
    REQUIRE(clipped.alpha() == 0.5);

    auto with_missing = Color::srgb(std::nullopt, 1.5, -0.5).to_gamut(GamutMapMethod::Clip);
    REQUIRE(with_missing.is_channel0_missing());
    REQUIRE(with_missing.channel1() == 1);
    REQUIRE(with_missing.channel2() == 0);
}

TEST_CASE("In-gamut colors are left unchanged", "[gamut]") {
    using namespace ce::color;
    const Color samples[] = {Color::rgb(12, 200, 99), Color::srgb(0.3, 0.6, 0.9, 0.5),
                             Color(ColorSpace::Rec2020, 0.4, 0.4, 0.1), Color::hsl(200, 30, 40)};
    for(const Color& c : samples) {
        REQUIRE(c.to_gamut(GamutMapMethod::Clip) == c);
        REQUIRE(c.to_gamut(GamutMapMethod::LocalMinde) == c);
    }
}

TEST_CASE("Local-MINDE always lands in gamut", "[gamut]") {
    using namespace ce::color;
    const Color samples[] = {
        Color(ColorSpace::DisplayP3, 1, 0, 0).to_space(ColorSpace::Srgb),
        Color(ColorSpace::Rec2020, 0, 1, 0).to_space(ColorSpace::Srgb),
        Color::oklch(0.7, 0.4, 250).to_space(ColorSpace::Srgb),
        Color::oklch(0.9, 0.3, 100).to_space(ColorSpace::DisplayP3),
        Color::lab(60, 120, -90).to_space(ColorSpace::A98Rgb),
        Color::rgb(300, -10, 128)};
    for(const Color& c : samples) {
        const Color mapped = c.to_gamut();
        INFO(to_string(c) << " -> " << to_string(mapped));
        REQUIRE(mapped.space() == c.space());
        REQUIRE(mapped.is_in_gamut());
    }
}

TEST_CASE("Local-MINDE stays perceptually close for slightly out-of-gamut colors", "[gamut]") {
    using namespace ce::color;
    const Color c = Color::srgb(1.01, 0.5, 0.2);
    const Color mapped = c.to_gamut(GamutMapMethod::LocalMinde);
    REQUIRE(mapped.is_in_gamut());
    REQUIRE(delta_eok(mapped, c) < 0.02);
}

TEST_CASE("Local-MINDE preserves lightness while reducing chroma", "[gamut]") {
    using namespace ce::color;
    const Color c = Color::oklch(0.7, 0.4, 250).to_space(ColorSpace::Srgb);
    const Color mapped = c.to_gamut(GamutMapMethod::LocalMinde).to_space(ColorSpace::Oklch);
    REQUIRE(approx(mapped.channel0(), 0.7, 0.02));
    REQUIRE(mapped.channel1() < 0.4);
}

TEST_CASE("White and black anchors", "[gamut]") {
    using namespace ce::color;
    auto white = Color::oklch(1, 0.3, 180).to_space(ColorSpace::Srgb).to_gamut();
    REQUIRE(white == Color::srgb(1, 1, 1));

    auto black = Color::oklch(0, 0.3, 180, 0.5).to_space(ColorSpace::Srgb).to_gamut();
    REQUIRE(black == Color::srgb(0, 0, 0, 0.5));

    auto legacy_white = Color::oklch(1.2, 0.3, 180).to_space(ColorSpace::Rgb).to_gamut();
    REQUIRE(legacy_white == Color::rgb(255, 255, 255));
}

TEST_CASE("Delta EOK", "[gamut]") {
    using namespace ce::color;
    REQUIRE(delta_eok(Color::srgb(0.2, 0.3, 0.4), Color::srgb(0.2, 0.3, 0.4)) == 0);
    REQUIRE(approx(delta_eok(Color::oklab(0.5, 0, 0), Color::oklab(0.8, 0, 0)), 0.3));
    REQUIRE(approx(delta_eok(Color::oklab(0.5, 0.03, 0), Color::oklab(0.5, 0, 0.04)), 0.05));
}
