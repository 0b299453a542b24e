#include <catch2/catch_test_macros.hpp>
#include "color/color.hpp"
#include "color/conversion.hpp"
#include "color/conversions.hpp"
#include <cmath>

namespace {
bool approx(double a, double b, double eps = 1e-9) { return std::fabs(a - b) < eps; }

bool approx_channels(const ce::color::Color& c, double c0, double c1, double c2, double eps) {
    return approx(c.channel0(), c0, eps) && approx(c.channel1(), c1, eps) && approx(c.channel2(), c2, eps);
}
}

TEST_CASE("Linear hub selection", "[conversion]") {
    using namespace ce::color;
    REQUIRE(linear_destination(ColorSpace::Hsl) == ColorSpace::Srgb);
    REQUIRE(linear_destination(ColorSpace::Hwb) == ColorSpace::Srgb);
    REQUIRE(linear_destination(ColorSpace::Lch) == ColorSpace::XyzD50);
    REQUIRE(linear_destination(ColorSpace::Oklab) == ColorSpace::Lms);
    REQUIRE(linear_destination(ColorSpace::DisplayP3) == ColorSpace::DisplayP3);
}

TEST_CASE("sRGB red to xyz-d65 is the first matrix column", "[conversion]") {
    using namespace ce::color;
    auto xyz = Color::srgb(1, 0, 0).to_space(ColorSpace::XyzD65);
    const auto& m = matrices::linear_srgb_to_xyz_d65;
    REQUIRE(xyz.space() == ColorSpace::XyzD65);
    REQUIRE(approx_channels(xyz, m[0][0], m[1][0], m[2][0], 1e-12));
}

TEST_CASE("sRGB red in the perceptual spaces", "[conversion]") {
    using namespace ce::color;
    const Color red = Color::srgb(1, 0, 0);

    REQUIRE(approx_channels(red.to_space(ColorSpace::Oklab), 0.627955, 0.224863, 0.125846, 1e-5));

    auto oklch = red.to_space(ColorSpace::Oklch);
    REQUIRE(approx(oklch.channel0(), 0.627955, 1e-5));
    REQUIRE(approx(oklch.channel1(), 0.257683, 1e-5));
    REQUIRE(approx(oklch.channel2(), 29.2339, 1e-3));

    REQUIRE(approx_channels(red.to_space(ColorSpace::Lab), 54.2905, 80.8049, 69.891, 1e-2));

    auto lch = red.to_space(ColorSpace::Lch);
    REQUIRE(approx(lch.channel0(), 54.2905, 1e-2));
    REQUIRE(approx(lch.channel1(), 106.837, 1e-2));
    REQUIRE(approx(lch.channel2(), 40.853, 2e-2));
}

TEST_CASE("Legacy conversions", "[conversion]") {
    using namespace ce::color;
    // #123456
    auto hsl = Color::rgb(0x12, 0x34, 0x56).to_space(ColorSpace::Hsl);
    REQUIRE(approx_channels(hsl, 210, 65.3846153846154, 20.392156862745097, 1e-9));

    auto rgb = Color::hsl(120, 42, 42).to_space(ColorSpace::Rgb);
    REQUIRE(approx_channels(rgb, 62.118, 152.082, 62.118, 1e-9));

    auto hwb = Color::rgb(255, 0, 0).to_space(ColorSpace::Hwb);
    REQUIRE(approx_channels(hwb, 0, 0, 0, 1e-9));

    auto from_hwb = Color::hwb(240, 20, 30).to_space(ColorSpace::Rgb);
    REQUIRE(approx_channels(from_hwb, 51, 51, 178.5, 1e-9));

    // whiteness + blackness > 100 normalizes to a gray
    auto gray = Color::hwb(0, 60, 60).to_space(ColorSpace::Rgb);
    REQUIRE(approx_channels(gray, 127.5, 127.5, 127.5, 1e-9));
}

TEST_CASE("In-gamut sRGB colors round-trip through every space", "[conversion]") {
    using namespace ce::color;
    const Color samples[] = {
        Color::srgb(0.2, 0.4, 0.6), Color::srgb(1, 0, 0), Color::srgb(0, 0, 0),
        Color::srgb(1, 1, 1), Color::srgb(0.9, 0.1, 0.5), Color::srgb(0.5, 0.5, 0.5)};

    for(const Color& c : samples) {
        for(ColorSpace space : all_color_spaces()) {
            auto back = c.to_space(space).to_space(ColorSpace::Srgb);
            INFO(to_string(c) << " via " << space_name(space) << " -> " << to_string(back));
            REQUIRE(approx_channels(back, c.channel0(), c.channel1(), c.channel2(), 1e-6));
        }
    }
}

TEST_CASE("sRGB round-trips through lms", "[conversion][lms]") {
    using namespace ce::color;
    const double samples[][3] = {{0.2, 0.4, 0.6}, {1, 0, 0}, {0, 0, 0}, {1, 1, 1}, {0.9, 0.1, 0.5}};
    for(const auto& s : samples) {
        auto lms = convert(ColorSpace::Srgb, ColorSpace::Lms, s[0], s[1], s[2], 1.0);
        REQUIRE(lms.space() == ColorSpace::Lms);
        auto back = convert(ColorSpace::Lms, ColorSpace::Srgb, lms.channel0(), lms.channel1(), lms.channel2(), 1.0);
        INFO(to_string(back));
        REQUIRE(approx_channels(back, s[0], s[1], s[2], 1e-7));
    }

    // White has equal cone responses.
    auto white = convert(ColorSpace::Srgb, ColorSpace::Lms, 1.0, 1.0, 1.0, 1.0);
    REQUIRE(approx(white.channel0(), white.channel1(), 1e-4));
    REQUIRE(approx(white.channel1(), white.channel2(), 1e-4));
}

TEST_CASE("Black has no chroma or hue in polar spaces", "[conversion][missing]") {
    using namespace ce::color;
    auto lch = Color::lab(0, 20, 30).to_space(ColorSpace::Lch);
    REQUIRE_FALSE(lch.is_channel0_missing());
    REQUIRE(lch.channel0() == 0);
    REQUIRE(lch.is_channel1_missing());
    REQUIRE(lch.is_channel2_missing());
    REQUIRE(to_string(lch) == "lch(0% none none)");

    auto oklch = Color::oklab(0, 0.1, -0.1).to_space(ColorSpace::Oklch);
    REQUIRE(oklch.channel0() == 0);
    REQUIRE(oklch.is_channel1_missing());
    REQUIRE(oklch.is_channel2_missing());

    REQUIRE(to_string(Color::srgb(0, 0, 0).to_space(ColorSpace::Oklch)) == "oklch(0% none none)");
    REQUIRE(to_string(Color::srgb(0, 0, 0, 0.5).to_space(ColorSpace::Lch)) == "lch(0% none none / 0.5)");
}

TEST_CASE("Missing rectangular channels stay missing between rectangular spaces", "[conversion][missing]") {
    using namespace ce::color;
    auto c = Color(ColorSpace::DisplayP3, std::nullopt, 0.5, 0.5).to_space(ColorSpace::Rec2020);
    REQUIRE(c.is_channel0_missing());
    REQUIRE_FALSE(c.is_channel1_missing());

    auto rgb = Color::rgb(std::nullopt, 10, 20).to_space(ColorSpace::Srgb);
    REQUIRE(rgb.is_channel0_missing());
    REQUIRE(approx(rgb.channel1(), 10.0 / 255));

    auto linear = Color::srgb(0.5, std::nullopt, 0.5).to_space(ColorSpace::SrgbLinear);
    REQUIRE(linear.is_channel1_missing());
}

TEST_CASE("Achromatic colors have a missing hue", "[conversion][missing]") {
    using namespace ce::color;
    REQUIRE(Color::srgb(0.5, 0.5, 0.5).to_space(ColorSpace::Hsl).is_channel0_missing());
    REQUIRE(Color::srgb(0.5, 0.5, 0.5).to_space(ColorSpace::Oklch).is_channel2_missing());
    REQUIRE(Color::srgb(1, 1, 1).to_space(ColorSpace::Hwb).is_channel0_missing());

    auto black = Color::srgb(0, 0, 0);
    REQUIRE(black.to_space(ColorSpace::Oklch).is_channel2_missing());
    auto oklab = black.to_space(ColorSpace::Oklab);
    REQUIRE_FALSE(oklab.is_channel0_missing());
    REQUIRE(oklab.is_channel1_missing());
    REQUIRE(oklab.is_channel2_missing());

    REQUIRE_FALSE(Color::srgb(1, 0, 0).to_space(ColorSpace::Hsl).is_channel0_missing());
}

TEST_CASE("Missing polar channels carry over to analogous channels", "[conversion][missing]") {
    using namespace ce::color;
    auto hwb = Color::hsl(std::nullopt, 50, 50).to_space(ColorSpace::Hwb);
    REQUIRE(hwb.is_channel0_missing());

    auto lch = Color::hsl(120, std::nullopt, 50).to_space(ColorSpace::Lch);
    REQUIRE(lch.is_channel1_missing());
    REQUIRE_FALSE(lch.is_channel0_missing());

    auto oklch = Color::lch(50, 30, std::nullopt).to_space(ColorSpace::Oklch);
    REQUIRE(oklch.is_channel2_missing());

    // Without a lightness there is nothing to hang chroma or hue on.
    auto from_lab = Color::lab(std::nullopt, 20, 30).to_space(ColorSpace::Lch);
    REQUIRE(from_lab.is_channel0_missing());
    REQUIRE(from_lab.is_channel1_missing());
    REQUIRE(from_lab.is_channel2_missing());

    auto oklab = Color::oklch(std::nullopt, 0.1, 120).to_space(ColorSpace::Oklab);
    REQUIRE(oklab.is_channel0_missing());
    REQUIRE_FALSE(oklab.is_channel1_missing());
    REQUIRE_FALSE(oklab.is_channel2_missing());

    auto hsl = Color::lab(std::nullopt, 0, 0).to_space(ColorSpace::Hsl);
    REQUIRE(hsl.is_channel2_missing());
}

TEST_CASE("Alpha passes through conversion", "[conversion]") {
    using namespace ce::color;
    REQUIRE(approx(Color::srgb(0.1, 0.2, 0.3, 0.4).to_space(ColorSpace::Oklch).alpha(), 0.4));
    REQUIRE(Color::srgb(0.1, 0.2, 0.3, std::nullopt).to_space(ColorSpace::Lab).is_alpha_missing());
}

TEST_CASE("Direct convert entry point", "[conversion]") {
    using namespace ce::color;
    auto c = convert(ColorSpace::Oklch, ColorSpace::Srgb, 1.0, 0.0, 0.0, 1.0);
    REQUIRE(approx_channels(c, 1, 1, 1, 1e-6));

    MissingFlags flags;
    flags.hue = true;
    auto hsl = convert(ColorSpace::Srgb, ColorSpace::Hsl, 1.0, 0.0, 0.0, 1.0, flags);
    REQUIRE(hsl.is_channel0_missing());
    REQUIRE(approx(hsl.channel1(), 100));
}
