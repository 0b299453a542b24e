#include "color/space.hpp"
#include "color/conversions.hpp"
#include "core/log.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <string>

namespace ce::color {

namespace {

using C = ColorChannel;

constexpr std::array<ColorChannel, 3> rgb_like_channels{
    C::linear("red", 0, 1), C::linear("green", 0, 1), C::linear("blue", 0, 1)};

constexpr std::array<ColorChannel, 3> xyz_channels{
    C::linear("x", 0, 1), C::linear("y", 0, 1), C::linear("z", 0, 1)};

// Indexed by ColorSpace.
constexpr std::array<ColorSpaceInfo, 16> g_spaces{{
    {ColorSpace::Rgb, "rgb",
     {C::linear("red", 0, 255), C::linear("green", 0, 255), C::linear("blue", 0, 255)},
     true, false, true, false},
    {ColorSpace::Hsl, "hsl",
     {C::polar_hue(),
      C::linear("saturation", 0, 100, true, true, false, "%"),
      C::linear("lightness", 0, 100, true, false, false, "%")},
     true, true, true, true},
    {ColorSpace::Hwb, "hwb",
     {C::polar_hue(),
      C::linear("whiteness", 0, 100, true, false, false, "%"),
      C::linear("blackness", 0, 100, true, false, false, "%")},
     true, true, true, true},
    {ColorSpace::Srgb, "srgb", rgb_like_channels, true, false, false, false},
    {ColorSpace::SrgbLinear, "srgb-linear", rgb_like_channels, true, false, false, false},
    {ColorSpace::DisplayP3, "display-p3", rgb_like_channels, true, false, false, false},
    {ColorSpace::A98Rgb, "a98-rgb", rgb_like_channels, true, false, false, false},
    {ColorSpace::ProphotoRgb, "prophoto-rgb", rgb_like_channels, true, false, false, false},
    {ColorSpace::Rec2020, "rec2020", rgb_like_channels, true, false, false, false},
    {ColorSpace::XyzD65, "xyz-d65", xyz_channels, false, false, false, false},
    {ColorSpace::XyzD50, "xyz-d50", xyz_channels, false, false, false, false},
    {ColorSpace::Lab, "lab",
     {C::linear("lightness", 0, 100, false, true, true, "%"),
      C::linear("a", -125, 125),
      C::linear("b", -125, 125)},
     false, false, false, false},
    {ColorSpace::Lch, "lch",
     {C::linear("lightness", 0, 100, false, true, true, "%"),
      C::linear("chroma", 0, 150, false, true, false),
      C::polar_hue()},
     false, false, false, true},
    {ColorSpace::Oklab, "oklab",
     {C::linear("lightness", 0, 1, false, true, true, "%"),
      C::linear("a", -0.4, 0.4),
      C::linear("b", -0.4, 0.4)},
     false, false, false, false},
    {ColorSpace::Oklch, "oklch",
     {C::linear("lightness", 0, 1, false, true, true, "%"),
      C::linear("chroma", 0, 0.4, false, true, false),
      C::polar_hue()},
     false, false, false, true},
    {ColorSpace::Lms, "lms",
     {C::linear("long", 0, 1), C::linear("medium", 0, 1), C::linear("short", 0, 1)},
     false, false, false, false},
}};

// sRGB and display-p3 share the same piecewise ~2.4 gamma curve.
double srgb_to_linear(double channel) {
    double abs = std::fabs(channel);
    return abs < 0.04045
        ? channel / 12.92
        : std::copysign(std::pow((abs + 0.055) / 1.055, 2.4), channel);
}

double srgb_from_linear(double channel) {
    double abs = std::fabs(channel);
    return abs <= 0.0031308
        ? channel * 12.92
        : std::copysign(1.055 * std::pow(abs, 1 / 2.4) - 0.055, channel);
}

constexpr double rec2020_alpha = 1.09929682680944;
constexpr double rec2020_beta = 0.018053968510807;

std::string to_lower(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

} // namespace

const ColorSpaceInfo& space_info(ColorSpace space) noexcept {
    return g_spaces[static_cast<std::size_t>(space)];
}

std::string_view space_name(ColorSpace space) noexcept { return space_info(space).name; }
const std::array<ColorChannel, 3>& space_channels(ColorSpace space) noexcept { return space_info(space).channels; }
bool is_bounded(ColorSpace space) noexcept { return space_info(space).is_bounded; }
bool is_strictly_bounded(ColorSpace space) noexcept { return space_info(space).is_strictly_bounded; }
bool is_legacy(ColorSpace space) noexcept { return space_info(space).is_legacy; }
bool is_polar(ColorSpace space) noexcept { return space_info(space).is_polar; }

std::optional<int> hue_channel_index(ColorSpace space) noexcept {
    const auto& chans = space_channels(space);
    for(int i = 0; i < 3; ++i) {
        if(chans[i].is_polar_angle) return i;
    }
    return std::nullopt;
}

std::optional<int> channel_index(ColorSpace space, std::string_view name) noexcept {
    const auto& chans = space_channels(space);
    for(int i = 0; i < 3; ++i) {
        if(chans[i].name == name) return i;
    }
    return std::nullopt;
}

ColorResult<ColorSpace> color_space_from_name(std::string_view name) {
    const std::string lower = to_lower(name);
    if(lower == "xyz") return ColorSpace::XyzD65;
    for(ColorSpace space : all_color_spaces()) {
        if(space_name(space) == lower) return space;
    }
    ce::log::warn("color_space_from_name: unknown color space \"" + std::string(name) + "\"");
    return color_error(ColorErrorKind::UnknownSpace, "Unknown color space \"" + std::string(name) + "\".");
}

const std::vector<ColorSpace>& all_color_spaces() {
    static const std::vector<ColorSpace> spaces{
        ColorSpace::Rgb, ColorSpace::Hsl, ColorSpace::Hwb,
        ColorSpace::Srgb, ColorSpace::SrgbLinear, ColorSpace::DisplayP3,
        ColorSpace::A98Rgb, ColorSpace::ProphotoRgb, ColorSpace::Rec2020,
        ColorSpace::XyzD65, ColorSpace::XyzD50,
        ColorSpace::Lab, ColorSpace::Lch, ColorSpace::Oklab, ColorSpace::Oklch};
    return spaces;
}

double to_linear(ColorSpace space, double channel) noexcept {
    switch(space) {
        case ColorSpace::Rgb:
            return srgb_to_linear(channel / 255);
        case ColorSpace::Srgb:
        case ColorSpace::DisplayP3:
            return srgb_to_linear(channel);
        case ColorSpace::A98Rgb:
            return std::copysign(std::pow(std::fabs(channel), 563.0 / 256.0), channel);
        case ColorSpace::ProphotoRgb: {
            double abs = std::fabs(channel);
            return abs <= 16.0 / 512.0 ? channel / 16 : std::copysign(std::pow(abs, 1.8), channel);
        }
        case ColorSpace::Rec2020: {
            double abs = std::fabs(channel);
            return abs < rec2020_beta * 4.5
                ? channel / 4.5
                : std::copysign(std::pow((abs + rec2020_alpha - 1) / rec2020_alpha, 1 / 0.45), channel);
        }
        default:
            // srgb-linear, xyz-d65, xyz-d50 and lms are already linear.
            return channel;
    }
}

double from_linear(ColorSpace space, double channel) noexcept {
    switch(space) {
        case ColorSpace::Rgb:
            return srgb_from_linear(channel) * 255;
        case ColorSpace::Srgb:
        case ColorSpace::DisplayP3:
            return srgb_from_linear(channel);
        case ColorSpace::A98Rgb:
            return std::copysign(std::pow(std::fabs(channel), 256.0 / 563.0), channel);
        case ColorSpace::ProphotoRgb: {
            double abs = std::fabs(channel);
            return abs >= 1.0 / 512.0 ? std::copysign(std::pow(abs, 1 / 1.8), channel) : 16 * channel;
        }
        case ColorSpace::Rec2020: {
            double abs = std::fabs(channel);
            return abs > rec2020_beta
                ? std::copysign(rec2020_alpha * std::pow(abs, 0.45) - (rec2020_alpha - 1), channel)
                : 4.5 * channel;
        }
        default:
            return channel;
    }
}

ColorSpace linear_family(ColorSpace space) noexcept {
    switch(space) {
        case ColorSpace::Rgb:
        case ColorSpace::Srgb:
        case ColorSpace::SrgbLinear:
            return ColorSpace::SrgbLinear;
        default:
            return space;
    }
}

const ColorMatrix* transformation_matrix(ColorSpace from, ColorSpace dest) noexcept {
    using namespace matrices;
    using S = ColorSpace;
    const S a = linear_family(from);
    const S b = linear_family(dest);
    if(a == b) return nullptr;

    switch(a) {
        case S::SrgbLinear:
            switch(b) {
                case S::DisplayP3: return &linear_srgb_to_linear_display_p3;
                case S::A98Rgb: return &linear_srgb_to_linear_a98_rgb;
                case S::ProphotoRgb: return &linear_srgb_to_linear_prophoto_rgb;
                case S::Rec2020: return &linear_srgb_to_linear_rec2020;
                case S::XyzD65: return &linear_srgb_to_xyz_d65;
                case S::XyzD50: return &linear_srgb_to_xyz_d50;
                case S::Lms: return &linear_srgb_to_lms;
                default: return nullptr;
            }
        case S::DisplayP3:
            switch(b) {
                case S::SrgbLinear: return &linear_display_p3_to_linear_srgb;
                case S::A98Rgb: return &linear_display_p3_to_linear_a98_rgb;
                case S::ProphotoRgb: return &linear_display_p3_to_linear_prophoto_rgb;
                case S::Rec2020: return &linear_display_p3_to_linear_rec2020;
                case S::XyzD65: return &linear_display_p3_to_xyz_d65;
                case S::XyzD50: return &linear_display_p3_to_xyz_d50;
                case S::Lms: return &linear_display_p3_to_lms;
                default: return nullptr;
            }
        case S::A98Rgb:
            switch(b) {
                case S::SrgbLinear: return &linear_a98_rgb_to_linear_srgb;
                case S::DisplayP3: return &linear_a98_rgb_to_linear_display_p3;
                case S::ProphotoRgb: return &linear_a98_rgb_to_linear_prophoto_rgb;
                case S::Rec2020: return &linear_a98_rgb_to_linear_rec2020;
                case S::XyzD65: return &linear_a98_rgb_to_xyz_d65;
                case S::XyzD50: return &linear_a98_rgb_to_xyz_d50;
                case S::Lms: return &linear_a98_rgb_to_lms;
                default: return nullptr;
            }
        case S::ProphotoRgb:
            switch(b) {
                case S::SrgbLinear: return &linear_prophoto_rgb_to_linear_srgb;
                case S::DisplayP3: return &linear_prophoto_rgb_to_linear_display_p3;
                case S::A98Rgb: return &linear_prophoto_rgb_to_linear_a98_rgb;
                case S::Rec2020: return &linear_prophoto_rgb_to_linear_rec2020;
                case S::XyzD65: return &linear_prophoto_rgb_to_xyz_d65;
                case S::XyzD50: return &linear_prophoto_rgb_to_xyz_d50;
                case S::Lms: return &linear_prophoto_rgb_to_lms;
                default: return nullptr;
            }
        case S::Rec2020:
            switch(b) {
                case S::SrgbLinear: return &linear_rec2020_to_linear_srgb;
                case S::DisplayP3: return &linear_rec2020_to_linear_display_p3;
                case S::A98Rgb: return &linear_rec2020_to_linear_a98_rgb;
                case S::ProphotoRgb: return &linear_rec2020_to_linear_prophoto_rgb;
                case S::XyzD65: return &linear_rec2020_to_xyz_d65;
                case S::XyzD50: return &linear_rec2020_to_xyz_d50;
                case S::Lms: return &linear_rec2020_to_lms;
                default: return nullptr;
            }
        case S::XyzD65:
            switch(b) {
                case S::SrgbLinear: return &xyz_d65_to_linear_srgb;
                case S::DisplayP3: return &xyz_d65_to_linear_display_p3;
                case S::A98Rgb: return &xyz_d65_to_linear_a98_rgb;
                case S::ProphotoRgb: return &xyz_d65_to_linear_prophoto_rgb;
                case S::Rec2020: return &xyz_d65_to_linear_rec2020;
                case S::XyzD50: return &xyz_d65_to_xyz_d50;
                case S::Lms: return &xyz_d65_to_lms;
                default: return nullptr;
            }
        case S::XyzD50:
            switch(b) {
                case S::SrgbLinear: return &xyz_d50_to_linear_srgb;
                case S::DisplayP3: return &xyz_d50_to_linear_display_p3;
                case S::A98Rgb: return &xyz_d50_to_linear_a98_rgb;
                case S::ProphotoRgb: return &xyz_d50_to_linear_prophoto_rgb;
                case S::Rec2020: return &xyz_d50_to_linear_rec2020;
                case S::XyzD65: return &xyz_d50_to_xyz_d65;
                case S::Lms: return &xyz_d50_to_lms;
                default: return nullptr;
            }
        case S::Lms:
            switch(b) {
                case S::SrgbLinear: return &lms_to_linear_srgb;
                case S::DisplayP3: return &lms_to_linear_display_p3;
                case S::A98Rgb: return &lms_to_linear_a98_rgb;
                case S::ProphotoRgb: return &lms_to_linear_prophoto_rgb;
                case S::Rec2020: return &lms_to_linear_rec2020;
                case S::XyzD65: return &lms_to_xyz_d65;
                case S::XyzD50: return &lms_to_xyz_d50;
                default: return nullptr;
            }
        default:
            return nullptr;
    }
}

std::array<double, 3> multiply(const ColorMatrix& m, double c0, double c1, double c2) noexcept {
    return {
        m[0][0] * c0 + m[0][1] * c1 + m[0][2] * c2,
        m[1][0] * c0 + m[1][1] * c1 + m[1][2] * c2,
        m[2][0] * c0 + m[2][1] * c1 + m[2][2] * c2,
    };
}

} // namespace ce::color
