#pragma once
#include <string_view>

namespace ce::color {

/**
 * @brief Static metadata about one channel of a color space.
 *
 * Linear channels carry reference bounds. Unless the owning space is strictly bounded
 * these are not hard limits: they scale percentages and define the gamut of bounded
 * spaces. Polar channels are always the hue, in degrees.
 */
struct ColorChannel {
    std::string_view name;
    bool is_polar_angle = false;
    double min = 0.0;
    double max = 0.0;
    bool requires_percent = false;          // unitless input forbidden at the function boundary
    bool lower_clamped = false;             // legacy functions clamp values below min
    bool upper_clamped = false;             // legacy functions clamp values above max
    std::string_view associated_unit;       // "%" or empty

    static constexpr ColorChannel linear(std::string_view name, double min, double max,
                                         bool requires_percent = false,
                                         bool lower_clamped = false,
                                         bool upper_clamped = false,
                                         std::string_view unit = {}) {
        return ColorChannel{name, false, min, max, requires_percent, lower_clamped, upper_clamped, unit};
    }

    static constexpr ColorChannel polar_hue() {
        return ColorChannel{"hue", true, 0.0, 360.0, false, false, false, "deg"};
    }

    // Analogous components per CSS Color 4 "missing components" interpolation rules.
    bool is_analogous(const ColorChannel& other) const noexcept;
};

} // namespace ce::color
