#pragma once

#include "color/color.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace ce::color {

// How the hue channel travels around the circle when interpolating polar colors.
enum class HueInterpolationMethod : std::uint8_t {
    Shorter,
    Longer,
    Increasing,
    Decreasing,
    Specified
};

ColorResult<HueInterpolationMethod> hue_interpolation_method_from_name(std::string_view name);
std::string_view to_string(HueInterpolationMethod method) noexcept;

enum class InterpolationResult : std::uint8_t {
    OriginalSpace,      // convert the blend back to the first color's space
    InterpolationSpace  // return the blend in the interpolation space
};

// Spaces a color may be interpolated in.
bool is_interpolation_space(ColorSpace space) noexcept;

/**
 * @brief A space plus, for polar spaces only, a hue interpolation method.
 *
 * Built only through create()/parse(), so an instance is always valid: the space supports
 * interpolation and hue() is set iff the space is polar.
 */
class InterpolationMethod {
public:
    static ColorResult<InterpolationMethod> create(ColorSpace space,
                                                   std::optional<HueInterpolationMethod> hue = std::nullopt);

    // "<space> [<hue-method> hue]", e.g. "oklch longer hue".
    static ColorResult<InterpolationMethod> parse(std::string_view text);

    ColorSpace space() const noexcept { return space_; }
    const std::optional<HueInterpolationMethod>& hue() const noexcept { return hue_; }

    std::string to_string() const;

private:
    InterpolationMethod(ColorSpace space, std::optional<HueInterpolationMethod> hue)
        : space_(space), hue_(hue) {}

    ColorSpace space_;
    std::optional<HueInterpolationMethod> hue_;
};

/**
 * @brief Blends `color1` toward `color2` in `method.space()`.
 *
 * weight 0 yields color1 and weight 1 yields color2. A channel missing in one color takes the
 * other color's (analogous) value; missing in both, it stays missing. Alpha is blended straight,
 * not premultiplied. Fails with WeightOutOfRange when weight is outside [0, 1].
 */
ColorResult<Color> interpolate(const Color& color1, const Color& color2,
                               const InterpolationMethod& method, double weight,
                               InterpolationResult result = InterpolationResult::OriginalSpace);

} // namespace ce::color
