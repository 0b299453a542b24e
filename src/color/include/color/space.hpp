#pragma once

#include "color/channel.hpp"
#include "color/color_error.hpp"
#include <array>
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace ce::color {

/**
 * @brief Closed catalog of the color spaces the engine understands.
 *
 * Legacy: Rgb, Hsl, Hwb. CSS Color 4 predefined and CIE spaces follow.
 * Lms is internal: it is the linear hub for Oklab/Oklch and cannot be named by callers.
 */
enum class ColorSpace : std::uint8_t {
    Rgb,
    Hsl,
    Hwb,
    Srgb,
    SrgbLinear,
    DisplayP3,
    A98Rgb,
    ProphotoRgb,
    Rec2020,
    XyzD65,
    XyzD50,
    Lab,
    Lch,
    Oklab,
    Oklch,
    Lms
};

// 3x3 row-major color transformation matrix
using ColorMatrix = std::array<std::array<double, 3>, 3>;

struct ColorSpaceInfo {
    ColorSpace space;
    std::string_view name;                      // CSS name
    std::array<ColorChannel, 3> channels;
    bool is_bounded;                            // has a meaningful gamut
    bool is_strictly_bounded;                   // out-of-range channels are invalid, not out-of-gamut
    bool is_legacy;
    bool is_polar;
};

// Registry (process-wide immutable data; safe to share across threads)
const ColorSpaceInfo& space_info(ColorSpace space) noexcept;
std::string_view space_name(ColorSpace space) noexcept;
const std::array<ColorChannel, 3>& space_channels(ColorSpace space) noexcept;
bool is_bounded(ColorSpace space) noexcept;
bool is_strictly_bounded(ColorSpace space) noexcept;
bool is_legacy(ColorSpace space) noexcept;
bool is_polar(ColorSpace space) noexcept;

// Index of the hue channel: 0 for hsl/hwb, 2 for lch/oklch, none for rectangular spaces.
std::optional<int> hue_channel_index(ColorSpace space) noexcept;

// Index of the channel named `name` in `space`, if any.
std::optional<int> channel_index(ColorSpace space, std::string_view name) noexcept;

// Case-insensitive lookup. "xyz" aliases "xyz-d65"; the internal lms space is not resolvable.
ColorResult<ColorSpace> color_space_from_name(std::string_view name);

// The public spaces, in catalog order.
const std::vector<ColorSpace>& all_color_spaces();

// Per-channel transfer curves to/from the space's linear-light vector form.
// Only meaningful for spaces with a transformation matrix (RGB-like, XYZ and LMS).
double to_linear(ColorSpace space, double channel) noexcept;
double from_linear(ColorSpace space, double channel) noexcept;

// Spaces that share a linear-light vector form with another registry entry.
// rgb and srgb linearize to srgb-linear.
ColorSpace linear_family(ColorSpace space) noexcept;

// Matrix mapping `from`'s linear vector to `dest`'s linear vector, or nullptr when the
// pair is not directly connected (polar/Lab spaces, or identical linear families).
const ColorMatrix* transformation_matrix(ColorSpace from, ColorSpace dest) noexcept;

// Applies `m` to (c0, c1, c2).
std::array<double, 3> multiply(const ColorMatrix& m, double c0, double c1, double c2) noexcept;

} // namespace ce::color
