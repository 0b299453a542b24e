#pragma once

#include "color/color.hpp"
#include <cstdint>
#include <string_view>

namespace ce::color {

// Algorithms that bring an out-of-gamut color back inside its space's gamut.
enum class GamutMapMethod : std::uint8_t {
    Clip,       // clamp each linear channel to its bounds
    LocalMinde  // CSS Color 4 perceptual chroma reduction in Oklch (default)
};

inline constexpr GamutMapMethod default_gamut_map_method = GamutMapMethod::LocalMinde;

// "clip" or "local-minde".
ColorResult<GamutMapMethod> gamut_map_method_from_name(std::string_view name);
std::string_view name(GamutMapMethod method) noexcept;

// Maps `color` into its own space's gamut. The result is always in the same space as `color`.
Color map_to_gamut(GamutMapMethod method, const Color& color);

// Euclidean distance between two colors in Oklab.
double delta_eok(const Color& a, const Color& b);

} // namespace ce::color
