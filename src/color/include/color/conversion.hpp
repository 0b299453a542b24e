#pragma once

#include "color/color.hpp"

namespace ce::color {

// Channels that were missing in a polar or Lab-like source and must stay missing in an
// analogous destination channel, even though the linear hop in between substituted 0.
struct MissingFlags {
    bool lightness = false;
    bool chroma = false;     // chroma / saturation
    bool hue = false;
    bool a = false;
    bool b = false;
};

/**
 * @brief Converts channels in `from` to a Color in `dest`.
 *
 * Routes through one linear hub per destination family: srgb for hsl/hwb, xyz-d50 for lab/lch,
 * lms for oklab/oklch, and the destination itself otherwise. Missing inputs count as 0 in the
 * arithmetic. A missing rectangular channel stays missing in a rectangular destination; polar
 * and Lab-like destinations follow `missing` and their own powerlessness rules.
 * Never fails: NaN/Infinity propagate per IEEE-754.
 */
Color convert(ColorSpace from, ColorSpace dest,
              Channel c0, Channel c1, Channel c2, Channel alpha,
              MissingFlags missing = {});

// The linear space a conversion into `dest` is routed through.
ColorSpace linear_destination(ColorSpace dest) noexcept;

} // namespace ce::color
