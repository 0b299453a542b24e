#include "color/gamut_map.hpp"
#include "color/conversion.hpp"
#include "core/log.hpp"
#include "core/log_config.hpp"
#include "core/number.hpp"
#include <cmath>
#include <string>

namespace ce::color {

namespace {

// Local-MINDE tuning from CSS Color 4 section 13.2.
constexpr double jnd = 0.02;
constexpr double epsilon = 0.0001;

Color clip(const Color& color) {
    const auto& chans = space_channels(color.space());
    Channels channels = color.channels_or_null();
    for(int i = 0; i < 3; ++i) {
        if(chans[i].is_polar_angle || !channels[i]) continue;
        channels[i] = fuzzy::clamp(*channels[i], chans[i].min, chans[i].max);
    }
    return color.change_channels(channels);
}

// Pure white or black in `color`'s space, keeping its alpha.
Color anchor(const Color& color, bool white) {
    const ColorSpace space = color.space();
    if(color.is_legacy()) {
        const double v = white ? 255 : 0;
        return Color::rgb(v, v, v, color.alpha_or_null()).to_space(space);
    }
    if(!white) return Color::rgb(0, 0, 0, color.alpha_or_null()).to_space(space);

    const auto& chans = space_channels(space);
    Channels channels;
    for(int i = 0; i < 3; ++i) channels[i] = chans[i].is_polar_angle ? 0.0 : chans[i].max;
    return Color(space, channels, color.alpha_or_null());
}

Color local_minde(const Color& color) {
    const Color original_oklch = color.to_space(ColorSpace::Oklch);
    const double lightness = original_oklch.channel0();
    const double hue = original_oklch.channel2();
    const Channel alpha = original_oklch.alpha_or_null();

    if(fuzzy::greater_than_or_equals(lightness, 1)) {
        CE_COLOR_TRACE("local-minde: lightness >= 1, returning white");
        return anchor(color, true);
    }
    if(fuzzy::less_than_or_equals(lightness, 0)) {
        CE_COLOR_TRACE("local-minde: lightness <= 0, returning black");
        return anchor(color, false);
    }

    Color clipped = clip(color);
    if(delta_eok(clipped, color) < jnd) {
        CE_COLOR_TRACE("local-minde: clipped color within JND");
        return clipped;
    }

    double min = 0;
    double max = original_oklch.channel1();
    bool min_in_gamut = true;
    while(max - min > epsilon) {
        const double chroma = (min + max) / 2;
        const Color candidate = convert(ColorSpace::Oklch, color.space(), lightness, chroma, hue, alpha);

        if(min_in_gamut && candidate.is_in_gamut()) {
            min = chroma;
            continue;
        }

        clipped = clip(candidate);
        const double e = delta_eok(clipped, candidate);
        if(e < jnd) {
            if(jnd - e < epsilon) return clipped;
            min_in_gamut = false;
            min = chroma;
        } else {
            max = chroma;
        }
    }
    return clipped;
}

} // namespace

ColorResult<GamutMapMethod> gamut_map_method_from_name(std::string_view text) {
    if(text == "clip") return GamutMapMethod::Clip;
    if(text == "local-minde") return GamutMapMethod::LocalMinde;
    ce::log::warn("gamut_map_method_from_name: unknown method \"" + std::string(text) + "\"");
    return color_error(ColorErrorKind::UnknownGamutMapMethod,
                       "Unknown gamut map method \"" + std::string(text) + "\".");
}

std::string_view name(GamutMapMethod method) noexcept {
    switch(method) {
        case GamutMapMethod::Clip: return "clip";
        case GamutMapMethod::LocalMinde: return "local-minde";
    }
    return "unknown";
}

Color map_to_gamut(GamutMapMethod method, const Color& color) {
    switch(method) {
        case GamutMapMethod::Clip: return clip(color);
        case GamutMapMethod::LocalMinde: return local_minde(color);
    }
    return clip(color);
}

double delta_eok(const Color& a, const Color& b) {
    // https://drafts.csswg.org/css-color-4/#color-difference-OK
    const Color lab1 = a.to_space(ColorSpace::Oklab);
    const Color lab2 = b.to_space(ColorSpace::Oklab);
    const double dl = lab1.channel0() - lab2.channel0();
    const double da = lab1.channel1() - lab2.channel1();
    const double db = lab1.channel2() - lab2.channel2();
    return std::sqrt(dl * dl + da * da + db * db);
}

} // namespace ce::color
