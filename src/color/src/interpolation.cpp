#include "color/interpolation.hpp"
#include "core/log.hpp"
#include "core/number.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <vector>

namespace ce::color {

namespace {

std::vector<std::string> split_words(std::string_view text) {
    std::vector<std::string> words;
    std::string current;
    for(char c : text) {
        if(std::isspace(static_cast<unsigned char>(c))) {
            if(!current.empty()) words.push_back(std::move(current));
            current.clear();
        } else {
            current.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        }
    }
    if(!current.empty()) words.push_back(std::move(current));
    return words;
}

// Whether channel `index` of `converted` should be treated as missing: either it is missing
// itself, or the analogous channel of the color it was converted from was missing.
bool analogous_channel_missing(const Color& original, const Color& converted, int index) {
    if(!converted.channel_or_null(index)) return true;
    if(original.space() == converted.space()) return false;

    const ColorChannel& target = space_channels(converted.space())[index];
    const auto& chans = space_channels(original.space());
    for(int i = 0; i < 3; ++i) {
        if(chans[i].is_analogous(target)) return !original.channel_or_null(i);
    }
    return false;
}

// Moves one of the hues by 360 degrees so a straight blend travels the requested arc.
void adjust_hues(double& hue1, double& hue2, HueInterpolationMethod method) {
    const double delta = hue2 - hue1;
    switch(method) {
        case HueInterpolationMethod::Shorter:
            if(delta > 180) hue1 += 360;
            else if(delta < -180) hue2 += 360;
            break;
        case HueInterpolationMethod::Longer:
            if(0 < delta && delta < 180) hue1 += 360;
            else if(-180 < delta && delta < 0) hue2 += 360;
            break;
        case HueInterpolationMethod::Increasing:
            if(hue2 < hue1) hue2 += 360;
            break;
        case HueInterpolationMethod::Decreasing:
            if(hue1 < hue2) hue1 += 360;
            break;
        case HueInterpolationMethod::Specified:
            break;
    }
}

} // namespace

ColorResult<HueInterpolationMethod> hue_interpolation_method_from_name(std::string_view name) {
    if(name == "shorter") return HueInterpolationMethod::Shorter;
    if(name == "longer") return HueInterpolationMethod::Longer;
    if(name == "increasing") return HueInterpolationMethod::Increasing;
    if(name == "decreasing") return HueInterpolationMethod::Decreasing;
    if(name == "specified") return HueInterpolationMethod::Specified;
    ce::log::warn("hue_interpolation_method_from_name: unknown method \"" + std::string(name) + "\"");
    return color_error(ColorErrorKind::UnknownHueInterpolationMethod,
                       "Unknown hue interpolation method " + std::string(name) + ".");
}

std::string_view to_string(HueInterpolationMethod method) noexcept {
    switch(method) {
        case HueInterpolationMethod::Shorter: return "shorter";
        case HueInterpolationMethod::Longer: return "longer";
        case HueInterpolationMethod::Increasing: return "increasing";
        case HueInterpolationMethod::Decreasing: return "decreasing";
        case HueInterpolationMethod::Specified: return "specified";
    }
    return "unknown";
}

bool is_interpolation_space(ColorSpace space) noexcept {
    switch(space) {
        case ColorSpace::Srgb:
        case ColorSpace::SrgbLinear:
        case ColorSpace::Lab:
        case ColorSpace::Oklab:
        case ColorSpace::XyzD50:
        case ColorSpace::XyzD65:
        case ColorSpace::Hsl:
        case ColorSpace::Hwb:
        case ColorSpace::Lch:
        case ColorSpace::Oklch:
            return true;
        default:
            return false;
    }
}

ColorResult<InterpolationMethod> InterpolationMethod::create(ColorSpace space,
                                                             std::optional<HueInterpolationMethod> hue) {
    if(!is_interpolation_space(space)) {
        return color_error(ColorErrorKind::UnsupportedInterpolationSpace,
                           "Color space " + std::string(space_name(space)) + " can't be used for interpolation.");
    }
    if(!is_polar(space)) {
        if(hue) {
            return color_error(ColorErrorKind::HueMethodOnRectangularSpace,
                               "Hue interpolation method \"" + std::string(color::to_string(*hue)) +
                               " hue\" may not be set for rectangular color space " +
                               std::string(space_name(space)) + ".");
        }
        return InterpolationMethod(space, std::nullopt);
    }
    return InterpolationMethod(space, hue.value_or(HueInterpolationMethod::Shorter));
}

ColorResult<InterpolationMethod> InterpolationMethod::parse(std::string_view text) {
    const auto words = split_words(text);
    if(words.empty()) {
        return color_error(ColorErrorKind::InvalidInterpolationMethod, "Expected a color interpolation method.");
    }

    auto space = color_space_from_name(words[0]);
    if(!space) return ce::unexpected<ColorError>(space.error());

    if(words.size() == 1) return create(*space);

    if(words.size() == 3 && words[2] == "hue") {
        auto hue = hue_interpolation_method_from_name(words[1]);
        if(!hue) return ce::unexpected<ColorError>(hue.error());
        return create(*space, *hue);
    }

    if(words.size() == 2 || (words.size() == 3 && words[2] != "hue")) {
        return color_error(ColorErrorKind::InvalidInterpolationMethod,
                           "Expected \"" + words[1] + " hue\" in \"" + std::string(text) + "\".");
    }
    return color_error(ColorErrorKind::InvalidInterpolationMethod,
                       "Unexpected \"" + words[3] + "\" in \"" + std::string(text) + "\".");
}

std::string InterpolationMethod::to_string() const {
    std::string out(space_name(space_));
    if(hue_) {
        out += ' ';
        out += color::to_string(*hue_);
        out += " hue";
    }
    return out;
}

ColorResult<Color> interpolate(const Color& color1, const Color& color2,
                               const InterpolationMethod& method, double weight,
                               InterpolationResult result) {
    if(!(weight >= 0 && weight <= 1)) {
        return color_error(ColorErrorKind::WeightOutOfRange,
                           "Expected weight to be within 0 and 1, was " + format_number(weight) + ".");
    }

    const ColorSpace space = method.space();
    const bool original = result == InterpolationResult::OriginalSpace;
    if(fuzzy::equals(weight, 0)) return original ? color1 : color1.to_space(space);
    if(fuzzy::equals(weight, 1)) return color2.to_space(original ? color1.space() : space);

    const Color first = color1.to_space(space);
    const Color second = color2.to_space(space);
    const auto hue_index = hue_channel_index(space);

    Channels channels;
    for(int i = 0; i < 3; ++i) {
        const bool missing1 = analogous_channel_missing(color1, first, i);
        const bool missing2 = analogous_channel_missing(color2, second, i);
        if(missing1 && missing2) continue;

        double value1 = missing1 ? second.channel_at(i) : first.channel_at(i);
        double value2 = missing2 ? first.channel_at(i) : second.channel_at(i);
        if(hue_index && *hue_index == i && method.hue()) {
            adjust_hues(value1, value2, *method.hue());
        }
        channels[i] = core::lerp(value1, value2, weight);
    }

    Channel alpha;
    if(!first.is_alpha_missing() || !second.is_alpha_missing()) {
        const double alpha1 = first.is_alpha_missing() ? second.alpha() : first.alpha();
        const double alpha2 = second.is_alpha_missing() ? first.alpha() : second.alpha();
        alpha = core::lerp(alpha1, alpha2, weight);
    }

    const Color mixed(space, channels, alpha);
    return original ? mixed.to_space(color1.space()) : mixed;
}

} // namespace ce::color
