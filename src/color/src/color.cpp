#include "color/color.hpp"
#include "color/conversion.hpp"
#include "color/gamut_map.hpp"
#include "core/number.hpp"
#include <cmath>
#include <iomanip>
#include <sstream>

namespace ce::color {

namespace {

bool nullable_equals(const Channel& a, const Channel& b) {
    if(!a || !b) return !a && !b;
    return fuzzy::equals(*a, *b);
}

// hsl saturation and lch/oklch chroma; a negative value means "the opposite hue".
std::optional<int> chroma_channel_index(ColorSpace space) {
    switch(space) {
        case ColorSpace::Hsl:
        case ColorSpace::Lch:
        case ColorSpace::Oklch:
            return 1;
        default:
            return std::nullopt;
    }
}

std::string channel_not_found_message(const Color& color, std::string_view name) {
    return "Color " + to_string(color) + " doesn't have a channel named \"" + std::string(name) + "\".";
}

} // namespace

Color::Color(ColorSpace space, Channel c0, Channel c1, Channel c2, Channel alpha)
    : space_(space), channels_{c0, c1, c2}, alpha_(alpha) {
    normalize();
}

Color::Color(ColorSpace space, const Channels& channels, Channel alpha)
    : space_(space), channels_(channels), alpha_(alpha) {
    normalize();
}

void Color::normalize() {
    if(alpha_) alpha_ = fuzzy::clamp(*alpha_, 0.0, 1.0);

    const auto hue_index = hue_channel_index(space_);
    if(const auto chroma_index = chroma_channel_index(space_)) {
        Channel& chroma = channels_[*chroma_index];
        if(chroma && *chroma < 0) {
            chroma = -*chroma;
            if(hue_index && channels_[*hue_index]) *channels_[*hue_index] += 180;
        }
    }
    if(hue_index && channels_[*hue_index]) {
        channels_[*hue_index] = core::normalize_degrees(*channels_[*hue_index]);
    }

    if(is_strictly_bounded(space_)) {
        const auto& chans = space_channels(space_);
        for(int i = 0; i < 3; ++i) {
            if(chans[i].is_polar_angle || !channels_[i]) continue;
            channels_[i] = fuzzy::clamp(*channels_[i], chans[i].min, chans[i].max);
        }
    }
}

Color Color::rgb(Channel red, Channel green, Channel blue, Channel alpha) {
    return Color(ColorSpace::Rgb, red, green, blue, alpha);
}

Color Color::hsl(Channel hue, Channel saturation, Channel lightness, Channel alpha) {
    return Color(ColorSpace::Hsl, hue, saturation, lightness, alpha);
}

Color Color::hwb(Channel hue, Channel whiteness, Channel blackness, Channel alpha) {
    return Color(ColorSpace::Hwb, hue, whiteness, blackness, alpha);
}

Color Color::srgb(Channel red, Channel green, Channel blue, Channel alpha) {
    return Color(ColorSpace::Srgb, red, green, blue, alpha);
}

Color Color::lab(Channel lightness, Channel a, Channel b, Channel alpha) {
    return Color(ColorSpace::Lab, lightness, a, b, alpha);
}

Color Color::lch(Channel lightness, Channel chroma, Channel hue, Channel alpha) {
    return Color(ColorSpace::Lch, lightness, chroma, hue, alpha);
}

Color Color::oklab(Channel lightness, Channel a, Channel b, Channel alpha) {
    return Color(ColorSpace::Oklab, lightness, a, b, alpha);
}

Color Color::oklch(Channel lightness, Channel chroma, Channel hue, Channel alpha) {
    return Color(ColorSpace::Oklch, lightness, chroma, hue, alpha);
}

ColorResult<double> Color::channel(std::string_view name) const {
    if(name == "alpha") return alpha();
    if(const auto index = channel_index(space_, name)) return channel_at(*index);
    return color_error(ColorErrorKind::ChannelNotFound, channel_not_found_message(*this, name));
}

ColorResult<bool> Color::is_channel_missing(std::string_view name) const {
    if(name == "alpha") return is_alpha_missing();
    if(const auto index = channel_index(space_, name)) return !channels_[*index];
    return color_error(ColorErrorKind::ChannelNotFound, channel_not_found_message(*this, name));
}

ColorResult<bool> Color::is_channel_powerless(std::string_view name) const {
    if(name == "alpha") return false;
    if(!channel_index(space_, name)) {
        return color_error(ColorErrorKind::ChannelNotFound, channel_not_found_message(*this, name));
    }
    if(name != "hue") return false;

    switch(space_) {
        case ColorSpace::Hsl:
        case ColorSpace::Lch:
        case ColorSpace::Oklch:
            return fuzzy::equals(channel1(), 0);
        case ColorSpace::Hwb:
            return fuzzy::greater_than_or_equals(channel1() + channel2(), 100);
        default:
            return false;
    }
}

double Color::red() const { return to_space(ColorSpace::Rgb).channel0(); }
double Color::green() const { return to_space(ColorSpace::Rgb).channel1(); }
double Color::blue() const { return to_space(ColorSpace::Rgb).channel2(); }
double Color::hue() const { return to_space(ColorSpace::Hsl).channel0(); }
double Color::saturation() const { return to_space(ColorSpace::Hsl).channel1(); }
double Color::lightness() const { return to_space(ColorSpace::Hsl).channel2(); }
double Color::whiteness() const { return to_space(ColorSpace::Hwb).channel1(); }
double Color::blackness() const { return to_space(ColorSpace::Hwb).channel2(); }

Color Color::to_space(ColorSpace dest) const {
    if(dest == space_) return *this;
    return convert(space_, dest, channels_[0], channels_[1], channels_[2], alpha_);
}

bool Color::is_in_gamut() const noexcept {
    if(!is_bounded(space_)) return true;
    const auto& chans = space_channels(space_);
    for(int i = 0; i < 3; ++i) {
        if(chans[i].is_polar_angle) continue;
        if(!fuzzy::in_range(channel_at(i), chans[i].min, chans[i].max)) return false;
    }
    return true;
}

Color Color::to_gamut() const { return to_gamut(GamutMapMethod::LocalMinde); }

Color Color::to_gamut(GamutMapMethod method) const {
    if(is_in_gamut()) return *this;
    return map_to_gamut(method, *this);
}

Color Color::change_channels(const Channels& channels) const {
    return Color(space_, channels, alpha_);
}

ColorResult<Color> Color::change_channel(std::string_view name, Channel value) const {
    if(name == "alpha") return change_alpha(value);
    const auto index = channel_index(space_, name);
    if(!index) return color_error(ColorErrorKind::ChannelNotFound, channel_not_found_message(*this, name));
    Channels next = channels_;
    next[*index] = value;
    return change_channels(next);
}

Color Color::change_alpha(Channel alpha) const {
    return Color(space_, channels_, alpha);
}

bool Color::operator==(const Color& other) const {
    if(is_legacy()) {
        if(!other.is_legacy()) return false;
        if(!nullable_equals(alpha_, other.alpha_)) return false;
        if(space_ != other.space_) return to_space(ColorSpace::Rgb) == other.to_space(ColorSpace::Rgb);
    } else if(space_ != other.space_ || !nullable_equals(alpha_, other.alpha_)) {
        return false;
    }
    return nullable_equals(channels_[0], other.channels_[0]) &&
           nullable_equals(channels_[1], other.channels_[1]) &&
           nullable_equals(channels_[2], other.channels_[2]);
}

std::string format_number(double value) {
    if(std::isnan(value)) return "NaN";
    if(std::isinf(value)) return value > 0 ? "Infinity" : "-Infinity";

    std::ostringstream os;
    os << std::fixed << std::setprecision(fuzzy::precision) << value;
    std::string text = os.str();
    if(text.find('.') != std::string::npos) {
        while(text.back() == '0') text.pop_back();
        if(text.back() == '.') text.pop_back();
    }
    if(text == "-0") text = "0";
    return text;
}

std::string to_string(const Color& color) {
    const ColorSpace space = color.space();
    const auto& chans = space_channels(space);

    auto channel_text = [&](int i) -> std::string {
        const Channel& c = color.channel_or_null(i);
        if(!c) return "none";
        if(chans[i].is_polar_angle) return format_number(*c) + "deg";
        if(chans[i].associated_unit == "%") {
            // Percent channels render relative to their reference maximum.
            return format_number(*c * 100 / chans[i].max) + "%";
        }
        return format_number(*c);
    };

    std::ostringstream os;
    switch(space) {
        case ColorSpace::Rgb:
        case ColorSpace::Hsl:
        case ColorSpace::Hwb:
        case ColorSpace::Lab:
        case ColorSpace::Lch:
        case ColorSpace::Oklab:
        case ColorSpace::Oklch:
            os << space_name(space) << '(';
            break;
        default:
            os << "color(" << space_name(space) << ' ';
            break;
    }
    os << channel_text(0) << ' ' << channel_text(1) << ' ' << channel_text(2);

    const Channel& alpha = color.alpha_or_null();
    if(!alpha) os << " / none";
    else if(!fuzzy::equals(*alpha, 1)) os << " / " << format_number(*alpha);
    os << ')';
    return os.str();
}

} // namespace ce::color
