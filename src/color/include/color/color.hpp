#pragma once

#include "color/color_error.hpp"
#include "color/space.hpp"
#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace ce::color {

enum class GamutMapMethod : std::uint8_t;

// A channel value, or std::nullopt for the CSS "none" missing-component marker.
using Channel = std::optional<double>;
using Channels = std::array<Channel, 3>;

/**
 * @brief Immutable color value: a space, three channels and alpha, any of which may be missing.
 *
 * Every mutator returns a new Color. Construction normalizes rather than rejects:
 * - hue channels wrap into [0, 360);
 * - a negative hsl saturation or lch/oklch chroma flips the hue by 180 degrees;
 * - channels of strictly bounded spaces (hsl, hwb) clamp to their reference bounds;
 * - alpha clamps to [0, 1].
 * No other clamping happens here; bringing a color into gamut is to_gamut()'s job.
 */
class Color {
public:
    Color(ColorSpace space, Channel c0, Channel c1, Channel c2, Channel alpha = 1.0);
    Color(ColorSpace space, const Channels& channels, Channel alpha = 1.0);

    // Convenience constructors
    static Color rgb(Channel red, Channel green, Channel blue, Channel alpha = 1.0);
    static Color hsl(Channel hue, Channel saturation, Channel lightness, Channel alpha = 1.0);
    static Color hwb(Channel hue, Channel whiteness, Channel blackness, Channel alpha = 1.0);
    static Color srgb(Channel red, Channel green, Channel blue, Channel alpha = 1.0);
    static Color lab(Channel lightness, Channel a, Channel b, Channel alpha = 1.0);
    static Color lch(Channel lightness, Channel chroma, Channel hue, Channel alpha = 1.0);
    static Color oklab(Channel lightness, Channel a, Channel b, Channel alpha = 1.0);
    static Color oklch(Channel lightness, Channel chroma, Channel hue, Channel alpha = 1.0);

    ColorSpace space() const noexcept { return space_; }
    bool is_legacy() const noexcept { return color::is_legacy(space_); }

    // Missing channels read as 0.
    double channel0() const noexcept { return channels_[0].value_or(0.0); }
    double channel1() const noexcept { return channels_[1].value_or(0.0); }
    double channel2() const noexcept { return channels_[2].value_or(0.0); }
    double channel_at(int index) const noexcept { return channels_[index].value_or(0.0); }
    std::array<double, 3> channels() const noexcept { return {channel0(), channel1(), channel2()}; }
    double alpha() const noexcept { return alpha_.value_or(0.0); }

    const Channel& channel0_or_null() const noexcept { return channels_[0]; }
    const Channel& channel1_or_null() const noexcept { return channels_[1]; }
    const Channel& channel2_or_null() const noexcept { return channels_[2]; }
    const Channel& channel_or_null(int index) const noexcept { return channels_[index]; }
    const Channels& channels_or_null() const noexcept { return channels_; }
    const Channel& alpha_or_null() const noexcept { return alpha_; }

    bool is_channel0_missing() const noexcept { return !channels_[0]; }
    bool is_channel1_missing() const noexcept { return !channels_[1]; }
    bool is_channel2_missing() const noexcept { return !channels_[2]; }
    bool is_alpha_missing() const noexcept { return !alpha_; }

    // Named lookup; "alpha" is accepted for every space.
    ColorResult<double> channel(std::string_view name) const;
    ColorResult<bool> is_channel_missing(std::string_view name) const;
    // Whether the channel's value cannot affect the rendered color (e.g. hue of a gray).
    ColorResult<bool> is_channel_powerless(std::string_view name) const;

    // Legacy accessors, converting through rgb / hsl / hwb.
    double red() const;
    double green() const;
    double blue() const;
    double hue() const;
    double saturation() const;
    double lightness() const;
    double whiteness() const;
    double blackness() const;

    Color to_space(ColorSpace dest) const;

    bool is_in_gamut() const noexcept;
    Color to_gamut() const;
    Color to_gamut(GamutMapMethod method) const;

    Color change_channels(const Channels& channels) const;
    ColorResult<Color> change_channel(std::string_view name, Channel value) const;
    Color change_alpha(Channel alpha) const;

    // Legacy colors compare in rgb; others require the same space. Channels compare fuzzily,
    // and a missing channel only equals another missing channel.
    bool operator==(const Color& other) const;
    bool operator!=(const Color& other) const { return !(*this == other); }

private:
    void normalize();

    ColorSpace space_;
    Channels channels_;
    Channel alpha_;
};

// CSS serialization, e.g. "rgb(255 0 128)", "oklch(50% 0.1 120deg / 0.5)", "color(display-p3 1 0 0)".
std::string to_string(const Color& color);

// Shortest decimal form with at most ten fractional digits.
std::string format_number(double value);

} // namespace ce::color
