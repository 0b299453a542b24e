#include "color/color_error.hpp"

namespace ce::color {

const char* to_string(ColorErrorKind kind) noexcept {
    switch(kind) {
        case ColorErrorKind::UnknownSpace: return "UnknownSpace";
        case ColorErrorKind::ChannelNotFound: return "ChannelNotFound";
        case ColorErrorKind::UnknownGamutMapMethod: return "UnknownGamutMapMethod";
        case ColorErrorKind::UnknownHueInterpolationMethod: return "UnknownHueInterpolationMethod";
        case ColorErrorKind::UnsupportedInterpolationSpace: return "UnsupportedInterpolationSpace";
        case ColorErrorKind::HueMethodOnRectangularSpace: return "HueMethodOnRectangularSpace";
        case ColorErrorKind::InvalidInterpolationMethod: return "InvalidInterpolationMethod";
        case ColorErrorKind::WeightOutOfRange: return "WeightOutOfRange";
    }
    return "Unknown";
}

} // namespace ce::color
