#pragma once
#include "core/expected.hpp"
#include <string>

namespace ce::color {

enum class ColorErrorKind {
    UnknownSpace,
    ChannelNotFound,
    UnknownGamutMapMethod,
    UnknownHueInterpolationMethod,
    UnsupportedInterpolationSpace,
    HueMethodOnRectangularSpace,
    InvalidInterpolationMethod,
    WeightOutOfRange
};

// Errors are local to one color operation; callers add argument names when reporting.
struct ColorError {
    ColorErrorKind kind;
    std::string message;
};

const char* to_string(ColorErrorKind kind) noexcept;

template <class T>
using ColorResult = ce::expected<T, ColorError>;

inline ce::unexpected<ColorError> color_error(ColorErrorKind kind, std::string message) {
    return ce::unexpected<ColorError>(ColorError{kind, std::move(message)});
}

} // namespace ce::color
