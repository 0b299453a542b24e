#include "color/channel.hpp"

namespace ce::color {

bool ColorChannel::is_analogous(const ColorChannel& other) const noexcept {
    auto either = [&](std::string_view a, std::string_view b) {
        return other.name == a || other.name == b;
    };
    if(name == "red" || name == "x") return either("red", "x");
    if(name == "green" || name == "y") return either("green", "y");
    if(name == "blue" || name == "z") return either("blue", "z");
    if(name == "chroma" || name == "saturation") return either("chroma", "saturation");
    if(name == "lightness" || name == "hue") return other.name == name;
    return false;
}

} // namespace ce::color
