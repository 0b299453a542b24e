#pragma once

/**
 * Fuzzy numeric helpers
 * Values closer than `epsilon` are treated as equal. Ten decimal digits of precision
 * matches the numeric precision of the stylesheet language consuming the color engine.
 */

#include <cmath>
#include <algorithm>

namespace ce::fuzzy {

inline constexpr int precision = 10;
inline constexpr double epsilon = 1e-11;

inline bool equals(double a, double b) noexcept { return std::fabs(a - b) < epsilon; }

inline bool less_than(double a, double b) noexcept { return a < b && !equals(a, b); }
inline bool less_than_or_equals(double a, double b) noexcept { return a < b || equals(a, b); }
inline bool greater_than(double a, double b) noexcept { return a > b && !equals(a, b); }
inline bool greater_than_or_equals(double a, double b) noexcept { return a > b || equals(a, b); }

// Snaps to min/max when within epsilon of (or beyond) either bound.
inline double clamp(double value, double min_val, double max_val) noexcept {
    if(less_than_or_equals(value, min_val)) return min_val;
    if(greater_than_or_equals(value, max_val)) return max_val;
    return value;
}

inline bool in_range(double value, double min_val, double max_val) noexcept {
    return greater_than_or_equals(value, min_val) && less_than_or_equals(value, max_val);
}

} // namespace ce::fuzzy

namespace ce::core {

inline constexpr double pi = 3.14159265358979323846;

inline double lerp(double a, double b, double t) noexcept {
    return a + t * (b - a);
}

inline double degrees_to_radians(double degrees) noexcept {
    return degrees * (pi / 180.0);
}

inline double radians_to_degrees(double radians) noexcept {
    return radians * (180.0 / pi);
}

// Wraps an angle in degrees into [0, 360).
inline double normalize_degrees(double degrees) noexcept {
    double h = std::fmod(degrees, 360.0);
    if(h < 0) h += 360.0;
    return h >= 360.0 ? 0.0 : h;
}

} // namespace ce::core
