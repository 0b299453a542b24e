#include "color/conversion.hpp"
#include "color/conversions.hpp"
#include "core/log_config.hpp"
#include "core/number.hpp"
#include "config/debug.hpp"
#include <algorithm>
#include <cmath>

namespace ce::color {

namespace {

using matrices::d50;
using matrices::lab_epsilon;
using matrices::lab_kappa;

Channel scaled(const Channel& c, double factor) {
    return c ? Channel(*c * factor) : std::nullopt;
}

Channel transfer(const Channel& c, ColorSpace space, bool linearize) {
    if(!c) return std::nullopt;
    return linearize ? to_linear(space, *c) : from_linear(space, *c);
}

// CSS3 hue-to-rgb helper, hue in turns.
double hue_to_rgb(double m1, double m2, double hue) {
    if(hue < 0) hue += 1;
    if(hue > 1) hue -= 1;

    if(hue < 1.0 / 6) return m1 + (m2 - m1) * hue * 6;
    if(hue < 1.0 / 2) return m2;
    if(hue < 2.0 / 3) return m1 + (m2 - m1) * (2.0 / 3 - hue) * 6;
    return m1;
}

double turns(double degrees) {
    double t = degrees / 360;
    return t - std::floor(t);
}

Color convert_linear(ColorSpace from, ColorSpace dest, Channel c0, Channel c1, Channel c2,
                     Channel alpha, MissingFlags missing);
Color from_srgb(ColorSpace dest, Channel red, Channel green, Channel blue, Channel alpha, MissingFlags missing);
Color from_xyz_d50(ColorSpace dest, Channel x, Channel y, Channel z, Channel alpha, MissingFlags missing);
Color from_lab(ColorSpace dest, Channel lightness, Channel a, Channel b, Channel alpha, MissingFlags missing);
Color from_oklab(ColorSpace dest, Channel lightness, Channel a, Channel b, Channel alpha, MissingFlags missing);
Color from_lms(ColorSpace dest, Channel l, Channel m, Channel s, Channel alpha, MissingFlags missing);

// Lab/Oklab to LCh/Oklch. The hue of an achromatic color is powerless and becomes missing.
// Black has neither chroma nor hue.
Color lab_to_lch(ColorSpace dest, Channel lightness, double a, double b, Channel alpha, MissingFlags missing) {
    if(!lightness || fuzzy::equals(*lightness, 0)) {
        return Color(dest,
                     !lightness || missing.lightness ? std::nullopt : Channel(0.0),
                     std::nullopt, std::nullopt, alpha);
    }

    double chroma = std::sqrt(a * a + b * b);
    Channel hue;
    if(!missing.hue && !fuzzy::equals(chroma, 0)) {
        double h = core::radians_to_degrees(std::atan2(b, a));
        hue = h >= 0 ? h : h + 360;
    }
    return Color(dest,
                 missing.lightness ? std::nullopt : lightness,
                 missing.chroma ? std::nullopt : Channel(chroma),
                 hue, alpha);
}

Color convert_linear(ColorSpace from, ColorSpace dest, Channel c0, Channel c1, Channel c2,
                     Channel alpha, MissingFlags missing) {
    const ColorSpace linear_dest = linear_destination(dest);

    Channel t0 = c0, t1 = c1, t2 = c2;
    if(linear_dest != from) {
        std::array<double, 3> lin{
            to_linear(from, c0.value_or(0.0)),
            to_linear(from, c1.value_or(0.0)),
            to_linear(from, c2.value_or(0.0))};

        if(const ColorMatrix* m = transformation_matrix(from, linear_dest)) {
            lin = multiply(*m, lin[0], lin[1], lin[2]);
        } else if(linear_family(from) != linear_family(linear_dest)) {
            // Not directly connected: hop through xyz-d65.
            const ColorMatrix* to_xyz = transformation_matrix(from, ColorSpace::XyzD65);
            const ColorMatrix* from_xyz = transformation_matrix(ColorSpace::XyzD65, linear_dest);
            CE_ASSERT(to_xyz && from_xyz);
            if(to_xyz && from_xyz) {
                lin = multiply(*to_xyz, lin[0], lin[1], lin[2]);
                lin = multiply(*from_xyz, lin[0], lin[1], lin[2]);
            }
        }

        t0 = from_linear(linear_dest, lin[0]);
        t1 = from_linear(linear_dest, lin[1]);
        t2 = from_linear(linear_dest, lin[2]);
    }

    switch(dest) {
        case ColorSpace::Hsl:
        case ColorSpace::Hwb:
            return from_srgb(dest, t0, t1, t2, alpha, missing);
        case ColorSpace::Lab:
        case ColorSpace::Lch:
            return from_xyz_d50(dest, t0, t1, t2, alpha, missing);
        case ColorSpace::Oklab:
        case ColorSpace::Oklch:
            return from_lms(dest, t0, t1, t2, alpha, missing);
        default:
            // Rectangular to rectangular: missing channels stay missing index by index.
            return Color(dest,
                         c0 ? t0 : std::nullopt,
                         c1 ? t1 : std::nullopt,
                         c2 ? t2 : std::nullopt,
                         alpha);
    }
}

Color from_srgb(ColorSpace dest, Channel red, Channel green, Channel blue, Channel alpha, MissingFlags missing) {
    switch(dest) {
        case ColorSpace::Hsl:
        case ColorSpace::Hwb: {
            // https://drafts.csswg.org/css-color-4/#rgb-to-hsl
            const double r = red.value_or(0.0);
            const double g = green.value_or(0.0);
            const double b = blue.value_or(0.0);
            const double max = std::max({r, g, b});
            const double min = std::min({r, g, b});
            const double delta = max - min;

            double hue;
            if(max == min) hue = 0;
            else if(max == r) hue = 60 * (g - b) / delta + 360;
            else if(max == g) hue = 60 * (b - r) / delta + 120;
            else hue = 60 * (r - g) / delta + 240;

            if(dest == ColorSpace::Hsl) {
                const double lightness = (min + max) / 2;
                double saturation = (lightness == 0 || lightness == 1)
                    ? 0.0
                    : 100 * (max - lightness) / std::min(lightness, 1 - lightness);
                if(saturation < 0) {
                    hue += 180;
                    saturation = std::fabs(saturation);
                }
                return Color(dest,
                             missing.hue || fuzzy::equals(saturation, 0) ? std::nullopt : Channel(std::fmod(hue, 360)),
                             missing.chroma ? std::nullopt : Channel(saturation),
                             missing.lightness ? std::nullopt : Channel(lightness * 100),
                             alpha);
            }

            const double whiteness = min * 100;
            const double blackness = 100 - max * 100;
            return Color(dest,
                         missing.hue || fuzzy::greater_than_or_equals(whiteness + blackness, 100)
                             ? std::nullopt : Channel(std::fmod(hue, 360)),
                         whiteness, blackness, alpha);
        }
        case ColorSpace::Rgb:
            return Color(dest, scaled(red, 255), scaled(green, 255), scaled(blue, 255), alpha);
        case ColorSpace::SrgbLinear:
            return Color(dest,
                         transfer(red, ColorSpace::Srgb, true),
                         transfer(green, ColorSpace::Srgb, true),
                         transfer(blue, ColorSpace::Srgb, true),
                         alpha);
        default:
            return convert_linear(ColorSpace::Srgb, dest, red, green, blue, alpha, missing);
    }
}

Color from_hsl(ColorSpace dest, Channel hue, Channel saturation, Channel lightness, Channel alpha) {
    // https://www.w3.org/TR/css3-color/#hsl-color
    const double h = turns(hue.value_or(0.0));
    const double s = saturation.value_or(0.0) / 100;
    const double l = lightness.value_or(0.0) / 100;

    const double m2 = l <= 0.5 ? l * (s + 1) : l + s - l * s;
    const double m1 = l * 2 - m2;

    MissingFlags missing;
    missing.lightness = !lightness;
    missing.chroma = !saturation;
    missing.hue = !hue;
    return from_srgb(dest,
                     hue_to_rgb(m1, m2, h + 1.0 / 3),
                     hue_to_rgb(m1, m2, h),
                     hue_to_rgb(m1, m2, h - 1.0 / 3),
                     alpha, missing);
}

Color from_hwb(ColorSpace dest, Channel hue, Channel whiteness, Channel blackness, Channel alpha) {
    const double h = turns(hue.value_or(0.0));
    double w = whiteness.value_or(0.0) / 100;
    double b = blackness.value_or(0.0) / 100;
    const double sum = w + b;
    if(sum > 1) {
        w /= sum;
        b /= sum;
    }
    const double factor = 1 - w - b;
    auto to_rgb = [&](double t) { return hue_to_rgb(0, 1, t) * factor + w; };

    MissingFlags missing;
    missing.hue = !hue;
    return from_srgb(dest, to_rgb(h + 1.0 / 3), to_rgb(h), to_rgb(h - 1.0 / 3), alpha, missing);
}

Color from_srgb_linear(ColorSpace dest, Channel red, Channel green, Channel blue, Channel alpha, MissingFlags missing) {
    switch(dest) {
        case ColorSpace::Rgb:
        case ColorSpace::Hsl:
        case ColorSpace::Hwb:
        case ColorSpace::Srgb:
            return from_srgb(dest,
                             transfer(red, ColorSpace::Srgb, false),
                             transfer(green, ColorSpace::Srgb, false),
                             transfer(blue, ColorSpace::Srgb, false),
                             alpha, missing);
        default:
            return convert_linear(ColorSpace::SrgbLinear, dest, red, green, blue, alpha, missing);
    }
}

double lab_f(double component) {
    return component > lab_epsilon ? std::cbrt(component) : (lab_kappa * component + 16) / 116;
}

double lab_f_inverse(double component) {
    const double cubed = component * component * component;
    return cubed > lab_epsilon ? cubed : (116 * component - 16) / lab_kappa;
}

Color from_xyz_d50(ColorSpace dest, Channel x, Channel y, Channel z, Channel alpha, MissingFlags missing) {
    if(dest == ColorSpace::Lab || dest == ColorSpace::Lch) {
        // https://www.w3.org/TR/css-color-4/#color-conversion-code
        const double f0 = lab_f(x.value_or(0.0) / d50[0]);
        const double f1 = lab_f(y.value_or(0.0) / d50[1]);
        const double f2 = lab_f(z.value_or(0.0) / d50[2]);
        return from_lab(dest, (116 * f1) - 16, 500 * (f0 - f1), 200 * (f1 - f2), alpha, missing);
    }
    return convert_linear(ColorSpace::XyzD50, dest, x, y, z, alpha, missing);
}

Color from_lab(ColorSpace dest, Channel lightness, Channel a, Channel b, Channel alpha, MissingFlags missing) {
    switch(dest) {
        case ColorSpace::Lab: {
            // a and b are powerless for black.
            const bool powerless_ab = lightness && !missing.lightness && fuzzy::equals(*lightness, 0);
            return Color(dest,
                         missing.lightness ? std::nullopt : lightness,
                         !a || missing.a || powerless_ab ? std::nullopt : a,
                         !b || missing.b || powerless_ab ? std::nullopt : b,
                         alpha);
        }
        case ColorSpace::Lch:
            return lab_to_lch(dest, lightness, a.value_or(0.0), b.value_or(0.0), alpha, missing);
        default: {
            const double l = lightness.value_or(0.0);
            const double f1 = (l + 16) / 116;
            const double x = lab_f_inverse(a.value_or(0.0) / 500 + f1) * d50[0];
            const double y = (l > lab_kappa * lab_epsilon ? f1 * f1 * f1 : l / lab_kappa) * d50[1];
            const double z = lab_f_inverse(f1 - b.value_or(0.0) / 200) * d50[2];

            MissingFlags forwarded = missing;
            forwarded.lightness = missing.lightness || !lightness;
            forwarded.a = !a;
            forwarded.b = !b;
            return from_xyz_d50(dest, x, y, z, alpha, forwarded);
        }
    }
}

Color from_lch(ColorSpace dest, Channel lightness, Channel chroma, Channel hue, Channel alpha) {
    const double radians = core::degrees_to_radians(hue.value_or(0.0));
    const double c = chroma.value_or(0.0);
    MissingFlags missing;
    missing.chroma = !chroma;
    missing.hue = !hue;
    return from_lab(dest, lightness, c * std::cos(radians), c * std::sin(radians), alpha, missing);
}

Color from_oklab(ColorSpace dest, Channel lightness, Channel a, Channel b, Channel alpha, MissingFlags missing) {
    if(dest == ColorSpace::Oklch) {
        return lab_to_lch(dest, lightness, a.value_or(0.0), b.value_or(0.0), alpha, missing);
    }

    const auto lms = multiply(matrices::oklab_to_lms, lightness.value_or(0.0), a.value_or(0.0), b.value_or(0.0));
    MissingFlags forwarded = missing;
    forwarded.lightness = missing.lightness || !lightness;
    forwarded.a = !a;
    forwarded.b = !b;
    return from_lms(dest,
                    lms[0] * lms[0] * lms[0],
                    lms[1] * lms[1] * lms[1],
                    lms[2] * lms[2] * lms[2],
                    alpha, forwarded);
}

Color from_oklch(ColorSpace dest, Channel lightness, Channel chroma, Channel hue, Channel alpha) {
    const double radians = core::degrees_to_radians(hue.value_or(0.0));
    const double c = chroma.value_or(0.0);
    MissingFlags missing;
    missing.chroma = !chroma;
    missing.hue = !hue;
    return from_oklab(dest, lightness, c * std::cos(radians), c * std::sin(radians), alpha, missing);
}

Color from_lms(ColorSpace dest, Channel l, Channel m, Channel s, Channel alpha, MissingFlags missing) {
    if(dest == ColorSpace::Oklab || dest == ColorSpace::Oklch) {
        // cbrt keeps the sign of out-of-gamut (negative) cone responses.
        const auto lab = multiply(matrices::lms_to_oklab,
                                  std::cbrt(l.value_or(0.0)),
                                  std::cbrt(m.value_or(0.0)),
                                  std::cbrt(s.value_or(0.0)));
        if(dest == ColorSpace::Oklch) {
            return lab_to_lch(dest, lab[0], lab[1], lab[2], alpha, missing);
        }
        const bool powerless_ab = !missing.lightness && fuzzy::equals(lab[0], 0);
        return Color(dest,
                     missing.lightness ? std::nullopt : Channel(lab[0]),
                     missing.a || powerless_ab ? std::nullopt : Channel(lab[1]),
                     missing.b || powerless_ab ? std::nullopt : Channel(lab[2]),
                     alpha);
    }
    return convert_linear(ColorSpace::Lms, dest, l, m, s, alpha, missing);
}

} // namespace

ColorSpace linear_destination(ColorSpace dest) noexcept {
    switch(dest) {
        case ColorSpace::Hsl:
        case ColorSpace::Hwb:
            return ColorSpace::Srgb;
        case ColorSpace::Lab:
        case ColorSpace::Lch:
            return ColorSpace::XyzD50;
        case ColorSpace::Oklab:
        case ColorSpace::Oklch:
            return ColorSpace::Lms;
        default:
            return dest;
    }
}

Color convert(ColorSpace from, ColorSpace dest,
              Channel c0, Channel c1, Channel c2, Channel alpha,
              MissingFlags missing) {
    CE_COLOR_TRACE("convert " + std::string(space_name(from)) + " -> " + std::string(space_name(dest)));
    switch(from) {
        case ColorSpace::Rgb:
            return from_srgb(dest, scaled(c0, 1.0 / 255), scaled(c1, 1.0 / 255), scaled(c2, 1.0 / 255), alpha, missing);
        case ColorSpace::Hsl:
            return from_hsl(dest, c0, c1, c2, alpha);
        case ColorSpace::Hwb:
            return from_hwb(dest, c0, c1, c2, alpha);
        case ColorSpace::Srgb:
            return from_srgb(dest, c0, c1, c2, alpha, missing);
        case ColorSpace::SrgbLinear:
            return from_srgb_linear(dest, c0, c1, c2, alpha, missing);
        case ColorSpace::XyzD50:
            return from_xyz_d50(dest, c0, c1, c2, alpha, missing);
        case ColorSpace::Lab:
            return from_lab(dest, c0, c1, c2, alpha, missing);
        case ColorSpace::Lch:
            return from_lch(dest, c0, c1, c2, alpha);
        case ColorSpace::Oklab:
            return from_oklab(dest, c0, c1, c2, alpha, missing);
        case ColorSpace::Oklch:
            return from_oklch(dest, c0, c1, c2, alpha);
        case ColorSpace::Lms:
            return from_lms(dest, c0, c1, c2, alpha, missing);
        case ColorSpace::DisplayP3:
        case ColorSpace::A98Rgb:
        case ColorSpace::ProphotoRgb:
        case ColorSpace::Rec2020:
        case ColorSpace::XyzD65:
            return convert_linear(from, dest, c0, c1, c2, alpha, missing);
    }
    return convert_linear(from, dest, c0, c1, c2, alpha, missing);
}

} // namespace ce::color
