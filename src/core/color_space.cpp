#include "core/color_space.hpp"
#include <cmath>
#include <algorithm>
#include <array>

namespace ctune {

namespace {

constexpr double kPi = 3.14159265358979323846;

// D65 reference white, Y scaled to 100.
constexpr double kWhiteX = 95.047;
constexpr double kWhiteY = 100.000;
constexpr double kWhiteZ = 108.883;

struct DecodeTable {
    std::array<double, 256> values{};

    DecodeTable() {
        for (int i = 0; i < 256; ++i) {
            values[i] = ColorSpace::srgb_decode(i / 255.0);
        }
    }
};

const DecodeTable& decode_table() {
    static const DecodeTable table;
    return table;
}

double signed_cbrt(double x) {
    return x >= 0.0 ? std::cbrt(x) : -std::cbrt(-x);
}

}

double ColorSpace::srgb_decode(double c) {
    if (c <= 0.04045) {
        return c / 12.92;
    }
    return std::pow((c + 0.055) / 1.055, 2.4);
}

double ColorSpace::srgb_encode(double c) {
    c = std::clamp(c, 0.0, 1.0);
    if (c <= 0.0031308) {
        return 12.92 * c;
    }
    return 1.055 * std::pow(c, 1.0 / 2.4) - 0.055;
}

double ColorSpace::srgb_to_linear(uint8_t srgb) {
    return decode_table().values[srgb];
}

LinearRGB ColorSpace::srgb_to_linear(const RGB& rgb) {
    return {srgb_to_linear(rgb.r), srgb_to_linear(rgb.g), srgb_to_linear(rgb.b)};
}

LinearRGB ColorSpace::srgb_to_linear(const NormalizedRGB& rgb) {
    return {srgb_decode(rgb.r), srgb_decode(rgb.g), srgb_decode(rgb.b)};
}

NormalizedRGB ColorSpace::linear_to_srgb(const LinearRGB& linear) {
    return {srgb_encode(linear.r), srgb_encode(linear.g), srgb_encode(linear.b)};
}

OKLab ColorSpace::linear_to_oklab(const LinearRGB& linear) {
    double r = linear.r;
    double g = linear.g;
    double b = linear.b;

    double l = 0.4122214708 * r + 0.5363325363 * g + 0.0514459929 * b;
    double m = 0.2119034982 * r + 0.6806995451 * g + 0.1073969566 * b;
    double s = 0.0883024619 * r + 0.2817188376 * g + 0.6299787005 * b;

    double l_ = signed_cbrt(l);
    double m_ = signed_cbrt(m);
    double s_ = signed_cbrt(s);

    double L = 0.2104542553 * l_ + 0.7936177850 * m_ - 0.0040720468 * s_;
    double A = 1.9779984951 * l_ - 2.4285922050 * m_ + 0.4505937099 * s_;
    double B = 0.0259040371 * l_ + 0.7827717662 * m_ - 0.8086757660 * s_;

    return {L, A, B};
}

LinearRGB ColorSpace::oklab_to_linear(const OKLab& lab) {
    double L = lab.L;
    double A = lab.a;
    double B = lab.b;

    double l_ = L + 0.3963377774 * A + 0.2158037573 * B;
    double m_ = L - 0.1055613458 * A - 0.0638541728 * B;
    double s_ = L - 0.0894841775 * A - 1.2914855480 * B;

    double l = l_ * l_ * l_;
    double m = m_ * m_ * m_;
    double s = s_ * s_ * s_;

    double r = 4.0767416621 * l - 3.3077115913 * m + 0.2309699292 * s;
    double g = -1.2684380046 * l + 2.6097574011 * m - 0.3413193965 * s;
    double b = -0.0041960863 * l - 0.7034186147 * m + 1.7076147010 * s;

    return {r, g, b};
}

OKLCH ColorSpace::oklab_to_lch(const OKLab& lab) {
    OKLCH lch;
    lch.L = std::clamp(lab.L, 0.0, 1.0);
    lch.C = std::sqrt(lab.a * lab.a + lab.b * lab.b);

    if (lch.C < kAchromaticChroma) {
        lch.H = 0.0;
        lch.has_hue = false;
        return lch;
    }

    double h = std::atan2(lab.b, lab.a) * 180.0 / kPi;
    if (h < 0.0) h += 360.0;
    if (h >= 360.0) h -= 360.0;
    lch.H = h;
    lch.has_hue = true;
    return lch;
}

OKLab ColorSpace::lch_to_oklab(const OKLCH& lch) {
    if (!lch.has_hue || lch.C < kAchromaticChroma) {
        return {lch.L, 0.0, 0.0};
    }
    double h = lch.H * kPi / 180.0;
    return {lch.L, lch.C * std::cos(h), lch.C * std::sin(h)};
}

OKLCH ColorSpace::rgb_to_lch(const RGB& rgb) {
    return oklab_to_lch(linear_to_oklab(srgb_to_linear(rgb)));
}

OKLCH ColorSpace::rgb_to_lch(const NormalizedRGB& rgb) {
    return oklab_to_lch(linear_to_oklab(srgb_to_linear(rgb)));
}

NormalizedRGB ColorSpace::lch_to_rgb_normalized(const OKLCH& lch) {
    LinearRGB linear = oklab_to_linear(lch_to_oklab(lch));
    linear.r = std::clamp(linear.r, 0.0, 1.0);
    linear.g = std::clamp(linear.g, 0.0, 1.0);
    linear.b = std::clamp(linear.b, 0.0, 1.0);
    return linear_to_srgb(linear);
}

RGB ColorSpace::lch_to_rgb(const OKLCH& lch) {
    return RGB::from_normalized(lch_to_rgb_normalized(lch));
}

XYZ ColorSpace::linear_to_xyz(const LinearRGB& linear) {
    XYZ xyz;
    xyz.x = (0.4124564 * linear.r + 0.3575761 * linear.g + 0.1804375 * linear.b) * 100.0;
    xyz.y = (0.2126729 * linear.r + 0.7151522 * linear.g + 0.0721750 * linear.b) * 100.0;
    xyz.z = (0.0193339 * linear.r + 0.1191920 * linear.g + 0.9503041 * linear.b) * 100.0;
    return xyz;
}

double ColorSpace::lab_f(double t) {
    constexpr double delta = 6.0 / 29.0;
    if (t > delta * delta * delta) {
        return std::cbrt(t);
    }
    return t / (3.0 * delta * delta) + 4.0 / 29.0;
}

Lab ColorSpace::xyz_to_lab(const XYZ& xyz) {
    double fx = lab_f(xyz.x / kWhiteX);
    double fy = lab_f(xyz.y / kWhiteY);
    double fz = lab_f(xyz.z / kWhiteZ);

    return {
        std::clamp(116.0 * fy - 16.0, 0.0, 100.0),
        500.0 * (fx - fy),
        200.0 * (fy - fz)
    };
}

Lab ColorSpace::rgb_to_lab(const RGB& rgb) {
    return xyz_to_lab(linear_to_xyz(srgb_to_linear(rgb)));
}

Lab ColorSpace::rgb_to_lab(const NormalizedRGB& rgb) {
    return xyz_to_lab(linear_to_xyz(srgb_to_linear(rgb)));
}

}
