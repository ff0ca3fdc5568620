#pragma once

#include "core/types.hpp"
#include <cstdint>
#include <cmath>

namespace ctune {

// Below this chroma the hue angle carries no information.
constexpr double kAchromaticChroma = 1e-6;

struct LinearRGB {
    double r = 0.0;
    double g = 0.0;
    double b = 0.0;

    LinearRGB() = default;
    LinearRGB(double r, double g, double b) : r(r), g(g), b(b) {}

    double luminance() const {
        return 0.2126 * r + 0.7152 * g + 0.0722 * b;
    }
};

struct OKLab {
    double L = 0.0;
    double a = 0.0;
    double b = 0.0;

    OKLab() = default;
    OKLab(double L, double a, double b) : L(L), a(a), b(b) {}
};

struct OKLCH {
    double L = 0.0;
    double C = 0.0;
    double H = 0.0;
    bool has_hue = false;

    OKLCH() = default;
    OKLCH(double L, double C, double H)
        : L(L), C(C), H(H), has_hue(C >= kAchromaticChroma) {}

    bool is_valid() const {
        return std::isfinite(L) && std::isfinite(C) && std::isfinite(H) &&
               L >= 0.0 && L <= 1.0 && C >= 0.0 && H >= 0.0 && H <= 360.0;
    }
};

struct XYZ {
    double x = 0.0;
    double y = 0.0;
    double z = 0.0;
};

struct Lab {
    double L = 0.0;
    double a = 0.0;
    double b = 0.0;

    Lab() = default;
    Lab(double L, double a, double b) : L(L), a(a), b(b) {}
};

class ColorSpace {
public:
    static double srgb_decode(double c);
    static double srgb_encode(double c);

    static double srgb_to_linear(uint8_t srgb);
    static LinearRGB srgb_to_linear(const RGB& rgb);
    static LinearRGB srgb_to_linear(const NormalizedRGB& rgb);
    static NormalizedRGB linear_to_srgb(const LinearRGB& linear);

    static OKLab linear_to_oklab(const LinearRGB& linear);
    static LinearRGB oklab_to_linear(const OKLab& lab);

    static OKLCH oklab_to_lch(const OKLab& lab);
    static OKLab lch_to_oklab(const OKLCH& lch);

    static OKLCH rgb_to_lch(const RGB& rgb);
    static OKLCH rgb_to_lch(const NormalizedRGB& rgb);
    static RGB lch_to_rgb(const OKLCH& lch);
    // Gamut-clamped but unrounded, for continuous optimisation.
    static NormalizedRGB lch_to_rgb_normalized(const OKLCH& lch);

    static XYZ linear_to_xyz(const LinearRGB& linear);
    static Lab xyz_to_lab(const XYZ& xyz);
    static Lab rgb_to_lab(const RGB& rgb);
    static Lab rgb_to_lab(const NormalizedRGB& rgb);

private:
    static double lab_f(double t);
};

}
