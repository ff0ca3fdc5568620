#include "core/delta_e.hpp"
#include <cmath>
#include <algorithm>

namespace ctune {

namespace {

constexpr double kPi = 3.14159265358979323846;
constexpr double kDegToRad = kPi / 180.0;
// 25^7
constexpr double kPow25_7 = 6103515625.0;

double hue_prime(double a_prime, double b) {
    if (a_prime == 0.0 && b == 0.0) {
        return 0.0;
    }
    double h = std::atan2(b, a_prime) / kDegToRad;
    if (h < 0.0) h += 360.0;
    return h;
}

}

double delta_e_2000(const Lab& lab1, const Lab& lab2, const DeltaEWeights& weights) {
    double C1 = std::sqrt(lab1.a * lab1.a + lab1.b * lab1.b);
    double C2 = std::sqrt(lab2.a * lab2.a + lab2.b * lab2.b);
    double C_bar = (C1 + C2) / 2.0;

    double C_bar_7 = std::pow(C_bar, 7.0);
    double G = 0.5 * (1.0 - std::sqrt(C_bar_7 / (C_bar_7 + kPow25_7)));

    double a1_prime = lab1.a * (1.0 + G);
    double a2_prime = lab2.a * (1.0 + G);

    double C1_prime = std::sqrt(a1_prime * a1_prime + lab1.b * lab1.b);
    double C2_prime = std::sqrt(a2_prime * a2_prime + lab2.b * lab2.b);

    double h1_prime = hue_prime(a1_prime, lab1.b);
    double h2_prime = hue_prime(a2_prime, lab2.b);

    double delta_L_prime = lab2.L - lab1.L;
    double delta_C_prime = C2_prime - C1_prime;

    // Hue is undefined for an achromatic member of the pair.
    bool achromatic = (C1_prime * C2_prime == 0.0);

    double delta_h_prime = 0.0;
    if (!achromatic) {
        double diff = h2_prime - h1_prime;
        if (std::fabs(diff) <= 180.0) {
            delta_h_prime = diff;
        } else if (diff > 180.0) {
            delta_h_prime = diff - 360.0;
        } else {
            delta_h_prime = diff + 360.0;
        }
    }

    double delta_H_prime = 2.0 * std::sqrt(C1_prime * C2_prime) *
                           std::sin(delta_h_prime * kDegToRad / 2.0);

    double L_bar_prime = (lab1.L + lab2.L) / 2.0;
    double C_bar_prime = (C1_prime + C2_prime) / 2.0;

    double h_bar_prime;
    if (achromatic) {
        h_bar_prime = h1_prime + h2_prime;
    } else {
        double sum = h1_prime + h2_prime;
        if (std::fabs(h1_prime - h2_prime) <= 180.0) {
            h_bar_prime = sum / 2.0;
        } else if (sum < 360.0) {
            h_bar_prime = (sum + 360.0) / 2.0;
        } else {
            h_bar_prime = (sum - 360.0) / 2.0;
        }
    }

    double T = 1.0
             - 0.17 * std::cos((h_bar_prime - 30.0) * kDegToRad)
             + 0.24 * std::cos((2.0 * h_bar_prime) * kDegToRad)
             + 0.32 * std::cos((3.0 * h_bar_prime + 6.0) * kDegToRad)
             - 0.20 * std::cos((4.0 * h_bar_prime - 63.0) * kDegToRad);

    double L_term = (L_bar_prime - 50.0) * (L_bar_prime - 50.0);
    double S_L = 1.0 + (0.015 * L_term) / std::sqrt(20.0 + L_term);
    double S_C = 1.0 + 0.045 * C_bar_prime;
    double S_H = 1.0 + 0.015 * C_bar_prime * T;

    double h_offset = (h_bar_prime - 275.0) / 25.0;
    double delta_theta = 30.0 * std::exp(-(h_offset * h_offset));
    double C_bar_prime_7 = std::pow(C_bar_prime, 7.0);
    double R_C = 2.0 * std::sqrt(C_bar_prime_7 / (C_bar_prime_7 + kPow25_7));
    double R_T = -std::sin(2.0 * delta_theta * kDegToRad) * R_C;

    double dL = delta_L_prime / (weights.k_L * S_L);
    double dC = delta_C_prime / (weights.k_C * S_C);
    double dH = delta_H_prime / (weights.k_H * S_H);

    double sum = dL * dL + dC * dC + dH * dH + R_T * dC * dH;
    return std::sqrt(std::max(sum, 0.0));
}

double difference(const RGB& a, const RGB& b) {
    return delta_e_2000(ColorSpace::rgb_to_lab(a), ColorSpace::rgb_to_lab(b));
}

double difference(const NormalizedRGB& a, const NormalizedRGB& b) {
    return delta_e_2000(ColorSpace::rgb_to_lab(a), ColorSpace::rgb_to_lab(b));
}

}
