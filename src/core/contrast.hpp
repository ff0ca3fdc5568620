#pragma once

#include "core/types.hpp"

namespace ctune {

struct ContrastThresholds {
    static constexpr double kNormalStandard = 4.5;
    static constexpr double kNormalHigh = 7.0;
    static constexpr double kLargeStandard = 3.0;
    static constexpr double kLargeHigh = 4.5;
};

double relative_luminance(const RGB& rgb);
double relative_luminance(const NormalizedRGB& rgb);

// Order-independent; always in [1, 21].
double contrast_ratio(const RGB& a, const RGB& b);
double contrast_ratio(const NormalizedRGB& a, const NormalizedRGB& b);
double contrast_ratio_from_luminance(double l1, double l2);

double standard_threshold(bool large_text);
double high_threshold(bool large_text);
double target_ratio(bool large_text, bool premium);

// Highest tier the ratio reaches for the given text size.
ContrastLevel level_for(double ratio, bool large_text);

// Like level_for, but a premium request that only reaches the standard tier fails.
ContrastLevel classify(double ratio, bool large_text, bool premium);

Readability readability_for(ContrastLevel level);

}
