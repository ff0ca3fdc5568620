#include "core/contrast.hpp"
#include "core/color_space.hpp"
#include <algorithm>

namespace ctune {

double relative_luminance(const RGB& rgb) {
    return ColorSpace::srgb_to_linear(rgb).luminance();
}

double relative_luminance(const NormalizedRGB& rgb) {
    return ColorSpace::srgb_to_linear(rgb).luminance();
}

double contrast_ratio_from_luminance(double l1, double l2) {
    double lighter = std::max(l1, l2);
    double darker = std::min(l1, l2);
    return (lighter + 0.05) / (darker + 0.05);
}

double contrast_ratio(const RGB& a, const RGB& b) {
    return contrast_ratio_from_luminance(relative_luminance(a), relative_luminance(b));
}

double contrast_ratio(const NormalizedRGB& a, const NormalizedRGB& b) {
    return contrast_ratio_from_luminance(relative_luminance(a), relative_luminance(b));
}

double standard_threshold(bool large_text) {
    return large_text ? ContrastThresholds::kLargeStandard : ContrastThresholds::kNormalStandard;
}

double high_threshold(bool large_text) {
    return large_text ? ContrastThresholds::kLargeHigh : ContrastThresholds::kNormalHigh;
}

double target_ratio(bool large_text, bool premium) {
    return premium ? high_threshold(large_text) : standard_threshold(large_text);
}

ContrastLevel level_for(double ratio, bool large_text) {
    if (ratio >= high_threshold(large_text)) return ContrastLevel::MeetsHigh;
    if (ratio >= standard_threshold(large_text)) return ContrastLevel::MeetsStandard;
    return ContrastLevel::Fails;
}

ContrastLevel classify(double ratio, bool large_text, bool premium) {
    ContrastLevel level = level_for(ratio, large_text);
    if (premium && level != ContrastLevel::MeetsHigh) {
        return ContrastLevel::Fails;
    }
    return level;
}

Readability readability_for(ContrastLevel level) {
    switch (level) {
        case ContrastLevel::MeetsHigh: return Readability::VeryReadable;
        case ContrastLevel::MeetsStandard: return Readability::Readable;
        case ContrastLevel::Fails: return Readability::NotReadable;
    }
    return Readability::NotReadable;
}

}
