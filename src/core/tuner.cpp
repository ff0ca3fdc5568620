#include "core/tuner.hpp"
#include "core/contrast.hpp"
#include <cmath>

namespace ctune {

namespace {

Result check_channels(const NormalizedRGB& c, const char* which) {
    if (!std::isfinite(c.r) || !std::isfinite(c.g) || !std::isfinite(c.b)) {
        return Result::fail(ErrorCode::INVALID_ARGUMENT,
                            std::string(which) + " color has a non-finite channel");
    }
    if (!c.is_valid()) {
        return Result::fail(ErrorCode::INVALID_ARGUMENT,
                            std::string(which) + " color channels must be within [0, 1]");
    }
    return Result::ok();
}

}

TuneResult Tuner::tune(const RGB& text, const RGB& background, const TuneOptions& options) const {
    TuneResult result;
    result.original = text;
    result.rgb = text;
    result.target = target_ratio(options.large_text, options.premium);
    result.initial_contrast = contrast_ratio(text, background);
    result.contrast = result.initial_contrast;

    if (result.initial_contrast >= result.target) {
        result.status = TuneStatus::AlreadyPasses;
        result.level = level_for(result.contrast, options.large_text);
        result.readability = readability_for(result.level);
        return result;
    }

    OptimizationResult opt = optimizer_.optimize(text, background, result.target, options.mode);

    result.rgb = opt.best.rgb;
    result.delta_e = opt.best.delta_e;
    result.contrast = contrast_ratio(result.rgb, background);
    result.steps = opt.steps;
    result.path = opt.path;
    result.level = level_for(result.contrast, options.large_text);
    result.readability = readability_for(result.level);
    result.improvement_percentage =
        std::round((result.contrast - result.initial_contrast) / result.initial_contrast * 10000.0) / 100.0;

    if (opt.meets_target && result.contrast >= result.target) {
        result.status = options.premium ? TuneStatus::PassesHigh
            : (result.level == ContrastLevel::MeetsHigh ? TuneStatus::PassesHigh : TuneStatus::PassesStandard);
    } else {
        result.status = TuneStatus::Failed;
        result.reason = opt.reason;
    }

    return result;
}

Result Tuner::tune_normalized(const NormalizedRGB& text, const NormalizedRGB& background,
                              const TuneOptions& options, TuneResult& out) const {
    Result r = check_channels(text, "text");
    if (r.failure()) return r;
    r = check_channels(background, "background");
    if (r.failure()) return r;

    out = tune(RGB::from_normalized(text), RGB::from_normalized(background), options);
    return Result::ok();
}

TuneResult tune(const RGB& text, const RGB& background, const TuneOptions& options) {
    return Tuner().tune(text, background, options);
}

}
