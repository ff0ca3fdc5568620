#pragma once

#include "core/types.hpp"
#include "core/optimizer.hpp"
#include <string>
#include <vector>

namespace ctune {

struct TuneOptions {
    bool large_text = false;
    bool premium = false;
    Mode mode = Mode::Default;
};

struct TuneResult {
    RGB original;
    RGB rgb;
    double delta_e = 0.0;
    double contrast = 1.0;
    double initial_contrast = 1.0;
    double target = 4.5;
    TuneStatus status = TuneStatus::Failed;
    ContrastLevel level = ContrastLevel::Fails;
    Readability readability = Readability::NotReadable;
    double improvement_percentage = 0.0;
    int steps = 0;
    std::vector<Candidate> path;
    std::string reason;

    bool passes() const { return status != TuneStatus::Failed; }
    bool changed() const { return rgb != original; }
};

class Tuner {
public:
    Tuner() = default;
    Tuner(const Optimizer::Config& config, const ModePolicies& policies)
        : optimizer_(config, policies) {}

    TuneResult tune(const RGB& text, const RGB& background, const TuneOptions& options) const;

    // Boundary for callers holding floating colours; rejects non-finite or out-of-range channels.
    Result tune_normalized(const NormalizedRGB& text, const NormalizedRGB& background,
                           const TuneOptions& options, TuneResult& out) const;

    const Optimizer& optimizer() const { return optimizer_; }

private:
    Optimizer optimizer_;
};

TuneResult tune(const RGB& text, const RGB& background, const TuneOptions& options = {});

}
