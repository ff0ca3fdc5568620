#pragma once

#include "core/types.hpp"
#include "core/color_space.hpp"
#include <optional>
#include <string>
#include <vector>

namespace ctune {

struct StrictPolicy {
    std::vector<double> budgets = {0.8, 1.5, 2.3, 3.5, 5.0};
};

// Compounding small corrections: each step is bounded relative to its own
// starting colour, the running total relative to the original.
struct DefaultPolicy {
    std::vector<double> step_budgets = {0.8, 1.5, 2.3, 3.0};
    double step_limit = 3.0;
    int max_steps = 6;
    double max_total_delta_e = 15.0;
};

struct RelaxedPolicy {
    std::vector<double> budgets = {5.0, 7.5, 10.0, 12.5, 15.0};
};

struct ModePolicies {
    StrictPolicy strict;
    DefaultPolicy default_mode;
    RelaxedPolicy relaxed;

    // Largest delta E a successful result may carry in the given mode.
    double max_delta_e(Mode mode) const;
};

struct Candidate {
    RGB rgb;
    double contrast = 1.0;
    double delta_e = 0.0;       // from the original colour
    double step_delta_e = 0.0;  // from the start of the current step
};

struct SearchContext {
    RGB anchor;
    RGB origin;
    RGB background;
    Lab anchor_lab;
    Lab origin_lab;
    double background_luminance = 0.0;
    double target = 4.5;
    double budget = 0.0;
    double total_cap = 0.0;

    static SearchContext make(const RGB& anchor, const RGB& origin, const RGB& background,
                              double target, double budget, double total_cap);

    Candidate evaluate(const RGB& rgb) const;
    bool in_budget(const Candidate& c) const;
    bool feasible(const Candidate& c) const;
};

struct SearchOutcome {
    std::optional<Candidate> feasible;
    // Highest-contrast candidate that stayed inside the budget.
    std::optional<Candidate> progress;
    double budget = 0.0;

    void offer(const SearchContext& ctx, const Candidate& c);
    void merge(const SearchOutcome& other);
};

struct OptimizationResult {
    Candidate best;
    bool meets_target = false;
    int steps = 0;
    // Accepted corrections in order; step_delta_e is relative to the previous one.
    std::vector<Candidate> path;
    double budget_used = 0.0;
    std::string reason;
};

class Optimizer {
public:
    struct Config {
        int binary_search_iterations = 20;
        int gradient_max_iterations = 50;
        double learning_rate = 0.02;
        double min_learning_rate = 1e-4;
        double finite_difference_step = 1e-3;
        double chroma_max_multiple = 2.0;
        double chroma_ceiling = 0.4;
        double contrast_weight = 100.0;
        double delta_e_weight = 1.0;
        double budget_penalty_weight = 100.0;
    };

    enum class Direction {
        Lighter,
        Darker
    };

    Optimizer() : Optimizer(Config{}, ModePolicies{}) {}
    Optimizer(const Config& config, const ModePolicies& policies);

    const Config& config() const { return config_; }
    const ModePolicies& policies() const { return policies_; }

    OptimizationResult optimize(const RGB& text, const RGB& background,
                                double target, Mode mode) const;

    SearchOutcome binary_search_lightness(const SearchContext& ctx) const;
    SearchOutcome gradient_descent(const SearchContext& ctx, const RGB& start) const;
    SearchOutcome relax(const SearchContext& base, const std::vector<double>& budgets) const;

    Direction choose_direction(const SearchContext& ctx, const OKLCH& lch) const;

private:
    Config config_;
    ModePolicies policies_;

    struct Accumulator {
        Candidate current;
        double cumulative_delta_e = 0.0;
        int steps = 0;
    };

    OptimizationResult run_ladder(const RGB& text, const RGB& background, double target,
                                  const std::vector<double>& budgets) const;
    OptimizationResult run_compounding(const RGB& text, const RGB& background, double target) const;
    OptimizationResult run_default(const RGB& text, const RGB& background, double target) const;
    OptimizationResult run_relaxed(const RGB& text, const RGB& background, double target) const;

    double loss(const SearchContext& ctx, const OKLCH& lch) const;
};

}
