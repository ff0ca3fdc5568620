#include "core/optimizer.hpp"
#include "core/contrast.hpp"
#include "core/delta_e.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>
#include <iomanip>

namespace ctune {

namespace {

double max_of(const std::vector<double>& values) {
    double m = 0.0;
    for (double v : values) m = std::max(m, v);
    return m;
}

// Prefer meeting the target with the smaller change, otherwise the higher contrast.
const OptimizationResult& pick_better(const OptimizationResult& a, const OptimizationResult& b) {
    if (a.meets_target && b.meets_target) {
        return b.best.delta_e < a.best.delta_e ? b : a;
    }
    if (a.meets_target) return a;
    if (b.meets_target) return b;
    if (b.best.contrast > a.best.contrast) return b;
    if (b.best.contrast == a.best.contrast && b.best.delta_e < a.best.delta_e) return b;
    return a;
}

bool better_progress(const Candidate& c, const Candidate& current) {
    if (c.contrast != current.contrast) return c.contrast > current.contrast;
    return c.delta_e < current.delta_e;
}

}

double ModePolicies::max_delta_e(Mode mode) const {
    double strict_max = max_of(strict.budgets);
    double default_max = std::max(default_mode.max_total_delta_e, strict_max);
    switch (mode) {
        case Mode::Strict: return strict_max;
        case Mode::Default: return default_max;
        case Mode::Relaxed: return std::max(default_max, max_of(relaxed.budgets));
    }
    return strict_max;
}

SearchContext SearchContext::make(const RGB& anchor, const RGB& origin, const RGB& background,
                                  double target, double budget, double total_cap) {
    SearchContext ctx;
    ctx.anchor = anchor;
    ctx.origin = origin;
    ctx.background = background;
    ctx.anchor_lab = ColorSpace::rgb_to_lab(anchor);
    ctx.origin_lab = ColorSpace::rgb_to_lab(origin);
    ctx.background_luminance = relative_luminance(background);
    ctx.target = target;
    ctx.budget = budget;
    ctx.total_cap = total_cap;
    return ctx;
}

Candidate SearchContext::evaluate(const RGB& rgb) const {
    Candidate c;
    c.rgb = rgb;
    c.contrast = contrast_ratio_from_luminance(relative_luminance(rgb), background_luminance);
    Lab lab = ColorSpace::rgb_to_lab(rgb);
    c.delta_e = delta_e_2000(origin_lab, lab);
    c.step_delta_e = delta_e_2000(anchor_lab, lab);
    return c;
}

bool SearchContext::in_budget(const Candidate& c) const {
    return c.step_delta_e <= budget && c.delta_e <= total_cap;
}

bool SearchContext::feasible(const Candidate& c) const {
    return c.contrast >= target && in_budget(c);
}

void SearchOutcome::offer(const SearchContext& ctx, const Candidate& c) {
    if (!ctx.in_budget(c)) return;

    if (ctx.feasible(c)) {
        if (!feasible || c.delta_e < feasible->delta_e) {
            feasible = c;
            budget = ctx.budget;
        }
    }
    if (!progress || better_progress(c, *progress)) {
        progress = c;
    }
}

void SearchOutcome::merge(const SearchOutcome& other) {
    if (other.feasible && (!feasible || other.feasible->delta_e < feasible->delta_e)) {
        feasible = other.feasible;
        budget = other.budget;
    }
    if (other.progress && (!progress || better_progress(*other.progress, *progress))) {
        progress = other.progress;
    }
}

Optimizer::Optimizer(const Config& config, const ModePolicies& policies)
    : config_(config), policies_(policies) {}

Optimizer::Direction Optimizer::choose_direction(const SearchContext& ctx, const OKLCH& lch) const {
    double text_lum = relative_luminance(ctx.anchor);
    double bg_lum = ctx.background_luminance;

    Direction preferred;
    if (text_lum > bg_lum) {
        preferred = Direction::Lighter;
    } else if (text_lum < bg_lum) {
        preferred = Direction::Darker;
    } else {
        double up = contrast_ratio_from_luminance(1.0, bg_lum);
        double down = contrast_ratio_from_luminance(0.0, bg_lum);
        preferred = up > down ? Direction::Lighter : Direction::Darker;
    }
    Direction other = preferred == Direction::Lighter ? Direction::Darker : Direction::Lighter;

    auto reach = [&](Direction dir) {
        OKLCH extreme = lch;
        extreme.L = dir == Direction::Lighter ? 1.0 : 0.0;
        return ctx.evaluate(ColorSpace::lch_to_rgb(extreme)).contrast;
    };

    double preferred_reach = reach(preferred);
    if (preferred_reach >= ctx.target) return preferred;
    double other_reach = reach(other);
    if (other_reach >= ctx.target) return other;
    return preferred_reach >= other_reach ? preferred : other;
}

SearchOutcome Optimizer::binary_search_lightness(const SearchContext& ctx) const {
    SearchOutcome outcome;
    OKLCH lch = ColorSpace::rgb_to_lch(ctx.anchor);
    Direction dir = choose_direction(ctx, lch);

    double low = dir == Direction::Lighter ? lch.L : 0.0;
    double high = dir == Direction::Lighter ? 1.0 : lch.L;

    for (int i = 0; i < config_.binary_search_iterations; ++i) {
        double mid = (low + high) / 2.0;
        OKLCH probe = lch;
        probe.L = mid;

        Candidate c = ctx.evaluate(ColorSpace::lch_to_rgb(probe));

        bool toward_anchor;
        if (!ctx.in_budget(c)) {
            toward_anchor = true;
        } else {
            outcome.offer(ctx, c);
            toward_anchor = c.contrast >= ctx.target;
        }

        if (dir == Direction::Lighter) {
            if (toward_anchor) high = mid; else low = mid;
        } else {
            if (toward_anchor) low = mid; else high = mid;
        }
    }

    return outcome;
}

double Optimizer::loss(const SearchContext& ctx, const OKLCH& lch) const {
    NormalizedRGB rgb = ColorSpace::lch_to_rgb_normalized(lch);
    Lab lab = ColorSpace::rgb_to_lab(rgb);

    double contrast = contrast_ratio_from_luminance(relative_luminance(rgb), ctx.background_luminance);
    double step_de = delta_e_2000(ctx.anchor_lab, lab);
    double total_de = delta_e_2000(ctx.origin_lab, lab);

    double deficit = std::max(0.0, ctx.target - contrast);
    double overshoot = std::max(0.0, step_de - ctx.budget) + std::max(0.0, total_de - ctx.total_cap);

    return config_.contrast_weight * deficit
         + config_.delta_e_weight * step_de
         + config_.budget_penalty_weight * overshoot;
}

SearchOutcome Optimizer::gradient_descent(const SearchContext& ctx, const RGB& start) const {
    SearchOutcome outcome;

    OKLCH anchor_lch = ColorSpace::rgb_to_lch(ctx.anchor);
    double c_max = anchor_lch.has_hue
        ? std::min(anchor_lch.C * config_.chroma_max_multiple, config_.chroma_ceiling)
        : 0.0;

    OKLCH p = ColorSpace::rgb_to_lch(start);
    p.H = anchor_lch.H;
    p.has_hue = anchor_lch.has_hue;
    p.L = std::clamp(p.L, 0.0, 1.0);
    p.C = std::clamp(p.C, 0.0, c_max);

    auto consider = [&](const OKLCH& q) {
        outcome.offer(ctx, ctx.evaluate(ColorSpace::lch_to_rgb(q)));
    };

    consider(p);
    double f = loss(ctx, p);
    double lr = config_.learning_rate;
    const double h = config_.finite_difference_step;

    for (int it = 0; it < config_.gradient_max_iterations && lr >= config_.min_learning_rate; ++it) {
        OKLCH qL = p;
        double hL = (p.L + h <= 1.0) ? h : -h;
        qL.L += hL;
        double gL = (loss(ctx, qL) - f) / hL;

        double gC = 0.0;
        if (c_max >= h) {
            OKLCH qC = p;
            double hC = (p.C + h <= c_max) ? h : -h;
            qC.C += hC;
            gC = (loss(ctx, qC) - f) / hC;
        }

        double norm = std::hypot(gL, gC);
        if (!(norm > 0.0) || !std::isfinite(norm)) {
            break;
        }

        OKLCH next = p;
        next.L = std::clamp(p.L - lr * gL / norm, 0.0, 1.0);
        next.C = std::clamp(p.C - lr * gC / norm, 0.0, c_max);

        double fn = loss(ctx, next);
        if (fn < f) {
            p = next;
            f = fn;
            consider(p);
        } else {
            lr *= 0.5;
        }
    }

    return outcome;
}

SearchOutcome Optimizer::relax(const SearchContext& base, const std::vector<double>& budgets) const {
    SearchOutcome combined;

    for (double budget : budgets) {
        SearchContext ctx = base;
        ctx.budget = budget;

        SearchOutcome phase1 = binary_search_lightness(ctx);
        if (phase1.feasible) {
            return phase1;
        }

        RGB start = phase1.progress ? phase1.progress->rgb : ctx.anchor;
        SearchOutcome phase2 = gradient_descent(ctx, start);
        if (phase2.feasible) {
            phase2.merge(phase1);
            return phase2;
        }

        combined.merge(phase1);
        combined.merge(phase2);
    }

    return combined;
}

OptimizationResult Optimizer::run_ladder(const RGB& text, const RGB& background, double target,
                                         const std::vector<double>& budgets) const {
    OptimizationResult result;
    double cap = max_of(budgets);
    SearchContext base = SearchContext::make(text, text, background, target, 0.0, cap);

    // The cap follows the active rung so a single jump never exceeds it.
    SearchOutcome combined;
    for (double budget : budgets) {
        SearchContext ctx = base;
        ctx.total_cap = budget;
        SearchOutcome outcome = relax(ctx, {budget});
        if (outcome.feasible) {
            result.best = *outcome.feasible;
            result.meets_target = true;
            result.steps = 1;
            result.path.push_back(result.best);
            result.budget_used = outcome.budget;
            return result;
        }
        combined.merge(outcome);
    }

    result.best = combined.progress ? *combined.progress : base.evaluate(text);
    result.budget_used = cap;
    return result;
}

OptimizationResult Optimizer::run_compounding(const RGB& text, const RGB& background, double target) const {
    const DefaultPolicy& policy = policies_.default_mode;

    Accumulator acc;
    acc.current = SearchContext::make(text, text, background, target, 0.0, 0.0).evaluate(text);

    OptimizationResult result;
    result.budget_used = policy.max_total_delta_e;

    while (acc.steps < policy.max_steps) {
        SearchContext ctx = SearchContext::make(acc.current.rgb, text, background, target,
                                                0.0, policy.max_total_delta_e);
        SearchOutcome outcome = relax(ctx, policy.step_budgets);

        if (outcome.feasible) {
            acc.current = *outcome.feasible;
            acc.cumulative_delta_e = acc.current.delta_e;
            acc.steps++;
            result.path.push_back(acc.current);
            result.best = acc.current;
            result.meets_target = true;
            result.steps = acc.steps;
            return result;
        }

        if (!outcome.progress || outcome.progress->contrast <= acc.current.contrast) {
            break;
        }

        acc.current = *outcome.progress;
        acc.cumulative_delta_e = acc.current.delta_e;
        acc.steps++;
        result.path.push_back(acc.current);
    }

    result.best = acc.current;
    result.steps = acc.steps;
    return result;
}

OptimizationResult Optimizer::run_default(const RGB& text, const RGB& background, double target) const {
    OptimizationResult compounding = run_compounding(text, background, target);
    if (compounding.meets_target && compounding.best.delta_e <= policies_.default_mode.step_limit) {
        return compounding;
    }

    OptimizationResult strict = run_ladder(text, background, target, policies_.strict.budgets);
    return pick_better(compounding, strict);
}

OptimizationResult Optimizer::run_relaxed(const RGB& text, const RGB& background, double target) const {
    OptimizationResult base = run_default(text, background, target);
    if (base.meets_target && !policies_.relaxed.budgets.empty() &&
        base.best.delta_e <= policies_.relaxed.budgets.front()) {
        return base;
    }

    OptimizationResult extended = run_ladder(text, background, target, policies_.relaxed.budgets);
    return pick_better(base, extended);
}

OptimizationResult Optimizer::optimize(const RGB& text, const RGB& background,
                                       double target, Mode mode) const {
    SearchContext origin = SearchContext::make(text, text, background, target, 0.0, 0.0);
    Candidate initial = origin.evaluate(text);

    if (initial.contrast >= target) {
        OptimizationResult result;
        result.best = initial;
        result.meets_target = true;
        return result;
    }

    OptimizationResult result;
    switch (mode) {
        case Mode::Strict:
            result = run_ladder(text, background, target, policies_.strict.budgets);
            break;
        case Mode::Default:
            result = run_default(text, background, target);
            break;
        case Mode::Relaxed:
            result = run_relaxed(text, background, target);
            break;
    }

    if (!result.meets_target) {
        if (result.best.contrast < initial.contrast) {
            result.best = initial;
        }
        std::ostringstream ss;
        ss << std::fixed << std::setprecision(2)
           << "contrast " << target << " unreachable within delta E "
           << policies_.max_delta_e(mode) << " (" << mode_name(mode) << " mode)";
        result.reason = ss.str();
    }

    return result;
}

}
