#include "render/preview.hpp"
#include "parse/color_parser.hpp"
#include <algorithm>
#include <cstdio>
#include <sstream>

namespace ctune {

namespace {

const RGB kBadgeFail(185, 28, 28);
const RGB kBadgePass(21, 128, 61);
const RGB kBadgeText(255, 255, 255);

const char* badge_text(Readability r) {
    switch (r) {
        case Readability::NotReadable: return "Not Readable";
        case Readability::Readable: return "Readable";
        case Readability::VeryReadable: return "Very Readable";
    }
    return "Not Readable";
}

std::string fixed(double v, int precision) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.*f", precision, v);
    return buf;
}

}

std::string PreviewRenderer::pad(const std::string& s, int visible_width) const {
    int fill = std::max(0, config_.panel_width - visible_width);
    return s + std::string(static_cast<size_t>(fill), ' ');
}

std::string PreviewRenderer::swatch(const RGB& text, const RGB& background, ColorMode mode) const {
    int sample_width = static_cast<int>(config_.sample.size());
    int left = std::max(0, (config_.panel_width - sample_width) / 2);
    int right = std::max(0, config_.panel_width - sample_width - left);

    std::string body = std::string(static_cast<size_t>(left), ' ') + config_.sample +
                       std::string(static_cast<size_t>(right), ' ');
    if (mode == ColorMode::None) {
        return "[" + body.substr(1, body.size() - 2) + "]";
    }
    return Terminal::color_code(mode, background, false) +
           Terminal::color_code(mode, text, true) + body + Terminal::reset_code(mode);
}

std::string PreviewRenderer::badge(Readability readability, ColorMode mode) {
    std::string label = std::string(" ") + badge_text(readability) + " ";
    if (mode == ColorMode::None) {
        return "[" + label + "]";
    }
    const RGB& bg = readability == Readability::NotReadable ? kBadgeFail : kBadgePass;
    return Terminal::color_code(mode, bg, false) + Terminal::color_code(mode, kBadgeText, true) +
           label + Terminal::reset_code(mode);
}

std::string PreviewRenderer::render(const PreviewPanel& before, const PreviewPanel& after,
                                    const RGB& background, ColorMode mode) const {
    const std::string gap = "  ->  ";
    const std::string blank_gap(gap.size(), ' ');
    std::ostringstream out;

    out << pad("Before", 6) << blank_gap << "After\n";
    out << swatch(before.text, background, mode) << gap << swatch(after.text, background, mode) << "\n";
    out << pad(before.label, static_cast<int>(before.label.size())) << blank_gap << after.label << "\n";

    // Badges carry escape codes, so pad by their visible width.
    int before_badge_width = static_cast<int>(std::string(badge_text(before.readability)).size()) + 2 +
                             (mode == ColorMode::None ? 2 : 0);
    out << pad(badge(before.readability, mode), before_badge_width) << blank_gap
        << badge(after.readability, mode) << "\n";

    return out.str();
}

std::string render_preview(const PreviewPanel& before, const PreviewPanel& after,
                           const RGB& background, ColorMode mode) {
    return PreviewRenderer().render(before, after, background, mode);
}

std::string render_details(const TuneResult& result, const std::string& original_label,
                           const std::string& tuned_label, Mode mode) {
    std::ostringstream out;
    out << "  original:     " << original_label << " (" << to_hex(result.original) << ")\n";
    out << "  tuned:        " << tuned_label << " (" << to_hex(result.rgb) << ")\n";
    out << "  mode:         " << mode_name(mode) << "\n";
    out << "  contrast:     " << fixed(result.initial_contrast, 2) << " -> " << fixed(result.contrast, 2)
        << " (target " << fixed(result.target, 1) << ", " << level_name(result.level) << ")\n";
    out << "  improvement:  " << fixed(result.improvement_percentage, 2) << "%\n";
    out << "  delta E 2000: " << fixed(result.delta_e, 2) << "\n";
    out << "  status:       " << status_name(result.status) << "\n";

    if (!result.path.empty()) {
        out << "  steps:\n";
        int index = 1;
        for (const Candidate& c : result.path) {
            out << "    " << index++ << ". " << to_hex(c.rgb)
                << "  contrast " << fixed(c.contrast, 2)
                << "  step dE " << fixed(c.step_delta_e, 2)
                << "  total dE " << fixed(c.delta_e, 2) << "\n";
        }
    }
    if (!result.reason.empty()) {
        out << "  reason:       " << result.reason << "\n";
    }
    return out.str();
}

}
