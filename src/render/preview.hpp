#pragma once

#include "core/types.hpp"
#include "core/tuner.hpp"
#include "terminal/terminal.hpp"
#include <string>

namespace ctune {

struct PreviewPanel {
    RGB text;
    std::string label;  // colour as written by the user, or as formatted on output
    Readability readability = Readability::NotReadable;
};

class PreviewRenderer {
public:
    struct Config {
        int panel_width = 24;
        std::string sample = "Sample Text";
    };

    PreviewRenderer() : PreviewRenderer(Config{}) {}
    explicit PreviewRenderer(const Config& config) : config_(config) {}

    // Two panels on the shared background, "Before -> After", with readability badges.
    std::string render(const PreviewPanel& before, const PreviewPanel& after,
                       const RGB& background, ColorMode mode) const;

    static std::string badge(Readability readability, ColorMode mode);

private:
    Config config_;

    std::string swatch(const RGB& text, const RGB& background, ColorMode mode) const;
    std::string pad(const std::string& s, int visible_width) const;
};

std::string render_preview(const PreviewPanel& before, const PreviewPanel& after,
                           const RGB& background, ColorMode mode);

// Multi-line per-pair report: ratios, target, delta E, status and the path of
// accepted corrections.
std::string render_details(const TuneResult& result, const std::string& original_label,
                           const std::string& tuned_label, Mode mode);

}
