#pragma once

#include "core/types.hpp"
#include <string>

namespace ctune {

enum class ColorMode {
    None,
    Ansi256,
    Truecolor
};

struct TerminalInfo {
    bool is_tty = false;
    ColorMode color_mode = ColorMode::None;
};

class Terminal {
public:
    Terminal();

    TerminalInfo get_info() const { return info_; }

    // NO_COLOR wins, then COLORTERM, then TERM. Non-tty output gets no colour.
    static ColorMode detect_color_mode(bool is_tty);

    static std::string color_code(ColorMode mode, uint8_t r, uint8_t g, uint8_t b, bool fg);
    static std::string color_code(ColorMode mode, const RGB& rgb, bool fg) {
        return color_code(mode, rgb.r, rgb.g, rgb.b, fg);
    }
    static std::string reset_code(ColorMode mode);
    static uint8_t rgb_to_256(uint8_t r, uint8_t g, uint8_t b);

private:
    TerminalInfo info_;
};

const char* color_mode_name(ColorMode mode);
// Accepts "none", "256", "truecolor"; "auto" resolves via detect_color_mode.
bool resolve_color_mode(const std::string& name, bool is_tty, ColorMode& out);

}
