#include "terminal.hpp"
#include <cstdio>
#include <cstdlib>

#ifdef _WIN32
#include <io.h>
#else
#include <unistd.h>
#endif

namespace ctune {

namespace {

constexpr int kCubeLevels[6] = {0, 95, 135, 175, 215, 255};

int nearest_cube_index(int v) {
    if (v < 48) return 0;
    if (v < 115) return 1;
    return (v - 35) / 40;
}

int squared_distance(int r1, int g1, int b1, int r2, int g2, int b2) {
    return (r1 - r2) * (r1 - r2) + (g1 - g2) * (g1 - g2) + (b1 - b2) * (b1 - b2);
}

bool stdout_is_tty() {
#ifdef _WIN32
    return _isatty(_fileno(stdout)) != 0;
#else
    return isatty(STDOUT_FILENO) != 0;
#endif
}

}

Terminal::Terminal() {
    info_.is_tty = stdout_is_tty();
    info_.color_mode = detect_color_mode(info_.is_tty);
}

ColorMode Terminal::detect_color_mode(bool is_tty) {
    const char* no_color = std::getenv("NO_COLOR");
    if (no_color && no_color[0] != '\0') {
        return ColorMode::None;
    }
    if (!is_tty) {
        return ColorMode::None;
    }

    const char* colorterm = std::getenv("COLORTERM");
    if (colorterm) {
        std::string ct(colorterm);
        if (ct == "truecolor" || ct == "24bit") {
            return ColorMode::Truecolor;
        }
    }

    const char* term = std::getenv("TERM");
    if (term) {
        std::string t(term);
        if (t == "dumb") {
            return ColorMode::None;
        }
        if (t.find("256color") != std::string::npos) {
            return ColorMode::Ansi256;
        }
    }

#ifdef _WIN32
    return ColorMode::Truecolor;
#else
    return ColorMode::Ansi256;
#endif
}

std::string Terminal::color_code(ColorMode mode, uint8_t r, uint8_t g, uint8_t b, bool fg) {
    char buf[32];
    switch (mode) {
        case ColorMode::None:
            return "";
        case ColorMode::Ansi256:
            snprintf(buf, sizeof(buf), "\033[%d;5;%dm", fg ? 38 : 48, rgb_to_256(r, g, b));
            return buf;
        case ColorMode::Truecolor:
            snprintf(buf, sizeof(buf), "\033[%d;2;%d;%d;%dm", fg ? 38 : 48, r, g, b);
            return buf;
    }
    return "";
}

std::string Terminal::reset_code(ColorMode mode) {
    return mode == ColorMode::None ? "" : "\033[0m";
}

// Nearest of the 6x6x6 cube (16..231) and the gray ramp (232..255). The 16 system
// colours are skipped since terminals theme them.
uint8_t Terminal::rgb_to_256(uint8_t r, uint8_t g, uint8_t b) {
    int ri = nearest_cube_index(r);
    int gi = nearest_cube_index(g);
    int bi = nearest_cube_index(b);
    int cube_dist = squared_distance(r, g, b, kCubeLevels[ri], kCubeLevels[gi], kCubeLevels[bi]);

    int avg = (r + g + b) / 3;
    int gray_index = avg > 238 ? 23 : (avg < 3 ? 0 : (avg - 3) / 10);
    int gray = 8 + gray_index * 10;
    int gray_dist = squared_distance(r, g, b, gray, gray, gray);

    if (gray_dist < cube_dist) {
        return static_cast<uint8_t>(232 + gray_index);
    }
    return static_cast<uint8_t>(16 + 36 * ri + 6 * gi + bi);
}

const char* color_mode_name(ColorMode mode) {
    switch (mode) {
        case ColorMode::None: return "none";
        case ColorMode::Ansi256: return "256";
        case ColorMode::Truecolor: return "truecolor";
    }
    return "none";
}

bool resolve_color_mode(const std::string& name, bool is_tty, ColorMode& out) {
    if (name.empty() || name == "auto") {
        out = Terminal::detect_color_mode(is_tty);
        return true;
    }
    if (name == "none") { out = ColorMode::None; return true; }
    if (name == "256") { out = ColorMode::Ansi256; return true; }
    if (name == "truecolor") { out = ColorMode::Truecolor; return true; }
    return false;
}

}
