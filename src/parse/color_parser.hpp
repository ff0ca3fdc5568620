#pragma once

#include "core/types.hpp"
#include <string>

namespace ctune {

// Notation a colour was written in; results are reported back in the same one.
enum class ColorFormat {
    Hex,
    Rgb,
    Hsl,
    Named
};

struct ParsedColor {
    RGB rgb;
    double alpha = 1.0;
    ColorFormat format = ColorFormat::Hex;

    bool opaque() const { return alpha >= 1.0; }
};

struct HSL {
    double h = 0.0;  // degrees [0, 360)
    double s = 0.0;  // percent
    double l = 0.0;  // percent
};

// Accepts #rgb, #rgba, #rrggbb, #rrggbbaa, rgb()/rgba(), hsl()/hsla() in comma or
// space syntax, CSS named colours and "transparent". Case-insensitive.
Result parse_color(const std::string& text, ParsedColor& out);

// Resolves a text/background pair to opaque colours. A translucent background is
// flattened onto white, a translucent text colour onto the flattened background.
Result resolve_pair(const std::string& text, const std::string& background,
                    ParsedColor& text_out, ParsedColor& background_out);

RGB composite(const RGB& fg, double alpha, const RGB& bg);

HSL rgb_to_hsl(const RGB& rgb);
RGB hsl_to_rgb(const HSL& hsl);

std::string format_color(const RGB& rgb, ColorFormat format);
std::string to_hex(const RGB& rgb);

const char* format_name(ColorFormat format);
bool parse_format(const std::string& name, ColorFormat& out);

bool lookup_named_color(const std::string& name, RGB& out);

}
