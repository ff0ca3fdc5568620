#include "parse/color_parser.hpp"
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <cmath>
#include <vector>

namespace ctune {

namespace {

std::string trim_lower(const std::string& s) {
    size_t start = 0;
    size_t end = s.size();
    while (start < end && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;

    std::string out;
    out.reserve(end - start);
    for (size_t i = start; i < end; ++i) {
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(s[i]))));
    }
    return out;
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return -1;
}

bool all_hex(const std::string& s) {
    for (char c : s) {
        if (hex_value(c) < 0) return false;
    }
    return !s.empty();
}

Result parse_hex(const std::string& digits, ParsedColor& out) {
    if (!all_hex(digits)) {
        return Result::fail(ErrorCode::INVALID_FORMAT, "invalid hex colour: #" + digits);
    }

    std::string full;
    if (digits.size() == 3 || digits.size() == 4) {
        for (char c : digits) {
            full.push_back(c);
            full.push_back(c);
        }
    } else if (digits.size() == 6 || digits.size() == 8) {
        full = digits;
    } else {
        return Result::fail(ErrorCode::INVALID_FORMAT,
                            "hex colour must have 3, 4, 6 or 8 digits: #" + digits);
    }

    auto byte_at = [&full](size_t i) {
        return static_cast<uint8_t>(hex_value(full[i]) * 16 + hex_value(full[i + 1]));
    };

    out.rgb = RGB(byte_at(0), byte_at(2), byte_at(4));
    out.alpha = full.size() == 8 ? byte_at(6) / 255.0 : 1.0;
    out.format = ColorFormat::Hex;
    return Result::ok();
}

struct Component {
    double value = 0.0;
    bool percent = false;
};

// "deg" is only meaningful on a hue, callers opt in with allow_degrees.
bool parse_component(const std::string& token, Component& out, bool allow_degrees = false) {
    if (token.empty()) return false;

    std::string body = token;
    out.percent = false;
    if (body.back() == '%') {
        out.percent = true;
        body.pop_back();
    } else if (allow_degrees && body.size() > 3 && body.compare(body.size() - 3, 3, "deg") == 0) {
        body.resize(body.size() - 3);
    }
    if (body.empty()) return false;

    const char* begin = body.c_str();
    char* end = nullptr;
    double v = std::strtod(begin, &end);
    if (end == begin || *end != '\0' || !std::isfinite(v)) return false;

    out.value = v;
    return true;
}

// Splits the argument list of a functional notation into components and an
// optional alpha. Supports "a, b, c[, d]" and "a b c[ / d]".
bool split_arguments(const std::string& inner, std::vector<std::string>& parts, std::string& alpha) {
    parts.clear();
    alpha.clear();

    auto push_token = [&parts](std::string& tok) {
        if (!tok.empty()) {
            parts.push_back(tok);
            tok.clear();
        }
    };

    if (inner.find(',') != std::string::npos) {
        std::string tok;
        for (char c : inner) {
            if (c == ',') {
                if (tok.empty()) return false;
                push_token(tok);
            } else if (!std::isspace(static_cast<unsigned char>(c))) {
                tok.push_back(c);
            } else if (!tok.empty()) {
                // embedded whitespace inside a comma-separated component
                return false;
            }
        }
        if (tok.empty()) return false;
        push_token(tok);

        if (parts.size() == 4) {
            alpha = parts.back();
            parts.pop_back();
        }
        return parts.size() == 3;
    }

    std::string main_part = inner;
    size_t slash = inner.find('/');
    if (slash != std::string::npos) {
        main_part = inner.substr(0, slash);
        std::string a = trim_lower(inner.substr(slash + 1));
        if (a.empty() || a.find_first_of(" \t/") != std::string::npos) return false;
        alpha = a;
    }

    std::string tok;
    for (char c : main_part) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            push_token(tok);
        } else {
            tok.push_back(c);
        }
    }
    push_token(tok);
    return parts.size() == 3;
}

Result parse_alpha(const std::string& token, double& alpha) {
    if (token.empty()) {
        alpha = 1.0;
        return Result::ok();
    }
    Component c;
    if (!parse_component(token, c)) {
        return Result::fail(ErrorCode::INVALID_FORMAT, "invalid alpha value: " + token);
    }
    double a = c.percent ? c.value / 100.0 : c.value;
    if (a < 0.0 || a > 1.0) {
        return Result::fail(ErrorCode::INVALID_ARGUMENT, "alpha must be between 0 and 1: " + token);
    }
    alpha = a;
    return Result::ok();
}

Result parse_rgb_function(const std::string& inner, ParsedColor& out) {
    std::vector<std::string> parts;
    std::string alpha_token;
    if (!split_arguments(inner, parts, alpha_token)) {
        return Result::fail(ErrorCode::INVALID_FORMAT, "rgb() expects three channels");
    }

    static const char* channel_names[3] = {"red", "green", "blue"};
    uint8_t channels[3];
    for (int i = 0; i < 3; ++i) {
        Component c;
        if (!parse_component(parts[i], c)) {
            return Result::fail(ErrorCode::INVALID_FORMAT,
                                std::string("invalid ") + channel_names[i] + " channel: " + parts[i]);
        }
        double v = c.percent ? c.value * 2.55 : c.value;
        if (v < 0.0 || v > 255.0) {
            return Result::fail(ErrorCode::INVALID_ARGUMENT,
                                std::string(channel_names[i]) + " channel out of range: " + parts[i]);
        }
        channels[i] = static_cast<uint8_t>(std::round(v));
    }

    Result ar = parse_alpha(alpha_token, out.alpha);
    if (ar.failure()) return ar;

    out.rgb = RGB(channels[0], channels[1], channels[2]);
    out.format = ColorFormat::Rgb;
    return Result::ok();
}

Result parse_hsl_function(const std::string& inner, ParsedColor& out) {
    std::vector<std::string> parts;
    std::string alpha_token;
    if (!split_arguments(inner, parts, alpha_token)) {
        return Result::fail(ErrorCode::INVALID_FORMAT, "hsl() expects hue, saturation and lightness");
    }

    Component h, s, l;
    if (!parse_component(parts[0], h, true) || h.percent) {
        return Result::fail(ErrorCode::INVALID_FORMAT, "invalid hue: " + parts[0]);
    }
    if (!parse_component(parts[1], s)) {
        return Result::fail(ErrorCode::INVALID_FORMAT, "invalid saturation: " + parts[1]);
    }
    if (!parse_component(parts[2], l)) {
        return Result::fail(ErrorCode::INVALID_FORMAT, "invalid lightness: " + parts[2]);
    }
    if (s.value < 0.0 || s.value > 100.0) {
        return Result::fail(ErrorCode::INVALID_ARGUMENT, "saturation out of range: " + parts[1]);
    }
    if (l.value < 0.0 || l.value > 100.0) {
        return Result::fail(ErrorCode::INVALID_ARGUMENT, "lightness out of range: " + parts[2]);
    }

    Result ar = parse_alpha(alpha_token, out.alpha);
    if (ar.failure()) return ar;

    HSL hsl;
    hsl.h = std::fmod(h.value, 360.0);
    if (hsl.h < 0.0) hsl.h += 360.0;
    hsl.s = s.value;
    hsl.l = l.value;

    out.rgb = hsl_to_rgb(hsl);
    out.format = ColorFormat::Hsl;
    return Result::ok();
}

double hue_to_channel(double p, double q, double t) {
    if (t < 0.0) t += 1.0;
    if (t > 1.0) t -= 1.0;
    if (t < 1.0 / 6.0) return p + (q - p) * 6.0 * t;
    if (t < 1.0 / 2.0) return q;
    if (t < 2.0 / 3.0) return p + (q - p) * (2.0 / 3.0 - t) * 6.0;
    return p;
}

uint8_t to_byte(double v) {
    return static_cast<uint8_t>(std::clamp(std::round(v * 255.0), 0.0, 255.0));
}

}

Result parse_color(const std::string& text, ParsedColor& out) {
    std::string s = trim_lower(text);
    if (s.empty()) {
        return Result::fail(ErrorCode::INVALID_FORMAT, "empty colour");
    }

    if (s[0] == '#') {
        return parse_hex(s.substr(1), out);
    }

    size_t open = s.find('(');
    if (open != std::string::npos) {
        if (s.back() != ')') {
            return Result::fail(ErrorCode::INVALID_FORMAT, "missing closing parenthesis: " + text);
        }
        std::string func = trim_lower(s.substr(0, open));
        std::string inner = s.substr(open + 1, s.size() - open - 2);

        if (func == "rgb" || func == "rgba") {
            return parse_rgb_function(inner, out);
        }
        if (func == "hsl" || func == "hsla") {
            return parse_hsl_function(inner, out);
        }
        return Result::fail(ErrorCode::INVALID_FORMAT, "unsupported colour function: " + func);
    }

    if (s == "transparent") {
        out.rgb = RGB(0, 0, 0);
        out.alpha = 0.0;
        out.format = ColorFormat::Named;
        return Result::ok();
    }

    RGB named;
    if (lookup_named_color(s, named)) {
        out.rgb = named;
        out.alpha = 1.0;
        out.format = ColorFormat::Named;
        return Result::ok();
    }

    // bare hex digits without the leading '#'
    if ((s.size() == 3 || s.size() == 6) && all_hex(s)) {
        return parse_hex(s, out);
    }

    return Result::fail(ErrorCode::INVALID_FORMAT, "unrecognised colour: " + text);
}

RGB composite(const RGB& fg, double alpha, const RGB& bg) {
    double a = std::clamp(alpha, 0.0, 1.0);
    auto blend = [a](uint8_t f, uint8_t b) {
        return static_cast<uint8_t>(std::clamp(std::round(f * a + b * (1.0 - a)), 0.0, 255.0));
    };
    return RGB(blend(fg.r, bg.r), blend(fg.g, bg.g), blend(fg.b, bg.b));
}

Result resolve_pair(const std::string& text, const std::string& background,
                    ParsedColor& text_out, ParsedColor& background_out) {
    Result r = parse_color(text, text_out);
    if (r.failure()) {
        return Result::fail(r.error, "text colour: " + r.message);
    }
    r = parse_color(background, background_out);
    if (r.failure()) {
        return Result::fail(r.error, "background colour: " + r.message);
    }

    if (!background_out.opaque()) {
        background_out.rgb = composite(background_out.rgb, background_out.alpha, RGB(255, 255, 255));
        background_out.alpha = 1.0;
    }
    if (!text_out.opaque()) {
        text_out.rgb = composite(text_out.rgb, text_out.alpha, background_out.rgb);
        text_out.alpha = 1.0;
    }
    return Result::ok();
}

HSL rgb_to_hsl(const RGB& rgb) {
    double r = rgb.r / 255.0;
    double g = rgb.g / 255.0;
    double b = rgb.b / 255.0;

    double mx = std::max({r, g, b});
    double mn = std::min({r, g, b});
    double l = (mx + mn) / 2.0;

    HSL out;
    out.l = l * 100.0;
    if (mx == mn) {
        return out;
    }

    double d = mx - mn;
    double s = l > 0.5 ? d / (2.0 - mx - mn) : d / (mx + mn);
    double h;
    if (mx == r) {
        h = (g - b) / d + (g < b ? 6.0 : 0.0);
    } else if (mx == g) {
        h = (b - r) / d + 2.0;
    } else {
        h = (r - g) / d + 4.0;
    }

    out.h = h * 60.0;
    out.s = s * 100.0;
    return out;
}

RGB hsl_to_rgb(const HSL& hsl) {
    double h = hsl.h / 360.0;
    double s = hsl.s / 100.0;
    double l = hsl.l / 100.0;

    if (s == 0.0) {
        uint8_t v = to_byte(l);
        return RGB(v, v, v);
    }

    double q = l < 0.5 ? l * (1.0 + s) : l + s - l * s;
    double p = 2.0 * l - q;
    return RGB(to_byte(hue_to_channel(p, q, h + 1.0 / 3.0)),
               to_byte(hue_to_channel(p, q, h)),
               to_byte(hue_to_channel(p, q, h - 1.0 / 3.0)));
}

std::string to_hex(const RGB& rgb) {
    char buf[8];
    std::snprintf(buf, sizeof(buf), "#%02x%02x%02x", rgb.r, rgb.g, rgb.b);
    return buf;
}

namespace {

constexpr int kMaxHslDecimals = 3;

// Shortest hsl() text that parses back to exactly rgb. Whole-number components
// can be off by a unit per channel.
std::string to_hsl_string(const RGB& rgb) {
    HSL hsl = rgb_to_hsl(rgb);
    char buf[64];
    for (int decimals = 0; decimals <= kMaxHslDecimals; ++decimals) {
        double step = std::pow(10.0, decimals);
        double h = std::round(hsl.h * step) / step;
        if (h >= 360.0) h -= 360.0;
        std::snprintf(buf, sizeof(buf), "hsl(%.*f, %.*f%%, %.*f%%)",
                      decimals, h, decimals, hsl.s, decimals, hsl.l);

        ParsedColor check;
        if (parse_color(buf, check).success() && check.rgb == rgb) {
            return buf;
        }
    }
    return buf;
}

}

std::string format_color(const RGB& rgb, ColorFormat format) {
    char buf[48];
    switch (format) {
        case ColorFormat::Hex:
            return to_hex(rgb);
        case ColorFormat::Hsl:
            return to_hsl_string(rgb);
        case ColorFormat::Rgb:
        case ColorFormat::Named:
            std::snprintf(buf, sizeof(buf), "rgb(%d, %d, %d)", rgb.r, rgb.g, rgb.b);
            return buf;
    }
    return to_hex(rgb);
}

const char* format_name(ColorFormat format) {
    switch (format) {
        case ColorFormat::Hex: return "hex";
        case ColorFormat::Rgb: return "rgb";
        case ColorFormat::Hsl: return "hsl";
        case ColorFormat::Named: return "named";
    }
    return "hex";
}

bool parse_format(const std::string& name, ColorFormat& out) {
    std::string s = trim_lower(name);
    if (s == "hex") { out = ColorFormat::Hex; return true; }
    if (s == "rgb") { out = ColorFormat::Rgb; return true; }
    if (s == "hsl") { out = ColorFormat::Hsl; return true; }
    return false;
}

}
