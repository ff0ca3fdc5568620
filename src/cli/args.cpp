#include "args.hpp"
#include <cstring>
#include <cstdio>
#include <initializer_list>

namespace ctune {

static bool validate_path(const std::string& path) {
    if (path.empty()) return false;
    if (path.find('\0') != std::string::npos) return false;
    return true;
}

static bool one_of(const std::string& value, std::initializer_list<const char*> allowed) {
    for (const char* a : allowed) {
        if (value == a) return true;
    }
    return false;
}

Args parse_args(int argc, char* argv[]) {
    Args args;
    int positional = 0;

    auto take_value = [&](int& i, const char* flag, std::string& out) {
        if (i + 1 >= argc) {
            args.error = std::string("missing value for ") + flag;
            return false;
        }
        out = argv[++i];
        return true;
    };

    for (int i = 1; i < argc && args.error.empty(); ++i) {
        const char* arg = argv[i];

        if (strcmp(arg, "-h") == 0 || strcmp(arg, "--help") == 0) {
            args.show_help = true;
            return args;
        }

        if (strcmp(arg, "-m") == 0 || strcmp(arg, "--mode") == 0) {
            std::string value;
            if (!take_value(i, arg, value)) break;
            if (!parse_mode(value, args.mode)) {
                args.error = "unknown mode: " + value + " (expected strict, default or relaxed)";
                break;
            }
            args.mode_set = true;
        }
        else if (strcmp(arg, "--config") == 0) {
            if (!take_value(i, arg, args.config_path)) break;
            if (!validate_path(args.config_path)) {
                args.error = "invalid config path";
            }
        }
        else if (strcmp(arg, "-b") == 0 || strcmp(arg, "--batch") == 0) {
            if (!take_value(i, arg, args.batch_path)) break;
            if (!validate_path(args.batch_path)) {
                args.error = "invalid batch path";
            }
        }
        else if (strcmp(arg, "--format") == 0) {
            if (!take_value(i, arg, args.format)) break;
            if (!one_of(args.format, {"auto", "hex", "rgb", "hsl"})) {
                args.error = "unknown format: " + args.format;
            }
        }
        else if (strcmp(arg, "--color") == 0) {
            if (!take_value(i, arg, args.color)) break;
            if (!one_of(args.color, {"auto", "none", "256", "truecolor"})) {
                args.error = "unknown color mode: " + args.color;
            }
        }
        else if (strcmp(arg, "-l") == 0 || strcmp(arg, "--large") == 0) {
            args.large_text = true;
            args.large_text_set = true;
        }
        else if (strcmp(arg, "--normal") == 0) {
            args.large_text = false;
            args.large_text_set = true;
        }
        else if (strcmp(arg, "-p") == 0 || strcmp(arg, "--premium") == 0) {
            args.premium = true;
            args.premium_set = true;
        }
        else if (strcmp(arg, "--standard") == 0) {
            args.premium = false;
            args.premium_set = true;
        }
        else if (strcmp(arg, "-d") == 0 || strcmp(arg, "--details") == 0) {
            args.details = true;
        }
        else if (strcmp(arg, "--no-preview") == 0) {
            args.no_preview = true;
        }
        else if (arg[0] == '-' && arg[1] != '\0') {
            args.error = std::string("unknown option: ") + arg;
        }
        else {
            if (positional == 0) {
                args.text = arg;
            } else if (positional == 1) {
                args.background = arg;
            } else {
                args.error = std::string("unexpected argument: ") + arg;
            }
            ++positional;
        }
    }

    if (args.error.empty()) {
        if (!args.batch_path.empty() && positional > 0) {
            args.error = "--batch cannot be combined with a colour pair";
        } else if (args.batch_path.empty() && positional < 2) {
            args.error = "expected <TEXT> and <BACKGROUND> colours";
        }
    }

    return args;
}

void print_help(const char* prog) {
    printf("Usage: %s [OPTIONS] <TEXT> <BACKGROUND>\n", prog);
    printf("       %s [OPTIONS] --batch <FILE>\n\n", prog);
    printf("Adjusts TEXT until it meets WCAG contrast against BACKGROUND while staying\n");
    printf("as close as possible to the original colour.\n\n");
    printf("COLOURS:\n");
    printf("  #rgb, #rrggbb, #rrggbbaa, rgb(r, g, b), rgba(r, g, b, a), hsl(h, s%%, l%%),\n");
    printf("  hsla(...), or a CSS colour name. Quote values containing spaces.\n\n");
    printf("OPTIONS:\n");
    printf("  -m, --mode <MODE>       Tuning mode: strict, default, relaxed (default: default)\n");
    printf("  -l, --large             Large text (lower contrast target: 3.0 / 4.5)\n");
    printf("      --normal            Normal-size text (overrides large_text in the config)\n");
    printf("  -p, --premium           Aim for the enhanced target (7.0, or 4.5 for large text)\n");
    printf("      --standard          Aim for the standard target (overrides premium in the config)\n");
    printf("  -b, --batch <FILE>      Tune pairs from FILE, one 'text ; background [; large]' per line\n");
    printf("      --config <FILE>     Config file path (default: platform-specific)\n");
    printf("      --format <FMT>      Output notation: auto, hex, rgb, hsl (default: auto)\n");
    printf("      --color <MODE>      Preview colours: auto, none, 256, truecolor\n");
    printf("  -d, --details           Print contrast, delta E and the correction path\n");
    printf("      --no-preview        Do not print the before/after preview\n");
    printf("  -h, --help              Show this help\n");
    printf("\nEXIT STATUS:\n");
    printf("  0  every pair is readable after tuning\n");
    printf("  1  at least one pair could not be made readable\n");
    printf("  2  usage, input or config error\n");
    printf("\nCONFIG FILE:\n");
    printf("  Default locations:\n");
    printf("    Linux:   ~/.config/ctune/config.toml\n");
    printf("    macOS:   ~/Library/Application Support/ctune/config.toml\n");
    printf("    Windows: %%APPDATA%%\\ctune\\config.toml\n");
}

}
