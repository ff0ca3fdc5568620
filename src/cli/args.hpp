#pragma once

#include "core/types.hpp"
#include <string>

namespace ctune {

struct Args {
    std::string text;
    std::string background;
    std::string batch_path;
    std::string config_path;

    Mode mode = Mode::Default;
    bool mode_set = false;
    bool large_text = false;
    bool large_text_set = false;
    bool premium = false;
    bool premium_set = false;

    std::string format;  // empty keeps the config value
    std::string color;
    bool details = false;
    bool no_preview = false;

    bool show_help = false;
    std::string error;  // set when the command line is unusable
};

Args parse_args(int argc, char* argv[]);
void print_help(const char* prog);

}
