#pragma once

#include "core/types.hpp"
#include "core/tuner.hpp"
#include "parse/color_parser.hpp"
#include <string>
#include <vector>

namespace ctune {

struct BatchItem {
    std::string text;
    std::string background;
    bool large_text = false;
    int line = 0;  // source line when read from a file, 0 otherwise
};

struct BatchResult {
    Result status;
    std::string tuned;        // tuned colour in the input's notation
    std::string readability;  // "very readable", "readable" or "not readable"
    ColorFormat format = ColorFormat::Hex;
    RGB background;  // resolved, opaque
    TuneResult tune;
};

// Tunes every item independently; output order matches input order and a bad
// item only fails its own entry. An item's large_text is OR-ed with the options.
std::vector<BatchResult> tune_batch(const std::vector<BatchItem>& items,
                                    const TuneOptions& options,
                                    const Tuner& tuner);

// One pair per line: "text ; background [; large]". Blank lines are skipped, as
// are comment lines: those starting with '#' that contain no ';'.
Result read_batch_file(const std::string& path, std::vector<BatchItem>& items);
Result parse_batch_line(const std::string& line, BatchItem& item, bool& skipped);

}
