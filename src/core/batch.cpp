#include "core/batch.hpp"
#include <cctype>
#include <fstream>

#ifdef CTUNE_HAS_OPENMP
#include <omp.h>
#endif

namespace ctune {

namespace {

std::string trim(const std::string& s) {
    size_t start = 0;
    size_t end = s.size();
    while (start < end && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

std::string lower(std::string s) {
    for (char& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

BatchResult tune_one(const BatchItem& item, const TuneOptions& options, const Tuner& tuner) {
    BatchResult out;

    ParsedColor text;
    ParsedColor background;
    out.status = resolve_pair(item.text, item.background, text, background);
    if (out.status.failure()) {
        out.readability = readability_name(Readability::NotReadable);
        return out;
    }

    TuneOptions item_options = options;
    item_options.large_text = options.large_text || item.large_text;

    out.format = text.format;
    out.background = background.rgb;
    out.tune = tuner.tune(text.rgb, background.rgb, item_options);
    out.tuned = format_color(out.tune.rgb, text.format);
    out.readability = readability_name(out.tune.readability);
    return out;
}

}

std::vector<BatchResult> tune_batch(const std::vector<BatchItem>& items,
                                    const TuneOptions& options,
                                    const Tuner& tuner) {
    std::vector<BatchResult> results(items.size());
    const int count = static_cast<int>(items.size());

#ifdef CTUNE_HAS_OPENMP
    #pragma omp parallel for schedule(dynamic)
#endif
    for (int i = 0; i < count; ++i) {
        results[i] = tune_one(items[i], options, tuner);
    }

    return results;
}

Result parse_batch_line(const std::string& line, BatchItem& item, bool& skipped) {
    skipped = false;
    std::string s = trim(line);
    if (s.empty() || (s[0] == '#' && s.find(';') == std::string::npos)) {
        skipped = true;
        return Result::ok();
    }

    std::vector<std::string> fields;
    size_t start = 0;
    while (true) {
        size_t sep = s.find(';', start);
        fields.push_back(trim(s.substr(start, sep == std::string::npos ? std::string::npos : sep - start)));
        if (sep == std::string::npos) break;
        start = sep + 1;
    }

    if (fields.size() < 2 || fields.size() > 3) {
        return Result::fail(ErrorCode::INVALID_FORMAT, "expected 'text ; background [; large]'");
    }
    if (fields[0].empty() || fields[1].empty()) {
        return Result::fail(ErrorCode::INVALID_FORMAT, "empty colour field");
    }

    item = BatchItem{};
    item.text = fields[0];
    item.background = fields[1];

    if (fields.size() == 3 && !fields[2].empty()) {
        std::string flag = lower(fields[2]);
        if (flag == "large" || flag == "true" || flag == "1") {
            item.large_text = true;
        } else if (flag == "normal" || flag == "false" || flag == "0") {
            item.large_text = false;
        } else {
            return Result::fail(ErrorCode::INVALID_FORMAT, "unknown text size: " + fields[2]);
        }
    }
    return Result::ok();
}

Result read_batch_file(const std::string& path, std::vector<BatchItem>& items) {
    std::ifstream in(path);
    if (!in) {
        return Result::fail(ErrorCode::FILE_NOT_FOUND, "cannot open batch file: " + path);
    }

    std::vector<BatchItem> parsed;
    std::string line;
    int line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        BatchItem item;
        bool skipped = false;
        Result r = parse_batch_line(line, item, skipped);
        if (r.failure()) {
            return Result::fail(r.error, path + ":" + std::to_string(line_no) + ": " + r.message);
        }
        if (skipped) continue;
        item.line = line_no;
        parsed.push_back(item);
    }

    items = std::move(parsed);
    return Result::ok();
}

}
