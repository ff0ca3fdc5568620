#include "cli/args.hpp"
#include "core/batch.hpp"
#include "core/config.hpp"
#include "core/contrast.hpp"
#include "core/tuner.hpp"
#include "parse/color_parser.hpp"
#include "render/preview.hpp"
#include "terminal/terminal.hpp"

#include <filesystem>
#include <iostream>
#include <vector>

namespace {

constexpr int kExitPass = 0;
constexpr int kExitFail = 1;
constexpr int kExitUsage = 2;

bool file_exists(const std::string& path) {
    std::error_code ec;
    return std::filesystem::exists(std::filesystem::path(path), ec) && !ec;
}

void print_result(const ctune::BatchItem& item, const ctune::BatchResult& result,
                  const ctune::Config& config, ctune::ColorMode color_mode, bool batch) {
    ctune::ColorFormat format = result.format;
    if (config.output.format != "auto") {
        ctune::parse_format(config.output.format, format);
    }
    std::string tuned = ctune::format_color(result.tune.rgb, format);

    if (batch) {
        std::cout << item.text << " ; " << item.background << " -> " << tuned
                  << " (" << result.readability << ")\n";
    } else {
        std::cout << tuned << "  " << result.readability << "\n";
    }

    if (config.output.preview) {
        ctune::PreviewPanel before;
        before.text = result.tune.original;
        before.label = item.text;
        before.readability = ctune::readability_for(
            ctune::level_for(result.tune.initial_contrast, config.tuning.large_text || item.large_text));

        ctune::PreviewPanel after;
        after.text = result.tune.rgb;
        after.label = tuned;
        after.readability = result.tune.readability;

        std::cout << "\n" << ctune::render_preview(before, after, result.background, color_mode) << "\n";
    }

    if (config.output.details) {
        std::cout << ctune::render_details(result.tune, item.text, tuned, config.tuning.mode);
        if (batch) std::cout << "\n";
    }
}

}

int main(int argc, char* argv[]) {
    ctune::Args args = ctune::parse_args(argc, argv);

    if (args.show_help) {
        ctune::print_help(argv[0]);
        return kExitPass;
    }
    if (!args.error.empty()) {
        std::cerr << "Error: " << args.error << "\n";
        std::cerr << "Try '" << argv[0] << " --help' for more information.\n";
        return kExitUsage;
    }

    ctune::Config config = ctune::Config::defaults();
    if (!args.config_path.empty()) {
        auto loaded = ctune::Config::load(args.config_path);
        if (!loaded) {
            std::cerr << "Error: Failed to load config file: " << args.config_path << "\n";
            return kExitUsage;
        }
        config = *loaded;
    } else {
        if (auto loaded_default = ctune::Config::load_default()) {
            config = *loaded_default;
        } else if (file_exists(ctune::Config::default_config_path())) {
            std::cerr << "Warning: Ignoring invalid config file: "
                      << ctune::Config::default_config_path() << "\n";
        }
    }
    config = ctune::apply_cli_overrides(config, args);

    std::string config_error;
    if (!config.validate(config_error)) {
        std::cerr << "Error: Invalid config: " << config_error << "\n";
        return kExitUsage;
    }

    ctune::Terminal terminal;
    ctune::ColorMode color_mode = ctune::ColorMode::None;
    if (!ctune::resolve_color_mode(config.output.color, terminal.get_info().is_tty, color_mode)) {
        std::cerr << "Error: Unknown color mode: " << config.output.color << "\n";
        return kExitUsage;
    }

    std::vector<ctune::BatchItem> items;
    const bool batch = !args.batch_path.empty();
    if (batch) {
        ctune::Result r = ctune::read_batch_file(args.batch_path, items);
        if (r.failure()) {
            std::cerr << "Error: " << r.message << "\n";
            return kExitUsage;
        }
        if (items.empty()) {
            std::cerr << "Warning: No colour pairs in " << args.batch_path << "\n";
            return kExitPass;
        }
    } else {
        ctune::BatchItem item;
        item.text = args.text;
        item.background = args.background;
        items.push_back(item);
    }

    ctune::TuneOptions options;
    options.mode = config.tuning.mode;
    options.large_text = config.tuning.large_text;
    options.premium = config.tuning.premium;

    ctune::Tuner tuner(config.optimizer, config.modes);
    std::vector<ctune::BatchResult> results = ctune::tune_batch(items, options, tuner);

    int exit_code = kExitPass;
    for (size_t i = 0; i < results.size(); ++i) {
        const ctune::BatchItem& item = items[i];
        const ctune::BatchResult& result = results[i];

        if (result.status.failure()) {
            if (batch) {
                std::cerr << "Error: " << args.batch_path << ":" << item.line << ": "
                          << result.status.message << "\n";
            } else {
                std::cerr << "Error: " << result.status.message << "\n";
            }
            exit_code = kExitUsage;
            continue;
        }

        print_result(item, result, config, color_mode, batch);

        if (!result.tune.passes()) {
            std::cerr << "Warning: " << item.text << " on " << item.background
                      << " could not be made readable: " << result.tune.reason << "\n";
            if (exit_code == kExitPass) exit_code = kExitFail;
        }
    }

    return exit_code;
}
