#include <iostream>
#include <cassert>
#include <filesystem>
#include <fstream>
#include <cmath>
#include <random>
#include <vector>
#include <string>

#include "../src/core/types.hpp"
#include "../src/core/contrast.hpp"
#include "../src/core/delta_e.hpp"
#include "../src/core/optimizer.hpp"
#include "../src/core/tuner.hpp"
#include "../src/core/batch.hpp"
#include "../src/core/config.hpp"
#include "../src/parse/color_parser.hpp"
#include "../src/cli/args.hpp"
#include "../src/render/preview.hpp"

using namespace ctune;

#define TEST(name) static void test_##name()
#define RUN_TEST(name) do { \
    std::cout << "Running " #name "... "; \
    try { \
        test_##name(); \
        std::cout << "PASSED\n"; \
    } catch (const std::exception& e) { \
        std::cout << "FAILED: " << e.what() << "\n"; \
        failures++; \
    } catch (...) { \
        std::cout << "FAILED: unknown exception\n"; \
        failures++; \
    } \
} while(0)

int failures = 0;

namespace {

TuneOptions with_mode(Mode mode, bool large = false, bool premium = false) {
    TuneOptions o;
    o.mode = mode;
    o.large_text = large;
    o.premium = premium;
    return o;
}

std::vector<std::pair<RGB, RGB>> sample_pairs(int count, unsigned seed) {
    std::mt19937 rng(seed);
    std::uniform_int_distribution<int> channel(0, 255);
    std::vector<std::pair<RGB, RGB>> pairs;
    for (int i = 0; i < count; ++i) {
        RGB text(static_cast<uint8_t>(channel(rng)), static_cast<uint8_t>(channel(rng)),
                 static_cast<uint8_t>(channel(rng)));
        RGB bg(static_cast<uint8_t>(channel(rng)), static_cast<uint8_t>(channel(rng)),
               static_cast<uint8_t>(channel(rng)));
        pairs.emplace_back(text, bg);
    }
    return pairs;
}

Args parse(std::vector<std::string> argv_strings) {
    std::vector<char*> argv;
    for (std::string& s : argv_strings) argv.push_back(&s[0]);
    return parse_args(static_cast<int>(argv.size()), argv.data());
}

std::string write_temp(const std::string& name, const std::string& content) {
    std::filesystem::path path = std::filesystem::temp_directory_path() / name;
    std::ofstream out(path);
    out << content;
    return path.string();
}

}

TEST(gray_on_white_default_mode) {
    const RGB gray(153, 153, 153);
    const RGB white(255, 255, 255);

    TuneResult r = tune(gray, white, with_mode(Mode::Default));
    assert(r.passes());
    assert(r.contrast >= 4.5);
    assert(r.status == TuneStatus::PassesStandard || r.status == TuneStatus::PassesHigh);
    assert(relative_luminance(r.rgb) < relative_luminance(gray));
    assert(r.improvement_percentage > 0.0);

    // Every accepted correction stays small relative to where it started.
    assert(!r.path.empty());
    for (const Candidate& step : r.path) {
        assert(step.step_delta_e <= 3.0 + 1e-9);
    }
    assert(r.path.back().rgb == r.rgb);
    assert(r.delta_e <= Tuner().optimizer().policies().max_delta_e(Mode::Default) + 1e-9);
}

TEST(black_on_white_already_passes) {
    TuneResult r = tune(RGB(0, 0, 0), RGB(255, 255, 255), with_mode(Mode::Strict));
    assert(r.status == TuneStatus::AlreadyPasses);
    assert(r.rgb == RGB(0, 0, 0));
    assert(r.delta_e == 0.0);
    assert(std::abs(r.contrast - 21.0) < 1e-9);
    assert(r.readability == Readability::VeryReadable);
    assert(!r.changed());

    TuneResult premium = tune(RGB(0, 0, 0), RGB(255, 255, 255), with_mode(Mode::Default, false, true));
    assert(premium.status == TuneStatus::AlreadyPasses);
}

TEST(white_on_white_strict_fails) {
    TuneResult r = tune(RGB(255, 255, 255), RGB(255, 255, 255), with_mode(Mode::Strict));
    assert(r.status == TuneStatus::Failed);
    assert(!r.passes());
    assert(r.contrast < 4.5);
    assert(r.delta_e <= 5.0 + 1e-9);
    assert(!r.reason.empty());
    assert(r.reason.find("strict") != std::string::npos);
    assert(r.readability == Readability::NotReadable);
}

TEST(large_text_lower_target) {
    TuneResult r = tune(RGB(153, 153, 153), RGB(255, 255, 255), with_mode(Mode::Strict, true));
    assert(r.target == 3.0);
    assert(r.passes());
    assert(r.contrast >= 3.0);
    assert(r.delta_e <= 5.0 + 1e-9);
}

TEST(premium_targets_high_tier) {
    TuneResult r = tune(RGB(153, 153, 153), RGB(255, 255, 255), with_mode(Mode::Relaxed, false, true));
    assert(r.target == 7.0);
    if (r.passes()) {
        assert(r.contrast >= 7.0);
        assert(r.status == TuneStatus::PassesHigh);
    } else {
        assert(r.status == TuneStatus::Failed);
    }
}

TEST(light_text_on_dark_background_gets_lighter) {
    const RGB text(110, 110, 130);
    const RGB bg(20, 20, 30);
    TuneResult r = tune(text, bg, with_mode(Mode::Relaxed));
    assert(r.passes());
    assert(relative_luminance(r.rgb) > relative_luminance(text));
}

TEST(idempotence) {
    Tuner tuner;
    for (const auto& pair : sample_pairs(40, 2024)) {
        TuneResult first = tuner.tune(pair.first, pair.second, with_mode(Mode::Default));
        if (!first.passes()) continue;

        TuneResult second = tuner.tune(first.rgb, pair.second, with_mode(Mode::Default));
        assert(second.status == TuneStatus::AlreadyPasses);
        assert(second.rgb == first.rgb);
        assert(second.delta_e == 0.0);
    }
}

TEST(monotonic_mode_ordering) {
    Tuner tuner;
    for (const auto& pair : sample_pairs(60, 4242)) {
        bool strict = tuner.tune(pair.first, pair.second, with_mode(Mode::Strict)).passes();
        bool def = tuner.tune(pair.first, pair.second, with_mode(Mode::Default)).passes();
        bool relaxed = tuner.tune(pair.first, pair.second, with_mode(Mode::Relaxed)).passes();
        if (strict) assert(def);
        if (def) assert(relaxed);
    }
}

TEST(bounded_output) {
    Tuner tuner;
    const ModePolicies& policies = tuner.optimizer().policies();
    const Mode modes[] = {Mode::Strict, Mode::Default, Mode::Relaxed};

    for (const auto& pair : sample_pairs(40, 7)) {
        for (Mode mode : modes) {
            TuneResult r = tuner.tune(pair.first, pair.second, with_mode(mode));
            assert(r.delta_e <= policies.max_delta_e(mode) + 1e-9);
            assert(r.contrast >= 1.0 && r.contrast <= 21.0);
            if (r.passes()) {
                assert(r.contrast >= r.target);
                assert(std::abs(r.delta_e - difference(r.original, r.rgb)) < 1e-9);
            } else {
                assert(r.contrast >= r.initial_contrast);
            }
        }
    }
}

TEST(tune_normalized_validates_input) {
    Tuner tuner;
    TuneResult out;
    TuneOptions opts;

    Result r = tuner.tune_normalized(NormalizedRGB(std::nan(""), 0.0, 0.0),
                                     NormalizedRGB(1.0, 1.0, 1.0), opts, out);
    assert(r.error == ErrorCode::INVALID_ARGUMENT);

    r = tuner.tune_normalized(NormalizedRGB(0.2, 0.2, 0.2), NormalizedRGB(1.5, 1.0, 1.0), opts, out);
    assert(r.error == ErrorCode::INVALID_ARGUMENT);
    assert(r.message.find("background") != std::string::npos);

    r = tuner.tune_normalized(NormalizedRGB(0.0, 0.0, 0.0), NormalizedRGB(1.0, 1.0, 1.0), opts, out);
    assert(r.success());
    assert(out.status == TuneStatus::AlreadyPasses);
}

TEST(custom_policies_respected) {
    Optimizer::Config cfg;
    ModePolicies policies;
    policies.strict.budgets = {0.5, 1.0};
    Tuner tuner(cfg, policies);

    TuneResult r = tuner.tune(RGB(153, 153, 153), RGB(255, 255, 255), with_mode(Mode::Strict));
    assert(r.status == TuneStatus::Failed);
    assert(r.delta_e <= 1.0 + 1e-9);
}

TEST(batch_preserves_order_and_format) {
    std::vector<BatchItem> items(4);
    items[0].text = "#999999";
    items[0].background = "#ffffff";
    items[1].text = "rgb(153, 153, 153)";
    items[1].background = "white";
    items[2].text = "not-a-colour";
    items[2].background = "white";
    items[3].text = "hsl(0, 0%, 60%)";
    items[3].background = "#fff";

    std::vector<BatchResult> results = tune_batch(items, with_mode(Mode::Default), Tuner());
    assert(results.size() == 4);

    assert(results[0].status.success());
    assert(results[0].tuned[0] == '#' && results[0].tuned.size() == 7);
    assert(results[0].format == ColorFormat::Hex);

    assert(results[1].status.success());
    assert(results[1].tuned.rfind("rgb(", 0) == 0);

    assert(results[2].status.failure());
    assert(results[2].status.message.find("text") != std::string::npos);
    assert(results[2].readability == "not readable");

    assert(results[3].status.success());
    assert(results[3].tuned.rfind("hsl(", 0) == 0);

    // Same colour in three notations tunes to the same value.
    assert(results[0].tune.rgb == results[1].tune.rgb);
    assert(results[0].tune.rgb == results[3].tune.rgb);
    assert(results[0].readability == "readable" || results[0].readability == "very readable");
}

TEST(tuned_hsl_output_keeps_target) {
    Tuner tuner;
    int tuned = 0;
    for (const auto& pair : sample_pairs(400, 2024)) {
        TuneResult r = tuner.tune(pair.first, pair.second, with_mode(Mode::Default));
        if (!r.passes() || r.status == TuneStatus::AlreadyPasses) continue;
        ++tuned;

        std::string text = format_color(r.rgb, ColorFormat::Hsl);
        ParsedColor written;
        assert(parse_color(text, written).success());
        assert(written.rgb == r.rgb);
        assert(contrast_ratio(written.rgb, pair.second) >= r.target);
    }
    assert(tuned > 0);

    std::vector<BatchItem> items(1);
    items[0].text = "hsl(212, 80%, 50%)";
    items[0].background = "hsl(0, 0%, 100%)";
    std::vector<BatchResult> results = tune_batch(items, with_mode(Mode::Default), tuner);
    assert(results[0].status.success());
    assert(results[0].tune.status == TuneStatus::PassesStandard);
    ParsedColor reparsed;
    assert(parse_color(results[0].tuned, reparsed).success());
    assert(reparsed.rgb == results[0].tune.rgb);
    assert(contrast_ratio(reparsed.rgb, results[0].background) >= results[0].tune.target);
}

TEST(batch_item_large_flag) {
    std::vector<BatchItem> items(2);
    items[0].text = "#999";
    items[0].background = "#fff";
    items[1] = items[0];
    items[1].large_text = true;

    std::vector<BatchResult> results = tune_batch(items, with_mode(Mode::Strict), Tuner());
    assert(results[0].tune.target == 4.5);
    assert(results[1].tune.target == 3.0);
}

TEST(batch_file_reading) {
    std::string path = write_temp("ctune_batch_test.txt",
        "# palette check\n"
        "\n"
        "#999999 ; #ffffff\n"
        "  rgb(10, 10, 10);white;large  \n"
        "#777;#fff;normal\n");

    std::vector<BatchItem> items;
    Result r = read_batch_file(path, items);
    assert(r.success());
    assert(items.size() == 3);
    assert(items[0].text == "#999999" && items[0].background == "#ffffff");
    assert(items[0].line == 3);
    assert(items[1].text == "rgb(10, 10, 10)" && items[1].large_text);
    assert(!items[2].large_text);

    std::string bad = write_temp("ctune_batch_bad.txt", "#000 ; #fff\n#000 ; #fff ; huge\n");
    r = read_batch_file(bad, items);
    assert(r.error == ErrorCode::INVALID_FORMAT);
    assert(r.message.find(":2:") != std::string::npos);

    r = read_batch_file("/nonexistent/ctune/batch.txt", items);
    assert(r.error == ErrorCode::FILE_NOT_FOUND);

    std::filesystem::remove(path);
    std::filesystem::remove(bad);
}

TEST(config_file_loading) {
    assert(!Config::load("/nonexistent/ctune/config.toml").has_value());

    std::string path = write_temp("ctune_config_test.toml",
        "[tuning]\nmode = \"strict\"\npremium = true\n\n[output]\ncolor = \"none\"\n");
    auto cfg = Config::load(path);
    assert(cfg.has_value());
    assert(cfg->tuning.mode == Mode::Strict);
    assert(cfg->tuning.premium);
    assert(cfg->output.color == "none");
    assert(cfg->config_path == path);

    std::string broken = write_temp("ctune_config_broken.toml", "[tuning\nmode = strict\n");
    assert(!Config::load(broken).has_value());

    std::filesystem::remove(path);
    std::filesystem::remove(broken);
}

TEST(args_single_pair) {
    Args a = parse({"ctune", "--mode", "strict", "--large", "-d", "#777", "white"});
    assert(a.error.empty());
    assert(a.mode_set && a.mode == Mode::Strict);
    assert(a.large_text && a.details);
    assert(a.text == "#777" && a.background == "white");

    Args help = parse({"ctune", "--help"});
    assert(help.show_help);
}

TEST(args_errors) {
    assert(!parse({"ctune", "#777"}).error.empty());
    assert(!parse({"ctune", "#777", "white", "black"}).error.empty());
    assert(!parse({"ctune", "--mode", "loose", "#777", "white"}).error.empty());
    assert(!parse({"ctune", "--frobnicate", "#777", "white"}).error.empty());
    assert(!parse({"ctune", "--format", "cmyk", "#777", "white"}).error.empty());
    assert(!parse({"ctune", "--batch", "pairs.txt", "#777"}).error.empty());
    assert(!parse({"ctune", "#777", "white", "--config"}).error.empty());

    Args batch = parse({"ctune", "--batch", "pairs.txt", "--no-preview"});
    assert(batch.error.empty());
    assert(batch.batch_path == "pairs.txt" && batch.no_preview);
}

TEST(cli_overrides_config) {
    Config cfg = Config::defaults();
    cfg.output.format = "rgb";

    Args a = parse({"ctune", "--mode", "relaxed", "--premium", "--color", "none", "--no-preview",
                    "#777", "white"});
    Config merged = apply_cli_overrides(cfg, a);
    assert(merged.tuning.mode == Mode::Relaxed);
    assert(merged.tuning.premium);
    assert(merged.output.color == "none");
    assert(!merged.output.preview);
    assert(merged.output.format == "rgb");

    Args plain = parse({"ctune", "#777", "white"});
    Config kept = apply_cli_overrides(merged, plain);
    assert(kept.tuning.mode == Mode::Relaxed);
    assert(kept.tuning.premium);
}

TEST(cli_flags_clear_config_switches) {
    Config cfg = Config::defaults();
    cfg.tuning.large_text = true;
    cfg.tuning.premium = true;

    Args a = parse({"ctune", "--normal", "--standard", "#777", "white"});
    assert(a.error.empty());
    assert(a.large_text_set && !a.large_text);
    assert(a.premium_set && !a.premium);

    Config merged = apply_cli_overrides(cfg, a);
    assert(!merged.tuning.large_text);
    assert(!merged.tuning.premium);

    // Last flag wins.
    Args flipped = parse({"ctune", "--normal", "--large", "#777", "white"});
    assert(apply_cli_overrides(Config::defaults(), flipped).tuning.large_text);
}

TEST(preview_rendering) {
    TuneResult r = tune(RGB(153, 153, 153), RGB(255, 255, 255), with_mode(Mode::Default));

    PreviewPanel before;
    before.text = r.original;
    before.label = "#999999";
    before.readability = Readability::NotReadable;

    PreviewPanel after;
    after.text = r.rgb;
    after.label = "#757575";
    after.readability = r.readability;

    std::string plain = render_preview(before, after, RGB(255, 255, 255), ColorMode::None);
    assert(plain.find("Before") != std::string::npos);
    assert(plain.find("After") != std::string::npos);
    assert(plain.find("[ Not Readable ]") != std::string::npos);
    assert(plain.find("Sample Text") != std::string::npos);
    assert(plain.find('\033') == std::string::npos);

    std::string colored = render_preview(before, after, RGB(255, 255, 255), ColorMode::Truecolor);
    assert(colored.find("\033[48;2;255;255;255m") != std::string::npos);

    std::string details = render_details(r, "#999999", "#757575", Mode::Default);
    assert(details.find("delta E") != std::string::npos);
    assert(details.find("steps:") != std::string::npos);
}

int main() {
    std::cout << "=== Contrast Tuner Integration Tests ===\n\n";

    std::cout << "--- Scenario Tests ---\n";
    RUN_TEST(gray_on_white_default_mode);
    RUN_TEST(black_on_white_already_passes);
    RUN_TEST(white_on_white_strict_fails);
    RUN_TEST(large_text_lower_target);
    RUN_TEST(premium_targets_high_tier);
    RUN_TEST(light_text_on_dark_background_gets_lighter);

    std::cout << "\n--- Property Tests ---\n";
    RUN_TEST(idempotence);
    RUN_TEST(monotonic_mode_ordering);
    RUN_TEST(bounded_output);
    RUN_TEST(tune_normalized_validates_input);
    RUN_TEST(custom_policies_respected);

    std::cout << "\n--- Batch Tests ---\n";
    RUN_TEST(batch_preserves_order_and_format);
    RUN_TEST(tuned_hsl_output_keeps_target);
    RUN_TEST(batch_item_large_flag);
    RUN_TEST(batch_file_reading);

    std::cout << "\n--- Config and CLI Tests ---\n";
    RUN_TEST(config_file_loading);
    RUN_TEST(args_single_pair);
    RUN_TEST(args_errors);
    RUN_TEST(cli_overrides_config);
    RUN_TEST(cli_flags_clear_config_switches);
    RUN_TEST(preview_rendering);

    std::cout << "\n=== Test Summary ===\n";
    std::cout << "Failures: " << failures << "\n";

    if (failures == 0) {
        std::cout << "\n✓ All tests passed!\n";
        return 0;
    }
    std::cout << "\n✗ Some tests failed!\n";
    return 1;
}
