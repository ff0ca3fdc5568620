#include "core/config.hpp"
#include "cli/args.hpp"
#include <toml++/toml.hpp>

#include <filesystem>
#include <cstdlib>

#ifdef _WIN32
    #include <windows.h>
    #include <shlobj.h>
#else
    #include <unistd.h>
    #include <pwd.h>
#endif

namespace ctune {

namespace {

// Per-user configuration root: %APPDATA%, ~/Library/Application Support, or
// $XDG_CONFIG_HOME falling back to ~/.config.
std::string user_config_root() {
#ifdef _WIN32
    if (const char* appdata = std::getenv("APPDATA")) {
        return appdata;
    }
    char profile[MAX_PATH];
    if (SUCCEEDED(SHGetFolderPathA(nullptr, CSIDL_PROFILE, nullptr, 0, profile))) {
        return profile;
    }
    const char* userprofile = std::getenv("USERPROFILE");
    return userprofile ? userprofile : ".";
#else
    std::string home = ".";
    if (const char* env_home = std::getenv("HOME")) {
        home = env_home;
    } else if (const struct passwd* pw = getpwuid(getuid())) {
        home = pw->pw_dir;
    }
#ifdef __APPLE__
    return home + "/Library/Application Support";
#else
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && xdg[0] != '\0') {
        return xdg;
    }
    return home + "/.config";
#endif
#endif
}

bool read_budgets(toml::node_view<const toml::node> node, std::vector<double>& out) {
    const toml::array* arr = node.as_array();
    if (!arr) return false;

    std::vector<double> values;
    for (const toml::node& el : *arr) {
        auto v = el.value<double>();
        if (!v) return false;
        values.push_back(*v);
    }
    out = values;
    return true;
}

bool validate_ladder(const std::vector<double>& budgets, const char* name, std::string& error) {
    if (budgets.empty()) {
        error = std::string(name) + " must not be empty";
        return false;
    }
    double prev = 0.0;
    for (double b : budgets) {
        if (!(b > prev)) {
            error = std::string(name) + " must be positive and strictly ascending";
            return false;
        }
        prev = b;
    }
    if (budgets.size() > 8) {
        error = std::string(name) + " must have at most 8 entries";
        return false;
    }
    return true;
}

}

Config Config::defaults() {
    Config cfg;
    cfg.version = CONFIG_VERSION;
    return cfg;
}

std::string Config::default_config_dir() {
    return user_config_root() + "/ctune";
}

std::string Config::default_config_path() {
    return default_config_dir() + "/config.toml";
}

bool Config::validate(std::string& error) const {
    const Optimizer::Config& o = optimizer;
    if (o.binary_search_iterations < 1 || o.binary_search_iterations > 64) {
        error = "optimizer.binary_search_iterations must be between 1 and 64";
        return false;
    }
    if (o.gradient_max_iterations < 0 || o.gradient_max_iterations > 500) {
        error = "optimizer.gradient_max_iterations must be between 0 and 500";
        return false;
    }
    if (!(o.learning_rate > 0.0) || o.learning_rate > 1.0) {
        error = "optimizer.learning_rate must be in (0, 1]";
        return false;
    }
    if (!(o.min_learning_rate > 0.0) || o.min_learning_rate > o.learning_rate) {
        error = "optimizer.min_learning_rate must be in (0, learning_rate]";
        return false;
    }
    if (!(o.finite_difference_step > 0.0) || o.finite_difference_step > 0.1) {
        error = "optimizer.finite_difference_step must be in (0, 0.1]";
        return false;
    }
    if (o.chroma_max_multiple < 1.0 || o.chroma_max_multiple > 10.0) {
        error = "optimizer.chroma_max_multiple must be between 1.0 and 10.0";
        return false;
    }
    if (o.chroma_ceiling <= 0.0 || o.chroma_ceiling > 0.5) {
        error = "optimizer.chroma_ceiling must be in (0, 0.5]";
        return false;
    }
    if (o.contrast_weight < 0.0 || o.delta_e_weight < 0.0 || o.budget_penalty_weight < 0.0) {
        error = "optimizer weights must not be negative";
        return false;
    }

    if (!validate_ladder(modes.strict.budgets, "modes.strict.budgets", error)) return false;
    if (!validate_ladder(modes.relaxed.budgets, "modes.relaxed.budgets", error)) return false;
    if (!validate_ladder(modes.default_mode.step_budgets, "modes.default.step_budgets", error)) return false;

    const DefaultPolicy& d = modes.default_mode;
    if (!(d.step_limit > 0.0)) {
        error = "modes.default.step_limit must be positive";
        return false;
    }
    if (d.step_budgets.back() > d.step_limit) {
        error = "modes.default.step_budgets must not exceed step_limit";
        return false;
    }
    if (d.max_steps < 1 || d.max_steps > 32) {
        error = "modes.default.max_steps must be between 1 and 32";
        return false;
    }
    if (d.max_total_delta_e < d.step_limit) {
        error = "modes.default.max_total_delta_e must be at least step_limit";
        return false;
    }

    if (output.format != "auto" && output.format != "hex" && output.format != "rgb" && output.format != "hsl") {
        error = "output.format must be one of auto, hex, rgb, hsl";
        return false;
    }
    if (output.color != "auto" && output.color != "none" && output.color != "256" && output.color != "truecolor") {
        error = "output.color must be one of auto, none, 256, truecolor";
        return false;
    }
    return true;
}

namespace {

std::optional<Config> config_from_table(const toml::table& tbl) {
    Config cfg = Config::defaults();

    if (auto v = tbl["config_version"].value<int>()) {
        if (*v != CONFIG_VERSION) {
            return std::nullopt;
        }
    }

    if (auto tuning = tbl["tuning"]) {
        if (auto v = tuning["mode"].value<std::string>()) {
            if (!parse_mode(*v, cfg.tuning.mode)) return std::nullopt;
        }
        if (auto v = tuning["large_text"].value<bool>()) cfg.tuning.large_text = *v;
        if (auto v = tuning["premium"].value<bool>()) cfg.tuning.premium = *v;
    }

    if (auto opt = tbl["optimizer"]) {
        Optimizer::Config& o = cfg.optimizer;
        if (auto v = opt["binary_search_iterations"].value<int>()) o.binary_search_iterations = *v;
        if (auto v = opt["gradient_max_iterations"].value<int>()) o.gradient_max_iterations = *v;
        if (auto v = opt["learning_rate"].value<double>()) o.learning_rate = *v;
        if (auto v = opt["min_learning_rate"].value<double>()) o.min_learning_rate = *v;
        if (auto v = opt["finite_difference_step"].value<double>()) o.finite_difference_step = *v;
        if (auto v = opt["chroma_max_multiple"].value<double>()) o.chroma_max_multiple = *v;
        if (auto v = opt["chroma_ceiling"].value<double>()) o.chroma_ceiling = *v;
        if (auto v = opt["contrast_weight"].value<double>()) o.contrast_weight = *v;
        if (auto v = opt["delta_e_weight"].value<double>()) o.delta_e_weight = *v;
        if (auto v = opt["budget_penalty_weight"].value<double>()) o.budget_penalty_weight = *v;
    }

    if (auto modes = tbl["modes"]) {
        if (auto strict = modes["strict"]) {
            if (strict["budgets"] && !read_budgets(strict["budgets"], cfg.modes.strict.budgets)) {
                return std::nullopt;
            }
        }
        if (auto def = modes["default"]) {
            DefaultPolicy& d = cfg.modes.default_mode;
            if (def["step_budgets"] && !read_budgets(def["step_budgets"], d.step_budgets)) {
                return std::nullopt;
            }
            if (auto v = def["step_limit"].value<double>()) d.step_limit = *v;
            if (auto v = def["max_steps"].value<int>()) d.max_steps = *v;
            if (auto v = def["max_total_delta_e"].value<double>()) d.max_total_delta_e = *v;
        }
        if (auto relaxed = modes["relaxed"]) {
            if (relaxed["budgets"] && !read_budgets(relaxed["budgets"], cfg.modes.relaxed.budgets)) {
                return std::nullopt;
            }
        }
    }

    if (auto output = tbl["output"]) {
        if (auto v = output["format"].value<std::string>()) cfg.output.format = *v;
        if (auto v = output["color"].value<std::string>()) cfg.output.color = *v;
        if (auto v = output["preview"].value<bool>()) cfg.output.preview = *v;
        if (auto v = output["details"].value<bool>()) cfg.output.details = *v;
    }

    std::string error;
    if (!cfg.validate(error)) {
        return std::nullopt;
    }

    return cfg;
}

}

std::optional<Config> Config::parse(const std::string& content) {
    try {
        toml::table tbl = toml::parse(content);
        return config_from_table(tbl);
    } catch (const toml::parse_error&) {
        return std::nullopt;
    }
}

std::optional<Config> Config::load(const std::string& path) {
    std::error_code ec;
    if (!std::filesystem::exists(std::filesystem::path(path), ec) || ec) {
        return std::nullopt;
    }

    try {
        toml::table tbl = toml::parse_file(path);
        auto cfg = config_from_table(tbl);
        if (cfg) cfg->config_path = path;
        return cfg;
    } catch (const toml::parse_error&) {
        return std::nullopt;
    }
}

std::optional<Config> Config::load_default() {
    return load(default_config_path());
}

Config apply_cli_overrides(Config config, const Args& args) {
    if (args.mode_set) config.tuning.mode = args.mode;
    if (args.large_text_set) config.tuning.large_text = args.large_text;
    if (args.premium_set) config.tuning.premium = args.premium;
    if (!args.format.empty()) config.output.format = args.format;
    if (!args.color.empty()) config.output.color = args.color;
    if (args.no_preview) config.output.preview = false;
    if (args.details) config.output.details = true;
    if (!args.config_path.empty()) config.config_path = args.config_path;
    return config;
}

}
