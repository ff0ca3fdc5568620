#pragma once

#include "core/types.hpp"
#include "core/optimizer.hpp"
#include <string>
#include <optional>

namespace ctune {

constexpr int CONFIG_VERSION = 1;

struct ConfigTuning {
    Mode mode = Mode::Default;
    bool large_text = false;
    bool premium = false;
};

struct ConfigOutput {
    std::string format = "auto";
    std::string color = "auto";
    bool preview = true;
    bool details = false;
};

struct Config {
    int version = CONFIG_VERSION;
    ConfigTuning tuning;
    Optimizer::Config optimizer;
    ModePolicies modes;
    ConfigOutput output;

    std::string config_path;

    bool validate(std::string& error) const;

    static Config defaults();
    static std::optional<Config> parse(const std::string& content);
    static std::optional<Config> load(const std::string& path);
    static std::optional<Config> load_default();
    static std::string default_config_path();
    static std::string default_config_dir();
};

Config apply_cli_overrides(Config config, const struct Args& args);

}
