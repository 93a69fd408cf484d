#pragma once

#include <string>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

class Config {
public:
    // Load from get_config_path(), writing the default file first if none exists.
    // If that file can't be written, `on_warning` hears why and the defaults are used.
    static Result<Config> load(StatusCallback on_warning = nullptr);

    // Load a specific file. Missing keys take their defaults.
    static Result<Config> load_file(const fs::path& path);

    // Parse YAML text directly (used by load_file)
    static Result<Config> parse(const std::string& yaml);

    const Settings& settings() const { return settings_; }
    const fs::path& path() const { return path_; }

public:
    Config() = default;

private:
    Settings settings_;
    fs::path path_;
};

// $SSM_CONFIG, else $XDG_CONFIG_HOME/ssm/config.yaml, else ~/.config/ssm/config.yaml
fs::path get_config_path();

// Write the commented default config to `path` unless it already exists
Result<void> create_default_config(const fs::path& path = get_config_path());
