#pragma once

#include <string>
#include <optional>
#include <filesystem>

namespace platform {

// Returns the user's home directory (HOME, falling back to the passwd entry).
std::filesystem::path home_dir();

// Returns XDG_CONFIG_HOME, or ~/.config when it is unset or relative.
std::filesystem::path config_dir();

// Value of an environment variable, nullopt when unset.
std::optional<std::string> get_env(const std::string& name);

} // namespace platform
