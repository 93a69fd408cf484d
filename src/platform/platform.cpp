#include "platform.hpp"
#include <cstdlib>
#include <unistd.h>
#include <pwd.h>

namespace fs = std::filesystem;

namespace platform {

fs::path home_dir() {
    if (auto home = get_env("HOME"); home && !home->empty()) {
        return fs::path(*home);
    }
    if (const struct passwd* pw = getpwuid(getuid()); pw && pw->pw_dir) {
        return fs::path(pw->pw_dir);
    }
    return fs::temp_directory_path();
}

fs::path config_dir() {
    // XDG base directory rules: relative values are ignored
    auto xdg = get_env("XDG_CONFIG_HOME");
    if (xdg && !xdg->empty() && fs::path(*xdg).is_absolute()) {
        return fs::path(*xdg);
    }
    return home_dir() / ".config";
}

std::optional<std::string> get_env(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (!value) return std::nullopt;
    return std::string(value);
}

} // namespace platform
