#include "config.hpp"
#include "constants.hpp"
#include <platform/platform.hpp>
#include <util/string_utils.hpp>
#include <yaml-cpp/yaml.h>
#include <fstream>
#include <iterator>
#include <stdexcept>

namespace fs = std::filesystem;

// yaml-cpp turns `key:` with no value into the string "null"; treat it as unset.
static std::string scalar_or(const YAML::Node& node, const char* key, const std::string& fallback) {
    if (!node || node.IsNull()) return fallback;
    if (!node.IsScalar()) {
        throw std::runtime_error(std::string("'") + key + "' must be a single value");
    }
    std::string value = StringUtils::trim(node.as<std::string>());
    return value.empty() ? fallback : value;
}

// `domains` may be a list, or one comma separated string.
static std::vector<std::string> parse_domains(const YAML::Node& node) {
    std::vector<std::string> domains;
    if (!node || node.IsNull()) return domains;

    if (node.IsSequence()) {
        for (const auto& d : node) {
            std::string domain = scalar_or(d, "domains", "");
            if (!domain.empty()) domains.push_back(domain);
        }
    } else if (node.IsScalar()) {
        for (const auto& part : StringUtils::split(node.as<std::string>(), ',')) {
            std::string domain = StringUtils::trim(part);
            if (!domain.empty()) domains.push_back(domain);
        }
    } else {
        throw std::runtime_error("'domains' must be a list of domain names");
    }

    // A leading dot would produce "host..example.com"
    for (auto& d : domains) {
        while (!d.empty() && d.front() == '.') d.erase(0, 1);
    }
    return domains;
}

static Settings parse_settings(const YAML::Node& root) {
    Settings s;
    // Ports are handed to ssh verbatim: `ssh_port: 2222` and `ssh_port: "2222"` are the same
    s.ssh_port = scalar_or(root["ssh_port"], "ssh_port", DEFAULT_SSH_PORT);
    s.tunnel_port = scalar_or(root["tunnel_port"], "tunnel_port", DEFAULT_TUNNEL_PORT);
    s.jump_host = scalar_or(root["jump_host"], "jump_host", "");
    s.domains = parse_domains(root["domains"]);
    if (root["sshpass"] && !root["sshpass"].IsNull()) {
        s.sshpass = root["sshpass"].as<bool>();     // throws on "maybe"
    }
    return s;
}

fs::path get_config_path() {
    if (auto env = platform::get_env(CONFIG_ENV)) {
        return fs::path(*env);
    }
    return platform::config_dir() / "ssm" / "config.yaml";
}

Result<void> create_default_config(const fs::path& path) {
    // Don't overwrite existing config
    if (fs::exists(path)) {
        return Result<void>::Ok();
    }

    const char* default_config = R"(# ssm configuration

# Port used when -p is not given
ssh_port: 22

# Jump host used by -j (may itself be a short name completed from `domains`)
jump_host: ""

# Suffixes appended to short host names, tried in order
domains: []
#  - corp.example.com
#  - lab.example.com

# Local SOCKS port opened by -t
tunnel_port: 1080

# Feed the password in $SSHPASS to ssh through `sshpass -e`
sshpass: false
)";

    try {
        if (path.has_parent_path()) {
            fs::create_directories(path.parent_path());
        }
        std::ofstream out(path);
        if (!out) {
            return Result<void>::Err("Failed to create config file at " + path.string());
        }
        out << default_config;
        out.close();
        return Result<void>::Ok();
    } catch (const std::exception& e) {
        return Result<void>::Err("Failed to write config file: " + std::string(e.what()));
    }
}

Result<Config> Config::parse(const std::string& yaml) {
    try {
        YAML::Node root = YAML::Load(yaml);
        if (!root.IsNull() && !root.IsMap()) {
            return Result<Config>::Err("Failed to parse config: top level must be a mapping");
        }

        Config config;
        config.settings_ = parse_settings(root);
        return Result<Config>::Ok(config);
    } catch (const std::exception& e) {
        return Result<Config>::Err(std::string("Failed to parse config: ") + e.what());
    }
}

Result<Config> Config::load_file(const fs::path& path) {
    std::ifstream in(path);
    if (!in) {
        return Result<Config>::Err("Config not found at " + path.string());
    }
    std::string text((std::istreambuf_iterator<char>(in)),
                     std::istreambuf_iterator<char>());

    auto result = parse(text);
    if (result.is_ok()) {
        result.value.path_ = path;
    }
    return result;
}

Result<Config> Config::load(StatusCallback on_warning) {
    fs::path path = get_config_path();

    if (!fs::exists(path)) {
        // First run: leave a template behind and carry on with defaults
        auto created = create_default_config(path);
        if (created.is_err() && on_warning) {
            on_warning(created.error + "; using defaults");
        }
        Config config;
        config.path_ = path;
        return Result<Config>::Ok(config);
    }

    return load_file(path);
}
