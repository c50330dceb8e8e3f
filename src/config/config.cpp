#include "scfw/config.hpp"
#include "scfw/platform.hpp"
#include "scfw/text_utils.hpp"

#include <cmath>
#include <cstdlib>

#include <nlohmann/json.hpp>

namespace scfw {

namespace {

void apply_on_warning(FirewallConfig& config, const std::string& value, const std::string& source) {
    auto policy = parse_warning_policy(value);
    if (!policy) {
        config.warnings.push_back("ignoring invalid on-warning policy '" + value + "' from " +
                                  source + " (expected ALLOW or BLOCK)");
        return;
    }
    config.on_warning = policy;
}

void apply_timeout(FirewallConfig& config, const std::string& value, const std::string& source) {
    auto timeout = parse_timeout_seconds(value);
    if (!timeout) {
        config.warnings.push_back("ignoring invalid verifier timeout '" + value + "' from " + source);
        return;
    }
    config.verifier_timeout = *timeout;
}

void apply_log_level(FirewallConfig& config, const std::string& value, const std::string& source) {
    std::string level = text::to_lower(text::trim(value));
    if (!is_valid_log_level(level)) {
        config.warnings.push_back("ignoring invalid log level '" + value + "' from " + source);
        return;
    }
    config.log_level = level;
}

std::vector<std::string> split_search_path(const std::string& value) {
    std::vector<std::string> dirs;
    for (const auto& dir : text::split(value, ':')) {
        if (!dir.empty()) dirs.push_back(dir);
    }
    return dirs;
}

void apply_config_file(FirewallConfig& config, const std::string& path) {
    auto content = read_file(path);
    if (!content) return;

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(*content);
    } catch (const nlohmann::json::parse_error& e) {
        config.warnings.push_back("ignoring invalid config file " + path + ": " + e.what());
        return;
    }
    if (!j.is_object()) {
        config.warnings.push_back("ignoring config file " + path + ": not a JSON object");
        return;
    }

    if (j.contains("on_warning")) {
        if (j["on_warning"].is_string()) {
            apply_on_warning(config, j["on_warning"].get<std::string>(), path);
        } else {
            config.warnings.push_back("ignoring non-string 'on_warning' in " + path);
        }
    }

    if (j.contains("verifier_timeout")) {
        const auto& v = j["verifier_timeout"];
        if (v.is_number()) {
            apply_timeout(config, std::to_string(v.get<double>()), path);
        } else if (v.is_string()) {
            apply_timeout(config, v.get<std::string>(), path);
        } else {
            config.warnings.push_back("ignoring invalid 'verifier_timeout' in " + path);
        }
    }

    if (j.contains("verifiers_path")) {
        const auto& v = j["verifiers_path"];
        if (v.is_string()) {
            config.verifiers_path = split_search_path(v.get<std::string>());
        } else if (v.is_array()) {
            std::vector<std::string> dirs;
            for (const auto& d : v) {
                if (d.is_string()) dirs.push_back(d.get<std::string>());
            }
            config.verifiers_path = dirs;
        } else {
            config.warnings.push_back("ignoring invalid 'verifiers_path' in " + path);
        }
    }

    if (j.contains("log_file") && j["log_file"].is_string()) {
        config.log_file = j["log_file"].get<std::string>();
    }

    if (j.contains("log_level") && j["log_level"].is_string()) {
        apply_log_level(config, j["log_level"].get<std::string>(), path);
    }
}

} // namespace

std::optional<std::chrono::milliseconds> parse_timeout_seconds(const std::string& value) {
    std::string s = text::trim(value);
    if (s.empty()) return std::nullopt;

    char* end = nullptr;
    double seconds = std::strtod(s.c_str(), &end);
    if (end == s.c_str() || *end != '\0' || !std::isfinite(seconds) || seconds <= 0) {
        return std::nullopt;
    }
    return std::chrono::milliseconds(static_cast<long long>(std::llround(seconds * 1000.0)));
}

bool is_valid_log_level(const std::string& level) {
    static const std::vector<std::string> kLevels = {
        "trace", "debug", "info", "warn", "warning", "error", "critical", "off",
    };
    for (const auto& l : kLevels) {
        if (l == level) return true;
    }
    return false;
}

FirewallConfig load_config(const EnvLookup& env) {
    EnvLookup lookup = env;
    if (!lookup) {
        lookup = [](const std::string& name) { return get_env(name); };
    }

    FirewallConfig config;

    // 1. Defaults
    auto home = lookup("SCFW_HOME");
    if (home && !home->empty()) {
        config.scfw_home = *home;
    } else {
        std::string user_home = home_directory();
        config.scfw_home = user_home.empty() ? ".scfw" : join_path(user_home, ".scfw");
    }
    config.verifiers_path = {join_path(config.scfw_home, "verifiers")};
    config.log_file = join_path(config.scfw_home, "scfw.log");

    // 2. Config file
    apply_config_file(config, join_path(config.scfw_home, "config.json"));

    // 3. Environment
    if (auto v = lookup("SCFW_ON_WARNING")) {
        apply_on_warning(config, *v, "SCFW_ON_WARNING");
    }
    if (auto v = lookup("SCFW_VERIFIER_TIMEOUT")) {
        apply_timeout(config, *v, "SCFW_VERIFIER_TIMEOUT");
    }
    if (auto v = lookup("SCFW_VERIFIERS_PATH")) {
        config.verifiers_path = split_search_path(*v);
    }
    if (auto v = lookup("SCFW_LOG_FILE")) {
        if (!v->empty()) config.log_file = *v;
    }
    if (auto v = lookup("SCFW_LOG_LEVEL")) {
        apply_log_level(config, *v, "SCFW_LOG_LEVEL");
    }

    return config;
}

} // namespace scfw
