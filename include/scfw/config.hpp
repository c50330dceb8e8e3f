#pragma once

/**
 * @file config.hpp
 * @brief Firewall configuration
 *
 * Layers, lowest precedence first:
 *   1. Built-in defaults
 *   2. $SCFW_HOME/config.json
 *   3. Environment (SCFW_ON_WARNING, SCFW_VERIFIER_TIMEOUT, SCFW_VERIFIERS_PATH,
 *      SCFW_LOG_FILE, SCFW_LOG_LEVEL)
 *   4. Command-line flags, applied by the caller
 *
 * An invalid value is reported as a warning and the previous layer's value
 * is kept.
 *
 * @example
 * ```json
 * {
 *   "on_warning": "BLOCK",
 *   "verifier_timeout": 10,
 *   "verifiers_path": ["/opt/scfw/verifiers"],
 *   "log_file": "/var/log/scfw.log",
 *   "log_level": "info"
 * }
 * ```
 */

#include "scfw/orchestrator.hpp"
#include "scfw/types.hpp"

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace scfw {

struct FirewallConfig {
    std::string scfw_home;
    std::optional<WarningPolicy> on_warning;
    std::chrono::milliseconds verifier_timeout = kDefaultVerifierTimeout;
    std::vector<std::string> verifiers_path;
    std::string log_file;
    std::string log_level = "warn";

    // Warnings collected while loading, to be reported once logging is set up
    std::vector<std::string> warnings;
};

using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

// Load all layers below the command line; env defaults to the process environment
FirewallConfig load_config(const EnvLookup& env = {});

// Parse a timeout given in (possibly fractional) seconds; must be positive
std::optional<std::chrono::milliseconds> parse_timeout_seconds(const std::string& value);

// True for the level names accepted by --log-level
bool is_valid_log_level(const std::string& level);

} // namespace scfw
