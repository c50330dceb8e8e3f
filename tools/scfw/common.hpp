/**
 * SCFW CLI - Common utilities and types
 */

#pragma once

#include <scfw/config.hpp>
#include <scfw/decision.hpp>
#include <scfw/firewall.hpp>
#include <scfw/http.hpp>
#include <scfw/logger.hpp>
#include <scfw/orchestrator.hpp>
#include <scfw/result.hpp>
#include <scfw/verifier_registry.hpp>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <unistd.h>

#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace scfw::cli {

// Process exit codes shared by all commands
constexpr int kExitOk = 0;
constexpr int kExitInternalError = 1;
constexpr int kExitUsage = 2;
constexpr int kExitUnsupportedVersion = 5;
constexpr int kExitInterrupted = 130;

/**
 * Global options available to all commands.
 */
struct GlobalOptions {
    std::string log_level;         // --log-level
};

/**
 * Options shared by commands that run verifiers.
 */
struct VerifierOptions {
    std::vector<std::string> verifier_dirs;    // --verifiers
    std::string timeout;                       // --timeout (seconds)
    std::string executable;                    // --executable
    bool offline = false;                      // --offline
};

inline void print_error(const std::string& msg) {
    std::cerr << "Error: " << msg << std::endl;
}

/**
 * Exit with the command's code. Verifier threads abandoned after a timeout
 * may still be running and logging, so static destructors are skipped then.
 */
inline void exit_process(int code) {
    if (running_abandoned_verifiers() > 0) {
        spdlog::default_logger()->flush();
        std::cout.flush();
        std::cerr.flush();
        std::_Exit(code);
    }
    std::exit(code);
}

/**
 * Route diagnostics to stderr. The level comes from --log-level, falling
 * back to the configured level.
 */
inline void init_logging(const GlobalOptions& opts, const FirewallConfig& config) {
    auto logger = spdlog::stderr_color_mt("scfw");
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("%l: %v");

    std::string level = config.log_level;
    if (!opts.log_level.empty()) {
        if (is_valid_log_level(opts.log_level)) {
            level = opts.log_level;
        } else {
            spdlog::warn("Ignoring invalid log level '{}'", opts.log_level);
        }
    }
    spdlog::set_level(spdlog::level::from_str(level == "warning" ? "warn" : level));

    for (const auto& warning : config.warnings) {
        spdlog::warn("{}", warning);
    }
}

/**
 * Load configuration and set up logging; every command starts here.
 */
inline FirewallConfig load_cli_config(const GlobalOptions& opts) {
    FirewallConfig config = load_config();
    init_logging(opts, config);
    return config;
}

/**
 * Map a pipeline error to the process exit code.
 */
inline int exit_code_for(const Error& error) {
    switch (error.code()) {
        case ErrorCode::UNSUPPORTED_VERSION: return kExitUnsupportedVersion;
        case ErrorCode::CANCELLED: return kExitInterrupted;
        case ErrorCode::INVALID_COMMAND:
        case ErrorCode::INVALID_POLICY: return kExitUsage;
        default: return kExitInternalError;
    }
}

/**
 * Verifier search path: --verifiers directories first, then the configured path.
 */
inline RegistryOptions registry_options(const FirewallConfig& config, const VerifierOptions& vopts) {
    RegistryOptions options;
    options.scfw_home = config.scfw_home;
    options.plugin_dirs = vopts.verifier_dirs;
    options.plugin_dirs.insert(options.plugin_dirs.end(),
                               config.verifiers_path.begin(), config.verifiers_path.end());
    if (!vopts.offline) {
        options.http = std::make_shared<CurlHttpClient>();
    }
    return options;
}

/**
 * Build the pipeline context shared by run and audit.
 * Returns nullopt (after printing the error) if --timeout is invalid.
 */
inline std::optional<FirewallContext> build_context(const FirewallConfig& config,
                                                    const VerifierOptions& vopts) {
    FirewallContext context;

    context.orchestrator.timeout = config.verifier_timeout;
    if (!vopts.timeout.empty()) {
        auto timeout = parse_timeout_seconds(vopts.timeout);
        if (!timeout) {
            print_error("invalid --timeout value: " + vopts.timeout);
            return std::nullopt;
        }
        context.orchestrator.timeout = *timeout;
    }

    const auto& registry = cached_registry(registry_options(config, vopts));
    context.verifiers = registry.verifiers();
    if (context.verifiers.empty()) {
        spdlog::warn("No verifiers are installed; installation targets will not be checked");
    }

    if (!config.log_file.empty()) {
        context.loggers.push_back(std::make_shared<FileLogger>(config.log_file));
    }

    return context;
}

inline bool is_terminal() {
    return ::isatty(STDIN_FILENO) && ::isatty(STDERR_FILENO);
}

} // namespace scfw::cli
