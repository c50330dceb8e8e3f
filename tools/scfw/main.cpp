/**
 * SCFW CLI - Entry Point
 *
 * Supply-chain firewall for pip, npm and poetry.
 */

#include <CLI/CLI.hpp>
#include "common.hpp"

// Forward declarations for commands
namespace scfw::cli::commands {
    void setup_run(CLI::App* app, GlobalOptions& opts);
    void setup_audit(CLI::App* app, GlobalOptions& opts);
    void setup_verifiers(CLI::App* app, GlobalOptions& opts);
}

int main(int argc, char** argv) {
    using namespace scfw::cli;

    CLI::App app{"scfw - Supply-chain firewall for package managers"};
    app.set_version_flag("-V,--version", SCFW_VERSION);
    app.require_subcommand(0, 1);

    GlobalOptions opts;

    // Global options
    app.add_option("--log-level", opts.log_level,
                   "Diagnostic log level (trace, debug, info, warn, error, off)");

    // Commands
    auto* run_cmd = app.add_subcommand("run", "Run a package manager command through the firewall");
    commands::setup_run(run_cmd, opts);

    auto* audit_cmd = app.add_subcommand("audit", "Verify installed packages");
    commands::setup_audit(audit_cmd, opts);

    auto* verifiers_cmd = app.add_subcommand("verifiers", "List installed verifiers");
    commands::setup_verifiers(verifiers_cmd, opts);

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        int rc = app.exit(e);
        return rc == 0 ? kExitOk : kExitUsage;
    }

    // If no subcommand, show help
    if (app.get_subcommands().empty()) {
        std::cout << app.help() << std::endl;
    }

    return kExitOk;
}
