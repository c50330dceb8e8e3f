/**
 * SCFW CLI - verifiers command
 *
 * List the verifiers that would run and any that failed to load.
 */

#include "../common.hpp"

#include <CLI/CLI.hpp>

namespace scfw::cli::commands {

namespace {

int cmd_verifiers(const GlobalOptions& opts, const VerifierOptions& vopts) {
    FirewallConfig config = load_cli_config(opts);

    const auto& registry = cached_registry(registry_options(config, vopts));

    if (registry.verifiers().empty()) {
        std::cout << "No verifiers installed." << std::endl;
    } else {
        std::cout << "Verifiers:" << std::endl;
        for (const auto& name : registry.names()) {
            std::cout << "  " << name << std::endl;
        }
    }

    if (!registry.failures().empty()) {
        std::cout << std::endl << "Failed to load:" << std::endl;
        for (const auto& failure : registry.failures()) {
            std::cout << "  " << failure.path << ": " << failure.reason << std::endl;
        }
    }

    return kExitOk;
}

} // anonymous namespace

void setup_verifiers(CLI::App* app, GlobalOptions& opts) {
    static VerifierOptions vopts;

    app->add_option("--verifiers", vopts.verifier_dirs, "Directory of verifier plugins")
        ->allow_extra_args(false);
    app->add_flag("--offline", vopts.offline, "Use only locally cached verifier data");

    app->callback([&opts]() {
        exit_process(cmd_verifiers(opts, vopts));
    });
}

} // namespace scfw::cli::commands
