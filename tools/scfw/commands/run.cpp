/**
 * SCFW CLI - run command
 *
 * Run a package manager command through the firewall.
 */

#include "../common.hpp"

#include <scfw/cancellation.hpp>
#include <scfw/package_manager.hpp>

#include <CLI/CLI.hpp>

namespace scfw::cli::commands {

namespace {

struct RunCliOptions {
    VerifierOptions verifiers;
    bool dry_run = false;
    bool allow_on_warning = false;
    bool block_on_warning = false;
    bool allow_unsupported = false;
    bool error_on_block = false;
    bool no_input = false;
};

void report_outcome(const FirewallOutcome& outcome, const Policy& policy) {
    const auto& report = outcome.report;

    switch (outcome.action) {
        case Action::Block:
            std::cerr << report.filtered(FindingSeverity::Critical).render();
            if (report.has_warnings()) {
                std::cerr << report.filtered(FindingSeverity::Warning).render();
            }
            std::cerr << "\nThe installation request was blocked. No changes have been made." << std::endl;
            return;
        case Action::Abort:
            if (!policy.interactive) {
                std::cerr << report.filtered(FindingSeverity::Warning).render();
            }
            std::cerr << "\nThe installation request was aborted. No changes have been made." << std::endl;
            return;
        case Action::Allow:
            break;
    }

    // Prompted warnings have already been shown
    if ((outcome.warned && !policy.interactive) || !report.failures().empty()) {
        std::cerr << report.filtered(FindingSeverity::Warning).render();
    }
    switch (report.coverage()) {
        case VerificationCoverage::AllFailed:
            std::cerr << "All verifiers failed: the installation targets could not be verified." << std::endl;
            break;
        case VerificationCoverage::NoVerifiers:
            std::cerr << "No verifiers ran: the installation targets were not verified." << std::endl;
            break;
        default:
            break;
    }

    if (policy.dry_run && outcome.classification == Classification::Installish) {
        if (report.unverified()) {
            std::cerr << "Dry-run: exiting without running command." << std::endl;
        } else if (report.empty()) {
            std::cerr << "Dry-run: no issues found, exiting without running command." << std::endl;
        } else {
            std::cerr << "Dry-run: exiting without running command." << std::endl;
        }
    }
}

int cmd_run(const GlobalOptions& opts, const RunCliOptions& run_opts, const Command& command) {
    FirewallConfig config = load_cli_config(opts);

    if (command.empty()) {
        print_error("missing package manager command");
        return kExitUsage;
    }

    auto kind = parse_manager_kind(command[0]);
    if (!kind) {
        print_error("unsupported package manager '" + command[0] + "'");
        return kExitUsage;
    }

    PolicyInputs inputs;
    inputs.allow_on_warning = run_opts.allow_on_warning;
    inputs.block_on_warning = run_opts.block_on_warning;
    inputs.configured = config.on_warning;
    inputs.no_input = run_opts.no_input;
    inputs.terminal = is_terminal();
    inputs.dry_run = run_opts.dry_run;
    inputs.error_on_block = run_opts.error_on_block;

    auto policy = resolve_policy(inputs);
    if (policy.isErr()) {
        print_error(policy.error().message());
        return kExitUsage;
    }

    std::optional<std::string> executable;
    if (!run_opts.verifiers.executable.empty()) {
        executable = run_opts.verifiers.executable;
    }
    auto manager = make_package_manager(*kind, executable);
    if (manager.isErr()) {
        print_error(manager.error().message());
        return kExitInternalError;
    }

    auto context = build_context(config, run_opts.verifiers);
    if (!context) {
        return kExitUsage;
    }

    install_interrupt_handlers();
    context->orchestrator.cancel = &interrupt_token();

    StreamPrompter prompter(std::cin, std::cerr);
    if (policy.value().interactive) {
        context->prompter = &prompter;
    }

    RunOptions options;
    options.command = command;
    options.policy = policy.value();
    options.allow_unsupported = run_opts.allow_unsupported;

    auto outcome = run_firewall(*manager.value(), options, *context);
    if (outcome.isErr()) {
        print_error(outcome.error().message());
        return exit_code_for(outcome.error());
    }

    if (interrupt_token().cancelled() && !outcome.value().executed) {
        print_error("interrupted");
        return kExitInterrupted;
    }

    report_outcome(outcome.value(), options.policy);
    return outcome.value().exit_code;
}

} // anonymous namespace

void setup_run(CLI::App* app, GlobalOptions& opts) {
    static RunCliOptions run_opts;

    app->add_flag("--dry-run", run_opts.dry_run, "Verify the installation targets but do not run the command");
    app->add_flag("--allow-on-warning", run_opts.allow_on_warning, "Allow installations with WARNING findings");
    app->add_flag("--block-on-warning", run_opts.block_on_warning, "Block installations with WARNING findings");
    app->add_flag("--allow-unsupported", run_opts.allow_unsupported,
                  "Run unsupported package manager versions without full verification");
    app->add_flag("--error-on-block", run_opts.error_on_block, "Exit nonzero when the installation is blocked");
    app->add_flag("--no-input", run_opts.no_input, "Never prompt");
    app->add_option("--executable", run_opts.verifiers.executable,
                    "Package manager executable (a Python interpreter for pip)");
    app->add_option("--verifiers", run_opts.verifiers.verifier_dirs, "Directory of verifier plugins")
        ->allow_extra_args(false);
    app->add_flag("--offline", run_opts.verifiers.offline, "Use only locally cached verifier data");
    app->add_option("--timeout", run_opts.verifiers.timeout, "Per-verifier timeout in seconds");

    // Everything from the first positional argument on is the manager command
    app->prefix_command();

    app->callback([&opts, app]() {
        exit_process(cmd_run(opts, run_opts, app->remaining()));
    });
}

} // namespace scfw::cli::commands
