/**
 * SCFW CLI - audit command
 *
 * Verify the packages already installed by a package manager.
 */

#include "../common.hpp"

#include <scfw/cancellation.hpp>
#include <scfw/package_manager.hpp>

#include <CLI/CLI.hpp>

namespace scfw::cli::commands {

namespace {

struct AuditCliOptions {
    VerifierOptions verifiers;
    std::string manager;
};

int cmd_audit(const GlobalOptions& opts, const AuditCliOptions& audit_opts) {
    FirewallConfig config = load_cli_config(opts);

    auto kind = parse_manager_kind(audit_opts.manager);
    if (!kind) {
        print_error("unsupported package manager '" + audit_opts.manager + "'");
        return kExitUsage;
    }

    std::optional<std::string> executable;
    if (!audit_opts.verifiers.executable.empty()) {
        executable = audit_opts.verifiers.executable;
    }
    auto manager = make_package_manager(*kind, executable);
    if (manager.isErr()) {
        print_error(manager.error().message());
        return kExitInternalError;
    }

    auto context = build_context(config, audit_opts.verifiers);
    if (!context) {
        return kExitUsage;
    }

    install_interrupt_handlers();
    context->orchestrator.cancel = &interrupt_token();

    auto result = run_audit(*manager.value(), *context);
    if (result.isErr()) {
        print_error(result.error().message());
        return exit_code_for(result.error());
    }

    const auto& audit = result.value();
    const std::string& name = manager.value()->name();
    if (audit.report.unverified()) {
        std::cout << audit.report.render();
        if (audit.report.all_verifiers_failed()) {
            std::cout << "All verifiers failed: the " << audit.targets.size() << " installed "
                      << name << " packages could not be verified." << std::endl;
        } else {
            std::cout << "No verifiers ran: the " << audit.targets.size() << " installed "
                      << name << " packages were not verified." << std::endl;
        }
    } else if (audit.report.empty()) {
        std::cout << audit.report.render();
        std::cout << "No issues found in " << audit.targets.size() << " installed "
                  << name << " packages." << std::endl;
    } else {
        std::cout << audit.report.render();
        std::cout << "\n" << audit.report.targets_with_findings().size() << " of "
                  << audit.targets.size() << " installed " << name
                  << " packages have findings." << std::endl;
    }

    return kExitOk;
}

} // anonymous namespace

void setup_audit(CLI::App* app, GlobalOptions& opts) {
    static AuditCliOptions audit_opts;

    app->add_option("manager", audit_opts.manager, "Package manager to audit (pip, npm, poetry)")
        ->required();
    app->add_option("--executable", audit_opts.verifiers.executable,
                    "Package manager executable (a Python interpreter for pip)");
    app->add_option("--verifiers", audit_opts.verifiers.verifier_dirs, "Directory of verifier plugins")
        ->allow_extra_args(false);
    app->add_flag("--offline", audit_opts.verifiers.offline, "Use only locally cached verifier data");
    app->add_option("--timeout", audit_opts.verifiers.timeout, "Per-verifier timeout in seconds");

    app->callback([&opts]() {
        exit_process(cmd_audit(opts, audit_opts));
    });
}

} // namespace scfw::cli::commands
