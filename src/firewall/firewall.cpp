#include "scfw/firewall.hpp"
#include "scfw/compatibility.hpp"
#include "scfw/platform.hpp"

#include <spdlog/spdlog.h>

namespace scfw {

namespace {

bool interrupted(const FirewallContext& context) {
    return context.orchestrator.cancel && context.orchestrator.cancel->cancelled();
}

Result<FirewallOutcome> execute(const PackageManager& manager, const RunOptions& options,
                                FirewallOutcome outcome) {
    if (options.policy.dry_run) {
        spdlog::info("Dry-run: exiting without running {} command", manager.name());
        outcome.exit_code = 0;
        return Result<FirewallOutcome>::ok(std::move(outcome));
    }

    auto exit_code = manager.runCommand(options.command);
    if (exit_code.isErr()) {
        return Result<FirewallOutcome>::err(exit_code.error());
    }
    outcome.executed = true;
    outcome.exit_code = exit_code.value();
    return Result<FirewallOutcome>::ok(std::move(outcome));
}

} // namespace

Result<FirewallOutcome> run_firewall(const PackageManager& manager, const RunOptions& options,
                                     const FirewallContext& context) {
    FirewallOutcome outcome;

    auto classification = classify(manager, options.command, options.allow_unsupported);
    if (classification.isErr()) {
        return Result<FirewallOutcome>::err(classification.error());
    }
    outcome.classification = classification.value();

    switch (outcome.classification) {
        case Classification::NotInstallish:
            spdlog::debug("Passing through non-installish {} command", manager.name());
            return execute(manager, options, std::move(outcome));
        case Classification::UnsupportedVersion:
            return Result<FirewallOutcome>::err(Error(ErrorCode::UNSUPPORTED_VERSION,
                manager.name() + " is not a supported version (minimum " +
                manager.minVersion().str() + "); use --allow-unsupported to run it anyway"));
        case Classification::Installish:
            break;
    }

    auto targets = manager.resolveInstallTargets(options.command);
    if (targets.isErr()) {
        if (!options.allow_unsupported) {
            return Result<FirewallOutcome>::err(
                targets.error().withContext("failed to resolve installation targets"));
        }
        spdlog::warn("Failed to resolve installation targets ({}); verification is disabled",
                     targets.error().message());
    } else {
        outcome.targets = std::move(targets.value());
        outcome.verified = true;
    }

    if (outcome.verified && !outcome.targets.empty()) {
        spdlog::info("Verifying {} installation targets", outcome.targets.size());
        auto report = verify_targets(context.verifiers, outcome.targets, context.orchestrator);
        if (report.isErr()) {
            return Result<FirewallOutcome>::err(report.error());
        }
        outcome.report = std::move(report.value());

        if (outcome.report.all_verifiers_failed()) {
            spdlog::warn("All verifiers failed; no verification results are available");
        } else if (outcome.report.unverified()) {
            spdlog::warn("No verifiers ran; {} installation targets were not verified",
                         outcome.targets.size());
        }

        Decision decision = decide(outcome.report, options.policy, context.prompter);
        outcome.action = decision.action;
        outcome.warned = decision.warned;
    } else {
        spdlog::info("No installation targets to verify");
        outcome.action = Action::Allow;
    }

    FirewallRecord record;
    record.manager = manager.name();
    record.executable = manager.executable();
    record.ecosystem = manager.ecosystem();
    record.command = options.command;
    record.targets = outcome.targets;
    record.action = outcome.action;
    record.verified = outcome.verified;
    record.warned = outcome.warned;
    record.dry_run = options.policy.dry_run;
    record.timestamp = get_current_timestamp();
    log_firewall_action_all(context.loggers, record);

    if (outcome.action != Action::Allow) {
        if (options.policy.error_on_block) {
            outcome.exit_code = outcome.action == Action::Block ? kExitBlocked : kExitAborted;
        }
        return Result<FirewallOutcome>::ok(std::move(outcome));
    }

    if (interrupted(context)) {
        return Result<FirewallOutcome>::err(Error(ErrorCode::CANCELLED,
            "interrupted before running the " + manager.name() + " command"));
    }

    return execute(manager, options, std::move(outcome));
}

Result<AuditResult> run_audit(const PackageManager& manager, const FirewallContext& context) {
    AuditResult result;

    auto installed = manager.listInstalledPackages();
    if (installed.isErr()) {
        return Result<AuditResult>::err(
            installed.error().withContext("failed to list installed " + manager.name() + " packages"));
    }
    result.targets = std::move(installed.value());

    auto report = verify_targets(context.verifiers, result.targets, context.orchestrator);
    if (report.isErr()) {
        return Result<AuditResult>::err(report.error());
    }
    result.report = std::move(report.value());

    // Audits never ask and never enforce
    Policy advisory;
    result.advisory_decision = decide(result.report, advisory, nullptr).action;

    AuditRecord record;
    record.manager = manager.name();
    record.executable = manager.executable();
    record.ecosystem = manager.ecosystem();
    record.package_count = result.targets.size();
    record.report = result.report;
    record.timestamp = get_current_timestamp();
    log_audit_all(context.loggers, record);

    return Result<AuditResult>::ok(std::move(result));
}

} // namespace scfw
