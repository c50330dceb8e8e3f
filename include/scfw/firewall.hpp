#pragma once

/**
 * @file firewall.hpp
 * @brief Command interception and audit pipelines
 *
 * run_firewall():
 *   classify -> (pass through | fail closed | resolve targets) ->
 *   verify -> decide -> log -> run the original command if allowed
 *
 * run_audit():
 *   list installed packages -> verify -> decide (advisory only) -> log
 *
 * Neither function prints anything; callers render the outcome.
 */

#include "scfw/decision.hpp"
#include "scfw/logger.hpp"
#include "scfw/orchestrator.hpp"
#include "scfw/package_manager.hpp"
#include "scfw/report.hpp"
#include "scfw/result.hpp"
#include "scfw/verifier.hpp"

#include <vector>

namespace scfw {

// Exit codes of a run that did not execute the original command
constexpr int kExitBlocked = 3;
constexpr int kExitAborted = 4;

struct FirewallContext {
    std::vector<VerifierPtr> verifiers;
    std::vector<FirewallLoggerPtr> loggers;
    Prompter* prompter = nullptr;
    OrchestratorOptions orchestrator;
};

struct RunOptions {
    Command command;
    Policy policy;
    bool allow_unsupported = false;
};

struct FirewallOutcome {
    Classification classification = Classification::NotInstallish;
    Action action = Action::Allow;
    int exit_code = 0;
    bool executed = false;      // the original command was run
    bool verified = false;      // verification ran (false when it was skipped)
    bool warned = false;
    TargetSet targets;
    VerificationReport report;
};

/**
 * @brief Run a package manager command through the firewall
 *
 * Errors: INVALID_COMMAND, EXECUTABLE_NOT_FOUND, PROCESS_FAILED,
 * UNSUPPORTED_VERSION (the command never ran), PARSE_ERROR (resolution
 * failed), CANCELLED (interrupted before the command ran).
 */
Result<FirewallOutcome> run_firewall(const PackageManager& manager, const RunOptions& options,
                                     const FirewallContext& context);

struct AuditResult {
    TargetSet targets;
    VerificationReport report;
    Action advisory_decision = Action::Allow;
};

// Verify every installed package; never changes anything
Result<AuditResult> run_audit(const PackageManager& manager, const FirewallContext& context);

} // namespace scfw
