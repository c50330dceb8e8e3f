#include "scfw/decision.hpp"

#include <istream>
#include <ostream>

#include <spdlog/spdlog.h>

namespace scfw {

Result<Policy> resolve_policy(const PolicyInputs& inputs) {
    if (inputs.allow_on_warning && inputs.block_on_warning) {
        return Result<Policy>::err(Error(ErrorCode::INVALID_POLICY,
            "--allow-on-warning and --block-on-warning are mutually exclusive"));
    }

    Policy policy;
    policy.dry_run = inputs.dry_run;
    policy.error_on_block = inputs.error_on_block;

    if (inputs.allow_on_warning) {
        policy.on_warning = WarningPolicy::Allow;
    } else if (inputs.block_on_warning) {
        policy.on_warning = WarningPolicy::Block;
    } else if (inputs.configured && *inputs.configured != WarningPolicy::Prompt) {
        policy.on_warning = *inputs.configured;
    }

    policy.interactive = policy.on_warning == WarningPolicy::Prompt &&
                         inputs.terminal && !inputs.no_input;

    return Result<Policy>::ok(policy);
}

bool StreamPrompter::confirm(const std::string& summary) {
    out_ << summary;
    out_ << "Proceed with installation? [y/N]: " << std::flush;

    std::string answer;
    if (!std::getline(in_, answer)) {
        out_ << std::endl;
        return false;
    }
    return answer == "y" || answer == "Y" || answer == "yes";
}

Decision decide(const VerificationReport& report, const Policy& policy, Prompter* prompter) {
    Decision decision;
    decision.report = report;

    if (report.has_critical()) {
        decision.action = Action::Block;
        return decision;
    }

    if (!report.has_warnings()) {
        decision.action = Action::Allow;
        return decision;
    }

    decision.warned = true;
    switch (policy.on_warning) {
        case WarningPolicy::Block:
            decision.action = Action::Block;
            break;
        case WarningPolicy::Allow:
            decision.action = Action::Allow;
            break;
        case WarningPolicy::Prompt:
            if (policy.interactive && prompter) {
                bool proceed = prompter->confirm(report.filtered(FindingSeverity::Warning).render());
                decision.action = proceed ? Action::Allow : Action::Abort;
            } else {
                spdlog::debug("Warnings present and no way to ask, aborting");
                decision.action = Action::Abort;
            }
            break;
    }
    return decision;
}

} // namespace scfw
