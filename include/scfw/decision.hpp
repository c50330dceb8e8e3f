#pragma once

/**
 * @file decision.hpp
 * @brief Reduction of a verification report and policy to an action
 *
 * Decision rules, in order:
 *   1. Any CRITICAL finding blocks, whatever the policy.
 *   2. Any WARNING finding follows the warning policy: block, allow, or ask
 *      the user when interactive. Non-interactive runs with no warning policy
 *      abort.
 *   3. Otherwise the installation is allowed.
 */

#include "scfw/report.hpp"
#include "scfw/result.hpp"
#include "scfw/types.hpp"

#include <iosfwd>
#include <optional>
#include <string>

namespace scfw {

// ============================================================================
// Policy
// ============================================================================

struct Policy {
    bool interactive = false;
    WarningPolicy on_warning = WarningPolicy::Prompt;
    bool error_on_block = false;
    bool dry_run = false;
};

struct PolicyInputs {
    bool allow_on_warning = false;                   // --allow-on-warning
    bool block_on_warning = false;                   // --block-on-warning
    std::optional<WarningPolicy> configured;         // SCFW_ON_WARNING or config file
    bool no_input = false;                           // --no-input
    bool terminal = false;                           // stdin and stderr are TTYs
    bool dry_run = false;
    bool error_on_block = false;
};

/**
 * @brief Combine flags and configuration into a Policy
 *
 * Flags win over the configured warning policy. Either source disables the
 * prompt. Passing both warning flags is an INVALID_POLICY error.
 */
Result<Policy> resolve_policy(const PolicyInputs& inputs);

// ============================================================================
// Prompter
// ============================================================================

class Prompter {
public:
    virtual ~Prompter() = default;

    // Show the summary and ask whether to proceed; true means proceed
    virtual bool confirm(const std::string& summary) = 0;
};

// Prompts on `out` and reads the answer from `in`. The CLI uses stdin and
// stderr so that stdout of the wrapped command stays clean.
class StreamPrompter : public Prompter {
public:
    StreamPrompter(std::istream& in, std::ostream& out) : in_(in), out_(out) {}

    bool confirm(const std::string& summary) override;

private:
    std::istream& in_;
    std::ostream& out_;
};

// ============================================================================
// Decision
// ============================================================================

struct Decision {
    Action action = Action::Allow;
    VerificationReport report;
    bool warned = false;    // warnings were present and surfaced
};

// prompter may be null for non-interactive policies
Decision decide(const VerificationReport& report, const Policy& policy, Prompter* prompter);

} // namespace scfw
