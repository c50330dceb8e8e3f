#pragma once

/**
 * @file report.hpp
 * @brief Verifier findings and the aggregated verification report
 */

#include "scfw/target.hpp"
#include "scfw/types.hpp"

#include <string>
#include <unordered_map>
#include <vector>

namespace scfw {

// ============================================================================
// Finding
// ============================================================================

struct Finding {
    InstallTarget target;
    FindingSeverity severity = FindingSeverity::Warning;
    std::string message;
    std::string verifier;   // name of the reporting verifier
    std::string detail;     // e.g. advisory identifier, optional
};

struct VerifierFailure {
    std::string name;
    std::string reason;
};

// How much of a target set the verifiers actually covered
enum class VerificationCoverage {
    NotNeeded,      // no targets
    Complete,       // every verifier produced a result
    Partial,        // some verifiers failed
    AllFailed,      // verifiers were expected and none produced a result
    NoVerifiers,    // nothing was registered to verify with
};

// ============================================================================
// Verification Report
// ============================================================================

/**
 * @brief Findings for a target set, grouped per target
 *
 * Filled in by the orchestrator, then handed read-only to the decision
 * engine. Findings are kept in the order they were added; findings from
 * different verifiers are never merged.
 */
class VerificationReport {
public:
    VerificationReport() = default;

    void add_finding(Finding finding);
    void add_failure(VerifierFailure failure);
    void add_verifier_run(const std::string& name);
    void set_target_count(size_t count) { target_count_ = count; }

    bool has_critical() const;
    bool has_warnings() const;
    bool empty() const { return order_.empty(); }

    // Findings for a target, empty if none
    const std::vector<Finding>& findings_for(const InstallTarget& target) const;

    // Report holding only the findings of the given severity
    VerificationReport filtered(FindingSeverity severity) const;

    // True if at least one verifier was expected and none produced a result
    bool all_verifiers_failed() const;

    VerificationCoverage coverage() const;

    // Targets exist but no verifier looked at them; an empty report then
    // means "not verified", never "no issues"
    bool unverified() const;

    const std::vector<InstallTarget>& targets_with_findings() const { return order_; }
    const std::vector<VerifierFailure>& failures() const { return failures_; }
    // Verifiers that completed without failure
    const std::vector<std::string>& verifiers_run() const { return verifiers_run_; }
    size_t target_count() const { return target_count_; }
    size_t finding_count() const;

    // Human-readable rendering used for prompts and final messages
    std::string render() const;

private:
    std::vector<InstallTarget> order_;
    std::unordered_map<InstallTarget, std::vector<Finding>, InstallTargetHash> findings_;
    std::vector<VerifierFailure> failures_;
    std::vector<std::string> verifiers_run_;
    size_t target_count_ = 0;
};

} // namespace scfw
