#pragma once

#include "scfw/cancellation.hpp"
#include "scfw/report.hpp"
#include "scfw/result.hpp"
#include "scfw/verifier.hpp"

#include <chrono>
#include <vector>

namespace scfw {

// ============================================================================
// Verifier Orchestrator
// ============================================================================

constexpr std::chrono::milliseconds kDefaultVerifierTimeout{30000};

struct OrchestratorOptions {
    std::chrono::milliseconds timeout = kDefaultVerifierTimeout;
    const CancellationToken* cancel = nullptr;
};

/**
 * @brief Run every verifier against the targets and merge the results
 *
 * Each verifier runs on its own thread with its own deadline. A verifier that
 * fails, throws or times out is listed in the report's failures; the others
 * still contribute. Findings for targets outside @p targets are dropped.
 *
 * @return The merged report, or CANCELLED if the token fired while waiting.
 *         Abandoned verifier threads finish in the background and their
 *         results are discarded.
 */
Result<VerificationReport> verify_targets(const std::vector<VerifierPtr>& verifiers,
                                          const TargetSet& targets,
                                          const OrchestratorOptions& options = {});

// Verifier threads abandoned by verify_targets() that have not finished yet.
// A process should not run static destructors while this is nonzero.
size_t running_abandoned_verifiers();

} // namespace scfw
