#pragma once

/**
 * @file verifier.hpp
 * @brief Verifier capability interface
 *
 * A verifier inspects a set of install targets against some data source and
 * reports findings. Every verifier receives the complete target set and
 * ignores targets from ecosystems it does not cover.
 *
 * @example
 * ```cpp
 * class NameListVerifier : public scfw::Verifier {
 * public:
 *     std::string name() const override { return "NameListVerifier"; }
 *     scfw::Result<std::vector<scfw::Finding>> verify(const scfw::TargetSet& targets) override;
 * };
 * ```
 */

#include "scfw/report.hpp"
#include "scfw/result.hpp"
#include "scfw/target.hpp"

#include <memory>
#include <string>
#include <vector>

namespace scfw {

class Verifier {
public:
    virtual ~Verifier() = default;

    // Stable identifier, unique within a registry
    virtual std::string name() const = 0;

    /**
     * @brief Check targets and report findings
     *
     * Returns VERIFIER_FAILED (or IO_ERROR) when the verifier could not do its
     * job. Such failures are recorded in the report and never abort the
     * pipeline. Findings whose target is not in @p targets are dropped.
     */
    virtual Result<std::vector<Finding>> verify(const TargetSet& targets) = 0;
};

using VerifierPtr = std::shared_ptr<Verifier>;

} // namespace scfw
