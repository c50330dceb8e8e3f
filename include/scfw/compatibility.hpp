#pragma once

#include "scfw/package_manager.hpp"
#include "scfw/result.hpp"
#include "scfw/types.hpp"

namespace scfw {

// ============================================================================
// Compatibility Gate
// ============================================================================

/**
 * @brief Classify a command before anything else runs
 *
 * - NotInstallish: the subcommand never installs, or an option such as
 *   --help or --dry-run stops it doing so. No version query is made.
 * - UnsupportedVersion: the manager is older than its minimum, or its version
 *   could not be determined. Overridden to Installish by allow_unsupported.
 * - Installish: the command must be resolved and verified.
 *
 * Errors: INVALID_COMMAND if the command does not name this manager;
 * EXECUTABLE_NOT_FOUND / PROCESS_FAILED if the version query cannot run.
 */
Result<Classification> classify(const PackageManager& manager, const Command& command,
                                bool allow_unsupported);

} // namespace scfw
