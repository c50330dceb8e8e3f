#pragma once

/**
 * @file semver.hpp
 * @brief Version parsing and ordering for package manager compatibility checks
 *
 * Package managers report versions that are not always strict SemVer 2.0.0
 * (pip reports "24.0" or "24.1b1"). parse_manager_version() normalizes such
 * strings to MAJOR.MINOR.PATCH before comparing them with SemVer precedence.
 *
 * @example
 * ```cpp
 * #include <scfw/semver.hpp>
 *
 * auto version = scfw::parse_manager_version("24.0");
 * auto minimum = scfw::parse_version("22.2.0");
 * if (version && minimum && *version >= *minimum) {
 *     // pip is recent enough
 * }
 * ```
 */

// cpp-semver requires <cstdint> but doesn't include it (GCC strictness)
#include <cstdint>
#include <semver/semver.hpp>
#include <optional>
#include <string>

namespace scfw {

/// Semantic version type (MAJOR.MINOR.PATCH[-prerelease][+build])
using Version = semver::version;

/**
 * @brief Parse a strict SemVer 2.0.0 version string
 * @param str Version string (e.g., "1.2.3", "1.0.0-alpha+build")
 * @return Parsed version or nullopt on failure
 */
std::optional<Version> parse_version(const std::string& str);

/**
 * @brief Parse a version string as reported by a package manager
 * @param str Version string (e.g., "24.0", "v10.2.4", "1.8.3", "24.1b1")
 * @return Version built from the leading numeric components, or nullopt
 *
 * A leading 'v' is ignored, missing MINOR/PATCH components are taken as 0 and
 * anything following the numeric components is dropped.
 */
std::optional<Version> parse_manager_version(const std::string& str);

/// True if version >= minimum under SemVer precedence
bool meets_minimum(const Version& version, const Version& minimum);

} // namespace scfw
