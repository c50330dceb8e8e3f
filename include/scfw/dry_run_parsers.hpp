#pragma once

/**
 * @file dry_run_parsers.hpp
 * @brief Parsers for package manager dry-run, listing and version output
 *
 * These functions are pure: they turn captured output into canonical targets
 * and never run a process. Output that does not have the expected shape is a
 * PARSE_ERROR; a partial result is never returned.
 */

#include "scfw/result.hpp"
#include "scfw/semver.hpp"
#include "scfw/target.hpp"

#include <optional>
#include <string>
#include <vector>

namespace scfw {

// ============================================================================
// pip
// ============================================================================

// `pip install --dry-run --quiet --report -` installation report (JSON)
Result<TargetSet> parse_pip_report(const std::string& report_json);

// `pip list --format json`
Result<TargetSet> parse_pip_list(const std::string& list_json);

// `pip --version`: "pip 24.0 from /usr/lib/python3/site-packages/pip (python 3.12)"
std::optional<Version> parse_pip_version(const std::string& output);

// ============================================================================
// npm
// ============================================================================

// Facts extracted from `npm install --dry-run --loglevel silly` stderr
struct NpmDryRunLog {
    std::vector<std::string> handles;       // ADD/CHANGE handles, e.g. node_modules/a/node_modules/b
    std::vector<InstallTarget> placed;      // placeDep name@version in log order
};

Result<NpmDryRunLog> parse_npm_dry_run_log(const std::string& log);

// Package name for an ADD/CHANGE handle (suffix after the last node_modules/)
std::string npm_handle_name(const std::string& handle);

/**
 * @brief Match handles to placed dependencies, then to the lock file
 * @param log Parsed dry-run log
 * @param lockfile_json Contents of package-lock.json, empty if there is none
 *
 * Every handle must resolve to a precise version and every placed dependency
 * must be consumed by a handle, otherwise the result is a PARSE_ERROR.
 */
Result<TargetSet> match_npm_targets(const NpmDryRunLog& log, const std::string& lockfile_json);

// `npm list --all --json`, flattened recursively
Result<TargetSet> parse_npm_list(const std::string& list_json);

// `npm --version`: "10.2.4"
std::optional<Version> parse_npm_version(const std::string& output);

// ============================================================================
// poetry
// ============================================================================

// `poetry <install|add|sync|update> --dry-run --no-ansi` stdout
Result<TargetSet> parse_poetry_dry_run(const std::string& output);

// `poetry show --no-ansi`: "name version description" lines
Result<TargetSet> parse_poetry_show(const std::string& output);

// `poetry --version`: "Poetry (version 2.1.1)"
std::optional<Version> parse_poetry_version(const std::string& output);

} // namespace scfw
