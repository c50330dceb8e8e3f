#pragma once

/**
 * @file package_manager.hpp
 * @brief Per-manager adapters for pip, npm and poetry
 *
 * Every supported manager is one PackageManager subclass selected by its
 * ManagerKind. An adapter knows how to query the manager's version, how to
 * run a command, how to resolve the targets an installish command would
 * install (without installing them), and how to list what is installed.
 *
 * @example
 * ```cpp
 * auto manager = scfw::make_package_manager(scfw::ManagerKind::Npm, std::nullopt);
 * if (manager.isErr()) return 1;
 * auto targets = manager.value()->resolveInstallTargets({"npm", "install", "react"});
 * ```
 */

#include "scfw/process.hpp"
#include "scfw/result.hpp"
#include "scfw/semver.hpp"
#include "scfw/target.hpp"
#include "scfw/types.hpp"

#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace scfw {

using Command = std::vector<std::string>;

class PackageManager {
public:
    virtual ~PackageManager() = default;

    virtual ManagerKind kind() const = 0;
    std::string name() const { return manager_kind_to_string(kind()); }
    Ecosystem ecosystem() const { return manager_ecosystem(kind()); }

    // Resolved path of the executable (the Python interpreter for pip)
    const std::string& executable() const { return executable_; }

    virtual Version minVersion() const = 0;
    virtual const std::set<std::string>& installishSubcommands() const = 0;

    // True if the command would install packages when run
    virtual bool isInstallish(const Command& command) const;

    // True if the command carries an option that stops it installing anything
    virtual bool installsNothing(const Command& command) const;

    // Read-only version query
    virtual Result<Version> queryVersion() const = 0;

    /**
     * @brief Translate a user command line into the argv to execute
     *
     * The command must start with the manager's name, which is replaced by the
     * resolved executable invocation. Otherwise INVALID_COMMAND.
     */
    Result<Command> normalizeCommand(const Command& command) const;

    // Run a command with inherited standard streams and return its exit code
    Result<int> runCommand(const Command& command) const;

    // Targets the command would install; empty if it would fail or do nothing
    virtual Result<TargetSet> resolveInstallTargets(const Command& command) const = 0;

    // Packages currently installed in the active environment
    virtual Result<TargetSet> listInstalledPackages() const = 0;

protected:
    explicit PackageManager(std::string executable) : executable_(std::move(executable)) {}

    // argv prefix that invokes the manager, e.g. {python, "-m", "pip"}
    virtual Command invocation() const { return {executable_}; }

    // First token after the manager name that is not an option
    static std::optional<std::string> subcommandOf(const Command& command);

    // Run with captured output, killed on interrupt (CANCELLED)
    static Result<ProcessResult> runCaptured(const Command& argv);

    std::string executable_;
};

/**
 * @brief Create the adapter for a manager kind
 * @param kind Which manager
 * @param executable Explicit executable (a Python interpreter for pip);
 *        otherwise the manager is located on PATH
 * @return The adapter, or EXECUTABLE_NOT_FOUND
 */
Result<std::unique_ptr<PackageManager>> make_package_manager(
    ManagerKind kind, const std::optional<std::string>& executable);

} // namespace scfw
