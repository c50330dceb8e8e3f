#pragma once

#include "scfw/package_manager.hpp"

namespace scfw {

// ============================================================================
// pip
// ============================================================================

// Invoked as `<python> -m pip` so that the active interpreter's pip is used
class PipManager : public PackageManager {
public:
    explicit PipManager(std::string python) : PackageManager(std::move(python)) {}

    ManagerKind kind() const override { return ManagerKind::Pip; }
    Version minVersion() const override;
    const std::set<std::string>& installishSubcommands() const override;

    Result<Version> queryVersion() const override;
    Result<TargetSet> resolveInstallTargets(const Command& command) const override;
    Result<TargetSet> listInstalledPackages() const override;

protected:
    Command invocation() const override { return {executable_, "-m", "pip"}; }
};

// ============================================================================
// npm
// ============================================================================

class NpmManager : public PackageManager {
public:
    explicit NpmManager(std::string npm) : PackageManager(std::move(npm)) {}

    ManagerKind kind() const override { return ManagerKind::Npm; }
    Version minVersion() const override;
    const std::set<std::string>& installishSubcommands() const override;

    // Any install alias anywhere on the command line
    bool isInstallish(const Command& command) const override;

    Result<Version> queryVersion() const override;
    Result<TargetSet> resolveInstallTargets(const Command& command) const override;
    Result<TargetSet> listInstalledPackages() const override;

private:
    // package-lock.json contents of the current project, empty if none
    std::string readLockfile() const;
};

// ============================================================================
// poetry
// ============================================================================

class PoetryManager : public PackageManager {
public:
    explicit PoetryManager(std::string poetry) : PackageManager(std::move(poetry)) {}

    ManagerKind kind() const override { return ManagerKind::Poetry; }
    Version minVersion() const override;
    const std::set<std::string>& installishSubcommands() const override;

    // Also -V / --version
    bool installsNothing(const Command& command) const override;

    Result<Version> queryVersion() const override;
    Result<TargetSet> resolveInstallTargets(const Command& command) const override;
    Result<TargetSet> listInstalledPackages() const override;
};

} // namespace scfw
