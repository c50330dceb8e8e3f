#include "scfw/compatibility.hpp"

#include <spdlog/spdlog.h>

namespace scfw {

Result<Classification> classify(const PackageManager& manager, const Command& command,
                                bool allow_unsupported) {
    auto normalized = manager.normalizeCommand(command);
    if (normalized.isErr()) {
        return Result<Classification>::err(normalized.error());
    }

    if (!manager.isInstallish(command)) {
        return Result<Classification>::ok(Classification::NotInstallish);
    }
    if (manager.installsNothing(command)) {
        spdlog::debug("{} command installs nothing", manager.name());
        return Result<Classification>::ok(Classification::NotInstallish);
    }

    auto version = manager.queryVersion();
    bool supported = false;
    std::string detail;

    if (version.isErr()) {
        if (version.error().code() != ErrorCode::PARSE_ERROR) {
            return Result<Classification>::err(version.error());
        }
        detail = version.error().message();
    } else if (meets_minimum(version.value(), manager.minVersion())) {
        supported = true;
    } else {
        detail = manager.name() + " version " + version.value().str() +
                 " is below the minimum supported version " + manager.minVersion().str();
    }

    if (supported) {
        return Result<Classification>::ok(Classification::Installish);
    }
    if (allow_unsupported) {
        spdlog::warn("{}; proceeding because unsupported versions are allowed", detail);
        return Result<Classification>::ok(Classification::Installish);
    }
    spdlog::debug("{}", detail);
    return Result<Classification>::ok(Classification::UnsupportedVersion);
}

} // namespace scfw
