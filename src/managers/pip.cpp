#include "scfw/dry_run_parsers.hpp"
#include "scfw/managers.hpp"
#include "scfw/process.hpp"
#include "scfw/text_utils.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace scfw {

// ============================================================================
// Parsers
// ============================================================================

Result<TargetSet> parse_pip_report(const std::string& report_json) {
    TargetSet targets;
    try {
        auto report = nlohmann::json::parse(report_json);
        if (!report.is_object() || !report.contains("install") || !report["install"].is_array()) {
            return Result<TargetSet>::err(Error(ErrorCode::PARSE_ERROR,
                "pip installation report has no 'install' list"));
        }

        for (const auto& entry : report["install"]) {
            const auto& metadata = entry.at("metadata");
            InstallTarget target;
            target.ecosystem = Ecosystem::PyPI;
            target.name = metadata.at("name").get<std::string>();
            target.version = metadata.at("version").get<std::string>();
            if (target.name.empty() || target.version.empty()) {
                return Result<TargetSet>::err(Error(ErrorCode::PARSE_ERROR,
                    "pip installation report entry with empty name or version"));
            }

            if (entry.value("is_direct", false) && entry.contains("download_info")) {
                target.source_hint = entry["download_info"].value("url", "");
            }
            targets.insert(std::move(target));
        }
    } catch (const nlohmann::json::exception& e) {
        return Result<TargetSet>::err(Error(ErrorCode::PARSE_ERROR,
            std::string("malformed pip installation report: ") + e.what()));
    }
    return Result<TargetSet>::ok(std::move(targets));
}

Result<TargetSet> parse_pip_list(const std::string& list_json) {
    TargetSet targets;
    try {
        auto list = nlohmann::json::parse(list_json);
        if (!list.is_array()) {
            return Result<TargetSet>::err(Error(ErrorCode::PARSE_ERROR,
                "pip list output is not a JSON array"));
        }
        for (const auto& entry : list) {
            InstallTarget target;
            target.ecosystem = Ecosystem::PyPI;
            target.name = entry.at("name").get<std::string>();
            target.version = entry.at("version").get<std::string>();
            targets.insert(std::move(target));
        }
    } catch (const nlohmann::json::exception& e) {
        return Result<TargetSet>::err(Error(ErrorCode::PARSE_ERROR,
            std::string("malformed pip list output: ") + e.what()));
    }
    return Result<TargetSet>::ok(std::move(targets));
}

std::optional<Version> parse_pip_version(const std::string& output) {
    auto tokens = text::tokenize(output);
    if (tokens.size() < 2 || tokens[0] != "pip") return std::nullopt;
    return parse_manager_version(tokens[1]);
}

// ============================================================================
// PipManager
// ============================================================================

Version PipManager::minVersion() const {
    return Version(22, 2, 0);
}

const std::set<std::string>& PipManager::installishSubcommands() const {
    static const std::set<std::string> kSubcommands = {"install"};
    return kSubcommands;
}

Result<Version> PipManager::queryVersion() const {
    Command argv = invocation();
    argv.push_back("--version");

    auto proc = runCaptured(argv);
    if (proc.isErr()) {
        return Result<Version>::err(proc.error());
    }
    if (!proc.value().succeeded()) {
        return Result<Version>::err(Error(ErrorCode::PROCESS_FAILED,
            "failed to query pip version: " + text::trim(proc.value().err)));
    }

    auto version = parse_pip_version(proc.value().out);
    if (!version) {
        return Result<Version>::err(Error(ErrorCode::PARSE_ERROR,
            "failed to parse pip version output: " + text::trim(proc.value().out)));
    }
    return Result<Version>::ok(*version);
}

Result<TargetSet> PipManager::resolveInstallTargets(const Command& command) const {
    auto argv = normalizeCommand(command);
    if (argv.isErr()) {
        return Result<TargetSet>::err(argv.error());
    }
    if (!isInstallish(command) || installsNothing(command)) {
        return Result<TargetSet>::ok(TargetSet{});
    }

    Command dry_run = argv.value();
    dry_run.insert(dry_run.end(), {"--dry-run", "--quiet", "--report", "-"});
    spdlog::debug("Resolving pip targets with {}", format_command(dry_run));

    auto proc = runCaptured(dry_run);
    if (proc.isErr()) {
        return Result<TargetSet>::err(proc.error());
    }
    if (proc.value().exit_code != 0) {
        spdlog::info("The pip command results in error: nothing will be installed");
        return Result<TargetSet>::ok(TargetSet{});
    }

    return parse_pip_report(proc.value().out);
}

Result<TargetSet> PipManager::listInstalledPackages() const {
    Command argv = invocation();
    argv.insert(argv.end(), {"list", "--format", "json"});

    auto proc = runCaptured(argv);
    if (proc.isErr()) {
        return Result<TargetSet>::err(proc.error());
    }
    if (!proc.value().succeeded()) {
        return Result<TargetSet>::err(Error(ErrorCode::PROCESS_FAILED,
            "failed to list installed pip packages: " + text::trim(proc.value().err)));
    }
    return parse_pip_list(proc.value().out);
}

} // namespace scfw
