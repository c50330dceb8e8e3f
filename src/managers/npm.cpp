#include "scfw/dry_run_parsers.hpp"
#include "scfw/managers.hpp"
#include "scfw/platform.hpp"
#include "scfw/process.hpp"
#include "scfw/text_utils.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace scfw {

// ============================================================================
// Parsers
// ============================================================================

Result<NpmDryRunLog> parse_npm_dry_run_log(const std::string& log) {
    NpmDryRunLog parsed;

    for (const auto& line : text::split_lines(log)) {
        auto tokens = text::tokenize(line);
        if (tokens.size() < 3) continue;

        bool silly = tokens[1] == "sill" || tokens[1] == "silly";

        if (silly && tokens.size() >= 4 && (tokens[2] == "ADD" || tokens[2] == "CHANGE")) {
            parsed.handles.push_back(tokens[3]);
            continue;
        }

        if (tokens[2] != "placeDep") continue;
        if (tokens.size() < 5) {
            return Result<NpmDryRunLog>::err(Error(ErrorCode::PARSE_ERROR,
                "truncated npm placeDep line: " + line));
        }

        // name@version, where a scoped name itself starts with '@'
        const std::string& spec = tokens[4];
        size_t at = spec.rfind('@');
        if (at == std::string::npos || at == 0 || at + 1 == spec.size()) {
            return Result<NpmDryRunLog>::err(Error(ErrorCode::PARSE_ERROR,
                "failed to parse npm installation target specification '" + spec + "'"));
        }

        InstallTarget target;
        target.ecosystem = Ecosystem::Npm;
        target.name = spec.substr(0, at);
        target.version = spec.substr(at + 1);
        parsed.placed.push_back(std::move(target));
    }

    return Result<NpmDryRunLog>::ok(std::move(parsed));
}

std::string npm_handle_name(const std::string& handle) {
    static const std::string kMarker = "node_modules/";
    size_t pos = handle.rfind(kMarker);
    if (pos == std::string::npos) return handle;
    return handle.substr(pos + kMarker.size());
}

Result<TargetSet> match_npm_targets(const NpmDryRunLog& log, const std::string& lockfile_json) {
    TargetSet targets;
    if (log.handles.empty()) {
        return Result<TargetSet>::ok(std::move(targets));
    }

    nlohmann::json lock_packages = nlohmann::json::object();
    if (!text::trim(lockfile_json).empty()) {
        try {
            auto lock = nlohmann::json::parse(lockfile_json);
            if (lock.contains("packages") && lock["packages"].is_object()) {
                lock_packages = lock["packages"];
            }
        } catch (const nlohmann::json::parse_error& e) {
            spdlog::warn("Failed to read package lockfile: {}", e.what());
        }
    }

    std::vector<bool> consumed(log.placed.size(), false);

    for (const auto& handle : log.handles) {
        std::string name = npm_handle_name(handle);

        bool matched = false;
        for (size_t i = 0; i < log.placed.size(); ++i) {
            if (!consumed[i] && log.placed[i].name == name) {
                consumed[i] = true;
                matched = true;
                spdlog::debug("Matched npm installation target '{}' to placed dependency {}",
                              name, log.placed[i].display());
                targets.insert(log.placed[i]);
                break;
            }
        }
        if (matched) continue;

        auto entry = lock_packages.find(handle);
        if (entry != lock_packages.end() && entry->is_object()) {
            std::string version = entry->value("version", "");
            if (version.empty()) {
                return Result<TargetSet>::err(Error(ErrorCode::PARSE_ERROR,
                    "malformed lockfile entry for npm installation target '" + name + "'"));
            }
            spdlog::debug("Matched npm installation target '{}' to lockfile entry '{}'", name, handle);
            InstallTarget target;
            target.ecosystem = Ecosystem::Npm;
            target.name = name;
            target.version = version;
            targets.insert(std::move(target));
            continue;
        }

        return Result<TargetSet>::err(Error(ErrorCode::PARSE_ERROR,
            "failed to resolve npm installation target '" + name + "' to a precise version"));
    }

    std::vector<std::string> leftover;
    for (size_t i = 0; i < log.placed.size(); ++i) {
        if (!consumed[i]) leftover.push_back(log.placed[i].display());
    }
    if (!leftover.empty()) {
        return Result<TargetSet>::err(Error(ErrorCode::PARSE_ERROR,
            "failed to match placed dependencies to npm installation targets: " +
            text::join(leftover, ", ")));
    }

    return Result<TargetSet>::ok(std::move(targets));
}

namespace {

void flatten_dependencies(const nlohmann::json& dependencies, TargetSet& targets) {
    for (auto it = dependencies.begin(); it != dependencies.end(); ++it) {
        const auto& data = it.value();
        if (!data.is_object()) continue;

        if (data.contains("dependencies") && data["dependencies"].is_object()) {
            flatten_dependencies(data["dependencies"], targets);
        }

        if (!data.contains("version") || !data["version"].is_string()) {
            spdlog::debug("Skipping npm package {} with no installed version", it.key());
            continue;
        }

        InstallTarget target;
        target.ecosystem = Ecosystem::Npm;
        target.name = it.key();
        target.version = data["version"].get<std::string>();
        targets.insert(std::move(target));
    }
}

} // namespace

Result<TargetSet> parse_npm_list(const std::string& list_json) {
    TargetSet targets;
    try {
        auto list = nlohmann::json::parse(list_json);
        if (!list.is_object()) {
            return Result<TargetSet>::err(Error(ErrorCode::PARSE_ERROR,
                "npm list output is not a JSON object"));
        }
        if (list.contains("dependencies") && list["dependencies"].is_object()) {
            flatten_dependencies(list["dependencies"], targets);
        }
    } catch (const nlohmann::json::exception& e) {
        return Result<TargetSet>::err(Error(ErrorCode::PARSE_ERROR,
            std::string("malformed npm list output: ") + e.what()));
    }
    return Result<TargetSet>::ok(std::move(targets));
}

std::optional<Version> parse_npm_version(const std::string& output) {
    auto tokens = text::tokenize(output);
    if (tokens.empty()) return std::nullopt;
    return parse_manager_version(tokens[0]);
}

// ============================================================================
// NpmManager
// ============================================================================

Version NpmManager::minVersion() const {
    return Version(7, 0, 0);
}

const std::set<std::string>& NpmManager::installishSubcommands() const {
    // https://docs.npmjs.com/cli/v10/commands/npm-install
    static const std::set<std::string> kSubcommands = {
        "install", "add", "i", "in", "ins", "inst", "insta", "instal",
        "isnt", "isnta", "isntal", "isntall",
    };
    return kSubcommands;
}

bool NpmManager::isInstallish(const Command& command) const {
    const auto& aliases = installishSubcommands();
    for (size_t i = 1; i < command.size(); ++i) {
        if (aliases.count(command[i])) return true;
    }
    return false;
}

Result<Version> NpmManager::queryVersion() const {
    auto proc = runCaptured({executable_, "--version"});
    if (proc.isErr()) {
        return Result<Version>::err(proc.error());
    }
    if (!proc.value().succeeded()) {
        return Result<Version>::err(Error(ErrorCode::PROCESS_FAILED,
            "failed to query npm version: " + text::trim(proc.value().err)));
    }

    auto version = parse_npm_version(proc.value().out);
    if (!version) {
        return Result<Version>::err(Error(ErrorCode::PARSE_ERROR,
            "failed to parse npm version output: " + text::trim(proc.value().out)));
    }
    return Result<Version>::ok(*version);
}

std::string NpmManager::readLockfile() const {
    auto proc = runCaptured({executable_, "prefix"});
    if (proc.isErr() || !proc.value().succeeded()) {
        spdlog::warn("Failed to determine the npm project prefix");
        return "";
    }

    std::string prefix = text::trim(proc.value().out);
    if (prefix.empty()) {
        spdlog::debug("'npm prefix' command returned empty output");
        return "";
    }

    std::string path = join_path(prefix, "package-lock.json");
    if (!is_regular_file(path)) {
        spdlog::debug("No package-lock.json file found in current project root");
        return "";
    }

    auto content = read_file(path);
    if (!content) {
        spdlog::warn("Failed to read package lockfile {}", path);
        return "";
    }
    return *content;
}

Result<TargetSet> NpmManager::resolveInstallTargets(const Command& command) const {
    auto argv = normalizeCommand(command);
    if (argv.isErr()) {
        return Result<TargetSet>::err(argv.error());
    }
    if (!isInstallish(command) || installsNothing(command)) {
        return Result<TargetSet>::ok(TargetSet{});
    }

    Command dry_run = argv.value();
    dry_run.insert(dry_run.end(), {"--dry-run", "--loglevel", "silly"});
    spdlog::debug("Resolving npm targets with {}", format_command(dry_run));

    auto proc = runCaptured(dry_run);
    if (proc.isErr()) {
        return Result<TargetSet>::err(proc.error());
    }
    if (proc.value().exit_code != 0) {
        spdlog::info("The npm command results in error: nothing will be installed");
        return Result<TargetSet>::ok(TargetSet{});
    }

    auto log = parse_npm_dry_run_log(proc.value().err);
    if (log.isErr()) {
        return Result<TargetSet>::err(log.error());
    }
    if (log.value().handles.empty()) {
        return Result<TargetSet>::ok(TargetSet{});
    }

    return match_npm_targets(log.value(), readLockfile());
}

Result<TargetSet> NpmManager::listInstalledPackages() const {
    auto proc = runCaptured({executable_, "list", "--all", "--json"});
    if (proc.isErr()) {
        return Result<TargetSet>::err(proc.error());
    }
    if (proc.value().exit_code != 0) {
        if (text::trim(proc.value().out).empty()) {
            return Result<TargetSet>::err(Error(ErrorCode::PROCESS_FAILED,
                "failed to list installed npm packages: " + text::trim(proc.value().err)));
        }
        spdlog::warn("npm list reported problems with the installed packages");
    }
    return parse_npm_list(proc.value().out);
}

} // namespace scfw
