#include "scfw/dry_run_parsers.hpp"
#include "scfw/managers.hpp"
#include "scfw/process.hpp"
#include "scfw/text_utils.hpp"

#include <cctype>

#include <spdlog/spdlog.h>

namespace scfw {

namespace {

constexpr const char* kOperationsHeader = "Package operations:";
constexpr const char* kCurrentProject = "Installing the current project: ";

constexpr size_t kMaxCountDigits = 9;

// "3 installs, 1 update, 0 removals, 2 skipped" -> installs + updates.
// Skipped operations are not part of the install and update counts.
std::optional<size_t> parse_operation_counts(const std::string& summary) {
    size_t total = 0;
    for (const auto& part : text::split(summary, ',')) {
        auto tokens = text::tokenize(part);
        if (tokens.size() < 2) return std::nullopt;
        if (tokens[0].empty() || tokens[0].size() > kMaxCountDigits) return std::nullopt;
        for (char c : tokens[0]) {
            if (!std::isdigit(static_cast<unsigned char>(c))) return std::nullopt;
        }
        size_t count = std::stoul(tokens[0]);
        if (text::starts_with(tokens[1], "install") || text::starts_with(tokens[1], "update")) {
            total += count;
        }
    }
    return total;
}

// "name (inside)" -> {name, inside}
std::optional<std::pair<std::string, std::string>> split_operation(const std::string& rest) {
    size_t open = rest.find(" (");
    size_t close = rest.rfind(')');
    if (open == std::string::npos || close == std::string::npos || close < open + 2) {
        return std::nullopt;
    }
    std::string name = text::trim(rest.substr(0, open));
    std::string inside = text::trim(rest.substr(open + 2, close - open - 2));
    if (name.empty() || inside.empty()) return std::nullopt;
    return std::make_pair(name, inside);
}

} // namespace

// ============================================================================
// Parsers
// ============================================================================

Result<TargetSet> parse_poetry_dry_run(const std::string& output) {
    TargetSet targets;
    std::optional<size_t> expected;
    size_t operations = 0;

    for (const auto& raw : text::split_lines(output)) {
        std::string line = text::trim(raw);
        if (line.empty()) continue;

        if (text::starts_with(line, kOperationsHeader)) {
            expected = parse_operation_counts(line.substr(std::string(kOperationsHeader).size()));
            if (!expected) {
                return Result<TargetSet>::err(Error(ErrorCode::PARSE_ERROR,
                    "failed to parse poetry operations summary: " + line));
            }
            continue;
        }

        // Operations are bulleted; "Installing dependencies from lock file" is not
        bool bullet = text::starts_with(line, "- ");
        if (bullet) {
            line = text::trim(line.substr(2));
        }

        bool current_project = text::starts_with(line, kCurrentProject);
        bool installing = bullet && !current_project && text::starts_with(line, "Installing ");
        bool updating = bullet &&
            (text::starts_with(line, "Updating ") || text::starts_with(line, "Downgrading "));
        if (!current_project && !installing && !updating) continue;

        std::string rest;
        if (current_project) {
            rest = line.substr(std::string(kCurrentProject).size());
        } else {
            rest = line.substr(line.find(' ') + 1);
        }

        // "...): Skipped for the following reason: ..."
        bool skipped = line.find("Skipped") != std::string::npos;
        size_t colon = rest.find("): ");
        if (colon != std::string::npos) {
            rest = rest.substr(0, colon + 1);
        }

        auto op = split_operation(rest);
        if (!op) {
            return Result<TargetSet>::err(Error(ErrorCode::PARSE_ERROR,
                "failed to parse poetry operation: " + line));
        }

        if (skipped) continue;
        if (!current_project) ++operations;

        InstallTarget target;
        target.ecosystem = Ecosystem::PyPI;
        target.name = op->first;

        if (updating) {
            size_t arrow = op->second.find("->");
            if (arrow == std::string::npos) {
                return Result<TargetSet>::err(Error(ErrorCode::PARSE_ERROR,
                    "failed to parse poetry update: " + line));
            }
            auto tokens = text::tokenize(op->second.substr(arrow + 2));
            if (tokens.empty()) {
                return Result<TargetSet>::err(Error(ErrorCode::PARSE_ERROR,
                    "failed to parse poetry update: " + line));
            }
            target.version = tokens[0];
            if (tokens.size() > 1) {
                target.source_hint = text::join(
                    std::vector<std::string>(tokens.begin() + 1, tokens.end()), " ");
            }
        } else {
            auto tokens = text::tokenize(op->second);
            target.version = tokens[0];
            if (tokens.size() > 1) {
                target.source_hint = text::join(
                    std::vector<std::string>(tokens.begin() + 1, tokens.end()), " ");
            }
        }

        targets.insert(std::move(target));
    }

    if (expected && *expected != operations) {
        return Result<TargetSet>::err(Error(ErrorCode::PARSE_ERROR,
            "poetry announced " + std::to_string(*expected) + " install/update operations but " +
            std::to_string(operations) + " were parsed"));
    }

    return Result<TargetSet>::ok(std::move(targets));
}

Result<TargetSet> parse_poetry_show(const std::string& output) {
    TargetSet targets;
    for (const auto& line : text::split_lines(output)) {
        auto tokens = text::tokenize(line);
        if (tokens.empty()) continue;
        if (tokens.size() < 2) {
            return Result<TargetSet>::err(Error(ErrorCode::PARSE_ERROR,
                "failed to parse poetry show line: " + line));
        }
        if (tokens[1] == "(!)") {
            spdlog::debug("Skipping poetry package {}: not installed", tokens[0]);
            continue;
        }

        InstallTarget target;
        target.ecosystem = Ecosystem::PyPI;
        target.name = tokens[0];
        target.version = tokens[1];
        targets.insert(std::move(target));
    }
    return Result<TargetSet>::ok(std::move(targets));
}

std::optional<Version> parse_poetry_version(const std::string& output) {
    auto tokens = text::tokenize(output);
    for (size_t i = 0; i + 1 < tokens.size(); ++i) {
        if (tokens[i] == "(version" || tokens[i] == "version") {
            std::string value = tokens[i + 1];
            if (!value.empty() && value.back() == ')') value.pop_back();
            return parse_manager_version(value);
        }
    }
    return std::nullopt;
}

// ============================================================================
// PoetryManager
// ============================================================================

Version PoetryManager::minVersion() const {
    return Version(1, 7, 0);
}

const std::set<std::string>& PoetryManager::installishSubcommands() const {
    static const std::set<std::string> kSubcommands = {"add", "install", "sync", "update"};
    return kSubcommands;
}

bool PoetryManager::installsNothing(const Command& command) const {
    if (PackageManager::installsNothing(command)) return true;
    for (size_t i = 1; i < command.size(); ++i) {
        if (command[i] == "-V" || command[i] == "--version") return true;
    }
    return false;
}

Result<Version> PoetryManager::queryVersion() const {
    auto proc = runCaptured({executable_, "--version", "--no-ansi"});
    if (proc.isErr()) {
        return Result<Version>::err(proc.error());
    }
    if (!proc.value().succeeded()) {
        return Result<Version>::err(Error(ErrorCode::PROCESS_FAILED,
            "failed to query poetry version: " + text::trim(proc.value().err)));
    }

    auto version = parse_poetry_version(proc.value().out);
    if (!version) {
        return Result<Version>::err(Error(ErrorCode::PARSE_ERROR,
            "failed to parse poetry version output: " + text::trim(proc.value().out)));
    }
    return Result<Version>::ok(*version);
}

Result<TargetSet> PoetryManager::resolveInstallTargets(const Command& command) const {
    auto argv = normalizeCommand(command);
    if (argv.isErr()) {
        return Result<TargetSet>::err(argv.error());
    }
    if (!isInstallish(command) || installsNothing(command)) {
        return Result<TargetSet>::ok(TargetSet{});
    }

    Command dry_run = argv.value();
    dry_run.insert(dry_run.end(), {"--dry-run", "--no-ansi"});
    spdlog::debug("Resolving poetry targets with {}", format_command(dry_run));

    auto proc = runCaptured(dry_run);
    if (proc.isErr()) {
        return Result<TargetSet>::err(proc.error());
    }
    if (proc.value().exit_code != 0) {
        spdlog::info("The poetry command results in error: nothing will be installed");
        return Result<TargetSet>::ok(TargetSet{});
    }

    return parse_poetry_dry_run(proc.value().out);
}

Result<TargetSet> PoetryManager::listInstalledPackages() const {
    auto proc = runCaptured({executable_, "show", "--no-ansi"});
    if (proc.isErr()) {
        return Result<TargetSet>::err(proc.error());
    }
    if (!proc.value().succeeded()) {
        return Result<TargetSet>::err(Error(ErrorCode::PROCESS_FAILED,
            "failed to list installed poetry packages: " + text::trim(proc.value().err)));
    }
    return parse_poetry_show(proc.value().out);
}

} // namespace scfw
