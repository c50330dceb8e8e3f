#include "scfw/package_manager.hpp"
#include "scfw/cancellation.hpp"
#include "scfw/managers.hpp"
#include "scfw/platform.hpp"
#include "scfw/process.hpp"

#include <spdlog/spdlog.h>

namespace scfw {

// ============================================================================
// PackageManager
// ============================================================================

std::optional<std::string> PackageManager::subcommandOf(const Command& command) {
    for (size_t i = 1; i < command.size(); ++i) {
        if (!command[i].empty() && command[i][0] != '-') {
            return command[i];
        }
    }
    return std::nullopt;
}

bool PackageManager::isInstallish(const Command& command) const {
    auto sub = subcommandOf(command);
    return sub && installishSubcommands().count(*sub) > 0;
}

bool PackageManager::installsNothing(const Command& command) const {
    for (size_t i = 1; i < command.size(); ++i) {
        const auto& arg = command[i];
        if (arg == "-h" || arg == "--help" || arg == "--dry-run") return true;
    }
    return false;
}

Result<Command> PackageManager::normalizeCommand(const Command& command) const {
    if (command.empty()) {
        return Result<Command>::err(Error(ErrorCode::INVALID_COMMAND,
            "received empty " + name() + " command line"));
    }
    if (command[0] != name()) {
        return Result<Command>::err(Error(ErrorCode::INVALID_COMMAND,
            "received invalid " + name() + " command line: " + format_command(command)));
    }

    Command normalized = invocation();
    normalized.insert(normalized.end(), command.begin() + 1, command.end());
    return Result<Command>::ok(std::move(normalized));
}

Result<ProcessResult> PackageManager::runCaptured(const Command& argv) {
    ProcessOptions options;
    options.cancel = &interrupt_token();

    auto result = run_process(argv, options);
    if (result.isOk() && result.value().cancelled) {
        return Result<ProcessResult>::err(Error(ErrorCode::CANCELLED,
            "interrupted while running " + format_command(argv)));
    }
    return result;
}

Result<int> PackageManager::runCommand(const Command& command) const {
    auto argv = normalizeCommand(command);
    if (argv.isErr()) {
        return Result<int>::err(argv.error());
    }

    spdlog::debug("Running {}", format_command(argv.value()));
    ProcessOptions options;
    options.capture = false;
    auto result = run_process(argv.value(), options);
    if (result.isErr()) {
        return Result<int>::err(result.error());
    }
    return Result<int>::ok(result.value().exit_code);
}

// ============================================================================
// Factory
// ============================================================================

namespace {

Result<std::string> locate(const std::vector<std::string>& candidates, const std::string& what) {
    for (const auto& candidate : candidates) {
        if (candidate.empty()) continue;
        auto found = find_executable(candidate);
        if (found) return Result<std::string>::ok(*found);
    }
    return Result<std::string>::err(Error(ErrorCode::EXECUTABLE_NOT_FOUND,
        "failed to find " + what + " executable"));
}

} // namespace

Result<std::unique_ptr<PackageManager>> make_package_manager(
    ManagerKind kind, const std::optional<std::string>& executable) {
    using Ptr = std::unique_ptr<PackageManager>;

    std::vector<std::string> candidates;
    std::string what = manager_kind_to_string(kind);

    if (executable) {
        candidates.push_back(*executable);
        what = *executable;
    } else if (kind == ManagerKind::Pip) {
        what = "Python";
        if (auto venv = get_env("VIRTUAL_ENV")) {
            candidates.push_back(join_path(*venv, "bin/python"));
        }
        candidates.push_back("python3");
        candidates.push_back("python");
    } else {
        candidates.push_back(what);
    }

    auto path = locate(candidates, what);
    if (path.isErr()) {
        return Result<Ptr>::err(path.error());
    }

    switch (kind) {
        case ManagerKind::Pip:
            return Result<Ptr>::ok(std::make_unique<PipManager>(path.value()));
        case ManagerKind::Npm:
            return Result<Ptr>::ok(std::make_unique<NpmManager>(path.value()));
        case ManagerKind::Poetry:
            return Result<Ptr>::ok(std::make_unique<PoetryManager>(path.value()));
    }
    return Result<Ptr>::err(Error(ErrorCode::INVALID_COMMAND, "unsupported package manager"));
}

} // namespace scfw
