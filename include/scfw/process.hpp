#pragma once

/**
 * @file process.hpp
 * @brief Synchronous external process execution
 *
 * Package managers are treated as opaque external processes. run_process()
 * spawns one with fork/execvp, optionally captures stdout and stderr, enforces
 * an optional timeout and honours a cancellation token. A child that is timed
 * out or cancelled is sent SIGTERM, then SIGKILL.
 */

#include "scfw/cancellation.hpp"
#include "scfw/result.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace scfw {

// ============================================================================
// Process Options and Result
// ============================================================================

struct ProcessOptions {
    // Capture stdout/stderr into the result; stdin is /dev/null.
    // When false the child inherits the caller's standard streams.
    bool capture = true;

    // Working directory for the child (empty: inherit)
    std::string cwd;

    // Kill the child once this much time has elapsed
    std::optional<std::chrono::milliseconds> timeout;

    // Kill the child once this token is cancelled
    const CancellationToken* cancel = nullptr;
};

struct ProcessResult {
    int exit_code = -1;       // 128 + signal if terminated by a signal
    std::string out;
    std::string err;
    bool timed_out = false;
    bool cancelled = false;

    bool succeeded() const { return exit_code == 0 && !timed_out && !cancelled; }
};

/**
 * @brief Run a process to completion
 * @param argv argv[0] is the executable (searched on PATH if it has no '/')
 * @param options Capture, cwd, timeout and cancellation settings
 * @return ProcessResult, or EXECUTABLE_NOT_FOUND / PROCESS_FAILED if the
 *         process could not be started at all
 *
 * A nonzero exit code is not an error at this level; callers decide.
 */
Result<ProcessResult> run_process(const std::vector<std::string>& argv,
                                  const ProcessOptions& options = {});

// Render argv for log messages
std::string format_command(const std::vector<std::string>& argv);

} // namespace scfw
