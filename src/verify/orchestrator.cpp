#include "scfw/orchestrator.hpp"

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include <spdlog/spdlog.h>

namespace scfw {

namespace {

constexpr std::chrono::milliseconds kWaitSlice{50};

std::atomic<size_t> g_abandoned{0};

// Shared between the orchestrator and one verifier thread; outlives an
// abandoned thread because both hold a reference.
struct TaskState {
    std::mutex mutex;
    std::condition_variable cv;
    bool done = false;
    bool abandoned = false;
    std::optional<Result<std::vector<Finding>>> result;
    std::string exception;
};

void run_task(const VerifierPtr& verifier, const std::shared_ptr<const TargetSet>& targets,
              const std::shared_ptr<TaskState>& state) {
    std::optional<Result<std::vector<Finding>>> result;
    std::string exception;
    try {
        result.emplace(verifier->verify(*targets));
    } catch (const std::exception& e) {
        exception = e.what();
        if (exception.empty()) exception = "unknown exception";
    } catch (...) {
        exception = "non-standard exception";
    }

    std::lock_guard<std::mutex> lock(state->mutex);
    state->result = std::move(result);
    state->exception = std::move(exception);
    state->done = true;
    if (state->abandoned) {
        g_abandoned.fetch_sub(1);
    }
    state->cv.notify_all();
}

} // namespace

Result<VerificationReport> verify_targets(const std::vector<VerifierPtr>& verifiers,
                                          const TargetSet& targets,
                                          const OrchestratorOptions& options) {
    VerificationReport report;
    report.set_target_count(targets.size());

    if (targets.empty() || verifiers.empty()) {
        return Result<VerificationReport>::ok(std::move(report));
    }

    auto shared_targets = std::make_shared<const TargetSet>(targets);
    std::vector<std::shared_ptr<TaskState>> states;
    std::vector<std::thread> threads;

    for (const auto& verifier : verifiers) {
        auto state = std::make_shared<TaskState>();
        states.push_back(state);
        threads.emplace_back(run_task, verifier, shared_targets, state);
    }

    auto deadline = std::chrono::steady_clock::now() + options.timeout;
    bool cancelled = false;

    for (size_t i = 0; i < verifiers.size(); ++i) {
        auto& state = states[i];
        std::unique_lock<std::mutex> lock(state->mutex);
        while (!state->done) {
            if (options.cancel && options.cancel->cancelled()) {
                cancelled = true;
                break;
            }
            auto now = std::chrono::steady_clock::now();
            if (now >= deadline) break;
            auto wake = std::min(deadline, now + kWaitSlice);
            state->cv.wait_until(lock, wake);
        }
        if (cancelled) break;
    }

    // Join what finished; abandon the rest
    std::vector<bool> finished(threads.size(), false);
    for (size_t i = 0; i < threads.size(); ++i) {
        {
            std::lock_guard<std::mutex> lock(states[i]->mutex);
            finished[i] = states[i]->done;
            if (!finished[i]) {
                states[i]->abandoned = true;
                g_abandoned.fetch_add(1);
            }
        }
        if (finished[i]) {
            threads[i].join();
        } else {
            threads[i].detach();
        }
    }

    if (cancelled) {
        return Result<VerificationReport>::err(Error(ErrorCode::CANCELLED,
            "verification interrupted"));
    }

    for (size_t i = 0; i < verifiers.size(); ++i) {
        const std::string name = verifiers[i]->name();
        if (!finished[i]) {
            spdlog::warn("Verifier {} timed out after {} ms", name, options.timeout.count());
            report.add_failure({name, "timed out after " +
                                std::to_string(options.timeout.count()) + " ms"});
            continue;
        }

        // The thread has been joined; its state is no longer shared
        auto& state = *states[i];
        if (!state.exception.empty()) {
            spdlog::warn("Verifier {} raised an exception: {}", name, state.exception);
            report.add_failure({name, "internal error: " + state.exception});
            continue;
        }
        if (state.result->isErr()) {
            spdlog::warn("Verifier {} failed: {}", name, state.result->error().message());
            report.add_failure({name, state.result->error().message()});
            continue;
        }

        report.add_verifier_run(name);
        for (auto& finding : state.result->value()) {
            if (!targets.contains(finding.target)) {
                spdlog::warn("Dropping finding from {} for unrequested target {}",
                             name, finding.target.display());
                continue;
            }
            if (finding.verifier.empty()) finding.verifier = name;
            report.add_finding(std::move(finding));
        }
    }

    return Result<VerificationReport>::ok(std::move(report));
}

size_t running_abandoned_verifiers() {
    return g_abandoned.load();
}

} // namespace scfw
