#pragma once

/**
 * @file verifier_registry.hpp
 * @brief Discovery of built-in verifiers and shared-library plugins
 *
 * Plugins are shared libraries exporting the C ABI in scfw/verifier_plugin.h.
 * They are searched in, by precedence:
 *   1. Directories given explicitly (--verifiers)
 *   2. SCFW_VERIFIERS_PATH (colon-separated)
 *   3. $SCFW_HOME/verifiers
 *
 * A plugin that cannot be loaded is recorded as a LoadFailure and never
 * stops discovery.
 */

#include "scfw/http.hpp"
#include "scfw/result.hpp"
#include "scfw/verifier.hpp"

#include <string>
#include <vector>

namespace scfw {

struct LoadFailure {
    std::string path;
    std::string reason;
};

struct RegistryOptions {
    std::string scfw_home;
    std::vector<std::string> plugin_dirs;   // already in precedence order
    bool include_builtins = true;
    HttpClientPtr http;                     // online data sources; null for offline only
};

class VerifierRegistry {
public:
    VerifierRegistry() = default;

    // Build a registry from built-ins and every plugin on the search path
    static VerifierRegistry discover(const RegistryOptions& options);

    // Register a verifier; a duplicate name is rejected as a load failure
    bool add(VerifierPtr verifier, const std::string& origin = "built-in");

    void add_failure(LoadFailure failure);

    const std::vector<VerifierPtr>& verifiers() const { return verifiers_; }
    const std::vector<LoadFailure>& failures() const { return failures_; }
    std::vector<std::string> names() const;

private:
    std::vector<VerifierPtr> verifiers_;
    std::vector<LoadFailure> failures_;
};

// Load one plugin shared library
Result<VerifierPtr> load_verifier_plugin(const std::string& path);

// True for file names with a shared-library extension (.so, .dylib)
bool is_plugin_file(const std::string& path);

// Discover once per process; later calls return the same registry
const VerifierRegistry& cached_registry(const RegistryOptions& options);

} // namespace scfw
