#include "scfw/verifier_registry.hpp"
#include "scfw/platform.hpp"
#include "scfw/text_utils.hpp"
#include "scfw/verifier_plugin.h"
#include "scfw/verifiers.hpp"

#include <memory>
#include <mutex>
#include <unordered_set>

#include <dlfcn.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace scfw {

namespace {

nlohmann::json targets_to_json(const TargetSet& targets) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& t : targets) {
        arr.push_back({
            {"ecosystem", ecosystem_to_string(t.ecosystem)},
            {"name", t.name},
            {"version", t.version},
        });
    }
    return arr;
}

Result<std::vector<Finding>> findings_from_json(const std::string& text,
                                                const std::string& verifier) {
    std::vector<Finding> findings;
    if (text::trim(text).empty()) {
        return Result<std::vector<Finding>>::ok(std::move(findings));
    }

    try {
        auto j = nlohmann::json::parse(text);
        if (!j.is_array()) {
            return Result<std::vector<Finding>>::err(Error(ErrorCode::VERIFIER_FAILED,
                "findings must be a JSON array"));
        }
        for (const auto& item : j) {
            auto ecosystem = parse_ecosystem(item.at("ecosystem").get<std::string>());
            auto severity = parse_severity(item.at("severity").get<std::string>());
            if (!ecosystem || !severity) {
                return Result<std::vector<Finding>>::err(Error(ErrorCode::VERIFIER_FAILED,
                    "finding with invalid ecosystem or severity"));
            }
            Finding f;
            f.target.ecosystem = *ecosystem;
            f.target.name = item.at("name").get<std::string>();
            f.target.version = item.at("version").get<std::string>();
            f.severity = *severity;
            f.message = item.at("message").get<std::string>();
            f.detail = item.value("detail", "");
            f.verifier = verifier;
            findings.push_back(std::move(f));
        }
    } catch (const nlohmann::json::exception& e) {
        return Result<std::vector<Finding>>::err(Error(ErrorCode::VERIFIER_FAILED,
            std::string("malformed findings: ") + e.what()));
    }
    return Result<std::vector<Finding>>::ok(std::move(findings));
}

// Verifier backed by a loaded plugin; keeps the library open while alive
class PluginVerifier : public Verifier {
public:
    PluginVerifier(std::shared_ptr<void> handle, const scfw_verifier_plugin* plugin)
        : handle_(std::move(handle)), plugin_(plugin), name_(plugin->name) {}

    std::string name() const override { return name_; }

    Result<std::vector<Finding>> verify(const TargetSet& targets) override {
        std::string input = targets_to_json(targets).dump();
        char* output = nullptr;
        int rc = plugin_->verify(input.c_str(), &output);

        std::string text;
        if (output) {
            text = output;
            if (plugin_->free_string) plugin_->free_string(output);
        }

        if (rc != 0) {
            std::string reason = text.empty()
                ? "plugin returned code " + std::to_string(rc)
                : text;
            return Result<std::vector<Finding>>::err(Error(ErrorCode::VERIFIER_FAILED, reason));
        }
        return findings_from_json(text, name_);
    }

private:
    std::shared_ptr<void> handle_;
    const scfw_verifier_plugin* plugin_;
    std::string name_;
};

} // namespace

bool is_plugin_file(const std::string& path) {
    return text::ends_with(path, ".so") || text::ends_with(path, ".dylib");
}

Result<VerifierPtr> load_verifier_plugin(const std::string& path) {
    void* raw = ::dlopen(path.c_str(), RTLD_NOW | RTLD_LOCAL);
    if (!raw) {
        const char* err = ::dlerror();
        return Result<VerifierPtr>::err(Error(ErrorCode::VERIFIER_FAILED,
            std::string("dlopen failed: ") + (err ? err : "unknown error")));
    }
    std::shared_ptr<void> handle(raw, [](void* h) { ::dlclose(h); });

    ::dlerror();
    void* symbol = ::dlsym(raw, SCFW_VERIFIER_ENTRY_SYMBOL);
    if (!symbol) {
        return Result<VerifierPtr>::err(Error(ErrorCode::VERIFIER_FAILED,
            std::string("missing symbol ") + SCFW_VERIFIER_ENTRY_SYMBOL));
    }

    auto entry = reinterpret_cast<scfw_load_verifier_fn>(symbol);
    const scfw_verifier_plugin* plugin = entry();
    if (!plugin) {
        return Result<VerifierPtr>::err(Error(ErrorCode::VERIFIER_FAILED,
            "plugin returned no verifier"));
    }
    if (plugin->abi_version != SCFW_VERIFIER_ABI_VERSION) {
        return Result<VerifierPtr>::err(Error(ErrorCode::VERIFIER_FAILED,
            "ABI version mismatch: expected " + std::to_string(SCFW_VERIFIER_ABI_VERSION) +
            ", got " + std::to_string(plugin->abi_version)));
    }
    if (!plugin->name || !*plugin->name || !plugin->verify) {
        return Result<VerifierPtr>::err(Error(ErrorCode::VERIFIER_FAILED,
            "plugin is missing a name or verify function"));
    }

    return Result<VerifierPtr>::ok(std::make_shared<PluginVerifier>(std::move(handle), plugin));
}

// ============================================================================
// VerifierRegistry
// ============================================================================

bool VerifierRegistry::add(VerifierPtr verifier, const std::string& origin) {
    std::string name = verifier->name();
    for (const auto& existing : verifiers_) {
        if (existing->name() == name) {
            add_failure({origin, "duplicate verifier name '" + name + "'"});
            return false;
        }
    }
    spdlog::debug("Registered verifier {} ({})", name, origin);
    verifiers_.push_back(std::move(verifier));
    return true;
}

void VerifierRegistry::add_failure(LoadFailure failure) {
    spdlog::warn("Failed to load verifier {}: {}", failure.path, failure.reason);
    failures_.push_back(std::move(failure));
}

std::vector<std::string> VerifierRegistry::names() const {
    std::vector<std::string> result;
    for (const auto& v : verifiers_) {
        result.push_back(v->name());
    }
    return result;
}

VerifierRegistry VerifierRegistry::discover(const RegistryOptions& options) {
    VerifierRegistry registry;

    if (options.include_builtins) {
        for (auto& verifier : builtin_verifiers(options.scfw_home, options.http)) {
            registry.add(std::move(verifier));
        }
    }

    std::unordered_set<std::string> seen_dirs;
    for (const auto& dir : options.plugin_dirs) {
        if (dir.empty() || !seen_dirs.insert(dir).second) continue;
        if (!is_directory(dir)) {
            spdlog::debug("Verifier directory {} does not exist", dir);
            continue;
        }
        for (const auto& path : list_directory(dir)) {
            if (!is_plugin_file(path)) continue;
            auto loaded = load_verifier_plugin(path);
            if (loaded.isErr()) {
                registry.add_failure({path, loaded.error().message()});
                continue;
            }
            registry.add(std::move(loaded.value()), path);
        }
    }

    return registry;
}

const VerifierRegistry& cached_registry(const RegistryOptions& options) {
    static std::once_flag once;
    static std::unique_ptr<VerifierRegistry> registry;
    std::call_once(once, [&options] {
        registry = std::make_unique<VerifierRegistry>(VerifierRegistry::discover(options));
    });
    return *registry;
}

} // namespace scfw
