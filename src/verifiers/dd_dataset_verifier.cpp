#include "scfw/verifiers.hpp"
#include "scfw/platform.hpp"
#include "scfw/text_utils.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace scfw {

namespace {

std::string manifest_file_name(Ecosystem ecosystem) {
    return ecosystem == Ecosystem::Npm ? "npm.json" : "pypi.json";
}

std::string manifest_url(Ecosystem ecosystem) {
    return std::string(DatadogMaliciousPackagesVerifier::kDatasetUrl) + "/" +
           text::to_lower(ecosystem_to_string(ecosystem)) + "/manifest.json";
}

} // namespace

Result<std::unordered_set<std::string>> parse_dataset_manifest(const std::string& json_text) {
    using Manifest = std::unordered_set<std::string>;

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(json_text);
    } catch (const nlohmann::json::parse_error& e) {
        return Result<Manifest>::err(Error(ErrorCode::PARSE_ERROR,
            std::string("invalid manifest JSON: ") + e.what()));
    }

    if (!j.is_object()) {
        return Result<Manifest>::err(Error(ErrorCode::PARSE_ERROR,
            "manifest must be a JSON object"));
    }

    Manifest manifest;
    for (auto it = j.begin(); it != j.end(); ++it) {
        if (!it.value().is_array() && !it.value().is_null()) {
            return Result<Manifest>::err(Error(ErrorCode::PARSE_ERROR,
                "versions of '" + it.key() + "' must be an array"));
        }
        manifest.insert(it.key());
    }
    return Result<Manifest>::ok(std::move(manifest));
}

DatadogMaliciousPackagesVerifier::DatadogMaliciousPackagesVerifier(std::string cache_dir,
                                                                   HttpClientPtr http)
    : cache_dir_(std::move(cache_dir)), http_(std::move(http)) {}

std::optional<DatadogMaliciousPackagesVerifier::Manifest>
DatadogMaliciousPackagesVerifier::download(Ecosystem ecosystem, const std::string& cache_path) {
    std::string url = manifest_url(ecosystem);
    auto response = http_->get(url, kDownloadTimeoutMs);
    if (!response.ok()) {
        spdlog::warn("Failed to download {} dataset from {}: {}",
                     ecosystem_to_string(ecosystem), url, response.describe());
        return std::nullopt;
    }

    auto parsed = parse_dataset_manifest(response.body);
    if (parsed.isErr()) {
        spdlog::warn("Discarding downloaded {} dataset: {}",
                     ecosystem_to_string(ecosystem), parsed.error().message());
        return std::nullopt;
    }

    if (!cache_path.empty() && !write_file_atomic(cache_path, response.body)) {
        spdlog::warn("Failed to update cached dataset {}", cache_path);
    }
    return std::move(parsed.value());
}

Result<const DatadogMaliciousPackagesVerifier::Manifest*>
DatadogMaliciousPackagesVerifier::manifest_for(Ecosystem ecosystem) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = manifests_.find(ecosystem);
    if (it != manifests_.end()) {
        return Result<const Manifest*>::ok(&it->second);
    }

    std::string path = cache_dir_.empty() ? "" : join_path(cache_dir_, manifest_file_name(ecosystem));

    if (http_) {
        auto downloaded = download(ecosystem, path);
        if (downloaded) {
            spdlog::debug("Downloaded {} {} dataset entries", downloaded->size(),
                          ecosystem_to_string(ecosystem));
            auto inserted = manifests_.emplace(ecosystem, std::move(*downloaded));
            return Result<const Manifest*>::ok(&inserted.first->second);
        }
    }

    auto content = path.empty() ? std::nullopt : read_file(path);
    if (!content) {
        std::string message = http_
            ? "failed to download " + std::string(ecosystem_to_string(ecosystem)) +
                  " dataset and no local copy is available"
            : "no " + std::string(ecosystem_to_string(ecosystem)) + " dataset manifest at " + path;
        return Result<const Manifest*>::err(Error(ErrorCode::IO_ERROR, message));
    }

    auto parsed = parse_dataset_manifest(*content);
    if (parsed.isErr()) {
        return Result<const Manifest*>::err(parsed.error().withContext(path));
    }

    spdlog::debug("Loaded {} entries from {}", parsed.value().size(), path);
    auto inserted = manifests_.emplace(ecosystem, std::move(parsed.value()));
    return Result<const Manifest*>::ok(&inserted.first->second);
}

Result<std::vector<Finding>> DatadogMaliciousPackagesVerifier::verify(const TargetSet& targets) {
    std::vector<Finding> findings;

    for (const auto& target : targets) {
        auto manifest = manifest_for(target.ecosystem);
        if (manifest.isErr()) {
            return Result<std::vector<Finding>>::err(Error(ErrorCode::VERIFIER_FAILED,
                manifest.error().message()));
        }

        // Version strings are ignored: any release of a listed package is suspect
        if (!manifest.value()->count(target.name)) continue;

        Finding f;
        f.target = target;
        f.severity = FindingSeverity::Critical;
        f.message = "Datadog Security Research has determined that package " +
                    target.name + " is malicious";
        f.verifier = kName;
        findings.push_back(std::move(f));
    }

    return Result<std::vector<Finding>>::ok(std::move(findings));
}

} // namespace scfw
