#pragma once

/**
 * @file verifiers.hpp
 * @brief Built-in verifiers
 *
 * Data locations under SCFW_HOME:
 *
 *   dd_verifier/{npm,pypi}.json          Datadog malicious packages manifests,
 *                                        refreshed from GitHub when online
 *   block_list_verifier/*.yml|*.yaml     User-supplied findings lists
 *   osv_verifier/<ecosystem>/*.json      Offline OSV advisory database; when
 *                                        absent, OSV.dev is queried instead
 */

#include "scfw/http.hpp"
#include "scfw/result.hpp"
#include "scfw/semver.hpp"
#include "scfw/verifier.hpp"

#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace scfw {

// ============================================================================
// Datadog Malicious Packages Dataset
// ============================================================================

class DatadogMaliciousPackagesVerifier : public Verifier {
public:
    static constexpr const char* kName = "DatadogMaliciousPackagesVerifier";
    static constexpr const char* kDatasetUrl =
        "https://raw.githubusercontent.com/DataDog/malicious-software-packages-dataset/main/samples";
    static constexpr long kDownloadTimeoutMs = 5000;

    // With a client, each manifest is downloaded once and written to
    // cache_dir; the cached copy is used when the download fails.
    // Without one, only cached copies are read.
    explicit DatadogMaliciousPackagesVerifier(std::string cache_dir, HttpClientPtr http = nullptr);

    std::string name() const override { return kName; }

    // Every version of a listed package is reported
    Result<std::vector<Finding>> verify(const TargetSet& targets) override;

private:
    using Manifest = std::unordered_set<std::string>;

    Result<const Manifest*> manifest_for(Ecosystem ecosystem);
    std::optional<Manifest> download(Ecosystem ecosystem, const std::string& cache_path);

    std::string cache_dir_;
    HttpClientPtr http_;
    std::mutex mutex_;
    std::map<Ecosystem, Manifest> manifests_;
};

// Package names of a dataset manifest: {"name": ["version", ...], ...}
Result<std::unordered_set<std::string>> parse_dataset_manifest(const std::string& json_text);

// ============================================================================
// Findings Lists
// ============================================================================

/**
 * @brief Merged view of user-supplied findings lists
 *
 * YAML schema:
 * @code
 * findings:
 *   - severity: CRITICAL | WARNING
 *     finding: "message"
 *     packages:
 *       - ecosystem: npm | PyPI
 *         name: react
 *         versions: [18.3.0]     # optional, omitted means every version
 * @endcode
 */
class FindingsMap {
public:
    static constexpr const char* kAnyVersion = "*";

    using Entry = std::pair<FindingSeverity, std::string>;

    static Result<FindingsMap> from_yaml(const std::string& yaml_text);

    void merge(const FindingsMap& other);

    // Findings for every version first, then those for the exact version
    std::vector<Entry> get(Ecosystem ecosystem, const std::string& name,
                           const std::string& version) const;

    bool empty() const { return map_.empty(); }

private:
    // ecosystem -> name -> version (or "*") -> findings
    std::map<Ecosystem, std::map<std::string, std::map<std::string, std::vector<Entry>>>> map_;
};

class FindingsListVerifier : public Verifier {
public:
    static constexpr const char* kName = "FindingsListVerifier";

    // Loads and merges every *.yml / *.yaml file in lists_dir.
    // Files that fail to parse are skipped with a warning.
    explicit FindingsListVerifier(const std::string& lists_dir);
    explicit FindingsListVerifier(FindingsMap findings);

    std::string name() const override { return kName; }
    Result<std::vector<Finding>> verify(const TargetSet& targets) override;

private:
    FindingsMap findings_;
};

// ============================================================================
// OSV Offline Advisories
// ============================================================================

struct OsvRangeEvent {
    enum class Type { Introduced, Fixed, LastAffected };

    Type type;
    Version version;
};

struct OsvAffected {
    Ecosystem ecosystem;
    std::string name;
    std::set<std::string> versions;
    // SEMVER ranges; each is a list of events sorted by version
    std::vector<std::vector<OsvRangeEvent>> semver_ranges;

    bool matches_version(const std::string& version) const;
};

struct OsvAdvisory {
    std::string id;
    std::string summary;
    std::string severity;   // database_specific.severity, optional

    std::vector<OsvAffected> affected;

    bool malicious() const;
    bool affects(const InstallTarget& target) const;
};

// Parse one advisory in OSV schema
Result<OsvAdvisory> parse_osv_advisory(const std::string& json_text);

/**
 * @brief OSV.dev advisories, from an offline database or the OSV.dev API
 *
 * MAL- advisories are CRITICAL, all others WARNING. When the API cannot be
 * reached the target gets a WARNING that asks the user to check OSV.dev.
 */
class OsvVerifier : public Verifier {
public:
    static constexpr const char* kName = "OsvVerifier";
    static constexpr const char* kVulnerabilityUrlPrefix = "https://osv.dev/vulnerability/";
    static constexpr const char* kListUrlPrefix = "https://osv.dev/list";
    static constexpr const char* kQueryUrl = "https://api.osv.dev/v1/query";
    static constexpr long kQueryTimeoutMs = 10000;

    // Offline: <database_dir>/<ecosystem>/*.json
    explicit OsvVerifier(std::string database_dir);
    // Online: POST kQueryUrl per target
    explicit OsvVerifier(HttpClientPtr http);

    std::string name() const override { return kName; }
    Result<std::vector<Finding>> verify(const TargetSet& targets) override;

private:
    Result<const std::vector<OsvAdvisory>*> advisories_for(Ecosystem ecosystem);
    Result<std::vector<OsvAdvisory>> query(const InstallTarget& target);

    std::string database_dir_;
    HttpClientPtr http_;
    std::mutex mutex_;
    std::map<Ecosystem, std::vector<OsvAdvisory>> advisories_;
};

// ============================================================================
// Built-in Discovery
// ============================================================================

/**
 * Instantiate the built-in verifiers.
 *
 * Without an HTTP client only built-ins whose data directory exists under
 * scfw_home are registered. With one, the dataset verifier is always
 * registered and OSV.dev is queried online unless an offline database exists.
 */
std::vector<VerifierPtr> builtin_verifiers(const std::string& scfw_home,
                                           const HttpClientPtr& http = nullptr);

} // namespace scfw
