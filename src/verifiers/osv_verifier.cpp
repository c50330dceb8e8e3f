#include "scfw/verifiers.hpp"
#include "scfw/platform.hpp"
#include "scfw/text_utils.hpp"

#include <algorithm>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace scfw {

namespace {

// PEP 503 normalization for PyPI; npm names are compared verbatim
std::string normalize_name(Ecosystem ecosystem, const std::string& name) {
    if (ecosystem != Ecosystem::PyPI) return name;
    std::string result;
    bool in_separator = false;
    for (char c : text::to_lower(name)) {
        if (c == '-' || c == '_' || c == '.') {
            if (!in_separator) result += '-';
            in_separator = true;
        } else {
            result += c;
            in_separator = false;
        }
    }
    return result;
}

std::optional<Version> parse_event_version(const std::string& version) {
    if (version == "0") return Version(0, 0, 0);
    return parse_version(version);
}

// "events": [{"introduced": "0"}, {"fixed": "4.17.21"}]
std::vector<OsvRangeEvent> parse_semver_events(const nlohmann::json& events, const std::string& id) {
    std::vector<OsvRangeEvent> result;
    if (!events.is_array()) return result;

    for (const auto& event : events) {
        if (!event.is_object()) continue;
        for (auto it = event.begin(); it != event.end(); ++it) {
            OsvRangeEvent::Type type;
            if (it.key() == "introduced") {
                type = OsvRangeEvent::Type::Introduced;
            } else if (it.key() == "fixed") {
                type = OsvRangeEvent::Type::Fixed;
            } else if (it.key() == "last_affected") {
                type = OsvRangeEvent::Type::LastAffected;
            } else {
                continue;
            }
            if (!it.value().is_string()) continue;

            auto version = parse_event_version(it.value().get<std::string>());
            if (!version) {
                spdlog::debug("Ignoring unparseable SEMVER event '{}' in {}",
                              it.value().get<std::string>(), id);
                continue;
            }
            result.push_back(OsvRangeEvent{type, *version});
        }
    }

    std::stable_sort(result.begin(), result.end(),
                     [](const OsvRangeEvent& a, const OsvRangeEvent& b) {
                         return a.version < b.version;
                     });
    return result;
}

Result<OsvAdvisory> advisory_from_json(const nlohmann::json& j) {
    OsvAdvisory advisory;
    advisory.id = j.at("id").get<std::string>();
    if (advisory.id.empty()) {
        return Result<OsvAdvisory>::err(Error(ErrorCode::PARSE_ERROR, "empty advisory id"));
    }
    advisory.summary = j.value("summary", "");
    if (j.contains("database_specific") && j["database_specific"].is_object()) {
        advisory.severity = j["database_specific"].value("severity", "");
    }

    if (j.contains("affected") && j["affected"].is_array()) {
        for (const auto& entry : j["affected"]) {
            if (!entry.contains("package")) continue;
            auto ecosystem = parse_ecosystem(entry["package"].value("ecosystem", ""));
            if (!ecosystem) continue;

            OsvAffected affected;
            affected.ecosystem = *ecosystem;
            affected.name = entry["package"].value("name", "");

            if (entry.contains("versions") && entry["versions"].is_array()) {
                for (const auto& v : entry["versions"]) {
                    if (v.is_string()) affected.versions.insert(v.get<std::string>());
                }
            }
            if (entry.contains("ranges") && entry["ranges"].is_array()) {
                for (const auto& range : entry["ranges"]) {
                    if (!range.is_object() || range.value("type", "") != "SEMVER") continue;
                    if (!range.contains("events")) continue;
                    auto events = parse_semver_events(range["events"], advisory.id);
                    if (!events.empty()) affected.semver_ranges.push_back(std::move(events));
                }
            }
            advisory.affected.push_back(std::move(affected));
        }
    }
    return Result<OsvAdvisory>::ok(std::move(advisory));
}

std::string render_finding(const OsvAdvisory& advisory, const InstallTarget& target) {
    std::string severity_tag = advisory.severity.empty() ? "" : "[" + advisory.severity + "] ";
    std::string kind = advisory.malicious() ? "malicious package disclosure" : "disclosure";
    return "An OSV.dev " + kind + " exists for package " + target.display() + ":\n" +
           "  * " + severity_tag + OsvVerifier::kVulnerabilityUrlPrefix + advisory.id;
}

std::string render_query_failure(const InstallTarget& target, const std::string& reason) {
    return "Failed to verify target against OSV.dev: " + reason + ".\n" +
           "Before proceeding, please check for OSV.dev advisories related to this target.\n" +
           "DO NOT PROCEED if it has an advisory with a MAL ID: it is very likely malicious.\n" +
           "  * " + OsvVerifier::kListUrlPrefix + "?q=" + target.name +
           "&ecosystem=" + ecosystem_to_string(target.ecosystem);
}

// Malicious package disclosures first, newest identifiers first
void append_findings(std::vector<const OsvAdvisory*> matches, const InstallTarget& target,
                     std::vector<Finding>& findings) {
    std::sort(matches.begin(), matches.end(), [](const OsvAdvisory* a, const OsvAdvisory* b) {
        if (a->malicious() != b->malicious()) return a->malicious();
        return a->id > b->id;
    });

    for (const auto* advisory : matches) {
        Finding f;
        f.target = target;
        f.severity = advisory->malicious() ? FindingSeverity::Critical : FindingSeverity::Warning;
        f.message = render_finding(*advisory, target);
        f.verifier = OsvVerifier::kName;
        f.detail = advisory->id;
        findings.push_back(std::move(f));
    }
}

} // namespace

// ============================================================================
// OsvAdvisory
// ============================================================================

bool OsvAffected::matches_version(const std::string& version) const {
    if (versions.count(version)) return true;
    if (semver_ranges.empty()) return false;

    auto parsed = parse_version(version);
    if (!parsed) {
        spdlog::debug("Cannot compare non-SemVer version '{}' of {} with OSV ranges", version, name);
        return false;
    }

    for (const auto& events : semver_ranges) {
        bool affected = false;
        for (const auto& event : events) {
            switch (event.type) {
                case OsvRangeEvent::Type::Introduced:
                    if (*parsed >= event.version) affected = true;
                    break;
                case OsvRangeEvent::Type::Fixed:
                    if (*parsed >= event.version) affected = false;
                    break;
                case OsvRangeEvent::Type::LastAffected:
                    if (*parsed > event.version) affected = false;
                    break;
            }
        }
        if (affected) return true;
    }
    return false;
}

bool OsvAdvisory::malicious() const {
    return text::starts_with(id, "MAL-");
}

bool OsvAdvisory::affects(const InstallTarget& target) const {
    std::string wanted = normalize_name(target.ecosystem, target.name);
    for (const auto& entry : affected) {
        if (entry.ecosystem != target.ecosystem) continue;
        if (normalize_name(target.ecosystem, entry.name) != wanted) continue;
        if (entry.matches_version(target.version)) return true;
    }
    return false;
}

Result<OsvAdvisory> parse_osv_advisory(const std::string& json_text) {
    try {
        return advisory_from_json(nlohmann::json::parse(json_text));
    } catch (const nlohmann::json::exception& e) {
        return Result<OsvAdvisory>::err(Error(ErrorCode::PARSE_ERROR,
            std::string("invalid OSV advisory: ") + e.what()));
    }
}

// ============================================================================
// OsvVerifier
// ============================================================================

OsvVerifier::OsvVerifier(std::string database_dir)
    : database_dir_(std::move(database_dir)) {}

OsvVerifier::OsvVerifier(HttpClientPtr http)
    : http_(std::move(http)) {}

Result<const std::vector<OsvAdvisory>*> OsvVerifier::advisories_for(Ecosystem ecosystem) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = advisories_.find(ecosystem);
    if (it != advisories_.end()) {
        return Result<const std::vector<OsvAdvisory>*>::ok(&it->second);
    }

    std::string dir = join_path(database_dir_, ecosystem_to_string(ecosystem));
    if (!is_directory(dir)) {
        return Result<const std::vector<OsvAdvisory>*>::err(Error(ErrorCode::IO_ERROR,
            "no OSV advisories for " + std::string(ecosystem_to_string(ecosystem)) + " at " + dir));
    }

    std::vector<OsvAdvisory> loaded;
    for (const auto& path : list_directory(dir)) {
        if (!text::ends_with(path, ".json") || !is_regular_file(path)) continue;
        auto content = read_file(path);
        if (!content) {
            spdlog::warn("Failed to read OSV advisory {}", path);
            continue;
        }
        auto advisory = parse_osv_advisory(*content);
        if (advisory.isErr()) {
            spdlog::warn("Skipping {}: {}", path, advisory.error().message());
            continue;
        }
        loaded.push_back(std::move(advisory.value()));
    }

    spdlog::debug("Loaded {} OSV advisories from {}", loaded.size(), dir);
    auto inserted = advisories_.emplace(ecosystem, std::move(loaded));
    return Result<const std::vector<OsvAdvisory>*>::ok(&inserted.first->second);
}

Result<std::vector<OsvAdvisory>> OsvVerifier::query(const InstallTarget& target) {
    std::vector<OsvAdvisory> advisories;

    nlohmann::json request = {
        {"version", target.version},
        {"package", {{"name", target.name}, {"ecosystem", ecosystem_to_string(target.ecosystem)}}},
    };

    // Results are paginated through next_page_token
    while (true) {
        auto response = http_->post_json(kQueryUrl, request.dump(), kQueryTimeoutMs);
        if (!response.ok()) {
            return Result<std::vector<OsvAdvisory>>::err(Error(ErrorCode::VERIFIER_FAILED,
                response.describe()));
        }

        try {
            auto body = nlohmann::json::parse(response.body);
            if (body.contains("vulns") && body["vulns"].is_array()) {
                for (const auto& vuln : body["vulns"]) {
                    if (!vuln.is_object() || vuln.value("id", "").empty()) continue;
                    auto advisory = advisory_from_json(vuln);
                    if (advisory.isOk()) advisories.push_back(std::move(advisory.value()));
                }
            }
            std::string token = body.value("next_page_token", "");
            if (token.empty()) break;
            request["page_token"] = token;
        } catch (const nlohmann::json::exception& e) {
            return Result<std::vector<OsvAdvisory>>::err(Error(ErrorCode::VERIFIER_FAILED,
                std::string("malformed OSV.dev response: ") + e.what()));
        }
    }

    return Result<std::vector<OsvAdvisory>>::ok(std::move(advisories));
}

Result<std::vector<Finding>> OsvVerifier::verify(const TargetSet& targets) {
    std::vector<Finding> findings;

    for (const auto& target : targets) {
        if (http_) {
            auto advisories = query(target);
            if (advisories.isErr()) {
                spdlog::warn("Failed to query OSV.dev for {}: {}", target.display(),
                             advisories.error().message());
                Finding f;
                f.target = target;
                f.severity = FindingSeverity::Warning;
                f.message = render_query_failure(target, advisories.error().message());
                f.verifier = kName;
                findings.push_back(std::move(f));
                continue;
            }

            // The API has already matched the version; duplicates share an id
            std::vector<const OsvAdvisory*> matches;
            std::set<std::string> seen;
            for (const auto& advisory : advisories.value()) {
                if (seen.insert(advisory.id).second) matches.push_back(&advisory);
            }
            append_findings(std::move(matches), target, findings);
            continue;
        }

        auto advisories = advisories_for(target.ecosystem);
        if (advisories.isErr()) {
            return Result<std::vector<Finding>>::err(Error(ErrorCode::VERIFIER_FAILED,
                advisories.error().message()));
        }

        std::vector<const OsvAdvisory*> matches;
        for (const auto& advisory : *advisories.value()) {
            if (advisory.affects(target)) matches.push_back(&advisory);
        }
        append_findings(std::move(matches), target, findings);
    }

    return Result<std::vector<Finding>>::ok(std::move(findings));
}

} // namespace scfw
