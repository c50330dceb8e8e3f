#include "scfw/verifiers.hpp"
#include "scfw/platform.hpp"
#include "scfw/text_utils.hpp"

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

namespace scfw {

// ============================================================================
// FindingsMap
// ============================================================================

Result<FindingsMap> FindingsMap::from_yaml(const std::string& yaml_text) {
    FindingsMap result;

    try {
        YAML::Node root = YAML::Load(yaml_text);
        YAML::Node findings = root["findings"];
        if (!findings || !findings.IsSequence()) {
            return Result<FindingsMap>::err(Error(ErrorCode::PARSE_ERROR,
                "missing 'findings' sequence"));
        }

        for (const auto& item : findings) {
            if (!item["severity"] || !item["finding"] || !item["packages"]) {
                return Result<FindingsMap>::err(Error(ErrorCode::PARSE_ERROR,
                    "each finding needs 'severity', 'finding' and 'packages'"));
            }

            auto severity = parse_severity(item["severity"].as<std::string>());
            if (!severity) {
                return Result<FindingsMap>::err(Error(ErrorCode::PARSE_ERROR,
                    "invalid severity: " + item["severity"].as<std::string>()));
            }
            std::string message = item["finding"].as<std::string>();

            const YAML::Node& packages = item["packages"];
            if (!packages.IsSequence()) {
                return Result<FindingsMap>::err(Error(ErrorCode::PARSE_ERROR,
                    "'packages' must be a sequence"));
            }

            for (const auto& pkg : packages) {
                if (!pkg["ecosystem"] || !pkg["name"]) {
                    return Result<FindingsMap>::err(Error(ErrorCode::PARSE_ERROR,
                        "each package needs 'ecosystem' and 'name'"));
                }
                auto ecosystem = parse_ecosystem(pkg["ecosystem"].as<std::string>());
                if (!ecosystem) {
                    return Result<FindingsMap>::err(Error(ErrorCode::PARSE_ERROR,
                        "invalid ecosystem: " + pkg["ecosystem"].as<std::string>()));
                }
                std::string name = pkg["name"].as<std::string>();

                std::vector<std::string> versions;
                if (pkg["versions"] && pkg["versions"].IsSequence()) {
                    for (const auto& v : pkg["versions"]) {
                        versions.push_back(v.as<std::string>());
                    }
                }
                if (versions.empty()) {
                    versions.push_back(kAnyVersion);
                }

                for (const auto& version : versions) {
                    result.map_[*ecosystem][name][version].emplace_back(*severity, message);
                }
            }
        }
    } catch (const YAML::Exception& e) {
        return Result<FindingsMap>::err(Error(ErrorCode::PARSE_ERROR,
            std::string("invalid YAML: ") + e.what()));
    }

    return Result<FindingsMap>::ok(std::move(result));
}

void FindingsMap::merge(const FindingsMap& other) {
    for (const auto& eco : other.map_) {
        for (const auto& pkg : eco.second) {
            for (const auto& ver : pkg.second) {
                auto& entries = map_[eco.first][pkg.first][ver.first];
                entries.insert(entries.end(), ver.second.begin(), ver.second.end());
            }
        }
    }
}

std::vector<FindingsMap::Entry> FindingsMap::get(Ecosystem ecosystem, const std::string& name,
                                                 const std::string& version) const {
    std::vector<Entry> result;

    auto eco = map_.find(ecosystem);
    if (eco == map_.end()) return result;
    auto pkg = eco->second.find(name);
    if (pkg == eco->second.end()) return result;

    auto any = pkg->second.find(kAnyVersion);
    if (any != pkg->second.end()) {
        result.insert(result.end(), any->second.begin(), any->second.end());
    }
    if (version != kAnyVersion) {
        auto exact = pkg->second.find(version);
        if (exact != pkg->second.end()) {
            result.insert(result.end(), exact->second.begin(), exact->second.end());
        }
    }
    return result;
}

// ============================================================================
// FindingsListVerifier
// ============================================================================

FindingsListVerifier::FindingsListVerifier(const std::string& lists_dir) {
    for (const auto& path : list_directory(lists_dir)) {
        if (!is_regular_file(path)) continue;
        if (!text::ends_with(path, ".yml") && !text::ends_with(path, ".yaml")) continue;

        auto content = read_file(path);
        if (!content) {
            spdlog::warn("Failed to read findings list {}", path);
            continue;
        }
        auto parsed = FindingsMap::from_yaml(*content);
        if (parsed.isErr()) {
            spdlog::warn("Failed to import findings list {}: {}", path, parsed.error().message());
            continue;
        }
        findings_.merge(parsed.value());
        spdlog::debug("Imported findings list {}", path);
    }
}

FindingsListVerifier::FindingsListVerifier(FindingsMap findings)
    : findings_(std::move(findings)) {}

Result<std::vector<Finding>> FindingsListVerifier::verify(const TargetSet& targets) {
    std::vector<Finding> findings;
    for (const auto& target : targets) {
        for (const auto& entry : findings_.get(target.ecosystem, target.name, target.version)) {
            Finding f;
            f.target = target;
            f.severity = entry.first;
            f.message = entry.second;
            f.verifier = kName;
            findings.push_back(std::move(f));
        }
    }
    return Result<std::vector<Finding>>::ok(std::move(findings));
}

} // namespace scfw
