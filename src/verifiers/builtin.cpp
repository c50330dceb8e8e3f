#include "scfw/verifiers.hpp"
#include "scfw/platform.hpp"

#include <spdlog/spdlog.h>

namespace scfw {

std::vector<VerifierPtr> builtin_verifiers(const std::string& scfw_home, const HttpClientPtr& http) {
    std::vector<VerifierPtr> verifiers;
    if (scfw_home.empty() && !http) {
        spdlog::debug("No SCFW home directory, built-in verifiers disabled");
        return verifiers;
    }

    std::string dd_dir = scfw_home.empty() ? "" : join_path(scfw_home, "dd_verifier");
    if (http || is_directory(dd_dir)) {
        verifiers.push_back(std::make_shared<DatadogMaliciousPackagesVerifier>(dd_dir, http));
    } else {
        spdlog::debug("{} not registered: no directory {}",
                      DatadogMaliciousPackagesVerifier::kName, dd_dir);
    }

    std::string lists_dir = scfw_home.empty() ? "" : join_path(scfw_home, "block_list_verifier");
    if (!lists_dir.empty() && is_directory(lists_dir)) {
        verifiers.push_back(std::make_shared<FindingsListVerifier>(lists_dir));
    } else {
        spdlog::debug("{} not registered: no directory {}", FindingsListVerifier::kName, lists_dir);
    }

    std::string osv_dir = scfw_home.empty() ? "" : join_path(scfw_home, "osv_verifier");
    if (!osv_dir.empty() && is_directory(osv_dir)) {
        verifiers.push_back(std::make_shared<OsvVerifier>(osv_dir));
    } else if (http) {
        spdlog::debug("{} will query {}", OsvVerifier::kName, OsvVerifier::kQueryUrl);
        verifiers.push_back(std::make_shared<OsvVerifier>(http));
    } else {
        spdlog::debug("{} not registered: no directory {}", OsvVerifier::kName, osv_dir);
    }

    return verifiers;
}

} // namespace scfw
