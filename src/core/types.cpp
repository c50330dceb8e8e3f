#include "scfw/types.hpp"
#include "scfw/text_utils.hpp"

#include <optional>

namespace scfw {

std::optional<Ecosystem> parse_ecosystem(const std::string& s) {
    std::string lower = text::to_lower(text::trim(s));
    if (lower == "npm") return Ecosystem::Npm;
    if (lower == "pypi") return Ecosystem::PyPI;
    return std::nullopt;
}

std::optional<ManagerKind> parse_manager_kind(const std::string& s) {
    if (s == "pip") return ManagerKind::Pip;
    if (s == "npm") return ManagerKind::Npm;
    if (s == "poetry") return ManagerKind::Poetry;
    return std::nullopt;
}

std::optional<FindingSeverity> parse_severity(const std::string& s) {
    std::string lower = text::to_lower(text::trim(s));
    if (lower == "warning") return FindingSeverity::Warning;
    if (lower == "critical") return FindingSeverity::Critical;
    return std::nullopt;
}

std::optional<WarningPolicy> parse_warning_policy(const std::string& s) {
    std::string lower = text::to_lower(text::trim(s));
    if (lower == "allow") return WarningPolicy::Allow;
    if (lower == "block") return WarningPolicy::Block;
    return std::nullopt;
}

} // namespace scfw
