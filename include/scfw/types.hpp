#pragma once

#include <optional>
#include <string>

namespace scfw {

// ============================================================================
// Ecosystem
// ============================================================================

enum class Ecosystem {
    Npm,
    PyPI
};

// Canonical string form ("npm", "PyPI")
inline const char* ecosystem_to_string(Ecosystem e) {
    switch (e) {
        case Ecosystem::Npm: return "npm";
        case Ecosystem::PyPI: return "PyPI";
        default: return "unknown";
    }
}

// Parse ecosystem string (case-insensitive)
std::optional<Ecosystem> parse_ecosystem(const std::string& s);

// ============================================================================
// Manager Kind
// ============================================================================

enum class ManagerKind {
    Pip,
    Npm,
    Poetry
};

inline const char* manager_kind_to_string(ManagerKind k) {
    switch (k) {
        case ManagerKind::Pip: return "pip";
        case ManagerKind::Npm: return "npm";
        case ManagerKind::Poetry: return "poetry";
        default: return "unknown";
    }
}

// Parse the command-line token naming a supported package manager
std::optional<ManagerKind> parse_manager_kind(const std::string& s);

// Ecosystem of the packages a manager installs
inline Ecosystem manager_ecosystem(ManagerKind k) {
    switch (k) {
        case ManagerKind::Npm: return Ecosystem::Npm;
        case ManagerKind::Pip: return Ecosystem::PyPI;
        case ManagerKind::Poetry: return Ecosystem::PyPI;
    }
    return Ecosystem::PyPI;
}

// ============================================================================
// Finding Severity
// ============================================================================

enum class FindingSeverity {
    Warning,
    Critical
};

inline const char* severity_to_string(FindingSeverity s) {
    switch (s) {
        case FindingSeverity::Warning: return "WARNING";
        case FindingSeverity::Critical: return "CRITICAL";
        default: return "WARNING";
    }
}

std::optional<FindingSeverity> parse_severity(const std::string& s);

// ============================================================================
// Command Classification (Compatibility Gate output)
// ============================================================================

enum class Classification {
    NotInstallish,
    Installish,
    UnsupportedVersion
};

inline const char* classification_to_string(Classification c) {
    switch (c) {
        case Classification::NotInstallish: return "not_installish";
        case Classification::Installish: return "installish";
        case Classification::UnsupportedVersion: return "unsupported_version";
        default: return "not_installish";
    }
}

// ============================================================================
// Firewall Action
// ============================================================================

enum class Action {
    Allow,
    Block,
    Abort
};

inline const char* action_to_string(Action a) {
    switch (a) {
        case Action::Allow: return "ALLOW";
        case Action::Block: return "BLOCK";
        case Action::Abort: return "ABORT";
        default: return "BLOCK";
    }
}

// ============================================================================
// Warning Policy
// ============================================================================

enum class WarningPolicy {
    Prompt,
    Allow,
    Block
};

inline const char* warning_policy_to_string(WarningPolicy p) {
    switch (p) {
        case WarningPolicy::Prompt: return "prompt";
        case WarningPolicy::Allow: return "allow";
        case WarningPolicy::Block: return "block";
        default: return "prompt";
    }
}

// Parse "ALLOW" / "BLOCK" (case-insensitive), as accepted in SCFW_ON_WARNING
std::optional<WarningPolicy> parse_warning_policy(const std::string& s);

} // namespace scfw
