#pragma once

#include "scfw/types.hpp"

#include <cstddef>
#include <functional>
#include <initializer_list>
#include <string>
#include <unordered_set>
#include <vector>

namespace scfw {

// ============================================================================
// Install Target
// ============================================================================

// A concrete package release that would be (or is) installed.
// Equality and hashing ignore the source hint.
struct InstallTarget {
    Ecosystem ecosystem = Ecosystem::PyPI;
    std::string name;
    std::string version;
    std::string source_hint;  // e.g. VCS URL or archive location, optional

    // "name==version" for PyPI, "name@version" for npm
    std::string display() const;
};

inline bool operator==(const InstallTarget& a, const InstallTarget& b) {
    return a.ecosystem == b.ecosystem && a.name == b.name && a.version == b.version;
}

inline bool operator!=(const InstallTarget& a, const InstallTarget& b) {
    return !(a == b);
}

struct InstallTargetHash {
    size_t operator()(const InstallTarget& t) const {
        size_t h = std::hash<int>()(static_cast<int>(t.ecosystem));
        h ^= std::hash<std::string>()(t.name) + 0x9e3779b9 + (h << 6) + (h >> 2);
        h ^= std::hash<std::string>()(t.version) + 0x9e3779b9 + (h << 6) + (h >> 2);
        return h;
    }
};

// ============================================================================
// Target Set
// ============================================================================

// Ordered, de-duplicated collection of install targets.
// Insertion order is preserved for deterministic reporting.
class TargetSet {
public:
    TargetSet() = default;
    TargetSet(std::initializer_list<InstallTarget> targets);

    // Returns false if an equal target was already present
    bool insert(InstallTarget target);

    bool contains(const InstallTarget& target) const;
    bool empty() const { return targets_.empty(); }
    size_t size() const { return targets_.size(); }

    const std::vector<InstallTarget>& items() const { return targets_; }
    std::vector<InstallTarget>::const_iterator begin() const { return targets_.begin(); }
    std::vector<InstallTarget>::const_iterator end() const { return targets_.end(); }

    // Comma-separated display forms
    std::string display() const;

private:
    std::vector<InstallTarget> targets_;
    std::unordered_set<InstallTarget, InstallTargetHash> index_;
};

} // namespace scfw
