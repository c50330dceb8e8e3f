#include "scfw/target.hpp"

namespace scfw {

std::string InstallTarget::display() const {
    if (ecosystem == Ecosystem::Npm) {
        return name + "@" + version;
    }
    return name + "==" + version;
}

TargetSet::TargetSet(std::initializer_list<InstallTarget> targets) {
    for (const auto& t : targets) {
        insert(t);
    }
}

bool TargetSet::insert(InstallTarget target) {
    if (index_.count(target)) {
        return false;
    }
    index_.insert(target);
    targets_.push_back(std::move(target));
    return true;
}

bool TargetSet::contains(const InstallTarget& target) const {
    return index_.count(target) > 0;
}

std::string TargetSet::display() const {
    std::string result;
    for (size_t i = 0; i < targets_.size(); ++i) {
        if (i > 0) result += ", ";
        result += targets_[i].display();
    }
    return result;
}

} // namespace scfw
