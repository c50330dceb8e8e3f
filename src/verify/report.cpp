#include "scfw/report.hpp"

#include <sstream>

namespace scfw {

void VerificationReport::add_finding(Finding finding) {
    auto it = findings_.find(finding.target);
    if (it == findings_.end()) {
        order_.push_back(finding.target);
        it = findings_.emplace(finding.target, std::vector<Finding>{}).first;
    }
    it->second.push_back(std::move(finding));
}

void VerificationReport::add_failure(VerifierFailure failure) {
    failures_.push_back(std::move(failure));
}

void VerificationReport::add_verifier_run(const std::string& name) {
    verifiers_run_.push_back(name);
}

bool VerificationReport::has_critical() const {
    for (const auto& entry : findings_) {
        for (const auto& f : entry.second) {
            if (f.severity == FindingSeverity::Critical) return true;
        }
    }
    return false;
}

bool VerificationReport::has_warnings() const {
    for (const auto& entry : findings_) {
        for (const auto& f : entry.second) {
            if (f.severity == FindingSeverity::Warning) return true;
        }
    }
    return false;
}

const std::vector<Finding>& VerificationReport::findings_for(const InstallTarget& target) const {
    static const std::vector<Finding> kNone;
    auto it = findings_.find(target);
    return it == findings_.end() ? kNone : it->second;
}

VerificationReport VerificationReport::filtered(FindingSeverity severity) const {
    VerificationReport result;
    for (const auto& target : order_) {
        for (const auto& f : findings_.at(target)) {
            if (f.severity == severity) {
                result.add_finding(f);
            }
        }
    }
    result.failures_ = failures_;
    result.verifiers_run_ = verifiers_run_;
    result.target_count_ = target_count_;
    return result;
}

bool VerificationReport::all_verifiers_failed() const {
    return verifiers_run_.empty() && !failures_.empty();
}

VerificationCoverage VerificationReport::coverage() const {
    if (target_count_ == 0) return VerificationCoverage::NotNeeded;
    if (verifiers_run_.empty()) {
        return failures_.empty() ? VerificationCoverage::NoVerifiers : VerificationCoverage::AllFailed;
    }
    return failures_.empty() ? VerificationCoverage::Complete : VerificationCoverage::Partial;
}

bool VerificationReport::unverified() const {
    auto c = coverage();
    return c == VerificationCoverage::AllFailed || c == VerificationCoverage::NoVerifiers;
}

size_t VerificationReport::finding_count() const {
    size_t count = 0;
    for (const auto& entry : findings_) {
        count += entry.second.size();
    }
    return count;
}

std::string VerificationReport::render() const {
    std::ostringstream out;
    for (const auto& target : order_) {
        out << "Installation target " << target.display() << ":\n";
        for (const auto& f : findings_.at(target)) {
            std::string indented = f.message;
            size_t pos = 0;
            while ((pos = indented.find('\n', pos)) != std::string::npos) {
                indented.replace(pos, 1, "\n    ");
                pos += 5;
            }
            out << "  - " << indented << "\n";
        }
    }
    if (!failures_.empty()) {
        out << failures_.size() << " verifier" << (failures_.size() == 1 ? "" : "s")
            << " unavailable:\n";
        for (const auto& failure : failures_) {
            out << "  - " << failure.name << ": " << failure.reason << "\n";
        }
    }
    return out.str();
}

} // namespace scfw
