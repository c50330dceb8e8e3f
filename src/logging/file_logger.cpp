#include "scfw/logger.hpp"
#include "scfw/platform.hpp"

#include <stdexcept>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace scfw {

namespace {

nlohmann::json target_to_json(const InstallTarget& target) {
    nlohmann::json j = {
        {"ecosystem", ecosystem_to_string(target.ecosystem)},
        {"name", target.name},
        {"version", target.version},
    };
    if (!target.source_hint.empty()) {
        j["source"] = target.source_hint;
    }
    return j;
}

nlohmann::json report_to_json(const VerificationReport& report) {
    nlohmann::json findings = nlohmann::json::array();
    for (const auto& target : report.targets_with_findings()) {
        for (const auto& f : report.findings_for(target)) {
            nlohmann::json j = {
                {"target", target_to_json(f.target)},
                {"severity", severity_to_string(f.severity)},
                {"verifier", f.verifier},
                {"message", f.message},
            };
            if (!f.detail.empty()) j["detail"] = f.detail;
            findings.push_back(std::move(j));
        }
    }

    nlohmann::json failures = nlohmann::json::array();
    for (const auto& failure : report.failures()) {
        failures.push_back({{"verifier", failure.name}, {"reason", failure.reason}});
    }

    return {
        {"findings", findings},
        {"verifier_failures", failures},
        {"verifiers", report.verifiers_run()},
    };
}

} // namespace

void FileLogger::append(const std::string& line) {
    if (!append_file(path_, line + "\n")) {
        throw std::runtime_error("failed to write log file " + path_);
    }
}

void FileLogger::log_firewall_action(const FirewallRecord& record) {
    nlohmann::json targets = nlohmann::json::array();
    for (const auto& t : record.targets) {
        targets.push_back(target_to_json(t));
    }

    nlohmann::json j = {
        {"event_id", generate_uuid()},
        {"timestamp", record.timestamp.empty() ? get_current_timestamp() : record.timestamp},
        {"event", "firewall_action"},
        {"package_manager", record.manager},
        {"executable", record.executable},
        {"ecosystem", ecosystem_to_string(record.ecosystem)},
        {"command", record.command},
        {"targets", targets},
        {"action", action_to_string(record.action)},
        {"verified", record.verified},
        {"warned", record.warned},
        {"dry_run", record.dry_run},
    };
    append(j.dump());
}

void FileLogger::log_audit(const AuditRecord& record) {
    nlohmann::json j = {
        {"event_id", generate_uuid()},
        {"timestamp", record.timestamp.empty() ? get_current_timestamp() : record.timestamp},
        {"event", "audit"},
        {"package_manager", record.manager},
        {"executable", record.executable},
        {"ecosystem", ecosystem_to_string(record.ecosystem)},
        {"package_count", record.package_count},
        {"report", report_to_json(record.report)},
    };
    append(j.dump());
}

void log_firewall_action_all(const std::vector<FirewallLoggerPtr>& loggers,
                             const FirewallRecord& record) {
    for (const auto& logger : loggers) {
        try {
            logger->log_firewall_action(record);
        } catch (const std::exception& e) {
            spdlog::warn("Failed to log firewall action: {}", e.what());
        }
    }
}

void log_audit_all(const std::vector<FirewallLoggerPtr>& loggers, const AuditRecord& record) {
    for (const auto& logger : loggers) {
        try {
            logger->log_audit(record);
        } catch (const std::exception& e) {
            spdlog::warn("Failed to log audit results: {}", e.what());
        }
    }
}

} // namespace scfw
