#pragma once

/**
 * @file logger.hpp
 * @brief Audit trail of firewall decisions
 *
 * Firewall loggers receive one record per decided run and one per audit.
 * They are distinct from diagnostics, which go through spdlog. A logger that
 * throws never affects the outcome of a run.
 */

#include "scfw/report.hpp"
#include "scfw/target.hpp"
#include "scfw/types.hpp"

#include <memory>
#include <string>
#include <vector>

namespace scfw {

struct FirewallRecord {
    std::string manager;
    std::string executable;
    Ecosystem ecosystem = Ecosystem::PyPI;
    std::vector<std::string> command;
    TargetSet targets;
    Action action = Action::Allow;
    bool verified = true;       // false when verification was skipped
    bool warned = false;
    bool dry_run = false;
    std::string timestamp;      // RFC3339; filled in by log_firewall_action if empty
};

struct AuditRecord {
    std::string manager;
    std::string executable;
    Ecosystem ecosystem = Ecosystem::PyPI;
    size_t package_count = 0;
    VerificationReport report;
    std::string timestamp;
};

class FirewallLogger {
public:
    virtual ~FirewallLogger() = default;

    virtual void log_firewall_action(const FirewallRecord& record) = 0;
    virtual void log_audit(const AuditRecord& record) = 0;
};

using FirewallLoggerPtr = std::shared_ptr<FirewallLogger>;

// Appends one JSON object per line to a file
class FileLogger : public FirewallLogger {
public:
    explicit FileLogger(std::string path) : path_(std::move(path)) {}

    void log_firewall_action(const FirewallRecord& record) override;
    void log_audit(const AuditRecord& record) override;

    const std::string& path() const { return path_; }

private:
    void append(const std::string& line);

    std::string path_;
};

// Dispatch to every logger; exceptions become warnings
void log_firewall_action_all(const std::vector<FirewallLoggerPtr>& loggers,
                             const FirewallRecord& record);
void log_audit_all(const std::vector<FirewallLoggerPtr>& loggers, const AuditRecord& record);

} // namespace scfw
