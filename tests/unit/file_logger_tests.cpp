#include <doctest/doctest.h>
#include <scfw/logger.hpp>
#include <scfw/text_utils.hpp>

#include "../test_helpers.hpp"

#include <nlohmann/json.hpp>

#include <stdexcept>

using scfw::Action;
using scfw::AuditRecord;
using scfw::Ecosystem;
using scfw::FileLogger;
using scfw::FirewallRecord;
using scfw::FindingSeverity;
using scfw_test::TempDir;

namespace {

std::vector<nlohmann::json> read_records(const std::string& path) {
    std::vector<nlohmann::json> records;
    auto content = scfw::read_file(path);
    REQUIRE(content);
    for (const auto& line : scfw::text::split_lines(*content)) {
        if (!line.empty()) records.push_back(nlohmann::json::parse(line));
    }
    return records;
}

class ThrowingLogger : public scfw::FirewallLogger {
public:
    void log_firewall_action(const FirewallRecord&) override {
        throw std::runtime_error("sink unavailable");
    }
    void log_audit(const AuditRecord&) override {
        throw std::runtime_error("sink unavailable");
    }
};

} // namespace

TEST_CASE("FileLogger appends one JSON line per firewall action") {
    TempDir dir;
    std::string path = dir / "logs/scfw.log";
    FileLogger logger(path);

    FirewallRecord record;
    record.manager = "npm";
    record.executable = "/usr/bin/npm";
    record.ecosystem = Ecosystem::Npm;
    record.command = {"npm", "install", "react"};
    record.targets.insert({Ecosystem::Npm, "react", "18.3.1", ""});
    record.action = Action::Allow;
    record.timestamp = "2026-10-19T12:00:00Z";

    logger.log_firewall_action(record);
    record.action = Action::Block;
    record.warned = true;
    logger.log_firewall_action(record);

    auto records = read_records(path);
    REQUIRE(records.size() == 2);

    const auto& first = records[0];
    CHECK(first["event"] == "firewall_action");
    CHECK(first["package_manager"] == "npm");
    CHECK(first["ecosystem"] == "npm");
    CHECK(first["action"] == "ALLOW");
    CHECK(first["timestamp"] == "2026-10-19T12:00:00Z");
    CHECK(first["command"].size() == 3);
    REQUIRE(first["targets"].size() == 1);
    CHECK(first["targets"][0]["name"] == "react");
    CHECK(first["targets"][0]["version"] == "18.3.1");
    CHECK(first["verified"] == true);
    CHECK_FALSE(first["event_id"].get<std::string>().empty());

    CHECK(records[1]["action"] == "BLOCK");
    CHECK(records[1]["warned"] == true);
    CHECK(records[0]["event_id"] != records[1]["event_id"]);
}

TEST_CASE("FileLogger records audit reports") {
    TempDir dir;
    std::string path = dir / "audit.log";
    FileLogger logger(path);

    AuditRecord record;
    record.manager = "pip";
    record.ecosystem = Ecosystem::PyPI;
    record.package_count = 12;

    scfw::Finding finding;
    finding.target = {Ecosystem::PyPI, "requests", "2.31.0", ""};
    finding.severity = FindingSeverity::Warning;
    finding.message = "vulnerable";
    finding.verifier = "OsvVerifier";
    finding.detail = "GHSA-9wx4-h78v-vm56";
    record.report.add_finding(finding);
    record.report.add_failure({"SlowVerifier", "timed out after 30000 ms"});

    logger.log_audit(record);

    auto records = read_records(path);
    REQUIRE(records.size() == 1);
    CHECK(records[0]["event"] == "audit");
    CHECK(records[0]["package_count"] == 12);
    REQUIRE(records[0]["report"]["findings"].size() == 1);
    CHECK(records[0]["report"]["findings"][0]["severity"] == "WARNING");
    CHECK(records[0]["report"]["findings"][0]["detail"] == "GHSA-9wx4-h78v-vm56");
    CHECK(records[0]["report"]["verifier_failures"][0]["verifier"] == "SlowVerifier");
}

TEST_CASE("log dispatch survives a failing logger") {
    TempDir dir;
    auto file = std::make_shared<FileLogger>(dir / "scfw.log");
    std::vector<scfw::FirewallLoggerPtr> loggers = {std::make_shared<ThrowingLogger>(), file};

    FirewallRecord record;
    record.manager = "pip";
    CHECK_NOTHROW(scfw::log_firewall_action_all(loggers, record));
    CHECK(read_records(file->path()).size() == 1);
}

TEST_CASE("FileLogger throws when the file cannot be written") {
    TempDir dir;
    scfw_test::write_file(dir / "blocker", "a regular file");
    FileLogger logger(dir / "blocker/scfw.log");

    CHECK_THROWS_AS(logger.log_firewall_action(FirewallRecord{}), std::runtime_error);
}
